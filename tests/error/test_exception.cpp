#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "scout/discovery/error.hpp"
#include "scout/error/exception.hpp"

using scout::error::Exception;

TEST(ExceptionTest, MessageIsConcatenated) {
    try {
        THROW_INVALID_ARGUMENT("confidence out of range: ", 120);
    } catch (const scout::error::InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "confidence out of range: 120");
        EXPECT_GT(e.getLine(), 0);
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
        return;
    }
    FAIL() << "expected InvalidArgument";
}

TEST(ExceptionTest, WhatIncludesContext) {
    try {
        THROW_RUNTIME_ERROR("boom");
    } catch (const Exception& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("boom"), std::string::npos);
        EXPECT_NE(what.find("test_exception.cpp"), std::string::npos);
        return;
    }
    FAIL() << "expected RuntimeError";
}

TEST(ExceptionTest, EnumerationErrorIsAnException) {
    EXPECT_THROW(THROW_ENUMERATION_ERROR("udev scan failed: ", "EACCES"),
                 Exception);
    try {
        THROW_ENUMERATION_ERROR("udev scan failed: ", "EACCES");
    } catch (const scout::discovery::EnumerationError& e) {
        EXPECT_EQ(e.getMessage(), "udev scan failed: EACCES");
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
