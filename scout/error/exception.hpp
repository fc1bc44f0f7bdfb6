/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Exception carrying its throw site

**************************************************/

#ifndef SCOUT_ERROR_EXCEPTION_HPP
#define SCOUT_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "scout/macro.hpp"

namespace scout::error {

/**
 * @brief Base exception recording file, line, function and thread of the
 * throw site.
 *
 * The message is the concatenation of every extra constructor argument, so
 * callers can write `THROW_RUNTIME_ERROR("open failed: ", path)`.
 */
class Exception : public std::exception {
public:
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full diagnostic text including the throw site.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    /**
     * @brief The bare message, without the throw site.
     */
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
};

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

}  // namespace scout::error

#define THROW_RUNTIME_ERROR(...)                                   \
    throw scout::error::RuntimeError(SCOUT_FILE_NAME, SCOUT_FILE_LINE, \
                                     SCOUT_FUNC_NAME, __VA_ARGS__)

#define THROW_INVALID_ARGUMENT(...)                                   \
    throw scout::error::InvalidArgument(SCOUT_FILE_NAME, SCOUT_FILE_LINE, \
                                        SCOUT_FUNC_NAME, __VA_ARGS__)

#endif  // SCOUT_ERROR_EXCEPTION_HPP
