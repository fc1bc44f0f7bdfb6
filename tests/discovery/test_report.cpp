#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "scout/discovery/error.hpp"
#include "scout/discovery/report.hpp"

using namespace scout::discovery;
using ::testing::Return;

class MockBackend : public DiscoveryBackend {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::vector<Candidate>, discover, (), (override));
};

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override { backend_ = std::make_shared<MockBackend>(); }

    DiscoveryReport run() { return runDiscovery(DiscoveryProvider(backend_)); }

    std::shared_ptr<MockBackend> backend_;
};

TEST_F(ReportTest, FoundCandidates) {
    std::vector<Candidate> candidates;
    candidates.emplace_back(
        Transport::deviceNode(NodeKind::UsbPrinterClass, "/dev/usb/lp0"), 80,
        "class node");
    candidates.emplace_back(
        Transport::deviceNode(NodeKind::Serial, "/dev/ttyUSB0"), 40, "serial");
    EXPECT_CALL(*backend_, discover()).WillOnce(Return(candidates));

    auto report = run();
    EXPECT_EQ(report.status, DiscoveryReport::Status::Found);
    EXPECT_EQ(report.candidates.size(), 2u);
    EXPECT_EQ(report.message, "found 2 printer candidate(s)");
    EXPECT_TRUE(report.detail.empty());
}

TEST_F(ReportTest, EmptyResultIsNotAnError) {
    EXPECT_CALL(*backend_, discover())
        .WillOnce(Return(std::vector<Candidate>{}));

    auto report = run();
    EXPECT_EQ(report.status, DiscoveryReport::Status::Empty);
    EXPECT_EQ(report.message, "no printers found");
}

// Enumeration failures become a Failed report with the underlying reason
TEST_F(ReportTest, EnumerationFailure) {
    EXPECT_CALL(*backend_, discover()).WillOnce([]() -> std::vector<Candidate> {
        THROW_ENUMERATION_ERROR("Failed to create udev context");
    });

    auto report = run();
    EXPECT_EQ(report.status, DiscoveryReport::Status::Failed);
    EXPECT_EQ(report.message, "could not enumerate printers on this host");
    EXPECT_EQ(report.detail, "Failed to create udev context");
    EXPECT_TRUE(report.candidates.empty());
}

TEST(ReportJsonTest, NodeCandidate) {
    Candidate candidate(
        Transport::deviceNode(NodeKind::UsbPrinterClass, "/dev/usb/lp0"), 80,
        "class node");
    candidate.fillDisplayName("Epson TM-T20");
    candidate.raiseConfidence(90, "interface");

    auto json = toJson(candidate);
    EXPECT_EQ(json["transport"]["type"], "usb_lp");
    EXPECT_EQ(json["transport"]["path"], "/dev/usb/lp0");
    EXPECT_EQ(json["transport"]["locator"], "file:/dev/usb/lp0");
    EXPECT_EQ(json["make_model"], "Epson TM-T20");
    EXPECT_TRUE(json["serial"].is_null());
    EXPECT_TRUE(json["vid"].is_null());
    EXPECT_EQ(json["confidence"], 90);
    EXPECT_EQ(json["notes"], nlohmann::json({"class node", "interface"}));
}

TEST(ReportJsonTest, UsbCandidate) {
    Candidate candidate(Transport::usbDevice(0x04b8, 0x0202, "ABC"), 85,
                        "bus");
    candidate.fillVendorId("04b8");
    candidate.fillProductId("0202");

    auto json = toJson(candidate);
    EXPECT_EQ(json["transport"]["type"], "usb_device");
    EXPECT_EQ(json["transport"]["vid"], "04b8");
    EXPECT_EQ(json["transport"]["pid"], "0202");
    EXPECT_EQ(json["transport"]["serial"], "ABC");
    EXPECT_EQ(json["transport"]["locator"], "usb:04b8:0202:ABC");
    EXPECT_EQ(json["vid"], "04b8");
    EXPECT_EQ(json["pid"], "0202");
}

TEST(ReportJsonTest, Report) {
    DiscoveryReport report;
    report.status = DiscoveryReport::Status::Failed;
    report.message = ENUMERATION_FAILED_MESSAGE;
    report.detail = "permission denied";

    auto json = toJson(report);
    EXPECT_EQ(json["status"], "failed");
    EXPECT_EQ(json["message"], "could not enumerate printers on this host");
    EXPECT_EQ(json["detail"], "permission denied");
    EXPECT_TRUE(json["candidates"].is_array());
    EXPECT_TRUE(json["candidates"].empty());

    report.status = DiscoveryReport::Status::Empty;
    report.detail.clear();
    json = toJson(report);
    EXPECT_EQ(json["status"], "empty");
    EXPECT_FALSE(json.contains("detail"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
