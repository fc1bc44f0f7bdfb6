#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "scout/discovery/enricher.hpp"
#include "scout/discovery/iokit_directory.hpp"

using namespace scout::discovery;
using ::testing::ElementsAre;
using ::testing::Return;

class MockPropertyDirectory : public PropertyDirectory {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(PropertyIndex, index, (), (override));
};

namespace {
Candidate classNode(const std::string& path) {
    return Candidate(Transport::deviceNode(NodeKind::UsbPrinterClass, path), 80,
                     "found in USB printer-class device namespace "
                     "(/dev/usb/lp*)");
}

Candidate serialNode(const std::string& path) {
    return Candidate(Transport::deviceNode(NodeKind::Serial, path), 40,
                     "found serial device node (/dev/ttyUSB*)");
}

Candidate macSerialNode(const std::string& path) {
    return Candidate(Transport::deviceNode(NodeKind::Serial, path), 35,
                     "found serial device node (/dev/cu.usbserial*)");
}
}  // namespace

class EnricherTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = std::make_shared<MockPropertyDirectory>();
        useSource("udev");
    }

    void useSource(const std::string& source) {
        EXPECT_CALL(*directory_, name()).WillRepeatedly(Return(source));
    }

    void enrich(std::vector<Candidate>& candidates, PropertyIndex index) {
        EXPECT_CALL(*directory_, index()).WillOnce(Return(std::move(index)));
        Enricher(directory_).enrich(candidates);
    }

    std::shared_ptr<MockPropertyDirectory> directory_;
};

TEST(PropertyLookupTest, EmptyValuesCountAsAbsent) {
    PropertyRecord record{{"ID_VENDOR", "EPSON"}, {"ID_MODEL", ""}};
    EXPECT_EQ(lookup(record, "ID_VENDOR"), "EPSON");
    EXPECT_FALSE(lookup(record, "ID_MODEL").has_value());
    EXPECT_FALSE(lookup(record, "ID_SERIAL").has_value());
}

TEST(PropertyLookupTest, PreferredKeyWins) {
    PropertyRecord record{{"ID_VENDOR_FROM_DATABASE", "Seiko Epson Corp."},
                          {"ID_VENDOR", "EPSON"}};
    EXPECT_EQ(lookupPreferred(record, "ID_VENDOR_FROM_DATABASE", "ID_VENDOR"),
              "Seiko Epson Corp.");
    record.erase("ID_VENDOR_FROM_DATABASE");
    EXPECT_EQ(lookupPreferred(record, "ID_VENDOR_FROM_DATABASE", "ID_VENDOR"),
              "EPSON");
}

TEST(InterfacesIncludePrinterTest, MatchesClassByteOfEachEntry) {
    EXPECT_TRUE(interfacesIncludePrinter(":070101:"));
    EXPECT_TRUE(interfacesIncludePrinter(":030000:070102:"));
    EXPECT_TRUE(interfacesIncludePrinter("0701"));
    EXPECT_FALSE(interfacesIncludePrinter(":030107:"));
    EXPECT_FALSE(interfacesIncludePrinter(":ff0000:020200:"));
    EXPECT_FALSE(interfacesIncludePrinter(""));
}

TEST(MatchPrinterKeywordTest, FirstKeywordWinsCaseInsensitively) {
    EXPECT_EQ(matchPrinterKeyword("EPSON TM-T20"), "epson");
    EXPECT_EQ(matchPrinterKeyword("Star Micronics TSP143"), "star");
    EXPECT_EQ(matchPrinterKeyword("Generic Thermal POS"), "pos");
    EXPECT_FALSE(matchPrinterKeyword("FTDI FT232R").has_value());
}

// /dev/usb/lp0 with an Epson record and a printer interface reaches 90
TEST_F(EnricherTest, EpsonClassNodeReachesInterfaceFloor) {
    std::vector<Candidate> candidates{classNode("/dev/usb/lp0")};
    enrich(candidates,
           {{"/dev/usb/lp0",
             {{"ID_VENDOR", "Epson"},
              {"ID_MODEL", "TM-T20"},
              {"ID_USB_INTERFACES", ":070102:"},
              {"ID_VENDOR_ID", "04b8"},
              {"ID_MODEL_ID", "0e15"},
              {"ID_SERIAL_SHORT", "TXQF123456"}}}});

    const auto& candidate = candidates[0];
    EXPECT_EQ(candidate.displayName(), "Epson TM-T20");
    EXPECT_EQ(candidate.confidence(), 90);
    EXPECT_EQ(candidate.serial(), "TXQF123456");
    EXPECT_EQ(candidate.vendorId(), "04b8");
    EXPECT_EQ(candidate.productId(), "0e15");
    EXPECT_THAT(
        candidate.notes(),
        ElementsAre(
            "found in USB printer-class device namespace (/dev/usb/lp*)",
            "udev: ID_USB_INTERFACES indicates USB printer class (07)",
            "make/model contains keyword 'epson'"));
}

// No record means no change at all
TEST_F(EnricherTest, SerialNodeWithoutRecordIsUntouched) {
    std::vector<Candidate> candidates{serialNode("/dev/ttyUSB3")};
    enrich(candidates, {{"/dev/ttyUSB0", {{"ID_MODEL", "FT232R"}}}});

    EXPECT_EQ(candidates[0].confidence(), 40);
    EXPECT_FALSE(candidates[0].displayName().has_value());
    EXPECT_THAT(candidates[0].notes(),
                ElementsAre("found serial device node (/dev/ttyUSB*)"));
}

TEST_F(EnricherTest, DatabaseNamesArePreferred) {
    std::vector<Candidate> candidates{classNode("/dev/usb/lp1")};
    enrich(candidates, {{"/dev/usb/lp1",
                         {{"ID_VENDOR", "STAR"},
                          {"ID_VENDOR_FROM_DATABASE", "Star Micronics Co., Ltd"},
                          {"ID_MODEL", "TSP100"}}}});
    EXPECT_EQ(candidates[0].displayName(), "Star Micronics Co., Ltd TSP100");
}

TEST_F(EnricherTest, ModelOnlyNameIsTrimmed) {
    std::vector<Candidate> candidates{classNode("/dev/usb/lp0")};
    enrich(candidates, {{"/dev/usb/lp0", {{"ID_MODEL", "Receipt_Printer"}}}});
    EXPECT_EQ(candidates[0].displayName(), "Receipt_Printer");
    // "receipt" lifts to 70 but a class node is already at 80
    EXPECT_EQ(candidates[0].confidence(), 80);
    EXPECT_THAT(candidates[0].notes(),
                ElementsAre(::testing::_,
                            "make/model contains keyword 'receipt'"));
}

TEST_F(EnricherTest, SerialFallsBackToFullSerial) {
    std::vector<Candidate> candidates{classNode("/dev/usb/lp0")};
    enrich(candidates,
           {{"/dev/usb/lp0", {{"ID_SERIAL", "EPSON_TM-T20_TXQF123456"}}}});
    EXPECT_EQ(candidates[0].serial(), "EPSON_TM-T20_TXQF123456");
}

// Fields already present are never overwritten
TEST_F(EnricherTest, FillsGapsOnly) {
    auto candidate = classNode("/dev/usb/lp0");
    candidate.fillDisplayName("Known Printer");
    candidate.fillSerial("KEEP");
    std::vector<Candidate> candidates{std::move(candidate)};

    enrich(candidates, {{"/dev/usb/lp0",
                         {{"ID_VENDOR", "Other"},
                          {"ID_MODEL", "Model"},
                          {"ID_SERIAL_SHORT", "DROP"},
                          {"ID_VENDOR_ID", "0519"}}}});
    EXPECT_EQ(candidates[0].displayName(), "Known Printer");
    EXPECT_EQ(candidates[0].serial(), "KEEP");
    EXPECT_EQ(candidates[0].vendorId(), "0519");
}

TEST_F(EnricherTest, UsbBackedNamedSerialNodeReachesSixty) {
    std::vector<Candidate> candidates{serialNode("/dev/ttyUSB0"),
                                      serialNode("/dev/ttyACM0"),
                                      serialNode("/dev/ttyUSB1")};
    enrich(candidates,
           {{"/dev/ttyUSB0",
             {{"ID_BUS", "usb"}, {"ID_VENDOR", "FTDI"}, {"ID_MODEL", "FT232R"}}},
            {"/dev/ttyACM0",
             {{"ID_VENDOR_ID", "2341"}, {"ID_MODEL", "Arduino_Uno"}}},
            {"/dev/ttyUSB1", {{"ID_BUS", "usb"}}}});

    EXPECT_EQ(candidates[0].confidence(), 60);
    EXPECT_THAT(candidates[0].notes(),
                ElementsAre(::testing::_, "udev: USB-backed serial device"));
    EXPECT_EQ(candidates[1].confidence(), 60);
    // USB-backed but nameless stays at the node floor
    EXPECT_EQ(candidates[2].confidence(), 40);
    EXPECT_EQ(candidates[2].notes().size(), 1u);
}

// All applicable floors apply, so a keyword serial printer ends at 70
TEST_F(EnricherTest, FloorsAreIndependent) {
    std::vector<Candidate> candidates{serialNode("/dev/ttyUSB0")};
    enrich(candidates, {{"/dev/ttyUSB0",
                         {{"ID_BUS", "usb"},
                          {"ID_VENDOR", "Xprinter"},
                          {"ID_MODEL", "XP-58"}}}});
    EXPECT_EQ(candidates[0].confidence(), 70);
    EXPECT_THAT(candidates[0].notes(),
                ElementsAre(::testing::_,
                            "make/model contains keyword 'xprinter'",
                            "udev: USB-backed serial device"));
}

// IOKit records are keyed by callout path
TEST_F(EnricherTest, IoKitUsbSerialNodeReachesSixty) {
    useSource("iokit");
    std::vector<Candidate> candidates{
        macSerialNode("/dev/cu.usbserial-1410"),
        macSerialNode("/dev/cu.usbserial-1420")};
    enrich(candidates,
           {{"/dev/cu.usbserial-1410",
             makeSerialPortRecord({.callout_path = "/dev/cu.usbserial-1410",
                                   .vendor_id = 0x0403,
                                   .product_id = 0x6001,
                                   .vendor_name = "FTDI",
                                   .product_name = "FT232R USB UART",
                                   .serial_number = "A50285BI"})},
            {"/dev/cu.usbserial-1420",
             makeSerialPortRecord({.callout_path = "/dev/cu.usbserial-1420",
                                   .vendor_id = 0x0416,
                                   .product_id = 0x5011,
                                   .vendor_name = "Winbond",
                                   .product_name = "Xprinter XP-58"})}});

    const auto& ftdi = candidates[0];
    EXPECT_EQ(ftdi.displayName(), "FTDI FT232R USB UART");
    EXPECT_EQ(ftdi.confidence(), 60);
    EXPECT_EQ(ftdi.serial(), "A50285BI");
    EXPECT_EQ(ftdi.vendorId(), "0403");
    EXPECT_EQ(ftdi.productId(), "6001");
    EXPECT_THAT(ftdi.notes(),
                ElementsAre("found serial device node (/dev/cu.usbserial*)",
                            "iokit: USB-backed serial device"));

    EXPECT_EQ(candidates[1].confidence(), 70);
    EXPECT_THAT(candidates[1].notes(),
                ElementsAre(::testing::_,
                            "make/model contains keyword 'xprinter'",
                            "iokit: USB-backed serial device"));
}

TEST_F(EnricherTest, BusCandidatesAreNeverEnriched) {
    std::vector<Candidate> candidates{
        Candidate(Transport::usbDevice(0x04b8, 0x0202, std::nullopt), 80,
                  "exposes USB printer-class interface (0x07)")};
    enrich(candidates, {{"usb:04b8:0202", {{"ID_MODEL", "TM-T88V"}}}});
    EXPECT_FALSE(candidates[0].displayName().has_value());
    EXPECT_EQ(candidates[0].notes().size(), 1u);
}

// Enrichment never lowers a candidate's confidence
TEST_F(EnricherTest, EnrichmentIsMonotonic) {
    auto strong = classNode("/dev/usb/lp0");
    strong.raiseConfidence(95, "manual");
    std::vector<Candidate> candidates{std::move(strong), serialNode("/dev/ttyUSB0")};
    enrich(candidates,
           {{"/dev/usb/lp0",
             {{"ID_USB_INTERFACES", ":070101:"}, {"ID_MODEL", "Citizen CT-S310"}}},
            {"/dev/ttyUSB0", {{"ID_MODEL", "Unknown"}}}});
    EXPECT_EQ(candidates[0].confidence(), 95);
    EXPECT_EQ(candidates[1].confidence(), 40);
}

TEST_F(EnricherTest, IndexIsBuiltOncePerPass) {
    std::vector<Candidate> candidates{classNode("/dev/usb/lp0"),
                                      classNode("/dev/usb/lp1"),
                                      serialNode("/dev/ttyUSB0")};
    enrich(candidates, {});
    for (const auto& candidate : candidates) {
        EXPECT_EQ(candidate.notes().size(), 1u);
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
