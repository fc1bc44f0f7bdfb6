#include <gtest/gtest.h>

#include "scout/discovery/iokit_directory.hpp"
#include "scout/discovery/property_directory.hpp"

using namespace scout::discovery;

TEST(HasDeviceIdentityTest, NamesOrInterfacesCount) {
    EXPECT_TRUE(hasDeviceIdentity({{"ID_MODEL", "TM-T20"}}));
    EXPECT_TRUE(hasDeviceIdentity({{"ID_VENDOR_FROM_DATABASE", "Seiko Epson"}}));
    EXPECT_TRUE(hasDeviceIdentity({{"ID_USB_INTERFACES", ":070102:"}}));
}

// Bus and serial keys alone do not identify a device
TEST(HasDeviceIdentityTest, EmptyOrUnrelatedKeysDoNotCount) {
    EXPECT_FALSE(hasDeviceIdentity({}));
    EXPECT_FALSE(hasDeviceIdentity({{"ID_MODEL", ""}, {"ID_VENDOR", ""}}));
    EXPECT_FALSE(hasDeviceIdentity(
        {{"ID_BUS", "usb"}, {"ID_SERIAL_SHORT", "A50285BI"}}));
}

TEST(MakeSerialPortRecordTest, UsbPortMapsEveryField) {
    auto record = makeSerialPortRecord({.callout_path = "/dev/cu.usbserial-1410",
                                        .vendor_id = 0x0403,
                                        .product_id = 0x6001,
                                        .vendor_name = "FTDI",
                                        .product_name = "FT232R USB UART",
                                        .serial_number = "A50285BI"});
    EXPECT_EQ(record.size(), 6u);
    EXPECT_EQ(record["ID_BUS"], "usb");
    EXPECT_EQ(record["ID_VENDOR_ID"], "0403");
    EXPECT_EQ(record["ID_MODEL_ID"], "6001");
    EXPECT_EQ(record["ID_VENDOR"], "FTDI");
    EXPECT_EQ(record["ID_MODEL"], "FT232R USB UART");
    EXPECT_EQ(record["ID_SERIAL_SHORT"], "A50285BI");
    EXPECT_TRUE(hasDeviceIdentity(record));
}

TEST(MakeSerialPortRecordTest, IdsAreLowercaseHex) {
    auto record = makeSerialPortRecord(
        {.callout_path = "/dev/cu.usbmodem1", .vendor_id = 0x1A86,
         .product_id = 0x7523});
    EXPECT_EQ(record["ID_VENDOR_ID"], "1a86");
    EXPECT_EQ(record["ID_MODEL_ID"], "7523");
}

// Built-in ports have no USB parent and carry no identity
TEST(MakeSerialPortRecordTest, PortWithoutUsbParentIsBare) {
    auto record =
        makeSerialPortRecord({.callout_path = "/dev/cu.Bluetooth-Incoming-Port"});
    EXPECT_TRUE(record.empty());
    EXPECT_FALSE(hasDeviceIdentity(record));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
