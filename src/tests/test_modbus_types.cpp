#include <gtest/gtest.h>

#include "modua/modbus/modbus_types.h"

using namespace modua::modbus;

TEST(ModbusTypesTest, ParseScalarAndArrayTypes) {
    TagType type;
    ASSERT_TRUE(parseDataType("Word", type));
    EXPECT_EQ(type.base, DataType::Word);
    EXPECT_FALSE(type.isArray);

    ASSERT_TRUE(parseDataType("Float(Array)", type));
    EXPECT_EQ(type.base, DataType::Float);
    EXPECT_TRUE(type.isArray);

    ASSERT_TRUE(parseDataType("dword array", type));
    EXPECT_EQ(type.base, DataType::DWord);
    EXPECT_TRUE(type.isArray);

    ASSERT_TRUE(parseDataType("Short[]", type));
    EXPECT_EQ(type.base, DataType::Short);
    EXPECT_TRUE(type.isArray);
}

TEST(ModbusTypesTest, ParseAliases) {
    TagType type;
    ASSERT_TRUE(parseDataType("bool", type));
    EXPECT_TRUE(type.isBoolean());
    ASSERT_TRUE(parseDataType("uint64", type));
    EXPECT_EQ(type.base, DataType::QWord);
    EXPECT_FALSE(parseDataType("Banana", type));
}

TEST(ModbusTypesTest, RegisterCounts) {
    EXPECT_EQ(registerCount(DataType::Boolean), 1);
    EXPECT_EQ(registerCount(DataType::Word), 1);
    EXPECT_EQ(registerCount(DataType::Float), 2);
    EXPECT_EQ(registerCount(DataType::Double), 4);
    EXPECT_EQ(registerCount(DataType::QWord), 4);
    EXPECT_EQ(registerCount(DataType::String), 6);
}

TEST(ModbusTypesTest, DisplayNamesListEveryArrayVariant) {
    const QStringList names = tagDataTypeNames();
    EXPECT_TRUE(names.contains("Boolean"));
    EXPECT_TRUE(names.contains("Boolean(Array)"));
    EXPECT_TRUE(names.contains("String(Array)"));
    EXPECT_EQ(names.size() % 2, 0);

    TagType type{DataType::Long, true};
    EXPECT_EQ(type.displayName(), "Long(Array)");
}

TEST(ModbusTypesTest, ParseAddress) {
    ParsedAddress addr;
    QString error;
    ASSERT_TRUE(parseAddress("400010", addr, error)) << qPrintable(error);
    EXPECT_EQ(addr.type, AddressType::HoldingRegister);
    EXPECT_EQ(addr.index, 10);
    EXPECT_FALSE(addr.isArray());

    ASSERT_TRUE(parseAddress("300000 [25]", addr, error));
    EXPECT_EQ(addr.type, AddressType::InputRegister);
    EXPECT_EQ(addr.arraySize, 25);

    // 少于六位左补零，落在线圈区
    ASSERT_TRUE(parseAddress("12", addr, error));
    EXPECT_EQ(addr.type, AddressType::Coil);
    EXPECT_EQ(addr.index, 12);
}

TEST(ModbusTypesTest, ParseAddressRejectsBadInput) {
    ParsedAddress addr;
    QString error;
    EXPECT_FALSE(parseAddress("200001", addr, error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(parseAddress("4000x1", addr, error));
    EXPECT_FALSE(parseAddress("400000 [0]", addr, error));
    EXPECT_FALSE(parseAddress("465537", addr, error));
}

TEST(ModbusTypesTest, WireAddressHonoursZeroBasedFlags) {
    ParsedAddress reg;
    reg.type = AddressType::HoldingRegister;
    reg.index = 1;
    EXPECT_EQ(wireAddress(reg, false, true), 1);
    EXPECT_EQ(wireAddress(reg, true, true), 0);

    ParsedAddress bit;
    bit.type = AddressType::Coil;
    bit.index = 0;
    EXPECT_EQ(wireAddress(bit, false, true), 0);
    EXPECT_EQ(wireAddress(bit, false, false), -1);
}

TEST(ModbusTypesTest, SixDigitHoldingAddressOnTheWire) {
    ParsedAddress addr;
    QString error;
    ASSERT_TRUE(parseAddress("400001", addr, error)) << qPrintable(error);
    EXPECT_EQ(wireAddress(addr, false, true), 1);
    EXPECT_EQ(wireAddress(addr, true, true), 0);

    ASSERT_TRUE(parseAddress("400000", addr, error));
    EXPECT_EQ(wireAddress(addr, false, true), 0);
    EXPECT_EQ(wireAddress(addr, true, true), -1);
}

TEST(ModbusTypesTest, PrefixAndFormat) {
    EXPECT_EQ(prefixFor(TagType{DataType::Boolean, false}, true), QChar('0'));
    EXPECT_EQ(prefixFor(TagType{DataType::Boolean, false}, false), QChar('1'));
    EXPECT_EQ(prefixFor(TagType{DataType::Float, false}, true), QChar('4'));
    EXPECT_EQ(prefixFor(TagType{DataType::Float, false}, false), QChar('3'));

    EXPECT_EQ(formatAddress('4', 7), "400007");
    EXPECT_EQ(formatAddress('3', 100, 4), "300100 [4]");
}

TEST(ModbusTypesTest, EncodingFromJsonAcceptsTextAndNumbers) {
    const DeviceEncoding defaults = DeviceEncoding::fromJson(QJsonObject());
    EXPECT_TRUE(defaults.byteOrderBig);
    EXPECT_TRUE(defaults.wordLowHigh);
    EXPECT_FALSE(defaults.bitOrderMsb);

    const DeviceEncoding enc = DeviceEncoding::fromJson(
        QJsonObject{{"byte_order", "Disable"}, {"word_order", 0}, {"treat_longs_as_decimals", "Enable"}});
    EXPECT_FALSE(enc.byteOrderBig);
    EXPECT_FALSE(enc.wordLowHigh);
    EXPECT_TRUE(enc.longsAsDecimals);
    EXPECT_EQ(enc.toJson().value("word_order").toInt(), 0);
}

TEST(ModbusTypesTest, ExceptionMessages) {
    EXPECT_EQ(exceptionMessage(ExceptionCode::IllegalDataAddress), "Illegal data address");
    EXPECT_EQ(readFunctionFor(AddressType::InputRegister), FunctionCode::ReadInputRegisters);
    EXPECT_TRUE(isBitAddress(AddressType::DiscreteInput));
}
