#include <gtest/gtest.h>

#include <QVariantList>

#include "modua/modbus/value_codec.h"

using namespace modua::modbus;

namespace {

DeviceEncoding bigEndianHighFirst() {
    DeviceEncoding enc;
    enc.byteOrderBig = true;
    enc.wordLowHigh = false;
    enc.dwordLowHigh = false;
    return enc;
}

} // namespace

TEST(ValueCodecTest, DecodeWordAndShort) {
    const ValueCodec codec;
    const QVector<uint16_t> regs = {0xFFFE};
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::Word, false}, regs).toULongLong(), 0xFFFEu);
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::Short, false}, regs).toLongLong(), -2);
}

TEST(ValueCodecTest, DefaultEncodingPutsLowWordFirst) {
    const ValueCodec codec;
    const QVector<uint16_t> regs = {0x5678, 0x1234};
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::DWord, false}, regs).toULongLong(), 0x12345678u);

    QVector<uint16_t> out;
    QString error;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::DWord, false}, 0x12345678u, out, error));
    EXPECT_EQ(out, regs);
}

TEST(ValueCodecTest, HighWordFirstEncoding) {
    const ValueCodec codec(bigEndianHighFirst());
    const QVector<uint16_t> regs = {0x1234, 0x5678};
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::DWord, false}, regs).toULongLong(), 0x12345678u);
}

TEST(ValueCodecTest, LittleEndianBytesSwapEachWord) {
    DeviceEncoding enc;
    enc.byteOrderBig = false;
    const ValueCodec codec(enc);
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::Word, false}, {0x3412}).toULongLong(), 0x1234u);
}

TEST(ValueCodecTest, FloatDecodesIeee754) {
    const ValueCodec codec(bigEndianHighFirst());
    // 1.5f = 0x3FC00000
    const QVariant v = codec.decodeRegisters(TagType{DataType::Float, false}, {0x3FC0, 0x0000});
    EXPECT_DOUBLE_EQ(v.toDouble(), 1.5);
}

TEST(ValueCodecTest, DoubleUsesFourRegisters) {
    const ValueCodec codec(bigEndianHighFirst());
    QVector<uint16_t> regs;
    QString error;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::Double, false}, -2.25, regs, error));
    ASSERT_EQ(regs.size(), 4);
    EXPECT_DOUBLE_EQ(codec.decodeRegisters(TagType{DataType::Double, false}, regs).toDouble(), -2.25);
}

TEST(ValueCodecTest, QWordUsesFourRegisters) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    const quint64 value = 0x0102030405060708ULL;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::QWord, false}, value, regs, error));
    ASSERT_EQ(regs.size(), 4);
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::QWord, false}, regs).toULongLong(), value);
}

TEST(ValueCodecTest, LongsAsDecimals) {
    DeviceEncoding enc = bigEndianHighFirst();
    enc.longsAsDecimals = true;
    const ValueCodec codec(enc);

    QVector<uint16_t> regs;
    QString error;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::QWord, false}, 12345678, regs, error));
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::QWord, false}, regs).toULongLong(), 12345678u);

    // 超出上限时截断到 99999999
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::QWord, false}, 123456789, regs, error));
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::QWord, false}, regs).toULongLong(),
              ValueCodec::kMaxDecimalLong);
}

TEST(ValueCodecTest, BcdRoundTripAndInvalidNibble) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::BCD, false}, 1234, regs, error));
    EXPECT_EQ(regs.value(0), 0x1234);
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::BCD, false}, regs).toULongLong(), 1234u);

    EXPECT_FALSE(codec.decodeRegisters(TagType{DataType::BCD, false}, {0x12AF}).isValid());
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::BCD, false}, 10000, regs, error));
}

TEST(ValueCodecTest, StringIsTwelveLatin1Chars) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::String, false}, QString("PUMP-01"), regs, error));
    ASSERT_EQ(regs.size(), 6);
    EXPECT_EQ(regs[0], ('P' << 8) | 'U');
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::String, false}, regs).toString(), "PUMP-01");
}

TEST(ValueCodecTest, RangeChecksOnEncode) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Short, false}, 40000, regs, error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Word, false}, -1, regs, error));
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Byte, false}, 256, regs, error));
    EXPECT_TRUE(codec.encodeRegisters(TagType{DataType::Short, false}, -32768, regs, error));
}

TEST(ValueCodecTest, IntegerTypesRejectFractions) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Short, false}, 3.7, regs, error));
    EXPECT_TRUE(error.contains("whole number")) << qPrintable(error);
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Word, false}, QString("7.5"), regs, error));
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::DWord, false}, 0.5, regs, error));
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::LLong, false}, -1.25, regs, error));

    regs.clear();
    ASSERT_TRUE(codec.encodeRegisters(TagType{DataType::Short, false}, 4.0, regs, error)) << qPrintable(error);
    ASSERT_EQ(regs.size(), 1);
    EXPECT_EQ(regs[0], 4);
}

TEST(ValueCodecTest, FloatRejectsValuesBeyondSinglePrecision) {
    const ValueCodec codec;
    QVector<uint16_t> regs;
    QString error;
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Float, false}, 1e39, regs, error));
    EXPECT_TRUE(error.contains("out of range")) << qPrintable(error);
    EXPECT_FALSE(codec.encodeRegisters(TagType{DataType::Float, false}, -3.5e38, regs, error));
    EXPECT_TRUE(codec.encodeRegisters(TagType{DataType::Float, false}, 3.4e38, regs, error)) << qPrintable(error);
    EXPECT_TRUE(codec.encodeRegisters(TagType{DataType::Double, false}, 1e39, regs, error)) << qPrintable(error);
}

TEST(ValueCodecTest, ArrayDecodeAndShortInput) {
    const ValueCodec codec;
    const QVector<uint16_t> regs = {1, 2, 3};
    const QVariant list = codec.decodeRegisters(TagType{DataType::Word, true}, regs, 0, 3);
    ASSERT_EQ(list.toList().size(), 3);
    EXPECT_EQ(list.toList().at(2).toULongLong(), 3u);

    // 寄存器不足
    EXPECT_FALSE(codec.decodeRegisters(TagType{DataType::Word, true}, regs, 1, 3).isValid());
    EXPECT_FALSE(codec.decodeRegisters(TagType{DataType::Float, false}, {1}).isValid());
}

TEST(ValueCodecTest, BitOrderReversesSixteenBitValues) {
    DeviceEncoding enc;
    enc.bitOrderMsb = true;
    const ValueCodec codec(enc);
    EXPECT_EQ(codec.decodeRegisters(TagType{DataType::Word, false}, {0x0001}).toULongLong(), 0x8000u);
    EXPECT_EQ(ValueCodec::reverseBits16(0x8001), 0x8001);
}

TEST(ValueCodecTest, BitsDecodeAndEncode) {
    const ValueCodec codec;
    const QVector<bool> bits = {true, false, true};
    EXPECT_TRUE(codec.decodeBits(bits, 2).toBool());
    EXPECT_EQ(codec.decodeBits(bits, 0, 3).toList().size(), 3);
    EXPECT_FALSE(codec.decodeBits(bits, 3).isValid());

    QVector<bool> out;
    QString error;
    ASSERT_TRUE(codec.encodeBits(QVariantList{true, "off", 1}, out, error));
    EXPECT_EQ(out, (QVector<bool>{true, false, true}));
    EXPECT_FALSE(codec.encodeBits(QString("maybe"), out, error));
}

TEST(ValueCodecTest, VariantToBool) {
    bool b = false;
    EXPECT_TRUE(variantToBool(QString("Yes"), b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(variantToBool(0, b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(variantToBool(QString("2x"), b));
}
