#include <gtest/gtest.h>

#include <QLineEdit>

#include "ui/dialogs/write_value_dialog.h"

namespace {

bool parse(const QString& text, const QString& type, QVariant& out) {
    QString error;
    return WriteValueDialog::parseValue(text, type, out, error);
}

} // namespace

TEST(WriteValueDialogTest, ParsesBooleans) {
    QVariant v;
    for (const QString& text : {"true", "1", "ON", " on "}) {
        ASSERT_TRUE(parse(text, "Boolean", v)) << qPrintable(text);
        EXPECT_TRUE(v.toBool());
    }
    ASSERT_TRUE(parse("off", "Boolean", v));
    EXPECT_FALSE(v.toBool());
    EXPECT_FALSE(parse("yes please", "Boolean", v));
}

TEST(WriteValueDialogTest, ChecksIntegerRanges) {
    QVariant v;
    EXPECT_TRUE(parse("-32768", "Short", v));
    EXPECT_FALSE(parse("32768", "Short", v));
    EXPECT_TRUE(parse("65535", "Word", v));
    EXPECT_FALSE(parse("-1", "Word", v));
    EXPECT_FALSE(parse("10000", "BCD", v));
    EXPECT_TRUE(parse("99999999", "LBCD", v));
    EXPECT_FALSE(parse("1.5", "Long", v));

    QString error;
    EXPECT_FALSE(WriteValueDialog::parseValue("70000", "Word", v, error));
    EXPECT_EQ(error, "70000 is out of range [0, 65535]");
}

TEST(WriteValueDialogTest, ParsesFloatsAndWideIntegers) {
    QVariant v;
    ASSERT_TRUE(parse("0.1", "Float", v));
    EXPECT_DOUBLE_EQ(v.toDouble(), static_cast<double>(0.1f));
    ASSERT_TRUE(parse("0.1", "Double", v));
    EXPECT_DOUBLE_EQ(v.toDouble(), 0.1);
    ASSERT_TRUE(parse("18446744073709551615", "QWord", v));
    EXPECT_EQ(v.toULongLong(), 18446744073709551615ULL);
    EXPECT_FALSE(parse("abc", "Float", v));
}

TEST(WriteValueDialogTest, ParsesArrays) {
    QVariant v;
    ASSERT_TRUE(parse("1, 2,3", "Word(Array)", v));
    const QVariantList list = v.toList();
    ASSERT_EQ(list.size(), 3);
    EXPECT_EQ(list[2].toInt(), 3);

    QString error;
    EXPECT_FALSE(WriteValueDialog::parseValue("1,x", "Short(Array)", v, error));
    EXPECT_TRUE(error.startsWith("element 1:"));
}

TEST(WriteValueDialogTest, RejectsEmptyAndUnknownType) {
    QVariant v;
    QString error;
    EXPECT_FALSE(WriteValueDialog::parseValue("  ", "Word", v, error));
    EXPECT_FALSE(WriteValueDialog::parseValue("1", "Nibble", v, error));
    EXPECT_TRUE(error.contains("Nibble"));
}

TEST(WriteValueDialogTest, ReadOnlyTagDisablesInput) {
    WriteValueDialog readOnly("Temp", "Word", "Read Only", 5);
    EXPECT_FALSE(readOnly.input()->isEnabled());

    WriteValueDialog writable("Temp", "Word", "Read/Write", QVariant());
    EXPECT_TRUE(writable.input()->isEnabled());
    EXPECT_FALSE(writable.value().isValid());
}
