#include <gtest/gtest.h>
#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

#include "modua/utils/config_utils.h"
#include "modua/utils/file_utils.h"
#include "modua/utils/validators.h"

using namespace modua;

TEST(ConfigUtilsTest, SafeGettersFallBack) {
    const QJsonObject obj{{"n", 5}, {"s", "12"}, {"f", "2.5"}, {"b", "Enable"}, {"o", QJsonObject{{"x", 1}}},
                          {"nil", QJsonValue::Null}};
    EXPECT_EQ(safeGetInt(obj, "n"), 5);
    EXPECT_EQ(safeGetInt(obj, "s"), 12);
    EXPECT_EQ(safeGetInt(obj, "missing", 7), 7);
    EXPECT_EQ(safeGetInt(obj, "o", 3), 3);
    EXPECT_DOUBLE_EQ(safeGetDouble(obj, "f"), 2.5);
    EXPECT_EQ(safeGetString(obj, "n"), "5");
    EXPECT_EQ(safeGetString(obj, "o", "def"), "def");
    EXPECT_TRUE(safeGetBool(obj, "b"));
    EXPECT_EQ(safeGetObject(obj, "o").value("x").toInt(), 1);
    EXPECT_TRUE(safeGetObject(obj, "n").isEmpty());
    EXPECT_EQ(safeGet(obj, "nil", 9).toInt(), 9);
}

TEST(ConfigUtilsTest, NumericFlag) {
    EXPECT_EQ(toNumericFlag(QJsonValue("Enable")), 1);
    EXPECT_EQ(toNumericFlag(QJsonValue("disabled"), 1), 0);
    EXPECT_EQ(toNumericFlag(QJsonValue(" ON ")), 1);
    EXPECT_EQ(toNumericFlag(QJsonValue(true)), 1);
    EXPECT_EQ(toNumericFlag(QJsonValue(0)), 0);
    EXPECT_EQ(toNumericFlag(QJsonValue("maybe"), 1), 1);
    EXPECT_EQ(flagToText(1), "Enable");
    EXPECT_EQ(flagToText(0), "Disable");
}

TEST(ConfigUtilsTest, TcpLikeDrivers) {
    EXPECT_TRUE(isTcpLikeDriver("Modbus TCP/IP Ethernet"));
    EXPECT_TRUE(isTcpLikeDriver("Modbus RTU over TCP"));
    EXPECT_FALSE(isTcpLikeDriver("Modbus RTU Serial"));
}

TEST(ConfigUtilsTest, AdapterStrings) {
    AdapterInfo info = parseAdapterString("Ethernet 2 (192.168.1.10)");
    EXPECT_EQ(info.name, "Ethernet 2");
    EXPECT_EQ(info.ip, "192.168.1.10");

    info = parseAdapterString("10.0.0.1 - eth0");
    EXPECT_EQ(info.name, "eth0");
    EXPECT_EQ(info.ip, "10.0.0.1");

    info = parseAdapterString("127.0.0.1");
    EXPECT_TRUE(info.name.isEmpty());
    EXPECT_EQ(info.ip, "127.0.0.1");

    info = parseAdapterString("Wi-Fi");
    EXPECT_EQ(info.name, "Wi-Fi");
    EXPECT_TRUE(info.ip.isEmpty());

    EXPECT_EQ(formatAdapterWithIp("eth0", "10.0.0.1"), "eth0 (10.0.0.1)");
    EXPECT_EQ(formatAdapterWithIp("eth0", ""), "eth0");
}

TEST(ConfigUtilsTest, AdapterListAlwaysHasDefaults) {
    const QStringList adapters = listNetworkAdapters();
    ASSERT_GE(adapters.size(), 2);
    EXPECT_EQ(adapters[0], "Default (0.0.0.0)");
    EXPECT_EQ(adapters[1], "Localhost (127.0.0.1)");
}

TEST(ConfigUtilsTest, FlattenKeepsExistingFlatKeys) {
    const QJsonObject data{{"name", "flat"}, {"general", QJsonObject{{"name", "nested"}, {"id", 3}}}};
    const QJsonObject flat = flattenSections(data, {"general"});
    EXPECT_EQ(flat.value("name").toString(), "flat");
    EXPECT_EQ(flat.value("id").toInt(), 3);
    EXPECT_FALSE(flat.contains("general"));

    const QJsonObject merged = mergeFlatAndNested(data, {"general"});
    EXPECT_EQ(merged.value("name").toString(), "nested");
}

TEST(ValidatorsTest, Ranges) {
    EXPECT_TRUE(isValidIp("192.168.0.1"));
    EXPECT_FALSE(isValidIp("300.1.1.1"));
    EXPECT_FALSE(isValidIp("::1"));
    EXPECT_TRUE(isValidPort(502));
    EXPECT_FALSE(isValidPort(0));
    EXPECT_FALSE(isValidPort(65536));
    EXPECT_TRUE(isValidModbusAddress(65535));
    EXPECT_FALSE(isValidModbusAddress(-1));
    EXPECT_TRUE(isValidFunctionCode(16));
    EXPECT_FALSE(isValidFunctionCode(7));
    EXPECT_TRUE(isValidDeviceId(1));
    EXPECT_FALSE(isValidDeviceId(0));
    EXPECT_TRUE(isValidUnitId(247));
    EXPECT_FALSE(isValidUnitId(248));
    EXPECT_TRUE(isValidTagName("Temp"));
    EXPECT_FALSE(isValidTagName("Temp.1"));
    EXPECT_FALSE(isValidTagName("  "));
    EXPECT_FALSE(isValidScanRate(0));
}

TEST(FileUtilsTest, AtomicWriteAndReadJson) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString path = tmpDir.filePath("a.json");
    QString error;
    ASSERT_TRUE(atomicWrite(path, R"({"x": [1, 2]})", error)) << qPrintable(error);

    QJsonObject obj;
    ASSERT_TRUE(readJsonObject(path, obj, error)) << qPrintable(error);
    EXPECT_EQ(obj.value("x").toArray().size(), 2);
}

TEST(FileUtilsTest, ReadJsonErrors) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    QJsonObject obj;
    QString error;
    EXPECT_FALSE(readJsonObject(tmpDir.filePath("missing.json"), obj, error));

    const QString bad = tmpDir.filePath("bad.json");
    ASSERT_TRUE(atomicWrite(bad, "{oops", error));
    EXPECT_FALSE(readJsonObject(bad, obj, error));
    EXPECT_TRUE(error.contains("parse error"));

    const QString arr = tmpDir.filePath("arr.json");
    ASSERT_TRUE(atomicWrite(arr, "[1]", error));
    EXPECT_FALSE(readJsonObject(arr, obj, error));
    EXPECT_TRUE(error.contains("JSON object"));
}
