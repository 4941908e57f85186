#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "modua/utils/app_logger.h"

using namespace modua;

namespace {

QStringList readLogLines(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return {};
    QStringList lines;
    while (!file.atEnd()) {
        const QString line = QString::fromUtf8(file.readLine()).trimmed();
        if (!line.isEmpty()) lines.append(line);
    }
    return lines;
}

QStringList logAtLevel(const QString& level, const QString& dir) {
    AppLogger::Config cfg;
    cfg.logLevel = level;
    cfg.logDir = dir;
    QString error;
    EXPECT_TRUE(AppLogger::init(cfg, error)) << qPrintable(error);
    qDebug("d");
    qInfo("i");
    qWarning("w");
    qCritical("e");
    AppLogger::shutdown();
    return readLogLines(dir + "/modua.log");
}

} // namespace

TEST(AppLoggerTest, InfoLevelFiltersDebug) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QStringList lines = logAtLevel("info", tmpDir.path());
    EXPECT_EQ(lines.size(), 3);
    for (const QString& line : lines) {
        EXPECT_FALSE(line.contains("[D]"));
    }
}

TEST(AppLoggerTest, WarnLevelFiltersInfo) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    EXPECT_EQ(logAtLevel("warn", tmpDir.path()).size(), 2);
}

TEST(AppLoggerTest, DebugLevelOutputsAll) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QStringList lines = logAtLevel("debug", tmpDir.path());
    ASSERT_EQ(lines.size(), 4);
    EXPECT_TRUE(lines[0].contains("[D] d"));
    EXPECT_TRUE(lines[3].contains("[E] e"));
}

TEST(AppLoggerTest, CreatesMissingLogDirectory) {
    QTemporaryDir tmpDir;
    ASSERT_TRUE(tmpDir.isValid());
    const QString nested = tmpDir.path() + "/a/b/logs";
    logAtLevel("info", nested);
    EXPECT_TRUE(QDir(nested).exists());
    EXPECT_TRUE(QFile::exists(nested + "/modua.log"));
}
