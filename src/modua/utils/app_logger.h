#pragma once

#include <QString>

#include "modua/modua_export.h"

namespace modua {

/**
 * spdlog 日志初始化
 *
 * 控制台 (stderr) + 滚动文件 modua.log；安装 Qt 消息处理器，
 * 库内统一使用 qDebug/qInfo/qWarning/qCritical 记录日志。
 */
class MODUA_API AppLogger {
public:
    struct Config {
        QString logLevel = "info";
        QString logDir;
        qint64 maxFileBytes = 10 * 1024 * 1024;
        int maxFiles = 3;
    };

    static bool init(const Config& config, QString& error);
    static void shutdown();
    static void setLevel(const QString& level);

private:
    AppLogger() = delete;
};

} // namespace modua
