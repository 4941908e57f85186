#pragma once

#include <QString>

#include "modua/config/app_args.h"
#include "modua/modua_export.h"

namespace modua {

/**
 * 应用配置，保存在 <data-root>/config.json
 *
 * 文件不存在时使用默认值；未知字段、类型错误或越界值视为错误。
 */
struct MODUA_API AppConfig {
    QString logLevel = "info";
    qint64 logMaxBytes = 10 * 1024 * 1024;
    int logMaxFiles = 3;
    QString lastProject;
    int diagnosticsCapacity = 5000;
    bool onlyTxRx = false;

    static AppConfig loadFromFile(const QString& filePath, QString& error);
    bool saveToFile(const QString& filePath, QString& error) const;
    void applyArgs(const AppArgs& args);
};

} // namespace modua
