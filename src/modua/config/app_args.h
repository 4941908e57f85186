#pragma once

#include <QString>
#include <QStringList>

#include "modua/modua_export.h"

namespace modua {

/**
 * 命令行参数
 *
 * --data-root=DIR   配置、日志与证书的根目录
 * --log-level=LVL   debug|info|warn|error
 * --project=FILE    启动时打开的工程
 */
struct MODUA_API AppArgs {
    QString dataRoot = ".";
    QString logLevel = "info";
    QString project;

    bool hasLogLevel = false;
    bool hasProject = false;

    bool help = false;
    bool version = false;
    QString error;

    static AppArgs parse(const QStringList& args);
    static QString usage();
};

} // namespace modua
