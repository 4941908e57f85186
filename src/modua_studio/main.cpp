#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>

#include "modua/config/app_args.h"
#include "modua/config/app_config.h"
#include "modua/utils/app_logger.h"
#include "ui/app_style.h"
#include "ui/mainwindow.h"

#ifndef MODUA_VERSION
#define MODUA_VERSION "1.0.0"
#endif

namespace {

bool ensureDirectories(const QString &dataRoot)
{
    static const char *kDirs[] = {"logs", "certs"};
    for (const char *sub : kDirs) {
        if (!QDir(dataRoot + "/" + sub).mkpath(".")) {
            std::fprintf(stderr, "Failed to create: %s/%s\n", qUtf8Printable(dataRoot), sub);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("ModUA");
    app.setApplicationVersion(MODUA_VERSION);
    app.setOrganizationName("ModUA");

    const modua::AppArgs args = modua::AppArgs::parse(app.arguments());
    if (args.help) {
        QTextStream err(stderr);
        err << modua::AppArgs::usage();
        err.flush();
        return 0;
    }
    if (args.version) {
        std::fprintf(stderr, "modua_studio %s\n", MODUA_VERSION);
        return 0;
    }
    if (!args.error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(args.error));
        return 2;
    }

    const QString dataRoot = QDir(args.dataRoot).absolutePath();
    const QString configPath = dataRoot + "/config.json";

    QString error;
    modua::AppConfig config = modua::AppConfig::loadFromFile(configPath, error);
    if (!error.isEmpty()) {
        std::fprintf(stderr, "Error: %s\n", qUtf8Printable(error));
        return 2;
    }
    config.applyArgs(args);

    if (!ensureDirectories(dataRoot)) {
        return 1;
    }

    modua::AppLogger::Config logConfig;
    logConfig.logLevel = config.logLevel;
    logConfig.logDir = dataRoot + "/logs";
    logConfig.maxFileBytes = config.logMaxBytes;
    logConfig.maxFiles = config.logMaxFiles;
    if (!modua::AppLogger::init(logConfig, error)) {
        std::fprintf(stderr, "Logger init error: %s\n", qUtf8Printable(error));
        return 1;
    }
    qInfo("ModUA %s starting, data root %s", MODUA_VERSION, qUtf8Printable(dataRoot));

    AppStyle::apply(app);

    int rc = 0;
    {
        MainWindow window(config, dataRoot);
        if (!config.lastProject.isEmpty() && QFileInfo::exists(config.lastProject)) {
            QString openError;
            if (!window.openProject(config.lastProject, openError)) {
                qWarning("Could not reopen %s: %s", qUtf8Printable(config.lastProject),
                         qUtf8Printable(openError));
            }
        }
        window.show();

        rc = app.exec();

        // 只回写最近工程与终端选项，命令行覆盖的值不落盘
        QString saveError;
        modua::AppConfig persisted = modua::AppConfig::loadFromFile(configPath, saveError);
        persisted.lastProject = window.config().lastProject;
        persisted.onlyTxRx = window.config().onlyTxRx;
        saveError.clear();
        if (!persisted.saveToFile(configPath, saveError)) {
            qWarning("Failed to save %s: %s", qUtf8Printable(configPath), qUtf8Printable(saveError));
        }
    }

    qInfo("ModUA exiting");
    modua::AppLogger::shutdown();
    return rc;
}
