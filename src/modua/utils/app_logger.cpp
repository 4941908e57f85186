#include "app_logger.h"

#include <QDir>
#include <string>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace modua {

namespace {

spdlog::level::level_enum toSpdlogLevel(const QString& level)
{
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

QtMessageHandler s_previousHandler = nullptr;
bool s_installed = false;

void qtToSpdlogHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    auto logger = spdlog::default_logger();
    // 非默认分类附带分类名
    std::string text = msg.toStdString();
    if (context.category && qstrcmp(context.category, "default") != 0) {
        text = std::string("[") + context.category + "] " + text;
    }
    switch (type) {
    case QtDebugMsg:    logger->debug("{}", text); break;
    case QtInfoMsg:     logger->info("{}", text); break;
    case QtWarningMsg:  logger->warn("{}", text); break;
    case QtCriticalMsg: logger->error("{}", text); break;
    case QtFatalMsg:
        logger->critical("{}", text);
        logger->flush();
        abort();
    }
}

} // namespace

bool AppLogger::init(const Config& config, QString& error)
{
    const QString dir = config.logDir.isEmpty() ? QStringLiteral("logs") : config.logDir;
    if (!QDir().mkpath(dir)) {
        error = QString("cannot create log directory: %1").arg(dir);
        return false;
    }

    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            QDir(dir).filePath("modua.log").toStdString(),
            static_cast<size_t>(config.maxFileBytes),
            static_cast<size_t>(config.maxFiles));

        auto logger = std::make_shared<spdlog::logger>(
            "modua", spdlog::sinks_init_list{consoleSink, fileSink});

        logger->set_level(toSpdlogLevel(config.logLevel));
        logger->set_pattern("%Y-%m-%dT%H:%M:%S.%eZ [%L] %v", spdlog::pattern_time_type::utc);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        if (!s_installed) {
            s_previousHandler = qInstallMessageHandler(qtToSpdlogHandler);
            s_installed = true;
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        error = QString("failed to initialize logger: %1").arg(ex.what());
        return false;
    }
}

void AppLogger::setLevel(const QString& level)
{
    spdlog::default_logger()->set_level(toSpdlogLevel(level));
}

void AppLogger::shutdown()
{
    if (s_installed) {
        qInstallMessageHandler(s_previousHandler);
        s_previousHandler = nullptr;
        s_installed = false;
    }
    spdlog::shutdown();
}

} // namespace modua
