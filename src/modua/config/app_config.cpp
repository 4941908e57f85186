#include "app_config.h"

#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>

#include "modua/utils/file_utils.h"

namespace modua {

namespace {

bool isValidLogLevel(const QString& level)
{
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

bool readInt(const QJsonObject& obj, const QString& key, int min, int max, int& out, QString& error)
{
    if (!obj.contains(key)) return true;
    if (!obj.value(key).isDouble()) {
        error = QString("config field '%1' must be an integer").arg(key);
        return false;
    }
    const double raw = obj.value(key).toDouble();
    if (raw < min || raw > max) {
        error = QString("config field '%1' out of range").arg(key);
        return false;
    }
    out = static_cast<int>(raw);
    return true;
}

} // namespace

AppConfig AppConfig::loadFromFile(const QString& filePath, QString& error)
{
    AppConfig cfg;

    if (!QFileInfo::exists(filePath)) {
        error.clear();
        return cfg;
    }

    QJsonObject obj;
    if (!readJsonObject(filePath, obj, error)) return cfg;

    static const QSet<QString> known = {"logLevel", "logMaxBytes", "logMaxFiles", "lastProject",
                                        "diagnosticsCapacity", "onlyTxRx"};
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!known.contains(it.key())) {
            error = "unknown field in config.json: " + it.key();
            return cfg;
        }
    }

    if (obj.contains("logLevel")) {
        if (!obj.value("logLevel").isString()) {
            error = "config field 'logLevel' must be a string";
            return cfg;
        }
        cfg.logLevel = obj.value("logLevel").toString();
        if (!isValidLogLevel(cfg.logLevel)) {
            error = "invalid config logLevel: " + cfg.logLevel;
            return cfg;
        }
    }

    if (obj.contains("logMaxBytes")) {
        if (!obj.value("logMaxBytes").isDouble()) {
            error = "config field 'logMaxBytes' must be an integer";
            return cfg;
        }
        cfg.logMaxBytes = static_cast<qint64>(obj.value("logMaxBytes").toDouble());
        if (cfg.logMaxBytes < 1024) {
            error = "config field 'logMaxBytes' out of range";
            return cfg;
        }
    }

    if (!readInt(obj, "logMaxFiles", 1, 100, cfg.logMaxFiles, error)) return cfg;
    if (!readInt(obj, "diagnosticsCapacity", 100, 1000000, cfg.diagnosticsCapacity, error)) return cfg;

    if (obj.contains("lastProject")) {
        if (!obj.value("lastProject").isString()) {
            error = "config field 'lastProject' must be a string";
            return cfg;
        }
        cfg.lastProject = obj.value("lastProject").toString();
    }

    if (obj.contains("onlyTxRx")) {
        if (!obj.value("onlyTxRx").isBool()) {
            error = "config field 'onlyTxRx' must be a boolean";
            return cfg;
        }
        cfg.onlyTxRx = obj.value("onlyTxRx").toBool();
    }

    error.clear();
    return cfg;
}

bool AppConfig::saveToFile(const QString& filePath, QString& error) const
{
    QJsonObject obj;
    obj["logLevel"] = logLevel;
    obj["logMaxBytes"] = static_cast<double>(logMaxBytes);
    obj["logMaxFiles"] = logMaxFiles;
    obj["lastProject"] = lastProject;
    obj["diagnosticsCapacity"] = diagnosticsCapacity;
    obj["onlyTxRx"] = onlyTxRx;
    return atomicWrite(filePath, QJsonDocument(obj).toJson(QJsonDocument::Indented), error);
}

void AppConfig::applyArgs(const AppArgs& args)
{
    if (args.hasLogLevel) {
        logLevel = args.logLevel;
    }
    if (args.hasProject) {
        lastProject = args.project;
    }
}

} // namespace modua
