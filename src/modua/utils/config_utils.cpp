#include "config_utils.h"

#include <QHostAddress>
#include <QNetworkInterface>
#include <QRegularExpression>
#include <QUdpSocket>

namespace modua {

QJsonValue safeGet(const QJsonObject& obj, const QString& key, const QJsonValue& defaultValue)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined() || value.isNull()) {
        return defaultValue;
    }
    return value;
}

QJsonObject safeGetObject(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    return value.isObject() ? value.toObject() : QJsonObject();
}

QString safeGetString(const QJsonObject& obj, const QString& key, const QString& defaultValue)
{
    const QJsonValue value = obj.value(key);
    if (value.isString()) return value.toString();
    if (value.isDouble()) return QString::number(value.toDouble());
    if (value.isBool()) return value.toBool() ? "true" : "false";
    return defaultValue;
}

int safeGetInt(const QJsonObject& obj, const QString& key, int defaultValue)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble()) return value.toInt(defaultValue);
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok) return parsed;
    }
    if (value.isBool()) return value.toBool() ? 1 : 0;
    return defaultValue;
}

double safeGetDouble(const QJsonObject& obj, const QString& key, double defaultValue)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble()) return value.toDouble();
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok) return parsed;
    }
    return defaultValue;
}

bool safeGetBool(const QJsonObject& obj, const QString& key, bool defaultValue)
{
    return toNumericFlag(obj.value(key), defaultValue ? 1 : 0) == 1;
}

int toNumericFlag(const QJsonValue& value, int defaultValue)
{
    if (value.isBool()) {
        return value.toBool() ? 1 : 0;
    }
    if (value.isDouble()) {
        return value.toDouble() != 0.0 ? 1 : 0;
    }
    if (value.isString()) {
        const QString s = value.toString().trimmed().toLower();
        if (s == "enable" || s == "enabled" || s == "true" || s == "1" || s == "on" || s == "yes") {
            return 1;
        }
        if (s == "disable" || s == "disabled" || s == "false" || s == "0" || s == "off" || s == "no") {
            return 0;
        }
    }
    return defaultValue;
}

QString flagToText(int flag)
{
    return flag ? "Enable" : "Disable";
}

bool isTcpLikeDriver(const QString& driverName)
{
    const QString s = driverName.toLower();
    return s.contains("over tcp") || s.contains("ethernet") || s.contains("tcp");
}

AdapterInfo parseAdapterString(const QString& text)
{
    AdapterInfo info;
    const QString s = text.trimmed();
    if (s.isEmpty()) return info;

    static const QRegularExpression nameIp(R"(^(.*?)\s*\(\s*([0-9.]+)\s*\)\s*$)");
    auto match = nameIp.match(s);
    if (match.hasMatch()) {
        info.name = match.captured(1).trimmed();
        info.ip = match.captured(2);
        return info;
    }

    static const QRegularExpression ipName(R"(^([0-9.]+)\s*-\s*(.*)$)");
    match = ipName.match(s);
    if (match.hasMatch()) {
        info.ip = match.captured(1);
        info.name = match.captured(2).trimmed();
        return info;
    }

    QHostAddress addr;
    if (addr.setAddress(s) && addr.protocol() == QAbstractSocket::IPv4Protocol) {
        info.ip = s;
    } else {
        info.name = s;
    }
    return info;
}

QString formatAdapterWithIp(const QString& name, const QString& ip)
{
    if (ip.isEmpty()) return name;
    if (name.isEmpty()) return ip;
    return QString("%1 (%2)").arg(name, ip);
}

QStringList listNetworkAdapters()
{
    QStringList adapters;
    adapters << formatAdapterWithIp("Default", "0.0.0.0");
    adapters << formatAdapterWithIp("Localhost", "127.0.0.1");

    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const QNetworkInterface& iface : interfaces) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) || flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        for (const QNetworkAddressEntry& entry : iface.addressEntries()) {
            if (entry.ip().protocol() != QAbstractSocket::IPv4Protocol) continue;
            adapters << formatAdapterWithIp(iface.humanReadableName(), entry.ip().toString());
        }
    }
    return adapters;
}

QString detectOutboundIp()
{
    QUdpSocket socket;
    socket.connectToHost(QHostAddress("8.8.8.8"), 80);
    if (socket.waitForConnected(500)) {
        const QHostAddress local = socket.localAddress();
        if (local.protocol() == QAbstractSocket::IPv4Protocol && !local.isNull()) {
            return local.toString();
        }
    }
    return "127.0.0.1";
}

QJsonObject flattenSections(const QJsonObject& nested, const QStringList& sections)
{
    QJsonObject flat;
    for (auto it = nested.begin(); it != nested.end(); ++it) {
        if (!sections.contains(it.key())) {
            flat.insert(it.key(), it.value());
        }
    }
    for (const QString& section : sections) {
        const QJsonObject sub = safeGetObject(nested, section);
        for (auto it = sub.begin(); it != sub.end(); ++it) {
            if (!flat.contains(it.key())) {
                flat.insert(it.key(), it.value());
            }
        }
    }
    return flat;
}

QJsonObject mergeFlatAndNested(const QJsonObject& data, const QStringList& sections)
{
    QJsonObject merged;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!sections.contains(it.key())) {
            merged.insert(it.key(), it.value());
        }
    }
    for (const QString& section : sections) {
        const QJsonObject sub = safeGetObject(data, section);
        for (auto it = sub.begin(); it != sub.end(); ++it) {
            merged.insert(it.key(), it.value());
        }
    }
    return merged;
}

} // namespace modua
