#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

#include "modua/modua_export.h"

namespace modua {

// 安全取值：键缺失或类型不符时返回默认值
MODUA_API QJsonValue safeGet(const QJsonObject& obj, const QString& key,
                             const QJsonValue& defaultValue = QJsonValue());
MODUA_API QJsonObject safeGetObject(const QJsonObject& obj, const QString& key);
MODUA_API QString safeGetString(const QJsonObject& obj, const QString& key,
                                const QString& defaultValue = QString());
MODUA_API int safeGetInt(const QJsonObject& obj, const QString& key, int defaultValue = 0);
MODUA_API double safeGetDouble(const QJsonObject& obj, const QString& key, double defaultValue = 0.0);
MODUA_API bool safeGetBool(const QJsonObject& obj, const QString& key, bool defaultValue = false);

/**
 * 将 Enable/Disable、true/false、on/off、1/0 等转为 1/0
 * 无法识别时返回 defaultValue
 */
MODUA_API int toNumericFlag(const QJsonValue& value, int defaultValue = 0);
MODUA_API QString flagToText(int flag);

MODUA_API bool isTcpLikeDriver(const QString& driverName);

struct MODUA_API AdapterInfo {
    QString name;
    QString ip;
};

/**
 * 解析 "Name (IP)" 或 "IP - Name"
 */
MODUA_API AdapterInfo parseAdapterString(const QString& text);
MODUA_API QString formatAdapterWithIp(const QString& name, const QString& ip);

/**
 * 列出可用的 IPv4 网卡，格式 "Name (IP)"
 */
MODUA_API QStringList listNetworkAdapters();

/**
 * 通过 UDP 连接 8.8.8.8:80 探测出站地址，失败返回 127.0.0.1
 */
MODUA_API QString detectOutboundIp();

/**
 * 将分节对象展开为扁平对象，已存在的扁平键不会被覆盖
 */
MODUA_API QJsonObject flattenSections(const QJsonObject& nested, const QStringList& sections);

/**
 * 合并扁平键与分节键，分节键优先
 */
MODUA_API QJsonObject mergeFlatAndNested(const QJsonObject& data, const QStringList& sections);

} // namespace modua
