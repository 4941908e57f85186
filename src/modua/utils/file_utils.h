#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "modua/modua_export.h"

namespace modua {

/// Atomic write using QSaveFile
MODUA_API bool atomicWrite(const QString& filePath, const QByteArray& content, QString& error);

/// 读取整个文件
MODUA_API bool readFile(const QString& filePath, QByteArray& content, QString& error);

/// 读取 JSON 对象文件；根不是对象时报错
MODUA_API bool readJsonObject(const QString& filePath, QJsonObject& obj, QString& error);

} // namespace modua
