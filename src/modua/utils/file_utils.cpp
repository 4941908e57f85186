#include "file_utils.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace modua {

bool atomicWrite(const QString& filePath, const QByteArray& content, QString& error)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        error = QString("failed to open for writing: %1").arg(file.errorString());
        return false;
    }
    if (file.write(content) != content.size()) {
        file.cancelWriting();
        error = "write incomplete";
        return false;
    }
    if (!file.commit()) {
        error = QString("commit failed: %1").arg(file.errorString());
        return false;
    }
    return true;
}

bool readFile(const QString& filePath, QByteArray& content, QString& error)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("cannot open %1: %2").arg(filePath, file.errorString());
        return false;
    }
    content = file.readAll();
    return true;
}

bool readJsonObject(const QString& filePath, QJsonObject& obj, QString& error)
{
    QByteArray content;
    if (!readFile(filePath, content, error)) return false;

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(content, &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = QString("%1: parse error at offset %2: %3")
                    .arg(QFileInfo(filePath).fileName())
                    .arg(parseErr.offset)
                    .arg(parseErr.errorString());
        return false;
    }
    if (!doc.isObject()) {
        error = QString("%1 must contain a JSON object").arg(QFileInfo(filePath).fileName());
        return false;
    }
    obj = doc.object();
    return true;
}

} // namespace modua
