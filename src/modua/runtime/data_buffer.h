#pragma once

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>
#include <QVariant>

#include "modua/modua_export.h"

namespace modua {

/**
 * 单个标签的实时数据
 */
struct MODUA_API TagSnapshot {
    QVariant value;
    double timestamp = 0.0;     // epoch 秒
    QString quality;            // "Good" / "Bad" / "Uncertain"
    int updateCount = 0;
    QDateTime lastUpdate;
    QDateTime lastWrite;
    QString dataType;           // 静态信息
    QString access;
};

/**
 * 线程安全的标签数据缓冲
 *
 * 轮询线程写入，监视表和 OPC UA 服务读取。条目数超过容量时淘汰最早加入的标签。
 */
class MODUA_API DataBuffer {
public:
    explicit DataBuffer(int maxSize = 2000);

    void updateTag(const QString& path, const QVariant& value, double timestamp,
                   const QString& quality, int updateCount);
    void setTagInfo(const QString& path, const QString& dataType, const QString& access);

    /** 合并静态信息与实时数据；未知标签返回 false */
    bool tagData(const QString& path, TagSnapshot& out) const;
    QVariant tagValue(const QString& path) const;

    /** 写回缓冲（双向同步用） */
    void writeTagValue(const QString& path, const QVariant& value);

    QHash<QString, TagSnapshot> allTags() const;
    int size() const;
    int maxSize() const { return m_maxSize; }
    void clear();

private:
    TagSnapshot& entry(const QString& path);

    mutable QMutex m_mutex;
    int m_maxSize;
    QHash<QString, TagSnapshot> m_tags;
    QList<QString> m_order;
};

} // namespace modua
