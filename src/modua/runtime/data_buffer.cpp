#include "data_buffer.h"

#include <QMutexLocker>

namespace modua {

DataBuffer::DataBuffer(int maxSize)
    : m_maxSize(qMax(1, maxSize))
{
}

TagSnapshot& DataBuffer::entry(const QString& path)
{
    auto it = m_tags.find(path);
    if (it != m_tags.end()) return it.value();

    while (m_tags.size() >= m_maxSize && !m_order.isEmpty()) {
        m_tags.remove(m_order.takeFirst());
    }
    m_order.append(path);
    return m_tags[path];
}

void DataBuffer::updateTag(const QString& path, const QVariant& value, double timestamp,
                           const QString& quality, int updateCount)
{
    QMutexLocker locker(&m_mutex);
    TagSnapshot& s = entry(path);
    s.value = value;
    s.timestamp = timestamp;
    s.quality = quality;
    s.updateCount = updateCount;
    s.lastUpdate = QDateTime::currentDateTime();
}

void DataBuffer::setTagInfo(const QString& path, const QString& dataType, const QString& access)
{
    QMutexLocker locker(&m_mutex);
    TagSnapshot& s = entry(path);
    s.dataType = dataType;
    s.access = access;
}

bool DataBuffer::tagData(const QString& path, TagSnapshot& out) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_tags.constFind(path);
    if (it == m_tags.constEnd()) return false;
    out = it.value();
    return true;
}

QVariant DataBuffer::tagValue(const QString& path) const
{
    QMutexLocker locker(&m_mutex);
    return m_tags.value(path).value;
}

void DataBuffer::writeTagValue(const QString& path, const QVariant& value)
{
    QMutexLocker locker(&m_mutex);
    TagSnapshot& s = entry(path);
    s.value = value;
    s.lastWrite = QDateTime::currentDateTime();
}

QHash<QString, TagSnapshot> DataBuffer::allTags() const
{
    QMutexLocker locker(&m_mutex);
    return m_tags;
}

int DataBuffer::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_tags.size();
}

void DataBuffer::clear()
{
    QMutexLocker locker(&m_mutex);
    m_tags.clear();
    m_order.clear();
}

} // namespace modua
