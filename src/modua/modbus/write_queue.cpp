#include "write_queue.h"

#include <QDebug>
#include <QMutexLocker>

namespace modua::modbus {

WriteQueue::WriteQueue(int maxPending, int maxAttempts)
    : m_maxPending(qMax(1, maxPending))
    , m_maxAttempts(qMax(1, maxAttempts))
{
}

void WriteQueue::setDiagnosticSink(DiagnosticSink sink)
{
    QMutexLocker locker(&m_mutex);
    m_sink = std::move(sink);
}

WriteQueue::Key WriteQueue::keyOf(const WriteRequest& request)
{
    return qMakePair(request.address, static_cast<int>(request.function));
}

void WriteQueue::emitDiagnostic(const QString& text) const
{
    if (m_sink) m_sink(text);
}

bool WriteQueue::enqueue(WriteRequest request)
{
    QString diag;
    bool accepted = true;
    {
        QMutexLocker locker(&m_mutex);
        const Key key = keyOf(request);
        request.sequence = m_nextSequence++;
        request.attempts = 0;

        if (m_entries.contains(key)) {
            m_entries[key] = request;
            m_stats.overwritten++;
            diag = QString("WRITE_QUEUE_OVERRIDE %1 addr=%2 fc=%3")
                       .arg(request.tagPath).arg(request.address).arg(static_cast<int>(request.function));
        } else if (m_entries.size() >= m_maxPending) {
            m_stats.failed++;
            accepted = false;
            diag = QString("WRITE_QUEUE_FULL %1 pending=%2").arg(request.tagPath).arg(m_entries.size());
        } else {
            m_entries.insert(key, request);
            m_order.append(key);
            diag = QString("WRITE_QUEUE_ENQUEUE %1 addr=%2 fc=%3")
                       .arg(request.tagPath).arg(request.address).arg(static_cast<int>(request.function));
        }
        if (accepted) m_stats.enqueued++;
        m_stats.pending = m_entries.size();
    }

    if (accepted) {
        qDebug().noquote() << diag;
    } else {
        qWarning().noquote() << diag;
    }
    emitDiagnostic(diag);
    return accepted;
}

QVector<WriteRequest> WriteQueue::takeBatch(int maxCount) const
{
    QMutexLocker locker(&m_mutex);
    QVector<WriteRequest> batch;
    for (const Key& key : m_order) {
        if (batch.size() >= maxCount) break;
        batch.append(m_entries.value(key));
    }
    return batch;
}

void WriteQueue::markCompleted(const WriteRequest& request)
{
    QString diag;
    {
        QMutexLocker locker(&m_mutex);
        const Key key = keyOf(request);
        auto it = m_entries.find(key);
        // 执行期间被新值覆盖时保留新值
        if (it != m_entries.end() && it->sequence == request.sequence) {
            m_entries.erase(it);
            m_order.removeOne(key);
        }
        m_stats.executed++;
        m_stats.pending = m_entries.size();
        diag = QString("WRITE_COMPLETED %1 addr=%2").arg(request.tagPath).arg(request.address);
    }
    emitDiagnostic(diag);
}

void WriteQueue::markFailed(const WriteRequest& request, const QString& reason)
{
    QString diag;
    {
        QMutexLocker locker(&m_mutex);
        const Key key = keyOf(request);
        auto it = m_entries.find(key);
        if (it != m_entries.end() && it->sequence == request.sequence) {
            it->attempts++;
            if (it->attempts >= m_maxAttempts) {
                m_entries.erase(it);
                m_order.removeOne(key);
            } else {
                // 移到队尾，避免阻塞其他写请求
                m_order.removeOne(key);
                m_order.append(key);
            }
        }
        m_stats.failed++;
        m_stats.pending = m_entries.size();
        diag = QString("WRITE_FAILED %1 addr=%2: %3").arg(request.tagPath).arg(request.address).arg(reason);
    }
    qWarning().noquote() << diag;
    emitDiagnostic(diag);
}

bool WriteQueue::isEmpty() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.isEmpty();
}

int WriteQueue::size() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

WriteQueue::Stats WriteQueue::stats() const
{
    QMutexLocker locker(&m_mutex);
    return m_stats;
}

void WriteQueue::clear()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();
    m_order.clear();
    m_stats.pending = 0;
}

} // namespace modua::modbus
