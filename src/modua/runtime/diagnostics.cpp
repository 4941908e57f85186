#include "diagnostics.h"

#include <QDateTime>
#include <QMutexLocker>
#include <QUuid>

namespace modua {

DiagnosticsManager::DiagnosticsManager(int capacity, bool onlyTxRx)
    : m_capacity(qMax(1, capacity))
    , m_onlyTxRx(onlyTxRx)
{
}

void DiagnosticsManager::setOnlyTxRx(bool value)
{
    QMutexLocker locker(&m_mutex);
    m_onlyTxRx = value;
}

bool DiagnosticsManager::onlyTxRx() const
{
    QMutexLocker locker(&m_mutex);
    return m_onlyTxRx;
}

QString DiagnosticsManager::registerListener(const QString& name, Callback callback, Matcher matcher)
{
    const QString token = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QMutexLocker locker(&m_mutex);
    m_listeners.insert(token, Listener{name, std::move(callback), std::move(matcher)});
    return token;
}

void DiagnosticsManager::unregisterListener(const QString& token)
{
    // 等待正在进行的分发结束，返回后回调不会再被调用
    QMutexLocker dispatch(&m_dispatchMutex);
    QMutexLocker locker(&m_mutex);
    m_listeners.remove(token);
}

int DiagnosticsManager::listenerCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_listeners.size();
}

bool DiagnosticsManager::shouldEmit(const QString& text, const DiagnosticContext& context) const
{
    if (!m_onlyTxRx) return true;
    if (text.contains("TX:") || text.contains("RX:")) return true;
    const QString dir = context.direction.toUpper();
    return dir == "TX" || dir == "RX";
}

QString DiagnosticsManager::currentTimestamp()
{
    return QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
}

void DiagnosticsManager::publish(const QString& text, const DiagnosticContext& context)
{
    QMutexLocker dispatch(&m_dispatchMutex);
    DiagnosticRecord record;
    QVector<Listener> listeners;
    {
        QMutexLocker locker(&m_mutex);
        if (m_listeners.isEmpty()) return;
        if (!shouldEmit(text, context)) return;

        record.timestamp = currentTimestamp();
        record.text = text;
        record.context = context;

        if (m_records.size() < m_capacity) {
            m_records.append(record);
        } else {
            m_records[m_head] = record;
            m_head = (m_head + 1) % m_capacity;
        }
        listeners.reserve(m_listeners.size());
        for (const Listener& l : std::as_const(m_listeners)) listeners.append(l);
    }

    for (const Listener& l : listeners) {
        if (l.matcher && !l.matcher(record)) continue;
        if (l.callback) l.callback(record);
    }
}

QVector<DiagnosticRecord> DiagnosticsManager::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    QVector<DiagnosticRecord> out;
    out.reserve(m_records.size());
    for (int i = 0; i < m_records.size(); ++i) {
        out.append(m_records[(m_head + i) % m_records.size()]);
    }
    return out;
}

void DiagnosticsManager::clear()
{
    QMutexLocker locker(&m_mutex);
    m_records.clear();
    m_head = 0;
}

void DiagnosticsManager::stop()
{
    QMutexLocker dispatch(&m_dispatchMutex);
    QMutexLocker locker(&m_mutex);
    m_listeners.clear();
    m_records.clear();
    m_head = 0;
}

} // namespace modua
