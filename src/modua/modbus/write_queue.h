#pragma once

#include <QHash>
#include <QList>
#include <QMutex>
#include <QPair>
#include <QString>
#include <QVector>
#include <functional>

#include "modua/modbus/modbus_types.h"
#include "modua/modua_export.h"

namespace modua::modbus {

/**
 * 待执行的写请求
 */
struct MODUA_API WriteRequest {
    QString tagPath;
    int unitId = 1;
    int address = 0;
    FunctionCode function = FunctionCode::WriteSingleRegister;
    QVector<uint16_t> registers;
    QVector<bool> bits;
    int attempts = 0;
    quint64 sequence = 0;   // 入队时分配，用于识别被覆盖的请求
};

/**
 * 写队列：同一 (地址, 功能码) 只保留最新值
 *
 * takeBatch 不移除条目；执行成功后 markCompleted 移除，
 * 失败则 markFailed 保留以便重试，超过重试上限后丢弃。
 * 线程安全。
 */
class MODUA_API WriteQueue {
public:
    struct Stats {
        int enqueued = 0;
        int executed = 0;
        int overwritten = 0;
        int failed = 0;
        int pending = 0;
    };

    using DiagnosticSink = std::function<void(const QString&)>;

    explicit WriteQueue(int maxPending = 100, int maxAttempts = 3);

    void setDiagnosticSink(DiagnosticSink sink);

    /**
     * 入队；队列满且不是覆盖已有条目时返回 false
     */
    bool enqueue(WriteRequest request);

    QVector<WriteRequest> takeBatch(int maxCount = 10) const;

    void markCompleted(const WriteRequest& request);
    void markFailed(const WriteRequest& request, const QString& reason);

    bool isEmpty() const;
    int size() const;
    Stats stats() const;
    void clear();

private:
    using Key = QPair<int, int>;
    static Key keyOf(const WriteRequest& request);
    void emitDiagnostic(const QString& text) const;

    mutable QMutex m_mutex;
    QHash<Key, WriteRequest> m_entries;
    QList<Key> m_order;
    int m_maxPending;
    int m_maxAttempts;
    quint64 m_nextSequence = 1;
    Stats m_stats;
    DiagnosticSink m_sink;
};

} // namespace modua::modbus
