#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QVector>
#include <functional>

#include "modua/modua_export.h"

namespace modua {

/**
 * 诊断消息上下文
 */
struct MODUA_API DiagnosticContext {
    QString configId;       // "Channel_Device"
    QString direction;      // "TX" / "RX"，非报文消息为空
    int functionCode = -1;
    int unitId = -1;
    int length = 0;
};

struct MODUA_API DiagnosticRecord {
    QString timestamp;      // HH:MM:SS.mmm
    QString text;
    DiagnosticContext context;
};

/**
 * 诊断消息中心
 *
 * 环形缓冲保存最近的记录；仅在至少有一个监听者（终端窗口）时才记录。
 * 监听回调在调用 publish 的线程执行，接收方负责切回 UI 线程。
 * unregisterListener 会等待进行中的分发；回调内不得注销监听者。
 */
class MODUA_API DiagnosticsManager {
public:
    using Callback = std::function<void(const DiagnosticRecord&)>;
    using Matcher = std::function<bool(const DiagnosticRecord&)>;

    explicit DiagnosticsManager(int capacity = 5000, bool onlyTxRx = false);

    void setOnlyTxRx(bool value);
    bool onlyTxRx() const;
    int capacity() const { return m_capacity; }

    /**
     * 注册监听者，返回注销用的令牌
     */
    QString registerListener(const QString& name, Callback callback, Matcher matcher = nullptr);
    void unregisterListener(const QString& token);
    int listenerCount() const;

    void publish(const QString& text, const DiagnosticContext& context = DiagnosticContext());

    QVector<DiagnosticRecord> snapshot() const;
    void clear();

    /** 清空监听者和记录 */
    void stop();

    static QString currentTimestamp();

private:
    struct Listener {
        QString name;
        Callback callback;
        Matcher matcher;
    };

    bool shouldEmit(const QString& text, const DiagnosticContext& context) const;

    mutable QMutex m_mutex;
    QMutex m_dispatchMutex;     // publish 分发期间持有，先于 m_mutex 加锁
    int m_capacity;
    bool m_onlyTxRx;
    QVector<DiagnosticRecord> m_records;
    int m_head = 0;         // 缓冲已满时最旧记录的位置
    QHash<QString, Listener> m_listeners;
};

} // namespace modua
