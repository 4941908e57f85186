#ifndef TERMINAL_WINDOW_H
#define TERMINAL_WINDOW_H

#include <QStringList>
#include <QTimer>
#include <QWidget>

#include "modua/runtime/diagnostics.h"

class QCheckBox;
class QLabel;
class QPlainTextEdit;

/**
 * 诊断终端：显示单个设备的实时报文与诊断信息
 *
 * 打开期间向 DiagnosticsManager 注册监听，关闭时注销。
 * 监听回调来自轮询线程，经队列切回界面线程后批量追加。
 */
class TerminalWindow : public QWidget
{
    Q_OBJECT

public:
    TerminalWindow(modua::DiagnosticsManager *diagnostics, const QString &configId,
                   QWidget *parent = nullptr);
    ~TerminalWindow() override;

    QString configId() const { return m_configId; }
    QString text() const;
    int lineCount() const;

    bool exportTo(const QString &path, QString &error) const;

    static QString formatRecord(const modua::DiagnosticRecord &record);

public slots:
    void clear();
    void setOnlyTxRx(bool enabled);

signals:
    void onlyTxRxChanged(bool enabled);

private slots:
    void exportToFile();
    void flushPending();

private:
    void appendRecord(const modua::DiagnosticRecord &record);

    modua::DiagnosticsManager *m_diagnostics;
    QString m_configId;
    QString m_listenerToken;

    QPlainTextEdit *m_output;
    QCheckBox *m_onlyTxRx;
    QLabel *m_countLabel;
    QTimer *m_flushTimer;
    QStringList m_pending;
    int m_lines = 0;

    static constexpr int kFlushIntervalMs = 50;
    static constexpr int kMaxLines = 5000;
};

#endif // TERMINAL_WINDOW_H
