#include "terminal_window.h"

#include <QCheckBox>
#include <QDebug>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QVBoxLayout>

#include "modua/utils/file_utils.h"
#include "ui/app_style.h"

TerminalWindow::TerminalWindow(modua::DiagnosticsManager *diagnostics, const QString &configId,
                               QWidget *parent)
    : QWidget(parent, Qt::Window)
    , m_diagnostics(diagnostics)
    , m_configId(configId)
    , m_output(new QPlainTextEdit(this))
    , m_onlyTxRx(new QCheckBox(tr("Only TX/RX"), this))
    , m_countLabel(new QLabel(this))
    , m_flushTimer(new QTimer(this))
{
    setWindowTitle(tr("Terminal - %1").arg(configId));
    setAttribute(Qt::WA_DeleteOnClose);
    resize(800, 500);

    auto *layout = new QVBoxLayout(this);

    auto *toolbar = new QHBoxLayout;
    auto *clearBtn = new QPushButton(AppStyle::emojiIcon("🧹"), tr("Clear"), this);
    clearBtn->setObjectName("secondary");
    auto *exportBtn = new QPushButton(AppStyle::emojiIcon("💾"), tr("Export..."), this);
    toolbar->addWidget(m_onlyTxRx);
    toolbar->addStretch();
    toolbar->addWidget(m_countLabel);
    toolbar->addWidget(clearBtn);
    toolbar->addWidget(exportBtn);
    layout->addLayout(toolbar);

    m_output->setReadOnly(true);
    m_output->setMaximumBlockCount(kMaxLines);
    m_output->setLineWrapMode(QPlainTextEdit::NoWrap);
    m_output->setStyleSheet(AppStyle::terminalStyleSheet());
    layout->addWidget(m_output);

    m_flushTimer->setInterval(kFlushIntervalMs);
    m_flushTimer->setSingleShot(true);
    connect(m_flushTimer, &QTimer::timeout, this, &TerminalWindow::flushPending);

    connect(clearBtn, &QPushButton::clicked, this, &TerminalWindow::clear);
    connect(exportBtn, &QPushButton::clicked, this, &TerminalWindow::exportToFile);
    connect(m_onlyTxRx, &QCheckBox::toggled, this, &TerminalWindow::setOnlyTxRx);

    if (m_diagnostics) {
        m_onlyTxRx->setChecked(m_diagnostics->onlyTxRx());

        // 先回放缓冲中已有的记录
        for (const modua::DiagnosticRecord &record : m_diagnostics->snapshot()) {
            if (record.context.configId == m_configId) m_pending << formatRecord(record);
        }
        flushPending();

        const QString id = m_configId;
        m_listenerToken = m_diagnostics->registerListener(
            "terminal:" + id,
            [this](const modua::DiagnosticRecord &record) {
                QMetaObject::invokeMethod(this, [this, record]() { appendRecord(record); },
                                          Qt::QueuedConnection);
            },
            [id](const modua::DiagnosticRecord &record) { return record.context.configId == id; });
    }
    m_countLabel->setText(tr("%1 lines").arg(m_lines));
}

TerminalWindow::~TerminalWindow()
{
    if (m_diagnostics && !m_listenerToken.isEmpty()) {
        m_diagnostics->unregisterListener(m_listenerToken);
    }
}

QString TerminalWindow::formatRecord(const modua::DiagnosticRecord &record)
{
    return QString("[%1] %2").arg(record.timestamp, record.text);
}

void TerminalWindow::appendRecord(const modua::DiagnosticRecord &record)
{
    m_pending << formatRecord(record);
    if (!m_flushTimer->isActive()) m_flushTimer->start();
}

void TerminalWindow::flushPending()
{
    if (m_pending.isEmpty()) return;
    m_output->appendPlainText(m_pending.join('\n'));
    m_lines = qMin(m_lines + static_cast<int>(m_pending.size()), kMaxLines);
    m_pending.clear();
    m_countLabel->setText(tr("%1 lines").arg(m_lines));
}

QString TerminalWindow::text() const
{
    return m_output->toPlainText();
}

int TerminalWindow::lineCount() const
{
    return m_lines;
}

void TerminalWindow::clear()
{
    m_pending.clear();
    m_output->clear();
    m_lines = 0;
    m_countLabel->setText(tr("%1 lines").arg(m_lines));
}

void TerminalWindow::setOnlyTxRx(bool enabled)
{
    if (m_onlyTxRx->isChecked() != enabled) m_onlyTxRx->setChecked(enabled);
    if (m_diagnostics) m_diagnostics->setOnlyTxRx(enabled);
    emit onlyTxRxChanged(enabled);
}

bool TerminalWindow::exportTo(const QString &path, QString &error) const
{
    QString content = text();
    if (!content.isEmpty() && !content.endsWith('\n')) content += '\n';
    return modua::atomicWrite(path, content.toUtf8(), error);
}

void TerminalWindow::exportToFile()
{
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Export Terminal"), m_configId + ".txt", tr("Text Files (*.txt);;All Files (*)"));
    if (path.isEmpty()) return;

    QString error;
    if (!exportTo(path, error)) {
        QMessageBox::critical(this, tr("Export Failed"), error);
        return;
    }
    qInfo().noquote() << "Terminal exported to" << path;
}
