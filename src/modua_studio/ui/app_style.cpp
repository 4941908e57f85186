#include "app_style.h"

#include <QApplication>
#include <QFont>
#include <QPainter>
#include <QPalette>
#include <QPixmap>
#include <QStyleFactory>

namespace AppStyle {

void apply(QApplication &app)
{
    app.setStyle(QStyleFactory::create("Fusion"));

    QPalette palette;
    palette.setColor(QPalette::Window, kWindow);
    palette.setColor(QPalette::WindowText, kText);
    palette.setColor(QPalette::Base, kPanel);
    palette.setColor(QPalette::AlternateBase, kWindow);
    palette.setColor(QPalette::Text, kText);
    palette.setColor(QPalette::Button, kPanel);
    palette.setColor(QPalette::ButtonText, kText);
    palette.setColor(QPalette::PlaceholderText, kMutedText);
    palette.setColor(QPalette::Link, kAccent);
    palette.setColor(QPalette::Highlight, kAccent);
    palette.setColor(QPalette::HighlightedText, kPanel);
    palette.setColor(QPalette::Disabled, QPalette::Text, kMutedText);
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, kMutedText);
    app.setPalette(palette);

#ifdef Q_OS_WIN
    QFont font("Segoe UI", kBaseFontSize);
#else
    QFont font("Roboto", kBaseFontSize);
#endif
    if (!font.exactMatch()) {
        font = QFont(QApplication::font().family(), kBaseFontSize);
    }
    app.setFont(font);

    app.setStyleSheet(styleSheet());
}

QString styleSheet()
{
    // 颜色取自调色板常量，控件样式集中在此
    const QString sheet = QStringLiteral(
        "QMainWindow, QDialog { background: @window; }"
        "QTreeView, QTableView { background: @panel; border: 1px solid @border; selection-background-color: @accent; }"
        "QHeaderView::section { background: @window; color: @muted; border: 0; border-right: 1px solid @border; "
        "border-bottom: 1px solid @border; padding: 3px 6px; }"
        "QTabWidget::pane { background: @panel; border: 1px solid @border; top: -1px; }"
        "QTabBar::tab { background: @window; color: @muted; border: 1px solid @border; padding: 5px 14px; }"
        "QTabBar::tab:selected { background: @panel; color: @accent; border-bottom-color: @panel; }"
        "QLineEdit, QSpinBox, QDoubleSpinBox, QComboBox { background: @panel; border: 1px solid @border; "
        "border-radius: 3px; padding: 2px 5px; min-height: 20px; }"
        "QLineEdit:focus, QSpinBox:focus, QDoubleSpinBox:focus, QComboBox:focus { border-color: @accent; }"
        "QLineEdit:read-only, QLineEdit:disabled { background: @window; color: @muted; }"
        "QPushButton { background: @accent; color: white; border: 0; border-radius: 3px; padding: 5px 14px; }"
        "QPushButton:hover { background: @accentDark; }"
        "QPushButton:disabled { background: @border; color: @muted; }"
        "QPushButton#secondary { background: @panel; color: @text; border: 1px solid @border; }"
        "QPushButton#secondary:hover { background: @window; }"
        "QToolBar { background: @panel; border: 0; border-bottom: 1px solid @border; padding: 3px; }"
        "QStatusBar { background: @panel; color: @muted; border-top: 1px solid @border; }"
        "QSplitter::handle { background: @border; }");

    QString out = sheet;
    out.replace("@window", kWindow.name());
    out.replace("@panel", kPanel.name());
    out.replace("@border", kBorder.name());
    out.replace("@muted", kMutedText.name());
    out.replace("@accentDark", kAccentDark.name());
    out.replace("@accent", kAccent.name());
    out.replace("@text", kText.name());
    return out;
}

QString terminalStyleSheet()
{
    return QString("QPlainTextEdit { background-color: %1; color: %2; "
                   "font-family: Consolas, 'Courier New', monospace; font-size: 12px; }")
        .arg(kTerminalBackground.name(), kTerminalText.name());
}

QIcon emojiIcon(const QString &emoji, int size)
{
    QPixmap canvas(size, size);
    canvas.fill(Qt::transparent);
    QPainter painter(&canvas);
#ifdef Q_OS_WIN
    QFont font("Segoe UI Emoji");
#else
    QFont font("Noto Color Emoji");
#endif
    font.setPixelSize(size * 4 / 5);
    painter.setFont(font);
    painter.drawText(QRect(0, 0, size, size), Qt::AlignCenter | Qt::TextSingleLine, emoji);
    painter.end();
    return QIcon(canvas);
}

QIcon nodeIcon(modua::ProjectNode::Kind kind)
{
    using Kind = modua::ProjectNode::Kind;
    switch (kind) {
    case Kind::Root:    return emojiIcon("🗂", 16);
    case Kind::Channel: return emojiIcon("🔌", 16);
    case Kind::Device:  return emojiIcon("🖥", 16);
    case Kind::Group:   return emojiIcon("📁", 16);
    case Kind::Tag:     return emojiIcon("🏷", 16);
    }
    return QIcon();
}

QColor qualityColor(const QString &quality)
{
    if (quality == "Good") return kQualityGood;
    if (quality == "Bad") return kQualityBad;
    if (quality == "Uncertain") return kQualityUncertain;
    return kText;
}

} // namespace AppStyle
