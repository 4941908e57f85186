#ifndef APP_STYLE_H
#define APP_STYLE_H

#include <QColor>
#include <QIcon>
#include <QString>

#include "modua/model/project_node.h"

class QApplication;

namespace AppStyle {

// 调色板
const QColor kWindow(242, 245, 247);
const QColor kPanel(255, 255, 255);
const QColor kText(38, 50, 56);
const QColor kMutedText(96, 125, 139);
const QColor kAccent(0, 121, 107);
const QColor kAccentDark(0, 96, 86);
const QColor kBorder(207, 216, 220);

// 品质着色
const QColor kQualityGood(40, 167, 69);
const QColor kQualityBad(220, 53, 69);
const QColor kQualityUncertain(255, 193, 7);

// 终端
const QColor kTerminalBackground(30, 30, 30);
const QColor kTerminalText(220, 220, 220);
const QColor kTerminalTx(86, 156, 214);
const QColor kTerminalRx(106, 153, 85);

constexpr int kBaseFontSize = 9;
constexpr int kDialogMinWidth = 520;
constexpr int kFieldSpacing = 6;

void apply(QApplication &app);

QString styleSheet();
QString terminalStyleSheet();

QIcon emojiIcon(const QString &emoji, int size = 24);
QIcon nodeIcon(modua::ProjectNode::Kind kind);

QColor qualityColor(const QString &quality);

} // namespace AppStyle

#endif // APP_STYLE_H
