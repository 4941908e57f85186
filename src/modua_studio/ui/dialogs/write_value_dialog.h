#ifndef WRITE_VALUE_DIALOG_H
#define WRITE_VALUE_DIALOG_H

#include <QDialog>
#include <QVariant>

class QLineEdit;

/**
 * 写值对话框：显示标签当前值，按数据类型校验输入
 *
 * 数组类型以逗号分隔各元素，结果为 QVariantList。
 */
class WriteValueDialog : public QDialog
{
    Q_OBJECT

public:
    WriteValueDialog(const QString &tagName, const QString &dataType, const QString &access,
                     const QVariant &currentValue, QWidget *parent = nullptr);

    QVariant value() const { return m_value; }
    QLineEdit *input() const { return m_input; }

    /**
     * 解析输入文本；布尔接受 true/false/1/0/on/off，整数检查类型范围
     */
    static bool parseValue(const QString &text, const QString &dataType, QVariant &out, QString &error);

public slots:
    void accept() override;

private:
    QString m_dataType;
    QLineEdit *m_input;
    QVariant m_value;
};

#endif // WRITE_VALUE_DIALOG_H
