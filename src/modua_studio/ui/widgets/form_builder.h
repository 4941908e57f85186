#ifndef FORM_BUILDER_H
#define FORM_BUILDER_H

#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>
#include <QWidget>
#include <functional>

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QFormLayout;
class QLineEdit;
class QSpinBox;

/**
 * 向 QFormLayout 添加带标签的字段，并以字段 id 存取值
 *
 * 下拉框的值为文本，数值框为数字，复选框为 bool。
 */
class FormBuilder
{
public:
    explicit FormBuilder(QFormLayout *layout);

    QLineEdit *addLineEdit(const QString &id, const QString &label,
                           const QString &defaultValue = QString());
    QSpinBox *addSpinBox(const QString &id, const QString &label,
                         int min, int max, int defaultValue);
    QDoubleSpinBox *addDoubleSpinBox(const QString &id, const QString &label,
                                     double min, double max, double defaultValue, int decimals = 3);
    QComboBox *addComboBox(const QString &id, const QString &label, const QStringList &items,
                           const QString &defaultValue = QString(), bool editable = false);
    QCheckBox *addCheckBox(const QString &id, const QString &label, bool defaultValue = false);
    QLineEdit *addReadOnly(const QString &id, const QString &label, const QString &text = QString());
    void addHidden(const QString &id, const QJsonValue &value = QJsonValue());

    QJsonValue value(const QString &id) const;
    bool setValue(const QString &id, const QJsonValue &value);

    QJsonObject values() const;
    // 未知的键被忽略
    void setValues(const QJsonObject &obj);

    QWidget *widget(const QString &id) const;
    void setRowVisible(const QString &id, bool visible);
    bool contains(const QString &id) const;
    QStringList ids() const { return m_order; }

    QFormLayout *layout() const { return m_layout; }

private:
    struct Field {
        QWidget *widget = nullptr;
        QWidget *label = nullptr;
        std::function<QJsonValue()> getValue;
        std::function<void(const QJsonValue &)> setValue;
    };

    void addField(const QString &id, const QString &label, QWidget *widget, Field field);

    QFormLayout *m_layout;
    QHash<QString, Field> m_fields;
    QJsonObject m_hidden;
    QStringList m_order;
};

#endif // FORM_BUILDER_H
