#include "form_builder.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <cmath>

#include "modua/utils/config_utils.h"

namespace {

QString jsonToText(const QJsonValue &v)
{
    if (v.isString()) return v.toString();
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (std::floor(d) == d && std::fabs(d) < 1e15) {
            return QString::number(static_cast<qint64>(d));
        }
        return QString::number(d);
    }
    if (v.isBool()) return v.toBool() ? "true" : "false";
    return QString();
}

bool jsonToDouble(const QJsonValue &v, double &out)
{
    if (v.isDouble()) {
        out = v.toDouble();
        return true;
    }
    if (v.isString()) {
        bool ok = false;
        out = v.toString().trimmed().toDouble(&ok);
        return ok;
    }
    if (v.isBool()) {
        out = v.toBool() ? 1.0 : 0.0;
        return true;
    }
    return false;
}

} // namespace

FormBuilder::FormBuilder(QFormLayout *layout)
    : m_layout(layout)
{
}

void FormBuilder::addField(const QString &id, const QString &label, QWidget *widget, Field field)
{
    field.widget = widget;
    field.label = new QLabel(label, m_layout->parentWidget());
    m_layout->addRow(field.label, widget);
    if (!m_fields.contains(id)) m_order << id;
    m_fields.insert(id, field);
}

QLineEdit *FormBuilder::addLineEdit(const QString &id, const QString &label, const QString &defaultValue)
{
    auto *edit = new QLineEdit(defaultValue, m_layout->parentWidget());
    Field f;
    f.getValue = [edit]() { return QJsonValue(edit->text()); };
    f.setValue = [edit](const QJsonValue &v) { edit->setText(jsonToText(v)); };
    addField(id, label, edit, f);
    return edit;
}

QSpinBox *FormBuilder::addSpinBox(const QString &id, const QString &label, int min, int max, int defaultValue)
{
    auto *spin = new QSpinBox(m_layout->parentWidget());
    spin->setRange(min, max);
    spin->setValue(defaultValue);
    Field f;
    f.getValue = [spin]() { return QJsonValue(spin->value()); };
    f.setValue = [spin](const QJsonValue &v) {
        double d = 0.0;
        if (jsonToDouble(v, d)) spin->setValue(static_cast<int>(std::lround(d)));
    };
    addField(id, label, spin, f);
    return spin;
}

QDoubleSpinBox *FormBuilder::addDoubleSpinBox(const QString &id, const QString &label,
                                              double min, double max, double defaultValue, int decimals)
{
    auto *spin = new QDoubleSpinBox(m_layout->parentWidget());
    spin->setDecimals(decimals);
    spin->setRange(min, max);
    spin->setValue(defaultValue);
    Field f;
    f.getValue = [spin]() { return QJsonValue(spin->value()); };
    f.setValue = [spin](const QJsonValue &v) {
        double d = 0.0;
        if (jsonToDouble(v, d)) spin->setValue(d);
    };
    addField(id, label, spin, f);
    return spin;
}

QComboBox *FormBuilder::addComboBox(const QString &id, const QString &label, const QStringList &items,
                                    const QString &defaultValue, bool editable)
{
    auto *combo = new QComboBox(m_layout->parentWidget());
    combo->setEditable(editable);
    combo->addItems(items);
    if (!defaultValue.isEmpty()) {
        const int idx = combo->findText(defaultValue);
        if (idx >= 0) {
            combo->setCurrentIndex(idx);
        } else if (editable) {
            combo->setEditText(defaultValue);
        }
    }
    Field f;
    f.getValue = [combo]() { return QJsonValue(combo->currentText()); };
    f.setValue = [combo](const QJsonValue &v) {
        const QString text = jsonToText(v);
        if (text.isEmpty()) return;
        const int idx = combo->findText(text, Qt::MatchFixedString);
        if (idx >= 0) {
            combo->setCurrentIndex(idx);
        } else if (combo->isEditable()) {
            combo->setEditText(text);
        }
    };
    addField(id, label, combo, f);
    return combo;
}

QCheckBox *FormBuilder::addCheckBox(const QString &id, const QString &label, bool defaultValue)
{
    auto *check = new QCheckBox(m_layout->parentWidget());
    check->setChecked(defaultValue);
    Field f;
    f.getValue = [check]() { return QJsonValue(check->isChecked()); };
    f.setValue = [check](const QJsonValue &v) {
        const int flag = modua::toNumericFlag(v, -1);
        if (flag >= 0) check->setChecked(flag == 1);
    };
    addField(id, label, check, f);
    return check;
}

QLineEdit *FormBuilder::addReadOnly(const QString &id, const QString &label, const QString &text)
{
    QLineEdit *edit = addLineEdit(id, label, text);
    edit->setReadOnly(true);
    return edit;
}

void FormBuilder::addHidden(const QString &id, const QJsonValue &value)
{
    m_hidden.insert(id, value);
    if (!m_order.contains(id)) m_order << id;
}

QJsonValue FormBuilder::value(const QString &id) const
{
    if (m_hidden.contains(id)) return m_hidden.value(id);
    auto it = m_fields.constFind(id);
    if (it == m_fields.constEnd()) return QJsonValue();
    return it->getValue();
}

bool FormBuilder::setValue(const QString &id, const QJsonValue &value)
{
    if (m_hidden.contains(id)) {
        m_hidden.insert(id, value);
        return true;
    }
    auto it = m_fields.constFind(id);
    if (it == m_fields.constEnd()) return false;
    if (value.isNull() || value.isUndefined()) return true;
    it->setValue(value);
    return true;
}

QJsonObject FormBuilder::values() const
{
    QJsonObject out;
    for (const QString &id : m_order) {
        out.insert(id, value(id));
    }
    return out;
}

void FormBuilder::setValues(const QJsonObject &obj)
{
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (contains(it.key())) setValue(it.key(), it.value());
    }
}

QWidget *FormBuilder::widget(const QString &id) const
{
    auto it = m_fields.constFind(id);
    return it == m_fields.constEnd() ? nullptr : it->widget;
}

void FormBuilder::setRowVisible(const QString &id, bool visible)
{
    auto it = m_fields.constFind(id);
    if (it == m_fields.constEnd()) return;
    it->label->setVisible(visible);
    it->widget->setVisible(visible);
}

bool FormBuilder::contains(const QString &id) const
{
    return m_fields.contains(id) || m_hidden.contains(id);
}
