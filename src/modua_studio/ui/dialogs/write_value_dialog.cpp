#include "write_value_dialog.h"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>
#include <limits>

#include "modua/core/constants.h"
#include "models/monitor_table_model.h"
#include "modua/modbus/modbus_types.h"
#include "ui/app_style.h"

namespace {

using modua::modbus::DataType;

struct IntRange {
    qint64 min;
    qint64 max;
};

bool integerRange(DataType type, IntRange &range)
{
    switch (type) {
    case DataType::Char:  range = {-128, 127}; return true;
    case DataType::Byte:  range = {0, 255}; return true;
    case DataType::Short: range = {-32768, 32767}; return true;
    case DataType::Word:
    case DataType::Int:   range = {0, 65535}; return true;
    case DataType::BCD:   range = {0, 9999}; return true;
    case DataType::DInt:
    case DataType::Long:  range = {std::numeric_limits<qint32>::min(), std::numeric_limits<qint32>::max()}; return true;
    case DataType::DWord: range = {0, std::numeric_limits<quint32>::max()}; return true;
    case DataType::LBCD:  range = {0, 99999999}; return true;
    case DataType::LLong: range = {std::numeric_limits<qint64>::min(), std::numeric_limits<qint64>::max()}; return true;
    default:
        return false;
    }
}

bool parseBool(const QString &text, bool &out)
{
    const QString s = text.trimmed().toLower();
    if (s == "true" || s == "1" || s == "on") {
        out = true;
        return true;
    }
    if (s == "false" || s == "0" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseScalar(const QString &text, DataType type, QVariant &out, QString &error)
{
    const QString s = text.trimmed();
    if (type == DataType::Boolean) {
        bool b = false;
        if (!parseBool(s, b)) {
            error = QObject::tr("'%1' is not a boolean (true/false/1/0/on/off)").arg(s);
            return false;
        }
        out = b;
        return true;
    }
    if (type == DataType::String) {
        out = text;
        return true;
    }
    if (type == DataType::QWord) {
        bool ok = false;
        const qulonglong v = s.toULongLong(&ok);
        if (!ok) {
            error = QObject::tr("'%1' is not an unsigned 64-bit integer").arg(s);
            return false;
        }
        out = v;
        return true;
    }

    IntRange range{};
    if (integerRange(type, range)) {
        bool ok = false;
        const qint64 v = s.toLongLong(&ok);
        if (!ok) {
            error = QObject::tr("'%1' is not an integer").arg(s);
            return false;
        }
        if (v < range.min || v > range.max) {
            error = QObject::tr("%1 is out of range [%2, %3]").arg(v).arg(range.min).arg(range.max);
            return false;
        }
        out = v;
        return true;
    }

    bool ok = false;
    const double d = s.toDouble(&ok);
    if (!ok) {
        error = QObject::tr("'%1' is not a number").arg(s);
        return false;
    }
    if (type == DataType::Float || type == DataType::Real) {
        out = static_cast<double>(static_cast<float>(d));
    } else {
        out = d;
    }
    return true;
}

} // namespace

WriteValueDialog::WriteValueDialog(const QString &tagName, const QString &dataType, const QString &access,
                                   const QVariant &currentValue, QWidget *parent)
    : QDialog(parent)
    , m_dataType(dataType)
{
    setWindowTitle(tr("Write Value"));
    setModal(true);
    setMinimumWidth(400);

    auto *layout = new QVBoxLayout(this);
    auto *form = new QFormLayout;
    form->setSpacing(AppStyle::kFieldSpacing);
    form->addRow(tr("Tag Name:"), new QLabel(tagName, this));
    form->addRow(tr("Data Type:"), new QLabel(dataType, this));
    form->addRow(tr("Client Access:"), new QLabel(access, this));
    form->addRow(tr("Current Value:"), new QLabel(currentValue.isValid() ? MonitorTableModel::formatValue(currentValue) : tr("N/A"), this));

    m_input = new QLineEdit(this);
    m_input->setPlaceholderText(dataType.contains("Array", Qt::CaseInsensitive)
                                    ? tr("Comma separated values")
                                    : tr("New value"));
    form->addRow(tr("New Value:"), m_input);
    layout->addLayout(form);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &WriteValueDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &WriteValueDialog::reject);

    if (access != modua::kAccessReadWrite) {
        m_input->setEnabled(false);
        buttons->button(QDialogButtonBox::Ok)->setEnabled(false);
    }
}

bool WriteValueDialog::parseValue(const QString &text, const QString &dataType, QVariant &out, QString &error)
{
    if (text.trimmed().isEmpty()) {
        error = tr("Please enter a value");
        return false;
    }

    modua::modbus::TagType type;
    if (!modua::modbus::parseDataType(dataType, type)) {
        error = tr("Unknown data type '%1'").arg(dataType);
        return false;
    }
    if (!type.isArray) return parseScalar(text, type.base, out, error);

    QVariantList list;
    const QStringList parts = text.split(',', Qt::SkipEmptyParts);
    for (int i = 0; i < parts.size(); ++i) {
        QVariant item;
        QString itemError;
        if (!parseScalar(parts.at(i), type.base, item, itemError)) {
            error = tr("element %1: %2").arg(i).arg(itemError);
            return false;
        }
        list << item;
    }
    out = list;
    return true;
}

void WriteValueDialog::accept()
{
    QString error;
    QVariant parsed;
    if (!parseValue(m_input->text(), m_dataType, parsed, error)) {
        QMessageBox::warning(this, tr("Invalid Value"), error);
        return;
    }
    m_value = parsed;
    QDialog::accept();
}
