#include "tag_dialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QRegularExpression>
#include <QTabWidget>
#include <QVBoxLayout>

#include "modua/core/constants.h"
#include "modua/modbus/modbus_types.h"
#include "modua/model/project_node.h"
#include "modua/utils/config_utils.h"
#include "modua/utils/validators.h"
#include "ui/app_style.h"
#include "ui/widgets/form_builder.h"

namespace {

const QStringList kYesNo = {"No", "Yes"};
const QStringList kScalingParams = {"raw_low", "raw_high", "scaled_type", "scaled_low", "scaled_high",
                                    "clamp_low", "clamp_high", "negate", "units"};

int arraySizeOf(const QString &address)
{
    static const QRegularExpression re(R"(\[\s*(\d+)\s*\])");
    const QRegularExpressionMatch match = re.match(address);
    return match.hasMatch() ? match.captured(1).toInt() : 0;
}

int indexOf(const QString &address)
{
    QString digits = address;
    digits.remove(QRegularExpression(R"(\[\s*\d*\s*\])"));
    digits.remove(QRegularExpression("[^0-9]"));
    if (digits.isEmpty()) return 0;
    return digits.right(modua::kAddressSequenceWidth).toInt();
}

} // namespace

TagDialog::TagDialog(QWidget *parent, const QString &suggestedName,
                     const modua::ProjectNode *parentNode, bool isNew)
    : QDialog(parent)
    , m_parentNode(parentNode)
    , m_isNew(isNew)
{
    setWindowTitle(tr("Tag Properties"));
    setMinimumWidth(AppStyle::kDialogMinWidth);

    auto *layout = new QVBoxLayout(this);
    m_tabs = new QTabWidget(this);

    auto *generalPage = new QWidget(m_tabs);
    m_general = std::make_unique<FormBuilder>(new QFormLayout(generalPage));
    m_general->addLineEdit("name", tr("Tag Name:"), suggestedName);
    m_general->addLineEdit("description", tr("Description:"));
    QComboBox *typeCombo = m_general->addComboBox("data_type", tr("Data Type:"),
                                                  modua::modbus::tagDataTypeNames(), "Word");
    QComboBox *accessCombo = m_general->addComboBox("access", tr("Client Access:"),
                                                    {modua::kAccessReadWrite, modua::kAccessReadOnly},
                                                    modua::kAccessReadWrite);
    m_general->addLineEdit("address", tr("Address:"), "400000");
    m_general->addSpinBox("scan_rate", tr("Scan Rate (ms):"), 1, 600000, modua::kDefaultScanRateMs);
    m_tabs->addTab(generalPage, tr("General"));

    auto *scalingPage = new QWidget(m_tabs);
    m_scaling = std::make_unique<FormBuilder>(new QFormLayout(scalingPage));
    QComboBox *scaleType = m_scaling->addComboBox("type", tr("Scaling Type:"),
                                                  {"None", "Linear", "Square Root"}, "None");
    m_scaling->addDoubleSpinBox("raw_low", tr("Raw Low:"), -1e12, 1e12, modua::kDefaultRawLow);
    m_scaling->addDoubleSpinBox("raw_high", tr("Raw High:"), -1e12, 1e12, modua::kDefaultRawHigh);
    m_scaling->addComboBox("scaled_type", tr("Scaled Data Type:"), modua::modbus::scaledDataTypeNames(),
                           modua::kDefaultScaledType);
    m_scaling->addDoubleSpinBox("scaled_low", tr("Scaled Low:"), -1e12, 1e12, modua::kDefaultScaledLow);
    m_scaling->addDoubleSpinBox("scaled_high", tr("Scaled High:"), -1e12, 1e12, modua::kDefaultScaledHigh);
    m_scaling->addComboBox("clamp_low", tr("Clamp Low:"), kYesNo, "No");
    m_scaling->addComboBox("clamp_high", tr("Clamp High:"), kYesNo, "No");
    m_scaling->addComboBox("negate", tr("Negate Value:"), kYesNo, "No");
    m_scaling->addLineEdit("units", tr("Units:"));
    m_tabs->addTab(scalingPage, tr("Scaling"));

    layout->addWidget(m_tabs);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &TagDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &TagDialog::reject);

    connect(typeCombo, &QComboBox::currentTextChanged, this, &TagDialog::updateAddress);
    connect(accessCombo, &QComboBox::currentTextChanged, this, &TagDialog::updateAddress);
    connect(scaleType, &QComboBox::currentTextChanged, this, &TagDialog::updateScalingRows);

    updateAddress();
    updateScalingRows();
}

TagDialog::~TagDialog() = default;

void TagDialog::updateAddress()
{
    if (m_loading) return;

    modua::modbus::TagType type;
    if (!modua::modbus::parseDataType(m_general->value("data_type").toString(), type)) return;
    const bool readWrite = m_general->value("access").toString() == modua::kAccessReadWrite;
    const QChar prefix = modua::modbus::prefixFor(type, readWrite);

    const QString current = m_general->value("address").toString();
    QString address;
    if (m_isNew && m_parentNode) {
        address = modua::nextTagAddress(m_parentNode, prefix);
    } else {
        address = modua::modbus::formatAddress(prefix, indexOf(current));
    }
    if (type.isArray) {
        const int size = arraySizeOf(current);
        address += QString(" [%1]").arg(size > 0 ? size : 1);
    }
    m_general->setValue("address", address);

    // 布尔类型不支持缩放
    auto *scaleType = qobject_cast<QComboBox *>(m_scaling->widget("type"));
    scaleType->setEnabled(!type.isBoolean());
    if (type.isBoolean()) m_scaling->setValue("type", QStringLiteral("None"));
}

void TagDialog::updateScalingRows()
{
    const bool enabled = m_scaling->value("type").toString() != "None";
    for (const QString &id : kScalingParams) {
        m_scaling->setRowVisible(id, enabled);
    }
}

QJsonObject TagDialog::getData() const
{
    QJsonObject general = m_general->values();
    general["name"] = general.value("name").toString().trimmed();
    general["address"] = general.value("address").toString().trimmed();

    QJsonObject out;
    out["general"] = general;
    const QJsonObject scaling = m_scaling->values();
    if (scaling.value("type").toString() != "None") out["scaling"] = scaling;
    return out;
}

void TagDialog::loadData(const QJsonObject &data)
{
    if (data.isEmpty()) return;

    m_loading = true;
    QJsonObject general = modua::safeGetObject(data, "general");
    for (const QString &id : m_general->ids()) {
        if (!general.contains(id) && data.contains(id)) general.insert(id, data.value(id));
    }
    m_general->setValues(general);
    m_scaling->setValues(modua::safeGetObject(data, "scaling"));
    m_loading = false;

    modua::modbus::TagType type;
    const bool boolean = modua::modbus::parseDataType(m_general->value("data_type").toString(), type)
                         && type.isBoolean();
    m_scaling->widget("type")->setEnabled(!boolean);
    updateScalingRows();

    if (m_general->value("address").toString().trimmed().isEmpty()) updateAddress();
}

bool TagDialog::validate(QString &error) const
{
    const QString name = m_general->value("name").toString().trimmed();
    if (!modua::isValidTagName(name)) {
        error = tr("Tag name must be non-empty and must not contain '.'");
        return false;
    }

    modua::modbus::TagType type;
    if (!modua::modbus::parseDataType(m_general->value("data_type").toString(), type)) {
        error = tr("Unknown data type");
        return false;
    }

    modua::modbus::ParsedAddress address;
    QString parseError;
    if (!modua::modbus::parseAddress(m_general->value("address").toString(), address, parseError)) {
        error = parseError;
        return false;
    }
    if (type.isArray != address.isArray()) {
        error = type.isArray ? tr("Array types need an element count, e.g. 400000 [10]")
                             : tr("Only array types accept an element count");
        return false;
    }

    const bool readWrite = m_general->value("access").toString() == modua::kAccessReadWrite;
    const QChar expected = modua::modbus::prefixFor(type, readWrite);
    if (modua::modbus::addressPrefix(address.type) != expected) {
        error = tr("Address must start with %1 for this data type and access").arg(expected);
        return false;
    }

    return true;
}

void TagDialog::accept()
{
    QString error;
    if (!validate(error)) {
        QMessageBox::warning(this, tr("Invalid Input"), error);
        return;
    }
    QDialog::accept();
}
