#include "device_dialog.h"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

#include "modua/core/constants.h"
#include "modua/utils/config_utils.h"
#include "modua/utils/validators.h"
#include "ui/app_style.h"
#include "ui/widgets/form_builder.h"

namespace {

const QStringList kFlagOptions = {"Enable", "Disable"};

// 旧文件中的 Timing 字段别名
const QList<QPair<QString, QString>> kTimingAliases = {
    {"req_timeout", "request_timeout"},
    {"attempts", "attempts_before_timeout"},
    {"inter_req_delay", "inter_request_delay"},
};

} // namespace

DeviceDialog::DeviceDialog(QWidget *parent, const QString &suggestedName,
                           const QString &driverType, int suggestedDeviceId)
    : QDialog(parent)
    , m_driverType(driverType)
{
    setWindowTitle(tr("Device Properties"));
    setMinimumWidth(AppStyle::kDialogMinWidth);

    auto *layout = new QVBoxLayout(this);
    layout->setSpacing(AppStyle::kFieldSpacing);
    m_tabs = new QTabWidget(this);

    auto *generalPage = new QWidget(m_tabs);
    m_general = std::make_unique<FormBuilder>(new QFormLayout(generalPage));
    m_general->addLineEdit("name", tr("Device Name:"), suggestedName);
    m_general->addLineEdit("description", tr("Description:"));
    m_general->addSpinBox("device_id", tr("Device ID:"), modua::kMinDeviceId, modua::kMaxDeviceId,
                          qBound(modua::kMinDeviceId, suggestedDeviceId, modua::kMaxDeviceId));
    m_tabs->addTab(generalPage, tr("General"));

    auto *timingPage = new QWidget(m_tabs);
    setupTiming(timingPage);
    m_tabs->addTab(timingPage, tr("Timing"));

    auto *accessPage = new QWidget(m_tabs);
    m_access = std::make_unique<FormBuilder>(new QFormLayout(accessPage));
    m_access->addComboBox("zero_based", tr("Zero-Based Addressing:"), kFlagOptions, "Disable");
    m_access->addComboBox("zero_based_bit", tr("Zero-Based Bit Addressing:"), kFlagOptions, "Enable");
    m_access->addComboBox("bit_writes", tr("Holding Register Bit Writes:"), kFlagOptions, "Disable");
    m_access->addComboBox("func_06", tr("Modbus Function 06:"), kFlagOptions, "Enable");
    m_access->addComboBox("func_05", tr("Modbus Function 05:"), kFlagOptions, "Enable");
    m_tabs->addTab(accessPage, tr("Data Access"));

    auto *encodingPage = new QWidget(m_tabs);
    m_encoding = std::make_unique<FormBuilder>(new QFormLayout(encodingPage));
    m_encoding->addComboBox("byte_order", tr("Modbus Byte Order:"), kFlagOptions, "Enable");
    m_encoding->addComboBox("word_order", tr("First Word Low:"), kFlagOptions, "Enable");
    m_encoding->addComboBox("dword_order", tr("First DWord Low:"), kFlagOptions, "Enable");
    m_encoding->addComboBox("bit_order", tr("Modicon Bit Order:"), kFlagOptions, "Disable");
    m_encoding->addComboBox("treat_longs_as_decimals", tr("Treat Longs as Decimals:"), kFlagOptions, "Disable");
    m_tabs->addTab(encodingPage, tr("Data Encoding"));

    auto *blockPage = new QWidget(m_tabs);
    m_blocks = std::make_unique<FormBuilder>(new QFormLayout(blockPage));
    m_blocks->addSpinBox("out_coils", tr("Output Coils:"), 1, 2000, modua::kDefaultOutCoils);
    m_blocks->addSpinBox("in_coils", tr("Input Coils:"), 1, 2000, modua::kDefaultInCoils);
    m_blocks->addSpinBox("int_regs", tr("Internal Registers:"), 1, 125, modua::kDefaultIntRegs);
    m_blocks->addSpinBox("hold_regs", tr("Holding Registers:"), 1, 125, modua::kDefaultHoldRegs);
    m_tabs->addTab(blockPage, tr("Block Sizes"));

    layout->addWidget(m_tabs);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Ok)->setText(tr("Finish"));
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &DeviceDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &DeviceDialog::reject);
}

DeviceDialog::~DeviceDialog() = default;

void DeviceDialog::setupTiming(QWidget *page)
{
    m_timing = std::make_unique<FormBuilder>(new QFormLayout(page));

    const bool overTcp = m_driverType == modua::kDriverRtuOverTcp;
    const bool ethernet = m_driverType == modua::kDriverTcpEthernet;

    if (overTcp || ethernet) {
        m_timing->addSpinBox("connect_timeout", tr("Connect Timeout (s):"), 1, 30,
                             modua::kDefaultConnectTimeoutSec);
    }
    if (overTcp) {
        m_timing->addSpinBox("connect_attempts", tr("Connect Attempts:"), 1, 10,
                             modua::kDefaultConnectAttempts);
    }
    m_timing->addSpinBox("request_timeout", tr("Request Timeout (ms):"), 50, 60000,
                         modua::kDefaultRequestTimeoutMs);
    m_timing->addSpinBox("attempts_before_timeout", tr("Attempts Before Timeout:"), 1, 10,
                         modua::kDefaultAttemptsBeforeTimeout);
    m_timing->addSpinBox("inter_request_delay", tr("Inter-Request Delay (ms):"), 0, 60000,
                         modua::kDefaultInterRequestDelayMs);
}

QStringList DeviceDialog::dataAccessKeys()
{
    return {"zero_based", "zero_based_bit", "bit_writes", "func_06", "func_05"};
}

QStringList DeviceDialog::encodingKeys()
{
    return {"byte_order", "word_order", "dword_order", "bit_order", "treat_longs_as_decimals"};
}

QJsonObject DeviceDialog::flagsToNumbers(const QJsonObject &values)
{
    QJsonObject out;
    for (auto it = values.begin(); it != values.end(); ++it) {
        out.insert(it.key(), modua::toNumericFlag(it.value(), 0));
    }
    return out;
}

QJsonObject DeviceDialog::flagsToText(const QJsonObject &values, const QStringList &keys)
{
    QJsonObject out;
    for (const QString &key : keys) {
        if (!values.contains(key)) continue;
        const int flag = modua::toNumericFlag(values.value(key), -1);
        if (flag >= 0) out.insert(key, modua::flagToText(flag));
    }
    return out;
}

QJsonObject DeviceDialog::getData() const
{
    const QJsonObject general{
        {"name", m_general->value("name").toString().trimmed()},
        {"description", m_general->value("description")},
        {"device_id", m_general->value("device_id")},
    };
    const QJsonObject timing = m_timing->values();
    const QJsonObject access = flagsToNumbers(m_access->values());
    const QJsonObject encoding = flagsToNumbers(m_encoding->values());
    const QJsonObject blocks = m_blocks->values();

    QJsonObject out = general;
    out["general"] = general;
    out["timing"] = timing;
    out["data_access"] = access;
    out["encoding"] = encoding;
    out["block_sizes"] = blocks;
    return out;
}

void DeviceDialog::loadData(const QJsonObject &data)
{
    if (data.isEmpty()) return;

    QJsonObject general = modua::safeGetObject(data, "general");
    for (const QString &key : {QStringLiteral("name"), QStringLiteral("description"), QStringLiteral("device_id")}) {
        if (!general.contains(key) && data.contains(key)) general.insert(key, data.value(key));
    }
    if (!general.contains("name") && data.value("text").isString()) general.insert("name", data.value("text"));
    m_general->setValues(general);

    // 分节可能位于顶层或 general 之下
    auto section = [&data, &general](const QString &key) {
        const QJsonObject top = modua::safeGetObject(data, key);
        return top.isEmpty() ? modua::safeGetObject(general, key) : top;
    };

    QJsonObject timing = section("timing");
    for (const auto &alias : kTimingAliases) {
        if (!timing.contains(alias.second) && timing.contains(alias.first)) {
            timing.insert(alias.second, timing.value(alias.first));
        }
    }
    m_timing->setValues(timing);
    m_access->setValues(flagsToText(section("data_access"), dataAccessKeys()));
    m_encoding->setValues(flagsToText(section("encoding"), encodingKeys()));
    m_blocks->setValues(section("block_sizes"));
}

void DeviceDialog::accept()
{
    const QString name = m_general->value("name").toString().trimmed();
    if (!modua::isValidTagName(name)) {
        QMessageBox::warning(this, tr("Invalid Input"), tr("Device name must be non-empty and must not contain '.'"));
        m_tabs->setCurrentIndex(0);
        return;
    }
    if (!modua::isValidDeviceId(m_general->value("device_id").toInt())) {
        QMessageBox::warning(this, tr("Invalid Input"), tr("Device ID must be between 1 and 65535"));
        m_tabs->setCurrentIndex(0);
        return;
    }
    QDialog::accept();
}
