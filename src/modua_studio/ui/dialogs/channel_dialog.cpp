#include "channel_dialog.h"

#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QSerialPortInfo>
#include <QStackedWidget>
#include <QTabWidget>
#include <QVBoxLayout>

#include "modua/core/constants.h"
#include "modua/utils/config_utils.h"
#include "modua/utils/validators.h"
#include "ui/app_style.h"
#include "ui/widgets/form_builder.h"

namespace {

QStringList availableSerialPorts()
{
    QStringList ports;
    for (const QSerialPortInfo &info : QSerialPortInfo::availablePorts()) {
        ports << info.portName();
    }
    if (ports.isEmpty()) ports << "COM1";
    return ports;
}

enum CommPage { SerialPage = 0, NetworkPage = 1 };

} // namespace

ChannelDialog::ChannelDialog(QWidget *parent, const QString &suggestedName)
    : QDialog(parent)
{
    setWindowTitle(tr("Channel Properties"));
    setMinimumWidth(AppStyle::kDialogMinWidth);
    setupUi(suggestedName);
    onDriverChanged();
}

ChannelDialog::~ChannelDialog() = default;

void ChannelDialog::setupUi(const QString &suggestedName)
{
    auto *layout = new QVBoxLayout(this);
    layout->setSpacing(AppStyle::kFieldSpacing);
    m_tabs = new QTabWidget(this);

    // General
    auto *generalPage = new QWidget(m_tabs);
    m_general = std::make_unique<FormBuilder>(new QFormLayout(generalPage));
    m_general->addLineEdit("channel_name", tr("Channel Name:"), suggestedName);
    m_general->addLineEdit("description", tr("Description:"));
    m_tabs->addTab(generalPage, tr("General"));

    // Driver
    auto *driverPage = new QWidget(m_tabs);
    auto *driverLayout = new QVBoxLayout(driverPage);
    driverLayout->addWidget(new QLabel(tr("Select Driver:"), driverPage));
    m_driverCombo = new QComboBox(driverPage);
    m_driverCombo->addItems(modua::driverTypes());
    driverLayout->addWidget(m_driverCombo);

    m_driverParamsPage = new QWidget(driverPage);
    m_driverParams = std::make_unique<FormBuilder>(new QFormLayout(m_driverParamsPage));
    m_driverParams->addLineEdit("ip", tr("IP Address:"), modua::kDefaultTcpIp);
    m_driverParams->addSpinBox("port", tr("Port:"), 1, 65535, modua::kDefaultTcpPort);
    m_driverParams->addComboBox("protocol", tr("Protocol:"), modua::networkProtocols(), "TCP/IP");
    driverLayout->addWidget(m_driverParamsPage);
    driverLayout->addStretch();
    m_tabs->addTab(driverPage, tr("Driver"));

    // Communication
    m_commStack = new QStackedWidget(m_tabs);

    auto *serialPage = new QWidget(m_commStack);
    m_serial = std::make_unique<FormBuilder>(new QFormLayout(serialPage));
    const QStringList ports = availableSerialPorts();
    m_serial->addComboBox("com", tr("COM ID:"), ports, ports.first(), true);
    m_serial->addComboBox("baud", tr("Baud Rate:"), modua::baudRates(),
                          QString::number(modua::kDefaultBaudRate));
    m_serial->addComboBox("data_bits", tr("Data Bits:"), modua::dataBitsOptions(),
                          QString::number(modua::kDefaultDataBits));
    m_serial->addComboBox("parity", tr("Parity:"), modua::parityOptions(), "None");
    m_serial->addComboBox("stop", tr("Stop Bits:"), modua::stopBitsOptions(), "1");
    m_serial->addComboBox("flow", tr("Flow Control:"), modua::flowControlOptions(), "None");
    m_commStack->insertWidget(SerialPage, serialPage);

    auto *networkPage = new QWidget(m_commStack);
    m_network = std::make_unique<FormBuilder>(new QFormLayout(networkPage));
    const QStringList adapters = modua::listNetworkAdapters();
    QComboBox *adapterCombo = m_network->addComboBox("network_adapter", tr("Network Adapter:"), adapters,
                                                     adapters.value(0));
    m_network->addHidden("network_adapter_ip", modua::parseAdapterString(adapters.value(0)).ip);
    m_commStack->insertWidget(NetworkPage, networkPage);
    m_tabs->addTab(m_commStack, tr("Communication"));

    layout->addWidget(m_tabs);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Ok)->setText(tr("Finish"));
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);

    connect(buttons, &QDialogButtonBox::accepted, this, &ChannelDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &ChannelDialog::reject);
    connect(m_driverCombo, &QComboBox::currentIndexChanged, this, &ChannelDialog::onDriverChanged);
    connect(adapterCombo, &QComboBox::currentIndexChanged, this, &ChannelDialog::onAdapterChanged);
}

QString ChannelDialog::driver() const
{
    return m_driverCombo->currentText();
}

bool ChannelDialog::isSerialDriver() const
{
    return !modua::isTcpLikeDriver(driver());
}

void ChannelDialog::onDriverChanged()
{
    const bool serial = isSerialDriver();
    m_driverParamsPage->setVisible(!serial);
    m_commStack->setCurrentIndex(serial ? SerialPage : NetworkPage);
}

void ChannelDialog::onAdapterChanged()
{
    const QString adapter = m_network->value("network_adapter").toString();
    m_network->setValue("network_adapter_ip", modua::parseAdapterString(adapter).ip);
}

QJsonObject ChannelDialog::getData() const
{
    const QString name = m_general->value("channel_name").toString().trimmed();
    const QString description = m_general->value("description").toString();

    const QJsonObject driverParams = isSerialDriver() ? QJsonObject() : m_driverParams->values();
    const QJsonObject comm = isSerialDriver() ? m_serial->values() : m_network->values();

    QJsonObject allParams = driverParams;
    for (auto it = comm.begin(); it != comm.end(); ++it) allParams.insert(it.key(), it.value());

    // 扁平视图
    QJsonObject out = allParams;
    out["name"] = name;
    out["description"] = description;
    out["params"] = allParams;

    // 分节视图覆盖同名键
    out["general"] = QJsonObject{{"channel_name", name}, {"description", description}};
    out["driver"] = QJsonObject{{"type", driver()}, {"params", driverParams}};
    out["communication"] = comm;
    return out;
}

void ChannelDialog::ensureComboItem(FormBuilder *form, const QString &id, const QJsonValue &value)
{
    auto *combo = qobject_cast<QComboBox *>(form->widget(id));
    const QString text = value.toString();
    if (!combo || text.isEmpty()) return;
    if (combo->findText(text) < 0) combo->addItem(text);
}

void ChannelDialog::loadData(const QJsonObject &data)
{
    if (data.isEmpty()) return;

    const QJsonObject general = modua::safeGetObject(data, "general");
    const QString name = modua::safeGetString(general, "channel_name",
                                              modua::safeGetString(general, "name",
                                                                   modua::safeGetString(data, "name")));
    if (!name.isEmpty()) m_general->setValue("channel_name", name);
    const QJsonValue description = general.contains("description") ? general.value("description")
                                                                    : data.value("description");
    if (description.isString()) m_general->setValue("description", description);

    QString driverType;
    QJsonObject driverParams;
    const QJsonValue driverValue = data.value("driver");
    if (driverValue.isObject()) {
        driverType = modua::safeGetString(driverValue.toObject(), "type");
        driverParams = modua::safeGetObject(driverValue.toObject(), "params");
    } else {
        driverType = driverValue.toString();
    }
    const int idx = m_driverCombo->findText(driverType);
    if (idx >= 0) m_driverCombo->setCurrentIndex(idx);

    // 扁平键先写入，分节键后写入以覆盖
    QJsonObject merged = data;
    const QJsonObject flatParams = modua::safeGetObject(data, "params");
    for (auto it = flatParams.begin(); it != flatParams.end(); ++it) merged.insert(it.key(), it.value());
    for (auto it = driverParams.begin(); it != driverParams.end(); ++it) merged.insert(it.key(), it.value());
    const QJsonObject comm = modua::safeGetObject(data, "communication");
    for (auto it = comm.begin(); it != comm.end(); ++it) merged.insert(it.key(), it.value());
    // 旧文件中网卡字段名为 adapter
    if (!merged.contains("network_adapter") && merged.contains("adapter")) {
        merged.insert("network_adapter", merged.value("adapter"));
    }

    ensureComboItem(m_serial.get(), "com", merged.value("com"));
    ensureComboItem(m_network.get(), "network_adapter", merged.value("network_adapter"));

    m_driverParams->setValues(merged);
    m_serial->setValues(merged);
    m_network->setValues(merged);
    if (!merged.contains("network_adapter_ip")) onAdapterChanged();
}

void ChannelDialog::accept()
{
    const QString name = m_general->value("channel_name").toString().trimmed();
    if (!modua::isValidTagName(name)) {
        QMessageBox::warning(this, tr("Invalid Input"), tr("Channel name must be non-empty and must not contain '.'"));
        m_tabs->setCurrentIndex(0);
        return;
    }
    if (!isSerialDriver()) {
        const QString ip = m_driverParams->value("ip").toString().trimmed();
        if (!modua::isValidIp(ip)) {
            QMessageBox::warning(this, tr("Invalid Input"), tr("Invalid IP address: %1").arg(ip));
            m_tabs->setCurrentIndex(1);
            return;
        }
    }
    QDialog::accept();
}
