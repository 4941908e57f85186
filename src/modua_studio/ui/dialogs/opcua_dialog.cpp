#include "opcua_dialog.h"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFormLayout>
#include <QLineEdit>
#include <QMessageBox>
#include <QPushButton>
#include <QSpinBox>
#include <QTabWidget>
#include <QVBoxLayout>

#include "modua/core/constants.h"
#include "modua/opcua/opcua_settings.h"
#include "modua/utils/config_utils.h"
#include "ui/app_style.h"
#include "ui/widgets/form_builder.h"

namespace {

const QStringList kSections = {"general", "authentication", "security_policies", "certificate"};
const QString kUsernamePassword = QStringLiteral("Username/Password");

QString policyLabel(const modua::SecurityPolicyInfo &policy)
{
    const QString name = policy.policyUri.section('#', 1);
    switch (policy.mode) {
    case modua::SecurityPolicyInfo::Mode::None:
        return QObject::tr("None");
    case modua::SecurityPolicyInfo::Mode::Sign:
        return QObject::tr("Sign - %1").arg(name);
    case modua::SecurityPolicyInfo::Mode::SignAndEncrypt:
        return QObject::tr("Sign & Encrypt - %1").arg(name);
    }
    return name;
}

} // namespace

OpcUaDialog::OpcUaDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("OPC UA Settings"));
    setMinimumWidth(AppStyle::kDialogMinWidth);

    auto *layout = new QVBoxLayout(this);
    layout->setSpacing(AppStyle::kFieldSpacing);
    m_tabs = new QTabWidget(this);

    // Settings
    auto *generalPage = new QWidget(m_tabs);
    m_general = std::make_unique<FormBuilder>(new QFormLayout(generalPage));
    m_general->addLineEdit("application_Name", tr("Application Name:"), modua::kDefaultOpcAppName);
    m_general->addLineEdit("namespace", tr("Namespace:"), modua::kDefaultOpcNamespace);
    QSpinBox *portSpin = m_general->addSpinBox("port", tr("Port:"), 1, 65535, modua::kDefaultOpcPort);
    m_general->addReadOnly("product_uri", tr("Product URI:"));
    const QStringList adapters = modua::listNetworkAdapters();
    QComboBox *adapterCombo = m_general->addComboBox("network_adapter", tr("Network Adapter:"), adapters,
                                                     adapters.value(0));
    m_general->addHidden("network_adapter_ip", modua::parseAdapterString(adapters.value(0)).ip);
    m_general->addSpinBox("max_sessions", tr("Max Sessions:"), 1, 100000, modua::kDefaultOpcMaxSessions);
    m_general->addSpinBox("publish_interval", tr("Publish Interval (ms):"), 10, 600000,
                          modua::kDefaultOpcPublishInterval);
    m_tabs->addTab(generalPage, tr("Settings"));

    // Authentication
    auto *authPage = new QWidget(m_tabs);
    m_auth = std::make_unique<FormBuilder>(new QFormLayout(authPage));
    QComboBox *authCombo = m_auth->addComboBox("auth_type", tr("Authentication:"),
                                               {"Anonymous", kUsernamePassword}, "Anonymous");
    m_auth->addLineEdit("username", tr("Username:"));
    QLineEdit *password = m_auth->addLineEdit("password", tr("Password:"));
    password->setEchoMode(QLineEdit::Password);
    m_tabs->addTab(authPage, tr("Authentication"));

    // Security Policies
    auto *policyPage = new QWidget(m_tabs);
    m_policies = std::make_unique<FormBuilder>(new QFormLayout(policyPage));
    for (const modua::SecurityPolicyInfo &policy : modua::securityPolicyInfos()) {
        m_policies->addCheckBox(policy.key, policyLabel(policy), policy.key == "policy_none");
    }
    m_tabs->addTab(policyPage, tr("Security Policies"));

    // Certificate
    auto *certPage = new QWidget(m_tabs);
    m_certificate = std::make_unique<FormBuilder>(new QFormLayout(certPage));
    m_certificate->addCheckBox("auto_generate", tr("Auto Generate:"), true);
    m_certificate->addLineEdit("common_name", tr("Common Name:"));
    m_certificate->addLineEdit("organization", tr("Organization:"), "ModUA Organization");
    m_certificate->addLineEdit("organization_unit", tr("Organization Unit:"), "OPC UA Server");
    m_certificate->addLineEdit("locality", tr("Locality:"));
    m_certificate->addLineEdit("state", tr("State:"));
    m_certificate->addLineEdit("country", tr("Country:"), "TW");
    m_certificate->addSpinBox("cert_validity", tr("Validity (years):"), 1, 20, modua::kDefaultCertValidityYears);
    m_tabs->addTab(certPage, tr("Certificate"));

    layout->addWidget(m_tabs);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &OpcUaDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &OpcUaDialog::reject);

    connect(portSpin, &QSpinBox::valueChanged, this, &OpcUaDialog::updateProductUri);
    connect(adapterCombo, &QComboBox::currentIndexChanged, this, &OpcUaDialog::onAdapterChanged);
    connect(authCombo, &QComboBox::currentIndexChanged, this, &OpcUaDialog::updateAuthRows);

    updateProductUri();
    updateAuthRows();
}

OpcUaDialog::~OpcUaDialog() = default;

void OpcUaDialog::onAdapterChanged()
{
    const QString adapter = m_general->value("network_adapter").toString();
    m_general->setValue("network_adapter_ip", modua::parseAdapterString(adapter).ip);
    updateProductUri();
}

void OpcUaDialog::updateProductUri()
{
    QString ip = m_general->value("network_adapter_ip").toString();
    if (ip.isEmpty()) ip = "0.0.0.0";
    const int port = m_general->value("port").toInt();
    m_general->setValue("product_uri", QString("opc.tcp://%1:%2/").arg(ip).arg(port));
}

void OpcUaDialog::updateAuthRows()
{
    const bool credentials = m_auth->value("auth_type").toString() == kUsernamePassword;
    m_auth->setRowVisible("username", credentials);
    m_auth->setRowVisible("password", credentials);
}

void OpcUaDialog::selectAdapter(const QString &adapter, const QString &ip)
{
    auto *combo = qobject_cast<QComboBox *>(m_general->widget("network_adapter"));
    if (!combo) return;

    int idx = adapter.isEmpty() ? -1 : combo->findText(adapter);
    if (idx < 0 && !ip.isEmpty()) {
        for (int i = 0; i < combo->count(); ++i) {
            if (modua::parseAdapterString(combo->itemText(i)).ip == ip) {
                idx = i;
                break;
            }
        }
    }
    if (idx < 0) {
        const QString text = adapter.isEmpty() ? ip : adapter;
        if (text.isEmpty()) return;
        combo->addItem(text);
        idx = combo->count() - 1;
    }
    combo->setCurrentIndex(idx);
}

QJsonObject OpcUaDialog::getData() const
{
    const QJsonObject general = m_general->values();
    const QJsonObject auth = m_auth->values();
    const QJsonObject policies = m_policies->values();
    const QJsonObject cert = m_certificate->values();

    QJsonObject out;
    for (const QJsonObject &section : {general, auth, policies, cert}) {
        for (auto it = section.begin(); it != section.end(); ++it) out.insert(it.key(), it.value());
    }
    out["general"] = general;
    out["authentication"] = auth;
    out["security_policies"] = policies;
    out["certificate"] = cert;
    return out;
}

void OpcUaDialog::loadData(const QJsonObject &data)
{
    if (data.isEmpty()) return;

    QJsonObject flat = modua::mergeFlatAndNested(data, kSections);
    if (!flat.contains("application_Name") && flat.contains("application_name")) {
        flat.insert("application_Name", flat.value("application_name"));
    }
    if (!flat.contains("auth_type") && data.value("authentication").isString()) {
        flat.insert("auth_type", data.value("authentication"));
    }

    selectAdapter(modua::safeGetString(flat, "network_adapter"), modua::safeGetString(flat, "network_adapter_ip"));
    flat.remove("network_adapter");
    flat.remove("product_uri");

    m_general->setValues(flat);
    m_auth->setValues(flat);
    m_policies->setValues(flat);
    m_certificate->setValues(flat);

    if (!flat.contains("network_adapter_ip")) onAdapterChanged();
    updateProductUri();
    updateAuthRows();
}

bool OpcUaDialog::validate(QString &error) const
{
    modua::OpcUaSettings settings;
    return modua::OpcUaSettings::fromJson(getData(), settings, error);
}

void OpcUaDialog::accept()
{
    QString error;
    if (!validate(error)) {
        QMessageBox::warning(this, tr("Invalid OPC UA Settings"), error);
        return;
    }
    QDialog::accept();
}
