#include "group_dialog.h"

#include <QDialogButtonBox>
#include <QFormLayout>
#include <QMessageBox>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

#include "modua/utils/config_utils.h"
#include "modua/utils/validators.h"
#include "ui/app_style.h"
#include "ui/widgets/form_builder.h"

GroupDialog::GroupDialog(QWidget *parent, const QString &suggestedName)
    : QDialog(parent)
{
    setWindowTitle(tr("Group Properties"));
    setMinimumWidth(AppStyle::kDialogMinWidth);

    auto *layout = new QVBoxLayout(this);
    auto *tabs = new QTabWidget(this);
    auto *page = new QWidget(tabs);
    m_form = std::make_unique<FormBuilder>(new QFormLayout(page));
    m_form->addLineEdit("name", tr("Name:"), suggestedName);
    m_form->addLineEdit("description", tr("Description:"));
    tabs->addTab(page, tr("General"));
    layout->addWidget(tabs);

    auto *buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Cancel)->setObjectName("secondary");
    layout->addWidget(buttons);
    connect(buttons, &QDialogButtonBox::accepted, this, &GroupDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &GroupDialog::reject);
}

GroupDialog::~GroupDialog() = default;

QJsonObject GroupDialog::getData() const
{
    const QJsonObject general{
        {"name", m_form->value("name").toString().trimmed()},
        {"description", m_form->value("description")},
    };
    QJsonObject out = general;
    out["general"] = general;
    return out;
}

void GroupDialog::loadData(const QJsonObject &data)
{
    if (data.isEmpty()) return;
    const QJsonObject general = modua::safeGetObject(data, "general");
    m_form->setValues(general.isEmpty() ? data : general);
}

void GroupDialog::accept()
{
    if (!modua::isValidTagName(m_form->value("name").toString().trimmed())) {
        QMessageBox::warning(this, tr("Invalid Input"), tr("Group name must be non-empty and must not contain '.'"));
        return;
    }
    QDialog::accept();
}
