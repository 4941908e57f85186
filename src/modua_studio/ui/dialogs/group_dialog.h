#ifndef GROUP_DIALOG_H
#define GROUP_DIALOG_H

#include <QDialog>
#include <QJsonObject>
#include <memory>

class FormBuilder;

class GroupDialog : public QDialog
{
    Q_OBJECT

public:
    explicit GroupDialog(QWidget *parent = nullptr, const QString &suggestedName = "Group1");
    ~GroupDialog() override;

    /** {name, description, general:{name, description}} */
    QJsonObject getData() const;
    void loadData(const QJsonObject &data);

    FormBuilder *form() const { return m_form.get(); }

public slots:
    void accept() override;

private:
    std::unique_ptr<FormBuilder> m_form;
};

#endif // GROUP_DIALOG_H
