#ifndef OPCUA_DIALOG_H
#define OPCUA_DIALOG_H

#include <QDialog>
#include <QJsonObject>
#include <memory>

class QTabWidget;
class FormBuilder;

/**
 * OPC UA 服务器设置对话框
 *
 * getData() 输出 {general, authentication, security_policies, certificate}
 * 并合并扁平键；未启用任何安全策略时拒绝确认。
 */
class OpcUaDialog : public QDialog
{
    Q_OBJECT

public:
    explicit OpcUaDialog(QWidget *parent = nullptr);
    ~OpcUaDialog() override;

    QJsonObject getData() const;
    void loadData(const QJsonObject &data);

    /** 校验当前输入，失败时返回原因 */
    bool validate(QString &error) const;

    FormBuilder *generalForm() const { return m_general.get(); }
    FormBuilder *authForm() const { return m_auth.get(); }
    FormBuilder *policyForm() const { return m_policies.get(); }
    FormBuilder *certificateForm() const { return m_certificate.get(); }

public slots:
    void accept() override;

private slots:
    void updateProductUri();
    void updateAuthRows();
    void onAdapterChanged();

private:
    void selectAdapter(const QString &adapter, const QString &ip);

    QTabWidget *m_tabs;
    std::unique_ptr<FormBuilder> m_general;
    std::unique_ptr<FormBuilder> m_auth;
    std::unique_ptr<FormBuilder> m_policies;
    std::unique_ptr<FormBuilder> m_certificate;
};

#endif // OPCUA_DIALOG_H
