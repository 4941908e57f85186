#ifndef CHANNEL_DIALOG_H
#define CHANNEL_DIALOG_H

#include <QDialog>
#include <QJsonObject>
#include <memory>

class QComboBox;
class QStackedWidget;
class QTabWidget;
class FormBuilder;

/**
 * 通道属性对话框：General / Driver / Communication 三页
 *
 * getData() 同时返回扁平键和分节结构 {general, driver:{type, params}, communication}，
 * loadData() 接受两种形式，分节优先。
 */
class ChannelDialog : public QDialog
{
    Q_OBJECT

public:
    explicit ChannelDialog(QWidget *parent = nullptr, const QString &suggestedName = "Channel1");
    ~ChannelDialog() override;

    QJsonObject getData() const;
    void loadData(const QJsonObject &data);

    QString driver() const;
    bool isSerialDriver() const;

    FormBuilder *generalForm() const { return m_general.get(); }
    FormBuilder *driverForm() const { return m_driverParams.get(); }
    FormBuilder *serialForm() const { return m_serial.get(); }
    FormBuilder *networkForm() const { return m_network.get(); }

public slots:
    void accept() override;

private slots:
    void onDriverChanged();
    void onAdapterChanged();

private:
    void setupUi(const QString &suggestedName);
    void ensureComboItem(FormBuilder *form, const QString &id, const QJsonValue &value);

    QTabWidget *m_tabs;
    QComboBox *m_driverCombo;
    QWidget *m_driverParamsPage;
    QStackedWidget *m_commStack;

    std::unique_ptr<FormBuilder> m_general;
    std::unique_ptr<FormBuilder> m_driverParams;
    std::unique_ptr<FormBuilder> m_serial;
    std::unique_ptr<FormBuilder> m_network;
};

#endif // CHANNEL_DIALOG_H
