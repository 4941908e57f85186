#ifndef DEVICE_DIALOG_H
#define DEVICE_DIALOG_H

#include <QDialog>
#include <QJsonObject>
#include <memory>

class QTabWidget;
class FormBuilder;

/**
 * 设备属性对话框
 *
 * Timing 页字段随通道驱动变化；Data Access 与 Data Encoding 页以 Enable/Disable
 * 显示，getData() 输出数值 0/1。
 */
class DeviceDialog : public QDialog
{
    Q_OBJECT

public:
    DeviceDialog(QWidget *parent = nullptr, const QString &suggestedName = "Device1",
                 const QString &driverType = "Modbus RTU Serial", int suggestedDeviceId = 1);
    ~DeviceDialog() override;

    QJsonObject getData() const;
    void loadData(const QJsonObject &data);

    FormBuilder *generalForm() const { return m_general.get(); }
    FormBuilder *timingForm() const { return m_timing.get(); }
    FormBuilder *accessForm() const { return m_access.get(); }
    FormBuilder *encodingForm() const { return m_encoding.get(); }
    FormBuilder *blockForm() const { return m_blocks.get(); }

    static QStringList dataAccessKeys();
    static QStringList encodingKeys();

public slots:
    void accept() override;

private:
    void setupTiming(QWidget *page);
    static QJsonObject flagsToNumbers(const QJsonObject &values);
    static QJsonObject flagsToText(const QJsonObject &values, const QStringList &keys);

    QString m_driverType;
    QTabWidget *m_tabs;
    std::unique_ptr<FormBuilder> m_general;
    std::unique_ptr<FormBuilder> m_timing;
    std::unique_ptr<FormBuilder> m_access;
    std::unique_ptr<FormBuilder> m_encoding;
    std::unique_ptr<FormBuilder> m_blocks;
};

#endif // DEVICE_DIALOG_H
