#ifndef TAG_DIALOG_H
#define TAG_DIALOG_H

#include <QDialog>
#include <QJsonObject>
#include <memory>

class QTabWidget;
class FormBuilder;

namespace modua {
class ProjectNode;
}

/**
 * 标签属性对话框：General / Scaling
 *
 * 数据类型与访问权限决定地址前缀；新建标签时地址取父节点下一个可用地址。
 */
class TagDialog : public QDialog
{
    Q_OBJECT

public:
    TagDialog(QWidget *parent = nullptr, const QString &suggestedName = "Tag1",
              const modua::ProjectNode *parentNode = nullptr, bool isNew = true);
    ~TagDialog() override;

    /** {general:{...}, scaling:{...}}，缩放为 None 时不含 scaling */
    QJsonObject getData() const;
    void loadData(const QJsonObject &data);

    bool validate(QString &error) const;

    FormBuilder *generalForm() const { return m_general.get(); }
    FormBuilder *scalingForm() const { return m_scaling.get(); }

public slots:
    void accept() override;

private slots:
    void updateAddress();
    void updateScalingRows();

private:
    const modua::ProjectNode *m_parentNode;
    bool m_isNew;
    bool m_loading = false;
    QTabWidget *m_tabs;
    std::unique_ptr<FormBuilder> m_general;
    std::unique_ptr<FormBuilder> m_scaling;
};

#endif // TAG_DIALOG_H
