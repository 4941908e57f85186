#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QHash>
#include <QJsonObject>
#include <QMainWindow>
#include <QPointer>
#include <memory>

#include "modua/config/app_config.h"
#include "modua/model/project_clipboard.h"
#include "modua/model/project_node.h"

class QAction;
class QLabel;
class QSplitter;
class QTableView;
class QTimer;
class QTreeView;
class MonitorTableModel;
class ProjectTreeModel;
class TerminalWindow;

namespace modua {
class DataBuffer;
class DiagnosticsManager;
class RuntimeMonitor;
}

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(const modua::AppConfig &config, const QString &dataRoot, QWidget *parent = nullptr);
    ~MainWindow() override;

    bool openProject(const QString &path, QString &error);
    bool saveProjectTo(const QString &path, QString &error);

    ProjectTreeModel *treeModel() const { return m_treeModel; }
    modua::RuntimeMonitor *runtime() const { return m_runtime; }
    const modua::AppConfig &config() const { return m_config; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void newProject();
    void openProjectDialog();
    bool saveProject();
    bool saveProjectAs();
    void importCsv();
    void exportCsv();

    void addChannel();
    void addDevice();
    void addGroup();
    void addTag();
    void editSelected();
    void copySelected();
    void cutSelected();
    void pasteClipboard();
    void deleteSelected();

    void startRuntime();
    void stopRuntime();
    void editOpcUaSettings();
    void openTerminal();
    void about();

    void onSelectionChanged();
    void onTreeDoubleClicked(const QModelIndex &index);
    void onMonitorDoubleClicked(const QModelIndex &index);
    void showTreeContextMenu(const QPoint &pos);
    void onRunningChanged(bool running);
    void onConnectionStateChanged(const QString &configId, bool connected);

private:
    void setupUi();
    void setupMenus();
    void setupToolBar();
    void restoreWindowState();
    void saveWindowState();
    void updateActions();
    void updateTitle();
    void setDirty(bool dirty);
    bool maybeSave();
    bool ensureStopped();

    modua::ProjectNode *currentNode() const;
    QList<modua::ProjectNode *> selectedNodes() const;
    modua::ProjectNode *selectedAncestor(modua::ProjectNode::Kind kind) const;
    modua::ProjectNode *tagContainer() const;
    void selectNode(const modua::ProjectNode *node);
    bool editNode(modua::ProjectNode *node);

    modua::AppConfig m_config;
    QString m_dataRoot;
    QString m_projectPath;
    QJsonObject m_opcua;
    bool m_dirty = false;

    std::unique_ptr<modua::DataBuffer> m_buffer;
    std::unique_ptr<modua::DiagnosticsManager> m_diagnostics;
    modua::RuntimeMonitor *m_runtime;
    modua::ProjectClipboard m_clipboard;

    ProjectTreeModel *m_treeModel;
    MonitorTableModel *m_monitorModel;
    QSplitter *m_splitter;
    QTreeView *m_tree;
    QTableView *m_monitorView;
    QLabel *m_runtimeLabel;
    QLabel *m_connectionLabel;
    QTimer *m_refreshTimer;
    QHash<QString, QPointer<TerminalWindow>> m_terminals;
    QHash<QString, bool> m_connections;

    QAction *m_saveAction;
    QAction *m_importCsvAction;
    QAction *m_exportCsvAction;
    QAction *m_addChannelAction;
    QAction *m_addDeviceAction;
    QAction *m_addGroupAction;
    QAction *m_addTagAction;
    QAction *m_propertiesAction;
    QAction *m_copyAction;
    QAction *m_cutAction;
    QAction *m_pasteAction;
    QAction *m_deleteAction;
    QAction *m_startAction;
    QAction *m_stopAction;
    QAction *m_opcUaEnabledAction;
    QAction *m_terminalAction;

    static constexpr int kRefreshIntervalMs = 500;
};

#endif // MAINWINDOW_H
