#include "mainwindow.h"

#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QHeaderView>
#include <QJsonArray>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTableView>
#include <QTimer>
#include <QToolBar>
#include <QTreeView>
#include <utility>

#include "modua/core/constants.h"
#include "modua/model/project_serializer.h"
#include "modua/model/tag_csv.h"
#include "modua/opcua/opcua_settings.h"
#include "modua/runtime/data_buffer.h"
#include "modua/runtime/diagnostics.h"
#include "modua/runtime/runtime_monitor.h"
#include "modua/utils/config_utils.h"
#include "models/monitor_table_model.h"
#include "models/project_tree_model.h"
#include "ui/app_style.h"
#include "ui/dialogs/channel_dialog.h"
#include "ui/dialogs/device_dialog.h"
#include "ui/dialogs/group_dialog.h"
#include "ui/dialogs/opcua_dialog.h"
#include "ui/dialogs/tag_dialog.h"
#include "ui/dialogs/write_value_dialog.h"
#include "ui/terminal_window.h"

using modua::ProjectNode;

namespace {

const QString kProjectFilter = QObject::tr("ModUA Project (*.json);;All Files (*)");
const QString kCsvFilter = QObject::tr("CSV Files (*.csv);;All Files (*)");

/** 对话框输出中节点需要保存的分节 */
QJsonObject sectionsFor(ProjectNode::Kind kind, const QJsonObject &data)
{
    QStringList keys;
    switch (kind) {
    case ProjectNode::Kind::Channel:
        keys = {"general", "driver", "communication"};
        break;
    case ProjectNode::Kind::Device:
        keys = {"general", "timing", "data_access", "encoding", "block_sizes"};
        break;
    case ProjectNode::Kind::Group:
        keys = {"general"};
        break;
    case ProjectNode::Kind::Tag:
        keys = {"general", "scaling"};
        break;
    case ProjectNode::Kind::Root:
        break;
    }

    QJsonObject out;
    for (const QString &key : keys) {
        if (data.value(key).isObject()) out.insert(key, data.value(key));
    }
    return out;
}

QString driverTypeOf(const ProjectNode *node)
{
    const ProjectNode *channel = node ? node->ancestor(ProjectNode::Kind::Channel) : nullptr;
    if (!channel) return modua::driverTypes().value(0);
    const QJsonObject driver = modua::safeGetObject(channel->config(), "driver");
    return modua::safeGetString(driver, "type", modua::driverTypes().value(0));
}

/** 启用缩放时写入值按缩放后的类型解析 */
QString effectiveDataType(const ProjectNode *tag, const QString &fallback)
{
    if (!tag) return fallback;
    const QJsonObject scaling = modua::safeGetObject(tag->config(), "scaling");
    const QString type = modua::safeGetString(scaling, "type", "None");
    if (type.isEmpty() || type == "None") return fallback;
    return modua::safeGetString(scaling, "scaled_type", fallback);
}

} // namespace

MainWindow::MainWindow(const modua::AppConfig &config, const QString &dataRoot, QWidget *parent)
    : QMainWindow(parent)
    , m_config(config)
    , m_dataRoot(dataRoot)
    , m_buffer(std::make_unique<modua::DataBuffer>())
    , m_diagnostics(std::make_unique<modua::DiagnosticsManager>(config.diagnosticsCapacity, config.onlyTxRx))
{
    m_runtime = new modua::RuntimeMonitor(m_buffer.get(), m_diagnostics.get(), this);

    setupUi();
    setupMenus();
    setupToolBar();
    restoreWindowState();

    connect(m_runtime, &modua::RuntimeMonitor::runningChanged, this, &MainWindow::onRunningChanged);
    connect(m_runtime, &modua::RuntimeMonitor::connectionStateChanged,
            this, &MainWindow::onConnectionStateChanged);

    resize(1280, 800);
    updateTitle();
    updateActions();
    statusBar()->showMessage(tr("Ready"));
}

MainWindow::~MainWindow()
{
    m_refreshTimer->stop();
    // 终端与运行时引用诊断中心和数据缓冲，须在成员析构前释放
    for (const QPointer<TerminalWindow> &terminal : std::as_const(m_terminals)) {
        delete terminal.data();
    }
    m_terminals.clear();
    delete m_runtime;
    m_runtime = nullptr;
}

void MainWindow::setupUi()
{
    m_treeModel = new ProjectTreeModel(this);
    m_monitorModel = new MonitorTableModel(m_buffer.get(), this);

    m_splitter = new QSplitter(Qt::Horizontal, this);

    m_tree = new QTreeView(m_splitter);
    m_tree->setModel(m_treeModel);
    m_tree->setHeaderHidden(true);
    m_tree->setSelectionMode(QAbstractItemView::ExtendedSelection);
    m_tree->setDragEnabled(true);
    m_tree->setAcceptDrops(true);
    m_tree->setDropIndicatorShown(true);
    m_tree->setDragDropMode(QAbstractItemView::InternalMove);
    m_tree->setDefaultDropAction(Qt::MoveAction);
    m_tree->setContextMenuPolicy(Qt::CustomContextMenu);

    m_monitorView = new QTableView(m_splitter);
    m_monitorView->setModel(m_monitorModel);
    m_monitorView->setSelectionBehavior(QAbstractItemView::SelectRows);
    m_monitorView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_monitorView->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_monitorView->setAlternatingRowColors(true);
    m_monitorView->verticalHeader()->setVisible(false);
    m_monitorView->horizontalHeader()->setStretchLastSection(true);

    m_splitter->addWidget(m_tree);
    m_splitter->addWidget(m_monitorView);
    m_splitter->setStretchFactor(0, 1);
    m_splitter->setStretchFactor(1, 3);
    setCentralWidget(m_splitter);

    m_runtimeLabel = new QLabel(this);
    m_connectionLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_connectionLabel);
    statusBar()->addPermanentWidget(m_runtimeLabel);

    m_refreshTimer = new QTimer(this);
    m_refreshTimer->setInterval(kRefreshIntervalMs);
    connect(m_refreshTimer, &QTimer::timeout, m_monitorModel, &MonitorTableModel::refresh);

    connect(m_tree->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, &MainWindow::onSelectionChanged);
    connect(m_tree, &QTreeView::doubleClicked, this, &MainWindow::onTreeDoubleClicked);
    connect(m_tree, &QTreeView::customContextMenuRequested, this, &MainWindow::showTreeContextMenu);
    connect(m_monitorView, &QTableView::doubleClicked, this, &MainWindow::onMonitorDoubleClicked);

    connect(m_treeModel, &ProjectTreeModel::moveFailed, this, [this](const QString &error) {
        statusBar()->showMessage(tr("Move failed: %1").arg(error), 5000);
    });
    connect(m_treeModel, &QAbstractItemModel::rowsMoved, this, [this]() { setDirty(true); });
}

void MainWindow::setupMenus()
{
    // File menu
    auto *fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(AppStyle::emojiIcon("📄"), tr("&New Project"), QKeySequence::New,
                        this, &MainWindow::newProject);
    fileMenu->addAction(AppStyle::emojiIcon("📂"), tr("&Open Project..."), QKeySequence::Open,
                        this, &MainWindow::openProjectDialog);
    m_saveAction = fileMenu->addAction(AppStyle::emojiIcon("💾"), tr("&Save"), QKeySequence::Save,
                                       this, &MainWindow::saveProject);
    fileMenu->addAction(tr("Save &As..."), QKeySequence::SaveAs, this, &MainWindow::saveProjectAs);
    fileMenu->addSeparator();
    m_importCsvAction = fileMenu->addAction(AppStyle::emojiIcon("📥"), tr("&Import Tags CSV..."),
                                            this, &MainWindow::importCsv);
    m_exportCsvAction = fileMenu->addAction(AppStyle::emojiIcon("📤"), tr("&Export Tags CSV..."),
                                            this, &MainWindow::exportCsv);
    fileMenu->addSeparator();
    fileMenu->addAction(AppStyle::emojiIcon("🚪"), tr("E&xit"), QKeySequence::Quit, this, &QWidget::close);

    // Edit menu
    auto *editMenu = menuBar()->addMenu(tr("&Edit"));
    m_addChannelAction = editMenu->addAction(AppStyle::emojiIcon("🔌"), tr("New &Channel..."),
                                             this, &MainWindow::addChannel);
    m_addDeviceAction = editMenu->addAction(AppStyle::emojiIcon("🖥"), tr("New &Device..."),
                                            this, &MainWindow::addDevice);
    m_addGroupAction = editMenu->addAction(AppStyle::emojiIcon("📁"), tr("New &Group..."),
                                           this, &MainWindow::addGroup);
    m_addTagAction = editMenu->addAction(AppStyle::emojiIcon("🏷"), tr("New &Tag..."),
                                         this, &MainWindow::addTag);
    m_propertiesAction = editMenu->addAction(AppStyle::emojiIcon("⚙"), tr("&Properties..."),
                                             this, &MainWindow::editSelected);
    editMenu->addSeparator();
    m_copyAction = editMenu->addAction(tr("&Copy"), QKeySequence::Copy, this, &MainWindow::copySelected);
    m_cutAction = editMenu->addAction(tr("Cu&t"), QKeySequence::Cut, this, &MainWindow::cutSelected);
    m_pasteAction = editMenu->addAction(tr("&Paste"), QKeySequence::Paste, this, &MainWindow::pasteClipboard);
    m_deleteAction = editMenu->addAction(AppStyle::emojiIcon("❌"), tr("&Delete"), QKeySequence::Delete,
                                         this, &MainWindow::deleteSelected);

    // Runtime menu
    auto *runtimeMenu = menuBar()->addMenu(tr("&Runtime"));
    m_startAction = runtimeMenu->addAction(AppStyle::emojiIcon("▶"), tr("&Start"), this, &MainWindow::startRuntime);
    m_stopAction = runtimeMenu->addAction(AppStyle::emojiIcon("⏹"), tr("S&top"), this, &MainWindow::stopRuntime);
    runtimeMenu->addSeparator();
    runtimeMenu->addAction(AppStyle::emojiIcon("🌐"), tr("&OPC UA Settings..."), this, &MainWindow::editOpcUaSettings);
    m_opcUaEnabledAction = runtimeMenu->addAction(tr("&Enable OPC UA Server"));
    m_opcUaEnabledAction->setCheckable(true);
    m_opcUaEnabledAction->setChecked(true);

    // View menu
    auto *viewMenu = menuBar()->addMenu(tr("&View"));
    m_terminalAction = viewMenu->addAction(AppStyle::emojiIcon("🖵"), tr("&Terminal"), this, &MainWindow::openTerminal);

    // Help menu
    auto *helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(AppStyle::emojiIcon("💡"), tr("&About"), this, &MainWindow::about);
}

void MainWindow::setupToolBar()
{
    auto *toolBar = addToolBar(tr("Main Toolbar"));
    toolBar->setObjectName("mainToolBar");
    toolBar->setMovable(false);
    toolBar->setFloatable(false);

    toolBar->addAction(m_saveAction);
    toolBar->addSeparator();
    toolBar->addAction(m_addChannelAction);
    toolBar->addAction(m_addDeviceAction);
    toolBar->addAction(m_addGroupAction);
    toolBar->addAction(m_addTagAction);
    toolBar->addSeparator();
    toolBar->addAction(m_startAction);
    toolBar->addAction(m_stopAction);
    toolBar->addAction(m_terminalAction);
}

void MainWindow::restoreWindowState()
{
    QSettings settings;
    restoreGeometry(settings.value("mainWindow/geometry").toByteArray());
    restoreState(settings.value("mainWindow/state").toByteArray());
    m_splitter->restoreState(settings.value("mainWindow/splitter").toByteArray());
    m_opcUaEnabledAction->setChecked(settings.value("opcua/enabled", true).toBool());
}

void MainWindow::saveWindowState()
{
    QSettings settings;
    settings.setValue("mainWindow/geometry", saveGeometry());
    settings.setValue("mainWindow/state", saveState());
    settings.setValue("mainWindow/splitter", m_splitter->saveState());
    settings.setValue("opcua/enabled", m_opcUaEnabledAction->isChecked());
}

void MainWindow::updateActions()
{
    const bool running = m_runtime->isRunning();
    ProjectNode *node = currentNode();
    const bool hasNode = node != nullptr;
    const bool hasDevice = selectedAncestor(ProjectNode::Kind::Device) != nullptr;

    m_addChannelAction->setEnabled(!running);
    m_addDeviceAction->setEnabled(!running && selectedAncestor(ProjectNode::Kind::Channel));
    m_addGroupAction->setEnabled(!running && tagContainer());
    m_addTagAction->setEnabled(!running && tagContainer());
    m_propertiesAction->setEnabled(!running && hasNode);
    m_copyAction->setEnabled(hasNode);
    m_cutAction->setEnabled(!running && hasNode);
    m_pasteAction->setEnabled(!running && !m_clipboard.isEmpty());
    m_deleteAction->setEnabled(!running && hasNode);
    m_importCsvAction->setEnabled(!running && hasDevice);
    m_exportCsvAction->setEnabled(hasDevice);

    m_startAction->setEnabled(!running);
    m_stopAction->setEnabled(running);
    m_opcUaEnabledAction->setEnabled(!running);
    m_terminalAction->setEnabled(hasDevice);

    m_tree->setDragEnabled(!running);
    m_runtimeLabel->setText(running ? tr("Runtime: running") : tr("Runtime: stopped"));
}

void MainWindow::updateTitle()
{
    const QString name = m_projectPath.isEmpty() ? tr("Untitled") : QFileInfo(m_projectPath).fileName();
    setWindowTitle(tr("%1%2 - ModUA").arg(name, m_dirty ? "*" : ""));
}

void MainWindow::setDirty(bool dirty)
{
    if (m_dirty == dirty) return;
    m_dirty = dirty;
    updateTitle();
}

bool MainWindow::maybeSave()
{
    if (!m_dirty) return true;
    const auto answer = QMessageBox::question(
        this, tr("Unsaved Changes"), tr("The project has been modified. Save changes?"),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel);
    if (answer == QMessageBox::Save) return saveProject();
    return answer == QMessageBox::Discard;
}

bool MainWindow::ensureStopped()
{
    if (!m_runtime->isRunning()) return true;
    statusBar()->showMessage(tr("Stop the runtime before editing the project"), 5000);
    return false;
}

ProjectNode *MainWindow::currentNode() const
{
    return m_treeModel->nodeFromIndex(m_tree->currentIndex());
}

QList<ProjectNode *> MainWindow::selectedNodes() const
{
    QList<ProjectNode *> nodes;
    for (const QModelIndex &index : m_tree->selectionModel()->selectedRows()) {
        if (ProjectNode *node = m_treeModel->nodeFromIndex(index)) nodes.append(node);
    }

    // 祖先已选中的节点随祖先一起处理
    QList<ProjectNode *> topLevel;
    for (ProjectNode *node : nodes) {
        bool covered = false;
        for (ProjectNode *p = node->parent(); p && !covered; p = p->parent()) {
            covered = nodes.contains(p);
        }
        if (!covered) topLevel.append(node);
    }
    return topLevel;
}

ProjectNode *MainWindow::selectedAncestor(ProjectNode::Kind kind) const
{
    ProjectNode *node = currentNode();
    return node ? node->ancestor(kind) : nullptr;
}

ProjectNode *MainWindow::tagContainer() const
{
    ProjectNode *node = currentNode();
    if (!node) return nullptr;
    if (node->kind() == ProjectNode::Kind::Tag) node = node->parent();
    if (node->kind() == ProjectNode::Kind::Device || node->kind() == ProjectNode::Kind::Group) return node;
    return nullptr;
}

void MainWindow::selectNode(const ProjectNode *node)
{
    const QModelIndex index = m_treeModel->indexForNode(node);
    if (!index.isValid()) return;
    m_tree->expand(index.parent());
    m_tree->setCurrentIndex(index);
    m_tree->scrollTo(index);
}

// ---------------------------------------------------------------------------
// File

void MainWindow::newProject()
{
    if (!ensureStopped() || !maybeSave()) return;
    m_treeModel->resetWith([this]() { m_treeModel->root()->clearChildren(); });
    m_opcua = QJsonObject();
    m_projectPath.clear();
    m_monitorModel->clear();
    m_dirty = false;
    updateTitle();
    updateActions();
}

void MainWindow::openProjectDialog()
{
    if (!ensureStopped() || !maybeSave()) return;

    const QString path = QFileDialog::getOpenFileName(this, tr("Open Project"),
                                                      QFileInfo(m_projectPath).absolutePath(), kProjectFilter);
    if (path.isEmpty()) return;

    QString error;
    if (!openProject(path, error)) {
        QMessageBox::critical(this, tr("Open Failed"), error);
    }
}

bool MainWindow::openProject(const QString &path, QString &error)
{
    bool ok = false;
    QJsonObject opcua;
    m_treeModel->resetWith([&]() {
        ok = modua::ProjectSerializer::loadProject(path, *m_treeModel->root(), opcua, error);
    });
    if (!ok) {
        qWarning() << "Failed to open project" << path << ":" << error;
        return false;
    }

    m_opcua = opcua;
    m_projectPath = QFileInfo(path).absoluteFilePath();
    m_config.lastProject = m_projectPath;
    m_monitorModel->clear();
    m_tree->expandToDepth(1);
    m_dirty = false;
    updateTitle();
    updateActions();
    qInfo() << "Opened project" << m_projectPath;
    statusBar()->showMessage(tr("Opened %1").arg(m_projectPath), 3000);
    return true;
}

bool MainWindow::saveProjectTo(const QString &path, QString &error)
{
    if (!modua::ProjectSerializer::saveProject(*m_treeModel->root(), m_opcua, path, error)) {
        qWarning() << "Failed to save project" << path << ":" << error;
        return false;
    }
    m_projectPath = QFileInfo(path).absoluteFilePath();
    m_config.lastProject = m_projectPath;
    m_dirty = false;
    updateTitle();
    statusBar()->showMessage(tr("Saved %1").arg(m_projectPath), 3000);
    return true;
}

bool MainWindow::saveProject()
{
    if (m_projectPath.isEmpty()) return saveProjectAs();

    QString error;
    if (!saveProjectTo(m_projectPath, error)) {
        QMessageBox::critical(this, tr("Save Failed"), error);
        return false;
    }
    return true;
}

bool MainWindow::saveProjectAs()
{
    QString path = QFileDialog::getSaveFileName(this, tr("Save Project As"),
                                                m_projectPath.isEmpty() ? "project.json" : m_projectPath,
                                                kProjectFilter);
    if (path.isEmpty()) return false;
    if (QFileInfo(path).suffix().isEmpty()) path += ".json";

    QString error;
    if (!saveProjectTo(path, error)) {
        QMessageBox::critical(this, tr("Save Failed"), error);
        return false;
    }
    return true;
}

void MainWindow::importCsv()
{
    if (!ensureStopped()) return;
    ProjectNode *device = selectedAncestor(ProjectNode::Kind::Device);
    if (!device) return;

    const QString path = QFileDialog::getOpenFileName(this, tr("Import Tags"), QString(), kCsvFilter);
    if (path.isEmpty()) return;

    bool ok = false;
    QString error;
    modua::CsvImportReport report;
    m_treeModel->resetWith([&]() {
        ok = modua::importTagsCsvFile(device, path, report, error);
    });
    if (!ok) {
        QMessageBox::critical(this, tr("Import Failed"), error);
        return;
    }

    setDirty(true);
    selectNode(device);
    QString message = tr("Imported %1 tag(s), created %2 group(s).").arg(report.imported).arg(report.groupsCreated);
    if (!report.errors.isEmpty()) {
        message += "\n\n" + tr("Skipped rows:") + "\n" + report.errors.join('\n');
        QMessageBox::warning(this, tr("Import Tags"), message);
    } else {
        QMessageBox::information(this, tr("Import Tags"), message);
    }
}

void MainWindow::exportCsv()
{
    ProjectNode *device = selectedAncestor(ProjectNode::Kind::Device);
    if (!device) return;

    QString path = QFileDialog::getSaveFileName(this, tr("Export Tags"), device->name() + ".csv", kCsvFilter);
    if (path.isEmpty()) return;

    QString error;
    if (!modua::exportTagsCsvFile(*device, path, error)) {
        QMessageBox::critical(this, tr("Export Failed"), error);
        return;
    }
    statusBar()->showMessage(tr("Exported tags to %1").arg(path), 3000);
}

// ---------------------------------------------------------------------------
// Edit

void MainWindow::addChannel()
{
    if (!ensureStopped()) return;
    ProjectNode *root = m_treeModel->root();

    ChannelDialog dialog(this, modua::uniqueName(root, "Channel1", ProjectNode::Kind::Channel));
    if (dialog.exec() != QDialog::Accepted) return;

    const QJsonObject config = sectionsFor(ProjectNode::Kind::Channel, dialog.getData());
    QString name = modua::safeGetString(modua::safeGetObject(config, "general"), "channel_name");
    if (root->findChild(name, ProjectNode::Kind::Channel)) {
        name = modua::uniqueName(root, name, ProjectNode::Kind::Channel);
    }

    ProjectNode *node = m_treeModel->addNode(
        root, std::make_unique<ProjectNode>(ProjectNode::Kind::Channel, name, config));
    selectNode(node);
    setDirty(true);
}

void MainWindow::addDevice()
{
    if (!ensureStopped()) return;
    ProjectNode *channel = selectedAncestor(ProjectNode::Kind::Channel);
    if (!channel) return;

    DeviceDialog dialog(this, modua::uniqueName(channel, "Device1", ProjectNode::Kind::Device),
                        driverTypeOf(channel), modua::nextDeviceId(channel));
    if (dialog.exec() != QDialog::Accepted) return;

    const QJsonObject config = sectionsFor(ProjectNode::Kind::Device, dialog.getData());
    QString name = modua::safeGetString(modua::safeGetObject(config, "general"), "name");
    if (channel->findChild(name, ProjectNode::Kind::Device)) {
        name = modua::uniqueName(channel, name, ProjectNode::Kind::Device);
    }

    ProjectNode *node = m_treeModel->addNode(
        channel, std::make_unique<ProjectNode>(ProjectNode::Kind::Device, name, config));
    selectNode(node);
    setDirty(true);
}

void MainWindow::addGroup()
{
    if (!ensureStopped()) return;
    ProjectNode *parent = tagContainer();
    if (!parent) return;

    GroupDialog dialog(this, modua::uniqueName(parent, "Group1", ProjectNode::Kind::Group));
    if (dialog.exec() != QDialog::Accepted) return;

    const QJsonObject config = sectionsFor(ProjectNode::Kind::Group, dialog.getData());
    QString name = modua::safeGetString(modua::safeGetObject(config, "general"), "name");
    if (parent->findChild(name, ProjectNode::Kind::Group)) {
        name = modua::uniqueName(parent, name, ProjectNode::Kind::Group);
    }

    ProjectNode *node = m_treeModel->addNode(
        parent, std::make_unique<ProjectNode>(ProjectNode::Kind::Group, name, config));
    selectNode(node);
    setDirty(true);
}

void MainWindow::addTag()
{
    if (!ensureStopped()) return;
    ProjectNode *parent = tagContainer();
    if (!parent) return;

    TagDialog dialog(this, modua::uniqueName(parent, "Tag1", ProjectNode::Kind::Tag), parent, true);
    if (dialog.exec() != QDialog::Accepted) return;

    const QJsonObject config = sectionsFor(ProjectNode::Kind::Tag, dialog.getData());
    QString name = modua::safeGetString(modua::safeGetObject(config, "general"), "name");
    if (parent->findChild(name, ProjectNode::Kind::Tag)) {
        name = modua::uniqueName(parent, name, ProjectNode::Kind::Tag);
    }

    ProjectNode *node = m_treeModel->addNode(
        parent, std::make_unique<ProjectNode>(ProjectNode::Kind::Tag, name, config));
    selectNode(node);
    setDirty(true);
}

void MainWindow::editSelected()
{
    if (!ensureStopped()) return;
    if (ProjectNode *node = currentNode()) editNode(node);
}

bool MainWindow::editNode(ProjectNode *node)
{
    const QJsonObject current = modua::ProjectSerializer::nodeToJson(*node);
    QJsonObject data;

    switch (node->kind()) {
    case ProjectNode::Kind::Channel: {
        ChannelDialog dialog(this, node->name());
        dialog.loadData(current);
        if (dialog.exec() != QDialog::Accepted) return false;
        data = dialog.getData();
        break;
    }
    case ProjectNode::Kind::Device: {
        DeviceDialog dialog(this, node->name(), driverTypeOf(node));
        dialog.loadData(current);
        if (dialog.exec() != QDialog::Accepted) return false;
        data = dialog.getData();
        break;
    }
    case ProjectNode::Kind::Group: {
        GroupDialog dialog(this, node->name());
        dialog.loadData(current);
        if (dialog.exec() != QDialog::Accepted) return false;
        data = dialog.getData();
        break;
    }
    case ProjectNode::Kind::Tag: {
        TagDialog dialog(this, node->name(), node->parent(), false);
        dialog.loadData(current);
        if (dialog.exec() != QDialog::Accepted) return false;
        data = dialog.getData();
        break;
    }
    case ProjectNode::Kind::Root:
        return false;
    }

    const QJsonObject config = sectionsFor(node->kind(), data);
    QString name = modua::safeGetString(modua::safeGetObject(config, "general"),
                                        ProjectNode::nameKey(node->kind()), node->name());
    if (name != node->name()) {
        ProjectNode *sibling = node->parent() ? node->parent()->findChild(name, node->kind()) : nullptr;
        if (sibling && sibling != node) name = modua::uniqueName(node->parent(), name, node->kind());
    }

    node->setConfig(config);
    node->setName(name);
    m_treeModel->nodeChanged(node);
    onSelectionChanged();
    setDirty(true);
    return true;
}

void MainWindow::copySelected()
{
    const QList<ProjectNode *> nodes = selectedNodes();
    if (nodes.isEmpty()) return;
    m_clipboard.copy(nodes);
    statusBar()->showMessage(tr("Copied %1 item(s)").arg(nodes.size()), 3000);
    updateActions();
}

void MainWindow::cutSelected()
{
    if (!ensureStopped()) return;
    const QList<ProjectNode *> nodes = selectedNodes();
    if (nodes.isEmpty()) return;

    m_monitorModel->clear();
    m_treeModel->resetWith([&]() { m_clipboard.cut(nodes); });
    setDirty(true);
    updateActions();
}

void MainWindow::pasteClipboard()
{
    if (!ensureStopped() || m_clipboard.isEmpty()) return;

    ProjectNode *target = currentNode();
    if (!target) target = m_treeModel->root();
    if (!m_clipboard.resolveParent(target)) {
        statusBar()->showMessage(tr("Cannot paste here"), 5000);
        return;
    }

    QString error;
    QList<ProjectNode *> pasted;
    m_treeModel->resetWith([&]() { pasted = m_clipboard.paste(target, error); });
    if (pasted.isEmpty()) {
        QMessageBox::warning(this, tr("Paste"), error);
        return;
    }

    selectNode(pasted.first());
    setDirty(true);
}

void MainWindow::deleteSelected()
{
    if (!ensureStopped()) return;
    const QList<ProjectNode *> nodes = selectedNodes();
    if (nodes.isEmpty()) return;

    const QString what = nodes.size() == 1 ? QString("'%1'").arg(nodes.first()->name())
                                           : tr("%1 items").arg(nodes.size());
    if (QMessageBox::question(this, tr("Delete"), tr("Delete %1?").arg(what)) != QMessageBox::Yes) return;

    m_monitorModel->clear();
    for (ProjectNode *node : nodes) m_treeModel->removeNode(node);
    setDirty(true);
    updateActions();
}

// ---------------------------------------------------------------------------
// Runtime

void MainWindow::startRuntime()
{
    if (m_runtime->isRunning()) return;

    QString error;
    const bool opcUaEnabled = m_opcUaEnabledAction->isChecked();
    modua::OpcUaSettings settings;
    if (opcUaEnabled && !modua::OpcUaSettings::fromJson(m_opcua, settings, error)) {
        QMessageBox::critical(this, tr("Start Failed"), tr("Invalid OPC UA settings: %1").arg(error));
        return;
    }
    m_runtime->setOpcUa(settings, opcUaEnabled, QDir(m_dataRoot).filePath("certs"));

    m_buffer->clear();
    m_connections.clear();
    if (!m_runtime->start(*m_treeModel->root(), error)) {
        QMessageBox::critical(this, tr("Start Failed"), error);
        return;
    }

    const QStringList warnings = m_runtime->warnings();
    if (!warnings.isEmpty()) {
        QMessageBox::warning(this, tr("Runtime Warnings"),
                             tr("Some tags were skipped:") + "\n" + warnings.join('\n'));
    }
    statusBar()->showMessage(tr("Runtime started"), 3000);
}

void MainWindow::stopRuntime()
{
    m_runtime->stop();
    statusBar()->showMessage(tr("Runtime stopped"), 3000);
}

void MainWindow::onRunningChanged(bool running)
{
    if (running) {
        m_refreshTimer->start();
    } else {
        m_refreshTimer->stop();
        m_connections.clear();
        m_connectionLabel->clear();
    }
    m_monitorModel->refresh();
    updateActions();
}

void MainWindow::onConnectionStateChanged(const QString &configId, bool connected)
{
    m_connections[configId] = connected;

    int online = 0;
    for (auto it = m_connections.constBegin(); it != m_connections.constEnd(); ++it) {
        if (it.value()) ++online;
    }
    m_connectionLabel->setText(tr("Devices online: %1/%2").arg(online).arg(m_connections.size()));
    statusBar()->showMessage(connected ? tr("%1 connected").arg(configId)
                                       : tr("%1 disconnected").arg(configId), 3000);
}

void MainWindow::editOpcUaSettings()
{
    OpcUaDialog dialog(this);
    dialog.loadData(m_opcua);
    if (dialog.exec() != QDialog::Accepted) return;

    m_opcua = dialog.getData();
    setDirty(true);
    if (m_runtime->isRunning()) {
        statusBar()->showMessage(tr("OPC UA settings take effect on the next start"), 5000);
    }
}

void MainWindow::openTerminal()
{
    ProjectNode *device = selectedAncestor(ProjectNode::Kind::Device);
    if (!device) return;

    const QString configId = modua::configIdFor(device);
    QPointer<TerminalWindow> terminal = m_terminals.value(configId);
    if (!terminal) {
        terminal = new TerminalWindow(m_diagnostics.get(), configId, this);
        connect(terminal, &TerminalWindow::onlyTxRxChanged, this, [this](bool enabled) {
            m_config.onlyTxRx = enabled;
        });
        m_terminals.insert(configId, terminal);
    }
    terminal->show();
    terminal->raise();
    terminal->activateWindow();
}

void MainWindow::about()
{
    QMessageBox::about(this, tr("About ModUA"),
                       tr("<h3>ModUA %1</h3>"
                          "<p>Modbus to OPC UA gateway configuration and runtime.</p>")
                           .arg(QCoreApplication::applicationVersion()));
}

// ---------------------------------------------------------------------------
// Tree & monitor

void MainWindow::onSelectionChanged()
{
    ProjectNode *node = currentNode();
    const ProjectNode *source = nullptr;
    if (node) {
        switch (node->kind()) {
        case ProjectNode::Kind::Device:
        case ProjectNode::Kind::Group:
            source = node;
            break;
        case ProjectNode::Kind::Tag:
            source = node->parent();
            break;
        default:
            break;
        }
    }
    m_monitorModel->setDevice(source);
    m_monitorView->resizeColumnsToContents();
    updateActions();
}

void MainWindow::onTreeDoubleClicked(const QModelIndex &index)
{
    if (!ensureStopped()) return;
    if (ProjectNode *node = m_treeModel->nodeFromIndex(index)) editNode(node);
}

void MainWindow::onMonitorDoubleClicked(const QModelIndex &index)
{
    if (!index.isValid()) return;
    const int row = index.row();
    if (m_monitorModel->accessAt(row) != modua::kAccessReadWrite) return;
    if (!m_runtime->isRunning()) {
        statusBar()->showMessage(tr("Start the runtime to write values"), 5000);
        return;
    }

    const QString path = m_monitorModel->pathAt(row);
    const ProjectNode *tag = m_treeModel->findByPath(path);
    const QString dataType = effectiveDataType(tag, m_monitorModel->dataTypeAt(row));

    WriteValueDialog dialog(path, dataType, m_monitorModel->accessAt(row), m_monitorModel->valueAt(row), this);
    if (dialog.exec() != QDialog::Accepted) return;

    QString error;
    if (!m_runtime->writeTag(path, dialog.value(), error)) {
        QMessageBox::warning(this, tr("Write Failed"), error);
        return;
    }
    statusBar()->showMessage(tr("Write queued for %1").arg(path), 3000);
}

void MainWindow::showTreeContextMenu(const QPoint &pos)
{
    const QModelIndex index = m_tree->indexAt(pos);
    if (!index.isValid()) m_tree->setCurrentIndex(QModelIndex());

    QMenu menu(this);
    ProjectNode *node = m_treeModel->nodeFromIndex(index);
    if (!node) {
        menu.addAction(m_addChannelAction);
        menu.addAction(m_pasteAction);
    } else {
        switch (node->kind()) {
        case ProjectNode::Kind::Channel:
            menu.addAction(m_addDeviceAction);
            break;
        case ProjectNode::Kind::Device:
            menu.addAction(m_addGroupAction);
            menu.addAction(m_addTagAction);
            menu.addSeparator();
            menu.addAction(m_importCsvAction);
            menu.addAction(m_exportCsvAction);
            menu.addAction(m_terminalAction);
            break;
        case ProjectNode::Kind::Group:
            menu.addAction(m_addGroupAction);
            menu.addAction(m_addTagAction);
            break;
        default:
            break;
        }
        menu.addSeparator();
        menu.addAction(m_copyAction);
        menu.addAction(m_cutAction);
        menu.addAction(m_pasteAction);
        menu.addAction(m_deleteAction);
        menu.addSeparator();
        menu.addAction(m_propertiesAction);
    }
    menu.exec(m_tree->viewport()->mapToGlobal(pos));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (!maybeSave()) {
        event->ignore();
        return;
    }

    m_refreshTimer->stop();
    m_runtime->stop();
    saveWindowState();
    event->accept();
}
