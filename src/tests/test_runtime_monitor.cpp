#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>

#include "helpers/fake_modbus_transport.h"
#include "modua/runtime/data_buffer.h"
#include "modua/runtime/diagnostics.h"
#include "modua/runtime/poll_worker.h"
#include "modua/runtime/runtime_monitor.h"

using namespace modua;
using Kind = ProjectNode::Kind;

namespace {

ProjectNode* addTag(ProjectNode* parent, const QString& name, const QString& type, const QString& address,
                    const QString& access = "Read/Write") {
    const QJsonObject cfg{{"general", QJsonObject{{"name", name}, {"data_type", type}, {"address", address},
                                                  {"access", access}, {"scan_rate", 20}}}};
    return parent->addChild(std::make_unique<ProjectNode>(Kind::Tag, name, cfg));
}

} // namespace

class RuntimeMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        static int argc = 1;
        static char arg0[] = "test";
        static char* argv[] = {arg0};
        if (!QCoreApplication::instance()) {
            new QCoreApplication(argc, argv);
        }

        const QJsonObject channelCfg{
            {"general", QJsonObject{{"channel_name", "Ch1"}}},
            {"driver", QJsonObject{{"type", "Modbus TCP/IP Ethernet"},
                                   {"params", QJsonObject{{"ip", "127.0.0.1"}, {"port", 502}}}}}};
        ProjectNode* channel = root.addChild(std::make_unique<ProjectNode>(Kind::Channel, "Ch1", channelCfg));
        ProjectNode* device = channel->addChild(std::make_unique<ProjectNode>(
            Kind::Device, "Dev1", QJsonObject{{"general", QJsonObject{{"name", "Dev1"}, {"device_id", 1}}}}));
        ProjectNode* group = device->addChild(std::make_unique<ProjectNode>(
            Kind::Group, "Pumps", QJsonObject{{"general", QJsonObject{{"name", "Pumps"}}}}));
        addTag(device, "Speed", "Word", "400000");
        addTag(group, "Running", "Boolean", "000001");
        addTag(device, "Broken", "Word", "4000x0");
        addTag(device, "Temp", "Short", "300004", "Read Only");

        slave = std::make_shared<FakeModbusTransport::Slave>();
        slave->holding[0] = 1500;
        slave->coils[1] = true;
        slave->input[4] = 0xFFF6;
    }

    void TearDown() override {
        monitor.stop();
    }

    void useFakeTransport() {
        monitor.setTransportFactory([this](const modbus::ChannelSettings&, QString&) {
            return std::unique_ptr<modbus::ModbusTransport>(new FakeModbusTransport(slave));
        });
    }

    bool waitFor(const std::function<bool()>& condition, int timeoutMs = 3000) {
        QElapsedTimer timer;
        timer.start();
        while (!condition() && timer.elapsed() < timeoutMs) {
            QCoreApplication::processEvents(QEventLoop::AllEvents, 20);
            QThread::msleep(10);
        }
        return condition();
    }

    ProjectNode root{Kind::Root};
    DataBuffer buffer;
    DiagnosticsManager diagnostics;
    RuntimeMonitor monitor{&buffer, &diagnostics};
    std::shared_ptr<FakeModbusTransport::Slave> slave;
};

TEST_F(RuntimeMonitorTest, CollectsDeviceGroups) {
    QStringList warnings;
    const QList<DeviceGroup> groups = RuntimeMonitor::collectDeviceGroups(root, warnings);
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups[0].configId, "Ch1_Dev1");
    EXPECT_EQ(groups[0].tags.size(), 3);
    EXPECT_EQ(groups[0].dataTypes.value("Ch1.Dev1.Pumps.Running"), "Boolean");
    ASSERT_EQ(warnings.size(), 1);
    EXPECT_TRUE(warnings[0].startsWith("Ch1.Dev1.Broken"));
}

TEST_F(RuntimeMonitorTest, CollectsOpcUaVariables) {
    const QList<OpcUaVariable> vars = RuntimeMonitor::collectOpcUaVariables(root);
    ASSERT_EQ(vars.size(), 4);
    EXPECT_EQ(vars[0].path, "Ch1.Dev1.Pumps.Running");
    EXPECT_EQ(vars[0].folders, (QStringList{"Ch1", "Dev1", "Pumps"}));
    EXPECT_EQ(vars[0].type, OpcUaType::Boolean);
    EXPECT_EQ(vars[3].accessLevel, kAccessRead);
    EXPECT_EQ(vars[3].type, OpcUaType::Int16);
}

TEST_F(RuntimeMonitorTest, StartFailsWithoutTags) {
    ProjectNode empty(Kind::Root);
    QString error;
    EXPECT_FALSE(monitor.start(empty, error));
    EXPECT_FALSE(monitor.isRunning());
}

TEST_F(RuntimeMonitorTest, StartFailsWhenTransportCannotBeCreated) {
    monitor.setTransportFactory([](const modbus::ChannelSettings&, QString& error) {
        error = "no port";
        return std::unique_ptr<modbus::ModbusTransport>();
    });
    QString error;
    EXPECT_FALSE(monitor.start(root, error));
    EXPECT_EQ(error, "Ch1_Dev1: no port");
    EXPECT_TRUE(monitor.configIds().isEmpty());
}

TEST_F(RuntimeMonitorTest, PollsIntoBufferAndWritesThrough) {
    useFakeTransport();
    QStringList running;
    QObject::connect(&monitor, &RuntimeMonitor::runningChanged,
                     [&running](bool r) { running << (r ? "on" : "off"); });

    QString error;
    ASSERT_TRUE(monitor.start(root, error)) << qPrintable(error);
    EXPECT_TRUE(monitor.isRunning());
    EXPECT_EQ(monitor.configIds(), QStringList{"Ch1_Dev1"});
    ASSERT_NE(monitor.worker("Ch1_Dev1"), nullptr);
    EXPECT_EQ(monitor.warnings().size(), 1);
    EXPECT_FALSE(monitor.start(root, error));

    ASSERT_TRUE(waitFor([this]() {
        TagSnapshot s;
        return buffer.tagData("Ch1.Dev1.Temp", s) && s.quality == "Good" && buffer.tagData("Ch1.Dev1.Speed", s)
            && s.quality == "Good";
    }));
    EXPECT_EQ(buffer.tagValue("Ch1.Dev1.Speed").toInt(), 1500);
    EXPECT_EQ(buffer.tagValue("Ch1.Dev1.Temp").toInt(), -10);
    EXPECT_TRUE(buffer.tagValue("Ch1.Dev1.Pumps.Running").toBool());

    TagSnapshot info;
    ASSERT_TRUE(buffer.tagData("Ch1.Dev1.Temp", info));
    EXPECT_EQ(info.dataType, "Short");
    EXPECT_EQ(info.access, "Read Only");
    EXPECT_GE(info.updateCount, 1);

    EXPECT_FALSE(monitor.writeTag("Ch1.Dev1.Temp", 1, error));
    EXPECT_FALSE(monitor.writeTag("Ch1.Dev1.Unknown", 1, error));
    ASSERT_TRUE(monitor.writeTag("Ch1.Dev1.Speed", 42, error)) << qPrintable(error);
    EXPECT_TRUE(waitFor([this]() {
        QMutexLocker lock(&slave->mutex);
        return slave->holding[0] == 42;
    }));

    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
    EXPECT_TRUE(monitor.configIds().isEmpty());
    EXPECT_EQ(running, (QStringList{"on", "off"}));
}
