#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QThread>
#include <QVariant>
#include <QVector>
#include <atomic>
#include <memory>

#include "modua/modbus/modbus_transport.h"
#include "modua/modbus/read_planner.h"
#include "modua/modbus/tag_definition.h"
#include "modua/modbus/transport_factory.h"
#include "modua/modbus/value_codec.h"
#include "modua/modbus/write_queue.h"
#include "modua/modua_export.h"

namespace modua {

class DiagnosticsManager;

/**
 * 单个 (通道, 设备) 的轮询线程
 *
 * 每个标签有独立的下次到期时间；每轮收集到期标签，合并为批量读取，
 * 解码并缩放后发出 tagPolled。写请求进入写队列，按占空比穿插在读之间执行。
 */
class MODUA_API PollWorker : public QObject {
    Q_OBJECT

public:
    PollWorker(const QString& configId,
               std::unique_ptr<modbus::ModbusTransport> transport,
               const modbus::DeviceSettings& device,
               const QVector<modbus::TagDefinition>& tags,
               QObject* parent = nullptr);
    ~PollWorker() override;

    PollWorker(const PollWorker&) = delete;
    PollWorker& operator=(const PollWorker&) = delete;

    QString configId() const { return m_configId; }
    const QVector<modbus::TagDefinition>& tags() const { return m_tags; }
    bool hasTag(const QString& path) const;

    void setDiagnostics(DiagnosticsManager* diagnostics);
    void setDutyCycleRatio(int ratio) { m_dutyCycleRatio = qMax(1, ratio); }

    void start();
    void stop();
    bool isRunning() const { return m_thread != nullptr; }

    /**
     * 将工程量写入标签；值经反向缩放、编码后入队
     */
    bool requestWrite(const QString& path, const QVariant& value, QString& error);

    modbus::WriteQueue& writeQueue() { return m_writeQueue; }

    /**
     * 执行一轮轮询（在工作线程中调用，测试可直接调用）
     */
    void runCycle();

    /**
     * 根据标签和设备设置构建写请求并选择功能码
     * - 布尔: FC5，func_05 禁用时 FC15
     * - 寄存器: func_06 启用且值只占一个寄存器时 FC6，否则 FC16
     */
    static bool buildWriteRequest(const modbus::TagDefinition& tag,
                                  const modbus::DeviceSettings& device,
                                  const QVariant& value,
                                  modbus::WriteRequest& out,
                                  QString& error);

signals:
    void tagPolled(const QString& path, const QVariant& value, const QString& quality);
    void connectionStateChanged(const QString& configId, bool connected);

private:
    void run();
    bool ensureConnected();
    bool readBatch(const modbus::ReadBatch& batch, modbus::ModbusResult& result);
    modbus::ModbusResult readWithRetry(modbus::FunctionCode fc, int start, int count);
    void publishBatch(const modbus::ReadBatch& batch, const modbus::ModbusResult& result);
    void markBatchBad(const modbus::ReadBatch& batch);
    void executePendingWrites();
    modbus::ModbusResult executeWrite(const modbus::WriteRequest& request);
    void reschedule(int tagIndex);
    void diagnostic(const QString& text, const QString& direction = QString(), int fc = -1,
                    int length = 0) const;
    void sleepFor(int ms) const;

    QString m_configId;
    std::unique_ptr<modbus::ModbusTransport> m_transport;
    modbus::DeviceSettings m_device;
    modbus::ValueCodec m_codec;
    QVector<modbus::TagDefinition> m_tags;
    QVector<qint64> m_nextDue;
    modbus::WriteQueue m_writeQueue;
    DiagnosticsManager* m_diagnostics = nullptr;
    int m_dutyCycleRatio;
    int m_readCount = 0;
    bool m_connected = false;
    QElapsedTimer m_clock;

    QThread* m_thread = nullptr;
    std::atomic<bool> m_stopped{false};
};

} // namespace modua
