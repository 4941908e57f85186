#include "poll_worker.h"

#include <QDebug>

#include "modua/core/constants.h"
#include "modua/modbus/scaling.h"
#include "modua/runtime/diagnostics.h"

namespace modua {

using namespace modbus;

namespace {

const QString kQualityGood = QStringLiteral("Good");
const QString kQualityBad = QStringLiteral("Bad");

} // namespace

PollWorker::PollWorker(const QString& configId,
                       std::unique_ptr<ModbusTransport> transport,
                       const DeviceSettings& device,
                       const QVector<TagDefinition>& tags,
                       QObject* parent)
    : QObject(parent)
    , m_configId(configId)
    , m_transport(std::move(transport))
    , m_device(device)
    , m_codec(device.encoding)
    , m_tags(tags)
    , m_nextDue(tags.size(), 0)
    , m_writeQueue(kWriteQueueMaxPending)
    , m_dutyCycleRatio(kDutyCycleRatio)
{
    m_clock.start();

    m_transport->setTraceCallback([this](const QString& direction, const QByteArray& adu, int fc) {
        diagnostic(QString("[ADU] %1: | %2 |").arg(direction, formatAduHex(adu)), direction, fc, adu.size());
    });
    m_writeQueue.setDiagnosticSink([this](const QString& text) { diagnostic(text); });
}

PollWorker::~PollWorker()
{
    stop();
}

bool PollWorker::hasTag(const QString& path) const
{
    for (const TagDefinition& tag : m_tags) {
        if (tag.path == path) return true;
    }
    return false;
}

void PollWorker::setDiagnostics(DiagnosticsManager* diagnostics)
{
    m_diagnostics = diagnostics;
}

void PollWorker::diagnostic(const QString& text, const QString& direction, int fc, int length) const
{
    if (!m_diagnostics) return;
    DiagnosticContext ctx;
    ctx.configId = m_configId;
    ctx.direction = direction;
    ctx.functionCode = fc;
    ctx.unitId = m_device.unitId;
    ctx.length = length;
    m_diagnostics->publish(text, ctx);
}

void PollWorker::start()
{
    if (m_thread) return;
    m_stopped.store(false);

    m_thread = new QThread();
    QObject::connect(m_thread, &QThread::started, [this]() { run(); });
    m_thread->start();
}

void PollWorker::stop()
{
    m_stopped.store(true);

    if (m_thread) {
        m_thread->quit();
        // run() 在当前 IO 超时或一次休眠片段内退出
        m_thread->wait();
        delete m_thread;
        m_thread = nullptr;
    }
}

void PollWorker::sleepFor(int ms) const
{
    int remaining = ms;
    while (remaining > 0 && !m_stopped.load()) {
        const int slice = qMin(remaining, 50);
        QThread::msleep(static_cast<unsigned long>(slice));
        remaining -= slice;
    }
}

void PollWorker::run()
{
    qInfo().noquote() << "PollWorker" << m_configId << "started with" << m_tags.size() << "tag(s)";
    while (!m_stopped.load()) {
        runCycle();
        sleepFor(kCycleSleepMs);
    }
    // 传输对象的套接字属于本线程，在此关闭
    m_transport->close();
    if (m_connected) {
        m_connected = false;
        emit connectionStateChanged(m_configId, false);
    }
    qInfo().noquote() << "PollWorker" << m_configId << "stopped";
}

bool PollWorker::ensureConnected()
{
    if (m_transport->isOpen()) return true;

    if (m_connected) {
        m_connected = false;
        emit connectionStateChanged(m_configId, false);
    }

    const int attempts = qMax(1, m_device.timing.connectAttempts);
    QString error;
    m_transport->setTimeout(qMax(1, m_device.timing.connectTimeoutSec) * 1000);
    for (int attempt = 1; attempt <= attempts && !m_stopped.load(); ++attempt) {
        if (m_transport->open(error)) {
            m_transport->setTimeout(m_device.timing.requestTimeoutMs);
            m_connected = true;
            diagnostic(QString("CONNECTED: %1 (attempt %2/%3)")
                           .arg(m_transport->description()).arg(attempt).arg(attempts));
            emit connectionStateChanged(m_configId, true);
            return true;
        }
    }
    m_transport->setTimeout(m_device.timing.requestTimeoutMs);
    qWarning().noquote() << m_configId << "connection failed:" << error;
    diagnostic(QString("CONNECTION_FAILED: %1 after %2 attempts: %3")
                   .arg(m_transport->description()).arg(attempts).arg(error));
    return false;
}

void PollWorker::reschedule(int tagIndex)
{
    m_nextDue[tagIndex] = m_clock.elapsed() + m_tags[tagIndex].scanRateMs;
}

void PollWorker::runCycle()
{
    const qint64 now = m_clock.elapsed();
    QVector<int> due;
    for (int i = 0; i < m_tags.size(); ++i) {
        if (m_nextDue[i] <= now) due.append(i);
    }

    if (!due.isEmpty()) {
        if (!ensureConnected()) {
            for (int idx : due) {
                emit tagPolled(m_tags[idx].path, QVariant(), kQualityBad);
                m_nextDue[idx] = m_clock.elapsed() + kFailureBackoffMs;
            }
            return;
        }

        const QVector<ReadBatch> batches = planReads(m_tags, due, m_device.blockSizes);
        for (int b = 0; b < batches.size() && !m_stopped.load(); ++b) {
            const ReadBatch& batch = batches[b];
            ModbusResult result;
            if (readBatch(batch, result)) {
                publishBatch(batch, result);
            } else {
                qWarning().noquote() << QString("%1 batch read failed (fc=%2 start=%3 count=%4): %5")
                                            .arg(m_configId)
                                            .arg(static_cast<int>(batch.function))
                                            .arg(batch.start)
                                            .arg(batch.count)
                                            .arg(result.errorMessage);
                diagnostic(QString("READ_FAILED fc=%1 start=%2 count=%3: %4")
                               .arg(static_cast<int>(batch.function))
                               .arg(batch.start)
                               .arg(batch.count)
                               .arg(result.errorMessage));
                markBatchBad(batch);
                sleepFor(kFailureBackoffMs);
                if (!m_transport->isOpen()) break;
                continue;
            }

            // 占空比：每 N 次读之后执行一批写
            ++m_readCount;
            if (m_readCount >= m_dutyCycleRatio && !m_writeQueue.isEmpty()) {
                executePendingWrites();
                m_readCount = 0;
            }

            if (b < batches.size() - 1 && m_device.timing.interRequestDelayMs > 0) {
                sleepFor(m_device.timing.interRequestDelayMs);
            }
        }
    }

    // 没有到期的读时也要处理写队列
    if (!m_writeQueue.isEmpty() && !m_stopped.load() && ensureConnected()) {
        executePendingWrites();
    }
}

ModbusResult PollWorker::readWithRetry(FunctionCode fc, int start, int count)
{
    const int attempts = qMax(1, m_device.timing.attemptsBeforeTimeout);
    ModbusResult result;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        result = m_transport->read(fc, static_cast<uint8_t>(m_device.unitId),
                                   static_cast<uint16_t>(start), static_cast<uint16_t>(count));
        // 异常响应是设备的明确答复，重试无意义
        if (result.success || result.exception != ExceptionCode::None) return result;
        if (attempt < attempts && !m_stopped.load()) sleepFor(kRetryDelayMs);
    }
    return result;
}

bool PollWorker::readBatch(const ReadBatch& batch, ModbusResult& result)
{
    // 超过块大小的单个标签分段读取
    const int limit = qMax(1, m_device.blockSizes.limitFor(batch.type));
    result = ModbusResult();
    result.success = true;

    for (int offset = 0; offset < batch.count; offset += limit) {
        const int count = qMin(limit, batch.count - offset);
        const ModbusResult part = readWithRetry(batch.function, batch.start + offset, count);
        if (!part.success) {
            result = part;
            return false;
        }
        // 短响应会使合并批次中后续标签整体错位
        const int received = isBitAddress(batch.type) ? part.coils.size() : part.registers.size();
        if (received != count) {
            result = ModbusResult();
            result.errorMessage = QString("Short reply: %1 of %2 values at %3")
                                      .arg(received).arg(count).arg(batch.start + offset);
            return false;
        }
        if (isBitAddress(batch.type)) {
            result.coils += part.coils.mid(0, count);
        } else {
            result.registers += part.registers;
        }
    }
    return true;
}

void PollWorker::publishBatch(const ReadBatch& batch, const ModbusResult& result)
{
    for (int idx : batch.tagIndices) {
        const TagDefinition& tag = m_tags[idx];
        const int offset = tag.wire - batch.start;
        const int count = tag.type.isArray ? tag.elementCount() : 0;

        QVariant raw;
        if (tag.isBitArea()) {
            raw = m_codec.decodeBits(result.coils, offset, count);
        } else {
            raw = m_codec.decodeRegisters(tag.type, result.registers, offset, count);
        }

        if (raw.isValid()) {
            emit tagPolled(tag.path, applyScaling(raw, tag.scaling), kQualityGood);
        } else {
            diagnostic(QString("DECODE_FAILED %1 offset=%2").arg(tag.path).arg(offset));
            emit tagPolled(tag.path, QVariant(), kQualityBad);
        }
        reschedule(idx);
    }
}

void PollWorker::markBatchBad(const ReadBatch& batch)
{
    for (int idx : batch.tagIndices) {
        emit tagPolled(m_tags[idx].path, QVariant(), kQualityBad);
        reschedule(idx);
    }
}

bool PollWorker::buildWriteRequest(const TagDefinition& tag, const DeviceSettings& device,
                                   const QVariant& value, WriteRequest& out, QString& error)
{
    if (!tag.readWrite) {
        error = QString("tag %1 is read only").arg(tag.path);
        return false;
    }

    WriteRequest request;
    request.tagPath = tag.path;
    request.unitId = device.unitId;
    request.address = tag.wire;

    const ValueCodec codec(device.encoding);
    const QVariant raw = reverseScaling(value, tag.scaling, tag.type);

    if (tag.isBitArea()) {
        if (!codec.encodeBits(raw, request.bits, error)) return false;
        if (tag.type.isArray && request.bits.size() != tag.elementCount()) {
            error = QString("tag %1 expects %2 values, got %3")
                        .arg(tag.path).arg(tag.elementCount()).arg(request.bits.size());
            return false;
        }
        request.function = (request.bits.size() == 1 && device.dataAccess.func05)
            ? FunctionCode::WriteSingleCoil
            : FunctionCode::WriteMultipleCoils;
    } else {
        if (!codec.encodeRegisters(tag.type, raw, request.registers, error)) return false;
        if (tag.type.isArray && request.registers.size() != tag.span()) {
            error = QString("tag %1 expects %2 registers, got %3")
                        .arg(tag.path).arg(tag.span()).arg(request.registers.size());
            return false;
        }
        if (device.dataAccess.func06 && request.registers.size() == 1) {
            request.function = FunctionCode::WriteSingleRegister;
        } else {
            if (device.dataAccess.func06) {
                qWarning().noquote() << QString("%1: value needs %2 registers, FC6 not applicable, using FC16")
                                            .arg(tag.path).arg(request.registers.size());
            }
            request.function = FunctionCode::WriteMultipleRegisters;
        }
    }

    out = request;
    error.clear();
    return true;
}

bool PollWorker::requestWrite(const QString& path, const QVariant& value, QString& error)
{
    for (const TagDefinition& tag : m_tags) {
        if (tag.path != path) continue;
        WriteRequest request;
        if (!buildWriteRequest(tag, m_device, value, request, error)) return false;
        if (!m_writeQueue.enqueue(request)) {
            error = QString("write queue full (%1 pending)").arg(m_writeQueue.size());
            return false;
        }
        return true;
    }
    error = QString("tag %1 not handled by %2").arg(path, m_configId);
    return false;
}

ModbusResult PollWorker::executeWrite(const WriteRequest& request)
{
    const auto unit = static_cast<uint8_t>(request.unitId);
    const auto address = static_cast<uint16_t>(request.address);
    switch (request.function) {
    case FunctionCode::WriteSingleCoil:
        return m_transport->writeSingleCoil(unit, address, request.bits.value(0));
    case FunctionCode::WriteMultipleCoils:
        return m_transport->writeMultipleCoils(unit, address, request.bits);
    case FunctionCode::WriteSingleRegister:
        return m_transport->writeSingleRegister(unit, address, request.registers.value(0));
    case FunctionCode::WriteMultipleRegisters:
        return m_transport->writeMultipleRegisters(unit, address, request.registers);
    default:
        return ModbusResult{false, ExceptionCode::IllegalFunction, "Not a write function code", {}, {}};
    }
}

void PollWorker::executePendingWrites()
{
    const QVector<WriteRequest> batch = m_writeQueue.takeBatch(kWriteBatchSize);
    for (const WriteRequest& request : batch) {
        if (m_stopped.load()) return;
        const ModbusResult result = executeWrite(request);
        if (result.success) {
            m_writeQueue.markCompleted(request);
            // 写成功后立即回读
            for (int i = 0; i < m_tags.size(); ++i) {
                if (m_tags[i].path == request.tagPath) m_nextDue[i] = 0;
            }
        } else {
            m_writeQueue.markFailed(request, result.errorMessage);
        }
    }
}

} // namespace modua
