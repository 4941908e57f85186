#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>

#include "modua/modbus/modbus_types.h"
#include "modua/modua_export.h"

class QIODevice;

namespace modua::modbus {

/**
 * Modbus 请求结果
 */
struct MODUA_API ModbusResult {
    bool success = false;
    ExceptionCode exception = ExceptionCode::None;
    QString errorMessage;
    QVector<bool> coils;
    QVector<uint16_t> registers;
};

/**
 * 串口参数
 */
struct MODUA_API SerialParams {
    QString portName;
    int baudRate = 9600;
    int dataBits = 8;
    QString parity = "None";     // None / Odd / Even
    QString stopBits = "1";      // 1 / 2
    QString flowControl = "None";
};

/**
 * Modbus 传输层基类
 *
 * 基类负责 PDU 的组装与解析，子类只负责帧封装与收发：
 * - ModbusTcpTransport:       MBAP 头
 * - ModbusRtuOverTcpTransport: RTU 帧 (CRC16) 走 TCP
 * - ModbusRtuSerialTransport:  RTU 帧走串口
 *
 * 所有 IO 为阻塞调用，应在工作线程中使用。
 */
class MODUA_API ModbusTransport {
public:
    /** ADU 跟踪回调：direction 为 "TX" 或 "RX"，fc 无法识别时为 -1 */
    using TraceCallback = std::function<void(const QString& direction, const QByteArray& adu, int fc)>;

    virtual ~ModbusTransport() = default;

    virtual bool open(QString& error) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;
    virtual QString description() const = 0;

    void setTimeout(int ms) { m_timeout = ms; }
    int timeout() const { return m_timeout; }
    void setTraceCallback(TraceCallback cb) { m_trace = std::move(cb); }

    // 功能码 0x01 / 0x02 / 0x03 / 0x04
    ModbusResult readCoils(uint8_t unitId, uint16_t address, uint16_t count);
    ModbusResult readDiscreteInputs(uint8_t unitId, uint16_t address, uint16_t count);
    ModbusResult readHoldingRegisters(uint8_t unitId, uint16_t address, uint16_t count);
    ModbusResult readInputRegisters(uint8_t unitId, uint16_t address, uint16_t count);

    // 功能码 0x05 / 0x06 / 0x0F / 0x10
    ModbusResult writeSingleCoil(uint8_t unitId, uint16_t address, bool value);
    ModbusResult writeSingleRegister(uint8_t unitId, uint16_t address, uint16_t value);
    ModbusResult writeMultipleCoils(uint8_t unitId, uint16_t address, const QVector<bool>& values);
    ModbusResult writeMultipleRegisters(uint8_t unitId, uint16_t address, const QVector<uint16_t>& values);

    ModbusResult read(FunctionCode fc, uint8_t unitId, uint16_t address, uint16_t count);

    // PDU 工具（公开用于测试）
    static QByteArray buildReadPdu(FunctionCode fc, uint16_t address, uint16_t count);
    static QByteArray buildWriteCoilsPdu(uint16_t address, const QVector<bool>& values);
    static QByteArray buildWriteRegistersPdu(uint16_t address, const QVector<uint16_t>& values);
    /** quantity 为请求的位数或寄存器数，字节数与之不符时判为失败 */
    static ModbusResult parseResponsePdu(const QByteArray& pdu, FunctionCode expected, uint16_t quantity);

protected:
    /**
     * 发送请求 PDU（功能码 + 数据），返回响应 PDU
     * 失败时返回空并设置 error
     */
    virtual QByteArray transact(uint8_t unitId, const QByteArray& pdu, QString& error) = 0;

    /** fcOffset 为功能码在 ADU 中的位置：MBAP 为 7，RTU 为 1 */
    void trace(const QString& direction, const QByteArray& adu, int fcOffset) const;

    int m_timeout = 1000;

private:
    ModbusResult execute(uint8_t unitId, FunctionCode fc, const QByteArray& pdu, uint16_t quantity);

    TraceCallback m_trace;
};

/**
 * RTU 帧工具
 */
class MODUA_API RtuFrame {
public:
    static uint16_t calculateCRC16(const QByteArray& data);
    static QByteArray build(uint8_t unitId, const QByteArray& pdu);
    static bool verifyCRC(const QByteArray& frame);
    /**
     * 根据已收到的字节推断完整响应帧长度；信息不足时返回 -1
     */
    static int expectedLength(const QByteArray& partial);
    /** T3.5 帧间隔（毫秒），19200 以上固定 1.75ms */
    static double calculateT35(int baudRate, int dataBits, bool hasParity, double stopBits);
};

class MODUA_API ModbusTcpTransport : public ModbusTransport {
public:
    ModbusTcpTransport(const QString& host, quint16 port);
    ~ModbusTcpTransport() override;

    bool open(QString& error) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

    static QByteArray buildMbap(uint16_t transactionId, uint8_t unitId, const QByteArray& pdu);
    /** 校验 MBAP 头（事务号、协议号、单元号）并返回 PDU，失败返回空 */
    static QByteArray unwrapMbap(const QByteArray& response, uint16_t transactionId, uint8_t unitId,
                                 QString& error);

protected:
    QByteArray transact(uint8_t unitId, const QByteArray& pdu, QString& error) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

class MODUA_API ModbusRtuOverTcpTransport : public ModbusTransport {
public:
    ModbusRtuOverTcpTransport(const QString& host, quint16 port);
    ~ModbusRtuOverTcpTransport() override;

    bool open(QString& error) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

protected:
    QByteArray transact(uint8_t unitId, const QByteArray& pdu, QString& error) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

class MODUA_API ModbusRtuSerialTransport : public ModbusTransport {
public:
    explicit ModbusRtuSerialTransport(const SerialParams& params);
    ~ModbusRtuSerialTransport() override;

    bool open(QString& error) override;
    void close() override;
    bool isOpen() const override;
    QString description() const override;

protected:
    QByteArray transact(uint8_t unitId, const QByteArray& pdu, QString& error) override;

private:
    struct Impl;
    std::unique_ptr<Impl> d;
};

/**
 * 从 RTU 字节流读取完整帧
 */
MODUA_API QByteArray readRtuFrame(QIODevice* device, int timeoutMs, QString& error);

/**
 * ADU 十六进制格式："01 03 00 00 00 01"
 */
MODUA_API QString formatAduHex(const QByteArray& adu);

} // namespace modua::modbus
