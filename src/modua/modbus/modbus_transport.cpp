#include "modbus_transport.h"

#include <QDataStream>
#include <QElapsedTimer>
#include <QIODevice>

namespace modua::modbus {

// CRC16 查找表（Modbus 标准多项式 0xA001）
static const uint16_t crc16Table[256] = {
    0x0000, 0xC0C1, 0xC181, 0x0140, 0xC301, 0x03C0, 0x0280, 0xC241,
    0xC601, 0x06C0, 0x0780, 0xC741, 0x0500, 0xC5C1, 0xC481, 0x0440,
    0xCC01, 0x0CC0, 0x0D80, 0xCD41, 0x0F00, 0xCFC1, 0xCE81, 0x0E40,
    0x0A00, 0xCAC1, 0xCB81, 0x0B40, 0xC901, 0x09C0, 0x0880, 0xC841,
    0xD801, 0x18C0, 0x1980, 0xD941, 0x1B00, 0xDBC1, 0xDA81, 0x1A40,
    0x1E00, 0xDEC1, 0xDF81, 0x1F40, 0xDD01, 0x1DC0, 0x1C80, 0xDC41,
    0x1400, 0xD4C1, 0xD581, 0x1540, 0xD701, 0x17C0, 0x1680, 0xD641,
    0xD201, 0x12C0, 0x1380, 0xD341, 0x1100, 0xD1C1, 0xD081, 0x1040,
    0xF001, 0x30C0, 0x3180, 0xF141, 0x3300, 0xF3C1, 0xF281, 0x3240,
    0x3600, 0xF6C1, 0xF781, 0x3740, 0xF501, 0x35C0, 0x3480, 0xF441,
    0x3C00, 0xFCC1, 0xFD81, 0x3D40, 0xFF01, 0x3FC0, 0x3E80, 0xFE41,
    0xFA01, 0x3AC0, 0x3B80, 0xFB41, 0x3900, 0xF9C1, 0xF881, 0x3840,
    0x2800, 0xE8C1, 0xE981, 0x2940, 0xEB01, 0x2BC0, 0x2A80, 0xEA41,
    0xEE01, 0x2EC0, 0x2F80, 0xEF41, 0x2D00, 0xEDC1, 0xEC81, 0x2C40,
    0xE401, 0x24C0, 0x2580, 0xE541, 0x2700, 0xE7C1, 0xE681, 0x2640,
    0x2200, 0xE2C1, 0xE381, 0x2340, 0xE101, 0x21C0, 0x2080, 0xE041,
    0xA001, 0x60C0, 0x6180, 0xA141, 0x6300, 0xA3C1, 0xA281, 0x6240,
    0x6600, 0xA6C1, 0xA781, 0x6740, 0xA501, 0x65C0, 0x6480, 0xA441,
    0x6C00, 0xACC1, 0xAD81, 0x6D40, 0xAF01, 0x6FC0, 0x6E80, 0xAE41,
    0xAA01, 0x6AC0, 0x6B80, 0xAB41, 0x6900, 0xA9C1, 0xA881, 0x6840,
    0x7800, 0xB8C1, 0xB981, 0x7940, 0xBB01, 0x7BC0, 0x7A80, 0xBA41,
    0xBE01, 0x7EC0, 0x7F80, 0xBF41, 0x7D00, 0xBDC1, 0xBC81, 0x7C40,
    0xB401, 0x74C0, 0x7580, 0xB541, 0x7700, 0xB7C1, 0xB681, 0x7640,
    0x7200, 0xB2C1, 0xB381, 0x7340, 0xB101, 0x71C0, 0x7080, 0xB041,
    0x5000, 0x90C1, 0x9181, 0x5140, 0x9301, 0x53C0, 0x5280, 0x9241,
    0x9601, 0x56C0, 0x5780, 0x9741, 0x5500, 0x95C1, 0x9481, 0x5440,
    0x9C01, 0x5CC0, 0x5D80, 0x9D41, 0x5F00, 0x9FC1, 0x9E81, 0x5E40,
    0x5A00, 0x9AC1, 0x9B81, 0x5B40, 0x9901, 0x59C0, 0x5880, 0x9841,
    0x8801, 0x48C0, 0x4980, 0x8941, 0x4B00, 0x8BC1, 0x8A81, 0x4A40,
    0x4E00, 0x8EC1, 0x8F81, 0x4F40, 0x8D01, 0x4DC0, 0x4C80, 0x8C41,
    0x4400, 0x84C1, 0x8581, 0x4540, 0x8701, 0x47C0, 0x4680, 0x8641,
    0x8201, 0x42C0, 0x4380, 0x8341, 0x4100, 0x81C1, 0x8081, 0x4040
};

// ---------------------------------------------------------------------------
// PDU
// ---------------------------------------------------------------------------

QByteArray ModbusTransport::buildReadPdu(FunctionCode fc, uint16_t address, uint16_t count)
{
    QByteArray pdu;
    QDataStream stream(&pdu, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint8>(fc) << address << count;
    return pdu;
}

QByteArray ModbusTransport::buildWriteCoilsPdu(uint16_t address, const QVector<bool>& values)
{
    const int byteCount = (values.size() + 7) / 8;
    QByteArray packed(byteCount, 0);
    for (int i = 0; i < values.size(); ++i) {
        if (values[i]) packed[i / 8] = static_cast<char>(packed[i / 8] | (1 << (i % 8)));
    }

    QByteArray pdu;
    QDataStream stream(&pdu, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint8>(FunctionCode::WriteMultipleCoils) << address
           << static_cast<quint16>(values.size()) << static_cast<quint8>(byteCount);
    pdu.append(packed);
    return pdu;
}

QByteArray ModbusTransport::buildWriteRegistersPdu(uint16_t address, const QVector<uint16_t>& values)
{
    QByteArray pdu;
    QDataStream stream(&pdu, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint8>(FunctionCode::WriteMultipleRegisters) << address
           << static_cast<quint16>(values.size()) << static_cast<quint8>(values.size() * 2);
    for (uint16_t v : values) stream << v;
    return pdu;
}

ModbusResult ModbusTransport::parseResponsePdu(const QByteArray& pdu, FunctionCode expected, uint16_t quantity)
{
    ModbusResult result;
    if (pdu.isEmpty()) {
        result.errorMessage = "Empty response";
        return result;
    }

    const uint8_t fc = static_cast<uint8_t>(pdu[0]);
    if (fc & 0x80) {
        if (fc != (static_cast<uint8_t>(expected) | 0x80)) {
            result.errorMessage =
                QString("Exception for unexpected function code 0x%1").arg(fc, 2, 16, QChar('0'));
            return result;
        }
        if (pdu.size() < 2) {
            result.errorMessage = "Truncated exception response";
            return result;
        }
        result.exception = static_cast<ExceptionCode>(static_cast<uint8_t>(pdu[1]));
        result.errorMessage = exceptionMessage(result.exception);
        return result;
    }
    if (fc != static_cast<uint8_t>(expected)) {
        result.errorMessage = QString("Unexpected function code 0x%1").arg(fc, 2, 16, QChar('0'));
        return result;
    }

    switch (expected) {
    case FunctionCode::ReadCoils:
    case FunctionCode::ReadDiscreteInputs: {
        if (pdu.size() < 2) {
            result.errorMessage = "Response too short for bit data";
            return result;
        }
        const int byteCount = static_cast<uint8_t>(pdu[1]);
        if (byteCount != (quantity + 7) / 8) {
            result.errorMessage = QString("Byte count %1 does not match %2 requested bits").arg(byteCount).arg(quantity);
            return result;
        }
        if (pdu.size() < 2 + byteCount) {
            result.errorMessage = "Incomplete bit data";
            return result;
        }
        for (uint16_t i = 0; i < quantity; ++i) {
            result.coils.append(((static_cast<uint8_t>(pdu[2 + i / 8]) >> (i % 8)) & 0x01) != 0);
        }
        result.success = true;
        return result;
    }
    case FunctionCode::ReadHoldingRegisters:
    case FunctionCode::ReadInputRegisters: {
        if (pdu.size() < 2) {
            result.errorMessage = "Response too short for register data";
            return result;
        }
        const int byteCount = static_cast<uint8_t>(pdu[1]);
        if (byteCount != quantity * 2) {
            result.errorMessage =
                QString("Byte count %1 does not match %2 requested registers").arg(byteCount).arg(quantity);
            return result;
        }
        if (pdu.size() < 2 + byteCount) {
            result.errorMessage = "Incomplete register data";
            return result;
        }
        for (int i = 0; i < byteCount / 2; ++i) {
            const uint16_t value = static_cast<uint16_t>((static_cast<uint8_t>(pdu[2 + i * 2]) << 8) |
                                                         static_cast<uint8_t>(pdu[3 + i * 2]));
            result.registers.append(value);
        }
        result.success = true;
        return result;
    }
    default:
        // 写响应: [FC] [Address (2)] [Value/Count (2)]
        result.success = pdu.size() >= 5;
        if (!result.success) result.errorMessage = "Write response too short";
        return result;
    }
}

// ---------------------------------------------------------------------------
// 请求
// ---------------------------------------------------------------------------

void ModbusTransport::trace(const QString& direction, const QByteArray& adu, int fcOffset) const
{
    if (!m_trace || adu.isEmpty()) return;
    const int fc = adu.size() > fcOffset ? static_cast<uint8_t>(adu[fcOffset]) : -1;
    m_trace(direction, adu, fc);
}

ModbusResult ModbusTransport::execute(uint8_t unitId, FunctionCode fc, const QByteArray& pdu, uint16_t quantity)
{
    if (!isOpen()) {
        return ModbusResult{false, ExceptionCode::None, "Not connected", {}, {}};
    }
    QString error;
    const QByteArray response = transact(unitId, pdu, error);
    if (response.isEmpty()) {
        return ModbusResult{false, ExceptionCode::None, error.isEmpty() ? "No response" : error, {}, {}};
    }
    return parseResponsePdu(response, fc, quantity);
}

ModbusResult ModbusTransport::read(FunctionCode fc, uint8_t unitId, uint16_t address, uint16_t count)
{
    switch (fc) {
    case FunctionCode::ReadCoils:
    case FunctionCode::ReadDiscreteInputs:
    case FunctionCode::ReadHoldingRegisters:
    case FunctionCode::ReadInputRegisters:
        return execute(unitId, fc, buildReadPdu(fc, address, count), count);
    default:
        return ModbusResult{false, ExceptionCode::IllegalFunction, "Not a read function code", {}, {}};
    }
}

ModbusResult ModbusTransport::readCoils(uint8_t unitId, uint16_t address, uint16_t count)
{
    return read(FunctionCode::ReadCoils, unitId, address, count);
}

ModbusResult ModbusTransport::readDiscreteInputs(uint8_t unitId, uint16_t address, uint16_t count)
{
    return read(FunctionCode::ReadDiscreteInputs, unitId, address, count);
}

ModbusResult ModbusTransport::readHoldingRegisters(uint8_t unitId, uint16_t address, uint16_t count)
{
    return read(FunctionCode::ReadHoldingRegisters, unitId, address, count);
}

ModbusResult ModbusTransport::readInputRegisters(uint8_t unitId, uint16_t address, uint16_t count)
{
    return read(FunctionCode::ReadInputRegisters, unitId, address, count);
}

ModbusResult ModbusTransport::writeSingleCoil(uint8_t unitId, uint16_t address, bool value)
{
    QByteArray pdu;
    QDataStream stream(&pdu, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint8>(FunctionCode::WriteSingleCoil) << address << quint16(value ? 0xFF00 : 0x0000);
    return execute(unitId, FunctionCode::WriteSingleCoil, pdu, 0);
}

ModbusResult ModbusTransport::writeSingleRegister(uint8_t unitId, uint16_t address, uint16_t value)
{
    QByteArray pdu;
    QDataStream stream(&pdu, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);
    stream << static_cast<quint8>(FunctionCode::WriteSingleRegister) << address << value;
    return execute(unitId, FunctionCode::WriteSingleRegister, pdu, 0);
}

ModbusResult ModbusTransport::writeMultipleCoils(uint8_t unitId, uint16_t address, const QVector<bool>& values)
{
    return execute(unitId, FunctionCode::WriteMultipleCoils, buildWriteCoilsPdu(address, values), 0);
}

ModbusResult ModbusTransport::writeMultipleRegisters(uint8_t unitId, uint16_t address,
                                                     const QVector<uint16_t>& values)
{
    return execute(unitId, FunctionCode::WriteMultipleRegisters, buildWriteRegistersPdu(address, values), 0);
}

// ---------------------------------------------------------------------------
// RTU 帧
// ---------------------------------------------------------------------------

uint16_t RtuFrame::calculateCRC16(const QByteArray& data)
{
    uint16_t crc = 0xFFFF;
    for (int i = 0; i < data.size(); ++i) {
        uint8_t byte = static_cast<uint8_t>(data[i]);
        crc = (crc >> 8) ^ crc16Table[(crc ^ byte) & 0xFF];
    }
    return crc;
}

QByteArray RtuFrame::build(uint8_t unitId, const QByteArray& pdu)
{
    QByteArray frame;
    frame.append(static_cast<char>(unitId));
    frame.append(pdu);
    const uint16_t crc = calculateCRC16(frame);
    frame.append(static_cast<char>(crc & 0xFF));
    frame.append(static_cast<char>((crc >> 8) & 0xFF));
    return frame;
}

bool RtuFrame::verifyCRC(const QByteArray& frame)
{
    if (frame.size() < 4) return false;
    const uint16_t calculated = calculateCRC16(frame.left(frame.size() - 2));
    const uint16_t received = static_cast<uint16_t>(static_cast<uint8_t>(frame[frame.size() - 2]) |
                                                    (static_cast<uint8_t>(frame[frame.size() - 1]) << 8));
    return calculated == received;
}

int RtuFrame::expectedLength(const QByteArray& partial)
{
    if (partial.size() < 2) return -1;
    const uint8_t fc = static_cast<uint8_t>(partial[1]);
    if (fc & 0x80) return 5;
    switch (fc) {
    case 0x01:
    case 0x02:
    case 0x03:
    case 0x04:
        if (partial.size() < 3) return -1;
        return 3 + static_cast<uint8_t>(partial[2]) + 2;
    case 0x05:
    case 0x06:
    case 0x0F:
    case 0x10:
        return 8;
    default:
        return -1;
    }
}

double RtuFrame::calculateT35(int baudRate, int dataBits, bool hasParity, double stopBits)
{
    if (baudRate <= 0) return 1.75;
    if (baudRate > 19200) return 1.75;
    const double bitsPerChar = 1.0 + dataBits + (hasParity ? 1.0 : 0.0) + stopBits;
    const double charTimeMs = bitsPerChar * 1000.0 / baudRate;
    return 3.5 * charTimeMs;
}

QByteArray readRtuFrame(QIODevice* device, int timeoutMs, QString& error)
{
    QByteArray frame;
    QElapsedTimer timer;
    timer.start();

    while (true) {
        frame.append(device->readAll());
        const int expected = RtuFrame::expectedLength(frame);
        if (expected > 0 && frame.size() >= expected) {
            return frame.left(expected);
        }
        const qint64 remaining = timeoutMs - timer.elapsed();
        if (remaining <= 0 || !device->waitForReadyRead(static_cast<int>(remaining))) {
            error = frame.isEmpty() ? QString("Read timeout")
                                    : QString("Incomplete frame (%1 bytes)").arg(frame.size());
            return frame;
        }
    }
}

QString formatAduHex(const QByteArray& adu)
{
    return QString::fromLatin1(adu.toHex(' ').toUpper());
}

} // namespace modua::modbus
