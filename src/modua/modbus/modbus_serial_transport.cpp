#include "modbus_transport.h"

#include <QSerialPort>
#include <QThread>

namespace modua::modbus {

struct ModbusRtuSerialTransport::Impl {
    SerialParams params;
    std::unique_ptr<QSerialPort> serial;
    double t35Ms = 3.646;
};

ModbusRtuSerialTransport::ModbusRtuSerialTransport(const SerialParams& params)
    : d(std::make_unique<Impl>())
{
    d->params = params;
}

ModbusRtuSerialTransport::~ModbusRtuSerialTransport()
{
    close();
}

bool ModbusRtuSerialTransport::open(QString& error)
{
    if (isOpen()) return true;

    const SerialParams& p = d->params;
    if (p.portName.isEmpty()) {
        error = "No serial port configured";
        return false;
    }

    d->serial = std::make_unique<QSerialPort>();
    d->serial->setPortName(p.portName);
    d->serial->setBaudRate(p.baudRate);

    switch (p.dataBits) {
    case 5: d->serial->setDataBits(QSerialPort::Data5); break;
    case 6: d->serial->setDataBits(QSerialPort::Data6); break;
    case 7: d->serial->setDataBits(QSerialPort::Data7); break;
    default: d->serial->setDataBits(QSerialPort::Data8); break;
    }

    const QString parity = p.parity.toLower();
    bool hasParity = true;
    if (parity == "even") {
        d->serial->setParity(QSerialPort::EvenParity);
    } else if (parity == "odd") {
        d->serial->setParity(QSerialPort::OddParity);
    } else {
        d->serial->setParity(QSerialPort::NoParity);
        hasParity = false;
    }

    double stopBits = 1.0;
    if (p.stopBits == "2") {
        d->serial->setStopBits(QSerialPort::TwoStop);
        stopBits = 2.0;
    } else if (p.stopBits == "1.5") {
        d->serial->setStopBits(QSerialPort::OneAndHalfStop);
        stopBits = 1.5;
    } else {
        d->serial->setStopBits(QSerialPort::OneStop);
    }

    const QString flow = p.flowControl.toLower();
    if (flow.contains("rts") || flow.contains("hardware")) {
        d->serial->setFlowControl(QSerialPort::HardwareControl);
    } else if (flow.contains("xon") || flow.contains("software")) {
        d->serial->setFlowControl(QSerialPort::SoftwareControl);
    } else {
        d->serial->setFlowControl(QSerialPort::NoFlowControl);
    }

    if (!d->serial->open(QIODevice::ReadWrite)) {
        error = QString("Open %1 failed: %2").arg(p.portName, d->serial->errorString());
        d->serial.reset();
        return false;
    }

    d->t35Ms = RtuFrame::calculateT35(p.baudRate, p.dataBits, hasParity, stopBits);
    return true;
}

void ModbusRtuSerialTransport::close()
{
    if (d->serial) {
        if (d->serial->isOpen()) d->serial->close();
        d->serial.reset();
    }
}

bool ModbusRtuSerialTransport::isOpen() const
{
    return d->serial && d->serial->isOpen();
}

QString ModbusRtuSerialTransport::description() const
{
    return QString("Modbus RTU %1 @ %2").arg(d->params.portName).arg(d->params.baudRate);
}

QByteArray ModbusRtuSerialTransport::transact(uint8_t unitId, const QByteArray& pdu, QString& error)
{
    // 帧间静默 T3.5
    QThread::usleep(static_cast<unsigned long>(d->t35Ms * 1000.0));
    d->serial->clear(QSerialPort::AllDirections);

    const QByteArray request = RtuFrame::build(unitId, pdu);
    trace("TX", request, 1);
    d->serial->write(request);
    if (!d->serial->waitForBytesWritten(m_timeout)) {
        error = "Write timeout";
        return {};
    }

    QString readError;
    const QByteArray frame = readRtuFrame(d->serial.get(), m_timeout, readError);
    trace("RX", frame, 1);
    if (!readError.isEmpty()) {
        error = readError;
        return {};
    }
    if (!RtuFrame::verifyCRC(frame)) {
        error = "CRC error";
        return {};
    }
    if (static_cast<uint8_t>(frame[0]) != unitId) {
        error = QString("Unexpected unit id %1").arg(static_cast<uint8_t>(frame[0]));
        return {};
    }
    return frame.mid(1, frame.size() - 3);
}

} // namespace modua::modbus
