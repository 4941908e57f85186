#include "modbus_transport.h"

#include <QDataStream>
#include <QElapsedTimer>
#include <QTcpSocket>

namespace modua::modbus {

namespace {

bool connectSocket(std::unique_ptr<QTcpSocket>& socket, const QString& host, quint16 port,
                   int timeout, QString& error)
{
    if (socket && socket->state() == QAbstractSocket::ConnectedState) return true;

    socket = std::make_unique<QTcpSocket>();
    socket->connectToHost(host, port);
    if (!socket->waitForConnected(timeout)) {
        error = QString("Connect to %1:%2 failed: %3").arg(host).arg(port).arg(socket->errorString());
        socket.reset();
        return false;
    }
    return true;
}

void disconnectSocket(std::unique_ptr<QTcpSocket>& socket)
{
    if (!socket) return;
    if (socket->state() != QAbstractSocket::UnconnectedState) {
        socket->disconnectFromHost();
        if (socket->state() != QAbstractSocket::UnconnectedState) {
            socket->waitForDisconnected(1000);
        }
    }
    socket.reset();
}

bool writeAll(QTcpSocket* socket, const QByteArray& data, int timeout, QString& error)
{
    socket->readAll(); // 丢弃迟到的旧响应
    socket->write(data);
    if (!socket->waitForBytesWritten(timeout)) {
        error = "Write timeout";
        return false;
    }
    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// Modbus TCP (MBAP)
// ---------------------------------------------------------------------------

struct ModbusTcpTransport::Impl {
    QString host;
    quint16 port = 502;
    std::unique_ptr<QTcpSocket> socket;
    uint16_t transactionId = 0;
};

ModbusTcpTransport::ModbusTcpTransport(const QString& host, quint16 port)
    : d(std::make_unique<Impl>())
{
    d->host = host;
    d->port = port;
}

ModbusTcpTransport::~ModbusTcpTransport()
{
    close();
}

bool ModbusTcpTransport::open(QString& error)
{
    return connectSocket(d->socket, d->host, d->port, m_timeout, error);
}

void ModbusTcpTransport::close()
{
    disconnectSocket(d->socket);
}

bool ModbusTcpTransport::isOpen() const
{
    return d->socket && d->socket->state() == QAbstractSocket::ConnectedState;
}

QString ModbusTcpTransport::description() const
{
    return QString("Modbus TCP %1:%2").arg(d->host).arg(d->port);
}

QByteArray ModbusTcpTransport::buildMbap(uint16_t transactionId, uint8_t unitId, const QByteArray& pdu)
{
    QByteArray request;
    QDataStream stream(&request, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::BigEndian);

    stream << transactionId;                    // Transaction ID
    stream << quint16(0);                       // Protocol ID (0 = Modbus)
    stream << quint16(pdu.size() + 1);          // Length (Unit ID + PDU)
    stream << static_cast<quint8>(unitId);      // Unit ID
    request.append(pdu);
    return request;
}

QByteArray ModbusTcpTransport::transact(uint8_t unitId, const QByteArray& pdu, QString& error)
{
    const uint16_t tid = d->transactionId++;
    const QByteArray request = buildMbap(tid, unitId, pdu);
    trace("TX", request, 7);
    if (!writeAll(d->socket.get(), request, m_timeout, error)) return {};

    QByteArray response;
    QElapsedTimer timer;
    timer.start();
    int expected = -1;
    while (expected < 0 || response.size() < expected) {
        const qint64 remaining = m_timeout - timer.elapsed();
        if (remaining <= 0 || !d->socket->waitForReadyRead(static_cast<int>(remaining))) {
            trace("RX", response, 7);
            error = response.isEmpty() ? QString("Read timeout") : QString("Incomplete response");
            return {};
        }
        response.append(d->socket->readAll());
        if (expected < 0 && response.size() >= 6) {
            const int length = (static_cast<uint8_t>(response[4]) << 8) | static_cast<uint8_t>(response[5]);
            expected = 6 + length;
        }
    }
    response.truncate(expected);
    trace("RX", response, 7);
    return unwrapMbap(response, tid, unitId, error);
}

QByteArray ModbusTcpTransport::unwrapMbap(const QByteArray& response, uint16_t transactionId, uint8_t unitId,
                                          QString& error)
{
    // 最小响应长度: MBAP(7) + FC(1) = 8
    if (response.size() < 8) {
        error = "Response too short";
        return {};
    }
    const uint16_t rxTid = static_cast<uint16_t>((static_cast<uint8_t>(response[0]) << 8) |
                                                 static_cast<uint8_t>(response[1]));
    if (rxTid != transactionId) {
        error = QString("Transaction ID mismatch (sent %1, got %2)").arg(transactionId).arg(rxTid);
        return {};
    }
    if (response[2] != 0 || response[3] != 0) {
        error = "Unexpected protocol id";
        return {};
    }
    const uint8_t rxUnit = static_cast<uint8_t>(response[6]);
    if (rxUnit != unitId) {
        error = QString("Unit id mismatch (sent %1, got %2)").arg(int(unitId)).arg(int(rxUnit));
        return {};
    }
    return response.mid(7);
}

// ---------------------------------------------------------------------------
// RTU over TCP
// ---------------------------------------------------------------------------

struct ModbusRtuOverTcpTransport::Impl {
    QString host;
    quint16 port = 502;
    std::unique_ptr<QTcpSocket> socket;
};

ModbusRtuOverTcpTransport::ModbusRtuOverTcpTransport(const QString& host, quint16 port)
    : d(std::make_unique<Impl>())
{
    d->host = host;
    d->port = port;
}

ModbusRtuOverTcpTransport::~ModbusRtuOverTcpTransport()
{
    close();
}

bool ModbusRtuOverTcpTransport::open(QString& error)
{
    return connectSocket(d->socket, d->host, d->port, m_timeout, error);
}

void ModbusRtuOverTcpTransport::close()
{
    disconnectSocket(d->socket);
}

bool ModbusRtuOverTcpTransport::isOpen() const
{
    return d->socket && d->socket->state() == QAbstractSocket::ConnectedState;
}

QString ModbusRtuOverTcpTransport::description() const
{
    return QString("Modbus RTU over TCP %1:%2").arg(d->host).arg(d->port);
}

QByteArray ModbusRtuOverTcpTransport::transact(uint8_t unitId, const QByteArray& pdu, QString& error)
{
    const QByteArray request = RtuFrame::build(unitId, pdu);
    trace("TX", request, 1);
    if (!writeAll(d->socket.get(), request, m_timeout, error)) return {};

    QString readError;
    const QByteArray frame = readRtuFrame(d->socket.get(), m_timeout, readError);
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
