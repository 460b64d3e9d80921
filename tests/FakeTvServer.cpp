#include "FakeTvServer.h"

#include <QHostAddress>
#include <QTcpSocket>

namespace {

QByteArray reasonPhrase(int status)
{
    switch (status) {
    case 200:
        return QByteArrayLiteral("OK");
    case 400:
        return QByteArrayLiteral("Bad Request");
    case 401:
        return QByteArrayLiteral("Unauthorized");
    case 404:
        return QByteArrayLiteral("Not Found");
    case 500:
        return QByteArrayLiteral("Internal Server Error");
    default:
        return QByteArrayLiteral("Status");
    }
}

} // namespace

FakeTvServer::FakeTvServer(QObject *parent)
    : QObject(parent)
{
    connect(&m_server, &QTcpServer::newConnection, this, [this]() { onNewConnection(); });
}

bool FakeTvServer::listen()
{
    m_clock.start();
    return m_server.listen(QHostAddress::LocalHost, 0);
}

quint16 FakeTvServer::port() const
{
    return m_server.serverPort();
}

void FakeTvServer::setResponse(const QString &path, int status, const QByteArray &body)
{
    m_responses.insert(path, qMakePair(status, body));
}

void FakeTvServer::setDefaultResponse(int status, const QByteArray &body)
{
    m_defaultResponse = qMakePair(status, body);
}

void FakeTvServer::failFromRequest(int fromIndex, int status)
{
    m_failFromIndex = fromIndex;
    m_failStatus = status;
}

quint16 FakeTvServer::unusedPort()
{
    QTcpServer scratch;
    if (!scratch.listen(QHostAddress::LocalHost, 0))
        return 1;
    const quint16 port = scratch.serverPort();
    scratch.close();
    return port;
}

void FakeTvServer::onNewConnection()
{
    while (QTcpSocket *socket = m_server.nextPendingConnection()) {
        m_buffers.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }
}

void FakeTvServer::onReadyRead(QTcpSocket *socket)
{
    QByteArray &buffer = m_buffers[socket];
    buffer.append(socket->readAll());

    const int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return;

    RecordedRequest request;
    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    if (lines.isEmpty())
        return;
    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() < 2)
        return;
    request.method = requestLine.at(0);
    request.path = QString::fromLatin1(requestLine.at(1));
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        const int colon = line.indexOf(':');
        if (colon <= 0)
            continue;
        request.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    const int contentLength = request.headers.value("content-length", "0").toInt();
    const int bodyStart = headerEnd + 4;
    if (buffer.size() - bodyStart < contentLength)
        return;
    request.body = buffer.mid(bodyStart, contentLength);
    request.receivedAtMs = m_clock.elapsed();
    buffer.clear();

    m_requests.append(request);
    if (m_hang)
        return;
    respond(socket, request);
}

void FakeTvServer::respond(QTcpSocket *socket, const RecordedRequest &request)
{
    QPair<int, QByteArray> response = m_responses.value(request.path, m_defaultResponse);
    const int index = m_requests.size() - 1;
    if (m_failFromIndex >= 0 && index >= m_failFromIndex)
        response = qMakePair(m_failStatus, QByteArray());

    QByteArray reply;
    reply += "HTTP/1.1 " + QByteArray::number(response.first) + ' ' + reasonPhrase(response.first) + "\r\n";
    reply += "Content-Type: text/xml; charset=\"utf-8\"\r\n";
    reply += "Content-Length: " + QByteArray::number(response.second.size()) + "\r\n";
    reply += "Connection: close\r\n\r\n";
    reply += response.second;
    socket->write(reply);
    socket->disconnectFromHost();
}
