#include "soaptransport.h"
#include "vieralog.h"

#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

namespace viera {

void TransportError::clear()
{
    kind = Kind::None;
    httpStatus = 0;
    message.clear();
}

QString transportErrorName(TransportError::Kind kind)
{
    switch (kind) {
    case TransportError::Kind::None:
        return QStringLiteral("none");
    case TransportError::Kind::Timeout:
        return QStringLiteral("timeout");
    case TransportError::Kind::HttpStatus:
        return QStringLiteral("httpStatus");
    case TransportError::Kind::Connection:
        return QStringLiteral("connection");
    }
    return QString();
}

QByteArray SoapCommand::envelope() const
{
    const QString text = QStringLiteral(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
        " <s:Body>\n"
        "  <u:%1 xmlns:u=\"%2\">\n"
        "   %3\n"
        "  </u:%1>\n"
        " </s:Body>\n"
        "</s:Envelope>")
        .arg(action, serviceUrn, body);
    return text.toUtf8();
}

QByteArray SoapCommand::soapActionHeader() const
{
    return QStringLiteral("\"%1#%2\"").arg(serviceUrn, action).toUtf8();
}

SoapTransport::SoapTransport(const DeviceTarget &target, int timeoutMs)
    : m_target(target)
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultRequestTimeoutMs)
{
}

bool SoapTransport::send(const SoapCommand &command, QByteArray *response, TransportError *error) const
{
    return execute(Method::Post,
                   command.path,
                   command.envelope(),
                   command.soapActionHeader(),
                   response,
                   error);
}

bool SoapTransport::get(const QString &path, QByteArray *body, TransportError *error) const
{
    return execute(Method::Get, path, QByteArray(), QByteArray(), body, error);
}

bool SoapTransport::execute(Method method,
                            const QString &path,
                            const QByteArray &payload,
                            const QByteArray &soapAction,
                            QByteArray *response,
                            TransportError *error) const
{
    TransportError localError;
    TransportError &err = error ? *error : localError;
    err.clear();

    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(m_target.host.trimmed());
    url.setPort(m_target.port);
    url.setPath(path);
    if (!url.isValid() || url.host().isEmpty()) {
        err.kind = TransportError::Kind::Connection;
        err.message = QStringLiteral("Invalid television address '%1'").arg(m_target.host);
        return false;
    }

    // Created per call so the manager lives in whichever thread issues the request.
    QNetworkAccessManager nam;
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    QNetworkReply *reply = nullptr;
    if (method == Method::Post) {
        req.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("text/xml; charset=\"utf-8\""));
        req.setRawHeader("SOAPAction", soapAction);
        reply = nam.post(req, payload);
    } else {
        reply = nam.get(req);
    }

    bool timedOut = false;
    QEventLoop loop;
    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    deadline.start(m_timeoutMs);
    if (!reply->isFinished())
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    deadline.stop();

    const int statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray data = reply->readAll();
    const QNetworkReply::NetworkError networkError = reply->error();
    const QString networkErrorString = reply->errorString();
    reply->deleteLater();

    if (timedOut) {
        err.kind = TransportError::Kind::Timeout;
        err.message = QStringLiteral("Request to %1 timed out after %2 ms")
                          .arg(url.toString())
                          .arg(m_timeoutMs);
    } else if (statusCode > 0 && statusCode != 200) {
        err.kind = TransportError::Kind::HttpStatus;
        err.httpStatus = statusCode;
        err.message = QStringLiteral("Request to %1 failed: HTTP %2")
                          .arg(url.toString())
                          .arg(statusCode);
    } else if (networkError != QNetworkReply::NoError || statusCode == 0) {
        err.kind = TransportError::Kind::Connection;
        err.message = QStringLiteral("Request to %1 failed: %2")
                          .arg(url.toString(), networkErrorString);
    }

    if (err.isError()) {
        qCDebug(vieraSoapLog).noquote() << err.message;
        return false;
    }
    if (response)
        *response = data;
    return true;
}

} // namespace viera
