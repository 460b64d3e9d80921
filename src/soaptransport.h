#pragma once

#include "vieratypes.h"

#include <QByteArray>
#include <QString>

namespace viera {

constexpr int kDefaultRequestTimeoutMs = 5000;

struct TransportError
{
    enum class Kind {
        None,
        Timeout,
        HttpStatus,
        Connection,
    };

    Kind kind = Kind::None;
    int httpStatus = 0;
    QString message;

    bool isError() const { return kind != Kind::None; }
    void clear();
};

QString transportErrorName(TransportError::Kind kind);

// One SOAP action; fully determines the request on the wire.
struct SoapCommand
{
    QString path;
    QString serviceUrn;
    QString action;
    QString body;

    // Body is embedded verbatim; callers escape their own values.
    QByteArray envelope() const;
    QByteArray soapActionHeader() const;
};

// Sends single SOAP/HTTP requests to one television. No retries.
class SoapTransport
{
public:
    explicit SoapTransport(const DeviceTarget &target, int timeoutMs = kDefaultRequestTimeoutMs);

    const DeviceTarget &target() const { return m_target; }
    int timeoutMs() const { return m_timeoutMs; }

    bool send(const SoapCommand &command, QByteArray *response, TransportError *error = nullptr) const;
    bool get(const QString &path, QByteArray *body = nullptr, TransportError *error = nullptr) const;

private:
    enum class Method {
        Get,
        Post,
    };

    bool execute(Method method,
                 const QString &path,
                 const QByteArray &payload,
                 const QByteArray &soapAction,
                 QByteArray *response,
                 TransportError *error) const;

    DeviceTarget m_target;
    int m_timeoutMs = kDefaultRequestTimeoutMs;
};

} // namespace viera
