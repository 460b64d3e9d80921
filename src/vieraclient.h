#pragma once

#include "soaptransport.h"
#include "vieratypes.h"

#include <QString>

#include <optional>

namespace viera {

constexpr auto kRemoteControlPath = "/nrc/control_0";
constexpr auto kRenderingControlPath = "/dmr/control_0";
constexpr auto kStatusDocumentPath = "/nrc/ddd.xml";
constexpr auto kRemoteControlUrn = "urn:panasonic-com:service:p00NetworkControl:1";
constexpr auto kRenderingControlUrn = "urn:schemas-upnp-org:service:RenderingControl:1";
constexpr int kDigitKeyDelayMs = 300;

/**
 * Remote-control and rendering-control commands for one Viera television.
 *
 * Every call blocks until the television answers or the request timeout
 * expires. Failures are reported through the optional TransportError
 * out-parameter; isAvailable() is the only call that folds every failure
 * into a plain boolean.
 */
class VieraClient
{
public:
    explicit VieraClient(const DeviceTarget &target, int timeoutMs = kDefaultRequestTimeoutMs);
    explicit VieraClient(const QString &host);

    const DeviceTarget &target() const { return m_transport.target(); }

    bool sendKey(const QString &key, TransportError *error = nullptr) const;

    /// Returns nullopt when the reply carries no CurrentVolume; check error to tell it from a failure.
    std::optional<int> getVolume(TransportError *error = nullptr) const;
    bool setVolume(double level, TransportError *error = nullptr) const;

    std::optional<bool> getMute(TransportError *error = nullptr) const;
    bool setMute(bool muted, TransportError *error = nullptr) const;

    bool isAvailable() const;

    /// Presses one digit key per decimal digit, strictly in sequence.
    /// Callers must not overlap two entries on the same television.
    bool sendChannelNumber(quint32 channel, TransportError *error = nullptr) const;

    int keyPressDelayMs() const { return m_keyPressDelayMs; }
    void setKeyPressDelayMs(int delayMs) { m_keyPressDelayMs = qMax(0, delayMs); }

    static QString normalizeKey(const QString &key);
    static QString digitKey(int digit);
    static int normalizeVolume(double level);
    static std::optional<QString> extractTagValue(const QByteArray &body, const QString &tag);

private:
    bool sendRenderingAction(const QString &action, const QString &arguments,
                             QByteArray *response, TransportError *error) const;

    SoapTransport m_transport;
    int m_keyPressDelayMs = kDigitKeyDelayMs;
};

} // namespace viera
