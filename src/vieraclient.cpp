#include "vieraclient.h"
#include "vieralog.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QRegularExpression>
#include <QTimer>

#include <cmath>

namespace viera {

namespace {

constexpr auto kMasterChannelArgs = "<InstanceID>0</InstanceID><Channel>Master</Channel>";

void waitMs(int delayMs)
{
    if (delayMs <= 0)
        return;
    QElapsedTimer elapsed;
    elapsed.start();
    qint64 remaining = delayMs;
    while (remaining > 0) {
        QEventLoop loop;
        QTimer::singleShot(static_cast<int>(remaining), Qt::PreciseTimer, &loop, &QEventLoop::quit);
        loop.exec(QEventLoop::ExcludeUserInputEvents);
        remaining = delayMs - elapsed.elapsed();
    }
}

} // namespace

VieraClient::VieraClient(const DeviceTarget &target, int timeoutMs)
    : m_transport(target, timeoutMs)
{
}

VieraClient::VieraClient(const QString &host)
    : m_transport(DeviceTarget { host, kDefaultControlPort })
{
}

QString VieraClient::normalizeKey(const QString &key)
{
    const QString trimmed = key.trimmed();
    if (trimmed.startsWith(QLatin1String("NRC_")))
        return trimmed;
    return QStringLiteral("NRC_%1-ONOFF").arg(trimmed.toUpper());
}

QString VieraClient::digitKey(int digit)
{
    return QStringLiteral("NRC_D%1-ONOFF").arg(qBound(0, digit, 9));
}

int VieraClient::normalizeVolume(double level)
{
    if (std::isnan(level))
        return 0;
    const double clamped = qBound(0.0, level, 100.0);
    return static_cast<int>(std::lround(clamped));
}

std::optional<QString> VieraClient::extractTagValue(const QByteArray &body, const QString &tag)
{
    const QRegularExpression pattern(
        QStringLiteral("<%1>(\\d+)</%1>").arg(QRegularExpression::escape(tag)));
    const QRegularExpressionMatch match = pattern.match(QString::fromUtf8(body));
    if (!match.hasMatch())
        return std::nullopt;
    return match.captured(1);
}

bool VieraClient::sendKey(const QString &key, TransportError *error) const
{
    const QString keyEvent = normalizeKey(key);
    qCDebug(vieraSoapLog) << "Sending key" << keyEvent << "to" << target().host;
    SoapCommand command;
    command.path = QString::fromLatin1(kRemoteControlPath);
    command.serviceUrn = QString::fromLatin1(kRemoteControlUrn);
    command.action = QStringLiteral("X_SendKey");
    command.body = QStringLiteral("<X_KeyEvent>%1</X_KeyEvent>").arg(keyEvent);
    QByteArray response;
    return m_transport.send(command, &response, error);
}

bool VieraClient::sendRenderingAction(const QString &action, const QString &arguments,
                                      QByteArray *response, TransportError *error) const
{
    SoapCommand command;
    command.path = QString::fromLatin1(kRenderingControlPath);
    command.serviceUrn = QString::fromLatin1(kRenderingControlUrn);
    command.action = action;
    command.body = arguments;
    return m_transport.send(command, response, error);
}

std::optional<int> VieraClient::getVolume(TransportError *error) const
{
    QByteArray response;
    if (!sendRenderingAction(QStringLiteral("GetVolume"), QString::fromLatin1(kMasterChannelArgs),
                             &response, error)) {
        return std::nullopt;
    }
    const std::optional<QString> value = extractTagValue(response, QStringLiteral("CurrentVolume"));
    if (!value)
        return std::nullopt;
    bool ok = false;
    const int volume = value->toInt(&ok);
    if (!ok)
        return std::nullopt;
    return qBound(0, volume, 100);
}

bool VieraClient::setVolume(double level, TransportError *error) const
{
    const int volume = normalizeVolume(level);
    const QString args = QString::fromLatin1(kMasterChannelArgs)
        + QStringLiteral("<DesiredVolume>%1</DesiredVolume>").arg(volume);
    QByteArray response;
    return sendRenderingAction(QStringLiteral("SetVolume"), args, &response, error);
}

std::optional<bool> VieraClient::getMute(TransportError *error) const
{
    QByteArray response;
    if (!sendRenderingAction(QStringLiteral("GetMute"), QString::fromLatin1(kMasterChannelArgs),
                             &response, error)) {
        return std::nullopt;
    }
    const std::optional<QString> value = extractTagValue(response, QStringLiteral("CurrentMute"));
    if (!value)
        return std::nullopt;
    return *value == QLatin1String("1");
}

bool VieraClient::setMute(bool muted, TransportError *error) const
{
    const QString args = QString::fromLatin1(kMasterChannelArgs)
        + QStringLiteral("<DesiredMute>%1</DesiredMute>").arg(muted ? 1 : 0);
    QByteArray response;
    return sendRenderingAction(QStringLiteral("SetMute"), args, &response, error);
}

bool VieraClient::isAvailable() const
{
    TransportError error;
    const bool reachable = m_transport.get(QString::fromLatin1(kStatusDocumentPath), nullptr, &error);
    if (!reachable) {
        qCDebug(vieraSoapLog) << "TV" << target().host << "not reachable:"
                              << transportErrorName(error.kind);
    }
    return reachable;
}

bool VieraClient::sendChannelNumber(quint32 channel, TransportError *error) const
{
    const QString digits = QString::number(channel);
    qCDebug(vieraSoapLog) << "Entering channel" << digits << "on" << target().host;
    for (int i = 0; i < digits.size(); ++i) {
        if (i > 0)
            waitMs(m_keyPressDelayMs);
        if (!sendKey(digitKey(digits.at(i).digitValue()), error))
            return false;
    }
    return true;
}

} // namespace viera
