#include "vieraadapter.h"

#include "companiondiscovery.h"
#include "pairingsession.h"
#include "vieraclient.h"
#include "vierakeys.h"
#include "wakecascade.h"

#include <QDateTime>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>
#include <QThread>
#include <QtGlobal>

#include <optional>
#include <utility>

namespace {
constexpr auto kChannelPower = "power";
constexpr auto kChannelVolume = "volume";
constexpr auto kChannelMute = "mute";
constexpr auto kChannelNumber = "channel";
constexpr auto kChannelInput = "input";
constexpr auto kChannelRemote = "remote";
constexpr auto kChannelConnectivity = "connectivity";
constexpr int kInitialPollDelayMs = 1000;
constexpr int kPowerOnProbeAttempts = 5;
constexpr int kPowerOnProbeSpacingMs = 2000;
constexpr int kMaxChannelNumber = 9999;
constexpr qint64 kConnectFailureLogIntervalMs = 60000;

QString credentialsMetaKey(viera::CompanionProtocol protocol)
{
    switch (protocol) {
    case viera::CompanionProtocol::Mrp:
        return QStringLiteral("appleTvMrpCredentials");
    case viera::CompanionProtocol::AirPlay:
        return QStringLiteral("appleTvAirplayCredentials");
    case viera::CompanionProtocol::Companion:
        return QStringLiteral("appleTvCompanionCredentials");
    }
    return QString();
}

phicore::CmdStatus statusForTransportError(const viera::TransportError &error)
{
    switch (error.kind) {
    case viera::TransportError::Kind::None:
        return phicore::CmdStatus::Success;
    case viera::TransportError::Kind::Timeout:
    case viera::TransportError::Kind::Connection:
        return phicore::CmdStatus::TemporarilyOffline;
    case viera::TransportError::Kind::HttpStatus:
        return phicore::CmdStatus::Failure;
    }
    return phicore::CmdStatus::Failure;
}

}

Q_LOGGING_CATEGORY(adapterLog, "phi-core.adapters.viera");

namespace phicore {

VieraAdapter::VieraAdapter(QObject *parent)
    : AdapterInterface(parent)
{
}

VieraAdapter::~VieraAdapter()
{
    releasePairingSession();
    qCDebug(adapterLog) << "VieraAdapter destroyed for" << adapter().id;
}

bool VieraAdapter::start(QString &errorString)
{
    m_stopping = false;
    applyConfig();

    qCInfo(adapterLog) << "Starting VieraAdapter for" << adapter().id
                       << "host" << resolveHost()
                       << "port" << m_controlPort
                       << "pollIntervalMs" << m_pollIntervalMs
                       << "requestTimeoutMs" << m_requestTimeoutMs
                       << "useAppleTv" << m_useAppleTv;

    if (resolveHost().isEmpty()) {
        errorString = QStringLiteral("No TV IP address configured");
        qCCritical(adapterLog) << "VieraAdapter: IP not configured";
        setConnected(false);
        return false;
    }
    errorString.clear();
    m_synced = false;
    emitDeviceSnapshot();
    QTimer::singleShot(kInitialPollDelayMs, this, [this]() { pollStatus(); });
    if (!m_pollTimer) {
        m_pollTimer = new QTimer(this);
        m_pollTimer->setSingleShot(false);
        connect(m_pollTimer, &QTimer::timeout, this, [this]() { pollStatus(); });
    }
    updatePollInterval();
    return true;
}

void VieraAdapter::stop()
{
    qCInfo(adapterLog) << "Stopping VieraAdapter for" << adapter().id;
    m_stopping = true;
    m_synced = false;
    if (m_pollTimer)
        m_pollTimer->stop();
    releasePairingSession();
    setConnected(false);
}

void VieraAdapter::requestFullSync()
{
    if (m_synced)
        return;
    emitDeviceSnapshot();
    pollStatus();
}

void VieraAdapter::adapterConfigUpdated()
{
    applyConfig();
    if (m_synced && !m_deviceId.isEmpty()) {
        emit channelUpdated(m_deviceId, buildInputChannel());
    } else {
        emitDeviceSnapshot();
    }
    pollStatus();
}

void VieraAdapter::setConnected(bool connected)
{
    if (m_connected == connected)
        return;
    m_connected = connected;
    emit connectionStateChanged(m_connected);
}

bool VieraAdapter::shouldAbort() const
{
    return m_stopping || QThread::currentThread()->isInterruptionRequested();
}

QString VieraAdapter::resolveHost() const
{
    const QString ip = adapter().ip.trimmed();
    if (!ip.isEmpty())
        return ip;
    return adapter().host.trimmed();
}

void VieraAdapter::updateChannelState(const QString &deviceExternalId,
                                      const QString &channelExternalId,
                                      const QVariant &value,
                                      CmdId cmdId)
{
    CmdResponse resp;
    resp.id = cmdId;
    resp.tsMs = QDateTime::currentMSecsSinceEpoch();

    const std::shared_ptr<const viera::VieraClient> client = m_client;
    if (deviceExternalId != m_deviceId || !client) {
        resp.status = CmdStatus::NotSupported;
        resp.error = QStringLiteral("Unknown device");
        emit cmdResult(resp);
        return;
    }

    QString errorString;

    if (channelExternalId == QLatin1String(kChannelPower)) {
        const bool on = value.toBool();
        if (on) {
            qCInfo(adapterLog) << "Powering on TV via Apple TV HDMI-CEC";
            resp.status = powerOn(errorString);
        } else {
            qCInfo(adapterLog) << "Sending power off command";
            resp.status = sendKeyCommand(QString::fromLatin1(viera::kPowerKey), errorString);
        }
        if (resp.status == CmdStatus::Success)
            resp.finalValue = on;
        else
            resp.error = errorString;
        emit cmdResult(resp);
        return;
    }

    if (channelExternalId == QLatin1String(kChannelVolume)) {
        bool ok = false;
        const double requested = value.toDouble(&ok);
        if (!ok) {
            resp.status = CmdStatus::InvalidArgument;
            resp.error = QStringLiteral("Volume must be numeric");
            emit cmdResult(resp);
            return;
        }
        const int level = viera::VieraClient::normalizeVolume(requested);
        qCDebug(adapterLog) << "Setting volume to" << level;
        viera::TransportError error;
        if (client->setVolume(requested, &error)) {
            resp.status = CmdStatus::Success;
            resp.finalValue = static_cast<double>(level);
            emitChannelState(QString::fromLatin1(kChannelVolume), static_cast<double>(level));
        } else {
            resp.status = statusForTransportError(error);
            resp.error = error.message;
        }
        emit cmdResult(resp);
        return;
    }

    if (channelExternalId == QLatin1String(kChannelMute)) {
        const bool muted = value.toBool();
        qCDebug(adapterLog) << "Setting mute to" << muted;
        viera::TransportError error;
        if (client->setMute(muted, &error)) {
            resp.status = CmdStatus::Success;
            resp.finalValue = muted;
            emitChannelState(QString::fromLatin1(kChannelMute), muted);
        } else {
            resp.status = statusForTransportError(error);
            resp.error = error.message;
        }
        emit cmdResult(resp);
        return;
    }

    if (channelExternalId == QLatin1String(kChannelNumber)) {
        bool ok = false;
        const int channel = value.toInt(&ok);
        if (!ok || channel <= 0 || channel > kMaxChannelNumber) {
            resp.status = CmdStatus::InvalidArgument;
            resp.error = QStringLiteral("Channel must be a number between 1 and %1").arg(kMaxChannelNumber);
            emit cmdResult(resp);
            return;
        }
        resp.status = enterChannel(channel, errorString);
        if (resp.status == CmdStatus::Success)
            resp.finalValue = channel;
        else
            resp.error = errorString;
        emit cmdResult(resp);
        return;
    }

    if (channelExternalId == QLatin1String(kChannelInput)) {
        const QString input = value.toString().trimmed();
        const QString key = viera::inputKeyToken(input);
        if (key.isEmpty()) {
            qCWarning(adapterLog) << "Unknown input:" << input;
            resp.status = CmdStatus::InvalidArgument;
            resp.error = QStringLiteral("Unknown input '%1'").arg(input);
            emit cmdResult(resp);
            return;
        }
        qCInfo(adapterLog) << "Switching input to" << input;
        resp.status = sendKeyCommand(key, errorString);
        if (resp.status == CmdStatus::Success)
            resp.finalValue = input.toUpper();
        else
            resp.error = errorString;
        emit cmdResult(resp);
        return;
    }

    if (channelExternalId == QLatin1String(kChannelRemote)) {
        const QString name = value.toString().trimmed();
        QString key = viera::remoteKeyToken(name);
        if (key.isEmpty() && name.startsWith(QLatin1String("NRC_")))
            key = name;
        if (key.isEmpty()) {
            resp.status = CmdStatus::InvalidArgument;
            resp.error = QStringLiteral("Unknown remote key '%1'").arg(name);
            emit cmdResult(resp);
            return;
        }
        resp.status = sendKeyCommand(key, errorString);
        if (resp.status == CmdStatus::Success)
            resp.finalValue = name;
        else
            resp.error = errorString;
        emit cmdResult(resp);
        return;
    }

    resp.status = CmdStatus::NotSupported;
    resp.error = QStringLiteral("Channel not supported");
    emit cmdResult(resp);
}

CmdStatus VieraAdapter::sendKeyCommand(const QString &key, QString &errorString)
{
    const std::shared_ptr<const viera::VieraClient> client = m_client;
    if (!client) {
        errorString = QStringLiteral("TV host not configured");
        return CmdStatus::Failure;
    }
    viera::TransportError error;
    if (client->sendKey(key, &error))
        return CmdStatus::Success;
    qCWarning(adapterLog).noquote() << "Sending" << key << "failed:" << error.message;
    errorString = error.message;
    return statusForTransportError(error);
}

CmdStatus VieraAdapter::enterChannel(int channel, QString &errorString)
{
    if (m_channelEntryActive) {
        errorString = QStringLiteral("Channel entry already in progress");
        return CmdStatus::Failure;
    }
    const std::shared_ptr<const viera::VieraClient> client = m_client;
    if (!client) {
        errorString = QStringLiteral("TV host not configured");
        return CmdStatus::Failure;
    }
    m_channelEntryActive = true;
    qCInfo(adapterLog) << "Switching to channel" << channel;
    viera::TransportError error;
    const bool sent = client->sendChannelNumber(static_cast<quint32>(channel), &error);
    m_channelEntryActive = false;
    if (sent)
        return CmdStatus::Success;
    qCWarning(adapterLog).noquote() << "Channel entry" << channel << "failed:" << error.message;
    errorString = error.message;
    return statusForTransportError(error);
}

CmdStatus VieraAdapter::powerOn(QString &errorString)
{
    if (!m_useAppleTv) {
        qCWarning(adapterLog) << "Power on not possible: Apple TV not configured";
        errorString = QStringLiteral("Power on needs an Apple TV; enable it in the adapter settings");
        return CmdStatus::NotSupported;
    }
    const viera::CompanionIdentity identity = companionIdentity();
    if (!identity.isValid()) {
        errorString = QStringLiteral("Apple TV not configured; scan for it first");
        return CmdStatus::Failure;
    }
    const viera::CredentialSet credentials = companionCredentials();
    if (!credentials.isUsableForWake()) {
        qCWarning(adapterLog) << "Apple TV not paired yet; pair it in the adapter settings first";
        errorString = QStringLiteral("Apple TV not paired");
        return CmdStatus::Failure;
    }

    viera::WakeCascade cascade(m_processes);
    const viera::WakeResult result = cascade.wake(identity, credentials);
    if (!result.succeeded()) {
        qCCritical(adapterLog).noquote() << "Apple TV wake failed:" << result.errorString;
        errorString = result.errorString;
        return CmdStatus::Failure;
    }
    qCInfo(adapterLog) << "Apple TV wake sent via" << result.label;

    bool reachable = false;
    for (int attempt = 0; attempt < kPowerOnProbeAttempts && !shouldAbort(); ++attempt) {
        const std::shared_ptr<const viera::VieraClient> client = m_client;
        if (client && client->isAvailable()) {
            reachable = true;
            break;
        }
        QThread::msleep(kPowerOnProbeSpacingMs);
    }
    if (!reachable) {
        qCWarning(adapterLog) << "TV not reachable after wake; skipping tuner key";
        return CmdStatus::Success;
    }
    setConnected(true);
    emitChannelState(QString::fromLatin1(kChannelConnectivity),
                     static_cast<int>(ConnectivityStatus::Connected));

    QString keyError;
    if (sendKeyCommand(QString::fromLatin1(viera::kTunerKey), keyError) != CmdStatus::Success)
        qCWarning(adapterLog).noquote() << "Tuner key after wake failed:" << keyError;
    return CmdStatus::Success;
}

void VieraAdapter::invokeAdapterAction(const QString &actionId,
                                       const QJsonObject &params,
                                       CmdId cmdId)
{
    if (actionId == QLatin1String("settings")) {
        AdapterInterface::invokeAdapterAction(actionId, params, cmdId);
        return;
    }
    ActionResponse resp;
    resp.id = cmdId;
    resp.tsMs = QDateTime::currentMSecsSinceEpoch();

    if (actionId == QLatin1String("scanCompanion")) {
        scanCompanion(params, resp);
    } else if (actionId == QLatin1String("startPairing")) {
        startPairing(params, resp);
    } else if (actionId == QLatin1String("submitPin")) {
        submitPin(params, resp);
    } else if (actionId == QLatin1String("cancelPairing")) {
        releasePairingSession();
        resp.status = CmdStatus::Success;
    } else {
        resp.status = CmdStatus::NotSupported;
        resp.error = QStringLiteral("Adapter action not supported");
    }
    if (cmdId != 0)
        emit actionResult(resp);
}

void VieraAdapter::scanCompanion(const QJsonObject &params, ActionResponse &resp)
{
    const QString address = viera::CompanionDiscovery::requestedAddress(params);
    viera::CompanionDiscovery discovery(m_processes);
    viera::CandidateDeviceList devices;
    QString errorString;
    if (!discovery.scan(address, devices, errorString)) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("Scan failed: %1").arg(errorString);
        return;
    }
    if (devices.isEmpty()) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("No Apple TV found");
        return;
    }

    QStringList summary;
    for (const viera::CandidateDevice &device : std::as_const(devices))
        summary.append(QStringLiteral("%1 (%2)").arg(device.name, device.address));

    const viera::CandidateDevice &first = devices.constFirst();
    QJsonObject patch;
    patch.insert(QStringLiteral("appleTvIdentifier"), first.identifier);
    patch.insert(QStringLiteral("appleTvAddress"), first.address);
    patch.insert(QStringLiteral("appleTvName"), first.name);
    emit adapterMetaUpdated(patch);

    resp.status = CmdStatus::Success;
    resp.resultType = ActionResultType::String;
    resp.resultValue = QStringLiteral("Found: %1").arg(summary.join(QStringLiteral(", ")));
}

void VieraAdapter::startPairing(const QJsonObject &params, ActionResponse &resp)
{
    const QString protocolValue = params.value(QStringLiteral("protocol")).toString(QStringLiteral("airplay"));
    const std::optional<viera::CompanionProtocol> protocol = viera::protocolFromName(protocolValue);
    if (!protocol) {
        resp.status = CmdStatus::InvalidArgument;
        resp.error = QStringLiteral("Unknown pairing protocol '%1'").arg(protocolValue);
        return;
    }
    const viera::CompanionIdentity identity = companionIdentity();
    if (!identity.isValid()) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("Scan for the Apple TV first");
        return;
    }

    releasePairingSession();
    // The local reference keeps the session alive if it is released while start() waits.
    const std::shared_ptr<viera::PairingSession> session = std::make_shared<viera::PairingSession>(m_processes);
    m_pairingSession = session;
    connect(session.get(), &viera::PairingSession::credentialsReady,
            this, [this](viera::CompanionProtocol paired, const QString &credentials) {
                storeCredentials(paired, credentials);
            });

    const viera::PairingSession::Outcome outcome = session->start(identity, *protocol);
    if (m_pairingSession != session || outcome.state == viera::PairingSession::State::Cancelled) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("Pairing cancelled");
        return;
    }
    switch (outcome.state) {
    case viera::PairingSession::State::AwaitingPin:
        resp.status = CmdStatus::Success;
        resp.resultType = ActionResultType::String;
        resp.resultValue = QStringLiteral("PIN is shown on the Apple TV; enter it and submit");
        return;
    case viera::PairingSession::State::Paired:
        resp.status = CmdStatus::Success;
        resp.resultType = ActionResultType::String;
        resp.resultValue = QStringLiteral("Pairing succeeded (no PIN needed)");
        break;
    default:
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("Pairing failed: %1").arg(outcome.message);
        break;
    }
    releasePairingSession();
}

void VieraAdapter::submitPin(const QJsonObject &params, ActionResponse &resp)
{
    const QJsonValue pinValue = params.value(QStringLiteral("pin"));
    const QString pin = pinValue.isDouble()
        ? QString::number(pinValue.toInt())
        : pinValue.toString().trimmed();
    if (pin.isEmpty()) {
        resp.status = CmdStatus::InvalidArgument;
        resp.error = QStringLiteral("No PIN entered");
        return;
    }
    const std::shared_ptr<viera::PairingSession> session = m_pairingSession;
    if (!session) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("No active pairing session; start pairing first");
        return;
    }

    const viera::PairingSession::Outcome outcome = session->finish(pin);
    const QString protocol = viera::protocolName(session->protocol());
    if (m_pairingSession != session || outcome.state == viera::PairingSession::State::Cancelled) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("Pairing cancelled");
        return;
    }
    if (outcome.error == viera::PairingSession::Error::NoActiveSession) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("No active pairing session; start pairing first");
    } else if (outcome.state == viera::PairingSession::State::Paired) {
        resp.status = CmdStatus::Success;
        resp.resultType = ActionResultType::String;
        resp.resultValue = QStringLiteral("%1 pairing succeeded; credentials stored").arg(protocol);
    } else {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("PIN failed: %1").arg(outcome.message);
    }
    // A PIN arriving while another is being checked must not tear down that exchange.
    if (session->isTerminal() || !session->hasLiveProcess())
        releasePairingSession();
}

void VieraAdapter::storeCredentials(viera::CompanionProtocol protocol, const QString &credentials)
{
    QJsonObject patch;
    patch.insert(credentialsMetaKey(protocol), credentials);
    emit adapterMetaUpdated(patch);
    qCInfo(adapterLog) << "Stored" << viera::protocolName(protocol) << "credentials";
}

void VieraAdapter::releasePairingSession()
{
    if (!m_pairingSession)
        return;
    // A start() or finish() still waiting holds its own reference and returns Cancelled.
    const std::shared_ptr<viera::PairingSession> session = std::move(m_pairingSession);
    session->cancel();
}

viera::CompanionIdentity VieraAdapter::companionIdentity() const
{
    viera::CompanionIdentity identity;
    identity.identifier = adapter().meta.value(QStringLiteral("appleTvIdentifier")).toString().trimmed();
    identity.address = adapter().meta.value(QStringLiteral("appleTvAddress")).toString().trimmed();
    return identity;
}

viera::CredentialSet VieraAdapter::companionCredentials() const
{
    viera::CredentialSet credentials;
    for (viera::CompanionProtocol protocol : { viera::CompanionProtocol::Mrp,
                                               viera::CompanionProtocol::AirPlay,
                                               viera::CompanionProtocol::Companion }) {
        credentials.setValue(protocol,
                             adapter().meta.value(credentialsMetaKey(protocol)).toString().trimmed());
    }
    return credentials;
}

void VieraAdapter::pollStatus()
{
    const std::shared_ptr<const viera::VieraClient> client = m_client;
    if (shouldAbort() || !client)
        return;

    const bool available = client->isAvailable();
    if (available != m_connected) {
        setConnected(available);
        emitChannelState(QString::fromLatin1(kChannelPower), available);
        emitChannelState(QString::fromLatin1(kChannelConnectivity),
                         static_cast<int>(available ? ConnectivityStatus::Connected
                                                    : ConnectivityStatus::Disconnected));
        qCDebug(adapterLog) << "TV" << (available ? "is now reachable" : "is no longer reachable");
    }
    if (!available)
        logConnectFailure(resolveHost());
    updatePollInterval();
    if (!available || shouldAbort())
        return;

    viera::TransportError error;
    const std::optional<int> volume = client->getVolume(&error);
    if (volume)
        emitChannelState(QString::fromLatin1(kChannelVolume), static_cast<double>(*volume));
    else if (error.isError())
        qCDebug(adapterLog).noquote() << "Could not get volume:" << error.message;

    const std::optional<bool> muted = client->getMute(&error);
    if (muted)
        emitChannelState(QString::fromLatin1(kChannelMute), *muted);
    else if (error.isError())
        qCDebug(adapterLog).noquote() << "Could not get mute state:" << error.message;
}

void VieraAdapter::logConnectFailure(const QString &host)
{
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    const QString msg = QStringLiteral("%1|%2").arg(host).arg(m_controlPort);
    if (msg == m_lastConnectError && (nowMs - m_lastConnectLogMs) < kConnectFailureLogIntervalMs)
        return;
    m_lastConnectError = msg;
    m_lastConnectLogMs = nowMs;
    qCWarning(adapterLog) << "Viera TV not reachable:" << "host" << host << "port" << m_controlPort;
}

void VieraAdapter::applyConfig()
{
    const int portValue = adapter().port > 0
        ? static_cast<int>(adapter().port)
        : 0;
    m_controlPort = portValue > 0 ? static_cast<quint16>(portValue) : viera::kDefaultControlPort;
    m_pollIntervalMs = qBound(1000,
                              adapter().meta.value(QStringLiteral("pollIntervalMs")).toInt(15000),
                              300000);
    m_requestTimeoutMs = qBound(500,
                                adapter().meta.value(QStringLiteral("requestTimeoutMs"))
                                    .toInt(viera::kDefaultRequestTimeoutMs),
                                30000);
    m_useAppleTv = adapter().meta.value(QStringLiteral("useAppleTv")).toBool(false);

    const QString host = resolveHost();
    if (host.isEmpty())
        m_client.reset();
    else
        m_client = std::make_shared<viera::VieraClient>(viera::DeviceTarget { host, m_controlPort },
                                                        m_requestTimeoutMs);
    updatePollInterval();
}

void VieraAdapter::updatePollInterval()
{
    if (!m_pollTimer || m_stopping)
        return;
    if (m_pollTimer->interval() != m_pollIntervalMs)
        m_pollTimer->setInterval(m_pollIntervalMs);
    if (!m_pollTimer->isActive())
        m_pollTimer->start();
}

void VieraAdapter::emitDeviceSnapshot()
{
    if (m_synced)
        return;

    m_deviceId = resolveDeviceId();

    Device device;
    device.id = m_deviceId;
    device.deviceClass = DeviceClass::MediaPlayer;
    const QString adapterName = adapter().name.trimmed();
    device.name = !adapterName.isEmpty() ? adapterName : QStringLiteral("Panasonic Viera TV");
    device.manufacturer = QStringLiteral("Panasonic");
    device.model = adapter().meta.value(QStringLiteral("model")).toString().trimmed();

    QJsonObject meta;
    meta.insert(QStringLiteral("host"), resolveHost());
    if (m_useAppleTv) {
        const QString appleTvName = adapter().meta.value(QStringLiteral("appleTvName")).toString().trimmed();
        if (!appleTvName.isEmpty())
            meta.insert(QStringLiteral("wakeDevice"), appleTvName);
    }
    device.meta = meta;

    ChannelList channels;
    Channel power;
    power.id = QString::fromLatin1(kChannelPower);
    power.name = QStringLiteral("Power");
    power.kind = ChannelKind::PowerOnOff;
    power.dataType = ChannelDataType::Bool;
    power.flags = ChannelFlagDefaultWrite;
    channels.push_back(power);

    Channel volume;
    volume.id = QString::fromLatin1(kChannelVolume);
    volume.name = QStringLiteral("Volume");
    volume.kind = ChannelKind::Volume;
    volume.dataType = ChannelDataType::Float;
    volume.flags = ChannelFlagDefaultWrite;
    volume.minValue = 0.0;
    volume.maxValue = 100.0;
    volume.stepValue = 1.0;
    channels.push_back(volume);

    Channel mute;
    mute.id = QString::fromLatin1(kChannelMute);
    mute.name = QStringLiteral("Mute");
    mute.kind = ChannelKind::Mute;
    mute.dataType = ChannelDataType::Bool;
    mute.flags = ChannelFlagDefaultWrite;
    channels.push_back(mute);

    Channel channelNumber;
    channelNumber.id = QString::fromLatin1(kChannelNumber);
    channelNumber.name = QStringLiteral("Channel Number");
    channelNumber.kind = ChannelKind::Unknown;
    channelNumber.dataType = ChannelDataType::Int;
    channelNumber.flags = ChannelFlagDefaultWrite;
    channelNumber.minValue = 1;
    channelNumber.maxValue = kMaxChannelNumber;
    channelNumber.stepValue = 1;
    channels.push_back(channelNumber);

    channels.push_back(buildInputChannel());
    channels.push_back(buildRemoteChannel());

    Channel connectivity;
    connectivity.id = QString::fromLatin1(kChannelConnectivity);
    connectivity.name = QStringLiteral("Connectivity");
    connectivity.kind = ChannelKind::ConnectivityStatus;
    connectivity.dataType = ChannelDataType::Enum;
    connectivity.flags = ChannelFlagDefaultRead;
    channels.push_back(connectivity);

    emit deviceUpdated(device, channels);
    emit fullSyncCompleted();
    m_synced = true;
}

QString VieraAdapter::resolveDeviceId() const
{
    const QString uuid = adapter().meta.value(QStringLiteral("deviceUuid")).toString().trimmed();
    if (!uuid.isEmpty())
        return uuid;
    if (!adapter().id.isEmpty())
        return adapter().id;
    const QString host = resolveHost();
    if (!host.isEmpty())
        return host;
    return QStringLiteral("panasonic-viera");
}

void VieraAdapter::emitChannelState(const QString &channelId, const QVariant &value)
{
    const qint64 tsMs = QDateTime::currentMSecsSinceEpoch();
    emit channelStateUpdated(m_deviceId, channelId, value, tsMs);
}

Channel VieraAdapter::buildInputChannel() const
{
    Channel input;
    input.id = QString::fromLatin1(kChannelInput);
    input.name = QStringLiteral("Input Source");
    input.kind = ChannelKind::HdmiInput;
    input.dataType = ChannelDataType::String;
    input.flags = ChannelFlagDefaultWrite;
    for (const auto &entry : viera::inputKeyCatalogue()) {
        AdapterConfigOption option;
        option.value = entry.first;
        option.label = entry.first.startsWith(QLatin1String("HDMI"))
            ? QStringLiteral("HDMI %1").arg(entry.first.mid(4))
            : entry.first;
        input.choices.push_back(option);
    }
    return input;
}

Channel VieraAdapter::buildRemoteChannel() const
{
    Channel remote;
    remote.id = QString::fromLatin1(kChannelRemote);
    remote.name = QStringLiteral("Remote Control");
    remote.kind = ChannelKind::Unknown;
    remote.dataType = ChannelDataType::String;
    remote.flags = ChannelFlagDefaultWrite;
    for (const auto &entry : viera::remoteKeyCatalogue()) {
        AdapterConfigOption option;
        option.value = entry.first;
        option.label = entry.first;
        remote.choices.push_back(option);
    }
    return remote;
}

} // namespace phicore
