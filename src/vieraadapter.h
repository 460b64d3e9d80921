#pragma once

#include "adapterinterface.h"

#include "controlprocess.h"
#include "soaptransport.h"
#include "vieratypes.h"

#include <QTimer>

#include <memory>

namespace viera {
class PairingSession;
class VieraClient;
}

namespace phicore {

class VieraAdapter : public AdapterInterface
{
    Q_OBJECT

public:
    explicit VieraAdapter(QObject *parent = nullptr);
    ~VieraAdapter() override;

protected:
    bool start(QString &errorString) override;
    void stop() override;
    void requestFullSync() override;
    void adapterConfigUpdated() override;
    void updateChannelState(const QString &deviceExternalId,
                            const QString &channelExternalId,
                            const QVariant &value,
                            CmdId cmdId) override;
    void invokeAdapterAction(const QString &actionId,
                             const QJsonObject &params,
                             CmdId cmdId) override;

private:
    void applyConfig();
    void updatePollInterval();
    void setConnected(bool connected);
    void pollStatus();
    void logConnectFailure(const QString &host);
    bool shouldAbort() const;
    QString resolveHost() const;
    void emitDeviceSnapshot();
    Channel buildInputChannel() const;
    Channel buildRemoteChannel() const;
    QString resolveDeviceId() const;
    void emitChannelState(const QString &channelId, const QVariant &value);
    CmdStatus sendKeyCommand(const QString &key, QString &errorString);
    CmdStatus powerOn(QString &errorString);
    CmdStatus enterChannel(int channel, QString &errorString);
    viera::CompanionIdentity companionIdentity() const;
    viera::CredentialSet companionCredentials() const;
    void storeCredentials(viera::CompanionProtocol protocol, const QString &credentials);
    void releasePairingSession();
    void scanCompanion(const QJsonObject &params, ActionResponse &resp);
    void startPairing(const QJsonObject &params, ActionResponse &resp);
    void submitPin(const QJsonObject &params, ActionResponse &resp);

    bool m_connected = false;
    bool m_synced = false;
    bool m_stopping = false;
    bool m_channelEntryActive = false;
    QString m_deviceId;
    quint16 m_controlPort = viera::kDefaultControlPort;
    int m_pollIntervalMs = 15000;
    int m_requestTimeoutMs = viera::kDefaultRequestTimeoutMs;
    bool m_useAppleTv = false;
    std::shared_ptr<const viera::VieraClient> m_client;
    viera::ControlProcessManager m_processes;
    std::shared_ptr<viera::PairingSession> m_pairingSession;
    QTimer *m_pollTimer = nullptr;
    QString m_lastConnectError;
    qint64 m_lastConnectLogMs = 0;
};

} // namespace phicore
