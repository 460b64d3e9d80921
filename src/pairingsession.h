#pragma once

#include "controlprocess.h"
#include "vieratypes.h"

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

class QEventLoop;

namespace viera {

constexpr int kPairingTimeoutMs = 30000;

/**
 * One interactive pairing handshake with the companion box.
 *
 * The session owns the long-lived control subprocess for its whole life:
 * start() spawns it and returns once a PIN prompt shows up, the process
 * exits or the timeout expires; finish() feeds the PIN and waits for the
 * process to exit. The subprocess is terminated on every exit path.
 *
 * Only one session per device should exist at a time; the caller owns the
 * session and must cancel the previous one before starting another.
 */
class PairingSession : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Starting,
        AwaitingPin,
        Finishing,
        Paired,
        Failed,
        Cancelled,
    };
    Q_ENUM(State)

    enum class Error {
        None,
        Timeout,
        NoActiveSession,
        NoCredentialsExtracted,
        BinaryUnavailable,
        SpawnFailure,
        InvalidIdentity,
        AlreadyStarted,
    };
    Q_ENUM(Error)

    struct Outcome
    {
        State state = State::Idle;
        Error error = Error::None;
        QString credentials;
        QString message;
    };

    explicit PairingSession(const ControlProcessManager &processes, QObject *parent = nullptr);
    ~PairingSession() override;

    Outcome start(const CompanionIdentity &identity, CompanionProtocol protocol);
    Outcome finish(const QString &pin);
    // Terminates the subprocess; safe to call repeatedly and from any state.
    void cancel();

    State state() const { return m_state; }
    CompanionProtocol protocol() const { return m_protocol; }
    bool isTerminal() const;
    bool hasLiveProcess() const;
    QString output() const { return m_output; }

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }

    static QStringList buildArguments(const CompanionIdentity &identity, CompanionProtocol protocol);
    static bool containsPinPrompt(const QString &output);
    // Labelled "credentials:" line first; otherwise the last long hex:colon token.
    static QString extractCredentials(const QString &output);

signals:
    void stateChanged(viera::PairingSession::State state);
    void credentialsReady(viera::CompanionProtocol protocol, const QString &credentials);

private:
    void setState(State state);
    Outcome outcome(Error error = Error::None, const QString &message = QString()) const;
    Outcome fail(Error error, const QString &message);
    Outcome complete(const QString &credentials);
    Outcome cancelledOutcome() const;
    Outcome resolveExit();
    bool waitUntil(const std::function<bool()> &done, int timeoutMs);
    void wakeWaiter();
    void releaseProcess();

    const ControlProcessManager &m_processes;
    State m_state = State::Idle;
    CompanionProtocol m_protocol = CompanionProtocol::AirPlay;
    int m_timeoutMs = kPairingTimeoutMs;
    QProcess *m_process = nullptr;
    QEventLoop *m_waitLoop = nullptr;
    QString m_output;
    int m_pinOffset = -1;
    bool m_exited = false;
    bool m_crashed = false;
    int m_exitCode = -1;
    bool m_spawnFailed = false;
    QString m_spawnError;
};

} // namespace viera
