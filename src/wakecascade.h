#pragma once

#include "controlprocess.h"
#include "vieratypes.h"

#include <QList>
#include <QString>
#include <QStringList>

namespace viera {

constexpr int kWakeTimeoutMs = 15000;

struct WakeStrategy
{
    QString label;
    QStringList command;
    // Credential fields passed to the binary for this strategy.
    QList<CompanionProtocol> credentialProtocols;
    // Set when the strategy cannot work without this protocol's credentials.
    std::optional<CompanionProtocol> requiredProtocol;
};

struct WakeAttemptResult
{
    QString strategyLabel;
    bool succeeded = false;
    QString rawOutput;
};

struct WakeResult
{
    enum class Error {
        None,
        InvalidIdentity,
        NotPaired,
        BinaryUnavailable,
        AllStrategiesFailed,
    };

    Error error = Error::None;
    QString label;
    QString errorString;
    QList<WakeAttemptResult> attempts;

    bool succeeded() const { return error == Error::None; }
};

/**
 * Wakes the companion box (which then powers the television on over
 * HDMI-CEC) by trying an ordered list of remote commands. Later entries
 * are weaker signals, so the order is significant.
 */
class WakeCascade
{
public:
    explicit WakeCascade(const ControlProcessManager &processes);

    static QList<WakeStrategy> defaultStrategies();
    static QStringList buildArguments(const WakeStrategy &strategy,
                                      const CompanionIdentity &identity,
                                      const CredentialSet &credentials);

    QList<WakeStrategy> strategies() const { return m_strategies; }
    void setStrategies(const QList<WakeStrategy> &strategies) { m_strategies = strategies; }
    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }

    WakeResult wake(const CompanionIdentity &identity, const CredentialSet &credentials) const;

private:
    const ControlProcessManager &m_processes;
    QList<WakeStrategy> m_strategies;
    int m_timeoutMs = kWakeTimeoutMs;
};

} // namespace viera
