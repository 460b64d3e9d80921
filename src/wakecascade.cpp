#include "wakecascade.h"
#include "vieralog.h"

namespace viera {

namespace {

constexpr auto kWakeAppBundleId = "com.apple.TVWatchList";

QString credentialOption(CompanionProtocol protocol)
{
    return QStringLiteral("--%1-credentials").arg(protocolName(protocol));
}

} // namespace

WakeCascade::WakeCascade(const ControlProcessManager &processes)
    : m_processes(processes)
    , m_strategies(defaultStrategies())
{
}

QList<WakeStrategy> WakeCascade::defaultStrategies()
{
    QList<WakeStrategy> strategies;

    WakeStrategy companionPower;
    companionPower.label = QStringLiteral("companion turn_on");
    companionPower.command = { QStringLiteral("turn_on") };
    companionPower.credentialProtocols = { CompanionProtocol::Companion };
    companionPower.requiredProtocol = CompanionProtocol::Companion;
    strategies.append(companionPower);

    WakeStrategy airplayPower;
    airplayPower.label = QStringLiteral("airplay turn_on");
    airplayPower.command = { QStringLiteral("turn_on") };
    airplayPower.credentialProtocols = { CompanionProtocol::Mrp, CompanionProtocol::AirPlay };
    strategies.append(airplayPower);

    WakeStrategy launchApp;
    launchApp.label = QStringLiteral("launch_app");
    launchApp.command = { QStringLiteral("launch_app=%1").arg(QString::fromLatin1(kWakeAppBundleId)) };
    launchApp.credentialProtocols = { CompanionProtocol::Companion };
    launchApp.requiredProtocol = CompanionProtocol::Companion;
    strategies.append(launchApp);

    WakeStrategy homeHold;
    homeHold.label = QStringLiteral("home_hold");
    homeHold.command = { QStringLiteral("home_hold") };
    homeHold.credentialProtocols = { CompanionProtocol::Mrp, CompanionProtocol::AirPlay,
                                     CompanionProtocol::Companion };
    strategies.append(homeHold);

    return strategies;
}

QStringList WakeCascade::buildArguments(const WakeStrategy &strategy,
                                        const CompanionIdentity &identity,
                                        const CredentialSet &credentials)
{
    QStringList args;
    const QString identifier = identity.identifier.trimmed();
    const QString address = identity.address.trimmed();
    if (!identifier.isEmpty())
        args << QStringLiteral("--id") << identifier;
    if (!address.isEmpty())
        args << QStringLiteral("--address") << address;
    for (CompanionProtocol protocol : strategy.credentialProtocols) {
        const QString value = credentials.value(protocol).trimmed();
        if (!value.isEmpty())
            args << credentialOption(protocol) << value;
    }
    args << strategy.command;
    return args;
}

WakeResult WakeCascade::wake(const CompanionIdentity &identity, const CredentialSet &credentials) const
{
    WakeResult result;
    if (!identity.isValid()) {
        result.error = WakeResult::Error::InvalidIdentity;
        result.errorString = QStringLiteral("Companion device has neither identifier nor address");
        return result;
    }
    if (!credentials.isUsableForWake()) {
        result.error = WakeResult::Error::NotPaired;
        result.errorString = QStringLiteral("Companion device not paired (no airplay or companion credentials)");
        return result;
    }

    QString lastError;
    for (const WakeStrategy &strategy : m_strategies) {
        WakeAttemptResult attempt;
        attempt.strategyLabel = strategy.label;

        if (strategy.requiredProtocol
            && credentials.value(*strategy.requiredProtocol).trimmed().isEmpty()) {
            attempt.rawOutput = QStringLiteral("skipped: no %1 credentials")
                                    .arg(protocolName(*strategy.requiredProtocol));
            qCDebug(vieraWakeLog).noquote() << "Wake strategy" << strategy.label << attempt.rawOutput;
            result.attempts.append(attempt);
            continue;
        }

        const QStringList args = buildArguments(strategy, identity, credentials);
        const ExecResult exec = m_processes.runTool(QString::fromLatin1(kControlBinaryName), args, m_timeoutMs);
        attempt.rawOutput = exec.combinedOutput().trimmed();

        if (exec.ok()) {
            attempt.succeeded = true;
            result.attempts.append(attempt);
            result.label = strategy.label;
            qCInfo(vieraWakeLog) << "Companion wake succeeded via" << strategy.label;
            return result;
        }

        result.attempts.append(attempt);
        lastError = exec.errorString;
        qCWarning(vieraWakeLog).noquote()
            << "Wake strategy" << strategy.label << "failed (" + execErrorName(exec.error) + "):"
            << exec.errorString;

        // No binary and provisioning failed: the remaining strategies cannot do better.
        if (exec.error == ExecResult::Error::SpawnFailure
            && m_processes.locateBinary(QString::fromLatin1(kControlBinaryName)).isEmpty()) {
            result.error = WakeResult::Error::BinaryUnavailable;
            result.errorString = exec.errorString;
            return result;
        }
    }

    result.error = WakeResult::Error::AllStrategiesFailed;
    result.errorString = QStringLiteral("All %1 wake strategies failed").arg(result.attempts.size());
    if (!lastError.isEmpty())
        result.errorString += QStringLiteral(" (last: %1)").arg(lastError.left(200));
    return result;
}

} // namespace viera
