#include "pairingsession.h"
#include "vieralog.h"

#include <QDeadlineTimer>
#include <QEventLoop>
#include <QRegularExpression>
#include <QTimer>

namespace viera {

namespace {

constexpr int kTerminateGraceMs = 2000;
constexpr int kKillGraceMs = 1000;
constexpr int kMinHexTokenLength = 32;
constexpr int kDiagnosticChars = 300;

QString shorten(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.size() <= kDiagnosticChars)
        return trimmed;
    return trimmed.left(kDiagnosticChars) + QStringLiteral("...");
}

} // namespace

PairingSession::PairingSession(const ControlProcessManager &processes, QObject *parent)
    : QObject(parent)
    , m_processes(processes)
{
}

PairingSession::~PairingSession()
{
    releaseProcess();
}

bool PairingSession::isTerminal() const
{
    return m_state == State::Paired || m_state == State::Failed || m_state == State::Cancelled;
}

bool PairingSession::hasLiveProcess() const
{
    return m_process && !m_exited && m_process->state() != QProcess::NotRunning;
}

QStringList PairingSession::buildArguments(const CompanionIdentity &identity, CompanionProtocol protocol)
{
    QStringList args;
    const QString identifier = identity.identifier.trimmed();
    const QString address = identity.address.trimmed();
    if (!identifier.isEmpty())
        args << QStringLiteral("--id") << identifier;
    if (!address.isEmpty())
        args << QStringLiteral("--address") << address;
    args << QStringLiteral("--protocol") << protocolName(protocol)
         << QStringLiteral("--port") << QString::number(defaultPairingPort(protocol))
         << QStringLiteral("pair");
    return args;
}

bool PairingSession::containsPinPrompt(const QString &output)
{
    static const QRegularExpression prompt(QStringLiteral("enter\\s+(?:the\\s+)?pin"),
                                           QRegularExpression::CaseInsensitiveOption);
    return prompt.match(output).hasMatch();
}

QString PairingSession::extractCredentials(const QString &output)
{
    static const QRegularExpression lineBreak(QStringLiteral("[\\r\\n]+"));
    static const QRegularExpression labelled(QStringLiteral("credentials:\\s*(\\S+)"),
                                             QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression hexToken(
        QStringLiteral("\\b[0-9A-Fa-f]{8,}(?::[0-9A-Fa-f]{8,})+\\b"));

    const QStringList lines = output.split(lineBreak, Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QRegularExpressionMatch match = labelled.match(line);
        if (match.hasMatch())
            return match.captured(1).trimmed();
    }

    QString last;
    for (const QString &line : lines) {
        QRegularExpressionMatchIterator it = hexToken.globalMatch(line);
        while (it.hasNext()) {
            const QString token = it.next().captured(0);
            if (token.size() >= kMinHexTokenLength)
                last = token;
        }
    }
    return last;
}

PairingSession::Outcome PairingSession::start(const CompanionIdentity &identity, CompanionProtocol protocol)
{
    if (m_state != State::Idle)
        return outcome(Error::AlreadyStarted, QStringLiteral("Pairing session already used"));

    m_protocol = protocol;
    setState(State::Starting);
    if (!identity.isValid())
        return fail(Error::InvalidIdentity, QStringLiteral("Companion device has neither identifier nor address"));

    QString errorString;
    const QString program = m_processes.ensureBinary(QString::fromLatin1(kControlBinaryName), errorString);
    if (m_state == State::Cancelled)
        return cancelledOutcome();
    if (program.isEmpty())
        return fail(Error::BinaryUnavailable, errorString);

    const QStringList args = buildArguments(identity, protocol);
    qCInfo(vieraPairingLog).noquote() << "Starting" << protocolName(protocol) << "pairing:"
                                      << program << ControlProcessManager::describeArguments(args);

    QProcess *process = new QProcess(this);
    m_process = process;
    process->setProcessChannelMode(QProcess::MergedChannels);
    connect(process, &QProcess::readyReadStandardOutput, this, [this, process]() {
        m_output += QString::fromLocal8Bit(process->readAllStandardOutput());
        wakeWaiter();
    });
    connect(process, &QProcess::finished, this, [this, process](int exitCode, QProcess::ExitStatus status) {
        m_output += QString::fromLocal8Bit(process->readAllStandardOutput());
        m_exited = true;
        m_exitCode = exitCode;
        m_crashed = status != QProcess::NormalExit;
        wakeWaiter();
    });
    connect(process, &QProcess::errorOccurred, this, [this, process](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart)
            return;
        m_spawnFailed = true;
        m_spawnError = process->errorString();
        wakeWaiter();
    });
    process->start(program, args);

    const bool settled = waitUntil([this]() {
        return m_state == State::Cancelled || m_spawnFailed || m_exited || containsPinPrompt(m_output);
    }, m_timeoutMs);

    if (m_state == State::Cancelled)
        return cancelledOutcome();
    if (m_spawnFailed)
        return fail(Error::SpawnFailure, QStringLiteral("Failed to start %1: %2").arg(program, m_spawnError));
    if (!settled) {
        return fail(Error::Timeout, m_output.trimmed().isEmpty()
                        ? QStringLiteral("No output from pairing process within %1 ms").arg(m_timeoutMs)
                        : QStringLiteral("No PIN prompt within %1 ms: %2").arg(m_timeoutMs).arg(shorten(m_output)));
    }
    if (m_exited)
        return resolveExit();

    qCInfo(vieraPairingLog) << "Pairing process waiting for PIN";
    setState(State::AwaitingPin);
    return outcome(Error::None, QStringLiteral("PIN displayed on device"));
}

PairingSession::Outcome PairingSession::finish(const QString &pin)
{
    if (m_state != State::AwaitingPin || !hasLiveProcess())
        return outcome(Error::NoActiveSession, QStringLiteral("No pairing session is waiting for a PIN"));

    setState(State::Finishing);
    m_pinOffset = m_output.size();
    m_process->write(pin.trimmed().toUtf8() + '\n');

    const bool exited = waitUntil([this]() {
        return m_state == State::Cancelled || m_exited;
    }, m_timeoutMs);

    if (m_state == State::Cancelled)
        return cancelledOutcome();
    if (!exited)
        return fail(Error::Timeout, QStringLiteral("Pairing process did not finish within %1 ms").arg(m_timeoutMs));
    return resolveExit();
}

PairingSession::Outcome PairingSession::resolveExit()
{
    const QString credentials = extractCredentials(m_output);
    if (!credentials.isEmpty())
        return complete(credentials);

    const bool cleanExit = !m_crashed && m_exitCode == 0;
    if (cleanExit && m_state == State::Finishing) {
        // Zero exit without a recognisable credential line; the raw reply is all there is.
        const QString raw = m_output.mid(qMax(0, m_pinOffset)).trimmed();
        if (!raw.isEmpty()) {
            qCWarning(vieraPairingLog) << "No credential pattern in pairing output; storing raw output";
            return complete(raw);
        }
    }
    if (m_crashed) {
        return fail(Error::NoCredentialsExtracted,
                    QStringLiteral("Pairing process crashed: %1").arg(shorten(m_output)));
    }
    return fail(Error::NoCredentialsExtracted,
                QStringLiteral("Pairing process exited with code %1 without credentials: %2")
                    .arg(m_exitCode)
                    .arg(shorten(m_output)));
}

void PairingSession::cancel()
{
    if (!isTerminal()) {
        qCInfo(vieraPairingLog) << "Cancelling" << protocolName(m_protocol) << "pairing in state" << m_state;
        setState(State::Cancelled);
    }
    releaseProcess();
    wakeWaiter();
}

void PairingSession::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    emit stateChanged(state);
}

PairingSession::Outcome PairingSession::outcome(Error error, const QString &message) const
{
    Outcome result;
    result.state = m_state;
    result.error = error;
    result.message = message;
    return result;
}

PairingSession::Outcome PairingSession::fail(Error error, const QString &message)
{
    qCWarning(vieraPairingLog).noquote() << protocolName(m_protocol) << "pairing failed:" << message;
    releaseProcess();
    setState(State::Failed);
    return outcome(error, message);
}

PairingSession::Outcome PairingSession::complete(const QString &credentials)
{
    releaseProcess();
    setState(State::Paired);
    qCInfo(vieraPairingLog) << protocolName(m_protocol) << "pairing succeeded";
    emit credentialsReady(m_protocol, credentials);
    Outcome result = outcome(Error::None, QStringLiteral("Paired"));
    result.credentials = credentials;
    return result;
}

PairingSession::Outcome PairingSession::cancelledOutcome() const
{
    return outcome(Error::None, QStringLiteral("Pairing cancelled"));
}

bool PairingSession::waitUntil(const std::function<bool()> &done, int timeoutMs)
{
    const QDeadlineTimer deadline(timeoutMs);
    while (!done()) {
        const qint64 remaining = deadline.remainingTime();
        if (remaining <= 0)
            return false;
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        timer.start(static_cast<int>(remaining));
        QEventLoop *outer = m_waitLoop;
        m_waitLoop = &loop;
        loop.exec(QEventLoop::ExcludeUserInputEvents);
        m_waitLoop = outer;
    }
    return true;
}

void PairingSession::wakeWaiter()
{
    if (m_waitLoop)
        m_waitLoop->quit();
}

void PairingSession::releaseProcess()
{
    if (!m_process)
        return;
    QProcess *process = m_process;
    m_process = nullptr;
    process->disconnect(this);
    if (process->state() != QProcess::NotRunning) {
        process->terminate();
        if (!process->waitForFinished(kTerminateGraceMs)) {
            process->kill();
            process->waitForFinished(kKillGraceMs);
        }
    }
    process->deleteLater();
}

} // namespace viera
