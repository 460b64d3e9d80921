#include "controlprocess.h"
#include "vieralog.h"

#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace viera {

namespace {

constexpr int kKillGraceMs = 1000;
constexpr int kLoggedArgumentChars = 20;

bool isExecutableFile(const QString &path)
{
    const QFileInfo info(path);
    return info.exists() && info.isFile() && info.isExecutable();
}

} // namespace

QString ExecResult::combinedOutput() const
{
    QString text = QString::fromLocal8Bit(standardOutput);
    const QString err = QString::fromLocal8Bit(standardError);
    if (!err.isEmpty()) {
        if (!text.isEmpty() && !text.endsWith(QLatin1Char('\n')))
            text.append(QLatin1Char('\n'));
        text.append(err);
    }
    return text;
}

QString ExecResult::diagnostics(int maxChars) const
{
    const QString text = combinedOutput().trimmed();
    if (maxChars <= 0 || text.size() <= maxChars)
        return text;
    return text.left(maxChars) + QStringLiteral("...");
}

QString execErrorName(ExecResult::Error error)
{
    switch (error) {
    case ExecResult::Error::None:
        return QStringLiteral("none");
    case ExecResult::Error::SpawnFailure:
        return QStringLiteral("spawnFailure");
    case ExecResult::Error::Timeout:
        return QStringLiteral("timeout");
    case ExecResult::Error::NonZeroExit:
        return QStringLiteral("nonZeroExit");
    }
    return QString();
}

ControlProcessManager::ControlProcessManager()
    : m_searchPaths(defaultSearchPaths())
    , m_homeRoot(QStringLiteral("/home"))
    , m_installMethods(defaultInstallMethods())
{
}

QStringList ControlProcessManager::defaultSearchPaths()
{
    return {
        QStringLiteral("/usr/local/bin"),
        QStringLiteral("/usr/bin"),
        QStringLiteral("/home/iobroker/.local/bin"),
        QStringLiteral("/root/.local/bin"),
        QStringLiteral("/opt/iobroker/.local/bin"),
        QStringLiteral("/snap/bin"),
    };
}

QList<InstallMethod> ControlProcessManager::defaultInstallMethods()
{
    const QString package = QString::fromLatin1(kControlPackageName);
    return {
        { QStringLiteral("pipx"), QStringLiteral("pipx"), { QStringLiteral("install"), package } },
        { QStringLiteral("pip3 --user"), QStringLiteral("pip3"),
          { QStringLiteral("install"), QStringLiteral("--user"), package } },
        { QStringLiteral("python3 -m pip"), QStringLiteral("python3"),
          { QStringLiteral("-m"), QStringLiteral("pip"), QStringLiteral("install"), QStringLiteral("--user"),
            QStringLiteral("--break-system-packages"), package } },
    };
}

QString ControlProcessManager::locateBinary(const QString &name) const
{
    for (const QString &dir : m_searchPaths) {
        const QString candidate = QDir(dir).filePath(name);
        if (isExecutableFile(candidate))
            return candidate;
    }
    if (m_homeRoot.isEmpty())
        return QString();
    const QDir home(m_homeRoot);
    if (!home.exists())
        return QString();
    const QStringList users = home.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &user : users) {
        const QString candidate = home.filePath(user + QStringLiteral("/.local/bin/") + name);
        if (isExecutableFile(candidate))
            return candidate;
    }
    return QString();
}

QString ControlProcessManager::ensureBinary(const QString &name, QString &errorString) const
{
    errorString.clear();
    QString path = locateBinary(name);
    if (!path.isEmpty())
        return path;

    qCInfo(vieraProcessLog) << name << "not found; trying to install" << kControlPackageName;
    if (!provision(errorString))
        return QString();

    path = locateBinary(name);
    if (path.isEmpty()) {
        errorString = QStringLiteral("%1 installed but %2 is still not in any known location")
                          .arg(QString::fromLatin1(kControlPackageName), name);
        qCWarning(vieraProcessLog).noquote() << errorString;
    }
    return path;
}

bool ControlProcessManager::provision(QString &errorString) const
{
    QStringList attempted;
    for (const InstallMethod &method : m_installMethods) {
        attempted.append(method.label);
        const QString program = QStandardPaths::findExecutable(method.program);
        if (program.isEmpty()) {
            qCDebug(vieraProcessLog) << "Installer" << method.label << "unavailable";
            continue;
        }
        qCInfo(vieraProcessLog) << "Installing" << kControlPackageName << "via" << method.label;
        const ExecResult result = run(program, method.arguments, m_installTimeoutMs);
        if (result.ok()) {
            qCInfo(vieraProcessLog) << "Installed" << kControlPackageName << "via" << method.label;
            return true;
        }
        qCWarning(vieraProcessLog).noquote()
            << "Install via" << method.label << "failed:" << execErrorName(result.error)
            << result.diagnostics();
    }
    errorString = QStringLiteral("%1 not found and installation failed (tried: %2)")
                      .arg(QString::fromLatin1(kControlBinaryName),
                           attempted.isEmpty() ? QStringLiteral("no installers configured")
                                               : attempted.join(QStringLiteral(", ")));
    qCWarning(vieraProcessLog).noquote() << errorString;
    return false;
}

ExecResult ControlProcessManager::run(const QString &program, const QStringList &arguments, int timeoutMs) const
{
    ExecResult result;
    qCDebug(vieraProcessLog).noquote() << "Executing:" << program << describeArguments(arguments);

    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.start();
    if (!process.waitForStarted(timeoutMs)) {
        result.error = ExecResult::Error::SpawnFailure;
        result.errorString = QStringLiteral("Failed to start %1: %2").arg(program, process.errorString());
        if (process.state() != QProcess::NotRunning) {
            process.kill();
            process.waitForFinished(kKillGraceMs);
        }
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(kKillGraceMs);
        result.error = ExecResult::Error::Timeout;
        result.standardOutput = process.readAllStandardOutput();
        result.standardError = process.readAllStandardError();
        result.errorString = QStringLiteral("%1 timed out after %2 ms").arg(program).arg(timeoutMs);
        return result;
    }

    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();
    result.exitCode = process.exitCode();
    if (process.exitStatus() != QProcess::NormalExit) {
        result.error = ExecResult::Error::NonZeroExit;
        result.exitCode = -1;
        result.errorString = QStringLiteral("%1 crashed: %2").arg(program, result.diagnostics());
    } else if (result.exitCode != 0) {
        result.error = ExecResult::Error::NonZeroExit;
        result.errorString = QStringLiteral("%1 exited with code %2: %3")
                                 .arg(program)
                                 .arg(result.exitCode)
                                 .arg(result.diagnostics());
    }
    return result;
}

ExecResult ControlProcessManager::runTool(const QString &name, const QStringList &arguments, int timeoutMs) const
{
    QString errorString;
    const QString path = ensureBinary(name, errorString);
    if (path.isEmpty()) {
        ExecResult result;
        result.error = ExecResult::Error::SpawnFailure;
        result.errorString = errorString;
        return result;
    }

    ExecResult result = run(path, arguments, timeoutMs);
    if (result.error != ExecResult::Error::SpawnFailure)
        return result;

    qCWarning(vieraProcessLog).noquote() << result.errorString << "- reprovisioning once";
    if (!provision(errorString)) {
        result.errorString = errorString;
        return result;
    }
    const QString retried = locateBinary(name);
    if (retried.isEmpty())
        return result;
    return run(retried, arguments, timeoutMs);
}

QString ControlProcessManager::describeArguments(const QStringList &arguments)
{
    QStringList shortened;
    shortened.reserve(arguments.size());
    for (const QString &arg : arguments) {
        if (arg.size() > kLoggedArgumentChars)
            shortened.append(arg.left(kLoggedArgumentChars) + QStringLiteral("..."));
        else
            shortened.append(arg);
    }
    return shortened.join(QLatin1Char(' '));
}

} // namespace viera
