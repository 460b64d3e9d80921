#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

namespace viera {

constexpr auto kControlBinaryName = "atvremote";
constexpr auto kControlPackageName = "pyatv";

struct ExecResult
{
    enum class Error {
        None,
        SpawnFailure,
        Timeout,
        NonZeroExit,
    };

    Error error = Error::None;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;
    QString errorString;

    bool ok() const { return error == Error::None; }
    QString combinedOutput() const;
    // Captured output cut down to maxChars for log lines and error messages.
    QString diagnostics(int maxChars = 300) const;
};

QString execErrorName(ExecResult::Error error);

struct InstallMethod
{
    QString label;
    QString program;
    QStringList arguments;
};

/**
 * Finds, provisions and runs the external companion-control binary.
 *
 * Search paths and installer fallbacks are plain instance state so the
 * adapter (and tests) decide where to look; nothing is global.
 */
class ControlProcessManager
{
public:
    ControlProcessManager();

    static QStringList defaultSearchPaths();
    static QList<InstallMethod> defaultInstallMethods();

    QStringList searchPaths() const { return m_searchPaths; }
    void setSearchPaths(const QStringList &paths) { m_searchPaths = paths; }
    // Root whose <user>/.local/bin directories are scanned after the fixed paths.
    QString homeRoot() const { return m_homeRoot; }
    void setHomeRoot(const QString &root) { m_homeRoot = root; }
    QList<InstallMethod> installMethods() const { return m_installMethods; }
    void setInstallMethods(const QList<InstallMethod> &methods) { m_installMethods = methods; }
    int installTimeoutMs() const { return m_installTimeoutMs; }
    void setInstallTimeoutMs(int timeoutMs) { m_installTimeoutMs = timeoutMs; }

    /// Returns the absolute path of the first executable match, or an empty string.
    QString locateBinary(const QString &name) const;

    /// locateBinary(), falling back to the installer cascade once when nothing is found.
    QString ensureBinary(const QString &name, QString &errorString) const;

    ExecResult run(const QString &program, const QStringList &arguments, int timeoutMs) const;

    /// Locates (or provisions) the binary and runs it; a spawn failure triggers
    /// one provisioning attempt and a single re-run.
    ExecResult runTool(const QString &name, const QStringList &arguments, int timeoutMs) const;

    static QString describeArguments(const QStringList &arguments);

private:
    bool provision(QString &errorString) const;

    QStringList m_searchPaths;
    QString m_homeRoot;
    QList<InstallMethod> m_installMethods;
    int m_installTimeoutMs = 180000;
};

} // namespace viera
