#pragma once

#include "controlprocess.h"
#include "vieratypes.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

namespace viera {

constexpr int kScanTimeoutMs = 20000;

// Finds companion boxes by running the control binary in scan mode.
class CompanionDiscovery
{
public:
    explicit CompanionDiscovery(const ControlProcessManager &processes);

    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int timeoutMs) { m_timeoutMs = timeoutMs; }

    /// Directed (unicast) scan when targetAddress is set, broadcast otherwise.
    bool scan(const QString &targetAddress, CandidateDeviceList &devices, QString &errorString) const;

    static QStringList buildArguments(const QString &targetAddress);
    // Address for a directed scan from action parameters: appleTvAddress, then address.
    static QString requestedAddress(const QJsonObject &params);
    static CandidateDeviceList parseScanOutput(const QString &output);
    static bool isMacAddress(const QString &value);

private:
    const ControlProcessManager &m_processes;
    int m_timeoutMs = kScanTimeoutMs;
};

} // namespace viera
