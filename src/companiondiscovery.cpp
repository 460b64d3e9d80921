#include "companiondiscovery.h"
#include "vieralog.h"

#include <QJsonValue>
#include <QRegularExpression>

#include <utility>

namespace viera {

namespace {

struct ScanBlock
{
    QString name;
    QString address;
    QString mac;
    QString model;
    QStringList identifiers;
};

bool isSeparatorRule(const QString &line)
{
    static const QRegularExpression rule(QStringLiteral("^\\s*[=\\-]{3,}\\s*$"));
    return rule.match(line).hasMatch();
}

QString fieldValue(const QString &trimmedLine, const QString &label)
{
    return trimmedLine.mid(label.size()).trimmed();
}

void flushBlock(ScanBlock &block, CandidateDeviceList &devices)
{
    CandidateDevice device;
    device.name = block.name;
    device.address = block.address;
    device.mac = block.mac;
    device.model = block.model;

    for (const QString &id : std::as_const(block.identifiers)) {
        if (CompanionDiscovery::isMacAddress(id)) {
            device.identifier = id;
            break;
        }
    }
    if (device.identifier.isEmpty() && !block.identifiers.isEmpty())
        device.identifier = block.identifiers.constFirst();
    if (device.identifier.isEmpty() && !block.mac.isEmpty())
        device.identifier = block.mac;

    if (!device.identifier.isEmpty() || !device.address.isEmpty()) {
        if (device.name.isEmpty())
            device.name = !device.address.isEmpty() ? device.address : device.identifier;
        devices.append(device);
    } else if (!device.name.isEmpty()) {
        qCDebug(vieraDiscoveryLog) << "Dropping scan entry without identifier or address:" << device.name;
    }
    block = ScanBlock();
}

} // namespace

CompanionDiscovery::CompanionDiscovery(const ControlProcessManager &processes)
    : m_processes(processes)
{
}

bool CompanionDiscovery::isMacAddress(const QString &value)
{
    static const QRegularExpression mac(
        QStringLiteral("^[0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5}$"));
    return mac.match(value.trimmed()).hasMatch();
}

QStringList CompanionDiscovery::buildArguments(const QString &targetAddress)
{
    QStringList args;
    const QString address = targetAddress.trimmed();
    if (!address.isEmpty())
        args << QStringLiteral("--scan-hosts") << address;
    args << QStringLiteral("scan");
    return args;
}

QString CompanionDiscovery::requestedAddress(const QJsonObject &params)
{
    const QString address = params.value(QStringLiteral("appleTvAddress")).toString().trimmed();
    if (!address.isEmpty())
        return address;
    return params.value(QStringLiteral("address")).toString().trimmed();
}

CandidateDeviceList CompanionDiscovery::parseScanOutput(const QString &output)
{
    CandidateDeviceList devices;
    ScanBlock block;
    bool inIdentifiers = false;

    const QStringList lines = output.split(QLatin1Char('\n'));
    for (const QString &rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || isSeparatorRule(line)) {
            flushBlock(block, devices);
            inIdentifiers = false;
            continue;
        }

        if (inIdentifiers) {
            if (line.startsWith(QLatin1Char('-'))) {
                const QString id = line.mid(1).trimmed();
                if (!id.isEmpty())
                    block.identifiers.append(id);
                continue;
            }
            inIdentifiers = false;
        }

        if (line.startsWith(QLatin1String("Name:"))) {
            block.name = fieldValue(line, QStringLiteral("Name:"));
        } else if (line.startsWith(QLatin1String("Address:"))) {
            block.address = fieldValue(line, QStringLiteral("Address:"));
        } else if (line.startsWith(QLatin1String("MAC:"))) {
            block.mac = fieldValue(line, QStringLiteral("MAC:"));
        } else if (line.startsWith(QLatin1String("Model/SW:"))) {
            block.model = fieldValue(line, QStringLiteral("Model/SW:"));
        } else if (line.startsWith(QLatin1String("Identifiers:"))) {
            inIdentifiers = true;
            const QString inlineId = fieldValue(line, QStringLiteral("Identifiers:"));
            if (!inlineId.isEmpty())
                block.identifiers.append(inlineId);
        }
    }
    flushBlock(block, devices);
    return devices;
}

bool CompanionDiscovery::scan(const QString &targetAddress, CandidateDeviceList &devices, QString &errorString) const
{
    devices.clear();
    errorString.clear();
    const QStringList args = buildArguments(targetAddress);
    qCInfo(vieraDiscoveryLog) << "Scanning for companion devices"
                              << (targetAddress.trimmed().isEmpty() ? QStringLiteral("(broadcast)")
                                                                    : targetAddress.trimmed());

    const ExecResult result = m_processes.runTool(QString::fromLatin1(kControlBinaryName), args, m_timeoutMs);
    if (!result.ok()) {
        errorString = result.errorString;
        qCWarning(vieraDiscoveryLog).noquote() << "Scan failed:" << errorString;
        return false;
    }

    devices = parseScanOutput(QString::fromLocal8Bit(result.standardOutput));
    qCInfo(vieraDiscoveryLog) << "Scan found" << devices.size() << "device(s)";
    return true;
}

} // namespace viera
