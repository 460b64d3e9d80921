#include "vieratypes.h"

namespace viera {

QString protocolName(CompanionProtocol protocol)
{
    switch (protocol) {
    case CompanionProtocol::Mrp:
        return QStringLiteral("mrp");
    case CompanionProtocol::AirPlay:
        return QStringLiteral("airplay");
    case CompanionProtocol::Companion:
        return QStringLiteral("companion");
    }
    return QString();
}

std::optional<CompanionProtocol> protocolFromName(const QString &name)
{
    const QString normalized = name.trimmed().toLower();
    if (normalized == QLatin1String("mrp"))
        return CompanionProtocol::Mrp;
    if (normalized == QLatin1String("airplay"))
        return CompanionProtocol::AirPlay;
    if (normalized == QLatin1String("companion"))
        return CompanionProtocol::Companion;
    return std::nullopt;
}

quint16 defaultPairingPort(CompanionProtocol protocol)
{
    switch (protocol) {
    case CompanionProtocol::Mrp:
        return 49152;
    case CompanionProtocol::AirPlay:
        return 7000;
    case CompanionProtocol::Companion:
        return 49153;
    }
    return 0;
}

bool CompanionIdentity::isValid() const
{
    return !identifier.trimmed().isEmpty() || !address.trimmed().isEmpty();
}

QString CredentialSet::value(CompanionProtocol protocol) const
{
    switch (protocol) {
    case CompanionProtocol::Mrp:
        return mrp;
    case CompanionProtocol::AirPlay:
        return airplay;
    case CompanionProtocol::Companion:
        return companion;
    }
    return QString();
}

void CredentialSet::setValue(CompanionProtocol protocol, const QString &credentials)
{
    switch (protocol) {
    case CompanionProtocol::Mrp:
        mrp = credentials;
        break;
    case CompanionProtocol::AirPlay:
        airplay = credentials;
        break;
    case CompanionProtocol::Companion:
        companion = credentials;
        break;
    }
}

bool CredentialSet::isUsableForWake() const
{
    return !airplay.trimmed().isEmpty() || !companion.trimmed().isEmpty();
}

} // namespace viera
