#pragma once

#include <QList>
#include <QString>
#include <QtGlobal>

#include <optional>

namespace viera {

constexpr quint16 kDefaultControlPort = 55000;

// Television endpoint; fixed for the lifetime of a client.
struct DeviceTarget
{
    QString host;
    quint16 port = kDefaultControlPort;
};

enum class CompanionProtocol {
    Mrp,
    AirPlay,
    Companion,
};

QString protocolName(CompanionProtocol protocol);
std::optional<CompanionProtocol> protocolFromName(const QString &name);
quint16 defaultPairingPort(CompanionProtocol protocol);

// How the companion box is addressed by the external control binary.
// At least one of the two fields must be set.
struct CompanionIdentity
{
    QString identifier;
    QString address;

    bool isValid() const;
};

// Opaque per-protocol credentials. Never parsed, only handed through.
struct CredentialSet
{
    QString mrp;
    QString airplay;
    QString companion;

    QString value(CompanionProtocol protocol) const;
    void setValue(CompanionProtocol protocol, const QString &credentials);
    bool isUsableForWake() const;
};

struct CandidateDevice
{
    QString name;
    QString identifier;
    QString address;
    QString mac;
    QString model;

    CompanionIdentity identity() const { return { identifier, address }; }
};

using CandidateDeviceList = QList<CandidateDevice>;

} // namespace viera
