#include <gtest/gtest.h>

#include "vieratypes.h"

using namespace viera;

TEST(VieraTypesTests, ProtocolNamesRoundTrip)
{
    for (CompanionProtocol protocol : { CompanionProtocol::Mrp, CompanionProtocol::AirPlay,
                                        CompanionProtocol::Companion }) {
        const std::optional<CompanionProtocol> parsed = protocolFromName(protocolName(protocol));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, protocol);
    }
    EXPECT_EQ(protocolFromName(QStringLiteral(" AirPlay ")), std::optional<CompanionProtocol>(CompanionProtocol::AirPlay));
    EXPECT_FALSE(protocolFromName(QStringLiteral("bluetooth")).has_value());
}

TEST(VieraTypesTests, DefaultPairingPorts)
{
    EXPECT_EQ(defaultPairingPort(CompanionProtocol::Mrp), 49152);
    EXPECT_EQ(defaultPairingPort(CompanionProtocol::AirPlay), 7000);
    EXPECT_EQ(defaultPairingPort(CompanionProtocol::Companion), 49153);
}

TEST(VieraTypesTests, IdentityNeedsIdentifierOrAddress)
{
    EXPECT_FALSE(CompanionIdentity().isValid());
    EXPECT_FALSE((CompanionIdentity { QStringLiteral("  "), QString() }).isValid());
    EXPECT_TRUE((CompanionIdentity { QStringLiteral("AA:BB:CC:DD:EE:FF"), QString() }).isValid());
    EXPECT_TRUE((CompanionIdentity { QString(), QStringLiteral("192.168.1.50") }).isValid());
}

TEST(VieraTypesTests, WakeNeedsAirplayOrCompanionCredentials)
{
    CredentialSet credentials;
    EXPECT_FALSE(credentials.isUsableForWake());
    credentials.setValue(CompanionProtocol::Mrp, QStringLiteral("mrp-creds"));
    EXPECT_FALSE(credentials.isUsableForWake());
    credentials.setValue(CompanionProtocol::Companion, QStringLiteral("companion-creds"));
    EXPECT_TRUE(credentials.isUsableForWake());
    EXPECT_EQ(credentials.value(CompanionProtocol::Companion), QStringLiteral("companion-creds"));
    EXPECT_EQ(credentials.value(CompanionProtocol::Mrp), QStringLiteral("mrp-creds"));
    EXPECT_TRUE(credentials.value(CompanionProtocol::AirPlay).isEmpty());
}

TEST(VieraTypesTests, CandidateIdentityCarriesIdentifierAndAddress)
{
    CandidateDevice device;
    device.identifier = QStringLiteral("AA:BB:CC:DD:EE:FF");
    device.address = QStringLiteral("192.168.1.50");
    const CompanionIdentity identity = device.identity();
    EXPECT_EQ(identity.identifier, device.identifier);
    EXPECT_EQ(identity.address, device.address);
}
