#include <gtest/gtest.h>

#include "ScriptFixture.h"
#include "companiondiscovery.h"

#include <QJsonObject>

using namespace viera;

namespace {

const char kScanOutput[] =
    "Scan Results\n"
    "========================================\n"
    "       Name: Living Room\n"
    "   Model/SW: Apple TV 4K, tvOS 17.1\n"
    "    Address: 192.168.1.50\n"
    "        MAC: AA:BB:CC:DD:EE:FF\n"
    " Deep Sleep: False\n"
    "Identifiers:\n"
    " - XYZ123\n"
    " - AA:BB:CC:DD:EE:FF\n"
    "Services:\n"
    " - Protocol: Companion, Port: 49153, Credentials: None\n"
    " - Protocol: AirPlay, Port: 7000, Credentials: None\n"
    "\n"
    "       Name: Bedroom\n"
    "    Address: 192.168.1.51\n"
    "Identifiers:\n"
    " - 5D7E2A\n"
    "\n"
    "       Name: Nameless Speaker\n";

} // namespace

TEST(CompanionDiscoveryTests, ParsesBlocksAndPrefersMacIdentifier)
{
    const CandidateDeviceList devices = CompanionDiscovery::parseScanOutput(QString::fromLatin1(kScanOutput));
    ASSERT_EQ(devices.size(), 2);

    const CandidateDevice &living = devices.at(0);
    EXPECT_EQ(living.name, QStringLiteral("Living Room"));
    EXPECT_EQ(living.identifier, QStringLiteral("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(living.address, QStringLiteral("192.168.1.50"));
    EXPECT_EQ(living.mac, QStringLiteral("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(living.model, QStringLiteral("Apple TV 4K, tvOS 17.1"));

    const CandidateDevice &bedroom = devices.at(1);
    EXPECT_EQ(bedroom.name, QStringLiteral("Bedroom"));
    EXPECT_EQ(bedroom.identifier, QStringLiteral("5D7E2A"));
    EXPECT_EQ(bedroom.address, QStringLiteral("192.168.1.51"));
}

TEST(CompanionDiscoveryTests, MacFieldIsFallbackIdentifier)
{
    const CandidateDeviceList devices = CompanionDiscovery::parseScanOutput(
        QStringLiteral("    Address: 10.0.0.9\n        MAC: 11:22:33:44:55:66\n"));
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices.first().identifier, QStringLiteral("11:22:33:44:55:66"));
    EXPECT_EQ(devices.first().name, QStringLiteral("10.0.0.9"));
}

TEST(CompanionDiscoveryTests, EmptyOutputHasNoDevices)
{
    EXPECT_TRUE(CompanionDiscovery::parseScanOutput(QString()).isEmpty());
    EXPECT_TRUE(CompanionDiscovery::parseScanOutput(QStringLiteral("Scan Results\n=====\n")).isEmpty());
}

TEST(CompanionDiscoveryTests, MacAddressShape)
{
    EXPECT_TRUE(CompanionDiscovery::isMacAddress(QStringLiteral("aa:bb:cc:dd:ee:ff")));
    EXPECT_FALSE(CompanionDiscovery::isMacAddress(QStringLiteral("XYZ123")));
    EXPECT_FALSE(CompanionDiscovery::isMacAddress(QStringLiteral("AA:BB:CC:DD:EE")));
}

TEST(CompanionDiscoveryTests, DirectedAndBroadcastArguments)
{
    EXPECT_EQ(CompanionDiscovery::buildArguments(QStringLiteral("192.168.1.50")),
              (QStringList { QStringLiteral("--scan-hosts"), QStringLiteral("192.168.1.50"), QStringLiteral("scan") }));
    EXPECT_EQ(CompanionDiscovery::buildArguments(QString()), QStringList { QStringLiteral("scan") });
}

TEST(CompanionDiscoveryTests, NamedBlockWithoutIdentifierOrAddressIsDropped)
{
    const CandidateDeviceList devices = CompanionDiscovery::parseScanOutput(QStringLiteral(
        "       Name: Kitchen\n"
        "   Model/SW: Apple TV HD\n"
        "\n"
        "       Name: Office\n"
        "Identifiers:\n"
        " - 9F8E7D\n"));
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices.first().name, QStringLiteral("Office"));
    EXPECT_EQ(devices.first().identifier, QStringLiteral("9F8E7D"));
    EXPECT_TRUE(devices.first().address.isEmpty());
}

TEST(CompanionDiscoveryTests, RequestedAddressPrefersFormField)
{
    QJsonObject params;
    EXPECT_TRUE(CompanionDiscovery::requestedAddress(params).isEmpty());

    params.insert(QStringLiteral("address"), QStringLiteral("10.0.0.7"));
    EXPECT_EQ(CompanionDiscovery::requestedAddress(params), QStringLiteral("10.0.0.7"));

    params.insert(QStringLiteral("appleTvAddress"), QStringLiteral(" 192.168.1.50 "));
    EXPECT_EQ(CompanionDiscovery::requestedAddress(params), QStringLiteral("192.168.1.50"));

    params.insert(QStringLiteral("appleTvAddress"), QString());
    EXPECT_EQ(CompanionDiscovery::requestedAddress(params), QStringLiteral("10.0.0.7"));
}

TEST(CompanionDiscoveryTests, ScanRunsControlBinary)
{
    ScriptDir dir;
    ASSERT_TRUE(dir.isValid());
    QString script = QStringLiteral("echo \"$*\" > '%1'\ncat <<'EOF'\n").arg(dir.filePath(QStringLiteral("args.log")));
    script += QString::fromLatin1(kScanOutput);
    script += QStringLiteral("EOF");
    dir.writeScript(QStringLiteral("atvremote"), script);
    const ControlProcessManager processes = dir.manager();
    const CompanionDiscovery discovery(processes);

    CandidateDeviceList devices;
    QString errorString;
    ASSERT_TRUE(discovery.scan(QStringLiteral("192.168.1.50"), devices, errorString));
    EXPECT_TRUE(errorString.isEmpty());
    ASSERT_EQ(devices.size(), 2);
    EXPECT_EQ(devices.first().identifier, QStringLiteral("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(dir.readFile(QStringLiteral("args.log")).trimmed(), QStringLiteral("--scan-hosts 192.168.1.50 scan"));
}

TEST(CompanionDiscoveryTests, FailedScanReportsError)
{
    ScriptDir dir;
    ASSERT_TRUE(dir.isValid());
    dir.writeScript(QStringLiteral("atvremote"), QStringLiteral("echo 'network unreachable' >&2\nexit 1"));
    const ControlProcessManager processes = dir.manager();
    const CompanionDiscovery discovery(processes);

    CandidateDeviceList devices;
    QString errorString;
    EXPECT_FALSE(discovery.scan(QString(), devices, errorString));
    EXPECT_TRUE(devices.isEmpty());
    EXPECT_TRUE(errorString.contains(QStringLiteral("network unreachable")));
}
