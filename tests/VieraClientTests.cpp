#include <gtest/gtest.h>

#include "FakeTvServer.h"
#include "vieraclient.h"

#include <QElapsedTimer>

using namespace viera;

namespace {

VieraClient clientFor(const FakeTvServer &server, int timeoutMs = 2000)
{
    return VieraClient(DeviceTarget { QStringLiteral("127.0.0.1"), server.port() }, timeoutMs);
}

} // namespace

TEST(VieraClientTests, NormalizeKeyWrapsBareNames)
{
    EXPECT_EQ(VieraClient::normalizeKey(QStringLiteral("VOLUP")), QStringLiteral("NRC_VOLUP-ONOFF"));
    EXPECT_EQ(VieraClient::normalizeKey(QStringLiteral("volup")), QStringLiteral("NRC_VOLUP-ONOFF"));
    EXPECT_EQ(VieraClient::normalizeKey(QStringLiteral("NRC_VOLUP-ONOFF")), QStringLiteral("NRC_VOLUP-ONOFF"));
}

TEST(VieraClientTests, DigitKeyUsesDigitToken)
{
    EXPECT_EQ(VieraClient::digitKey(0), QStringLiteral("NRC_D0-ONOFF"));
    EXPECT_EQ(VieraClient::digitKey(7), QStringLiteral("NRC_D7-ONOFF"));
}

TEST(VieraClientTests, NormalizeVolumeClampsAndRounds)
{
    EXPECT_EQ(VieraClient::normalizeVolume(150.0), 100);
    EXPECT_EQ(VieraClient::normalizeVolume(-3.0), 0);
    EXPECT_EQ(VieraClient::normalizeVolume(42.6), 43);
    EXPECT_EQ(VieraClient::normalizeVolume(42.4), 42);
}

TEST(VieraClientTests, ExtractTagValueReadsDigits)
{
    const QByteArray body("<s:Body><u:GetVolumeResponse><CurrentVolume>17</CurrentVolume></u:GetVolumeResponse></s:Body>");
    const std::optional<QString> value = VieraClient::extractTagValue(body, QStringLiteral("CurrentVolume"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, QStringLiteral("17"));
    EXPECT_FALSE(VieraClient::extractTagValue(body, QStringLiteral("CurrentMute")).has_value());
}

TEST(VieraClientTests, BareAndPrefixedKeysSendIdenticalRequests)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    const VieraClient client = clientFor(server);

    ASSERT_TRUE(client.sendKey(QStringLiteral("VOLUP")));
    ASSERT_TRUE(client.sendKey(QStringLiteral("NRC_VOLUP-ONOFF")));
    ASSERT_EQ(server.requests().size(), 2);
    EXPECT_EQ(server.requests().at(0).body, server.requests().at(1).body);
    EXPECT_TRUE(server.requests().at(0).body.contains("<X_KeyEvent>NRC_VOLUP-ONOFF</X_KeyEvent>"));
    EXPECT_EQ(server.requests().at(0).path, QStringLiteral("/nrc/control_0"));
}

TEST(VieraClientTests, SetVolumeSendsClampedInteger)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    const VieraClient client = clientFor(server);

    ASSERT_TRUE(client.setVolume(150.0));
    ASSERT_TRUE(client.setVolume(-3.0));
    ASSERT_TRUE(client.setVolume(42.6));
    ASSERT_EQ(server.requests().size(), 3);
    EXPECT_TRUE(server.requests().at(0).body.contains("<DesiredVolume>100</DesiredVolume>"));
    EXPECT_TRUE(server.requests().at(1).body.contains("<DesiredVolume>0</DesiredVolume>"));
    EXPECT_TRUE(server.requests().at(2).body.contains("<DesiredVolume>43</DesiredVolume>"));
    const RecordedRequest &request = server.requests().first();
    EXPECT_EQ(request.path, QStringLiteral("/dmr/control_0"));
    EXPECT_EQ(request.headers.value("soapaction"),
              QByteArray("\"urn:schemas-upnp-org:service:RenderingControl:1#SetVolume\""));
    EXPECT_TRUE(request.body.contains("<InstanceID>0</InstanceID><Channel>Master</Channel>"));
}

TEST(VieraClientTests, GetVolumeParsesAndClampsReply)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setResponse(QStringLiteral("/dmr/control_0"), 200,
                       QByteArrayLiteral("<u:GetVolumeResponse><CurrentVolume>42</CurrentVolume></u:GetVolumeResponse>"));
    const VieraClient client = clientFor(server);

    TransportError error;
    const std::optional<int> volume = client.getVolume(&error);
    ASSERT_TRUE(volume.has_value());
    EXPECT_EQ(*volume, 42);
    EXPECT_FALSE(error.isError());

    server.setResponse(QStringLiteral("/dmr/control_0"), 200,
                       QByteArrayLiteral("<CurrentVolume>150</CurrentVolume>"));
    EXPECT_EQ(client.getVolume().value_or(-1), 100);
}

TEST(VieraClientTests, GetVolumeWithoutTagIsUnknownNotError)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setResponse(QStringLiteral("/dmr/control_0"), 200, QByteArrayLiteral("<empty/>"));
    const VieraClient client = clientFor(server);

    TransportError error;
    EXPECT_FALSE(client.getVolume(&error).has_value());
    EXPECT_FALSE(error.isError());
}

TEST(VieraClientTests, GetMuteParsesFlag)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setResponse(QStringLiteral("/dmr/control_0"), 200,
                       QByteArrayLiteral("<u:GetMuteResponse><CurrentMute>1</CurrentMute></u:GetMuteResponse>"));
    const VieraClient client = clientFor(server);
    EXPECT_EQ(client.getMute(), std::optional<bool>(true));

    server.setResponse(QStringLiteral("/dmr/control_0"), 200, QByteArrayLiteral("<CurrentMute>0</CurrentMute>"));
    EXPECT_EQ(client.getMute(), std::optional<bool>(false));
}

TEST(VieraClientTests, SetMuteSendsOneOrZero)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    const VieraClient client = clientFor(server);

    ASSERT_TRUE(client.setMute(true));
    ASSERT_TRUE(client.setMute(false));
    ASSERT_EQ(server.requests().size(), 2);
    EXPECT_TRUE(server.requests().at(0).body.contains("<DesiredMute>1</DesiredMute>"));
    EXPECT_TRUE(server.requests().at(1).body.contains("<DesiredMute>0</DesiredMute>"));
}

TEST(VieraClientTests, ChannelDigitsArePressedInOrderWithDelay)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    const VieraClient client = clientFor(server);

    QElapsedTimer elapsed;
    elapsed.start();
    ASSERT_TRUE(client.sendChannelNumber(123));
    EXPECT_GE(elapsed.elapsed(), 2 * kDigitKeyDelayMs);
    ASSERT_EQ(server.requests().size(), 3);
    EXPECT_TRUE(server.requests().at(0).body.contains("NRC_D1-ONOFF"));
    EXPECT_TRUE(server.requests().at(1).body.contains("NRC_D2-ONOFF"));
    EXPECT_TRUE(server.requests().at(2).body.contains("NRC_D3-ONOFF"));
    // Server stamps are whole milliseconds taken independently, so allow one tick of truncation.
    EXPECT_GE(server.requests().at(1).receivedAtMs - server.requests().at(0).receivedAtMs, kDigitKeyDelayMs - 1);
    EXPECT_GE(server.requests().at(2).receivedAtMs - server.requests().at(1).receivedAtMs, kDigitKeyDelayMs - 1);
}

TEST(VieraClientTests, ChannelEntryStopsAtFirstFailedPress)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.failFromRequest(1, 500);
    VieraClient client = clientFor(server);
    client.setKeyPressDelayMs(10);

    TransportError error;
    EXPECT_FALSE(client.sendChannelNumber(456, &error));
    EXPECT_EQ(server.requests().size(), 2);
    EXPECT_EQ(error.kind, TransportError::Kind::HttpStatus);
    EXPECT_EQ(error.httpStatus, 500);
}

TEST(VieraClientTests, SingleDigitChannelSendsOnePress)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    const VieraClient client = clientFor(server);

    ASSERT_TRUE(client.sendChannelNumber(0));
    ASSERT_EQ(server.requests().size(), 1);
    EXPECT_TRUE(server.requests().first().body.contains("NRC_D0-ONOFF"));
}

TEST(VieraClientTests, IsAvailableProbesStatusDocument)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setResponse(QStringLiteral("/nrc/ddd.xml"), 200, QByteArrayLiteral("<root/>"));
    const VieraClient client = clientFor(server);

    EXPECT_TRUE(client.isAvailable());
    ASSERT_EQ(server.requests().size(), 1);
    EXPECT_EQ(server.requests().first().method, QByteArray("GET"));
    EXPECT_EQ(server.requests().first().path, QStringLiteral("/nrc/ddd.xml"));
}

TEST(VieraClientTests, IsAvailableFalseOnServerError)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setDefaultResponse(500);
    EXPECT_FALSE(clientFor(server).isAvailable());
}

TEST(VieraClientTests, IsAvailableFalseOnRefusedConnection)
{
    const VieraClient client(DeviceTarget { QStringLiteral("127.0.0.1"), FakeTvServer::unusedPort() }, 2000);
    EXPECT_FALSE(client.isAvailable());
}

TEST(VieraClientTests, IsAvailableFalseOnTimeout)
{
    FakeTvServer server;
    ASSERT_TRUE(server.listen());
    server.setHang(true);
    EXPECT_FALSE(clientFor(server, 300).isAvailable());
}

TEST(VieraClientTests, HostOnlyConstructorUsesDefaultPort)
{
    const VieraClient client(QStringLiteral("192.0.2.10"));
    EXPECT_EQ(client.target().host, QStringLiteral("192.0.2.10"));
    EXPECT_EQ(client.target().port, kDefaultControlPort);
    EXPECT_EQ(client.keyPressDelayMs(), kDigitKeyDelayMs);
}
