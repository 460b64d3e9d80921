#include <gtest/gtest.h>

#include "vierakeys.h"

#include <QSet>

using namespace viera;

TEST(VieraKeysTests, RemoteNamesMapToTokens)
{
    EXPECT_EQ(remoteKeyToken(QStringLiteral("volumeUp")), QStringLiteral("NRC_VOLUP-ONOFF"));
    EXPECT_EQ(remoteKeyToken(QStringLiteral("back")), QStringLiteral("NRC_RETURN-ONOFF"));
    EXPECT_EQ(remoteKeyToken(QStringLiteral("lastView")), QStringLiteral("NRC_R_TUNE-ONOFF"));
    EXPECT_EQ(remoteKeyToken(QStringLiteral("power")), QString::fromLatin1(kPowerKey));
    EXPECT_EQ(remoteKeyToken(QStringLiteral("tv")), QString::fromLatin1(kTunerKey));
}

TEST(VieraKeysTests, UnknownRemoteNameIsEmpty)
{
    EXPECT_TRUE(remoteKeyToken(QStringLiteral("selfDestruct")).isEmpty());
    EXPECT_TRUE(remoteKeyToken(QStringLiteral("VOLUMEUP")).isEmpty());
    EXPECT_TRUE(remoteKeyToken(QString()).isEmpty());
}

TEST(VieraKeysTests, CatalogueCoversDigitKeys)
{
    QSet<QString> names;
    for (const auto &entry : remoteKeyCatalogue())
        names.insert(entry.first);
    for (int digit = 0; digit <= 9; ++digit)
        EXPECT_TRUE(names.contains(QStringLiteral("d%1").arg(digit))) << digit;
    EXPECT_EQ(remoteKeyToken(QStringLiteral("d5")), QStringLiteral("NRC_D5-ONOFF"));
}

TEST(VieraKeysTests, InputLookupIgnoresCaseAndSpaces)
{
    EXPECT_EQ(inputKeyToken(QStringLiteral("HDMI1")), QStringLiteral("NRC_HDMI1-ONOFF"));
    EXPECT_EQ(inputKeyToken(QStringLiteral("hdmi 2")), QStringLiteral("NRC_HDMI2-ONOFF"));
    EXPECT_EQ(inputKeyToken(QStringLiteral(" tv ")), QStringLiteral("NRC_TV-ONOFF"));
    EXPECT_TRUE(inputKeyToken(QStringLiteral("HDMI5")).isEmpty());
}

TEST(VieraKeysTests, InputCatalogueOrder)
{
    const auto &inputs = inputKeyCatalogue();
    ASSERT_EQ(inputs.size(), 5);
    EXPECT_EQ(inputs.first().first, QStringLiteral("HDMI1"));
    EXPECT_EQ(inputs.last().first, QStringLiteral("TV"));
}
