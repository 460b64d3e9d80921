#include "vierakeys.h"

namespace viera {

namespace {

QList<QPair<QString, QString>> buildRemoteKeys()
{
    struct Entry {
        const char *name;
        const char *token;
    };
    const Entry entries[] = {
        { "power", "NRC_POWER-ONOFF" },
        { "channelUp", "NRC_CH_UP-ONOFF" },
        { "channelDown", "NRC_CH_DOWN-ONOFF" },
        { "volumeUp", "NRC_VOLUP-ONOFF" },
        { "volumeDown", "NRC_VOLDOWN-ONOFF" },
        { "up", "NRC_UP-ONOFF" },
        { "down", "NRC_DOWN-ONOFF" },
        { "left", "NRC_LEFT-ONOFF" },
        { "right", "NRC_RIGHT-ONOFF" },
        { "ok", "NRC_ENTER-ONOFF" },
        { "enter", "NRC_ENTER-ONOFF" },
        { "back", "NRC_RETURN-ONOFF" },
        { "menu", "NRC_MENU-ONOFF" },
        { "home", "NRC_MENU-ONOFF" },
        { "play", "NRC_PLAY-ONOFF" },
        { "pause", "NRC_PAUSE-ONOFF" },
        { "stop", "NRC_STOP-ONOFF" },
        { "rewind", "NRC_REW-ONOFF" },
        { "forward", "NRC_FF-ONOFF" },
        { "red", "NRC_RED-ONOFF" },
        { "green", "NRC_GREEN-ONOFF" },
        { "yellow", "NRC_YELLOW-ONOFF" },
        { "blue", "NRC_BLUE-ONOFF" },
        { "epg", "NRC_EPG-ONOFF" },
        { "text", "NRC_TEXT-ONOFF" },
        { "subtitles", "NRC_STTL-ONOFF" },
        { "info", "NRC_INFO-ONOFF" },
        { "hdmi1", "NRC_HDMI1-ONOFF" },
        { "hdmi2", "NRC_HDMI2-ONOFF" },
        { "hdmi3", "NRC_HDMI3-ONOFF" },
        { "hdmi4", "NRC_HDMI4-ONOFF" },
        { "tv", "NRC_TV-ONOFF" },
        { "lastView", "NRC_R_TUNE-ONOFF" },
        { "d0", "NRC_D0-ONOFF" },
        { "d1", "NRC_D1-ONOFF" },
        { "d2", "NRC_D2-ONOFF" },
        { "d3", "NRC_D3-ONOFF" },
        { "d4", "NRC_D4-ONOFF" },
        { "d5", "NRC_D5-ONOFF" },
        { "d6", "NRC_D6-ONOFF" },
        { "d7", "NRC_D7-ONOFF" },
        { "d8", "NRC_D8-ONOFF" },
        { "d9", "NRC_D9-ONOFF" },
        { "3d", "NRC_3D-ONOFF" },
        { "apps", "NRC_APPS-ONOFF" },
        { "mute", "NRC_MUTE-ONOFF" },
        { "submenu", "NRC_SUBMENU-ONOFF" },
        { "inputSwitch", "NRC_CHG_INPUT-ONOFF" },
        { "record", "NRC_REC-ONOFF" },
    };
    QList<QPair<QString, QString>> keys;
    for (const Entry &entry : entries)
        keys.append({ QString::fromLatin1(entry.name), QString::fromLatin1(entry.token) });
    return keys;
}

QList<QPair<QString, QString>> buildInputKeys()
{
    return {
        { QStringLiteral("HDMI1"), QStringLiteral("NRC_HDMI1-ONOFF") },
        { QStringLiteral("HDMI2"), QStringLiteral("NRC_HDMI2-ONOFF") },
        { QStringLiteral("HDMI3"), QStringLiteral("NRC_HDMI3-ONOFF") },
        { QStringLiteral("HDMI4"), QStringLiteral("NRC_HDMI4-ONOFF") },
        { QStringLiteral("TV"), QStringLiteral("NRC_TV-ONOFF") },
    };
}

} // namespace

const QList<QPair<QString, QString>> &remoteKeyCatalogue()
{
    static const QList<QPair<QString, QString>> keys = buildRemoteKeys();
    return keys;
}

const QList<QPair<QString, QString>> &inputKeyCatalogue()
{
    static const QList<QPair<QString, QString>> keys = buildInputKeys();
    return keys;
}

QString remoteKeyToken(const QString &name)
{
    const QString trimmed = name.trimmed();
    for (const auto &entry : remoteKeyCatalogue()) {
        if (entry.first == trimmed)
            return entry.second;
    }
    return QString();
}

QString inputKeyToken(const QString &name)
{
    const QString normalized = name.trimmed().toUpper().remove(QLatin1Char(' '));
    for (const auto &entry : inputKeyCatalogue()) {
        if (entry.first == normalized)
            return entry.second;
    }
    return QString();
}

} // namespace viera
