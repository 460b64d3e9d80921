#pragma once

#include <QList>
#include <QPair>
#include <QString>

namespace viera {

// Friendly remote-button name -> NRC key token, in presentation order.
const QList<QPair<QString, QString>> &remoteKeyCatalogue();
// Input name (HDMI1..HDMI4, TV) -> NRC key token.
const QList<QPair<QString, QString>> &inputKeyCatalogue();

QString remoteKeyToken(const QString &name);
QString inputKeyToken(const QString &name);

constexpr auto kPowerKey = "NRC_POWER-ONOFF";
constexpr auto kTunerKey = "NRC_TV-ONOFF";

} // namespace viera
