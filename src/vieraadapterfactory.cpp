#include "vieraadapterfactory.h"
#include "vieraadapter.h"

#include "vieraclient.h"
#include "vieratypes.h"

#include <QJsonObject>

namespace phicore::adapter {

namespace {

void addFieldByLegacyScope(AdapterConfigSchema &schema, const AdapterConfigField &field)
{
    const bool instanceOnly =
        (static_cast<int>(field.flags) & static_cast<int>(AdapterConfigFieldFlag::InstanceOnly)) != 0;
    if (!instanceOnly)
        schema.factory.fields.push_back(field);
    schema.instance.fields.push_back(field);
}

AdapterActionDescriptor formCommand(const QString &id, const QString &label, const QString &description)
{
    AdapterActionDescriptor action;
    action.id = id;
    action.label = label;
    action.description = description;
    action.meta.insert(QStringLiteral("placement"), QStringLiteral("form_field"));
    action.meta.insert(QStringLiteral("kind"), QStringLiteral("command"));
    action.meta.insert(QStringLiteral("requiresAck"), true);
    return action;
}

} // namespace

static const QByteArray kVieraIconSvg = QByteArrayLiteral(
    "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" fill=\"none\" "
    "xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"Television icon\">\n"
    "  <rect x=\"2.5\" y=\"4\" width=\"19\" height=\"12.5\" rx=\"1.8\" "
    "stroke=\"#2E3A4F\" stroke-width=\"1.6\" fill=\"#121A26\"/>\n"
    "  <rect x=\"4.5\" y=\"6\" width=\"15\" height=\"8.5\" rx=\"0.8\" fill=\"#1F5FA8\"/>\n"
    "  <path d=\"M9 20h6M12 16.5V20\" stroke=\"#7A8AA4\" stroke-width=\"1.6\" stroke-linecap=\"round\"/>\n"
    "</svg>\n"
);

QByteArray VieraAdapterFactory::icon() const
{
    return kVieraIconSvg;
}

AdapterCapabilities VieraAdapterFactory::capabilities() const
{
    AdapterCapabilities caps;
    caps.required = AdapterRequirement::Host;
    caps.optional = AdapterRequirement::None;
    caps.flags |= AdapterFlag::AdapterFlagSupportsProbe;
    caps.flags |= AdapterFlag::AdapterFlagRequiresPolling;
    caps.defaults.insert(QStringLiteral("port"), static_cast<int>(viera::kDefaultControlPort));
    caps.defaults.insert(QStringLiteral("pollIntervalMs"), 15000);
    caps.defaults.insert(QStringLiteral("requestTimeoutMs"), viera::kDefaultRequestTimeoutMs);
    caps.defaults.insert(QStringLiteral("useAppleTv"), false);

    AdapterActionDescriptor settings;
    settings.id = QStringLiteral("settings");
    settings.label = QStringLiteral("Settings");
    settings.description = QStringLiteral("Edit TV connection and Apple TV settings.");
    settings.hasForm = true;
    settings.meta.insert(QStringLiteral("placement"), QStringLiteral("card"));
    settings.meta.insert(QStringLiteral("kind"), QStringLiteral("open_dialog"));
    settings.meta.insert(QStringLiteral("requiresAck"), true);
    caps.instanceActions.push_back(settings);

    caps.instanceActions.push_back(formCommand(QStringLiteral("scanCompanion"),
                                               QStringLiteral("Scan"),
                                               QStringLiteral("Search the network for an Apple TV.")));
    AdapterActionDescriptor startPairing = formCommand(QStringLiteral("startPairing"),
                                                       QStringLiteral("Start pairing"),
                                                       QStringLiteral("Pair with the Apple TV; a PIN appears on screen."));
    startPairing.meta.insert(QStringLiteral("resultField"), QStringLiteral("pairingStatus"));
    caps.instanceActions.push_back(startPairing);
    AdapterActionDescriptor submitPin = formCommand(QStringLiteral("submitPin"),
                                                    QStringLiteral("Submit PIN"),
                                                    QStringLiteral("Finish pairing with the PIN shown on the TV."));
    submitPin.meta.insert(QStringLiteral("resultField"), QStringLiteral("pairingStatus"));
    caps.instanceActions.push_back(submitPin);
    caps.instanceActions.push_back(formCommand(QStringLiteral("cancelPairing"),
                                               QStringLiteral("Cancel pairing"),
                                               QStringLiteral("Abort a running pairing.")));

    AdapterActionDescriptor probeAction;
    probeAction.id = QStringLiteral("probe");
    probeAction.label = QStringLiteral("Test connection");
    probeAction.description = QStringLiteral("Check that the TV answers on its control port");
    probeAction.meta.insert(QStringLiteral("placement"), QStringLiteral("card"));
    probeAction.meta.insert(QStringLiteral("kind"), QStringLiteral("command"));
    probeAction.meta.insert(QStringLiteral("requiresAck"), true);
    caps.factoryActions.push_back(probeAction);
    return caps;
}

AdapterConfigSchema VieraAdapterFactory::configSchema(const Adapter &info) const
{
    AdapterConfigSchema schema;
    schema.factory.title = QStringLiteral("Panasonic Viera TV");
    schema.factory.description = QStringLiteral("Configure connection to a Panasonic Viera TV (SOAP, port 55000).");
    schema.instance.title = schema.factory.title;
    schema.instance.description = schema.factory.description;

    const QString resolvedHost = !info.host.isEmpty()
        ? info.host
        : (!info.ip.isEmpty()
            ? info.ip
            : info.meta.value(QStringLiteral("host")).toString().trimmed());
    AdapterConfigField hostField;
    hostField.key = QStringLiteral("host");
    hostField.label = QStringLiteral("TV IP address");
    hostField.type = AdapterConfigFieldType::Hostname;
    hostField.flags = AdapterConfigFieldFlag::Required;
    if (!resolvedHost.isEmpty())
        hostField.defaultValue = resolvedHost;
    hostField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, hostField);

    AdapterConfigField portField;
    portField.key = QStringLiteral("port");
    portField.label = QStringLiteral("Control port");
    portField.type = AdapterConfigFieldType::Port;
    if (info.port > 0 && info.port != 80) {
        portField.defaultValue = static_cast<int>(info.port);
    } else {
        portField.defaultValue = static_cast<int>(viera::kDefaultControlPort);
    }
    portField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, portField);

    AdapterConfigField pollField;
    pollField.key = QStringLiteral("pollIntervalMs");
    pollField.label = QStringLiteral("Poll interval");
    pollField.type = AdapterConfigFieldType::Integer;
    pollField.defaultValue = 15000;
    pollField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, pollField);

    AdapterConfigField timeoutField;
    timeoutField.key = QStringLiteral("requestTimeoutMs");
    timeoutField.label = QStringLiteral("Request timeout");
    timeoutField.description = QStringLiteral("Per-request SOAP deadline in milliseconds.");
    timeoutField.type = AdapterConfigFieldType::Integer;
    timeoutField.defaultValue = viera::kDefaultRequestTimeoutMs;
    timeoutField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, timeoutField);

    AdapterConfigField appleTvField;
    appleTvField.key = QStringLiteral("useAppleTv");
    appleTvField.label = QStringLiteral("Power on via Apple TV");
    appleTvField.description = QStringLiteral("The TV cannot be woken over the network; an Apple TV on HDMI-CEC wakes it.");
    appleTvField.type = AdapterConfigFieldType::Boolean;
    appleTvField.defaultValue = false;
    appleTvField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, appleTvField);

    AdapterConfigField addressField;
    addressField.key = QStringLiteral("appleTvAddress");
    addressField.label = QStringLiteral("Apple TV address");
    addressField.description = QStringLiteral("Leave empty to scan the whole network.");
    addressField.type = AdapterConfigFieldType::Hostname;
    addressField.flags = AdapterConfigFieldFlag::InstanceOnly;
    addressField.actionId = QStringLiteral("scanCompanion");
    addressField.actionLabel = QStringLiteral("Scan");
    addressField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, addressField);

    const QString appleTvName = info.meta.value(QStringLiteral("appleTvName")).toString().trimmed();
    AdapterConfigField nameField;
    nameField.key = QStringLiteral("appleTvName");
    nameField.label = QStringLiteral("Apple TV");
    nameField.type = AdapterConfigFieldType::String;
    nameField.flags = AdapterConfigFieldFlag::ReadOnly | AdapterConfigFieldFlag::InstanceOnly;
    if (!appleTvName.isEmpty())
        nameField.defaultValue = appleTvName;
    nameField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, nameField);

    AdapterConfigField identifierField;
    identifierField.key = QStringLiteral("appleTvIdentifier");
    identifierField.label = QStringLiteral("Apple TV identifier");
    identifierField.type = AdapterConfigFieldType::String;
    identifierField.flags = AdapterConfigFieldFlag::ReadOnly | AdapterConfigFieldFlag::InstanceOnly;
    identifierField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, identifierField);

    AdapterConfigField protocolField;
    protocolField.key = QStringLiteral("protocol");
    protocolField.label = QStringLiteral("Pairing protocol");
    protocolField.type = AdapterConfigFieldType::Select;
    protocolField.flags = AdapterConfigFieldFlag::Transient | AdapterConfigFieldFlag::InstanceOnly;
    protocolField.defaultValue = viera::protocolName(viera::CompanionProtocol::AirPlay);
    for (viera::CompanionProtocol protocol : { viera::CompanionProtocol::AirPlay,
                                               viera::CompanionProtocol::Companion,
                                               viera::CompanionProtocol::Mrp }) {
        AdapterConfigOption opt;
        opt.value = viera::protocolName(protocol);
        opt.label = opt.value;
        protocolField.options.push_back(opt);
    }
    protocolField.actionId = QStringLiteral("startPairing");
    protocolField.actionLabel = QStringLiteral("Start pairing");
    protocolField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, protocolField);

    AdapterConfigField pinField;
    pinField.key = QStringLiteral("pin");
    pinField.label = QStringLiteral("PIN");
    pinField.description = QStringLiteral("Four-digit PIN shown on the TV during pairing.");
    pinField.type = AdapterConfigFieldType::String;
    pinField.flags = AdapterConfigFieldFlag::Transient | AdapterConfigFieldFlag::InstanceOnly;
    pinField.actionId = QStringLiteral("submitPin");
    pinField.actionLabel = QStringLiteral("Submit PIN");
    pinField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, pinField);

    AdapterConfigField statusField;
    statusField.key = QStringLiteral("pairingStatus");
    statusField.label = QStringLiteral("Pairing status");
    statusField.type = AdapterConfigFieldType::String;
    statusField.flags = AdapterConfigFieldFlag::ReadOnly
        | AdapterConfigFieldFlag::Transient
        | AdapterConfigFieldFlag::InstanceOnly;
    statusField.actionId = QStringLiteral("cancelPairing");
    statusField.actionLabel = QStringLiteral("Cancel");
    statusField.parentActionId = QStringLiteral("settings");
    addFieldByLegacyScope(schema, statusField);

    return schema;
}

ActionResponse VieraAdapterFactory::invokeFactoryAction(const QString &actionId,
                                                        Adapter &infoInOut,
                                                        const QJsonObject &params) const
{
    ActionResponse resp;
    Q_UNUSED(params);
    if (actionId != QLatin1String("probe")) {
        resp.status = CmdStatus::NotImplemented;
        resp.error = QStringLiteral("Unsupported action");
        return resp;
    }

    QString host = infoInOut.host.trimmed();
    if (host.isEmpty())
        host = infoInOut.ip.trimmed();
    if (host.isEmpty()) {
        resp.status = CmdStatus::InvalidArgument;
        resp.error = QStringLiteral("Host is required");
        return resp;
    }

    const int portValue = infoInOut.port > 0
        ? static_cast<int>(infoInOut.port)
        : 0;
    const quint16 port = portValue > 0 ? static_cast<quint16>(portValue) : viera::kDefaultControlPort;

    const viera::VieraClient client(viera::DeviceTarget { host, port });
    if (!client.isAvailable()) {
        resp.status = CmdStatus::Failure;
        resp.error = QStringLiteral("TV not reachable at %1:%2").arg(host).arg(port);
        return resp;
    }

    viera::TransportError error;
    const std::optional<int> volume = client.getVolume(&error);
    if (!volume) {
        resp.status = CmdStatus::Failure;
        resp.error = error.isError()
            ? QStringLiteral("TV reachable but control failed: %1").arg(error.message)
            : QStringLiteral("Unexpected response from TV");
        return resp;
    }
    resp.status = CmdStatus::Success;
    return resp;
}

AdapterInterface *VieraAdapterFactory::create(QObject *parent)
{
    return new VieraAdapter(parent);
}

} // namespace phicore::adapter
