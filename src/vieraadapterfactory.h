#pragma once

#include "adapterfactory.h"

namespace phicore::adapter {

class VieraAdapterFactory : public AdapterFactory
{
    Q_OBJECT
    Q_PLUGIN_METADATA(IID PHI_ADAPTER_FACTORY_IID)
    Q_INTERFACES(phicore::adapter::AdapterFactory)

public:
    explicit VieraAdapterFactory(QObject *parent = nullptr)
        : AdapterFactory(parent)
    {
    }

    QString pluginType() const override { return QStringLiteral("panasonic-viera"); }
    QString displayName() const override { return QStringLiteral("Panasonic Viera"); }
    QString apiVersion() const override { return QStringLiteral("1.0.0"); }
    QString description() const override {
        return QStringLiteral("Control Panasonic Viera TVs over SOAP; power on through an Apple TV via HDMI-CEC.");
    }
    QString loggingCategory() const override { return QStringLiteral("phi-core.adapters.viera"); }
    QByteArray icon() const override;

    AdapterCapabilities capabilities() const override;
    AdapterConfigSchema configSchema(const Adapter &info) const override;
    ActionResponse invokeFactoryAction(const QString &actionId,
                                       Adapter &infoInOut,
                                       const QJsonObject &params) const override;
    AdapterInterface *create(QObject *parent = nullptr) override;
};

} // namespace phicore::adapter
