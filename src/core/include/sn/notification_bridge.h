#pragma once

#include <functional>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include "event_bus.h"
#include "notification_center.h"
#include "subscription_manager.h"

namespace sn {

// Two-way adapter between typed bus events and NotificationCenter names.
// Each mapped event type is forwarded to the legacy channel and back, with
// its fields flattened into a QVariantMap. Nothing is echoed back to the
// side it came from.
class NotificationBridge : public QObject {
    Q_OBJECT

public:
    NotificationBridge(EventBus& bus, NotificationCenter& center, QObject* parent = nullptr);
    ~NotificationBridge() override;

    // Idempotent.
    void start();
    void stop();
    [[nodiscard]] bool isRunning() const { return running_; }

    // Every legacy notification name the bridge handles.
    [[nodiscard]] static QStringList legacyNames();

    // Legacy name for an event kName, or an empty string when unmapped.
    [[nodiscard]] static QString legacyNameFor(const char* eventName);

private slots:
    void onNotificationPosted(const QString& name, const QVariantMap& payload);

private:
    template <typename E>
    void bridge();

    EventBus& bus_;
    NotificationCenter& center_;
    SubscriptionManager subscriptions_;
    QMetaObject::Connection connection_;
    QHash<QString, std::function<void(const QVariantMap&)>> inbound_;

    // Names currently being forwarded, per direction.
    QSet<QString> to_legacy_;
    QSet<QString> to_bus_;
    bool running_ = false;
};

} // namespace sn
