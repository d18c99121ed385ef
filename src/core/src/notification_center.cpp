#include "sn/notification_center.h"

#include "sn/logging.h"

namespace sn {

NotificationCenter::NotificationCenter(QObject* parent)
    : QObject(parent) {
}

void NotificationCenter::broadcast(const QString& name, const QVariantMap& payload) {
    ++post_counts_[name];
    qCDebug(lcBridge) << "broadcast" << name << payload.keys();
    emit notificationPosted(name, payload);
}

int NotificationCenter::postCount(const QString& name) const {
    return post_counts_.value(name, 0);
}

} // namespace sn
