#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <QVariantMap>

namespace sn {

// String-keyed broadcast channel used by older components. Delivery is
// synchronous through notificationPosted.
class NotificationCenter : public QObject {
    Q_OBJECT

public:
    explicit NotificationCenter(QObject* parent = nullptr);

    void broadcast(const QString& name, const QVariantMap& payload = {});

    // Number of broadcasts seen per name since construction.
    [[nodiscard]] int postCount(const QString& name) const;

signals:
    void notificationPosted(const QString& name, const QVariantMap& payload);

private:
    QHash<QString, int> post_counts_;
};

} // namespace sn
