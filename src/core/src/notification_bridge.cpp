#include "sn/notification_bridge.h"

#include <algorithm>
#include <cstring>
#include <optional>
#include <type_traits>
#include <QByteArray>

#include "sn/events.h"
#include "sn/logging.h"

namespace sn {

namespace {

// Marks a name as in flight for the lifetime of one forward.
class InFlight {
public:
    InFlight(QSet<QString>& set, const QString& name) : set_(set), name_(name) { set_.insert(name_); }
    ~InFlight() { set_.remove(name_); }

    InFlight(const InFlight&) = delete;
    InFlight& operator=(const InFlight&) = delete;

private:
    QSet<QString>& set_;
    QString name_;
};

std::optional<int> intField(const QVariantMap& payload, const char* key) {
    const QVariant value = payload.value(QLatin1String(key));
    if (!value.isValid()) {
        return std::nullopt;
    }
    bool ok = false;
    int result = value.toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return result;
}

std::optional<bool> boolField(const QVariantMap& payload, const char* key) {
    const QVariant value = payload.value(QLatin1String(key));
    if (value.typeId() != QMetaType::Bool) {
        return std::nullopt;
    }
    return value.toBool();
}

std::optional<std::string> stringField(const QVariantMap& payload, const char* key) {
    const QVariant value = payload.value(QLatin1String(key));
    if (value.typeId() != QMetaType::QString) {
        return std::nullopt;
    }
    return value.toString().toStdString();
}

QVariantMap encodeTemplate(const CanvasTemplate& t) {
    QVariantMap map;
    map["type"] = QString::fromLatin1(templateTypeName(t.type));
    map["spacing"] = t.spacing;
    map["colorHex"] = QString::fromStdString(t.colorHex);
    map["lineWidth"] = t.lineWidth;
    return map;
}

std::optional<CanvasTemplate> decodeTemplate(const QVariant& value) {
    if (value.typeId() != QMetaType::QVariantMap) {
        return std::nullopt;
    }
    const QVariantMap map = value.toMap();
    auto typeName = stringField(map, "type");
    if (!typeName) {
        return std::nullopt;
    }
    auto type = templateTypeFromName(*typeName);
    if (!type) {
        return std::nullopt;
    }
    CanvasTemplate t;
    t.type = *type;
    bool ok = true;
    if (map.contains("spacing")) {
        t.spacing = map.value("spacing").toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
    }
    if (auto color = stringField(map, "colorHex")) {
        t.colorHex = *color;
    }
    if (map.contains("lineWidth")) {
        t.lineWidth = map.value("lineWidth").toDouble(&ok);
        if (!ok) {
            return std::nullopt;
        }
    }
    return t;
}

// Flattening of one event type into a legacy payload and back.
template <typename E>
struct LegacyCodec {
    static QVariantMap encode(const E&) { return {}; }
    static std::optional<E> decode(const QVariantMap&) { return E{}; }
};

template <typename E>
struct PageIndexCodec {
    static QVariantMap encode(const E& e) { return {{"pageIndex", e.pageIndex}}; }
    static std::optional<E> decode(const QVariantMap& payload) {
        auto index = intField(payload, "pageIndex");
        if (!index) {
            return std::nullopt;
        }
        E e;
        e.pageIndex = *index;
        return e;
    }
};

template <typename E>
struct PageIdCodec {
    static QVariantMap encode(const E& e) { return {{"pageId", QString::fromStdString(e.pageId)}}; }
    static std::optional<E> decode(const QVariantMap& payload) {
        auto id = stringField(payload, "pageId");
        if (!id) {
            return std::nullopt;
        }
        E e;
        e.pageId = *id;
        return e;
    }
};

template <typename E>
struct VisibilityCodec {
    static QVariantMap encode(const E& e) { return {{"isVisible", e.isVisible}}; }
    static std::optional<E> decode(const QVariantMap& payload) {
        auto visible = boolField(payload, "isVisible");
        if (!visible) {
            return std::nullopt;
        }
        E e;
        e.isVisible = *visible;
        return e;
    }
};

template <typename E>
struct EnabledCodec {
    static QVariantMap encode(const E& e) { return {{"isEnabled", e.isEnabled}}; }
    static std::optional<E> decode(const QVariantMap& payload) {
        auto enabled = boolField(payload, "isEnabled");
        if (!enabled) {
            return std::nullopt;
        }
        E e;
        e.isEnabled = *enabled;
        return e;
    }
};

template <> struct LegacyCodec<events::PageSelected> : PageIndexCodec<events::PageSelected> {};
template <> struct LegacyCodec<events::PageSelectedByUser> : PageIndexCodec<events::PageSelectedByUser> {};
template <> struct LegacyCodec<events::VisiblePageChanged> : PageIndexCodec<events::VisiblePageChanged> {};
template <> struct LegacyCodec<events::ScrollToPage> : PageIndexCodec<events::ScrollToPage> {};
template <> struct LegacyCodec<events::PageAdded> : PageIdCodec<events::PageAdded> {};
template <> struct LegacyCodec<events::LiveDrawingUpdate> : PageIdCodec<events::LiveDrawingUpdate> {};
template <> struct LegacyCodec<events::DrawingStarted> : PageIdCodec<events::DrawingStarted> {};
template <> struct LegacyCodec<events::DrawingDidComplete> : PageIdCodec<events::DrawingDidComplete> {};
template <> struct LegacyCodec<events::SidebarVisibilityChanged> : VisibilityCodec<events::SidebarVisibilityChanged> {};
template <> struct LegacyCodec<events::GridStateChanged> : VisibilityCodec<events::GridStateChanged> {};
template <> struct LegacyCodec<events::DebugModeChanged> : EnabledCodec<events::DebugModeChanged> {};
template <> struct LegacyCodec<events::AutoScrollSettingChanged> : EnabledCodec<events::AutoScrollSettingChanged> {};

template <>
struct LegacyCodec<events::PageReordering> {
    static QVariantMap encode(const events::PageReordering& e) {
        return {{"fromIndex", e.fromIndex}, {"toIndex", e.toIndex}};
    }
    static std::optional<events::PageReordering> decode(const QVariantMap& payload) {
        auto from = intField(payload, "fromIndex");
        auto to = intField(payload, "toIndex");
        if (!from || !to) {
            return std::nullopt;
        }
        return events::PageReordering{*from, *to};
    }
};

template <>
struct LegacyCodec<events::PageDrawingChanged> {
    static QVariantMap encode(const events::PageDrawingChanged& e) {
        QVariantMap map{{"pageId", QString::fromStdString(e.pageId)}};
        if (e.drawingData) {
            QByteArray bytes(static_cast<int>(e.drawingData->size()), Qt::Uninitialized);
            std::copy(e.drawingData->begin(), e.drawingData->end(), bytes.begin());
            map["drawingData"] = bytes;
        }
        return map;
    }
    static std::optional<events::PageDrawingChanged> decode(const QVariantMap& payload) {
        auto id = stringField(payload, "pageId");
        if (!id) {
            return std::nullopt;
        }
        events::PageDrawingChanged e;
        e.pageId = *id;
        const QVariant data = payload.value("drawingData");
        if (data.isValid()) {
            if (data.typeId() != QMetaType::QByteArray) {
                return std::nullopt;
            }
            const QByteArray bytes = data.toByteArray();
            e.drawingData = DrawingData(bytes.begin(), bytes.end());
        }
        return e;
    }
};

template <>
struct LegacyCodec<events::TemplateChanged> {
    static QVariantMap encode(const events::TemplateChanged& e) {
        return {{"template", encodeTemplate(e.canvasTemplate)}};
    }
    static std::optional<events::TemplateChanged> decode(const QVariantMap& payload) {
        auto t = decodeTemplate(payload.value("template"));
        if (!t) {
            return std::nullopt;
        }
        return events::TemplateChanged{*t};
    }
};

template <>
struct LegacyCodec<events::CoordinatorReady> {
    static QVariantMap encode(const events::CoordinatorReady& e) {
        return {{"coordinator", QVariant::fromValue<qulonglong>(e.coordinator.value)}};
    }
    static std::optional<events::CoordinatorReady> decode(const QVariantMap& payload) {
        const QVariant value = payload.value("coordinator");
        bool ok = false;
        qulonglong handle = value.toULongLong(&ok);
        if (!value.isValid() || !ok) {
            return std::nullopt;
        }
        return events::CoordinatorReady{OpaqueHandle{handle}};
    }
};

template <typename E>
QString legacyName() {
    if constexpr (std::is_same_v<E, events::PageReordering>) {
        return QStringLiteral("PageReorderingNotification");
    } else {
        return QString::fromLatin1(E::kName);
    }
}

// All bridged event types, in registration order.
template <typename F>
void forEachBridgedType(F&& f) {
    f(static_cast<events::PageSelected*>(nullptr));
    f(static_cast<events::PageSelectedByUser*>(nullptr));
    f(static_cast<events::PageSelectionDeactivated*>(nullptr));
    f(static_cast<events::PageAdded*>(nullptr));
    f(static_cast<events::PageReordering*>(nullptr));
    f(static_cast<events::VisiblePageChanged*>(nullptr));
    f(static_cast<events::ScrollToPage*>(nullptr));
    f(static_cast<events::PageDrawingChanged*>(nullptr));
    f(static_cast<events::LiveDrawingUpdate*>(nullptr));
    f(static_cast<events::DrawingStarted*>(nullptr));
    f(static_cast<events::DrawingDidComplete*>(nullptr));
    f(static_cast<events::RefreshTemplate*>(nullptr));
    f(static_cast<events::ForceTemplateRefresh*>(nullptr));
    f(static_cast<events::TemplateChanged*>(nullptr));
    f(static_cast<events::SidebarVisibilityChanged*>(nullptr));
    f(static_cast<events::CloseSidebar*>(nullptr));
    f(static_cast<events::ToggleSidebar*>(nullptr));
    f(static_cast<events::GridStateChanged*>(nullptr));
    f(static_cast<events::ToggleCoordinateGrid*>(nullptr));
    f(static_cast<events::DebugModeChanged*>(nullptr));
    f(static_cast<events::AutoScrollSettingChanged*>(nullptr));
    f(static_cast<events::CoordinatorReady*>(nullptr));
}

} // namespace

NotificationBridge::NotificationBridge(EventBus& bus, NotificationCenter& center, QObject* parent)
    : QObject(parent)
    , bus_(bus)
    , center_(center)
    , subscriptions_(bus) {
}

NotificationBridge::~NotificationBridge() {
    stop();
}

QStringList NotificationBridge::legacyNames() {
    QStringList names;
    forEachBridgedType([&names](auto* tag) {
        using E = std::remove_pointer_t<decltype(tag)>;
        names << legacyName<E>();
    });
    return names;
}

QString NotificationBridge::legacyNameFor(const char* eventName) {
    QString result;
    forEachBridgedType([&result, eventName](auto* tag) {
        using E = std::remove_pointer_t<decltype(tag)>;
        if (std::strcmp(E::kName, eventName) == 0) {
            result = legacyName<E>();
        }
    });
    return result;
}

template <typename E>
void NotificationBridge::bridge() {
    const QString name = legacyName<E>();

    subscriptions_.subscribe<E>([this, name](const E& event) {
        if (to_bus_.contains(name)) {
            return;
        }
        InFlight guard(to_legacy_, name);
        qCDebug(lcBridge) << E::kName << "->" << name;
        center_.broadcast(name, LegacyCodec<E>::encode(event));
    });

    inbound_.insert(name, [this, name](const QVariantMap& payload) {
        auto event = LegacyCodec<E>::decode(payload);
        if (!event) {
            qCWarning(lcBridge) << "dropping" << name << "with undecodable payload" << payload;
            return;
        }
        InFlight guard(to_bus_, name);
        qCDebug(lcBridge) << name << "->" << E::kName;
        bus_.publish(*event);
    });
}

void NotificationBridge::start() {
    if (running_) {
        return;
    }
    forEachBridgedType([this](auto* tag) {
        using E = std::remove_pointer_t<decltype(tag)>;
        bridge<E>();
    });
    connection_ = connect(&center_, &NotificationCenter::notificationPosted,
                          this, &NotificationBridge::onNotificationPosted, Qt::DirectConnection);
    running_ = true;
    qCInfo(lcBridge) << "bridging" << inbound_.size() << "notification names";
}

void NotificationBridge::stop() {
    if (!running_) {
        return;
    }
    disconnect(connection_);
    subscriptions_.clearAll();
    inbound_.clear();
    running_ = false;
}

void NotificationBridge::onNotificationPosted(const QString& name, const QVariantMap& payload) {
    if (to_legacy_.contains(name)) {
        return;
    }
    auto it = inbound_.constFind(name);
    if (it == inbound_.constEnd()) {
        return;
    }
    // Copy: the handler may publish into code that stops the bridge.
    auto handler = it.value();
    handler(payload);
}

} // namespace sn
