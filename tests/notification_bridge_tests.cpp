#include <doctest/doctest.h>

#include <QObject>

#include "sn/events.h"
#include "sn/handle_registry.h"
#include "sn/notification_bridge.h"
#include "sn/notification_center.h"
#include "sn/subscription_manager.h"

using namespace sn;

namespace {

struct Posted {
    QString name;
    QVariantMap payload;
};

struct Fixture {
    EventBus bus;
    NotificationCenter center;
    NotificationBridge bridge{bus, center};
    std::vector<Posted> posted;
    QMetaObject::Connection connection;

    Fixture() {
        connection = QObject::connect(&center, &NotificationCenter::notificationPosted,
            [this](const QString& name, const QVariantMap& payload) { posted.push_back({name, payload}); });
        bridge.start();
    }

    ~Fixture() {
        QObject::disconnect(connection);
    }
};

} // namespace

TEST_CASE("NotificationBridge: typed events are broadcast once under their legacy name")
{
    Fixture f;
    int typed = 0;
    SubscriptionManager subs(f.bus);
    subs.subscribe<events::PageSelected>([&typed](const events::PageSelected&) { ++typed; });

    f.bus.publish(events::PageSelected{3});

    REQUIRE(f.posted.size() == 1);
    CHECK(f.posted[0].name == "PageSelected");
    CHECK(f.posted[0].payload.value("pageIndex").toInt() == 3);
    CHECK(typed == 1);
    CHECK(f.center.postCount("PageSelected") == 1);
}

TEST_CASE("NotificationBridge: legacy broadcasts are published once as typed events")
{
    Fixture f;
    std::vector<int> received;
    SubscriptionManager subs(f.bus);
    subs.subscribe<events::PageReordering>([&received](const events::PageReordering& e) {
        received.push_back(e.fromIndex);
        received.push_back(e.toIndex);
    });

    f.center.broadcast("PageReorderingNotification", {{"fromIndex", 2}, {"toIndex", 0}});

    CHECK(received == std::vector<int>{2, 0});
    // Only the original broadcast, no echo.
    CHECK(f.posted.size() == 1);
    CHECK(f.center.postCount("PageReorderingNotification") == 1);
}

TEST_CASE("NotificationBridge: PageReordering uses its dedicated legacy name")
{
    CHECK(NotificationBridge::legacyNameFor(events::PageReordering::kName) == "PageReorderingNotification");
    CHECK(NotificationBridge::legacyNameFor(events::ToggleSidebar::kName) == "ToggleSidebar");
    CHECK(NotificationBridge::legacyNameFor(events::StateChanged::kName).isEmpty());
    CHECK(NotificationBridge::legacyNames().size() == 22);
}

TEST_CASE("NotificationBridge: payload fields survive both directions")
{
    Fixture f;

    SUBCASE("template") {
        std::optional<CanvasTemplate> received;
        SubscriptionManager subs(f.bus);
        subs.subscribe<events::TemplateChanged>([&received](const events::TemplateChanged& e) { received = e.canvasTemplate; });

        f.bus.publish(events::TemplateChanged{CanvasTemplate::graph()});
        REQUIRE(f.posted.size() == 1);
        const QVariantMap t = f.posted[0].payload.value("template").toMap();
        CHECK(t.value("type").toString() == "Graph Paper");
        CHECK(t.value("spacing").toDouble() == doctest::Approx(20.0));

        received.reset();
        f.center.broadcast("TemplateChanged", f.posted[0].payload);
        CHECK(received == CanvasTemplate::graph());
    }

    SUBCASE("drawing data") {
        std::optional<events::PageDrawingChanged> received;
        SubscriptionManager subs(f.bus);
        subs.subscribe<events::PageDrawingChanged>([&received](const events::PageDrawingChanged& e) { received = e; });

        f.center.broadcast("PageDrawingChanged", {{"pageId", "p1"}, {"drawingData", QByteArray("\x01\x02", 2)}});
        REQUIRE(received);
        CHECK(received->pageId == "p1");
        REQUIRE(received->drawingData);
        CHECK(*received->drawingData == DrawingData{1, 2});
    }

    SUBCASE("drawing data to legacy") {
        events::PageDrawingChanged e;
        e.pageId = "p2";
        e.drawingData = DrawingData{0, 128, 255};
        f.bus.publish(e);

        REQUIRE(f.posted.size() == 1);
        const QByteArray bytes = f.posted[0].payload.value("drawingData").toByteArray();
        REQUIRE(bytes.size() == 3);
        CHECK(static_cast<unsigned char>(bytes[0]) == 0);
        CHECK(static_cast<unsigned char>(bytes[1]) == 128);
        CHECK(static_cast<unsigned char>(bytes[2]) == 255);
    }

    SUBCASE("coordinator handle") {
        HandleRegistry registry;
        const OpaqueHandle handle = registry.issue(std::make_shared<int>(7));
        f.bus.publish(events::CoordinatorReady{handle});
        REQUIRE(f.posted.size() == 1);
        CHECK(f.posted[0].payload.value("coordinator").toULongLong() == handle.value);
    }
}

TEST_CASE("NotificationBridge: undecodable legacy payloads are dropped")
{
    Fixture f;
    int received = 0;
    SubscriptionManager subs(f.bus);
    subs.subscribe<events::SidebarVisibilityChanged>([&received](const events::SidebarVisibilityChanged&) { ++received; });

    f.center.broadcast("SidebarVisibilityChanged", {{"isVisible", "yes"}});
    f.center.broadcast("SidebarVisibilityChanged", {});
    CHECK(received == 0);

    f.center.broadcast("SidebarVisibilityChanged", {{"isVisible", true}});
    CHECK(received == 1);
}

TEST_CASE("NotificationBridge: unknown legacy names are ignored")
{
    Fixture f;
    f.center.broadcast("SomethingElse", {});
    CHECK(f.posted.size() == 1);
    CHECK(f.bus.listActiveEventTypes().count("PageSelected") == 1);
}

TEST_CASE("NotificationBridge: stop removes both directions")
{
    Fixture f;
    f.bridge.stop();
    CHECK_FALSE(f.bridge.isRunning());
    CHECK(f.bus.listActiveEventTypes().empty());

    f.bus.publish(events::ToggleCoordinateGrid{});
    CHECK(f.posted.empty());

    int received = 0;
    SubscriptionManager subs(f.bus);
    subs.subscribe<events::ToggleCoordinateGrid>([&received](const events::ToggleCoordinateGrid&) { ++received; });
    f.center.broadcast("ToggleCoordinateGrid");
    CHECK(received == 0);

    f.bridge.start();
    f.bridge.start();
    f.bus.publish(events::ToggleCoordinateGrid{});
    CHECK(f.posted.size() == 2);
}
