#pragma once

#include <memory>
#include <optional>
#include <string>

#include "actions.h"
#include "app_state.h"
#include "handle_registry.h"
#include "note_model.h"

namespace sn {
namespace events {

// Page navigation and selection

struct PageSelected {
    static constexpr const char* kName = "PageSelected";
    static constexpr const char* kDescription = "Fired when a page is selected, either programmatically or by user";
    int pageIndex = 0;
};

struct PageSelectedByUser {
    static constexpr const char* kName = "PageSelectedByUser";
    static constexpr const char* kDescription = "Fired when a page is explicitly selected by the user via the thumbnail";
    int pageIndex = 0;
};

struct PageSelectionDeactivated {
    static constexpr const char* kName = "PageSelectionDeactivated";
    static constexpr const char* kDescription = "Fired when page selection is deactivated, allowing free scrolling";
};

struct PageAdded {
    static constexpr const char* kName = "PageAdded";
    static constexpr const char* kDescription = "Fired when a new page is added to the note";
    PageId pageId;
};

struct PageReordering {
    static constexpr const char* kName = "PageReordering";
    static constexpr const char* kDescription = "Fired when pages are reordered via drag and drop";
    int fromIndex = 0;
    int toIndex = 0;
};

struct VisiblePageChanged {
    static constexpr const char* kName = "VisiblePageChanged";
    static constexpr const char* kDescription = "Fired when the visible page changes during scrolling";
    int pageIndex = 0;
};

struct ScrollToPage {
    static constexpr const char* kName = "ScrollToPage";
    static constexpr const char* kDescription = "Request to scroll to a specific page";
    int pageIndex = 0;
};

// Drawing

struct PageDrawingChanged {
    static constexpr const char* kName = "PageDrawingChanged";
    static constexpr const char* kDescription = "Fired when a page's drawing is modified and saved";
    PageId pageId;
    std::optional<DrawingData> drawingData;
};

struct LiveDrawingUpdate {
    static constexpr const char* kName = "LiveDrawingUpdate";
    static constexpr const char* kDescription = "Fired during active drawing to provide frequent updates";
    PageId pageId;
};

struct DrawingStarted {
    static constexpr const char* kName = "DrawingStarted";
    static constexpr const char* kDescription = "Fired when drawing begins on a page";
    PageId pageId;
};

struct DrawingDidComplete {
    static constexpr const char* kName = "DrawingDidComplete";
    static constexpr const char* kDescription = "Fired when drawing is completed on a page";
    PageId pageId;
};

// Templates

struct RefreshTemplate {
    static constexpr const char* kName = "RefreshTemplate";
    static constexpr const char* kDescription = "Request to refresh the current template";
};

struct ForceTemplateRefresh {
    static constexpr const char* kName = "ForceTemplateRefresh";
    static constexpr const char* kDescription = "Request to force a complete template refresh";
};

struct TemplateChanged {
    static constexpr const char* kName = "TemplateChanged";
    static constexpr const char* kDescription = "Fired when a template has been changed";
    CanvasTemplate canvasTemplate;
};

// Sidebar

struct SidebarVisibilityChanged {
    static constexpr const char* kName = "SidebarVisibilityChanged";
    static constexpr const char* kDescription = "Fired when the sidebar visibility changes";
    bool isVisible = false;
};

struct CloseSidebar {
    static constexpr const char* kName = "CloseSidebar";
    static constexpr const char* kDescription = "Request to close the sidebar";
};

struct ToggleSidebar {
    static constexpr const char* kName = "ToggleSidebar";
    static constexpr const char* kDescription = "Request to toggle the sidebar visibility";
};

// Coordinate grid

struct GridStateChanged {
    static constexpr const char* kName = "GridStateChanged";
    static constexpr const char* kDescription = "Fired when the grid visibility state changes";
    bool isVisible = false;
};

struct ToggleCoordinateGrid {
    static constexpr const char* kName = "ToggleCoordinateGrid";
    static constexpr const char* kDescription = "Request to toggle the coordinate grid visibility";
};

// Tools

enum class InkType {
    Pen,
    Pencil,
    Marker
};

struct ToolChanged {
    static constexpr const char* kName = "ToolChanged";
    static constexpr const char* kDescription = "Fired when a drawing tool is changed";
    InkType tool = InkType::Pen;
    std::string colorHex = "#000000";
    double width = 1.0;
};

// System

struct DebugModeChanged {
    static constexpr const char* kName = "DebugModeChanged";
    static constexpr const char* kDescription = "Fired when debug mode is enabled or disabled";
    bool isEnabled = false;
};

struct AutoScrollSettingChanged {
    static constexpr const char* kName = "AutoScrollSettingChanged";
    static constexpr const char* kDescription = "Fired when auto-scroll settings are modified";
    bool isEnabled = false;
};

// The coordinator itself lives in a HandleRegistry; only its handle travels.
struct CoordinatorReady {
    static constexpr const char* kName = "CoordinatorReady";
    static constexpr const char* kDescription = "Fired when the multi-page scroll coordinator is ready";
    OpaqueHandle coordinator;
};

// Store

struct StateChanged {
    static constexpr const char* kName = "StateChanged";
    static constexpr const char* kDescription = "Fired after every dispatch with the new state snapshot";
    std::shared_ptr<const AppState> previous;
    std::shared_ptr<const AppState> current;
    ActionCategory category = ActionCategory::Subject;
    std::string actionDescription;
};

struct ActionIgnored {
    static constexpr const char* kName = "ActionIgnored";
    static constexpr const char* kDescription = "Fired in debug mode when a dispatched action left the state unchanged";
    std::string actionDescription;
};

// Persistence

struct SaveCompleted {
    static constexpr const char* kName = "SaveCompleted";
    static constexpr const char* kDescription = "Fired on the main thread after state was persisted";
    size_t subjectCount = 0;
};

struct SaveFailed {
    static constexpr const char* kName = "SaveFailed";
    static constexpr const char* kDescription = "Fired on the main thread when persisting state failed";
    std::string reason;
};

} // namespace events
} // namespace sn
