#include "sn/application_settings.h"

#include <QStandardPaths>

#include "sn/logging.h"

namespace sn {

namespace {

constexpr int kDefaultSaveDebounceMs = 3000;

QString viewModeName(ViewMode mode) {
    return mode == ViewMode::List ? QStringLiteral("list") : QStringLiteral("grid");
}

ViewMode viewModeFromName(const QString& name) {
    return name == QLatin1String("list") ? ViewMode::List : ViewMode::Grid;
}

QString sortOptionName(SortOption option) {
    switch (option) {
    case SortOption::DateCreated: return QStringLiteral("dateCreated");
    case SortOption::Title: return QStringLiteral("title");
    case SortOption::DateModified: break;
    }
    return QStringLiteral("dateModified");
}

SortOption sortOptionFromName(const QString& name) {
    if (name == QLatin1String("dateCreated")) {
        return SortOption::DateCreated;
    }
    if (name == QLatin1String("title")) {
        return SortOption::Title;
    }
    return SortOption::DateModified;
}

CanvasTemplate presetFor(CanvasTemplate::Type type) {
    switch (type) {
    case CanvasTemplate::Type::Lined: return CanvasTemplate::lined();
    case CanvasTemplate::Type::Graph: return CanvasTemplate::graph();
    case CanvasTemplate::Type::Dotted: return CanvasTemplate::dotted();
    case CanvasTemplate::Type::None: break;
    }
    return CanvasTemplate::none();
}

} // namespace

ApplicationSettings::ApplicationSettings()
    : settings_("SmartNotes", "smartnotes") {
}

ApplicationSettings::ApplicationSettings(const QString& iniPath)
    : settings_(iniPath, QSettings::IniFormat) {
}

QString ApplicationSettings::dataFile() const {
    const QString fallback = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/subjects.json";
    return settings_.value("SN/dataFile", fallback).toString();
}

void ApplicationSettings::setDataFile(const QString& path) {
    settings_.setValue("SN/dataFile", path);
}

int ApplicationSettings::saveDebounceMs() const {
    bool ok = false;
    int ms = settings_.value("SN/saveDebounceMs", kDefaultSaveDebounceMs).toInt(&ok);
    if (!ok || ms < 0) {
        qCWarning(lcPersistence) << "invalid SN/saveDebounceMs, using" << kDefaultSaveDebounceMs;
        return kDefaultSaveDebounceMs;
    }
    return ms;
}

void ApplicationSettings::setSaveDebounceMs(int ms) {
    settings_.setValue("SN/saveDebounceMs", ms);
}

bool ApplicationSettings::debugLogging() const {
    return settings_.value("SN/debugLogging", false).toBool();
}

void ApplicationSettings::setDebugLogging(bool enabled) {
    settings_.setValue("SN/debugLogging", enabled);
}

SettingsState ApplicationSettings::loadSettingsState() const {
    SettingsState state;
    state.disableFingerDrawing = settings_.value("SN/disableFingerDrawing", state.disableFingerDrawing).toBool();
    state.autoScrollEnabled = settings_.value("SN/autoScrollEnabled", state.autoScrollEnabled).toBool();

    const QString templateName = settings_.value("SN/defaultTemplate/type", templateTypeName(state.defaultTemplate.type)).toString();
    if (auto type = templateTypeFromName(templateName.toStdString())) {
        // Fields missing from older files take the preset's values.
        CanvasTemplate t = presetFor(*type);
        t.spacing = settings_.value("SN/defaultTemplate/spacing", t.spacing).toDouble();
        t.colorHex = settings_.value("SN/defaultTemplate/colorHex", QString::fromStdString(t.colorHex)).toString().toStdString();
        t.lineWidth = settings_.value("SN/defaultTemplate/lineWidth", t.lineWidth).toDouble();
        state.defaultTemplate = t;
    } else {
        qCWarning(lcPersistence) << "unknown default template" << templateName;
    }

    state.defaultViewMode = viewModeFromName(settings_.value("SN/defaultViewMode", viewModeName(state.defaultViewMode)).toString());
    state.defaultSortOption = sortOptionFromName(settings_.value("SN/defaultSortOption", sortOptionName(state.defaultSortOption)).toString());
    state.defaultSortOrder = settings_.value("SN/defaultSortOrder", "descending").toString() == QLatin1String("ascending")
        ? SortOrder::Ascending
        : SortOrder::Descending;
    return state;
}

void ApplicationSettings::saveSettingsState(const SettingsState& state) {
    settings_.setValue("SN/disableFingerDrawing", state.disableFingerDrawing);
    settings_.setValue("SN/autoScrollEnabled", state.autoScrollEnabled);
    settings_.setValue("SN/defaultTemplate/type", QString::fromLatin1(templateTypeName(state.defaultTemplate.type)));
    settings_.setValue("SN/defaultTemplate/spacing", state.defaultTemplate.spacing);
    settings_.setValue("SN/defaultTemplate/colorHex", QString::fromStdString(state.defaultTemplate.colorHex));
    settings_.setValue("SN/defaultTemplate/lineWidth", state.defaultTemplate.lineWidth);
    settings_.setValue("SN/defaultViewMode", viewModeName(state.defaultViewMode));
    settings_.setValue("SN/defaultSortOption", sortOptionName(state.defaultSortOption));
    settings_.setValue("SN/defaultSortOrder",
        state.defaultSortOrder == SortOrder::Ascending ? QStringLiteral("ascending") : QStringLiteral("descending"));
}

void ApplicationSettings::sync() {
    settings_.sync();
    if (settings_.status() != QSettings::NoError) {
        qCWarning(lcPersistence) << "failed to write settings to" << settings_.fileName();
    }
}

} // namespace sn
