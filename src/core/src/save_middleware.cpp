#include "sn/save_middleware.h"

#include <QtConcurrent/QtConcurrent>

#include "sn/events.h"
#include "sn/logging.h"

namespace sn {

SaveMiddleware::SaveMiddleware(Store& store, IStateStorage* storage, ApplicationSettings* settings, QObject* parent)
    : QObject(parent)
    , store_(store)
    , storage_(storage)
    , settings_(settings) {
    if (settings_) {
        debounce_ms_ = settings_->saveDebounceMs();
    }
    debounce_timer_.setSingleShot(true);
    debounce_timer_.setInterval(debounce_ms_);
    connect(&debounce_timer_, &QTimer::timeout, this, &SaveMiddleware::onDebounceTimeout);
    connect(&watcher_, &QFutureWatcher<VoidResult>::finished, this, &SaveMiddleware::onWatcherFinished);
}

SaveMiddleware::~SaveMiddleware() {
    debounce_timer_.stop();
    // The worker reads through storage_, which may go away with us.
    if (saving_) {
        watcher_.waitForFinished();
    }
}

bool SaveMiddleware::shouldSave(const Action& action) {
    // Freshly loaded content is already on disk.
    if (std::holds_alternative<actions::LoadSubjects>(action)) {
        return false;
    }
    switch (categoryOf(action)) {
    case ActionCategory::Subject:
    case ActionCategory::Note:
    case ActionCategory::Page:
    case ActionCategory::Template:
        return true;
    case ActionCategory::Navigation:
    case ActionCategory::Settings:
        break;
    }
    return false;
}

void SaveMiddleware::afterReduce(const Action& action, const AppState& previous, const AppState& next) {
    if (&previous == &next) {
        return;
    }
    if (settings_ && previous.settings != next.settings) {
        settings_->saveSettingsState(next.settings);
    }
    if (shouldSave(action)) {
        scheduleSave();
    }
}

void SaveMiddleware::setDebounceMs(int ms) {
    debounce_ms_ = ms < 0 ? 0 : ms;
    debounce_timer_.setInterval(debounce_ms_);
}

void SaveMiddleware::scheduleSave() {
    dirty_ = true;
    if (saving_) {
        pending_save_ = true;
        return;
    }
    qCDebug(lcPersistence) << "scheduling save in" << debounce_ms_ << "ms";
    debounce_timer_.start();
}

void SaveMiddleware::onDebounceTimeout() {
    startSave();
}

void SaveMiddleware::startSave() {
    if (saving_ || !storage_) {
        return;
    }
    std::shared_ptr<const AppState> state = store_.snapshot();
    saving_ = true;
    dirty_ = false;
    in_flight_count_ = state->content.subjects.size();

    IStateStorage* storage = storage_;
    QFuture<VoidResult> future = QtConcurrent::run([storage, state]() {
        return storage->saveSubjects(state->content.subjects);
    });
    watcher_.setFuture(future);
}

void SaveMiddleware::onWatcherFinished() {
    // Already handled by flush()
    if (!saving_) {
        return;
    }
    handleResult(watcher_.result(), in_flight_count_);
}

void SaveMiddleware::handleResult(const VoidResult& result, size_t subjectCount) {
    saving_ = false;

    if (isSuccess(result)) {
        ++completed_saves_;
        qCInfo(lcPersistence) << "saved" << subjectCount << "subjects";
        store_.bus().publish(events::SaveCompleted{subjectCount});
        emit saveFinished(true);
    } else {
        // Keep the changes marked unsaved so the next save or flush retries.
        dirty_ = true;
        const char* reason = storageErrorName(std::get<StorageError>(result));
        qCWarning(lcPersistence) << "save failed:" << reason;
        store_.bus().publish(events::SaveFailed{reason});
        emit saveFinished(false);
    }

    if (pending_save_) {
        pending_save_ = false;
        scheduleSave();
    }
}

bool SaveMiddleware::flush() {
    debounce_timer_.stop();
    if (saving_) {
        watcher_.waitForFinished();
        handleResult(watcher_.result(), in_flight_count_);
        debounce_timer_.stop();
    }
    pending_save_ = false;
    if (!dirty_ || !storage_) {
        return !dirty_;
    }

    std::shared_ptr<const AppState> state = store_.snapshot();
    saving_ = true;
    dirty_ = false;
    VoidResult result = storage_->saveSubjects(state->content.subjects);
    handleResult(result, state->content.subjects.size());
    return isSuccess(result);
}

} // namespace sn
