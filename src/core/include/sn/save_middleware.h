#pragma once

#include <memory>
#include <QFutureWatcher>
#include <QObject>
#include <QTimer>

#include "application_settings.h"
#include "interfaces.h"
#include "storage.h"
#include "store.h"

namespace sn {

// Persists content after Subject, Note, Page and Template actions. Saves are
// debounced and run on a worker thread; the outcome is published on the
// store's bus as SaveCompleted or SaveFailed. Settings changes are written
// to ApplicationSettings immediately.
class SaveMiddleware : public QObject, public Middleware {
    Q_OBJECT

public:
    // `storage` and `settings` must outlive this object; `settings` may be null.
    SaveMiddleware(Store& store, IStateStorage* storage, ApplicationSettings* settings = nullptr,
                   QObject* parent = nullptr);
    ~SaveMiddleware() override;

    void afterReduce(const Action& action, const AppState& previous, const AppState& next) override;

    void setDebounceMs(int ms);
    [[nodiscard]] int debounceMs() const { return debounce_ms_; }

    // Restarts the debounce window.
    void scheduleSave();

    // Cancels the debounce, waits for a running save and writes the latest
    // state synchronously. Used at shutdown.
    bool flush();

    [[nodiscard]] bool isSaving() const { return saving_; }
    [[nodiscard]] bool hasUnsavedChanges() const { return dirty_; }
    [[nodiscard]] int completedSaves() const { return completed_saves_; }

signals:
    void saveFinished(bool success);

private slots:
    void onDebounceTimeout();
    void onWatcherFinished();

private:
    static bool shouldSave(const Action& action);

    void startSave();
    void handleResult(const VoidResult& result, size_t subjectCount);

    Store& store_;
    IStateStorage* storage_;
    ApplicationSettings* settings_;

    QTimer debounce_timer_;
    QFutureWatcher<VoidResult> watcher_;
    int debounce_ms_ = 3000;

    bool saving_ = false;
    bool pending_save_ = false;
    bool dirty_ = false;
    size_t in_flight_count_ = 0;
    int completed_saves_ = 0;
};

} // namespace sn
