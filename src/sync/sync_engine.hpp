#pragma once

#include "core/clip.hpp"
#include "network/store_client.hpp"
#include "platform/clipboard.hpp"
#include "sync/reconcile.hpp"
#include <QObject>
#include <QTimer>

namespace clipsync::sync {

/**
 * Result of one half of a tick.
 */
enum class StepOutcome {
    Skipped,            // nothing to do, or nothing to read
    Done,               // acted (pushed, pulled, or adopted a read-back)
    TransientFailure    // clipboard or network failed; retried next tick
};

struct TickReport {
    StepOutcome local = StepOutcome::Skipped;
    StepOutcome remote = StepOutcome::Skipped;
    bool pushed = false;
    bool pulled = false;
    bool adopted_read_back = false;
    bool paused = false;
};

struct EngineStats {
    quint64 ticks = 0;
    quint64 pushes = 0;
    quint64 pulls = 0;
    quint64 transient_failures = 0;
    quint64 tick_exceptions = 0;
    quint64 skipped_revisions = 0;
};

/**
 * SyncEngine - polls the local clipboard and the remote store and moves
 * clips between them without echoing them back.
 *
 * Ticks run on the owning thread, driven by a single-shot timer that is only
 * re-armed after a tick returns, so ticks never overlap.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    struct Options {
        Origin origin = Origin::Desktop;
        int poll_interval_ms = 500;
        int backoff_ms = 1000;
    };

    SyncEngine(platform::ClipboardPort& clipboard,
               network::RemoteStore& remote,
               Options options,
               QObject* parent = nullptr);

    /**
     * Run one pass: local read and push, then remote fetch and pull.
     * Port failures are absorbed; an exception thrown by a port propagates
     * to the caller. The polling loop catches it and backs off.
     */
    TickReport tick();

    /**
     * Start the polling loop. The first tick runs on the next event loop turn.
     */
    void start();

    /**
     * Ask the loop to stop. An in-flight tick finishes first; stopped() is
     * emitted once the loop is idle.
     */
    void requestStop();

    void pause();
    void resume();

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] bool isPaused() const { return paused_; }
    [[nodiscard]] const EngineState& state() const { return state_; }
    [[nodiscard]] const EngineStats& stats() const { return stats_; }
    [[nodiscard]] const Options& options() const { return options_; }

    /**
     * Delay used when the timer was last armed.
     */
    [[nodiscard]] int lastScheduledDelayMs() const { return last_delay_ms_; }

signals:
    void pushed(const clipsync::Clip& clip);
    void pulled(const clipsync::Clip& clip);
    void tickFailed(const QString& message);
    void stopped();

private slots:
    void onTimer();

private:
    StepOutcome syncLocal(TickReport& report);
    StepOutcome syncRemote(TickReport& report);
    void observeRevision(qint64 revision);
    void schedule(int delay_ms);
    void finishStop();

    platform::ClipboardPort& clipboard_;
    network::RemoteStore& remote_;
    Options options_;
    EngineState state_;
    EngineStats stats_;
    QTimer timer_;
    bool running_ = false;
    bool paused_ = false;
    bool in_tick_ = false;
    bool stop_requested_ = false;
    int last_delay_ms_ = 0;
};

} // namespace clipsync::sync
