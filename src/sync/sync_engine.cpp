#include "sync/sync_engine.hpp"
#include "core/logging.hpp"

#include <exception>

namespace clipsync::sync {

SyncEngine::SyncEngine(platform::ClipboardPort& clipboard,
                       network::RemoteStore& remote,
                       Options options,
                       QObject* parent)
    : QObject(parent)
    , clipboard_(clipboard)
    , remote_(remote)
    , options_(options)
    , timer_(this)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &SyncEngine::onTimer);
}

TickReport SyncEngine::tick() {
    TickReport report;
    if (paused_) {
        report.paused = true;
        return report;
    }

    ++stats_.ticks;
    report.local = syncLocal(report);
    // A pull only shields the tick right after it, whatever that tick read.
    if (state_.last_action_origin == ActionOrigin::Remote) {
        state_.last_action_origin = ActionOrigin::None;
    }
    report.remote = syncRemote(report);
    return report;
}

StepOutcome SyncEngine::syncLocal(TickReport& report) {
    auto read = clipboard_.read();
    if (read.is_err()) {
        ++stats_.transient_failures;
        qCDebug(lcSync) << "clipboard read failed:" << read.unwrap_err().message.c_str();
        return StepOutcome::TransientFailure;
    }
    const auto& local = read.unwrap();
    if (!local) {
        return StepOutcome::Skipped;
    }

    auto clip = Clip::from_local(local->kind, local->bytes, options_.origin);
    const auto fingerprint = crypto::Fingerprint::of(clip.payload);
    const auto decision = decide_local(state_, fingerprint);

    switch (decision.kind) {
        case LocalDecisionKind::Unchanged:
            return StepOutcome::Skipped;

        case LocalDecisionKind::AdoptReadBack:
            qCDebug(lcSync) << decision.reason << fingerprint.hex();
            state_.last_local_fingerprint = fingerprint;
            state_.last_action_origin = ActionOrigin::None;
            report.adopted_read_back = true;
            return StepOutcome::Done;

        case LocalDecisionKind::Push:
            break;
    }

    auto ack = remote_.push(clip);
    state_.last_local_fingerprint = fingerprint;
    state_.last_action_origin = ActionOrigin::Local;

    if (ack.is_err()) {
        state_.push_pending = true;
        ++stats_.transient_failures;
        qCDebug(lcSync) << decision.reason << "failed:" << ack.unwrap_err().message.c_str();
        return StepOutcome::TransientFailure;
    }

    state_.push_pending = false;
    state_.last_remote_fingerprint = fingerprint;
    clip.revision = ack.unwrap();
    observeRevision(clip.revision);
    ++stats_.pushes;
    report.pushed = true;
    qCInfo(lcSync) << "pushed" << to_wire(clip.kind) << "clip, revision" << clip.revision;
    emit pushed(clip);
    return StepOutcome::Done;
}

StepOutcome SyncEngine::syncRemote(TickReport& report) {
    auto fetched = remote_.fetch();
    if (fetched.is_err()) {
        ++stats_.transient_failures;
        qCDebug(lcSync) << "fetch failed:" << fetched.unwrap_err().message.c_str();
        return StepOutcome::TransientFailure;
    }
    if (!fetched.unwrap()) {
        return StepOutcome::Skipped;
    }

    const Clip clip = *fetched.unwrap();
    observeRevision(clip.revision);

    const auto fingerprint = crypto::Fingerprint::of(clip.payload);
    const auto decision = decide_remote(state_, fingerprint, clip.origin, options_.origin);
    if (decision.kind != RemoteDecisionKind::Apply) {
        return StepOutcome::Skipped;
    }

    auto bytes = clip.local_bytes();
    if (bytes.is_err()) {
        // Retrying cannot fix a broken payload; wait for the next write.
        qCWarning(lcSync) << "ignoring remote clip revision" << clip.revision << ":"
                          << bytes.unwrap_err().message.c_str();
        state_.last_remote_fingerprint = fingerprint;
        return StepOutcome::Skipped;
    }

    auto written = clipboard_.write(clip.kind, bytes.unwrap());
    if (written.is_err() && written.unwrap_err().kind == ErrorKind::Validation) {
        // The clipboard refused the content itself; it will refuse it again.
        qCWarning(lcSync) << "ignoring remote clip revision" << clip.revision << ":"
                          << written.unwrap_err().message.c_str();
        state_.last_remote_fingerprint = fingerprint;
        return StepOutcome::Skipped;
    }
    if (written.is_err()) {
        ++stats_.transient_failures;
        qCDebug(lcSync) << "clipboard write failed:" << written.unwrap_err().message.c_str();
        return StepOutcome::TransientFailure;
    }

    state_.last_local_fingerprint = fingerprint;
    state_.last_remote_fingerprint = fingerprint;
    state_.last_action_origin = ActionOrigin::Remote;
    state_.push_pending = false;
    ++stats_.pulls;
    report.pulled = true;
    qCInfo(lcSync) << "pulled" << to_wire(clip.kind) << "clip from" << to_wire(clip.origin)
                   << "revision" << clip.revision;
    emit pulled(clip);
    return StepOutcome::Done;
}

void SyncEngine::observeRevision(qint64 revision) {
    if (revision <= 0) {
        return;
    }
    const auto skipped = revisions_skipped(state_.last_seen_revision, revision);
    if (skipped > 0) {
        stats_.skipped_revisions += static_cast<quint64>(skipped);
        qCInfo(lcSync) << "missed" << skipped << "store revision(s) before" << revision;
    }
    state_.last_seen_revision = revision;
}

void SyncEngine::start() {
    if (running_) {
        return;
    }
    running_ = true;
    stop_requested_ = false;
    qCInfo(lcSync) << "sync engine started as" << to_wire(options_.origin)
                   << "polling every" << options_.poll_interval_ms << "ms";
    schedule(0);
}

void SyncEngine::requestStop() {
    if (!running_) {
        return;
    }
    stop_requested_ = true;
    if (!in_tick_) {
        finishStop();
    }
}

void SyncEngine::pause() {
    if (!paused_) {
        paused_ = true;
        qCInfo(lcSync) << "sync paused";
    }
}

void SyncEngine::resume() {
    if (paused_) {
        paused_ = false;
        qCInfo(lcSync) << "sync resumed";
    }
}

void SyncEngine::onTimer() {
    if (!running_) {
        return;
    }

    int delay = options_.poll_interval_ms;
    in_tick_ = true;
    try {
        tick();
    } catch (const std::exception& e) {
        ++stats_.tick_exceptions;
        delay = options_.backoff_ms;
        qCWarning(lcSync) << "sync tick failed:" << e.what();
        emit tickFailed(QString::fromUtf8(e.what()));
    } catch (...) {
        ++stats_.tick_exceptions;
        delay = options_.backoff_ms;
        qCWarning(lcSync) << "sync tick failed with a non-standard exception";
        emit tickFailed(QStringLiteral("unknown error"));
    }
    in_tick_ = false;

    if (stop_requested_) {
        finishStop();
        return;
    }
    schedule(delay);
}

void SyncEngine::schedule(int delay_ms) {
    last_delay_ms_ = delay_ms;
    timer_.start(delay_ms);
}

void SyncEngine::finishStop() {
    timer_.stop();
    running_ = false;
    stop_requested_ = false;
    qCInfo(lcSync) << "sync engine stopped after" << stats_.ticks << "ticks";
    emit stopped();
}

} // namespace clipsync::sync
