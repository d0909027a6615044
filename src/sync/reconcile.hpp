#pragma once

#include "core/clip.hpp"
#include "crypto/fingerprint.hpp"
#include <QString>
#include <QtGlobal>

namespace clipsync::sync {

/**
 * Who caused the most recent clipboard change this endpoint knows about.
 */
enum class ActionOrigin {
    None,
    Local,
    Remote
};

/**
 * Per-endpoint change-detection memory. Lives only as long as the engine.
 */
struct EngineState {
    crypto::Fingerprint last_local_fingerprint;
    crypto::Fingerprint last_remote_fingerprint;
    ActionOrigin last_action_origin = ActionOrigin::None;
    qint64 last_seen_revision = 0;
    // Set while the local clip behind last_local_fingerprint has not been
    // acknowledged by the store.
    bool push_pending = false;
};

enum class LocalDecisionKind {
    Unchanged,
    AdoptReadBack,
    Push,
};

struct LocalDecision {
    LocalDecisionKind kind = LocalDecisionKind::Unchanged;
    QString reason;
};

/**
 * What to do with the clipboard content fingerprinted as `observed`.
 *
 * A change seen right after this engine wrote the clipboard is its own write
 * read back; it is adopted without a push, once. Unchanged content whose last
 * push failed is pushed again.
 */
[[nodiscard]] inline LocalDecision decide_local(const EngineState& state,
                                                const crypto::Fingerprint& observed) {
    if (observed == state.last_local_fingerprint) {
        if (state.push_pending && state.last_action_origin == ActionOrigin::Local) {
            return {LocalDecisionKind::Push, QStringLiteral("Retrying unacknowledged push")};
        }
        return {LocalDecisionKind::Unchanged, QString{}};
    }
    if (state.last_action_origin == ActionOrigin::Remote) {
        return {LocalDecisionKind::AdoptReadBack, QStringLiteral("Read-back of a pulled clip")};
    }
    return {LocalDecisionKind::Push, QStringLiteral("Local clipboard changed")};
}

enum class RemoteDecisionKind {
    Unchanged,
    OwnOrigin,
    Apply,
};

struct RemoteDecision {
    RemoteDecisionKind kind = RemoteDecisionKind::Unchanged;
    QString reason;
};

/**
 * Whether a fetched clip should be written to the local clipboard. Clips
 * tagged with this endpoint's own origin are never pulled back.
 */
[[nodiscard]] inline RemoteDecision decide_remote(const EngineState& state,
                                                  const crypto::Fingerprint& fetched,
                                                  Origin clip_origin,
                                                  Origin self) {
    if (fetched == state.last_remote_fingerprint) {
        return {RemoteDecisionKind::Unchanged, QString{}};
    }
    if (clip_origin == self) {
        return {RemoteDecisionKind::OwnOrigin, QStringLiteral("Clip came from this endpoint")};
    }
    return {RemoteDecisionKind::Apply, QStringLiteral("Remote clip changed")};
}

/**
 * Number of store writes between `last_seen` and `observed` that this
 * endpoint never saw. Zero before the first observation and when the store
 * went backwards (reset or restored).
 */
[[nodiscard]] inline qint64 revisions_skipped(qint64 last_seen, qint64 observed) noexcept {
    if (last_seen <= 0 || observed <= last_seen + 1) {
        return 0;
    }
    return observed - last_seen - 1;
}

} // namespace clipsync::sync
