#include <catch2/catch_test_macros.hpp>
#include "sync/reconcile.hpp"

using namespace clipsync;
using namespace clipsync::sync;
using clipsync::crypto::Fingerprint;

TEST_CASE("decide_local: unchanged content does nothing", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    state.last_local_fingerprint = Fingerprint::of("a");

    REQUIRE(decide_local(state, Fingerprint::of("a")).kind == LocalDecisionKind::Unchanged);
}

TEST_CASE("decide_local: new content is pushed", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    REQUIRE(decide_local(state, Fingerprint::of("first")).kind == LocalDecisionKind::Push);

    state.last_local_fingerprint = Fingerprint::of("first");
    state.last_action_origin = ActionOrigin::Local;
    REQUIRE(decide_local(state, Fingerprint::of("second")).kind == LocalDecisionKind::Push);
}

TEST_CASE("decide_local: unacknowledged content is pushed again", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    state.last_local_fingerprint = Fingerprint::of("offline");
    state.last_action_origin = ActionOrigin::Local;
    state.push_pending = true;
    REQUIRE(decide_local(state, Fingerprint::of("offline")).kind == LocalDecisionKind::Push);

    state.push_pending = false;
    REQUIRE(decide_local(state, Fingerprint::of("offline")).kind == LocalDecisionKind::Unchanged);
}

TEST_CASE("decide_local: change right after a pull is a read-back", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    state.last_local_fingerprint = Fingerprint::of("pulled");
    state.last_action_origin = ActionOrigin::Remote;

    const auto decision = decide_local(state, Fingerprint::of("pulled, re-encoded"));
    REQUIRE(decision.kind == LocalDecisionKind::AdoptReadBack);
    REQUIRE_FALSE(decision.reason.isEmpty());
}

TEST_CASE("decide_remote: unchanged fingerprint is skipped", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    state.last_remote_fingerprint = Fingerprint::of("x");
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Phone, Origin::Desktop).kind
            == RemoteDecisionKind::Unchanged);
}

TEST_CASE("decide_remote: own origin is never pulled back", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Desktop, Origin::Desktop).kind
            == RemoteDecisionKind::OwnOrigin);
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Phone, Origin::Phone).kind
            == RemoteDecisionKind::OwnOrigin);
}

TEST_CASE("decide_remote: foreign and unknown origins are applied", "[reconcile]") {
    REQUIRE(crypto::init().is_ok());

    EngineState state;
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Phone, Origin::Desktop).kind
            == RemoteDecisionKind::Apply);
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Unknown, Origin::Desktop).kind
            == RemoteDecisionKind::Apply);
    REQUIRE(decide_remote(state, Fingerprint::of("x"), Origin::Unknown, Origin::Phone).kind
            == RemoteDecisionKind::Apply);
}

TEST_CASE("revisions_skipped counts unseen writes", "[reconcile]") {
    REQUIRE(revisions_skipped(0, 5) == 0);
    REQUIRE(revisions_skipped(3, 3) == 0);
    REQUIRE(revisions_skipped(3, 4) == 0);
    REQUIRE(revisions_skipped(3, 7) == 3);
    REQUIRE(revisions_skipped(9, 2) == 0);
}
