#include <catch2/catch_test_macros.hpp>
#include "sync/one_shot.hpp"
#include "fake_remote.hpp"

using namespace clipsync;
using namespace clipsync::sync;
using clipsync::platform::MemoryClipboard;
using clipsync::storage::ClipStore;
using clipsync::storage::MemorySlotBackend;
using clipsync::testing::FakeRemote;
using clipsync::testing::put_remote;

TEST_CASE("push_once uploads the clipboard with the given origin", "[oneshot]") {
    ClipStore store(std::make_unique<MemorySlotBackend>());
    FakeRemote remote(store);
    MemoryClipboard clipboard;
    clipboard.set(ClipKind::Text, "one shot");

    auto pushed = push_once(clipboard, remote, Origin::Phone);
    REQUIRE(pushed.is_ok());
    REQUIRE(pushed.unwrap().revision == 1);
    REQUIRE(store.current()->payload == QByteArrayLiteral("one shot"));
    REQUIRE(store.current()->origin == Origin::Phone);
}

TEST_CASE("push_once fails on an empty clipboard", "[oneshot]") {
    ClipStore store(std::make_unique<MemorySlotBackend>());
    FakeRemote remote(store);
    MemoryClipboard clipboard;

    auto pushed = push_once(clipboard, remote, Origin::Desktop);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(remote.push_calls == 0);
}

TEST_CASE("push_once reports an unreachable store", "[oneshot]") {
    ClipStore store(std::make_unique<MemorySlotBackend>());
    FakeRemote remote(store);
    remote.offline = true;
    MemoryClipboard clipboard;
    clipboard.set(ClipKind::Text, "x");

    auto pushed = push_once(clipboard, remote, Origin::Desktop);
    REQUIRE(pushed.is_err());
    REQUIRE(pushed.unwrap_err().kind == ErrorKind::Transient);
}

TEST_CASE("pull_once writes the stored clip to the clipboard", "[oneshot]") {
    ClipStore store(std::make_unique<MemorySlotBackend>());
    FakeRemote remote(store);
    MemoryClipboard clipboard;
    put_remote(store, "stored", Origin::Desktop);

    // Unlike the engine, a manual pull ignores the origin.
    auto pulled = pull_once(clipboard, remote);
    REQUIRE(pulled.is_ok());
    REQUIRE(pulled.unwrap().origin == Origin::Desktop);
    REQUIRE(clipboard.content()->bytes == QByteArrayLiteral("stored"));
}

TEST_CASE("pull_once fails on an empty store", "[oneshot]") {
    ClipStore store(std::make_unique<MemorySlotBackend>());
    FakeRemote remote(store);
    MemoryClipboard clipboard;

    auto pulled = pull_once(clipboard, remote);
    REQUIRE(pulled.is_err());
    REQUIRE(pulled.unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(clipboard.writes() == 0);
}
