#include <catch2/catch_test_macros.hpp>
#include "network/store_client.hpp"
#include "network/store_server.hpp"
#include "platform/clipboard.hpp"
#include "storage/clip_store.hpp"
#include "sync/sync_engine.hpp"

using namespace clipsync;
using namespace clipsync::sync;
using clipsync::platform::MemoryClipboard;

namespace {

struct Endpoint {
    MemoryClipboard clipboard;
    network::HttpStoreClient client;
    SyncEngine engine;

    Endpoint(const QUrl& base, Origin origin)
        : client(base, 2000)
        , engine(clipboard, client, SyncEngine::Options{.origin = origin}) {}
};

QUrl base_url(quint16 port) {
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(QStringLiteral("127.0.0.1"));
    url.setPort(port);
    return url;
}

} // namespace

TEST_CASE("Sync: desktop and phone converge through one store", "[integration][sync]") {
    storage::ClipStore store(std::make_unique<storage::MemorySlotBackend>());
    network::StoreServer server(store);
    auto bound = server.listen(QStringLiteral("127.0.0.1"), 0);
    REQUIRE(bound.is_ok());
    const auto base = base_url(bound.unwrap());

    Endpoint desktop(base, Origin::Desktop);
    Endpoint phone(base, Origin::Phone);

    SECTION("desktop copy reaches the phone and nothing bounces") {
        desktop.clipboard.set(ClipKind::Text, "from the desktop");
        REQUIRE(desktop.engine.tick().pushed);

        REQUIRE(phone.engine.tick().pulled);
        REQUIRE(phone.clipboard.content()->bytes == QByteArrayLiteral("from the desktop"));

        for (int i = 0; i < 3; ++i) {
            REQUIRE_FALSE(desktop.engine.tick().pulled);
            REQUIRE_FALSE(phone.engine.tick().pushed);
        }
        REQUIRE(store.current()->revision == 1);
        REQUIRE(desktop.clipboard.writes() == 0);
    }

    SECTION("both directions, last writer wins") {
        desktop.clipboard.set(ClipKind::Text, "first");
        REQUIRE(desktop.engine.tick().pushed);
        REQUIRE(phone.engine.tick().pulled);
        REQUIRE_FALSE(phone.engine.tick().pushed);

        phone.clipboard.set(ClipKind::Text, "second");
        REQUIRE(phone.engine.tick().pushed);
        REQUIRE(desktop.engine.tick().pulled);
        REQUIRE(desktop.clipboard.content()->bytes == QByteArrayLiteral("second"));

        REQUIRE_FALSE(desktop.engine.tick().pushed);
        REQUIRE(store.current()->payload == QByteArrayLiteral("second"));
        REQUIRE(store.current()->origin == Origin::Phone);
        REQUIRE(store.current()->revision == 2);
    }

    SECTION("an unreachable store is absorbed until it is back") {
        const auto port = bound.unwrap();
        server.close();
        desktop.clipboard.set(ClipKind::Text, "offline copy");
        const auto report = desktop.engine.tick();
        REQUIRE(report.local == StepOutcome::TransientFailure);
        REQUIRE(report.remote == StepOutcome::TransientFailure);
        REQUIRE_FALSE(store.current().has_value());

        REQUIRE(server.listen(QStringLiteral("127.0.0.1"), port).is_ok());
        REQUIRE(desktop.engine.tick().pushed);
        REQUIRE(store.current()->payload == QByteArrayLiteral("offline copy"));

        REQUIRE(phone.engine.tick().pulled);
        REQUIRE(phone.clipboard.content()->bytes == QByteArrayLiteral("offline copy"));
        REQUIRE(store.current()->revision == 1);
    }
}
