#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <QUrl>

#include "crypto/fingerprint.hpp"
#include "network/store_client.hpp"
#include "network/store_server.hpp"
#include "platform/clipboard.hpp"
#include "storage/clip_store.hpp"
#include "storage/slot_backend.hpp"
#include "sync/sync_engine.hpp"

#include <functional>

namespace {

bool wait_until(const std::function<bool()>& done, int timeout_ms) {
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(timeout_ms);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (done()) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();
    return done();
}

bool holds_text(const clipsync::platform::MemoryClipboard& clipboard, const QByteArray& text) {
    const auto& content = clipboard.content();
    return content && content->kind == clipsync::ClipKind::Text && content->bytes == text;
}

} // namespace

int main(int argc, char **argv) {
    using namespace clipsync;

    QCoreApplication app(argc, argv);

    qputenv("CLIPSYNC_DEBUG_SYNC", "1");

    if (crypto::init().is_err()) {
        return 1;
    }

    storage::ClipStore store(std::make_unique<storage::MemorySlotBackend>());
    network::StoreServer server(store);
    auto bound = server.listen(QStringLiteral("127.0.0.1"), 0);
    if (bound.is_err()) {
        qCritical().noquote() << "listen failed:" << QString::fromStdString(bound.unwrap_err().message);
        return 1;
    }

    QUrl base;
    base.setScheme(QStringLiteral("http"));
    base.setHost(QStringLiteral("127.0.0.1"));
    base.setPort(bound.unwrap());

    platform::MemoryClipboard desktopBoard;
    platform::MemoryClipboard phoneBoard;
    network::HttpStoreClient desktopClient(base, 1000);
    network::HttpStoreClient phoneClient(base, 1000);

    sync::SyncEngine desktop(desktopBoard, desktopClient, {.origin = Origin::Desktop, .poll_interval_ms = 30});
    sync::SyncEngine phone(phoneBoard, phoneClient, {.origin = Origin::Phone, .poll_interval_ms = 30});

    QObject::connect(&desktop, &sync::SyncEngine::tickFailed, &app, [](const QString &msg) {
        qCritical().noquote() << "desktop tick failed:" << msg;
    });
    QObject::connect(&phone, &sync::SyncEngine::tickFailed, &app, [](const QString &msg) {
        qCritical().noquote() << "phone tick failed:" << msg;
    });

    desktop.start();
    phone.start();

    // Desktop -> phone.
    desktopBoard.set(ClipKind::Text, QByteArrayLiteral("copied on the desktop"));
    if (!wait_until([&]() { return holds_text(phoneBoard, "copied on the desktop"); }, 3000)) {
        return 2;
    }

    // Phone -> desktop.
    phoneBoard.set(ClipKind::Text, QByteArrayLiteral("copied on the phone"));
    if (!wait_until([&]() { return holds_text(desktopBoard, "copied on the phone"); }, 3000)) {
        return 3;
    }

    // Let a few more ticks pass; nothing may bounce back.
    wait_until([]() { return false; }, 300);

    const auto slot = store.current();
    if (!slot || slot->payload != "copied on the phone" || slot->revision != 2) {
        return 4;
    }
    if (desktop.stats().pushes != 1 || phone.stats().pushes != 1) {
        return 5;
    }

    desktop.requestStop();
    phone.requestStop();
    server.close();
    return 0;
}
