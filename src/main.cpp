#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QGuiApplication>
#include <QMetaObject>
#include <QTextStream>
#include <QThread>

#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/fingerprint.hpp"
#include "network/store_client.hpp"
#include "network/store_server.hpp"
#include "platform/clipboard.hpp"
#include "platform/signal_watcher.hpp"
#include "storage/clip_store.hpp"
#include "sync/one_shot.hpp"
#include "sync/sync_engine.hpp"

#include <memory>
#include <optional>

namespace {

using namespace clipsync;

const QStringList kCommands = {
    QStringLiteral("serve"),
    QStringLiteral("sync"),
    QStringLiteral("push"),
    QStringLiteral("pull"),
    QStringLiteral("status"),
};

// The application object has to exist before the parser runs, and the
// clipboard commands need a GUI one; look ahead for the command name.
QString peek_command(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const auto arg = QString::fromLocal8Bit(argv[i]);
        if (kCommands.contains(arg)) {
            return arg;
        }
    }
    return {};
}

void print_error(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
}

void print_error(const Error& error) {
    print_error(QStringLiteral("error (%1): %2")
                    .arg(QString::fromLatin1(error_kind_name(error.kind)),
                         QString::fromStdString(error.message)));
}

std::unique_ptr<storage::ClipStore> open_store(const Config& config) {
    auto backend = storage::make_backend(config);
    if (backend.is_err()) {
        print_error(backend.unwrap_err());
        return nullptr;
    }
    return std::make_unique<storage::ClipStore>(std::move(backend).unwrap());
}

QString describe_clip(const Clip& clip) {
    return QStringLiteral("revision %1: %2 from %3, %4 bytes (%5), created %6")
        .arg(clip.revision)
        .arg(to_wire(clip.kind), to_wire(clip.origin))
        .arg(clip.payload.size())
        .arg(clip.effective_mime(),
             QDateTime::fromSecsSinceEpoch(clip.created_at).toString(Qt::ISODate));
}

int run_serve(QCoreApplication& app, const Config& config) {
    auto store = open_store(config);
    if (!store) {
        return 1;
    }

    network::StoreServer server(*store);
    auto bound = server.listen(config.bind_host, config.bind_port);
    if (bound.is_err()) {
        print_error(bound.unwrap_err());
        return 1;
    }

    platform::SignalWatcher watcher;
    QObject::connect(&watcher, &platform::SignalWatcher::shutdownRequested, &app, [&]() {
        qCInfo(lcServer) << "shutting down";
        server.close();
        app.quit();
    });
    watcher.install();

    return app.exec();
}

int run_sync(QCoreApplication& app, const Config& config, bool serve) {
    std::unique_ptr<storage::ClipStore> store;
    QThread server_thread;
    server_thread.setObjectName(QStringLiteral("store-server"));

    if (serve) {
        store = open_store(config);
        if (!store) {
            return 1;
        }

        auto* server = new network::StoreServer(*store);
        server->moveToThread(&server_thread);
        QObject::connect(&server_thread, &QThread::finished, server, &QObject::deleteLater);
        server_thread.start();

        std::optional<Result<quint16, Error>> bound;
        QMetaObject::invokeMethod(server, [&]() {
            bound = server->listen(config.bind_host, config.bind_port);
        }, Qt::BlockingQueuedConnection);

        if (!bound || bound->is_err()) {
            if (bound) {
                print_error(bound->unwrap_err());
            }
            server_thread.quit();
            server_thread.wait();
            return 1;
        }
    }

    platform::QtClipboard clipboard;
    network::HttpStoreClient remote(config.server_url, config.http_timeout_ms);
    sync::SyncEngine engine(clipboard, remote, sync::SyncEngine::Options{
        .origin = config.origin,
        .poll_interval_ms = config.poll_interval_ms,
        .backoff_ms = config.backoff_ms,
    });

    platform::SignalWatcher watcher;
    QObject::connect(&watcher, &platform::SignalWatcher::shutdownRequested,
                     &engine, &sync::SyncEngine::requestStop);
    QObject::connect(&engine, &sync::SyncEngine::stopped, &app, &QCoreApplication::quit);
    watcher.install();

    qCInfo(lcSync) << "syncing with" << config.server_url.toString();
    engine.start();
    const int rc = app.exec();

    if (server_thread.isRunning()) {
        server_thread.quit();
        server_thread.wait();
    }

    const auto& stats = engine.stats();
    qCInfo(lcSync) << "pushes" << stats.pushes << "pulls" << stats.pulls
                   << "transient failures" << stats.transient_failures
                   << "skipped revisions" << stats.skipped_revisions;
    return rc;
}

int run_push(const Config& config) {
    platform::QtClipboard clipboard;
    network::HttpStoreClient remote(config.server_url, config.http_timeout_ms);

    auto pushed = sync::push_once(clipboard, remote, config.origin);
    if (pushed.is_err()) {
        print_error(pushed.unwrap_err());
        return 1;
    }
    QTextStream(stdout) << "pushed " << describe_clip(pushed.unwrap()) << '\n';
    return 0;
}

int run_pull(const Config& config) {
    platform::QtClipboard clipboard;
    network::HttpStoreClient remote(config.server_url, config.http_timeout_ms);

    auto pulled = sync::pull_once(clipboard, remote);
    if (pulled.is_err()) {
        print_error(pulled.unwrap_err());
        return 1;
    }
    QTextStream(stdout) << "pulled " << describe_clip(pulled.unwrap()) << '\n';
    return 0;
}

int run_status(const Config& config) {
    network::HttpStoreClient remote(config.server_url, config.http_timeout_ms);

    auto fetched = remote.fetch();
    if (fetched.is_err()) {
        print_error(fetched.unwrap_err());
        return 1;
    }
    QTextStream out(stdout);
    out << config.server_url.toString() << ": ";
    if (!fetched.unwrap()) {
        out << "no clip available\n";
        return 0;
    }
    const auto& clip = *fetched.unwrap();
    out << describe_clip(clip) << '\n'
        << "fingerprint " << crypto::Fingerprint::of(clip.payload).hex() << '\n';
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    const auto command = peek_command(argc, argv);
    const bool needs_gui = command == QStringLiteral("sync") ||
                           command == QStringLiteral("push") ||
                           command == QStringLiteral("pull");

    std::unique_ptr<QCoreApplication> app;
    if (needs_gui) {
        app = std::make_unique<QGuiApplication>(argc, argv);
    } else {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }
    app->setApplicationName(QStringLiteral("clipsync"));
    app->setApplicationVersion(QStringLiteral("0.1.0"));
    app->setOrganizationName(QStringLiteral("clipsync"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Clipboard sync between a desktop and a phone"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("Address the store server binds to (CLIPSYNC_HOST)."),
        QStringLiteral("address"));
    parser.addOption(hostOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Port the store server listens on (CLIPSYNC_PORT)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption serverOption(
        QStringList{QStringLiteral("server")},
        QStringLiteral("Base URL of the store server (CLIPSYNC_SERVER)."),
        QStringLiteral("url"));
    parser.addOption(serverOption);

    const QCommandLineOption intervalOption(
        QStringList{QStringLiteral("interval")},
        QStringLiteral("Poll interval in milliseconds (CLIPSYNC_POLL_INTERVAL_MS)."),
        QStringLiteral("ms"));
    parser.addOption(intervalOption);

    const QCommandLineOption originOption(
        QStringList{QStringLiteral("origin")},
        QStringLiteral("This endpoint's origin, 'desktop' or 'phone' (CLIPSYNC_ORIGIN)."),
        QStringLiteral("origin"));
    parser.addOption(originOption);

    const QCommandLineOption storeOption(
        QStringList{QStringLiteral("store")},
        QStringLiteral("Path of the persisted slot (CLIPSYNC_STORE_PATH)."),
        QStringLiteral("path"));
    parser.addOption(storeOption);

    const QCommandLineOption backendOption(
        QStringList{QStringLiteral("backend")},
        QStringLiteral("Store backend, 'json' or 'sqlite' (CLIPSYNC_STORE_BACKEND)."),
        QStringLiteral("kind"));
    parser.addOption(backendOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log lines to this file (CLIPSYNC_LOG_FILE)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption serveOption(
        QStringList{QStringLiteral("serve")},
        QStringLiteral("With 'sync': also run the store server in this process."));
    parser.addOption(serveOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable debug logging (also sets CLIPSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("One of: serve, sync, push, pull, status."));
    parser.process(*app);

    if (parser.isSet(debugSyncOption)) {
        qputenv("CLIPSYNC_DEBUG_SYNC", "1");
    }

    auto config = config_from_environment();

    if (parser.isSet(hostOption)) {
        config.bind_host = parser.value(hostOption);
    }
    if (parser.isSet(portOption)) {
        const auto port = parse_port(parser.value(portOption));
        if (!port) {
            print_error(QStringLiteral("invalid --port: %1").arg(parser.value(portOption)));
            return 1;
        }
        config.bind_port = *port;
    }
    if (parser.isSet(serverOption)) {
        const auto url = parse_server_url(parser.value(serverOption));
        if (!url) {
            print_error(QStringLiteral("invalid --server: %1").arg(parser.value(serverOption)));
            return 1;
        }
        config.server_url = *url;
    }
    if (parser.isSet(intervalOption)) {
        const auto interval = parse_interval_ms(parser.value(intervalOption));
        if (!interval) {
            print_error(QStringLiteral("invalid --interval: %1").arg(parser.value(intervalOption)));
            return 1;
        }
        config.poll_interval_ms = *interval;
    }
    if (parser.isSet(originOption)) {
        const auto origin = parse_endpoint_origin(parser.value(originOption));
        if (!origin) {
            print_error(QStringLiteral("invalid --origin: %1").arg(parser.value(originOption)));
            return 1;
        }
        config.origin = *origin;
    }
    if (parser.isSet(backendOption)) {
        const auto backend = parse_backend(parser.value(backendOption));
        if (!backend) {
            print_error(QStringLiteral("invalid --backend: %1").arg(parser.value(backendOption)));
            return 1;
        }
        const bool default_path = config.store_path == default_store_path(config.store_backend);
        config.store_backend = *backend;
        if (default_path) {
            config.store_path = default_store_path(config.store_backend);
        }
    }
    if (parser.isSet(storeOption)) {
        config.store_path = parser.value(storeOption);
    }
    if (parser.isSet(logFileOption)) {
        config.log_file = parser.value(logFileOption);
    }

    install_logging(config.log_file);
    if (config.debug_sync) {
        enable_debug_logging();
        qInfo() << "clipsync: debug logging enabled";
    }

    if (auto init = crypto::init(); init.is_err()) {
        print_error(init.unwrap_err());
        return 1;
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty() || !kCommands.contains(positional.first())) {
        print_error(QStringLiteral("expected a command: serve, sync, push, pull or status"));
        parser.showHelp(1);
    }

    const auto& name = positional.first();
    if (name == QStringLiteral("serve")) {
        return run_serve(*app, config);
    }
    if (name == QStringLiteral("sync")) {
        return run_sync(*app, config, parser.isSet(serveOption));
    }
    if (name == QStringLiteral("push")) {
        return run_push(config);
    }
    if (name == QStringLiteral("pull")) {
        return run_pull(config);
    }
    return run_status(config);
}
