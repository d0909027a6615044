#include "core/config.hpp"
#include "core/logging.hpp"

#include <QDir>
#include <QStandardPaths>

namespace clipsync {

namespace {

QString env_or_empty(const EnvLookup& lookup, const char* name) {
    return lookup ? lookup(name) : qEnvironmentVariable(name);
}

template<typename T, typename Parser>
void apply(const EnvLookup& lookup, const char* name, T& target, Parser parse) {
    const auto raw = env_or_empty(lookup, name).trimmed();
    if (raw.isEmpty()) {
        return;
    }
    const auto parsed = parse(raw);
    if (!parsed) {
        qCWarning(lcConfig) << "ignoring invalid" << name << "=" << raw;
        return;
    }
    target = *parsed;
}

} // namespace

std::optional<quint16> parse_port(const QString& value) {
    bool ok = false;
    const auto port = value.toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        return std::nullopt;
    }
    return static_cast<quint16>(port);
}

std::optional<int> parse_interval_ms(const QString& value) {
    bool ok = false;
    const auto ms = value.toInt(&ok);
    if (!ok || ms <= 0) {
        return std::nullopt;
    }
    return ms;
}

std::optional<Origin> parse_endpoint_origin(const QString& value) {
    const auto origin = parse_origin(value);
    // An endpoint has to be one of the two sides.
    if (origin == Origin::Unknown) {
        return std::nullopt;
    }
    return origin;
}

std::optional<StoreBackendKind> parse_backend(const QString& value) {
    const auto normalized = value.toLower();
    if (normalized == QStringLiteral("json") || normalized == QStringLiteral("file")) {
        return StoreBackendKind::JsonFile;
    }
    if (normalized == QStringLiteral("sqlite")) {
        return StoreBackendKind::Sqlite;
    }
    return std::nullopt;
}

std::optional<QUrl> parse_server_url(const QString& value) {
    QUrl url(value, QUrl::StrictMode);
    if (!url.isValid() || url.host().isEmpty()) {
        return std::nullopt;
    }
    if (url.scheme() != QStringLiteral("http")) {
        return std::nullopt;
    }
    // Keep the base free of a trailing slash so paths can be appended.
    auto path = url.path();
    while (path.endsWith(QLatin1Char('/'))) {
        path.chop(1);
    }
    url.setPath(path);
    return url;
}

QString default_store_path(StoreBackendKind backend) {
    const auto fileName = backend == StoreBackendKind::Sqlite
        ? QStringLiteral("clipboard_store.sqlite")
        : QStringLiteral("clipboard_store.json");
    const auto dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataPath.isEmpty()) {
        return QDir::temp().filePath(fileName);
    }
    return QDir(dataPath).filePath(fileName);
}

Config config_from_environment(const EnvLookup& lookup) {
    Config config;

    const auto host = env_or_empty(lookup, "CLIPSYNC_HOST").trimmed();
    if (!host.isEmpty()) {
        config.bind_host = host;
    }
    apply(lookup, "CLIPSYNC_PORT", config.bind_port, parse_port);
    apply(lookup, "CLIPSYNC_SERVER", config.server_url, parse_server_url);
    apply(lookup, "CLIPSYNC_POLL_INTERVAL_MS", config.poll_interval_ms, parse_interval_ms);
    apply(lookup, "CLIPSYNC_BACKOFF_MS", config.backoff_ms, parse_interval_ms);
    apply(lookup, "CLIPSYNC_HTTP_TIMEOUT_MS", config.http_timeout_ms, parse_interval_ms);
    apply(lookup, "CLIPSYNC_ORIGIN", config.origin, parse_endpoint_origin);
    apply(lookup, "CLIPSYNC_STORE_BACKEND", config.store_backend, parse_backend);

    config.store_path = env_or_empty(lookup, "CLIPSYNC_STORE_PATH").trimmed();
    if (config.store_path.isEmpty()) {
        config.store_path = default_store_path(config.store_backend);
    }
    config.log_file = env_or_empty(lookup, "CLIPSYNC_LOG_FILE").trimmed();

    // Presence is enough, like the other debug switches.
    config.debug_sync = lookup ? !lookup("CLIPSYNC_DEBUG_SYNC").isEmpty()
                               : qEnvironmentVariableIsSet("CLIPSYNC_DEBUG_SYNC");
    return config;
}

} // namespace clipsync
