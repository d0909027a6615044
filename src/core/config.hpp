#pragma once

#include "core/clip.hpp"
#include <QString>
#include <QUrl>
#include <QtGlobal>
#include <functional>

namespace clipsync {

enum class StoreBackendKind {
    JsonFile,
    Sqlite
};

/**
 * Runtime configuration. Every field has a default; the environment
 * (CLIPSYNC_*) overrides defaults and the command line overrides both.
 */
struct Config {
    QString bind_host = QStringLiteral("0.0.0.0");
    quint16 bind_port = 5000;
    QUrl server_url = QUrl(QStringLiteral("http://localhost:5000"));
    int poll_interval_ms = 500;
    int backoff_ms = 1000;
    int http_timeout_ms = 2000;
    Origin origin = Origin::Desktop;
    QString store_path;
    StoreBackendKind store_backend = StoreBackendKind::JsonFile;
    QString log_file;
    bool debug_sync = false;
};

using EnvLookup = std::function<QString(const char*)>;

/**
 * Build a Config from environment variables. `lookup` defaults to
 * qEnvironmentVariable; tests inject their own. Invalid values keep the
 * default and log a warning.
 */
[[nodiscard]] Config config_from_environment(const EnvLookup& lookup = {});

/**
 * Default slot location: <AppDataLocation>/clipboard_store.json, or
 * clipboard_store.sqlite for the sqlite backend.
 */
[[nodiscard]] QString default_store_path(StoreBackendKind backend = StoreBackendKind::JsonFile);

// Individual parsers, shared with the command line.
[[nodiscard]] std::optional<quint16> parse_port(const QString& value);
[[nodiscard]] std::optional<int> parse_interval_ms(const QString& value);
[[nodiscard]] std::optional<Origin> parse_endpoint_origin(const QString& value);
[[nodiscard]] std::optional<StoreBackendKind> parse_backend(const QString& value);
[[nodiscard]] std::optional<QUrl> parse_server_url(const QString& value);

} // namespace clipsync
