#pragma once

#include "core/result.hpp"
#include "network/http_message.hpp"
#include "storage/clip_store.hpp"
#include <QHash>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include <functional>
#include <memory>

namespace clipsync::network {

// A connection that goes this long without traffic is dropped.
constexpr int DEFAULT_IDLE_TIMEOUT_MS = 5000;

/**
 * StoreServer - HTTP front of a ClipStore.
 *
 * Each accepted socket gets its own incremental parser; a request is answered
 * as soon as it is complete and the connection is then closed. The server
 * never owns the store. It may be moved to a worker thread before listen()
 * is called there.
 */
class StoreServer : public QObject {
    Q_OBJECT

public:
    using Clock = std::function<qint64()>;

    explicit StoreServer(storage::ClipStore& store, QObject* parent = nullptr);
    ~StoreServer() override;

    /**
     * Start listening.
     * @param host Address to bind ("0.0.0.0", "127.0.0.1", ...)
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<quint16, Error> listen(const QString& host, quint16 port);

    void close();

    [[nodiscard]] quint16 port() const;
    [[nodiscard]] bool isListening() const;
    [[nodiscard]] int connectionCount() const { return static_cast<int>(parsers_.size()); }

    /**
     * Idle limit for connections accepted from now on.
     */
    void setIdleTimeout(int ms) { idle_timeout_ms_ = ms; }

    /**
     * Replace the createdAt clock (seconds since epoch).
     */
    void setClock(Clock clock) { clock_ = std::move(clock); }

signals:
    void requestHandled(const QByteArray& method, const QString& path, int status);

private slots:
    void onNewConnection();

private:
    void onReadyRead(QTcpSocket* socket);
    void respond(QTcpSocket* socket, const HttpResponse& response);
    void forget(QTcpSocket* socket);

    storage::ClipStore& store_;
    std::unique_ptr<QTcpServer> server_;
    QHash<QTcpSocket*, HttpRequestParser> parsers_;
    Clock clock_;
    int idle_timeout_ms_ = DEFAULT_IDLE_TIMEOUT_MS;
};

} // namespace clipsync::network
