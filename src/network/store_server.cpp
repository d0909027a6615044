#include "network/store_server.hpp"
#include "core/logging.hpp"
#include "network/clip_api.hpp"

#include <QDateTime>
#include <QHostAddress>

namespace clipsync::network {

StoreServer::StoreServer(storage::ClipStore& store, QObject* parent)
    : QObject(parent)
    , store_(store)
    , server_(std::make_unique<QTcpServer>(this))
    , clock_([] { return QDateTime::currentSecsSinceEpoch(); })
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &StoreServer::onNewConnection);
}

StoreServer::~StoreServer() {
    close();
}

Result<quint16, Error> StoreServer::listen(const QString& host, quint16 port) {
    QHostAddress address;
    if (host.isEmpty() || host == QStringLiteral("0.0.0.0")) {
        address = QHostAddress::AnyIPv4;
    } else if (host == QStringLiteral("localhost")) {
        address = QHostAddress::LocalHost;
    } else if (!address.setAddress(host)) {
        return Result<quint16, Error>::err(
            Error{ErrorKind::Validation, "invalid bind address: " + host.toStdString()});
    }

    if (!server_->listen(address, port)) {
        return Result<quint16, Error>::err(
            Error{ErrorKind::Internal, server_->errorString().toStdString(),
                  static_cast<int>(server_->serverError())});
    }

    qCInfo(lcServer) << "listening on" << address.toString() << "port" << server_->serverPort()
                     << "store" << store_.location();
    return Result<quint16, Error>::ok(server_->serverPort());
}

void StoreServer::close() {
    if (server_->isListening()) {
        server_->close();
    }
    const auto sockets = parsers_.keys();
    for (auto* socket : sockets) {
        socket->abort();
        forget(socket);
    }
}

quint16 StoreServer::port() const {
    return server_->serverPort();
}

bool StoreServer::isListening() const {
    return server_->isListening();
}

void StoreServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        parsers_.insert(socket, HttpRequestParser{});

        auto* idle = new QTimer(socket);
        idle->setSingleShot(true);
        connect(idle, &QTimer::timeout, this, [this, socket]() {
            qCDebug(lcServer) << "dropping idle connection from" << socket->peerAddress().toString();
            socket->abort();
            forget(socket);
        });
        idle->start(idle_timeout_ms_);

        connect(socket, &QTcpSocket::readyRead, this, [this, socket, idle]() {
            idle->start(idle_timeout_ms_);
            onReadyRead(socket);
        });
        connect(socket, &QTcpSocket::bytesWritten, idle, [this, idle]() {
            idle->start(idle_timeout_ms_);
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            forget(socket);
        });

        // Data may already be buffered by the time we connect.
        if (socket->bytesAvailable() > 0) {
            onReadyRead(socket);
        }
    }
}

void StoreServer::onReadyRead(QTcpSocket* socket) {
    auto it = parsers_.find(socket);
    if (it == parsers_.end()) {
        return;
    }

    const auto status = it->feed(socket->readAll());
    switch (status) {
        case HttpRequestParser::Status::NeedMore:
            return;
        case HttpRequestParser::Status::Malformed:
        case HttpRequestParser::Status::TooLarge:
            qCDebug(lcServer) << "rejecting request from" << socket->peerAddress().toString();
            respond(socket, rejected_request_response(status));
            return;
        case HttpRequestParser::Status::Complete:
            break;
    }

    const auto request = it->request();
    const auto response = handle_clip_request(request, store_, clock_());
    qCDebug(lcServer) << request.method << request.path << "->" << response.status;
    emit requestHandled(request.method, request.path, response.status);
    respond(socket, response);
}

void StoreServer::respond(QTcpSocket* socket, const HttpResponse& response) {
    // Stop feeding this socket; anything after the first request is ignored.
    disconnect(socket, &QTcpSocket::readyRead, this, nullptr);
    socket->write(response.to_bytes());
    socket->disconnectFromHost();
}

void StoreServer::forget(QTcpSocket* socket) {
    if (parsers_.remove(socket) > 0) {
        socket->deleteLater();
    }
}

} // namespace clipsync::network
