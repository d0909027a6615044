#pragma once

#include "core/clip.hpp"
#include "core/result.hpp"
#include <QNetworkAccessManager>
#include <QObject>
#include <QUrl>
#include <optional>

class QNetworkReply;

namespace clipsync::network {

/**
 * RemoteStore - what the sync engine needs from the shared store.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    /**
     * Upload a clip. Returns the revision the store assigned.
     */
    [[nodiscard]] virtual Result<qint64, Error> push(const Clip& clip) = 0;

    /**
     * Download the slot. An empty store is ok(nullopt), not an error.
     */
    [[nodiscard]] virtual Result<std::optional<Clip>, Error> fetch() = 0;
};

/**
 * HttpStoreClient - RemoteStore over the HTTP API.
 *
 * Calls block the caller on a local event loop until the reply finishes or
 * the transfer timeout fires. Every failure is reported as Transient with
 * the HTTP status (or QNetworkReply error) as the code.
 */
class HttpStoreClient : public QObject, public RemoteStore {
    Q_OBJECT

public:
    explicit HttpStoreClient(QUrl base_url, int timeout_ms = 2000, QObject* parent = nullptr);

    Result<qint64, Error> push(const Clip& clip) override;
    Result<std::optional<Clip>, Error> fetch() override;

    [[nodiscard]] const QUrl& baseUrl() const { return base_url_; }

private:
    struct Reply {
        int status = 0;
        QByteArray body;
    };

    [[nodiscard]] QUrl endpoint(const QString& path) const;
    Result<Reply, Error> wait(QNetworkReply* reply);

    QUrl base_url_;
    int timeout_ms_;
    QNetworkAccessManager nam_;
};

} // namespace clipsync::network
