#include "network/store_client.hpp"
#include "core/logging.hpp"

#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <memory>
#include <string>

namespace clipsync::network {

namespace {

Error transient(const std::string& what, int code) {
    return Error{ErrorKind::Transient, what, code};
}

} // namespace

HttpStoreClient::HttpStoreClient(QUrl base_url, int timeout_ms, QObject* parent)
    : QObject(parent)
    , base_url_(std::move(base_url))
    , timeout_ms_(timeout_ms)
    , nam_(this)
{
    // Endpoints are on the local network; never route them through a proxy.
    nam_.setProxy(QNetworkProxy::NoProxy);
}

QUrl HttpStoreClient::endpoint(const QString& path) const {
    QUrl url = base_url_;
    url.setPath(url.path() + path);
    return url;
}

Result<HttpStoreClient::Reply, Error> HttpStoreClient::wait(QNetworkReply* raw) {
    std::unique_ptr<QNetworkReply, void (*)(QNetworkReply*)> reply(
        raw, [](QNetworkReply* r) { r->deleteLater(); });

    if (!reply->isFinished()) {
        QEventLoop loop;
        connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const auto status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status == 0) {
        // No HTTP exchange happened: refused, unreachable or timed out.
        return Result<Reply, Error>::err(
            transient(reply->errorString().toStdString(), static_cast<int>(reply->error())));
    }
    return Result<Reply, Error>::ok(Reply{status, reply->readAll()});
}

Result<qint64, Error> HttpStoreClient::push(const Clip& clip) {
    QJsonObject body;
    body.insert(QStringLiteral("type"), to_wire(clip.kind));
    body.insert(QStringLiteral("data"), QString::fromUtf8(clip.payload));
    body.insert(QStringLiteral("mime"), clip.effective_mime());
    body.insert(QStringLiteral("source"), to_wire(clip.origin));

    QNetworkRequest request(endpoint(QStringLiteral("/clip")));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    request.setTransferTimeout(timeout_ms_);

    auto reply = wait(nam_.post(request, QJsonDocument(body).toJson(QJsonDocument::Compact)));
    if (reply.is_err()) {
        qCDebug(lcClient) << "push failed:" << reply.unwrap_err().message.c_str();
        return Result<qint64, Error>::err(reply.unwrap_err());
    }

    const auto& [status, payload] = reply.unwrap();
    if (status != 200) {
        qCDebug(lcClient) << "push rejected with status" << status << payload;
        return Result<qint64, Error>::err(transient("store answered " + std::to_string(status), status));
    }

    const auto ack = QJsonDocument::fromJson(payload).object();
    return Result<qint64, Error>::ok(ack.value(QStringLiteral("revision")).toInteger(0));
}

Result<std::optional<Clip>, Error> HttpStoreClient::fetch() {
    using R = Result<std::optional<Clip>, Error>;

    QNetworkRequest request(endpoint(QStringLiteral("/clip")));
    request.setTransferTimeout(timeout_ms_);

    auto reply = wait(nam_.get(request));
    if (reply.is_err()) {
        qCDebug(lcClient) << "fetch failed:" << reply.unwrap_err().message.c_str();
        return R::err(reply.unwrap_err());
    }

    const auto& [status, payload] = reply.unwrap();
    if (status == 404) {
        return R::ok(std::nullopt);
    }
    if (status != 200) {
        qCDebug(lcClient) << "fetch answered status" << status;
        return R::err(transient("store answered " + std::to_string(status), status));
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(payload, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return R::err(transient("store sent a body that is not a JSON object", status));
    }

    auto clip = clip_from_json(doc.object());
    if (clip.is_err()) {
        return R::err(transient(clip.unwrap_err().message, status));
    }
    return R::ok(std::move(clip).unwrap());
}

} // namespace clipsync::network
