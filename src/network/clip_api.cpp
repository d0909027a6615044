#include "network/clip_api.hpp"
#include "core/logging.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace clipsync::network {

namespace {

const QString kClipPath = QStringLiteral("/clip");
const QString kLatestPath = QStringLiteral("/clip/latest");

HttpResponse with_cors(HttpResponse response) {
    response.set_header("Access-Control-Allow-Origin", "*");
    return response;
}

HttpResponse preflight() {
    HttpResponse response;
    response.status = 200;
    response.set_header("Access-Control-Allow-Methods", "GET,POST,OPTIONS");
    response.set_header("Access-Control-Allow-Headers", "Content-Type");
    return response;
}

HttpResponse get_clip(const storage::ClipStore& store) {
    const auto slot = store.current();
    if (!slot) {
        return HttpResponse::error(404, QStringLiteral("No clip available"));
    }
    return HttpResponse::json(200, clip_to_json(*slot));
}

HttpResponse post_clip(const HttpRequest& request, storage::ClipStore& store, qint64 now_secs) {
    if (request.body.isEmpty()) {
        return HttpResponse::error(400, QStringLiteral("Missing body"));
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(request.body, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        qCDebug(lcServer) << "rejecting body:" << parse_error.errorString();
        return HttpResponse::error(400, QStringLiteral("Invalid JSON"));
    }

    auto parsed = clip_from_json(doc.object());
    if (parsed.is_err()) {
        qCDebug(lcServer) << "rejecting clip:" << parsed.unwrap_err().message.c_str();
        return HttpResponse::error(400, QString::fromStdString(parsed.unwrap_err().message));
    }

    auto clip = std::move(parsed).unwrap();
    clip.created_at = now_secs;

    auto stored = store.save(std::move(clip));
    if (stored.is_err()) {
        return HttpResponse::error(500, QStringLiteral("Failed to persist clip"));
    }

    const auto& saved = stored.unwrap();
    qCInfo(lcServer) << "stored" << to_wire(saved.kind) << "clip from" << to_wire(saved.origin)
                     << "revision" << saved.revision << "(" << saved.payload.size() << "bytes )";

    QJsonObject ack;
    ack.insert(QStringLiteral("status"), QStringLiteral("ok"));
    ack.insert(QStringLiteral("revision"), saved.revision);
    return HttpResponse::json(200, ack);
}

} // namespace

HttpResponse handle_clip_request(const HttpRequest& request,
                                 storage::ClipStore& store,
                                 qint64 now_secs) {
    const auto& method = request.method;

    if (method == "OPTIONS") {
        return with_cors(preflight());
    }
    if (method != "GET" && method != "POST") {
        return with_cors(HttpResponse::error(405, QStringLiteral("Method not allowed")));
    }

    if (method == "GET" && (request.path == kClipPath || request.path == kLatestPath)) {
        return with_cors(get_clip(store));
    }
    if (method == "POST" && request.path == kClipPath) {
        return with_cors(post_clip(request, store, now_secs));
    }

    qCDebug(lcServer) << "no route for" << method << request.path;
    return with_cors(HttpResponse::error(404, QStringLiteral("Not found")));
}

HttpResponse rejected_request_response(HttpRequestParser::Status status) {
    if (status == HttpRequestParser::Status::TooLarge) {
        return with_cors(HttpResponse::error(413, QStringLiteral("Payload too large")));
    }
    return with_cors(HttpResponse::error(400, QStringLiteral("Bad request")));
}

} // namespace clipsync::network
