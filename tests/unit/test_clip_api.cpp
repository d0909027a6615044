#include <catch2/catch_test_macros.hpp>
#include "network/clip_api.hpp"

#include <QJsonDocument>

using namespace clipsync;
using namespace clipsync::network;
using namespace clipsync::storage;

namespace {

constexpr qint64 kNow = 1700000123;

HttpRequest request(const char* method, const char* path, const QByteArray& body = {}) {
    HttpRequest req;
    req.method = method;
    req.path = QString::fromLatin1(path);
    req.body = body;
    return req;
}

QJsonObject json_body(const HttpResponse& response) {
    return QJsonDocument::fromJson(response.body).object();
}

QString error_of(const HttpResponse& response) {
    return json_body(response).value(QStringLiteral("error")).toString();
}

struct Fixture {
    MemorySlotBackend* backend = nullptr;
    std::unique_ptr<ClipStore> store;

    Fixture() {
        auto owned = std::make_unique<MemorySlotBackend>();
        backend = owned.get();
        store = std::make_unique<ClipStore>(std::move(owned));
    }

    HttpResponse handle(const HttpRequest& req) {
        return handle_clip_request(req, *store, kNow);
    }
};

} // namespace

TEST_CASE("Clip API: empty store answers 404 on both GET routes", "[api]") {
    Fixture f;

    for (const char* path : {"/clip", "/clip/latest"}) {
        const auto response = f.handle(request("GET", path));
        REQUIRE(response.status == 404);
        REQUIRE(error_of(response) == QStringLiteral("No clip available"));
        REQUIRE(response.header("Access-Control-Allow-Origin") == "*");
        REQUIRE(response.header("Content-Type") == "application/json");
    }
}

TEST_CASE("Clip API: POST stores and GET returns the clip", "[api]") {
    Fixture f;

    const auto posted = f.handle(request("POST", "/clip",
        R"({"type":"text","data":"hello","source":"phone"})"));
    REQUIRE(posted.status == 200);
    REQUIRE(json_body(posted).value(QStringLiteral("status")).toString() == QStringLiteral("ok"));
    REQUIRE(json_body(posted).value(QStringLiteral("revision")).toInteger() == 1);

    const auto fetched = f.handle(request("GET", "/clip/latest"));
    REQUIRE(fetched.status == 200);
    const auto clip = json_body(fetched);
    REQUIRE(clip.value(QStringLiteral("type")).toString() == QStringLiteral("text"));
    REQUIRE(clip.value(QStringLiteral("data")).toString() == QStringLiteral("hello"));
    REQUIRE(clip.value(QStringLiteral("mime")).toString() == QStringLiteral("text/plain"));
    REQUIRE(clip.value(QStringLiteral("source")).toString() == QStringLiteral("phone"));
    REQUIRE(clip.value(QStringLiteral("createdAt")).toInteger() == kNow);
    REQUIRE(clip.value(QStringLiteral("revision")).toInteger() == 1);
}

TEST_CASE("Clip API: server stamps createdAt and defaults the source", "[api]") {
    Fixture f;

    REQUIRE(f.handle(request("POST", "/clip",
        R"({"type":"image","data":"iVBORw0KGgo=","createdAt":5})")).status == 200);

    const auto slot = f.store->current();
    REQUIRE(slot.has_value());
    REQUIRE(slot->created_at == kNow);
    REQUIRE(slot->origin == Origin::Unknown);
    REQUIRE(slot->mime == QStringLiteral("image/png"));
}

TEST_CASE("Clip API: invalid posts are rejected and leave the store untouched", "[api]") {
    Fixture f;
    REQUIRE(f.handle(request("POST", "/clip", R"({"type":"text","data":"original"})")).status == 200);

    struct Case {
        const char* body;
        const char* error;
    };
    const Case cases[] = {
        {"", "Missing body"},
        {"not json", "Invalid JSON"},
        {"[1,2,3]", "Invalid JSON"},
        {R"({"data":"x"})", "type must be 'text' or 'image'"},
        {R"({"type":"video","data":"x"})", "type must be 'text' or 'image'"},
        {R"({"type":7,"data":"x"})", "type must be 'text' or 'image'"},
        {R"({"type":"text"})", "data is required"},
        {R"({"type":"text","data":null})", "data is required"},
    };

    for (const auto& c : cases) {
        INFO("body: " << c.body);
        const auto response = f.handle(request("POST", "/clip", QByteArray(c.body)));
        REQUIRE(response.status == 400);
        REQUIRE(error_of(response) == QString::fromLatin1(c.error));
        REQUIRE(response.header("Access-Control-Allow-Origin") == "*");
    }

    REQUIRE(f.backend->write_attempts() == 1);
    REQUIRE(f.store->current()->payload == QByteArrayLiteral("original"));
    REQUIRE(f.store->current()->revision == 1);
}

TEST_CASE("Clip API: an empty string is valid data", "[api]") {
    Fixture f;
    REQUIRE(f.handle(request("POST", "/clip", R"({"type":"text","data":""})")).status == 200);
    REQUIRE(f.store->current()->payload.isEmpty());
}

TEST_CASE("Clip API: persistence failure answers 500 and keeps the slot", "[api]") {
    Fixture f;
    REQUIRE(f.handle(request("POST", "/clip", R"({"type":"text","data":"good"})")).status == 200);

    f.backend->set_fail_writes(true);
    const auto response = f.handle(request("POST", "/clip", R"({"type":"text","data":"bad"})"));
    REQUIRE(response.status == 500);
    REQUIRE(error_of(response) == QStringLiteral("Failed to persist clip"));

    const auto fetched = f.handle(request("GET", "/clip"));
    REQUIRE(json_body(fetched).value(QStringLiteral("data")).toString() == QStringLiteral("good"));
}

TEST_CASE("Clip API: GET is idempotent", "[api]") {
    Fixture f;
    REQUIRE(f.handle(request("POST", "/clip", R"({"type":"text","data":"same"})")).status == 200);

    const auto first = f.handle(request("GET", "/clip"));
    const auto second = f.handle(request("GET", "/clip"));
    REQUIRE(first.body == second.body);
    REQUIRE(f.backend->write_attempts() == 1);
}

TEST_CASE("Clip API: OPTIONS answers the CORS preflight on any path", "[api]") {
    Fixture f;

    for (const char* path : {"/clip", "/anything"}) {
        const auto response = f.handle(request("OPTIONS", path));
        REQUIRE(response.status == 200);
        REQUIRE(response.header("Access-Control-Allow-Origin") == "*");
        REQUIRE(response.header("Access-Control-Allow-Methods") == "GET,POST,OPTIONS");
        REQUIRE(response.header("Access-Control-Allow-Headers") == "Content-Type");
    }
}

TEST_CASE("Clip API: unknown routes and methods", "[api]") {
    Fixture f;

    const auto unknown_path = f.handle(request("GET", "/nope"));
    REQUIRE(unknown_path.status == 404);
    REQUIRE(error_of(unknown_path) == QStringLiteral("Not found"));

    const auto post_latest = f.handle(request("POST", "/clip/latest", R"({"type":"text","data":"x"})"));
    REQUIRE(post_latest.status == 404);
    REQUIRE_FALSE(f.store->current().has_value());

    const auto deleted = f.handle(request("DELETE", "/clip"));
    REQUIRE(deleted.status == 405);
    REQUIRE(error_of(deleted) == QStringLiteral("Method not allowed"));
    REQUIRE(deleted.header("Access-Control-Allow-Origin") == "*");
}

TEST_CASE("Clip API: parser rejections map to 400 and 413", "[api]") {
    const auto bad = rejected_request_response(HttpRequestParser::Status::Malformed);
    REQUIRE(bad.status == 400);
    REQUIRE(error_of(bad) == QStringLiteral("Bad request"));

    const auto large = rejected_request_response(HttpRequestParser::Status::TooLarge);
    REQUIRE(large.status == 413);
    REQUIRE(error_of(large) == QStringLiteral("Payload too large"));
    REQUIRE(large.header("Access-Control-Allow-Origin") == "*");
}
