#include <catch2/catch_test_macros.hpp>
#include "core/clip.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace clipsync;

namespace {

QJsonObject object_from(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST_CASE("Clip kinds and origins map to wire strings", "[clip]") {
    REQUIRE(to_wire(ClipKind::Text) == QStringLiteral("text"));
    REQUIRE(to_wire(ClipKind::Image) == QStringLiteral("image"));
    REQUIRE(to_wire(Origin::Desktop) == QStringLiteral("desktop"));
    REQUIRE(to_wire(Origin::Phone) == QStringLiteral("phone"));
    REQUIRE(to_wire(Origin::Unknown) == QStringLiteral("unknown"));
}

TEST_CASE("parse_clip_kind accepts only exact kinds", "[clip]") {
    REQUIRE(parse_clip_kind(QStringLiteral("text")) == ClipKind::Text);
    REQUIRE(parse_clip_kind(QStringLiteral("image")) == ClipKind::Image);
    REQUIRE_FALSE(parse_clip_kind(QStringLiteral("video")).has_value());
    REQUIRE_FALSE(parse_clip_kind(QStringLiteral("TEXT")).has_value());
    REQUIRE_FALSE(parse_clip_kind(QString()).has_value());
}

TEST_CASE("parse_origin is case-insensitive and defaults to unknown", "[clip]") {
    REQUIRE(parse_origin(QStringLiteral("desktop")) == Origin::Desktop);
    REQUIRE(parse_origin(QStringLiteral("Phone")) == Origin::Phone);
    REQUIRE(parse_origin(QStringLiteral("DESKTOP")) == Origin::Desktop);
    REQUIRE(parse_origin(QStringLiteral("server")) == Origin::Unknown);
    REQUIRE(parse_origin(QString()) == Origin::Unknown);
}

TEST_CASE("Clip::from_local keeps text and base64-encodes images", "[clip]") {
    const auto text = Clip::from_local(ClipKind::Text, QByteArrayLiteral("hello"), Origin::Desktop);
    REQUIRE(text.payload == QByteArrayLiteral("hello"));
    REQUIRE(text.mime == QStringLiteral("text/plain"));
    REQUIRE(text.origin == Origin::Desktop);

    const QByteArray png("\x89PNG\r\n\x1a\n", 8);
    const auto image = Clip::from_local(ClipKind::Image, png, Origin::Phone);
    REQUIRE(image.payload == png.toBase64());
    REQUIRE(image.mime == QStringLiteral("image/png"));

    auto bytes = image.local_bytes();
    REQUIRE(bytes.is_ok());
    REQUIRE(bytes.unwrap() == png);
}

TEST_CASE("Clip::local_bytes rejects broken base64 images", "[clip]") {
    Clip clip;
    clip.kind = ClipKind::Image;
    clip.payload = QByteArrayLiteral("not base64 !!!");

    auto bytes = clip.local_bytes();
    REQUIRE(bytes.is_err());
    REQUIRE(bytes.unwrap_err().kind == ErrorKind::Validation);
}

TEST_CASE("clip_from_json validates type and data", "[clip]") {
    SECTION("missing type") {
        auto clip = clip_from_json(object_from(R"({"data":"x"})"));
        REQUIRE(clip.is_err());
        REQUIRE(clip.unwrap_err().message == "type must be 'text' or 'image'");
    }

    SECTION("unknown type") {
        auto clip = clip_from_json(object_from(R"({"type":"video","data":"x"})"));
        REQUIRE(clip.is_err());
        REQUIRE(clip.unwrap_err().kind == ErrorKind::Validation);
    }

    SECTION("missing data") {
        auto clip = clip_from_json(object_from(R"({"type":"text"})"));
        REQUIRE(clip.is_err());
        REQUIRE(clip.unwrap_err().message == "data is required");
    }

    SECTION("null data") {
        auto clip = clip_from_json(object_from(R"({"type":"text","data":null})"));
        REQUIRE(clip.is_err());
        REQUIRE(clip.unwrap_err().message == "data is required");
    }

    SECTION("empty string data is allowed") {
        auto clip = clip_from_json(object_from(R"({"type":"text","data":""})"));
        REQUIRE(clip.is_ok());
        REQUIRE(clip.unwrap().payload.isEmpty());
    }
}

TEST_CASE("clip_from_json fills defaults", "[clip]") {
    auto text = clip_from_json(object_from(R"({"type":"text","data":"hi"})"));
    REQUIRE(text.is_ok());
    REQUIRE(text.unwrap().mime == QStringLiteral("text/plain"));
    REQUIRE(text.unwrap().origin == Origin::Unknown);
    REQUIRE(text.unwrap().created_at == 0);
    REQUIRE(text.unwrap().revision == 0);

    auto image = clip_from_json(object_from(R"({"type":"image","data":"AAAA","mime":""})"));
    REQUIRE(image.is_ok());
    REQUIRE(image.unwrap().mime == QStringLiteral("image/png"));
}

TEST_CASE("clip_from_json stores non-string data as JSON text", "[clip]") {
    REQUIRE(clip_from_json(object_from(R"({"type":"text","data":42})")).unwrap().payload == "42");
    REQUIRE(clip_from_json(object_from(R"({"type":"text","data":1.5})")).unwrap().payload == "1.5");
    REQUIRE(clip_from_json(object_from(R"({"type":"text","data":true})")).unwrap().payload == "true");
    REQUIRE(clip_from_json(object_from(R"({"type":"text","data":[1,2]})")).unwrap().payload == "[1,2]");
    REQUIRE(clip_from_json(object_from(R"({"type":"text","data":{"a":1}})")).unwrap().payload == "{\"a\":1}");
}

TEST_CASE("Slot document survives serialize and parse", "[clip]") {
    Clip clip;
    clip.kind = ClipKind::Text;
    clip.payload = QByteArrayLiteral("héllo \xF0\x9F\x93\x8B");
    clip.mime = QStringLiteral("text/plain");
    clip.origin = Origin::Phone;
    clip.created_at = 1700000000;
    clip.revision = 7;

    auto parsed = parse_slot(serialize_slot(clip));
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap() == clip);
}

TEST_CASE("parse_slot distinguishes empty from corrupt", "[clip]") {
    REQUIRE(parse_slot(QByteArray()).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(parse_slot(QByteArrayLiteral("{}")).unwrap_err().kind == ErrorKind::NotFound);
    REQUIRE(parse_slot(QByteArrayLiteral("{not json")).unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(parse_slot(QByteArrayLiteral("[1,2]")).unwrap_err().kind == ErrorKind::Validation);
    REQUIRE(parse_slot(QByteArrayLiteral(R"({"type":"video","data":"x"})")).is_err());
}
