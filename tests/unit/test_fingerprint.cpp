#include <catch2/catch_test_macros.hpp>
#include "crypto/fingerprint.hpp"

using namespace clipsync::crypto;

TEST_CASE("Fingerprint: same payload, same fingerprint", "[fingerprint]") {
    REQUIRE(init().is_ok());

    const auto a = Fingerprint::of(QByteArrayLiteral("hello"));
    const auto b = Fingerprint::of(QByteArrayLiteral("hello"));
    REQUIRE(a == b);
    REQUIRE(a.hex().size() == static_cast<qsizetype>(FINGERPRINT_SIZE * 2));
}

TEST_CASE("Fingerprint: different payloads differ", "[fingerprint]") {
    REQUIRE(init().is_ok());

    REQUIRE_FALSE(Fingerprint::of(QByteArrayLiteral("hello")) == Fingerprint::of(QByteArrayLiteral("hello!")));
}

TEST_CASE("Fingerprint: empty fingerprint never matches a computed one", "[fingerprint]") {
    REQUIRE(init().is_ok());

    const Fingerprint none;
    REQUIRE(none.empty());

    const auto of_empty_payload = Fingerprint::of(QByteArray());
    REQUIRE_FALSE(of_empty_payload.empty());
    REQUIRE_FALSE(none == of_empty_payload);
}

TEST_CASE("Fingerprint: hex is lowercase", "[fingerprint]") {
    REQUIRE(init().is_ok());

    const auto hex = Fingerprint::of(QByteArrayLiteral("clip")).hex();
    REQUIRE(hex == hex.toLower());
}
