#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>

namespace clipsync::crypto {

// BLAKE2b output size used for change detection. Not a security boundary.
constexpr size_t FINGERPRINT_SIZE = 16;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Fingerprint - content hash of a clip payload, rendered as lowercase hex.
 * A default-constructed fingerprint is empty and never equals a computed one.
 */
class Fingerprint {
public:
    Fingerprint() = default;

    [[nodiscard]] static Fingerprint of(const QByteArray& payload);

    [[nodiscard]] bool empty() const { return hex_.isEmpty(); }
    [[nodiscard]] const QString& hex() const { return hex_; }

    bool operator==(const Fingerprint&) const = default;

private:
    explicit Fingerprint(QString hex) : hex_(std::move(hex)) {}

    QString hex_;
};

} // namespace clipsync::crypto
