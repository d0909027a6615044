#include "crypto/fingerprint.hpp"

#include <sodium.h>
#include <array>

namespace clipsync::crypto {

Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{ErrorKind::Internal, "Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

Fingerprint Fingerprint::of(const QByteArray& payload) {
    std::array<unsigned char, FINGERPRINT_SIZE> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(payload.constData()),
                       static_cast<unsigned long long>(payload.size()),
                       nullptr, 0);

    std::array<char, FINGERPRINT_SIZE * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return Fingerprint(QString::fromLatin1(hex.data()));
}

} // namespace clipsync::crypto
