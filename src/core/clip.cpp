#include "core/clip.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace clipsync {

namespace {

constexpr const char* kKeyType = "type";
constexpr const char* kKeyData = "data";
constexpr const char* kKeyMime = "mime";
constexpr const char* kKeySource = "source";
constexpr const char* kKeyCreatedAt = "createdAt";
constexpr const char* kKeyRevision = "revision";

QString key(const char* name) {
    return QString::fromLatin1(name);
}

} // namespace

QString to_wire(ClipKind kind) {
    switch (kind) {
        case ClipKind::Text: return QStringLiteral("text");
        case ClipKind::Image: return QStringLiteral("image");
    }
    return QStringLiteral("text");
}

QString to_wire(Origin origin) {
    switch (origin) {
        case Origin::Desktop: return QStringLiteral("desktop");
        case Origin::Phone: return QStringLiteral("phone");
        case Origin::Unknown: return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

std::optional<ClipKind> parse_clip_kind(const QString& wire) {
    if (wire == QStringLiteral("text")) return ClipKind::Text;
    if (wire == QStringLiteral("image")) return ClipKind::Image;
    return std::nullopt;
}

Origin parse_origin(const QString& wire) {
    const auto normalized = wire.trimmed().toLower();
    if (normalized == QStringLiteral("desktop")) return Origin::Desktop;
    if (normalized == QStringLiteral("phone")) return Origin::Phone;
    return Origin::Unknown;
}

QString default_mime(ClipKind kind) {
    return kind == ClipKind::Image ? QStringLiteral("image/png")
                                   : QStringLiteral("text/plain");
}

Clip Clip::from_local(ClipKind kind, const QByteArray& raw, Origin origin) {
    Clip clip;
    clip.kind = kind;
    clip.payload = kind == ClipKind::Image ? raw.toBase64() : raw;
    clip.mime = default_mime(kind);
    clip.origin = origin;
    return clip;
}

Res<QByteArray> Clip::local_bytes() const {
    if (kind == ClipKind::Text) {
        return Res<QByteArray>::ok(payload);
    }
    auto decoded = QByteArray::fromBase64Encoding(payload, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        return Res<QByteArray>::err(Error{ErrorKind::Validation, "image payload is not valid base64"});
    }
    return Res<QByteArray>::ok(decoded.decoded);
}

QJsonObject clip_to_json(const Clip& clip) {
    QJsonObject obj;
    obj.insert(key(kKeyType), to_wire(clip.kind));
    obj.insert(key(kKeyData), QString::fromUtf8(clip.payload));
    obj.insert(key(kKeyMime), clip.effective_mime());
    obj.insert(key(kKeySource), to_wire(clip.origin));
    obj.insert(key(kKeyCreatedAt), clip.created_at);
    obj.insert(key(kKeyRevision), clip.revision);
    return obj;
}

Res<Clip> clip_from_json(const QJsonObject& obj) {
    const auto kind = parse_clip_kind(obj.value(key(kKeyType)).toString());
    if (!kind) {
        return Res<Clip>::err(Error{ErrorKind::Validation, "type must be 'text' or 'image'"});
    }

    const auto data = obj.value(key(kKeyData));
    if (data.isNull() || data.isUndefined()) {
        return Res<Clip>::err(Error{ErrorKind::Validation, "data is required"});
    }

    Clip clip;
    clip.kind = *kind;
    if (data.isString()) {
        clip.payload = data.toString().toUtf8();
    } else if (data.isObject()) {
        clip.payload = QJsonDocument(data.toObject()).toJson(QJsonDocument::Compact);
    } else if (data.isArray()) {
        clip.payload = QJsonDocument(data.toArray()).toJson(QJsonDocument::Compact);
    } else if (data.isBool()) {
        clip.payload = data.toBool() ? QByteArrayLiteral("true") : QByteArrayLiteral("false");
    } else {
        // Integral values print without a trailing ".0".
        const double number = data.toDouble();
        const bool integral = std::trunc(number) == number && std::fabs(number) < 1e15;
        clip.payload = integral
            ? QByteArray::number(static_cast<qint64>(number))
            : QByteArray::number(number, 'g', 17);
    }

    clip.mime = obj.value(key(kKeyMime)).toString();
    if (clip.mime.isEmpty()) {
        clip.mime = default_mime(clip.kind);
    }
    clip.origin = parse_origin(obj.value(key(kKeySource)).toString());
    clip.created_at = obj.value(key(kKeyCreatedAt)).toInteger(0);
    clip.revision = obj.value(key(kKeyRevision)).toInteger(0);
    return Res<Clip>::ok(std::move(clip));
}

QByteArray serialize_slot(const Clip& clip) {
    return QJsonDocument(clip_to_json(clip)).toJson(QJsonDocument::Indented);
}

Res<Clip> parse_slot(const QByteArray& bytes) {
    if (bytes.trimmed().isEmpty()) {
        return Res<Clip>::err(Error{ErrorKind::NotFound, "no clip stored"});
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Res<Clip>::err(Error{ErrorKind::Validation, "slot is not a JSON object"});
    }
    // `{}` is an empty slot, not a corrupt one.
    if (doc.object().isEmpty()) {
        return Res<Clip>::err(Error{ErrorKind::NotFound, "no clip stored"});
    }
    return clip_from_json(doc.object());
}

} // namespace clipsync
