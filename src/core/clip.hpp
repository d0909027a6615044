#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QtGlobal>
#include <optional>

namespace clipsync {

/**
 * Content kind of a clip. Anything else is rejected at the boundary.
 */
enum class ClipKind {
    Text,
    Image
};

/**
 * Which endpoint produced a clip.
 */
enum class Origin {
    Desktop,
    Phone,
    Unknown
};

[[nodiscard]] QString to_wire(ClipKind kind);
[[nodiscard]] QString to_wire(Origin origin);

/**
 * Parse a wire kind ("text" / "image"). Exact match, anything else is nullopt.
 */
[[nodiscard]] std::optional<ClipKind> parse_clip_kind(const QString& wire);

/**
 * Parse a wire source. Case-insensitive; unrecognized strings map to Unknown.
 */
[[nodiscard]] Origin parse_origin(const QString& wire);

[[nodiscard]] QString default_mime(ClipKind kind);

/**
 * Clip - the synchronized unit of clipboard content.
 *
 * `payload` is the wire `data` value verbatim: UTF-8 text for Text,
 * base64 of the encoded image for Image. Fingerprints are computed over it,
 * so both endpoints agree on equality without decoding.
 */
struct Clip {
    ClipKind kind = ClipKind::Text;
    QByteArray payload;
    QString mime;
    Origin origin = Origin::Unknown;
    qint64 created_at = 0;
    qint64 revision = 0;

    [[nodiscard]] QString effective_mime() const {
        return mime.isEmpty() ? default_mime(kind) : mime;
    }

    /**
     * Build a clip from raw clipboard bytes (image bytes get base64 encoded).
     */
    [[nodiscard]] static Clip from_local(ClipKind kind, const QByteArray& raw, Origin origin);

    /**
     * Bytes to hand to the clipboard (image payloads get base64 decoded).
     */
    [[nodiscard]] Res<QByteArray> local_bytes() const;

    bool operator==(const Clip&) const = default;
};

/**
 * The store's entire persisted state: at most one clip.
 */
using StoreSlot = std::optional<Clip>;

/**
 * Slot JSON layout: {type, data, mime, source, createdAt, revision}.
 */
[[nodiscard]] QJsonObject clip_to_json(const Clip& clip);
[[nodiscard]] Res<Clip> clip_from_json(const QJsonObject& obj);

[[nodiscard]] QByteArray serialize_slot(const Clip& clip);
[[nodiscard]] Res<Clip> parse_slot(const QByteArray& bytes);

} // namespace clipsync
