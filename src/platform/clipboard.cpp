#include "platform/clipboard.hpp"
#include "core/logging.hpp"

#include <QBuffer>
#include <QClipboard>
#include <QGuiApplication>
#include <QImage>
#include <QMimeData>

namespace clipsync::platform {

namespace {

Result<QByteArray, Error> encode_png(const QImage& image) {
    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, "PNG")) {
        return Result<QByteArray, Error>::err(Error{ErrorKind::Transient, "cannot encode clipboard image"});
    }
    return Result<QByteArray, Error>::ok(bytes);
}

} // namespace

Result<std::optional<LocalClip>, Error> QtClipboard::read() {
    using R = Result<std::optional<LocalClip>, Error>;

    auto* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        return R::err(Error{ErrorKind::Transient, "no clipboard available"});
    }
    const auto* mime = clipboard->mimeData();
    if (!mime) {
        return R::ok(std::nullopt);
    }

    // Images win over text, the way screenshot tools put both on the board.
    if (mime->hasImage()) {
        const QImage image = clipboard->image();
        if (!image.isNull()) {
            auto png = encode_png(image);
            if (png.is_err()) {
                qCDebug(lcClipboard) << png.unwrap_err().message.c_str();
                return R::err(png.unwrap_err());
            }
            return R::ok(LocalClip{ClipKind::Image, std::move(png).unwrap()});
        }
    }

    if (mime->hasText()) {
        const auto text = clipboard->text();
        if (!text.isEmpty()) {
            return R::ok(LocalClip{ClipKind::Text, text.toUtf8()});
        }
    }
    return R::ok(std::nullopt);
}

Result<void, Error> QtClipboard::write(ClipKind kind, const QByteArray& bytes) {
    auto* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        return Result<void, Error>::err(Error{ErrorKind::Transient, "no clipboard available"});
    }

    if (kind == ClipKind::Text) {
        clipboard->setText(QString::fromUtf8(bytes));
        return Result<void, Error>::ok();
    }

    const auto image = QImage::fromData(bytes);
    if (image.isNull()) {
        qCWarning(lcClipboard) << "cannot decode image of" << bytes.size() << "bytes";
        return Result<void, Error>::err(Error{ErrorKind::Validation, "image data could not be decoded"});
    }
    clipboard->setImage(image);
    return Result<void, Error>::ok();
}

} // namespace clipsync::platform
