#include "storage/json_file_backend.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace clipsync::storage {

JsonFileBackend::JsonFileBackend(QString path)
    : path_(std::move(path)) {
}

Result<std::optional<QByteArray>, Error> JsonFileBackend::read() {
    using R = Result<std::optional<QByteArray>, Error>;

    QFile file(path_);
    if (!file.exists()) {
        return R::ok(std::nullopt);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return R::err(Error{ErrorKind::Transient,
                            "cannot open " + path_.toStdString() + ": " + file.errorString().toStdString()});
    }
    return R::ok(file.readAll());
}

Result<void, Error> JsonFileBackend::write(const QByteArray& document) {
    const QFileInfo info(path_);
    QDir dir(info.absolutePath());
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return Result<void, Error>::err(
            Error{ErrorKind::Persistence, "cannot create directory " + dir.absolutePath().toStdString()});
    }

    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void, Error>::err(
            Error{ErrorKind::Persistence, "cannot open " + path_.toStdString() + ": " +
                                              file.errorString().toStdString()});
    }
    if (file.write(document) != document.size()) {
        const auto reason = file.errorString().toStdString();
        file.cancelWriting();
        return Result<void, Error>::err(Error{ErrorKind::Persistence, "short write: " + reason});
    }
    if (!file.commit()) {
        return Result<void, Error>::err(
            Error{ErrorKind::Persistence, "commit failed: " + file.errorString().toStdString()});
    }
    return Result<void, Error>::ok();
}

} // namespace clipsync::storage
