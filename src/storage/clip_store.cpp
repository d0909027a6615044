#include "storage/clip_store.hpp"
#include "core/logging.hpp"
#include "storage/json_file_backend.hpp"
#include "storage/sqlite_backend.hpp"

namespace clipsync::storage {

namespace {

StoreSlot read_slot(SlotBackend& backend) {
    auto raw = backend.read();
    if (raw.is_err()) {
        qCWarning(lcStore) << "cannot read" << backend.describe() << ":"
                           << raw.unwrap_err().message.c_str();
        return std::nullopt;
    }
    if (!raw.unwrap().has_value()) {
        return std::nullopt;
    }

    auto parsed = parse_slot(*raw.unwrap());
    if (parsed.is_err()) {
        if (parsed.unwrap_err().kind != ErrorKind::NotFound) {
            qCWarning(lcStore) << "ignoring corrupt slot in" << backend.describe() << ":"
                               << parsed.unwrap_err().message.c_str();
        }
        return std::nullopt;
    }
    return std::move(parsed).unwrap();
}

} // namespace

ClipStore::ClipStore(std::unique_ptr<SlotBackend> backend)
    : backend_(std::move(backend)) {
    load();
}

StoreSlot ClipStore::load() {
    QMutexLocker lock(&mu_);
    slot_ = read_slot(*backend_);
    if (slot_) {
        qCDebug(lcStore) << "loaded revision" << slot_->revision << "from" << backend_->describe();
    }
    return slot_;
}

Result<Clip, Error> ClipStore::save(Clip clip) {
    QMutexLocker lock(&mu_);

    clip.revision = (slot_ ? slot_->revision : 0) + 1;
    if (clip.mime.isEmpty()) {
        clip.mime = default_mime(clip.kind);
    }

    auto written = backend_->write(serialize_slot(clip));
    if (written.is_err()) {
        qCWarning(lcStore) << "failed to persist clip to" << backend_->describe() << ":"
                           << written.unwrap_err().message.c_str();
        return Result<Clip, Error>::err(written.unwrap_err());
    }

    slot_ = clip;
    qCDebug(lcStore) << "stored" << to_wire(clip.kind) << "revision" << clip.revision
                     << "from" << to_wire(clip.origin);
    return Result<Clip, Error>::ok(std::move(clip));
}

StoreSlot ClipStore::current() const {
    QMutexLocker lock(&mu_);
    return slot_;
}

QString ClipStore::location() const {
    return backend_->describe();
}

Result<std::unique_ptr<SlotBackend>, Error> make_backend(const Config& config) {
    using R = Result<std::unique_ptr<SlotBackend>, Error>;

    switch (config.store_backend) {
        case StoreBackendKind::JsonFile:
            return R::ok(std::make_unique<JsonFileBackend>(config.store_path));
        case StoreBackendKind::Sqlite: {
            auto opened = SqliteBackend::open(config.store_path);
            if (opened.is_err()) {
                return R::err(opened.unwrap_err());
            }
            return R::ok(std::move(opened).unwrap());
        }
    }
    return R::err(Error{ErrorKind::Internal, "unknown store backend"});
}

} // namespace clipsync::storage
