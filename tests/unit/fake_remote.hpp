#pragma once

#include "network/store_client.hpp"
#include "storage/clip_store.hpp"

#include <QDateTime>
#include <stdexcept>

namespace clipsync::testing {

/**
 * RemoteStore that talks straight to an in-process ClipStore, with switches
 * for network failures and throwing ports.
 */
class FakeRemote final : public network::RemoteStore {
public:
    explicit FakeRemote(storage::ClipStore& store) : store_(store) {}

    Result<qint64, Error> push(const Clip& clip) override {
        ++push_calls;
        if (throw_on_call) {
            throw std::runtime_error("remote exploded");
        }
        if (throw_non_standard) {
            throw 42;
        }
        if (offline) {
            return Result<qint64, Error>::err(Error{ErrorKind::Transient, "connection refused"});
        }
        Clip stamped = clip;
        stamped.created_at = QDateTime::currentSecsSinceEpoch();
        auto saved = store_.save(stamped);
        if (saved.is_err()) {
            return Result<qint64, Error>::err(Error{ErrorKind::Transient, "store answered 500", 500});
        }
        return Result<qint64, Error>::ok(saved.unwrap().revision);
    }

    Result<std::optional<Clip>, Error> fetch() override {
        ++fetch_calls;
        if (throw_on_call) {
            throw std::runtime_error("remote exploded");
        }
        if (throw_non_standard) {
            throw 42;
        }
        if (offline) {
            return Result<std::optional<Clip>, Error>::err(Error{ErrorKind::Transient, "timeout"});
        }
        return Result<std::optional<Clip>, Error>::ok(store_.current());
    }

    bool offline = false;
    bool throw_on_call = false;
    bool throw_non_standard = false;
    int push_calls = 0;
    int fetch_calls = 0;

private:
    storage::ClipStore& store_;
};

/**
 * Writes a clip into the store as if another endpoint had pushed it.
 */
inline Clip put_remote(storage::ClipStore& store, const char* text, Origin origin) {
    Clip clip;
    clip.kind = ClipKind::Text;
    clip.payload = QByteArray(text);
    clip.origin = origin;
    return store.save(clip).unwrap();
}

} // namespace clipsync::testing
