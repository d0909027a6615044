#include "sync/one_shot.hpp"
#include "core/logging.hpp"

namespace clipsync::sync {

Result<Clip, Error> push_once(platform::ClipboardPort& clipboard,
                              network::RemoteStore& remote,
                              Origin origin) {
    auto read = clipboard.read();
    if (read.is_err()) {
        return Result<Clip, Error>::err(read.unwrap_err());
    }
    if (!read.unwrap()) {
        return Result<Clip, Error>::err(Error{ErrorKind::NotFound, "clipboard is empty"});
    }

    const auto& local = *read.unwrap();
    auto clip = Clip::from_local(local.kind, local.bytes, origin);

    auto ack = remote.push(clip);
    if (ack.is_err()) {
        return Result<Clip, Error>::err(ack.unwrap_err());
    }
    clip.revision = ack.unwrap();
    qCInfo(lcSync) << "pushed" << to_wire(clip.kind) << "clip," << clip.payload.size()
                   << "bytes, revision" << clip.revision;
    return Result<Clip, Error>::ok(std::move(clip));
}

Result<Clip, Error> pull_once(platform::ClipboardPort& clipboard,
                              network::RemoteStore& remote) {
    auto fetched = remote.fetch();
    if (fetched.is_err()) {
        return Result<Clip, Error>::err(fetched.unwrap_err());
    }
    if (!fetched.unwrap()) {
        return Result<Clip, Error>::err(Error{ErrorKind::NotFound, "no clip available"});
    }

    Clip clip = *fetched.unwrap();
    auto bytes = clip.local_bytes();
    if (bytes.is_err()) {
        return Result<Clip, Error>::err(bytes.unwrap_err());
    }

    auto written = clipboard.write(clip.kind, bytes.unwrap());
    if (written.is_err()) {
        return Result<Clip, Error>::err(written.unwrap_err());
    }
    qCInfo(lcSync) << "pulled" << to_wire(clip.kind) << "clip from" << to_wire(clip.origin)
                   << "revision" << clip.revision;
    return Result<Clip, Error>::ok(std::move(clip));
}

} // namespace clipsync::sync
