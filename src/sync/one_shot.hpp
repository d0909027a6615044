#pragma once

#include "core/clip.hpp"
#include "core/result.hpp"
#include "network/store_client.hpp"
#include "platform/clipboard.hpp"

namespace clipsync::sync {

/**
 * Push whatever the clipboard holds, tagged with `origin`. Fails with
 * NotFound when the clipboard is empty. Returns the stored clip with the
 * revision the store assigned.
 */
[[nodiscard]] Result<Clip, Error> push_once(platform::ClipboardPort& clipboard,
                                            network::RemoteStore& remote,
                                            Origin origin);

/**
 * Fetch the store's clip and put it on the clipboard. Fails with NotFound
 * when the store is empty.
 */
[[nodiscard]] Result<Clip, Error> pull_once(platform::ClipboardPort& clipboard,
                                            network::RemoteStore& remote);

} // namespace clipsync::sync
