#pragma once

#include "network/http_message.hpp"
#include "storage/clip_store.hpp"
#include <QtGlobal>

namespace clipsync::network {

/**
 * Routes one request against the store:
 *
 *   GET  /clip, /clip/latest   -> slot JSON, or 404 when empty
 *   POST /clip                 -> validate, stamp createdAt, persist, ack
 *   OPTIONS <any>              -> CORS preflight
 *
 * Every response carries Access-Control-Allow-Origin. Validation failures
 * never touch the store. `now_secs` is the createdAt stamp for a POST.
 */
[[nodiscard]] HttpResponse handle_clip_request(const HttpRequest& request,
                                               storage::ClipStore& store,
                                               qint64 now_secs);

/**
 * Response for a request the parser rejected (400 Bad request / 413).
 */
[[nodiscard]] HttpResponse rejected_request_response(HttpRequestParser::Status status);

} // namespace clipsync::network
