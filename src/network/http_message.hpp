#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>

namespace clipsync::network {

/**
 * A parsed HTTP/1.x request. Header names are lower-cased; the path has its
 * query string and fragment stripped.
 */
struct HttpRequest {
    QByteArray method;
    QString path;
    QMap<QByteArray, QByteArray> headers;
    QByteArray body;

    [[nodiscard]] QByteArray header(const QByteArray& name) const {
        return headers.value(name.toLower());
    }
};

/**
 * Incremental request parser fed from a socket buffer.
 *
 * Bytes after the end of the first request are ignored: the server answers
 * one request per connection.
 */
class HttpRequestParser {
public:
    enum class Status {
        NeedMore,
        Complete,
        Malformed,
        TooLarge
    };

    static constexpr qsizetype MAX_HEADER_BYTES = 16 * 1024;
    static constexpr qsizetype MAX_BODY_BYTES = 32 * 1024 * 1024;

    explicit HttpRequestParser(qsizetype max_body = MAX_BODY_BYTES)
        : max_body_(max_body) {}

    Status feed(const QByteArray& bytes);

    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] const HttpRequest& request() const { return request_; }

private:
    Status parse_head(qsizetype head_end);

    qsizetype max_body_;
    QByteArray buffer_;
    HttpRequest request_;
    Status status_ = Status::NeedMore;
    bool head_parsed_ = false;
    qsizetype body_offset_ = 0;
    qsizetype content_length_ = 0;
};

/**
 * An HTTP response ready for serialization.
 */
struct HttpResponse {
    int status = 200;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;

    void set_header(const QByteArray& name, const QByteArray& value);
    [[nodiscard]] QByteArray header(const QByteArray& name) const;

    /**
     * Serialize with status line, Content-Length and Connection: close.
     */
    [[nodiscard]] QByteArray to_bytes() const;

    [[nodiscard]] static HttpResponse json(int status, const QJsonObject& body);
    [[nodiscard]] static HttpResponse error(int status, const QString& message);
};

[[nodiscard]] QByteArray reason_phrase(int status);

} // namespace clipsync::network
