#include "network/http_message.hpp"

#include <QJsonDocument>
#include <QUrl>

namespace clipsync::network {

namespace {

const QByteArray kHeadTerminator = QByteArrayLiteral("\r\n\r\n");

bool is_token(const QByteArray& value) {
    if (value.isEmpty()) return false;
    for (char c : value) {
        if (c <= 0x20 || c >= 0x7f) return false;
    }
    return true;
}

} // namespace

// ============================================================================
// HttpRequestParser
// ============================================================================

HttpRequestParser::Status HttpRequestParser::feed(const QByteArray& bytes) {
    if (status_ != Status::NeedMore) {
        return status_;
    }
    buffer_.append(bytes);

    if (!head_parsed_) {
        const auto head_end = buffer_.indexOf(kHeadTerminator);
        if (head_end < 0) {
            if (buffer_.size() > MAX_HEADER_BYTES) {
                status_ = Status::Malformed;
            }
            return status_;
        }
        if (head_end > MAX_HEADER_BYTES) {
            status_ = Status::Malformed;
            return status_;
        }
        status_ = parse_head(head_end);
        if (status_ != Status::NeedMore) {
            return status_;
        }
        head_parsed_ = true;
        body_offset_ = head_end + kHeadTerminator.size();
    }

    if (buffer_.size() - body_offset_ >= content_length_) {
        request_.body = buffer_.mid(body_offset_, content_length_);
        buffer_.clear();
        status_ = Status::Complete;
    }
    return status_;
}

HttpRequestParser::Status HttpRequestParser::parse_head(qsizetype head_end) {
    const auto head = buffer_.left(head_end);
    const auto lines = head.split('\n');
    if (lines.isEmpty()) {
        return Status::Malformed;
    }

    const auto request_line = lines.first().trimmed().split(' ');
    if (request_line.size() != 3 || !is_token(request_line[0]) ||
        !request_line[2].startsWith("HTTP/1.")) {
        return Status::Malformed;
    }
    request_.method = request_line[0].toUpper();

    const QUrl target(QString::fromLatin1(request_line[1]));
    if (!target.isValid()) {
        return Status::Malformed;
    }
    request_.path = target.path();
    if (request_.path.isEmpty()) {
        request_.path = QStringLiteral("/");
    }

    for (qsizetype i = 1; i < lines.size(); ++i) {
        const auto line = lines[i].trimmed();
        if (line.isEmpty()) continue;
        const auto colon = line.indexOf(':');
        if (colon <= 0) {
            return Status::Malformed;
        }
        const auto name = line.left(colon).trimmed().toLower();
        if (!is_token(name)) {
            return Status::Malformed;
        }
        request_.headers.insert(name, line.mid(colon + 1).trimmed());
    }

    if (request_.headers.contains("transfer-encoding")) {
        // Chunked uploads are not accepted; every client here sends a length.
        return Status::Malformed;
    }

    const auto length_header = request_.headers.value("content-length");
    if (!length_header.isEmpty()) {
        bool ok = false;
        const auto length = length_header.toLongLong(&ok);
        if (!ok || length < 0) {
            return Status::Malformed;
        }
        if (length > max_body_) {
            return Status::TooLarge;
        }
        content_length_ = static_cast<qsizetype>(length);
    }
    return Status::NeedMore;
}

// ============================================================================
// HttpResponse
// ============================================================================

void HttpResponse::set_header(const QByteArray& name, const QByteArray& value) {
    for (auto& entry : headers) {
        if (entry.first.compare(name, Qt::CaseInsensitive) == 0) {
            entry.second = value;
            return;
        }
    }
    headers.append({name, value});
}

QByteArray HttpResponse::header(const QByteArray& name) const {
    for (const auto& entry : headers) {
        if (entry.first.compare(name, Qt::CaseInsensitive) == 0) {
            return entry.second;
        }
    }
    return {};
}

QByteArray HttpResponse::to_bytes() const {
    QByteArray out;
    out.reserve(body.size() + 256);
    out += "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason_phrase(status) + "\r\n";
    for (const auto& [name, value] : headers) {
        if (name.compare("content-length", Qt::CaseInsensitive) == 0 ||
            name.compare("connection", Qt::CaseInsensitive) == 0) {
            continue;
        }
        out += name + ": " + value + "\r\n";
    }
    out += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

HttpResponse HttpResponse::json(int status, const QJsonObject& body) {
    HttpResponse response;
    response.status = status;
    response.set_header("Content-Type", "application/json");
    response.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return response;
}

HttpResponse HttpResponse::error(int status, const QString& message) {
    QJsonObject body;
    body.insert(QStringLiteral("error"), message);
    return json(status, body);
}

QByteArray reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

} // namespace clipsync::network
