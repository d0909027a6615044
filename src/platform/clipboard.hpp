#pragma once

#include "core/clip.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <optional>

namespace clipsync::platform {

/**
 * Clipboard content as the OS hands it over: UTF-8 text, or PNG bytes.
 */
struct LocalClip {
    ClipKind kind = ClipKind::Text;
    QByteArray bytes;

    bool operator==(const LocalClip&) const = default;
};

/**
 * ClipboardPort - the local clipboard as the sync engine sees it.
 *
 * read() returns nullopt for an empty clipboard (or one holding a format
 * that is neither text nor image). Either call may fail transiently.
 */
class ClipboardPort {
public:
    virtual ~ClipboardPort() = default;

    [[nodiscard]] virtual Result<std::optional<LocalClip>, Error> read() = 0;
    [[nodiscard]] virtual Result<void, Error> write(ClipKind kind, const QByteArray& bytes) = 0;
};

/**
 * QtClipboard - ClipboardPort over QGuiApplication::clipboard().
 * Must be used from the GUI thread.
 */
class QtClipboard final : public ClipboardPort {
public:
    Result<std::optional<LocalClip>, Error> read() override;
    Result<void, Error> write(ClipKind kind, const QByteArray& bytes) override;
};

/**
 * In-process clipboard for tests and headless checks.
 */
class MemoryClipboard final : public ClipboardPort {
public:
    Result<std::optional<LocalClip>, Error> read() override {
        ++reads_;
        if (fail_reads_) {
            return Result<std::optional<LocalClip>, Error>::err(
                Error{ErrorKind::Transient, "clipboard busy"});
        }
        return Result<std::optional<LocalClip>, Error>::ok(content_);
    }

    Result<void, Error> write(ClipKind kind, const QByteArray& bytes) override {
        ++writes_;
        if (fail_writes_) {
            return Result<void, Error>::err(Error{ErrorKind::Transient, "clipboard busy"});
        }
        content_ = LocalClip{kind, bytes};
        return Result<void, Error>::ok();
    }

    // Simulates the user copying something.
    void set(ClipKind kind, const QByteArray& bytes) { content_ = LocalClip{kind, bytes}; }
    void clear() { content_.reset(); }

    void set_fail_reads(bool fail) { fail_reads_ = fail; }
    void set_fail_writes(bool fail) { fail_writes_ = fail; }

    [[nodiscard]] const std::optional<LocalClip>& content() const { return content_; }
    [[nodiscard]] int reads() const { return reads_; }
    [[nodiscard]] int writes() const { return writes_; }

private:
    std::optional<LocalClip> content_;
    bool fail_reads_ = false;
    bool fail_writes_ = false;
    int reads_ = 0;
    int writes_ = 0;
};

} // namespace clipsync::platform
