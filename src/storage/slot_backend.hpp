#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QString>
#include <optional>

namespace clipsync::storage {

/**
 * SlotBackend - durable home of the serialized slot document.
 *
 * A backend only moves bytes; parsing and validation happen in ClipStore.
 * `write` must replace the previous document atomically: a reader never sees
 * a mix of the old and new document.
 */
class SlotBackend {
public:
    virtual ~SlotBackend() = default;

    /**
     * Read the stored document, or nullopt if nothing was ever written.
     */
    [[nodiscard]] virtual Result<std::optional<QByteArray>, Error> read() = 0;

    [[nodiscard]] virtual Result<void, Error> write(const QByteArray& document) = 0;

    /**
     * Human-readable location, for logs.
     */
    [[nodiscard]] virtual QString describe() const = 0;
};

/**
 * In-memory backend for tests. Writes can be made to fail on demand.
 */
class MemorySlotBackend final : public SlotBackend {
public:
    MemorySlotBackend() = default;
    explicit MemorySlotBackend(QByteArray initial) : document_(std::move(initial)) {}

    Result<std::optional<QByteArray>, Error> read() override {
        return Result<std::optional<QByteArray>, Error>::ok(document_);
    }

    Result<void, Error> write(const QByteArray& document) override {
        ++write_attempts_;
        if (fail_writes_) {
            return Result<void, Error>::err(Error{ErrorKind::Persistence, "simulated write failure"});
        }
        document_ = document;
        return Result<void, Error>::ok();
    }

    [[nodiscard]] QString describe() const override { return QStringLiteral("memory"); }

    void set_fail_writes(bool fail) { fail_writes_ = fail; }
    [[nodiscard]] int write_attempts() const { return write_attempts_; }
    [[nodiscard]] const std::optional<QByteArray>& document() const { return document_; }

private:
    std::optional<QByteArray> document_;
    bool fail_writes_ = false;
    int write_attempts_ = 0;
};

} // namespace clipsync::storage
