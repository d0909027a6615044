#pragma once

#include "storage/slot_backend.hpp"

namespace clipsync::storage {

/**
 * Stores the slot as a single JSON file, replaced atomically via QSaveFile.
 */
class JsonFileBackend final : public SlotBackend {
public:
    explicit JsonFileBackend(QString path);

    Result<std::optional<QByteArray>, Error> read() override;
    Result<void, Error> write(const QByteArray& document) override;
    [[nodiscard]] QString describe() const override { return path_; }

    [[nodiscard]] const QString& path() const { return path_; }

private:
    QString path_;
};

} // namespace clipsync::storage
