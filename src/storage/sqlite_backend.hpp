#pragma once

#include "storage/database.hpp"
#include "storage/slot_backend.hpp"

namespace clipsync::storage {

/**
 * Stores the slot document in a one-row SQLite table.
 *
 * Schema: slot(id INTEGER PRIMARY KEY CHECK (id = 1), document BLOB, updated_at INTEGER)
 */
class SqliteBackend final : public SlotBackend {
public:
    /**
     * Open (creating if needed) the database at `path` and ensure the schema.
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteBackend>, Error> open(const QString& path);

    /**
     * Wrap an already-open database (in-memory databases in tests).
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteBackend>, Error> attach(Database db, QString label);

    Result<std::optional<QByteArray>, Error> read() override;
    Result<void, Error> write(const QByteArray& document) override;
    [[nodiscard]] QString describe() const override { return label_; }

private:
    SqliteBackend(Database db, QString label);

    Database db_;
    QString label_;
};

} // namespace clipsync::storage
