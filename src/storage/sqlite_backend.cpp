#include "storage/sqlite_backend.hpp"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

namespace clipsync::storage {

namespace {

constexpr const char* kSchema = R"SQL(
    CREATE TABLE IF NOT EXISTS slot (
        id INTEGER PRIMARY KEY CHECK (id = 1),
        document BLOB NOT NULL,
        updated_at INTEGER NOT NULL
    );
)SQL";

} // namespace

SqliteBackend::SqliteBackend(Database db, QString label)
    : db_(std::move(db))
    , label_(std::move(label)) {
}

Result<std::unique_ptr<SqliteBackend>, Error> SqliteBackend::open(const QString& path) {
    using R = Result<std::unique_ptr<SqliteBackend>, Error>;

    QDir dir(QFileInfo(path).absolutePath());
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return R::err(Error{ErrorKind::Persistence,
                            "cannot create directory " + dir.absolutePath().toStdString()});
    }

    auto db = Database::open(path.toStdString());
    if (db.is_err()) {
        return R::err(db.unwrap_err());
    }
    return attach(std::move(db).unwrap(), path);
}

Result<std::unique_ptr<SqliteBackend>, Error> SqliteBackend::attach(Database db, QString label) {
    using R = Result<std::unique_ptr<SqliteBackend>, Error>;

    auto schema = db.execute(kSchema);
    if (schema.is_err()) {
        return R::err(schema.unwrap_err());
    }
    return R::ok(std::unique_ptr<SqliteBackend>(new SqliteBackend(std::move(db), std::move(label))));
}

Result<std::optional<QByteArray>, Error> SqliteBackend::read() {
    using R = Result<std::optional<QByteArray>, Error>;

    auto stmt = db_.prepare("SELECT document FROM slot WHERE id = 1;");
    if (stmt.is_err()) {
        return R::err(stmt.unwrap_err());
    }
    auto& query = stmt.unwrap();
    auto row = query.step();
    if (row.is_err()) {
        return R::err(row.unwrap_err());
    }
    if (!row.unwrap()) {
        return R::ok(std::nullopt);
    }

    const auto blob = query.column_blob(0);
    return R::ok(QByteArray(reinterpret_cast<const char*>(blob.data()),
                            static_cast<qsizetype>(blob.size())));
}

Result<void, Error> SqliteBackend::write(const QByteArray& document) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto stmt = db_.prepare(
            "INSERT INTO slot (id, document, updated_at) VALUES (1, ?, ?) "
            "ON CONFLICT(id) DO UPDATE SET document = excluded.document, "
            "updated_at = excluded.updated_at;");
        if (stmt.is_err()) {
            return Result<void, Error>::err(stmt.unwrap_err());
        }
        auto& upsert = stmt.unwrap();

        auto bound = upsert.bind_blob(1, document.constData(), static_cast<size_t>(document.size()));
        if (bound.is_err()) return bound;
        bound = upsert.bind_int64(2, QDateTime::currentMSecsSinceEpoch());
        if (bound.is_err()) return bound;

        auto done = upsert.step();
        if (done.is_err()) {
            return Result<void, Error>::err(done.unwrap_err());
        }
        return Result<void, Error>::ok();
    });
}

} // namespace clipsync::storage
