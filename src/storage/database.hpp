#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace clipsync::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int64(int index, int64_t value);
    Result<void, Error> bind_blob(int index, const void* data, size_t size);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] std::vector<uint8_t> column_blob(int index) const;

    Result<bool, Error> step();  // true if there's a row

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection wrapper.
 *
 * Errors come back as ErrorKind::Persistence with the sqlite rc as code.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `f` inside BEGIN IMMEDIATE / COMMIT. Rolls back if `f` fails.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = execute("BEGIN IMMEDIATE;");
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            // The original failure is what the caller needs to see.
            [[maybe_unused]] auto rollback = execute("ROLLBACK;");
            return result;
        }

        auto commit_result = execute("COMMIT;");
        if (commit_result.is_err()) {
            [[maybe_unused]] auto rollback = execute("ROLLBACK;");
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace clipsync::storage
