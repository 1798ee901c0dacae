#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <sqlite3.h>

#include <cstdint>
#include <memory>

namespace konnect::storage {

/**
 * Statement - prepared statement, finalized when the last copy goes away.
 *
 * Parameters are 1-based and columns 0-based, as in the sqlite3 API. Text
 * is bound and read as UTF-8.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] Res<void> bind(int index, const QString& text);
    [[nodiscard]] Res<void> bind(int index, const QByteArray& blob);
    [[nodiscard]] Res<void> bind(int index, int64_t value);

    [[nodiscard]] QString text(int column) const;
    [[nodiscard]] QByteArray blob(int column) const;
    [[nodiscard]] int64_t integer(int column) const;

    /// True while a row is available, false once the statement is done.
    [[nodiscard]] Res<bool> step();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - one SQLite connection.
 *
 * Opened with synchronous=FULL: a committed transaction is on disk when
 * commit returns, which is what lets a pairing be reported durable.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /// Open or create the file; a new file is made readable by the owner only.
    [[nodiscard]] static Res<Database> open(const QString& path);
    [[nodiscard]] static Res<Database> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Res<Statement> prepare(const char* sql);
    [[nodiscard]] Res<void> execute(const char* sql);

    /// PRAGMA user_version, the schema version the migrations maintain.
    [[nodiscard]] Res<int> user_version();
    [[nodiscard]] Res<void> set_user_version(int version);

    /**
     * Run f inside BEGIN IMMEDIATE / COMMIT. An error from f, or from the
     * commit, rolls back and is returned unchanged.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begun = execute("BEGIN IMMEDIATE;");
        if (begun.is_err()) {
            return ResultType::err(begun.unwrap_err());
        }
        auto result = f();
        if (result.is_ok()) {
            auto committed = execute("COMMIT;");
            if (committed.is_ok()) {
                return result;
            }
            result = ResultType::err(committed.unwrap_err());
        }
        auto rolled_back = execute("ROLLBACK;");
        if (rolled_back.is_err()) {
            return ResultType::err(Error{result.unwrap_err().message + " (rollback failed: " +
                                             rolled_back.unwrap_err().message + ")",
                                         ErrorCode::Storage});
        }
        return result;
    }

private:
    explicit Database(sqlite3* db) : db_(db) {}

    [[nodiscard]] Error error(const std::string& what, int rc) const;

    sqlite3* db_ = nullptr;
};

} // namespace konnect::storage
