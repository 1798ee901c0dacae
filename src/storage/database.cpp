#include "storage/database.hpp"

#include "core/logging.hpp"

#include <QFile>
#include <QFileInfo>

namespace konnect::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

Error bind_error(int index, int rc) {
    return Error{"cannot bind parameter " + std::to_string(index) + " (" + sqlite3_errstr(rc) + ")",
                 ErrorCode::Storage, rc};
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Res<void> Statement::bind(int index, const QString& text) {
    const QByteArray utf8 = text.toUtf8();
    const int rc = sqlite3_bind_text(stmt_.get(), index, utf8.constData(),
                                     static_cast<int>(utf8.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Res<void>::err(bind_error(index, rc));
    }
    return Res<void>::ok();
}

Res<void> Statement::bind(int index, const QByteArray& blob) {
    // sqlite3 stores NULL for a null pointer; an empty blob must stay a blob.
    static const char empty = 0;
    const void* data = blob.isEmpty() ? static_cast<const void*>(&empty) : blob.constData();
    const int rc = sqlite3_bind_blob(stmt_.get(), index, data,
                                     static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Res<void>::err(bind_error(index, rc));
    }
    return Res<void>::ok();
}

Res<void> Statement::bind(int index, int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Res<void>::err(bind_error(index, rc));
    }
    return Res<void>::ok();
}

QString Statement::text(int column) const {
    const auto* data = sqlite3_column_text(stmt_.get(), column);
    const int size = sqlite3_column_bytes(stmt_.get(), column);
    if (data == nullptr) {
        return {};
    }
    return QString::fromUtf8(reinterpret_cast<const char*>(data), size);
}

QByteArray Statement::blob(int column) const {
    const void* data = sqlite3_column_blob(stmt_.get(), column);
    const int size = sqlite3_column_bytes(stmt_.get(), column);
    if (data == nullptr || size <= 0) {
        return {};
    }
    return QByteArray(static_cast<const char*>(data), size);
}

int64_t Statement::integer(int column) const {
    return sqlite3_column_int64(stmt_.get(), column);
}

Res<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Res<bool>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Res<bool>::ok(false);
    }
    return Res<bool>::err(Error{std::string("step failed (") + sqlite3_errstr(rc) + ")",
                                ErrorCode::Storage, rc});
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Res<Database> Database::open(const QString& path) {
    const bool in_memory = path == QStringLiteral(":memory:");
    const bool created = !in_memory && !QFileInfo::exists(path);

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.toUtf8().constData(), &handle,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return Res<Database>::err(Error{"cannot open " + path.toStdString() + ": " + message,
                                        ErrorCode::Storage, rc});
    }
    sqlite3_busy_timeout(handle, BUSY_TIMEOUT_MS);

    Database db(handle);
    auto synced = db.execute("PRAGMA synchronous = FULL;");
    if (synced.is_err()) {
        return Res<Database>::err(synced.unwrap_err());
    }
    if (created && !QFile::setPermissions(path, QFile::ReadOwner | QFile::WriteOwner)) {
        qCWarning(konnectTrustLog) << "Could not restrict permissions of" << path;
    }
    return Res<Database>::ok(std::move(db));
}

Res<Database> Database::open_memory() {
    return open(QStringLiteral(":memory:"));
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Error Database::error(const std::string& what, int rc) const {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : "database not open";
    return Error{what + ": " + detail, ErrorCode::Storage, rc};
}

Res<Statement> Database::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Res<Statement>::err(error("prepare failed", rc));
    }
    return Res<Statement>::ok(Statement(stmt));
}

Res<void> Database::execute(const char* sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string detail = message ? message : sqlite3_errstr(rc);
        sqlite3_free(message);
        return Res<void>::err(Error{detail, ErrorCode::Storage, rc});
    }
    return Res<void>::ok();
}

Res<int> Database::user_version() {
    auto stmt = prepare("PRAGMA user_version;");
    if (stmt.is_err()) {
        return Res<int>::err(stmt.unwrap_err());
    }
    auto row = stmt.unwrap().step();
    if (row.is_err()) {
        return Res<int>::err(row.unwrap_err());
    }
    return Res<int>::ok(row.unwrap() ? static_cast<int>(stmt.unwrap().integer(0)) : 0);
}

Res<void> Database::set_user_version(int version) {
    // PRAGMA arguments cannot be bound.
    const std::string sql = "PRAGMA user_version = " + std::to_string(version) + ";";
    return execute(sql.c_str());
}

} // namespace konnect::storage
