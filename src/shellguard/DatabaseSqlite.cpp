#include "DatabaseSqlite.hpp"

#include <sqlite3.h>

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

DatabaseException MakeSqliteError(sqlite3* db, int code, const std::string& context) {
    const char* rawMessage = db ? sqlite3_errmsg(db) : nullptr;
    std::string message = rawMessage ? rawMessage : "unknown sqlite error";
    return DatabaseException("sqlite", code, context + ": " + message);
}

DatabaseException MakeSqliteError(int code, const std::string& context, const std::string& message) {
    return DatabaseException("sqlite", code, context + ": " + message);
}

void ExecuteSql(sqlite3* db, const std::string& sql, const std::string& context) {
    char* err = nullptr;
    const auto result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (result != SQLITE_OK) {
        std::string message = err ? err : "unknown sqlite error";
        sqlite3_free(err);
        throw MakeSqliteError(result, context, message);
    }
}

class SqliteStatement final : public IStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql)
        : db_{db}
        , stmt_{nullptr} {
        auto result = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (result != SQLITE_OK) {
            throw MakeSqliteError(db_, result, "prepare failed");
        }
    }

    ~SqliteStatement() override { sqlite3_finalize(stmt_); }

    int BindParameterIndex(const std::string& name) const override {
        const int index = sqlite3_bind_parameter_index(stmt_, name.c_str());
        if (index == 0) {
            throw DatabaseException("sqlite", SQLITE_MISUSE, "missing parameter: " + name);
        }

        return index;
    }

    void BindInt(int index, int64_t value) override {
        Check(sqlite3_bind_int64(stmt_, index, value), "bind int failed");
    }

    void BindText(int index, const std::string& value) override {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
            "bind text failed");
    }

    StatementStepResult Step() override {
        auto result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW) {
            return StatementStepResult::Row;
        }
        if (result == SQLITE_DONE) {
            return StatementStepResult::Done;
        }
        throw MakeSqliteError(db_, result, "step failed");
    }

    int64_t ColumnInt(int index) const override { return sqlite3_column_int64(stmt_, index); }

    std::string ColumnText(int index) const override {
        auto* text = sqlite3_column_text(stmt_, index);
        return text ? std::string{reinterpret_cast<const char*>(text),
                                  static_cast<size_t>(sqlite3_column_bytes(stmt_, index))}
                    : std::string{};
    }

private:
    void Check(int result, const std::string& context) {
        if (result != SQLITE_OK) {
            throw MakeSqliteError(db_, result, context);
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

class SqliteTransaction final : public ITransaction {
public:
    explicit SqliteTransaction(sqlite3* db)
        : db_{db}
        , done_{false} {
        ExecuteSql(db_, "BEGIN IMMEDIATE", "transaction failed");
    }

    ~SqliteTransaction() override {
        if (!done_) {
            // Fails only when sqlite already ended the transaction itself.
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    void Commit() override {
        ExecuteSql(db_, "COMMIT", "transaction failed");
        done_ = true;
    }

    void Rollback() override {
        done_ = true;
        ExecuteSql(db_, "ROLLBACK", "transaction failed");
    }

private:
    sqlite3* db_;
    bool done_;
};

} // namespace

SqliteDatabaseConnection::SqliteDatabaseConnection(const std::string& path)
    : db_{nullptr} {
    const auto result = sqlite3_open_v2(path.c_str(), &db_,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (result != SQLITE_OK) {
        auto error = MakeSqliteError(db_, result, "open database failed");
        sqlite3_close(db_);
        throw error;
    }

    if (sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS) != SQLITE_OK) {
        auto error = MakeSqliteError(db_, sqlite3_errcode(db_), "configure busy timeout failed");
        sqlite3_close(db_);
        throw error;
    }
}

SqliteDatabaseConnection::~SqliteDatabaseConnection() { sqlite3_close(db_); }

std::unique_ptr<IStatement> SqliteDatabaseConnection::Prepare(const std::string& sql) {
    return std::make_unique<SqliteStatement>(db_, sql);
}

std::unique_ptr<ITransaction> SqliteDatabaseConnection::BeginTransaction() {
    return std::make_unique<SqliteTransaction>(db_);
}

void SqliteDatabaseConnection::Execute(const std::string& sql) {
    ExecuteSql(db_, sql, "execute failed");
}

uint64_t SqliteDatabaseConnection::GetLastInsertId() const {
    return static_cast<uint64_t>(sqlite3_last_insert_rowid(db_));
}

std::string SqliteDatabaseConnection::BackendName() const { return "sqlite"; }
