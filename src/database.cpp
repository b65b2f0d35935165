#include "database.hpp"
#include <sqlite3.h>
#include <iostream>

Statement::Statement(sqlite3* database, const std::string& sql) : db(database), stmt(nullptr) {
    int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw PersistenceError("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

Statement::Statement(Statement&& other) noexcept : db(other.db), stmt(other.stmt) {
    other.stmt = nullptr;
}

Statement::~Statement() {
    if (stmt) {
        sqlite3_finalize(stmt);
    }
}

void Statement::check(int rc, const char* what) const {
    if (rc == SQLITE_OK) return;
    std::string message = std::string(what) + ": " + sqlite3_errmsg(db);
    if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
        throw ConstraintError(message);
    }
    throw PersistenceError(message);
}

void Statement::bind(int index, double value) {
    check(sqlite3_bind_double(stmt, index, value), "Failed to bind value");
}

void Statement::bind(int index, std::int64_t value) {
    check(sqlite3_bind_int64(stmt, index, value), "Failed to bind value");
}

void Statement::bind(int index, const std::string& value) {
    check(sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
          "Failed to bind value");
}

bool Statement::step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    check(rc, "Failed to execute statement");
    return false;
}

void Statement::reset() {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

double Statement::columnDouble(int column) const {
    return sqlite3_column_double(stmt, column);
}

std::int64_t Statement::columnInt64(int column) const {
    return sqlite3_column_int64(stmt, column);
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (!text) return std::string();
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

Database::Database(const std::string& path) : db_path(path), db(nullptr) {
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw PersistenceError("Failed to open database " + path + ": " + message);
    }
}

Database::~Database() {
    if (db) {
        sqlite3_close(db);
    }
}

void Database::execute(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(db);
        sqlite3_free(error);
        if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
            throw ConstraintError(message);
        }
        throw PersistenceError(message);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(db, sql);
}

int Database::changes() const {
    return sqlite3_changes(db);
}

std::int64_t Database::lastInsertId() const {
    return sqlite3_last_insert_rowid(db);
}

void Database::beginTransaction() {
    execute("BEGIN TRANSACTION");
}

void Database::commit() {
    execute("COMMIT");
}

void Database::rollback() {
    execute("ROLLBACK");
}

Transaction::Transaction(Database& database) : db(database), committed(false) {
    db.beginTransaction();
}

Transaction::~Transaction() {
    if (committed) return;
    try {
        db.rollback();
    } catch (const PersistenceError& e) {
        std::cerr << "Warning: rollback failed: " << e.what() << std::endl;
    }
}

void Transaction::commit() {
    db.commit();
    committed = true;
}
