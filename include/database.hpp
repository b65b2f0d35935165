#ifndef DATABASE_H
#define DATABASE_H

#include <cstdint>
#include <stdexcept>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

/**
 * @class PersistenceError
 * @brief Raised when the underlying SQLite storage fails.
 */
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ConstraintError
 * @brief Raised when a write violates a UNIQUE or NOT NULL constraint.
 */
class ConstraintError : public PersistenceError {
public:
    using PersistenceError::PersistenceError;
};

/**
 * @class Statement
 * @brief A prepared SQLite statement, finalized on destruction.
 *
 * Bind indices are 1-based and column indices 0-based, as in the SQLite C API.
 */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) = delete;

    void bind(int index, double value);
    void bind(int index, std::int64_t value);
    void bind(int index, const std::string& value);

    /**
     * @brief Advances the statement.
     * @return True if a result row is available, false when done.
     * @throw ConstraintError on a constraint violation.
     * @throw PersistenceError on any other failure.
     */
    bool step();

    /// @brief Clears bindings and rewinds the statement for reuse.
    void reset();

    double columnDouble(int column) const;
    std::int64_t columnInt64(int column) const;
    std::string columnText(int column) const;

private:
    void check(int rc, const char* what) const;

    sqlite3* db;
    sqlite3_stmt* stmt;
};

/**
 * @class Database
 * @brief Owns a SQLite connection.
 *
 * Use ":memory:" as the path for a private in-memory database.
 */
class Database {
public:
    /**
     * @brief Opens (or creates) the database file.
     * @param path Filesystem path or ":memory:".
     * @throw PersistenceError if the database cannot be opened.
     */
    explicit Database(const std::string& path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /// @brief Runs one or more statements that return no rows.
    void execute(const std::string& sql);

    Statement prepare(const std::string& sql);

    /// @brief Rows modified by the most recent INSERT, UPDATE or DELETE.
    int changes() const;

    std::int64_t lastInsertId() const;

    void beginTransaction();
    void commit();
    void rollback();

    const std::string& path() const { return db_path; }

private:
    std::string db_path;
    sqlite3* db;
};

/**
 * @class Transaction
 * @brief Rolls back on scope exit unless commit() was called.
 */
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db;
    bool committed;
};

#endif // DATABASE_H
