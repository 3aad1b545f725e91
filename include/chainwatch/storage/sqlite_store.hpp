#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "chainwatch/common/error.hpp"

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace chainwatch::storage {

    using namespace datapod;

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        i32 busy_timeout_ms = 5000;
        i32 cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    class SqliteStore;

    // ===========================================
    // Statement - prepared statement owner
    // ===========================================

    /// Prepared statement bound to one connection; finalized on destruction.
    /// Bind indexes are 1-based, column indexes 0-based, as in the C API.
    class Statement {
      public:
        Statement(SqliteStore &store, const char *sql);
        ~Statement();

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        /// False when preparation failed; error() explains why
        bool ok() const { return stmt_ != nullptr && !failed_; }
        Error error() const;

        Statement &bind(int index, int value);
        Statement &bind(int index, i64 value);
        Statement &bind(int index, double value);
        Statement &bind(int index, const std::string &value);
        Statement &bind(int index, const std::optional<i64> &value);
        Statement &bindNull(int index);

        /// Step to the next row. Returns false when done or failed; check ok() to tell them apart
        bool next();

        /// Run a statement that returns no rows
        Result<void, Error> exec();

        /// Rows changed by the last exec()
        i64 changes() const;

        i64 columnInt64(int column) const;
        double columnDouble(int column) const;
        std::string columnText(int column) const;
        bool columnIsNull(int column) const;

      private:
        SqliteStore &store_;
        sqlite3_stmt *stmt_;
        bool failed_;
        int rc_;
    };

    // ===========================================
    // SqliteStore - connection and schema owner
    // ===========================================

    class SqliteStore {
      public:
        SqliteStore();
        ~SqliteStore();

        // Non-copyable, movable
        SqliteStore(const SqliteStore &) = delete;
        SqliteStore &operator=(const SqliteStore &) = delete;
        SqliteStore(SqliteStore &&) noexcept;
        SqliteStore &operator=(SqliteStore &&) noexcept;

        /// Open or create database at given path
        Result<void, Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close database connection
        void close();

        bool isOpen() const;

        const std::string &path() const { return db_path_; }

        /// Create or migrate all indexer tables. Idempotent.
        Result<void, Error> initializeSchema();

        /// Highest applied schema migration, 0 when none
        i32 schemaVersion();

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            explicit TxGuard(SqliteStore &store);
            ~TxGuard();

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            /// False when BEGIN failed (e.g. database busy)
            bool active() const { return active_; }
            Error beginError() const;

            Result<void, Error> commit();
            void rollback();

          private:
            SqliteStore &store_;
            bool active_;
            bool committed_;
            std::optional<Error> begin_error_;
        };

        std::unique_ptr<TxGuard> beginTransaction();

        // ===========================================
        // Raw SQL access
        // ===========================================

        /// Execute one or more statements without parameters
        Result<void, Error> executeSql(const std::string &sql);

        /// Run SQLite quick check
        bool quickCheck();

        sqlite3 *handle() const { return db_; }

      private:
        sqlite3 *db_;
        std::string db_path_;
        bool is_open_;

        void applyPragmas(const OpenOptions &opts);
        bool tableExists(const std::string &table_name);
        Result<void, Error> setSchemaVersion(i32 version);
    };

    /// Map an SQLite result code to the indexer error taxonomy
    Error errorFromCode(int rc, const std::string &context);

    /// Get current Unix timestamp in seconds
    i64 currentTimestamp();

} // namespace chainwatch::storage
