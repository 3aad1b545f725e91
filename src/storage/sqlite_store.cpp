#include <chainwatch/storage/schema.hpp>
#include <chainwatch/storage/sqlite_store.hpp>
#include <chrono>
#include <sqlite3.h>

namespace chainwatch::storage {

    // ===========================================
    // Utility functions
    // ===========================================

    i64 currentTimestamp() {
        return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    Error errorFromCode(int rc, const std::string &context) {
        std::string msg = context + ": " + sqlite3_errstr(rc);
        switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return transient_store(msg);
        default:
            return store_failed(msg);
        }
    }

    // ===========================================
    // Statement implementation
    // ===========================================

    Statement::Statement(SqliteStore &store, const char *sql)
        : store_(store), stmt_(nullptr), failed_(false), rc_(SQLITE_OK) {
        if (!store_.handle()) {
            failed_ = true;
            rc_ = SQLITE_MISUSE;
            return;
        }
        rc_ = sqlite3_prepare_v2(store_.handle(), sql, -1, &stmt_, nullptr);
        if (rc_ != SQLITE_OK) {
            failed_ = true;
            if (stmt_) {
                sqlite3_finalize(stmt_);
                stmt_ = nullptr;
            }
        }
    }

    Statement::~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Error Statement::error() const {
        if (!store_.handle()) {
            return store_failed("Store not open");
        }
        return errorFromCode(rc_, sqlite3_errmsg(store_.handle()));
    }

    Statement &Statement::bind(int index, int value) { return bind(index, static_cast<i64>(value)); }

    Statement &Statement::bind(int index, i64 value) {
        if (ok()) {
            sqlite3_bind_int64(stmt_, index, value);
        }
        return *this;
    }

    Statement &Statement::bind(int index, double value) {
        if (ok()) {
            sqlite3_bind_double(stmt_, index, value);
        }
        return *this;
    }

    Statement &Statement::bind(int index, const std::string &value) {
        if (ok()) {
            sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        }
        return *this;
    }

    Statement &Statement::bind(int index, const std::optional<i64> &value) {
        if (value.has_value()) {
            return bind(index, *value);
        }
        return bindNull(index);
    }

    Statement &Statement::bindNull(int index) {
        if (ok()) {
            sqlite3_bind_null(stmt_, index);
        }
        return *this;
    }

    bool Statement::next() {
        if (!ok())
            return false;

        rc_ = sqlite3_step(stmt_);
        if (rc_ == SQLITE_ROW)
            return true;
        if (rc_ != SQLITE_DONE)
            failed_ = true;
        return false;
    }

    Result<void, Error> Statement::exec() {
        if (!ok())
            return Result<void, Error>::err(error());

        rc_ = sqlite3_step(stmt_);
        if (rc_ != SQLITE_DONE && rc_ != SQLITE_ROW) {
            failed_ = true;
            return Result<void, Error>::err(error());
        }
        return Result<void, Error>::ok();
    }

    i64 Statement::changes() const { return store_.handle() ? sqlite3_changes(store_.handle()) : 0; }

    i64 Statement::columnInt64(int column) const { return sqlite3_column_int64(stmt_, column); }

    double Statement::columnDouble(int column) const { return sqlite3_column_double(stmt_, column); }

    std::string Statement::columnText(int column) const {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    bool Statement::columnIsNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

    // ===========================================
    // SqliteStore implementation
    // ===========================================

    SqliteStore::SqliteStore() : db_(nullptr), is_open_(false) {}

    SqliteStore::~SqliteStore() { close(); }

    SqliteStore::SqliteStore(SqliteStore &&other) noexcept
        : db_(other.db_), db_path_(std::move(other.db_path_)), is_open_(other.is_open_) {
        other.db_ = nullptr;
        other.is_open_ = false;
    }

    SqliteStore &SqliteStore::operator=(SqliteStore &&other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            db_path_ = std::move(other.db_path_);
            is_open_ = other.is_open_;
            other.db_ = nullptr;
            other.is_open_ = false;
        }
        return *this;
    }

    Result<void, Error> SqliteStore::open(const std::string &path, const OpenOptions &opts) {
        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            auto error = errorFromCode(rc, "open " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            is_open_ = false;
            return Result<void, Error>::err(error);
        }

        db_path_ = path;
        is_open_ = true;
        applyPragmas(opts);
        return Result<void, Error>::ok();
    }

    void SqliteStore::close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
            is_open_ = false;
        }
    }

    bool SqliteStore::isOpen() const { return is_open_; }

    void SqliteStore::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts.enable_foreign_keys) {
            sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        // Also installs the busy handler used when several chain tasks write
        sqlite3_busy_timeout(db_, opts.busy_timeout_ms);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts.cache_size_kb) + ";";
        sqlite3_exec(db_, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db_, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    Result<void, Error> SqliteStore::initializeSchema() {
        if (!db_ || !is_open_)
            return Result<void, Error>::err(store_failed("Store not open"));

        auto tx = beginTransaction();
        if (!tx->active())
            return Result<void, Error>::err(tx->beginError());

        auto created = executeSql(schema::SCHEMA_MIGRATIONS_TABLE);
        if (!created.is_ok())
            return created;

        i32 current_version = schemaVersion();

        for (const auto &[version, statements] : schema::migrations()) {
            if (version <= current_version)
                continue;
            for (const char *sql : statements) {
                auto applied = executeSql(sql);
                if (!applied.is_ok())
                    return applied;
            }
            auto recorded = setSchemaVersion(version);
            if (!recorded.is_ok())
                return recorded;
        }

        return tx->commit();
    }

    bool SqliteStore::tableExists(const std::string &table_name) {
        Statement stmt(*this, "SELECT name FROM sqlite_master WHERE type='table' AND name=?");
        stmt.bind(1, table_name);
        return stmt.next();
    }

    i32 SqliteStore::schemaVersion() {
        if (!tableExists("schema_migrations"))
            return 0;

        Statement stmt(*this, "SELECT IFNULL(MAX(version), 0) FROM schema_migrations");
        if (stmt.next()) {
            return static_cast<i32>(stmt.columnInt64(0));
        }
        return 0;
    }

    Result<void, Error> SqliteStore::setSchemaVersion(i32 version) {
        Statement stmt(*this, "INSERT OR REPLACE INTO schema_migrations (version, applied_at) VALUES (?, ?)");
        stmt.bind(1, version).bind(2, currentTimestamp());
        return stmt.exec();
    }

    // ===========================================
    // Transaction Guard
    // ===========================================

    SqliteStore::TxGuard::TxGuard(SqliteStore &store) : store_(store), active_(false), committed_(false) {
        if (!store_.db_) {
            begin_error_ = store_failed("Store not open");
            return;
        }
        // IMMEDIATE takes the write lock up front so contention surfaces here, not mid-block
        int rc = sqlite3_exec(store_.db_, "BEGIN IMMEDIATE TRANSACTION", nullptr, nullptr, nullptr);
        active_ = (rc == SQLITE_OK);
        if (!active_) {
            begin_error_ = errorFromCode(rc, "begin transaction");
        }
    }

    SqliteStore::TxGuard::~TxGuard() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Error SqliteStore::TxGuard::beginError() const {
        return begin_error_.has_value() ? *begin_error_ : store_failed("Transaction not started");
    }

    Result<void, Error> SqliteStore::TxGuard::commit() {
        if (!active_ || committed_)
            return Result<void, Error>::err(beginError());

        int rc = sqlite3_exec(store_.db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            // Destructor rolls back what is left
            return Result<void, Error>::err(errorFromCode(rc, "commit"));
        }
        committed_ = true;
        active_ = false;
        return Result<void, Error>::ok();
    }

    void SqliteStore::TxGuard::rollback() {
        if (active_ && !committed_) {
            sqlite3_exec(store_.db_, "ROLLBACK", nullptr, nullptr, nullptr);
            committed_ = true;
            active_ = false;
        }
    }

    std::unique_ptr<SqliteStore::TxGuard> SqliteStore::beginTransaction() {
        return std::make_unique<TxGuard>(*this);
    }

    // ===========================================
    // Raw SQL access
    // ===========================================

    Result<void, Error> SqliteStore::executeSql(const std::string &sql) {
        if (!db_ || !is_open_)
            return Result<void, Error>::err(store_failed("Store not open"));

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            std::string context = errmsg ? errmsg : "exec";
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return Result<void, Error>::err(errorFromCode(rc, context));
        }

        return Result<void, Error>::ok();
    }

    bool SqliteStore::quickCheck() {
        if (!db_ || !is_open_)
            return false;

        Statement stmt(*this, "PRAGMA quick_check");
        if (stmt.next()) {
            return stmt.columnText(0) == "ok";
        }
        return false;
    }

} // namespace chainwatch::storage
