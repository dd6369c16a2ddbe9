#include "agentlink/sqlite_ledger.hpp"
#include "agentlink/in_memory_ledger.hpp"
#include "agentlink/json_util.hpp"
#include "agentlink/log.hpp"
#include <sqlite3.h>
#include <chrono>

namespace agentlink {

namespace {

// Finalizes a prepared statement when leaving scope.
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() { if (stmt) sqlite3_finalize(stmt); }
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

} // namespace

struct SqliteLedger::Impl {
    sqlite3* db = nullptr;

    ~Impl() {
        if (db) sqlite3_close(db);
    }

    bool exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            log::error("SqliteLedger", std::string("SQLite error: ") + (err ? err : "unknown"));
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    void prepare(Statement& st, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
            throw LedgerError(std::string("STORAGE_ERROR: ") + sqlite3_errmsg(db));
        }
    }

    // Rolls back unless commit() was called.
    struct Transaction {
        Impl& impl;
        bool done = false;

        explicit Transaction(Impl& i) : impl(i) {
            if (!impl.exec("BEGIN IMMEDIATE"))
                throw LedgerError("STORAGE_ERROR: cannot begin transaction");
        }
        ~Transaction() {
            if (!done) impl.exec("ROLLBACK");
        }
        void commit() {
            if (!impl.exec("COMMIT"))
                throw LedgerError("STORAGE_ERROR: commit failed");
            done = true;
        }
    };
};

SqliteLedger::SqliteLedger(const std::string& operator_id, uint64_t first_topic_number)
    : impl_(std::make_unique<Impl>())
    , operator_id_(operator_id)
    , first_topic_number_(first_topic_number) {}

SqliteLedger::~SqliteLedger() = default;

bool SqliteLedger::initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (sqlite3_open(db_path.c_str(), &impl_->db) != SQLITE_OK) {
        log::error("SqliteLedger", std::string("Cannot open database: ") + sqlite3_errmsg(impl_->db));
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    log::info("SqliteLedger", "Opened database at: " + db_path);

    impl_->exec("PRAGMA journal_mode=WAL");

    const char* create_tables_sql = R"(
        CREATE TABLE IF NOT EXISTS topics (
            num INTEGER PRIMARY KEY AUTOINCREMENT,
            topic_id TEXT UNIQUE,
            memo TEXT NOT NULL,
            admin_key TEXT,
            submit_key TEXT,
            last_sequence INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS messages (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            topic_id TEXT NOT NULL,
            sequence_number INTEGER NOT NULL,
            payload BLOB NOT NULL,
            transaction_memo TEXT NOT NULL,
            transaction_id TEXT NOT NULL,
            consensus_at INTEGER NOT NULL,

            UNIQUE(topic_id, sequence_number)
        );

        CREATE INDEX IF NOT EXISTS idx_messages_topic ON messages(topic_id);
    )";

    if (!impl_->exec(create_tables_sql)) {
        return false;
    }
    return true;
}

bool SqliteLedger::configured() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return impl_->db != nullptr && !operator_id_.empty();
}

std::string SqliteLedger::create_topic(const std::string& memo,
                                       const std::optional<KeyPolicy>& admin_key,
                                       const std::optional<KeyPolicy>& submit_key) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) throw LedgerError("STORAGE_ERROR: database not open");

    Impl::Transaction tx(*impl_);

    Statement insert;
    impl_->prepare(insert, R"(
        INSERT INTO topics (memo, admin_key, submit_key, created_at)
        VALUES (?, ?, ?, ?)
    )");

    std::string admin_json = admin_key ? write_json(admin_key->to_json()) : std::string();
    std::string submit_json = submit_key ? write_json(submit_key->to_json()) : std::string();
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_bind_text(insert.stmt, 1, memo.c_str(), -1, SQLITE_STATIC);
    if (admin_key) sqlite3_bind_text(insert.stmt, 2, admin_json.c_str(), -1, SQLITE_STATIC);
    else sqlite3_bind_null(insert.stmt, 2);
    if (submit_key) sqlite3_bind_text(insert.stmt, 3, submit_json.c_str(), -1, SQLITE_STATIC);
    else sqlite3_bind_null(insert.stmt, 3);
    sqlite3_bind_int64(insert.stmt, 4, now);

    if (sqlite3_step(insert.stmt) != SQLITE_DONE) {
        throw LedgerError(std::string("STORAGE_ERROR: ") + sqlite3_errmsg(impl_->db));
    }

    sqlite3_int64 num = sqlite3_last_insert_rowid(impl_->db);
    std::string topic_id = "0.0." + std::to_string(first_topic_number_ + static_cast<uint64_t>(num) - 1);

    Statement update;
    impl_->prepare(update, "UPDATE topics SET topic_id = ? WHERE num = ?");
    sqlite3_bind_text(update.stmt, 1, topic_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(update.stmt, 2, num);
    if (sqlite3_step(update.stmt) != SQLITE_DONE) {
        throw LedgerError(std::string("STORAGE_ERROR: ") + sqlite3_errmsg(impl_->db));
    }

    tx.commit();
    log::debug("SqliteLedger", "Created topic " + topic_id + " memo=" + memo);
    return topic_id;
}

SubmitReceipt SqliteLedger::submit_message(const std::string& topic_id,
                                           const std::vector<uint8_t>& payload,
                                           const std::string& transaction_memo) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) throw LedgerError("STORAGE_ERROR: database not open");

    Impl::Transaction tx(*impl_);

    Statement bump;
    impl_->prepare(bump, "UPDATE topics SET last_sequence = last_sequence + 1 WHERE topic_id = ?");
    sqlite3_bind_text(bump.stmt, 1, topic_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(bump.stmt) != SQLITE_DONE) {
        throw LedgerError(std::string("STORAGE_ERROR: ") + sqlite3_errmsg(impl_->db));
    }
    if (sqlite3_changes(impl_->db) == 0) {
        throw LedgerError("INVALID_TOPIC_ID");
    }

    Statement select;
    impl_->prepare(select, "SELECT last_sequence FROM topics WHERE topic_id = ?");
    sqlite3_bind_text(select.stmt, 1, topic_id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(select.stmt) != SQLITE_ROW) {
        throw LedgerError("INVALID_TOPIC_ID");
    }

    SubmitReceipt receipt;
    receipt.sequence_number = static_cast<uint64_t>(sqlite3_column_int64(select.stmt, 0));
    receipt.transaction_id = make_transaction_id(operator_id_);

    Statement insert;
    impl_->prepare(insert, R"(
        INSERT INTO messages
        (topic_id, sequence_number, payload, transaction_memo, transaction_id, consensus_at)
        VALUES (?, ?, ?, ?, ?, ?)
    )");

    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_bind_text(insert.stmt, 1, topic_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(insert.stmt, 2, static_cast<sqlite3_int64>(receipt.sequence_number));
    if (payload.empty()) sqlite3_bind_zeroblob(insert.stmt, 3, 0);
    else sqlite3_bind_blob(insert.stmt, 3, payload.data(), static_cast<int>(payload.size()), SQLITE_STATIC);
    sqlite3_bind_text(insert.stmt, 4, transaction_memo.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(insert.stmt, 5, receipt.transaction_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(insert.stmt, 6, now);

    if (sqlite3_step(insert.stmt) != SQLITE_DONE) {
        throw LedgerError(std::string("STORAGE_ERROR: ") + sqlite3_errmsg(impl_->db));
    }

    tx.commit();
    return receipt;
}

std::optional<SqliteLedger::TopicInfo> SqliteLedger::topic_info(const std::string& topic_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) return std::nullopt;

    Statement st;
    const char* sql = R"(
        SELECT topic_id, memo, admin_key, submit_key, last_sequence
        FROM topics WHERE topic_id = ?
    )";
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &st.stmt, nullptr) != SQLITE_OK) {
        log::error("SqliteLedger", std::string("Failed to prepare query: ") + sqlite3_errmsg(impl_->db));
        return std::nullopt;
    }
    sqlite3_bind_text(st.stmt, 1, topic_id.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(st.stmt) != SQLITE_ROW) return std::nullopt;

    TopicInfo info;
    info.topic_id = column_text(st.stmt, 0);
    info.memo = column_text(st.stmt, 1);
    info.admin_key = column_text(st.stmt, 2);
    info.submit_key = column_text(st.stmt, 3);
    info.last_sequence_number = static_cast<uint64_t>(sqlite3_column_int64(st.stmt, 4));
    return info;
}

SqliteLedger::Stats SqliteLedger::get_stats() const {
    Stats stats = {0, 0};
    std::lock_guard<std::mutex> lk(mutex_);
    if (!impl_->db) return stats;

    const char* sql = R"(
        SELECT
            (SELECT COUNT(*) FROM topics) AS topic_count,
            (SELECT COUNT(*) FROM messages) AS message_count
    )";

    Statement st;
    if (sqlite3_prepare_v2(impl_->db, sql, -1, &st.stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(st.stmt) == SQLITE_ROW) {
            stats.topic_count = sqlite3_column_int(st.stmt, 0);
            stats.message_count = sqlite3_column_int(st.stmt, 1);
        }
    }
    return stats;
}

} // namespace agentlink
