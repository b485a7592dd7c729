// File: src/storage/sqlite_rule_store.cpp
#include "storage/sqlite_rule_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace profitlift {

namespace {

// Separator for item ids inside a TEXT column
constexpr char kItemSeparator = '\x1f';

std::string EncodeItems(const ItemSet& items) {
    return JoinItems(items, std::string(1, kItemSeparator));
}

ItemSet DecodeItems(const std::string& text) {
    ItemSet items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(kItemSeparator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            items.insert(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return items;
}

/// Owns a prepared statement; finalised on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
        : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw PersistenceError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void BindText(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
    }

    void BindOptionalText(int index, const std::optional<std::string>& value) {
        if (value) {
            BindText(index, *value);
        } else {
            Check(sqlite3_bind_null(stmt_, index));
        }
    }

    void BindDouble(int index, double value) {
        Check(sqlite3_bind_double(stmt_, index, value));
    }

    void BindOptionalDouble(int index, const std::optional<double>& value) {
        if (value) {
            BindDouble(index, *value);
        } else {
            Check(sqlite3_bind_null(stmt_, index));
        }
    }

    void BindInt64(int index, int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, value));
    }

    void BindOptionalInt(int index, const std::optional<int>& value) {
        if (value) {
            BindInt64(index, *value);
        } else {
            Check(sqlite3_bind_null(stmt_, index));
        }
    }

    /// @return true if a row is available, false when done
    bool Step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw PersistenceError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

    std::string Text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (!text) {
            return "";
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    std::optional<std::string> OptionalText(int col) const {
        if (IsNull(col)) {
            return std::nullopt;
        }
        return Text(col);
    }

    double Double(int col) const { return sqlite3_column_double(stmt_, col); }

    std::optional<double> OptionalDouble(int col) const {
        if (IsNull(col)) {
            return std::nullopt;
        }
        return Double(col);
    }

    int64_t Int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};

    void Check(int rc) {
        if (rc != SQLITE_OK) {
            throw PersistenceError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }
};

constexpr const char* kRuleColumns =
    "signature, context_key, store_id, time_bin, weekday_weekend, quarter, festival_period, "
    "antecedent, consequent, support, confidence, lift, "
    "profit_score, diversity_score, overall_score";

constexpr const char* kUpliftColumns =
    "rule_signature, status, incremental_attach_rate, incremental_revenue, incremental_margin, "
    "control_rate, treatment_rate, control_size, treatment_size, ci_lower, ci_upper, actionable";

// Column order matches kRuleColumns starting at column 2
Context ReadContext(const Statement& stmt) {
    Context context;
    context.store_id = stmt.OptionalText(2);
    context.time_bin = stmt.OptionalText(3);
    context.weekday_weekend = stmt.OptionalText(4);
    if (!stmt.IsNull(5)) {
        context.quarter = static_cast<int>(stmt.Int64(5));
    }
    context.festival_period = stmt.OptionalText(6);
    return context;
}

ContextualRule ReadRule(const Statement& stmt) {
    ContextualRule rule;
    rule.context = ReadContext(stmt);
    rule.antecedent = DecodeItems(stmt.Text(7));
    rule.consequent = DecodeItems(stmt.Text(8));
    rule.support = stmt.Double(9);
    rule.confidence = stmt.Double(10);
    rule.lift = stmt.Double(11);
    rule.profit_score = stmt.OptionalDouble(12);
    rule.diversity_score = stmt.OptionalDouble(13);
    rule.overall_score = stmt.OptionalDouble(14);
    return rule;
}

UpliftResult ReadUplift(const Statement& stmt) {
    UpliftResult result;
    result.rule_signature = stmt.Text(0);
    result.status = ParseUpliftStatus(stmt.Text(1));
    result.incremental_attach_rate = stmt.Double(2);
    result.incremental_revenue = stmt.Double(3);
    result.incremental_margin = stmt.Double(4);
    result.control_rate = stmt.Double(5);
    result.treatment_rate = stmt.Double(6);
    result.control_size = static_cast<size_t>(stmt.Int64(7));
    result.treatment_size = static_cast<size_t>(stmt.Int64(8));
    if (!stmt.IsNull(9) && !stmt.IsNull(10)) {
        result.confidence_interval = std::make_pair(stmt.Double(9), stmt.Double(10));
    }
    result.actionable = stmt.Int64(11) != 0;
    return result;
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteRuleStore::SqliteRuleStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw PersistenceError("Failed to open database " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
    } catch (const PersistenceError&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRuleStore::~SqliteRuleStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements finish
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteRuleStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    CreateTables();
}

void SqliteRuleStore::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS association_rules (
            signature TEXT PRIMARY KEY,
            context_key TEXT NOT NULL,
            store_id TEXT,
            time_bin TEXT,
            weekday_weekend TEXT,
            quarter INTEGER,
            festival_period TEXT,
            antecedent TEXT NOT NULL,
            consequent TEXT NOT NULL,
            support REAL NOT NULL,
            confidence REAL NOT NULL,
            lift REAL NOT NULL,
            profit_score REAL,
            diversity_score REAL,
            overall_score REAL
        );
    )");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS uplift_results (
            rule_signature TEXT PRIMARY KEY,
            status TEXT NOT NULL,
            incremental_attach_rate REAL NOT NULL,
            incremental_revenue REAL NOT NULL,
            incremental_margin REAL NOT NULL,
            control_rate REAL NOT NULL,
            treatment_rate REAL NOT NULL,
            control_size INTEGER NOT NULL,
            treatment_size INTEGER NOT NULL,
            ci_lower REAL,
            ci_upper REAL,
            actionable INTEGER NOT NULL,
            updated_at INTEGER NOT NULL
        );
    )");

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_rules_context ON association_rules(context_key);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_rules_store ON association_rules(store_id);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_rules_time_bin ON association_rules(time_bin);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_rules_score ON association_rules(overall_score);");
}

void SqliteRuleStore::ExecuteSQL(const std::string& sql) const {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw PersistenceError(error + " (while executing: " + sql.substr(0, 60) + ")");
    }
}

// ============================================================================
// Rules
// ============================================================================

void SqliteRuleStore::ReplaceContextRules(const Context& context,
                                          const std::vector<ContextualRule>& rules) {
    for (const auto& rule : rules) {
        if (rule.context != context) {
            throw std::invalid_argument("Rule " + rule.Signature() +
                                        " does not belong to context " + context.ToString());
        }
    }
    std::vector<ContextualRule> merged = MergeDuplicateRules(rules);

    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();
    try {
        Statement remove(db_, "DELETE FROM association_rules WHERE context_key = ?;");
        remove.BindText(1, context.Canonical());
        remove.Step();

        const std::string insert_sql = std::string("INSERT OR REPLACE INTO association_rules (") +
                                       kRuleColumns +
                                       ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        Statement insert(db_, insert_sql.c_str());

        for (const auto& rule : merged) {
            insert.BindText(1, rule.Signature());
            insert.BindText(2, context.Canonical());
            insert.BindOptionalText(3, context.store_id);
            insert.BindOptionalText(4, context.time_bin);
            insert.BindOptionalText(5, context.weekday_weekend);
            insert.BindOptionalInt(6, context.quarter);
            insert.BindOptionalText(7, context.festival_period);
            insert.BindText(8, EncodeItems(rule.antecedent));
            insert.BindText(9, EncodeItems(rule.consequent));
            insert.BindDouble(10, rule.support);
            insert.BindDouble(11, rule.confidence);
            insert.BindDouble(12, rule.lift);
            insert.BindOptionalDouble(13, rule.profit_score);
            insert.BindOptionalDouble(14, rule.diversity_score);
            insert.BindOptionalDouble(15, rule.overall_score);
            insert.Step();
            insert.Reset();
        }

        CommitTransaction();
    } catch (const PersistenceError&) {
        RollbackTransaction();
        throw;
    }
}

std::vector<ContextualRule> SqliteRuleStore::QueryRules(const RuleQuery& query) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kRuleColumns +
        " FROM association_rules"
        " WHERE (?1 IS NULL OR store_id = ?1)"
        "   AND (?2 IS NULL OR time_bin = ?2)"
        "   AND (?3 IS NULL OR overall_score >= ?3)"
        " ORDER BY overall_score IS NULL, overall_score DESC, signature ASC"
        " LIMIT ?4;";

    Statement stmt(db_, sql.c_str());
    stmt.BindOptionalText(1, query.store_id);
    stmt.BindOptionalText(2, query.time_bin);
    stmt.BindOptionalDouble(3, query.min_score);
    stmt.BindInt64(4, query.limit > 0 ? static_cast<int64_t>(query.limit) : -1);

    std::vector<ContextualRule> rules;
    while (stmt.Step()) {
        rules.push_back(ReadRule(stmt));
    }
    return rules;
}

std::vector<ContextualRule> SqliteRuleStore::GetContextRules(const Context& context) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kRuleColumns +
        " FROM association_rules WHERE context_key = ?"
        " ORDER BY overall_score IS NULL, overall_score DESC, signature ASC;";

    Statement stmt(db_, sql.c_str());
    stmt.BindText(1, context.Canonical());

    std::vector<ContextualRule> rules;
    while (stmt.Step()) {
        rules.push_back(ReadRule(stmt));
    }
    return rules;
}

std::vector<Context> SqliteRuleStore::ListContexts() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT MIN(signature), context_key, store_id, time_bin, weekday_weekend, quarter, "
        "festival_period FROM association_rules GROUP BY context_key;");

    std::vector<Context> contexts;
    while (stmt.Step()) {
        contexts.push_back(ReadContext(stmt));
    }
    std::sort(contexts.begin(), contexts.end());
    return contexts;
}

size_t SqliteRuleStore::CountUnlocked(const char* table) const {
    Statement stmt(db_, (std::string("SELECT COUNT(*) FROM ") + table + ";").c_str());
    if (!stmt.Step()) {
        return 0;
    }
    return static_cast<size_t>(stmt.Int64(0));
}

size_t SqliteRuleStore::RuleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountUnlocked("association_rules");
}

// ============================================================================
// Uplift
// ============================================================================

void SqliteRuleStore::StoreUplift(const UpliftResult& result) {
    if (result.rule_signature.empty()) {
        throw std::invalid_argument("UpliftResult has an empty rule signature");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("INSERT OR REPLACE INTO uplift_results (") +
                            kUpliftColumns +
                            ", updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, "
                            "CAST(strftime('%s', 'now') AS INTEGER));";

    Statement stmt(db_, sql.c_str());
    stmt.BindText(1, result.rule_signature);
    stmt.BindText(2, ToString(result.status));
    stmt.BindDouble(3, result.incremental_attach_rate);
    stmt.BindDouble(4, result.incremental_revenue);
    stmt.BindDouble(5, result.incremental_margin);
    stmt.BindDouble(6, result.control_rate);
    stmt.BindDouble(7, result.treatment_rate);
    stmt.BindInt64(8, static_cast<int64_t>(result.control_size));
    stmt.BindInt64(9, static_cast<int64_t>(result.treatment_size));
    if (result.confidence_interval) {
        stmt.BindDouble(10, result.confidence_interval->first);
        stmt.BindDouble(11, result.confidence_interval->second);
    } else {
        stmt.BindOptionalDouble(10, std::nullopt);
        stmt.BindOptionalDouble(11, std::nullopt);
    }
    stmt.BindInt64(12, result.actionable ? 1 : 0);
    stmt.Step();
}

std::optional<UpliftResult> SqliteRuleStore::GetUplift(const std::string& rule_signature) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kUpliftColumns +
                            " FROM uplift_results WHERE rule_signature = ?;";
    Statement stmt(db_, sql.c_str());
    stmt.BindText(1, rule_signature);

    if (!stmt.Step()) {
        return std::nullopt;
    }
    return ReadUplift(stmt);
}

std::vector<UpliftResult> SqliteRuleStore::ListUplifts() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string sql = std::string("SELECT ") + kUpliftColumns +
                            " FROM uplift_results ORDER BY rule_signature ASC;";
    Statement stmt(db_, sql.c_str());

    std::vector<UpliftResult> results;
    while (stmt.Step()) {
        results.push_back(ReadUplift(stmt));
    }
    return results;
}

size_t SqliteRuleStore::UpliftCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CountUnlocked("uplift_results");
}

// ============================================================================
// Maintenance
// ============================================================================

RuleStoreStats SqliteRuleStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RuleStoreStats stats;
    stats.total_rules = CountUnlocked("association_rules");
    stats.total_uplifts = CountUnlocked("uplift_results");

    Statement stmt(db_, "SELECT COUNT(DISTINCT context_key) FROM association_rules;");
    if (stmt.Step()) {
        stats.context_count = static_cast<size_t>(stmt.Int64(0));
    }
    stats.disk_usage_bytes = GetDatabaseSize();
    return stats;
}

void SqliteRuleStore::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

void SqliteRuleStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();
    try {
        ExecuteSQL("DELETE FROM association_rules;");
        ExecuteSQL("DELETE FROM uplift_results;");
        CommitTransaction();
    } catch (const PersistenceError&) {
        RollbackTransaction();
        throw;
    }
}

// ============================================================================
// Snapshot
// ============================================================================

bool SqliteRuleStore::CreateSnapshot(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }

    sqlite3* backup_db = nullptr;
    int rc = sqlite3_open(path.c_str(), &backup_db);
    if (rc != SQLITE_OK) {
        sqlite3_close(backup_db);
        return false;
    }

    sqlite3_backup* backup = sqlite3_backup_init(backup_db, "main", db_, "main");
    if (!backup) {
        sqlite3_close(backup_db);
        return false;
    }

    rc = sqlite3_backup_step(backup, -1);  // Copy all pages
    int finish_rc = sqlite3_backup_finish(backup);
    sqlite3_close(backup_db);

    return rc == SQLITE_DONE && finish_rc == SQLITE_OK;
}

// ============================================================================
// Helper Methods
// ============================================================================

size_t SqliteRuleStore::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

void SqliteRuleStore::BeginTransaction() {
    ExecuteSQL("BEGIN IMMEDIATE TRANSACTION;");
}

void SqliteRuleStore::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void SqliteRuleStore::RollbackTransaction() noexcept {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
}

} // namespace profitlift
