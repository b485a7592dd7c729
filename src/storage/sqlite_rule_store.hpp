// File: src/storage/sqlite_rule_store.hpp
#pragma once

#include "storage/rule_store.hpp"
#include <mutex>
#include <sqlite3.h>
#include <string>

namespace profitlift {

/// Persistent rule and uplift storage using SQLite
///
/// Tables:
///   association_rules  one row per rule, primary key = signature
///   uplift_results     one row per estimated rule, primary key = signature
///
/// Context replacement runs in a single transaction (DELETE + INSERT), so
/// readers never see a half-replaced context. Uplift rows are independent
/// of rule rows and survive replacement.
///
/// Every SQLite failure is raised as PersistenceError.
class SqliteRuleStore : public RuleStore {
public:
    /// Configuration for SqliteRuleStore
    struct Config {
        Config() = default;

        /// Path to the SQLite database file (":memory:" for a private
        /// in-memory database)
        std::string db_path{"profitlift.db"};

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Open (and create if needed) the database
    /// @throws PersistenceError if the database cannot be opened or
    ///         initialised
    explicit SqliteRuleStore(const Config& config);

    /// Destructor - closes database connection
    ~SqliteRuleStore() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteRuleStore(const SqliteRuleStore&) = delete;
    SqliteRuleStore& operator=(const SqliteRuleStore&) = delete;

    // ========================================================================
    // RuleStore Interface Implementation
    // ========================================================================

    void ReplaceContextRules(const Context& context,
                             const std::vector<ContextualRule>& rules) override;
    std::vector<ContextualRule> QueryRules(const RuleQuery& query) const override;
    std::vector<ContextualRule> GetContextRules(const Context& context) const override;
    std::vector<Context> ListContexts() const override;
    size_t RuleCount() const override;

    void StoreUplift(const UpliftResult& result) override;
    std::optional<UpliftResult> GetUplift(const std::string& rule_signature) const override;
    std::vector<UpliftResult> ListUplifts() const override;
    size_t UpliftCount() const override;

    RuleStoreStats GetStats() const override;
    void Flush() override;
    void Clear() override;

    /// Copy the whole database to `path` with the SQLite backup API
    /// @return true on success
    bool CreateSnapshot(const std::string& path);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // Serialises all access to the connection
    mutable std::mutex mutex_;

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Set pragmas and create the schema
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute SQL without results
    /// @throws PersistenceError on failure
    void ExecuteSQL(const std::string& sql) const;

    /// Count rows of a table; mutex must be held
    size_t CountUnlocked(const char* table) const;

    size_t GetDatabaseSize() const;

    void BeginTransaction();
    void CommitTransaction();

    /// Roll back without throwing; used while unwinding a failed write
    void RollbackTransaction() noexcept;
};

} // namespace profitlift
