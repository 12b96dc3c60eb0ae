#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

// Initial state of a persisted portfolio; replaying the stored transactions on
// top of it rebuilds the ledger
struct PortfolioMeta {
    double initial_amount = 0.0;
    std::string currency;
};

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates price_bars, transactions and portfolio_meta if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // --- Price bars ---
    // Duplicates (same pair, interval, timestamp) are ignored
    bool saveBars(const core::TimeSeries<core::PriceBar>& bars,
                  const core::CurrencyPair& pair,
                  const std::string& interval);

    core::TimeSeries<core::PriceBar> queryBars(const core::CurrencyPair& pair,
                                               const std::string& interval,
                                               core::Timestamp start_time,
                                               core::Timestamp end_time);

    // --- Portfolio ---
    bool savePortfolioMeta(const PortfolioMeta& meta);
    std::optional<PortfolioMeta> loadPortfolioMeta();

    // Appends to the log. Fails on a duplicate id.
    bool saveTransaction(const core::Transaction& transaction);
    // In insertion order. Throws core::DatabaseException on malformed rows.
    std::vector<core::Transaction> loadTransactions();

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;
    std::recursive_mutex mutex_; // executeSQL is re-entered inside save transactions
};

} // namespace data
