#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp

#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data
{

    namespace
    {
        std::string columnText(sqlite3_stmt* stmt, int column)
        {
            const unsigned char* text = sqlite3_column_text(stmt, column);
            return text ? reinterpret_cast<const char*>(text) : std::string();
        }
    } // anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // Usually an unfinalized statement
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS price_bars (
            pair TEXT NOT NULL,     -- "EUR/USD"
            interval TEXT NOT NULL, -- "daily", "5min", ...
            ts TEXT NOT NULL,       -- ISO 8601 UTC
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            PRIMARY KEY (pair, interval, ts)
        );
    )";

        const std::string create_transactions_sql = R"(
        CREATE TABLE IF NOT EXISTS transactions (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            pair TEXT NOT NULL,
            side TEXT NOT NULL,  -- "Buy" / "Sell"
            amount REAL NOT NULL,
            price REAL NOT NULL,
            ts TEXT NOT NULL,
            realized_pnl REAL    -- NULL for acquisitions
        );
    )";

        const std::string create_meta_sql = R"(
        CREATE TABLE IF NOT EXISTS portfolio_meta (
            id INTEGER PRIMARY KEY CHECK (id = 1),
            initial_amount REAL NOT NULL,
            currency TEXT NOT NULL
        );
    )";

        bool success = true;
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_transactions_sql);
        success &= executeSQL(create_meta_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::PriceBar> &bars,
                                   const core::CurrencyPair &pair,
                                   const std::string &interval)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            return true; // Nothing to do
        }

        const std::string symbol = pair.symbol();
        const char *sql = R"(
INSERT OR IGNORE INTO price_bars
(pair, interval, ts, open, high, low, close)
VALUES (?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            const std::string timestamp_str = core::utils::timestampToString(bar.timestamp);
            sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize the statement BEFORE commit/rollback
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT bars for {} ({}).", symbol, interval);
                executeSQL("ROLLBACK;");
                return false;
            }
            logger->debug("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
        }
        else
        {
            if (!executeSQL("ROLLBACK;"))
            {
                logger->error("Failed to ROLLBACK bars for {} ({}).", symbol, interval);
            }
            logger->warn("Transaction rolled back due to error during bar save for {} ({}).", symbol, interval);
        }
        return success;
    }

    core::TimeSeries<core::PriceBar> DatabaseManager::queryBars(
        const core::CurrencyPair &pair,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        core::TimeSeries<core::PriceBar> bars;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot query bars: Not connected to database.");
            return bars;
        }

        const std::string symbol = pair.symbol();
        const std::string start_str = core::utils::timestampToString(start_time);
        const std::string end_str = core::utils::timestampToString(end_time);

        // ISO 8601 UTC strings order the same way as the instants they encode
        const char* sql = R"(
            SELECT ts, open, high, low, close
            FROM price_bars
            WHERE pair = ? AND interval = ? AND ts >= ? AND ts <= ?
            ORDER BY ts ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare bar query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return bars;
        }

        sqlite3_bind_text(stmt, 1, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            const std::string ts = columnText(stmt, 0);
            if (ts.empty()) {
                logger->warn("NULL timestamp in price_bars for {} ({}), skipping row.", symbol, interval);
                continue;
            }
            try {
                core::PriceBar bar;
                bar.timestamp = core::utils::stringToTimestamp(ts);
                bar.open = sqlite3_column_double(stmt, 1);
                bar.high = sqlite3_column_double(stmt, 2);
                bar.low = sqlite3_column_double(stmt, 3);
                bar.close = sqlite3_column_double(stmt, 4);
                bars.push_back(bar);
            } catch (const std::runtime_error& e) {
                logger->error("Skipping bar row with bad timestamp '{}': {}", ts, e.what());
            }
        }

        if (rc != SQLITE_DONE) {
            logger->error("Error stepping through bar query results [{}]: {}", rc, sqlite3_errmsg(db_));
        } else {
            logger->debug("Loaded {} bars for {} ({}).", bars.size(), symbol, interval);
        }

        sqlite3_finalize(stmt);
        return bars;
    }

    bool DatabaseManager::savePortfolioMeta(const PortfolioMeta &meta)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot save portfolio meta: Not connected to database.");
            return false;
        }

        const char* sql = "INSERT OR REPLACE INTO portfolio_meta (id, initial_amount, currency) VALUES (1, ?, ?);";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare portfolio meta insert [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }
        sqlite3_bind_double(stmt, 1, meta.initial_amount);
        sqlite3_bind_text(stmt, 2, meta.currency.c_str(), -1, SQLITE_TRANSIENT);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            logger->error("Failed to save portfolio meta [{}]: {}", rc, sqlite3_errmsg(db_));
            return false;
        }
        return true;
    }

    std::optional<PortfolioMeta> DatabaseManager::loadPortfolioMeta()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot load portfolio meta: Not connected to database.");
            return std::nullopt;
        }

        const char* sql = "SELECT initial_amount, currency FROM portfolio_meta WHERE id = 1;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare portfolio meta query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return std::nullopt;
        }

        std::optional<PortfolioMeta> meta;
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            meta = PortfolioMeta{sqlite3_column_double(stmt, 0), columnText(stmt, 1)};
        } else if (rc != SQLITE_DONE) {
            logger->error("Failed to read portfolio meta [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        return meta;
    }

    bool DatabaseManager::saveTransaction(const core::Transaction &transaction)
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot save transaction: Not connected to database.");
            return false;
        }

        const char* sql = R"(
INSERT INTO transactions (id, pair, side, amount, price, ts, realized_pnl)
VALUES (?, ?, ?, ?, ?, ?, ?);
)";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare transaction insert [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        const std::string symbol = transaction.pair.symbol();
        const std::string side = core::utils::toString(transaction.side);
        const std::string ts = core::utils::timestampToString(transaction.timestamp);
        sqlite3_bind_text(stmt, 1, transaction.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, symbol.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, side.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 4, transaction.amount);
        sqlite3_bind_double(stmt, 5, transaction.price);
        sqlite3_bind_text(stmt, 6, ts.c_str(), -1, SQLITE_TRANSIENT);
        if (transaction.realized_pnl) {
            sqlite3_bind_double(stmt, 7, *transaction.realized_pnl);
        } else {
            sqlite3_bind_null(stmt, 7);
        }

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            logger->error("Failed to save transaction {} [{}]: {}", transaction.id, rc, sqlite3_errmsg(db_));
            return false;
        }
        logger->debug("Persisted transaction {}", transaction.id);
        return true;
    }

    std::vector<core::Transaction> DatabaseManager::loadTransactions()
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::vector<core::Transaction> transactions;
        auto logger = core::logging::getLogger();
        if (!isConnected()) {
            logger->error("Cannot load transactions: Not connected to database.");
            return transactions;
        }

        const char* sql = "SELECT id, pair, side, amount, price, ts, realized_pnl FROM transactions ORDER BY seq ASC;";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            logger->error("Failed to prepare transaction query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return transactions;
        }

        try {
            while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
                core::Transaction tx;
                tx.id = columnText(stmt, 0);
                tx.pair = core::utils::parsePair(columnText(stmt, 1));
                tx.side = core::utils::tradeSideFromString(columnText(stmt, 2));
                tx.amount = sqlite3_column_double(stmt, 3);
                tx.price = sqlite3_column_double(stmt, 4);
                tx.timestamp = core::utils::stringToTimestamp(columnText(stmt, 5));
                if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
                    tx.realized_pnl = sqlite3_column_double(stmt, 6);
                }
                transactions.push_back(tx);
            }
        } catch (const std::exception& e) {
            sqlite3_finalize(stmt);
            throw core::DatabaseException(fmt::format("Malformed transaction row after {} rows: {}",
                                                      transactions.size(), e.what()));
        }

        if (rc != SQLITE_DONE) {
            logger->error("Error stepping through transaction rows [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        sqlite3_finalize(stmt);
        logger->info("Loaded {} transactions from {}", transactions.size(), database_path_);
        return transactions;
    }

} // namespace data
