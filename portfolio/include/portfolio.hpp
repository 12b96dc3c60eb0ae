// portfolio/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <memory>
#include <optional>

#include "datatypes.hpp" // Provides core::Transaction, core::Position, core::Quote
#include "logging.hpp"   // Needed by PortfolioSnapshot::logSummary

namespace portfolio {

    // --- Per-pair breakdown ---
    struct PairBreakdown {
        core::CurrencyPair pair;
        std::string foreign_currency;
        double foreign_amount = 0.0;       // Units of the foreign currency held
        double cost_basis = 0.0;           // Portfolio currency committed to the open position
        double average_entry_price = 0.0;  // Quote per base
        double mark_price = 0.0;           // Last marked mid (entry price when never marked)
        double market_value = 0.0;         // In the portfolio currency
        double unrealized_pnl = 0.0;
        double realized_pnl = 0.0;         // Closed portions, lifetime
    };

    // --- Snapshot Struct ---
    struct PortfolioSnapshot {
        std::string currency;
        double initial_value = 0.0;
        double cash_balance = 0.0;
        double positions_value = 0.0;
        double total_value = 0.0;    // cash_balance + positions_value
        double realized_pnl = 0.0;
        double unrealized_pnl = 0.0;
        double total_pnl = 0.0;      // total_value - initial_value
        double return_pct = 0.0;     // total_pnl / initial_value * 100
        std::size_t transaction_count = 0;
        std::size_t open_positions = 0;
        std::vector<PairBreakdown> pairs;

        void logSummary() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Portfolio Snapshot ({}) ---", currency);
            logger->info("Total Value: {:.2f} (initial {:.2f}, return {:.2f}%)", total_value, initial_value, return_pct);
            logger->info("Cash: {:.2f}, Positions: {:.2f} in {} open", cash_balance, positions_value, open_positions);
            logger->info("Realized PnL: {:.2f}, Unrealized PnL: {:.2f}", realized_pnl, unrealized_pnl);
            for (const auto& p : pairs) {
                logger->info("  {}: {:.4f} {} @ {:.5f} (mark {:.5f}) value {:.2f} uPnL {:.2f} rPnL {:.2f}",
                             p.pair.symbol(), p.foreign_amount, p.foreign_currency, p.average_entry_price,
                             p.mark_price, p.market_value, p.unrealized_pnl, p.realized_pnl);
            }
            logger->info("Transactions: {}", transaction_count);
            logger->info("------------------------------");
        }
    };

    // --- Portfolio Ledger ---
    // Cash is held in the portfolio currency. Every tracked pair must involve
    // that currency; its other side is the foreign currency a position holds.
    // A transaction's amount is portfolio currency, its price quote per base.
    class Portfolio {
    public:
        // Throws core::ConfigException if the amount is not positive or the currency code is malformed
        Portfolio(double initial_amount, const std::string& currency);

        Portfolio(const Portfolio&) = delete;
        Portfolio& operator=(const Portfolio&) = delete;

        // Rebuilds a ledger from a transaction log
        static std::unique_ptr<Portfolio> replay(double initial_amount,
                                                 const std::string& currency,
                                                 const std::vector<core::Transaction>& transactions);

        // --- Modifiers ---
        // Validates and appends. Returns the stored transaction, including realized_pnl
        // on disposals. Throws InsufficientFunds/InsufficientHoldings/InvalidTransaction.
        core::Transaction apply(const core::Transaction& transaction);

        // Records the quote mid as the pair's mark price for unrealized P&L
        void markToMarket(const core::CurrencyPair& pair, const core::Quote& quote);

        // Unique sequential id ("TX-000001", ...)
        std::string nextTransactionId();

        // --- Getters ---
        PortfolioSnapshot snapshot() const;
        double getCash() const;
        double getInitialValue() const { return initial_value_; }
        const std::string& getCurrency() const { return currency_; }
        std::optional<core::Position> getPosition(const core::CurrencyPair& pair) const;
        std::vector<core::Position> getPositions() const;
        std::vector<core::Transaction> getTransactions() const;

        // Foreign currency units held for the pair (0 when flat)
        double foreignAmount(const core::Position& position) const;
        // Portfolio currency committed to the position
        double costBasis(const core::Position& position) const;
        // Value of the position in the portfolio currency at the given rate
        double marketValue(const core::Position& position, double price) const;

    private:
        void validate(const core::Transaction& transaction) const;
        bool currencyIsBase(const core::CurrencyPair& pair) const { return pair.base == currency_; }

        const double initial_value_;
        const std::string currency_;
        double cash_;
        std::map<core::CurrencyPair, core::Position> positions_;
        std::map<core::CurrencyPair, double> mark_prices_;
        std::map<core::CurrencyPair, double> realized_by_pair_;
        std::vector<core::Transaction> transactions_;
        std::set<std::string> transaction_ids_;
        unsigned long id_counter_ = 0;
        mutable std::mutex mutex_;
    };

} // namespace portfolio
