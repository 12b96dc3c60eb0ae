#include "portfolio.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace portfolio {

    namespace {
        // Relative tolerance for treating a disposal as closing the whole position
        constexpr double kCloseTolerance = 1e-9;

        // Parses the sequence number of ids issued by nextTransactionId(); "TX-" then digits only
        std::optional<unsigned long> sequenceOf(const std::string& id) {
            if (id.rfind("TX-", 0) != 0) {
                return std::nullopt;
            }
            const std::string digits = id.substr(3);
            if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                               [](unsigned char c) { return std::isdigit(c) != 0; })) {
                return std::nullopt;
            }
            try {
                return std::stoul(digits);
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
    } // anonymous namespace

    Portfolio::Portfolio(double initial_amount, const std::string& currency)
        : initial_value_(initial_amount), currency_(currency), cash_(initial_amount) {
        if (!(initial_amount > 0.0) || !std::isfinite(initial_amount)) {
            throw core::ConfigException(fmt::format("Initial amount must be positive, got {}", initial_amount));
        }
        if (!core::utils::isCurrencyCode(currency)) {
            throw core::ConfigException(fmt::format("Invalid portfolio currency code: '{}'", currency));
        }
        core::logging::getLogger()->info("Portfolio initialized with {:.2f} {}", initial_amount, currency);
    }

    std::unique_ptr<Portfolio> Portfolio::replay(double initial_amount,
                                                 const std::string& currency,
                                                 const std::vector<core::Transaction>& transactions) {
        auto ledger = std::make_unique<Portfolio>(initial_amount, currency);
        for (const auto& tx : transactions) {
            ledger->apply(tx);
        }
        core::logging::getLogger()->info("Replayed {} transactions: cash {:.2f} {}, {} open positions",
                                         transactions.size(), ledger->getCash(), currency, ledger->getPositions().size());
        return ledger;
    }

    double Portfolio::getCash() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cash_;
    }

    std::optional<core::Position> Portfolio::getPosition(const core::CurrencyPair& pair) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(pair);
        if (it == positions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<core::Position> Portfolio::getPositions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::Position> result;
        result.reserve(positions_.size());
        for (const auto& entry : positions_) {
            result.push_back(entry.second);
        }
        return result;
    }

    std::vector<core::Transaction> Portfolio::getTransactions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transactions_;
    }

    std::string Portfolio::nextTransactionId() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string id;
        do {
            id = fmt::format("TX-{:06d}", ++id_counter_);
        } while (transaction_ids_.count(id) > 0);
        return id;
    }

    double Portfolio::foreignAmount(const core::Position& position) const {
        return currencyIsBase(position.pair) ? position.quote_amount : position.base_amount;
    }

    double Portfolio::costBasis(const core::Position& position) const {
        return currencyIsBase(position.pair) ? position.base_amount : position.quote_amount;
    }

    double Portfolio::marketValue(const core::Position& position, double price) const {
        if (!(price > 0.0)) {
            return costBasis(position);
        }
        return currencyIsBase(position.pair) ? position.quote_amount / price : position.base_amount * price;
    }

    void Portfolio::validate(const core::Transaction& tx) const {
        if (tx.id.empty()) {
            throw core::InvalidTransactionException("Transaction id must not be empty");
        }
        if (transaction_ids_.count(tx.id) > 0) {
            throw core::InvalidTransactionException(fmt::format("Duplicate transaction id '{}'", tx.id));
        }
        if (!(tx.amount > 0.0) || !std::isfinite(tx.amount)) {
            throw core::InvalidTransactionException(
                fmt::format("Transaction {} amount must be positive, got {}", tx.id, tx.amount));
        }
        if (!(tx.price > 0.0) || !std::isfinite(tx.price)) {
            throw core::InvalidTransactionException(
                fmt::format("Transaction {} price must be positive, got {}", tx.id, tx.price));
        }
        if (tx.pair.base == tx.pair.quote || !tx.pair.involves(currency_)) {
            throw core::InvalidTransactionException(
                fmt::format("Pair {} does not trade the portfolio currency {}", tx.pair.symbol(), currency_));
        }
    }

    core::Transaction Portfolio::apply(const core::Transaction& transaction) {
        auto logger = core::logging::getLogger();
        std::lock_guard<std::mutex> lock(mutex_);

        validate(transaction);
        core::Transaction stored = transaction;
        stored.realized_pnl.reset();

        const bool base_is_cash = currencyIsBase(stored.pair);

        if (stored.side == core::TradeSide::Buy) {
            if (stored.amount > cash_) {
                throw core::InsufficientFundsException(fmt::format(
                    "Insufficient cash for {}: have {:.2f} {}, need {:.2f}", stored.id, cash_, currency_, stored.amount));
            }

            auto& position = positions_[stored.pair];
            position.pair = stored.pair;
            // Weighted average falls out of the running totals
            if (base_is_cash) {
                position.base_amount += stored.amount;
                position.quote_amount += stored.amount * stored.price;
            } else {
                position.quote_amount += stored.amount;
                position.base_amount += stored.amount / stored.price;
            }
            position.average_entry_price = position.quote_amount / position.base_amount;
            position.last_update_time = stored.timestamp;
            cash_ -= stored.amount;
        } else {
            auto it = positions_.find(stored.pair);
            if (it == positions_.end()) {
                throw core::InsufficientHoldingsException(
                    fmt::format("No open position in {} to sell ({})", stored.pair.symbol(), stored.id));
            }
            core::Position& position = it->second;
            const double held = foreignAmount(position);
            const double units = base_is_cash ? stored.amount * stored.price : stored.amount / stored.price;

            if (units > held * (1.0 + kCloseTolerance)) {
                throw core::InsufficientHoldingsException(fmt::format(
                    "Insufficient holdings for {}: have {:.6f}, need {:.6f} ({})",
                    stored.pair.symbol(), held, units, stored.id));
            }

            double realized = 0.0;
            if (units >= held * (1.0 - kCloseTolerance)) {
                realized = stored.amount - costBasis(position);
                positions_.erase(it);
            } else {
                const double fraction = units / held;
                realized = stored.amount - costBasis(position) * fraction;
                position.base_amount *= (1.0 - fraction);
                position.quote_amount *= (1.0 - fraction);
                position.last_update_time = stored.timestamp;
                // average_entry_price is unchanged by a proportional reduction
            }

            cash_ += stored.amount;
            stored.realized_pnl = realized;
            realized_by_pair_[stored.pair] += realized;
        }

        transactions_.push_back(stored);
        transaction_ids_.insert(stored.id);
        if (auto seq = sequenceOf(stored.id)) {
            if (*seq > id_counter_) id_counter_ = *seq;
        }

        logger->info("Transaction applied: Id={}, Time={}, Pair={}, Side={}, Amount={:.2f} {}, Price={:.5f}, NewCash={:.2f}{}",
                     stored.id,
                     core::utils::timestampToString(stored.timestamp),
                     stored.pair.symbol(),
                     core::utils::toString(stored.side),
                     stored.amount, currency_,
                     stored.price,
                     cash_,
                     stored.realized_pnl ? fmt::format(", RealizedPnL={:.2f}", *stored.realized_pnl) : std::string());
        return stored;
    }

    void Portfolio::markToMarket(const core::CurrencyPair& pair, const core::Quote& quote) {
        if (!(quote.bid > 0.0) || !(quote.ask > 0.0) || quote.bid >= quote.ask) {
            throw core::InvalidQuoteException(fmt::format(
                "Cannot mark {} at bid={} ask={}", pair.symbol(), quote.bid, quote.ask));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        mark_prices_[pair] = quote.mid();

        auto it = positions_.find(pair);
        if (it != positions_.end()) {
            core::logging::getLogger()->trace("Marked {} at {:.5f}: unrealized {:.2f} {}",
                pair.symbol(), quote.mid(),
                marketValue(it->second, quote.mid()) - costBasis(it->second), currency_);
        }
    }

    PortfolioSnapshot Portfolio::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);

        PortfolioSnapshot snap;
        snap.currency = currency_;
        snap.initial_value = initial_value_;
        snap.cash_balance = cash_;
        snap.transaction_count = transactions_.size();
        snap.open_positions = positions_.size();

        std::map<core::CurrencyPair, PairBreakdown> rows;
        for (const auto& entry : positions_) {
            const core::Position& position = entry.second;
            PairBreakdown row;
            row.pair = position.pair;
            row.foreign_currency = currencyIsBase(position.pair) ? position.pair.quote : position.pair.base;
            row.foreign_amount = foreignAmount(position);
            row.cost_basis = costBasis(position);
            row.average_entry_price = position.average_entry_price;

            auto mark_it = mark_prices_.find(position.pair);
            row.mark_price = (mark_it != mark_prices_.end()) ? mark_it->second : position.average_entry_price;
            row.market_value = marketValue(position, row.mark_price);
            row.unrealized_pnl = row.market_value - row.cost_basis;

            snap.positions_value += row.market_value;
            snap.unrealized_pnl += row.unrealized_pnl;
            rows[position.pair] = row;
        }

        for (const auto& entry : realized_by_pair_) {
            auto& row = rows[entry.first];
            if (row.foreign_currency.empty()) {
                row.pair = entry.first;
                row.foreign_currency = currencyIsBase(entry.first) ? entry.first.quote : entry.first.base;
                auto mark_it = mark_prices_.find(entry.first);
                row.mark_price = (mark_it != mark_prices_.end()) ? mark_it->second : 0.0;
            }
            row.realized_pnl = entry.second;
            snap.realized_pnl += entry.second;
        }

        for (auto& entry : rows) {
            snap.pairs.push_back(entry.second);
        }

        snap.total_value = snap.cash_balance + snap.positions_value;
        snap.total_pnl = snap.total_value - snap.initial_value;
        snap.return_pct = snap.initial_value > 0.0 ? snap.total_pnl / snap.initial_value * 100.0 : 0.0;
        return snap;
    }

} // namespace portfolio
