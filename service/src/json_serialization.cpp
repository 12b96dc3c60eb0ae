#include "json_serialization.hpp"
#include "utils.hpp"

namespace core {

    void to_json(json& j, const CurrencyPair& pair) {
        j = pair.symbol();
    }

    void to_json(json& j, const PriceBar& bar) {
        j = json{{"timestamp", utils::timestampToString(bar.timestamp)},
                 {"open", bar.open},
                 {"high", bar.high},
                 {"low", bar.low},
                 {"close", bar.close}};
    }

    void to_json(json& j, const Quote& quote) {
        j = json{{"pair", quote.pair},
                 {"bid", quote.bid},
                 {"ask", quote.ask},
                 {"mid", quote.mid()},
                 {"spread_pips", utils::spreadPips(quote)},
                 {"timestamp", utils::timestampToString(quote.timestamp)}};
    }

    void to_json(json& j, const TradingSignal& signal) {
        j = json{{"pair", signal.pair},
                 {"direction", utils::toString(signal.direction)},
                 {"score", signal.score},
                 {"strength", signal.strength},
                 {"confidence", signal.confidence},
                 {"entry_price", signal.entry_price},
                 {"stop_loss", signal.stop_loss},
                 {"take_profit", signal.take_profit},
                 {"risk_level", utils::toString(signal.risk_level)},
                 {"reasoning", signal.reasoning},
                 {"generated_at", utils::timestampToString(signal.generated_at)}};
    }

    void to_json(json& j, const Transaction& transaction) {
        j = json{{"id", transaction.id},
                 {"pair", transaction.pair},
                 {"side", utils::toString(transaction.side)},
                 {"amount", transaction.amount},
                 {"price", transaction.price},
                 {"timestamp", utils::timestampToString(transaction.timestamp)}};
        j["realized_pnl"] = transaction.realized_pnl ? json(*transaction.realized_pnl) : json(nullptr);
    }

    void to_json(json& j, const Position& position) {
        j = json{{"pair", position.pair},
                 {"base_amount", position.base_amount},
                 {"quote_amount", position.quote_amount},
                 {"average_entry_price", position.average_entry_price},
                 {"last_update_time", utils::timestampToString(position.last_update_time)}};
    }

} // namespace core

namespace indicators {

    void to_json(nlohmann::json& j, const IndicatorSet& set) {
        using nlohmann::json;
        j = json{{"rsi", set.rsi},
                 {"macd", {{"line", set.macd.line}, {"signal", set.macd.signal}, {"histogram", set.macd.histogram}}},
                 {"bollinger", {{"upper", set.bollinger.upper}, {"middle", set.bollinger.middle}, {"lower", set.bollinger.lower}}},
                 {"sma_20", set.sma_20},
                 {"ema_12", set.ema_12},
                 {"ema_26", set.ema_26},
                 {"atr_14", set.atr_14},
                 {"bar_count", set.bar_count},
                 {"last_close", set.last_close},
                 {"computed_at", core::utils::timestampToString(set.computed_at)}};
        j["sma_50"] = set.sma_50 ? json(*set.sma_50) : json(nullptr);
        if (set.stochastic) {
            j["stochastic"] = {{"k", set.stochastic->k}, {"d", set.stochastic->d}};
        } else {
            j["stochastic"] = nullptr;
        }
    }

} // namespace indicators

namespace portfolio {

    void to_json(nlohmann::json& j, const PairBreakdown& row) {
        j = nlohmann::json{{"pair", row.pair},
                           {"foreign_currency", row.foreign_currency},
                           {"foreign_amount", row.foreign_amount},
                           {"cost_basis", row.cost_basis},
                           {"average_entry_price", row.average_entry_price},
                           {"mark_price", row.mark_price},
                           {"market_value", row.market_value},
                           {"unrealized_pnl", row.unrealized_pnl},
                           {"realized_pnl", row.realized_pnl}};
    }

    void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot) {
        j = nlohmann::json{{"currency", snapshot.currency},
                           {"initial_value", snapshot.initial_value},
                           {"cash_balance", snapshot.cash_balance},
                           {"positions_value", snapshot.positions_value},
                           {"total_value", snapshot.total_value},
                           {"realized_pnl", snapshot.realized_pnl},
                           {"unrealized_pnl", snapshot.unrealized_pnl},
                           {"total_pnl", snapshot.total_pnl},
                           {"return_pct", snapshot.return_pct},
                           {"transaction_count", snapshot.transaction_count},
                           {"open_positions", snapshot.open_positions},
                           {"pairs", snapshot.pairs}};
    }

} // namespace portfolio

namespace monitor {

    void to_json(nlohmann::json& j, const Alert& alert) {
        j = nlohmann::json{{"kind", toString(alert.kind)},
                           {"pair", alert.pair},
                           {"message", alert.message},
                           {"severity", toString(alert.severity)},
                           {"timestamp", core::utils::timestampToString(alert.timestamp)}};
    }

    void to_json(nlohmann::json& j, const TickReport& report) {
        nlohmann::json signals = nlohmann::json::object();
        for (const auto& entry : report.signals) {
            signals[entry.first.symbol()] = entry.second;
        }
        nlohmann::json failed = nlohmann::json::array();
        for (const auto& failure : report.failed_pairs) {
            nlohmann::json row = {{"pair", failure.pair}, {"message", failure.message}};
            row["error_kind"] = failure.provider_error ? nlohmann::json(core::toString(*failure.provider_error))
                                                       : nlohmann::json(nullptr);
            failed.push_back(row);
        }
        j = nlohmann::json{{"tick", report.tick},
                           {"started_at", core::utils::timestampToString(report.started_at)},
                           {"signals", signals},
                           {"failed_pairs", failed},
                           {"alerts", report.alerts},
                           {"rate_limited", report.rate_limited},
                           {"cancelled", report.cancelled}};
    }

} // namespace monitor

namespace service {

    void to_json(nlohmann::json& j, const PairOverview& entry) {
        j = nlohmann::json{{"pair", entry.pair},
                           {"quote", nullptr},
                           {"signal", nullptr},
                           {"error_kind", nullptr}};
        if (entry.quote) j["quote"] = *entry.quote;
        if (entry.signal) j["signal"] = *entry.signal;
        if (entry.error_kind) {
            j["error_kind"] = *entry.error_kind;
            j["error"] = entry.error;
        }
    }

    void to_json(nlohmann::json& j, const MarketOverview& overview) {
        j = nlohmann::json{{"pairs", overview.pairs},
                           {"buy_signals", overview.buy_signals},
                           {"sell_signals", overview.sell_signals},
                           {"hold_signals", overview.hold_signals},
                           {"sentiment", toString(overview.sentiment)}};
    }

} // namespace service
