#pragma once

#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "indicator_set.hpp"
#include "portfolio.hpp"
#include "alert.hpp"
#include "currency_monitor.hpp"
#include "trading_core_service.hpp"

// to_json overloads live next to the types so nlohmann finds them by ADL.
// Timestamps are encoded as ISO 8601 UTC strings.

namespace core {
    using json = nlohmann::json;

    void to_json(json& j, const CurrencyPair& pair);
    void to_json(json& j, const PriceBar& bar);
    void to_json(json& j, const Quote& quote);
    void to_json(json& j, const TradingSignal& signal);
    void to_json(json& j, const Transaction& transaction);
    void to_json(json& j, const Position& position);
}

namespace indicators {
    void to_json(nlohmann::json& j, const IndicatorSet& set);
}

namespace portfolio {
    void to_json(nlohmann::json& j, const PairBreakdown& row);
    void to_json(nlohmann::json& j, const PortfolioSnapshot& snapshot);
}

namespace monitor {
    void to_json(nlohmann::json& j, const Alert& alert);
    void to_json(nlohmann::json& j, const TickReport& report);
}

namespace service {
    void to_json(nlohmann::json& j, const PairOverview& entry);
    void to_json(nlohmann::json& j, const MarketOverview& overview);
}
