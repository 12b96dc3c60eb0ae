#pragma once

#include <string>
#include "datatypes.hpp"

namespace monitor {

    enum class AlertKind {
        RateChange,
        SignalTriggered,
        StopLossHit,
        TakeProfitHit,
        TradeExecuted,
        TradeRejected,
        DataError,
        Degraded
    };

    enum class AlertSeverity {
        Info,
        Warning,
        Critical
    };

    struct Alert {
        AlertKind kind = AlertKind::DataError;
        core::CurrencyPair pair;
        std::string message;
        AlertSeverity severity = AlertSeverity::Info;
        core::Timestamp timestamp;
    };

    std::string toString(AlertKind kind);
    std::string toString(AlertSeverity severity);

} // namespace monitor
