#include "alert.hpp"

namespace monitor {

    std::string toString(AlertKind kind) {
        switch (kind) {
            case AlertKind::RateChange:      return "RateChange";
            case AlertKind::SignalTriggered: return "SignalTriggered";
            case AlertKind::StopLossHit:     return "StopLossHit";
            case AlertKind::TakeProfitHit:   return "TakeProfitHit";
            case AlertKind::TradeExecuted:   return "TradeExecuted";
            case AlertKind::TradeRejected:   return "TradeRejected";
            case AlertKind::DataError:       return "DataError";
            case AlertKind::Degraded:        return "Degraded";
        }
        return "Unknown";
    }

    std::string toString(AlertSeverity severity) {
        switch (severity) {
            case AlertSeverity::Info:     return "Info";
            case AlertSeverity::Warning:  return "Warning";
            case AlertSeverity::Critical: return "Critical";
        }
        return "Unknown";
    }

} // namespace monitor
