#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For std::istringstream
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::round
#include <cctype>     // For std::isdigit, std::toupper
#include <algorithm>

namespace core {
namespace utils {

    namespace {

        Timestamp fromUtcTm(std::tm& tm, const std::string& source) {
            // timegm interprets struct tm as UTC. Use _mkgmtime on Windows.
            #ifdef _WIN32
                time_t tt = _mkgmtime(&tm);
            #else
                time_t tt = timegm(&tm);
            #endif
            if (tt == static_cast<time_t>(-1)) {
                 throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + source);
            }
            return std::chrono::system_clock::from_time_t(tt);
        }

    } // namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing timezone offset/indicator: " + iso_string);
        }

        auto base_tp_utc = fromUtcTm(tm, iso_string);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // Shift by the inverse of the offset to land on UTC
        return base_tp_utc - offset_duration;
    }

    Timestamp parseUtcDateTime(const std::string& text) {
        std::tm tm = {};
        std::istringstream ss(text);
        if (text.size() > 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        } else {
            ss >> std::get_time(&tm, "%Y-%m-%d");
        }
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse UTC date/time: '" + text + "'");
        }
        return fromUtcTm(tm, text);
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm{};
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    bool isCurrencyCode(const std::string& code) {
        return code.size() == 3 &&
               std::all_of(code.begin(), code.end(), [](unsigned char c) { return std::isupper(c) != 0; });
    }

    CurrencyPair parsePair(const std::string& symbol) {
        auto slash = symbol.find('/');
        if (slash == std::string::npos) {
            throw std::invalid_argument("Currency pair must be formatted BASE/QUOTE: '" + symbol + "'");
        }
        CurrencyPair pair;
        pair.base = symbol.substr(0, slash);
        pair.quote = symbol.substr(slash + 1);
        auto upper = [](std::string& s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        };
        upper(pair.base);
        upper(pair.quote);
        if (!isCurrencyCode(pair.base) || !isCurrencyCode(pair.quote)) {
            throw std::invalid_argument("Currency codes must be three letters: '" + symbol + "'");
        }
        if (pair.base == pair.quote) {
            throw std::invalid_argument("Currency pair must name two different currencies: '" + symbol + "'");
        }
        return pair;
    }

    double pipSize(const CurrencyPair& pair) {
        return pair.isJpyQuoted() ? 0.01 : 0.0001;
    }

    double spreadPips(const Quote& quote) {
        // Reported on the reference scale where bid 1.0854 / ask 1.0858 reads 0.4.
        // Rounded to 1e-6 so binary noise in the subtraction does not leak out.
        double raw = (quote.ask - quote.bid) / (pipSize(quote.pair) * 10.0);
        return std::round(raw * 1e6) / 1e6;
    }

    std::string toString(SignalDirection direction) {
        switch (direction) {
            case SignalDirection::Buy:  return "Buy";
            case SignalDirection::Sell: return "Sell";
            case SignalDirection::Hold: return "Hold";
        }
        return "Unknown";
    }

    std::string toString(TradeSide side) {
        return side == TradeSide::Buy ? "Buy" : "Sell";
    }

    std::string toString(RiskLevel level) {
        switch (level) {
            case RiskLevel::Low:    return "Low";
            case RiskLevel::Medium: return "Medium";
            case RiskLevel::High:   return "High";
        }
        return "Unknown";
    }

    TradeSide tradeSideFromString(const std::string& side_str) {
        if (side_str == "Buy") return TradeSide::Buy;
        if (side_str == "Sell") return TradeSide::Sell;
        throw std::invalid_argument("Unknown trade side string: " + side_str);
    }

} // namespace utils
} // namespace core
