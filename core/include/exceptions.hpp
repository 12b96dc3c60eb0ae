#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class TradingPlatformException : public std::runtime_error {
    public:
        explicit TradingPlatformException(const std::string& message)
            : std::runtime_error(message) {}

        explicit TradingPlatformException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class DataLoadException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class DatabaseException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class IndicatorCalculationException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // Not enough bars for an indicator window
    class InsufficientDataException : public IndicatorCalculationException {
    public: using IndicatorCalculationException::IndicatorCalculationException; };

    // bid >= ask, or a non-positive side
    class InvalidQuoteException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    // --- Ledger validation ---
    class LedgerException : public TradingPlatformException {
    public: using TradingPlatformException::TradingPlatformException; };

    class InsufficientFundsException : public LedgerException {
    public: using LedgerException::LedgerException; };

    class InsufficientHoldingsException : public LedgerException {
    public: using LedgerException::LedgerException; };

    class InvalidTransactionException : public LedgerException {
    public: using LedgerException::LedgerException; };

    // --- Market data provider failures ---
    enum class DataProviderErrorKind {
        RateLimited,
        AuthFailed,
        NotFound,
        Network,
        Malformed
    };

    inline const char* toString(DataProviderErrorKind kind) {
        switch (kind) {
            case DataProviderErrorKind::RateLimited: return "RateLimited";
            case DataProviderErrorKind::AuthFailed:  return "AuthFailed";
            case DataProviderErrorKind::NotFound:    return "NotFound";
            case DataProviderErrorKind::Network:     return "Network";
            case DataProviderErrorKind::Malformed:   return "Malformed";
        }
        return "Unknown";
    }

    class DataProviderException : public TradingPlatformException {
    public:
        DataProviderException(DataProviderErrorKind kind, const std::string& message)
            : TradingPlatformException(message), kind_(kind) {}

        DataProviderErrorKind kind() const { return kind_; }

    private:
        DataProviderErrorKind kind_;
    };

} // namespace core
