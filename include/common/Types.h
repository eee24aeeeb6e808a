#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>

namespace optionlab {

using Price = double;
using Amount = double;

// One listed option contract controls 100 shares of the underlying.
constexpr double kContractMultiplier = 100.0;

enum class OptionRight { CALL, PUT };

inline std::string toString(OptionRight right) {
    return right == OptionRight::CALL ? "C" : "P";
}

struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;
    double implied_volatility = 0.0;
};

// Contract identity: (strike, expiration, right)
struct ContractKey {
    double strike = 0.0;
    std::string expiration;   // YYYY-MM-DD
    OptionRight right = OptionRight::CALL;

    bool operator==(const ContractKey& other) const {
        return strike == other.strike &&
               expiration == other.expiration &&
               right == other.right;
    }
    bool operator!=(const ContractKey& other) const { return !(*this == other); }

    bool operator<(const ContractKey& other) const {
        if (expiration != other.expiration) return expiration < other.expiration;
        if (strike != other.strike) return strike < other.strike;
        return static_cast<int>(right) < static_cast<int>(other.right);
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << expiration << " " << std::fixed << std::setprecision(2) << strike
            << optionlab::toString(right);
        return oss.str();
    }
};

struct OptionQuote {
    ContractKey contract;
    Price bid = 0.0;
    Price ask = 0.0;
    Price close = 0.0;
    long long volume = 0;
    long long open_interest = 0;
    Greeks greeks;

    Price mid() const { return (bid + ask) / 2.0; }

    // (ask - bid) / mid, 1.0 when mid is not positive
    double spreadPct() const {
        const double m = mid();
        return (m > 0.0) ? (ask - bid) / m : 1.0;
    }
};

// Option chain for one trading date
struct MarketSnapshot {
    std::string date;
    Price underlying_price = 0.0;
    std::vector<OptionQuote> quotes;

    const OptionQuote* find(const ContractKey& key) const {
        for (const auto& quote : quotes) {
            if (quote.contract == key) {
                return &quote;
            }
        }
        return nullptr;
    }

    bool empty() const { return quotes.empty() || underlying_price <= 0.0; }
};

// Per-day underlying observation kept in the rolling history window
struct UnderlyingBar {
    std::string date;
    Price close = 0.0;
    double atm_iv = 0.0;      // 0 when no at-the-money quote was available
    bool has_atm_iv = false;
};

} // namespace optionlab
