#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/Types.h"

namespace optionlab {
namespace backtest {

enum class PositionStatus { OPEN, EXIT_PENDING, CLOSED };

std::string toString(PositionStatus status);

// Daily Greeks snapshot of a held position
struct GreeksSnapshot {
    std::string date;
    Greeks greeks;
    Price mark = 0.0;
    Price underlying_price = 0.0;
    bool stale = false;             // carried forward from an earlier day
};

// Candidate counts through each selection stage
struct SelectionFunnel {
    int total = 0;
    int after_type = 0;
    int after_anomaly = 0;
    int after_liquidity = 0;
    int after_dte = 0;
    int after_delta = 0;
    int after_held = 0;
    bool relaxed = false;
};

struct Position {
    std::uint64_t id = 0;
    std::string symbol;
    ContractKey contract;

    std::string entry_date;
    Price entry_price = 0.0;
    int contracts = 0;
    Amount entry_commission = 0.0;
    Amount entry_cost = 0.0;        // entry_price * contracts * 100 + commission
    int entry_dte = 0;
    Price entry_underlying_price = 0.0;
    Price entry_bid = 0.0;
    Price entry_ask = 0.0;
    long long entry_volume = 0;
    long long entry_open_interest = 0;
    bool relaxed_selection = false;

    Price current_mark = 0.0;
    Amount unrealized_pnl = 0.0;
    Greeks entry_greeks;
    Greeks current_greeks;
    std::string last_quote_date;    // last day a real quote was seen
    std::vector<GreeksSnapshot> greeks_history;

    PositionStatus status = PositionStatus::OPEN;

    Amount marketValue() const { return current_mark * contracts * kContractMultiplier; }

    // Simulated days since entry, 0 on the entry day
    int daysHeld() const {
        return greeks_history.empty() ? 0 : static_cast<int>(greeks_history.size()) - 1;
    }
};

struct ClosedTrade {
    Position position;

    std::string exit_date;
    Price exit_price = 0.0;
    Amount exit_value = 0.0;        // exit_price * contracts * 100
    Greeks exit_greeks;
    Price exit_underlying_price = 0.0;
    Price exit_bid = 0.0;
    Price exit_ask = 0.0;

    Amount realized_pnl = 0.0;      // exit_value - entry_cost
    double pnl_pct = 0.0;           // realized_pnl / entry_cost
    int days_held = 0;              // simulated days
    int calendar_days_held = 0;
    std::string exit_reason;        // exit rule identifier
    std::string exit_detail;

    bool delta_compliant = false;
    bool dte_compliant = false;
    double compliance_score = 0.0;  // 0~100
};

struct EquityPoint {
    std::string date;
    Amount cash = 0.0;
    Amount positions_value = 0.0;
    Amount total_value = 0.0;
    int open_positions = 0;
};

} // namespace backtest
} // namespace optionlab
