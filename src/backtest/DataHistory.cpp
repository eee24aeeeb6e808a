#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <map>
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace optionlab {
namespace backtest {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::vector<std::string> splitRow(const std::string& line) {
    std::stringstream ss(line);
    std::string cell;
    std::vector<std::string> row;
    while (std::getline(ss, cell, ',')) {
        row.push_back(normalizeCell(cell));
    }
    return row;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseRight(const std::string& text, OptionRight& out) {
    const std::string value = lower(text);
    if (value == "c" || value == "call") {
        out = OptionRight::CALL;
        return true;
    }
    if (value == "p" || value == "put") {
        out = OptionRight::PUT;
        return true;
    }
    return false;
}

const std::vector<std::string> kRequiredColumns = {
    "date", "underlying_price", "strike", "expiration", "right",
    "bid", "ask", "close", "volume", "delta", "gamma", "theta", "vega", "iv"
};

} // namespace

core::InMemorySnapshotProvider DataHistory::loadOptionChainCSV(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        throw SnapshotLoadError("cannot open option chain file '" + file_path + "'");
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw SnapshotLoadError("option chain file '" + file_path + "' is empty");
    }

    std::map<std::string, size_t> columns;
    const auto header = splitRow(line);
    for (size_t i = 0; i < header.size(); ++i) {
        columns[lower(header[i])] = i;
    }
    for (const auto& name : kRequiredColumns) {
        if (columns.find(name) == columns.end()) {
            throw SnapshotLoadError("option chain file '" + file_path + "' has no '" + name + "' column");
        }
    }
    const auto oi_col = columns.find("open_interest");
    const auto rho_col = columns.find("rho");

    core::InMemorySnapshotProvider provider;
    size_t line_no = 1;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) continue;

        const auto row = splitRow(line);
        auto cell = [&](const std::string& name) -> const std::string& {
            return row.at(columns.at(name));
        };

        try {
            const std::string& date = cell("date");
            if (!utils::DateUtils::isValid(date)) {
                throw std::invalid_argument("bad date '" + date + "'");
            }

            OptionQuote quote;
            quote.contract.strike = std::stod(cell("strike"));
            quote.contract.expiration = cell("expiration");
            if (!parseRight(cell("right"), quote.contract.right)) {
                throw std::invalid_argument("bad right '" + cell("right") + "'");
            }
            quote.bid = std::stod(cell("bid"));
            quote.ask = std::stod(cell("ask"));
            quote.close = std::stod(cell("close"));
            quote.volume = std::stoll(cell("volume"));
            if (oi_col != columns.end() && oi_col->second < row.size() && !row[oi_col->second].empty()) {
                quote.open_interest = std::stoll(row[oi_col->second]);
            }
            quote.greeks.delta = std::stod(cell("delta"));
            quote.greeks.gamma = std::stod(cell("gamma"));
            quote.greeks.theta = std::stod(cell("theta"));
            quote.greeks.vega = std::stod(cell("vega"));
            quote.greeks.implied_volatility = std::stod(cell("iv"));
            if (rho_col != columns.end() && rho_col->second < row.size() && !row[rho_col->second].empty()) {
                quote.greeks.rho = std::stod(row[rho_col->second]);
            }

            // Underlying price of a date comes from its first row
            provider.addQuote(date, std::stod(cell("underlying_price")), quote);
        } catch (const std::exception& e) {
            ++skipped;
            LOG_WARN("Skipping row {} of {}: {}", line_no, file_path, e.what());
        }
    }

    LOG_INFO("Loaded {} quotes over {} dates from {} ({} rows skipped)",
             provider.quoteCount(), provider.size(), file_path, skipped);
    return provider;
}

std::vector<std::string> DataHistory::filterByDate(const std::vector<std::string>& dates,
                                                   const std::string& start_date,
                                                   const std::string& end_date) {
    std::vector<std::string> filtered;
    for (const auto& date : dates) {
        if (!start_date.empty() && date < start_date) continue;
        if (!end_date.empty() && date > end_date) continue;
        filtered.push_back(date);
    }
    return filtered;
}

} // namespace backtest
} // namespace optionlab
