#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "TestFixtures.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace optionlab;
using backtest::DataHistory;
using fixtures::near;

namespace {

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

bool loadThrows(const std::string& path) {
    try {
        DataHistory::loadOptionChainCSV(path);
    } catch (const SnapshotLoadError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    const std::string path = "test_option_chain.csv";

    // Header order is free, cells may be quoted, first cell may carry a BOM
    {
        writeFile(path,
            "\xEF\xBB\xBF" "Date,underlying_price,strike,expiration,right,bid,ask,close,volume,open_interest,"
            "delta,gamma,theta,vega,iv,rho\n"
            "2024-01-02,450.10,450,2024-02-16,C,1.95,2.05,2.00,500,5000,0.40,0.02,-0.05,0.10,0.25,0.01\n"
            "2024-01-02,450.10,440,2024-02-16,\"put\",1.45,1.55,1.50,300,,-0.30,0.02,-0.04,0.09,0.27,-0.01\n"
            "2024-01-02,450.10,455,2024-02-16,X,1.45,1.55,1.50,300,10,0.30,0.02,-0.04,0.09,0.27,0.01\n"
            "\n"
            "2024-01-03,451.00,450,2024-02-16,call,2.25,2.35,2.30,400,4100,0.44,0.02,-0.05,0.10,0.24\n"
            "2024-01-04,452.00,450,2024-02-16,C,abc,2.35,2.30,400,4100,0.44,0.02,-0.05,0.10,0.24,0.01\n"
            "01/05/2024,452.00,450,2024-02-16,C,2.25,2.35,2.30,400,4100,0.44,0.02,-0.05,0.10,0.24,0.01\n"
            "2024-01-08,453.00,450,2024-02-16\n");

        const auto provider = DataHistory::loadOptionChainCSV(path);
        const auto dates = provider.tradingDates();
        assert(dates.size() == 2);
        assert(dates[0] == "2024-01-02" && dates[1] == "2024-01-03");
        assert(provider.quoteCount() == 3);

        const auto day0 = provider.snapshot("2024-01-02");
        assert(day0 && day0->quotes.size() == 2);
        assert(near(day0->underlying_price, 450.10));
        assert(day0->quotes[0].contract.right == OptionRight::CALL);
        assert(day0->quotes[0].open_interest == 5000);
        assert(near(day0->quotes[0].greeks.implied_volatility, 0.25));
        assert(day0->quotes[1].contract.right == OptionRight::PUT);
        assert(day0->quotes[1].open_interest == 0);
        assert(near(day0->quotes[1].greeks.rho, -0.01));

        const auto day1 = provider.snapshot("2024-01-03");
        assert(day1 && near(day1->quotes[0].greeks.rho, 0.0));
    }

    // Unreadable sources
    {
        writeFile(path, "date,strike,expiration,right,bid,ask,close,volume,delta,gamma,theta,vega,iv\n");
        assert(loadThrows(path));

        writeFile(path, "");
        assert(loadThrows(path));

        assert(loadThrows("no_such_chain.csv"));
    }

    // Date window
    {
        const std::vector<std::string> dates = {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"};
        assert(DataHistory::filterByDate(dates, "", "").size() == 4);
        const auto window = DataHistory::filterByDate(dates, "2024-01-03", "2024-01-04");
        assert(window.size() == 2 && window.front() == "2024-01-03");
        assert(DataHistory::filterByDate(dates, "2024-01-04", "").size() == 2);
        assert(DataHistory::filterByDate(dates, "", "2024-01-02").size() == 1);
    }

    std::filesystem::remove(path);

    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
