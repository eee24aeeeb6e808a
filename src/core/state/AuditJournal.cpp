#include "core/state/AuditJournal.h"
#include "common/Logger.h"

#include <fstream>

namespace optionlab {
namespace core {

const AuditEntry& AuditJournal::append(AuditEntry entry) {
    entry.seq = ++last_seq_;
    entries_.push_back(std::move(entry));
    return entries_.back();
}

std::vector<AuditEntry> AuditJournal::readFrom(std::uint64_t seq_inclusive) const {
    std::vector<AuditEntry> out;
    for (const auto& entry : entries_) {
        if (entry.seq >= seq_inclusive) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<std::string> AuditJournal::lines() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(toJson(entry).dump());
    }
    return out;
}

bool AuditJournal::writeJsonl(const std::filesystem::path& file_path) const {
    if (file_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(file_path.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Audit directory create failed: {} ({})", file_path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Audit file open failed: {}", file_path.string());
        return false;
    }

    for (const auto& entry : entries_) {
        out << toJson(entry).dump() << "\n";
    }
    return static_cast<bool>(out);
}

std::vector<AuditEntry> AuditJournal::readJsonl(const std::filesystem::path& file_path) {
    std::vector<AuditEntry> out;
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        LOG_WARN("Audit file not found: {}", file_path.string());
        return out;
    }

    std::string row;
    size_t line_no = 0;
    while (std::getline(in, row)) {
        ++line_no;
        if (row.empty()) {
            continue;
        }
        auto entry = parseLine(row);
        if (!entry) {
            LOG_WARN("Skipping malformed audit line {} in {}", line_no, file_path.string());
            continue;
        }
        out.push_back(std::move(*entry));
    }
    return out;
}

nlohmann::json AuditJournal::toJson(const AuditEntry& entry) {
    nlohmann::json line;
    line["seq"] = entry.seq;
    line["date"] = entry.date;
    line["event"] = toString(entry.type);
    line["contract"] = entry.contract;
    line["price"] = entry.price;
    line["contracts"] = entry.contracts;
    line["cash"] = entry.cash;
    line["rationale"] = entry.rationale;
    line["payload"] = entry.payload;
    return line;
}

std::optional<AuditEntry> AuditJournal::fromJson(const nlohmann::json& line) {
    if (!line.is_object()) {
        return std::nullopt;
    }
    const auto type = fromString(line.value("event", std::string()));
    if (!type) {
        return std::nullopt;
    }

    AuditEntry entry;
    entry.seq = line.value("seq", static_cast<std::uint64_t>(0));
    entry.date = line.value("date", std::string());
    entry.type = *type;
    entry.contract = line.value("contract", std::string());
    entry.price = line.value("price", 0.0);
    entry.contracts = line.value("contracts", 0);
    entry.cash = line.value("cash", 0.0);
    entry.rationale = line.value("rationale", std::string());
    entry.payload = line.value("payload", nlohmann::json::object());
    return entry;
}

std::optional<AuditEntry> AuditJournal::parseLine(const std::string& row) {
    try {
        return fromJson(nlohmann::json::parse(row));
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::string AuditJournal::toString(AuditEventType type) {
    switch (type) {
        case AuditEventType::RUN_START: return "RUN_START";
        case AuditEventType::ENTRY: return "ENTRY";
        case AuditEventType::EXIT: return "EXIT";
        case AuditEventType::NO_CONTRACT: return "NO_CONTRACT";
        case AuditEventType::INSUFFICIENT_CAPITAL: return "INSUFFICIENT_CAPITAL";
        case AuditEventType::FILTER_BLOCKED: return "FILTER_BLOCKED";
        case AuditEventType::MAX_POSITIONS: return "MAX_POSITIONS";
        case AuditEventType::ENTRY_THROTTLED: return "ENTRY_THROTTLED";
        case AuditEventType::STALE_MARK: return "STALE_MARK";
        case AuditEventType::DATA_GAP: return "DATA_GAP";
        case AuditEventType::QUOTE_ANOMALY: return "QUOTE_ANOMALY";
        case AuditEventType::EQUITY: return "EQUITY";
        case AuditEventType::RUN_END: return "RUN_END";
    }
    return "RUN_START";
}

std::optional<AuditEventType> AuditJournal::fromString(const std::string& value) {
    if (value == "RUN_START") return AuditEventType::RUN_START;
    if (value == "ENTRY") return AuditEventType::ENTRY;
    if (value == "EXIT") return AuditEventType::EXIT;
    if (value == "NO_CONTRACT") return AuditEventType::NO_CONTRACT;
    if (value == "INSUFFICIENT_CAPITAL") return AuditEventType::INSUFFICIENT_CAPITAL;
    if (value == "FILTER_BLOCKED") return AuditEventType::FILTER_BLOCKED;
    if (value == "MAX_POSITIONS") return AuditEventType::MAX_POSITIONS;
    if (value == "ENTRY_THROTTLED") return AuditEventType::ENTRY_THROTTLED;
    if (value == "STALE_MARK") return AuditEventType::STALE_MARK;
    if (value == "DATA_GAP") return AuditEventType::DATA_GAP;
    if (value == "QUOTE_ANOMALY") return AuditEventType::QUOTE_ANOMALY;
    if (value == "EQUITY") return AuditEventType::EQUITY;
    if (value == "RUN_END") return AuditEventType::RUN_END;
    return std::nullopt;
}

} // namespace core
} // namespace optionlab
