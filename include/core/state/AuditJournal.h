#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace optionlab {
namespace core {

enum class AuditEventType {
    RUN_START,
    ENTRY,
    EXIT,
    NO_CONTRACT,
    INSUFFICIENT_CAPITAL,
    FILTER_BLOCKED,
    MAX_POSITIONS,
    ENTRY_THROTTLED,
    STALE_MARK,
    DATA_GAP,
    QUOTE_ANOMALY,
    EQUITY,
    RUN_END
};

struct AuditEntry {
    std::uint64_t seq = 0;
    std::string date;
    AuditEventType type = AuditEventType::RUN_START;
    std::string contract;           // empty when not contract specific
    double price = 0.0;
    int contracts = 0;
    double cash = 0.0;
    std::string rationale;
    nlohmann::json payload = nlohmann::json::object();
};

// Append-only, in-memory audit trail of a single run. One JSON object per line
// when persisted.
class AuditJournal {
public:
    // Assigns the next sequence number
    const AuditEntry& append(AuditEntry entry);

    const std::vector<AuditEntry>& entries() const { return entries_; }
    std::vector<AuditEntry> readFrom(std::uint64_t seq_inclusive) const;
    std::uint64_t lastSeq() const { return last_seq_; }
    std::vector<std::string> lines() const;

    bool writeJsonl(const std::filesystem::path& file_path) const;

    // Malformed or unknown lines are skipped with a warning
    static std::vector<AuditEntry> readJsonl(const std::filesystem::path& file_path);

    static nlohmann::json toJson(const AuditEntry& entry);
    static std::optional<AuditEntry> fromJson(const nlohmann::json& line);
    static std::optional<AuditEntry> parseLine(const std::string& row);

    static std::string toString(AuditEventType type);
    static std::optional<AuditEventType> fromString(const std::string& value);

private:
    std::vector<AuditEntry> entries_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace optionlab
