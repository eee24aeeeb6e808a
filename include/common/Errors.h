#pragma once

#include <stdexcept>
#include <string>

namespace optionlab {

// Fatal: raised before the first simulated day.
class ConfigValidationError : public std::runtime_error {
public:
    ConfigValidationError(const std::string& field, const std::string& message)
        : std::runtime_error(field + ": " + message), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

// Snapshot source could not be read at all (missing file, no usable header).
class SnapshotLoadError : public std::runtime_error {
public:
    explicit SnapshotLoadError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace optionlab
