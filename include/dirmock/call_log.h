/**
 * @file call_log.h
 * @brief Per-emulator record of protocol calls and their arguments
 *
 * Lets a test assert which operations a client invoked, in order, and with
 * which arguments. Owned by one emulator instance; no global state.
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>

namespace dirmock {

/// @brief One recorded call
struct CallRecord {
    std::string method;  ///< Protocol client method name, e.g. "search_s"
    Json::Value args;    ///< Arguments as a JSON array
};

class CallLog {
public:
    void record(std::string method, Json::Value args);

    [[nodiscard]] const std::vector<CallRecord>& records() const noexcept { return records_; }

    /// @brief Method names in call order
    [[nodiscard]] std::vector<std::string> methodsCalled() const;

    [[nodiscard]] bool wasCalled(const std::string& method) const;

    /// @brief Records of one method, in call order
    [[nodiscard]] std::vector<CallRecord> callsTo(const std::string& method) const;

    [[nodiscard]] size_t size() const noexcept { return records_.size(); }

    void clear() noexcept { records_.clear(); }

    /// @brief Whole log as a JSON array of {"method", "args"} objects
    [[nodiscard]] Json::Value toJson() const;

private:
    std::vector<CallRecord> records_;
};

} // namespace dirmock
