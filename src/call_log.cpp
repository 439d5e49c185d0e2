/**
 * @file call_log.cpp
 * @brief Call recording implementation
 */

#include "dirmock/call_log.h"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

namespace dirmock {

void CallLog::record(std::string method, Json::Value args) {
    spdlog::trace("call #{}: {}", records_.size(), method);
    records_.push_back(CallRecord{std::move(method), std::move(args)});
}

std::vector<std::string> CallLog::methodsCalled() const {
    std::vector<std::string> names;
    names.reserve(records_.size());
    for (const auto& record : records_) {
        names.push_back(record.method);
    }
    return names;
}

bool CallLog::wasCalled(const std::string& method) const {
    return std::any_of(records_.begin(), records_.end(),
                       [&method](const CallRecord& r) { return r.method == method; });
}

std::vector<CallRecord> CallLog::callsTo(const std::string& method) const {
    std::vector<CallRecord> matching;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(matching),
                 [&method](const CallRecord& r) { return r.method == method; });
    return matching;
}

Json::Value CallLog::toJson() const {
    Json::Value array(Json::arrayValue);
    for (const auto& record : records_) {
        Json::Value item;
        item["method"] = record.method;
        item["args"] = record.args;
        array.append(item);
    }
    return array;
}

} // namespace dirmock
