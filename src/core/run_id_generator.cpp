// src/core/run_id_generator.cpp

#include "backfolio/core/run_id_generator.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include "backfolio/core/time_utils.hpp"

namespace backfolio {

std::string RunIdGenerator::sanitize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        out += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return out.empty() ? "BACKTEST" : out;
}

std::string RunIdGenerator::generate_timestamp_string(const Timestamp& timestamp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  timestamp.time_since_epoch())
                  .count() %
              1000;

    std::ostringstream ss;
    ss << core::format_timestamp(timestamp, "%Y%m%d_%H%M%S");
    ss << "_" << std::setfill('0') << std::setw(3) << ms;
    return ss.str();
}

std::string RunIdGenerator::generate_run_id(const std::string& strategy_name,
                                            const Timestamp& timestamp) {
    return sanitize(strategy_name) + "_" + generate_timestamp_string(timestamp);
}

std::string RunIdGenerator::generate_batch_run_id(const std::vector<std::string>& strategy_names,
                                                  const Timestamp& timestamp) {
    std::vector<std::string> sorted;
    sorted.reserve(strategy_names.size());
    for (const auto& name : strategy_names) {
        sorted.push_back(sanitize(name));
    }
    std::sort(sorted.begin(), sorted.end());

    std::string combined;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i > 0)
            combined += "&";
        combined += sorted[i];
    }
    return (combined.empty() ? "BATCH" : combined) + "_" + generate_timestamp_string(timestamp);
}

}  // namespace backfolio
