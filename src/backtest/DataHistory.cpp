#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <limits>
#include <unordered_map>
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TimeUtils.h"

namespace replaybt {
namespace backtest {

namespace {
constexpr TimestampMs kDayMs = 24LL * 60 * 60 * 1000;

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

const nlohmann::json* findKey(const nlohmann::json& item, const char* long_key, const char* short_key) {
    if (item.contains(long_key)) return &item.at(long_key);
    if (item.contains(short_key)) return &item.at(short_key);
    return nullptr;
}

double readPrice(const nlohmann::json& item, const char* long_key, const char* short_key, bool required) {
    const auto* v = findKey(item, long_key, short_key);
    if (!v) {
        if (required) {
            throw DataError(std::string("missing field '") + long_key + "'");
        }
        return 0.0;
    }
    if (v->is_string()) {
        return std::stod(v->get<std::string>());
    }
    return v->get<double>();
}

TimestampMs readTimestamp(const nlohmann::json& item) {
    const auto* v = findKey(item, "timestamp", "t");
    if (!v) {
        throw DataError("missing field 'timestamp'");
    }
    if (v->is_number()) {
        return utils::toMsTimestamp(v->get<long long>());
    }
    if (v->is_string()) {
        auto parsed = utils::parseTimestamp(v->get<std::string>());
        if (parsed) return *parsed;
    }
    throw DataError("unparsable timestamp: " + v->dump());
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}

std::vector<Bar> DataHistory::load(const std::string& file_path) {
    const std::string ext = toLowerCopy(std::filesystem::path(file_path).extension().string());
    if (ext == ".json") {
        return loadJSON(file_path);
    }
    return loadCSV(file_path);
}

std::vector<Bar> DataHistory::loadCSV(const std::string& file_path) {
    std::vector<Bar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataError("failed to open CSV file: " + file_path);
    }

    std::string line;
    size_t line_no = 0;
    size_t skipped = 0;

    while (std::getline(file, line)) {
        line_no++;
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        const auto ts = utils::parseTimestamp(row[0]);
        if (!ts) {
            if (line_no == 1) {
                // Header row
                continue;
            }
            LOG_WARN("{}:{} unparsable timestamp '{}', row skipped", file_path, line_no, row[0]);
            skipped++;
            continue;
        }
        if (row.size() < 6) {
            LOG_WARN("{}:{} expected at least 6 columns, got {}", file_path, line_no, row.size());
            skipped++;
            continue;
        }

        try {
            Bar bar(std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                    std::stod(row[4]), std::stod(row[5]), *ts);
            if (row.size() >= 7 && !row[6].empty()) {
                bar.benchmark_close = std::stod(row[6]);
            }
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row {}: {} - {}", line_no, line, e.what());
            skipped++;
        }
    }

    if (bars.empty()) {
        throw DataError("no valid bars in " + file_path);
    }
    if (skipped > 0) {
        LOG_WARN("{} malformed row(s) skipped in {}", skipped, file_path);
    }

    bars = normalize(std::move(bars), file_path);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::loadJSON(const std::string& file_path) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        throw DataError("failed to open JSON file: " + file_path);
    }

    std::vector<Bar> bars;
    try {
        nlohmann::json j;
        file >> j;

        // Either a bare array or an envelope {"result": [...]}
        const nlohmann::json& items = (j.is_object() && j.contains("result")) ? j.at("result") : j;
        if (!items.is_array()) {
            throw DataError("expected an array of bars in " + file_path);
        }

        for (const auto& item : items) {
            Bar bar;
            bar.timestamp = readTimestamp(item);
            bar.open = readPrice(item, "open", "o", false);
            bar.high = readPrice(item, "high", "h", false);
            bar.low = readPrice(item, "low", "l", false);
            bar.close = readPrice(item, "close", "c", true);
            bar.volume = readPrice(item, "volume", "v", false);
            if (item.contains("benchmark_close") && !item.at("benchmark_close").is_null()) {
                bar.benchmark_close = item.at("benchmark_close").get<double>();
            }
            bars.push_back(bar);
        }
    } catch (const nlohmann::json::exception& e) {
        throw DataError("error parsing JSON file " + file_path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw DataError("invalid number in " + file_path + ": " + e.what());
    } catch (const std::out_of_range& e) {
        throw DataError("number out of range in " + file_path + ": " + e.what());
    }

    if (bars.empty()) {
        throw DataError("no bars in " + file_path);
    }

    bars = normalize(std::move(bars), file_path);
    LOG_INFO("Loaded {} bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<Bar> DataHistory::normalize(std::vector<Bar> bars, const std::string& source) {
    // Ensure sorted by timestamp ascending
    std::stable_sort(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp < b.timestamp;
    });

    const size_t before = bars.size();
    bars.erase(std::unique(bars.begin(), bars.end(), [](const Bar& a, const Bar& b) {
        return a.timestamp == b.timestamp;
    }), bars.end());

    if (bars.size() != before) {
        LOG_WARN("Dropped {} duplicate timestamp(s){}{}", before - bars.size(),
                 source.empty() ? "" : " in ", source);
    }
    return bars;
}

std::vector<Bar> DataHistory::filterByDate(const std::vector<Bar>& bars,
                                           const std::string& start_date,
                                           const std::string& end_date) {
    TimestampMs lower = std::numeric_limits<TimestampMs>::min();
    TimestampMs upper = std::numeric_limits<TimestampMs>::max();

    if (!trim(start_date).empty()) {
        auto ts = utils::parseTimestamp(trim(start_date));
        if (!ts) {
            throw ConfigError("invalid start_date: " + start_date);
        }
        lower = *ts;
    }
    if (!trim(end_date).empty()) {
        const std::string end = trim(end_date);
        auto ts = utils::parseTimestamp(end);
        if (!ts) {
            throw ConfigError("invalid end_date: " + end_date);
        }
        upper = (end.size() == 10) ? (*ts + kDayMs - 1) : *ts;
    }
    if (lower > upper) {
        throw ConfigError("start_date is after end_date");
    }

    std::vector<Bar> out;
    out.reserve(bars.size());
    std::copy_if(bars.begin(), bars.end(), std::back_inserter(out), [&](const Bar& bar) {
        return bar.timestamp >= lower && bar.timestamp <= upper;
    });

    if (out.size() != bars.size()) {
        LOG_INFO("Date filter [{} .. {}] kept {} of {} bars",
                 start_date.empty() ? "*" : start_date, end_date.empty() ? "*" : end_date,
                 out.size(), bars.size());
    }
    return out;
}

size_t DataHistory::attachBenchmark(std::vector<Bar>& bars, const std::vector<Bar>& benchmark) {
    std::unordered_map<TimestampMs, double> closes;
    closes.reserve(benchmark.size());
    for (const auto& b : benchmark) {
        closes.emplace(b.timestamp, b.close);
    }

    size_t matched = 0;
    for (auto& bar : bars) {
        auto it = closes.find(bar.timestamp);
        if (it != closes.end()) {
            bar.benchmark_close = it->second;
            matched++;
        } else {
            bar.benchmark_close.reset();
        }
    }

    if (matched < bars.size()) {
        LOG_WARN("Benchmark covers {} of {} bars", matched, bars.size());
    }
    return matched;
}

void DataHistory::attachSelfBenchmark(std::vector<Bar>& bars) {
    for (auto& bar : bars) {
        bar.benchmark_close = bar.close;
    }
}

} // namespace backtest
} // namespace replaybt
