#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace replaybt {
namespace backtest {

// Historical bar loading. Every loader returns bars sorted ascending with
// duplicate timestamps removed; unreadable or empty input throws DataError.
class DataHistory {
public:
    // Dispatches on the extension: ".json" -> loadJSON, anything else -> loadCSV
    static std::vector<Bar> load(const std::string& file_path);

    // Expected format: timestamp,open,high,low,close,volume[,benchmark_close]
    // A leading header row is skipped. Timestamps: epoch s/ms or ISO date-time.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Array of objects with long (open/close/...) or short (o/c/...) keys
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Sorts by timestamp and drops repeated timestamps, keeping the first.
    static std::vector<Bar> normalize(std::vector<Bar> bars, const std::string& source = "");

    // Keeps bars in [start_date, end_date]. A date-only end_date covers the whole day.
    // Empty bounds are open. Throws ConfigError for an unparsable date.
    static std::vector<Bar> filterByDate(const std::vector<Bar>& bars,
                                         const std::string& start_date,
                                         const std::string& end_date);

    // Joins benchmark closes by timestamp; unmatched bars keep no benchmark.
    // Returns the number of bars that received a benchmark value.
    static size_t attachBenchmark(std::vector<Bar>& bars, const std::vector<Bar>& benchmark);

    // Buy-and-hold benchmark: every bar's own close, replacing any loaded value.
    static void attachSelfBenchmark(std::vector<Bar>& bars);
};

} // namespace backtest
} // namespace replaybt
