#undef NDEBUG
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/TimeUtils.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace replaybt;
using namespace replaybt::backtest;

namespace {
void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

TimestampMs ts(const std::string& text) {
    auto parsed = utils::parseTimestamp(text);
    assert(parsed);
    return *parsed;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "replaybt_test_data";
    std::filesystem::create_directories(dir);

    // Timestamp parsing
    {
        assert(ts("1970-01-02") == 86400000LL);
        assert(ts("2024-01-01T00:00:00") == 1704067200000LL);
        assert(ts("2024-01-01 01:30") == 1704072600000LL);
        assert(ts("1704067200") == 1704067200000LL);
        assert(ts("1704067200000") == 1704067200000LL);
        assert(!utils::parseTimestamp("timestamp"));
        assert(!utils::parseTimestamp("2024-13-01"));
        assert(utils::formatTimestamp(1704072600000LL) == "2024-01-01 01:30:00");
    }

    // CSV: BOM header, quotes, unsorted rows, duplicates, bad rows, benchmark column
    {
        const auto path = dir / "bars.csv";
        writeFile(path,
                  "\xEF\xBB\xBFtimestamp,open,high,low,close,volume,benchmark_close\n"
                  "2024-01-01 02:00:00,3,3,3,3,30,\n"
                  "\"2024-01-01 00:00:00\",1,1,1,1,10,100\n"
                  "2024-01-01 01:00:00,2,2,2,2,20,101\n"
                  "2024-01-01 01:00:00,9,9,9,9,90,999\n"
                  "2024-01-01 03:00:00,4,4,4,abc,40\n"
                  "garbage,1,2\n"
                  "\n");

        auto bars = DataHistory::loadCSV(path.string());
        assert(bars.size() == 3);
        assert(bars[0].timestamp == ts("2024-01-01 00:00:00"));
        assert(bars[0].close == 1.0);
        assert(bars[0].volume == 10.0);
        assert(bars[0].benchmark_close && *bars[0].benchmark_close == 100.0);
        // First of the duplicate pair (file order) is kept
        assert(bars[1].close == 2.0);
        assert(*bars[1].benchmark_close == 101.0);
        assert(!bars[2].benchmark_close);
        for (size_t i = 1; i < bars.size(); ++i) {
            assert(bars[i].timestamp > bars[i - 1].timestamp);
        }

        auto dispatched = DataHistory::load(path.string());
        assert(dispatched.size() == bars.size());
    }

    // CSV with epoch seconds and no header
    {
        const auto path = dir / "epoch.csv";
        writeFile(path, "1704067200,1,1,1,10,1\n1704070800,1,1,1,11,1\n");
        auto bars = DataHistory::loadCSV(path.string());
        assert(bars.size() == 2);
        assert(bars[1].timestamp == 1704070800000LL);
        assert(bars[1].close == 11.0);
    }

    // JSON with short keys and string timestamps
    {
        const auto path = dir / "bars.json";
        writeFile(path, R"([
            {"t": "2024-01-02", "o": 1, "h": 2, "l": 0.5, "c": 1.5, "v": 100},
            {"timestamp": 1704067200000, "open": 1, "high": 1, "low": 1, "close": 1.25, "volume": 5}
        ])");
        auto bars = DataHistory::load(path.string());
        assert(bars.size() == 2);
        assert(bars[0].timestamp == 1704067200000LL);
        assert(bars[0].close == 1.25);
        assert(bars[1].close == 1.5);
        assert(bars[1].high == 2.0);
    }

    // Errors
    {
        bool thrown = false;
        try {
            DataHistory::loadCSV((dir / "missing.csv").string());
        } catch (const DataError&) {
            thrown = true;
        }
        assert(thrown);

        const auto header_only = dir / "empty.csv";
        writeFile(header_only, "timestamp,open,high,low,close,volume\n");
        thrown = false;
        try {
            DataHistory::loadCSV(header_only.string());
        } catch (const DataError&) {
            thrown = true;
        }
        assert(thrown);

        const auto broken = dir / "broken.json";
        writeFile(broken, "[{\"t\": 1, \"c\": ");
        thrown = false;
        try {
            DataHistory::loadJSON(broken.string());
        } catch (const DataError&) {
            thrown = true;
        }
        assert(thrown);

        const auto no_close = dir / "no_close.json";
        writeFile(no_close, R"([{"t": 1704067200, "o": 1}])");
        thrown = false;
        try {
            DataHistory::loadJSON(no_close.string());
        } catch (const DataError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Date filtering: date-only end covers the whole day
    {
        std::vector<Bar> bars;
        for (int h = 0; h < 72; h += 6) {
            bars.emplace_back(1, 1, 1, 1, 1, ts("2024-01-01") + h * 3600000LL);
        }
        auto day2 = DataHistory::filterByDate(bars, "2024-01-02", "2024-01-02");
        assert(day2.size() == 4);
        assert(day2.front().timestamp == ts("2024-01-02"));
        assert(day2.back().timestamp == ts("2024-01-02 18:00"));

        auto open_ended = DataHistory::filterByDate(bars, "", "2024-01-01");
        assert(open_ended.size() == 4);
        assert(DataHistory::filterByDate(bars, "", "").size() == bars.size());

        bool thrown = false;
        try {
            DataHistory::filterByDate(bars, "01/02/2024", "");
        } catch (const ConfigError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            DataHistory::filterByDate(bars, "2024-01-03", "2024-01-01");
        } catch (const ConfigError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Benchmark joins
    {
        std::vector<Bar> bars;
        std::vector<Bar> index;
        for (int i = 0; i < 4; ++i) {
            bars.emplace_back(1, 1, 1, 10.0 + i, 1, 1000LL * i);
            if (i != 2) {
                index.emplace_back(1, 1, 1, 200.0 + i, 1, 1000LL * i);
            }
        }
        auto matched = DataHistory::attachBenchmark(bars, index);
        assert(matched == 3);
        assert(*bars[0].benchmark_close == 200.0);
        assert(!bars[2].benchmark_close);
        assert(*bars[3].benchmark_close == 203.0);

        // Self benchmark never mixes with a partial series
        DataHistory::attachSelfBenchmark(bars);
        for (const auto& bar : bars) {
            assert(bar.benchmark_close);
            assert(*bar.benchmark_close == bar.close);
        }
    }

    std::filesystem::remove_all(dir);
    std::cout << "[TEST] DataHistory PASSED\n";
    return 0;
}
