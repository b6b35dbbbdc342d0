#pragma once

#include "bar.hpp"
#include <vector>
#include <string>
#include <optional>

namespace ensemble {

/// Broken-down timestamp. Fields not present in the text are left at 0.
struct TimeParts {
    int year{0};
    int month{0};
    int day{0};
    int hour{0};
    int minute{0};
};

/// Parse "2024-01-02", "2024-01-02T13:00[:00]" or "2024-01-02 13:00:00".
/// Returns std::nullopt if the date part is unparseable.
std::optional<TimeParts> parseTimestamp(const std::string& ts);

/// Loads OHLCV bars from a CSV file.
/// CSV: expected columns timestamp/date, open, high, low, close [, volume] [, regime].
/// The first unparseable row, bad number ("101abc") or timestamp that is not strictly
/// after the previous one fails the load with file and line in error().
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from CSV file. Returns false (see error()) on open, header or row failure;
    /// no bars are kept in that case.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const std::string& error() const { return error_; }

    const Bar& at(std::size_t i) const { return bars_.at(i); }

private:
    struct Columns {
        int date{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
        int regime{-1};
    };

    std::string filepath_;
    std::vector<Bar> bars_;
    std::string error_;

    static std::optional<Bar> parseLine(const std::string& line, const Columns& cols);
};

} // namespace ensemble
