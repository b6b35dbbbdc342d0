#include "data_source.hpp"
#include "text_util.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace ensemble {

namespace {

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

bool hasColumn(const std::vector<std::string>& parts, int idx) {
    return idx >= 0 && static_cast<std::size_t>(idx) < parts.size();
}

bool isBefore(const TimeParts& a, const TimeParts& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    if (a.day != b.day) return a.day < b.day;
    if (a.hour != b.hour) return a.hour < b.hour;
    return a.minute < b.minute;
}

} // namespace

std::optional<TimeParts> parseTimestamp(const std::string& ts) {
    TimeParts tp;
    std::string s = ts;
    for (auto& c : s) if (c == '_') c = ':';
    std::string datePart, timePart;
    auto tPos = s.find('T');
    auto spPos = s.find(' ');
    if (tPos != std::string::npos) {
        datePart = s.substr(0, tPos);
        timePart = s.substr(tPos + 1);
    } else if (spPos != std::string::npos) {
        datePart = s.substr(0, spPos);
        timePart = s.substr(spPos + 1);
    } else {
        datePart = s;
    }
    // Date YYYY-MM-DD
    if (datePart.size() < 10) return std::nullopt;
    try {
        tp.year = std::stoi(datePart.substr(0, 4));
        tp.month = std::stoi(datePart.substr(5, 2));
        tp.day = std::stoi(datePart.substr(8, 2));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (!timePart.empty()) {
        auto colon1 = timePart.find(':');
        if (colon1 != std::string::npos) {
            try {
                tp.hour = std::stoi(timePart.substr(0, colon1));
                auto colon2 = timePart.find(':', colon1 + 1);
                tp.minute = std::stoi(timePart.substr(colon1 + 1,
                    colon2 == std::string::npos ? std::string::npos : colon2 - (colon1 + 1)));
            } catch (const std::exception&) { /* keep 0,0 */ }
        }
    }
    return tp;
}

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    error_.clear();

    std::ifstream f(filepath_);
    if (!f.is_open()) {
        error_ = "cannot open data file: " + filepath_;
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        error_ = "data file is empty: " + filepath_;
        return false;
    }
    // Tolerate a UTF-8 BOM (our own CSV writers emit one).
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    Columns cols;
    cols.date = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    cols.open = findColumn(headers, {"open", "o"});
    cols.high = findColumn(headers, {"high", "h"});
    cols.low = findColumn(headers, {"low", "l"});
    cols.close = findColumn(headers, {"close", "c"});
    cols.volume = findColumn(headers, {"volume", "vol", "v"});
    cols.regime = findColumn(headers, {"regime", "volatility_regime"});

    if (cols.date < 0 || cols.open < 0 || cols.high < 0 || cols.low < 0 || cols.close < 0) {
        error_ = "missing required column (timestamp, open, high, low, close) in " + filepath_;
        return false;
    }

    std::size_t line_no = 1;
    std::optional<TimeParts> prev_time;
    while (std::getline(f, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        const std::string where = filepath_ + ":" + std::to_string(line_no) + ": ";
        auto bar = parseLine(line, cols);
        if (!bar) {
            error_ = where + "malformed row \"" + trim(line) + "\"";
            bars_.clear();
            return false;
        }
        auto time = parseTimestamp(bar->timestamp);
        if (!time) {
            error_ = where + "unparseable timestamp \"" + bar->timestamp + "\"";
            bars_.clear();
            return false;
        }
        if (prev_time && !isBefore(*prev_time, *time)) {
            error_ = where + "timestamp " + bar->timestamp + " is not after " + bars_.back().timestamp;
            bars_.clear();
            return false;
        }
        prev_time = time;
        bars_.push_back(*bar);
    }

    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line, const Columns& cols) {
    auto parts = split(line, ',');
    if (!hasColumn(parts, cols.date) || !hasColumn(parts, cols.open) || !hasColumn(parts, cols.high)
        || !hasColumn(parts, cols.low) || !hasColumn(parts, cols.close))
        return std::nullopt;

    Bar b;
    b.timestamp = parts[static_cast<std::size_t>(cols.date)];
    if (!parseDouble(parts[static_cast<std::size_t>(cols.open)], b.open)
        || !parseDouble(parts[static_cast<std::size_t>(cols.high)], b.high)
        || !parseDouble(parts[static_cast<std::size_t>(cols.low)], b.low)
        || !parseDouble(parts[static_cast<std::size_t>(cols.close)], b.close))
        return std::nullopt;
    if (hasColumn(parts, cols.volume) && !parts[static_cast<std::size_t>(cols.volume)].empty()
        && !parseDouble(parts[static_cast<std::size_t>(cols.volume)], b.volume))
        return std::nullopt;
    if (hasColumn(parts, cols.regime))
        b.regime = parts[static_cast<std::size_t>(cols.regime)];
    return b;
}

} // namespace ensemble
