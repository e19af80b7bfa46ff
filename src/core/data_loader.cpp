/// @file src/core/data_loader.cpp
/// @brief CSV DataLoader for raw player snapshots.

#include "fvh/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <system_error>

namespace fvh::core {

namespace {

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        const auto start = field.find_first_not_of(" \t\r\n");
        const auto end   = field.find_last_not_of(" \t\r\n");
        fields.push_back(start == std::string::npos ? std::string{}
                                                    : field.substr(start, end - start + 1));
    }
    // A trailing comma yields one more (empty) field.
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

int find_col(const std::vector<std::string>& hdr, const std::string& name) {
    for (int i = 0; i < static_cast<int>(hdr.size()); ++i) {
        std::string h = hdr[static_cast<std::size_t>(i)];
        std::transform(h.begin(), h.end(), h.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (h == name) return i;
    }
    return -1;
}

/// Column indices; -1 when the header lacks the column.
struct ColumnMap {
    int player_id          = -1;
    int period             = -1;
    int position           = -1;
    int points             = -1;
    int minutes            = -1;
    int shot_rate          = -1;
    int shot_rate_baseline = -1;
    int price              = -1;
    int fixture_difficulty = -1;
    int starter_status     = -1;
    int starter_override   = -1;
    int prior_baseline     = -1;
    int revision           = -1;

    [[nodiscard]] bool has_required() const noexcept {
        return player_id >= 0 && period >= 0 && position >= 0;
    }
};

ColumnMap map_columns(const std::vector<std::string>& hdr) {
    return ColumnMap{
        .player_id          = find_col(hdr, "player_id"),
        .period             = find_col(hdr, "period"),
        .position           = find_col(hdr, "position"),
        .points             = find_col(hdr, "points"),
        .minutes            = find_col(hdr, "minutes"),
        .shot_rate          = find_col(hdr, "shot_rate"),
        .shot_rate_baseline = find_col(hdr, "shot_rate_baseline"),
        .price              = find_col(hdr, "price"),
        .fixture_difficulty = find_col(hdr, "fixture_difficulty"),
        .starter_status     = find_col(hdr, "starter_status"),
        .starter_override   = find_col(hdr, "starter_override"),
        .prior_baseline     = find_col(hdr, "prior_baseline"),
        .revision           = find_col(hdr, "revision"),
    };
}

/// A cell parsed as an optional value: empty = absent, malformed = bad.
template <typename T>
struct Cell {
    std::optional<T> value;
    bool             bad = false;
};

const std::string& cell_text(const std::vector<std::string>& fields, int col) {
    static const std::string empty;
    if (col < 0 || static_cast<std::size_t>(col) >= fields.size()) return empty;
    return fields[static_cast<std::size_t>(col)];
}

Cell<double> number_cell(const std::vector<std::string>& fields, int col) {
    const std::string& text = cell_text(fields, col);
    if (text.empty()) return {};
    double v = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(v)) {
        return Cell<double>{.value = std::nullopt, .bad = true};
    }
    return Cell<double>{.value = v, .bad = false};
}

Cell<int> int_cell(const std::vector<std::string>& fields, int col) {
    const std::string& text = cell_text(fields, col);
    if (text.empty()) return {};
    int v = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Cell<int>{.value = std::nullopt, .bad = true};
    }
    return Cell<int>{.value = v, .bad = false};
}

Cell<StarterStatus> status_cell(const std::vector<std::string>& fields, int col) {
    const std::string& text = cell_text(fields, col);
    if (text.empty()) return {};
    const auto s = parse_starter_status(text);
    return Cell<StarterStatus>{.value = s, .bad = !s.has_value()};
}

std::optional<RawSnapshot> parse_row(const std::vector<std::string>& fields, const ColumnMap& cols) {
    const std::string& id = cell_text(fields, cols.player_id);
    const auto period     = int_cell(fields, cols.period);
    const auto position   = parse_position(cell_text(fields, cols.position));
    if (id.empty() || !period.value || !position) {
        return std::nullopt;
    }

    const auto points   = number_cell(fields, cols.points);
    const auto minutes  = number_cell(fields, cols.minutes);
    const auto rate     = number_cell(fields, cols.shot_rate);
    const auto rate_bl  = number_cell(fields, cols.shot_rate_baseline);
    const auto price    = number_cell(fields, cols.price);
    const auto fixture  = number_cell(fields, cols.fixture_difficulty);
    const auto status   = status_cell(fields, cols.starter_status);
    const auto manual   = status_cell(fields, cols.starter_override);
    const auto prior    = number_cell(fields, cols.prior_baseline);
    const auto revision = int_cell(fields, cols.revision);

    if (points.bad || minutes.bad || rate.bad || rate_bl.bad || price.bad || fixture.bad ||
        status.bad || manual.bad || prior.bad || revision.bad) {
        return std::nullopt;
    }

    RawSnapshot s{
        .player_id          = id,
        .period             = *period.value,
        .position           = *position,
        .points             = points.value,
        .minutes            = minutes.value.value_or(0.0),
        .shot_rate          = rate.value,
        .shot_rate_baseline = rate_bl.value,
        .price              = price.value,
        .fixture_difficulty = fixture.value,
        .starter_status     = status.value,
        .starter_override   = manual.value,
        .prior_baseline     = prior.value,
        .revision           = revision.value.value_or(0),
    };

    if (!DataLoader::validate_snapshot(s)) {
        return std::nullopt;
    }
    return s;
}

} // anonymous namespace

// ─── DataLoader::validate_snapshot ────────────────────────────────────────────

bool DataLoader::validate_snapshot(const RawSnapshot& s) noexcept {
    if (s.player_id.empty() || s.period < 1 || s.revision < 0) return false;

    const auto finite = [](const std::optional<double>& v) { return !v || std::isfinite(*v); };
    const auto non_negative = [](const std::optional<double>& v) { return !v || *v >= 0.0; };

    if (!std::isfinite(s.minutes) || s.minutes < 0.0) return false;
    if (!finite(s.points) || !finite(s.fixture_difficulty)) return false;
    for (const auto& v : {s.shot_rate, s.shot_rate_baseline, s.price, s.prior_baseline}) {
        if (!finite(v) || !non_negative(v)) return false;
    }
    return true;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

LoadReport DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadReport report;
    std::istringstream stream(csv_content);
    std::string line;
    std::optional<ColumnMap> cols;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (!cols) {
            // First non-empty, non-comment line is the header.
            cols = map_columns(split_csv(line));
            if (!cols->has_required()) {
                return report;
            }
            continue;
        }

        if (auto snapshot = parse_row(split_csv(line), *cols)) {
            report.snapshots.push_back(std::move(*snapshot));
        } else {
            ++report.skipped_rows;
        }
    }

    return report;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<LoadReport> DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace fvh::core
