#pragma once

/// @file include/fvh/data_loader.hpp
/// @brief CSV loader for raw player snapshots.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV exports of per-player-per-period snapshots into RawSnapshots
/// ready to append to a snapshot store. Malformed rows are skipped and
/// counted; the loader never crashes on bad input.
///
/// ## Expected CSV Format
/// ```
/// player_id,period,position,points,minutes,shot_rate,shot_rate_baseline,price,fixture_difficulty,starter_status,starter_override,prior_baseline,revision
/// salah,1,M,12,90,0.82,0.75,13.0,-2,confirmed,,7.1,0
/// saka,1,M,,0,,,9.5,3,,bench,,0
/// ```
/// The header names the columns; order is free. `player_id`, `period` and
/// `position` are required, every other column is optional and an empty
/// cell means "absent".
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips individual bad rows rather than failing the entire load
/// - Does not modify any file or external state

#include "fvh/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fvh::core {

struct LoadReport {
    std::vector<RawSnapshot> snapshots;
    std::size_t              skipped_rows = 0;
};

/// Loads RawSnapshots from CSV files and strings.
class DataLoader {
public:
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - A report with no snapshots if the header is missing a required column
    [[nodiscard]] static std::optional<LoadReport>
    load_csv(const std::string& filepath) noexcept;

    /// Same format as `load_csv`; the first non-comment line is the header.
    [[nodiscard]] static LoadReport
    parse_csv_string(const std::string& csv_content) noexcept;

    /// A snapshot is valid if its id is non-empty, its period is >= 1, its
    /// revision is >= 0, and every numeric field present is finite. Minutes,
    /// shot rates, prices and prior baselines must also be non-negative.
    [[nodiscard]] static bool validate_snapshot(const RawSnapshot& snapshot) noexcept;
};

} // namespace fvh::core
