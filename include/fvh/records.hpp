#pragma once

/// @file include/fvh/records.hpp
/// @brief Flat key/value records for ParameterSet, Prediction,
///        ValidationMetrics and OptimizationEntry.
///
/// # Module: Records
///
/// ## Responsibility
/// Lossless conversion between the core types and `Record`, a sorted map of
/// string keys to string values, plus a one-line text encoding of a Record
/// used by the file-backed stores and parameter files.
///
/// ## Format
/// A line is a tab-separated list of `key=value` fields. Inside keys and
/// values a backslash, tab, newline and `=` are escaped as `\\`, `\t`, `\n`
/// and `\e`. Doubles are written in shortest round-trip form. Absent optional
/// fields are omitted.
///
/// ## Guarantees
/// - from_record(to_record(x)) == x for every supported type
/// - Malformed input gives nullopt, never a partially filled value
/// - A decoded ParameterSet that violates an invariant throws
///   InvalidParameterSet

#include "fvh/metrics.hpp"
#include "fvh/optimization.hpp"
#include "fvh/parameters.hpp"
#include "fvh/types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace fvh::records {

using Record = std::map<std::string, std::string>;

// ─── Line encoding ────────────────────────────────────────────────────────────

[[nodiscard]] std::string encode_line(const Record& record);
[[nodiscard]] std::optional<Record> decode_line(std::string_view line);

// ─── Conversions ──────────────────────────────────────────────────────────────

[[nodiscard]] Record to_record(const ParameterSet& params);
[[nodiscard]] Record to_record(const Prediction& prediction);
[[nodiscard]] Record to_record(const validation::ValidationMetrics& metrics);
[[nodiscard]] Record to_record(const validation::OptimizationEntry& entry);

[[nodiscard]] std::optional<ParameterSet> parameter_set_from_record(const Record& record);
[[nodiscard]] std::optional<Prediction> prediction_from_record(const Record& record);
[[nodiscard]] std::optional<validation::ValidationMetrics> metrics_from_record(const Record& record);
[[nodiscard]] std::optional<validation::OptimizationEntry> entry_from_record(const Record& record);

// ─── Identity ─────────────────────────────────────────────────────────────────

/// FNV-1a 64 over the encoded coefficients. Name and version are excluded,
/// so two sets that evaluate identically share a fingerprint.
[[nodiscard]] std::uint64_t fingerprint(const ParameterSet& params);

/// Result-store key: "<fingerprint>:<first>-<last>:n<sample>:t<min train>:
/// s<seed>:k<top k>:m<min sample>". Entries computed under different
/// sampling or metric settings never share a key.
[[nodiscard]] std::string entry_key(const validation::OptimizationEntry& entry);

// ─── Parameter files ──────────────────────────────────────────────────────────

/// First non-empty line not starting with '#', decoded as a ParameterSet.
/// @throws std::runtime_error if the file cannot be read or holds no valid
///         record; InvalidParameterSet if the record violates an invariant.
[[nodiscard]] ParameterSet load_parameter_file(const std::filesystem::path& path);

/// @throws std::runtime_error if the file cannot be written.
void save_parameter_file(const std::filesystem::path& path, const ParameterSet& params);

} // namespace fvh::records
