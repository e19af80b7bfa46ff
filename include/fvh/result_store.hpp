#pragma once

/// @file include/fvh/result_store.hpp
/// @brief Append-only store of grid-search entries, keyed by
///        (ParameterSet fingerprint, period range, evaluation settings).
///
/// An entry is written once. Appending an existing key is a no-op, which is
/// what makes an interrupted grid search restartable.

#include "fvh/optimization.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fvh::store {

class ResultStore {
public:
    virtual ~ResultStore() = default;

    /// Store `entry` unless its key exists. Returns true if it was written.
    virtual bool append(const validation::OptimizationEntry& entry) = 0;

    [[nodiscard]] virtual std::optional<validation::OptimizationEntry>
    find(const std::string& key) const = 0;

    /// Insertion order.
    [[nodiscard]] virtual std::vector<validation::OptimizationEntry> entries() const = 0;
};

class InMemoryResultStore final : public ResultStore {
public:
    bool append(const validation::OptimizationEntry& entry) override;
    [[nodiscard]] std::optional<validation::OptimizationEntry>
    find(const std::string& key) const override;
    [[nodiscard]] std::vector<validation::OptimizationEntry> entries() const override;

private:
    std::vector<validation::OptimizationEntry> entries_;
    std::map<std::string, std::size_t>         index_;
};

/// One encoded record per line. Existing lines are loaded on construction;
/// new entries are appended and flushed immediately.
class FileResultStore final : public ResultStore {
public:
    /// @throws std::runtime_error if the file cannot be opened for append.
    explicit FileResultStore(std::filesystem::path path);

    bool append(const validation::OptimizationEntry& entry) override;
    [[nodiscard]] std::optional<validation::OptimizationEntry>
    find(const std::string& key) const override;
    [[nodiscard]] std::vector<validation::OptimizationEntry> entries() const override;

    /// Lines that failed to decode when the file was loaded.
    [[nodiscard]] std::size_t skipped_lines() const noexcept { return skipped_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    InMemoryResultStore   cache_;
    std::ofstream         out_;
    std::size_t           skipped_ = 0;
};

} // namespace fvh::store
