/// @file src/store/result_store.cpp
/// @brief In-memory and line-file ResultStore implementations.

#include "fvh/result_store.hpp"
#include "fvh/errors.hpp"
#include "fvh/records.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace fvh::store {

// ─── InMemoryResultStore ──────────────────────────────────────────────────────

bool InMemoryResultStore::append(const validation::OptimizationEntry& entry) {
    const std::string key = entry.key();
    if (index_.count(key) != 0) return false;
    index_.emplace(key, entries_.size());
    entries_.push_back(entry);
    return true;
}

std::optional<validation::OptimizationEntry>
InMemoryResultStore::find(const std::string& key) const {
    const auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second];
}

std::vector<validation::OptimizationEntry> InMemoryResultStore::entries() const {
    return entries_;
}

// ─── FileResultStore ──────────────────────────────────────────────────────────

FileResultStore::FileResultStore(std::filesystem::path path)
    : path_(std::move(path)) {
    if (std::filesystem::is_regular_file(path_)) {
        std::ifstream in(path_);
        if (!in.is_open()) {
            throw std::runtime_error(fmt::format("Cannot read result store: {}", path_.string()));
        }
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            const auto record = records::decode_line(line);
            std::optional<validation::OptimizationEntry> entry;
            if (record) {
                try {
                    entry = records::entry_from_record(*record);
                } catch (const InvalidParameterSet&) {
                    entry.reset();  // counted below with the other unreadable lines
                }
            }
            if (entry) {
                cache_.append(*entry);
            } else {
                ++skipped_;
            }
        }
    }

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        throw std::runtime_error(fmt::format("Cannot open result store for append: {}", path_.string()));
    }
}

bool FileResultStore::append(const validation::OptimizationEntry& entry) {
    if (cache_.find(entry.key())) return false;
    out_ << records::encode_line(records::to_record(entry)) << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error(fmt::format("Failed writing result store: {}", path_.string()));
    }
    // Cached only once the line is on disk.
    return cache_.append(entry);
}

std::optional<validation::OptimizationEntry>
FileResultStore::find(const std::string& key) const {
    return cache_.find(key);
}

std::vector<validation::OptimizationEntry> FileResultStore::entries() const {
    return cache_.entries();
}

} // namespace fvh::store
