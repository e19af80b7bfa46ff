/// @file src/validation/grid_search.cpp
/// @brief Restartable grid search over ParameterSets.
///
/// Every combination is walk-forward backtested over the same period range.
/// Each finished entry is written to the ResultStore before the next one
/// starts, so an interrupted search resumes where it stopped.

#include "fvh/validation.hpp"
#include "fvh/records.hpp"

#include <fmt/format.h>

#include <utility>

namespace fvh::validation {

namespace {

/// SplitMix64 finaliser over (run seed, parameter fingerprint). The same
/// ParameterSet gets the same sampling seed wherever it sits in a grid.
std::uint64_t mix_seed(std::uint64_t run_seed, std::uint64_t fingerprint) noexcept {
    std::uint64_t z = run_seed + 0x9E3779B97F4A7C15ULL * (fingerprint + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

} // anonymous namespace

// ─── ParameterGrid ────────────────────────────────────────────────────────────

std::size_t ParameterGrid::size() const noexcept {
    return decay_rates.size() * adaptation_horizons.size() * form_caps.size() * ratio_caps.size();
}

ParameterSet ParameterGrid::combination(std::size_t index, const ParameterSet& base) const {
    const std::size_t r = index % ratio_caps.size();
    index /= ratio_caps.size();
    const std::size_t f = index % form_caps.size();
    index /= form_caps.size();
    const std::size_t k = index % adaptation_horizons.size();
    const std::size_t a = index / adaptation_horizons.size();

    ParameterSet p       = base;
    p.decay_rate         = decay_rates.at(a);
    p.adaptation_horizon = adaptation_horizons[k];
    p.form_cap           = form_caps[f];
    p.ratio_cap          = ratio_caps[r];
    p.name = fmt::format("{}-a{}-K{}-form{}:{}-ratio{}:{}", base.name, p.decay_rate,
                         p.adaptation_horizon, form_caps[f].min, form_caps[f].max,
                         ratio_caps[r].min, ratio_caps[r].max);
    return p;
}

ParameterGrid ParameterGrid::defaults() {
    return ParameterGrid{
        .decay_rates         = {0.75, 0.80, 0.85, 0.87, 0.90, 0.95},
        .adaptation_horizons = {12, 14, 16, 18, 20},
        .form_caps           = {{0.4, 2.2}, {0.5, 2.0}, {0.6, 1.8}},
        .ratio_caps          = {{0.3, 2.8}, {0.4, 2.5}, {0.5, 2.2}},
    };
}

// ─── OptimizationEntry / OptimizationRun ──────────────────────────────────────

std::string OptimizationEntry::key() const {
    return records::entry_key(*this);
}

std::optional<OptimizationEntry> OptimizationRun::best() const {
    if (!best_index) return std::nullopt;
    return entries[*best_index];
}

std::string OptimizationRun::to_string() const {
    std::string out = fmt::format("{} entries ({} computed, {} reused)",
                                  entries.size(), computed, reused);
    if (const auto b = best()) {
        out += fmt::format("\nbest: {}\n  {}", b->parameters.identity(), b->metrics.to_string());
    } else {
        out += "\nbest: none (no entry had a sufficient sample)";
    }
    return out;
}

// ─── ValidationEngine::optimize ───────────────────────────────────────────────

OptimizationRun ValidationEngine::optimize(const ParameterGrid& grid,
                                           PeriodRange range,
                                           store::ResultStore& results,
                                           const ParameterSet& base,
                                           const OptimizationConfig& config) const {
    // Build and validate every combination before evaluating any.
    std::vector<ParameterSet> combinations;
    combinations.reserve(grid.size());
    for (std::size_t i = 0; i < grid.size(); ++i) {
        combinations.push_back(grid.combination(i, base));
        validate(combinations.back());
    }

    OptimizationRun run;
    for (std::size_t i = 0; i < combinations.size(); ++i) {
        const ParameterSet& params = combinations[i];

        OptimizationEntry entry{
            .parameters        = params,
            .range             = range,
            .sample_size       = config.sample_size,
            .min_train_periods = config.min_train_periods,
            .seed              = config.sample_size == 0
                                     ? 0
                                     : mix_seed(config.seed, records::fingerprint(params)),
            .metrics_config    = config.metrics,
        };

        bool reused = false;
        if (auto stored = results.find(entry.key())) {
            run.entries.push_back(std::move(*stored));
            ++run.reused;
            reused = true;
        } else {
            const WalkForwardResult wf = walk_forward(params, range, config.min_train_periods,
                                                      config.sample_size, entry.seed);
            entry.metrics   = MetricsCalculator::compute(wf.pairs, config.metrics);
            entry.succeeded = wf.pairs.size();
            entry.failed    = wf.skipped;
            entry.excluded  = wf.excluded;
            results.append(entry);
            run.entries.push_back(std::move(entry));
            ++run.computed;
        }

        const OptimizationEntry& e = run.entries.back();
        if (e.metrics.sufficient &&
            (!run.best_index || e.metrics.rmse < run.entries[*run.best_index].metrics.rmse)) {
            run.best_index = run.entries.size() - 1;
        }
        if (config.on_entry) {
            config.on_entry(e, i, combinations.size(), reused);
        }
    }
    return run;
}

} // namespace fvh::validation
