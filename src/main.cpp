/// @file src/main.cpp
/// @brief fvh CLI entry point.
///
/// Usage:
///   fvh --trend <csv>           Recompute values over a period range
///   fvh --backtest <csv>        Backtest one period against realized points
///   fvh --optimize <csv>        Restartable grid search into a result file
///   fvh --cross-validate <csv>  Consecutive-fold cross-validation
///   fvh --stratify <csv>        Walk-forward metrics by position, fixture, price
///   fvh --compare <csv>         Two parameter sets over the same backtest
///   fvh --default-params <file> Write the default parameter set
///   fvh --help                  Print usage

#include "fvh/data_loader.hpp"
#include "fvh/records.hpp"
#include "fvh/result_store.hpp"
#include "fvh/snapshot_store.hpp"
#include "fvh/trend.hpp"
#include "fvh/validation.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

using namespace fvh;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  fvh --trend <csv>           [--from N] [--to M] [--player ID]... [--workers W] [--top K]\n"
        "  fvh --backtest <csv>        --test N [--from N] [--top K]\n"
        "  fvh --optimize <csv>        --results <file> [--from N] [--to M] [--sample S] [--seed X]\n"
        "  fvh --cross-validate <csv>  [--fold-size F] [--min-train T]\n"
        "  fvh --stratify <csv>        [--from N] [--to M] [--min-train T]\n"
        "  fvh --compare <csv>         --params <file> --params-b <file> [--from N] [--to M]\n"
        "  fvh --default-params <file>\n"
        "  fvh --help\n"
        "\n"
        "Common options:\n"
        "  --params <file>   Parameter set record file (default: built-in defaults)\n"
        "  --verbose         Progress and data-quality summaries on stderr\n"
        "\n"
        "CSV format (header required, order free):\n"
        "  player_id,period,position,points,minutes,shot_rate,shot_rate_baseline,price,\n"
        "  fixture_difficulty,starter_status,starter_override,prior_baseline,revision\n");
}

// ─── Arguments ────────────────────────────────────────────────────────────────

struct Args {
    std::string              mode;
    std::string              input;
    std::optional<std::string> params_path;
    std::optional<std::string> params_b_path;
    std::optional<std::string> results_path;
    std::optional<Period>    from;
    std::optional<Period>    to;
    std::optional<Period>    test;
    std::vector<PlayerId>    players;
    std::size_t              workers   = 1;
    std::size_t              top       = 10;
    std::size_t              sample    = 0;
    std::uint64_t            seed      = validation::OptimizationConfig{}.seed;
    std::size_t              fold_size = validation::CrossValidationConfig{}.fold_size;
    std::optional<std::size_t> min_train;
    bool                     verbose   = false;
};

template <typename T>
T parse_number(const std::string& flag, const std::string& text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error(fmt::format("{} expects a number, got '{}'", flag, text));
    }
    return value;
}

Args parse_args(int argc, char* argv[]) {
    Args args;
    args.mode = argv[1];
    if (args.mode == "--help" || args.mode == "-h") return args;
    if (argc < 3) {
        throw std::runtime_error(fmt::format("{} requires a file path", args.mode));
    }
    args.input = argv[2];

    for (int i = 3; i < argc; ++i) {
        const std::string key(argv[i]);
        if (key == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw std::runtime_error(fmt::format("{} requires a value", key));
        }
        const std::string val(argv[++i]);
        if (key == "--params")          args.params_path   = val;
        else if (key == "--params-b")   args.params_b_path = val;
        else if (key == "--results")    args.results_path  = val;
        else if (key == "--from")       args.from      = parse_number<Period>(key, val);
        else if (key == "--to")         args.to        = parse_number<Period>(key, val);
        else if (key == "--test")       args.test      = parse_number<Period>(key, val);
        else if (key == "--player")     args.players.push_back(val);
        else if (key == "--workers")    args.workers   = parse_number<std::size_t>(key, val);
        else if (key == "--top")        args.top       = parse_number<std::size_t>(key, val);
        else if (key == "--sample")     args.sample    = parse_number<std::size_t>(key, val);
        else if (key == "--seed")       args.seed      = parse_number<std::uint64_t>(key, val);
        else if (key == "--fold-size")  args.fold_size = parse_number<std::size_t>(key, val);
        else if (key == "--min-train")  args.min_train = parse_number<std::size_t>(key, val);
        else throw std::runtime_error(fmt::format("Unknown option: {}", key));
    }
    return args;
}

// ─── Shared setup ─────────────────────────────────────────────────────────────

ParameterSet load_params(const std::optional<std::string>& path) {
    return path ? records::load_parameter_file(*path) : ParameterSet::defaults();
}

void load_store(const Args& args, store::InMemorySnapshotStore& snapshots) {
    auto report = core::DataLoader::load_csv(args.input);
    if (!report) {
        throw std::runtime_error(fmt::format("Cannot open file '{}'", args.input));
    }
    if (report->snapshots.empty()) {
        throw std::runtime_error(fmt::format("No valid snapshots loaded from '{}'", args.input));
    }
    const std::size_t appended = snapshots.append_all(report->snapshots);
    if (args.verbose) {
        fmt::print(stderr, "Loaded {} snapshots from '{}' ({} rows skipped, {} duplicate or stale)\n",
                   appended, args.input, report->skipped_rows, report->snapshots.size() - appended);
    }
}

validation::PeriodRange resolve_range(const Args& args, const store::RawSnapshotStore& snapshots) {
    const auto periods = snapshots.periods();
    return validation::PeriodRange{
        .first = args.from.value_or(periods.front()),
        .last  = args.to.value_or(periods.back()),
    };
}

void print_pairs(const std::string& title, const std::vector<validation::PredictionOutcome>& pairs) {
    fmt::print("{}\n", title);
    for (const auto& p : pairs) {
        fmt::print("  {:<20} P{:<3} predicted={:7.3f} actual={:6.2f}\n",
                   p.prediction.player_id, p.prediction.period, p.prediction.final_value, p.actual);
    }
}

// ─── Modes ────────────────────────────────────────────────────────────────────

int run_trend(const Args& args) {
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet params = load_params(args.params_path);
    const auto range = resolve_range(args, snapshots);

    trend::TrendAnalysisEngine engine(snapshots, trend::TrendConfig{.workers = args.workers});

    if (args.players.size() == 1) {
        for (const auto& p : engine.player_trend(args.players.front(), params, range.first, range.last)) {
            fmt::print("{}\n", p.to_string());
        }
        return 0;
    }

    const trend::TrendRun run = engine.calculate(params, range.first, range.last, args.players);
    if (args.verbose) {
        fmt::print(stderr, "{}\n", run.to_string());
    }

    // Best value per price in the last period of the range.
    std::vector<Prediction> latest;
    std::copy_if(run.predictions.begin(), run.predictions.end(), std::back_inserter(latest),
                 [&](const Prediction& p) { return p.period == range.last; });
    std::sort(latest.begin(), latest.end(), [](const Prediction& a, const Prediction& b) {
        if (a.value_per_price != b.value_per_price) return a.value_per_price > b.value_per_price;
        return a.player_id < b.player_id;
    });
    latest.resize(std::min(latest.size(), args.top));

    fmt::print("{} predictions over periods {}-{} with {}\n",
               run.succeeded, range.first, range.last, run.parameter_set);
    fmt::print("Top {} by value per price in period {}:\n", latest.size(), range.last);
    for (const auto& p : latest) {
        fmt::print("  {}\n", p.to_string());
    }
    return 0;
}

int run_backtest(const Args& args) {
    if (!args.test) {
        throw std::runtime_error("--backtest requires --test <period>");
    }
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet params = load_params(args.params_path);

    std::vector<Period> train;
    for (const Period p : snapshots.periods()) {
        if (p < *args.test && p >= args.from.value_or(p)) train.push_back(p);
    }

    validation::ValidationEngine engine(snapshots);
    const auto result = engine.run_backtest(train, *args.test, params, args.players);
    fmt::print("Backtest of period {} on {} training periods with {}\n",
               *args.test, train.size(), params.identity());
    fmt::print("{} evaluated, {} excluded (no outcome), {} skipped (no history)\n",
               result.evaluated, result.excluded, result.skipped);
    fmt::print("{}\n", engine.compute_metrics(result.pairs).to_string());
    print_pairs("Top predicted:", validation::ValidationEngine::top_predictions(result.pairs, args.top));
    print_pairs("Top actual:", validation::ValidationEngine::top_actuals(result.pairs, args.top));
    return 0;
}

int run_optimize(const Args& args) {
    if (!args.results_path) {
        throw std::runtime_error("--optimize requires --results <file>");
    }
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet base = load_params(args.params_path);
    const auto range = resolve_range(args, snapshots);

    store::FileResultStore results(*args.results_path);
    if (results.skipped_lines() > 0) {
        fmt::print(stderr, "Warning: {} unreadable lines in '{}' ignored\n",
                   results.skipped_lines(), *args.results_path);
    }

    validation::OptimizationConfig config;
    config.sample_size = args.sample;
    config.seed        = args.seed;
    if (args.min_train) config.min_train_periods = *args.min_train;
    if (args.verbose) {
        config.on_entry = [](const validation::OptimizationEntry& e, std::size_t i,
                             std::size_t total, bool reused) {
            fmt::print(stderr, "[{}/{}] {} {}: {}\n", i + 1, total,
                       reused ? "reused  " : "computed", e.parameters.name, e.metrics.to_string());
        };
    }

    validation::ValidationEngine engine(snapshots);
    const auto run = engine.optimize(validation::ParameterGrid::defaults(), range, results, base, config);
    fmt::print("{}\n", run.to_string());
    return 0;
}

int run_cross_validate(const Args& args) {
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet params = load_params(args.params_path);

    validation::CrossValidationConfig config;
    config.fold_size = args.fold_size;
    if (args.min_train) config.min_train_periods = *args.min_train;

    validation::ValidationEngine engine(snapshots);
    const auto periods = snapshots.periods();
    fmt::print("{}\n", engine.cross_validate(periods, params, config).to_string());
    return 0;
}

int run_stratify(const Args& args) {
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet params = load_params(args.params_path);
    const auto range = resolve_range(args, snapshots);

    validation::ValidationEngine engine(snapshots);
    const auto wf = engine.walk_forward(params, range, args.min_train.value_or(1));
    fmt::print("Walk-forward over {} periods: {}\n", wf.tested_periods.size(),
               engine.compute_metrics(wf.pairs).to_string());
    for (const auto& s : engine.stratify(wf.pairs)) {
        fmt::print("  {:<9} {:<8} {}\n", s.dimension, s.label, s.metrics.to_string());
    }
    return 0;
}

int run_compare(const Args& args) {
    if (!args.params_b_path) {
        throw std::runtime_error("--compare requires --params-b <file>");
    }
    store::InMemorySnapshotStore snapshots;
    load_store(args, snapshots);
    const ParameterSet a = load_params(args.params_path);
    const ParameterSet b = load_params(args.params_b_path);
    const auto range = resolve_range(args, snapshots);

    validation::ValidationEngine engine(snapshots);
    fmt::print("{}\n", engine.compare(a, b, range, args.min_train.value_or(1)).to_string());
    return 0;
}

int dispatch(const Args& args) {
    if (args.mode == "--help" || args.mode == "-h") {
        print_usage();
        return 0;
    }
    if (args.mode == "--default-params") {
        records::save_parameter_file(args.input, ParameterSet::defaults());
        fmt::print("Wrote {} to '{}'\n", ParameterSet::defaults().identity(), args.input);
        return 0;
    }
    if (args.mode == "--trend")          return run_trend(args);
    if (args.mode == "--backtest")       return run_backtest(args);
    if (args.mode == "--optimize")       return run_optimize(args);
    if (args.mode == "--cross-validate") return run_cross_validate(args);
    if (args.mode == "--stratify")       return run_stratify(args);
    if (args.mode == "--compare")        return run_compare(args);

    fmt::print(stderr, "Unknown option: {}\n", args.mode);
    print_usage();
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    try {
        return dispatch(parse_args(argc, argv));
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
    }
    return 1;
}
