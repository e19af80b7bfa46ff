/// @file src/store/records.cpp
/// @brief Flat-record conversions and the one-line text encoding.

#include "fvh/records.hpp"
#include "fvh/errors.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace fvh::records {

namespace {

// ─── Escaping ─────────────────────────────────────────────────────────────────

std::string escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '=':  out += "\\e";  break;
            default:   out += c;
        }
    }
    return out;
}

std::optional<std::string> unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out += text[i];
            continue;
        }
        if (++i == text.size()) return std::nullopt;
        switch (text[i]) {
            case '\\': out += '\\'; break;
            case 't':  out += '\t'; break;
            case 'n':  out += '\n'; break;
            case 'e':  out += '=';  break;
            default:   return std::nullopt;
        }
    }
    return out;
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(sep, start);
        parts.push_back(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return parts;
}

// ─── Scalars ──────────────────────────────────────────────────────────────────

std::optional<double> parse_double(std::string_view text) noexcept {
    double value = 0.0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) return std::nullopt;
    return value;
}

template <typename Int>
std::optional<Int> parse_integer(std::string_view text) noexcept {
    Int value{};
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end || text.empty()) return std::nullopt;
    return value;
}

// ─── Writer / Reader ──────────────────────────────────────────────────────────

/// Puts typed fields into a Record under an optional key prefix.
class Writer {
public:
    Writer(Record& record, std::string prefix) : record_(record), prefix_(std::move(prefix)) {}

    void text(std::string_view key, std::string_view value) {
        record_[prefix_ + std::string(key)] = std::string(value);
    }
    void number(std::string_view key, double value) { text(key, fmt::format("{}", value)); }
    template <typename Int>
    void integer(std::string_view key, Int value) { text(key, fmt::format("{}", value)); }
    void flag(std::string_view key, bool value) { text(key, value ? "1" : "0"); }
    void optional_number(std::string_view key, const std::optional<double>& value) {
        if (value) number(key, *value);
    }
    void bounds(std::string_view key, const MultiplierBounds& b) {
        number(fmt::format("{}.min", key), b.min);
        number(fmt::format("{}.max", key), b.max);
    }
    void optional_bounds(std::string_view key, const std::optional<MultiplierBounds>& b) {
        if (b) bounds(key, *b);
    }

private:
    Record&     record_;
    std::string prefix_;
};

/// Reads typed fields out of a Record. Any missing or malformed required
/// field clears ok().
class Reader {
public:
    Reader(const Record& record, std::string prefix) : record_(record), prefix_(std::move(prefix)) {}

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    [[nodiscard]] bool has(std::string_view key) const {
        return record_.count(prefix_ + std::string(key)) != 0;
    }

    std::string text(std::string_view key) {
        const auto it = record_.find(prefix_ + std::string(key));
        if (it == record_.end()) {
            ok_ = false;
            return {};
        }
        return it->second;
    }

    double number(std::string_view key) {
        return require(parse_double(text(key)));
    }

    template <typename Int>
    Int integer(std::string_view key) {
        return require(parse_integer<Int>(text(key)));
    }

    bool flag(std::string_view key) {
        const std::string v = text(key);
        if (v != "0" && v != "1") ok_ = false;
        return v == "1";
    }

    std::optional<double> optional_number(std::string_view key) {
        if (!has(key)) return std::nullopt;
        return number(key);
    }

    MultiplierBounds bounds(std::string_view key) {
        return MultiplierBounds{number(fmt::format("{}.min", key)), number(fmt::format("{}.max", key))};
    }

    std::optional<MultiplierBounds> optional_bounds(std::string_view key) {
        if (!has(fmt::format("{}.min", key)) && !has(fmt::format("{}.max", key))) return std::nullopt;
        return bounds(key);
    }

    template <typename T>
    T require(const std::optional<T>& value) {
        if (!value) {
            ok_ = false;
            return T{};
        }
        return *value;
    }

private:
    const Record& record_;
    std::string   prefix_;
    bool          ok_ = true;
};

// ─── Compound fields ──────────────────────────────────────────────────────────

std::string join_numbers(const std::vector<double>& values) {
    std::string out;
    for (const double v : values) {
        if (!out.empty()) out += ',';
        out += fmt::format("{}", v);
    }
    return out;
}

std::optional<std::vector<double>> parse_numbers(std::string_view text) {
    std::vector<double> values;
    if (text.empty()) return values;
    for (const auto part : split(text, ',')) {
        const auto v = parse_double(part);
        if (!v) return std::nullopt;
        values.push_back(*v);
    }
    return values;
}

std::string join_tiers(const std::vector<FixtureTier>& tiers) {
    std::string out;
    for (const auto& t : tiers) {
        if (!out.empty()) out += ',';
        out += fmt::format("{}:{}", t.threshold, t.multiplier);
    }
    return out;
}

std::optional<std::vector<FixtureTier>> parse_tiers(std::string_view text) {
    std::vector<FixtureTier> tiers;
    if (text.empty()) return tiers;
    for (const auto part : split(text, ',')) {
        const auto colon = part.find(':');
        if (colon == std::string_view::npos) return std::nullopt;
        const auto threshold  = parse_double(part.substr(0, colon));
        const auto multiplier = parse_double(part.substr(colon + 1));
        if (!threshold || !multiplier) return std::nullopt;
        tiers.push_back(FixtureTier{*threshold, *multiplier});
    }
    return tiers;
}

constexpr std::array<Position, POSITION_COUNT> kPositions{
    Position::Goalkeeper, Position::Defender, Position::Midfielder, Position::Forward,
};

void write_parameters(Writer& w, const ParameterSet& p) {
    w.text("name", p.name);
    w.integer("version", p.version);
    w.number("decay_rate", p.decay_rate);
    w.integer("lookback", p.lookback);
    w.integer("adaptation_horizon", p.adaptation_horizon);
    w.bounds("form", p.form_bounds);
    w.bounds("fixture", p.fixture_bounds);
    w.bounds("ratio", p.ratio_bounds);
    w.optional_bounds("form_cap", p.form_cap);
    w.optional_bounds("fixture_cap", p.fixture_cap);
    w.optional_bounds("ratio_cap", p.ratio_cap);
    w.number("global_cap", p.global_cap);
    w.number("fixture_base", p.fixture_base);
    w.number("ratio_dampening", p.ratio_dampening);
    w.number("ratio_min_baseline", p.ratio_min_baseline);
    w.number("starter.rotation_risk", p.starter.rotation_risk);
    w.number("starter.bench", p.starter.bench);
    for (const auto pos : kPositions) {
        const auto& weights = p.weights_for(pos);
        w.number(fmt::format("position.{}.fixture_weight", to_string(pos)), weights.fixture_weight);
        w.text(fmt::format("position.{}.ratio_impact", to_string(pos)), to_string(weights.ratio_impact));
    }
    w.number("baseline_floor", p.baseline_floor);
    w.number("price_floor", p.price_floor);
    w.number("default_prior_baseline", p.default_prior_baseline);
    w.text("form_strategy", to_string(p.form_strategy));
    w.text("form_fixed_weights", join_numbers(p.form_fixed_weights));
    w.text("fixture_strategy", to_string(p.fixture_strategy));
    w.text("fixture_tiers", join_tiers(p.fixture_tiers));
}

std::optional<ParameterSet> read_parameters(Reader& r) {
    ParameterSet p;
    p.name               = r.text("name");
    p.version            = r.integer<int>("version");
    p.decay_rate         = r.number("decay_rate");
    p.lookback           = r.integer<std::size_t>("lookback");
    p.adaptation_horizon = r.integer<int>("adaptation_horizon");
    p.form_bounds        = r.bounds("form");
    p.fixture_bounds     = r.bounds("fixture");
    p.ratio_bounds       = r.bounds("ratio");
    p.form_cap           = r.optional_bounds("form_cap");
    p.fixture_cap        = r.optional_bounds("fixture_cap");
    p.ratio_cap          = r.optional_bounds("ratio_cap");
    p.global_cap         = r.number("global_cap");
    p.fixture_base       = r.number("fixture_base");
    p.ratio_dampening    = r.number("ratio_dampening");
    p.ratio_min_baseline = r.number("ratio_min_baseline");
    p.starter.rotation_risk = r.number("starter.rotation_risk");
    p.starter.bench         = r.number("starter.bench");
    for (const auto pos : kPositions) {
        auto& weights = p.positions[index_of(pos)];
        weights.fixture_weight = r.number(fmt::format("position.{}.fixture_weight", to_string(pos)));
        weights.ratio_impact   = r.require(
            parse_ratio_impact(r.text(fmt::format("position.{}.ratio_impact", to_string(pos)))));
    }
    p.baseline_floor         = r.number("baseline_floor");
    p.price_floor            = r.number("price_floor");
    p.default_prior_baseline = r.number("default_prior_baseline");
    p.form_strategy          = r.require(parse_form_strategy(r.text("form_strategy")));
    p.form_fixed_weights     = r.require(parse_numbers(r.text("form_fixed_weights")));
    p.fixture_strategy       = r.require(parse_fixture_strategy(r.text("fixture_strategy")));
    p.fixture_tiers          = r.require(parse_tiers(r.text("fixture_tiers")));

    if (!r.ok()) return std::nullopt;
    validate(p);
    return p;
}

void write_metrics(Writer& w, const validation::ValidationMetrics& m) {
    w.integer("sample_size", m.sample_size);
    w.number("rmse", m.rmse);
    w.number("mae", m.mae);
    w.number("bias", m.bias);
    w.number("r_squared", m.r_squared);
    w.number("spearman", m.spearman);
    w.number("spearman_p_value", m.spearman_p_value);
    w.number("precision_at_k", m.precision_at_k);
    w.integer("k", m.k);
    w.number("mean_predicted", m.mean_predicted);
    w.number("mean_actual", m.mean_actual);
    w.flag("sufficient", m.sufficient);
}

std::optional<validation::ValidationMetrics> read_metrics(Reader& r) {
    validation::ValidationMetrics m;
    m.sample_size      = r.integer<std::size_t>("sample_size");
    m.rmse             = r.number("rmse");
    m.mae              = r.number("mae");
    m.bias             = r.number("bias");
    m.r_squared        = r.number("r_squared");
    m.spearman         = r.number("spearman");
    m.spearman_p_value = r.number("spearman_p_value");
    m.precision_at_k   = r.number("precision_at_k");
    m.k                = r.integer<std::size_t>("k");
    m.mean_predicted   = r.number("mean_predicted");
    m.mean_actual      = r.number("mean_actual");
    m.sufficient       = r.flag("sufficient");
    if (!r.ok()) return std::nullopt;
    return m;
}

} // anonymous namespace

// ─── Line encoding ────────────────────────────────────────────────────────────

std::string encode_line(const Record& record) {
    std::string line;
    for (const auto& [key, value] : record) {
        if (!line.empty()) line += '\t';
        line += escape(key);
        line += '=';
        line += escape(value);
    }
    return line;
}

std::optional<Record> decode_line(std::string_view line) {
    Record record;
    if (line.empty()) return record;
    for (const auto field : split(line, '\t')) {
        const auto eq = field.find('=');
        if (eq == std::string_view::npos) return std::nullopt;
        auto key   = unescape(field.substr(0, eq));
        auto value = unescape(field.substr(eq + 1));
        if (!key || !value || key->empty()) return std::nullopt;
        if (!record.emplace(std::move(*key), std::move(*value)).second) return std::nullopt;
    }
    return record;
}

// ─── ParameterSet ─────────────────────────────────────────────────────────────

Record to_record(const ParameterSet& params) {
    Record record;
    Writer w(record, "");
    write_parameters(w, params);
    return record;
}

std::optional<ParameterSet> parameter_set_from_record(const Record& record) {
    Reader r(record, "");
    return read_parameters(r);
}

// ─── Prediction ───────────────────────────────────────────────────────────────

Record to_record(const Prediction& p) {
    Record record;
    Writer w(record, "");
    w.text("player_id", p.player_id);
    w.integer("period", p.period);
    w.text("parameter_set", p.parameter_set);
    w.text("position", to_string(p.position));
    w.number("blended_baseline", p.blended_baseline);
    w.number("blend_weight", p.blend_weight);
    w.number("form_multiplier", p.form_multiplier);
    w.number("fixture_multiplier", p.fixture_multiplier);
    w.number("starter_multiplier", p.starter_multiplier);
    w.number("ratio_multiplier", p.ratio_multiplier);
    w.number("final_value", p.final_value);
    w.number("value_per_price", p.value_per_price);
    w.number("price_used", p.price_used);
    w.flag("global_cap_applied", p.global_cap_applied);
    w.optional_number("fixture_difficulty", p.fixture_difficulty);
    if (!p.data_quality.empty()) {
        std::string issues;
        for (const auto issue : p.data_quality) {
            if (!issues.empty()) issues += ',';
            issues += to_string(issue);
        }
        w.text("data_quality", issues);
    }
    return record;
}

std::optional<Prediction> prediction_from_record(const Record& record) {
    Reader r(record, "");
    Prediction p;
    p.player_id          = r.text("player_id");
    p.period             = r.integer<Period>("period");
    p.parameter_set      = r.text("parameter_set");
    p.position           = r.require(parse_position(r.text("position")));
    p.blended_baseline   = r.number("blended_baseline");
    p.blend_weight       = r.number("blend_weight");
    p.form_multiplier    = r.number("form_multiplier");
    p.fixture_multiplier = r.number("fixture_multiplier");
    p.starter_multiplier = r.number("starter_multiplier");
    p.ratio_multiplier   = r.number("ratio_multiplier");
    p.final_value        = r.number("final_value");
    p.value_per_price    = r.number("value_per_price");
    p.price_used         = r.number("price_used");
    p.global_cap_applied = r.flag("global_cap_applied");
    p.fixture_difficulty = r.optional_number("fixture_difficulty");
    if (r.has("data_quality")) {
        const std::string issues = r.text("data_quality");
        for (const auto name : split(issues, ',')) {
            p.data_quality.push_back(r.require(parse_data_quality_issue(name)));
        }
    }
    if (!r.ok()) return std::nullopt;
    return p;
}

// ─── ValidationMetrics ────────────────────────────────────────────────────────

Record to_record(const validation::ValidationMetrics& metrics) {
    Record record;
    Writer w(record, "");
    write_metrics(w, metrics);
    return record;
}

std::optional<validation::ValidationMetrics> metrics_from_record(const Record& record) {
    Reader r(record, "");
    return read_metrics(r);
}

// ─── OptimizationEntry ────────────────────────────────────────────────────────

Record to_record(const validation::OptimizationEntry& entry) {
    Record record;
    Writer params(record, "param.");
    write_parameters(params, entry.parameters);
    Writer metrics(record, "metrics.");
    write_metrics(metrics, entry.metrics);

    Writer w(record, "");
    w.integer("range.first", entry.range.first);
    w.integer("range.last", entry.range.last);
    w.integer("sample.size", entry.sample_size);
    w.integer("sample.min_train", entry.min_train_periods);
    w.integer("sample.top_k", entry.metrics_config.top_k);
    w.integer("sample.min_sample", entry.metrics_config.min_sample);
    w.integer("seed", entry.seed);
    w.integer("succeeded", entry.succeeded);
    w.integer("failed", entry.failed);
    w.integer("excluded", entry.excluded);
    return record;
}

std::optional<validation::OptimizationEntry> entry_from_record(const Record& record) {
    Reader params(record, "param.");
    Reader metrics(record, "metrics.");
    Reader r(record, "");

    validation::OptimizationEntry entry;
    auto p = read_parameters(params);
    auto m = read_metrics(metrics);
    entry.range.first               = r.integer<Period>("range.first");
    entry.range.last                = r.integer<Period>("range.last");
    entry.sample_size               = r.integer<std::size_t>("sample.size");
    entry.min_train_periods         = r.integer<std::size_t>("sample.min_train");
    entry.metrics_config.top_k      = r.integer<std::size_t>("sample.top_k");
    entry.metrics_config.min_sample = r.integer<std::size_t>("sample.min_sample");
    entry.seed                      = r.integer<std::uint64_t>("seed");
    entry.succeeded                 = r.integer<std::size_t>("succeeded");
    entry.failed                    = r.integer<std::size_t>("failed");
    entry.excluded                  = r.integer<std::size_t>("excluded");
    if (!p || !m || !r.ok()) return std::nullopt;
    entry.parameters = std::move(*p);
    entry.metrics    = *m;
    return entry;
}

// ─── Identity ─────────────────────────────────────────────────────────────────

std::uint64_t fingerprint(const ParameterSet& params) {
    Record record = to_record(params);
    record.erase("name");
    record.erase("version");

    // FNV-1a, 64-bit.
    std::uint64_t hash = 14695981039346656037ULL;
    for (const unsigned char c : encode_line(record)) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::string entry_key(const validation::OptimizationEntry& entry) {
    return fmt::format("{:016x}:{}-{}:n{}:t{}:s{:x}:k{}:m{}", fingerprint(entry.parameters),
                       entry.range.first, entry.range.last, entry.sample_size,
                       entry.min_train_periods, entry.seed, entry.metrics_config.top_k,
                       entry.metrics_config.min_sample);
}

// ─── Parameter files ──────────────────────────────────────────────────────────

ParameterSet load_parameter_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(fmt::format("Cannot open parameter file: {}", path.string()));
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;
        const auto record = decode_line(line);
        if (!record) break;
        if (auto params = parameter_set_from_record(*record)) return *params;
        break;
    }
    throw std::runtime_error(fmt::format("No valid parameter record in {}", path.string()));
}

void save_parameter_file(const std::filesystem::path& path, const ParameterSet& params) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error(fmt::format("Cannot write parameter file: {}", path.string()));
    }
    out << "# " << params.identity() << '\n' << encode_line(to_record(params)) << '\n';
    if (!out) {
        throw std::runtime_error(fmt::format("Failed writing parameter file: {}", path.string()));
    }
}

} // namespace fvh::records
