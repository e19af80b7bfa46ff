/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the snapshot CSV loader.
 *
 * Build:
 *   cmake -DFVH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Every returned snapshot passes DataLoader::validate_snapshot.
 *   3. Appending the snapshots to a store and evaluating every player at
 *      every stored period never yields a negative final value. Extreme
 *      but finite inputs may overflow to inf; that is not a failure.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "fvh/data_loader.hpp"
#include "fvh/formula.hpp"
#include "fvh/snapshot_store.hpp"

using namespace fvh;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const core::LoadReport report = core::DataLoader::parse_csv_string(input);
    for (const auto& s : report.snapshots) {
        assert(core::DataLoader::validate_snapshot(s));
    }

    store::InMemorySnapshotStore store;
    store.append_all(report.snapshots);

    const formula::FormulaEngine engine(ParameterSet::defaults());
    for (const Period period : store.periods()) {
        for (const auto& player : store.players_at(period)) {
            const Prediction p = engine.evaluate(store.player_history(player, period), period);
            assert(!(p.final_value < 0.0));
            assert(p.price_used > 0.0);
        }
    }
    return 0;
}
