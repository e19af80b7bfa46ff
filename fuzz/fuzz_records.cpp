/**
 * @file  fuzz_records.cpp
 * @brief libFuzzer target for the record line codec and its conversions.
 *
 * Build:
 *   cmake -DFVH_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_records
 *
 * Safety invariants verified on every input:
 *   1. No crash for any byte sequence; a rejected line gives nullopt.
 *   2. A decoded record re-encodes to a line that decodes to the same record.
 *   3. Conversions either reject the record or produce a value whose record
 *      converts back to the same record. Records are compared rather than
 *      values so that NaN fields still compare equal. InvalidParameterSet is
 *      the only exception allowed to escape a conversion.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fvh/errors.hpp"
#include "fvh/records.hpp"

using namespace fvh;
using namespace fvh::records;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto record = decode_line(input);
    if (!record) return 0;

    const auto again = decode_line(encode_line(*record));
    assert(again.has_value());
    assert(*again == *record);

    if (const auto p = prediction_from_record(*record)) {
        const Record r = to_record(*p);
        const auto back = prediction_from_record(r);
        assert(back && to_record(*back) == r);
    }
    if (const auto m = metrics_from_record(*record)) {
        const Record r = to_record(*m);
        const auto back = metrics_from_record(r);
        assert(back && to_record(*back) == r);
    }
    try {
        if (const auto params = parameter_set_from_record(*record)) {
            const Record r = to_record(*params);
            const auto back = parameter_set_from_record(r);
            assert(back && to_record(*back) == r);
        }
        if (const auto entry = entry_from_record(*record)) {
            const Record r = to_record(*entry);
            const auto back = entry_from_record(r);
            assert(back && to_record(*back) == r);
        }
    } catch (const InvalidParameterSet&) {
        return 0;
    }
    return 0;
}
