/**
 * @file  fuzz_grammar.cpp
 * @brief libFuzzer target for the iter-v1 line grammar
 *
 * Build:
 *   cmake -DTRAINLOG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_grammar
 *
 * Run for 60 seconds:
 *   ./fuzz_grammar -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no out-of-bounds read for any byte sequence.
 *   2. If a record is returned:
 *      a. episode is non-empty and all ASCII digits
 *      b. decision matches [A-Z][0-9]-[A-Z][0-9]
 *      c. every decimal field is finite
 *   3. Same input twice gives the same result.
 *   4. The record renders to a CSV row that parses back to itself.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "trainlog/grammar.hpp"
#include "trainlog/table_io.hpp"

using namespace trainlog;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const auto rec = grammar::extract(input);

    // Invariant 3: deterministic
    const auto again = grammar::extract(input);
    assert(rec.has_value() == again.has_value());

    if (!rec) return 0;
    assert(*rec == *again);

    // Invariant 2a
    assert(!rec->episode.empty());
    for (const char c : rec->episode) {
        assert(c >= '0' && c <= '9');
    }

    // Invariant 2b
    assert(rec->decision.size() == 5);
    assert(rec->decision[2] == '-');

    // Invariant 2c
    assert(std::isfinite(rec->eps));
    assert(std::isfinite(rec->learning_rate));
    assert(std::isfinite(rec->ret));
    assert(std::isfinite(rec->step_time));
    assert(std::isfinite(rec->sf));
    assert(std::isfinite(rec->reward));

    // Invariant 4
    const auto row = io::parse_record_row(io::record_row(*rec));
    assert(row.has_value());
    assert(*row == *rec);

    return 0;
}
