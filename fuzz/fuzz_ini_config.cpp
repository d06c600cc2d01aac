/**
 * @file  fuzz_ini_config.cpp
 * @brief libFuzzer target for the ini config parser
 *
 * Build:
 *   cmake -DTRAINLOG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_ini_config
 *
 * Run for 60 seconds:
 *   ./fuzz_ini_config -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. Any byte sequence either parses or throws IniParseError; nothing
 *      else escapes.
 *   2. On success every parameter name contains the "." joining section and
 *      key, is at least three bytes long, and names are unique.
 *   3. The config table renders to CSV with one header line.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "trainlog/ini_config.hpp"
#include "trainlog/table_io.hpp"

using namespace trainlog;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    std::vector<ConfigParameter> params;
    try {
        params = config::parse_ini(input, "fuzz.ini");
    } catch (const config::IniParseError& e) {
        // Invariant 1: errors carry a 1-based line number
        assert(e.line() >= 1);
        return 0;
    }

    // Invariant 2
    std::set<std::string> names;
    for (const auto& p : params) {
        assert(p.parameter.size() >= 3);
        assert(p.parameter.find('.') != std::string::npos);
        assert(names.insert(p.parameter).second);
    }

    // Invariant 3
    config::ConfigTable table;
    table.merge(params);
    assert(table.size() == names.size());
    const std::string csv = io::render_config(table.parameters());
    assert(csv.rfind(io::config_header() + "\n", 0) == 0);

    return 0;
}
