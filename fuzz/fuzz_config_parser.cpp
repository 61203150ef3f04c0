/**
 * @file  fuzz_config_parser.cpp
 * @brief libFuzzer target for ConfigLoader::parse_string
 *
 * Build:
 *   cmake -DBIRKHOFF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_config_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_config_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. A rejected input always carries an error message.
 *   3. An accepted configuration passes validate().
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>

#include "birkhoff/config.hpp"

using namespace birkhoff;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string text(reinterpret_cast<const char*>(data), size);

    std::string error;
    const auto cfg = ConfigLoader::parse_string(text, &error);
    if (!cfg) {
        assert(!error.empty());
        return 0;
    }

    assert(!cfg->validate().has_value());
    assert(cfg->endpoint_a.size() == cfg->endpoint_b.size());
    assert(cfg->n_nodes >= 2);
    return 0;
}
