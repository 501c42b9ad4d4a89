/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string and the Engine
 *        sweep it feeds.
 *
 * Build:
 *   cmake -DPOLYREG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Invariants verified on every input:
 *   1. No crash and no UB for any byte sequence (binary garbage, "nan",
 *      "inf", CR/LF mixes, very long lines).
 *   2. Every parsed value is finite and ≥ 0.
 *   3. The Engine accepts every parsed value without throwing.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>

#include "polyreg/data_loader.hpp"
#include "polyreg/engine.hpp"

using namespace polyreg::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto values = DataLoader::parse_csv_string(input);
    for (double v : values) {
        assert(std::isfinite(v));
        assert(v >= 0.0);
    }

    Engine engine;
    const auto points  = engine.evaluate_series(values);
    const auto summary = Engine::summarise(points);
    assert(summary.count == values.size());
    assert(summary.passed <= summary.count);
    return 0;
}
