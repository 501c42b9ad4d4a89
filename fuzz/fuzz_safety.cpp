/**
 * @file  fuzz_safety.cpp
 * @brief libFuzzer target for safety::assess and safety::classify.
 *
 * Build:
 *   cmake -DPOLYREG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_safety
 *
 * Invariants verified on every input:
 *   1. No crash and no UB for any (margin, observed, threshold) bit pattern.
 *   2. Invalid inputs are reported only as InvalidParameterError.
 *   3. ratio is never NaN and is > 0.
 *   4. passes == (ratio > threshold).
 *   5. The batch result equals the scalar result element by element.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "polyreg/safety.hpp"
#include "polyreg/errors.hpp"

using namespace polyreg;
using namespace polyreg::safety;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 3 * sizeof(double)) return 0;

    double margin = 0.0, observed = 0.0, threshold = 0.0;
    std::memcpy(&margin,    data,                      sizeof(double));
    std::memcpy(&observed,  data + sizeof(double),     sizeof(double));
    std::memcpy(&threshold, data + 2 * sizeof(double), sizeof(double));

    try {
        const auto a = assess(margin, observed, threshold);
        assert(!std::isnan(a.ratio));
        assert(a.ratio > 0.0);
        assert(a.passes == (a.ratio > threshold));
        (void)classify(a.ratio, threshold);
    } catch (const InvalidParameterError&) {
        return 0;
    }

    const std::size_t offset = 3 * sizeof(double);
    std::vector<double> batch((size - offset) / sizeof(double));
    if (!batch.empty()) {
        std::memcpy(batch.data(), data + offset, batch.size() * sizeof(double));
    }
    try {
        const auto out = assess(margin, batch, threshold);
        assert(out.size() == batch.size());
        for (std::size_t i = 0; i < batch.size(); ++i) {
            const auto single = assess(margin, batch[i], threshold);
            assert(out[i].ratio == single.ratio);
            assert(out[i].passes == single.passes);
        }
    } catch (const InvalidParameterError&) {
        return 0;
    }
    return 0;
}
