/**
 * @file  fuzz_response.cpp
 * @brief libFuzzer target for response::compute and its batch/formulation
 *        variants.
 *
 * Build:
 *   cmake -DPOLYREG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_response
 *
 * Run for 60 seconds:
 *   ./fuzz_response -max_total_time=60
 *
 * Invariants verified on every input:
 *   1. No crash and no UB for any (μ, k², formulation) bit pattern.
 *   2. Invalid inputs are reported only as InvalidParameterError.
 *   3. Every returned response is ≥ 0, and finite outside the legacy
 *      formulation (whose 1/k² factor overflows for subnormal k²).
 *   4. The scaled formulation never exceeds μ².
 *   5. The batch path equals the scalar path element by element.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include "polyreg/response.hpp"
#include "polyreg/errors.hpp"

using namespace polyreg;
using namespace polyreg::response;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2 * sizeof(double) + 1) return 0;

    double mu = 0.0;
    double k2 = 0.0;
    std::memcpy(&mu, data, sizeof(double));
    std::memcpy(&k2, data + sizeof(double), sizeof(double));
    const auto f = static_cast<Formulation>(data[2 * sizeof(double)] % 3u);

    try {
        const double g = compute(mu, k2, f);
        assert(!std::isnan(g));
        assert(g >= 0.0);
        if (f != Formulation::LegacyNormalizedSinc) {
            assert(std::isfinite(g));
        }
        if (f == Formulation::ScaledSinc) {
            assert(g <= mu * mu);
        }
    } catch (const InvalidParameterError&) {
        return 0;
    }

    // Remaining bytes form a batch of k² values.
    const std::size_t offset = 2 * sizeof(double) + 1;
    std::vector<double> batch((size - offset) / sizeof(double));
    if (!batch.empty()) {
        std::memcpy(batch.data(), data + offset, batch.size() * sizeof(double));
    }
    try {
        const auto out = compute(mu, batch, f);
        assert(out.size() == batch.size());
        for (std::size_t i = 0; i < batch.size(); ++i) {
            assert(out[i] == compute(mu, batch[i], f));
        }
    } catch (const InvalidParameterError&) {
        return 0;
    }
    return 0;
}
