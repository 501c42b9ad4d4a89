/**
 * @file  prop_simd_scalar_identity.cpp
 * @brief Property: the dispatched ratio kernel is bit-identical to the scalar
 *        reference for any batch of finite observations.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_simd_scalar_identity
 */

#include <rapidcheck.h>
#include <cmath>
#include <cstring>
#include <vector>

#include "polyreg/simd/simd_dispatch.hpp"
// Internal kernel header (src/simd/ on include path):
#include "simd_batch_detail.hpp"

using namespace polyreg::simd;

int main() {
    rc::check(
        "simd_scalar_identity: compute_ratio_batch == compute_ratio_scalar bitwise",
        [](const std::vector<double>& raw, double raw_margin) {
            RC_PRE(std::isfinite(raw_margin));
            const double margin = std::abs(raw_margin) + 1e-9;

            std::vector<double> observed;
            observed.reserve(raw.size());
            for (double r : raw) {
                if (std::isfinite(r)) observed.push_back(r);
            }

            std::vector<double> ref(observed.size());
            detail::compute_ratio_scalar(margin, observed.data(), observed.size(), ref.data());
            const auto got = compute_ratio_batch(margin, observed);

            RC_ASSERT(got.size() == ref.size());
            if (!ref.empty()) {
                RC_ASSERT(std::memcmp(got.data(), ref.data(), ref.size() * sizeof(double)) == 0);
            }
        }
    );

    return 0;
}
