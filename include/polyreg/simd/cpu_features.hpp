#pragma once
/**
 * @file  cpu_features.hpp
 * @brief Runtime selection of the widest safety-ratio kernel the host runs.
 *
 * Module:  include/polyreg/simd/
 *
 * Responsibility
 * --------------
 * Report which of the compiled ratio kernels may execute on this CPU:
 *
 *   SCALAR  : always available; reference path
 *   AVX2    : 4 doubles per register
 *   AVX512F : 8 doubles per register
 *
 * A kernel level is reported only when the CPU advertises the instruction
 * set AND the OS saves the matching register state (XCR0).
 *
 * Guarantees
 * ----------
 *   • detect_simd_level() queries CPUID once; later calls return the cached level.
 *   • noexcept throughout, no allocation.
 *   • Targets without CPUID (non-x86) report SCALAR.
 *
 * NOT Responsible For
 * -------------------
 *   • Levels with no ratio kernel (SSE, AVX without AVX2, AVX-512 VL/DQ/BW).
 */

#include <cstdint>

#if defined(_MSC_VER) && (defined(_M_X64) || defined(_M_IX86))
#  include <intrin.h>
#  include <immintrin.h>
#  define POLYREG_HAS_CPUID 1
#elif (defined(__GNUC__) || defined(__clang__)) && (defined(__x86_64__) || defined(__i386__))
#  include <cpuid.h>
#  define POLYREG_HAS_CPUID 1
#else
#  define POLYREG_HAS_CPUID 0
#endif

namespace polyreg::simd {

// ── SimdLevel ─────────────────────────────────────────────────────────────────

/// Ordered: a higher level implies every lower one is usable.
enum class SimdLevel : std::uint8_t {
    SCALAR  = 0,
    AVX2    = 1,
    AVX512F = 2,
};

namespace detail {

struct CpuidLeaf {
    std::uint32_t eax = 0, ebx = 0, ecx = 0, edx = 0;
};

[[nodiscard]] inline CpuidLeaf read_cpuid(std::uint32_t leaf, std::uint32_t subleaf) noexcept {
    CpuidLeaf r;
#if POLYREG_HAS_CPUID && defined(_MSC_VER)
    int regs[4] = {};
    __cpuidex(regs, static_cast<int>(leaf), static_cast<int>(subleaf));
    r.eax = static_cast<std::uint32_t>(regs[0]);
    r.ebx = static_cast<std::uint32_t>(regs[1]);
    r.ecx = static_cast<std::uint32_t>(regs[2]);
    r.edx = static_cast<std::uint32_t>(regs[3]);
#elif POLYREG_HAS_CPUID
    __cpuid_count(leaf, subleaf, r.eax, r.ebx, r.ecx, r.edx);
#else
    (void)leaf;
    (void)subleaf;
#endif
    return r;
}

/// XCR0; callers must have checked OSXSAVE first (xgetbv faults without it).
[[nodiscard]] inline std::uint64_t read_xcr0() noexcept {
#if POLYREG_HAS_CPUID && defined(_MSC_VER)
    return _xgetbv(0);
#elif POLYREG_HAS_CPUID
    std::uint32_t lo = 0, hi = 0;
    __asm__ volatile("xgetbv" : "=a"(lo), "=d"(hi) : "c"(0u));
    return (static_cast<std::uint64_t>(hi) << 32u) | lo;
#else
    return 0u;
#endif
}

[[nodiscard]] constexpr bool bit(std::uint32_t reg, unsigned n) noexcept {
    return ((reg >> n) & 1u) != 0u;
}

// XCR0 state components.
inline constexpr std::uint64_t XCR0_YMM = 0x06u;  // SSE + AVX upper halves
inline constexpr std::uint64_t XCR0_ZMM = 0xE0u;  // opmask + ZMM_Hi256 + Hi16_ZMM

[[nodiscard]] inline SimdLevel query_simd_level() noexcept {
    if (read_cpuid(0u, 0u).eax < 7u) return SimdLevel::SCALAR;

    const CpuidLeaf leaf1 = read_cpuid(1u, 0u);
    if (!bit(leaf1.ecx, 27u)) return SimdLevel::SCALAR;     // OSXSAVE
    const std::uint64_t xcr0 = read_xcr0();
    if ((xcr0 & XCR0_YMM) != XCR0_YMM) return SimdLevel::SCALAR;

    const CpuidLeaf leaf7 = read_cpuid(7u, 0u);
    if (bit(leaf7.ebx, 16u) && (xcr0 & XCR0_ZMM) == XCR0_ZMM) return SimdLevel::AVX512F;
    if (bit(leaf7.ebx, 5u))                                   return SimdLevel::AVX2;
    return SimdLevel::SCALAR;
}

} // namespace detail

// ── detect_simd_level ─────────────────────────────────────────────────────────

[[nodiscard]] inline SimdLevel detect_simd_level() noexcept {
    static const SimdLevel kLevel = detail::query_simd_level();
    return kLevel;
}

[[nodiscard]] inline bool has_avx512f() noexcept {
    return detect_simd_level() >= SimdLevel::AVX512F;
}

[[nodiscard]] inline bool has_avx2() noexcept {
    return detect_simd_level() >= SimdLevel::AVX2;
}

[[nodiscard]] inline const char* simd_level_name(SimdLevel level) noexcept {
    switch (level) {
        case SimdLevel::SCALAR:  return "SCALAR";
        case SimdLevel::AVX2:    return "AVX2";
        case SimdLevel::AVX512F: return "AVX512F";
    }
    return "UNKNOWN";
}

} // namespace polyreg::simd
