/// @file src/core/config.cpp
/// @brief Command-line run configuration for the polyreg executable.

#include "polyreg/config.hpp"
#include "polyreg/errors.hpp"

#include <fmt/format.h>

#include <charconv>
#include <string>
#include <system_error>

namespace polyreg::core {

namespace {

[[nodiscard]] double parse_number(std::string_view token, std::string_view what) {
    const std::string_view digits =
        (!token.empty() && token.front() == '+') ? token.substr(1) : token;

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw InvalidParameterError(std::string(what),
            fmt::format("{} expects a number, got '{}'", what, token));
    }
    return value;
}

[[nodiscard]] std::size_t parse_count(std::string_view token, std::string_view what) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        throw InvalidParameterError(std::string(what),
            fmt::format("{} expects a non-negative integer, got '{}'", what, token));
    }
    return value;
}

[[nodiscard]] RunMode parse_mode(std::string_view token) {
    if (token == "--help" || token == "-h") return RunMode::Help;
    if (token == "--compute")               return RunMode::Compute;
    if (token == "--assess")                return RunMode::Assess;
    if (token == "--spectrum")              return RunMode::Spectrum;
    if (token == "--sweep")                 return RunMode::Sweep;
    throw InvalidParameterError("mode", fmt::format("unknown option: {}", token));
}

/// Flags that take one value, and the modes that accept them.
[[nodiscard]] bool flag_allowed(RunMode mode, std::string_view flag) noexcept {
    if (flag == "--threshold")   return mode == RunMode::Assess || mode == RunMode::Sweep;
    if (flag == "--formulation") return mode == RunMode::Compute || mode == RunMode::Sweep;
    if (flag == "--mu" || flag == "--margin") return mode == RunMode::Sweep;
    return false;
}

void require_positionals(const std::vector<std::string_view>& positionals,
                         std::size_t expected, std::string_view mode) {
    if (positionals.size() != expected) {
        throw InvalidParameterError(std::string(mode),
            fmt::format("{} expects {} argument(s), got {}", mode, expected, positionals.size()));
    }
}

} // anonymous namespace

// ─── parse_formulation ────────────────────────────────────────────────────────

Formulation parse_formulation(std::string_view name) {
    if (name == "scaled") return Formulation::ScaledSinc;
    if (name == "sine")   return Formulation::SineRatio;
    if (name == "legacy") return Formulation::LegacyNormalizedSinc;
    throw InvalidParameterError("--formulation",
        fmt::format("--formulation must be scaled, sine or legacy, got '{}'", name));
}

// ─── RunConfig::engine_config ─────────────────────────────────────────────────

EngineConfig RunConfig::engine_config() const {
    return EngineConfig{
        .mu              = mu,
        .formulation     = formulation,
        .margin_constant = margin_constant,
        .threshold       = threshold,
        .verbose         = verbose,
    };
}

// ─── parse_run_config ─────────────────────────────────────────────────────────

RunConfig parse_run_config(std::span<const std::string_view> args) {
    if (args.empty()) {
        throw InvalidParameterError("mode", "missing mode; see --help");
    }

    RunConfig cfg;
    cfg.mode = parse_mode(args[0]);
    if (cfg.mode == RunMode::Help) {
        return cfg;
    }

    // ── Split flags from positionals ─────────────────────────────────────────
    std::vector<std::string_view> positionals;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string_view tok = args[i];

        if (tok == "--verbose") {
            cfg.verbose = true;
            continue;
        }
        if (tok.starts_with("--")) {
            if (!flag_allowed(cfg.mode, tok)) {
                throw InvalidParameterError(std::string(tok),
                    fmt::format("option {} is not valid for {}", tok, args[0]));
            }
            if (i + 1 >= args.size()) {
                throw InvalidParameterError(std::string(tok),
                    fmt::format("{} requires a value", tok));
            }
            const std::string_view value = args[++i];
            if (tok == "--threshold")        cfg.threshold       = parse_number(value, tok);
            else if (tok == "--mu")          cfg.mu              = parse_number(value, tok);
            else if (tok == "--margin")      cfg.margin_constant = parse_number(value, tok);
            else if (tok == "--formulation") cfg.formulation     = parse_formulation(value);
            continue;
        }
        positionals.push_back(tok);
    }

    // ── Bind positionals per mode ────────────────────────────────────────────
    switch (cfg.mode) {
        case RunMode::Compute:
            if (positionals.size() < 2) {
                throw InvalidParameterError("--compute",
                    "--compute expects <mu> and at least one <k_squared>");
            }
            cfg.mu = parse_number(positionals[0], "mu");
            for (std::size_t i = 1; i < positionals.size(); ++i) {
                cfg.k_squared.push_back(parse_number(positionals[i], "k_squared"));
            }
            break;

        case RunMode::Assess:
            require_positionals(positionals, 2, "--assess");
            cfg.margin_constant   = parse_number(positionals[0], "margin_constant");
            cfg.observed_quantity = parse_number(positionals[1], "observed_quantity");
            break;

        case RunMode::Spectrum:
            require_positionals(positionals, 4, "--spectrum");
            cfg.mu     = parse_number(positionals[0], "mu");
            cfg.k_min  = parse_number(positionals[1], "k_min");
            cfg.k_max  = parse_number(positionals[2], "k_max");
            cfg.points = parse_count(positionals[3], "points");
            break;

        case RunMode::Sweep:
            require_positionals(positionals, 1, "--sweep");
            cfg.input_path = std::string(positionals[0]);
            break;

        case RunMode::Help:
            break;
    }

    return cfg;
}

} // namespace polyreg::core
