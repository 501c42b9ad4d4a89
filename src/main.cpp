/// @file src/main.cpp
/// @brief polyreg CLI entry point.
///
/// Usage:
///   polyreg --compute  <mu> <k_squared>... [--formulation F]
///   polyreg --assess   <margin> <observed> [--threshold T]
///   polyreg --spectrum <mu> <k_min> <k_max> <points>
///   polyreg --sweep    <csv_file> [--mu M] [--margin C] [--threshold T]
///                      [--formulation F] [--verbose]
///   polyreg --help

#include "polyreg/config.hpp"
#include "polyreg/data_loader.hpp"
#include "polyreg/engine.hpp"
#include "polyreg/errors.hpp"
#include "polyreg/response.hpp"
#include "polyreg/safety.hpp"

#include <fmt/core.h>

#include <exception>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  polyreg --compute  <mu> <k_squared>... [--formulation F]\n"
        "  polyreg --assess   <margin> <observed> [--threshold T]\n"
        "  polyreg --spectrum <mu> <k_min> <k_max> <points>\n"
        "  polyreg --sweep    <csv_file> [--mu M] [--margin C] [--threshold T]\n"
        "                     [--formulation F] [--verbose]\n"
        "  polyreg --help\n"
        "\n"
        "Formulations: scaled (default), sine, legacy\n"
        "Sweep CSV format (header required): k_squared[,ignored...]\n"
    );
}

int run_compute(const polyreg::core::RunConfig& cfg) {
    const auto values = polyreg::response::compute(cfg.mu, cfg.k_squared, cfg.formulation);
    fmt::print("mu={:.6g} formulation={}\n", cfg.mu, polyreg::response::to_string(cfg.formulation));
    for (std::size_t i = 0; i < values.size(); ++i) {
        fmt::print("k2={:.6g}  G={:.12g}\n", cfg.k_squared[i], values[i]);
    }
    return 0;
}

int run_assess(const polyreg::core::RunConfig& cfg) {
    const auto a = polyreg::safety::assess(cfg.margin_constant, cfg.observed_quantity, cfg.threshold);
    const auto level = polyreg::safety::classify(a.ratio, cfg.threshold);
    fmt::print("ratio={:.6e}  passes={}  level={}\n",
               a.ratio, a.passes, polyreg::safety::to_string(level));
    return a.passes ? 0 : 2;
}

int run_spectrum(const polyreg::core::RunConfig& cfg) {
    const auto points = polyreg::response::spectrum(cfg.mu, cfg.k_min, cfg.k_max, cfg.points);
    fmt::print("k_squared,response\n");
    for (const auto& p : points) {
        fmt::print("{:.12g},{:.12g}\n", p.k_squared, p.response);
    }
    return 0;
}

int run_sweep(const polyreg::core::RunConfig& cfg) {
    auto values = polyreg::core::DataLoader::load_csv(cfg.input_path);
    if (!values) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", cfg.input_path);
        return 1;
    }
    if (values->empty()) {
        fmt::print(stderr, "Error: no valid k_squared rows loaded from '{}'\n", cfg.input_path);
        return 1;
    }
    fmt::print(stderr, "Loaded {} rows from '{}'\n", values->size(), cfg.input_path);

    const polyreg::core::Engine engine(cfg.engine_config());
    const auto points = engine.evaluate_series(*values);

    fmt::print("k_squared,response,ratio,passes,level\n");
    for (const auto& p : points) {
        fmt::print("{:.12g},{:.12g},{:.6e},{},{}\n",
                   p.k_squared, p.response, p.assessment.ratio,
                   p.assessment.passes ? 1 : 0,
                   polyreg::safety::to_string(p.level));
    }
    fmt::print(stderr, "{}\n", polyreg::core::Engine::summarise(points).to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::vector<std::string_view> args(argv + 1, argv + argc);

    try {
        const auto cfg = polyreg::core::parse_run_config(args);
        switch (cfg.mode) {
            case polyreg::core::RunMode::Help:     print_usage(); return 0;
            case polyreg::core::RunMode::Compute:  return run_compute(cfg);
            case polyreg::core::RunMode::Assess:   return run_assess(cfg);
            case polyreg::core::RunMode::Spectrum: return run_spectrum(cfg);
            case polyreg::core::RunMode::Sweep:    return run_sweep(cfg);
        }
    } catch (const polyreg::InvalidParameterError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }
    return 1;
}
