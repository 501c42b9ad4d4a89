/// @file src/core/data_loader.cpp
/// @brief CSV loader for momentum-squared sweeps.

#include "polyreg/data_loader.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

namespace polyreg::core {

namespace {

/// Trim leading/trailing blanks and line-ending characters.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ─── DataLoader::parse_row ────────────────────────────────────────────────────

std::optional<double> DataLoader::parse_row(std::string_view line) noexcept {
    // Skip blank lines and comment lines.
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    const auto comma = line.find(',');
    const std::string_view field = trim(line.substr(0, comma));
    if (field.empty()) {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'.
    const std::string_view digits = (field.front() == '+') ? field.substr(1) : field;

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;  // not a number, or trailing garbage
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

// ─── DataLoader::parse_csv_string ────────────────────────────────────────────

std::vector<double> DataLoader::parse_csv_string(const std::string& csv_content) noexcept {
    std::vector<double> values;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (!header_skipped) {
            // First non-empty, non-comment line is the header.
            if (!trim(line).empty() && line.front() != '#') {
                header_skipped = true;
            }
            continue;
        }

        if (auto v = parse_row(line)) {
            values.push_back(*v);
        }
    }
    return values;
}

// ─── DataLoader::load_csv ────────────────────────────────────────────────────

std::optional<std::vector<double>>
DataLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

} // namespace polyreg::core
