#pragma once

/// @file include/polyreg/data_loader.hpp
/// @brief CSV loader for momentum-squared sweeps.
///
/// # Module: DataLoader
///
/// ## Responsibility
/// Parse CSV text whose first column holds k² values into a vector of
/// doubles. Further columns (labels, units) are ignored.
///
/// ## Expected CSV Format
/// ```
/// k_squared,label
/// 0.0,origin
/// 4.0,reference
/// 1e6,
/// ```
/// The first non-empty, non-comment line is the header and is skipped.
/// Lines starting with '#' are comments.
///
/// ## Guarantees
/// - Never throws; returns `nullopt` only when the file cannot be opened
/// - Skips malformed, non-finite and negative rows rather than failing the load
/// - Does not modify any file or external state

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyreg::core {

class DataLoader {
public:
    /// Load k² values from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Empty vector if the file has a header but no valid rows
    [[nodiscard]] static std::optional<std::vector<double>>
    load_csv(const std::string& filepath) noexcept;

    /// Parse k² values from CSV text (same format as `load_csv`).
    [[nodiscard]] static std::vector<double>
    parse_csv_string(const std::string& csv_content) noexcept;

    /// Parse one data row. Returns `nullopt` for a malformed, non-finite or
    /// negative first field.
    [[nodiscard]] static std::optional<double>
    parse_row(std::string_view line) noexcept;
};

} // namespace polyreg::core
