#pragma once

#include <filesystem>

namespace vecture {

/// "report.txt" -> "report_redacted.txt"
[[nodiscard]] std::filesystem::path redacted_path_for(const std::filesystem::path& input);

/**
 * @brief Default output path for a restored document
 *
 * Every "_redacted" in the stem becomes "_restored"; a stem without one
 * gets "_restored" appended. The extension is kept.
 */
[[nodiscard]] std::filesystem::path restored_path_for(const std::filesystem::path& redacted);

/// Key file written beside the sanitized output: "<output>.vecture"
[[nodiscard]] std::filesystem::path key_path_for(const std::filesystem::path& output);

} // namespace vecture
