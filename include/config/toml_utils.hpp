#pragma once

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlanon::toml_utils {

// ============================================================================
// Parsing (env expansion, includes, merging)
// ============================================================================

/**
 * @brief Expand ${VAR_NAME} patterns with environment variables
 * (unset variables expand to nothing)
 * @throws std::runtime_error on an unclosed "${"
 */
[[nodiscard]] std::string expand_env_vars(const std::string& input);

/**
 * @brief Deep-merge @p overlay into @p base. Overlay wins for scalars,
 * arrays are concatenated.
 */
void merge_tables(toml::table& base, const toml::table& overlay);

/**
 * @brief Parse TOML text, then expand ${VAR} in every string value
 * @throws toml::parse_error, std::runtime_error
 */
[[nodiscard]] toml::table parse_string(std::string_view content);

/**
 * @brief Parse a TOML file, resolve its `include = "..."` / `include = [...]`
 * directives (relative to the including file, main file wins, depth <= 10,
 * no cycles), then expand ${VAR} in every string value
 * @throws toml::parse_error, std::runtime_error, std::filesystem::filesystem_error
 */
[[nodiscard]] toml::table parse_file(const std::string& file_path);

/**
 * @brief A parsed file, include directive removed
 */
struct Document {
    std::string path;
    toml::table table;
};

/**
 * @brief Parse a TOML file and the files it includes, without merging
 *
 * Included documents come first, depth-first in declaration order, each
 * before the document that includes it. Same include rules as parse_file().
 * @throws toml::parse_error, std::runtime_error, std::filesystem::filesystem_error
 */
[[nodiscard]] std::vector<Document> parse_documents(const std::string& file_path);

// ============================================================================
// Extraction helpers
// ============================================================================

/**
 * @brief Convert a TOML value to JSON. Dates and times become their TOML
 * text form.
 */
[[nodiscard]] nlohmann::json to_json(const toml::node& node);

/**
 * @brief Entries of @p table in declaration order
 *
 * toml::table iterates by key; this sorts on where each key (or, for
 * implicitly created tables, its first child) appears in the source.
 */
[[nodiscard]] std::vector<std::pair<std::string, const toml::node*>> in_source_order(
    const toml::table& table);

[[nodiscard]] std::optional<std::string> optional_string(const toml::table& tbl, std::string_view key);

} // namespace sqlanon::toml_utils
