#pragma once

#include "anonymizer/iconfig_loader.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <utility>

namespace sqlanon {

/**
 * @brief Anonymization rules read from TOML
 *
 * One table per database table, one entry per target, in declaration
 * order:
 *
 *   [users.email]
 *   anonymizer = "email"
 *   options = { domain = "example.com" }
 *
 *   [users]
 *   last_login = "null"        # shorthand: strategy without options
 *
 * ${VAR} expansion works as in the application config. Included files
 * are read as separate documents, their rules first; a target declared
 * in two files is a ConfigurationError.
 */
class TomlAnonymizationConfigLoader : public IAnonymizationConfigLoader {
public:
    /** @brief Read @p file_path on every load() */
    [[nodiscard]] static TomlAnonymizationConfigLoader from_file(std::string file_path);

    /** @brief Parse @p content on every load() */
    [[nodiscard]] static TomlAnonymizationConfigLoader from_string(std::string content);

    /**
     * @throws ConfigurationError on I/O, syntax or validation failure
     */
    [[nodiscard]] AnonymizationConfig load() override;

    /**
     * @brief Build the rules from an already parsed document
     * @throws ConfigurationError on the first invalid entry
     */
    [[nodiscard]] static AnonymizationConfig extract(const toml::table& root);

private:
    static void extract_into(const toml::table& root, AnonymizationConfig& config);

    TomlAnonymizationConfigLoader(std::string source, bool is_file)
        : source_(std::move(source)), is_file_(is_file) {}

    std::string source_;
    bool is_file_;
};

} // namespace sqlanon
