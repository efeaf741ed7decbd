#include "anonymizer/abstract_anonymizer.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <format>

namespace sqlanon {

AbstractAnonymizer::AbstractAnonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : connection_(context.connection),
      dialect_(context.dialect),
      kind_(config.anonymizer),
      table_(config.table),
      column_(config.target_name),
      options_(config.options.is_null() ? nlohmann::json::object() : config.options) {}

// ============================================================================
// Temporary tables
// ============================================================================

std::string AbstractAnonymizer::random_hex(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw StrategyLifecycleError(std::format(
            "RAND_bytes failed: {}", ERR_error_string(ERR_get_error(), nullptr)));
    }

    std::string hex;
    hex.reserve(bytes * 2);
    for (const unsigned char b : buffer) {
        hex += std::format("{:02x}", b);
    }
    return hex;
}

std::string AbstractAnonymizer::generate_temp_table_name() {
    return std::string(kTempTablePrefix) + random_hex(8);
}

// ============================================================================
// Options
// ============================================================================

ConfigurationError AbstractAnonymizer::option_error(std::string_view message) const {
    return ConfigurationError(std::format(
        "Anonymizer \"{}\" on \"{}\".\"{}\": {}", kind_, table_, column_, message));
}

bool AbstractAnonymizer::has_option(std::string_view key) const {
    return options_.contains(std::string(key));
}

std::string AbstractAnonymizer::string_option(std::string_view key, std::string_view default_value) const {
    if (!has_option(key)) {
        return std::string(default_value);
    }
    const auto& value = options_.at(std::string(key));
    if (!value.is_string()) {
        throw option_error(std::format("option \"{}\" must be a string", key));
    }
    return value.get<std::string>();
}

std::string AbstractAnonymizer::required_string_option(std::string_view key) const {
    if (!has_option(key)) {
        throw option_error(std::format("option \"{}\" is required", key));
    }
    return string_option(key, "");
}

bool AbstractAnonymizer::bool_option(std::string_view key, bool default_value) const {
    if (!has_option(key)) {
        return default_value;
    }
    const auto& value = options_.at(std::string(key));
    if (!value.is_boolean()) {
        throw option_error(std::format("option \"{}\" must be a boolean", key));
    }
    return value.get<bool>();
}

int64_t AbstractAnonymizer::required_int_option(std::string_view key) const {
    if (!has_option(key)) {
        throw option_error(std::format("option \"{}\" is required", key));
    }
    const auto& value = options_.at(std::string(key));
    if (!value.is_number_integer()) {
        throw option_error(std::format("option \"{}\" must be an integer", key));
    }
    return value.get<int64_t>();
}

std::vector<std::string> AbstractAnonymizer::string_list_option(std::string_view key) const {
    std::vector<std::string> result;
    if (!has_option(key)) {
        return result;
    }
    const auto& value = options_.at(std::string(key));
    if (!value.is_array()) {
        throw option_error(std::format("option \"{}\" must be an array of strings", key));
    }
    result.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw option_error(std::format("option \"{}\" must be an array of strings", key));
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace sqlanon
