#include "anonymizer/builtin_anonymizers.hpp"
#include "anonymizer/anonymizer_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>

namespace sqlanon {

// Option keys
static constexpr std::string_view kValue   = "value";
static constexpr std::string_view kUseSalt = "use_salt";
static constexpr std::string_view kDomain  = "domain";
static constexpr std::string_view kMin     = "min";
static constexpr std::string_view kMax     = "max";
static constexpr std::string_view kSample  = "sample";

static constexpr std::string_view kDefaultDomain = "example.com";

namespace {

// Keep NULL as NULL, anonymize everything else
std::string unless_null(const std::string& column_ref, const std::string& expr) {
    return std::format("CASE WHEN {} IS NULL THEN NULL ELSE {} END", column_ref, expr);
}

std::string salted_md5(const ISqlDialect& dialect, const std::string& column_ref,
                       const std::string& salt) {
    const std::string text = dialect.cast_to_text(column_ref);
    if (salt.empty()) {
        return dialect.md5(text);
    }
    return dialect.md5(dialect.concat({text, dialect.quote_literal(salt)}));
}

} // anonymous namespace

void register_builtin_anonymizers(AnonymizerRegistry& registry) {
    registry.register_anonymizer<ConstantAnonymizer>("constant");
    registry.register_anonymizer<NullAnonymizer>("null");
    registry.register_anonymizer<Md5Anonymizer>("md5");
    registry.register_anonymizer<EmailAnonymizer>("email");
    registry.register_anonymizer<IntegerAnonymizer>("integer");
    registry.register_anonymizer<StringAnonymizer>("string");
}

// ============================================================================
// constant / null
// ============================================================================

ConstantAnonymizer::ConstantAnonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : AbstractAnonymizer(context, config),
      value_(required_string_option(kValue)) {}

void ConstantAnonymizer::anonymize(UpdateQuery& query) {
    query.set(column_name(), dialect().quote_literal(value_));
}

void NullAnonymizer::anonymize(UpdateQuery& query) {
    query.set(column_name(), "NULL");
}

// ============================================================================
// md5 / email
// ============================================================================

Md5Anonymizer::Md5Anonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : AbstractAnonymizer(context, config) {
    if (bool_option(kUseSalt, true)) {
        salt_ = random_hex(8);
    }
}

void Md5Anonymizer::anonymize(UpdateQuery& query) {
    const std::string ref = query.column(column_name());
    query.set(column_name(), unless_null(ref, salted_md5(dialect(), ref, salt_)));
}

EmailAnonymizer::EmailAnonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : AbstractAnonymizer(context, config),
      domain_(string_option(kDomain, kDefaultDomain)) {
    if (domain_.empty() || domain_.find('@') != std::string::npos) {
        throw option_error(std::format("invalid email domain \"{}\"", domain_));
    }
    if (bool_option(kUseSalt, true)) {
        salt_ = random_hex(8);
    }
}

void EmailAnonymizer::anonymize(UpdateQuery& query) {
    const std::string ref = query.column(column_name());
    const std::string email = dialect().concat({
        dialect().quote_literal("anon-"),
        salted_md5(dialect(), ref, salt_),
        dialect().quote_literal("@" + domain_),
    });
    query.set(column_name(), unless_null(ref, email));
}

// ============================================================================
// integer
// ============================================================================

IntegerAnonymizer::IntegerAnonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : AbstractAnonymizer(context, config),
      min_(required_int_option(kMin)),
      max_(required_int_option(kMax)) {
    if (min_ > max_) {
        throw option_error(std::format("min ({}) is greater than max ({})", min_, max_));
    }
    // The dialects render max - min + 1, which must fit in a BIGINT
    const uint64_t span = static_cast<uint64_t>(max_) - static_cast<uint64_t>(min_);
    if (span >= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw option_error(std::format("range [{}, {}] is too wide", min_, max_));
    }
}

void IntegerAnonymizer::anonymize(UpdateQuery& query) {
    query.set(column_name(), dialect().random_int(min_, max_));
}

// ============================================================================
// string
// ============================================================================

StringAnonymizer::StringAnonymizer(const AnonymizerContext& context, const TargetConfig& config)
    : AbstractAnonymizer(context, config),
      sample_(string_list_option(kSample)) {
    if (sample_.empty()) {
        throw option_error("option \"sample\" must contain at least one value");
    }
}

void StringAnonymizer::initialize() {
    temp_table_ = generate_temp_table_name();
    const std::string table = dialect().quote_identifier(temp_table_);

    execute_or_throw(connection(), std::format(
        "CREATE TABLE {} ({} INTEGER NOT NULL PRIMARY KEY, {} TEXT)",
        table, dialect().quote_identifier("id"), dialect().quote_identifier("value")));
    created_ = true;

    for (size_t offset = 0; offset < sample_.size(); offset += kInsertBatchSize) {
        const size_t end = std::min(sample_.size(), offset + kInsertBatchSize);
        std::string sql = std::format("INSERT INTO {} ({}, {}) VALUES ", table,
            dialect().quote_identifier("id"), dialect().quote_identifier("value"));
        for (size_t i = offset; i < end; ++i) {
            if (i > offset) sql += ", ";
            sql += std::format("({}, {})", i + 1, dialect().quote_literal(sample_[i]));
        }
        execute_or_throw(connection(), sql);
    }

    utils::log::info(std::format("Anonymizer string on \"{}\".\"{}\": {} samples loaded into {}",
        table_name(), column_name(), sample_.size(), temp_table_));
}

void StringAnonymizer::anonymize(UpdateQuery& query) {
    if (!created_) {
        throw StrategyLifecycleError(std::format(
            "Anonymizer string on \"{}\".\"{}\" used before initialize()",
            table_name(), column_name()));
    }

    const std::string ref = query.column(column_name());
    const std::string table = dialect().quote_identifier(temp_table_);
    const std::string pick = std::format("(SELECT {}.{} FROM {} WHERE {}.{} = {} + 1)",
        table, dialect().quote_identifier("value"), table,
        table, dialect().quote_identifier("id"),
        dialect().hash_bucket(ref, static_cast<int64_t>(sample_.size())));

    query.set(column_name(), unless_null(ref, pick));
}

void StringAnonymizer::clean() {
    if (!created_) {
        return;
    }
    execute_or_throw(connection(), "DROP TABLE " + dialect().quote_identifier(temp_table_));
    created_ = false;
}

} // namespace sqlanon
