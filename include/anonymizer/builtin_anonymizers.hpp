#pragma once

#include "anonymizer/abstract_anonymizer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sqlanon {

class AnonymizerRegistry;

/**
 * @brief Register every built-in strategy under its identifier:
 * constant, null, md5, email, integer, string
 */
void register_builtin_anonymizers(AnonymizerRegistry& registry);

/**
 * @brief "constant": overwrite with a fixed string.
 * Options: value (string, required)
 */
class ConstantAnonymizer : public AbstractAnonymizer {
public:
    ConstantAnonymizer(const AnonymizerContext& context, const TargetConfig& config);
    void anonymize(UpdateQuery& query) override;

private:
    std::string value_;
};

/**
 * @brief "null": overwrite with NULL
 */
class NullAnonymizer : public AbstractAnonymizer {
public:
    using AbstractAnonymizer::AbstractAnonymizer;
    void anonymize(UpdateQuery& query) override;
};

/**
 * @brief "md5": replace non-NULL values by their salted MD5 digest.
 * Options: use_salt (bool, default true)
 */
class Md5Anonymizer : public AbstractAnonymizer {
public:
    Md5Anonymizer(const AnonymizerContext& context, const TargetConfig& config);
    void anonymize(UpdateQuery& query) override;

    [[nodiscard]] const std::string& salt() const { return salt_; }

private:
    std::string salt_;
};

/**
 * @brief "email": replace non-NULL values by anon-<md5>@<domain>.
 * Options: domain (default "example.com"), use_salt (bool, default true)
 */
class EmailAnonymizer : public AbstractAnonymizer {
public:
    EmailAnonymizer(const AnonymizerContext& context, const TargetConfig& config);
    void anonymize(UpdateQuery& query) override;

private:
    std::string domain_;
    std::string salt_;
};

/**
 * @brief "integer": random integer in [min, max], per row.
 * Options: min, max (integers, required, min <= max)
 */
class IntegerAnonymizer : public AbstractAnonymizer {
public:
    IntegerAnonymizer(const AnonymizerContext& context, const TargetConfig& config);
    void anonymize(UpdateQuery& query) override;

private:
    int64_t min_;
    int64_t max_;
};

/**
 * @brief "string": pick a replacement from a sample list.
 * Options: sample (non-empty array of strings)
 *
 * initialize() loads the samples into a temporary table named with
 * kTempTablePrefix; each row picks the sample whose id matches a hash
 * bucket of its current value, so equal inputs get equal outputs.
 * clean() drops the temporary table.
 */
class StringAnonymizer : public AbstractAnonymizer {
public:
    StringAnonymizer(const AnonymizerContext& context, const TargetConfig& config);
    void initialize() override;
    void anonymize(UpdateQuery& query) override;
    void clean() override;

    [[nodiscard]] const std::string& temp_table() const { return temp_table_; }

private:
    static constexpr size_t kInsertBatchSize = 500;

    std::vector<std::string> sample_;
    std::string temp_table_;
    bool created_ = false;
};

} // namespace sqlanon
