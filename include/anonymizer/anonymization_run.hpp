#pragma once

#include "anonymizer/abstract_anonymizer.hpp"
#include "anonymizer/anonymization_config.hpp"
#include "anonymizer/plan_builder.hpp"
#include "core/line_stream.hpp"
#include "core/utils.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlanon {

class AnonymizerRegistry;

/**
 * @brief Anonymizers of one table, from initialization to cleanup
 *
 * Once initialize_all() has started, every anonymizer gets its clean()
 * call exactly once: through clean_all(), or from the destructor when the
 * owning run is dropped halfway through the table.
 */
class TableScope {
public:
    TableScope(std::string table, std::vector<std::unique_ptr<AbstractAnonymizer>> anonymizers);
    ~TableScope();

    TableScope(const TableScope&) = delete;
    TableScope& operator=(const TableScope&) = delete;

    /**
     * @brief initialize() every anonymizer, in order, stopping at the first failure
     * @throws StrategyLifecycleError (or the AnonymizerError raised by the hook)
     */
    void initialize_all();

    /**
     * @brief clean() every anonymizer, in order, even after a failure
     * @return One message per failed clean(), empty on success
     */
    [[nodiscard]] std::vector<std::string> clean_all();

    [[nodiscard]] const std::string& table() const { return table_; }
    [[nodiscard]] size_t size() const { return anonymizers_.size(); }
    [[nodiscard]] AbstractAnonymizer& operator[](size_t index) { return *anonymizers_[index]; }

    [[nodiscard]] bool initialized() const { return initialized_; }
    [[nodiscard]] bool cleaned() const { return cleaned_; }

private:
    std::string table_;
    std::vector<std::unique_ptr<AbstractAnonymizer>> anonymizers_;
    bool initialized_ = false;
    bool cleaned_ = false;
};

/**
 * @brief Lazy, single-pass stream of progress lines for one anonymization
 *
 * Each call to next() performs the work behind the line it returns, so
 * nothing touches the database until the caller pulls. Tables are handled
 * one after the other in plan order:
 *
 *    * table 1/2: "users" ("email", "name")
 *      - initializing anonymizers...
 *   time: 12 ms, mem: 8.00 MiB
 *      - anonymizing...
 *   time: 1.204 s, mem: 8.00 MiB
 *      - cleaning anonymizers...
 *   time: 3 ms, mem: 8.00 MiB
 *      - total time: 1.219 s, mem: 8.00 MiB
 *
 * A failure while initializing or anonymizing a table is held until that
 * table's anonymizers are cleaned, then rethrown by the following next()
 * call. After an exception the stream is finished and next() returns
 * std::nullopt.
 *
 * Holds references to the Anonymizator's collaborators: it must not
 * outlive the Anonymizator that created it.
 */
class AnonymizationRun {
public:
    AnonymizationRun(const AnonymizerContext& context,
                     const AnonymizerRegistry& registry,
                     const AnonymizationConfig& config,
                     AnonymizationPlan plan,
                     bool at_once);

    AnonymizationRun(AnonymizationRun&&) noexcept = default;
    AnonymizationRun(const AnonymizationRun&) = delete;
    AnonymizationRun& operator=(const AnonymizationRun&) = delete;

    /**
     * @brief Run the next step and return its progress line
     * @return std::nullopt once every table is done
     * @throws AnonymizerError (or whatever a strategy let through)
     */
    [[nodiscard]] std::optional<std::string> next();

    [[nodiscard]] bool finished() const { return step_ == Step::DONE; }
    [[nodiscard]] const AnonymizationPlan& plan() const { return plan_; }
    [[nodiscard]] bool at_once() const { return at_once_; }

    [[nodiscard]] LineIterator<AnonymizationRun> begin() { return LineIterator<AnonymizationRun>(this); }
    [[nodiscard]] LineIterator<AnonymizationRun> end() { return {}; }

private:
    enum class Step {
        TABLE_HEADER,
        INIT_MARKER,
        INITIALIZE,
        ANONYMIZE_MARKER,
        ANONYMIZE_TABLE,
        COLUMN_HEADER,
        ANONYMIZE_COLUMN,
        CLEAN_MARKER,
        CLEAN,
        TOTAL,
        FAILED,
        DONE
    };

    std::optional<std::string> start_table();
    std::optional<std::string> initialize_table();
    std::optional<std::string> anonymize_table();
    std::optional<std::string> anonymize_column();
    std::optional<std::string> clean_table();
    std::optional<std::string> finish_table();

    /** @brief Let @p anonymizers contribute to one UPDATE and execute it */
    void run_update(const std::vector<AbstractAnonymizer*>& anonymizers);

    std::unique_ptr<TableScope> create_scope(const AnonymizationPlan::Entry& entry);

    AnonymizerContext context_;
    const AnonymizerRegistry& registry_;
    const AnonymizationConfig& config_;
    AnonymizationPlan plan_;
    bool at_once_;

    Step step_ = Step::TABLE_HEADER;
    size_t table_index_ = 0;
    size_t column_index_ = 0;
    std::unique_ptr<TableScope> scope_;
    utils::Timer table_timer_;
    utils::Timer step_timer_;
    std::exception_ptr pending_error_;
};

} // namespace sqlanon
