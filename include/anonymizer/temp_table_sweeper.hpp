#pragma once

#include "core/line_stream.hpp"
#include "db/ischema_manager.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlanon {

/**
 * @brief Lazy stream removing leftover anonymizer temporary tables
 *
 * Emits "table: <name>" for every table whose name starts with the prefix.
 * Unless dry_run, the table just emitted is dropped on the following
 * next() call, before the next match is searched for. Tables are listed on
 * the first call.
 *
 * Any table carrying the prefix is dropped, whoever created it.
 */
class TempTableSweeper {
public:
    TempTableSweeper(ISchemaManager& schema, bool dry_run, std::string prefix);

    TempTableSweeper(TempTableSweeper&&) noexcept = default;
    TempTableSweeper(const TempTableSweeper&) = delete;
    TempTableSweeper& operator=(const TempTableSweeper&) = delete;

    /**
     * @throws ExecutionError if listing or dropping fails; the stream is
     * then finished
     */
    [[nodiscard]] std::optional<std::string> next();

    [[nodiscard]] bool dry_run() const { return dry_run_; }
    [[nodiscard]] size_t matched() const { return matched_; }

    [[nodiscard]] LineIterator<TempTableSweeper> begin() { return LineIterator<TempTableSweeper>(this); }
    [[nodiscard]] LineIterator<TempTableSweeper> end() { return {}; }

private:
    void drop_pending();

    ISchemaManager& schema_;
    bool dry_run_;
    std::string prefix_;

    std::optional<std::vector<std::string>> tables_;
    size_t position_ = 0;
    std::optional<std::string> pending_drop_;
    size_t matched_ = 0;
    bool done_ = false;
};

} // namespace sqlanon
