#include "anonymizer/temp_table_sweeper.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <utility>

namespace sqlanon {

TempTableSweeper::TempTableSweeper(ISchemaManager& schema, bool dry_run, std::string prefix)
    : schema_(schema),
      dry_run_(dry_run),
      prefix_(std::move(prefix)) {}

void TempTableSweeper::drop_pending() {
    if (!pending_drop_) {
        return;
    }
    const std::string table = std::exchange(pending_drop_, std::nullopt).value();
    try {
        schema_.drop_table(table);
    } catch (const std::exception&) {
        done_ = true;
        throw;
    }
}

std::optional<std::string> TempTableSweeper::next() {
    if (done_) {
        return std::nullopt;
    }

    drop_pending();

    if (!tables_) {
        try {
            tables_ = schema_.list_table_names();
        } catch (const std::exception&) {
            done_ = true;
            throw;
        }
    }

    while (position_ < tables_->size()) {
        const std::string& table = (*tables_)[position_++];
        if (!table.starts_with(prefix_)) {
            continue;
        }
        ++matched_;
        if (!dry_run_) {
            pending_drop_ = table;
        }
        return std::format("table: {}", table);
    }

    done_ = true;
    if (matched_ == 0) {
        utils::log::info(std::format("No table starting with \"{}\" found", prefix_));
    }
    return std::nullopt;
}

} // namespace sqlanon
