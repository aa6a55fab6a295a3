#include "dump/dump_processor.hpp"
#include "dump/copy_codec.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <future>
#include <system_error>

namespace dumpscrub {

DumpProcessor::DumpProcessor(const Strategy& strategy, const DatabaseSchema& schema,
                             IFakeDataSource& fake, ProcessorOptions options)
    : strategy_(strategy),
      schema_(schema),
      options_(options),
      rewriter_(fake, uniqueness_) {
    options_.workers = std::max<size_t>(options_.workers, 1);
    options_.batch_size = std::max<size_t>(options_.batch_size, 1);
}

Result<DumpProcessor::CopyBlock> DumpProcessor::open_block(const dump::CopyStatement& stmt) const {
    using R = Result<CopyBlock>;

    CopyBlock block;
    block.table = stmt.table_name;

    const TableStrategy* table = strategy_.find_table(stmt.table_name);
    if (table && table->truncate) {
        block.truncate = true;
        return R::ok(std::move(block));
    }

    const TableSchema* table_schema = schema_.find_table(stmt.table_name);

    // Without a column list, COPY data follows the CREATE TABLE column order
    std::vector<std::string> names = stmt.columns;
    if (names.empty()) {
        if (!table_schema || table_schema->columns.empty()) {
            return R::error(ErrorCode::UNCONFIGURED_COLUMN,
                std::format("{}: COPY has no column list and no CREATE TABLE was seen",
                            stmt.table_name));
        }
        for (const auto& col : table_schema->columns) names.push_back(col.name);
    }

    for (const auto& name : names) {
        const ColumnConfig* cfg = table ? table->find_column(name) : nullptr;
        if (!cfg) {
            return R::error(ErrorCode::UNCONFIGURED_COLUMN,
                std::format("{}.{}: present in the dump but not configured", stmt.table_name, name));
        }
        block.columns.push_back(*cfg);

        bool is_array = false;
        if (table_schema) {
            for (const auto& col : table_schema->columns) {
                if (col.name == name) { is_array = col.is_array(); break; }
            }
        }
        block.array_columns.push_back(is_array);
    }
    return R::ok(std::move(block));
}

std::vector<Result<Row>> DumpProcessor::rewrite_batch(const CopyBlock& block,
                                                      const std::vector<Row>& rows) {
    std::vector<Result<Row>> results(rows.size());
    const size_t num_rows = rows.size();

    // Rewrites rows [start, end)
    auto rewrite_range = [&](size_t start, size_t end) {
        for (size_t r = start; r < end; ++r) {
            results[r] = rewriter_.rewrite_row(block.table, block.columns, rows[r],
                                               block.array_columns);
        }
    };

    if (options_.workers > 1 && num_rows > 1) {
        const size_t num_workers = std::min(options_.workers, num_rows);
        const size_t chunk = (num_rows + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_rows);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, rewrite_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        rewrite_range(0, num_rows);
    }

    return results;
}

Result<size_t> DumpProcessor::flush_batch(CopyBlock& block, std::vector<std::string>& pending,
                                          std::ostream& out, ProcessStats& stats) {
    if (pending.empty()) return Result<size_t>::ok(0);
    if (cancelled()) {
        return Result<size_t>::error(ErrorCode::CANCELLED, "run cancelled");
    }

    // Row number (1-based, within the table) of the first pending line
    const size_t first_row = block.rows - pending.size() + 1;

    std::vector<Row> rows;
    rows.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        auto row = dump::copy_text::decode_row(pending[i]);
        if (row.size() != block.columns.size()) {
            return Result<size_t>::error(ErrorCode::PARSE_ERROR,
                std::format("{} row {}: expected {} fields, got {}",
                            block.table, first_row + i, block.columns.size(), row.size()));
        }
        rows.emplace_back(std::move(row));
    }
    pending.clear();

    auto results = rewrite_batch(block, rows);

    size_t written = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        const size_t row_no = first_row + i;

        if (result.is_error()) {
            if (is_data_error(result.error_code()) &&
                options_.on_data_error == DataErrorPolicy::SKIP_ROW) {
                utils::log::warn(std::format("row {} skipped: {}", row_no, result.error_message()));
                ++stats.rows_skipped;
                continue;
            }
            return Result<size_t>::error(result.error_code(),
                std::format("row {}: {}", row_no, result.error_message()));
        }

        out << dump::copy_text::encode_row(result.value()) << '\n';
        ++written;
    }

    stats.rows_written += written;
    return Result<size_t>::ok(written);
}

Result<ProcessStats> DumpProcessor::process(std::istream& in, std::ostream& out) {
    using R = Result<ProcessStats>;

    ProcessStats stats;
    std::optional<CopyBlock> block;
    std::vector<std::string> pending;
    pending.reserve(options_.batch_size);

    std::string line;
    while (std::getline(in, line)) {
        if (!block) {
            if (auto stmt = dump::parse_copy_statement(line)) {
                if (cancelled()) return R::error(ErrorCode::CANCELLED, "run cancelled");

                auto opened = open_block(*stmt);
                if (opened.is_error()) {
                    return R::error(opened.error_code(), opened.error_message());
                }
                block = std::move(opened.value());
                ++stats.tables;
                if (block->truncate) {
                    ++stats.truncated_tables;
                    utils::log::debug(std::format("{}: truncating", block->table));
                } else {
                    utils::log::debug(std::format("{}: rewriting", block->table));
                }
            }
            out << line << '\n';
            continue;
        }

        if (dump::is_copy_terminator(line)) {
            auto flushed = flush_batch(*block, pending, out, stats);
            if (flushed.is_error()) {
                return R::error(flushed.error_code(), flushed.error_message());
            }
            utils::log::debug(std::format("{}: {} rows", block->table, block->rows));
            block.reset();
            out << line << '\n';
            continue;
        }

        ++stats.rows_read;
        ++block->rows;

        if (block->truncate) {
            ++stats.rows_truncated;
            continue;
        }

        pending.push_back(std::move(line));
        if (pending.size() >= options_.batch_size) {
            auto flushed = flush_batch(*block, pending, out, stats);
            if (flushed.is_error()) {
                return R::error(flushed.error_code(), flushed.error_message());
            }
        }
    }

    if (in.bad()) {
        return R::error(ErrorCode::IO_ERROR, "read error while rewriting dump");
    }
    if (block) {
        return R::error(ErrorCode::PARSE_ERROR,
            std::format("{}: unterminated COPY data block", block->table));
    }

    out.flush();
    if (!out) {
        return R::error(ErrorCode::IO_ERROR, "write error while rewriting dump");
    }
    return R::ok(stats);
}

Result<ProcessStats> DumpProcessor::process_file(const std::string& input_path,
                                                 const std::string& output_path) {
    std::ifstream in(input_path);
    if (!in) {
        return Result<ProcessStats>::error(ErrorCode::IO_ERROR,
            std::format("Failed to open dump file: {}", input_path));
    }

    std::ofstream out(output_path, std::ios::out | std::ios::trunc);
    if (!out) {
        return Result<ProcessStats>::error(ErrorCode::IO_ERROR,
            std::format("Failed to open output file: {}", output_path));
    }

    auto remove_output = [&] {
        out.close();
        std::error_code ec;
        std::filesystem::remove(output_path, ec);
        if (ec) {
            utils::log::warn(std::format("Failed to remove partial output {}: {}",
                                         output_path, ec.message()));
        }
    };

    try {
        auto result = process(in, out);
        if (result.is_error()) {
            remove_output();
        }
        return result;
    } catch (const std::exception&) {
        remove_output();
        throw;
    }
}

} // namespace dumpscrub
