#pragma once

#include "config/strategy.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "dump/copy_statement.hpp"
#include "transform/ifake_data_source.hpp"
#include "transform/row_rewriter.hpp"
#include "transform/uniqueness_tracker.hpp"

#include <atomic>
#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace dumpscrub {

struct ProcessorOptions {
    size_t workers = 1;         // Threads per batch
    size_t batch_size = 1000;   // Rows buffered before a batch is rewritten
    DataErrorPolicy on_data_error = DataErrorPolicy::ABORT;
};

struct ProcessStats {
    size_t tables = 0;              // COPY blocks seen
    size_t truncated_tables = 0;
    size_t rows_read = 0;
    size_t rows_written = 0;
    size_t rows_skipped = 0;        // Dropped under DataErrorPolicy::SKIP_ROW
    size_t rows_truncated = 0;
};

// ============================================================================
// DumpProcessor - Second pass: stream the dump, rewriting COPY rows
// ============================================================================

/**
 * @brief Rewrites every COPY data block of a plain-format dump
 *
 * All non-data lines are copied through. Rows are buffered into batches,
 * each batch is split among `workers` threads, and results are written in
 * input order. The strategy is expected to have passed validation against
 * `schema` already; a COPY column without configuration still fails here.
 *
 * cancel() may be called from another thread or a signal handler; the run
 * stops before the next batch with ErrorCode::CANCELLED.
 */
class DumpProcessor {
public:
    DumpProcessor(const Strategy& strategy, const DatabaseSchema& schema,
                  IFakeDataSource& fake, ProcessorOptions options = {});

    DumpProcessor(const DumpProcessor&) = delete;
    DumpProcessor& operator=(const DumpProcessor&) = delete;

    [[nodiscard]] Result<ProcessStats> process(std::istream& in, std::ostream& out);

    /**
     * @brief Process input_path into output_path
     *
     * On any failure the partially written output file is removed.
     */
    [[nodiscard]] Result<ProcessStats> process_file(const std::string& input_path,
                                                    const std::string& output_path);

    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

    [[nodiscard]] const UniquenessTracker& uniqueness() const { return uniqueness_; }

private:
    struct CopyBlock {
        std::string table;
        std::vector<ColumnConfig> columns;      // COPY (or CREATE TABLE) column order
        std::vector<bool> array_columns;
        bool truncate = false;
        size_t rows = 0;                        // Data lines seen so far
    };

    [[nodiscard]] Result<CopyBlock> open_block(const dump::CopyStatement& stmt) const;

    // Rewrites and writes the pending lines; returns the number of rows written
    [[nodiscard]] Result<size_t> flush_batch(CopyBlock& block, std::vector<std::string>& pending,
                                             std::ostream& out, ProcessStats& stats);

    [[nodiscard]] std::vector<Result<Row>> rewrite_batch(const CopyBlock& block,
                                                         const std::vector<Row>& rows);

    const Strategy& strategy_;
    const DatabaseSchema& schema_;
    ProcessorOptions options_;
    UniquenessTracker uniqueness_;
    RowRewriter rewriter_;
    std::atomic<bool> cancelled_{false};
};

} // namespace dumpscrub
