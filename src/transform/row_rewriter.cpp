#include "transform/row_rewriter.hpp"
#include "transform/transformer_registry.hpp"
#include "dump/pg_array.hpp"

#include <format>
#include <stdexcept>

namespace dumpscrub {

RowRewriter::RowRewriter(IFakeDataSource& fake, UniquenessTracker& uniqueness)
    : fake_(fake), uniqueness_(uniqueness) {}

Result<std::shared_ptr<const Transformer>> RowRewriter::transformer_for(
    const std::string& table, const ColumnConfig& column) {
    using R = Result<std::shared_ptr<const Transformer>>;
    ColumnKey key(table, column.name);

    {
        std::shared_lock lock(cache_mutex_);
        const auto it = cache_.find(key);
        if (it != cache_.end()) {
            return R::ok(it->second);
        }
    }

    auto resolved = TransformerRegistry::resolve(column.transformer);
    if (resolved.is_error()) {
        return R::error(resolved.error_code(),
            std::format("{}: {}", key.full_name(), resolved.error_message()));
    }

    std::unique_lock lock(cache_mutex_);
    auto [it, inserted] = cache_.try_emplace(std::move(key), nullptr);
    if (inserted) {
        it->second = std::make_shared<const Transformer>(std::move(resolved.value()));
    }
    return R::ok(it->second);
}

Result<Row> RowRewriter::rewrite_row(const std::string& table,
                                     const std::vector<ColumnConfig>& columns,
                                     const Row& values,
                                     const std::vector<bool>& array_columns) {
    if (columns.size() != values.size()) {
        throw std::logic_error(std::format(
            "{}: row has {} values but {} columns are configured",
            table, values.size(), columns.size()));
    }

    Row out;
    out.reserve(values.size());

    for (size_t i = 0; i < values.size(); ++i) {
        const auto& value = values[i];
        if (!value.has_value()) {
            out.emplace_back(std::nullopt);
            continue;
        }

        auto transformer = transformer_for(table, columns[i]);
        if (transformer.is_error()) {
            return Result<Row>::error(transformer.error_code(), transformer.error_message());
        }

        TransformContext ctx{fake_, uniqueness_, ColumnKey(table, columns[i].name)};
        const auto& t = *transformer.value();

        const bool is_array = i < array_columns.size() && array_columns[i];
        auto rewritten = is_array
            ? pg_array::transform(*value, [&](std::string_view element) { return t.apply(element, ctx); })
            : t.apply(*value, ctx);

        if (rewritten.is_error()) {
            return Result<Row>::error(rewritten.error_code(),
                std::format("{}.{}: {}", table, columns[i].name, rewritten.error_message()));
        }
        out.emplace_back(std::move(rewritten.value()));
    }

    return Result<Row>::ok(std::move(out));
}

size_t RowRewriter::cached_transformer_count() const {
    std::shared_lock lock(cache_mutex_);
    return cache_.size();
}

} // namespace dumpscrub
