#pragma once

#include "cdb/fdb/fdb-database.h"
#include "cdb/fdb/fdb-value.h"
#include "cdb/typed/column-spec.h"
#include "cdb/typed/typed-errors.h"
#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>

namespace cdb::typed {

/**
 * TypedRow - a raw row bound to the column map of its table kind
 *
 * Accessors decode by declared kind. For a required column get<C>() returns
 * the plain value and throws FieldContractError if the stored value is null
 * or of another type. For an optional column it returns std::optional and is
 * empty when the column is absent from the file, the value is null, or the
 * value is of another type.
 *
 * A TypedRow borrows both the backing buffer and the column map of the
 * TypedTable it came from; it must not outlive either.
 */
template <typename SchemaT>
class TypedRow
{
public:
    using Schema = SchemaT;
    using Column = typename Schema::Column;
    using Map = ColumnMap<Schema>;

    template <Column C>
    using value_type = typename KindTraits<Map::spec(C).kind>::type;

    TypedRow(fdb::Row inner, const Map& columns)
        : inner_(inner), columns_(&columns)
    {
    }

    const fdb::Row&
    raw() const
    {
        return inner_;
    }

    template <Column C>
    auto
    get() const
    {
        if constexpr (Map::spec(C).required)
        {
            return read_required<C>();
        }
        else
        {
            return try_get<C>();
        }
    }

    /**
     * Read any column as optional, without the required-value contract.
     * For queries that supply their own default for a missing value.
     */
    template <Column C>
    std::optional<value_type<C>>
    try_get() const
    {
        auto index = columns_->index_of(C);
        if (!index)
        {
            return std::nullopt;
        }
        auto field = inner_.field_at(*index);
        if (!field)
        {
            return std::nullopt;
        }
        return KindTraits<Map::spec(C).kind>::extract(*field);
    }

    /**
     * Call f(spec, value) for every declared column, in declaration order,
     * with value as returned by get<C>().
     */
    template <typename F>
    void
    visit_columns(F&& f) const
    {
        [&]<size_t... I>(std::index_sequence<I...>) {
            (f(Map::spec(static_cast<Column>(I)),
               this->template get<static_cast<Column>(I)>()),
             ...);
        }(std::make_index_sequence<Map::column_count>{});
    }

private:
    template <Column C>
    value_type<C>
    read_required() const
    {
        constexpr const ColumnSpec& spec = Map::spec(C);

        // Required columns always resolve, or the table would not exist
        auto field = inner_.field_at(*columns_->index_of(C));
        if (field)
        {
            if (auto value = KindTraits<spec.kind>::extract(*field))
            {
                return *value;
            }
        }
        throw FieldContractError(
            Schema::table_name,
            spec.name,
            value_kind_to_string(spec.kind),
            field ? fdb::value_type_to_string(field->type()) : "no field");
    }

    fdb::Row inner_;
    const Map* columns_;
};

/**
 * Lazy, restartable range of typed rows over an fdb::RowRange
 */
template <typename RowT>
class TypedRowRange
{
public:
    using Map = typename RowT::Map;

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = RowT;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = RowT;

        iterator() = default;
        iterator(fdb::RowIterator it, const Map* columns)
            : it_(it), columns_(columns)
        {
        }

        RowT
        operator*() const
        {
            return RowT(*it_, *columns_);
        }
        iterator&
        operator++()
        {
            ++it_;
            return *this;
        }
        iterator
        operator++(int)
        {
            iterator tmp = *this;
            ++it_;
            return tmp;
        }
        bool
        operator==(const iterator& other) const
        {
            return it_ == other.it_;
        }

    private:
        fdb::RowIterator it_;
        const Map* columns_ = nullptr;
    };

    TypedRowRange(fdb::RowRange inner, const Map& columns)
        : inner_(inner), columns_(&columns)
    {
    }

    iterator
    begin() const
    {
        return {inner_.begin(), columns_};
    }
    iterator
    end() const
    {
        return {inner_.end(), columns_};
    }
    bool
    empty() const
    {
        return inner_.empty();
    }

private:
    fdb::RowRange inner_;
    const Map* columns_;
};

}  // namespace cdb::typed
