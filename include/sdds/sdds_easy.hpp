#pragma once

#include "sdds/sdds.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sdds::easy {

inline FieldDef make_parameter(std::string name, ScalarType type, std::string units = {}) {
    FieldDef f;
    f.kind = FieldKind::Parameter;
    f.name = std::move(name);
    f.type = type;
    f.units = std::move(units);
    return f;
}

// A parameter whose value lives in the header and never in the data section.
inline FieldDef make_fixed_parameter(std::string name, ScalarType type, std::string literal) {
    FieldDef f = make_parameter(std::move(name), type);
    f.fixed_value = std::move(literal);
    return f;
}

inline FieldDef make_column(std::string name, ScalarType type, std::string units = {}) {
    FieldDef f;
    f.kind = FieldKind::Column;
    f.name = std::move(name);
    f.type = type;
    f.units = std::move(units);
    return f;
}

inline FieldDef make_array(std::string name, ScalarType type, int dimensions = 1) {
    FieldDef f;
    f.kind = FieldKind::Array;
    f.name = std::move(name);
    f.type = type;
    f.dimensions = dimensions;
    return f;
}

inline Schema make_schema(DataMode mode, std::vector<FieldDef> fields,
                          std::optional<Endianness> endianness = std::nullopt) {
    Schema s;
    s.data.mode = mode;
    s.data.endianness = endianness;
    for (auto& f : fields) s.add_field(std::move(f));
    return s;
}

// Schema for rewriting `in` in another mode and/or byte order. Binary output
// always carries row counts, since pages may differ in length. ASCII output
// drops the byte order and column-major layout.
inline Schema converted_schema(Schema in, std::optional<DataMode> mode,
                               std::optional<Endianness> endianness = std::nullopt) {
    if (mode) in.data.mode = *mode;
    if (endianness) in.data.endianness = endianness;
    if (in.data.mode == DataMode::Binary) {
        in.data.no_row_counts = false;
    } else {
        in.data.column_major_order = false;
        in.data.endianness = endianness;
    }
    return in;
}

inline void set(Page& page, std::string name, Value v) {
    page.parameters[std::move(name)] = std::move(v);
}

// Stores a column and sets the page's row count to its length.
template <typename T>
inline void set_column(Page& page, std::string name, std::vector<T> values) {
    page.row_count = values.size();
    page.columns[std::move(name)] = ValueVector{std::move(values)};
}

template <typename T>
inline void set_array(Page& page, std::string name, std::vector<std::int32_t> dims, std::vector<T> values) {
    ArrayValue a;
    a.dims = std::move(dims);
    a.values = ValueVector{std::move(values)};
    page.arrays[std::move(name)] = std::move(a);
}

// Numeric view of a value; std::nullopt for strings.
inline std::optional<double> as_double(const Value& v) {
    return std::visit([](const auto& x) -> std::optional<double> {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return std::nullopt;
        } else {
            return static_cast<double>(x);
        }
    }, v);
}

} // namespace sdds::easy
