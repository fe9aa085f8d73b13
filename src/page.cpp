#include "sdds_internal.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>

namespace sdds {

namespace internal {

static ErrorLocation page_location(std::size_t page_number, const std::string& field) {
    ErrorLocation loc;
    loc.page = page_number;
    loc.field = field;
    return loc;
}

static Value fixed_parameter(const FieldDef& f, const InputCursor& in) {
    return parse_literal(*f.fixed_value, f.type, in.where());
}

static std::size_t element_count(const std::vector<std::int32_t>& dims, const ErrorLocation& loc) {
    std::size_t n = 1;
    for (std::int32_t d : dims) {
        if (d < 0) throw SddsError(ErrorKind::InvalidData, "negative array dimension " + std::to_string(d), loc);
        const auto u = static_cast<std::size_t>(d);
        if (u != 0 && n > std::numeric_limits<std::size_t>::max() / u) {
            throw SddsError(ErrorKind::InvalidData, "array size overflow", loc);
        }
        n *= u;
    }
    return n;
}

// ------------------------------
// Binary pages
// ------------------------------

static std::optional<Page> read_binary_page(const Schema& schema, InputCursor& in, const ReadOptions& opts) {
    if (in.at_eof()) return std::nullopt;
    const std::uint64_t start = in.offset();
    const Endianness e = schema.resolved_endianness(opts.default_endianness);

    Page p;
    in.field.clear();
    if (schema.data.no_row_counts) {
        if (!opts.row_count) {
            throw SddsError(ErrorKind::RowCountRequired,
                "data has no row counts; a row count must be supplied", in.where());
        }
        p.row_count = *opts.row_count;
    } else {
        const std::uint64_t at = in.offset();
        std::int32_t n = read_binary_i32(in, e);
        if (n < 0) throw SddsError(ErrorKind::InvalidData, "negative row count " + std::to_string(n), in.where(at));
        p.row_count = static_cast<std::size_t>(n);
    }

    for (const FieldDef* f : schema.parameters()) {
        in.field = f->name;
        if (f->fixed_value) {
            p.parameters.emplace(f->name, fixed_parameter(*f, in));
        } else {
            p.parameters.emplace(f->name, read_binary_value(in, f->type, e));
        }
    }

    for (const FieldDef* f : schema.arrays()) {
        in.field = f->name;
        const ErrorLocation loc = in.where();
        ArrayValue a;
        for (int d = 0; d < f->dimensions; ++d) a.dims.push_back(read_binary_i32(in, e));
        const std::size_t n = element_count(a.dims, loc);
        a.values = make_vector(f->type);
        read_binary_values(in, a.values, n, e);
        p.arrays.emplace(f->name, std::move(a));
    }

    const auto columns = schema.columns();
    std::vector<ValueVector*> slots;
    slots.reserve(columns.size());
    for (const FieldDef* f : columns) {
        auto it = p.columns.emplace(f->name, make_vector(f->type)).first;
        slots.push_back(&it->second);
    }

    if (schema.data.column_major_order) {
        for (std::size_t c = 0; c < columns.size(); ++c) {
            in.field = columns[c]->name;
            read_binary_values(in, *slots[c], p.row_count, e);
        }
    } else if (!columns.empty()) {
        for (ValueVector* v : slots) {
            std::visit([&](auto& vec) { vec.reserve(std::min(p.row_count, kMaxReserve)); }, *v);
        }
        for (std::size_t r = 0; r < p.row_count; ++r) {
            for (std::size_t c = 0; c < columns.size(); ++c) {
                in.field = columns[c]->name;
                push_back(*slots[c], read_binary_value(in, columns[c]->type, e));
            }
        }
    }

    if (in.offset() == start && !in.at_eof()) {
        in.field.clear();
        throw SddsError(ErrorKind::InvalidData, "trailing bytes after the last page", in.where());
    }
    return p;
}

static void encode_binary_page(const Schema& schema, const Page& page, std::string& out) {
    const Endianness e = schema.resolved_endianness();
    if (!schema.data.no_row_counts) {
        append_binary_i32(out, static_cast<std::int32_t>(page.row_count), e);
    }
    for (const FieldDef* f : schema.parameters()) {
        if (f->fixed_value) continue;
        append_binary_value(out, page.parameter(f->name), e);
    }
    for (const FieldDef* f : schema.arrays()) {
        const ArrayValue& a = page.array(f->name);
        for (std::int32_t d : a.dims) append_binary_i32(out, d, e);
        const std::size_t n = size_of(a.values);
        for (std::size_t i = 0; i < n; ++i) append_binary_element(out, a.values, i, e);
    }

    std::vector<const ValueVector*> cols;
    for (const FieldDef* f : schema.columns()) cols.push_back(&page.column(f->name));
    if (schema.data.column_major_order) {
        for (const ValueVector* v : cols) {
            for (std::size_t r = 0; r < page.row_count; ++r) append_binary_element(out, *v, r, e);
        }
    } else {
        for (std::size_t r = 0; r < page.row_count; ++r) {
            for (const ValueVector* v : cols) append_binary_element(out, *v, r, e);
        }
    }
}

// ------------------------------
// ASCII pages
// ------------------------------

// Line reader for one ASCII page with a single line of pushback.
class AsciiLines {
public:
    explicit AsciiLines(InputCursor& in) : in_(in) {}

    // Next line that is neither blank nor a comment. False at end of stream.
    bool next_content(std::string& line) {
        if (pending_) {
            line = std::move(*pending_);
            pending_.reset();
            return true;
        }
        while (true) {
            start_ = in_.offset();
            if (!in_.read_line(line)) return false;
            if (is_blank(line) || is_comment(line)) continue;
            return true;
        }
    }

    // Next line that is not a comment; blank lines are returned.
    bool next_row(std::string& line) {
        if (pending_) {
            line = std::move(*pending_);
            pending_.reset();
            return true;
        }
        while (true) {
            start_ = in_.offset();
            if (!in_.read_line(line)) return false;
            if (is_comment(line)) continue;
            return true;
        }
    }

    void push_back(std::string line) { pending_ = std::move(line); }

    ErrorLocation where() const { return in_.where(start_); }

    // Content line or TruncatedStream naming what was expected.
    std::string require(const char* what) {
        std::string line;
        if (!next_content(line)) {
            throw SddsError(ErrorKind::TruncatedStream, std::string("unexpected end of stream while reading ") + what,
                in_.where());
        }
        return line;
    }

private:
    InputCursor& in_;
    std::optional<std::string> pending_{};
    std::uint64_t start_{0};
};

static void parse_row(const std::string& line, std::vector<ValueVector*>& slots,
                      const std::vector<const FieldDef*>& columns, InputCursor& in, const ErrorLocation& loc) {
    std::vector<std::string> tokens = split_tokens(line, loc);
    if (tokens.size() != slots.size()) {
        std::ostringstream oss;
        oss << "row has " << tokens.size() << " values, expected " << slots.size();
        throw SddsError(ErrorKind::FieldCountMismatch, oss.str(), loc);
    }
    for (std::size_t c = 0; c < slots.size(); ++c) {
        in.field = columns[c]->name;
        ErrorLocation cloc = loc;
        cloc.field = in.field;
        parse_ascii_into(*slots[c], tokens[c], cloc);
    }
}

static std::optional<Page> read_ascii_page(const Schema& schema, InputCursor& in) {
    AsciiLines lines(in);
    std::string line;
    in.field.clear();
    if (!lines.next_content(line)) return std::nullopt;
    lines.push_back(std::move(line));

    Page p;
    for (const FieldDef* f : schema.parameters()) {
        in.field = f->name;
        if (f->fixed_value) {
            p.parameters.emplace(f->name, fixed_parameter(*f, in));
            continue;
        }
        line = lines.require("a parameter value");
        const ErrorLocation loc = lines.where();
        std::string_view t = trim(line);
        if (f->type == ScalarType::String && (t.empty() || t.front() != '"')) {
            p.parameters.emplace(f->name, Value{std::string(t)});
            continue;
        }
        std::vector<std::string> tokens = split_tokens(t, loc);
        if (tokens.size() != 1) {
            throw SddsError(ErrorKind::FieldCountMismatch,
                "parameter line holds " + std::to_string(tokens.size()) + " values", loc);
        }
        p.parameters.emplace(f->name, parse_ascii_value(tokens[0], f->type, loc));
    }

    for (const FieldDef* f : schema.arrays()) {
        in.field = f->name;
        line = lines.require("array dimensions");
        ErrorLocation loc = lines.where();
        std::vector<std::string> tokens = split_tokens(line, loc);
        if (tokens.size() != static_cast<std::size_t>(f->dimensions)) {
            throw SddsError(ErrorKind::FieldCountMismatch,
                "expected " + std::to_string(f->dimensions) + " array dimensions, got " + std::to_string(tokens.size()), loc);
        }
        ArrayValue a;
        for (const auto& tok : tokens) {
            a.dims.push_back(std::get<std::int32_t>(parse_ascii_value(tok, ScalarType::Long, loc)));
        }
        const std::size_t n = element_count(a.dims, loc);
        a.values = make_vector(f->type);
        while (size_of(a.values) < n) {
            line = lines.require("array elements");
            loc = lines.where();
            tokens = split_tokens(line, loc);
            if (size_of(a.values) + tokens.size() > n) {
                throw SddsError(ErrorKind::FieldCountMismatch, "more array elements than its dimensions allow", loc);
            }
            for (const auto& tok : tokens) parse_ascii_into(a.values, tok, loc);
        }
        p.arrays.emplace(f->name, std::move(a));
    }

    const auto columns = schema.columns();
    std::vector<ValueVector*> slots;
    for (const FieldDef* f : columns) {
        auto it = p.columns.emplace(f->name, make_vector(f->type)).first;
        slots.push_back(&it->second);
    }

    if (!schema.data.no_row_counts) {
        in.field.clear();
        line = lines.require("the row count");
        const ErrorLocation loc = lines.where();
        std::vector<std::string> tokens = split_tokens(line, loc);
        if (tokens.size() != 1) {
            throw SddsError(ErrorKind::FieldCountMismatch, "row count line must hold a single value", loc);
        }
        std::int32_t n = std::get<std::int32_t>(parse_ascii_value(tokens[0], ScalarType::Long, loc));
        if (n < 0) throw SddsError(ErrorKind::InvalidData, "negative row count " + std::to_string(n), loc);
        p.row_count = static_cast<std::size_t>(n);
        if (!columns.empty()) {
            for (std::size_t r = 0; r < p.row_count; ++r) {
                line = lines.require("a row");
                parse_row(line, slots, columns, in, lines.where());
            }
        }
    } else {
        // Rows run to a blank line (consumed) or to the end of the stream.
        while (lines.next_row(line)) {
            if (is_blank(line)) break;
            parse_row(line, slots, columns, in, lines.where());
            ++p.row_count;
        }
    }
    in.field.clear();
    return p;
}

static void encode_ascii_page(const Schema& schema, const Page& page, std::size_t page_number, std::string& out) {
    out += "! page number " + std::to_string(page_number) + "\n";
    for (const FieldDef* f : schema.parameters()) {
        if (f->fixed_value) continue;
        append_ascii_value(out, page.parameter(f->name));
        out += '\n';
    }
    for (const FieldDef* f : schema.arrays()) {
        const ArrayValue& a = page.array(f->name);
        for (std::size_t d = 0; d < a.dims.size(); ++d) {
            if (d) out += ' ';
            out += std::to_string(a.dims[d]);
        }
        out += '\n';
        const std::size_t n = size_of(a.values);
        for (std::size_t i = 0; i < n; ++i) {
            append_ascii_element(out, a.values, i);
            out += (i + 1 == n || (i + 1) % 8 == 0) ? '\n' : ' ';
        }
    }

    std::vector<const ValueVector*> cols;
    for (const FieldDef* f : schema.columns()) cols.push_back(&page.column(f->name));
    if (!schema.data.no_row_counts) {
        out += std::to_string(page.row_count) + "\n";
    }
    if (!cols.empty()) {
        for (std::size_t r = 0; r < page.row_count; ++r) {
            for (std::size_t c = 0; c < cols.size(); ++c) {
                if (c) out += ' ';
                append_ascii_element(out, *cols[c], r);
            }
            out += '\n';
        }
    }
    if (schema.data.no_row_counts) out += '\n';
}

// ------------------------------
// Dispatch
// ------------------------------

std::optional<Page> read_page_at(
    const Schema& schema,
    InputCursor& in,
    const ReadOptions& opts,
    std::size_t page_number
) {
    in.page = page_number;
    in.field.clear();
    if (schema.data.mode == DataMode::Binary) return read_binary_page(schema, in, opts);
    return read_ascii_page(schema, in);
}

void encode_page(const Schema& schema, const Page& page, std::size_t page_number, std::string& out) {
    if (schema.data.mode == DataMode::Binary) {
        encode_binary_page(schema, page, out);
    } else {
        encode_ascii_page(schema, page, page_number, out);
    }
}

} // namespace internal

// ------------------------------
// Validation and public page API
// ------------------------------

static void check_type(const FieldDef& f, ScalarType got, std::size_t page_number) {
    if (got != f.type) {
        throw SddsError(ErrorKind::TypeMismatch,
            to_string(f.kind) + " is declared " + to_string(f.type) + " but holds " + to_string(got),
            internal::page_location(page_number, f.name));
    }
}

// Equality that also matches NaN against NaN.
static bool same_value(const Value& a, const Value& b) {
    if (a == b) return true;
    return std::visit([](const auto& x, const auto& y) {
        using X = std::decay_t<decltype(x)>;
        using Y = std::decay_t<decltype(y)>;
        if constexpr (std::is_same_v<X, Y> && std::is_floating_point_v<X>) {
            return std::isnan(x) && std::isnan(y);
        } else {
            return false;
        }
    }, a, b);
}

template <typename Map>
static void check_declared(const Schema& schema, const Map& values, FieldKind kind, std::size_t page_number) {
    for (const auto& kv : values) {
        const FieldDef* f = schema.find(kv.first);
        if (!f || f->kind != kind) {
            throw SddsError(ErrorKind::InvalidData, "page holds undeclared " + to_string(kind) + " '" + kv.first + "'",
                internal::page_location(page_number, kv.first));
        }
    }
}

void validate_page(const Schema& schema, const Page& page, std::size_t page_number) {
    check_declared(schema, page.parameters, FieldKind::Parameter, page_number);
    check_declared(schema, page.columns, FieldKind::Column, page_number);
    check_declared(schema, page.arrays, FieldKind::Array, page_number);

    if (page.row_count > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw SddsError(ErrorKind::InvalidData, "row count exceeds the format limit",
            internal::page_location(page_number, {}));
    }

    for (const FieldDef& f : schema.fields()) {
        const ErrorLocation loc = internal::page_location(page_number, f.name);
        switch (f.kind) {
            case FieldKind::Parameter: {
                auto it = page.parameters.find(f.name);
                if (it == page.parameters.end()) {
                    if (f.fixed_value) break;
                    throw SddsError(ErrorKind::MissingValue, "missing parameter", loc);
                }
                check_type(f, type_of(it->second), page_number);
                // Fixed values live in the header; the page may only repeat them.
                if (f.fixed_value && !same_value(it->second, internal::parse_literal(*f.fixed_value, f.type, loc))) {
                    throw SddsError(ErrorKind::InvalidData,
                        "value differs from the declared fixed_value '" + *f.fixed_value + "'", loc);
                }
                break;
            }
            case FieldKind::Column: {
                auto it = page.columns.find(f.name);
                if (it == page.columns.end()) throw SddsError(ErrorKind::MissingValue, "missing column", loc);
                check_type(f, type_of(it->second), page_number);
                const std::size_t n = size_of(it->second);
                if (n != page.row_count) {
                    std::ostringstream oss;
                    oss << "column has " << n << " values but the page has " << page.row_count << " rows";
                    throw SddsError(ErrorKind::RowCountMismatch, oss.str(), loc);
                }
                break;
            }
            case FieldKind::Array: {
                auto it = page.arrays.find(f.name);
                if (it == page.arrays.end()) throw SddsError(ErrorKind::MissingValue, "missing array", loc);
                const ArrayValue& a = it->second;
                check_type(f, type_of(a.values), page_number);
                if (a.dims.size() != static_cast<std::size_t>(f.dimensions)) {
                    throw SddsError(ErrorKind::InvalidData,
                        "array declared with " + std::to_string(f.dimensions) + " dimensions has " +
                        std::to_string(a.dims.size()) + " sizes", loc);
                }
                if (internal::element_count(a.dims, loc) != size_of(a.values)) {
                    throw SddsError(ErrorKind::InvalidData, "array element count does not match its dimensions", loc);
                }
                break;
            }
        }
    }

    if (schema.data.mode == DataMode::Ascii && schema.data.no_row_counts) {
        if (schema.columns().empty() && page.row_count != 0) {
            throw SddsError(ErrorKind::InvalidData, "rows without columns cannot be stored without row counts",
                internal::page_location(page_number, {}));
        }
        // Such a page would be written as a blank line only.
        const bool has_lines = !schema.arrays().empty() ||
            std::any_of(schema.fields().begin(), schema.fields().end(), [](const FieldDef& f) {
                return f.kind == FieldKind::Parameter && !f.fixed_value;
            });
        if (!has_lines && page.row_count == 0) {
            throw SddsError(ErrorKind::InvalidData, "an empty page cannot be stored without row counts",
                internal::page_location(page_number, {}));
        }
    }
}

std::optional<Page> read_page(const Schema& schema, std::istream& is, const ReadOptions& opts) {
    std::uint64_t base = 0;
    auto pos = is.tellg();
    if (pos != std::istream::pos_type(-1)) base = static_cast<std::uint64_t>(pos);
    internal::InputCursor in(is, base);
    return internal::read_page_at(schema, in, opts, 1);
}

void write_page(const Schema& schema, const Page& page, std::ostream& os, std::size_t page_number) {
    validate_page(schema, page, page_number);
    std::string buf;
    internal::encode_page(schema, page, page_number, buf);
    os.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    if (!os) throw SddsError(ErrorKind::Io, "write failed", ErrorLocation{std::nullopt, page_number, {}});
}

} // namespace sdds
