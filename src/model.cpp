#include "sdds/sdds.hpp"

#include <cctype>
#include <cstring>
#include <sstream>
#include <type_traits>
#include <utility>

namespace sdds {

// ------------------------------
// Errors
// ------------------------------

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Io: return "Io";
        case ErrorKind::MalformedNamelist: return "MalformedNamelist";
        case ErrorKind::UnsupportedVersion: return "UnsupportedVersion";
        case ErrorKind::DuplicateFieldName: return "DuplicateFieldName";
        case ErrorKind::MissingName: return "MissingName";
        case ErrorKind::MissingType: return "MissingType";
        case ErrorKind::UnknownType: return "UnknownType";
        case ErrorKind::UnknownDataMode: return "UnknownDataMode";
        case ErrorKind::MissingDataCommand: return "MissingDataCommand";
        case ErrorKind::InvalidHeader: return "InvalidHeader";
        case ErrorKind::RowCountRequired: return "RowCountRequired";
        case ErrorKind::TruncatedStream: return "TruncatedStream";
        case ErrorKind::FieldCountMismatch: return "FieldCountMismatch";
        case ErrorKind::MissingValue: return "MissingValue";
        case ErrorKind::TypeMismatch: return "TypeMismatch";
        case ErrorKind::RowCountMismatch: return "RowCountMismatch";
        case ErrorKind::InvalidData: return "InvalidData";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Unsupported: return "Unsupported";
        case ErrorKind::ZlibError: return "ZlibError";
    }
    return "Unknown";
}

static std::string with_location(const std::string& msg, const ErrorLocation& loc) {
    if (!loc.offset && !loc.page && loc.field.empty()) return msg;
    std::ostringstream oss;
    oss << msg << " (";
    bool first = true;
    if (loc.offset) {
        oss << "offset " << *loc.offset;
        first = false;
    }
    if (loc.page) {
        if (!first) oss << ", ";
        oss << "page " << *loc.page;
        first = false;
    }
    if (!loc.field.empty()) {
        if (!first) oss << ", ";
        oss << "field '" << loc.field << "'";
    }
    oss << ')';
    return oss.str();
}

SddsError::SddsError(ErrorKind k, const std::string& msg, ErrorLocation loc)
    : std::runtime_error(with_location(msg, loc)), kind_(k), loc_(std::move(loc)) {}

ErrorKind SddsError::kind() const noexcept { return kind_; }

const ErrorLocation& SddsError::location() const noexcept { return loc_; }

// ------------------------------
// Scalar type helpers
// ------------------------------

std::string to_string(ScalarType t) {
    switch (t) {
        case ScalarType::Double: return "double";
        case ScalarType::Float: return "float";
        case ScalarType::Long: return "long";
        case ScalarType::Short: return "short";
        case ScalarType::Character: return "character";
        case ScalarType::String: return "string";
        case ScalarType::Boolean: return "boolean";
    }
    return "unknown";
}

std::optional<ScalarType> scalar_type_from_string(const std::string& s) {
    std::string t;
    t.reserve(s.size());
    for (char c : s) t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (t == "double") return ScalarType::Double;
    if (t == "float") return ScalarType::Float;
    if (t == "long") return ScalarType::Long;
    if (t == "short") return ScalarType::Short;
    if (t == "character") return ScalarType::Character;
    if (t == "string") return ScalarType::String;
    if (t == "boolean") return ScalarType::Boolean;
    return std::nullopt;
}

std::size_t binary_width(ScalarType t) {
    switch (t) {
        case ScalarType::Double: return 8;
        case ScalarType::Float: return 4;
        case ScalarType::Long: return 4;
        case ScalarType::Short: return 2;
        case ScalarType::Character: return 1;
        case ScalarType::String: return 0;
        case ScalarType::Boolean: return 4;
    }
    return 0;
}

ScalarType type_of(const Value& v) {
    return static_cast<ScalarType>(v.index());
}

ScalarType type_of(const ValueVector& v) {
    return static_cast<ScalarType>(v.index());
}

ValueVector make_vector(ScalarType t) {
    switch (t) {
        case ScalarType::Double: return std::vector<double>{};
        case ScalarType::Float: return std::vector<float>{};
        case ScalarType::Long: return std::vector<std::int32_t>{};
        case ScalarType::Short: return std::vector<std::int16_t>{};
        case ScalarType::Character: return std::vector<char>{};
        case ScalarType::String: return std::vector<std::string>{};
        case ScalarType::Boolean: return std::vector<bool>{};
    }
    throw SddsError(ErrorKind::InvalidData, "invalid scalar type");
}

std::size_t size_of(const ValueVector& v) {
    return std::visit([](const auto& vec) { return vec.size(); }, v);
}

Value value_at(const ValueVector& v, std::size_t i) {
    if (i >= size_of(v)) throw SddsError(ErrorKind::NotFound, "value index out of range");
    return std::visit([i](const auto& vec) -> Value {
        using Vec = std::decay_t<decltype(vec)>;
        return Value{static_cast<typename Vec::value_type>(vec[i])};
    }, v);
}

void push_back(ValueVector& v, const Value& x) {
    if (v.index() != x.index()) {
        throw SddsError(ErrorKind::TypeMismatch,
            "cannot store " + to_string(type_of(x)) + " value in " + to_string(type_of(v)) + " sequence");
    }
    std::visit([&x](auto& vec) {
        using T = typename std::decay_t<decltype(vec)>::value_type;
        vec.push_back(std::get<T>(x));
    }, v);
}

// ------------------------------
// Enum names
// ------------------------------

std::string to_string(FieldKind k) {
    switch (k) {
        case FieldKind::Parameter: return "parameter";
        case FieldKind::Column: return "column";
        case FieldKind::Array: return "array";
    }
    return "unknown";
}

std::string to_string(DataMode m) {
    return m == DataMode::Binary ? "binary" : "ascii";
}

std::string to_string(Endianness e) {
    return e == Endianness::Big ? "big-endian" : "little-endian";
}

Endianness native_endianness() noexcept {
    const std::uint16_t x = 1;
    unsigned char b = 0;
    std::memcpy(&b, &x, 1);
    return b == 1 ? Endianness::Little : Endianness::Big;
}

// ------------------------------
// Schema
// ------------------------------

void Schema::add_field(FieldDef f) {
    if (f.name.empty()) {
        throw SddsError(ErrorKind::MissingName, "field definition without a name");
    }
    auto it = index_.find(f.name);
    if (it != index_.end()) {
        const FieldDef& prev = fields_[it->second];
        throw SddsError(ErrorKind::DuplicateFieldName,
            "'" + f.name + "' declared as " + to_string(f.kind) + " is already declared as " + to_string(prev.kind),
            ErrorLocation{std::nullopt, std::nullopt, f.name});
    }
    if (f.kind == FieldKind::Array && f.dimensions < 1) {
        throw SddsError(ErrorKind::InvalidHeader, "array dimensions must be at least 1",
            ErrorLocation{std::nullopt, std::nullopt, f.name});
    }
    index_.emplace(f.name, fields_.size());
    fields_.push_back(std::move(f));
}

const FieldDef* Schema::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second];
}

const FieldDef& Schema::at(const std::string& name) const {
    const FieldDef* f = find(name);
    if (!f) throw SddsError(ErrorKind::NotFound, "no field named '" + name + "'");
    return *f;
}

static std::vector<const FieldDef*> fields_of_kind(const std::vector<FieldDef>& fields, FieldKind k) {
    std::vector<const FieldDef*> out;
    for (const auto& f : fields) {
        if (f.kind == k) out.push_back(&f);
    }
    return out;
}

std::vector<const FieldDef*> Schema::parameters() const { return fields_of_kind(fields_, FieldKind::Parameter); }
std::vector<const FieldDef*> Schema::columns() const { return fields_of_kind(fields_, FieldKind::Column); }
std::vector<const FieldDef*> Schema::arrays() const { return fields_of_kind(fields_, FieldKind::Array); }

Endianness Schema::resolved_endianness(std::optional<Endianness> fallback) const {
    if (data.endianness) return *data.endianness;
    if (fallback) return *fallback;
    return native_endianness();
}

// ------------------------------
// Equality
// ------------------------------

bool operator==(const FieldDef& a, const FieldDef& b) {
    return a.kind == b.kind && a.name == b.name && a.type == b.type &&
           a.units == b.units && a.symbol == b.symbol && a.description == b.description &&
           a.format_string == b.format_string && a.fixed_value == b.fixed_value &&
           a.dimensions == b.dimensions && a.group_name == b.group_name &&
           a.field_length == b.field_length && a.extra == b.extra;
}

bool operator!=(const FieldDef& a, const FieldDef& b) { return !(a == b); }

bool operator==(const Schema& a, const Schema& b) {
    if (a.description.has_value() != b.description.has_value()) return false;
    if (a.description && (a.description->text != b.description->text ||
                          a.description->contents != b.description->contents)) {
        return false;
    }
    // Include offsets depend on layout; only the references matter.
    if (a.includes.size() != b.includes.size()) return false;
    for (std::size_t i = 0; i < a.includes.size(); ++i) {
        if (a.includes[i].filename != b.includes[i].filename) return false;
    }
    const DataSpec& x = a.data;
    const DataSpec& y = b.data;
    if (x.mode != y.mode || x.endianness != y.endianness || x.no_row_counts != y.no_row_counts ||
        x.additional_header_lines != y.additional_header_lines ||
        x.column_major_order != y.column_major_order || x.extra != y.extra) {
        return false;
    }
    return a.fields() == b.fields();
}

bool operator!=(const Schema& a, const Schema& b) { return !(a == b); }

bool operator==(const ArrayValue& a, const ArrayValue& b) {
    return a.dims == b.dims && a.values == b.values;
}

bool operator!=(const ArrayValue& a, const ArrayValue& b) { return !(a == b); }

bool operator==(const Page& a, const Page& b) {
    return a.row_count == b.row_count && a.parameters == b.parameters &&
           a.columns == b.columns && a.arrays == b.arrays;
}

bool operator!=(const Page& a, const Page& b) { return !(a == b); }

bool operator==(const Document& a, const Document& b) {
    return a.schema == b.schema && a.pages == b.pages;
}

bool operator!=(const Document& a, const Document& b) { return !(a == b); }

// ------------------------------
// Page accessors
// ------------------------------

const Value& Page::parameter(const std::string& name) const {
    auto it = parameters.find(name);
    if (it == parameters.end()) throw SddsError(ErrorKind::NotFound, "no parameter named '" + name + "'");
    return it->second;
}

const ValueVector& Page::column(const std::string& name) const {
    auto it = columns.find(name);
    if (it == columns.end()) throw SddsError(ErrorKind::NotFound, "no column named '" + name + "'");
    return it->second;
}

const ArrayValue& Page::array(const std::string& name) const {
    auto it = arrays.find(name);
    if (it == arrays.end()) throw SddsError(ErrorKind::NotFound, "no array named '" + name + "'");
    return it->second;
}

} // namespace sdds
