#include "sdds_internal.hpp"

#include <cctype>
#include <charconv>
#include <sstream>

namespace sdds {

namespace internal {

// ------------------------------
// Input cursor
// ------------------------------

InputCursor::InputCursor(std::istream& is, std::uint64_t offset)
    : sb_(is.rdbuf()), offset_(offset) {
    if (!sb_) throw SddsError(ErrorKind::Io, "input stream has no buffer");
}

bool InputCursor::at_eof() {
    return sb_->sgetc() == std::char_traits<char>::eof();
}

bool InputCursor::read_line(std::string& line) {
    bool newline = false;
    return read_line(line, newline);
}

bool InputCursor::read_line(std::string& line, bool& newline) {
    using traits = std::char_traits<char>;
    line.clear();
    newline = false;
    bool any = false;
    int c;
    while ((c = sb_->sbumpc()) != traits::eof()) {
        any = true;
        ++offset_;
        if (c == '\n') {
            newline = true;
            return true;
        }
        line.push_back(static_cast<char>(c));
    }
    return any;
}

std::size_t InputCursor::read_some(char* dst, std::size_t n) {
    std::streamsize got = sb_->sgetn(dst, static_cast<std::streamsize>(n));
    if (got < 0) got = 0;
    offset_ += static_cast<std::uint64_t>(got);
    return static_cast<std::size_t>(got);
}

void InputCursor::read_exact(char* dst, std::size_t n) {
    const std::uint64_t start = offset_;
    std::size_t got = read_some(dst, n);
    if (got != n) {
        std::ostringstream oss;
        oss << "unexpected end of stream: needed " << n << " bytes, got " << got;
        throw SddsError(ErrorKind::TruncatedStream, oss.str(), where(start));
    }
}

ErrorLocation InputCursor::where() const {
    return where(offset_);
}

ErrorLocation InputCursor::where(std::uint64_t at) const {
    ErrorLocation loc;
    loc.offset = at;
    if (page != 0) loc.page = page;
    loc.field = field;
    return loc;
}

// ------------------------------
// Header parsing
// ------------------------------

static std::string lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

static bool parse_int(std::string_view s, long long& out) {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

static bool parse_flag(const std::string& s, bool& out) {
    long long v = 0;
    if (!parse_int(s, v)) return false;
    out = v != 0;
    return true;
}

static std::optional<Endianness> endianness_from_string(std::string_view s) {
    std::string t = lower(trim(s));
    if (t == "little-endian" || t == "little") return Endianness::Little;
    if (t == "big-endian" || t == "big") return Endianness::Big;
    return std::nullopt;
}

static void check_fixed_literal(const FieldDef& f, const ErrorLocation& loc) {
    if (f.kind != FieldKind::Parameter || !f.fixed_value) return;
    try {
        (void)parse_literal(*f.fixed_value, f.type, loc);
    } catch (const SddsError&) {
        throw SddsError(ErrorKind::InvalidHeader,
            "fixed_value '" + *f.fixed_value + "' is not a valid " + to_string(f.type), loc);
    }
}

static void check_data_spec(const DataSpec& d, const ErrorLocation& loc) {
    if (d.column_major_order && d.mode == DataMode::Ascii) {
        throw SddsError(ErrorKind::Unsupported, "column_major_order is only supported for binary data", loc);
    }
}

static FieldDef field_from_command(const NamelistCommand& cmd, FieldKind kind) {
    const ErrorLocation loc{cmd.offset, std::nullopt, {}};
    FieldDef f;
    f.kind = kind;
    const std::string* type_name = nullptr;
    for (const auto& [key, value] : cmd.fields) {
        if (key == "name") f.name = value;
        else if (key == "type") type_name = &value;
        else if (key == "units") f.units = value;
        else if (key == "symbol") f.symbol = value;
        else if (key == "description") f.description = value;
        else if (key == "format_string") f.format_string = value;
        else if (key == "fixed_value") f.fixed_value = value;
        else if (key == "field_length") {
            long long n = 0;
            if (!parse_int(value, n)) {
                throw SddsError(ErrorKind::InvalidHeader, "field_length is not an integer: '" + value + "'", loc);
            }
            f.field_length = static_cast<int>(n);
        } else if (kind == FieldKind::Array && key == "dimensions") {
            long long n = 0;
            if (!parse_int(value, n) || n < 1 || n > 64) {
                throw SddsError(ErrorKind::InvalidHeader, "array dimensions must be a positive integer, got '" + value + "'", loc);
            }
            f.dimensions = static_cast<int>(n);
        } else if (kind == FieldKind::Array && key == "group_name") {
            f.group_name = value;
        } else {
            f.extra.emplace_back(key, value);
        }
    }

    if (f.name.empty()) {
        throw SddsError(ErrorKind::MissingName, "&" + cmd.name + " without a name", loc);
    }
    ErrorLocation floc{cmd.offset, std::nullopt, f.name};
    if (!type_name) {
        throw SddsError(ErrorKind::MissingType, "&" + cmd.name + " '" + f.name + "' has no type", floc);
    }
    auto t = scalar_type_from_string(*type_name);
    if (!t) {
        throw SddsError(ErrorKind::UnknownType, "unknown type '" + *type_name + "'", floc);
    }
    f.type = *t;

    check_fixed_literal(f, floc);
    return f;
}

static DataSpec data_from_command(const NamelistCommand& cmd) {
    const ErrorLocation loc{cmd.offset, std::nullopt, {}};
    DataSpec d;
    bool have_mode = false;
    for (const auto& [key, value] : cmd.fields) {
        if (key == "mode") {
            std::string m = lower(trim(value));
            if (m == "ascii") d.mode = DataMode::Ascii;
            else if (m == "binary") d.mode = DataMode::Binary;
            else throw SddsError(ErrorKind::UnknownDataMode, "unknown data mode '" + value + "'", loc);
            have_mode = true;
        } else if (key == "no_row_counts") {
            if (!parse_flag(value, d.no_row_counts)) {
                throw SddsError(ErrorKind::InvalidHeader, "no_row_counts must be 0 or 1", loc);
            }
        } else if (key == "additional_header_lines") {
            long long n = 0;
            if (!parse_int(value, n) || n < 0) {
                throw SddsError(ErrorKind::InvalidHeader, "additional_header_lines must be a non-negative integer", loc);
            }
            d.additional_header_lines = static_cast<std::size_t>(n);
        } else if (key == "column_major_order") {
            if (!parse_flag(value, d.column_major_order)) {
                throw SddsError(ErrorKind::InvalidHeader, "column_major_order must be 0 or 1", loc);
            }
        } else if (key == "endian") {
            auto e = endianness_from_string(value);
            if (!e) throw SddsError(ErrorKind::InvalidHeader, "unknown endian '" + value + "'", loc);
            d.endianness = e;
        } else {
            d.extra.emplace_back(key, value);
        }
    }
    if (!have_mode) {
        throw SddsError(ErrorKind::UnknownDataMode, "&data without a mode", loc);
    }
    check_data_spec(d, loc);
    return d;
}

Schema read_header(InputCursor& in) {
    std::string line;
    if (!in.read_line(line) || trim(line) != "SDDS1") {
        throw SddsError(ErrorKind::UnsupportedVersion,
            "expected version line 'SDDS1', got '" + std::string(trim(line)) + "'",
            ErrorLocation{std::uint64_t{0}, std::nullopt, {}});
    }

    // Optional "!# little-endian" directive on the line right after the version.
    std::optional<Endianness> directive;
    std::optional<std::string> pushback;
    bool pushback_newline = false;
    std::uint64_t base = in.offset();
    if (in.read_line(line, pushback_newline)) {
        std::string_view t = trim(line);
        if (t.size() >= 2 && t.substr(0, 2) == "!#") {
            directive = endianness_from_string(t.substr(2));
            if (!directive) {
                throw SddsError(ErrorKind::InvalidHeader,
                    "unknown byte order directive '" + std::string(t) + "'",
                    ErrorLocation{base, std::nullopt, {}});
            }
            base = in.offset();
        } else {
            pushback = line;
        }
    }

    NamelistTokenizer tok(
        [&in, &pushback, pushback_newline](std::string& out, bool& newline) {
            if (pushback) {
                out = std::move(*pushback);
                pushback.reset();
                newline = pushback_newline;
                return true;
            }
            return in.read_line(out, newline);
        },
        base);

    Schema s;
    bool seen_field = false;
    bool seen_data = false;
    while (auto cmd = tok.next()) {
        const ErrorLocation loc{cmd->offset, std::nullopt, {}};
        if (cmd->name == "description") {
            if (s.description) {
                throw SddsError(ErrorKind::InvalidHeader, "&description given more than once", loc);
            }
            if (seen_field) {
                throw SddsError(ErrorKind::InvalidHeader, "&description must precede field definitions", loc);
            }
            Description d;
            if (const std::string* v = cmd->find("text")) d.text = *v;
            if (const std::string* v = cmd->find("contents")) d.contents = *v;
            s.description = std::move(d);
        } else if (cmd->name == "parameter" || cmd->name == "column" || cmd->name == "array") {
            FieldKind kind = cmd->name == "parameter" ? FieldKind::Parameter
                           : cmd->name == "column"    ? FieldKind::Column
                                                      : FieldKind::Array;
            FieldDef f = field_from_command(*cmd, kind);
            if (const FieldDef* prev = s.find(f.name)) {
                throw SddsError(ErrorKind::DuplicateFieldName,
                    "'" + f.name + "' declared as " + to_string(kind) + " is already declared as " + to_string(prev->kind),
                    ErrorLocation{cmd->offset, std::nullopt, f.name});
            }
            s.add_field(std::move(f));
            seen_field = true;
        } else if (cmd->name == "include") {
            const std::string* file = cmd->find("filename");
            if (!file || file->empty()) {
                throw SddsError(ErrorKind::InvalidHeader, "&include without a filename", loc);
            }
            s.includes.push_back(IncludeRef{*file, cmd->offset});
        } else if (cmd->name == "data") {
            s.data = data_from_command(*cmd);
            seen_data = true;
            break;
        } else {
            throw SddsError(ErrorKind::InvalidHeader, "unknown header command '&" + cmd->name + "'", loc);
        }
    }
    if (!seen_data) {
        throw SddsError(ErrorKind::MissingDataCommand, "end of input before &data",
            ErrorLocation{tok.consumed(), std::nullopt, {}});
    }

    if (directive) s.data.endianness = directive;

    for (std::size_t i = 0; i < s.data.additional_header_lines; ++i) {
        if (!in.read_line(line)) break;
    }
    return s;
}

} // namespace internal

Schema parse_header(std::string_view text) {
    std::istringstream iss{std::string(text)};
    internal::InputCursor in(iss, 0);
    return internal::read_header(in);
}

void validate_schema(const Schema& schema) {
    for (const FieldDef& f : schema.fields()) {
        const ErrorLocation loc{std::nullopt, std::nullopt, f.name};
        if (f.kind == FieldKind::Array && f.dimensions < 1) {
            throw SddsError(ErrorKind::InvalidHeader, "array dimensions must be at least 1", loc);
        }
        internal::check_fixed_literal(f, loc);
    }
    internal::check_data_spec(schema.data, ErrorLocation{});
}

// ------------------------------
// Header rendering
// ------------------------------

static bool needs_quotes(const std::string& v) {
    if (v.empty()) return true;
    for (char c : v) {
        switch (c) {
            case ' ': case '\t': case '\n': case '\r':
            case ',': case '"': case '&': case '!': case '\\':
                return true;
            default:
                break;
        }
    }
    return false;
}

static std::string header_value(const std::string& v) {
    if (!needs_quotes(v)) return v;
    std::string out;
    out.reserve(v.size() + 2);
    out.push_back('"');
    for (char c : v) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

static void put(std::string& out, const char* key, const std::string& value) {
    out += key;
    out += '=';
    out += header_value(value);
    out += ", ";
}

std::string render_header(const Schema& schema) {
    std::string out = "SDDS1\n";
    if (schema.data.endianness) {
        out += "!# " + to_string(*schema.data.endianness) + "\n";
    }
    if (schema.description) {
        out += "&description ";
        if (!schema.description->text.empty()) put(out, "text", schema.description->text);
        if (!schema.description->contents.empty()) put(out, "contents", schema.description->contents);
        out += "&end\n";
    }
    for (const auto& inc : schema.includes) {
        out += "&include ";
        put(out, "filename", inc.filename);
        out += "&end\n";
    }
    for (const auto& f : schema.fields()) {
        out += "&" + to_string(f.kind) + " ";
        put(out, "name", f.name);
        if (!f.symbol.empty()) put(out, "symbol", f.symbol);
        if (!f.units.empty()) put(out, "units", f.units);
        if (!f.description.empty()) put(out, "description", f.description);
        if (!f.format_string.empty()) put(out, "format_string", f.format_string);
        put(out, "type", to_string(f.type));
        if (f.fixed_value) put(out, "fixed_value", *f.fixed_value);
        if (f.kind == FieldKind::Array) {
            put(out, "dimensions", std::to_string(f.dimensions));
            if (!f.group_name.empty()) put(out, "group_name", f.group_name);
        }
        if (f.field_length) put(out, "field_length", std::to_string(*f.field_length));
        for (const auto& [key, value] : f.extra) put(out, key.c_str(), value);
        out += "&end\n";
    }

    const DataSpec& d = schema.data;
    out += "&data ";
    put(out, "mode", to_string(d.mode));
    if (d.no_row_counts) put(out, "no_row_counts", "1");
    if (d.additional_header_lines) put(out, "additional_header_lines", std::to_string(d.additional_header_lines));
    if (d.column_major_order) put(out, "column_major_order", "1");
    for (const auto& [key, value] : d.extra) put(out, key.c_str(), value);
    out += "&end\n";
    return out;
}

} // namespace sdds
