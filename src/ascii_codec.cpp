#include "sdds_internal.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <limits>
#include <type_traits>

namespace sdds::internal {

// ------------------------------
// Line helpers
// ------------------------------

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_blank(std::string_view line) {
    return trim(line).empty();
}

bool is_comment(std::string_view line) {
    std::string_view t = trim(line);
    return !t.empty() && t.front() == '!';
}

std::vector<std::string> split_tokens(std::string_view line, const ErrorLocation& loc) {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) ++i;
        if (i >= line.size()) break;

        std::string tok;
        if (line[i] == '"') {
            ++i;
            bool closed = false;
            while (i < line.size()) {
                char c = line[i++];
                if (c == '"') {
                    closed = true;
                    break;
                }
                if (c == '\\' && i < line.size() && (line[i] == '"' || line[i] == '\\')) {
                    tok.push_back(line[i++]);
                    continue;
                }
                tok.push_back(c);
            }
            if (!closed) throw SddsError(ErrorKind::InvalidData, "unterminated quoted value", loc);
        } else {
            while (i < line.size() && !is_space(line[i])) tok.push_back(line[i++]);
        }
        out.push_back(std::move(tok));
    }
    return out;
}

// ------------------------------
// Parsing
// ------------------------------

template <typename T>
static bool parse_number(std::string_view s, T& out) {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

static SddsError bad_token(const std::string& token, ScalarType t, const ErrorLocation& loc) {
    return SddsError(ErrorKind::InvalidData, "cannot parse '" + token + "' as " + to_string(t), loc);
}

Value parse_ascii_value(const std::string& token, ScalarType t, const ErrorLocation& loc) {
    switch (t) {
        case ScalarType::Double: {
            double v = 0.0;
            if (!parse_number(token, v)) throw bad_token(token, t, loc);
            return v;
        }
        case ScalarType::Float: {
            float v = 0.0f;
            if (!parse_number(token, v)) throw bad_token(token, t, loc);
            return v;
        }
        case ScalarType::Long: {
            std::int32_t v = 0;
            if (!parse_number(token, v)) throw bad_token(token, t, loc);
            return v;
        }
        case ScalarType::Short: {
            std::int16_t v = 0;
            if (!parse_number(token, v)) throw bad_token(token, t, loc);
            return v;
        }
        case ScalarType::Character:
            if (token.size() != 1) throw bad_token(token, t, loc);
            return token[0];
        case ScalarType::String:
            return token;
        case ScalarType::Boolean: {
            std::string l;
            for (char c : token) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            if (l == "1" || l == "true") return true;
            if (l == "0" || l == "false") return false;
            throw bad_token(token, t, loc);
        }
    }
    throw bad_token(token, t, loc);
}

Value parse_literal(const std::string& text, ScalarType t, const ErrorLocation& loc) {
    if (t == ScalarType::String) return text;
    return parse_ascii_value(std::string(trim(text)), t, loc);
}

void parse_ascii_into(ValueVector& out, const std::string& token, const ErrorLocation& loc) {
    const ScalarType t = type_of(out);
    std::visit([&](auto& vec) {
        using T = typename std::decay_t<decltype(vec)>::value_type;
        vec.push_back(std::get<T>(parse_ascii_value(token, t, loc)));
    }, out);
}

// ------------------------------
// Formatting
// ------------------------------

std::string quote_token(const std::string& s) {
    bool quote = s.empty() || s.front() == '!';
    for (char c : s) {
        if (is_space(c) || c == '"' || c == '\\') {
            quote = true;
            break;
        }
    }
    if (!quote) return s;
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

template <typename T>
static void append_number(std::string& out, T v) {
    std::array<char, 64> buf{};
    auto res = std::to_chars(buf.data(), buf.data() + buf.size(), v);
    if (res.ec != std::errc()) {
        throw SddsError(ErrorKind::InvalidData, "number formatting failed");
    }
    out.append(buf.data(), res.ptr);
}

template <typename T>
static void append_ascii(std::string& out, const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        out.push_back(v ? '1' : '0');
    } else if constexpr (std::is_same_v<T, char>) {
        append_ascii(out, std::string(1, v));
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (v.find('\n') != std::string::npos) {
            throw SddsError(ErrorKind::InvalidData, "ASCII data cannot hold a line break inside a value");
        }
        out += quote_token(v);
    } else {
        append_number(out, v);
    }
}

void append_ascii_value(std::string& out, const Value& v) {
    std::visit([&out](const auto& x) { append_ascii(out, x); }, v);
}

void append_ascii_element(std::string& out, const ValueVector& v, std::size_t i) {
    std::visit([&out, i](const auto& vec) {
        using T = typename std::decay_t<decltype(vec)>::value_type;
        append_ascii(out, static_cast<T>(vec[i]));
    }, v);
}

} // namespace sdds::internal
