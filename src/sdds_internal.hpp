#pragma once

#include "sdds/namelist.hpp"
#include "sdds/sdds.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdds::internal {

// Upper bound on elements pre-reserved from a count read off the wire.
static constexpr std::size_t kMaxReserve = 1u << 16;

// ------------------------------
// Input cursor
// ------------------------------

// Byte-counting reader over an istream's buffer. Errors raised through it
// carry the current offset plus the page/field it was told about.
class InputCursor {
public:
    InputCursor(std::istream& is, std::uint64_t offset);

    std::uint64_t offset() const noexcept { return offset_; }

    bool at_eof();
    // Reads through the next '\n' (not stored). False only when nothing is left.
    bool read_line(std::string& line);
    // As above; `newline` tells whether the line ended with '\n' or at end of input.
    bool read_line(std::string& line, bool& newline);
    std::size_t read_some(char* dst, std::size_t n);
    // Throws TruncatedStream when fewer than n bytes remain.
    void read_exact(char* dst, std::size_t n);

    ErrorLocation where() const;
    ErrorLocation where(std::uint64_t at) const;

    std::size_t page{0};
    std::string field{};

private:
    std::streambuf* sb_;
    std::uint64_t offset_;
};

// ------------------------------
// Header
// ------------------------------

// Reads the header from the cursor, leaving it at the first data byte.
Schema read_header(InputCursor& in);

// Parses a fixed_value literal (or any single ASCII token) as `t`.
Value parse_literal(const std::string& text, ScalarType t, const ErrorLocation& loc);

// ------------------------------
// Binary codec
// ------------------------------

std::int32_t read_binary_i32(InputCursor& in, Endianness e);
Value read_binary_value(InputCursor& in, ScalarType t, Endianness e);
// Appends `n` decoded elements to `out`.
void read_binary_values(InputCursor& in, ValueVector& out, std::size_t n, Endianness e);

void append_binary_i32(std::string& out, std::int32_t v, Endianness e);
void append_binary_value(std::string& out, const Value& v, Endianness e);
void append_binary_element(std::string& out, const ValueVector& v, std::size_t i, Endianness e);

// ------------------------------
// ASCII codec
// ------------------------------

bool is_blank(std::string_view line);
bool is_comment(std::string_view line);
std::string_view trim(std::string_view s);

// Splits a data line into whitespace separated tokens; quoted tokens are unescaped.
std::vector<std::string> split_tokens(std::string_view line, const ErrorLocation& loc);

Value parse_ascii_value(const std::string& token, ScalarType t, const ErrorLocation& loc);
void parse_ascii_into(ValueVector& out, const std::string& token, const ErrorLocation& loc);

// Quotes strings that would not survive split_tokens as a single token.
std::string quote_token(const std::string& s);

void append_ascii_value(std::string& out, const Value& v);
void append_ascii_element(std::string& out, const ValueVector& v, std::size_t i);

// ------------------------------
// Pages
// ------------------------------

std::optional<Page> read_page_at(
    const Schema& schema,
    InputCursor& in,
    const ReadOptions& opts,
    std::size_t page_number
);

// Encodes a validated page into `out`.
void encode_page(const Schema& schema, const Page& page, std::size_t page_number, std::string& out);

} // namespace sdds::internal
