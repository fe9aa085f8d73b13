#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sdds {

// ------------------------------
// Error model
// ------------------------------

enum class ErrorKind {
    Io,
    MalformedNamelist,
    UnsupportedVersion,
    DuplicateFieldName,
    MissingName,
    MissingType,
    UnknownType,
    UnknownDataMode,
    MissingDataCommand,
    InvalidHeader,
    RowCountRequired,
    TruncatedStream,
    FieldCountMismatch,
    MissingValue,
    TypeMismatch,
    RowCountMismatch,
    InvalidData,
    NotFound,
    Unsupported,
    ZlibError,
};

std::string to_string(ErrorKind k);

// Where in the input (or in the page being written) an error was detected.
struct ErrorLocation {
    std::optional<std::uint64_t> offset{}; // byte offset from the start of the file
    std::optional<std::size_t> page{};     // 1-based page number
    std::string field{};
};

class SddsError : public std::runtime_error {
public:
    SddsError(ErrorKind k, const std::string& msg, ErrorLocation loc = ErrorLocation{});
    ErrorKind kind() const noexcept;
    const ErrorLocation& location() const noexcept;

private:
    ErrorKind kind_;
    ErrorLocation loc_;
};

// ------------------------------
// Scalar types and values
// ------------------------------

// Enumerator order matches the alternative order of Value and ValueVector.
enum class ScalarType {
    Double,
    Float,
    Long,
    Short,
    Character,
    String,
    Boolean,
};

std::string to_string(ScalarType t);
std::optional<ScalarType> scalar_type_from_string(const std::string& s);

/// On-wire width in bytes for binary mode; 0 for string (length-prefixed).
std::size_t binary_width(ScalarType t);

using Value = std::variant<double, float, std::int32_t, std::int16_t, char, std::string, bool>;

using ValueVector = std::variant<
    std::vector<double>,
    std::vector<float>,
    std::vector<std::int32_t>,
    std::vector<std::int16_t>,
    std::vector<char>,
    std::vector<std::string>,
    std::vector<bool>
>;

ScalarType type_of(const Value& v);
ScalarType type_of(const ValueVector& v);

ValueVector make_vector(ScalarType t);
std::size_t size_of(const ValueVector& v);
Value value_at(const ValueVector& v, std::size_t i);
// Throws TypeMismatch when the value's type differs from the vector's.
void push_back(ValueVector& v, const Value& x);

// ------------------------------
// Schema model
// ------------------------------

enum class FieldKind {
    Parameter,
    Column,
    Array,
};

std::string to_string(FieldKind k);

enum class DataMode {
    Ascii,
    Binary,
};

enum class Endianness {
    Little,
    Big,
};

std::string to_string(DataMode m);
std::string to_string(Endianness e);
Endianness native_endianness() noexcept;

// Header keys this library does not interpret, kept in declaration order.
using ExtraKeys = std::vector<std::pair<std::string, std::string>>;

struct FieldDef {
    FieldKind kind{FieldKind::Column};
    std::string name{};
    ScalarType type{ScalarType::Double};

    // Display hints, carried through verbatim.
    std::string units{};
    std::string symbol{};
    std::string description{};
    std::string format_string{};

    // Parameters with a fixed value are never transmitted in the data section.
    std::optional<std::string> fixed_value{};

    // Arrays only: number of dimensions. Sizes are stored per page.
    int dimensions{1};
    std::string group_name{};

    std::optional<int> field_length{};
    ExtraKeys extra{};
};

bool operator==(const FieldDef& a, const FieldDef& b);
bool operator!=(const FieldDef& a, const FieldDef& b);

struct Description {
    std::string text{};
    std::string contents{};
};

// An `&include` command. The library records it and never resolves it.
struct IncludeRef {
    std::string filename{};
    std::uint64_t offset{0};
};

struct DataSpec {
    DataMode mode{DataMode::Ascii};
    std::optional<Endianness> endianness{};
    bool no_row_counts{false};
    std::size_t additional_header_lines{0};
    bool column_major_order{false};
    ExtraKeys extra{};
};

class Schema {
public:
    std::optional<Description> description{};
    std::vector<IncludeRef> includes{};
    DataSpec data{};

    /// Append a field. Names share one namespace across all kinds.
    void add_field(FieldDef f);

    const std::vector<FieldDef>& fields() const noexcept { return fields_; }
    const FieldDef* find(const std::string& name) const;
    const FieldDef& at(const std::string& name) const;

    std::vector<const FieldDef*> parameters() const;
    std::vector<const FieldDef*> columns() const;
    std::vector<const FieldDef*> arrays() const;

    /// Binary byte order for this schema, falling back to `fallback` (native when unset).
    Endianness resolved_endianness(std::optional<Endianness> fallback = std::nullopt) const;

private:
    std::vector<FieldDef> fields_{};
    std::map<std::string, std::size_t> index_{};
};

bool operator==(const Schema& a, const Schema& b);
bool operator!=(const Schema& a, const Schema& b);

// ------------------------------
// Page and document model
// ------------------------------

struct ArrayValue {
    std::vector<std::int32_t> dims{};
    ValueVector values{};
};

bool operator==(const ArrayValue& a, const ArrayValue& b);
bool operator!=(const ArrayValue& a, const ArrayValue& b);

struct Page {
    std::map<std::string, Value> parameters{};
    std::size_t row_count{0};
    std::map<std::string, ValueVector> columns{};
    std::map<std::string, ArrayValue> arrays{};

    const Value& parameter(const std::string& name) const;
    const ValueVector& column(const std::string& name) const;
    const ArrayValue& array(const std::string& name) const;

    template <typename T>
    const T& parameter_as(const std::string& name) const {
        const Value& v = parameter(name);
        if (!std::holds_alternative<T>(v)) throw SddsError(ErrorKind::TypeMismatch, "parameter has another type", ErrorLocation{std::nullopt, std::nullopt, name});
        return std::get<T>(v);
    }

    template <typename T>
    const std::vector<T>& column_as(const std::string& name) const {
        const ValueVector& v = column(name);
        if (!std::holds_alternative<std::vector<T>>(v)) throw SddsError(ErrorKind::TypeMismatch, "column has another type", ErrorLocation{std::nullopt, std::nullopt, name});
        return std::get<std::vector<T>>(v);
    }
};

bool operator==(const Page& a, const Page& b);
bool operator!=(const Page& a, const Page& b);

struct Document {
    Schema schema{};
    std::vector<Page> pages{};
};

bool operator==(const Document& a, const Document& b);
bool operator!=(const Document& a, const Document& b);

// ------------------------------
// Options
// ------------------------------

struct ReadOptions {
    // Byte order for binary data when neither the header nor `&data` names one.
    std::optional<Endianness> default_endianness{};
    // Row count for every page when the stream carries none (`no_row_counts=1`, binary).
    std::optional<std::uint32_t> row_count{};
};

enum class CompressionMode {
    Never,
    Always,
    Auto, // gzip when the output path ends in ".gz"
};

struct WriteOptions {
    CompressionMode compression{CompressionMode::Auto};
    int zlib_level{6}; // 0..9
};

// ------------------------------
// Header API
// ------------------------------

/// Parse a complete header (version line through `&data`). Text after the
/// `&data` line is ignored.
Schema parse_header(std::string_view text);

/// Render the canonical header text for a schema, ending with the `&data` line.
std::string render_header(const Schema& schema);

/// Throws the error reading back `render_header(schema)` would raise, if any:
/// InvalidHeader for a fixed_value that does not parse as its type or an array
/// without dimensions, Unsupported for column_major_order in ASCII mode.
void validate_schema(const Schema& schema);

// ------------------------------
// Page API
// ------------------------------

/// Read one page from a stream positioned at a page boundary.
/// Returns std::nullopt when the stream ends exactly at that boundary.
std::optional<Page> read_page(const Schema& schema, std::istream& is, const ReadOptions& opts = ReadOptions{});

/// Validate and write one page. Nothing is written when validation fails.
void write_page(const Schema& schema, const Page& page, std::ostream& os, std::size_t page_number = 1);

/// Throws the error write_page would raise for this page, if any.
void validate_page(const Schema& schema, const Page& page, std::size_t page_number = 1);

// ------------------------------
// Streaming reader / writer
// ------------------------------

class GzFileBuf;

class Reader {
public:
    /// Read from a caller-owned stream. The header is parsed immediately.
    explicit Reader(std::istream& is, ReadOptions opts = ReadOptions{});

    /// Open a file; gzip-compressed files are decompressed transparently.
    static Reader open(const std::filesystem::path& file, ReadOptions opts = ReadOptions{});

    Reader(Reader&&) noexcept;
    Reader& operator=(Reader&&) noexcept;
    ~Reader();

    const Schema& schema() const noexcept { return schema_; }

    /// Next page, or std::nullopt at the end of the document.
    std::optional<Page> read_page();
    /// Next page with an explicit row count (for `no_row_counts` binary data).
    std::optional<Page> read_page(std::uint32_t row_count);

    std::size_t pages_read() const noexcept { return pages_read_; }
    std::uint64_t data_offset() const noexcept { return data_offset_; }

    /// Restart at page 1. Requires a seekable stream.
    void rewind();

private:
    Reader(std::unique_ptr<GzFileBuf> buf, ReadOptions opts);
    void init();
    std::optional<Page> next(const ReadOptions& opts);

    std::unique_ptr<GzFileBuf> owned_buf_{};
    std::unique_ptr<std::istream> owned_stream_{};
    std::istream* is_{nullptr};
    ReadOptions opts_{};
    Schema schema_{};
    std::uint64_t stream_base_{0};
    std::uint64_t data_offset_{0};
    std::uint64_t offset_{0};
    std::size_t pages_read_{0};
};

class Writer {
public:
    /// Write to a caller-owned stream. The header is written immediately.
    Writer(std::ostream& os, Schema schema);

    /// Create a file; see WriteOptions::compression.
    static Writer create(const std::filesystem::path& file, Schema schema, const WriteOptions& opts = WriteOptions{});

    Writer(Writer&&) noexcept;
    Writer& operator=(Writer&&) noexcept;
    ~Writer();

    const Schema& schema() const noexcept { return schema_; }

    void write_page(const Page& page);
    std::size_t pages_written() const noexcept { return pages_written_; }

    /// Flush and release the file. Called by the destructor if needed.
    void close();

private:
    Writer(std::unique_ptr<GzFileBuf> gz, std::unique_ptr<std::ostream> os, Schema schema);
    void write_header();

    std::unique_ptr<GzFileBuf> owned_gz_{};
    std::unique_ptr<std::ostream> owned_stream_{};
    std::ostream* os_{nullptr};
    Schema schema_{};
    std::size_t pages_written_{0};
};

// ------------------------------
// Document API
// ------------------------------

/// Read every page of a stream into memory.
Document read_document(std::istream& is, const ReadOptions& opts = ReadOptions{});
Document read_document(const std::filesystem::path& file, const ReadOptions& opts = ReadOptions{});

void write_document(std::ostream& os, const Document& doc);
void write_document(const std::filesystem::path& file, const Document& doc, const WriteOptions& opts = WriteOptions{});

} // namespace sdds
