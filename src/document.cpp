#include "gzstream.hpp"
#include "sdds_internal.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <utility>

namespace sdds {

// ------------------------------
// Reader
// ------------------------------

Reader::Reader(std::istream& is, ReadOptions opts)
    : is_(&is), opts_(std::move(opts)) {
    init();
}

Reader::Reader(std::unique_ptr<GzFileBuf> buf, ReadOptions opts)
    : owned_buf_(std::move(buf)), opts_(std::move(opts)) {
    owned_stream_ = std::make_unique<std::istream>(owned_buf_.get());
    is_ = owned_stream_.get();
    init();
}

Reader Reader::open(const std::filesystem::path& file, ReadOptions opts) {
    return Reader(GzFileBuf::open(file, "rb"), std::move(opts));
}

Reader::Reader(Reader&&) noexcept = default;
Reader& Reader::operator=(Reader&&) noexcept = default;
Reader::~Reader() = default;

void Reader::init() {
    const auto pos = is_->tellg();
    stream_base_ = pos != std::istream::pos_type(-1) ? static_cast<std::uint64_t>(pos) : 0;
    internal::InputCursor in(*is_, 0);
    schema_ = internal::read_header(in);
    data_offset_ = in.offset();
    offset_ = data_offset_;
}

std::optional<Page> Reader::next(const ReadOptions& opts) {
    if (!is_) throw SddsError(ErrorKind::Io, "reader has no stream");
    internal::InputCursor in(*is_, offset_);
    std::optional<Page> page = internal::read_page_at(schema_, in, opts, pages_read_ + 1);
    offset_ = in.offset();
    if (page) ++pages_read_;
    return page;
}

std::optional<Page> Reader::read_page() {
    return next(opts_);
}

std::optional<Page> Reader::read_page(std::uint32_t row_count) {
    ReadOptions opts = opts_;
    opts.row_count = row_count;
    return next(opts);
}

void Reader::rewind() {
    if (!is_) throw SddsError(ErrorKind::Io, "reader has no stream");
    is_->clear();
    is_->seekg(static_cast<std::streamoff>(stream_base_ + data_offset_), std::ios::beg);
    if (!*is_) {
        is_->clear();
        throw SddsError(ErrorKind::Io, "cannot rewind: stream is not seekable");
    }
    offset_ = data_offset_;
    pages_read_ = 0;
}

// ------------------------------
// Writer
// ------------------------------

Writer::Writer(std::ostream& os, Schema schema)
    : os_(&os), schema_(std::move(schema)) {
    write_header();
}

Writer::Writer(std::unique_ptr<GzFileBuf> gz, std::unique_ptr<std::ostream> os, Schema schema)
    : owned_gz_(std::move(gz)), owned_stream_(std::move(os)), schema_(std::move(schema)) {
    os_ = owned_stream_.get();
    write_header();
}

Writer Writer::create(const std::filesystem::path& file, Schema schema, const WriteOptions& opts) {
    validate_schema(schema);
    const bool gzip = opts.compression == CompressionMode::Always ||
                      (opts.compression == CompressionMode::Auto && file.extension() == ".gz");
    if (gzip) {
        if (opts.zlib_level < 0 || opts.zlib_level > 9) {
            throw SddsError(ErrorKind::InvalidData, "zlib_level must be between 0 and 9");
        }
        const std::string mode = "wb" + std::to_string(opts.zlib_level);
        auto buf = GzFileBuf::open(file, mode.c_str());
        auto os = std::make_unique<std::ostream>(buf.get());
        return Writer(std::move(buf), std::move(os), std::move(schema));
    }

    auto os = std::make_unique<std::ofstream>(file, std::ios::binary | std::ios::trunc);
    if (!*os) {
        throw SddsError(ErrorKind::Io, "failed to open file for writing: " + file.string());
    }
    return Writer(nullptr, std::move(os), std::move(schema));
}

Writer::Writer(Writer&& other) noexcept
    : owned_gz_(std::move(other.owned_gz_)),
      owned_stream_(std::move(other.owned_stream_)),
      os_(std::exchange(other.os_, nullptr)),
      schema_(std::move(other.schema_)),
      pages_written_(other.pages_written_) {}

Writer& Writer::operator=(Writer&& other) noexcept {
    if (this != &other) {
        if (os_) os_->flush();
        owned_stream_ = std::move(other.owned_stream_);
        owned_gz_ = std::move(other.owned_gz_);
        os_ = std::exchange(other.os_, nullptr);
        schema_ = std::move(other.schema_);
        pages_written_ = other.pages_written_;
    }
    return *this;
}

Writer::~Writer() {
    // Failures here go unreported; call close() to observe them.
    if (os_) os_->flush();
}

void Writer::write_header() {
    validate_schema(schema_);
    std::string text = render_header(schema_);
    text.append(schema_.data.additional_header_lines, '\n');
    os_->write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!*os_) throw SddsError(ErrorKind::Io, "failed to write header");
}

void Writer::write_page(const Page& page) {
    if (!os_) throw SddsError(ErrorKind::Io, "writer is closed");
    sdds::write_page(schema_, page, *os_, pages_written_ + 1);
    ++pages_written_;
}

void Writer::close() {
    if (!os_) return;
    os_->flush();
    bool ok = static_cast<bool>(*os_);
    os_ = nullptr;
    if (auto* f = dynamic_cast<std::ofstream*>(owned_stream_.get())) {
        f->close();
        ok = ok && !f->fail();
    }
    owned_stream_.reset();
    if (owned_gz_) {
        auto gz = std::move(owned_gz_);
        gz->close();
    }
    if (!ok) throw SddsError(ErrorKind::Io, "failed to flush output");
}

// ------------------------------
// Whole documents
// ------------------------------

static Document collect(Reader& r) {
    Document doc;
    doc.schema = r.schema();
    while (auto page = r.read_page()) doc.pages.push_back(std::move(*page));
    return doc;
}

Document read_document(std::istream& is, const ReadOptions& opts) {
    Reader r(is, opts);
    return collect(r);
}

Document read_document(const std::filesystem::path& file, const ReadOptions& opts) {
    Reader r = Reader::open(file, opts);
    return collect(r);
}

void write_document(std::ostream& os, const Document& doc) {
    Writer w(os, doc.schema);
    for (const auto& page : doc.pages) w.write_page(page);
    w.close();
}

void write_document(const std::filesystem::path& file, const Document& doc, const WriteOptions& opts) {
    Writer w = Writer::create(file, doc.schema, opts);
    for (const auto& page : doc.pages) w.write_page(page);
    w.close();
}

} // namespace sdds
