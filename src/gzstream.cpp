#include "gzstream.hpp"

#include <cstdio>

namespace sdds {

static constexpr std::size_t kGzBufferSize = 64u * 1024u;

std::unique_ptr<GzFileBuf> GzFileBuf::open(const std::filesystem::path& file, const char* mode) {
    gzFile f = ::gzopen(file.string().c_str(), mode);
    if (!f) {
        throw SddsError(ErrorKind::Io, "failed to open file: " + file.string());
    }
    const bool writing = mode[0] == 'w' || mode[0] == 'a';
    return std::unique_ptr<GzFileBuf>(new GzFileBuf(f, writing));
}

GzFileBuf::GzFileBuf(gzFile f, bool writing)
    : file_(f), writing_(writing), buf_(kGzBufferSize) {
    if (writing_) {
        setp(buf_.data(), buf_.data() + buf_.size());
    } else {
        setg(buf_.data(), buf_.data(), buf_.data());
    }
}

GzFileBuf::~GzFileBuf() {
    // Errors on this path are only reported through close().
    if (writing_ && file_) flush_out();
}

std::string GzFileBuf::last_error() const {
    if (!file_) return "file is closed";
    int errnum = Z_OK;
    const char* msg = ::gzerror(file_.get(), &errnum);
    return msg ? msg : "unknown zlib error";
}

void GzFileBuf::close() {
    if (!file_) return;
    bool flushed = true;
    if (writing_) flushed = flush_out();
    const int rc = ::gzclose(file_.release());
    if (!flushed || rc != Z_OK) {
        throw SddsError(ErrorKind::ZlibError, "failed to finish gzip stream (gzclose returned " + std::to_string(rc) + ")");
    }
}

bool GzFileBuf::flush_out() {
    const std::ptrdiff_t n = pptr() - pbase();
    if (n <= 0) return true;
    if (!file_) return false;
    const int written = ::gzwrite(file_.get(), pbase(), static_cast<unsigned>(n));
    setp(buf_.data(), buf_.data() + buf_.size());
    return written == n;
}

GzFileBuf::int_type GzFileBuf::underflow() {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());
    if (writing_ || !file_) return traits_type::eof();
    const int n = ::gzread(file_.get(), buf_.data(), static_cast<unsigned>(buf_.size()));
    if (n < 0) {
        throw SddsError(ErrorKind::ZlibError, "gzip read failed: " + last_error());
    }
    if (n == 0) return traits_type::eof();
    setg(buf_.data(), buf_.data(), buf_.data() + n);
    return traits_type::to_int_type(*gptr());
}

GzFileBuf::int_type GzFileBuf::overflow(int_type ch) {
    if (!writing_) return traits_type::eof();
    if (!flush_out()) return traits_type::eof();
    if (!traits_type::eq_int_type(ch, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int GzFileBuf::sync() {
    if (!writing_) return 0;
    return flush_out() ? 0 : -1;
}

GzFileBuf::pos_type GzFileBuf::seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) {
    if (!file_) return pos_type(off_type(-1));
    const z_off_t here = ::gztell(file_.get());
    if (here < 0) return pos_type(off_type(-1));
    if (writing_) {
        // Output is append-only; only position queries are answered.
        if (dir != std::ios_base::cur || off != 0) return pos_type(off_type(-1));
        return pos_type(off_type(here) + (pptr() - pbase()));
    }
    const off_type current = off_type(here) - (egptr() - gptr());
    if (dir == std::ios_base::cur) {
        if (off == 0) return pos_type(current);
        return seekpos(pos_type(current + off), which);
    }
    if (dir == std::ios_base::beg) return seekpos(pos_type(off), which);
    return pos_type(off_type(-1));
}

GzFileBuf::pos_type GzFileBuf::seekpos(pos_type pos, std::ios_base::openmode) {
    if (!file_ || writing_) return pos_type(off_type(-1));
    const z_off_t r = ::gzseek(file_.get(), static_cast<z_off_t>(off_type(pos)), SEEK_SET);
    if (r < 0) return pos_type(off_type(-1));
    setg(buf_.data(), buf_.data(), buf_.data());
    return pos;
}

} // namespace sdds
