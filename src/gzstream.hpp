#pragma once

#include "sdds/sdds.hpp"

#include <filesystem>
#include <memory>
#include <streambuf>
#include <vector>

#include <zlib.h>

namespace sdds {

struct GzClose {
    void operator()(gzFile_s* f) const noexcept {
        if (f) ::gzclose(f);
    }
};

// std::streambuf over a zlib gzFile. Read mode handles plain and gzip files alike.
class GzFileBuf : public std::streambuf {
public:
    /// `mode` is a gzopen mode string ("rb", "wb6", ...). Throws Io when the file cannot be opened.
    static std::unique_ptr<GzFileBuf> open(const std::filesystem::path& file, const char* mode);

    ~GzFileBuf() override;

    GzFileBuf(const GzFileBuf&) = delete;
    GzFileBuf& operator=(const GzFileBuf&) = delete;

    // Flush pending output and close the file. Throws ZlibError on failure.
    void close();

    bool writing() const noexcept { return writing_; }

protected:
    int_type underflow() override;
    int_type overflow(int_type ch) override;
    int sync() override;
    pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override;
    pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

private:
    GzFileBuf(gzFile f, bool writing);
    bool flush_out();
    std::string last_error() const;

    std::unique_ptr<gzFile_s, GzClose> file_;
    bool writing_;
    std::vector<char> buf_;
};

} // namespace sdds
