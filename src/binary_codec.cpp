#include "sdds_internal.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>
#include <type_traits>

namespace sdds::internal {

// ------------------------------
// Byte order helpers
// ------------------------------

template <typename U>
static U load_uint(const unsigned char* p, Endianness e) {
    U v = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        const std::size_t shift = e == Endianness::Little ? 8 * i : 8 * (sizeof(U) - 1 - i);
        v |= static_cast<U>(static_cast<U>(p[i]) << shift);
    }
    return v;
}

template <typename U>
static void store_uint(unsigned char* p, U v, Endianness e) {
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        const std::size_t shift = e == Endianness::Little ? 8 * i : 8 * (sizeof(U) - 1 - i);
        p[i] = static_cast<unsigned char>((v >> shift) & 0xFFu);
    }
}

template <typename T>
static T decode_scalar(const unsigned char* p, Endianness e) {
    if constexpr (std::is_same_v<T, double>) {
        std::uint64_t u = load_uint<std::uint64_t>(p, e);
        double d;
        std::memcpy(&d, &u, sizeof d);
        return d;
    } else if constexpr (std::is_same_v<T, float>) {
        std::uint32_t u = load_uint<std::uint32_t>(p, e);
        float f;
        std::memcpy(&f, &u, sizeof f);
        return f;
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return static_cast<std::int32_t>(load_uint<std::uint32_t>(p, e));
    } else if constexpr (std::is_same_v<T, std::int16_t>) {
        return static_cast<std::int16_t>(load_uint<std::uint16_t>(p, e));
    } else if constexpr (std::is_same_v<T, char>) {
        return static_cast<char>(p[0]);
    } else {
        static_assert(std::is_same_v<T, bool>, "unsupported fixed-width type");
        return load_uint<std::uint32_t>(p, e) != 0;
    }
}

template <typename T>
static constexpr std::size_t wire_width() {
    if constexpr (std::is_same_v<T, bool>) return 4;
    else return sizeof(T);
}

template <typename T>
static void append_scalar(std::string& out, const T& v, Endianness e) {
    if constexpr (std::is_same_v<T, std::string>) {
        if (v.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
            throw SddsError(ErrorKind::InvalidData, "string too long for binary encoding");
        }
        append_binary_i32(out, static_cast<std::int32_t>(v.size()), e);
        out += v;
    } else {
        std::array<unsigned char, 8> b{};
        if constexpr (std::is_same_v<T, double>) {
            std::uint64_t u;
            std::memcpy(&u, &v, sizeof u);
            store_uint(b.data(), u, e);
        } else if constexpr (std::is_same_v<T, float>) {
            std::uint32_t u;
            std::memcpy(&u, &v, sizeof u);
            store_uint(b.data(), u, e);
        } else if constexpr (std::is_same_v<T, std::int32_t>) {
            store_uint(b.data(), static_cast<std::uint32_t>(v), e);
        } else if constexpr (std::is_same_v<T, std::int16_t>) {
            store_uint(b.data(), static_cast<std::uint16_t>(v), e);
        } else if constexpr (std::is_same_v<T, char>) {
            b[0] = static_cast<unsigned char>(v);
        } else {
            store_uint(b.data(), static_cast<std::uint32_t>(v ? 1 : 0), e);
        }
        out.append(reinterpret_cast<const char*>(b.data()), wire_width<T>());
    }
}

// ------------------------------
// Reading
// ------------------------------

std::int32_t read_binary_i32(InputCursor& in, Endianness e) {
    std::array<unsigned char, 4> b{};
    in.read_exact(reinterpret_cast<char*>(b.data()), b.size());
    return decode_scalar<std::int32_t>(b.data(), e);
}

static std::string read_binary_string(InputCursor& in, Endianness e) {
    const std::uint64_t at = in.offset();
    std::int32_t len = read_binary_i32(in, e);
    if (len < 0) {
        throw SddsError(ErrorKind::InvalidData, "negative string length " + std::to_string(len), in.where(at));
    }
    // Grow in bounded steps; a corrupt length then fails as truncation, not as a huge allocation.
    std::string s;
    std::size_t remaining = static_cast<std::size_t>(len);
    while (remaining > 0) {
        const std::size_t n = std::min(remaining, kMaxReserve);
        const std::size_t old = s.size();
        s.resize(old + n);
        in.read_exact(&s[old], n);
        remaining -= n;
    }
    return s;
}

template <typename T>
static T read_scalar(InputCursor& in, Endianness e) {
    if constexpr (std::is_same_v<T, std::string>) {
        return read_binary_string(in, e);
    } else {
        std::array<unsigned char, 8> b{};
        in.read_exact(reinterpret_cast<char*>(b.data()), wire_width<T>());
        return decode_scalar<T>(b.data(), e);
    }
}

Value read_binary_value(InputCursor& in, ScalarType t, Endianness e) {
    switch (t) {
        case ScalarType::Double: return read_scalar<double>(in, e);
        case ScalarType::Float: return read_scalar<float>(in, e);
        case ScalarType::Long: return read_scalar<std::int32_t>(in, e);
        case ScalarType::Short: return read_scalar<std::int16_t>(in, e);
        case ScalarType::Character: return read_scalar<char>(in, e);
        case ScalarType::String: return read_scalar<std::string>(in, e);
        case ScalarType::Boolean: return read_scalar<bool>(in, e);
    }
    throw SddsError(ErrorKind::InvalidData, "invalid scalar type");
}

void read_binary_values(InputCursor& in, ValueVector& out, std::size_t n, Endianness e) {
    std::visit([&](auto& vec) {
        using T = typename std::decay_t<decltype(vec)>::value_type;
        vec.reserve(vec.size() + std::min(n, kMaxReserve));
        if constexpr (std::is_same_v<T, std::string>) {
            for (std::size_t i = 0; i < n; ++i) vec.push_back(read_binary_string(in, e));
        } else {
            // Fixed width: pull the bytes in blocks and decode in place.
            constexpr std::size_t w = wire_width<T>();
            std::vector<unsigned char> buf;
            std::size_t left = n;
            while (left > 0) {
                const std::size_t k = std::min(left, kMaxReserve);
                buf.resize(k * w);
                in.read_exact(reinterpret_cast<char*>(buf.data()), buf.size());
                for (std::size_t i = 0; i < k; ++i) vec.push_back(decode_scalar<T>(buf.data() + i * w, e));
                left -= k;
            }
        }
    }, out);
}

// ------------------------------
// Writing
// ------------------------------

void append_binary_i32(std::string& out, std::int32_t v, Endianness e) {
    append_scalar(out, v, e);
}

void append_binary_value(std::string& out, const Value& v, Endianness e) {
    std::visit([&](const auto& x) { append_scalar(out, x, e); }, v);
}

void append_binary_element(std::string& out, const ValueVector& v, std::size_t i, Endianness e) {
    std::visit([&](const auto& vec) {
        using T = typename std::decay_t<decltype(vec)>::value_type;
        append_scalar(out, static_cast<T>(vec[i]), e);
    }, v);
}

} // namespace sdds::internal
