#include "sdds/sdds.hpp"
#include "sdds/sdds_easy.hpp"
#include "sdds_internal.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace sdds;
using internal::InputCursor;

static std::string bytes(std::initializer_list<int> b) {
    std::string out;
    for (int x : b) out.push_back(static_cast<char>(x));
    return out;
}

static Value decode_one(const std::string& data, ScalarType t, Endianness e) {
    std::istringstream is(data);
    InputCursor in(is, 0);
    return internal::read_binary_value(in, t, e);
}

int main() {
    try {
        // Scalar encodings in both byte orders
        {
            std::string out;
            internal::append_binary_value(out, Value{std::int32_t{1}}, Endianness::Big);
            CHECK(out == bytes({0, 0, 0, 1}));

            out.clear();
            internal::append_binary_value(out, Value{std::int16_t{-2}}, Endianness::Little);
            CHECK(out == bytes({0xFE, 0xFF}));

            out.clear();
            internal::append_binary_value(out, Value{1.0}, Endianness::Big);
            CHECK(out == bytes({0x3F, 0xF0, 0, 0, 0, 0, 0, 0}));

            out.clear();
            internal::append_binary_value(out, Value{1.0f}, Endianness::Little);
            CHECK(out == bytes({0, 0, 0x80, 0x3F}));

            out.clear();
            internal::append_binary_value(out, Value{true}, Endianness::Little);
            CHECK(out == bytes({1, 0, 0, 0}));

            out.clear();
            internal::append_binary_value(out, Value{'x'}, Endianness::Big);
            CHECK(out == "x");

            CHECK(std::get<double>(decode_one(bytes({0x3F, 0xF0, 0, 0, 0, 0, 0, 0}), ScalarType::Double, Endianness::Big)) == 1.0);
            CHECK(std::get<double>(decode_one(bytes({0, 0, 0, 0, 0, 0, 0xF0, 0x3F}), ScalarType::Double, Endianness::Little)) == 1.0);
            CHECK(std::get<std::int32_t>(decode_one(bytes({0xFF, 0xFF, 0xFF, 0xFE}), ScalarType::Long, Endianness::Big)) == -2);
            CHECK(std::get<std::int16_t>(decode_one(bytes({0x01, 0x02}), ScalarType::Short, Endianness::Little)) == 0x0201);
        }

        // Any nonzero boolean reads as true
        {
            CHECK(std::get<bool>(decode_one(bytes({5, 0, 0, 0}), ScalarType::Boolean, Endianness::Little)));
            CHECK(!std::get<bool>(decode_one(bytes({0, 0, 0, 0}), ScalarType::Boolean, Endianness::Little)));
        }

        // Length-prefixed strings
        {
            std::string out;
            internal::append_binary_value(out, Value{std::string("abc")}, Endianness::Little);
            CHECK(out == bytes({3, 0, 0, 0, 'a', 'b', 'c'}));
            CHECK(std::get<std::string>(decode_one(out, ScalarType::String, Endianness::Little)) == "abc");

            out.clear();
            internal::append_binary_value(out, Value{std::string()}, Endianness::Big);
            CHECK(out == bytes({0, 0, 0, 0}));

            CHECK_THROWS_KIND(ErrorKind::InvalidData,
                decode_one(bytes({0xFF, 0xFF, 0xFF, 0xFF}), ScalarType::String, Endianness::Little));
            // A corrupt length far beyond the input fails as truncation.
            CHECK_THROWS_KIND(ErrorKind::TruncatedStream,
                decode_one(bytes({0xFF, 0xFF, 0xFF, 0x7F, 'a', 'b'}), ScalarType::String, Endianness::Little));
        }

        // Truncated fixed-width value reports the offset where it started
        {
            std::istringstream is(bytes({1, 2, 3, 4, 5}));
            InputCursor in(is, 10);
            (void)internal::read_binary_i32(in, Endianness::Little);
            auto err = capture_error([&]() { (void)internal::read_binary_i32(in, Endianness::Little); });
            CHECK(err.kind() == ErrorKind::TruncatedStream);
            CHECK(err.location().offset && *err.location().offset == 14);
        }

        // Bulk decode of a typed sequence
        {
            std::string data;
            for (std::int32_t v : {7, -8, 9}) internal::append_binary_i32(data, v, Endianness::Big);
            std::istringstream is(data);
            InputCursor in(is, 0);
            ValueVector vec = make_vector(ScalarType::Long);
            internal::read_binary_values(in, vec, 3, Endianness::Big);
            CHECK((std::get<std::vector<std::int32_t>>(vec) == std::vector<std::int32_t>{7, -8, 9}));
            CHECK(in.at_eof());
        }

        // A one-row binary page holding a string column
        {
            Schema s = easy::make_schema(DataMode::Binary,
                {easy::make_column("name", ScalarType::String)}, Endianness::Little);
            Page p;
            easy::set_column(p, "name", std::vector<std::string>{"abc"});
            std::ostringstream os;
            write_page(s, p, os);
            CHECK(os.str() == bytes({1, 0, 0, 0, 3, 0, 0, 0, 'a', 'b', 'c'}));

            std::istringstream is(os.str());
            auto back = read_page(s, is);
            CHECK(back && *back == p);
            CHECK(!read_page(s, is));
        }

        // Page layout: row count, parameters, arrays, then rows
        {
            Schema s = easy::make_schema(DataMode::Binary, {
                easy::make_parameter("n", ScalarType::Short),
                easy::make_array("a", ScalarType::Character),
                easy::make_column("x", ScalarType::Short),
                easy::make_column("y", ScalarType::Character),
            }, Endianness::Big);
            Page p;
            easy::set(p, "n", std::int16_t{5});
            easy::set_array(p, "a", {2}, std::vector<char>{'p', 'q'});
            easy::set_column(p, "x", std::vector<std::int16_t>{1, 2});
            easy::set_column(p, "y", std::vector<char>{'u', 'v'});
            std::ostringstream os;
            write_page(s, p, os);
            CHECK(os.str() == bytes({0, 0, 0, 2, 0, 5, 0, 0, 0, 2, 'p', 'q', 0, 1, 'u', 0, 2, 'v'}));

            s.data.column_major_order = true;
            std::ostringstream cm;
            write_page(s, p, cm);
            CHECK(cm.str() == bytes({0, 0, 0, 2, 0, 5, 0, 0, 0, 2, 'p', 'q', 0, 1, 0, 2, 'u', 'v'}));
            std::istringstream is(cm.str());
            auto back = read_page(s, is);
            CHECK(back && *back == p);
        }

        // Truncated page and clean end of data
        {
            Schema s = easy::make_schema(DataMode::Binary, {easy::make_column("x", ScalarType::Double)}, Endianness::Little);
            std::istringstream empty("");
            CHECK(!read_page(s, empty));

            std::string data;
            internal::append_binary_i32(data, 2, Endianness::Little);
            internal::append_binary_value(data, Value{1.5}, Endianness::Little);
            std::istringstream is(data);
            auto err = capture_error([&]() { (void)read_page(s, is); });
            CHECK(err.kind() == ErrorKind::TruncatedStream);
            CHECK(err.location().page && *err.location().page == 1);
            CHECK(err.location().field == "x");

            std::string neg;
            internal::append_binary_i32(neg, -1, Endianness::Little);
            std::istringstream nis(neg);
            CHECK_THROWS_KIND(ErrorKind::InvalidData, read_page(s, nis));
        }

        // Implicit row counts need the caller's count
        {
            Schema s = easy::make_schema(DataMode::Binary, {easy::make_column("x", ScalarType::Long)}, Endianness::Little);
            s.data.no_row_counts = true;
            Page p;
            easy::set_column(p, "x", std::vector<std::int32_t>{4, 5});
            std::ostringstream os;
            write_page(s, p, os);
            CHECK(os.str().size() == 8);

            std::istringstream is(os.str());
            CHECK_THROWS_KIND(ErrorKind::RowCountRequired, read_page(s, is));

            std::istringstream is2(os.str());
            ReadOptions ro;
            ro.row_count = 2;
            auto back = read_page(s, is2, ro);
            CHECK(back && *back == p);
        }

        // Unset byte order falls back to the reader's default
        {
            Schema s = easy::make_schema(DataMode::Binary, {easy::make_parameter("v", ScalarType::Long)});
            std::istringstream is(bytes({0, 0, 0, 0, 0, 0, 1, 0}));
            ReadOptions ro;
            ro.default_endianness = Endianness::Big;
            auto p = read_page(s, is, ro);
            CHECK(p && p->parameter_as<std::int32_t>("v") == 256);
        }

        std::cout << "All tests passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failure: " << e.what() << "\n";
        return 1;
    }
}
