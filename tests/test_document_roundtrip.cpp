#include "sdds/sdds.hpp"
#include "sdds/sdds_easy.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace sdds;

static Schema make_sample_schema(DataMode mode, Endianness e) {
    Schema s = easy::make_schema(mode, {
        easy::make_parameter("Step", ScalarType::Long),
        easy::make_parameter("Charge", ScalarType::Double, "C"),
        easy::make_parameter("Label", ScalarType::String),
        easy::make_fixed_parameter("Revision", ScalarType::String, "26104M"),
        easy::make_array("Matrix", ScalarType::Float, 2),
        easy::make_column("s", ScalarType::Double, "m"),
        easy::make_column("turn", ScalarType::Short),
        easy::make_column("plane", ScalarType::Character),
        easy::make_column("lost", ScalarType::Boolean),
        easy::make_column("ElementName", ScalarType::String),
        easy::make_column("betax", ScalarType::Float, "m"),
    }, e);
    s.description = Description{"round trip sample", "test data"};
    s.includes.push_back(IncludeRef{"common.sdds", 0});
    return s;
}

static Page make_sample_page(std::int32_t step, std::size_t rows) {
    Page p;
    easy::set(p, "Step", step);
    easy::set(p, "Charge", 1.5e-9 * step);
    easy::set(p, "Label", std::string(step % 2 ? "odd page" : "\"even\" page"));
    easy::set(p, "Revision", std::string("26104M"));
    easy::set_array(p, "Matrix", {2, 3}, std::vector<float>{1.0f, 0.5f, -2.0f, 0.0f, 3.25f, 1e-3f});

    std::vector<double> s;
    std::vector<std::int16_t> turn;
    std::vector<char> plane;
    std::vector<bool> lost;
    std::vector<std::string> names;
    std::vector<float> betax;
    for (std::size_t i = 0; i < rows; ++i) {
        s.push_back(0.1 * static_cast<double>(i) + step);
        turn.push_back(static_cast<std::int16_t>(i * 3));
        plane.push_back(i % 2 ? 'y' : 'x');
        lost.push_back(i % 3 == 0);
        names.push_back(i == 0 ? "" : "Q" + std::to_string(i) + (i % 2 ? " drift" : ""));
        betax.push_back(10.0f / static_cast<float>(i + 1));
    }
    easy::set_column(p, "s", s);
    easy::set_column(p, "turn", turn);
    easy::set_column(p, "plane", plane);
    easy::set_column(p, "lost", lost);
    easy::set_column(p, "ElementName", names);
    easy::set_column(p, "betax", betax);
    return p;
}

static Document make_sample_document(DataMode mode, Endianness e) {
    Document doc;
    doc.schema = make_sample_schema(mode, e);
    doc.pages.push_back(make_sample_page(1, 5));
    doc.pages.push_back(make_sample_page(2, 0));
    doc.pages.push_back(make_sample_page(3, 2));
    return doc;
}

static std::string file_bytes(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

int main() {
    const std::filesystem::path dir = std::filesystem::temp_directory_path();
    const std::filesystem::path plain = dir / "sdds_cpp_test.sdds";
    const std::filesystem::path gz = dir / "sdds_cpp_test.sdds.gz";
    std::filesystem::remove(plain);
    std::filesystem::remove(gz);

    try {
        // Every mode and byte order survives a round trip, and rewriting is stable
        for (DataMode mode : {DataMode::Ascii, DataMode::Binary}) {
            for (Endianness e : {Endianness::Little, Endianness::Big}) {
                const Document doc = make_sample_document(mode, e);
                std::ostringstream os;
                write_document(os, doc);

                std::istringstream is(os.str());
                const Document back = read_document(is);
                CHECK(back == doc);

                std::ostringstream again;
                write_document(again, back);
                CHECK(again.str() == os.str());
            }
        }

        // Column-major binary
        {
            Document doc = make_sample_document(DataMode::Binary, Endianness::Big);
            doc.schema.data.column_major_order = true;
            std::ostringstream os;
            write_document(os, doc);
            std::istringstream is(os.str());
            CHECK(read_document(is) == doc);
        }

        // Two pages, then end of data
        {
            Document doc;
            doc.schema = easy::make_schema(DataMode::Binary, {
                easy::make_parameter("p", ScalarType::Long),
                easy::make_column("c", ScalarType::Double),
            }, Endianness::Little);
            for (std::int32_t i : {1, 2}) {
                Page p;
                easy::set(p, "p", i);
                easy::set_column(p, "c", std::vector<double>{0.5 * i});
                doc.pages.push_back(p);
            }
            std::ostringstream os;
            write_document(os, doc);

            std::istringstream is(os.str());
            Reader r(is);
            CHECK(r.schema() == doc.schema);
            CHECK(r.data_offset() == render_header(doc.schema).size());
            auto p1 = r.read_page();
            auto p2 = r.read_page();
            CHECK(p1 && p1->parameter_as<std::int32_t>("p") == 1);
            CHECK(p2 && p2->parameter_as<std::int32_t>("p") == 2);
            CHECK(!r.read_page());
            CHECK(!r.read_page());
            CHECK(r.pages_read() == 2);

            r.rewind();
            CHECK(r.pages_read() == 0);
            auto again = r.read_page();
            CHECK(again && *again == *p1);
        }

        // Streaming writer
        {
            Schema s = easy::make_schema(DataMode::Ascii, {easy::make_column("x", ScalarType::Long)});
            std::ostringstream os;
            {
                Writer w(os, s);
                CHECK(os.str() == render_header(s));
                for (std::int32_t i = 0; i < 4; ++i) {
                    Page p;
                    easy::set_column(p, "x", std::vector<std::int32_t>{i, i + 1});
                    w.write_page(p);
                }
                CHECK(w.pages_written() == 4);

                Page bad;
                easy::set_column(bad, "y", std::vector<std::int32_t>{1});
                CHECK_THROWS_KIND(ErrorKind::InvalidData, w.write_page(bad));
                CHECK(w.pages_written() == 4);
                w.close();
                CHECK_THROWS_KIND(ErrorKind::Io, w.write_page(Page{}));
            }
            std::istringstream is(os.str());
            Document back = read_document(is);
            CHECK(back.pages.size() == 4);
            CHECK(back.pages[3].column_as<std::int32_t>("x")[1] == 4);

            Schema cm = s;
            cm.data.column_major_order = true;
            std::ostringstream unused;
            CHECK_THROWS_KIND(ErrorKind::Unsupported, Writer(unused, cm));
        }

        // Extra header lines are written and skipped
        {
            Document doc = make_sample_document(DataMode::Ascii, Endianness::Little);
            doc.schema.data.additional_header_lines = 2;
            std::ostringstream os;
            write_document(os, doc);
            CHECK(os.str().find("&end\n\n\n") != std::string::npos);
            std::istringstream is(os.str());
            Reader r(is);
            CHECK(r.data_offset() == render_header(doc.schema).size() + 2);
            std::istringstream whole(os.str());
            CHECK(read_document(whole) == doc);
        }

        // Binary data without row counts
        {
            Schema s = easy::make_schema(DataMode::Binary, {easy::make_column("v", ScalarType::Double)}, Endianness::Big);
            s.data.no_row_counts = true;
            std::ostringstream os;
            {
                Writer w(os, s);
                Page p;
                easy::set_column(p, "v", std::vector<double>{1, 2, 3});
                w.write_page(p);
                w.close();
            }
            std::istringstream is(os.str());
            Reader r(is);
            CHECK_THROWS_KIND(ErrorKind::RowCountRequired, r.read_page());

            std::istringstream is2(os.str());
            Reader r2(is2);
            auto p = r2.read_page(3);
            CHECK(p && p->row_count == 3);
            CHECK(!r2.read_page(3));
        }

        // Converting ragged ASCII pages without row counts to binary
        {
            Document doc;
            doc.schema = easy::make_schema(DataMode::Ascii, {
                easy::make_parameter("turn", ScalarType::Long),
                easy::make_column("x", ScalarType::Double),
            });
            doc.schema.data.no_row_counts = true;
            for (std::int32_t n : {3, 1, 2}) {
                Page p;
                easy::set(p, "turn", n);
                easy::set_column(p, "x", std::vector<double>(static_cast<std::size_t>(n), 0.25 * n));
                doc.pages.push_back(p);
            }

            Document bin;
            bin.schema = easy::converted_schema(doc.schema, DataMode::Binary, Endianness::Big);
            CHECK(!bin.schema.data.no_row_counts);
            CHECK(bin.schema.data.endianness == Endianness::Big);
            bin.pages = doc.pages;
            std::ostringstream os;
            write_document(os, bin);
            std::istringstream is(os.str());
            const Document back = read_document(is);
            CHECK(back.pages == doc.pages);

            Schema cm = bin.schema;
            cm.data.column_major_order = true;
            const Schema ascii = easy::converted_schema(cm, DataMode::Ascii);
            CHECK(!ascii.data.column_major_order);
            CHECK(!ascii.data.endianness);
            validate_schema(ascii);
        }

        // Plain file
        {
            const Document doc = make_sample_document(DataMode::Binary, Endianness::Little);
            write_document(plain, doc);
            CHECK(file_bytes(plain).rfind("SDDS1\n", 0) == 0);
            CHECK(read_document(plain) == doc);
        }

        // Gzip file chosen by extension, read back transparently
        {
            const Document doc = make_sample_document(DataMode::Ascii, Endianness::Little);
            write_document(gz, doc);
            const std::string raw = file_bytes(gz);
            CHECK(raw.size() > 2);
            CHECK(static_cast<unsigned char>(raw[0]) == 0x1f);
            CHECK(static_cast<unsigned char>(raw[1]) == 0x8b);
            CHECK(read_document(gz) == doc);

            Reader r = Reader::open(gz);
            auto first = r.read_page();
            while (r.read_page()) {
            }
            CHECK(r.pages_read() == 3);
            r.rewind();
            auto again = r.read_page();
            CHECK(first && again && *first == *again);

            WriteOptions never;
            never.compression = CompressionMode::Never;
            write_document(gz, doc, never);
            CHECK(file_bytes(gz).rfind("SDDS1\n", 0) == 0);
            CHECK(read_document(gz) == doc);

            WriteOptions bad_level;
            bad_level.compression = CompressionMode::Always;
            bad_level.zlib_level = 12;
            CHECK_THROWS_KIND(ErrorKind::InvalidData, write_document(plain, doc, bad_level));
        }

        // Missing file
        {
            CHECK_THROWS_KIND(ErrorKind::Io, read_document(dir / "sdds_cpp_test_missing.sdds"));
        }

        // Schemas the reader would reject are refused before anything is written
        {
            Document doc;
            doc.schema = easy::make_schema(DataMode::Ascii, {
                easy::make_fixed_parameter("x", ScalarType::Double, "abc"),
            });
            doc.pages.emplace_back();

            std::ostringstream os;
            auto err = capture_error([&]() { write_document(os, doc); });
            CHECK(err.kind() == ErrorKind::InvalidHeader);
            CHECK(err.location().field == "x");
            CHECK(os.str().empty());
            CHECK_THROWS_KIND(ErrorKind::InvalidHeader, validate_schema(doc.schema));

            const auto bad_file = dir / "sdds_cpp_test_bad_schema.sdds";
            std::filesystem::remove(bad_file);
            CHECK_THROWS_KIND(ErrorKind::InvalidHeader, write_document(bad_file, doc, WriteOptions{}));
            CHECK(!std::filesystem::exists(bad_file));

            doc.schema = easy::make_schema(DataMode::Ascii, {
                easy::make_fixed_parameter("x", ScalarType::Double, "2.5"),
            });
            write_document(os, doc);
            std::istringstream is(os.str());
            const Document back = read_document(is);
            CHECK(back.schema == doc.schema);
            CHECK(back.pages.size() == 1);
            CHECK(back.pages[0].parameter_as<double>("x") == 2.5);
        }

        // Truncated file
        {
            const Document doc = make_sample_document(DataMode::Binary, Endianness::Little);
            std::ostringstream os;
            write_document(os, doc);
            std::string text = os.str();
            text.resize(text.size() - 3);
            std::istringstream is(text);
            auto err = capture_error([&]() { (void)read_document(is); });
            CHECK(err.kind() == ErrorKind::TruncatedStream);
            CHECK(err.location().page && *err.location().page == 3);
        }
    } catch (const std::exception& e) {
        std::cerr << "Test failure: " << e.what() << "\n";
        std::filesystem::remove(plain);
        std::filesystem::remove(gz);
        return 1;
    }

    std::filesystem::remove(plain);
    std::filesystem::remove(gz);
    std::cout << "All tests passed.\n";
    return 0;
}
