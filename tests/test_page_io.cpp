#include "sdds/sdds.hpp"
#include "sdds/sdds_easy.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace sdds;

static Schema tracking_schema(DataMode mode) {
    return easy::make_schema(mode, {
        easy::make_fixed_parameter("SVNVersion", ScalarType::String, "26104M"),
        easy::make_parameter("Step", ScalarType::Long),
        easy::make_array("R", ScalarType::Double, 2),
        easy::make_column("s", ScalarType::Double, "m"),
        easy::make_column("ElementName", ScalarType::String),
    }, Endianness::Little);
}

static Page tracking_page() {
    Page p;
    easy::set(p, "Step", std::int32_t{1});
    easy::set_array(p, "R", {2, 2}, std::vector<double>{1, 0, 0, 1});
    easy::set_column(p, "s", std::vector<double>{0.0, 1.25});
    easy::set_column(p, "ElementName", std::vector<std::string>{"_BEG_", "Q1"});
    return p;
}

int main() {
    try {
        // Schema lookups
        {
            Schema s = tracking_schema(DataMode::Binary);
            CHECK(s.fields().size() == 5);
            CHECK(s.find("s") && s.find("s")->units == "m");
            CHECK(s.find("nope") == nullptr);
            CHECK_THROWS_KIND(ErrorKind::NotFound, s.at("nope"));
            CHECK(s.parameters().size() == 2);
            CHECK(s.arrays().size() == 1);
            CHECK(s.columns()[1]->name == "ElementName");
            CHECK_THROWS_KIND(ErrorKind::DuplicateFieldName, s.add_field(easy::make_column("Step", ScalarType::Long)));
            CHECK_THROWS_KIND(ErrorKind::MissingName, s.add_field(easy::make_column("", ScalarType::Long)));
            CHECK(s.fields().size() == 5);
        }

        // Page accessors
        {
            Page p = tracking_page();
            CHECK(p.parameter_as<std::int32_t>("Step") == 1);
            CHECK(p.column_as<std::string>("ElementName")[1] == "Q1");
            CHECK(p.array("R").dims.size() == 2);
            CHECK_THROWS_KIND(ErrorKind::NotFound, p.parameter("Pass"));
            CHECK_THROWS_KIND(ErrorKind::NotFound, p.column("x"));
            CHECK_THROWS_KIND(ErrorKind::NotFound, p.array("Q"));
            CHECK_THROWS_KIND(ErrorKind::TypeMismatch, p.parameter_as<double>("Step"));
            CHECK_THROWS_KIND(ErrorKind::TypeMismatch, p.column_as<float>("s"));
            CHECK(easy::as_double(p.parameter("Step")) == 1.0);
        }

        // Fixed parameters never appear in the data section
        for (DataMode mode : {DataMode::Binary, DataMode::Ascii}) {
            Schema s = tracking_schema(mode);
            const Page p = tracking_page();
            std::ostringstream os;
            write_page(s, p, os);
            CHECK(os.str().find("26104M") == std::string::npos);

            std::istringstream is(os.str());
            auto back = read_page(s, is);
            CHECK(back);
            CHECK(back->parameter_as<std::string>("SVNVersion") == "26104M");
            CHECK(back->parameter_as<std::int32_t>("Step") == 1);
            CHECK(back->columns == p.columns);
            CHECK(back->arrays == p.arrays);

            // A page may carry the fixed value itself
            Page with_fixed = p;
            easy::set(with_fixed, "SVNVersion", std::string("26104M"));
            std::ostringstream os2;
            write_page(s, with_fixed, os2);
            CHECK(os2.str() == os.str());

            // but not a different one
            Page other_fixed = p;
            easy::set(other_fixed, "SVNVersion", std::string("26105"));
            std::ostringstream os3;
            auto err = capture_error([&]() { write_page(s, other_fixed, os3, 2); });
            CHECK(err.kind() == ErrorKind::InvalidData);
            CHECK(err.location().field == "SVNVersion");
            CHECK(os3.str().empty());
        }

        // Numeric fixed values compare by value
        {
            Schema s = easy::make_schema(DataMode::Binary, {
                easy::make_fixed_parameter("rev", ScalarType::Long, "3"),
                easy::make_fixed_parameter("gap", ScalarType::Double, "nan"),
            }, Endianness::Big);
            Page p;
            easy::set(p, "rev", std::int32_t{3});
            easy::set(p, "gap", std::numeric_limits<double>::quiet_NaN());
            validate_page(s, p);
            easy::set(p, "rev", std::int32_t{99});
            CHECK_THROWS_KIND(ErrorKind::InvalidData, validate_page(s, p));
        }

        // Validation failures write nothing and name the field
        {
            Schema s = tracking_schema(DataMode::Binary);

            auto expect = [&](ErrorKind kind, const Page& p, const std::string& field) {
                std::ostringstream os;
                auto err = capture_error([&]() { write_page(s, p, os, 4); });
                CHECK(err.kind() == kind);
                CHECK(err.location().field == field);
                CHECK(err.location().page && *err.location().page == 4);
                CHECK(os.str().empty());
            };

            Page missing = tracking_page();
            missing.parameters.erase("Step");
            expect(ErrorKind::MissingValue, missing, "Step");

            Page no_col = tracking_page();
            no_col.columns.erase("s");
            expect(ErrorKind::MissingValue, no_col, "s");

            Page no_array = tracking_page();
            no_array.arrays.erase("R");
            expect(ErrorKind::MissingValue, no_array, "R");

            Page wrong_type = tracking_page();
            easy::set(wrong_type, "Step", 1.0);
            expect(ErrorKind::TypeMismatch, wrong_type, "Step");

            Page wrong_col = tracking_page();
            wrong_col.columns["s"] = ValueVector{std::vector<float>{0.0f, 1.0f}};
            expect(ErrorKind::TypeMismatch, wrong_col, "s");

            Page short_col = tracking_page();
            short_col.columns["s"] = ValueVector{std::vector<double>{0.0}};
            expect(ErrorKind::RowCountMismatch, short_col, "s");

            Page undeclared = tracking_page();
            easy::set(undeclared, "Pass", std::int32_t{0});
            expect(ErrorKind::InvalidData, undeclared, "Pass");

            Page bad_dims = tracking_page();
            bad_dims.arrays["R"].dims = {4};
            expect(ErrorKind::InvalidData, bad_dims, "R");

            Page bad_count = tracking_page();
            bad_count.arrays["R"].dims = {2, 3};
            expect(ErrorKind::InvalidData, bad_count, "R");

            Page fixed_mismatch = tracking_page();
            easy::set(fixed_mismatch, "SVNVersion", 3.0);
            expect(ErrorKind::TypeMismatch, fixed_mismatch, "SVNVersion");
        }

        // Rows without columns cannot be delimited in ASCII without row counts
        {
            Schema s = easy::make_schema(DataMode::Ascii, {easy::make_parameter("p", ScalarType::Short)});
            s.data.no_row_counts = true;
            Page p;
            easy::set(p, "p", std::int16_t{3});
            p.row_count = 2;
            CHECK_THROWS_KIND(ErrorKind::InvalidData, validate_page(s, p));
            p.row_count = 0;
            validate_page(s, p);

            Schema cols_only = easy::make_schema(DataMode::Ascii, {easy::make_column("c", ScalarType::Double)});
            cols_only.data.no_row_counts = true;
            Page empty;
            easy::set_column(empty, "c", std::vector<double>{});
            CHECK_THROWS_KIND(ErrorKind::InvalidData, validate_page(cols_only, empty));
            easy::set_column(empty, "c", std::vector<double>{1.0});
            validate_page(cols_only, empty);
        }

        // Values helpers
        {
            ValueVector v = make_vector(ScalarType::Boolean);
            push_back(v, Value{true});
            push_back(v, Value{false});
            CHECK(size_of(v) == 2);
            CHECK(type_of(v) == ScalarType::Boolean);
            CHECK(std::get<bool>(value_at(v, 0)));
            CHECK_THROWS_KIND(ErrorKind::TypeMismatch, push_back(v, Value{1.0}));
            CHECK_THROWS_KIND(ErrorKind::NotFound, value_at(v, 2));
            CHECK(binary_width(ScalarType::Boolean) == 4);
            CHECK(binary_width(ScalarType::String) == 0);
            CHECK(scalar_type_from_string("character") == ScalarType::Character);
            CHECK(!scalar_type_from_string("complex"));
        }

        std::cout << "All tests passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failure: " << e.what() << "\n";
        return 1;
    }
}
