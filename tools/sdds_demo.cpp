#include "sdds/sdds_easy.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>


// Twiss-like optics along a short FODO line.
static sdds::Page make_optics_page(std::int32_t step, std::size_t n) {
    using namespace sdds;

    std::vector<double> s(n);
    std::vector<double> betax(n);
    std::vector<std::string> names(n);
    for (std::size_t i = 0; i < n; ++i) {
        s[i] = 0.5 * static_cast<double>(i);
        betax[i] = 10.0 + 2.0 * std::sin(s[i]) * step;
        names[i] = (i % 2 ? "QD" : "QF") + std::to_string(i / 2 + 1);
    }

    Page p;
    easy::set(p, "Step", step);
    easy::set(p, "pCentral", 1956.9 * step);
    easy::set_array(p, "R", {2, 2}, std::vector<double>{1.0, 0.5 * step, 0.0, 1.0});
    easy::set_column(p, "s", s);
    easy::set_column(p, "betax", betax);
    easy::set_column(p, "ElementName", names);
    return p;
}

int main() {
    try {
        using namespace sdds;

        Document doc;
        doc.schema = easy::make_schema(DataMode::Binary, {
            easy::make_parameter("Step", ScalarType::Long),
            easy::make_parameter("pCentral", ScalarType::Double, "m$be$nc"),
            easy::make_fixed_parameter("SVNVersion", ScalarType::String, "26104M"),
            easy::make_array("R", ScalarType::Double, 2),
            easy::make_column("s", ScalarType::Double, "m"),
            easy::make_column("betax", ScalarType::Double, "m"),
            easy::make_column("ElementName", ScalarType::String),
        }, Endianness::Little);
        doc.schema.description = Description{"demo optics", "twiss output"};

        doc.pages.push_back(make_optics_page(1, 8));
        doc.pages.push_back(make_optics_page(2, 8));

        // Write
        WriteOptions wo;
        wo.compression = CompressionMode::Auto;
        wo.zlib_level = 6;

        std::string file = "demo_out.sdds.gz";
        write_document(file, doc, wo);

        std::cout << "Wrote: " << file << "\n";

        // Stream it back page by page
        Reader r = Reader::open(file);
        std::cout << "Schema: " << r.schema().parameters().size() << " parameters, "
                  << r.schema().columns().size() << " columns, mode=" << to_string(r.schema().data.mode) << "\n";
        while (auto page = r.read_page()) {
            const auto& betax = page->column_as<double>("betax");
            std::cout << "Page " << r.pages_read()
                      << ": Step=" << page->parameter_as<std::int32_t>("Step")
                      << " rows=" << page->row_count
                      << " betax[last]=" << betax.back()
                      << " SVNVersion=" << page->parameter_as<std::string>("SVNVersion")
                      << "\n";
        }

        // Same data as ASCII, to stdout
        doc.schema.data.mode = DataMode::Ascii;
        doc.schema.data.endianness.reset();
        doc.pages.resize(1);
        write_document(std::cout, doc);

        std::cout << "OK\n";
        return 0;

    } catch (const sdds::SddsError& e) {
        std::cerr << "SDDS error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
