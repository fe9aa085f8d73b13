#include "sdds/sdds.hpp"
#include "sdds/sdds_easy.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <locale>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static void usage() {
    std::cerr <<
        "sdds_cli (C++) - SDDS file inspector and converter\n"
        "\n"
        "Usage:\n"
        "  sdds_cli header  <FILE> [--raw] [--no-color]\n"
        "  sdds_cli tree    <FILE> [--details] [--no-color]\n"
        "  sdds_cli pages   <FILE> [--row-count N] [--no-color]\n"
        "  sdds_cli show    <FILE> [--page N] [--rows N] [--row-count N]\n"
        "  sdds_cli convert <IN> <OUT> [--ascii|--binary] [--little-endian|--big-endian] [--gzip] [--row-count N]\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string out;
    bool raw{false};
    bool details{false};
    bool no_color{false};
    bool gzip{false};
    std::optional<sdds::DataMode> mode;
    std::optional<sdds::Endianness> endianness;
    std::optional<std::uint32_t> row_count;
    std::size_t page{1};
    std::size_t rows{20};
};

template <typename T>
static bool parse_number(const char* s, T& out) {
    const char* end = s + std::char_traits<char>::length(s);
    auto [p, ec] = std::from_chars(s, end, out);
    return ec == std::errc() && p == end;
}

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    if (a.cmd == "convert") {
        if (i >= argc || std::string(argv[i]).rfind("--", 0) == 0) {
            std::cerr << "convert needs an output file\n";
            return false;
        }
        a.out = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--raw") a.raw = true;
        else if (opt == "--details") a.details = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--gzip") a.gzip = true;
        else if (opt == "--ascii") a.mode = sdds::DataMode::Ascii;
        else if (opt == "--binary") a.mode = sdds::DataMode::Binary;
        else if (opt == "--little-endian") a.endianness = sdds::Endianness::Little;
        else if (opt == "--big-endian") a.endianness = sdds::Endianness::Big;
        else if (opt == "--row-count" && i < argc) {
            std::uint32_t n = 0;
            if (!parse_number(argv[i++], n)) {
                std::cerr << "Invalid row count: " << argv[i - 1] << "\n";
                return false;
            }
            a.row_count = n;
        } else if ((opt == "--page" || opt == "--rows") && i < argc) {
            std::size_t n = 0;
            if (!parse_number(argv[i++], n) || n == 0) {
                std::cerr << "Invalid value for " << opt << ": " << argv[i - 1] << "\n";
                return false;
            }
            (opt == "--page" ? a.page : a.rows) = n;
        } else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "header" && a.cmd != "tree" && a.cmd != "pages" && a.cmd != "show" && a.cmd != "convert") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

static sdds::ReadOptions read_options(const Args& a) {
    sdds::ReadOptions ro;
    ro.row_count = a.row_count;
    return ro;
}

// ----------------- Value formatting -----------------

static std::string fmt_value(const sdds::Value& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    std::visit([&](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) oss << '"' << x << '"';
        else if constexpr (std::is_same_v<T, bool>) oss << (x ? "true" : "false");
        else if constexpr (std::is_same_v<T, char>) oss << '\'' << x << '\'';
        else if constexpr (std::is_same_v<T, std::int16_t>) oss << static_cast<int>(x);
        else oss << x;
    }, v);
    return oss.str();
}

static std::string fmt_dims(const std::vector<std::int32_t>& dims) {
    if (dims.empty()) return "[?]";
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < dims.size(); ++i) {
        if (i) oss << " x ";
        oss << dims[i];
    }
    oss << ']';
    return oss.str();
}

static std::string fmt_endianness(const sdds::Schema& s) {
    if (!s.data.endianness) return "unspecified";
    return sdds::to_string(*s.data.endianness);
}

// ----------------- Field tree -----------------

struct FieldGroup {
    std::string name;
    std::vector<const sdds::FieldDef*> fields;
};

static std::vector<FieldGroup> group_fields(const sdds::Schema& s) {
    std::vector<FieldGroup> out;
    if (auto p = s.parameters(); !p.empty()) out.push_back({"parameters", std::move(p)});
    if (auto a = s.arrays(); !a.empty()) out.push_back({"arrays", std::move(a)});
    if (auto c = s.columns(); !c.empty()) out.push_back({"columns", std::move(c)});
    return out;
}

static void print_field_details(const sdds::FieldDef& f, const Ansi& ansi) {
    std::cout << " " << ansi.dim();
    if (!f.units.empty()) std::cout << " units=" << f.units;
    if (!f.symbol.empty()) std::cout << " symbol=" << f.symbol;
    if (!f.format_string.empty()) std::cout << " format=" << f.format_string;
    if (f.kind == sdds::FieldKind::Array) std::cout << " dimensions=" << f.dimensions;
    if (!f.group_name.empty()) std::cout << " group=" << f.group_name;
    if (f.fixed_value) std::cout << " fixed_value=" << *f.fixed_value;
    for (const auto& kv : f.extra) std::cout << " " << kv.first << "=" << kv.second;
    std::cout << ansi.reset();
    if (!f.description.empty()) std::cout << " " << ansi.gray() << "\"" << f.description << "\"" << ansi.reset();
}

static void print_tree(const sdds::Schema& s, const Ansi& ansi, bool details) {
    for (const auto& g : group_fields(s)) {
        std::cout << ansi.magenta() << g.name << "/" << ansi.reset() << "\n";
        for (const sdds::FieldDef* f : g.fields) {
            std::cout << "  " << ansi.cyan() << f->name << ansi.reset()
                      << " " << ansi.yellow() << sdds::to_string(f->type) << ansi.reset();
            if (details) print_field_details(*f, ansi);
            std::cout << "\n";
        }
    }
}

// ----------------- Interactive browser (FTXUI) -----------------

struct UiRow {
    const FieldGroup* group{nullptr};
    const sdds::FieldDef* field{nullptr};
};

static std::vector<UiRow> flatten_rows(const std::vector<FieldGroup>& groups, const std::set<std::string>& collapsed) {
    std::vector<UiRow> out;
    for (const auto& g : groups) {
        out.push_back(UiRow{&g, nullptr});
        if (collapsed.count(g.name)) continue;
        for (const sdds::FieldDef* f : g.fields) out.push_back(UiRow{&g, f});
    }
    return out;
}

static std::string preview_text(const sdds::FieldDef& f, const sdds::Page* page, std::size_t max_rows) {
    std::ostringstream oss;
    oss << sdds::to_string(f.kind) << ":\n";
    oss << "  type=" << sdds::to_string(f.type) << "\n";
    if (!page) {
        oss << "  (no page data)\n";
        return oss.str();
    }

    auto list = [&](const sdds::ValueVector& v) {
        const std::size_t n = sdds::size_of(v);
        const std::size_t show = std::min(max_rows, n);
        oss << "preview:\n";
        for (std::size_t i = 0; i < show; ++i) {
            oss << "  [" << i << "] " << fmt_value(sdds::value_at(v, i)) << "\n";
        }
        if (show < n) oss << "  ... " << (n - show) << " more\n";
    };

    switch (f.kind) {
        case sdds::FieldKind::Parameter: {
            auto it = page->parameters.find(f.name);
            if (it == page->parameters.end()) {
                oss << "  value=<missing>\n";
            } else {
                oss << "  value=" << fmt_value(it->second) << "\n";
            }
            break;
        }
        case sdds::FieldKind::Column: {
            auto it = page->columns.find(f.name);
            oss << "  rows=" << page->row_count << "\n";
            if (it != page->columns.end()) list(it->second);
            break;
        }
        case sdds::FieldKind::Array: {
            auto it = page->arrays.find(f.name);
            if (it == page->arrays.end()) break;
            oss << "  dims=" << fmt_dims(it->second.dims) << "\n";
            oss << "  numel=" << sdds::size_of(it->second.values) << "\n";
            list(it->second.values);
            break;
        }
    }
    return oss.str();
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());
    for (const auto& line : lines) {
        // Section headers like "column:" / "preview:"
        if (!line.empty() && line.back() == ':' && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }
        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);
            auto eq = rest.find('=');
            if (eq != std::string::npos && rest.front() != '[') {
                els.push_back(hbox({
                    text("  "),
                    text(rest.substr(0, eq)) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(rest.substr(eq + 1)) | color(Color::GrayLight) | flex,
                }));
                continue;
            }
            auto close = rest.find("] ");
            if (!rest.empty() && rest.front() == '[' && close != std::string::npos) {
                els.push_back(hbox({
                    text("  "),
                    text(rest.substr(0, close + 1)) | color(Color::GrayDark),
                    text(rest.substr(close + 1)) | color(Color::Green),
                }));
                continue;
            }
        }
        els.push_back(text(line) | color(Color::White));
    }
    return vbox(std::move(els));
}

static int run_show(const Args& a) {
    using namespace ftxui;

    const sdds::Document doc = sdds::read_document(std::filesystem::path(a.file), read_options(a));
    const std::vector<FieldGroup> groups = group_fields(doc.schema);

    std::size_t page_index = std::min(a.page, std::max<std::size_t>(doc.pages.size(), 1)) - 1;
    std::set<std::string> collapsed;
    int selected = 0;
    int left_scroll = 0;
    std::vector<UiRow> rows = flatten_rows(groups, collapsed);

    auto current_page = [&]() -> const sdds::Page* {
        return page_index < doc.pages.size() ? &doc.pages[page_index] : nullptr;
    };
    auto clamp_selected = [&]() {
        rows = flatten_rows(groups, collapsed);
        if (rows.empty()) selected = 0;
        else selected = std::max(0, std::min(selected, static_cast<int>(rows.size()) - 1));
    };

    auto left_pane = Renderer([&] {
        clamp_selected();
        auto dim = Terminal::Size();
        const int visible_rows = std::max(3, std::max(10, dim.dimy) - 6);
        const int total = static_cast<int>(rows.size());
        if (selected < left_scroll) left_scroll = selected;
        if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));

        const int begin = left_scroll;
        const int end = std::min(total, begin + visible_rows);
        constexpr int kLeftLineMax = 46;

        std::vector<Element> items;
        if (begin > 0) items.push_back(text("↑ more") | color(Color::GrayDark));
        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[static_cast<std::size_t>(i)];
            Element line;
            if (!r.field) {
                const bool open = collapsed.count(r.group->name) == 0;
                line = hbox({
                    text((open ? "▾ " : "▸ ") + r.group->name) | color(Color::Magenta) | flex,
                    text(std::to_string(r.group->fields.size())) | color(Color::GrayDark),
                });
            } else {
                line = hbox({
                    text("  • " + r.field->name) | color(Color::Cyan) | flex,
                    text(sdds::to_string(r.field->type)) | color(Color::Yellow),
                });
            }
            line = line | size(WIDTH, LESS_THAN, kLeftLineMax);
            if (i == selected) line = line | inverted;
            items.push_back(line);
        }
        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));

        auto header = hbox({
            text("SDDS") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" fold  ") | color(Color::GrayDark),
            text("n/p") | bold | color(Color::Yellow),
            text(" page") | color(Color::GrayDark),
        });
        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    });

    auto right_pane = Renderer([&] {
        const sdds::Page* page = current_page();
        std::string page_label = doc.pages.empty()
            ? std::string("no pages")
            : "page " + std::to_string(page_index + 1) + "/" + std::to_string(doc.pages.size());
        if (page) page_label += "  rows=" + std::to_string(page->row_count);

        std::vector<Element> meta_lines;
        std::string title = "<schema>";
        std::string preview;
        const UiRow* r = rows.empty() ? nullptr : &rows[static_cast<std::size_t>(selected)];
        if (r && r->field) {
            const sdds::FieldDef& f = *r->field;
            title = f.name;
            auto kv = [&](const std::string& k, const std::string& v) {
                if (v.empty()) return;
                meta_lines.push_back(hbox({
                    text(k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(v) | color(Color::GrayLight) | flex,
                }));
            };
            kv("units", f.units);
            kv("symbol", f.symbol);
            kv("description", f.description);
            kv("format", f.format_string);
            if (f.fixed_value) kv("fixed_value", *f.fixed_value);
            preview = preview_text(f, page, a.rows);
        } else {
            auto kv = [&](const std::string& k, const std::string& v) {
                meta_lines.push_back(hbox({
                    text(k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(v) | color(Color::GrayLight) | flex,
                }));
            };
            kv("mode", sdds::to_string(doc.schema.data.mode));
            kv("endianness", fmt_endianness(doc.schema));
            if (doc.schema.description) kv("description", doc.schema.description->text);
        }
        if (meta_lines.empty()) meta_lines.push_back(text("(no metadata)") | color(Color::GrayDark));

        Element top = vbox({
            hbox({text(title) | bold | color(Color::Green), filler(), text(page_label) | color(Color::GrayDark)}),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("preview") | bold | color(Color::Magenta),
            separator(),
            render_preview_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    });

    auto layout = Renderer([&] {
        auto dim = Terminal::Size();
        return hbox({
                   left_pane->Render() | size(WIDTH, EQUAL, 48),
                   right_pane->Render() | flex,
               }) |
               size(WIDTH, EQUAL, std::max(20, dim.dimx)) |
               size(HEIGHT, EQUAL, std::max(10, dim.dimy));
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        clamp_selected();
        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        if (e == Event::Character('n')) {
            if (page_index + 1 < doc.pages.size()) ++page_index;
            return true;
        }
        if (e == Event::Character('p')) {
            if (page_index > 0) --page_index;
            return true;
        }
        if (rows.empty()) return false;
        const UiRow& r = rows[static_cast<std::size_t>(selected)];

        if (e == Event::ArrowUp) {
            if (selected > 0) --selected;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < static_cast<int>(rows.size())) ++selected;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min(static_cast<int>(rows.size()) - 1, selected + 25);
            return true;
        }
        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min(static_cast<int>(rows.size()) - 1, selected + 3);
                return true;
            }
        }
        if (e == Event::ArrowRight && !r.field) {
            collapsed.erase(r.group->name);
            return true;
        }
        if (e == Event::ArrowLeft && !r.field) {
            collapsed.insert(r.group->name);
            return true;
        }
        return false;
    });

    screen.Loop(app);
    return 0;
}

// ----------------- Conversion -----------------

static int run_convert(const Args& a, const Ansi& ansi) {
    sdds::Reader reader = sdds::Reader::open(a.file, read_options(a));

    sdds::Schema schema = sdds::easy::converted_schema(reader.schema(), a.mode, a.endianness);

    sdds::WriteOptions wo;
    if (a.gzip) wo.compression = sdds::CompressionMode::Always;

    sdds::Writer writer = sdds::Writer::create(a.out, std::move(schema), wo);
    while (auto page = reader.read_page()) writer.write_page(*page);
    writer.close();

    std::cout << ansi.green() << "Wrote" << ansi.reset() << " " << writer.pages_written()
              << " page(s) to " << a.out << " (" << sdds::to_string(writer.schema().data.mode)
              << (a.gzip ? ", gzip" : "") << ")\n";
    return 0;
}

} // namespace


int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        if (a.cmd == "header") {
            sdds::Reader r = sdds::Reader::open(a.file, read_options(a));
            const sdds::Schema& s = r.schema();
            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "Mode" << ansi.reset() << ": " << sdds::to_string(s.data.mode) << "\n";
            std::cout << ansi.bold() << "Endianness" << ansi.reset() << ": " << fmt_endianness(s) << "\n";
            std::cout << ansi.bold() << "Row counts" << ansi.reset() << ": " << (s.data.no_row_counts ? "no" : "yes") << "\n";
            if (s.data.column_major_order) {
                std::cout << ansi.bold() << "Order" << ansi.reset() << ": column-major\n";
            }
            if (s.description) {
                std::cout << ansi.bold() << "Description" << ansi.reset() << ": " << s.description->text;
                if (!s.description->contents.empty()) std::cout << " " << ansi.dim() << "(" << s.description->contents << ")" << ansi.reset();
                std::cout << "\n";
            }
            for (const auto& inc : s.includes) {
                std::cout << ansi.bold() << "Include" << ansi.reset() << ": " << inc.filename << "\n";
            }
            std::cout << ansi.bold() << "Fields" << ansi.reset() << ": "
                      << s.parameters().size() << " parameter(s), "
                      << s.arrays().size() << " array(s), "
                      << s.columns().size() << " column(s)\n";
            std::cout << ansi.bold() << "Data offset" << ansi.reset() << ": " << r.data_offset() << " bytes\n";
            if (a.raw) {
                std::cout << sdds::render_header(s);
            } else {
                std::cout << ansi.dim() << "(use --raw to print the normalized header)\n" << ansi.reset();
            }
            return 0;
        }

        if (a.cmd == "tree") {
            sdds::Reader r = sdds::Reader::open(a.file, read_options(a));
            std::cout << ansi.bold() << "SDDS fields" << ansi.reset() << ": " << a.file << "\n";
            print_tree(r.schema(), ansi, a.details);
            return 0;
        }

        if (a.cmd == "pages") {
            sdds::Reader r = sdds::Reader::open(a.file, read_options(a));
            while (auto page = r.read_page()) {
                std::cout << ansi.magenta() << "page " << r.pages_read() << ansi.reset()
                          << " " << ansi.gray() << "rows=" << page->row_count << ansi.reset() << "\n";
                for (const sdds::FieldDef* f : r.schema().parameters()) {
                    std::cout << "  " << ansi.cyan() << f->name << ansi.reset() << " = "
                              << fmt_value(page->parameter(f->name)) << "\n";
                }
                for (const auto& kv : page->arrays) {
                    std::cout << "  " << ansi.cyan() << kv.first << ansi.reset() << " "
                              << ansi.gray() << fmt_dims(kv.second.dims) << ansi.reset() << "\n";
                }
            }
            std::cout << ansi.dim() << r.pages_read() << " page(s)" << ansi.reset() << "\n";
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a);
        }

        if (a.cmd == "convert") {
            return run_convert(a, ansi);
        }
    } catch (const sdds::SddsError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what()
                  << " " << ansi.dim() << "[" << sdds::to_string(e.kind()) << "]" << ansi.reset() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
