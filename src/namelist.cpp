#include "sdds/namelist.hpp"

#include "sdds/sdds.hpp"

#include <cctype>
#include <memory>

namespace sdds {

const std::string* NamelistCommand::find(const std::string& key) const {
    const std::string* out = nullptr;
    for (const auto& kv : fields) {
        if (kv.first == key) out = &kv.second;
    }
    return out;
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_blank_char(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

static SddsError malformed(const std::string& msg, std::uint64_t offset) {
    return SddsError(ErrorKind::MalformedNamelist, msg, ErrorLocation{offset, std::nullopt, {}});
}

NamelistTokenizer::NamelistTokenizer(LineSource source, std::uint64_t base_offset)
    : source_(std::move(source)), consumed_(base_offset) {}

NamelistTokenizer::NamelistTokenizer(std::string_view text, std::uint64_t base_offset)
    : consumed_(base_offset) {
    struct Cursor {
        std::string text;
        std::size_t pos{0};
    };
    auto cur = std::make_shared<Cursor>();
    cur->text.assign(text.data(), text.size());
    source_ = [cur](std::string& line, bool& newline) {
        if (cur->pos >= cur->text.size()) return false;
        auto nl = cur->text.find('\n', cur->pos);
        newline = nl != std::string::npos;
        if (!newline) nl = cur->text.size();
        line.assign(cur->text, cur->pos, nl - cur->pos);
        cur->pos = nl + 1;
        return true;
    };
}

bool NamelistTokenizer::fill() {
    bool newline = false;
    if (!source_ || !source_(line_, newline)) {
        have_line_ = false;
        line_.clear();
        pos_ = 0;
        return false;
    }
    line_offset_ = consumed_;
    consumed_ += line_.size() + (newline ? 1 : 0);
    pos_ = 0;
    have_line_ = true;
    return true;
}

void NamelistTokenizer::skip_blanks() {
    while (pos_ < line_.size() && is_blank_char(line_[pos_])) ++pos_;
}

bool NamelistTokenizer::looking_at_end() const {
    if (line_.compare(pos_, 4, "&end") != 0) return false;
    return pos_ + 4 >= line_.size() || !is_ident_char(line_[pos_ + 4]);
}

std::string NamelistTokenizer::read_identifier() {
    std::size_t start = pos_;
    while (pos_ < line_.size() && is_ident_char(line_[pos_])) ++pos_;
    return line_.substr(start, pos_ - start);
}

std::string NamelistTokenizer::read_quoted(std::uint64_t cmd_offset) {
    // opening quote already consumed; a quoted value may continue on following lines
    std::string out;
    while (true) {
        if (at_line_end()) {
            if (!fill()) throw malformed("unbalanced quote in namelist value", cmd_offset);
            out.push_back('\n');
            continue;
        }
        char c = line_[pos_++];
        if (c == '"') return out;
        if (c == '\\' && pos_ < line_.size() && (line_[pos_] == '"' || line_[pos_] == '\\')) {
            out.push_back(line_[pos_++]);
            continue;
        }
        out.push_back(c);
    }
}

std::string NamelistTokenizer::read_bareword() {
    std::string out;
    while (!at_line_end()) {
        char c = line_[pos_];
        if (c == ',') break;
        if (c == '&' && looking_at_end()) break;
        if (c == '\\' && pos_ + 1 < line_.size() && line_[pos_ + 1] == ',') {
            out.push_back(',');
            pos_ += 2;
            continue;
        }
        out.push_back(c);
        ++pos_;
    }
    while (!out.empty() && is_blank_char(out.back())) out.pop_back();
    return out;
}

std::optional<NamelistCommand> NamelistTokenizer::next() {
    // Find the next '&' outside of comments and blank lines.
    while (true) {
        if (!have_line_ || at_line_end()) {
            if (!fill()) return std::nullopt;
        }
        skip_blanks();
        if (at_line_end()) continue;
        char c = line_[pos_];
        if (c == '!') {
            pos_ = line_.size();
            continue;
        }
        if (c == '&') break;
        throw malformed("unexpected text outside a namelist command", line_offset_ + pos_);
    }

    NamelistCommand cmd;
    cmd.offset = line_offset_ + pos_;
    ++pos_;
    cmd.name = read_identifier();
    if (cmd.name.empty()) throw malformed("'&' not followed by a command name", cmd.offset);
    if (cmd.name == "end") throw malformed("'&end' without an open command", cmd.offset);

    const std::string unterminated = "command '&" + cmd.name + "' is not terminated by &end";
    while (true) {
        skip_blanks();
        if (at_line_end()) {
            if (!fill()) throw malformed(unterminated, cmd.offset);
            continue;
        }
        char c = line_[pos_];
        if (c == ',') {
            ++pos_;
            continue;
        }
        if (c == '&') {
            if (looking_at_end()) {
                pos_ += 4;
                return cmd;
            }
            throw malformed(unterminated, cmd.offset);
        }

        const std::uint64_t key_offset = line_offset_ + pos_;
        std::string key = read_identifier();
        if (key.empty()) throw malformed("expected a key in '&" + cmd.name + "'", key_offset);
        skip_blanks();
        if (at_line_end() || line_[pos_] != '=') {
            throw malformed("expected '=' after '" + key + "' in '&" + cmd.name + "'", key_offset);
        }
        ++pos_;
        skip_blanks();

        std::string value;
        if (!at_line_end() && line_[pos_] == '"') {
            ++pos_;
            value = read_quoted(cmd.offset);
        } else {
            value = read_bareword();
        }
        cmd.fields.emplace_back(std::move(key), std::move(value));
    }
}

} // namespace sdds
