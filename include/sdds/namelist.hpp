#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sdds {

// One `&name key=value, ... &end` command.
struct NamelistCommand {
    std::string name{};
    // Raw values in source order; quotes and escapes already removed.
    std::vector<std::pair<std::string, std::string>> fields{};
    // Byte offset of the opening '&'.
    std::uint64_t offset{0};

    // Last value given for `key`, if any.
    const std::string* find(const std::string& key) const;
};

/// Lexes namelist commands. Input is pulled one line at a time, so the
/// tokenizer never reads past the line holding the `&end` it stops at.
class NamelistTokenizer {
public:
    // Fills `line` with the next line (without the newline) and returns false at end of input.
    // `newline` is set when a terminating '\n' was consumed after the line.
    using LineSource = std::function<bool(std::string& line, bool& newline)>;

    NamelistTokenizer(LineSource source, std::uint64_t base_offset);
    explicit NamelistTokenizer(std::string_view text, std::uint64_t base_offset = 0);

    /// Next command, or std::nullopt when the input is exhausted.
    /// Throws SddsError(MalformedNamelist) on syntax errors.
    std::optional<NamelistCommand> next();

    /// Offset just past the last line pulled from the source.
    std::uint64_t consumed() const noexcept { return consumed_; }

private:
    bool fill();
    bool at_line_end() const { return pos_ >= line_.size(); }
    bool looking_at_end() const;
    std::string read_identifier();
    std::string read_quoted(std::uint64_t cmd_offset);
    std::string read_bareword();
    void skip_blanks();

    LineSource source_;
    std::string line_{};
    std::size_t pos_{0};
    std::uint64_t line_offset_{0};
    std::uint64_t consumed_{0};
    bool have_line_{false};
};

} // namespace sdds
