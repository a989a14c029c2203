#include "logvec/ingest/normalizer.h"

#include <cctype>
#include <utility>

namespace logvec {
namespace ingest {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return c >= '0' && c <= '9'; }

// Each scanner advances pos past the run it accepts and reports whether the
// run had at least min characters.
bool skip_spaces(const std::string& s, size_t& pos, size_t min = 1) {
    size_t start = pos;
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos - start >= min;
}

bool skip_digits(const std::string& s, size_t& pos, size_t min = 1) {
    size_t start = pos;
    while (pos < s.size() && is_digit(s[pos])) {
        ++pos;
    }
    return pos - start >= min;
}

bool skip_exact_digits(const std::string& s, size_t& pos, size_t count) {
    for (size_t i = 0; i < count; ++i, ++pos) {
        if (pos >= s.size() || !is_digit(s[pos])) {
            return false;
        }
    }
    return true;
}

bool skip_char(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

bool skip_non_spaces(const std::string& s, size_t& pos) {
    size_t start = pos;
    while (pos < s.size() && !is_space(s[pos])) {
        ++pos;
    }
    return pos > start;
}

// Hostname field and the whitespace that follows it.
bool skip_host(const std::string& s, size_t& pos) {
    return skip_spaces(s, pos) && skip_non_spaces(s, pos) && skip_spaces(s, pos);
}

// "Nov 04 23:58:33 archlinux "
size_t syslog_prefix_length(const std::string& s) {
    if (s.size() < 3 || !std::isupper(static_cast<unsigned char>(s[0])) ||
        !std::islower(static_cast<unsigned char>(s[1])) ||
        !std::islower(static_cast<unsigned char>(s[2]))) {
        return 0;
    }
    size_t pos = 3;
    bool ok = skip_spaces(s, pos) && skip_digits(s, pos) && skip_spaces(s, pos) &&
              skip_digits(s, pos) && skip_char(s, pos, ':') && skip_digits(s, pos) &&
              skip_char(s, pos, ':') && skip_digits(s, pos) && skip_host(s, pos);
    return ok ? pos : 0;
}

// "2024-11-04T23:58:33.123+01:00 archlinux "
size_t iso_prefix_length(const std::string& s) {
    size_t pos = 0;
    bool ok = skip_exact_digits(s, pos, 4) && skip_char(s, pos, '-') &&
              skip_exact_digits(s, pos, 2) && skip_char(s, pos, '-') &&
              skip_exact_digits(s, pos, 2) && (skip_char(s, pos, 'T') || skip_char(s, pos, ' ')) &&
              skip_exact_digits(s, pos, 2) && skip_char(s, pos, ':') &&
              skip_exact_digits(s, pos, 2) && skip_char(s, pos, ':') &&
              skip_exact_digits(s, pos, 2);
    if (!ok) {
        return 0;
    }
    if (skip_char(s, pos, '.') && !skip_digits(s, pos)) {
        return 0;
    }
    if (!skip_char(s, pos, 'Z') && (skip_char(s, pos, '+') || skip_char(s, pos, '-'))) {
        if (!skip_exact_digits(s, pos, 2)) {
            return 0;
        }
        skip_char(s, pos, ':');
        if (!skip_exact_digits(s, pos, 2)) {
            return 0;
        }
    }
    return skip_host(s, pos) ? pos : 0;
}

std::string strip_prefixes(std::string line) {
    line.erase(0, syslog_prefix_length(line));
    line.erase(0, iso_prefix_length(line));
    return line;
}

// Drops every "[<digits>]" token.
std::string remove_bracketed_pids(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        if (line[i] == '[') {
            size_t pos = i + 1;
            if (skip_digits(line, pos) && skip_char(line, pos, ']')) {
                i = pos;
                continue;
            }
        }
        out.push_back(line[i]);
        ++i;
    }
    return out;
}

// Drops trailing whitespace-separated all-digit tokens.
std::string strip_trailing_numbers(std::string line) {
    while (true) {
        size_t end = line.size();
        while (end > 0 && is_space(line[end - 1])) {
            --end;
        }
        size_t digits_start = end;
        while (digits_start > 0 && is_digit(line[digits_start - 1])) {
            --digits_start;
        }
        size_t space_start = digits_start;
        while (space_start > 0 && is_space(line[space_start - 1])) {
            --space_start;
        }
        if (digits_start == end || space_start == digits_start) {
            return line;
        }
        line.erase(space_start);
    }
}

std::string single_pass(const std::string& line) {
    std::string out = strip_prefixes(line);
    out = remove_bracketed_pids(out);
    out = strip_trailing_numbers(std::move(out));
    return collapse_whitespace(out);
}

} // namespace

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

std::string normalize(const std::string& raw) {
    if (is_blank(raw)) {
        return std::string();
    }

    // A pass either shortens the text or only rewrites whitespace.
    std::string current = raw;
    while (true) {
        std::string next = single_pass(current);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }

    if (current.empty()) {
        return collapse_whitespace(raw);
    }
    return current;
}

} // namespace ingest
} // namespace logvec
