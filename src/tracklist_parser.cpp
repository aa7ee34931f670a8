//
//  tracklist_parser.cpp
//  TrackSplit
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tracklist_parser.hpp"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

#include "logging.hpp"

namespace tracksplit {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kEnDash = "\xE2\x80\x93";
constexpr std::string_view kEmDash = "\xE2\x80\x94";
constexpr size_t kMaxTimeGroups = 3;
constexpr size_t kMaxHourDigits = 6;
constexpr int kMaxMinuteOrSecond = 59;

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

size_t skip_space(std::string_view s, size_t pos) {
    while (pos < s.size() && is_space(s[pos])) {
        ++pos;
    }
    return pos;
}

// Length in bytes of the label separator at `pos`, 0 if there is none.
size_t separator_length(std::string_view s, size_t pos) {
    if (pos >= s.size()) {
        return 0;
    }
    const char c = s[pos];
    if (c == '-' || c == '|' || c == ':') {
        return 1;
    }
    auto rest = s.substr(pos);
    if (rest.substr(0, kEnDash.size()) == kEnDash || rest.substr(0, kEmDash.size()) == kEmDash) {
        return kEnDash.size();
    }
    return 0;
}

size_t scan_digits(std::string_view s, size_t pos) {
    while (pos < s.size() && is_digit(s[pos])) {
        ++pos;
    }
    return pos;
}

// A digit run following ':' belongs to the time token only if it ends where a time field
// may end; otherwise the colon is the label separator ("3:45:2nd Movement").
bool ends_time_field(std::string_view s, size_t pos) {
    return pos == s.size() || is_space(s[pos]) || s[pos] == ':' || separator_length(s, pos) > 0;
}

bool to_int(std::string_view digits, int64_t &out) {
    auto r = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return r.ec == std::errc() && r.ptr == digits.data() + digits.size();
}

std::string line_error(int line_no, std::string_view raw, const std::string &detail) {
    std::ostringstream oss;
    oss << "line " << line_no << ": " << detail << ": '" << raw << "'";
    return oss.str();
}

}  // namespace

namespace parser_detail {

std::optional<TimeToken> scan_time_token(std::string_view line, std::string &error) {
    if (line.empty() || !is_digit(line.front())) {
        error = "line does not start with a timestamp";
        return std::nullopt;
    }
    std::vector<std::string_view> groups;
    size_t pos = scan_digits(line, 0);
    groups.push_back(line.substr(0, pos));
    while (pos + 1 < line.size() && line[pos] == ':' && is_digit(line[pos + 1])) {
        const size_t end = scan_digits(line, pos + 1);
        if (!ends_time_field(line, end)) {
            break;
        }
        groups.push_back(line.substr(pos + 1, end - pos - 1));
        pos = end;
    }

    if (groups.size() == 1) {
        error = "timestamp needs minutes and seconds (M:SS or H:MM:SS)";
        return std::nullopt;
    }
    if (groups.size() > kMaxTimeGroups) {
        error = "timestamp has more than three fields";
        return std::nullopt;
    }

    const bool has_hours = groups.size() == kMaxTimeGroups;
    std::string_view hours_text = has_hours ? groups[0] : std::string_view("0");
    std::string_view minutes_text = groups[groups.size() - 2];
    std::string_view seconds_text = groups.back();

    if (hours_text.size() > kMaxHourDigits) {
        error = "hour field is too large";
        return std::nullopt;
    }
    if (has_hours ? minutes_text.size() != 2 : minutes_text.size() > 2) {
        error = has_hours ? "minutes must have two digits after hours"
                          : "minutes must have one or two digits";
        return std::nullopt;
    }
    if (seconds_text.size() != 2) {
        error = "seconds must have two digits";
        return std::nullopt;
    }

    int64_t hours = 0, minutes = 0, seconds = 0;
    if (!to_int(hours_text, hours) || !to_int(minutes_text, minutes) ||
        !to_int(seconds_text, seconds)) {
        error = "timestamp is not numeric";
        return std::nullopt;
    }
    if (minutes > kMaxMinuteOrSecond) {
        error = "minutes out of range [0,59]";
        return std::nullopt;
    }
    if (seconds > kMaxMinuteOrSecond) {
        error = "seconds out of range [0,59]";
        return std::nullopt;
    }

    TimeToken tok;
    tok.offset = std::chrono::hours(hours) + std::chrono::minutes(minutes) +
                 std::chrono::seconds(seconds);
    tok.length = pos;
    return tok;
}

}  // namespace parser_detail

std::string format_timestamp(Duration offset) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(offset).count();
    std::ostringstream oss;
    oss << (total / 3600) << ':' << std::setfill('0') << std::setw(2) << (total / 60) % 60 << ':'
        << std::setw(2) << total % 60;
    return oss.str();
}

TracklistResult parse_tracklist(std::string_view text) {
    TracklistResult res;
    if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        text.remove_prefix(kUtf8Bom.size());
    }

    auto fail = [&res](ErrorKind kind, int line, std::string msg) {
        TS_LOG("debug", "tracklist rejected: " << msg);
        res.status = make_error(kind, std::move(msg));
        res.entries.clear();
        res.error_line = line;
        return res;
    };

    int line_no = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        std::string_view raw =
            text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        ++line_no;
        start = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;

        std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        std::string detail;
        auto tok = parser_detail::scan_time_token(line, detail);
        if (!tok) {
            return fail(ErrorKind::Parse, line_no, line_error(line_no, line, detail));
        }
        size_t pos = skip_space(line, tok->length);
        const size_t sep = separator_length(line, pos);
        if (sep == 0) {
            return fail(ErrorKind::Parse, line_no,
                        line_error(line_no, line, "expected '-', '|' or ':' after timestamp"));
        }
        TracklistEntry entry;
        entry.offset = tok->offset;
        entry.label = std::string(trim(line.substr(pos + sep)));
        entry.source_line = line_no;

        if (!res.entries.empty()) {
            const auto &prev = res.entries.back();
            if (entry.offset <= prev.offset) {
                std::ostringstream oss;
                if (entry.offset == prev.offset) {
                    oss << "duplicate timestamp " << format_timestamp(entry.offset) << " on lines "
                        << prev.source_line << " and " << line_no;
                } else {
                    oss << "line " << line_no << " (" << format_timestamp(entry.offset)
                        << ") comes before line " << prev.source_line << " ("
                        << format_timestamp(prev.offset) << "); tracklist is out of order";
                }
                const int conflict = prev.source_line;
                fail(ErrorKind::Order, line_no, oss.str());
                res.conflict_line = conflict;
                return res;
            }
        }
        res.entries.push_back(std::move(entry));
    }

    if (res.entries.empty()) {
        return fail(ErrorKind::Parse, 0, "no valid timestamp lines");
    }
    TS_LOG("debug", "parsed " << res.entries.size() << " tracklist entries from " << line_no
                              << " lines");
    return res;
}

TracklistResult parse_tracklist_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        TracklistResult res;
        std::string msg = "cannot open tracklist file " + path + " (" +
                          std::generic_category().message(errno) + ")";
        TS_LOG("error", msg);
        res.status = make_error(ErrorKind::Parse, std::move(msg));
        return res;
    }
    std::ostringstream buf;
    buf << f.rdbuf();
    return parse_tracklist(buf.str());
}

}  // namespace tracksplit
