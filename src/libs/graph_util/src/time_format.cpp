#include <graph_util/time_format.hpp>
#include <array>
#include <cctype>
#include <chrono>
#include <date/date.h>
#include <sstream>

namespace graph_util {

namespace {

using Micros = date::sys_time<std::chrono::microseconds>;
using Millis = date::sys_time<std::chrono::milliseconds>;

constexpr std::array<const char*, 7> offset_formats = {
    "%FT%T%Ez", "%FT%T%z", "%FT%R%Ez", "%FT%R%z", "%FT%T", "%FT%R", "%F",
};
constexpr std::array<const char*, 3> utc_formats = {"%FT%T", "%FT%R", "%F"};

// Parses the whole of `text` with `fmt`; trailing input counts as a failure.
bool parse_exact(const std::string& text, const char* fmt, Micros& out) {
    std::istringstream in(text);
    in >> date::parse(fmt, out);
    return !in.fail() && in.peek() == std::char_traits<char>::eof();
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

std::optional<std::int64_t> parse_iso8601_ms(const std::string& text) {
    std::string s = trim(text);
    if (s.size() > 10 && (s[10] == ' ' || s[10] == 't')) s[10] = 'T';

    bool utc = false;
    if (s.size() > 10 && (s.back() == 'Z' || s.back() == 'z')) {
        s.pop_back();
        utc = true;
    }

    Micros tp;
    bool parsed = false;
    if (utc) {
        for (const char* fmt : utc_formats) {
            if ((parsed = parse_exact(s, fmt, tp))) break;
        }
    } else {
        for (const char* fmt : offset_formats) {
            if ((parsed = parse_exact(s, fmt, tp))) break;
        }
    }
    if (!parsed) return std::nullopt;

    return date::floor<std::chrono::milliseconds>(tp).time_since_epoch().count();
}

std::string format_iso8601_ms(std::int64_t epoch_ms) {
    return date::format("%FT%TZ", Millis{std::chrono::milliseconds{epoch_ms}});
}

std::string format_timestamp(const std::string& iso) {
    if (iso.empty()) return "-";
    const auto ms = parse_iso8601_ms(iso);
    if (!ms) return iso;
    return date::format("%F %R", Millis{std::chrono::milliseconds{*ms}});
}

} // namespace graph_util
