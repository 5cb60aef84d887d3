#include "engine/transcript_parser.hpp"
#include "config.hpp"

#include <charconv>
#include <nlohmann/json.hpp>
#include <sstream>

namespace transcript {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::optional<int64_t> parse_timestamp(std::string_view s) {
    // h+ ':' mm ':' ss [.,] mmm
    auto c1 = s.find(':');
    if (c1 == std::string_view::npos || s.size() < c1 + 10) return std::nullopt;
    if (s[c1 + 3] != ':' || (s[c1 + 6] != '.' && s[c1 + 6] != ',')) return std::nullopt;

    auto num = [](std::string_view part) -> std::optional<int64_t> {
        int64_t v = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), v);
        if (ec != std::errc() || ptr != part.data() + part.size()) return std::nullopt;
        return v;
    };

    auto h = num(s.substr(0, c1));
    auto m = num(s.substr(c1 + 1, 2));
    auto sec = num(s.substr(c1 + 4, 2));
    auto ms = num(s.substr(c1 + 7));
    if (!h || !m || !sec || !ms || s.size() != c1 + 10) return std::nullopt;
    if (*m >= 60 || *sec >= 60) return std::nullopt;

    return ((*h * 60 + *m) * 60 + *sec) * 1000 + *ms;
}

std::vector<Segment> parse_segments(const std::string& output) {
    std::vector<Segment> segments;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        std::string_view v(line);
        auto open = v.find('[');
        if (open == std::string_view::npos || !trim(v.substr(0, open)).empty()) continue;
        auto close = v.find(']', open);
        if (close == std::string_view::npos) continue;

        auto header = v.substr(open + 1, close - open - 1);
        auto arrow = header.find("-->");
        if (arrow == std::string_view::npos) continue;

        auto start = parse_timestamp(trim(header.substr(0, arrow)));
        auto end = parse_timestamp(trim(header.substr(arrow + 3)));
        if (!start || !end) continue;

        segments.push_back({*start, *end, trim(v.substr(close + 1))});
    }
    return segments;
}

std::string join(const std::vector<Segment>& segments) {
    std::string out;
    for (const auto& s : segments) {
        if (s.text.empty()) continue;
        if (!out.empty()) out += ' ';
        out += s.text;
    }
    return out;
}

std::string to_json(const TranscriptionResult& result) {
    using json = nlohmann::json;

    json j = {
        {"text", result.text},
        {"format", to_string(result.format)},
        {"elapsed_s", result.elapsed_s},
        {"engine_s", result.engine_s},
        {"normalized", result.normalized},
        {"model", result.model_path},
        {"segments", json::array()},
    };
    for (const auto& s : result.segments) {
        j["segments"].push_back({{"start_ms", s.start_ms}, {"end_ms", s.end_ms}, {"text", s.text}});
    }
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

} // namespace transcript
