#pragma once

#include "engine/transcription.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transcript {

std::string trim(std::string_view s);

// "hh:mm:ss.mmm" (',' accepted as the decimal separator) -> milliseconds.
std::optional<int64_t> parse_timestamp(std::string_view s);

// Engine output in timestamped mode, one segment per line:
//   [00:00:00.000 --> 00:00:02.500]   And so my fellow Americans
// Lines without a timestamp header are ignored.
std::vector<Segment> parse_segments(const std::string& output);

// Segment texts joined by single spaces.
std::string join(const std::vector<Segment>& segments);

// Pretty-printed JSON of a result. The engine may split a multi-byte
// character across segments; invalid UTF-8 becomes U+FFFD.
std::string to_json(const TranscriptionResult& result);

} // namespace transcript
