#pragma once

#include "ethos/common/result.hpp"
#include "ethos/sig/graph.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ethos::sig {

/// One event per non-blank line. Errors name the 1-based line number.
[[nodiscard]] common::Result<std::vector<Event>> parse_transcript_jsonl(const std::string &text);
[[nodiscard]] common::Result<std::vector<Event>>
load_transcript(const std::filesystem::path &path);

} // namespace ethos::sig
