#include "ethos/sig/transcript.hpp"

#include "ethos/common/fs.hpp"
#include "ethos/common/json.hpp"

#include <sstream>

namespace ethos::sig {

common::Result<std::vector<Event>> parse_transcript_jsonl(const std::string &text) {
  std::vector<Event> events;
  std::istringstream in(text);
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (common::trim(line).empty()) {
      continue;
    }
    auto parsed = common::parse_json(line);
    if (!parsed.ok()) {
      return common::Result<std::vector<Event>>::failure(
          common::ErrorKind::Input, "line " + std::to_string(line_number) + ": " + parsed.error());
    }
    auto event = Event::from_json(std::move(parsed.value()));
    if (!event.ok()) {
      return common::Result<std::vector<Event>>::failure(
          common::ErrorKind::Input, "line " + std::to_string(line_number) + ": " + event.error());
    }
    events.push_back(std::move(event.value()));
  }
  return common::Result<std::vector<Event>>::success(std::move(events));
}

common::Result<std::vector<Event>> load_transcript(const std::filesystem::path &path) {
  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::vector<Event>>::failure(content);
  }
  auto events = parse_transcript_jsonl(content.value());
  if (!events.ok()) {
    return common::Result<std::vector<Event>>::failure(events.kind(),
                                                       path.string() + ": " + events.error());
  }
  return events;
}

} // namespace ethos::sig
