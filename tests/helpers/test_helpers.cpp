#include "tests/helpers/test_helpers.hpp"

#include "ethos/config/config.hpp"
#include "ethos/sig/transcript.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace ethos::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("ethos-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
  return file_path;
}

std::string TempWorkspace::read(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = std::string(existing);
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

ConfigOverrideGuard::ConfigOverrideGuard(std::optional<std::filesystem::path> next) {
  old_override = config::config_path_override();
  if (next.has_value()) {
    config::set_config_path_override(*next);
  } else {
    config::clear_config_path_override();
  }
}

ConfigOverrideGuard::~ConfigOverrideGuard() {
  if (old_override.has_value()) {
    config::set_config_path_override(*old_override);
  } else {
    config::clear_config_path_override();
  }
}

sig::Clock fixed_clock(std::string value) {
  return [value = std::move(value)] { return value; };
}

std::vector<sig::Event> events_from_jsonl(const std::string &jsonl) {
  auto events = sig::parse_transcript_jsonl(jsonl);
  if (!events.ok()) {
    throw std::runtime_error("transcript fixture failed to parse: " + events.error());
  }
  return events.value();
}

std::vector<sig::Event> two_event_transcript() {
  return events_from_jsonl(
      "{\"type\":\"event\"}\n"
      "{\"type\":\"tool_call\",\"tool_name\":\"shell\",\"payload\":{\"cmd\":\"ls\"}}\n");
}

sig::Graph build_test_graph(const std::vector<sig::Event> &events, const std::string &agent) {
  sig::GraphBuilderOptions options;
  options.agent = agent;
  options.clock = fixed_clock();
  const sig::GraphBuilder builder(std::move(options));
  auto graph = builder.build_graph(events);
  if (!graph.ok()) {
    throw std::runtime_error("graph fixture failed to build: " + graph.error());
  }
  return graph.value();
}

} // namespace ethos::testing
