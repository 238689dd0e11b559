#pragma once

#include <functional>
#include <string>
#include <vector>

namespace ethos::checks {

struct CheckResult {
  std::string name;
  double score = 0.0;
  std::string explanation;
};

using Scorer = std::function<CheckResult(const std::string &text)>;

struct NamedScorer {
  std::string name;
  Scorer scorer;
};

/// Ordered scorer table. Results come back in registration order.
class ScorerSet {
public:
  void add(std::string name, Scorer scorer);
  [[nodiscard]] bool empty() const { return scorers_.empty(); }
  [[nodiscard]] std::size_t size() const { return scorers_.size(); }
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] std::vector<CheckResult> run(const std::string &text) const;

private:
  std::vector<NamedScorer> scorers_;
};

struct ScorerOptions {
  bool require_uncertainty = true;
};

[[nodiscard]] CheckResult overconfidence_check(const std::string &text,
                                               bool require_uncertainty = true);
[[nodiscard]] CheckResult sensitive_data_check(const std::string &text);
[[nodiscard]] CheckResult manipulation_check(const std::string &text);

/// overconfidence, sensitive_data, manipulation, in that order.
[[nodiscard]] ScorerSet default_scorers(const ScorerOptions &options = {});

[[nodiscard]] double clip_score(double score);

} // namespace ethos::checks
