#include "PatternRegistry.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace redact {

PIIPattern::PIIPattern(std::string name, std::string expression,
                       bool ignoreCase, int valueGroup)
    : name(std::move(name)), expression(std::move(expression)),
      matcher(this->expression,
              ignoreCase ? std::regex::ECMAScript | std::regex::icase
                         : std::regex::ECMAScript),
      valueGroup(valueGroup) {
  if (valueGroup < 0 ||
      static_cast<size_t>(valueGroup) > matcher.mark_count()) {
    throw std::invalid_argument("Pattern '" + this->name +
                                "' has no capture group " +
                                std::to_string(valueGroup));
  }
}

PatternRegistry::PatternRegistry(std::vector<PIIPattern> patterns)
    : m_patterns(std::move(patterns)) {
  std::set<std::string> seen;
  for (const auto &pattern : m_patterns) {
    if (pattern.name.empty()) {
      throw std::invalid_argument("Pattern name must not be empty");
    }
    if (!seen.insert(pattern.name).second) {
      throw std::invalid_argument("Duplicate pattern name: " + pattern.name);
    }
  }
}

std::shared_ptr<const PatternRegistry> PatternRegistry::createDefault() {
  std::vector<PIIPattern> patterns;
  patterns.reserve(16);

  // Network identifiers. OCR frequently reads a dot as a comma.
  patterns.emplace_back("ipv4", R"(\b(?:[0-9]{1,3}[.,]){3}[0-9]{1,3}\b)");
  patterns.emplace_back("ipv6",
                        R"(\b(?:[A-Fa-f0-9]{1,4}:){7}[A-Fa-f0-9]{1,4}\b)");

  // Contact data and personal identifiers
  patterns.emplace_back(
      "email", R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)");
  patterns.emplace_back(
      "phone",
      R"(\b(?:\+?1[-.]?)?\(?[0-9]{3}\)?[-.]?[0-9]{3}[-.]?[0-9]{4}\b)");
  patterns.emplace_back("ssn", R"(\b\d{3}-\d{2}-\d{4}\b)");
  patterns.emplace_back("credit_card", R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)");

  // Credentials, broadest first
  patterns.emplace_back("api_key_generic", R"(\b[A-Za-z0-9_-]{20,}\b)");
  patterns.emplace_back("aws_access_key", R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)");
  patterns.emplace_back("aws_secret", R"(\b[A-Za-z0-9/+=]{40}\b)");
  patterns.emplace_back(
      "jwt",
      R"(\beyJ[A-Za-z0-9_=-]+\.eyJ[A-Za-z0-9_=-]+\.[A-Za-z0-9_.+/=-]+\b)");
  patterns.emplace_back("private_key",
                        R"(-----BEGIN (?:RSA |EC )?PRIVATE KEY-----)");
  patterns.emplace_back("github_token", R"(\bghp_[A-Za-z0-9]{36}\b)");
  patterns.emplace_back("stripe_key",
                        R"(\b(?:sk|pk)_(?:live|test)_[A-Za-z0-9]{24,}\b)");
  patterns.emplace_back("slack_token", R"(\bxox[baprs]-([0-9a-zA-Z]{10,48})\b)",
                        false, 1);
  patterns.emplace_back("google_api", R"(\bAIza[0-9A-Za-z_-]{35}\b)");

  // "password: hunter2", "API_KEY=...": the value is reported, not the key
  patterns.emplace_back(
      "context_secret",
      R"(\b[a-z0-9_]*(?:password|passwd|secret|token|key|pwd|auth|api|email|phone)[a-z0-9_]*\s*[:=]\s*["']?([A-Za-z0-9+/=._@-]+)["']?)",
      true, 1);

  return std::make_shared<const PatternRegistry>(std::move(patterns));
}

const std::vector<PIIPattern> &PatternRegistry::patterns() const {
  return m_patterns;
}

size_t PatternRegistry::size() const { return m_patterns.size(); }

const PIIPattern *PatternRegistry::find(const std::string &name) const {
  for (const auto &pattern : m_patterns) {
    if (pattern.name == name) {
      return &pattern;
    }
  }
  return nullptr;
}

std::vector<std::string> PatternRegistry::names() const {
  std::vector<std::string> result;
  result.reserve(m_patterns.size());
  for (const auto &pattern : m_patterns) {
    result.push_back(pattern.name);
  }
  return result;
}

} // namespace redact
