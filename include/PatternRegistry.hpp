#ifndef REDACT_PATTERN_REGISTRY_HPP
#define REDACT_PATTERN_REGISTRY_HPP

#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief A named, compiled PII pattern
 *
 * The matcher is compiled once and never modified afterwards, so a pattern
 * can be shared by any number of concurrent scans.
 */
struct PIIPattern {
  /**
   * @brief Compile a pattern
   * @param name Category name reported in findings (must be unique)
   * @param expression ECMAScript regular expression
   * @param ignoreCase Compile the expression case-insensitively
   * @param valueGroup Capture group reported as the matched value (0 = whole
   * match)
   * @throws std::regex_error if the expression does not compile
   */
  PIIPattern(std::string name, std::string expression, bool ignoreCase = false,
             int valueGroup = 0);

  std::string name;       ///< Category name
  std::string expression; ///< Source expression, kept for diagnostics
  std::regex matcher;     ///< Compiled expression
  int valueGroup;         ///< Capture group holding the reported value
};

/**
 * @brief Immutable, ordered set of PII patterns
 *
 * Registration order only decides the order in which categories are
 * reported. There is no process-wide instance: callers build a registry
 * (usually with createDefault()) and hand it to whoever needs it.
 */
class PatternRegistry {
public:
  /**
   * @brief Build a registry from a pattern list
   * @param patterns Patterns in reporting order
   * @throws std::invalid_argument on an empty or duplicate name
   */
  explicit PatternRegistry(std::vector<PIIPattern> patterns);

  /**
   * @brief Registry with the built-in forensic pattern set
   *
   * Categories: ipv4, ipv6, email, phone, ssn, credit_card, api_key_generic,
   * aws_access_key, aws_secret, jwt, private_key, github_token, stripe_key,
   * slack_token, google_api, context_secret.
   */
  static std::shared_ptr<const PatternRegistry> createDefault();

  const std::vector<PIIPattern> &patterns() const;

  size_t size() const;

  /**
   * @brief Look up a pattern by category name
   * @return Pointer into the registry, or nullptr if unknown
   */
  const PIIPattern *find(const std::string &name) const;

  /**
   * @brief Category names in registration order
   */
  std::vector<std::string> names() const;

private:
  std::vector<PIIPattern> m_patterns;
};

} // namespace redact

#endif // REDACT_PATTERN_REGISTRY_HPP
