#ifndef REDACT_TEXT_DETECTOR_HPP
#define REDACT_TEXT_DETECTOR_HPP

#include "PatternRegistry.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace redact {

/**
 * @brief Matched values grouped by category
 *
 * Categories keep registry order and only appear when they have at least one
 * match. Values keep scan order and duplicates are retained.
 */
class Findings {
public:
  using Entry = std::pair<std::string, std::vector<std::string>>;

  /**
   * @brief Append a category with its matches (ignored if matches is empty)
   */
  void add(const std::string &category, std::vector<std::string> matches);

  bool empty() const;

  /**
   * @brief Category names in registry order
   */
  std::vector<std::string> categories() const;

  bool contains(const std::string &category) const;

  /**
   * @brief Values found for a category (empty if the category is absent)
   */
  const std::vector<std::string> &matches(const std::string &category) const;

  /**
   * @brief Every matched value across all categories, duplicates kept
   */
  std::vector<std::string> terms() const;

  /**
   * @brief Distinct matched values in first-seen order
   */
  std::vector<std::string> uniqueTerms() const;

  /**
   * @brief Total number of matches across all categories
   */
  size_t matchCount() const;

  const std::vector<Entry> &entries() const { return m_entries; }

private:
  std::vector<Entry> m_entries;
};

/**
 * @brief Scans text against a pattern registry
 *
 * Every pattern performs an unanchored, non-overlapping, left-to-right scan
 * of the whole text. The detector keeps no state between calls and can be
 * used from several threads at once.
 *
 * std::regex matches recursively, one stack frame per repeated character.
 * Runs of non-whitespace longer than MAX_SCAN_RUN are therefore scanned as
 * separate slices of that length, and longer whitespace runs are shortened
 * to it. Reported values are still verbatim substrings of the input.
 */
class TextDetector {
public:
  static constexpr size_t MAX_SCAN_RUN = 512;

  /**
   * @brief Detector over the built-in pattern set
   */
  TextDetector();

  /**
   * @brief Detector over a caller-supplied registry
   * @throws std::invalid_argument if registry is null
   */
  explicit TextDetector(std::shared_ptr<const PatternRegistry> registry);

  /**
   * @brief Find all PII in a piece of text
   * @param text Text to scan (usually an OCR transcription)
   * @return Findings keyed by category
   */
  Findings detect(const std::string &text) const;

  const PatternRegistry &registry() const;

private:
  std::shared_ptr<const PatternRegistry> m_registry;
};

} // namespace redact

#endif // REDACT_TEXT_DETECTOR_HPP
