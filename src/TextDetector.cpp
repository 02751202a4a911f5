#include "TextDetector.hpp"

#include <set>
#include <stdexcept>

namespace redact {

namespace {

// ASCII whitespace, as matched by \s
bool isSpace(char c) { return c == ' ' || (c >= '\t' && c <= '\r'); }

// Copy of text where no run of non-whitespace exceeds maxRun and no
// whitespace run exceeds maxRun. Slices are separated by a NUL, which no
// built-in pattern matches, so a match never straddles a slice boundary.
std::string boundRuns(const std::string &text, size_t maxRun) {
  std::string bounded;
  bounded.reserve(text.size() + text.size() / maxRun);

  size_t run = 0;
  bool inSpace = false;
  for (char c : text) {
    const bool space = isSpace(c);
    if (space != inSpace) {
      inSpace = space;
      run = 0;
    }
    if (run == maxRun) {
      if (space) {
        continue;
      }
      bounded.push_back('\0');
      run = 0;
    }
    bounded.push_back(c);
    ++run;
  }

  return bounded;
}

} // anonymous namespace

void Findings::add(const std::string &category,
                   std::vector<std::string> matches) {
  if (matches.empty()) {
    return;
  }
  m_entries.emplace_back(category, std::move(matches));
}

bool Findings::empty() const { return m_entries.empty(); }

std::vector<std::string> Findings::categories() const {
  std::vector<std::string> names;
  names.reserve(m_entries.size());
  for (const auto &entry : m_entries) {
    names.push_back(entry.first);
  }
  return names;
}

bool Findings::contains(const std::string &category) const {
  for (const auto &entry : m_entries) {
    if (entry.first == category) {
      return true;
    }
  }
  return false;
}

const std::vector<std::string> &
Findings::matches(const std::string &category) const {
  static const std::vector<std::string> none;
  for (const auto &entry : m_entries) {
    if (entry.first == category) {
      return entry.second;
    }
  }
  return none;
}

std::vector<std::string> Findings::terms() const {
  std::vector<std::string> all;
  for (const auto &entry : m_entries) {
    all.insert(all.end(), entry.second.begin(), entry.second.end());
  }
  return all;
}

std::vector<std::string> Findings::uniqueTerms() const {
  std::vector<std::string> unique;
  std::set<std::string> seen;
  for (const auto &entry : m_entries) {
    for (const auto &value : entry.second) {
      if (seen.insert(value).second) {
        unique.push_back(value);
      }
    }
  }
  return unique;
}

size_t Findings::matchCount() const {
  size_t count = 0;
  for (const auto &entry : m_entries) {
    count += entry.second.size();
  }
  return count;
}

TextDetector::TextDetector() : m_registry(PatternRegistry::createDefault()) {}

TextDetector::TextDetector(std::shared_ptr<const PatternRegistry> registry)
    : m_registry(std::move(registry)) {
  if (!m_registry) {
    throw std::invalid_argument("TextDetector requires a pattern registry");
  }
}

Findings TextDetector::detect(const std::string &text) const {
  Findings findings;
  if (text.empty()) {
    return findings;
  }

  const std::string scanned = boundRuns(text, MAX_SCAN_RUN);

  for (const auto &pattern : m_registry->patterns()) {
    std::vector<std::string> matches;
    for (auto it = std::sregex_iterator(scanned.begin(), scanned.end(),
                                        pattern.matcher);
         it != std::sregex_iterator(); ++it) {
      matches.push_back((*it)[pattern.valueGroup].str());
    }
    findings.add(pattern.name, std::move(matches));
  }

  return findings;
}

const PatternRegistry &TextDetector::registry() const { return *m_registry; }

} // namespace redact
