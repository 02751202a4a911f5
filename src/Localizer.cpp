#include "Localizer.hpp"

#include <algorithm>

namespace redact {

std::string toLowerAscii(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  });
  return lower;
}

std::vector<cv::Rect> locate(const std::vector<OCRToken> &tokens,
                             const std::vector<std::string> &terms) {
  std::vector<cv::Rect> boxes;

  std::vector<std::string> loweredTerms;
  loweredTerms.reserve(terms.size());
  for (const auto &term : terms) {
    if (!term.empty()) {
      loweredTerms.push_back(toLowerAscii(term));
    }
  }
  if (loweredTerms.empty()) {
    return boxes;
  }

  for (const auto &token : tokens) {
    if (token.text.empty()) {
      continue;
    }
    const std::string word = toLowerAscii(token.text);
    for (const auto &term : loweredTerms) {
      if (word.find(term) != std::string::npos) {
        boxes.push_back(token.box);
      }
    }
  }

  return boxes;
}

} // namespace redact
