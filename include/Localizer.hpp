#ifndef REDACT_LOCALIZER_HPP
#define REDACT_LOCALIZER_HPP

#include "OCRAdapter.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Find the boxes of OCR tokens that contain any of the given terms
 *
 * For every token in reading order and every non-empty term, a token whose
 * text contains the term (ASCII case-insensitive) emits its box. A token
 * hit by several terms emits its box once per term.
 *
 * A term is only found when it lies entirely inside one token. Values the
 * engine split over several words (spaced card numbers, IPs read as separate
 * fragments) are not localized.
 *
 * @param tokens OCR tokens in reading order
 * @param terms Matched values to look for
 * @return Raw token boxes (not padded, not clamped) in token order
 */
std::vector<cv::Rect> locate(const std::vector<OCRToken> &tokens,
                             const std::vector<std::string> &terms);

/**
 * @brief Lower-case ASCII letters, leave every other byte untouched
 */
std::string toLowerAscii(const std::string &text);

} // namespace redact

#endif // REDACT_LOCALIZER_HPP
