#include "Sanitizer.hpp"

#include "Localizer.hpp"
#include "Redactor.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace redact {

bool parseRedactionMethod(const std::string &name, RedactionMethod &method) {
  const std::string lower = toLowerAscii(name);
  if (lower == "blur") {
    method = RedactionMethod::Blur;
    return true;
  }
  if (lower == "pixelate") {
    method = RedactionMethod::Pixelate;
    return true;
  }
  return false;
}

const char *toString(RedactionMethod method) {
  switch (method) {
  case RedactionMethod::Pixelate:
    return "pixelate";
  case RedactionMethod::Blur:
  default:
    return "blur";
  }
}

const char *toString(SanitizeStatus status) {
  switch (status) {
  case SanitizeStatus::Redacted:
    return "redacted";
  case SanitizeStatus::NoFindings:
    return "no findings";
  case SanitizeStatus::OCRUnavailable:
    return "OCR unavailable";
  case SanitizeStatus::OCRFailed:
    return "OCR failed";
  case SanitizeStatus::EmptyTranscription:
    return "empty transcription";
  case SanitizeStatus::InvalidImage:
  default:
    return "invalid image";
  }
}

Sanitizer::Sanitizer() : m_detector(), m_config() {}

Sanitizer::Sanitizer(const SanitizerConfig &config)
    : m_detector(), m_config(config) {}

Sanitizer::Sanitizer(std::shared_ptr<const PatternRegistry> registry,
                     const SanitizerConfig &config)
    : m_detector(std::move(registry)), m_config(config) {}

SanitizationResult Sanitizer::autoSanitize(const cv::Mat &image,
                                           OCRAdapter &ocr) const {
  return autoSanitize(image, ocr, m_config.method);
}

SanitizationResult Sanitizer::autoSanitize(const cv::Mat &image,
                                           OCRAdapter &ocr,
                                           RedactionMethod method) const {
  SanitizationResult result;

  if (image.empty()) {
    result.status = SanitizeStatus::InvalidImage;
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();
  auto elapsedMs = [&startTime]() {
    auto endTime = std::chrono::high_resolution_clock::now();
    return std::chrono::duration<double, std::milli>(endTime - startTime)
        .count();
  };

  result.success = true;
  result.image = image.clone();

  // EXTRACT
  TranscriptionResult transcription = ocr.transcribe(image);
  if (!transcription.success()) {
    result.status = transcription.status == OCRStatus::Unavailable
                        ? SanitizeStatus::OCRUnavailable
                        : SanitizeStatus::OCRFailed;
    result.errorMessage = transcription.errorMessage;
    std::cerr << "Warning: " << toString(result.status)
              << ", image passed through unscanned";
    if (!transcription.errorMessage.empty()) {
      std::cerr << ": " << transcription.errorMessage;
    }
    std::cerr << std::endl;
    result.processingTimeMs = elapsedMs();
    return result;
  }

  if (transcription.text.find_first_not_of(" \t\n\r\f\v") ==
      std::string::npos) {
    result.status = SanitizeStatus::EmptyTranscription;
    result.errorMessage = "OCR produced no text";
    debug("Transcription is empty, image passed through unscanned");
    result.processingTimeMs = elapsedMs();
    return result;
  }

  result.scanned = true;
  debug("Transcribed " + std::to_string(transcription.text.size()) +
        " bytes of text");

  // DETECT
  Findings findings = m_detector.detect(transcription.text);
  if (findings.empty()) {
    result.status = SanitizeStatus::NoFindings;
    debug("No PII patterns matched");
    result.processingTimeMs = elapsedMs();
    return result;
  }

  result.status = SanitizeStatus::Redacted;
  result.categories = findings.categories();
  if (m_config.verbose) {
    for (const auto &entry : findings.entries()) {
      debug("Category " + entry.first + ": " +
            std::to_string(entry.second.size()) + " match(es)");
    }
  }

  // LOCALIZE
  TokenizationResult tokenization = ocr.tokenize(image);
  if (!tokenization.success()) {
    // Detection stands; nothing can be placed on the image
    result.errorMessage = std::string("Localization skipped, OCR ") +
                          toString(tokenization.status);
    if (!tokenization.errorMessage.empty()) {
      result.errorMessage += ": " + tokenization.errorMessage;
    }
    std::cerr << "Warning: " << result.errorMessage << std::endl;
    result.processingTimeMs = elapsedMs();
    return result;
  }

  // A value flagged by several categories is redacted once per category
  std::vector<cv::Rect> boxes = locate(tokenization.tokens, findings.terms());
  debug("Located " + std::to_string(boxes.size()) + " box(es) among " +
        std::to_string(tokenization.tokens.size()) + " OCR token(s)");

  // REDACT
  result.regions = redactRegions(result.image, boxes, method);

  result.processingTimeMs = elapsedMs();
  return result;
}

std::vector<cv::Rect>
Sanitizer::redactRegions(cv::Mat &image, const std::vector<cv::Rect> &boxes,
                         RedactionMethod method) const {
  std::vector<cv::Rect> applied;
  if (image.empty()) {
    return applied;
  }

  for (const auto &box : boxes) {
    cv::Rect region = toRedactionRegion(box, image.size());
    if (region.empty()) {
      continue;
    }

    if (method == RedactionMethod::Pixelate) {
      pixelate(image, region, m_config.pixelBlockSize);
    } else {
      blur(image, region, m_config.blurKernelSize);
    }
    applied.push_back(region);
  }

  return applied;
}

cv::Rect Sanitizer::toRedactionRegion(const cv::Rect &box,
                                      const cv::Size &imageSize) const {
  if (box.width <= 0 || box.height <= 0) {
    return cv::Rect();
  }
  // More than the image extent pads nothing extra once clamped
  const int pad = std::min(std::max(0, m_config.padding),
                           std::max(imageSize.width, imageSize.height));
  cv::Rect padded(box.x - pad, box.y - pad, box.width + 2 * pad,
                  box.height + 2 * pad);
  return clampRegion(padded, imageSize);
}

const TextDetector &Sanitizer::detector() const { return m_detector; }

const SanitizerConfig &Sanitizer::getConfig() const { return m_config; }

void Sanitizer::debug(const std::string &message) const {
  if (m_config.verbose) {
    std::cerr << "DEBUG: " << message << std::endl;
  }
}

std::string formatSanitizationLog(const SanitizationResult &result) {
  std::ostringstream log;

  if (!result.success) {
    log << "Sanitization failed: " << result.errorMessage;
  } else if (!result.scanned) {
    log << "Not scanned: " << toString(result.status);
  } else if (result.categories.empty()) {
    log << "No PII detected";
  } else {
    log << "PII detected and redacted: ";
    for (size_t i = 0; i < result.categories.size(); ++i) {
      if (i > 0) {
        log << ", ";
      }
      log << result.categories[i];
    }
  }

  return log.str();
}

} // namespace redact
