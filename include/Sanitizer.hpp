#ifndef REDACT_SANITIZER_HPP
#define REDACT_SANITIZER_HPP

#include "OCRAdapter.hpp"
#include "PatternRegistry.hpp"
#include "TextDetector.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief How detected regions are obscured
 */
enum class RedactionMethod {
  Blur,    ///< Gaussian blur
  Pixelate ///< Mosaic blocks
};

/**
 * @brief Parse "blur" or "pixelate" (case-insensitive)
 * @param name Method name
 * @param method Receives the parsed method on success
 * @return false if the name is not recognized
 */
bool parseRedactionMethod(const std::string &name, RedactionMethod &method);

const char *toString(RedactionMethod method);

/**
 * @brief Where a sanitization run ended
 */
enum class SanitizeStatus {
  Redacted,           ///< Findings were detected; located regions redacted
  NoFindings,         ///< Scanned, nothing detected
  OCRUnavailable,     ///< No OCR engine, image not scanned
  OCRFailed,          ///< OCR error, image not scanned
  EmptyTranscription, ///< OCR produced no text, image not scanned
  InvalidImage        ///< Input image was empty or could not be decoded
};

const char *toString(SanitizeStatus status);

/**
 * @brief Configuration options for sanitization
 */
struct SanitizerConfig {
  RedactionMethod method = RedactionMethod::Blur; ///< Default method
  int padding = 5;         ///< Pixels added on every side of a located box
  int blurKernelSize = 25; ///< Gaussian kernel size for Blur
  int pixelBlockSize = 10; ///< Block size for Pixelate
  bool verbose = false;    ///< Print pipeline diagnostics to stderr
};

/**
 * @brief Result of a sanitization run
 *
 * When scanned is false the image was passed through without being read, so
 * an empty category list says nothing about its contents. Categories are
 * reported for every detection even when no region could be located for it.
 */
struct SanitizationResult {
  bool success = false;     ///< False only for unusable input
  std::string errorMessage; ///< Error or degradation message
  SanitizeStatus status = SanitizeStatus::InvalidImage;
  bool scanned = false;     ///< OCR text was obtained and scanned
  cv::Mat image;            ///< Sanitized copy (or unmodified copy)
  std::vector<std::string> categories; ///< Detected categories, registry order
  std::vector<cv::Rect> regions;       ///< Regions redacted, in order applied
  double processingTimeMs = 0;         ///< Processing time in milliseconds
};

/**
 * @brief Detects PII in an image through OCR and redacts where it appears
 *
 * One autoSanitize() call runs EXTRACT -> DETECT -> LOCALIZE -> REDACT on a
 * private copy of the input image and blocks until done. A Sanitizer has no
 * mutable state and may be shared between threads, as long as each thread
 * passes its own OCRAdapter.
 *
 * Example usage:
 * @code
 * redact::TesseractOCR ocr;
 * redact::Sanitizer sanitizer;
 * auto result = sanitizer.autoSanitize(image, ocr);
 * if (!result.scanned) {
 *     // not vetted: do not treat as safe to share
 * }
 * @endcode
 */
class Sanitizer {
public:
  /**
   * @brief Sanitizer with the built-in patterns and default configuration
   */
  Sanitizer();

  explicit Sanitizer(const SanitizerConfig &config);

  /**
   * @brief Sanitizer over a caller-supplied registry
   * @throws std::invalid_argument if registry is null
   */
  Sanitizer(std::shared_ptr<const PatternRegistry> registry,
            const SanitizerConfig &config = SanitizerConfig());

  /**
   * @brief Detect and redact PII using the configured method
   * @param image Decoded input image; never modified
   * @param ocr OCR engine used for this call
   */
  SanitizationResult autoSanitize(const cv::Mat &image, OCRAdapter &ocr) const;

  /**
   * @brief Detect and redact PII with an explicit method for this call
   */
  SanitizationResult autoSanitize(const cv::Mat &image, OCRAdapter &ocr,
                                  RedactionMethod method) const;

  /**
   * @brief Pad, clamp and redact caller-supplied boxes
   * @param image Image to modify in place
   * @param boxes Raw boxes, e.g. from locate() or a manual selection
   * @param method Redaction method
   * @return Regions actually redacted (empty ones are skipped)
   */
  std::vector<cv::Rect> redactRegions(cv::Mat &image,
                                      const std::vector<cv::Rect> &boxes,
                                      RedactionMethod method) const;

  /**
   * @brief Pad a raw box and clamp it to the image
   */
  cv::Rect toRedactionRegion(const cv::Rect &box,
                             const cv::Size &imageSize) const;

  const TextDetector &detector() const;

  const SanitizerConfig &getConfig() const;

private:
  void debug(const std::string &message) const;

  TextDetector m_detector; ///< Pattern scan over the transcription
  SanitizerConfig m_config; ///< Redaction policy
};

/**
 * @brief Audit line for a sanitization result
 *
 * "PII detected and redacted: ipv4, email" for runs with findings,
 * "No PII detected" for clean scans, and "Not scanned: <reason>" when OCR
 * did not run.
 */
std::string formatSanitizationLog(const SanitizationResult &result);

} // namespace redact

#endif // REDACT_SANITIZER_HPP
