#ifndef REDACT_OCR_ADAPTER_HPP
#define REDACT_OCR_ADAPTER_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace redact {

/**
 * @brief Outcome of an OCR request
 */
enum class OCRStatus {
  Ok,          ///< Recognition ran
  Unavailable, ///< No engine (not installed, no language data)
  Failed       ///< Engine present but recognition failed
};

/**
 * @brief A single recognized word with its position in the image
 */
struct OCRToken {
  std::string text;        ///< Word as segmented by the engine
  cv::Rect box;            ///< Bounding box, top-left origin
  float confidence = 0.0f; ///< Confidence score (0-100)
};

/**
 * @brief Result of a full-image transcription
 */
struct TranscriptionResult {
  OCRStatus status = OCRStatus::Failed;
  std::string text;         ///< Recognized text, lines separated by '\n'
  std::string errorMessage; ///< Error message if status is not Ok

  bool success() const { return status == OCRStatus::Ok; }
};

/**
 * @brief Result of word-level recognition
 */
struct TokenizationResult {
  OCRStatus status = OCRStatus::Failed;
  std::vector<OCRToken> tokens; ///< Words in reading order
  std::string errorMessage;     ///< Error message if status is not Ok

  bool success() const { return status == OCRStatus::Ok; }
};

/**
 * @brief Boundary between the redaction pipeline and an OCR engine
 *
 * Implementations are free to hold engine state; the pipeline uses one
 * adapter per call and never shares it between threads.
 */
class OCRAdapter {
public:
  virtual ~OCRAdapter() = default;

  /**
   * @brief Transcribe the whole image
   * @param image Decoded image of any depth and channel count
   */
  virtual TranscriptionResult transcribe(const cv::Mat &image) = 0;

  /**
   * @brief Recognize individual words with their geometry
   * @param image Decoded image of any depth and channel count
   */
  virtual TokenizationResult tokenize(const cv::Mat &image) = 0;
};

const char *toString(OCRStatus status);

} // namespace redact

#endif // REDACT_OCR_ADAPTER_HPP
