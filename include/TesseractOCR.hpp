#ifndef REDACT_TESSERACT_OCR_HPP
#define REDACT_TESSERACT_OCR_HPP

#include "OCRAdapter.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace redact {

/**
 * @brief Configuration options for OCR processing
 */
struct OCRConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu", "fra")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO; ///< Page segmentation mode
  int minConfidence = 0;   ///< Words below this confidence are dropped (0-100)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX or default)
};

/**
 * @brief OCR adapter backed by Tesseract, with OpenCV preprocessing
 *
 * The engine is initialized lazily on the first request. If initialization
 * fails every request reports OCRStatus::Unavailable. Images are converted
 * to 8-bit grayscale before recognition, so word boxes are in the input
 * image's pixel coordinates.
 *
 * Example usage:
 * @code
 * redact::TesseractOCR ocr;
 * auto text = ocr.transcribe(image);
 * if (text.success()) {
 *     std::cout << text.text << std::endl;
 * }
 * @endcode
 */
class TesseractOCR : public OCRAdapter {
public:
  TesseractOCR();

  explicit TesseractOCR(const OCRConfig &config);

  ~TesseractOCR() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractOCR(const TesseractOCR &) = delete;
  TesseractOCR &operator=(const TesseractOCR &) = delete;

  // Enable move operations
  TesseractOCR(TesseractOCR &&other) noexcept;
  TesseractOCR &operator=(TesseractOCR &&other) noexcept;

  /**
   * @brief Initialize the OCR engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize();

  bool isInitialized() const;

  TranscriptionResult transcribe(const cv::Mat &image) override;

  TokenizationResult tokenize(const cv::Mat &image) override;

  const OCRConfig &getConfig() const;

  /**
   * @brief Set a new configuration (the engine re-initializes on next use)
   */
  void setConfig(const OCRConfig &config);

  static std::string getTesseractVersion();

  /**
   * @brief Get available languages
   * @return Language codes, empty if the engine is not initialized
   */
  std::vector<std::string> getAvailableLanguages() const;

  /**
   * @brief Convert an image of any depth and channel count to 8-bit gray
   */
  static cv::Mat toGray8(const cv::Mat &image);

private:
  /**
   * @brief Initialize on demand and hand the image to Tesseract
   * @return Ok, or the status to report without recognizing
   */
  OCRStatus prepare(const cv::Mat &image, std::string &errorMessage);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;    ///< Tesseract API instance
  OCRConfig m_config; ///< Current configuration
  bool m_initialized; ///< Initialization state
  bool m_initFailed;  ///< Initialization was attempted and failed
};

} // namespace redact

#endif // REDACT_TESSERACT_OCR_HPP
