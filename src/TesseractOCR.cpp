#include "TesseractOCR.hpp"

#include <opencv2/imgproc.hpp>
#include <tesseract/resultiterator.h>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace redact {

TesseractOCR::TesseractOCR()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false), m_initFailed(false) {}

TesseractOCR::TesseractOCR(const OCRConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false), m_initFailed(false) {}

TesseractOCR::~TesseractOCR() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

TesseractOCR::TesseractOCR(TesseractOCR &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)), m_initialized(other.m_initialized),
      m_initFailed(other.m_initFailed) {
  other.m_initialized = false;
  other.m_initFailed = false;
}

TesseractOCR &TesseractOCR::operator=(TesseractOCR &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_initialized = other.m_initialized;
    m_initFailed = other.m_initFailed;
    other.m_initialized = false;
    other.m_initFailed = false;
  }
  return *this;
}

bool TesseractOCR::initialize() {
  if (m_initialized) {
    return true;
  }
  if (!m_tesseract) {
    // Moved-from instance
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else {
      // Priority 3: Let Tesseract use its compiled-in location
      std::cerr << "TESSDATA_PREFIX not set, using Tesseract's default "
                   "tessdata location"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    m_initFailed = true;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  m_initFailed = false;
  return true;
}

bool TesseractOCR::isInitialized() const { return m_initialized; }

OCRStatus TesseractOCR::prepare(const cv::Mat &image,
                                std::string &errorMessage) {
  if (!m_initialized) {
    if (m_initFailed || !initialize()) {
      errorMessage = "Tesseract is not available for language: " +
                     m_config.language;
      return OCRStatus::Unavailable;
    }
  }

  if (image.empty()) {
    errorMessage = "Input image is empty";
    return OCRStatus::Failed;
  }

  cv::Mat gray = toGray8(image);
  m_tesseract->SetImage(gray.data, gray.cols, gray.rows, 1,
                        static_cast<int>(gray.step));
  return OCRStatus::Ok;
}

TranscriptionResult TesseractOCR::transcribe(const cv::Mat &image) {
  TranscriptionResult result;

  try {
    result.status = prepare(image, result.errorMessage);
    if (result.status != OCRStatus::Ok) {
      return result;
    }

    char *outText = m_tesseract->GetUTF8Text();
    if (outText == nullptr) {
      result.status = OCRStatus::Failed;
      result.errorMessage = "Tesseract returned no transcription";
      return result;
    }
    result.text = outText;
    delete[] outText;
  } catch (const std::exception &e) {
    result.status = OCRStatus::Failed;
    result.errorMessage = std::string("OCR transcription failed: ") + e.what();
  }

  return result;
}

TokenizationResult TesseractOCR::tokenize(const cv::Mat &image) {
  TokenizationResult result;

  try {
    result.status = prepare(image, result.errorMessage);
    if (result.status != OCRStatus::Ok) {
      return result;
    }

    // Must call Recognize before GetIterator
    if (m_tesseract->Recognize(nullptr) != 0) {
      result.status = OCRStatus::Failed;
      result.errorMessage = "Tesseract recognition failed";
      return result;
    }

    std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

    if (ri != nullptr) {
      do {
        const char *word = ri->GetUTF8Text(level);
        if (word == nullptr) {
          continue;
        }

        float conf = ri->Confidence(level);
        int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
        if (*word != '\0' && conf >= m_config.minConfidence &&
            ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
          OCRToken token;
          token.text = word;
          token.confidence = conf;
          token.box = cv::Rect(x1, y1, x2 - x1, y2 - y1);

          result.tokens.push_back(token);
        }

        delete[] word;
      } while (ri->Next(level));
    }
  } catch (const std::exception &e) {
    result.status = OCRStatus::Failed;
    result.errorMessage = std::string("OCR tokenization failed: ") + e.what();
    result.tokens.clear();
  }

  return result;
}

const OCRConfig &TesseractOCR::getConfig() const { return m_config; }

void TesseractOCR::setConfig(const OCRConfig &config) {
  m_config = config;
  if (m_initialized && m_tesseract) {
    m_tesseract->End();
  }
  m_initialized = false;
  m_initFailed = false;
}

std::string TesseractOCR::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractOCR::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

cv::Mat TesseractOCR::toGray8(const cv::Mat &image) {
  if (image.empty()) {
    return cv::Mat();
  }

  // cvtColor only handles 8U, 16U and 32F
  cv::Mat working = image;
  const bool integerSource = image.depth() != CV_32F &&
                             image.depth() != CV_64F;
  if (image.depth() != CV_8U && image.depth() != CV_16U &&
      image.depth() != CV_32F) {
    image.convertTo(working, CV_32F);
  }

  cv::Mat gray;
  if (working.channels() == 3) {
    cv::cvtColor(working, gray, cv::COLOR_BGR2GRAY);
  } else if (working.channels() == 4) {
    cv::cvtColor(working, gray, cv::COLOR_BGRA2GRAY);
  } else if (working.channels() == 1) {
    gray = working;
  } else {
    cv::extractChannel(working, gray, 0);
  }

  cv::Mat gray8;
  switch (gray.depth()) {
  case CV_8U:
    gray8 = gray.clone();
    break;
  case CV_16U:
    gray.convertTo(gray8, CV_8U, 1.0 / 257.0);
    break;
  default:
    if (integerSource) {
      // Signed integer data has no fixed white point; stretch its range
      cv::normalize(gray, gray8, 0, 255, cv::NORM_MINMAX, CV_8U);
    } else {
      // Floating point images are expected in [0, 1]
      gray.convertTo(gray8, CV_8U, 255.0);
    }
    break;
  }

  return gray8;
}

} // namespace redact
