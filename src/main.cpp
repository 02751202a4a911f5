#include "Sanitizer.hpp"
#include "TesseractOCR.hpp"

#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

// Exit code when the image could not be scanned and was written unredacted
const int EXIT_NOT_SCANNED = 3;

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <image_path> [options]\n"
      << "\nOptions:\n"
      << "  -o, --output <path>     Output image (default: <name>_redacted.<ext>)\n"
      << "  -m, --method <name>     Redaction method: blur or pixelate "
         "(default: blur)\n"
      << "  -p, --padding <px>      Padding around each located word "
         "(default: 5)\n"
      << "  -k, --kernel <px>       Blur kernel size (default: 25)\n"
      << "  -b, --block <px>        Pixelation block size (default: 10)\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -c, --confidence <val>  Minimum OCR word confidence (0-100)\n"
      << "  -r, --regions           Show redacted regions\n"
      << "  -v, --verbose           Print pipeline diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExit status: 0 scanned, 1 error, 3 image could not be scanned\n"
      << "\nExamples:\n"
      << "  " << programName << " screenshot.png\n"
      << "  " << programName << " screenshot.png -m pixelate -b 12 -r\n"
      << "  " << programName << " screenshot.png -o shared.png -p 8\n";
}

bool parseInt(const std::string &text, int &value) {
  try {
    size_t used = 0;
    value = std::stoi(text, &used);
    return used == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

std::string defaultOutputPath(const std::string &imagePath) {
  std::filesystem::path input(imagePath);
  std::filesystem::path output = input.parent_path() /
                                 (input.stem().string() + "_redacted" +
                                  input.extension().string());
  return output.string();
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string imagePath;
  std::string outputPath;
  redact::OCRConfig ocrConfig;
  redact::SanitizerConfig config;
  bool showRegions = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto takeValue = [&](std::string &value) {
      if (i + 1 < argc) {
        value = argv[++i];
        return true;
      }
      std::cerr << "Error: " << arg << " requires an argument\n";
      return false;
    };
    auto takeInt = [&](int &value) {
      std::string text;
      if (!takeValue(text)) {
        return false;
      }
      if (!parseInt(text, value)) {
        std::cerr << "Error: " << arg << " expects a number, got '" << text
                  << "'\n";
        return false;
      }
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-o" || arg == "--output") {
      if (!takeValue(outputPath)) {
        return 1;
      }
    } else if (arg == "-m" || arg == "--method") {
      std::string method;
      if (!takeValue(method)) {
        return 1;
      }
      if (!redact::parseRedactionMethod(method, config.method)) {
        std::cerr << "Error: unknown method '" << method
                  << "' (expected blur or pixelate)\n";
        return 1;
      }
    } else if (arg == "-p" || arg == "--padding") {
      if (!takeInt(config.padding)) {
        return 1;
      }
    } else if (arg == "-k" || arg == "--kernel") {
      if (!takeInt(config.blurKernelSize)) {
        return 1;
      }
    } else if (arg == "-b" || arg == "--block") {
      if (!takeInt(config.pixelBlockSize)) {
        return 1;
      }
    } else if (arg == "-l" || arg == "--language") {
      if (!takeValue(ocrConfig.language)) {
        return 1;
      }
    } else if (arg == "-c" || arg == "--confidence") {
      if (!takeInt(ocrConfig.minConfidence)) {
        return 1;
      }
    } else if (arg == "-r" || arg == "--regions") {
      showRegions = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      imagePath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (imagePath.empty()) {
    std::cerr << "Error: No image path provided\n";
    printUsage(argv[0]);
    return 1;
  }
  if (outputPath.empty()) {
    outputPath = defaultOutputPath(imagePath);
  }

  // Display version info
  std::cout << "=== ScreenRedact ===\n"
            << "Tesseract version: "
            << redact::TesseractOCR::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << ocrConfig.language << "\n"
            << "Method: " << redact::toString(config.method) << "\n"
            << "====================\n\n";

  // Keep bit depth and alpha as decoded
  cv::Mat image = cv::imread(imagePath, cv::IMREAD_UNCHANGED);
  if (image.empty()) {
    std::cerr << "Failed to load image: " << imagePath << "\n";
    return 1;
  }

  std::cout << "Sanitizing image: " << imagePath << " (" << image.cols << "x"
            << image.rows << ")\n";
  std::cout << "-------------------------------------------\n";

  redact::TesseractOCR ocr(ocrConfig);
  redact::Sanitizer sanitizer(config);

  auto result = sanitizer.autoSanitize(image, ocr);

  if (!result.success) {
    std::cerr << "Sanitization failed: " << result.errorMessage << "\n";
    return 1;
  }

  std::cout << redact::formatSanitizationLog(result) << "\n";
  if (!result.scanned) {
    std::cout << "WARNING: the image was NOT scanned for PII ("
              << result.errorMessage << ")\n";
  } else if (!result.categories.empty() && result.regions.empty()) {
    std::cout << "WARNING: PII was detected but could not be located in the "
                 "image; nothing was redacted\n";
  }

  if (showRegions && !result.regions.empty()) {
    std::cout << "\n[Redacted Regions]\n";
    std::cout << std::setw(6) << "No." << std::setw(30) << "Region" << "\n";
    std::cout << std::string(40, '-') << "\n";

    for (size_t i = 0; i < result.regions.size(); ++i) {
      const auto &region = result.regions[i];
      std::ostringstream bbox;
      bbox << "(" << region.x << "," << region.y << "," << region.width << ","
           << region.height << ")";
      std::cout << std::setw(6) << (i + 1) << std::setw(30) << bbox.str()
                << "\n";
    }
  }

  try {
    if (!cv::imwrite(outputPath, result.image)) {
      std::cerr << "Failed to write image: " << outputPath << "\n";
      return 1;
    }
  } catch (const cv::Exception &e) {
    std::cerr << "Failed to write image: " << outputPath << ": " << e.what()
              << "\n";
    return 1;
  }

  std::cout << "\nOutput written to: " << outputPath << "\n";
  std::cout << "Processing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";
  std::cout << "Regions redacted: " << result.regions.size() << "\n";

  return result.scanned ? 0 : EXIT_NOT_SCANNED;
}
