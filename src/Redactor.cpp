#include "Redactor.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace redact {

namespace {

// First pixel of grid cell i when len pixels are split into n cells. Matches
// the nearest-neighbour mapping src = floor(dst * n / len).
int cellStart(int i, int len, int n) {
  return static_cast<int>((static_cast<long long>(i) * len + n - 1) / n);
}

} // anonymous namespace

cv::Rect clampRegion(const cv::Rect &region, const cv::Size &imageSize) {
  if (region.width <= 0 || region.height <= 0) {
    return cv::Rect();
  }
  cv::Rect clamped = region & cv::Rect(0, 0, imageSize.width, imageSize.height);
  if (clamped.empty()) {
    return cv::Rect();
  }
  return clamped;
}

void blur(cv::Mat &image, const cv::Rect &region, int kernelSize) {
  if (image.empty()) {
    return;
  }

  cv::Rect validRegion = clampRegion(region, image.size());
  if (validRegion.empty()) {
    return;
  }

  int k = std::max(1, kernelSize);
  if (k % 2 == 0) {
    k += 1;
  }
  if (k == 1) {
    return;
  }

  // Filter a detached copy so no pixel outside the region is sampled
  cv::Mat patch = image(validRegion).clone();
  const cv::Size kernel(k, k);
  const int depth = image.depth();
  if (depth == CV_8S || depth == CV_32S) {
    // No Gaussian filter for these depths; go through double
    cv::Mat widened;
    patch.convertTo(widened, CV_64F);
    cv::GaussianBlur(widened, widened, kernel, 0, 0, cv::BORDER_REFLECT_101);
    widened.convertTo(patch, image.type());
  } else {
    cv::GaussianBlur(patch, patch, kernel, 0, 0, cv::BORDER_REFLECT_101);
  }

  patch.copyTo(image(validRegion));
}

void pixelate(cv::Mat &image, const cv::Rect &region, int blockSize) {
  if (image.empty()) {
    return;
  }

  cv::Rect validRegion = clampRegion(region, image.size());
  if (validRegion.empty()) {
    return;
  }

  const int block = std::max(1, blockSize);
  const int gridCols = std::max(1, validRegion.width / block);
  const int gridRows = std::max(1, validRegion.height / block);

  cv::Mat roi = image(validRegion);

  // Downsample: one averaged sample per grid cell
  for (int gy = 0; gy < gridRows; ++gy) {
    const int y0 = cellStart(gy, validRegion.height, gridRows);
    const int y1 = cellStart(gy + 1, validRegion.height, gridRows);
    for (int gx = 0; gx < gridCols; ++gx) {
      const int x0 = cellStart(gx, validRegion.width, gridCols);
      const int x1 = cellStart(gx + 1, validRegion.width, gridCols);

      cv::Mat cell = roi(cv::Range(y0, y1), cv::Range(x0, x1));
      // Upsample: nearest-neighbour replication of the sample over the cell
      cell.setTo(cv::mean(cell));
    }
  }
}

} // namespace redact
