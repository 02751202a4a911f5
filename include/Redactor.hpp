#ifndef REDACT_REDACTOR_HPP
#define REDACT_REDACTOR_HPP

#include <opencv2/core.hpp>

namespace redact {

/**
 * @brief Intersect a region with the image extent
 * @param region Requested region, possibly partly or fully outside
 * @param imageSize Image dimensions
 * @return Region inside [0, cols) x [0, rows); empty if there is no overlap
 */
cv::Rect clampRegion(const cv::Rect &region, const cv::Size &imageSize);

/**
 * @brief Gaussian-blur one region of an image in place
 *
 * Only pixels inside the (clamped) region are read or written. The kernel is
 * square and odd: an even size is rounded up to size + 1, and sizes below 1
 * are treated as 1 (no change).
 *
 * @param image Image to modify, any depth and channel count
 * @param region Region to blur; clamped to the image before use
 * @param kernelSize Kernel width and height in pixels
 */
void blur(cv::Mat &image, const cv::Rect &region, int kernelSize);

/**
 * @brief Pixelate one region of an image in place
 *
 * The region is divided into max(1, w / blockSize) x max(1, h / blockSize)
 * cells. Each cell is replaced by its mean value, which is the same as
 * downsampling to the cell grid and scaling back up with nearest-neighbour
 * interpolation. Pixelating an already pixelated region with the same block
 * size leaves it unchanged.
 *
 * @param image Image to modify, any depth and channel count
 * @param region Region to pixelate; clamped to the image before use
 * @param blockSize Nominal block edge in pixels (values below 1 act as 1)
 */
void pixelate(cv::Mat &image, const cv::Rect &region, int blockSize);

} // namespace redact

#endif // REDACT_REDACTOR_HPP
