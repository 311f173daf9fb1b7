#ifndef COMMANDWATCH_OCRPREPROCESSOR_H
#define COMMANDWATCH_OCRPREPROCESSOR_H

#include <QImage>

#include <opencv2/core.hpp>

// Image preparation between a captured QImage and Tesseract.
//
// Qt's Format_RGB32 stores pixels as 0xAARRGGBB, which on little-endian
// architectures gives byte order B-G-R-A. That matches OpenCV's CV_8UC4
// layout, so the converted buffer can be wrapped without a channel swap.

namespace OCRPreprocessor {

// Converts to grayscale and upscales by @p upscaleFactor with cubic
// interpolation. Small UI labels recognize far better at 3x.
// Returns an empty Mat for a null image.
cv::Mat prepare(const QImage& image, int upscaleFactor);

// Converts a cv::Mat to QImage. Supports CV_8UC4 (→ Format_RGB32)
// and CV_8UC1 (→ Format_Grayscale8). Returns a deep copy.
QImage toQImage(const cv::Mat& mat);

} // namespace OCRPreprocessor

#endif // COMMANDWATCH_OCRPREPROCESSOR_H
