#include "ocr/OCRPreprocessor.h"

#include <QDebug>
#include <QtGlobal>

#include <opencv2/imgproc.hpp>

namespace OCRPreprocessor {

cv::Mat prepare(const QImage& image, int upscaleFactor)
{
    if (image.isNull()) {
        qWarning() << "OCRPreprocessor::prepare: received null QImage";
        return {};
    }

    QImage rgb = image.convertToFormat(QImage::Format_RGB32);
    cv::Mat bgra(rgb.height(), rgb.width(), CV_8UC4,
                 const_cast<uchar*>(rgb.bits()),
                 static_cast<size_t>(rgb.bytesPerLine()));

    cv::Mat gray;
    cv::cvtColor(bgra, gray, cv::COLOR_BGRA2GRAY);

    const int factor = qBound(1, upscaleFactor, 6);
    if (factor == 1) {
        return gray;
    }

    cv::Mat scaled;
    cv::resize(gray, scaled, cv::Size(), factor, factor, cv::INTER_CUBIC);
    return scaled;
}

QImage toQImage(const cv::Mat& mat)
{
    if (mat.type() == CV_8UC4) {
        return QImage(mat.data, mat.cols, mat.rows,
                      static_cast<int>(mat.step),
                      QImage::Format_RGB32).copy();
    }
    if (mat.type() == CV_8UC1) {
        return QImage(mat.data, mat.cols, mat.rows,
                      static_cast<int>(mat.step),
                      QImage::Format_Grayscale8).copy();
    }
    qWarning() << "OCRPreprocessor::toQImage: unsupported Mat type" << mat.type();
    return {};
}

} // namespace OCRPreprocessor
