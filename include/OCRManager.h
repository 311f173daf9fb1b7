#ifndef OCRMANAGER_H
#define OCRMANAGER_H

#include "detection/OCRTypes.h"

#include <QImage>
#include <QList>
#include <QString>
#include <memory>

namespace tesseract {
class TessBaseAPI;
}

/**
 * @brief Tesseract-backed text recognition for captured frames.
 *
 * Recognition is synchronous and not thread-safe; each instance is owned
 * and used by a single thread (the detection worker).
 */
class OCRManager
{
public:
    OCRManager(const QString &language, const QString &tessdataPath);
    ~OCRManager();

    OCRManager(const OCRManager&) = delete;
    OCRManager& operator=(const OCRManager&) = delete;

    /**
     * @brief Load the language model. Safe to call again after a failure.
     * @return false on failure, see lastError()
     */
    bool initialize();
    bool isInitialized() const { return m_initialized; }
    QString lastError() const { return m_lastError; }

    /**
     * @brief Recognize text in @p image.
     *
     * Tries each page segmentation mode in order (single line, uniform
     * block, fully automatic) and returns the first non-empty result,
     * whitespace-collapsed and lower-cased. A result whose mean confidence
     * falls below @p minConfidence is reported as success with empty text.
     */
    OCRResult recognize(const QImage &image, int upscaleFactor, int minConfidence = 0);

    QString language() const { return m_language; }

    // Default pass order: single line, uniform block, fully automatic.
    static QList<int> pageSegModes();
    // Overrides the pass order; an empty list restores the default.
    void setPageSegModes(const QList<int> &modes);
    static QString tesseractVersion();

private:
    OCRResult recognizeWithMode(int pageSegMode);

    std::unique_ptr<tesseract::TessBaseAPI> m_api;
    QString m_language;
    QString m_tessdataPath;
    QList<int> m_pageSegModes;
    QString m_lastError;
    bool m_initialized = false;
};

#endif // OCRMANAGER_H
