#ifndef OCRTYPES_H
#define OCRTYPES_H

#include <QList>
#include <QMetaType>
#include <QRect>
#include <QString>

// A word Tesseract found, boxed in the pixels of the image it was given.
struct OCRWord {
    QString text;
    QRect box;
    float confidence = -1.0f;
};

/**
 * @brief What one recognition pass over a frame produced
 *
 * success with empty text means the frame was read and holds no words.
 * Only the pass that produced text is reported; see OCRManager::recognize().
 */
struct OCRResult {
    bool success = false;
    QString text;          // whitespace-collapsed, lower case
    QString error;
    QList<OCRWord> words;
    int confidence = -1;   // mean word confidence, 0..100
    int pageSegMode = -1;

    static OCRResult failure(const QString &message)
    {
        OCRResult result;
        result.error = message;
        return result;
    }
};

Q_DECLARE_METATYPE(OCRResult)

#endif // OCRTYPES_H
