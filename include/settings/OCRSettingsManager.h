#ifndef OCRSETTINGSMANAGER_H
#define OCRSETTINGSMANAGER_H

#include <QString>

/**
 * @brief Singleton manager for Tesseract OCR settings.
 *
 * Handles persistence of the recognition language, the tessdata location,
 * the upscale factor applied before recognition and the minimum mean
 * confidence a result needs to be accepted.
 */
class OCRSettingsManager
{
public:
    static OCRSettingsManager& instance();

    // Tesseract language code(s), e.g. "eng" or "eng+deu"
    QString language() const;
    void setLanguage(const QString &language);

    // Empty means the Tesseract default (TESSDATA_PREFIX or build-time path)
    QString tessdataPath() const;
    void setTessdataPath(const QString &path);

    int upscaleFactor() const;
    void setUpscaleFactor(int factor);

    // 0 disables the confidence check
    int minConfidence() const;
    void setMinConfidence(int confidence);

    // Save to QSettings
    void save();

    // Load from QSettings
    void load();

    static constexpr const char* kDefaultLanguage = "eng";
    static constexpr int kDefaultUpscaleFactor = 3;
    static constexpr int kDefaultMinConfidence = 0;

private:
    OCRSettingsManager();
    ~OCRSettingsManager() = default;
    OCRSettingsManager(const OCRSettingsManager&) = delete;
    OCRSettingsManager& operator=(const OCRSettingsManager&) = delete;

    QString m_language;
    QString m_tessdataPath;
    int m_upscaleFactor = kDefaultUpscaleFactor;
    int m_minConfidence = kDefaultMinConfidence;

    static constexpr const char* kLanguageKey = "OCR/language";
    static constexpr const char* kTessdataPathKey = "OCR/tessdataPath";
    static constexpr const char* kUpscaleFactorKey = "OCR/upscaleFactor";
    static constexpr const char* kMinConfidenceKey = "OCR/minConfidence";
};

#endif // OCRSETTINGSMANAGER_H
