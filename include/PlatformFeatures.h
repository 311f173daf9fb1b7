#ifndef PLATFORMFEATURES_H
#define PLATFORMFEATURES_H

#include <QIcon>
#include <QStringList>

/**
 * @brief What this session can actually do on the running platform
 *
 * Probes are run once and cached. OCR is probed by loading the configured
 * language, which is slow enough that it only happens on first request.
 */
class PlatformFeatures
{
public:
    static PlatformFeatures& instance();

    bool isOCRAvailable() const;
    bool isKeySynthesisAvailable() const { return m_keySynthesisAvailable; }

    // One line per missing capability, empty when everything works.
    QStringList unavailableFeatures() const;

    QString platformName() const;
    QIcon createTrayIcon() const;

private:
    PlatformFeatures();

    PlatformFeatures(const PlatformFeatures&) = delete;
    PlatformFeatures& operator=(const PlatformFeatures&) = delete;

    mutable int m_ocrProbe = -1;  // -1 not probed, 0 failed, 1 loaded
    mutable QString m_ocrError;
    bool m_keySynthesisAvailable;
};

#endif // PLATFORMFEATURES_H
