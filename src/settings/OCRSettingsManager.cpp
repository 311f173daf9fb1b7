#include "settings/OCRSettingsManager.h"
#include "settings/Settings.h"
#include <QDebug>
#include <QtGlobal>

OCRSettingsManager& OCRSettingsManager::instance()
{
    static OCRSettingsManager instance;
    return instance;
}

OCRSettingsManager::OCRSettingsManager()
    : m_language(QString::fromLatin1(kDefaultLanguage))
{
    load();
}

QString OCRSettingsManager::language() const
{
    return m_language;
}

void OCRSettingsManager::setLanguage(const QString &language)
{
    const QString trimmed = language.trimmed();
    m_language = trimmed.isEmpty() ? QString::fromLatin1(kDefaultLanguage) : trimmed;
}

QString OCRSettingsManager::tessdataPath() const
{
    return m_tessdataPath;
}

void OCRSettingsManager::setTessdataPath(const QString &path)
{
    m_tessdataPath = path.trimmed();
}

int OCRSettingsManager::upscaleFactor() const
{
    return m_upscaleFactor;
}

void OCRSettingsManager::setUpscaleFactor(int factor)
{
    m_upscaleFactor = qBound(1, factor, 6);
}

int OCRSettingsManager::minConfidence() const
{
    return m_minConfidence;
}

void OCRSettingsManager::setMinConfidence(int confidence)
{
    m_minConfidence = qBound(0, confidence, 100);
}

void OCRSettingsManager::save()
{
    auto settings = CommandWatch::getSettings();
    settings.setValue(kLanguageKey, m_language);
    settings.setValue(kTessdataPathKey, m_tessdataPath);
    settings.setValue(kUpscaleFactorKey, m_upscaleFactor);
    settings.setValue(kMinConfidenceKey, m_minConfidence);
    qDebug() << "OCRSettingsManager: Saved language:" << m_language
             << "upscale:" << m_upscaleFactor << "minConfidence:" << m_minConfidence;
}

void OCRSettingsManager::load()
{
    auto settings = CommandWatch::getSettings();
    setLanguage(settings.value(kLanguageKey, QString::fromLatin1(kDefaultLanguage)).toString());
    setTessdataPath(settings.value(kTessdataPathKey).toString());
    setUpscaleFactor(settings.value(kUpscaleFactorKey, kDefaultUpscaleFactor).toInt());
    setMinConfidence(settings.value(kMinConfidenceKey, kDefaultMinConfidence).toInt());

    qDebug() << "OCRSettingsManager: Loaded language:" << m_language;
}
