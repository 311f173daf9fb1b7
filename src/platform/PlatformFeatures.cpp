#include "PlatformFeatures.h"
#include "OCRManager.h"
#include "input/KeySynthesizerFactory.h"
#include "settings/OCRSettingsManager.h"

#include <QDebug>
#include <QGuiApplication>
#include <QPainter>
#include <QPixmap>

PlatformFeatures& PlatformFeatures::instance()
{
    static PlatformFeatures features;
    return features;
}

PlatformFeatures::PlatformFeatures()
    : m_keySynthesisAvailable(isPlatformKeySynthesisAvailable())
{
}

bool PlatformFeatures::isOCRAvailable() const
{
    if (m_ocrProbe < 0) {
        const auto& settings = OCRSettingsManager::instance();
        OCRManager probe(settings.language(), settings.tessdataPath());
        m_ocrProbe = probe.initialize() ? 1 : 0;
        if (m_ocrProbe == 0) {
            m_ocrError = probe.lastError();
            qWarning() << "PlatformFeatures: OCR unavailable:" << m_ocrError;
        }
    }
    return m_ocrProbe == 1;
}

QStringList PlatformFeatures::unavailableFeatures() const
{
    QStringList missing;
    if (!isOCRAvailable()) {
        missing << QStringLiteral("Text recognition: %1").arg(m_ocrError);
    }
    if (!m_keySynthesisAvailable) {
        missing << QStringLiteral("Keyboard input on %1").arg(platformName());
    }
    return missing;
}

QString PlatformFeatures::platformName() const
{
    return QGuiApplication::platformName();
}

QIcon PlatformFeatures::createTrayIcon() const
{
    constexpr int kSize = 32;
    QPixmap pixmap(kSize, kSize);
    pixmap.fill(Qt::transparent);

    QPainter painter(&pixmap);
    painter.setRenderHint(QPainter::Antialiasing);

    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0x25, 0x63, 0xEB));
    painter.drawRoundedRect(QRectF(1, 1, kSize - 2, kSize - 2), 7, 7);

    // Viewfinder corners around a text bar, i.e. a watched region
    QPen bracket(Qt::white, 2.5, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    painter.setPen(bracket);
    const int lo = 7;
    const int hi = kSize - 7;
    const int arm = 6;
    painter.drawPolyline(QPolygon({QPoint(lo, lo + arm), QPoint(lo, lo), QPoint(lo + arm, lo)}));
    painter.drawPolyline(QPolygon({QPoint(hi - arm, lo), QPoint(hi, lo), QPoint(hi, lo + arm)}));
    painter.drawPolyline(QPolygon({QPoint(lo, hi - arm), QPoint(lo, hi), QPoint(lo + arm, hi)}));
    painter.drawPolyline(QPolygon({QPoint(hi - arm, hi), QPoint(hi, hi), QPoint(hi, hi - arm)}));

    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0xFB, 0xBF, 0x24));
    painter.drawRoundedRect(QRectF(11, 14, 10, 4), 2, 2);

    return QIcon(pixmap);
}
