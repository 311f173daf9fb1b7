#include "capture/QtCaptureEngine.h"

#include <QScreen>
#include <QPixmap>
#include <QDebug>

QtCaptureEngine::QtCaptureEngine(QObject *parent)
    : ICaptureEngine(parent)
{
}

QtCaptureEngine::~QtCaptureEngine()
{
    stop();
}

bool QtCaptureEngine::setRegion(const QRect &region, QScreen *screen)
{
    if (!screen) {
        emit error(tr("No screen for the watch region"));
        return false;
    }

    m_region = region.normalized();
    m_screen = screen;
    // grabWindow() wants coordinates relative to the screen it is called on
    m_screenLocalRect = m_region.translated(-screen->geometry().topLeft());

    qDebug() << "QtCaptureEngine: Region" << m_region << "on" << screen->name();
    return true;
}

QString QtCaptureEngine::validationError() const
{
    if (!m_screen) {
        return tr("No watch region has been set");
    }
    if (m_region.width() < kMinRegionSize || m_region.height() < kMinRegionSize) {
        return tr("Watch region must be at least %1x%1 pixels").arg(kMinRegionSize);
    }
    if (!m_screen->geometry().intersects(m_region)) {
        return tr("Watch region is outside screen %1").arg(m_screen->name());
    }
    return QString();
}

bool QtCaptureEngine::start()
{
    const QString problem = validationError();
    if (!problem.isEmpty()) {
        qWarning() << "QtCaptureEngine:" << problem;
        emit error(problem);
        return false;
    }

    m_running = true;
    return true;
}

void QtCaptureEngine::stop()
{
    m_running = false;
}

QImage QtCaptureEngine::captureFrame()
{
    if (!m_running || !m_screen) {
        return QImage();
    }

    const QPixmap grab = m_screen->grabWindow(0,
                                              m_screenLocalRect.x(),
                                              m_screenLocalRect.y(),
                                              m_screenLocalRect.width(),
                                              m_screenLocalRect.height());
    if (grab.isNull()) {
        qWarning() << "QtCaptureEngine: Grab returned nothing for" << m_region;
        return QImage();
    }
    return grab.toImage();
}
