#include "MockCaptureEngine.h"

bool MockCaptureEngine::setRegion(const QRect &region, QScreen *screen)
{
    ++m_calls.region;
    m_region = region;
    m_screen = screen;

    if (m_failRegion) {
        emit error(QStringLiteral("scripted region failure"));
    }
    return !m_failRegion;
}

bool MockCaptureEngine::start()
{
    ++m_calls.start;
    if (m_failStart) {
        emit error(QStringLiteral("scripted start failure"));
        return false;
    }
    m_running = true;
    return true;
}

void MockCaptureEngine::stop()
{
    ++m_calls.stop;
    m_running = false;
}

QImage MockCaptureEngine::captureFrame()
{
    ++m_calls.capture;
    if (!m_running || m_script.isEmpty()) {
        return QImage();
    }
    const QImage frame = m_script.at(m_cursor);
    m_cursor = (m_cursor + 1) % m_script.size();
    return frame;
}

void MockCaptureEngine::setFrameSequence(const QList<QImage> &frames)
{
    m_script = frames;
    m_cursor = 0;
}

void MockCaptureEngine::resetCounters()
{
    m_calls = Calls();
    m_cursor = 0;
}
