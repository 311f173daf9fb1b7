#ifndef QTCAPTUREENGINE_H
#define QTCAPTUREENGINE_H

#include "ICaptureEngine.h"

/**
 * @brief Grabs the region from the screen's root window with QScreen
 *
 * Needs no extra permissions on X11. The grab comes back at device pixel
 * resolution, so HiDPI screens give OCR the sharper image.
 */
class QtCaptureEngine : public ICaptureEngine
{
    Q_OBJECT

public:
    explicit QtCaptureEngine(QObject *parent = nullptr);
    ~QtCaptureEngine() override;

    bool setRegion(const QRect &region, QScreen *screen) override;
    bool start() override;
    void stop() override;
    bool isRunning() const override { return m_running; }
    QImage captureFrame() override;
    QString engineName() const override { return QStringLiteral("Qt screen grab"); }

private:
    // Reason the current configuration can't be captured, empty when it can.
    QString validationError() const;

    QRect m_screenLocalRect;
    bool m_running = false;
};

#endif // QTCAPTUREENGINE_H
