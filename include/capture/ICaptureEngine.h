#ifndef ICAPTUREENGINE_H
#define ICAPTUREENGINE_H

#include <QObject>
#include <QRect>
#include <QImage>

class QScreen;

/**
 * @brief Source of still images of the watched region
 *
 * AutomationController pulls one image per poll tick on the UI thread.
 * There is no frame push; an engine only has to answer captureFrame().
 */
class ICaptureEngine : public QObject
{
    Q_OBJECT

public:
    explicit ICaptureEngine(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~ICaptureEngine() = default;

    // Region is in global (virtual desktop) coordinates and must lie on screen.
    virtual bool setRegion(const QRect &region, QScreen *screen) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    /**
     * @brief Grab the region once
     *
     * Returns a null image while stopped or when the grab fails. A null
     * image is a skipped tick, not an error the caller must handle.
     */
    virtual QImage captureFrame() = 0;

    virtual QString engineName() const = 0;

    QRect region() const { return m_region; }
    QScreen *screen() const { return m_screen; }

    // Caller owns the result.
    static ICaptureEngine *createBestEngine(QObject *parent = nullptr);

    // Smallest width and height OCR can do anything useful with.
    static constexpr int kMinRegionSize = 10;

signals:
    void error(const QString &message);

protected:
    QRect m_region;
    QScreen *m_screen = nullptr;
};

#endif // ICAPTUREENGINE_H
