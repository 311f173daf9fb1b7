#ifndef DETECTIONWORKER_H
#define DETECTIONWORKER_H

#include "automation/AutomationSession.h"

#include <QImage>
#include <QMutex>
#include <QQueue>
#include <QThread>
#include <QWaitCondition>
#include <atomic>
#include <memory>

class IKeySynthesizer;
class OCRManager;

struct RecognitionConfig {
    QString language;
    QString tessdataPath;
    int upscaleFactor = 3;
    int minConfidence = 0;

    static RecognitionConfig fromSettings();
};

/**
 * @brief Worker thread that turns captured frames into key presses
 *
 * The UI thread grabs a frame on every poll tick and hands it over with
 * submitFrame(). This thread runs OCR and the automation session, which may
 * block for seconds while keys are typed, so frames arriving meanwhile are
 * dropped instead of queued. Message requests from console commands are
 * queued and run between frames.
 */
class DetectionWorker : public QThread
{
    Q_OBJECT

public:
    DetectionWorker(std::unique_ptr<IKeySynthesizer> synthesizer,
                    const SessionConfig &sessionConfig,
                    const RecognitionConfig &recognitionConfig,
                    QObject *parent = nullptr);
    ~DetectionWorker() override;

    /**
     * @brief Session driven by this worker. Connect to its signals before
     * start(); call nothing else on it while the thread runs.
     */
    AutomationSession *session() const { return m_session.get(); }

    /**
     * @brief Hand a frame to the worker (non-blocking, called from main thread)
     * @return false if a frame is still pending and this one was dropped
     */
    bool submitFrame(const QImage &frame);

    /**
     * @brief Queue a chat message to be typed by the worker thread
     */
    void requestMessage(AutomationSession::MessageKind kind);

    int pendingFrameCount() const;
    int pendingMessageCount() const;

    void requestStop();

    bool isProcessing() const { return m_processing.load(); }
    qint64 frameCount() const { return m_frameCount.load(); }
    qint64 droppedCount() const { return m_droppedCount.load(); }

    static constexpr int MAX_PENDING_FRAMES = 1;

signals:
    void textRecognized(const QString &text);
    void frameDropped();
    void processingError(const QString &message);

    /**
     * @brief Emitted once when Tesseract cannot be initialized
     */
    void ocrUnavailable(const QString &message);

protected:
    void run() override;

private:
    bool ensureOcr();
    void processFrame(const QImage &frame);

    std::unique_ptr<IKeySynthesizer> m_synthesizer;
    std::unique_ptr<AutomationSession> m_session;
    std::unique_ptr<OCRManager> m_ocr;
    RecognitionConfig m_recognitionConfig;
    bool m_ocrFailed = false;

    mutable QMutex m_mutex;
    QWaitCondition m_condition;
    QQueue<QImage> m_pendingFrames;
    QQueue<AutomationSession::MessageKind> m_pendingMessages;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_processing{false};
    std::atomic<qint64> m_frameCount{0};
    std::atomic<qint64> m_droppedCount{0};
};

#endif // DETECTIONWORKER_H
