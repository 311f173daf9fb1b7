#include "automation/DetectionWorker.h"
#include "OCRManager.h"
#include "input/IKeySynthesizer.h"
#include "settings/OCRSettingsManager.h"

#include <QDebug>

RecognitionConfig RecognitionConfig::fromSettings()
{
    const auto& settings = OCRSettingsManager::instance();

    RecognitionConfig config;
    config.language = settings.language();
    config.tessdataPath = settings.tessdataPath();
    config.upscaleFactor = settings.upscaleFactor();
    config.minConfidence = settings.minConfidence();
    return config;
}

DetectionWorker::DetectionWorker(std::unique_ptr<IKeySynthesizer> synthesizer,
                                 const SessionConfig &sessionConfig,
                                 const RecognitionConfig &recognitionConfig,
                                 QObject *parent)
    : QThread(parent)
    , m_synthesizer(std::move(synthesizer))
    , m_recognitionConfig(recognitionConfig)
{
    m_session = std::make_unique<AutomationSession>(m_synthesizer.get(), sessionConfig);
}

DetectionWorker::~DetectionWorker()
{
    requestStop();
    if (!wait(5000)) {
        qWarning() << "DetectionWorker: Force terminating after timeout";
        terminate();
        wait();
    }
}

bool DetectionWorker::submitFrame(const QImage &frame)
{
    QMutexLocker locker(&m_mutex);

    if (m_pendingFrames.size() >= MAX_PENDING_FRAMES) {
        m_droppedCount++;
        locker.unlock();
        emit frameDropped();
        return false;
    }

    m_pendingFrames.enqueue(frame);
    m_condition.wakeOne();
    return true;
}

void DetectionWorker::requestMessage(AutomationSession::MessageKind kind)
{
    QMutexLocker locker(&m_mutex);
    m_pendingMessages.enqueue(kind);
    m_condition.wakeOne();
}

int DetectionWorker::pendingFrameCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_pendingFrames.size();
}

int DetectionWorker::pendingMessageCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_pendingMessages.size();
}

void DetectionWorker::requestStop()
{
    QMutexLocker locker(&m_mutex);
    m_stopRequested = true;
    m_condition.wakeAll();
}

void DetectionWorker::run()
{
    qDebug() << "DetectionWorker: Started on thread" << QThread::currentThreadId();
    m_processing = true;

    while (!m_stopRequested) {
        QImage frame;
        bool hasMessage = false;
        AutomationSession::MessageKind message = AutomationSession::MessageKind::Continue;
        {
            QMutexLocker locker(&m_mutex);

            while (m_pendingFrames.isEmpty() && m_pendingMessages.isEmpty() && !m_stopRequested) {
                m_condition.wait(&m_mutex);
            }

            if (m_stopRequested) {
                break;
            }

            // Console requests go first, they are rarer and user-initiated.
            if (!m_pendingMessages.isEmpty()) {
                message = m_pendingMessages.dequeue();
                hasMessage = true;
            } else {
                frame = m_pendingFrames.dequeue();
            }
        }

        if (hasMessage) {
            m_session->sendMessage(message);
        } else {
            processFrame(frame);
        }
    }

    // Tesseract state belongs to this thread.
    m_ocr.reset();

    m_processing = false;
    qDebug() << "DetectionWorker: Stopped, total frames:" << m_frameCount.load()
             << "dropped:" << m_droppedCount.load();
}

bool DetectionWorker::ensureOcr()
{
    if (m_ocr && m_ocr->isInitialized()) {
        return true;
    }
    if (m_ocrFailed) {
        return false;
    }

    m_ocr = std::make_unique<OCRManager>(m_recognitionConfig.language,
                                         m_recognitionConfig.tessdataPath);
    if (!m_ocr->initialize()) {
        m_ocrFailed = true;
        const QString message = QStringLiteral("OCR unavailable: %1").arg(m_ocr->lastError());
        qWarning().noquote() << "DetectionWorker:" << message;
        emit ocrUnavailable(message);
        return false;
    }
    return true;
}

void DetectionWorker::processFrame(const QImage &frame)
{
    if (frame.isNull() || !ensureOcr()) {
        return;
    }

    const OCRResult result = m_ocr->recognize(frame,
                                              m_recognitionConfig.upscaleFactor,
                                              m_recognitionConfig.minConfidence);
    m_frameCount++;

    if (!result.success) {
        const QString message = QStringLiteral("Error reading text: %1").arg(result.error);
        qWarning().noquote() << message;
        emit processingError(message);
        return;
    }

    if (result.text.isEmpty()) {
        return;
    }

    emit textRecognized(result.text);
    m_session->handleText(result.text);
}
