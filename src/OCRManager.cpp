#include "OCRManager.h"
#include "ocr/OCRPreprocessor.h"

#include <QDebug>

#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>

#include <opencv2/core.hpp>

namespace {

struct TextDeleter {
    void operator()(char *text) const { delete[] text; }
};
using TessText = std::unique_ptr<char, TextDeleter>;

} // namespace

OCRManager::OCRManager(const QString &language, const QString &tessdataPath)
    : m_api(std::make_unique<tesseract::TessBaseAPI>())
    , m_language(language)
    , m_tessdataPath(tessdataPath)
    , m_pageSegModes(pageSegModes())
{
}

OCRManager::~OCRManager()
{
    if (m_api) {
        m_api->End();
    }
}

bool OCRManager::initialize()
{
    if (m_initialized) {
        return true;
    }

    const QByteArray language = m_language.toUtf8();
    const QByteArray dataPath = m_tessdataPath.toLocal8Bit();
    const char *dataPathArg = m_tessdataPath.isEmpty() ? nullptr : dataPath.constData();

    if (m_api->Init(dataPathArg, language.constData(), tesseract::OEM_DEFAULT) != 0) {
        m_lastError = QStringLiteral("Tesseract could not load language '%1'%2")
            .arg(m_language,
                 m_tessdataPath.isEmpty() ? QString()
                                          : QStringLiteral(" from %1").arg(m_tessdataPath));
        qCritical() << "OCRManager:" << m_lastError;
        return false;
    }

    // Captures carry no DPI metadata; without this Tesseract warns on every frame
    m_api->SetVariable("user_defined_dpi", "300");
    m_api->SetVariable("debug_file", "/dev/null");

    m_initialized = true;
    m_lastError.clear();
    qDebug() << "OCRManager: Tesseract" << tesseractVersion() << "initialized with" << m_language;
    return true;
}

OCRResult OCRManager::recognize(const QImage &image, int upscaleFactor, int minConfidence)
{
    if (!m_initialized) {
        return OCRResult::failure(m_lastError.isEmpty() ? QStringLiteral("OCR not initialized")
                                                        : m_lastError);
    }

    cv::Mat prepared = OCRPreprocessor::prepare(image, upscaleFactor);
    if (prepared.empty()) {
        return OCRResult::failure(QStringLiteral("Empty frame"));
    }

    OCRResult result;
    result.success = true;
    for (int mode : m_pageSegModes) {
        // SetImage drops the previous pass's recognition; without it
        // GetUTF8Text returns the cached text of the first mode.
        m_api->SetImage(prepared.data, prepared.cols, prepared.rows,
                        prepared.channels(), static_cast<int>(prepared.step));
        OCRResult pass = recognizeWithMode(mode);
        if (!pass.success) {
            result = pass;
            break;
        }
        if (!pass.text.isEmpty()) {
            result = pass;
            break;
        }
    }
    m_api->Clear();

    if (result.success && minConfidence > 0 && !result.text.isEmpty()
        && result.confidence < minConfidence) {
        qDebug() << "OCRManager: Dropped" << result.text << "with confidence" << result.confidence;
        result.text.clear();
        result.words.clear();
    }
    return result;
}

OCRResult OCRManager::recognizeWithMode(int pageSegMode)
{
    m_api->SetPageSegMode(static_cast<tesseract::PageSegMode>(pageSegMode));

    TessText text(m_api->GetUTF8Text());
    if (!text) {
        return OCRResult::failure(QStringLiteral("Tesseract returned no result"));
    }

    OCRResult result;
    result.success = true;
    result.pageSegMode = pageSegMode;
    result.text = QString::fromUtf8(text.get()).simplified().toLower();
    if (result.text.isEmpty()) {
        return result;
    }

    result.confidence = m_api->MeanTextConf();

    std::unique_ptr<tesseract::ResultIterator> it(m_api->GetIterator());
    if (it) {
        const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
        do {
            TessText word(it->GetUTF8Text(level));
            if (!word) {
                continue;
            }
            int left = 0;
            int top = 0;
            int right = 0;
            int bottom = 0;
            if (!it->BoundingBox(level, &left, &top, &right, &bottom)) {
                continue;
            }

            OCRWord found;
            found.text = QString::fromUtf8(word.get()).trimmed();
            found.box = QRect(QPoint(left, top), QPoint(right - 1, bottom - 1));
            found.confidence = it->Confidence(level);
            result.words.append(found);
        } while (it->Next(level));
    }

    return result;
}

QList<int> OCRManager::pageSegModes()
{
    return {
        tesseract::PSM_SINGLE_LINE,
        tesseract::PSM_SINGLE_BLOCK,
        tesseract::PSM_AUTO
    };
}

void OCRManager::setPageSegModes(const QList<int> &modes)
{
    m_pageSegModes = modes.isEmpty() ? pageSegModes() : modes;
}

QString OCRManager::tesseractVersion()
{
    return QString::fromLatin1(tesseract::TessBaseAPI::Version());
}
