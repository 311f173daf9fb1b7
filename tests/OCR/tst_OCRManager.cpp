#include <QtTest>
#include <QFont>
#include <QPainter>

#include <tesseract/publictypes.h>

#include "OCRManager.h"

// Recognition tests need the English model; they skip where it is missing.
class tst_OCRManager : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();

    void testInitializeFailsForUnknownLanguage();
    void testRecognizeBeforeInitializeFails();
    void testTextIsCollapsedAndLowerCased();
    void testLaterPassRunsWhenSingleLineIsEmpty();
    void testBlockModeReadsBothLines();
    void testMinConfidenceDropsText();
    void testBlankFrameHasNoText();

private:
    static QImage renderLines(const QStringList &lines);

    bool m_englishAvailable = false;
};

QImage tst_OCRManager::renderLines(const QStringList &lines)
{
    constexpr int kLineHeight = 60;
    QImage image(640, kLineHeight * lines.size() + 40, QImage::Format_RGB32);
    image.fill(Qt::white);

    QPainter painter(&image);
    QFont font;
    font.setPixelSize(32);
    painter.setFont(font);
    painter.setPen(Qt::black);
    for (int i = 0; i < lines.size(); ++i) {
        painter.drawText(QRect(20, 20 + i * kLineHeight, 600, kLineHeight),
                         Qt::AlignLeft | Qt::AlignVCenter, lines.at(i));
    }
    return image;
}

void tst_OCRManager::initTestCase()
{
    OCRManager english(QStringLiteral("eng"), QString());
    m_englishAvailable = english.initialize();
}

void tst_OCRManager::testInitializeFailsForUnknownLanguage()
{
    OCRManager ocr(QStringLiteral("zz_no_such_language"), QString());
    QVERIFY(!ocr.initialize());
    QVERIFY(!ocr.isInitialized());
    QVERIFY(ocr.lastError().contains("zz_no_such_language"));

    const OCRResult result = ocr.recognize(renderLines({"run command"}), 2);
    QVERIFY(!result.success);
    QCOMPARE(result.error, ocr.lastError());
}

void tst_OCRManager::testRecognizeBeforeInitializeFails()
{
    OCRManager ocr(QStringLiteral("eng"), QString());
    const OCRResult result = ocr.recognize(renderLines({"run command"}), 2);
    QVERIFY(!result.success);
    QVERIFY(!result.error.isEmpty());
}

void tst_OCRManager::testTextIsCollapsedAndLowerCased()
{
    if (!m_englishAvailable) {
        QSKIP("eng traineddata not installed");
    }

    OCRManager ocr(QStringLiteral("eng"), QString());
    QVERIFY(ocr.initialize());

    const OCRResult result = ocr.recognize(renderLines({"Run    Command"}), 2);
    QVERIFY(result.success);
    QCOMPARE(result.text, QString("run command"));
    QCOMPARE(result.pageSegMode, int(tesseract::PSM_SINGLE_LINE));
    QVERIFY(!result.words.isEmpty());
}

void tst_OCRManager::testLaterPassRunsWhenSingleLineIsEmpty()
{
    if (!m_englishAvailable) {
        QSKIP("eng traineddata not installed");
    }

    const QImage frame = renderLines({"loading", "", "run command"});

    OCRManager singleLine(QStringLiteral("eng"), QString());
    QVERIFY(singleLine.initialize());
    singleLine.setPageSegModes({tesseract::PSM_SINGLE_LINE});
    const OCRResult lineOnly = singleLine.recognize(frame, 2);
    QVERIFY(lineOnly.success);

    OCRManager ocr(QStringLiteral("eng"), QString());
    QVERIFY(ocr.initialize());
    const OCRResult result = ocr.recognize(frame, 2);
    QVERIFY(result.success);

    if (lineOnly.text.isEmpty()) {
        // The block and automatic passes must recognize again, not reuse
        // the empty single line result.
        QVERIFY(result.pageSegMode != int(tesseract::PSM_SINGLE_LINE));
        QVERIFY(result.text.contains("run command"));
    } else {
        QCOMPARE(result.pageSegMode, int(tesseract::PSM_SINGLE_LINE));
        QCOMPARE(result.text, lineOnly.text);
    }
}

void tst_OCRManager::testBlockModeReadsBothLines()
{
    if (!m_englishAvailable) {
        QSKIP("eng traineddata not installed");
    }

    OCRManager ocr(QStringLiteral("eng"), QString());
    QVERIFY(ocr.initialize());
    // Block mode first, so one pass covers both lines
    ocr.setPageSegModes({tesseract::PSM_SINGLE_BLOCK, tesseract::PSM_AUTO});

    const OCRResult result = ocr.recognize(renderLines({"loading", "run command"}), 2);
    QVERIFY(result.success);
    QCOMPARE(result.pageSegMode, int(tesseract::PSM_SINGLE_BLOCK));
    QVERIFY(result.text.contains("loading"));
    QVERIFY(result.text.contains("run command"));
}

void tst_OCRManager::testMinConfidenceDropsText()
{
    if (!m_englishAvailable) {
        QSKIP("eng traineddata not installed");
    }

    OCRManager ocr(QStringLiteral("eng"), QString());
    QVERIFY(ocr.initialize());
    const QImage frame = renderLines({"accept all"});

    const OCRResult kept = ocr.recognize(frame, 2);
    QVERIFY(!kept.text.isEmpty());
    QVERIFY(kept.confidence >= 0);
    if (kept.confidence >= 100) {
        QSKIP("Recognition is already at full confidence");
    }

    const OCRResult dropped = ocr.recognize(frame, 2, kept.confidence + 1);
    QVERIFY(dropped.success);
    QVERIFY(dropped.text.isEmpty());
    QVERIFY(dropped.words.isEmpty());

    const OCRResult atThreshold = ocr.recognize(frame, 2, kept.confidence);
    QCOMPARE(atThreshold.text, kept.text);
}

void tst_OCRManager::testBlankFrameHasNoText()
{
    if (!m_englishAvailable) {
        QSKIP("eng traineddata not installed");
    }

    OCRManager ocr(QStringLiteral("eng"), QString());
    QVERIFY(ocr.initialize());

    QImage blank(200, 60, QImage::Format_RGB32);
    blank.fill(Qt::white);
    const OCRResult result = ocr.recognize(blank, 2);
    QVERIFY(result.success);
    QVERIFY(result.text.isEmpty());
}

QTEST_MAIN(tst_OCRManager)
#include "tst_OCRManager.moc"
