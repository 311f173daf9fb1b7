#include <QtTest>

#include "input/IKeySynthesizer.h"
#include "input/KeyChord.h"

class tst_KeyChord : public QObject
{
    Q_OBJECT

private slots:
    void testParseCtrlReturn();
    void testEnterAliasMapsToReturn();
    void testParseSlash();
    void testInvalidInputs_data();
    void testInvalidInputs();
    void testToStringRoundTrip();
    void testEquality();
    void testTypingFailure_data();
    void testTypingFailure();
};

void tst_KeyChord::testParseCtrlReturn()
{
    const KeyChord chord = KeyChord::fromString("Ctrl+Return");
    QVERIFY(chord.isValid());
    QCOMPARE(chord.key(), Qt::Key_Return);
    QCOMPARE(chord.modifiers(), Qt::KeyboardModifiers(Qt::ControlModifier));
}

void tst_KeyChord::testEnterAliasMapsToReturn()
{
    QCOMPARE(KeyChord::fromString("Ctrl+Enter"), KeyChord::fromString("Ctrl+Return"));
    QCOMPARE(KeyChord::fromString("enter").key(), Qt::Key_Return);
}

void tst_KeyChord::testParseSlash()
{
    const KeyChord chord = KeyChord::fromString(" Ctrl+/ ");
    QVERIFY(chord.isValid());
    QCOMPARE(chord.key(), Qt::Key_Slash);
    QCOMPARE(chord.modifiers(), Qt::KeyboardModifiers(Qt::ControlModifier));
}

void tst_KeyChord::testInvalidInputs_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("blank") << "   ";
    QTest::newRow("two chords") << "Ctrl+A, Ctrl+B";
    QTest::newRow("modifier only") << "Ctrl";
}

void tst_KeyChord::testInvalidInputs()
{
    QFETCH(QString, text);
    QVERIFY(!KeyChord::fromString(text).isValid());
    QVERIFY(KeyChord::fromString(text).toString().isEmpty());
}

void tst_KeyChord::testToStringRoundTrip()
{
    const KeyChord chord(Qt::ControlModifier | Qt::ShiftModifier, Qt::Key_K);
    QCOMPARE(chord.toString(), QString("Ctrl+Shift+K"));
    QCOMPARE(KeyChord::fromString(chord.toString()), chord);
}

void tst_KeyChord::testEquality()
{
    QVERIFY(KeyChord(Qt::ControlModifier, Qt::Key_A) != KeyChord(Qt::AltModifier, Qt::Key_A));
    QVERIFY(KeyChord() == KeyChord());
}

void tst_KeyChord::testTypingFailure_data()
{
    QTest::addColumn<int>("length");
    QTest::addColumn<int>("skipped");
    QTest::addColumn<bool>("accepted");
    QTest::addColumn<bool>("fails");

    QTest::newRow("all typed") << 10 << 0 << true << false;
    QTest::newRow("some skipped") << 10 << 3 << true << false;
    QTest::newRow("every character skipped") << 10 << 10 << true << true;
    QTest::newRow("event rejected") << 10 << 0 << false << true;
    QTest::newRow("event rejected after skips") << 10 << 4 << false << true;
    QTest::newRow("empty text") << 0 << 0 << true << false;
}

void tst_KeyChord::testTypingFailure()
{
    QFETCH(int, length);
    QFETCH(int, skipped);
    QFETCH(bool, accepted);
    QFETCH(bool, fails);

    QCOMPARE(!IKeySynthesizer::typingFailure(length, skipped, accepted).isEmpty(), fails);
}

QTEST_MAIN(tst_KeyChord)
#include "tst_KeyChord.moc"
