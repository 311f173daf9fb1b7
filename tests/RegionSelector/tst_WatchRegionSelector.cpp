#include <QtTest>
#include <QGuiApplication>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPointer>
#include <QScreen>
#include <QSignalSpy>

#include "region/WatchRegionSelector.h"

class tst_WatchRegionSelector : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDragThenEnterEmitsGlobalRegion();
    void testTinyDragIsDiscarded();
    void testEscapeCancels();
    void testRightClickCancels();
    void testArrowKeysMoveAndResize();
    void testNudgeStopsAtScreenEdge();

private:
    void drag(const QPoint &from, const QPoint &to);
    void press(int key, Qt::KeyboardModifiers modifiers = Qt::NoModifier);

    QScreen *m_screen = nullptr;
    QPointer<WatchRegionSelector> m_selector;
};

void tst_WatchRegionSelector::init()
{
    m_screen = QGuiApplication::primaryScreen();
    QVERIFY(m_screen);
    m_selector = new WatchRegionSelector();
    m_selector->initializeForScreen(m_screen);
}

void tst_WatchRegionSelector::cleanup()
{
    delete m_selector.data();
}

void tst_WatchRegionSelector::drag(const QPoint &from, const QPoint &to)
{
    QMouseEvent down(QEvent::MouseButtonPress, from, m_selector->mapToGlobal(from),
                     Qt::LeftButton, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_selector, &down);
    QMouseEvent move(QEvent::MouseMove, to, m_selector->mapToGlobal(to),
                     Qt::NoButton, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_selector, &move);
    QMouseEvent up(QEvent::MouseButtonRelease, to, m_selector->mapToGlobal(to),
                   Qt::LeftButton, Qt::NoButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_selector, &up);
}

void tst_WatchRegionSelector::press(int key, Qt::KeyboardModifiers modifiers)
{
    QKeyEvent event(QEvent::KeyPress, key, modifiers);
    QCoreApplication::sendEvent(m_selector, &event);
}

void tst_WatchRegionSelector::testDragThenEnterEmitsGlobalRegion()
{
    QSignalSpy selected(m_selector.data(), &WatchRegionSelector::regionSelected);

    drag(QPoint(20, 30), QPoint(220, 90));
    QCOMPARE(m_selector->selection(), QRect(QPoint(20, 30), QPoint(220, 90)));

    press(Qt::Key_Return);
    QCOMPARE(selected.count(), 1);
    const QRect expected = QRect(QPoint(20, 30), QPoint(220, 90))
                               .translated(m_screen->geometry().topLeft());
    QCOMPARE(selected.at(0).at(0).toRect(), expected);
    QCOMPARE(selected.at(0).at(1).value<QScreen *>(), m_screen);
}

void tst_WatchRegionSelector::testTinyDragIsDiscarded()
{
    QSignalSpy selected(m_selector.data(), &WatchRegionSelector::regionSelected);

    drag(QPoint(50, 50), QPoint(55, 200));
    QVERIFY(m_selector->selection().isEmpty());

    press(Qt::Key_Enter);
    QCOMPARE(selected.count(), 0);
}

void tst_WatchRegionSelector::testEscapeCancels()
{
    QSignalSpy cancelled(m_selector.data(), &WatchRegionSelector::cancelled);
    press(Qt::Key_Escape);
    QCOMPARE(cancelled.count(), 1);
}

void tst_WatchRegionSelector::testRightClickCancels()
{
    QSignalSpy cancelled(m_selector.data(), &WatchRegionSelector::cancelled);
    QMouseEvent down(QEvent::MouseButtonPress, QPointF(5, 5), m_selector->mapToGlobal(QPointF(5, 5)),
                     Qt::RightButton, Qt::RightButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_selector, &down);
    QCOMPARE(cancelled.count(), 1);
}

void tst_WatchRegionSelector::testArrowKeysMoveAndResize()
{
    const QPoint origin = m_screen->geometry().topLeft();
    m_selector->initializeWithRegion(m_screen, QRect(origin + QPoint(100, 100), QSize(80, 40)));
    QCOMPARE(m_selector->selection(), QRect(100, 100, 80, 40));

    press(Qt::Key_Right);
    QCOMPARE(m_selector->selection(), QRect(101, 100, 80, 40));

    press(Qt::Key_Down, Qt::ShiftModifier);
    QCOMPARE(m_selector->selection(), QRect(101, 110, 80, 40));

    press(Qt::Key_Left, Qt::AltModifier);
    QCOMPARE(m_selector->selection(), QRect(101, 110, 79, 40));
}

void tst_WatchRegionSelector::testNudgeStopsAtScreenEdge()
{
    const QPoint origin = m_screen->geometry().topLeft();
    m_selector->initializeWithRegion(m_screen, QRect(origin, QSize(50, 50)));

    press(Qt::Key_Left);
    press(Qt::Key_Up);
    QCOMPARE(m_selector->selection(), QRect(0, 0, 50, 50));
}

QTEST_MAIN(tst_WatchRegionSelector)
#include "tst_WatchRegionSelector.moc"
