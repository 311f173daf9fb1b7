#include "region/WatchRegionSelector.h"

#include <QDebug>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <QScreen>

namespace {
const QColor kShade(10, 12, 20, 110);
const QColor kDraftColor(59, 130, 246);
const QColor kReadyColor(34, 197, 94);
}

WatchRegionSelector::WatchRegionSelector(QWidget *parent)
    : QWidget(parent, Qt::Window | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint)
{
    setAttribute(Qt::WA_DeleteOnClose);
    setAttribute(Qt::WA_TranslucentBackground);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setCursor(Qt::CrossCursor);
}

void WatchRegionSelector::initializeForScreen(QScreen *screen)
{
    m_screen = screen;
    m_mode = Mode::Waiting;
    m_selection = QRect();
    setGeometry(screen->geometry());
    qDebug() << "WatchRegionSelector: Overlay on" << screen->name() << screen->geometry();
}

void WatchRegionSelector::initializeWithRegion(QScreen *screen, const QRect &region)
{
    initializeForScreen(screen);

    const QRect local = region.translated(-screen->geometry().topLeft()).intersected(rect());
    if (isLargeEnough(local)) {
        m_selection = local;
        m_mode = Mode::Adjusting;
    }
}

bool WatchRegionSelector::isLargeEnough(const QRect &rect) const
{
    return rect.width() >= kMinSelectionSize && rect.height() >= kMinSelectionSize;
}

void WatchRegionSelector::nudge(int dx, int dy, bool resize)
{
    QRect moved = m_selection;
    if (resize) {
        moved.setWidth(qMax(kMinSelectionSize, moved.width() + dx));
        moved.setHeight(qMax(kMinSelectionSize, moved.height() + dy));
    } else {
        moved.translate(dx, dy);
    }

    // Keep the whole rectangle on this screen
    if (!rect().contains(moved)) {
        return;
    }
    m_selection = moved;
    update();
}

void WatchRegionSelector::accept()
{
    if (m_mode != Mode::Adjusting || !m_screen) {
        return;
    }

    const QRect global = m_selection.translated(m_screen->geometry().topLeft());
    qDebug() << "WatchRegionSelector: Accepted" << global;
    emit regionSelected(global, m_screen);
    close();
}

void WatchRegionSelector::cancel()
{
    qDebug() << "WatchRegionSelector: Cancelled";
    emit cancelled();
    close();
}

void WatchRegionSelector::mousePressEvent(QMouseEvent *event)
{
    if (event->button() == Qt::RightButton) {
        cancel();
        return;
    }
    if (event->button() != Qt::LeftButton) {
        return;
    }

    // Any fresh press outside a finished rectangle starts a new one
    if (m_mode == Mode::Adjusting && m_selection.contains(event->pos())) {
        return;
    }
    m_mode = Mode::Dragging;
    m_anchor = event->pos();
    m_selection = QRect(m_anchor, QSize(1, 1));
    update();
}

void WatchRegionSelector::mouseMoveEvent(QMouseEvent *event)
{
    if (m_mode == Mode::Dragging) {
        m_selection = QRect(m_anchor, event->pos()).normalized().intersected(rect());
    }
    // Guides follow the cursor in every mode
    update();
}

void WatchRegionSelector::mouseReleaseEvent(QMouseEvent *event)
{
    if (event->button() != Qt::LeftButton || m_mode != Mode::Dragging) {
        return;
    }

    m_selection = QRect(m_anchor, event->pos()).normalized().intersected(rect());
    if (isLargeEnough(m_selection)) {
        m_mode = Mode::Adjusting;
    } else {
        qDebug() << "WatchRegionSelector: Ignoring" << m_selection.size()
                 << "below" << kMinSelectionSize << "px";
        m_mode = Mode::Waiting;
        m_selection = QRect();
    }
    update();
}

void WatchRegionSelector::mouseDoubleClickEvent(QMouseEvent *event)
{
    if (event->button() == Qt::LeftButton && m_selection.contains(event->pos())) {
        accept();
    }
}

void WatchRegionSelector::keyPressEvent(QKeyEvent *event)
{
    const int step = event->modifiers().testFlag(Qt::ShiftModifier) ? 10 : 1;
    const bool resize = event->modifiers().testFlag(Qt::AltModifier);

    switch (event->key()) {
    case Qt::Key_Escape:
        cancel();
        return;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        accept();
        return;
    case Qt::Key_Left:
    case Qt::Key_Right:
    case Qt::Key_Up:
    case Qt::Key_Down:
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }

    if (m_mode != Mode::Adjusting) {
        return;
    }
    const int dx = event->key() == Qt::Key_Left ? -step : event->key() == Qt::Key_Right ? step : 0;
    const int dy = event->key() == Qt::Key_Up ? -step : event->key() == Qt::Key_Down ? step : 0;
    nudge(dx, dy, resize);
}

void WatchRegionSelector::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    paintShade(painter);

    if (m_mode == Mode::Waiting) {
        paintCursorGuides(painter);
        paintBadge(painter, tr("Drag over the area where prompts appear"),
                   QPoint(width() / 2, height() - 48), true);
        return;
    }

    paintFrame(painter);
    paintBadge(painter, QStringLiteral("%1 x %2").arg(m_selection.width()).arg(m_selection.height()),
               QPoint(m_selection.center().x(), m_selection.top() - 6), true);

    if (m_mode == Mode::Adjusting) {
        paintBadge(painter, tr("Enter to watch, arrows to adjust, Esc to cancel"),
                   QPoint(m_selection.center().x(), m_selection.bottom() + 6), false);
    }
}

void WatchRegionSelector::paintShade(QPainter &painter) const
{
    QPainterPath shade;
    shade.addRect(rect());
    if (!m_selection.isEmpty()) {
        QPainterPath hole;
        hole.addRect(m_selection);
        shade = shade.subtracted(hole);
    }
    painter.fillPath(shade, kShade);
}

void WatchRegionSelector::paintFrame(QPainter &painter) const
{
    const bool ready = m_mode == Mode::Adjusting;
    QPen pen(ready ? kReadyColor : kDraftColor, ready ? 2 : 1);
    pen.setStyle(ready ? Qt::SolidLine : Qt::DashLine);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawRect(QRectF(m_selection).adjusted(0.5, 0.5, -0.5, -0.5));
}

void WatchRegionSelector::paintCursorGuides(QPainter &painter) const
{
    const QPoint cursorPos = mapFromGlobal(QCursor::pos());
    if (!rect().contains(cursorPos)) {
        return;
    }
    painter.setPen(QPen(QColor(255, 255, 255, 170), 1, Qt::DotLine));
    painter.drawLine(0, cursorPos.y(), width(), cursorPos.y());
    painter.drawLine(cursorPos.x(), 0, cursorPos.x(), height());
}

void WatchRegionSelector::paintBadge(QPainter &painter, const QString &text,
                                     const QPoint &anchor, bool above) const
{
    QFont font = painter.font();
    font.setPointSize(11);
    painter.setFont(font);

    QRect box = painter.fontMetrics().boundingRect(text).adjusted(-10, -5, 10, 5);
    box.moveCenter(anchor);
    if (above) {
        box.moveBottom(anchor.y());
    } else {
        box.moveTop(anchor.y());
    }

    // Flip to the other side of the anchor, then clamp, when off screen
    if (box.top() < 4) {
        box.moveTop(anchor.y() + 4);
    } else if (box.bottom() > height() - 4) {
        box.moveBottom(anchor.y() - 4);
    }
    box.moveLeft(qBound(4, box.left(), qMax(4, width() - box.width() - 4)));

    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0, 0, 0, 190));
    painter.drawRoundedRect(box, 5, 5);
    painter.setPen(Qt::white);
    painter.drawText(box, Qt::AlignCenter, text);
}
