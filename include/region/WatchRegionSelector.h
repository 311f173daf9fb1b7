#ifndef WATCHREGIONSELECTOR_H
#define WATCHREGIONSELECTOR_H

#include <QWidget>
#include <QRect>
#include <QPoint>

class QScreen;

/**
 * @brief Translucent overlay on one screen for marking the area to watch.
 *
 * Drag to draw the rectangle, then adjust it with the arrow keys (Shift
 * moves ten pixels, Alt resizes instead of moving). Enter or a double click
 * inside accepts. Escape or a right click cancels. The accepted region is
 * emitted in global coordinates.
 */
class WatchRegionSelector : public QWidget
{
    Q_OBJECT

public:
    explicit WatchRegionSelector(QWidget *parent = nullptr);

    void initializeForScreen(QScreen *screen);
    // Opens with @p region (global coordinates) already drawn.
    void initializeWithRegion(QScreen *screen, const QRect &region);

    // Current rectangle in widget coordinates, empty while nothing is drawn.
    QRect selection() const { return m_selection; }

    static constexpr int kMinSelectionSize = 10;

signals:
    void regionSelected(const QRect &region, QScreen *screen);
    void cancelled();

protected:
    void paintEvent(QPaintEvent *event) override;
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void mouseDoubleClickEvent(QMouseEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    enum class Mode {
        Waiting,   // nothing drawn yet
        Dragging,
        Adjusting  // a valid rectangle is waiting to be accepted
    };

    bool isLargeEnough(const QRect &rect) const;
    void nudge(int dx, int dy, bool resize);
    void accept();
    void cancel();

    void paintShade(QPainter &painter) const;
    void paintFrame(QPainter &painter) const;
    void paintCursorGuides(QPainter &painter) const;
    void paintBadge(QPainter &painter, const QString &text, const QPoint &anchor, bool above) const;

    QScreen *m_screen = nullptr;
    Mode m_mode = Mode::Waiting;
    QPoint m_anchor;
    QRect m_selection;
};

#endif // WATCHREGIONSELECTOR_H
