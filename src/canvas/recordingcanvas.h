/*
 * recordingcanvas.h — PageCanvas that keeps a display list per page
 *
 * Used for the layout pass: the page total is only known once every
 * section has been placed, so pages are recorded first and replayed onto
 * the output canvas together with their footers.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_RECORDINGCANVAS_H
#define LEDGERPRINT_RECORDINGCANVAS_H

#include <QList>
#include <QStringList>

#include "pagecanvas.h"

struct DrawOp {
    enum Type { TextOp, LineOp, RectOp };
    Type type = TextOp;

    QString text;
    QPointF from;            // text baseline, or line start
    QPointF to;              // line end
    QRectF rect;
    const FontFace *font = nullptr;
    qreal fontSize = 0;
    qreal lineWidth = 0;
    QColor color;
};

struct RecordedPage {
    QSizeF size;
    QList<DrawOp> ops;
};

class RecordingCanvas : public PageCanvas {
public:
    void addPage(const QSizeF &size) override;
    int pageCount() const override { return m_pages.size(); }

    void drawText(const QString &text, const QPointF &baseline,
                  const FontFace *font, qreal fontSize,
                  const QColor &color) override;
    void drawLine(const QPointF &from, const QPointF &to,
                  qreal width, const QColor &color) override;
    void drawRect(const QRectF &rect, qreal width,
                  const QColor &stroke) override;

    const QList<RecordedPage> &pages() const { return m_pages; }

    // Text strings drawn on a page, in drawing order
    QStringList textOnPage(int pageIndex) const;

    // Add the page to target and redraw its operations there
    void replayPage(int pageIndex, PageCanvas &target) const;

private:
    QList<RecordedPage> m_pages;

    RecordedPage &currentPage();
};

#endif // LEDGERPRINT_RECORDINGCANVAS_H
