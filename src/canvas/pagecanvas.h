/*
 * pagecanvas.h — Abstract drawing surface the layout engine paints on
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_PAGECANVAS_H
#define LEDGERPRINT_PAGECANVAS_H

#include <QColor>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

struct FontFace;

// Pages are append-only. All drawing goes to the most recently added page,
// in points with the origin at the top-left corner of the page and y
// growing downwards. Text positions are baseline positions.
class PageCanvas {
public:
    virtual ~PageCanvas() = default;

    virtual void addPage(const QSizeF &size) = 0;
    virtual int pageCount() const = 0;

    virtual void drawText(const QString &text, const QPointF &baseline,
                          const FontFace *font, qreal fontSize,
                          const QColor &color) = 0;
    virtual void drawLine(const QPointF &from, const QPointF &to,
                          qreal width, const QColor &color) = 0;
    virtual void drawRect(const QRectF &rect, qreal width,
                          const QColor &stroke) = 0;
};

#endif // LEDGERPRINT_PAGECANVAS_H
