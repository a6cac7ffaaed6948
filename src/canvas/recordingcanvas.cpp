/*
 * recordingcanvas.cpp — PageCanvas that keeps a display list per page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "recordingcanvas.h"
#include "documenterrors.h"

void RecordingCanvas::addPage(const QSizeF &size)
{
    RecordedPage page;
    page.size = size;
    m_pages.append(page);
}

RecordedPage &RecordingCanvas::currentPage()
{
    if (m_pages.isEmpty())
        throw RenderError(QStringLiteral("RecordingCanvas: drawing before the first page"));
    return m_pages.last();
}

void RecordingCanvas::drawText(const QString &text, const QPointF &baseline,
                               const FontFace *font, qreal fontSize,
                               const QColor &color)
{
    DrawOp op;
    op.type = DrawOp::TextOp;
    op.text = text;
    op.from = baseline;
    op.font = font;
    op.fontSize = fontSize;
    op.color = color;
    currentPage().ops.append(op);
}

void RecordingCanvas::drawLine(const QPointF &from, const QPointF &to,
                               qreal width, const QColor &color)
{
    DrawOp op;
    op.type = DrawOp::LineOp;
    op.from = from;
    op.to = to;
    op.lineWidth = width;
    op.color = color;
    currentPage().ops.append(op);
}

void RecordingCanvas::drawRect(const QRectF &rect, qreal width, const QColor &stroke)
{
    DrawOp op;
    op.type = DrawOp::RectOp;
    op.rect = rect;
    op.lineWidth = width;
    op.color = stroke;
    currentPage().ops.append(op);
}

QStringList RecordingCanvas::textOnPage(int pageIndex) const
{
    QStringList result;
    if (pageIndex < 0 || pageIndex >= m_pages.size())
        return result;
    for (const DrawOp &op : m_pages[pageIndex].ops) {
        if (op.type == DrawOp::TextOp)
            result.append(op.text);
    }
    return result;
}

void RecordingCanvas::replayPage(int pageIndex, PageCanvas &target) const
{
    const RecordedPage &page = m_pages.at(pageIndex);
    target.addPage(page.size);
    for (const DrawOp &op : page.ops) {
        switch (op.type) {
        case DrawOp::TextOp:
            target.drawText(op.text, op.from, op.font, op.fontSize, op.color);
            break;
        case DrawOp::LineOp:
            target.drawLine(op.from, op.to, op.lineWidth, op.color);
            break;
        case DrawOp::RectOp:
            target.drawRect(op.rect, op.lineWidth, op.color);
            break;
        }
    }
}
