/*
 * pdfcanvas.h — PageCanvas producing a standalone PDF document
 *
 * Text is written with simple fonts in WinAnsiEncoding: the standard
 * Helvetica faces by reference, system TrueType faces embedded whole
 * through /FontFile2.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_PDFCANVAS_H
#define LEDGERPRINT_PDFCANVAS_H

#include <QByteArray>
#include <QHash>
#include <QList>

#include "pagecanvas.h"
#include "pdfexportoptions.h"
#include "pdfwriter.h"

class PdfCanvas : public PageCanvas {
public:
    explicit PdfCanvas(const PdfExportOptions &options = PdfExportOptions());

    void addPage(const QSizeF &size) override;
    int pageCount() const override { return m_pages.size(); }

    void drawText(const QString &text, const QPointF &baseline,
                  const FontFace *font, qreal fontSize,
                  const QColor &color) override;
    void drawLine(const QPointF &from, const QPointF &to,
                  qreal width, const QColor &color) override;
    void drawRect(const QRectF &rect, qreal width,
                  const QColor &stroke) override;

    // Register a font for the document; returns its resource name.
    QByteArray embedFont(const FontFace *font);

    // Serialize the whole document. Throws RenderError on failure; the
    // canvas can be saved again afterwards and yields the same bytes.
    QByteArray save() const;

private:
    struct PageData {
        QSizeF size;
        QByteArray content;
        QList<QByteArray> fontNames;
    };

    PdfExportOptions m_options;
    QList<PageData> m_pages;
    QList<const FontFace *> m_fonts;            // embedding order
    QHash<const FontFace *, QByteArray> m_fontNames;

    PageData &currentPage(const char *operation);
    qreal toPdfY(qreal y) const;

    void writeFont(Pdf::Writer &writer, const FontFace *font, Pdf::ObjId fontObj) const;
    void writeInfo(Pdf::Writer &writer) const;
};

#endif // LEDGERPRINT_PDFCANVAS_H
