/*
 * paginator.h — Cursor-driven placement of rows onto fixed-size pages
 *
 * The paginator owns the vertical cursor over the printable area. It
 * breaks pages before rows that do not fit, repeats table headers after
 * a break, honours fresh-page and keep-with-next requests, and refuses
 * to grow a document past its page guard.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_PAGINATOR_H
#define LEDGERPRINT_PAGINATOR_H

#include <QRectF>
#include <QStringList>

#include "layoutrows.h"
#include "pagelayout.h"

class PageCanvas;

namespace Layout {

class Paginator {
public:
    static constexpr int kDefaultMaxPages = 50;

    Paginator(PageCanvas *canvas, const PageLayout &pageLayout,
              int maxPages = kDefaultMaxPages);

    // Greedy wrap at line-break opportunities. Explicit '\n' forces a
    // break and blank source lines come back as empty strings. A word
    // wider than maxWidth is split into the longest prefixes that fit,
    // at least one character per line. Empty text yields no lines.
    static QStringList measureWrap(const QString &text, qreal maxWidth,
                                   const FontFace *font, qreal fontSize);

    // Baseline offset of text of the given style inside a line slot
    static qreal baselineOffset(const TextStyle &style, qreal lineHeight);

    void placeLines(const QStringList &lines, qreal lineHeight,
                    const TextStyle &style, qreal x);
    void placeRow(const Row &row);
    void placeBlock(const Section &section);
    void breakPage();

    const Cursor &cursor() const { return m_cursor; }
    int pageCount() const { return m_cursor.pageIndex + 1; }
    int maxPages() const { return m_maxPages; }
    const PageLayout &pageLayout() const { return m_pageLayout; }
    QRectF contentRect() const { return m_contentRect; }

    // True before anything but spacers was placed on the current page
    bool atPageTop() const;

private:
    PageCanvas *m_canvas;
    PageLayout m_pageLayout;
    QRectF m_contentRect;
    int m_maxPages;
    Cursor m_cursor;
    int m_rowsOnPage = 0;
    const Section *m_repeatingSection = nullptr;

    void ensurePage();
    void drawRow(const Row &row);
    qreal rowCapacity() const;
};

} // namespace Layout

#endif // LEDGERPRINT_PAGINATOR_H
