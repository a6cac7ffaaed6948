/*
 * layoutrows.h — Atomic rows and sections handed to the paginator
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_LAYOUTROWS_H
#define LEDGERPRINT_LAYOUTROWS_H

#include <optional>

#include <QColor>
#include <QList>
#include <QRectF>
#include <QString>

struct FontFace;

namespace Layout {

struct TextStyle {
    const FontFace *font = nullptr;
    qreal fontSize = 10.0;
    QColor color{0x1a, 0x1a, 0x1a};
};

// Positions inside a row are relative to the row's top edge; x is an
// absolute page coordinate. For right-aligned runs x is the right edge.
struct TextRun {
    QString text;
    qreal x = 0;
    qreal baseline = 0;
    TextStyle style;
    bool alignRight = false;
    bool strikeOut = false;
};

struct RuleRun {
    qreal x1 = 0;
    qreal x2 = 0;
    qreal y = 0;
    qreal width = 0.6;
    QColor color{0xdb, 0xdb, 0xdb};
};

struct BoxRun {
    QRectF rect;
    qreal width = 0.8;
    QColor color{0xdb, 0xdb, 0xdb};
};

// The unit of page breaking: a row is never split across pages.
struct Row {
    qreal height = 0;
    QList<TextRun> texts;
    QList<RuleRun> rules;
    QList<BoxRun> boxes;
    bool keepWithNext = false;   // move to the next page together with the following row

    bool isSpacer() const { return texts.isEmpty() && rules.isEmpty() && boxes.isEmpty(); }

    static Row spacer(qreal height)
    {
        Row r;
        r.height = height;
        return r;
    }
};

struct Section {
    enum Kind { Flow, Table };

    QString name;
    Kind kind = Flow;
    bool startsOnFreshPage = false;
    qreal spaceBefore = 0;       // dropped at the top of a page
    std::optional<Row> header;   // table column headers, or a page title
    bool repeatHeader = false;   // Table sections always repeat their header
    QList<Row> rows;

    bool repeatsHeader() const { return header.has_value() && (kind == Table || repeatHeader); }
};

struct Cursor {
    int pageIndex = -1;          // -1: no page yet
    qreal y = 0;                 // top of the next row, page coordinates
    qreal remainingHeight = 0;
};

} // namespace Layout

#endif // LEDGERPRINT_LAYOUTROWS_H
