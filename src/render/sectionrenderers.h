/*
 * sectionrenderers.h — Content blocks of a quote or invoice
 *
 * Each renderer turns the sanitized payload into one Layout::Section of
 * atomic rows; the paginator decides where the rows land. Renderers do
 * not touch a canvas and never see unsanitized text.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_SECTIONRENDERERS_H
#define LEDGERPRINT_SECTIONRENDERERS_H

#include <optional>

#include <QColor>
#include <QList>
#include <QRectF>
#include <QStringList>

#include "documentpayload.h"
#include "layoutrows.h"

struct FontFace;

namespace Sections {

// Type scale (points)
constexpr qreal kTitleSize = 20.0;
constexpr qreal kSectionSize = 12.0;
constexpr qreal kItemTitleSize = 11.0;
constexpr qreal kBodySize = 10.0;
constexpr qreal kSmallSize = 9.0;
constexpr qreal kTinySize = 8.0;
constexpr qreal kLegalTitleSize = 16.0;

// Vertical rhythm (points)
constexpr qreal kSectionGap = 28.0;
constexpr qreal kBlockGap = 24.0;
constexpr qreal kHeaderGap = 18.0;
constexpr qreal kRowHeight = 14.0;
constexpr qreal kRowGap = 12.0;
constexpr qreal kSmallLineHeight = 12.0;
constexpr qreal kParagraphGap = 6.0;

enum class Tone {
    Primary,
    Secondary,
    Legal,
    Rule,
};

QColor toneColor(Tone tone);

struct RenderContext {
    const DocumentPayload *payload = nullptr;   // already sanitized
    const FontFace *regular = nullptr;
    const FontFace *bold = nullptr;
    QRectF content;                             // printable area of a page

    Layout::TextStyle style(qreal size, Tone tone = Tone::Primary, bool isBold = false) const;

    // Item table grid. The right edges are measured from the content's
    // right edge so the grid follows the page size.
    qreal labelX() const { return content.left(); }
    qreal quantityRight() const { return content.right() - 215.0; }
    qreal unitRight() const { return content.right() - 175.0; }
    qreal unitPriceRight() const { return content.right() - 105.0; }
    qreal totalRight() const { return content.right(); }
    qreal labelWidth() const { return quantityRight() - 20.0 - labelX(); }
    qreal totalsLabelX() const { return unitPriceRight() - 20.0; }
};

struct TotalsLine {
    QString label;
    QString value;
    bool emphasized = false;     // larger bold line, e.g. "Total TTC"
    bool gapBefore = false;
};

// Wrapped text as one row per line; blank lines become spacer rows
QList<Layout::Row> textRows(const QString &text, qreal x, qreal maxWidth,
                            const Layout::TextStyle &style, qreal lineHeight);

// Single-line row with one left-aligned run
Layout::Row labelRow(const QString &text, qreal x, const Layout::TextStyle &style,
                     qreal height);

// "2026-03-05T10:00:00Z" -> "05/03/2026"; unparsable input is returned as is
QString formatDate(const QString &isoDate);

// Year of the issue date, else the expiry or due date; nothing without dates
std::optional<int> documentYear(const DocumentPayload &payload);

// VAT on an excluding-tax total, rounded half up. The rate is taken in
// basis points so the product stays in integer arithmetic.
qint64 vatCents(qint64 totalCents, double ratePercent);

// "Paiement sous 30 jours." when no payment terms text is configured
QString paymentTermsLine(const PartyDetails &business, std::optional<int> paymentTermsDays);

Layout::Section identityHeader(const RenderContext &ctx, const QString &title,
                               const QString &numberLine);
Layout::Section documentMetadata(const RenderContext &ctx, const QStringList &lines);
Layout::Section clientBlock(const RenderContext &ctx);
// Project name and prestations; withRecap adds the date, parties, the
// total including VAT and a numbered list of the priced items
Layout::Section projectDescription(const RenderContext &ctx, bool withRecap = false);
Layout::Section itemTable(const RenderContext &ctx);
Layout::Section totals(const RenderContext &ctx, const QList<TotalsLine> &lines);
// The note as a titled block of its own; empty without a note
Layout::Section collaborationTerms(const RenderContext &ctx);
Layout::Section legalTerms(const RenderContext &ctx);
Layout::Section footer(const RenderContext &ctx, const QList<Layout::Row> &closingRows,
                       bool withNote = true);

// Closing content of the footer
QList<Layout::Row> signatureRows(const RenderContext &ctx);
QList<Layout::Row> closingLineRows(const RenderContext &ctx, const QStringList &lines);

} // namespace Sections

#endif // LEDGERPRINT_SECTIONRENDERERS_H
