/*
 * sectionrenderers.cpp — Content blocks of a quote or invoice
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "sectionrenderers.h"
#include "fontface.h"
#include "moneycodec.h"
#include "paginator.h"

#include <QDate>
#include <QDateTime>

#include <cmath>

using Layout::Row;
using Layout::Section;
using Layout::TextRun;
using Layout::TextStyle;

namespace Sections {

QColor toneColor(Tone tone)
{
    switch (tone) {
    case Tone::Primary:
        return QColor(0x1a, 0x1a, 0x1a);
    case Tone::Secondary:
        return QColor(0x66, 0x66, 0x66);
    case Tone::Legal:
        return QColor(0x80, 0x80, 0x80);
    case Tone::Rule:
        return QColor(0xdb, 0xdb, 0xdb);
    }
    return QColor(Qt::black);
}

TextStyle RenderContext::style(qreal size, Tone tone, bool isBold) const
{
    TextStyle s;
    s.font = isBold ? bold : regular;
    s.fontSize = size;
    s.color = toneColor(tone);
    return s;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

TextRun makeRun(const QString &text, qreal x, qreal baseline, const TextStyle &style,
                bool alignRight = false)
{
    TextRun run;
    run.text = text;
    run.x = x;
    run.baseline = baseline;
    run.style = style;
    run.alignRight = alignRight;
    return run;
}

void appendRows(QList<Row> &rows, const QList<Row> &more)
{
    for (const Row &r : more)
        rows.append(r);
}

QStringList splitParagraphs(const QString &text)
{
    QStringList result;
    const QStringList parts = text.split(QLatin1Char('\n'));
    for (const QString &part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty())
            result.append(trimmed);
    }
    return result;
}

// "Label: value", or nothing when the value is empty
void addLabelled(QStringList &lines, const char *label, const QString &value)
{
    if (!value.isEmpty())
        lines.append(QString::fromUtf8(label) + value);
}

void addIfSet(QStringList &lines, const QString &value)
{
    if (!value.isEmpty())
        lines.append(value);
}

QString joinNonEmpty(const QString &a, const QString &b)
{
    if (a.isEmpty())
        return b;
    if (b.isEmpty())
        return a;
    return a + QLatin1Char(' ') + b;
}

// Company name, else contact name, else the loose client name
QString clientLabel(const DocumentPayload &p)
{
    if (!p.client.companyName.isEmpty())
        return p.client.companyName;
    if (!p.client.name.isEmpty())
        return p.client.name;
    return p.clientName;
}

// Caption plus its lines; nothing at all when there are no lines
QList<Row> partyRows(const RenderContext &ctx, const QString &caption,
                     const QStringList &lines)
{
    QList<Row> rows;
    if (lines.isEmpty())
        return rows;

    Row captionRow = labelRow(caption, ctx.content.left(),
                              ctx.style(kTinySize, Tone::Secondary, true), kSmallLineHeight);
    captionRow.keepWithNext = true;
    rows.append(captionRow);

    for (int i = 0; i < lines.size(); ++i) {
        // The first line names the party
        const TextStyle style = i == 0 ? ctx.style(kSmallSize, Tone::Primary, true)
                                       : ctx.style(kSmallSize, Tone::Secondary);
        appendRows(rows, textRows(lines[i], ctx.content.left(), ctx.content.width(),
                                  style, kSmallLineHeight));
    }
    return rows;
}

} // namespace

QList<Row> textRows(const QString &text, qreal x, qreal maxWidth,
                    const TextStyle &style, qreal lineHeight)
{
    QList<Row> rows;
    const QStringList lines = Layout::Paginator::measureWrap(text, maxWidth, style.font,
                                                             style.fontSize);
    const qreal baseline = Layout::Paginator::baselineOffset(style, lineHeight);
    for (const QString &line : lines) {
        if (line.isEmpty()) {
            rows.append(Row::spacer(lineHeight));
            continue;
        }
        Row row;
        row.height = lineHeight;
        row.texts.append(makeRun(line, x, baseline, style));
        rows.append(row);
    }
    return rows;
}

Row labelRow(const QString &text, qreal x, const TextStyle &style, qreal height)
{
    Row row;
    row.height = height;
    row.texts.append(makeRun(text, x, Layout::Paginator::baselineOffset(style, height), style));
    return row;
}

QString formatDate(const QString &isoDate)
{
    if (isoDate.isEmpty())
        return {};

    QDateTime dt = QDateTime::fromString(isoDate, Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(isoDate, Qt::ISODate);
    if (dt.isValid())
        return dt.date().toString(QStringLiteral("dd/MM/yyyy"));

    const QDate d = QDate::fromString(isoDate.left(10), Qt::ISODate);
    if (d.isValid())
        return d.toString(QStringLiteral("dd/MM/yyyy"));
    return isoDate;
}

std::optional<int> documentYear(const DocumentPayload &payload)
{
    for (const QString &candidate : {payload.issuedAt, payload.expiresAt, payload.dueAt}) {
        const QDate d = QDate::fromString(candidate.left(10), Qt::ISODate);
        if (d.isValid())
            return d.year();
    }
    return std::nullopt;
}

qint64 vatCents(qint64 totalCents, double ratePercent)
{
    const qint64 basisPoints = std::llround(ratePercent * 100.0);
    if (totalCents <= 0 || basisPoints <= 0)
        return 0;
    return (totalCents * basisPoints + 5000) / 10000;
}

QString paymentTermsLine(const PartyDetails &business, std::optional<int> paymentTermsDays)
{
    const QString text = business.paymentTermsText.trimmed();
    if (!text.isEmpty())
        return text;
    if (paymentTermsDays)
        return QStringLiteral("Paiement sous %1 jours.").arg(*paymentTermsDays);
    return {};
}

// ---------------------------------------------------------------------------
// Identity, metadata, client
// ---------------------------------------------------------------------------

Section identityHeader(const RenderContext &ctx, const QString &title, const QString &numberLine)
{
    const DocumentPayload &p = *ctx.payload;
    const PartyDetails &b = p.business;
    const qreal x = ctx.content.left();

    Section section;
    section.name = QStringLiteral("identity");

    Row titleRow = labelRow(title, x, ctx.style(kTitleSize, Tone::Primary, true), 26.0);
    titleRow.keepWithNext = true;
    section.rows.append(titleRow);
    if (!numberLine.isEmpty())
        section.rows.append(labelRow(numberLine, x, ctx.style(kSectionSize, Tone::Primary, true), 20.0));

    QStringList issuer;
    addIfSet(issuer, b.legalName.isEmpty() ? p.businessName : b.legalName);
    addIfSet(issuer, b.addressLine1);
    addIfSet(issuer, b.addressLine2);
    addIfSet(issuer, joinNonEmpty(b.postalCode, b.city));
    addIfSet(issuer, b.countryCode);
    addLabelled(issuer, "SIRET: ", b.siret);
    addLabelled(issuer, "TVA: ", b.vatNumber);
    addIfSet(issuer, b.websiteUrl);
    addIfSet(issuer, b.email);
    addIfSet(issuer, b.phone);

    const QList<Row> issuerRows = partyRows(ctx, QStringLiteral("ÉMETTEUR"), issuer);
    if (!issuerRows.isEmpty()) {
        section.rows.append(Row::spacer(kHeaderGap));
        appendRows(section.rows, issuerRows);
    }
    return section;
}

Section documentMetadata(const RenderContext &ctx, const QStringList &lines)
{
    Section section;
    section.name = QStringLiteral("metadata");
    section.spaceBefore = kSmallLineHeight;

    const TextStyle style = ctx.style(kTinySize, Tone::Secondary);
    for (const QString &line : lines) {
        if (!line.isEmpty())
            section.rows.append(labelRow(line, ctx.content.left(), style, kSmallLineHeight));
    }
    return section;
}

Section clientBlock(const RenderContext &ctx)
{
    const DocumentPayload &p = *ctx.payload;
    const ClientDetails &c = p.client;

    Section section;
    section.name = QStringLiteral("client");
    section.spaceBefore = kHeaderGap;

    QStringList lines;
    addIfSet(lines, clientLabel(p));
    if (!c.companyName.isEmpty() && !c.name.isEmpty() && c.name != c.companyName)
        addLabelled(lines, "Contact: ", c.name);

    const bool structured = !c.addressLine1.isEmpty() || !c.addressLine2.isEmpty()
        || !c.postalCode.isEmpty() || !c.city.isEmpty() || !c.countryCode.isEmpty();
    if (structured) {
        addIfSet(lines, c.addressLine1);
        addIfSet(lines, c.addressLine2);
        addIfSet(lines, joinNonEmpty(c.postalCode, c.city));
        addIfSet(lines, c.countryCode);
    } else {
        lines.append(splitParagraphs(c.address));
    }

    addIfSet(lines, c.email.isEmpty() ? p.clientEmail : c.email);
    addIfSet(lines, c.phone);
    addLabelled(lines, "TVA: ", c.vatNumber);
    addLabelled(lines, "Réf: ", c.reference);

    section.rows = partyRows(ctx, QStringLiteral("CLIENT"), lines);
    return section;
}

// ---------------------------------------------------------------------------
// Project description
// ---------------------------------------------------------------------------

Section projectDescription(const RenderContext &ctx, bool withRecap)
{
    const DocumentPayload &p = *ctx.payload;
    const qreal labelX = ctx.content.left();
    const qreal valueX = labelX + 140.0;
    const qreal valueWidth = ctx.content.right() - valueX;

    Section section;
    section.name = QStringLiteral("project");
    section.spaceBefore = kBlockGap;

    const TextStyle labelStyle = ctx.style(kSmallSize, Tone::Primary, true);
    const TextStyle valueStyle = ctx.style(kSmallSize, Tone::Secondary);
    const QString dash = QStringLiteral("—");

    // Label in the left column, sharing the first wrapped value line
    auto addRow = [&](const QString &label, const QString &value) {
        QList<Row> valueRows = textRows(value, valueX, valueWidth, valueStyle, kRowHeight);
        if (valueRows.isEmpty())
            return;
        const qreal baseline = Layout::Paginator::baselineOffset(labelStyle, kRowHeight);
        valueRows.first().texts.prepend(makeRun(label, labelX, baseline, labelStyle));
        appendRows(section.rows, valueRows);
        section.rows.append(Row::spacer(kParagraphGap));
    };

    if (withRecap) {
        const QString issuedAt = formatDate(p.issuedAt);
        const QString client = clientLabel(p);
        const QString issuer = p.business.legalName.isEmpty() ? p.businessName
                                                              : p.business.legalName;
        const qint64 vat = p.vatEnabled ? vatCents(p.totalCents, p.vatRatePercent) : 0;

        addRow(QStringLiteral("Objet"), p.projectName.isEmpty() ? dash : p.projectName);
        addRow(QStringLiteral("Date"), issuedAt.isEmpty() ? dash : issuedAt);
        addRow(QStringLiteral("Client"), client.isEmpty() ? dash : client);
        addRow(QStringLiteral("Émetteur"), issuer);
        addRow(QStringLiteral("Montant total"), Money::formatAmount(p.totalCents + vat, p.currency));
    } else if (!p.projectName.isEmpty()) {
        addRow(QStringLiteral("Objet"), p.projectName);
    }

    const QStringList paragraphs = splitParagraphs(p.prestationsText);
    if (!paragraphs.isEmpty()) {
        Row heading = labelRow(QStringLiteral("Détail des prestations"), labelX, labelStyle,
                               kSmallLineHeight);
        heading.keepWithNext = true;
        section.rows.append(heading);
        for (const QString &paragraph : paragraphs) {
            appendRows(section.rows, textRows(paragraph, valueX, valueWidth, valueStyle, kRowHeight));
            section.rows.append(Row::spacer(kParagraphGap));
        }
    }

    if (withRecap && !p.items.isEmpty()) {
        section.rows.append(Row::spacer(kParagraphGap));
        Row heading = labelRow(QStringLiteral("Prestations tarifées"), labelX, labelStyle,
                               kSmallLineHeight);
        heading.keepWithNext = true;
        section.rows.append(heading);
        for (int i = 0; i < p.items.size(); ++i) {
            const QString entry = QStringLiteral("%1. %2").arg(i + 1).arg(p.items[i].label);
            appendRows(section.rows, textRows(entry, valueX, valueWidth, valueStyle, kRowHeight));
        }
    }

    return section;
}

// ---------------------------------------------------------------------------
// Collaboration terms
// ---------------------------------------------------------------------------

Section collaborationTerms(const RenderContext &ctx)
{
    Section section;
    section.name = QStringLiteral("conditions");
    section.spaceBefore = kSectionGap;

    const QStringList paragraphs = splitParagraphs(ctx.payload->note);
    if (paragraphs.isEmpty())
        return section;

    const qreal x = ctx.content.left();
    Row heading = labelRow(QStringLiteral("Conditions de collaboration"), x,
                           ctx.style(kSectionSize, Tone::Primary, true), 18.0);
    heading.keepWithNext = true;
    section.rows.append(heading);

    const TextStyle style = ctx.style(kSmallSize, Tone::Secondary);
    for (const QString &paragraph : paragraphs) {
        appendRows(section.rows, textRows(paragraph, x, ctx.content.width(), style, kRowHeight));
        section.rows.append(Row::spacer(kParagraphGap));
    }
    return section;
}

// ---------------------------------------------------------------------------
// Line items
// ---------------------------------------------------------------------------

namespace {

Row itemRow(const RenderContext &ctx, const LineItem &item, const QString &currency)
{
    const TextStyle labelStyle = ctx.style(kItemTitleSize, Tone::Primary, true);
    const TextStyle descStyle = ctx.style(kSmallSize, Tone::Secondary);
    const TextStyle bodyStyle = ctx.style(kBodySize);
    const TextStyle totalStyle = ctx.style(kBodySize, Tone::Primary, true);
    const TextStyle unitStyle = ctx.style(kSmallSize, Tone::Secondary);
    const TextStyle strikeStyle = ctx.style(kTinySize, Tone::Secondary);

    QStringList labelLines = Layout::Paginator::measureWrap(item.label, ctx.labelWidth(),
                                                            labelStyle.font, labelStyle.fontSize);
    if (labelLines.isEmpty())
        labelLines.append(QStringLiteral("—"));
    const QStringList descLines = Layout::Paginator::measureWrap(item.description, ctx.labelWidth(),
                                                                 descStyle.font, descStyle.fontSize);

    // Band above the first line for the struck original price
    const qreal band = item.showsOriginalPrice() ? kRowHeight : 0.0;

    Row row;
    row.height = band + (labelLines.size() + descLines.size()) * kRowHeight + kRowGap;

    if (item.showsOriginalPrice()) {
        const qreal baseline = Layout::Paginator::baselineOffset(strikeStyle, kRowHeight);
        TextRun original = makeRun(Money::formatAmount(*item.originalUnitPriceCents, currency),
                                   ctx.unitPriceRight(), baseline, strikeStyle, true);
        original.strikeOut = true;
        row.texts.append(original);
        if (!item.discount.isEmpty())
            row.texts.append(makeRun(item.discount, ctx.unitPriceRight() + 4.0, baseline, strikeStyle));
    }

    const qreal labelBaseline = Layout::Paginator::baselineOffset(labelStyle, kRowHeight);
    for (int i = 0; i < labelLines.size(); ++i)
        row.texts.append(makeRun(labelLines[i], ctx.labelX(), band + i * kRowHeight + labelBaseline,
                                 labelStyle));

    // Figures sit on the first label line
    const qreal first = band + Layout::Paginator::baselineOffset(bodyStyle, kRowHeight);
    const QString unitLabel = item.resolvedUnitLabel();
    QString unitPrice = Money::formatAmount(item.unitPriceCents, currency);
    if (!unitLabel.isEmpty())
        unitPrice += QLatin1Char(' ') + unitLabel;

    row.texts.append(makeRun(Money::formatQuantity(item.quantity), ctx.quantityRight(), first,
                             bodyStyle, true));
    row.texts.append(makeRun(unitLabel.isEmpty() ? QStringLiteral("—") : unitLabel, ctx.unitRight(),
                             first, unitStyle, true));
    row.texts.append(makeRun(unitPrice, ctx.unitPriceRight(), first, bodyStyle, true));
    row.texts.append(makeRun(Money::formatAmount(item.totalCents, currency), ctx.totalRight(), first,
                             totalStyle, true));

    const qreal descBaseline = Layout::Paginator::baselineOffset(descStyle, kRowHeight);
    const qreal descTop = band + labelLines.size() * kRowHeight;
    for (int j = 0; j < descLines.size(); ++j) {
        if (!descLines[j].isEmpty())
            row.texts.append(makeRun(descLines[j], ctx.labelX(), descTop + j * kRowHeight + descBaseline,
                                     descStyle));
    }

    return row;
}

} // namespace

Section itemTable(const RenderContext &ctx)
{
    const DocumentPayload &p = *ctx.payload;

    Section section;
    section.name = QStringLiteral("items");
    section.kind = Section::Table;
    section.spaceBefore = kBlockGap;

    const TextStyle headStyle = ctx.style(kSmallSize, Tone::Secondary, true);
    const qreal baseline = 10.0;
    Row header;
    header.height = 20.0;
    header.texts.append(makeRun(QStringLiteral("Description"), ctx.labelX(), baseline, headStyle));
    header.texts.append(makeRun(QStringLiteral("Qté"), ctx.quantityRight(), baseline, headStyle, true));
    header.texts.append(makeRun(QStringLiteral("Unité"), ctx.unitRight(), baseline, headStyle, true));
    header.texts.append(makeRun(QStringLiteral("PU"), ctx.unitPriceRight(), baseline, headStyle, true));
    header.texts.append(makeRun(QStringLiteral("Total"), ctx.totalRight(), baseline, headStyle, true));

    Layout::RuleRun divider;
    divider.x1 = ctx.content.left();
    divider.x2 = ctx.content.right();
    divider.y = 15.0;
    divider.color = toneColor(Tone::Rule);
    header.rules.append(divider);
    section.header = header;

    for (const LineItem &item : p.items)
        section.rows.append(itemRow(ctx, item, p.currency));

    return section;
}

// ---------------------------------------------------------------------------
// Totals
// ---------------------------------------------------------------------------

Section totals(const RenderContext &ctx, const QList<TotalsLine> &lines)
{
    Section section;
    section.name = QStringLiteral("totals");
    section.spaceBefore = kSectionGap;
    if (lines.isEmpty())
        return section;

    Row rule;
    rule.height = 4.0;
    Layout::RuleRun run;
    run.x1 = ctx.totalsLabelX();
    run.x2 = ctx.totalRight();
    run.y = 0;
    run.width = 0.8;
    run.color = toneColor(Tone::Rule);
    rule.rules.append(run);
    rule.keepWithNext = true;
    section.rows.append(rule);

    for (int i = 0; i < lines.size(); ++i) {
        const TotalsLine &line = lines[i];
        const TextStyle style = line.emphasized ? ctx.style(kSectionSize, Tone::Primary, true)
                                                : ctx.style(kBodySize);
        const qreal gap = line.gapBefore ? 8.0 : 0.0;

        Row row;
        row.height = kRowHeight + gap;
        row.texts.append(makeRun(line.label, ctx.totalsLabelX(), gap + 10.0, style));
        row.texts.append(makeRun(line.value, ctx.totalRight(), gap + 10.0, style, true));
        // The block moves as a whole
        row.keepWithNext = i + 1 < lines.size();
        section.rows.append(row);
    }

    return section;
}

// ---------------------------------------------------------------------------
// Legal clauses
// ---------------------------------------------------------------------------

namespace {

struct Clause {
    QString title;
    QString text;
};

QList<Clause> legalClauses(const DocumentPayload &p)
{
    const PartyDetails &b = p.business;
    QList<Clause> clauses;

    auto add = [&clauses](const char *title, const QString &text) {
        if (!text.trimmed().isEmpty())
            clauses.append(Clause{QString::fromUtf8(title), text});
    };

    add("Conditions générales de vente", b.cgvText);
    add("Conditions de paiement", paymentTermsLine(b, p.paymentTermsDays));
    add("Pénalités de retard", b.lateFeesText);
    add("Indemnité forfaitaire", b.fixedIndemnityText);
    add("Mentions légales", b.legalMentionsText);
    add("Mentions complémentaires", b.billingLegalText);
    if (clauses.isEmpty())
        add("Mentions légales", b.legalText);
    return clauses;
}

} // namespace

Section legalTerms(const RenderContext &ctx)
{
    const DocumentPayload &p = *ctx.payload;
    const QList<Clause> clauses = legalClauses(p);

    Section section;
    section.name = QStringLiteral("legal");
    section.spaceBefore = kSectionGap;
    if (clauses.isEmpty())
        return section;

    const bool hasCgv = !p.business.cgvText.trimmed().isEmpty();
    const QString pageTitle = hasCgv ? QStringLiteral("Conditions générales de vente")
                                     : QStringLiteral("Mentions légales");
    section.startsOnFreshPage = true;
    section.repeatHeader = true;

    const TextStyle titleStyle = ctx.style(kLegalTitleSize, Tone::Primary, true);
    Row header;
    header.height = 28.0;
    header.texts.append(makeRun(pageTitle, ctx.content.left(), 16.0, titleStyle));
    section.header = header;

    const TextStyle subtitleStyle = ctx.style(kSmallSize, Tone::Primary, true);
    const TextStyle bodyStyle = ctx.style(kTinySize, Tone::Legal);

    for (const Clause &clause : clauses) {
        if (clause.title != pageTitle) {
            Row subtitle = labelRow(clause.title, ctx.content.left(), subtitleStyle, 16.0);
            subtitle.keepWithNext = true;
            section.rows.append(subtitle);
        }
        for (const QString &paragraph : splitParagraphs(clause.text)) {
            appendRows(section.rows, textRows(paragraph, ctx.content.left(), ctx.content.width(),
                                              bodyStyle, kSmallLineHeight));
            section.rows.append(Row::spacer(kParagraphGap));
        }
        section.rows.append(Row::spacer(kParagraphGap));
    }

    return section;
}

// ---------------------------------------------------------------------------
// Footer
// ---------------------------------------------------------------------------

Section footer(const RenderContext &ctx, const QList<Row> &closingRows, bool withNote)
{
    const DocumentPayload &p = *ctx.payload;
    const PartyDetails &b = p.business;
    const qreal x = ctx.content.left();
    const qreal width = ctx.content.width();

    Section section;
    section.name = QStringLiteral("footer");
    section.spaceBefore = kSectionGap;

    QStringList bankLines;
    addLabelled(bankLines, "Titulaire: ", b.accountHolder);
    addLabelled(bankLines, "Banque: ", b.bankName);
    addLabelled(bankLines, "IBAN: ", b.iban);
    addLabelled(bankLines, "BIC: ", b.bic);
    const QString terms = paymentTermsLine(b, p.paymentTermsDays);

    const TextStyle lineStyle = ctx.style(kSmallSize, Tone::Secondary);

    if (!terms.isEmpty() || !bankLines.isEmpty()) {
        Row heading = labelRow(QStringLiteral("Règlement"), x,
                               ctx.style(kSectionSize, Tone::Primary, true), 18.0);
        heading.keepWithNext = true;
        section.rows.append(heading);
        appendRows(section.rows, textRows(terms, x, width, lineStyle, kRowHeight));
        for (const QString &line : bankLines)
            appendRows(section.rows, textRows(line, x, width, lineStyle, kRowHeight));
    }

    const QStringList noteParagraphs = withNote ? splitParagraphs(p.note) : QStringList();
    if (!noteParagraphs.isEmpty()) {
        section.rows.append(Row::spacer(kRowGap));
        Row heading = labelRow(QStringLiteral("Remarques"), x,
                               ctx.style(kSmallSize, Tone::Primary, true), 16.0);
        heading.keepWithNext = true;
        section.rows.append(heading);
        for (const QString &paragraph : noteParagraphs)
            appendRows(section.rows, textRows(paragraph, x, width, lineStyle, kRowHeight));
    }

    if (!closingRows.isEmpty()) {
        if (!section.rows.isEmpty())
            section.rows.append(Row::spacer(kBlockGap));
        appendRows(section.rows, closingRows);
    }

    return section;
}

QList<Row> signatureRows(const RenderContext &ctx)
{
    const qreal x = ctx.content.left();
    QList<Row> rows;

    Row heading = labelRow(QStringLiteral("Bon pour accord"), x,
                           ctx.style(kSectionSize, Tone::Primary, true), 18.0);
    heading.keepWithNext = true;
    rows.append(heading);

    Row caption = labelRow(QStringLiteral("Signature du client"), x,
                           ctx.style(kSmallSize, Tone::Secondary), kRowHeight);
    caption.keepWithNext = true;
    rows.append(caption);

    Row box;
    box.height = 78.0;
    Layout::BoxRun frame;
    frame.rect = QRectF(x, 4.0, 240.0, 70.0);
    frame.width = 0.8;
    frame.color = toneColor(Tone::Rule);
    box.boxes.append(frame);
    rows.append(box);

    return rows;
}

QList<Row> closingLineRows(const RenderContext &ctx, const QStringList &lines)
{
    QList<Row> rows;
    const TextStyle style = ctx.style(kSmallSize, Tone::Secondary);
    for (int i = 0; i < lines.size(); ++i) {
        Row row = labelRow(lines[i], ctx.content.left(), style, kRowHeight);
        row.keepWithNext = i + 1 < lines.size();
        rows.append(row);
    }
    return rows;
}

} // namespace Sections
