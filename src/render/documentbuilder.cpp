/*
 * documentbuilder.cpp — Quote and invoice PDF generation
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentbuilder.h"
#include "documenterrors.h"
#include "fontmanager.h"
#include "headerfooterrenderer.h"
#include "moneycodec.h"
#include "paginator.h"
#include "pdfcanvas.h"
#include "recordingcanvas.h"

#include <QDebug>

#include <cmath>
#include <limits>

using Layout::Row;
using Layout::Section;

namespace {

// Largest total whose VAT product (total x basis points) fits in qint64
constexpr qint64 kMaxTotalCents = std::numeric_limits<qint64>::max() / 10000;

void requireNonNegative(qint64 cents, const QString &field)
{
    if (cents < 0)
        throw ValidationError(field, QStringLiteral("must not be negative"));
    if (cents > kMaxTotalCents)
        throw ValidationError(field, QStringLiteral("amount too large"));
}

} // namespace

DocumentBuilder::DocumentBuilder(const RenderSettings &settings)
    : m_settings(settings)
{
}

DocumentBuilder::~DocumentBuilder() = default;

void DocumentBuilder::validate(const DocumentPayload &payload) const
{
    if (payload.businessName.trimmed().isEmpty() && payload.business.legalName.trimmed().isEmpty())
        throw ValidationError(QStringLiteral("businessName"), QStringLiteral("is required"));

    if (payload.items.isEmpty())
        throw ValidationError(QStringLiteral("items"), QStringLiteral("at least one line item is required"));

    if (payload.currency.trimmed().isEmpty())
        throw ValidationError(QStringLiteral("currency"), QStringLiteral("is required"));

    requireNonNegative(payload.totalCents, QStringLiteral("totalCents"));
    requireNonNegative(payload.depositCents, QStringLiteral("depositCents"));
    requireNonNegative(payload.balanceCents, QStringLiteral("balanceCents"));

    if (payload.vatEnabled) {
        const double rate = payload.vatRatePercent;
        if (!std::isfinite(rate) || rate < 0.0 || rate > 100.0)
            throw ValidationError(QStringLiteral("vatRatePercent"),
                                  QStringLiteral("must be between 0 and 100"));
    }

    if (payload.depositPercent) {
        const double pct = *payload.depositPercent;
        if (!std::isfinite(pct) || pct < 0.0 || pct > 100.0)
            throw ValidationError(QStringLiteral("depositPercent"),
                                  QStringLiteral("must be between 0 and 100"));
    }

    if (payload.paymentTermsDays && *payload.paymentTermsDays < 0)
        throw ValidationError(QStringLiteral("paymentTermsDays"), QStringLiteral("must not be negative"));

    for (int i = 0; i < payload.items.size(); ++i) {
        const LineItem &item = payload.items[i];
        const QString prefix = QStringLiteral("items[%1].").arg(i);

        if (!std::isfinite(item.quantity) || item.quantity <= 0.0)
            throw ValidationError(prefix + QLatin1String("quantity"),
                                  QStringLiteral("must be a positive number"));
        requireNonNegative(item.unitPriceCents, prefix + QLatin1String("unitPriceCents"));
        requireNonNegative(item.totalCents, prefix + QLatin1String("totalCents"));
        if (item.originalUnitPriceCents)
            requireNonNegative(*item.originalUnitPriceCents,
                               prefix + QLatin1String("originalUnitPriceCents"));
    }
}

QString DocumentBuilder::depositLabel(const DocumentPayload &) const
{
    return QStringLiteral("Acompte");
}

QList<Sections::TotalsLine> DocumentBuilder::totalsLines(const DocumentPayload &p) const
{
    QList<Sections::TotalsLine> lines;
    const QString &cur = p.currency;

    qint64 vat = 0;
    lines.append(Sections::TotalsLine{QStringLiteral("Sous-total HT"), Money::formatAmount(p.totalCents, cur)});
    if (p.vatEnabled) {
        vat = Sections::vatCents(p.totalCents, p.vatRatePercent);
        lines.append(Sections::TotalsLine{QStringLiteral("TVA %1 %").arg(Money::formatPercent(p.vatRatePercent)),
                                          Money::formatAmount(vat, cur)});
    }

    Sections::TotalsLine ttc;
    ttc.label = QStringLiteral("Total TTC");
    ttc.value = Money::formatAmount(p.totalCents + vat, cur);
    ttc.emphasized = true;
    lines.append(ttc);

    Sections::TotalsLine deposit;
    deposit.label = depositLabel(p);
    deposit.value = Money::formatAmount(p.depositCents, cur);
    deposit.gapBefore = true;
    lines.append(deposit);

    lines.append(Sections::TotalsLine{QStringLiteral("Solde"), Money::formatAmount(p.balanceCents, cur)});
    return lines;
}

QList<Section> DocumentBuilder::composeSections(const Sections::RenderContext &ctx) const
{
    const DocumentPayload &p = *ctx.payload;
    // Without any date the title carries no year
    const std::optional<int> year = Sections::documentYear(p);
    const QString title = year ? QStringLiteral("%1 %2").arg(titleWord()).arg(*year) : titleWord();
    const bool quote = type() == DocumentType::Quote;

    QList<Section> sections;
    sections.append(Sections::identityHeader(ctx, title, numberLine(p)));
    sections.append(Sections::documentMetadata(ctx, metadataLines(p)));
    sections.append(Sections::clientBlock(ctx));
    sections.append(Sections::projectDescription(ctx, quote));
    sections.append(Sections::itemTable(ctx));
    sections.append(Sections::totals(ctx, totalsLines(p)));
    if (quote)
        sections.append(Sections::collaborationTerms(ctx));
    sections.append(Sections::legalTerms(ctx));
    sections.append(Sections::footer(ctx, closingRows(ctx), !quote));
    return sections;
}

RenderedDocument DocumentBuilder::build(const DocumentPayload &payload) const
{
    const DocumentPayload clean = payload.sanitized();
    validate(clean);

    FontManager &fonts = FontManager::shared();
    Sections::RenderContext ctx;
    ctx.payload = &clean;
    ctx.regular = fonts.face(m_settings.fontFamily, FontRole::Regular);
    ctx.bold = fonts.face(m_settings.fontFamily, FontRole::Bold);
    ctx.content = m_settings.pageLayout.contentRect();

    // Pass 1: lay out onto recorded pages
    RecordingCanvas recording;
    Layout::Paginator paginator(&recording, m_settings.pageLayout, m_settings.maxPages);
    const QList<Section> sections = composeSections(ctx);
    for (const Section &section : sections)
        paginator.placeBlock(section);

    // Pass 2: replay with footers now that the total is known
    PdfExportOptions options = m_settings.pdf;
    if (options.title.isEmpty())
        options.title = numberLine(clean);
    if (options.author.isEmpty())
        options.author = clean.business.legalName.isEmpty() ? clean.businessName
                                                            : clean.business.legalName;

    PdfCanvas pdf(options);
    PageMetadata meta;
    meta.totalPages = recording.pageCount();
    meta.documentNumber = clean.displayNumber();
    meta.title = options.title;
    for (int i = 0; i < recording.pageCount(); ++i) {
        recording.replayPage(i, pdf);
        meta.pageNumber = i;
        HeaderFooterRenderer::drawFooter(&pdf, m_settings.pageLayout, meta, ctx.regular);
    }

    RenderedDocument doc;
    doc.bytes = pdf.save();
    doc.pageCount = pdf.pageCount();

    qDebug() << "DocumentBuilder:" << titleWord() << clean.displayNumber()
             << doc.pageCount << "pages," << doc.bytes.size() << "bytes";
    return doc;
}

// ---------------------------------------------------------------------------
// Quote
// ---------------------------------------------------------------------------

QString QuoteBuilder::titleWord() const
{
    return QStringLiteral("DEVIS");
}

QString QuoteBuilder::numberLine(const DocumentPayload &p) const
{
    return QStringLiteral("Devis n° %1").arg(p.displayNumber());
}

QStringList QuoteBuilder::metadataLines(const DocumentPayload &p) const
{
    QStringList lines;
    if (!p.issuedAt.isEmpty())
        lines.append(QStringLiteral("Créé le %1").arg(Sections::formatDate(p.issuedAt)));
    if (!p.expiresAt.isEmpty())
        lines.append(QStringLiteral("Valable jusqu'au %1").arg(Sections::formatDate(p.expiresAt)));
    lines.append(QStringLiteral("Devise: %1").arg(p.currency));
    if (!p.requestId.isEmpty())
        lines.append(QStringLiteral("Req: %1").arg(p.requestId));
    return lines;
}

QString QuoteBuilder::depositLabel(const DocumentPayload &p) const
{
    if (p.depositPercent)
        return QStringLiteral("Acompte %1 %").arg(Money::formatPercent(*p.depositPercent));
    return DocumentBuilder::depositLabel(p);
}

QList<Row> QuoteBuilder::closingRows(const Sections::RenderContext &ctx) const
{
    return Sections::signatureRows(ctx);
}

// ---------------------------------------------------------------------------
// Invoice
// ---------------------------------------------------------------------------

QString InvoiceBuilder::titleWord() const
{
    return QStringLiteral("FACTURE");
}

QString InvoiceBuilder::numberLine(const DocumentPayload &p) const
{
    return QStringLiteral("Facture n° %1").arg(p.displayNumber());
}

QStringList InvoiceBuilder::metadataLines(const DocumentPayload &p) const
{
    QStringList lines;
    if (!p.issuedAt.isEmpty())
        lines.append(QStringLiteral("Émise: %1").arg(Sections::formatDate(p.issuedAt)));
    if (!p.dueAt.isEmpty())
        lines.append(QStringLiteral("Échéance: %1").arg(Sections::formatDate(p.dueAt)));
    if (!p.paidAt.isEmpty())
        lines.append(QStringLiteral("Payée: %1").arg(Sections::formatDate(p.paidAt)));
    lines.append(QStringLiteral("Devise: %1").arg(p.currency));
    if (!p.requestId.isEmpty())
        lines.append(QStringLiteral("Req: %1").arg(p.requestId));
    return lines;
}

QList<Row> InvoiceBuilder::closingRows(const Sections::RenderContext &ctx) const
{
    QStringList lines{QStringLiteral("Merci pour votre paiement.")};
    if (ctx.payload->paidAt.isEmpty())
        lines.append(QStringLiteral("Règlement attendu à échéance."));
    return Sections::closingLineRows(ctx, lines);
}

std::unique_ptr<DocumentBuilder> createBuilder(DocumentType type, const RenderSettings &settings)
{
    switch (type) {
    case DocumentType::Quote:
        return std::make_unique<QuoteBuilder>(settings);
    case DocumentType::Invoice:
        return std::make_unique<InvoiceBuilder>(settings);
    }
    return nullptr;
}
