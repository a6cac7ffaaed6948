/*
 * documentbuilder.h — Quote and invoice PDF generation
 *
 * A builder validates the payload, sanitizes it, lays the sections out
 * in their fixed order on recorded pages, then replays the pages into a
 * PDF with a "Page i/N" footer once the page total is known. Builders
 * hold no per-render state; one instance can serve concurrent calls.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_DOCUMENTBUILDER_H
#define LEDGERPRINT_DOCUMENTBUILDER_H

#include <memory>

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

#include "documentpayload.h"
#include "layoutrows.h"
#include "rendersettings.h"
#include "sectionrenderers.h"

struct RenderedDocument {
    QByteArray bytes;
    int pageCount = 0;
};

enum class DocumentType {
    Quote,
    Invoice,
};

class DocumentBuilder {
public:
    explicit DocumentBuilder(const RenderSettings &settings = RenderSettings());
    virtual ~DocumentBuilder();

    // Throws ValidationError before any layout work, LayoutOverflowError
    // when the content exceeds the page guard or a row cannot fit on a
    // page, RenderError when the PDF cannot be produced.
    RenderedDocument build(const DocumentPayload &payload) const;

    // Checks a sanitized payload, so text the sanitizer strips to nothing
    // counts as missing. Throws ValidationError naming the field.
    void validate(const DocumentPayload &payload) const;

    // Sections in print order for an already sanitized payload
    QList<Layout::Section> composeSections(const Sections::RenderContext &ctx) const;

    const RenderSettings &settings() const { return m_settings; }

    virtual DocumentType type() const = 0;

protected:
    virtual QString titleWord() const = 0;                       // "DEVIS"
    virtual QString numberLine(const DocumentPayload &p) const = 0;
    virtual QStringList metadataLines(const DocumentPayload &p) const = 0;
    virtual QString depositLabel(const DocumentPayload &p) const;
    virtual QList<Layout::Row> closingRows(const Sections::RenderContext &ctx) const = 0;

    QList<Sections::TotalsLine> totalsLines(const DocumentPayload &p) const;

private:
    RenderSettings m_settings;
};

class QuoteBuilder : public DocumentBuilder {
public:
    using DocumentBuilder::DocumentBuilder;

    DocumentType type() const override { return DocumentType::Quote; }

protected:
    QString titleWord() const override;
    QString numberLine(const DocumentPayload &p) const override;
    QStringList metadataLines(const DocumentPayload &p) const override;
    QString depositLabel(const DocumentPayload &p) const override;
    QList<Layout::Row> closingRows(const Sections::RenderContext &ctx) const override;
};

class InvoiceBuilder : public DocumentBuilder {
public:
    using DocumentBuilder::DocumentBuilder;

    DocumentType type() const override { return DocumentType::Invoice; }

protected:
    QString titleWord() const override;
    QString numberLine(const DocumentPayload &p) const override;
    QStringList metadataLines(const DocumentPayload &p) const override;
    QList<Layout::Row> closingRows(const Sections::RenderContext &ctx) const override;
};

std::unique_ptr<DocumentBuilder> createBuilder(DocumentType type,
                                               const RenderSettings &settings = RenderSettings());

#endif // LEDGERPRINT_DOCUMENTBUILDER_H
