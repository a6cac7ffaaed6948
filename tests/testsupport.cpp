/*
 * testsupport.cpp — Shared payloads and printers for the unit tests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "testsupport.h"

#include <memory>

#include <poppler-qt6.h>

namespace TestSupport {

namespace {

// Amount pasted with a narrow no-break space as group separator
const QString kOddAmount = QStringLiteral("2\u202F500,00 \u20AC");

PartyDetails studioBusiness()
{
    QStringList clauses;
    for (int i = 1; i <= 45; ++i)
        clauses << QStringLiteral("Clause %1 : prestation longue description pour test multi-page.").arg(i);

    PartyDetails b;
    b.legalName = QStringLiteral("Studio Lune SAS");
    b.addressLine1 = QStringLiteral("10 rue des Lilas");
    b.postalCode = QStringLiteral("75001");
    b.city = QStringLiteral("Paris");
    b.countryCode = QStringLiteral("FR");
    b.siret = QStringLiteral("123 456 789 00010");
    b.vatNumber = QStringLiteral("FR123456789");
    b.websiteUrl = QStringLiteral("https://lune.app");
    b.iban = QStringLiteral("FR7630001000102679233217");
    b.bic = QStringLiteral("REVOFRP2");
    b.cgvText = clauses.join(QLatin1Char('\n'));
    b.paymentTermsText = QStringLiteral("Paiement \u00E0 30 jours.");
    b.lateFeesText = QStringLiteral("P\u00E9nalit\u00E9s de retard : 3x le taux l\u00E9gal.");
    b.fixedIndemnityText = QStringLiteral("Indemnit\u00E9 forfaitaire de 40\u20AC pour frais de recouvrement.");
    b.legalMentionsText = QStringLiteral("TVA non applicable - article 293B du CGI.");
    return b;
}

} // namespace

DocumentPayload minimalPayload()
{
    DocumentPayload p;
    p.documentId = QStringLiteral("1");
    p.number = QStringLiteral("DEV-0001");
    p.businessName = QStringLiteral("Atelier Test");
    p.issuedAt = QStringLiteral("2026-03-05T10:00:00.000Z");
    p.totalCents = 10000;
    p.depositCents = 3000;
    p.balanceCents = 7000;

    LineItem item;
    item.label = QStringLiteral("Conseil");
    item.quantity = 1;
    item.unitPriceCents = 10000;
    item.totalCents = 10000;
    p.items.append(item);
    return p;
}

DocumentPayload studioPayload(bool invoice)
{
    QStringList prestations;
    for (int i = 1; i <= 12; ++i)
        prestations << QStringLiteral("Prestation %1 : description d\u00E9taill\u00E9e du p\u00E9rim\u00E8tre et des livrables.").arg(i);

    DocumentPayload p;
    p.documentId = invoice ? QStringLiteral("456") : QStringLiteral("123");
    p.number = invoice ? QStringLiteral("SF-FAC-2026-0001") : QStringLiteral("SF-DEV-2026-0001");
    p.businessName = QStringLiteral("Studio Lune");
    p.business = studioBusiness();

    p.client.name = QStringLiteral("Client Exemple");
    p.client.companyName = QStringLiteral("Client & Co");
    p.client.address = QStringLiteral("5 avenue de la R\u00E9publique, 75011 Paris");
    p.client.email = QStringLiteral("client@example.com");
    p.client.phone = QStringLiteral("+33 6 00 00 00 00");

    p.projectName = QStringLiteral("Projet D\u00E9mo");
    p.prestationsText = prestations.join(QLatin1Char('\n'));

    p.issuedAt = QStringLiteral("2026-03-05T10:00:00.000Z");
    if (invoice)
        p.dueAt = QStringLiteral("2026-03-19T10:00:00.000Z");
    else
        p.expiresAt = QStringLiteral("2026-03-12T10:00:00.000Z");
    if (!invoice)
        p.depositPercent = 30;

    p.totalCents = 250000;
    p.depositCents = 75000;
    p.balanceCents = 175000;
    p.currency = QStringLiteral("EUR");
    p.vatEnabled = true;
    p.vatRatePercent = 20;
    p.paymentTermsDays = 30;
    p.note = (invoice ? QStringLiteral("Facture : ") : QStringLiteral("Montant indicatif : ")) + kOddAmount;

    for (int i = 1; i <= 40; ++i) {
        LineItem item;
        item.label = QStringLiteral("Service %1 %2").arg(i).arg(kOddAmount);
        item.description = QStringLiteral("Description d\u00E9taill\u00E9e de la prestation avec plusieurs mots "
                                          "pour forcer le retour \u00E0 la ligne.");
        item.quantity = 1;
        item.unitPriceCents = 200000;
        item.originalUnitPriceCents = 250000;
        item.unitLabel = QStringLiteral("/mois");
        item.billingUnit = QStringLiteral("MONTHLY");
        item.totalCents = 200000;
        p.items.append(item);
    }
    return p;
}

QStringList pdfPageTexts(const QByteArray &pdf)
{
    QStringList texts;
    std::unique_ptr<Poppler::Document> doc = Poppler::Document::loadFromData(pdf);
    if (!doc || doc->isLocked())
        return texts;
    for (int i = 0; i < doc->numPages(); ++i) {
        std::unique_ptr<Poppler::Page> page = doc->page(i);
        texts << (page ? page->text(QRectF()) : QString());
    }
    return texts;
}

} // namespace TestSupport
