/*
 * documentpayload.h — Input of a quote or invoice render
 *
 * Amounts are integer cents throughout; the totals are authoritative
 * and are displayed as given, never re-derived from the items.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_DOCUMENTPAYLOAD_H
#define LEDGERPRINT_DOCUMENTPAYLOAD_H

#include <optional>

#include <QList>
#include <QString>
#include <QtGlobal>

class QJsonObject;

// Issuer identity, bank details and legal clauses
struct PartyDetails {
    QString legalName;
    QString addressLine1;
    QString addressLine2;
    QString postalCode;
    QString city;
    QString countryCode;
    QString siret;
    QString vatNumber;
    QString websiteUrl;
    QString email;
    QString phone;

    QString iban;
    QString bic;
    QString bankName;
    QString accountHolder;

    QString cgvText;             // general terms of sale
    QString paymentTermsText;
    QString lateFeesText;
    QString fixedIndemnityText;
    QString legalMentionsText;
    QString billingLegalText;
    QString legalText;           // used only when none of the above is set
};

struct ClientDetails {
    QString name;
    QString companyName;
    QString address;             // free form, used without structured lines
    QString addressLine1;
    QString addressLine2;
    QString postalCode;
    QString city;
    QString countryCode;
    QString email;
    QString phone;
    QString vatNumber;
    QString reference;
};

struct LineItem {
    QString label;
    QString description;
    double quantity = 1.0;
    qint64 unitPriceCents = 0;
    std::optional<qint64> originalUnitPriceCents;
    QString discount;            // e.g. "-20 %", shown next to a struck original price
    QString unitLabel;
    QString billingUnit;         // "MONTHLY", "ONE_OFF", ...
    qint64 totalCents = 0;

    // Explicit unit label, else "/mois" for monthly billing, else empty
    QString resolvedUnitLabel() const;
    bool showsOriginalPrice() const
    {
        return originalUnitPriceCents && *originalUnitPriceCents > unitPriceCents;
    }
};

struct DocumentPayload {
    QString documentId;
    QString number;              // allocated externally, printed verbatim
    QString requestId;

    QString businessName;
    PartyDetails business;
    ClientDetails client;
    QString clientName;          // fallbacks when client details are absent
    QString clientEmail;

    QString projectName;
    QString prestationsText;

    // ISO-8601 dates
    QString issuedAt;
    QString expiresAt;
    QString dueAt;
    QString paidAt;

    qint64 totalCents = 0;
    qint64 depositCents = 0;
    qint64 balanceCents = 0;
    QString currency{QStringLiteral("EUR")};

    bool vatEnabled = false;
    double vatRatePercent = 0.0;
    std::optional<double> depositPercent;
    std::optional<int> paymentTermsDays;

    QString note;
    QList<LineItem> items;

    QString displayNumber() const { return number.isEmpty() ? documentId : number; }

    // Copy with every free-text field passed through TextSanitizer
    DocumentPayload sanitized() const;

    // Keys mirror the member names. Amounts are JSON integers or
    // decimal-integer strings; anything else raises ValidationError.
    static DocumentPayload fromJson(const QJsonObject &obj);
};

#endif // LEDGERPRINT_DOCUMENTPAYLOAD_H
