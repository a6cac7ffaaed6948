/*
 * documentpayload.cpp — Sanitizing and JSON reading for DocumentPayload
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentpayload.h"
#include "documenterrors.h"
#include "textsanitizer.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include <cmath>

using TextSanitizer::sanitize;
using TextSanitizer::sanitizeLine;

QString LineItem::resolvedUnitLabel() const
{
    const QString explicitLabel = unitLabel.trimmed();
    if (!explicitLabel.isEmpty())
        return explicitLabel;
    if (billingUnit == QLatin1String("MONTHLY"))
        return QStringLiteral("/mois");
    return {};
}

DocumentPayload DocumentPayload::sanitized() const
{
    DocumentPayload p = *this;

    p.documentId = sanitizeLine(documentId);
    p.number = sanitizeLine(number);
    p.requestId = sanitizeLine(requestId);
    p.businessName = sanitizeLine(businessName);
    p.clientName = sanitizeLine(clientName);
    p.clientEmail = sanitizeLine(clientEmail);
    p.projectName = sanitizeLine(projectName);
    p.prestationsText = sanitize(prestationsText);
    p.issuedAt = sanitizeLine(issuedAt);
    p.expiresAt = sanitizeLine(expiresAt);
    p.dueAt = sanitizeLine(dueAt);
    p.paidAt = sanitizeLine(paidAt);
    p.currency = sanitizeLine(currency).toUpper();
    p.note = sanitize(note);

    PartyDetails &b = p.business;
    b.legalName = sanitizeLine(business.legalName);
    b.addressLine1 = sanitizeLine(business.addressLine1);
    b.addressLine2 = sanitizeLine(business.addressLine2);
    b.postalCode = sanitizeLine(business.postalCode);
    b.city = sanitizeLine(business.city);
    b.countryCode = sanitizeLine(business.countryCode);
    b.siret = sanitizeLine(business.siret);
    b.vatNumber = sanitizeLine(business.vatNumber);
    b.websiteUrl = sanitizeLine(business.websiteUrl);
    b.email = sanitizeLine(business.email);
    b.phone = sanitizeLine(business.phone);
    b.iban = sanitizeLine(business.iban);
    b.bic = sanitizeLine(business.bic);
    b.bankName = sanitizeLine(business.bankName);
    b.accountHolder = sanitizeLine(business.accountHolder);
    b.cgvText = sanitize(business.cgvText);
    b.paymentTermsText = sanitize(business.paymentTermsText);
    b.lateFeesText = sanitize(business.lateFeesText);
    b.fixedIndemnityText = sanitize(business.fixedIndemnityText);
    b.legalMentionsText = sanitize(business.legalMentionsText);
    b.billingLegalText = sanitize(business.billingLegalText);
    b.legalText = sanitize(business.legalText);

    ClientDetails &c = p.client;
    c.name = sanitizeLine(client.name);
    c.companyName = sanitizeLine(client.companyName);
    c.address = sanitize(client.address);
    c.addressLine1 = sanitizeLine(client.addressLine1);
    c.addressLine2 = sanitizeLine(client.addressLine2);
    c.postalCode = sanitizeLine(client.postalCode);
    c.city = sanitizeLine(client.city);
    c.countryCode = sanitizeLine(client.countryCode);
    c.email = sanitizeLine(client.email);
    c.phone = sanitizeLine(client.phone);
    c.vatNumber = sanitizeLine(client.vatNumber);
    c.reference = sanitizeLine(client.reference);

    for (LineItem &item : p.items) {
        item.label = sanitizeLine(item.label);
        item.description = sanitize(item.description);
        item.discount = sanitizeLine(item.discount);
        item.unitLabel = sanitizeLine(item.unitLabel);
        item.billingUnit = sanitizeLine(item.billingUnit).toUpper();
    }

    return p;
}

// ---------------------------------------------------------------------------
// fromJson
// ---------------------------------------------------------------------------

namespace {

// Largest integer a JSON double carries exactly
constexpr double kMaxExactDouble = 9007199254740992.0;

QString str(const QJsonObject &obj, const char *key)
{
    return obj.value(QLatin1String(key)).toString();
}

std::optional<qint64> optionalCents(const QJsonObject &obj, const char *key, const QString &field)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return std::nullopt;
    if (v.isDouble()) {
        const double d = v.toDouble();
        if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > kMaxExactDouble)
            throw ValidationError(field, QStringLiteral("not an integer amount of cents"));
        return static_cast<qint64>(d);
    }
    if (v.isString()) {
        bool ok = false;
        const qint64 cents = v.toString().trimmed().toLongLong(&ok);
        if (!ok)
            throw ValidationError(field, QStringLiteral("not an integer amount of cents"));
        return cents;
    }
    throw ValidationError(field, QStringLiteral("not an integer amount of cents"));
}

qint64 cents(const QJsonObject &obj, const char *key, const QString &field)
{
    return optionalCents(obj, key, field).value_or(0);
}

std::optional<double> optionalNumber(const QJsonObject &obj, const char *key, const QString &field)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isUndefined() || v.isNull())
        return std::nullopt;
    if (v.isDouble())
        return v.toDouble();
    if (v.isString()) {
        bool ok = false;
        QString text = v.toString().trimmed();
        text.replace(QLatin1Char(','), QLatin1Char('.'));
        const double d = text.toDouble(&ok);
        if (ok)
            return d;
    }
    throw ValidationError(field, QStringLiteral("not a number"));
}

PartyDetails partyFromJson(const QJsonObject &obj)
{
    PartyDetails b;
    b.legalName = str(obj, "legalName");
    b.addressLine1 = str(obj, "addressLine1");
    b.addressLine2 = str(obj, "addressLine2");
    b.postalCode = str(obj, "postalCode");
    b.city = str(obj, "city");
    b.countryCode = str(obj, "countryCode");
    b.siret = str(obj, "siret");
    b.vatNumber = str(obj, "vatNumber");
    b.websiteUrl = str(obj, "websiteUrl");
    b.email = str(obj, "email");
    b.phone = str(obj, "phone");
    b.iban = str(obj, "iban");
    b.bic = str(obj, "bic");
    b.bankName = str(obj, "bankName");
    b.accountHolder = str(obj, "accountHolder");
    b.cgvText = str(obj, "cgvText");
    b.paymentTermsText = str(obj, "paymentTermsText");
    b.lateFeesText = str(obj, "lateFeesText");
    b.fixedIndemnityText = str(obj, "fixedIndemnityText");
    b.legalMentionsText = str(obj, "legalMentionsText");
    b.billingLegalText = str(obj, "billingLegalText");
    b.legalText = str(obj, "legalText");
    return b;
}

ClientDetails clientFromJson(const QJsonObject &obj)
{
    ClientDetails c;
    c.name = str(obj, "name");
    c.companyName = str(obj, "companyName");
    c.address = str(obj, "address");
    c.addressLine1 = str(obj, "addressLine1");
    c.addressLine2 = str(obj, "addressLine2");
    c.postalCode = str(obj, "postalCode");
    c.city = str(obj, "city");
    c.countryCode = str(obj, "countryCode");
    c.email = str(obj, "email");
    c.phone = str(obj, "phone");
    c.vatNumber = str(obj, "vatNumber");
    c.reference = str(obj, "reference");
    return c;
}

LineItem itemFromJson(const QJsonObject &obj, int index)
{
    const QString prefix = QStringLiteral("items[%1].").arg(index);

    LineItem item;
    item.label = str(obj, "label");
    item.description = str(obj, "description");
    item.quantity = optionalNumber(obj, "quantity", prefix + QLatin1String("quantity")).value_or(1.0);
    item.unitPriceCents = cents(obj, "unitPriceCents", prefix + QLatin1String("unitPriceCents"));
    item.originalUnitPriceCents = optionalCents(obj, "originalUnitPriceCents",
                                                prefix + QLatin1String("originalUnitPriceCents"));
    item.discount = str(obj, "discount");
    item.unitLabel = str(obj, "unitLabel");
    item.billingUnit = str(obj, "billingUnit");
    item.totalCents = cents(obj, "totalCents", prefix + QLatin1String("totalCents"));
    return item;
}

} // namespace

DocumentPayload DocumentPayload::fromJson(const QJsonObject &obj)
{
    DocumentPayload p;

    p.documentId = str(obj, "documentId");
    if (p.documentId.isEmpty())
        p.documentId = str(obj, "quoteId");
    if (p.documentId.isEmpty())
        p.documentId = str(obj, "invoiceId");
    p.number = str(obj, "number");
    p.requestId = str(obj, "requestId");

    p.businessName = str(obj, "businessName");
    p.business = partyFromJson(obj.value(QLatin1String("business")).toObject());
    p.client = clientFromJson(obj.value(QLatin1String("client")).toObject());
    p.clientName = str(obj, "clientName");
    p.clientEmail = str(obj, "clientEmail");

    p.projectName = str(obj, "projectName");
    p.prestationsText = str(obj, "prestationsText");

    p.issuedAt = str(obj, "issuedAt");
    p.expiresAt = str(obj, "expiresAt");
    p.dueAt = str(obj, "dueAt");
    p.paidAt = str(obj, "paidAt");

    p.totalCents = cents(obj, "totalCents", QStringLiteral("totalCents"));
    p.depositCents = cents(obj, "depositCents", QStringLiteral("depositCents"));
    p.balanceCents = cents(obj, "balanceCents", QStringLiteral("balanceCents"));
    if (obj.contains(QLatin1String("currency")))
        p.currency = str(obj, "currency");

    p.vatEnabled = obj.value(QLatin1String("vatEnabled")).toBool(false);
    p.vatRatePercent = optionalNumber(obj, "vatRatePercent", QStringLiteral("vatRatePercent")).value_or(0.0);
    p.depositPercent = optionalNumber(obj, "depositPercent", QStringLiteral("depositPercent"));
    if (auto days = optionalNumber(obj, "paymentTermsDays", QStringLiteral("paymentTermsDays"))) {
        if (!std::isfinite(*days) || std::fabs(*days) > 100000.0)
            throw ValidationError(QStringLiteral("paymentTermsDays"), QStringLiteral("out of range"));
        p.paymentTermsDays = static_cast<int>(std::lround(*days));
    }

    p.note = str(obj, "note");

    const QJsonArray items = obj.value(QLatin1String("items")).toArray();
    for (int i = 0; i < items.size(); ++i)
        p.items.append(itemFromJson(items.at(i).toObject(), i));

    return p;
}
