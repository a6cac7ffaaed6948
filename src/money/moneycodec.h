/*
 * moneycodec.h — Integer cents <-> French-locale decimal strings
 *
 * Amounts are never converted to floating point.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_MONEYCODEC_H
#define LEDGERPRINT_MONEYCODEC_H

#include <optional>

#include <QString>
#include <QtGlobal>

namespace Money {

struct FormatOptions {
    int minimumFractionDigits = 0;   // 0: fraction only when non-zero; 2: always
    bool groupThousands = false;
};

// 10000 -> "100", 10050 -> "100,50", 10005 -> "100,05".
// A non-empty currency code appends its symbol: "100 €".
QString formatCentsToDisplay(qint64 cents, const QString &currency = QString(),
                             const FormatOptions &options = FormatOptions());

// Document form: two fraction digits, grouped thousands, currency symbol.
// 250000, "EUR" -> "2 500,00 €"
QString formatAmount(qint64 cents, const QString &currency);

// Accepts comma or dot decimals, surrounding currency symbols or codes,
// any kind of space and thousands separators. Fraction digits beyond the
// second are truncated. std::nullopt for empty, malformed or
// out-of-range input.
std::optional<qint64> parseDisplayToCents(const QString &input);

// "EUR" -> "€", "USD" -> "$", "GBP" -> "£", anything else unchanged.
QString currencySymbol(const QString &code);

// 20 -> "20", 5.5 -> "5,5"
QString formatPercent(double percent);

// 1 -> "1", 1.5 -> "1,5", 0.25 -> "0,25"
QString formatQuantity(double quantity);

} // namespace Money

#endif // LEDGERPRINT_MONEYCODEC_H
