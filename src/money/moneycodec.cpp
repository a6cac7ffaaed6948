/*
 * moneycodec.cpp — Integer cents <-> French-locale decimal strings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "moneycodec.h"
#include "textsanitizer.h"

#include <QLocale>
#include <QRegularExpression>
#include <QStringList>
#include <QtNumeric>

#include <cmath>
#include <limits>

namespace Money {

namespace {

QString groupDigits(const QString &digits, const QString &separator)
{
    QString result;
    result.reserve(digits.size() + digits.size() / 3 * separator.size());
    const int leading = digits.size() % 3;
    for (int i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i - leading) % 3 == 0)
            result.append(separator);
        result.append(digits[i]);
    }
    return result;
}

QString formatDecimal(double value, int maxDecimals)
{
    if (!std::isfinite(value))
        return {};
    QString s = QString::number(value, 'f', maxDecimals);
    if (s.contains(QLatin1Char('.'))) {
        while (s.endsWith(QLatin1Char('0')))
            s.chop(1);
        if (s.endsWith(QLatin1Char('.')))
            s.chop(1);
    }
    if (s == QLatin1String("-0"))
        s = QStringLiteral("0");
    s.replace(QLatin1Char('.'), QLatin1Char(','));
    return s;
}

bool isSignChar(QChar c)
{
    return c == QLatin1Char('-') || c == QLatin1Char('+') || c == QChar(0x2212);
}

} // namespace

QString currencySymbol(const QString &code)
{
    const QString upper = code.trimmed().toUpper();
    if (upper == QLatin1String("EUR"))
        return QStringLiteral("€");
    if (upper == QLatin1String("USD"))
        return QStringLiteral("$");
    if (upper == QLatin1String("GBP"))
        return QStringLiteral("£");
    return upper;
}

QString formatCentsToDisplay(qint64 cents, const QString &currency, const FormatOptions &options)
{
    const bool negative = cents < 0;
    const quint64 magnitude = negative ? quint64(0) - static_cast<quint64>(cents)
                                       : static_cast<quint64>(cents);
    const quint64 units = magnitude / 100;
    const int fraction = static_cast<int>(magnitude % 100);

    QString integerPart = QString::number(units);
    if (options.groupThousands)
        integerPart = groupDigits(integerPart,
                                  QLocale(QLocale::French, QLocale::France).groupSeparator());

    QString result;
    if (negative)
        result.append(QLatin1Char('-'));
    result.append(integerPart);
    if (fraction != 0 || options.minimumFractionDigits > 0) {
        result.append(QLatin1Char(','));
        result.append(QStringLiteral("%1").arg(fraction, 2, 10, QLatin1Char('0')));
    }
    if (!currency.trimmed().isEmpty()) {
        result.append(QLatin1Char(' '));
        result.append(currencySymbol(currency));
    }

    // The locale group separator is a narrow no-break space
    return TextSanitizer::sanitizeLine(result);
}

QString formatAmount(qint64 cents, const QString &currency)
{
    FormatOptions options;
    options.minimumFractionDigits = 2;
    options.groupThousands = true;
    return formatCentsToDisplay(cents, currency, options);
}

std::optional<qint64> parseDisplayToCents(const QString &input)
{
    static const QRegularExpression currencyCode(QStringLiteral("\\b[A-Z]{3}\\b"));
    static const QRegularExpression separators(QStringLiteral("[,.]"));

    QString text = input;
    text.remove(currencyCode);

    QString digits;
    bool negative = false;
    bool signSeen = false;
    for (QChar c : text) {
        if (c.isSpace() || c.category() == QChar::Other_Format
            || c == QLatin1Char('\'') || c == QChar(0x2019))
            continue;
        if (c.category() == QChar::Symbol_Currency)
            continue;
        if ((c >= QLatin1Char('0') && c <= QLatin1Char('9'))
            || c == QLatin1Char(',') || c == QLatin1Char('.')) {
            digits.append(c);
            continue;
        }
        if (isSignChar(c)) {
            if (signSeen || !digits.isEmpty())
                return std::nullopt;
            signSeen = true;
            negative = c != QLatin1Char('+');
            continue;
        }
        return std::nullopt;
    }

    // Decide which separator, if any, is the decimal one
    const int commas = digits.count(QLatin1Char(','));
    const int dots = digits.count(QLatin1Char('.'));
    QChar decimal;
    if (commas > 0 && dots > 0) {
        decimal = digits.lastIndexOf(QLatin1Char(',')) > digits.lastIndexOf(QLatin1Char('.'))
            ? QLatin1Char(',') : QLatin1Char('.');
        if (digits.count(decimal) > 1)
            return std::nullopt;
    } else if (commas == 1) {
        decimal = QLatin1Char(',');
    } else if (dots == 1) {
        decimal = QLatin1Char('.');
    }

    QString integerPart = digits;
    QString fractionPart;
    if (!decimal.isNull()) {
        const int pos = digits.lastIndexOf(decimal);
        integerPart = digits.left(pos);
        fractionPart = digits.mid(pos + 1);
    }

    // Thousands groups: a leading group of 1-3 digits, then exactly three
    const QStringList groups = integerPart.split(separators);
    for (int i = 1; i < groups.size(); ++i) {
        if (groups[i].size() != 3 || groups.first().isEmpty())
            return std::nullopt;
    }
    integerPart = groups.join(QString());

    if (integerPart.isEmpty() && fractionPart.isEmpty())
        return std::nullopt;

    quint64 units = 0;
    for (QChar c : integerPart) {
        if (qMulOverflow(units, quint64(10), &units)
            || qAddOverflow(units, quint64(c.digitValue()), &units))
            return std::nullopt;
    }

    int fraction = 0;
    if (fractionPart.size() >= 1)
        fraction += fractionPart[0].digitValue() * 10;
    if (fractionPart.size() >= 2)
        fraction += fractionPart[1].digitValue();

    quint64 magnitude = 0;
    if (qMulOverflow(units, quint64(100), &magnitude)
        || qAddOverflow(magnitude, quint64(fraction), &magnitude))
        return std::nullopt;

    const quint64 maxPositive = static_cast<quint64>(std::numeric_limits<qint64>::max());
    if (magnitude > (negative ? maxPositive + 1 : maxPositive))
        return std::nullopt;

    if (negative)
        return magnitude == 0 ? qint64(0) : -static_cast<qint64>(magnitude - 1) - 1;
    return static_cast<qint64>(magnitude);
}

QString formatPercent(double percent)
{
    return formatDecimal(percent, 2);
}

QString formatQuantity(double quantity)
{
    return formatDecimal(quantity, 3);
}

} // namespace Money
