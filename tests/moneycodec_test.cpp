/*
 * moneycodec_test.cpp — Integer cents formatting and parsing
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <limits>

#include "moneycodec.h"
#include "testsupport.h"

using namespace Money;

TEST(MoneyCodecTest, FractionShownOnlyWhenNonZero)
{
    EXPECT_EQ(formatCentsToDisplay(10000), QStringLiteral("100"));
    EXPECT_EQ(formatCentsToDisplay(10050), QStringLiteral("100,50"));
    EXPECT_EQ(formatCentsToDisplay(10005), QStringLiteral("100,05"));
    EXPECT_EQ(formatCentsToDisplay(0), QStringLiteral("0"));
    EXPECT_EQ(formatCentsToDisplay(5), QStringLiteral("0,05"));
    EXPECT_EQ(formatCentsToDisplay(-150), QStringLiteral("-1,50"));
}

TEST(MoneyCodecTest, AppendsCurrencySymbol)
{
    EXPECT_EQ(formatCentsToDisplay(10000, QStringLiteral("EUR")), QStringLiteral("100 \u20AC"));
    EXPECT_EQ(formatCentsToDisplay(10000, QStringLiteral("usd")), QStringLiteral("100 $"));
    EXPECT_EQ(formatCentsToDisplay(10000, QStringLiteral("CHF")), QStringLiteral("100 CHF"));
}

TEST(MoneyCodecTest, DocumentAmountsAreGroupedWithTwoDecimals)
{
    EXPECT_EQ(formatAmount(250000, QStringLiteral("EUR")), QStringLiteral("2 500,00 \u20AC"));
    EXPECT_EQ(formatAmount(123456789, QStringLiteral("EUR")), QStringLiteral("1 234 567,89 \u20AC"));
    EXPECT_EQ(formatAmount(0, QStringLiteral("EUR")), QStringLiteral("0,00 \u20AC"));
    EXPECT_EQ(formatAmount(99999, QString()), QStringLiteral("999,99"));
}

TEST(MoneyCodecTest, GroupSeparatorIsPlainSpace)
{
    const QString text = formatAmount(1000000000, QStringLiteral("EUR"));
    EXPECT_FALSE(text.contains(QChar(0x202F)));
    EXPECT_FALSE(text.contains(QChar(0x00A0)));
}

TEST(MoneyCodecTest, ExtremeValuesFormat)
{
    EXPECT_EQ(formatCentsToDisplay(std::numeric_limits<qint64>::max()),
              QStringLiteral("92233720368547758,07"));
    EXPECT_EQ(formatCentsToDisplay(std::numeric_limits<qint64>::min()),
              QStringLiteral("-92233720368547758,08"));
}

TEST(MoneyCodecTest, ParsesCommaAndDotDecimals)
{
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("100")), 10000);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("100,5")), 10050);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("100.50")), 10050);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral(",5")), 50);
}

TEST(MoneyCodecTest, ParsesGroupedAmountsWithCurrency)
{
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("2\u202F500,00 \u20AC")), 250000);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1 234,56")), 123456);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1.234,56")), 123456);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1,234.56")), 123456);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1'234.56 CHF")), 123456);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("EUR 12,30")), 1230);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("$ 7")), 700);
}

TEST(MoneyCodecTest, ParsesSigns)
{
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("-10")), -1000);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("+5,25")), 525);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("- 3,00 \u20AC")), -300);
}

TEST(MoneyCodecTest, TruncatesExtraFractionDigits)
{
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("12,345")), 1234);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("0.999")), 99);
}

TEST(MoneyCodecTest, RejectsMalformedInput)
{
    EXPECT_FALSE(parseDisplayToCents(QString()).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("   ")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("abc")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("12a")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("1..2")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("1,2.3,4")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("10-")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("--1")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("\u20AC")).has_value());
}

TEST(MoneyCodecTest, ThousandsGroupsHaveThreeDigits)
{
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("1,5,0")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("1.23.456")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("1.2345,00")).has_value());
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1.234.567")), 123456700);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("12,345,678.90")), 1234567890);
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("1 234,56")), 123456);
}

TEST(MoneyCodecTest, RejectsOutOfRange)
{
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("99999999999999999999")).has_value());
    EXPECT_FALSE(parseDisplayToCents(QStringLiteral("92233720368547758,08")).has_value());
    EXPECT_EQ(parseDisplayToCents(QStringLiteral("-92233720368547758,08")),
              std::numeric_limits<qint64>::min());
}

TEST(MoneyCodecTest, FormattedAmountsParseBack)
{
    const qint64 samples[] = {
        0, 1, 99, 100, 123456, -42, 250000,
        std::numeric_limits<qint64>::max(), std::numeric_limits<qint64>::min(),
    };
    for (qint64 cents : samples) {
        EXPECT_EQ(parseDisplayToCents(formatCentsToDisplay(cents)), cents);
        EXPECT_EQ(parseDisplayToCents(formatAmount(cents, QStringLiteral("EUR"))), cents);
    }
}

TEST(MoneyCodecTest, PercentAndQuantity)
{
    EXPECT_EQ(formatPercent(20), QStringLiteral("20"));
    EXPECT_EQ(formatPercent(5.5), QStringLiteral("5,5"));
    EXPECT_EQ(formatPercent(0), QStringLiteral("0"));
    EXPECT_EQ(formatQuantity(1), QStringLiteral("1"));
    EXPECT_EQ(formatQuantity(1.5), QStringLiteral("1,5"));
    EXPECT_EQ(formatQuantity(0.25), QStringLiteral("0,25"));
    EXPECT_EQ(formatQuantity(2.125), QStringLiteral("2,125"));
}
