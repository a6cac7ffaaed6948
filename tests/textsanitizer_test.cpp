/*
 * textsanitizer_test.cpp — Reduction of user text to the WinAnsi glyph set
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "testsupport.h"
#include "textsanitizer.h"
#include "winansi.h"

using TextSanitizer::sanitize;
using TextSanitizer::sanitizeLine;

namespace {

bool onlyDrawable(const QString &s)
{
    for (QChar c : s) {
        if (c != QLatin1Char('\n') && !WinAnsi::isEncodable(c))
            return false;
    }
    return true;
}

} // namespace

TEST(TextSanitizerTest, EmptyStaysEmpty)
{
    EXPECT_EQ(sanitize(QString()), QString());
    EXPECT_EQ(sanitizeLine(QStringLiteral(" \n\t ")), QString());
}

TEST(TextSanitizerTest, ExoticSpacesBecomeSpaces)
{
    EXPECT_EQ(sanitize(QStringLiteral("2\u202F500,00\u00A0\u20AC")), QStringLiteral("2 500,00 \u20AC"));
    EXPECT_EQ(sanitize(QStringLiteral("10\u2009000")), QStringLiteral("10 000"));
}

TEST(TextSanitizerTest, KeepsFrenchTypography)
{
    const QString text = QStringLiteral("Cr\u00E8me br\u00FBl\u00E9e \u00AB \u0153uvre \u00BB "
                                        "\u2014 40 \u20AC \u2026 \u2019");
    EXPECT_EQ(sanitize(text), text);
}

TEST(TextSanitizerTest, ComposesCombiningSequences)
{
    EXPECT_EQ(sanitize(QStringLiteral("Cre\u0300me")), QStringLiteral("Cr\u00E8me"));
}

TEST(TextSanitizerTest, StripsControlAndFormatCharacters)
{
    EXPECT_EQ(sanitize(QStringLiteral("ab\u200Dc\x07\uFEFF")), QStringLiteral("abc"));
}

TEST(TextSanitizerTest, NormalizesLineEndings)
{
    EXPECT_EQ(sanitize(QStringLiteral("a\r\nb\rc\u2028d")), QStringLiteral("a\nb\nc\nd"));
}

TEST(TextSanitizerTest, CollapsesSpacesAndTrimsLines)
{
    EXPECT_EQ(sanitize(QStringLiteral("  a \t  b  \n  c  ")), QStringLiteral("a b\nc"));
}

TEST(TextSanitizerTest, KeepsInteriorBlankLinesOnly)
{
    EXPECT_EQ(sanitize(QStringLiteral("\n\nfirst\n\nsecond\n\n")), QStringLiteral("first\n\nsecond"));
}

TEST(TextSanitizerTest, TransliteratesLettersOutsideTheGlyphSet)
{
    EXPECT_EQ(sanitize(QStringLiteral("Erd\u0151s")), QStringLiteral("Erdos"));
    EXPECT_EQ(sanitize(QStringLiteral("\u041F\u0440\u0438\u0432\u0435\u0442")), QStringLiteral("Privet"));
}

TEST(TextSanitizerTest, DropsWhatCannotBeTransliterated)
{
    EXPECT_EQ(sanitize(QStringLiteral("Merci \U0001F642")), QStringLiteral("Merci"));
    EXPECT_EQ(sanitize(QStringLiteral("\U0001F4C8\U0001F4C9")), QString());
}

TEST(TextSanitizerTest, OutputIsAlwaysDrawable)
{
    const QStringList samples = {
        QStringLiteral("\u03A3\u03CD\u03BC\u03B2\u03B1\u03C3\u03B7 \u21165 \u2014 \u6771\u4EAC \u2713"),
        QStringLiteral("Ligne\u2028Paragraphe\u0085Fin"),
        QStringLiteral("\u200B\u200B \u3000x"),
        QStringLiteral("\u01C4emal \u013Fuka \u0133ssel"),
    };
    for (const QString &s : samples) {
        const QString out = sanitize(s);
        EXPECT_TRUE(onlyDrawable(out)) << out.toStdString();
    }
}

TEST(TextSanitizerTest, IsIdempotent)
{
    const QStringList samples = {
        QStringLiteral("  Service 1 2\u202F500,00 \u20AC\r\n\r\n\r\nSuite "),
        QStringLiteral("\u041F\u0440\u0438\u0432\u0435\u0442, \u043C\u0438\u0440 \U0001F30D"),
        QStringLiteral("Zo\u00EB \u00AB na\u00EFve \u00BB caf\u00E9"),
    };
    for (const QString &s : samples) {
        const QString once = sanitize(s);
        EXPECT_EQ(sanitize(once), once);
    }
}

TEST(TextSanitizerTest, SanitizeLineFoldsLineBreaks)
{
    EXPECT_EQ(sanitizeLine(QStringLiteral("10 rue des Lilas\n\n75001 Paris\r\n")),
              QStringLiteral("10 rue des Lilas 75001 Paris"));
}
