/*
 * textsanitizer.cpp — Reduce arbitrary user text to what the fonts can draw
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textsanitizer.h"
#include "winansi.h"

#include <QDebug>
#include <QStringList>

#include <memory>

#include <unicode/translit.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>

namespace TextSanitizer {

namespace {

enum class CharClass { Keep, Space, Newline, Drop, Foreign };

CharClass classify(char32_t cp)
{
    if (cp == U'\n' || cp == 0x2028 || cp == 0x2029 || cp == 0x0085)
        return CharClass::Newline;
    if (cp == U'\t' || cp == 0x200B)
        return CharClass::Space;

    switch (QChar::category(cp)) {
    case QChar::Separator_Space:
        return CharClass::Space;
    case QChar::Separator_Line:
    case QChar::Separator_Paragraph:
        return CharClass::Newline;
    case QChar::Other_Control:
    case QChar::Other_Format:
    case QChar::Other_Surrogate:
    case QChar::Other_NotAssigned:
    case QChar::Other_PrivateUse:
        return CharClass::Drop;
    default:
        break;
    }
    return WinAnsi::isEncodable(cp) ? CharClass::Keep : CharClass::Foreign;
}

icu::Transliterator *transliterator()
{
    // ICU transliterators are not thread safe; one per thread.
    thread_local std::unique_ptr<icu::Transliterator> instance;
    thread_local bool initialized = false;
    if (!initialized) {
        initialized = true;
        UErrorCode err = U_ZERO_ERROR;
        instance.reset(icu::Transliterator::createInstance(
            icu::UnicodeString::fromUTF8("Any-Latin; Latin-ASCII"), UTRANS_FORWARD, err));
        if (U_FAILURE(err)) {
            qWarning() << "TextSanitizer: ICU transliterator unavailable:" << u_errorName(err);
            instance.reset();
        }
    }
    return instance.get();
}

// Transliterate a run of characters the fonts cannot draw. Whatever the
// transliteration leaves outside the glyph set is dropped.
void appendTransliterated(const QString &run, QString &out)
{
    icu::Transliterator *translit = transliterator();
    if (!translit)
        return;

    icu::UnicodeString ustr(reinterpret_cast<const UChar *>(run.utf16()), run.length());
    translit->transliterate(ustr);
    const QString latin = QString(reinterpret_cast<const QChar *>(ustr.getBuffer()),
                                  ustr.length());

    for (char32_t cp : latin.toUcs4()) {
        switch (classify(cp)) {
        case CharClass::Keep:
            out.append(QChar(static_cast<char16_t>(cp)));
            break;
        case CharClass::Space:
            out.append(QLatin1Char(' '));
            break;
        default:
            break;
        }
    }
}

QString collapseAndTrim(const QString &text)
{
    const QStringList lines = text.split(QLatin1Char('\n'));
    QStringList cleaned;
    cleaned.reserve(lines.size());
    for (const QString &line : lines) {
        QString collapsed;
        collapsed.reserve(line.size());
        bool pendingSpace = false;
        for (QChar c : line) {
            if (c == QLatin1Char(' ')) {
                pendingSpace = !collapsed.isEmpty();
                continue;
            }
            if (pendingSpace)
                collapsed.append(QLatin1Char(' '));
            pendingSpace = false;
            collapsed.append(c);
        }
        cleaned.append(collapsed);
    }

    while (!cleaned.isEmpty() && cleaned.first().isEmpty())
        cleaned.removeFirst();
    while (!cleaned.isEmpty() && cleaned.last().isEmpty())
        cleaned.removeLast();
    return cleaned.join(QLatin1Char('\n'));
}

} // namespace

QString sanitize(const QString &text)
{
    if (text.isEmpty())
        return {};

    const QList<uint> codePoints = text.normalized(QString::NormalizationForm_C).toUcs4();

    QString out;
    out.reserve(codePoints.size());
    QString foreignRun;

    auto flushForeign = [&]() {
        if (!foreignRun.isEmpty()) {
            appendTransliterated(foreignRun, out);
            foreignRun.clear();
        }
    };

    for (int i = 0; i < codePoints.size(); ++i) {
        const char32_t cp = codePoints[i];

        if (cp == U'\r') {
            flushForeign();
            if (i + 1 < codePoints.size() && codePoints[i + 1] == U'\n')
                ++i;
            out.append(QLatin1Char('\n'));
            continue;
        }

        switch (classify(cp)) {
        case CharClass::Keep:
            flushForeign();
            out.append(QChar(static_cast<char16_t>(cp)));
            break;
        case CharClass::Space:
            flushForeign();
            out.append(QLatin1Char(' '));
            break;
        case CharClass::Newline:
            flushForeign();
            out.append(QLatin1Char('\n'));
            break;
        case CharClass::Drop:
            break;
        case CharClass::Foreign:
            foreignRun.append(QString::fromUcs4(&cp, 1));
            break;
        }
    }
    flushForeign();

    return collapseAndTrim(out);
}

QString sanitizeLine(const QString &text)
{
    const QStringList lines = sanitize(text).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    return lines.join(QLatin1Char(' '));
}

} // namespace TextSanitizer
