/*
 * winansi.cpp — WinAnsiEncoding (Windows-1252) mapping for PDF simple fonts
 *
 * Table after PDF32000-2008, Annex D.2 (Latin character set and encodings).
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "winansi.h"

namespace WinAnsi {

namespace {

// Unicode values of codes 0x80..0x9F; 0 marks the five undefined codes.
constexpr char32_t kHighControlRange[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

} // namespace

uchar encode(char32_t codePoint)
{
    if (codePoint >= 0x20 && codePoint <= 0x7E)
        return static_cast<uchar>(codePoint);
    if (codePoint >= 0xA0 && codePoint <= 0xFF)
        return static_cast<uchar>(codePoint);

    switch (codePoint) {
    case 0x20AC: return 0x80; case 0x201A: return 0x82; case 0x0192: return 0x83;
    case 0x201E: return 0x84; case 0x2026: return 0x85; case 0x2020: return 0x86;
    case 0x2021: return 0x87; case 0x02C6: return 0x88; case 0x2030: return 0x89;
    case 0x0160: return 0x8A; case 0x2039: return 0x8B; case 0x0152: return 0x8C;
    case 0x017D: return 0x8E; case 0x2018: return 0x91; case 0x2019: return 0x92;
    case 0x201C: return 0x93; case 0x201D: return 0x94; case 0x2022: return 0x95;
    case 0x2013: return 0x96; case 0x2014: return 0x97; case 0x02DC: return 0x98;
    case 0x2122: return 0x99; case 0x0161: return 0x9A; case 0x203A: return 0x9B;
    case 0x0153: return 0x9C; case 0x017E: return 0x9E; case 0x0178: return 0x9F;
    default:
        return 0;
    }
}

uchar encode(QChar c)
{
    if (c.isSurrogate())
        return 0;
    return encode(static_cast<char32_t>(c.unicode()));
}

char32_t toUnicode(uchar code)
{
    if (code >= 0x20 && code <= 0x7E)
        return code;
    if (code >= 0xA0)
        return code;
    if (code >= 0x80 && code <= 0x9F)
        return kHighControlRange[code - 0x80];
    return 0;
}

QByteArray fromUnicode(const QString &s)
{
    QByteArray result;
    result.reserve(s.length());
    for (QChar c : s) {
        uchar code = encode(c);
        result.append(code ? static_cast<char>(code) : '?');
    }
    return result;
}

} // namespace WinAnsi
