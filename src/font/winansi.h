/*
 * winansi.h — WinAnsiEncoding (Windows-1252) mapping for PDF simple fonts
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_WINANSI_H
#define LEDGERPRINT_WINANSI_H

#include <QByteArray>
#include <QChar>
#include <QString>

namespace WinAnsi {

// Byte code for a Unicode character, 0 if the glyph set has no such glyph.
// Only printable characters map; control characters always return 0.
uchar encode(QChar c);
uchar encode(char32_t codePoint);

inline bool isEncodable(QChar c) { return encode(c) != 0; }
inline bool isEncodable(char32_t codePoint) { return encode(codePoint) != 0; }

// Unicode character for a byte code, 0 for the undefined codes.
char32_t toUnicode(uchar code);

// Encode for a PDF string operand. Unsupported characters become '?';
// callers sanitize text first so this should not happen in practice.
QByteArray fromUnicode(const QString &s);

} // namespace WinAnsi

#endif // LEDGERPRINT_WINANSI_H
