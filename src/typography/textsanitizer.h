/*
 * textsanitizer.h — Reduce arbitrary user text to what the fonts can draw
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_TEXTSANITIZER_H
#define LEDGERPRINT_TEXTSANITIZER_H

#include <QString>

namespace TextSanitizer {

// NFC-compose, normalize line endings and exotic spaces, strip control and
// invisible format characters, transliterate characters outside the
// WinAnsi glyph set (dropping what cannot be transliterated), then collapse
// space runs and trim every line. Interior line breaks survive.
// Never throws; idempotent.
QString sanitize(const QString &text);

// sanitize() for one-line fields: line breaks fold into single spaces.
QString sanitizeLine(const QString &text);

} // namespace TextSanitizer

#endif // LEDGERPRINT_TEXTSANITIZER_H
