/*
 * fontface.h — Immutable font metrics for the WinAnsi glyph set
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_FONTFACE_H
#define LEDGERPRINT_FONTFACE_H

#include <array>

#include <QByteArray>
#include <QList>
#include <QString>

// A font as the layout engine and the PDF canvas see it: advance widths
// for the 256 WinAnsi codes plus the descriptor metrics. Faces are built
// once by FontManager and never modified afterwards, so they can be
// shared across threads.
struct FontFace {
    QByteArray postScriptName;   // "Helvetica", "DejaVuSans-Bold", ...
    bool embedded = false;       // false: one of the standard 14 PDF fonts

    // Advance widths in 1/1000 em, indexed by WinAnsi byte code
    std::array<int, 256> widths{};

    // Descriptor metrics in 1/1000 em
    int ascent = 718;
    int descent = -207;
    int capHeight = 718;
    int italicAngle = 0;
    int stemV = 80;
    int flags = 32;              // Nonsymbolic
    QList<int> bbox{0, 0, 1000, 1000};

    // TrueType program, only set for embedded faces
    QByteArray fontProgram;

    qreal charWidth(QChar c, qreal sizePoints) const;
    qreal textWidth(const QString &text, qreal sizePoints) const;
};

#endif // LEDGERPRINT_FONTFACE_H
