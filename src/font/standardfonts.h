/*
 * standardfonts.h — Metrics of the standard Helvetica faces
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_STANDARDFONTS_H
#define LEDGERPRINT_STANDARDFONTS_H

#include "fontface.h"

// Helvetica and Helvetica-Bold are among the standard 14 fonts every PDF
// viewer provides, so they are referenced by name and never embedded.
namespace StandardFonts {

FontFace helvetica();
FontFace helveticaBold();

} // namespace StandardFonts

#endif // LEDGERPRINT_STANDARDFONTS_H
