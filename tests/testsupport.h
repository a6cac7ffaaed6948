/*
 * testsupport.h — Shared payloads and printers for the unit tests
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_TESTSUPPORT_H
#define LEDGERPRINT_TESTSUPPORT_H

#include <ostream>

#include <QByteArray>
#include <QString>
#include <QStringList>

#include "documentpayload.h"

// Readable QString values in GoogleTest failure messages
inline void PrintTo(const QString &s, std::ostream *os)
{
    *os << '"' << s.toStdString() << '"';
}

namespace TestSupport {

// Smallest payload that passes validation: one item, no legal text
DocumentPayload minimalPayload();

// A studio's quote or invoice with 40 discounted monthly items, 12
// prestations paragraphs and 45 clauses of general terms of sale.
// Labels and notes carry narrow no-break spaces.
DocumentPayload studioPayload(bool invoice);

// Page texts of a PDF, extracted with poppler; empty when the bytes do
// not load as a PDF.
QStringList pdfPageTexts(const QByteArray &pdf);

} // namespace TestSupport

#endif // LEDGERPRINT_TESTSUPPORT_H
