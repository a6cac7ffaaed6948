/*
 * pdfexportoptions.h — Document information and stream options for PDF output
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_PDFEXPORTOPTIONS_H
#define LEDGERPRINT_PDFEXPORTOPTIONS_H

#include <QDateTime>
#include <QString>

struct PdfExportOptions {
    // Metadata; an empty title is filled in from the document number
    QString title;
    QString author;
    QString subject;
    QString keywords;           // comma-separated
    QString producer{QStringLiteral("LedgerPrint")};

    // Written as /CreationDate when valid. Left unset by default so that
    // the same payload always yields the same bytes.
    QDateTime creationDate;

    // Flate-compress content streams and font programs
    bool compressStreams = true;
};

#endif // LEDGERPRINT_PDFEXPORTOPTIONS_H
