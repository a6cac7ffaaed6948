/*
 * pdfwriter.h — Low-level PDF writer
 *
 * Extracted from Scribus (Andreas Vox, 2014) and simplified:
 *   - No encryption, no PDFVersion enum, no ScStreamFilter
 *   - Hardcoded PDF-1.7
 *   - In-memory QByteArray output only
 *   - File identifier derived from the written bytes, so identical
 *     documents serialize identically
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_PDFWRITER_H
#define LEDGERPRINT_PDFWRITER_H

#include <type_traits>

#include <QByteArray>
#include <QCryptographicHash>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QString>

namespace Pdf {

using ObjId = uint32_t;

// --- PDF serialization helpers (cf. PDF32000-2008) ---

bool isDelimiter(char c);

QByteArray toUTF16(const QString &s);

QByteArray toPdf(bool v);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 6); }

// Coordinates and widths: at most 3 decimals, trailing zeros removed
QByteArray toCoord(qreal v);

QByteArray toObjRef(ObjId id);

QByteArray toLiteralString(const QByteArray &s);

QByteArray toHexString(const QByteArray &s);

QByteArray toName(const QByteArray &s);

QByteArray toDateString(const QDateTime &dt);

// --- Resource dictionary (simplified from Scribus) ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts;
};

// --- PDF Writer ---

class Writer {
public:
    Writer();

    bool openBuffer(QByteArray *buffer);
    bool close(bool aborted = false);

    qint64 bytesWritten() const;

    // PDF structure
    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management. Misuse (nested objects, mismatched ids) throws
    // RenderError.
    ObjId reserveObjects(unsigned int n);
    ObjId newObject() { return reserveObjects(1); }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true, bool fontProgram = false);

    // Well-known object IDs (assigned when the buffer is opened)
    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    ObjId m_objCounter = 0;
    ObjId m_currentObj = 0;

    QByteArray *m_buffer = nullptr;

    QList<qint64> m_xref;
    qint64 m_bytesWritten = 0;

    // Well-known objects
    ObjId m_catalogObj = 0;
    ObjId m_infoObj = 0;
    ObjId m_pagesObj = 0;

    QCryptographicHash m_digest;

    void writeRaw(const QByteArray &bytes);
};

} // namespace Pdf

#endif // LEDGERPRINT_PDFWRITER_H
