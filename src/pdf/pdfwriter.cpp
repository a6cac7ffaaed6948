/*
 * pdfwriter.cpp — Low-level PDF writer
 *
 * Extracted from Scribus (Andreas Vox, 2014) and simplified.
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"
#include "documenterrors.h"

#include <algorithm>

#include <zlib.h>

namespace Pdf {

// --- Character classification ---

bool isDelimiter(char c)
{
    return QByteArray("()<>[]{}/%").contains(c);
}

QByteArray toUTF16(const QString &s)
{
    QByteArray result;
    result.reserve(2 + s.length() * 2);
    result.append('\xfe');
    result.append('\xff');
    for (int i = 0; i < s.length(); ++i) {
        result.append(static_cast<char>(s[i].row()));
        result.append(static_cast<char>(s[i].cell()));
    }
    return result;
}

QByteArray toPdf(bool v)
{
    return v ? "true" : "false";
}

QByteArray toCoord(qreal v)
{
    QByteArray result = QByteArray::number(v, 'f', 3);
    if (result.contains('.')) {
        while (result.endsWith('0'))
            result.chop(1);
        if (result.endsWith('.'))
            result.chop(1);
    }
    if (result == "-0")
        result = "0";
    return result;
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    constexpr int lineLength = 80;
    QByteArray result("(");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(static_cast<char>(v));
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append("01234567"[(v / 64) % 8]);
            result.append("01234567"[(v / 8) % 8]);
            result.append("01234567"[v % 8]);
        } else {
            result.append(static_cast<char>(v));
        }
        if (i % lineLength == lineLength - 1)
            result.append("\\\n");
    }
    result.append(')');
    return result;
}

QByteArray toHexString(const QByteArray &s)
{
    constexpr int lineLength = 80;
    QByteArray result("<");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        result.append("0123456789ABCDEF"[v / 16]);
        result.append("0123456789ABCDEF"[v % 16]);
        if (i % lineLength == lineLength - 1)
            result.append('\n');
    }
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (int i = 0; i < s.length(); ++i) {
        uchar c = s[i];
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(static_cast<char>(c))) {
            result.append('#');
            result.append("0123456789ABCDEF"[c / 16]);
            result.append("0123456789ABCDEF"[c % 16]);
        } else {
            result.append(static_cast<char>(c));
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z";
}

// --- Writer implementation ---

Writer::Writer()
    : m_digest(QCryptographicHash::Md5)
{
}

bool Writer::openBuffer(QByteArray *buffer)
{
    if (!buffer)
        return false;
    m_buffer = buffer;
    m_buffer->clear();
    m_bytesWritten = 0;
    m_objCounter = 4; // reserve 1=catalog, 2=info, 3=pages
    m_catalogObj = 1;
    m_infoObj = 2;
    m_pagesObj = 3;
    m_currentObj = 0;
    m_xref.clear();
    m_digest.reset();
    return true;
}

bool Writer::close(bool aborted)
{
    if (!m_buffer)
        return false;
    if (aborted)
        m_buffer->clear();
    m_buffer = nullptr;
    return !aborted;
}

qint64 Writer::bytesWritten() const
{
    return m_bytesWritten;
}

void Writer::writeRaw(const QByteArray &bytes)
{
    if (!m_buffer)
        throw RenderError(QStringLiteral("Pdf::Writer: no output buffer open"));
    m_buffer->append(bytes);
    m_digest.addData(bytes);
    m_bytesWritten += bytes.size();
}

void Writer::write(const QByteArray &bytes)
{
    writeRaw(bytes);
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // high-bit bytes to signal binary
}

void Writer::writeXrefAndTrailer()
{
    if (m_currentObj != 0)
        throw RenderError(QStringLiteral("Pdf::Writer: object %1 left open").arg(m_currentObj));

    // Identifier over everything written so far
    const QByteArray fileId = m_digest.result();

    while (m_xref.size() < static_cast<qsizetype>(m_objCounter))
        m_xref.append(0);

    qint64 startXref = m_bytesWritten;
    write("xref\n");
    write("0 " + toPdf(m_xref.count()) + "\n");
    for (int i = 0; i < m_xref.count(); ++i) {
        if (m_xref[i] > 0) {
            QByteArray offset = QByteArray::number(m_xref[i]);
            while (offset.length() < 10)
                offset.prepend('0');
            write(offset + " 00000 n \n");
        } else {
            write("0000000000 65535 f \n");
        }
    }
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_xref.count()) + "\n");
    QByteArray idHex = toHexString(fileId);
    write("/Root " + toObjRef(m_catalogObj) + "\n");
    write("/Info " + toObjRef(m_infoObj) + "\n");
    write("/ID [" + idHex + idHex + "]\n");
    write(">>\nstartxref\n");
    write(toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text]\n");
    if (!dict.fonts.isEmpty()) {
        // Sorted so the output does not depend on hash order
        QList<QByteArray> names = dict.fonts.keys();
        std::sort(names.begin(), names.end());
        write("/Font <<\n");
        for (const QByteArray &name : names)
            write(toName(name) + " " + toObjRef(dict.fonts.value(name)) + "\n");
        write(">>\n");
    }
    write(">>\n");
}

ObjId Writer::reserveObjects(unsigned int n)
{
    if (n >= (1u << 30))
        throw RenderError(QStringLiteral("Pdf::Writer: too many objects requested"));
    ObjId result = m_objCounter;
    m_objCounter += n;
    return result;
}

void Writer::startObj(ObjId id)
{
    if (m_currentObj != 0)
        throw RenderError(QStringLiteral("Pdf::Writer: object %1 started inside object %2")
                              .arg(id).arg(m_currentObj));
    m_currentObj = id;
    while (static_cast<uint>(m_xref.length()) <= id)
        m_xref.append(0);
    m_xref[id] = m_bytesWritten;
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    ObjId id = newObject();
    startObj(id);
    return id;
}

void Writer::endObj(ObjId id)
{
    if (m_currentObj != id)
        throw RenderError(QStringLiteral("Pdf::Writer: ending object %1 but %2 is open")
                              .arg(id).arg(m_currentObj));
    m_currentObj = 0;
    write("\nendobj\n");
}

void Writer::endObjectWithStream(ObjId id, const QByteArray &streamContent,
                                 bool compress, bool fontProgram)
{
    if (m_currentObj != id)
        throw RenderError(QStringLiteral("Pdf::Writer: stream for object %1 but %2 is open")
                              .arg(id).arg(m_currentObj));

    QByteArray data;
    bool compressed = false;
    if (compress && streamContent.size() > 128) {
        // zlib compress
        uLongf destLen = compressBound(streamContent.size());
        data.resize(static_cast<int>(destLen));
        int zret = ::compress2(reinterpret_cast<Bytef *>(data.data()), &destLen,
                               reinterpret_cast<const Bytef *>(streamContent.data()),
                               streamContent.size(), Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            data.resize(static_cast<int>(destLen));
            compressed = true;
        } else {
            data = streamContent;
        }
    } else {
        data = streamContent;
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (compressed)
        write("/Filter /FlateDecode\n");
    if (fontProgram)
        write("/Length1 " + toPdf(streamContent.size()) + "\n");
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj(id);
}

} // namespace Pdf
