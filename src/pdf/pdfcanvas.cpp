/*
 * pdfcanvas.cpp — PageCanvas producing a standalone PDF document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfcanvas.h"
#include "documenterrors.h"
#include "fontface.h"
#include "winansi.h"

namespace {

QByteArray colorOperator(const QColor &color, bool stroke)
{
    return Pdf::toCoord(color.redF()) + " "
         + Pdf::toCoord(color.greenF()) + " "
         + Pdf::toCoord(color.blueF())
         + (stroke ? " RG\n" : " rg\n");
}

} // namespace

PdfCanvas::PdfCanvas(const PdfExportOptions &options)
    : m_options(options)
{
}

void PdfCanvas::addPage(const QSizeF &size)
{
    if (!size.isValid() || size.isEmpty())
        throw RenderError(QStringLiteral("PdfCanvas: invalid page size %1x%2")
                              .arg(size.width()).arg(size.height()));
    PageData page;
    page.size = size;
    m_pages.append(page);
}

PdfCanvas::PageData &PdfCanvas::currentPage(const char *operation)
{
    if (m_pages.isEmpty())
        throw RenderError(QStringLiteral("PdfCanvas: %1 before the first page")
                              .arg(QLatin1String(operation)));
    return m_pages.last();
}

qreal PdfCanvas::toPdfY(qreal y) const
{
    return m_pages.last().size.height() - y;
}

QByteArray PdfCanvas::embedFont(const FontFace *font)
{
    if (!font)
        throw RenderError(QStringLiteral("PdfCanvas: no font given"));
    auto it = m_fontNames.constFind(font);
    if (it != m_fontNames.constEnd())
        return it.value();

    QByteArray name = "F" + QByteArray::number(m_fonts.size() + 1);
    m_fonts.append(font);
    m_fontNames.insert(font, name);
    return name;
}

void PdfCanvas::drawText(const QString &text, const QPointF &baseline,
                         const FontFace *font, qreal fontSize,
                         const QColor &color)
{
    PageData &page = currentPage("drawText");
    if (text.isEmpty())
        return;

    const QByteArray name = embedFont(font);
    if (!page.fontNames.contains(name))
        page.fontNames.append(name);

    QByteArray &out = page.content;
    out += "BT\n";
    out += Pdf::toName(name) + " " + Pdf::toCoord(fontSize) + " Tf\n";
    out += colorOperator(color, false);
    out += Pdf::toCoord(baseline.x()) + " " + Pdf::toCoord(toPdfY(baseline.y())) + " Td\n";
    out += Pdf::toLiteralString(WinAnsi::fromUnicode(text)) + " Tj\n";
    out += "ET\n";
}

void PdfCanvas::drawLine(const QPointF &from, const QPointF &to,
                         qreal width, const QColor &color)
{
    QByteArray &out = currentPage("drawLine").content;
    out += "q\n";
    out += Pdf::toCoord(width) + " w\n";
    out += colorOperator(color, true);
    out += Pdf::toCoord(from.x()) + " " + Pdf::toCoord(toPdfY(from.y())) + " m\n";
    out += Pdf::toCoord(to.x()) + " " + Pdf::toCoord(toPdfY(to.y())) + " l\n";
    out += "S\nQ\n";
}

void PdfCanvas::drawRect(const QRectF &rect, qreal width, const QColor &stroke)
{
    QByteArray &out = currentPage("drawRect").content;
    out += "q\n";
    out += Pdf::toCoord(width) + " w\n";
    out += colorOperator(stroke, true);
    out += Pdf::toCoord(rect.left()) + " " + Pdf::toCoord(toPdfY(rect.bottom())) + " "
         + Pdf::toCoord(rect.width()) + " " + Pdf::toCoord(rect.height()) + " re\n";
    out += "S\nQ\n";
}

void PdfCanvas::writeFont(Pdf::Writer &writer, const FontFace *font, Pdf::ObjId fontObj) const
{
    if (!font->embedded) {
        writer.startObj(fontObj);
        writer.write("<<\n/Type /Font\n/Subtype /Type1\n");
        writer.write("/BaseFont " + Pdf::toName(font->postScriptName) + "\n");
        writer.write("/Encoding /WinAnsiEncoding\n>>");
        writer.endObj(fontObj);
        return;
    }

    if (font->fontProgram.isEmpty())
        throw RenderError(QStringLiteral("PdfCanvas: font %1 has no font program")
                              .arg(QString::fromLatin1(font->postScriptName)));

    // Font program
    Pdf::ObjId fileObj = writer.startObj();
    writer.write("<<\n");
    writer.endObjectWithStream(fileObj, font->fontProgram, m_options.compressStreams, true);

    // FontDescriptor
    Pdf::ObjId descObj = writer.startObj();
    writer.write("<<\n/Type /FontDescriptor\n");
    writer.write("/FontName " + Pdf::toName(font->postScriptName) + "\n");
    writer.write("/Flags " + Pdf::toPdf(font->flags) + "\n");
    writer.write("/FontBBox [" + Pdf::toPdf(font->bbox.value(0)) + " "
                 + Pdf::toPdf(font->bbox.value(1)) + " "
                 + Pdf::toPdf(font->bbox.value(2)) + " "
                 + Pdf::toPdf(font->bbox.value(3)) + "]\n");
    writer.write("/ItalicAngle " + Pdf::toPdf(font->italicAngle) + "\n");
    writer.write("/Ascent " + Pdf::toPdf(font->ascent) + "\n");
    writer.write("/Descent " + Pdf::toPdf(font->descent) + "\n");
    writer.write("/CapHeight " + Pdf::toPdf(font->capHeight) + "\n");
    writer.write("/StemV " + Pdf::toPdf(font->stemV) + "\n");
    writer.write("/FontFile2 " + Pdf::toObjRef(fileObj) + "\n");
    writer.write(">>");
    writer.endObj(descObj);

    // Font dictionary with explicit widths for codes 32..255
    writer.startObj(fontObj);
    writer.write("<<\n/Type /Font\n/Subtype /TrueType\n");
    writer.write("/BaseFont " + Pdf::toName(font->postScriptName) + "\n");
    writer.write("/FirstChar 32\n/LastChar 255\n/Widths [");
    for (int code = 32; code <= 255; ++code) {
        writer.write(Pdf::toPdf(font->widths[code]));
        writer.write(code % 16 == 15 ? "\n" : " ");
    }
    writer.write("]\n/Encoding /WinAnsiEncoding\n");
    writer.write("/FontDescriptor " + Pdf::toObjRef(descObj) + "\n>>");
    writer.endObj(fontObj);
}

void PdfCanvas::writeInfo(Pdf::Writer &writer) const
{
    writer.startObj(writer.infoObj());
    writer.write("<<\n");
    writer.write("/Producer " + Pdf::toLiteralString(Pdf::toUTF16(m_options.producer)) + "\n");
    if (!m_options.title.isEmpty())
        writer.write("/Title " + Pdf::toLiteralString(Pdf::toUTF16(m_options.title)) + "\n");
    if (!m_options.author.isEmpty())
        writer.write("/Author " + Pdf::toLiteralString(Pdf::toUTF16(m_options.author)) + "\n");
    if (!m_options.subject.isEmpty())
        writer.write("/Subject " + Pdf::toLiteralString(Pdf::toUTF16(m_options.subject)) + "\n");
    if (!m_options.keywords.isEmpty())
        writer.write("/Keywords " + Pdf::toLiteralString(Pdf::toUTF16(m_options.keywords)) + "\n");
    if (m_options.creationDate.isValid())
        writer.write("/CreationDate " + Pdf::toLiteralString(Pdf::toDateString(m_options.creationDate)) + "\n");
    writer.write(">>");
    writer.endObj(writer.infoObj());
}

QByteArray PdfCanvas::save() const
{
    if (m_pages.isEmpty())
        throw RenderError(QStringLiteral("PdfCanvas: document has no pages"));

    QByteArray buffer;
    Pdf::Writer writer;
    if (!writer.openBuffer(&buffer))
        throw RenderError(QStringLiteral("PdfCanvas: cannot open output buffer"));

    try {
        writer.writeHeader();

        QHash<QByteArray, Pdf::ObjId> fontObjs;
        for (const FontFace *font : m_fonts) {
            Pdf::ObjId fontObj = writer.newObject();
            writeFont(writer, font, fontObj);
            fontObjs.insert(m_fontNames.value(font), fontObj);
        }

        QList<Pdf::ObjId> pageObjIds;
        for (const PageData &page : m_pages) {
            // Content stream object
            Pdf::ObjId contentObj = writer.startObj();
            writer.write("<<\n");
            writer.endObjectWithStream(contentObj, page.content, m_options.compressStreams);

            Pdf::ResourceDict resources;
            for (const QByteArray &name : page.fontNames)
                resources.fonts.insert(name, fontObjs.value(name));

            // Page object
            Pdf::ObjId pageObj = writer.startObj();
            writer.write("<<\n");
            writer.write("/Type /Page\n");
            writer.write("/Parent " + Pdf::toObjRef(writer.pagesObj()) + "\n");
            writer.write("/MediaBox [0 0 "
                         + Pdf::toCoord(page.size.width()) + " "
                         + Pdf::toCoord(page.size.height()) + "]\n");
            writer.write("/Contents " + Pdf::toObjRef(contentObj) + "\n");
            writer.write("/Resources ");
            writer.writeResourceDict(resources);
            writer.write(">>");
            writer.endObj(pageObj);
            pageObjIds.append(pageObj);
        }

        // Pages object
        writer.startObj(writer.pagesObj());
        writer.write("<<\n/Type /Pages\n/Kids [");
        for (auto id : pageObjIds)
            writer.write(Pdf::toObjRef(id) + " ");
        writer.write("]\n/Count " + Pdf::toPdf(pageObjIds.size()) + "\n>>");
        writer.endObj(writer.pagesObj());

        writeInfo(writer);

        // Catalog object
        writer.startObj(writer.catalogObj());
        writer.write("<<\n/Type /Catalog\n/Pages " + Pdf::toObjRef(writer.pagesObj()) + "\n");
        writer.write("/PageLayout /OneColumn\n>>");
        writer.endObj(writer.catalogObj());

        writer.writeXrefAndTrailer();
    } catch (const RenderError &) {
        writer.close(true);
        throw;
    }

    if (!writer.close())
        throw RenderError(QStringLiteral("PdfCanvas: failed to finish output"));
    return buffer;
}
