/*
 * pdfcanvas_test.cpp — PDF serialization of drawn pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QRegularExpression>

#include "documenterrors.h"
#include "fontmanager.h"
#include "pdfcanvas.h"
#include "pdfwriter.h"
#include "testsupport.h"

namespace {

PdfExportOptions plainOptions()
{
    PdfExportOptions options;
    options.compressStreams = false;
    return options;
}

QByteArray twoPageDocument(const PdfExportOptions &options)
{
    const FontFace *regular = FontManager::shared().standardFace(FontRole::Regular);
    const FontFace *bold = FontManager::shared().standardFace(FontRole::Bold);

    PdfCanvas canvas(options);
    canvas.addPage(QSizeF(595, 842));
    canvas.drawText(QStringLiteral("Hello (World)"), QPointF(50, 100), regular, 12, Qt::black);
    canvas.drawLine(QPointF(50, 110), QPointF(545, 110), 0.5, QColor(0xdb, 0xdb, 0xdb));
    canvas.addPage(QSizeF(595, 842));
    canvas.drawText(QStringLiteral("Total 5 \u20AC"), QPointF(50, 100), bold, 10, Qt::black);
    canvas.drawRect(QRectF(50, 200, 240, 70), 0.8, Qt::gray);
    return canvas.save();
}

} // namespace

TEST(PdfCanvasTest, SavingWithoutPagesFails)
{
    PdfCanvas canvas;
    EXPECT_THROW(canvas.save(), RenderError);
}

TEST(PdfCanvasTest, DrawingBeforeFirstPageFails)
{
    PdfCanvas canvas;
    const FontFace *regular = FontManager::shared().standardFace(FontRole::Regular);
    EXPECT_THROW(canvas.drawText(QStringLiteral("x"), QPointF(0, 0), regular, 10, Qt::black),
                 RenderError);
    EXPECT_THROW(canvas.drawLine(QPointF(0, 0), QPointF(1, 1), 1, Qt::black), RenderError);
}

TEST(PdfCanvasTest, DocumentStructure)
{
    const QByteArray pdf = twoPageDocument(plainOptions());

    EXPECT_TRUE(pdf.startsWith("%PDF-1.7\n"));
    EXPECT_TRUE(pdf.endsWith("%%EOF\n"));
    EXPECT_TRUE(pdf.contains("/Type /Catalog"));
    EXPECT_TRUE(pdf.contains("/Count 2"));
    EXPECT_TRUE(pdf.contains("/BaseFont /Helvetica\n"));
    EXPECT_TRUE(pdf.contains("/BaseFont /Helvetica-Bold\n"));
    EXPECT_TRUE(pdf.contains("/Encoding /WinAnsiEncoding"));
    EXPECT_TRUE(pdf.contains("/Producer"));
    EXPECT_FALSE(pdf.contains("/CreationDate"));
}

TEST(PdfCanvasTest, XrefOffsetsPointAtObjects)
{
    const QByteArray pdf = twoPageDocument(plainOptions());

    static const QRegularExpression startXref(QStringLiteral("startxref\\n(\\d+)\\n%%EOF\\n$"));
    const QRegularExpressionMatch m = startXref.match(QString::fromLatin1(pdf));
    ASSERT_TRUE(m.hasMatch());
    const qsizetype xrefPos = m.captured(1).toLongLong();
    ASSERT_TRUE(pdf.mid(xrefPos).startsWith("xref\n0 "));

    const qsizetype countStart = xrefPos + 7;
    const qsizetype countEnd = pdf.indexOf('\n', countStart);
    const int count = pdf.mid(countStart, countEnd - countStart).toInt();
    ASSERT_GT(count, 5);

    qsizetype entry = countEnd + 1;
    for (int id = 0; id < count; ++id, entry += 20) {
        const QByteArray line = pdf.mid(entry, 20);
        ASSERT_EQ(line.size(), 20);
        if (line.at(17) != 'n')
            continue;
        const qsizetype offset = line.left(10).toLongLong();
        EXPECT_TRUE(pdf.mid(offset).startsWith(QByteArray::number(id) + " 0 obj\n")) << "object " << id;
    }
}

TEST(PdfCanvasTest, TextIsEscapedAndWinAnsiEncoded)
{
    const QByteArray pdf = twoPageDocument(plainOptions());

    EXPECT_TRUE(pdf.contains("(Hello \\(World\\)) Tj"));
    // Euro sign is WinAnsi 0x80
    EXPECT_TRUE(pdf.contains("(Total 5 \\200) Tj"));
    EXPECT_TRUE(pdf.contains("50 742 Td"));
}

TEST(PdfCanvasTest, LiteralStringEscaping)
{
    EXPECT_EQ(Pdf::toLiteralString("a(b)c\\"), QByteArray("(a\\(b\\)c\\\\)"));
    EXPECT_EQ(Pdf::toLiteralString(QByteArray("\n\xe9", 2)), QByteArray("(\\012\\351)"));
}

TEST(PdfCanvasTest, CoordinatesAreCompact)
{
    EXPECT_EQ(Pdf::toCoord(50), QByteArray("50"));
    EXPECT_EQ(Pdf::toCoord(0.5), QByteArray("0.5"));
    EXPECT_EQ(Pdf::toCoord(12.3456), QByteArray("12.346"));
    EXPECT_EQ(Pdf::toCoord(-0.0001), QByteArray("0"));
}

TEST(PdfCanvasTest, IdenticalDrawingSerializesIdentically)
{
    PdfExportOptions options;
    options.title = QStringLiteral("Devis n\u00B0 1");
    EXPECT_EQ(twoPageDocument(options), twoPageDocument(options));
}

TEST(PdfCanvasTest, CreationDateIsWrittenWhenSet)
{
    PdfExportOptions options = plainOptions();
    options.creationDate = QDateTime(QDate(2026, 3, 5), QTime(10, 0), Qt::UTC);
    const QByteArray pdf = twoPageDocument(options);
    EXPECT_TRUE(pdf.contains("/CreationDate (D:20260305100000Z)"));
}

TEST(PdfCanvasTest, PopplerReadsTheOutput)
{
    const QStringList pages = TestSupport::pdfPageTexts(twoPageDocument(PdfExportOptions()));
    ASSERT_EQ(pages.size(), 2);
    EXPECT_TRUE(pages[0].contains(QStringLiteral("Hello (World)")));
    EXPECT_TRUE(pages[1].contains(QStringLiteral("Total 5 \u20AC")));
}
