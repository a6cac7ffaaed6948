/*
 * paginator_test.cpp — Row placement, page breaks and header repetition
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "documenterrors.h"
#include "fontface.h"
#include "fontmanager.h"
#include "headerfooterrenderer.h"
#include "paginator.h"
#include "recordingcanvas.h"
#include "testsupport.h"

using Layout::Paginator;
using Layout::Row;
using Layout::Section;
using Layout::TextRun;
using Layout::TextStyle;

namespace {

class PaginatorTest : public ::testing::Test {
protected:
    const FontFace *font() const
    {
        return FontManager::shared().standardFace(FontRole::Regular);
    }

    TextStyle style(qreal size = 10.0) const
    {
        TextStyle s;
        s.font = font();
        s.fontSize = size;
        return s;
    }

    Row textRow(const QString &text, qreal height, bool keepWithNext = false) const
    {
        Row row;
        row.height = height;
        TextRun run;
        run.text = text;
        run.x = m_layout.margins.left();
        run.baseline = qMin<qreal>(10.0, height);
        run.style = style();
        row.texts.append(run);
        row.keepWithNext = keepWithNext;
        return row;
    }

    // A4 with the default margins: 730 pt of content height starting at y = 52
    PageLayout m_layout;
    RecordingCanvas m_canvas;
};

} // namespace

TEST_F(PaginatorTest, EmptyTextHasNoLines)
{
    EXPECT_TRUE(Paginator::measureWrap(QString(), 100, font(), 10).isEmpty());
    EXPECT_TRUE(Paginator::measureWrap(QStringLiteral("\n\n"), 100, font(), 10).isEmpty());
}

TEST_F(PaginatorTest, WrappedLinesFitTheWidth)
{
    const QString text = QStringLiteral(
        "Description d\u00E9taill\u00E9e de la prestation avec plusieurs mots pour forcer le retour \u00E0 la ligne.");
    const qreal width = 120;
    const QStringList lines = Paginator::measureWrap(text, width, font(), 9);

    ASSERT_GT(lines.size(), 1);
    for (const QString &line : lines) {
        EXPECT_LE(font()->textWidth(line, 9), width + 0.001) << line.toStdString();
        EXPECT_FALSE(line.startsWith(QLatin1Char(' ')));
        EXPECT_FALSE(line.endsWith(QLatin1Char(' ')));
    }
    EXPECT_EQ(lines.join(QLatin1Char(' ')), text);
}

TEST_F(PaginatorTest, ExplicitBreaksAndBlankLinesSurvive)
{
    EXPECT_EQ(Paginator::measureWrap(QStringLiteral("a\nb"), 100, font(), 10),
              QStringList({QStringLiteral("a"), QStringLiteral("b")}));
    EXPECT_EQ(Paginator::measureWrap(QStringLiteral("a\n\nb"), 100, font(), 10),
              QStringList({QStringLiteral("a"), QString(), QStringLiteral("b")}));
}

TEST_F(PaginatorTest, OverlongWordIsSplit)
{
    const QString word(200, QLatin1Char('x'));
    const QStringList lines = Paginator::measureWrap(word, 50, font(), 10);

    ASSERT_GT(lines.size(), 1);
    for (const QString &line : lines)
        EXPECT_LE(font()->textWidth(line, 10), 50.001);
    EXPECT_EQ(lines.join(QString()), word);
}

TEST_F(PaginatorTest, NarrowWidthStillAdvances)
{
    const QStringList lines = Paginator::measureWrap(QStringLiteral("WWW"), 1, font(), 10);
    EXPECT_EQ(lines, QStringList({QStringLiteral("W"), QStringLiteral("W"), QStringLiteral("W")}));
}

TEST_F(PaginatorTest, FirstRowOpensFirstPage)
{
    Paginator paginator(&m_canvas, m_layout);
    EXPECT_EQ(paginator.pageCount(), 0);

    paginator.placeRow(textRow(QStringLiteral("one"), 20));

    EXPECT_EQ(m_canvas.pageCount(), 1);
    EXPECT_DOUBLE_EQ(paginator.cursor().y, 72.0);
    EXPECT_DOUBLE_EQ(paginator.cursor().remainingHeight, 710.0);
}

TEST_F(PaginatorTest, BreaksBeforeRowThatDoesNotFit)
{
    Paginator paginator(&m_canvas, m_layout);
    for (int i = 0; i < 8; ++i)
        paginator.placeRow(textRow(QStringLiteral("row %1").arg(i), 100));

    ASSERT_EQ(m_canvas.pageCount(), 2);
    EXPECT_EQ(m_canvas.textOnPage(0).size(), 7);
    EXPECT_EQ(m_canvas.textOnPage(1), QStringList({QStringLiteral("row 7")}));
    EXPECT_DOUBLE_EQ(paginator.cursor().y, 152.0);
}

TEST_F(PaginatorTest, RowTallerThanPageOverflows)
{
    Paginator paginator(&m_canvas, m_layout);
    EXPECT_THROW(paginator.placeRow(textRow(QStringLiteral("huge"), 800)), LayoutOverflowError);
}

TEST_F(PaginatorTest, PageGuardStopsRunawayDocuments)
{
    Paginator paginator(&m_canvas, m_layout, 2);
    Section section;
    section.name = QStringLiteral("long");
    for (int i = 0; i < 30; ++i)
        section.rows.append(textRow(QStringLiteral("row %1").arg(i), 100));

    EXPECT_THROW(paginator.placeBlock(section), LayoutOverflowError);
    EXPECT_EQ(m_canvas.pageCount(), 2);
}

TEST_F(PaginatorTest, SpacerIsDroppedAtPageTop)
{
    Paginator paginator(&m_canvas, m_layout);
    paginator.placeRow(Row::spacer(40));
    paginator.placeRow(textRow(QStringLiteral("first"), 20));

    EXPECT_DOUBLE_EQ(m_canvas.pages().first().ops.first().from.y(), 62.0);
}

TEST_F(PaginatorTest, SpacerIsClampedAtPageBottom)
{
    Paginator paginator(&m_canvas, m_layout);
    for (int i = 0; i < 7; ++i)
        paginator.placeRow(textRow(QStringLiteral("row"), 100));
    paginator.placeRow(Row::spacer(100));

    EXPECT_EQ(m_canvas.pageCount(), 1);
    EXPECT_DOUBLE_EQ(paginator.cursor().remainingHeight, 0.0);
}

TEST_F(PaginatorTest, TableHeaderRepeatsAfterBreak)
{
    Paginator paginator(&m_canvas, m_layout);
    Section table;
    table.name = QStringLiteral("items");
    table.kind = Section::Table;
    table.header = textRow(QStringLiteral("HEAD"), 20);
    for (int i = 0; i < 20; ++i)
        table.rows.append(textRow(QStringLiteral("item %1").arg(i), 100));

    paginator.placeBlock(table);

    ASSERT_GE(m_canvas.pageCount(), 3);
    for (int page = 0; page < m_canvas.pageCount(); ++page) {
        const QStringList texts = m_canvas.textOnPage(page);
        ASSERT_FALSE(texts.isEmpty());
        EXPECT_EQ(texts.first(), QStringLiteral("HEAD")) << "page " << page;
        EXPECT_EQ(texts.count(QStringLiteral("HEAD")), 1);
    }
}

TEST_F(PaginatorTest, FlowHeaderRepeatsOnlyWhenAsked)
{
    Section flow;
    flow.name = QStringLiteral("legal");
    flow.header = textRow(QStringLiteral("TITLE"), 20);
    for (int i = 0; i < 20; ++i)
        flow.rows.append(textRow(QStringLiteral("clause %1").arg(i), 100));

    {
        RecordingCanvas canvas;
        Paginator paginator(&canvas, m_layout);
        paginator.placeBlock(flow);
        EXPECT_EQ(canvas.textOnPage(1).count(QStringLiteral("TITLE")), 0);
    }

    flow.repeatHeader = true;
    RecordingCanvas canvas;
    Paginator paginator(&canvas, m_layout);
    paginator.placeBlock(flow);
    for (int page = 0; page < canvas.pageCount(); ++page)
        EXPECT_EQ(canvas.textOnPage(page).first(), QStringLiteral("TITLE"));
}

TEST_F(PaginatorTest, RepeatedHeaderEndsWithItsSection)
{
    Paginator paginator(&m_canvas, m_layout);
    Section table;
    table.name = QStringLiteral("items");
    table.kind = Section::Table;
    table.header = textRow(QStringLiteral("HEAD"), 20);
    table.rows.append(textRow(QStringLiteral("item"), 100));
    paginator.placeBlock(table);

    Section after;
    after.name = QStringLiteral("after");
    for (int i = 0; i < 10; ++i)
        after.rows.append(textRow(QStringLiteral("after %1").arg(i), 100));
    paginator.placeBlock(after);

    ASSERT_EQ(m_canvas.pageCount(), 2);
    EXPECT_EQ(m_canvas.textOnPage(1).count(QStringLiteral("HEAD")), 0);
}

TEST_F(PaginatorTest, FreshPageSectionBreaksAfterContent)
{
    Paginator paginator(&m_canvas, m_layout);
    paginator.placeRow(textRow(QStringLiteral("intro"), 20));

    Section legal;
    legal.name = QStringLiteral("legal");
    legal.startsOnFreshPage = true;
    legal.rows.append(textRow(QStringLiteral("clause"), 20));
    paginator.placeBlock(legal);

    ASSERT_EQ(m_canvas.pageCount(), 2);
    EXPECT_EQ(m_canvas.textOnPage(1), QStringList({QStringLiteral("clause")}));
}

TEST_F(PaginatorTest, FreshPageSectionOnEmptyPageDoesNotBreak)
{
    Paginator paginator(&m_canvas, m_layout);
    Section legal;
    legal.name = QStringLiteral("legal");
    legal.startsOnFreshPage = true;
    legal.rows.append(textRow(QStringLiteral("clause"), 20));
    paginator.placeBlock(legal);

    EXPECT_EQ(m_canvas.pageCount(), 1);
}

TEST_F(PaginatorTest, EmptySectionPlacesNothing)
{
    Paginator paginator(&m_canvas, m_layout);
    Section empty;
    empty.name = QStringLiteral("empty");
    empty.startsOnFreshPage = true;
    empty.header = textRow(QStringLiteral("HEAD"), 20);
    paginator.placeBlock(empty);

    EXPECT_EQ(m_canvas.pageCount(), 0);
}

TEST_F(PaginatorTest, KeepWithNextMovesTitleAlong)
{
    Paginator paginator(&m_canvas, m_layout);
    for (int i = 0; i < 7; ++i)
        paginator.placeRow(textRow(QStringLiteral("filler"), 100));
    ASSERT_DOUBLE_EQ(paginator.cursor().remainingHeight, 30.0);

    Section section;
    section.name = QStringLiteral("notes");
    section.rows.append(textRow(QStringLiteral("title"), 20, true));
    section.rows.append(textRow(QStringLiteral("body"), 20));
    paginator.placeBlock(section);

    ASSERT_EQ(m_canvas.pageCount(), 2);
    EXPECT_EQ(m_canvas.textOnPage(1), QStringList({QStringLiteral("title"), QStringLiteral("body")}));
}

TEST_F(PaginatorTest, HeaderIsNotLeftAloneAtPageBottom)
{
    Paginator paginator(&m_canvas, m_layout);
    for (int i = 0; i < 7; ++i)
        paginator.placeRow(textRow(QStringLiteral("filler"), 100));

    Section table;
    table.name = QStringLiteral("items");
    table.kind = Section::Table;
    table.header = textRow(QStringLiteral("HEAD"), 20);
    table.rows.append(textRow(QStringLiteral("item"), 20));
    paginator.placeBlock(table);

    ASSERT_EQ(m_canvas.pageCount(), 2);
    EXPECT_EQ(m_canvas.textOnPage(0).count(QStringLiteral("HEAD")), 0);
    EXPECT_EQ(m_canvas.textOnPage(1), QStringList({QStringLiteral("HEAD"), QStringLiteral("item")}));
}

TEST_F(PaginatorTest, SpaceBeforeIsSkippedAtPageTop)
{
    Paginator paginator(&m_canvas, m_layout);
    Section section;
    section.name = QStringLiteral("spaced");
    section.spaceBefore = 28;
    section.rows.append(textRow(QStringLiteral("x"), 20));
    paginator.placeBlock(section);
    EXPECT_DOUBLE_EQ(paginator.cursor().y, 72.0);

    paginator.placeBlock(section);
    EXPECT_DOUBLE_EQ(paginator.cursor().y, 120.0);
}

TEST_F(PaginatorTest, RightAlignedRunEndsAtItsX)
{
    Paginator paginator(&m_canvas, m_layout);
    Row row = textRow(QStringLiteral("1 234,00"), 20);
    row.texts.first().x = 545;
    row.texts.first().alignRight = true;
    paginator.placeRow(row);

    const DrawOp &op = m_canvas.pages().first().ops.first();
    EXPECT_NEAR(op.from.x() + font()->textWidth(op.text, op.fontSize), 545.0, 0.001);
}

TEST_F(PaginatorTest, StrikeOutDrawsALineThroughTheText)
{
    Paginator paginator(&m_canvas, m_layout);
    Row row = textRow(QStringLiteral("2 500,00"), 20);
    row.texts.first().strikeOut = true;
    paginator.placeRow(row);

    const QList<DrawOp> &ops = m_canvas.pages().first().ops;
    ASSERT_EQ(ops.size(), 2);
    EXPECT_EQ(ops[1].type, DrawOp::LineOp);
    EXPECT_LT(ops[1].from.y(), ops[0].from.y());
}

TEST_F(PaginatorTest, FooterFieldsResolve)
{
    PageMetadata meta;
    meta.pageNumber = 1;
    meta.totalPages = 4;
    meta.documentNumber = QStringLiteral("SF-DEV-2026-0001");
    meta.title = QStringLiteral("Devis");

    EXPECT_EQ(HeaderFooterRenderer::resolveField(QStringLiteral("Page {page}/{pages}"), meta),
              QStringLiteral("Page 2/4"));
    EXPECT_EQ(HeaderFooterRenderer::resolveField(QStringLiteral("{title} {number}"), meta),
              QStringLiteral("Devis SF-DEV-2026-0001"));
}

TEST_F(PaginatorTest, ReplayCarriesFooterOnEveryPage)
{
    Paginator paginator(&m_canvas, m_layout);
    for (int i = 0; i < 10; ++i)
        paginator.placeRow(textRow(QStringLiteral("row"), 100));

    PageMetadata meta;
    meta.totalPages = m_canvas.pageCount();
    meta.documentNumber = QStringLiteral("N-1");

    RecordingCanvas target;
    for (int i = 0; i < m_canvas.pageCount(); ++i) {
        m_canvas.replayPage(i, target);
        meta.pageNumber = i;
        HeaderFooterRenderer::drawFooter(&target, m_layout, meta, font());
    }

    ASSERT_EQ(target.pageCount(), 2);
    EXPECT_TRUE(target.textOnPage(0).contains(QStringLiteral("Page 1/2")));
    EXPECT_TRUE(target.textOnPage(1).contains(QStringLiteral("Page 2/2")));
    EXPECT_TRUE(target.textOnPage(1).contains(QStringLiteral("N-1")));
}
