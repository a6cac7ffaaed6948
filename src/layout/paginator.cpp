/*
 * paginator.cpp — Cursor-driven placement of rows onto fixed-size pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "paginator.h"
#include "documenterrors.h"
#include "fontface.h"
#include "pagecanvas.h"

#include <QDebug>

#include <memory>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace Layout {

namespace {

// Rounding slack when comparing accumulated heights
constexpr qreal kEpsilon = 0.001;

QList<int> lineBreakPositions(const QString &text)
{
    thread_local std::unique_ptr<icu::BreakIterator> lineBreakIter;
    thread_local bool initialized = false;
    if (!initialized) {
        initialized = true;
        UErrorCode err = U_ZERO_ERROR;
        lineBreakIter.reset(icu::BreakIterator::createLineInstance(icu::Locale::getFrench(), err));
        if (U_FAILURE(err)) {
            qWarning() << "Paginator: ICU line breaker unavailable:" << u_errorName(err);
            lineBreakIter.reset();
        }
    }

    QList<int> positions;
    if (lineBreakIter) {
        icu::UnicodeString ustr(reinterpret_cast<const UChar *>(text.utf16()), text.length());
        lineBreakIter->setText(ustr);
        for (int32_t pos = lineBreakIter->first();
             pos != icu::BreakIterator::DONE;
             pos = lineBreakIter->next()) {
            positions.append(pos);
        }
        return positions;
    }

    // Fallback: break after every space
    positions.append(0);
    for (int i = 0; i < text.size(); ++i) {
        if (text[i] == QLatin1Char(' ') && i + 1 < text.size() && text[i + 1] != QLatin1Char(' '))
            positions.append(i + 1);
    }
    positions.append(text.size());
    return positions;
}

QString chopTrailingSpaces(const QString &s)
{
    int end = s.size();
    while (end > 0 && s[end - 1] == QLatin1Char(' '))
        --end;
    return s.left(end);
}

// Number of leading characters of s that fit in maxWidth, at least one
int fittingPrefix(const QString &s, qreal maxWidth, const FontFace *font, qreal fontSize)
{
    qreal width = 0;
    int count = 0;
    for (QChar c : s) {
        width += font->charWidth(c, fontSize);
        if (width > maxWidth + kEpsilon)
            break;
        ++count;
    }
    return qMax(1, count);
}

void wrapParagraph(const QString &paragraph, qreal maxWidth,
                   const FontFace *font, qreal fontSize, QStringList &lines)
{
    auto widthOf = [&](const QString &s) {
        return font->textWidth(chopTrailingSpaces(s), fontSize);
    };

    const QList<int> breaks = lineBreakPositions(paragraph);
    QString current;

    auto flush = [&]() {
        const QString line = chopTrailingSpaces(current);
        if (!line.isEmpty())
            lines.append(line);
        current.clear();
    };

    for (int i = 1; i < breaks.size(); ++i) {
        const QString segment = paragraph.mid(breaks[i - 1], breaks[i] - breaks[i - 1]);
        const QString candidate = current + segment;
        if (widthOf(candidate) <= maxWidth + kEpsilon) {
            current = candidate;
            continue;
        }

        flush();
        QString piece = segment;
        while (piece.startsWith(QLatin1Char(' ')))
            piece.remove(0, 1);

        // Hard-split a word wider than the whole line
        while (!piece.isEmpty() && widthOf(piece) > maxWidth + kEpsilon) {
            const int take = fittingPrefix(piece, maxWidth, font, fontSize);
            lines.append(piece.left(take));
            piece = piece.mid(take);
        }
        current = piece;
    }
    flush();
}

} // namespace

Paginator::Paginator(PageCanvas *canvas, const PageLayout &pageLayout, int maxPages)
    : m_canvas(canvas)
    , m_pageLayout(pageLayout)
    , m_contentRect(pageLayout.contentRect())
    , m_maxPages(maxPages)
{
    if (!m_canvas)
        throw RenderError(QStringLiteral("Paginator: no canvas"));
    if (m_contentRect.width() <= 0 || m_contentRect.height() <= 0)
        throw LayoutOverflowError(QStringLiteral("Paginator: margins leave no printable area"));
}

QStringList Paginator::measureWrap(const QString &text, qreal maxWidth,
                                   const FontFace *font, qreal fontSize)
{
    QStringList lines;
    if (text.isEmpty() || !font)
        return lines;

    const QStringList paragraphs = text.split(QLatin1Char('\n'));
    for (const QString &paragraph : paragraphs) {
        if (paragraph.trimmed().isEmpty()) {
            lines.append(QString());
            continue;
        }
        wrapParagraph(paragraph, maxWidth, font, fontSize, lines);
    }

    while (!lines.isEmpty() && lines.first().isEmpty())
        lines.removeFirst();
    while (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();
    return lines;
}

qreal Paginator::baselineOffset(const TextStyle &style, qreal lineHeight)
{
    return qMin(lineHeight, style.fontSize * 0.8 + (lineHeight - style.fontSize) / 2.0);
}

bool Paginator::atPageTop() const
{
    return m_cursor.pageIndex < 0 || m_rowsOnPage == 0;
}

void Paginator::ensurePage()
{
    if (m_cursor.pageIndex < 0)
        breakPage();
}

void Paginator::breakPage()
{
    if (m_cursor.pageIndex + 1 >= m_maxPages)
        throw LayoutOverflowError(
            QStringLiteral("Document needs more than the maximum of %1 pages").arg(m_maxPages));

    m_canvas->addPage(m_pageLayout.pageSizePoints());
    ++m_cursor.pageIndex;
    m_cursor.y = m_contentRect.top();
    m_cursor.remainingHeight = m_contentRect.height();
    m_rowsOnPage = 0;

    if (m_repeatingSection)
        drawRow(*m_repeatingSection->header);
}

qreal Paginator::rowCapacity() const
{
    qreal capacity = m_contentRect.height();
    if (m_repeatingSection)
        capacity -= m_repeatingSection->header->height;
    return capacity;
}

void Paginator::placeLines(const QStringList &lines, qreal lineHeight,
                           const TextStyle &style, qreal x)
{
    const qreal baseline = baselineOffset(style, lineHeight);
    for (const QString &line : lines) {
        Row row;
        row.height = lineHeight;
        if (!line.isEmpty()) {
            TextRun run;
            run.text = line;
            run.x = x;
            run.baseline = baseline;
            run.style = style;
            row.texts.append(run);
        }
        placeRow(row);
    }
}

void Paginator::placeRow(const Row &row)
{
    ensurePage();

    if (row.isSpacer()) {
        // Vertical gaps never open a page and are not carried over a break
        if (atPageTop())
            return;
        const qreal gap = qMin(row.height, m_cursor.remainingHeight);
        m_cursor.y += gap;
        m_cursor.remainingHeight -= gap;
        return;
    }

    if (row.height > rowCapacity() + kEpsilon)
        throw LayoutOverflowError(
            QStringLiteral("A row of %1 pt does not fit on an empty page (%2 pt available)")
                .arg(row.height).arg(rowCapacity()));

    if (row.height > m_cursor.remainingHeight + kEpsilon)
        breakPage();

    drawRow(row);
}

void Paginator::drawRow(const Row &row)
{
    const qreal top = m_cursor.y;

    for (const TextRun &run : row.texts) {
        if (run.text.isEmpty())
            continue;
        if (!run.style.font)
            throw RenderError(QStringLiteral("Paginator: text run without a font"));
        const qreal width = run.style.font->textWidth(run.text, run.style.fontSize);
        const qreal x = run.alignRight ? run.x - width : run.x;
        const qreal baseline = top + run.baseline;
        m_canvas->drawText(run.text, QPointF(x, baseline), run.style.font,
                           run.style.fontSize, run.style.color);
        if (run.strikeOut) {
            const qreal y = baseline - run.style.fontSize * 0.3;
            m_canvas->drawLine(QPointF(x, y), QPointF(x + width, y), 0.6, run.style.color);
        }
    }
    for (const RuleRun &rule : row.rules)
        m_canvas->drawLine(QPointF(rule.x1, top + rule.y), QPointF(rule.x2, top + rule.y),
                           rule.width, rule.color);
    for (const BoxRun &box : row.boxes)
        m_canvas->drawRect(box.rect.translated(0, top), box.width, box.color);

    m_cursor.y += row.height;
    m_cursor.remainingHeight -= row.height;
    ++m_rowsOnPage;
}

namespace {

// Clears the paginator's repeating-header reference when a section ends,
// including when placement throws.
class RepeatScope {
public:
    RepeatScope(const Section **slot, const Section *section)
        : m_slot(slot)
    {
        *m_slot = section;
    }
    ~RepeatScope() { *m_slot = nullptr; }

    RepeatScope(const RepeatScope &) = delete;
    RepeatScope &operator=(const RepeatScope &) = delete;

private:
    const Section **m_slot;
};

} // namespace

void Paginator::placeBlock(const Section &section)
{
    // A section without rows occupies no page at all
    if (section.rows.isEmpty())
        return;

    ensurePage();
    if (section.startsOnFreshPage && !atPageTop())
        breakPage();
    if (section.spaceBefore > 0)
        placeRow(Row::spacer(section.spaceBefore));

    if (section.header) {
        // Never leave a header alone at the bottom of a page
        const Row &first = section.rows.first();
        const qreal needed = section.header->height + (first.isSpacer() ? 0 : first.height);
        if (!atPageTop() && needed > m_cursor.remainingHeight + kEpsilon
            && needed <= m_contentRect.height())
            breakPage();
        placeRow(*section.header);
    }

    RepeatScope scope(&m_repeatingSection, section.repeatsHeader() ? &section : nullptr);

    for (int i = 0; i < section.rows.size(); ++i) {
        const Row &row = section.rows[i];
        if (row.keepWithNext && i + 1 < section.rows.size()) {
            const qreal needed = row.height + section.rows[i + 1].height;
            if (!atPageTop() && needed > m_cursor.remainingHeight + kEpsilon
                && needed <= rowCapacity())
                breakPage();
        }
        placeRow(row);
    }

    qDebug() << "Paginator: placed" << section.name << "ending on page" << pageCount();
}

} // namespace Layout
