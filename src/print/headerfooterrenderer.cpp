#include "headerfooterrenderer.h"
#include "fontface.h"
#include "pagecanvas.h"
#include "pagelayout.h"
#include "textsanitizer.h"

#include <QColor>

namespace HeaderFooterRenderer {

static void drawFields(PageCanvas *canvas, const PageLayout &layout,
                       const PageMetadata &meta, const FontFace *font)
{
    const QColor color(0x66, 0x66, 0x66);
    const qreal size = PageLayout::kFooterFontSize;
    const QSizeF page = layout.pageSizePoints();
    const qreal baseline = page.height() - PageLayout::kFooterBaselineOffset;
    const qreal left = layout.margins.left();
    const qreal right = page.width() - layout.margins.right();

    QString resolvedLeft = TextSanitizer::sanitizeLine(resolveField(layout.footerLeft, meta));
    QString resolvedCenter = TextSanitizer::sanitizeLine(resolveField(layout.footerCenter, meta));
    QString resolvedRight = TextSanitizer::sanitizeLine(resolveField(layout.footerRight, meta));

    if (!resolvedLeft.isEmpty())
        canvas->drawText(resolvedLeft, QPointF(left, baseline), font, size, color);
    if (!resolvedCenter.isEmpty()) {
        qreal width = font->textWidth(resolvedCenter, size);
        canvas->drawText(resolvedCenter, QPointF((left + right - width) / 2.0, baseline),
                         font, size, color);
    }
    if (!resolvedRight.isEmpty()) {
        qreal width = font->textWidth(resolvedRight, size);
        canvas->drawText(resolvedRight, QPointF(right - width, baseline), font, size, color);
    }
}

void drawFooter(PageCanvas *canvas, const PageLayout &layout,
                const PageMetadata &meta, const FontFace *font)
{
    if (!layout.footerEnabled)
        return;

    // Separator line above the footer fields
    const QSizeF page = layout.pageSizePoints();
    const qreal ruleY = page.height() - PageLayout::kFooterRuleOffset;
    canvas->drawLine(QPointF(layout.margins.left(), ruleY),
                     QPointF(page.width() - layout.margins.right(), ruleY),
                     0.5, QColor(0xdb, 0xdb, 0xdb));

    drawFields(canvas, layout, meta, font);
}

QString resolveField(const QString &text, const PageMetadata &meta)
{
    if (text.isEmpty())
        return {};

    QString result = text;
    result.replace(QLatin1String("{pages}"), QString::number(meta.totalPages));
    result.replace(QLatin1String("{page}"), QString::number(meta.pageNumber + 1));
    result.replace(QLatin1String("{number}"), meta.documentNumber);
    result.replace(QLatin1String("{title}"), meta.title);
    return result;
}

} // namespace HeaderFooterRenderer
