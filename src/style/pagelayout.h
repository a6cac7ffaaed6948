#ifndef LEDGERPRINT_PAGELAYOUT_H
#define LEDGERPRINT_PAGELAYOUT_H

#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QRectF>
#include <QSizeF>
#include <QString>

class QJsonObject;

struct PageLayout
{
    QPageSize::PageSizeId pageSizeId = QPageSize::A4;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QMarginsF margins{50.0, 52.0, 50.0, 60.0}; // points

    // Footer configuration. Fields: {page}, {pages}, {number}, {title}
    bool footerEnabled = true;
    QString footerLeft{QStringLiteral("{number}")};
    QString footerCenter;
    QString footerRight{QStringLiteral("Page {page}/{pages}")};

    // Footer sits inside the bottom margin; offsets from the page bottom (points)
    static constexpr qreal kFooterRuleOffset = 32.0;
    static constexpr qreal kFooterBaselineOffset = 20.0;
    static constexpr qreal kFooterFontSize = 8.0;

    // Return the full page size in points
    QSizeF pageSizePoints() const
    {
        QPageSize ps(pageSizeId);
        QSizeF full = ps.size(QPageSize::Point);
        if (orientation == QPageLayout::Landscape)
            full.transpose();
        return full;
    }

    // Printable area in page coordinates (top-left origin)
    QRectF contentRect() const
    {
        QSizeF full = pageSizePoints();
        return QRectF(margins.left(), margins.top(),
                      full.width() - margins.left() - margins.right(),
                      full.height() - margins.top() - margins.bottom());
    }

    QSizeF contentSizePoints() const { return contentRect().size(); }

    static PageLayout fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;
};

#endif // LEDGERPRINT_PAGELAYOUT_H
