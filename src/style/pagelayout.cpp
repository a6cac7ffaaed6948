/*
 * pagelayout.cpp — JSON serialization for PageLayout
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"

#include <QDebug>
#include <QJsonObject>

namespace {

struct NamedSize {
    const char *name;
    QPageSize::PageSizeId id;
};

// First entry is the fallback for unknown names
constexpr NamedSize kPageSizes[] = {
    {"A4", QPageSize::A4},
    {"A5", QPageSize::A5},
    {"Letter", QPageSize::Letter},
    {"Legal", QPageSize::Legal},
};

QPageSize::PageSizeId pageSizeFromName(const QString &name)
{
    for (const NamedSize &size : kPageSizes) {
        if (name.compare(QLatin1String(size.name), Qt::CaseInsensitive) == 0)
            return size.id;
    }
    qWarning() << "PageLayout: unknown page size" << name << "- using A4";
    return kPageSizes[0].id;
}

QString pageSizeName(QPageSize::PageSizeId id)
{
    for (const NamedSize &size : kPageSizes) {
        if (size.id == id)
            return QLatin1String(size.name);
    }
    return QLatin1String(kPageSizes[0].name);
}

// Negative or missing values keep the current margin
qreal marginValue(const QJsonObject &m, const char *key, qreal current)
{
    const qreal v = m.value(QLatin1String(key)).toDouble(current);
    return v >= 0 ? v : current;
}

} // namespace

PageLayout PageLayout::fromJson(const QJsonObject &obj)
{
    PageLayout pl;

    if (obj.contains(QLatin1String("pageSize")))
        pl.pageSizeId = pageSizeFromName(obj.value(QLatin1String("pageSize")).toString());

    if (obj.value(QLatin1String("orientation")).toString() == QLatin1String("landscape"))
        pl.orientation = QPageLayout::Landscape;

    if (obj.contains(QLatin1String("margins"))) {
        const QJsonObject m = obj.value(QLatin1String("margins")).toObject();
        const QMarginsF requested(marginValue(m, "left", pl.margins.left()),
                                  marginValue(m, "top", pl.margins.top()),
                                  marginValue(m, "right", pl.margins.right()),
                                  marginValue(m, "bottom", pl.margins.bottom()));
        const QSizeF full = pl.pageSizePoints();
        if (requested.left() + requested.right() < full.width()
            && requested.top() + requested.bottom() < full.height()) {
            pl.margins = requested;
        } else {
            qWarning() << "PageLayout: margins leave no content area, ignored";
        }
    }

    if (obj.contains(QLatin1String("footer"))) {
        const QJsonObject f = obj.value(QLatin1String("footer")).toObject();
        pl.footerEnabled = f.value(QLatin1String("enabled")).toBool(true);
        pl.footerLeft    = f.value(QLatin1String("left")).toString(pl.footerLeft);
        pl.footerCenter  = f.value(QLatin1String("center")).toString();
        pl.footerRight   = f.value(QLatin1String("right")).toString(pl.footerRight);
    }

    return pl;
}

QJsonObject PageLayout::toJson() const
{
    QJsonObject m;
    m[QLatin1String("left")]   = margins.left();
    m[QLatin1String("top")]    = margins.top();
    m[QLatin1String("right")]  = margins.right();
    m[QLatin1String("bottom")] = margins.bottom();

    QJsonObject f;
    f[QLatin1String("enabled")] = footerEnabled;
    f[QLatin1String("left")]    = footerLeft;
    f[QLatin1String("center")]  = footerCenter;
    f[QLatin1String("right")]   = footerRight;

    QJsonObject obj;
    obj[QLatin1String("pageSize")] = pageSizeName(pageSizeId);
    obj[QLatin1String("orientation")] = orientation == QPageLayout::Landscape
        ? QStringLiteral("landscape") : QStringLiteral("portrait");
    obj[QLatin1String("margins")] = m;
    obj[QLatin1String("footer")] = f;
    return obj;
}
