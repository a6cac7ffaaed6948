/*
 * rendersettings.cpp — JSON serialization for RenderSettings
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "rendersettings.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

RenderSettings RenderSettings::fromJson(const QJsonObject &obj)
{
    RenderSettings s;

    if (obj.contains(QLatin1String("page")))
        s.pageLayout = PageLayout::fromJson(obj.value(QLatin1String("page")).toObject());

    s.fontFamily = obj.value(QLatin1String("fontFamily")).toString();
    s.maxPages = obj.value(QLatin1String("maxPages")).toInt(kDefaultMaxPages);
    if (s.maxPages < 1)
        s.maxPages = 1;

    if (obj.contains(QLatin1String("pdf"))) {
        QJsonObject p = obj.value(QLatin1String("pdf")).toObject();
        s.pdf.title    = p.value(QLatin1String("title")).toString();
        s.pdf.author   = p.value(QLatin1String("author")).toString();
        s.pdf.subject  = p.value(QLatin1String("subject")).toString();
        s.pdf.keywords = p.value(QLatin1String("keywords")).toString();
        s.pdf.producer = p.value(QLatin1String("producer")).toString(s.pdf.producer);
        s.pdf.compressStreams = p.value(QLatin1String("compress")).toBool(true);
        const QString created = p.value(QLatin1String("creationDate")).toString();
        if (!created.isEmpty())
            s.pdf.creationDate = QDateTime::fromString(created, Qt::ISODate);
    }

    return s;
}

QJsonObject RenderSettings::toJson() const
{
    QJsonObject obj;
    obj[QLatin1String("page")] = pageLayout.toJson();
    obj[QLatin1String("fontFamily")] = fontFamily;
    obj[QLatin1String("maxPages")] = maxPages;

    QJsonObject p;
    p[QLatin1String("title")]    = pdf.title;
    p[QLatin1String("author")]   = pdf.author;
    p[QLatin1String("subject")]  = pdf.subject;
    p[QLatin1String("keywords")] = pdf.keywords;
    p[QLatin1String("producer")] = pdf.producer;
    p[QLatin1String("compress")] = pdf.compressStreams;
    if (pdf.creationDate.isValid())
        p[QLatin1String("creationDate")] = pdf.creationDate.toString(Qt::ISODate);
    obj[QLatin1String("pdf")] = p;

    return obj;
}

std::optional<RenderSettings> RenderSettings::loadFromFile(const QString &path,
                                                           QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = file.errorString();
        return std::nullopt;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        if (errorMessage)
            *errorMessage = doc.isNull() ? parseError.errorString()
                                         : QStringLiteral("settings must be a JSON object");
        return std::nullopt;
    }

    return fromJson(doc.object());
}
