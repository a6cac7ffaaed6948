/*
 * rendersettings.h — Everything about a render that is not the payload
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_RENDERSETTINGS_H
#define LEDGERPRINT_RENDERSETTINGS_H

#include <optional>

#include <QString>

#include "pagelayout.h"
#include "pdfexportoptions.h"

class QJsonObject;

struct RenderSettings
{
    static constexpr int kDefaultMaxPages = 50;

    PageLayout pageLayout;
    PdfExportOptions pdf;
    QString fontFamily;          // empty: standard Helvetica
    int maxPages = kDefaultMaxPages;

    // Missing keys keep their defaults
    static RenderSettings fromJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    // std::nullopt when the file cannot be read or is not a JSON object;
    // the reason goes to errorMessage.
    static std::optional<RenderSettings> loadFromFile(const QString &path,
                                                      QString *errorMessage = nullptr);
};

#endif // LEDGERPRINT_RENDERSETTINGS_H
