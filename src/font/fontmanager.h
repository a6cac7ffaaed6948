/*
 * fontmanager.h — Font resolution and metrics
 *
 * Standard Helvetica faces are always available. A system TrueType
 * family can be requested instead; it is resolved with fontconfig and
 * measured with FreeType, then embedded by the PDF canvas.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef LEDGERPRINT_FONTMANAGER_H
#define LEDGERPRINT_FONTMANAGER_H

#include <QHash>
#include <QMutex>
#include <QString>

#include <ft2build.h>
#include FT_FREETYPE_H

#include "fontface.h"

enum class FontRole {
    Regular,
    Bold,
};

struct FontKey {
    QString family;
    int weight;   // 400=Normal, 700=Bold

    bool operator==(const FontKey &o) const
    {
        return family == o.family && weight == o.weight;
    }
};

inline size_t qHash(const FontKey &k, size_t seed = 0)
{
    return qHash(k.family, seed) ^ qHash(k.weight, seed);
}

class FontManager {
public:
    FontManager();
    ~FontManager();

    FontManager(const FontManager &) = delete;
    FontManager &operator=(const FontManager &) = delete;

    // Process-wide instance; faces it hands out live as long as the process.
    static FontManager &shared();

    const FontFace *standardFace(FontRole role) const;

    // nullptr when the family cannot be resolved to a TrueType file.
    const FontFace *loadFont(const QString &family, FontRole role);

    // loadFont with fallback: an empty family, or one that cannot be
    // loaded, yields the standard face for the role.
    const FontFace *face(const QString &family, FontRole role);

private:
    FT_Library m_ftLibrary = nullptr;
    FontFace m_helvetica;
    FontFace m_helveticaBold;
    QHash<FontKey, const FontFace *> m_faces;
    QHash<QString, FontFace *> m_facesByPath;
    QMutex m_mutex;

    QString resolveFontPath(const QString &family, int weight) const;
    const FontFace *loadFontFromPathLocked(const QString &filePath);
};

#endif // LEDGERPRINT_FONTMANAGER_H
