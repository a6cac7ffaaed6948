/*
 * fontmanager.cpp — Font resolution and metrics
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontmanager.h"
#include "standardfonts.h"
#include "winansi.h"

#include <QDebug>
#include <QFile>
#include <QMutexLocker>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_FONT_FORMATS_H
#include FT_TRUETYPE_TABLES_H

#include <fontconfig/fontconfig.h>

qreal FontFace::charWidth(QChar c, qreal sizePoints) const
{
    uchar code = WinAnsi::encode(c);
    return widths[code ? code : '?'] * sizePoints / 1000.0;
}

qreal FontFace::textWidth(const QString &text, qreal sizePoints) const
{
    int units = 0;
    for (QChar c : text) {
        uchar code = WinAnsi::encode(c);
        units += widths[code ? code : '?'];
    }
    return units * sizePoints / 1000.0;
}

FontManager::FontManager()
    : m_helvetica(StandardFonts::helvetica())
    , m_helveticaBold(StandardFonts::helveticaBold())
{
    FT_Error err = FT_Init_FreeType(&m_ftLibrary);
    if (err) {
        qWarning() << "FontManager: Failed to initialize FreeType:" << err;
        m_ftLibrary = nullptr;
    }
}

FontManager::~FontManager()
{
    // m_facesByPath owns the faces; m_faces may alias several keys to one
    // file when fontconfig resolves different weights to the same path.
    m_faces.clear();
    qDeleteAll(m_facesByPath);
    m_facesByPath.clear();
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

FontManager &FontManager::shared()
{
    static FontManager instance;
    return instance;
}

const FontFace *FontManager::standardFace(FontRole role) const
{
    return role == FontRole::Bold ? &m_helveticaBold : &m_helvetica;
}

QString FontManager::resolveFontPath(const QString &family, int weight) const
{
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config)
        return {};

    FcPattern *pat = FcPatternCreate();
    FcPatternAddString(pat, FC_FAMILY,
                       reinterpret_cast<const FcChar8 *>(family.toUtf8().constData()));
    FcPatternAddInteger(pat, FC_WEIGHT, weight >= 700 ? FC_WEIGHT_BOLD : FC_WEIGHT_REGULAR);
    FcPatternAddInteger(pat, FC_SLANT, FC_SLANT_ROMAN);
    FcPatternAddString(pat, FC_FONTFORMAT, reinterpret_cast<const FcChar8 *>("TrueType"));

    FcConfigSubstitute(config, pat, FcMatchPattern);
    FcDefaultSubstitute(pat);

    FcResult fcResult;
    FcPattern *match = FcFontMatch(config, pat, &fcResult);
    QString path;
    if (match) {
        FcChar8 *file = nullptr;
        if (FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch && file)
            path = QString::fromUtf8(reinterpret_cast<const char *>(file));
        FcPatternDestroy(match);
    }
    FcPatternDestroy(pat);
    FcConfigDestroy(config);
    return path;
}

const FontFace *FontManager::loadFont(const QString &family, FontRole role)
{
    QMutexLocker locker(&m_mutex);

    const int weight = role == FontRole::Bold ? 700 : 400;
    FontKey key{family, weight};
    if (auto *existing = m_faces.value(key))
        return existing;

    QString path = resolveFontPath(family, weight);
    if (path.isEmpty()) {
        qWarning() << "FontManager: Could not resolve font:" << family << weight;
        return nullptr;
    }

    const FontFace *face = loadFontFromPathLocked(path);
    if (face)
        m_faces.insert(key, face);
    return face;
}

const FontFace *FontManager::face(const QString &family, FontRole role)
{
    if (family.isEmpty())
        return standardFace(role);
    if (const FontFace *loaded = loadFont(family, role))
        return loaded;
    qWarning() << "FontManager: Falling back to" << standardFace(role)->postScriptName
               << "for" << family;
    return standardFace(role);
}

static int ftUnitsToPdf(FT_Long units, FT_UShort unitsPerEm)
{
    if (unitsPerEm == 0)
        return 0;
    return static_cast<int>(units * 1000 / unitsPerEm);
}

const FontFace *FontManager::loadFontFromPathLocked(const QString &filePath)
{
    if (auto *existing = m_facesByPath.value(filePath))
        return existing;

    if (!m_ftLibrary)
        return nullptr;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "FontManager: Cannot open font file:" << filePath;
        return nullptr;
    }
    QByteArray rawData = file.readAll();

    FT_Face ftFace = nullptr;
    FT_Error err = FT_New_Memory_Face(
        m_ftLibrary,
        reinterpret_cast<const FT_Byte *>(rawData.constData()),
        rawData.size(),
        0,
        &ftFace);
    if (err) {
        qWarning() << "FontManager: FreeType failed to load:" << filePath << "error:" << err;
        return nullptr;
    }

    // Only TrueType outlines can go into /FontFile2 as a simple font
    const char *format = FT_Get_Font_Format(ftFace);
    if (!format || qstrcmp(format, "TrueType") != 0 || !FT_IS_SFNT(ftFace)) {
        qWarning() << "FontManager: Not a TrueType font:" << filePath << format;
        FT_Done_Face(ftFace);
        return nullptr;
    }
    if (FT_Select_Charmap(ftFace, FT_ENCODING_UNICODE) != 0) {
        qWarning() << "FontManager: No Unicode cmap in" << filePath;
        FT_Done_Face(ftFace);
        return nullptr;
    }

    auto *face = new FontFace;
    face->embedded = true;
    face->fontProgram = rawData;

    const FT_UShort upem = ftFace->units_per_EM;
    const char *psName = FT_Get_Postscript_Name(ftFace);
    face->postScriptName = psName ? QByteArray(psName) : QByteArray("Unknown");

    for (int code = 0; code < 256; ++code) {
        char32_t unicode = WinAnsi::toUnicode(static_cast<uchar>(code));
        if (unicode == 0)
            continue;
        FT_UInt gid = FT_Get_Char_Index(ftFace, unicode);
        if (gid == 0)
            continue;
        if (FT_Load_Glyph(ftFace, gid, FT_LOAD_NO_SCALE) == 0)
            face->widths[code] = ftUnitsToPdf(ftFace->glyph->advance.x, upem);
    }

    face->ascent = ftUnitsToPdf(ftFace->ascender, upem);
    face->descent = ftUnitsToPdf(ftFace->descender, upem);
    face->capHeight = face->ascent;
    auto *os2 = reinterpret_cast<TT_OS2 *>(FT_Get_Sfnt_Table(ftFace, FT_SFNT_OS2));
    if (os2 && os2->sCapHeight > 0)
        face->capHeight = ftUnitsToPdf(os2->sCapHeight, upem);
    auto *post = reinterpret_cast<TT_Postscript *>(FT_Get_Sfnt_Table(ftFace, FT_SFNT_POST));
    if (post)
        face->italicAngle = static_cast<int>(post->italicAngle / 65536);

    // PDF font flags (PDF32000-2008, Table 123)
    face->flags = 1 << 5; // Nonsymbolic
    if (FT_IS_FIXED_WIDTH(ftFace))
        face->flags |= 1 << 0;
    if (ftFace->style_flags & FT_STYLE_FLAG_BOLD)
        face->stemV = 140;

    FT_BBox bbox = ftFace->bbox;
    face->bbox = {ftUnitsToPdf(bbox.xMin, upem), ftUnitsToPdf(bbox.yMin, upem),
                  ftUnitsToPdf(bbox.xMax, upem), ftUnitsToPdf(bbox.yMax, upem)};

    FT_Done_Face(ftFace);

    m_facesByPath.insert(filePath, face);
    return face;
}
