#ifndef LEDGERPRINT_HEADERFOOTERRENDERER_H
#define LEDGERPRINT_HEADERFOOTERRENDERER_H

#include <QString>

class PageCanvas;
struct FontFace;
struct PageLayout;

struct PageMetadata {
    int pageNumber = 0;   // 0-based
    int totalPages = 1;
    QString documentNumber;
    QString title;
};

namespace HeaderFooterRenderer {

// Draw the footer rule and fields on the canvas's current page.
void drawFooter(PageCanvas *canvas, const PageLayout &layout,
                const PageMetadata &meta, const FontFace *font);

QString resolveField(const QString &text, const PageMetadata &meta);

} // namespace HeaderFooterRenderer

#endif // LEDGERPRINT_HEADERFOOTERRENDERER_H
