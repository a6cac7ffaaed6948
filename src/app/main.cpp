#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

#include <KAboutData>
#include <KLocalizedString>

#include "documentbuilder.h"
#include "documenterrors.h"
#include "rendersettings.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitValidation = 2,
    ExitLayoutOverflow = 3,
    ExitRender = 4,
};

bool readJsonObject(const QString &path, QJsonObject *out, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull()) {
        *error = parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        *error = i18n("the payload must be a JSON object");
        return false;
    }
    *out = doc.object();
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("ledgerprint");

    KAboutData aboutData(
        QStringLiteral("ledgerprint"),
        i18n("LedgerPrint"),
        QStringLiteral("0.1.0"),
        i18n("Renders quotes and invoices to PDF"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    QCommandLineOption typeOption(
        {QStringLiteral("t"), QStringLiteral("type")},
        i18n("Document type: quote or invoice."),
        QStringLiteral("type"), QStringLiteral("quote"));
    QCommandLineOption settingsOption(
        {QStringLiteral("s"), QStringLiteral("settings")},
        i18n("Render settings JSON file."),
        QStringLiteral("file"));
    QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("Output PDF file (default: payload name with .pdf)."),
        QStringLiteral("file"));
    parser.addOption(typeOption);
    parser.addOption(settingsOption);
    parser.addOption(outputOption);
    parser.addPositionalArgument(
        QStringLiteral("payload"),
        i18n("Document payload JSON file"),
        QStringLiteral("payload.json"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        qCritical().noquote() << i18n("Expected exactly one payload file.");
        return ExitUsage;
    }
    const QString payloadPath = args.first();

    const QString typeName = parser.value(typeOption).toLower();
    DocumentType type;
    if (typeName == QLatin1String("quote")) {
        type = DocumentType::Quote;
    } else if (typeName == QLatin1String("invoice")) {
        type = DocumentType::Invoice;
    } else {
        qCritical().noquote() << i18n("Unknown document type: %1", typeName);
        return ExitUsage;
    }

    RenderSettings settings;
    if (parser.isSet(settingsOption)) {
        QString error;
        auto loaded = RenderSettings::loadFromFile(parser.value(settingsOption), &error);
        if (!loaded) {
            qCritical().noquote() << i18n("Cannot read settings %1: %2",
                                          parser.value(settingsOption), error);
            return ExitUsage;
        }
        settings = *loaded;
    }

    QJsonObject json;
    QString error;
    if (!readJsonObject(payloadPath, &json, &error)) {
        qCritical().noquote() << i18n("Cannot read payload %1: %2", payloadPath, error);
        return ExitUsage;
    }

    QString outputPath = parser.value(outputOption);
    if (outputPath.isEmpty()) {
        const QFileInfo fi(payloadPath);
        outputPath = fi.path() + QLatin1Char('/') + fi.completeBaseName() + QLatin1String(".pdf");
    }

    RenderedDocument doc;
    try {
        const DocumentPayload payload = DocumentPayload::fromJson(json);
        doc = createBuilder(type, settings)->build(payload);
    } catch (const ValidationError &e) {
        qCritical().noquote() << i18n("Invalid payload: %1", e.message());
        return ExitValidation;
    } catch (const LayoutOverflowError &e) {
        qCritical().noquote() << i18n("Layout failed: %1", e.message());
        return ExitLayoutOverflow;
    } catch (const RenderError &e) {
        qCritical().noquote() << i18n("Rendering failed: %1", e.message());
        return ExitRender;
    }

    QSaveFile out(outputPath);
    if (!out.open(QIODevice::WriteOnly) || out.write(doc.bytes) != doc.bytes.size()
        || !out.commit()) {
        qCritical().noquote() << i18n("Cannot write %1: %2", outputPath, out.errorString());
        return ExitUsage;
    }

    qInfo().noquote() << i18np("Wrote %2 (1 page)", "Wrote %2 (%1 pages)",
                               doc.pageCount, outputPath);
    return ExitOk;
}
