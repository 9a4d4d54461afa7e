/*
 * main.cpp: md2pdf command-line entry point
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSaveFile>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "chromiumbackend.h"
#include "converter.h"
#include "documentassembler.h"
#include "renderconfig.h"
#include "renderorchestrator.h"

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitUsage = 1,
    ExitInput = 2,
    ExitStructure = 3,
    ExitNoRenderer = 4,
    ExitRender = 5,
    ExitTimeout = 6,
    ExitOutput = 7,
};

int reportError(const QString &message, int code)
{
    QTextStream(stderr) << i18n("Error: %1", message) << Qt::endl;
    return code;
}

bool writeFile(const QString &path, const QByteArray &bytes, QString *errorString)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorString = file.errorString();
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        *errorString = file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        *errorString = file.errorString();
        return false;
    }
    return true;
}

int exitCodeFor(RenderOrchestrator::Error error)
{
    switch (error) {
    case RenderOrchestrator::CapabilityUnavailableError:
        return ExitNoRenderer;
    case RenderOrchestrator::TimeoutError:
        return ExitTimeout;
    default:
        return ExitRender;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("md2pdf");

    KAboutData aboutData(
        QStringLiteral("md2pdf"),
        i18n("md2pdf"),
        QStringLiteral("0.1.0"),
        i18n("Convert Markdown to a styled, paginated PDF"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2026"));
    KAboutData::setApplicationData(aboutData);

    RenderConfig config = RenderConfig::loadDefaults();

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption inputOption(
        {QStringLiteral("i"), QStringLiteral("input")},
        i18n("Markdown file to convert"), i18n("file"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("PDF file to write (default: input with a .pdf extension)"), i18n("file"));
    const QCommandLineOption marginOption(
        {QStringLiteral("m"), QStringLiteral("margin")},
        i18n("Page margin in CSS pixels (default: %1)", config.marginPixels), i18n("px"));
    const QCommandLineOption timeoutOption(
        {QStringLiteral("t"), QStringLiteral("timeout")},
        i18n("Rendering deadline in seconds (default: %1)", config.timeoutMs / 1000),
        i18n("seconds"));
    const QCommandLineOption browserOption(
        {QStringLiteral("b"), QStringLiteral("browser")},
        i18n("Chromium-compatible browser executable"), i18n("path"));
    const QCommandLineOption htmlOption(
        QStringLiteral("html"),
        i18n("Also write the assembled HTML document"), i18n("file"));

    parser.addOptions({inputOption, outputOption, marginOption, timeoutOption,
                       browserOption, htmlOption});
    parser.addPositionalArgument(QStringLiteral("file"),
                                 i18n("Markdown file to convert"),
                                 QStringLiteral("[file]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    // --- Arguments ---

    QString inputPath = parser.value(inputOption);
    const QStringList positional = parser.positionalArguments();
    if (inputPath.isEmpty() && !positional.isEmpty())
        inputPath = positional.constFirst();
    if (inputPath.isEmpty() || positional.size() > 1
        || (!positional.isEmpty() && parser.isSet(inputOption))) {
        return reportError(i18n("expected exactly one input file"), ExitUsage);
    }

    if (parser.isSet(marginOption)) {
        bool ok = false;
        const int margin = parser.value(marginOption).toInt(&ok);
        if (!ok || margin < 0)
            return reportError(i18n("invalid margin '%1'", parser.value(marginOption)), ExitUsage);
        config.marginPixels = margin;
    }
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const int seconds = parser.value(timeoutOption).toInt(&ok);
        if (!ok || !config.setTimeoutSeconds(seconds))
            return reportError(i18n("invalid timeout '%1'", parser.value(timeoutOption)), ExitUsage);
    }
    if (parser.isSet(browserOption))
        config.browserExecutable = parser.value(browserOption);

    config.outputPath = parser.isSet(outputOption)
        ? parser.value(outputOption)
        : RenderConfig::defaultOutputPath(inputPath);

    // --- Markdown -> HTML ---

    QFile input(inputPath);
    if (!input.open(QIODevice::ReadOnly))
        return reportError(i18n("cannot read %1: %2", inputPath, input.errorString()), ExitInput);
    const QString markdown = QString::fromUtf8(input.readAll());
    input.close();

    Converter converter;
    if (!converter.convert(markdown))
        return reportError(converter.errorString(), ExitStructure);

    const AssembledDocument document = DocumentAssembler::assemble(converter.html(), config);

    if (parser.isSet(htmlOption)) {
        const QString htmlPath = parser.value(htmlOption);
        QString error;
        if (!writeFile(htmlPath, document.toHtml().toUtf8(), &error))
            return reportError(i18n("cannot write %1: %2", htmlPath, error), ExitOutput);
    }

    // --- HTML -> PDF ---

    ChromiumBackend backend(config.browserExecutable);
    RenderOrchestrator orchestrator(&backend, config);
    const QByteArray pdf = orchestrator.renderToPdf(document);
    if (orchestrator.error() != RenderOrchestrator::NoError)
        return reportError(orchestrator.errorString(), exitCodeFor(orchestrator.error()));

    QString error;
    if (!writeFile(config.outputPath, pdf, &error))
        return reportError(i18n("cannot write %1: %2", config.outputPath, error), ExitOutput);

    QTextStream(stdout) << i18n("PDF generated successfully: %1", config.outputPath) << Qt::endl;
    return ExitSuccess;
}
