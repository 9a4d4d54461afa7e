/*
 * renderconfig.h: Options shared by the assembler and the render orchestrator
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_RENDERCONFIG_H
#define MD2PDF_RENDERCONFIG_H

#include <QString>

#include <limits>

class KConfigGroup;

struct RenderConfig
{
    static constexpr int DefaultMarginPixels = 50;
    static constexpr int DefaultTimeoutSeconds = 30;
    // Largest deadline whose millisecond value still fits timeoutMs
    static constexpr int MaxTimeoutSeconds = std::numeric_limits<int>::max() / 1000;

    int marginPixels = DefaultMarginPixels;   // CSS px, all four page edges
    QString outputPath;
    int timeoutMs = DefaultTimeoutSeconds * 1000;
    QString browserExecutable;                 // empty = search PATH

    // Defaults from the [Render] group of md2pdfrc, with MD2PDF_BROWSER
    // taking precedence over the configured browser.
    static RenderConfig loadDefaults();

    // Defaults from a [Render] group; out-of-range values are clamped
    static RenderConfig fromConfigGroup(const KConfigGroup &group);

    // Sets timeoutMs; false (and unchanged) unless 1 <= seconds <= MaxTimeoutSeconds
    bool setTimeoutSeconds(int seconds);

    // "dir/notes.md" -> "dir/notes.pdf"
    static QString defaultOutputPath(const QString &inputPath);
};

#endif // MD2PDF_RENDERCONFIG_H
