/*
 * renderconfig.cpp: Options shared by the assembler and the render orchestrator
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderconfig.h"

#include <KConfigGroup>
#include <KSharedConfig>

#include <QDebug>

#include <algorithm>

RenderConfig RenderConfig::loadDefaults()
{
    const KConfigGroup group(KSharedConfig::openConfig(QStringLiteral("md2pdfrc")),
                             QStringLiteral("Render"));
    RenderConfig config = fromConfigGroup(group);

    const QString envBrowser = qEnvironmentVariable("MD2PDF_BROWSER");
    if (!envBrowser.isEmpty())
        config.browserExecutable = envBrowser;

    return config;
}

RenderConfig RenderConfig::fromConfigGroup(const KConfigGroup &group)
{
    RenderConfig config;

    const int margin = group.readEntry("MarginPixels", DefaultMarginPixels);
    if (margin >= 0) {
        config.marginPixels = margin;
    } else {
        qWarning() << "RenderConfig: Ignoring negative MarginPixels" << margin;
    }

    int timeoutSeconds = group.readEntry("TimeoutSeconds", DefaultTimeoutSeconds);
    if (timeoutSeconds > MaxTimeoutSeconds) {
        qWarning() << "RenderConfig: Clamping TimeoutSeconds" << timeoutSeconds
                   << "to" << MaxTimeoutSeconds;
        timeoutSeconds = MaxTimeoutSeconds;
    }
    config.timeoutMs = std::max(1, timeoutSeconds) * 1000;

    config.browserExecutable = group.readEntry("BrowserExecutable", QString());
    return config;
}

bool RenderConfig::setTimeoutSeconds(int seconds)
{
    if (seconds <= 0 || seconds > MaxTimeoutSeconds)
        return false;
    timeoutMs = seconds * 1000;
    return true;
}

QString RenderConfig::defaultOutputPath(const QString &inputPath)
{
    const qsizetype slash = inputPath.lastIndexOf(QLatin1Char('/'));
    const QString dir = inputPath.left(slash + 1);
    QString name = inputPath.mid(slash + 1);

    // Only the last extension is replaced; dot files keep their name
    const qsizetype dot = name.lastIndexOf(QLatin1Char('.'));
    if (dot > 0)
        name.truncate(dot);

    return dir + name + QStringLiteral(".pdf");
}
