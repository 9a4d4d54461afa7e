/*
 * rendererbackend.h: Paginating renderer capability
 *
 * Every step completes asynchronously by emitting exactly one of its
 * completion signals or failed(). close() is synchronous and may be
 * called in any state.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_RENDERERBACKEND_H
#define MD2PDF_RENDERERBACKEND_H

#include <QByteArray>
#include <QObject>
#include <QString>

class RendererBackend : public QObject
{
    Q_OBJECT

public:
    enum FailureKind {
        CapabilityUnavailable, // no renderer could be acquired
        RenderFailure,         // the renderer reported an error mid-run
    };
    Q_ENUM(FailureKind)

    explicit RendererBackend(QObject *parent = nullptr)
        : QObject(parent)
    {
    }
    ~RendererBackend() override = default;

    /// Acquire the renderer. Completes with launched().
    virtual void launch() = 0;

    /// Supply a complete HTML document. Completes with loadFinished()
    /// once content and styles have been applied.
    virtual void loadHtml(const QString &html) = 0;

    /// Print the loaded document with a uniform margin (CSS px).
    /// Completes with pdfReady().
    virtual void printToPdf(int marginPixels) = 0;

    /// Release everything launch() acquired.
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

Q_SIGNALS:
    void launched();
    void loadFinished();
    void pdfReady(const QByteArray &pdf);
    void failed(RendererBackend::FailureKind kind, const QString &message);
};

#endif // MD2PDF_RENDERERBACKEND_H
