/*
 * renderorchestrator.h: Drives a RendererBackend from HTML to PDF bytes
 *
 *   Idle -> Launching -> Loaded -> Printed -> Closed
 *                \          \         \
 *                 +----------+---------+--> Failed
 *
 * One deadline covers Launching..Printed. The backend is closed exactly
 * once per run on every path, including destruction mid-run.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_RENDERORCHESTRATOR_H
#define MD2PDF_RENDERORCHESTRATOR_H

#include <QByteArray>
#include <QObject>
#include <QTimer>

#include <functional>

#include "documentassembler.h"
#include "renderconfig.h"
#include "rendererbackend.h"

class RenderOrchestrator : public QObject
{
    Q_OBJECT

public:
    enum State {
        Idle,
        Launching,
        Loaded,
        Printed,
        Closed,
        Failed,
    };
    Q_ENUM(State)

    enum Error {
        NoError,
        CapabilityUnavailableError,
        RenderError,
        TimeoutError,
        CancelledError,
    };
    Q_ENUM(Error)

    // The backend is not owned and must outlive the orchestrator.
    RenderOrchestrator(RendererBackend *backend, const RenderConfig &config,
                       QObject *parent = nullptr);
    ~RenderOrchestrator() override;

    /// Blocking: runs a local event loop until the run finishes.
    /// Returns the PDF bytes, or an empty array on failure (see error()).
    QByteArray renderToPdf(const AssembledDocument &document);

    /// Starts a run; finished() is emitted when it ends. Returns false if
    /// a run is already in flight.
    bool start(const AssembledDocument &document);

    /// Aborts the current run with CancelledError.
    void cancel();

    State state() const { return m_state; }
    bool isRunning() const;
    QByteArray pdf() const { return m_pdf; }
    Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

Q_SIGNALS:
    void stateChanged(RenderOrchestrator::State state);
    void finished(bool ok);

private:
    void onLaunched();
    void onLoadFinished();
    void onPdfReady(const QByteArray &pdf);
    void onBackendFailed(RendererBackend::FailureKind kind, const QString &message);
    void onDeadline();

    // Queue handler for the run that is current now
    void deliver(std::function<void()> handler);
    void setState(State state);
    void fail(Error error, const QString &message);
    void release();

    RendererBackend *m_backend;
    RenderConfig m_config;
    QTimer m_deadline;
    QString m_html;
    QByteArray m_pdf;
    State m_state = Idle;
    Error m_error = NoError;
    QString m_errorString;
    bool m_released = true;
    quint64 m_run = 0;
};

#endif // MD2PDF_RENDERORCHESTRATOR_H
