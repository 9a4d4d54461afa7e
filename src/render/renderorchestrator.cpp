/*
 * renderorchestrator.cpp: Drives a RendererBackend from HTML to PDF bytes
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "renderorchestrator.h"

#include <QDebug>
#include <QEventLoop>
#include <QMetaEnum>

RenderOrchestrator::RenderOrchestrator(RendererBackend *backend, const RenderConfig &config,
                                       QObject *parent)
    : QObject(parent)
    , m_backend(backend)
    , m_config(config)
{
    m_deadline.setSingleShot(true);
    connect(&m_deadline, &QTimer::timeout, this, &RenderOrchestrator::onDeadline);

    // Completions are tagged with the run that was current when the
    // backend emitted them and delivered queued: a backend completing from
    // inside launch()/loadHtml() must not re-enter the state machine, and
    // a completion from a cancelled run must not reach the next one.
    connect(m_backend, &RendererBackend::launched, this, [this]() {
        deliver([this]() { onLaunched(); });
    });
    connect(m_backend, &RendererBackend::loadFinished, this, [this]() {
        deliver([this]() { onLoadFinished(); });
    });
    connect(m_backend, &RendererBackend::pdfReady, this, [this](const QByteArray &pdf) {
        deliver([this, pdf]() { onPdfReady(pdf); });
    });
    connect(m_backend, &RendererBackend::failed, this,
            [this](RendererBackend::FailureKind kind, const QString &message) {
        deliver([this, kind, message]() { onBackendFailed(kind, message); });
    });
}

RenderOrchestrator::~RenderOrchestrator()
{
    m_deadline.stop();
    release();
}

bool RenderOrchestrator::isRunning() const
{
    return m_state == Launching || m_state == Loaded || m_state == Printed;
}

QByteArray RenderOrchestrator::renderToPdf(const AssembledDocument &document)
{
    if (!start(document))
        return {};

    if (isRunning()) {
        QEventLoop loop;
        connect(this, &RenderOrchestrator::finished, &loop, &QEventLoop::quit);
        loop.exec();
    }

    return m_error == NoError ? m_pdf : QByteArray();
}

bool RenderOrchestrator::start(const AssembledDocument &document)
{
    if (isRunning()) {
        qWarning() << "RenderOrchestrator: A render is already in progress";
        return false;
    }

    ++m_run;
    m_html = document.toHtml();
    m_pdf.clear();
    m_error = NoError;
    m_errorString.clear();
    m_released = false;

    setState(Launching);
    m_deadline.start(m_config.timeoutMs);
    m_backend->launch();
    return true;
}

void RenderOrchestrator::cancel()
{
    if (isRunning())
        fail(CancelledError, QStringLiteral("Rendering was cancelled"));
}

// --- Backend completions ---

void RenderOrchestrator::onLaunched()
{
    if (m_state != Launching)
        return;
    m_backend->loadHtml(m_html);
}

void RenderOrchestrator::onLoadFinished()
{
    if (m_state != Launching)
        return;
    setState(Loaded);
    m_backend->printToPdf(m_config.marginPixels);
}

void RenderOrchestrator::onPdfReady(const QByteArray &pdf)
{
    if (m_state != Loaded)
        return;

    if (pdf.isEmpty()) {
        fail(RenderError, QStringLiteral("The renderer returned an empty PDF"));
        return;
    }

    m_deadline.stop();
    m_pdf = pdf;
    setState(Printed);
    release();
    setState(Closed);
    Q_EMIT finished(true);
}

void RenderOrchestrator::onBackendFailed(RendererBackend::FailureKind kind, const QString &message)
{
    if (!isRunning())
        return;
    fail(kind == RendererBackend::CapabilityUnavailable ? CapabilityUnavailableError : RenderError,
         message);
}

void RenderOrchestrator::onDeadline()
{
    if (!isRunning())
        return;
    const char *stage = QMetaEnum::fromType<State>().valueToKey(m_state);
    fail(TimeoutError, QStringLiteral("Rendering did not finish within %1 ms (stuck in %2)")
                           .arg(m_config.timeoutMs)
                           .arg(QLatin1String(stage)));
}

// --- Internals ---

void RenderOrchestrator::deliver(std::function<void()> handler)
{
    const quint64 run = m_run;
    QMetaObject::invokeMethod(this, [this, run, handler = std::move(handler)]() {
        if (run == m_run)
            handler();
    }, Qt::QueuedConnection);
}

void RenderOrchestrator::setState(State state)
{
    if (m_state == state)
        return;
    m_state = state;
    Q_EMIT stateChanged(state);
}

void RenderOrchestrator::fail(Error error, const QString &message)
{
    m_deadline.stop();
    m_error = error;
    m_errorString = message;
    m_pdf.clear();
    qWarning() << "RenderOrchestrator:" << message;

    release();
    setState(Failed);
    Q_EMIT finished(false);
}

void RenderOrchestrator::release()
{
    if (m_released)
        return;
    m_released = true;
    m_backend->close();
}
