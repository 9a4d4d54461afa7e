/*
 * chromiumbackend.cpp: RendererBackend driving headless Chromium
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "chromiumbackend.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QUrl>

namespace {
constexpr int kTerminateWaitMs = 3000;
constexpr int kKillWaitMs = 1000;
constexpr double kCssPixelsPerInch = 96.0;
}

ChromiumBackend::ChromiumBackend(const QString &executable, QObject *parent)
    : RendererBackend(parent)
    , m_executable(executable)
{
    connect(&m_socket, &QWebSocket::connected, this, &ChromiumBackend::onSocketConnected);
    connect(&m_socket, &QWebSocket::disconnected, this, &ChromiumBackend::onSocketDisconnected);
    connect(&m_socket, &QWebSocket::errorOccurred, this, &ChromiumBackend::onSocketError);
    connect(&m_socket, &QWebSocket::textMessageReceived, this, &ChromiumBackend::onMessage);
}

ChromiumBackend::~ChromiumBackend()
{
    close();
}

QStringList ChromiumBackend::candidateExecutables()
{
    return {
        QStringLiteral("chromium"),
        QStringLiteral("chromium-browser"),
        QStringLiteral("google-chrome"),
        QStringLiteral("google-chrome-stable"),
        QStringLiteral("chrome"),
        QStringLiteral("microsoft-edge"),
    };
}

QString ChromiumBackend::resolveExecutable() const
{
    if (!m_executable.isEmpty()) {
        if (QFile::exists(m_executable))
            return m_executable;
        return QStandardPaths::findExecutable(m_executable);
    }

    const QStringList candidates = candidateExecutables();
    for (const QString &name : candidates) {
        const QString path = QStandardPaths::findExecutable(name);
        if (!path.isEmpty())
            return path;
    }
    return {};
}

bool ChromiumBackend::isOpen() const
{
    return m_process != nullptr;
}

// --- Launch ---

void ChromiumBackend::launch()
{
    if (m_process) {
        failWith(RenderFailure, QStringLiteral("Browser is already running"));
        return;
    }

    const QString program = resolveExecutable();
    if (program.isEmpty()) {
        const QString tried = m_executable.isEmpty()
            ? candidateExecutables().join(QStringLiteral(", "))
            : m_executable;
        failWith(CapabilityUnavailable,
                 QStringLiteral("No Chromium-compatible browser found (tried: %1)").arg(tried));
        return;
    }

    m_tempDir = std::make_unique<QTemporaryDir>();
    if (!m_tempDir->isValid()) {
        const QString reason = m_tempDir->errorString();
        m_tempDir.reset();
        failWith(RenderFailure,
                 QStringLiteral("Cannot create a temporary directory: %1").arg(reason));
        return;
    }

    m_closing = false;
    m_connected = false;
    m_waitingForLoad = false;
    m_stderrBuffer.clear();
    m_sessionId.clear();

    m_process = new QProcess(this);
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    m_process->setStandardOutputFile(QProcess::nullDevice());
    connect(m_process, &QProcess::readyReadStandardError,
            this, &ChromiumBackend::onProcessStderr);
    connect(m_process, &QProcess::errorOccurred, this, &ChromiumBackend::onProcessError);
    connect(m_process, &QProcess::finished, this, &ChromiumBackend::onProcessFinished);

    const QStringList args = {
        QStringLiteral("--headless=new"),
        QStringLiteral("--disable-gpu"),
        QStringLiteral("--no-sandbox"),
        QStringLiteral("--no-first-run"),
        QStringLiteral("--no-default-browser-check"),
        QStringLiteral("--remote-debugging-port=0"),
        QStringLiteral("--user-data-dir=%1").arg(m_tempDir->filePath(QStringLiteral("profile"))),
        QStringLiteral("about:blank"),
    };

    qDebug() << "ChromiumBackend: Starting" << program;
    m_process->start(program, args);
}

void ChromiumBackend::onProcessStderr()
{
    if (!m_process)
        return;

    const QByteArray chunk = m_process->readAllStandardError();
    if (m_connected || m_socket.state() != QAbstractSocket::UnconnectedState) {
        // Keep the latest output for exit diagnostics
        m_stderrBuffer = chunk;
        return;
    }
    m_stderrBuffer.append(chunk);

    static const QRegularExpression listening(
        QStringLiteral("DevTools listening on (ws://\\S+)"));
    const QRegularExpressionMatch match =
        listening.match(QString::fromUtf8(m_stderrBuffer));
    if (!match.hasMatch())
        return;

    const QUrl url(match.captured(1));
    qDebug() << "ChromiumBackend: DevTools endpoint" << url.toString();
    m_stderrBuffer.clear();
    m_socket.open(url);
}

void ChromiumBackend::onProcessError(QProcess::ProcessError error)
{
    if (m_closing)
        return;

    if (error == QProcess::FailedToStart) {
        const QString reason = m_process ? m_process->errorString() : QString();
        failWith(CapabilityUnavailable,
                 QStringLiteral("Browser failed to start: %1").arg(reason));
    } else if (error == QProcess::Crashed) {
        // Reported through finished()
    } else {
        const QString reason = m_process ? m_process->errorString() : QString();
        failWith(RenderFailure, QStringLiteral("Browser process error: %1").arg(reason));
    }
}

void ChromiumBackend::onProcessFinished(int exitCode, QProcess::ExitStatus status)
{
    if (m_closing)
        return;

    const QString how = status == QProcess::CrashExit
        ? QStringLiteral("crashed")
        : QStringLiteral("exited with code %1").arg(exitCode);
    QString message = QStringLiteral("Browser %1 unexpectedly").arg(how);
    const QString tail = QString::fromUtf8(m_stderrBuffer).trimmed();
    if (!tail.isEmpty())
        message += QStringLiteral(": ") + tail.section(QLatin1Char('\n'), -1);
    failWith(RenderFailure, message);
}

// --- DevTools session ---

void ChromiumBackend::onSocketConnected()
{
    m_connected = true;

    QJsonObject createParams;
    createParams.insert(QStringLiteral("url"), QStringLiteral("about:blank"));
    send(QStringLiteral("Target.createTarget"), createParams,
         [this](const QJsonObject &created) {
        QJsonObject attachParams;
        attachParams.insert(QStringLiteral("targetId"),
                            created.value(QStringLiteral("targetId")).toString());
        attachParams.insert(QStringLiteral("flatten"), true);
        send(QStringLiteral("Target.attachToTarget"), attachParams,
             [this](const QJsonObject &attached) {
            m_sessionId = attached.value(QStringLiteral("sessionId")).toString();
            send(QStringLiteral("Page.enable"), QJsonObject(),
                 [this](const QJsonObject &) { Q_EMIT launched(); });
        }, false);
    }, false);
}

void ChromiumBackend::onSocketError(QAbstractSocket::SocketError error)
{
    Q_UNUSED(error)
    if (m_closing)
        return;
    failWith(RenderFailure,
             QStringLiteral("DevTools connection error: %1").arg(m_socket.errorString()));
}

void ChromiumBackend::onSocketDisconnected()
{
    if (m_closing || !m_connected)
        return;
    m_connected = false;
    failWith(RenderFailure, QStringLiteral("DevTools connection closed by the browser"));
}

void ChromiumBackend::send(const QString &method, const QJsonObject &params,
                           Callback callback, bool toSession)
{
    const int id = m_nextId++;

    QJsonObject command;
    command.insert(QStringLiteral("id"), id);
    command.insert(QStringLiteral("method"), method);
    command.insert(QStringLiteral("params"), params);
    if (toSession && !m_sessionId.isEmpty())
        command.insert(QStringLiteral("sessionId"), m_sessionId);

    m_pending.insert(id, PendingCommand{method, std::move(callback)});
    qDebug() << "ChromiumBackend: ->" << id << method;
    m_socket.sendTextMessage(
        QString::fromUtf8(QJsonDocument(command).toJson(QJsonDocument::Compact)));
}

void ChromiumBackend::onMessage(const QString &message)
{
    if (m_closing)
        return;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(message.toUtf8(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "ChromiumBackend: Ignoring malformed DevTools message:"
                   << parseError.errorString();
        return;
    }

    const QJsonObject obj = doc.object();
    if (!obj.contains(QStringLiteral("id"))) {
        handleEvent(obj.value(QStringLiteral("method")).toString(),
                    obj.value(QStringLiteral("params")).toObject());
        return;
    }

    const int id = obj.value(QStringLiteral("id")).toInt();
    auto it = m_pending.find(id);
    if (it == m_pending.end())
        return;
    const PendingCommand command = it.value();
    m_pending.erase(it);

    if (obj.contains(QStringLiteral("error"))) {
        const QJsonObject error = obj.value(QStringLiteral("error")).toObject();
        failWith(RenderFailure, QStringLiteral("%1 failed: %2")
                                    .arg(command.method,
                                         error.value(QStringLiteral("message")).toString()));
        return;
    }

    qDebug() << "ChromiumBackend: <-" << id << command.method;
    if (command.callback)
        command.callback(obj.value(QStringLiteral("result")).toObject());
}

void ChromiumBackend::handleEvent(const QString &method, const QJsonObject &params)
{
    Q_UNUSED(params)
    if (method == QLatin1String("Page.loadEventFired") && m_waitingForLoad) {
        m_waitingForLoad = false;
        waitForFonts();
    }
}

// --- Load / print ---

void ChromiumBackend::loadHtml(const QString &html)
{
    if (!m_connected || m_sessionId.isEmpty()) {
        failWith(RenderFailure, QStringLiteral("loadHtml() called before the browser was ready"));
        return;
    }

    const QString path = m_tempDir->filePath(QStringLiteral("document.html"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        failWith(RenderFailure, QStringLiteral("Cannot write %1: %2")
                                    .arg(path, file.errorString()));
        return;
    }
    const QByteArray bytes = html.toUtf8();
    if (file.write(bytes) != bytes.size()) {
        failWith(RenderFailure, QStringLiteral("Cannot write %1: %2")
                                    .arg(path, file.errorString()));
        return;
    }
    file.close();

    m_waitingForLoad = true;
    QJsonObject params;
    params.insert(QStringLiteral("url"), QUrl::fromLocalFile(path).toString());
    send(QStringLiteral("Page.navigate"), params, [this](const QJsonObject &result) {
        const QString errorText = result.value(QStringLiteral("errorText")).toString();
        if (!errorText.isEmpty()) {
            m_waitingForLoad = false;
            failWith(RenderFailure, QStringLiteral("Navigation failed: %1").arg(errorText));
        }
    });
}

void ChromiumBackend::waitForFonts()
{
    QJsonObject params;
    params.insert(QStringLiteral("expression"),
                  QStringLiteral("document.fonts.ready.then(() => document.readyState)"));
    params.insert(QStringLiteral("awaitPromise"), true);
    params.insert(QStringLiteral("returnByValue"), true);
    send(QStringLiteral("Runtime.evaluate"), params, [this](const QJsonObject &result) {
        if (result.contains(QStringLiteral("exceptionDetails"))) {
            const QJsonObject details = result.value(QStringLiteral("exceptionDetails")).toObject();
            failWith(RenderFailure, QStringLiteral("Page script failed: %1")
                                        .arg(details.value(QStringLiteral("text")).toString()));
            return;
        }
        Q_EMIT loadFinished();
    });
}

void ChromiumBackend::printToPdf(int marginPixels)
{
    if (!m_connected || m_sessionId.isEmpty()) {
        failWith(RenderFailure, QStringLiteral("printToPdf() called before the browser was ready"));
        return;
    }

    const double inches = qMax(0, marginPixels) / kCssPixelsPerInch;

    QJsonObject params;
    params.insert(QStringLiteral("printBackground"), true);
    params.insert(QStringLiteral("preferCSSPageSize"), true);
    params.insert(QStringLiteral("marginTop"), inches);
    params.insert(QStringLiteral("marginBottom"), inches);
    params.insert(QStringLiteral("marginLeft"), inches);
    params.insert(QStringLiteral("marginRight"), inches);
    send(QStringLiteral("Page.printToPDF"), params, [this](const QJsonObject &result) {
        const QByteArray pdf = QByteArray::fromBase64(
            result.value(QStringLiteral("data")).toString().toLatin1());
        Q_EMIT pdfReady(pdf);
    });
}

// --- Teardown ---

void ChromiumBackend::close()
{
    if (!m_process && !m_tempDir)
        return;

    m_closing = true;
    m_pending.clear();
    m_waitingForLoad = false;

    if (m_connected && m_socket.state() == QAbstractSocket::ConnectedState) {
        QJsonObject command;
        command.insert(QStringLiteral("id"), m_nextId++);
        command.insert(QStringLiteral("method"), QStringLiteral("Browser.close"));
        m_socket.sendTextMessage(
            QString::fromUtf8(QJsonDocument(command).toJson(QJsonDocument::Compact)));
        m_socket.flush();
    }
    m_socket.abort();
    m_connected = false;
    m_sessionId.clear();

    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->terminate();
            if (!m_process->waitForFinished(kTerminateWaitMs)) {
                qWarning() << "ChromiumBackend: Browser did not exit, killing it";
                m_process->kill();
                m_process->waitForFinished(kKillWaitMs);
            }
        }
        delete m_process;
        m_process = nullptr;
    }

    // QTemporaryDir removes the profile and the document on destruction
    m_tempDir.reset();
    m_closing = false;
}

void ChromiumBackend::failWith(FailureKind kind, const QString &message)
{
    qWarning() << "ChromiumBackend:" << message;
    Q_EMIT failed(kind, message);
}
