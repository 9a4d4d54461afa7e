/*
 * chromiumbackend.h: RendererBackend driving headless Chromium
 *
 * The browser runs as a child process with a throwaway profile and is
 * controlled over the DevTools protocol (JSON over a WebSocket). The
 * document is written next to the profile and loaded from a file URL.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef MD2PDF_CHROMIUMBACKEND_H
#define MD2PDF_CHROMIUMBACKEND_H

#include <QHash>
#include <QJsonObject>
#include <QProcess>
#include <QStringList>
#include <QWebSocket>

#include <functional>
#include <memory>

#include "rendererbackend.h"

class QTemporaryDir;

class ChromiumBackend : public RendererBackend
{
    Q_OBJECT

public:
    explicit ChromiumBackend(const QString &executable = QString(), QObject *parent = nullptr);
    ~ChromiumBackend() override;

    void launch() override;
    void loadHtml(const QString &html) override;
    void printToPdf(int marginPixels) override;
    void close() override;
    bool isOpen() const override;

    // Executables tried in order when none is configured
    static QStringList candidateExecutables();

    // Configured executable if set, else the first candidate on PATH.
    // Empty when nothing was found.
    QString resolveExecutable() const;

private Q_SLOTS:
    void onProcessStderr();
    void onProcessError(QProcess::ProcessError error);
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onSocketConnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onSocketDisconnected();
    void onMessage(const QString &message);

private:
    using Callback = std::function<void(const QJsonObject &result)>;

    struct PendingCommand {
        QString method;
        Callback callback;
    };

    void send(const QString &method, const QJsonObject &params, Callback callback,
              bool toSession = true);
    void handleEvent(const QString &method, const QJsonObject &params);
    void waitForFonts();
    void failWith(FailureKind kind, const QString &message);

    QString m_executable;
    QProcess *m_process = nullptr;
    QWebSocket m_socket;
    std::unique_ptr<QTemporaryDir> m_tempDir;

    QByteArray m_stderrBuffer;
    QString m_sessionId;
    QHash<int, PendingCommand> m_pending;
    int m_nextId = 1;

    bool m_connected = false;
    bool m_waitingForLoad = false;
    bool m_closing = false;
};

#endif // MD2PDF_CHROMIUMBACKEND_H
