// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QLoggingCategory>
#include <QtCore/QSettings>
#include <QtNetwork/QTcpSocket>

#include "qvncclient.h"
#include "vnchandshake.h"

Q_LOGGING_CATEGORY(lcVncScreenshot, "qt.vnccapture.screenshot")

namespace {

// "shots/desk.png" and 2 give "shots/desk-2.png"
QString screenFileName(const QString &output, int number)
{
    const QFileInfo info(output);
    const QString suffix = info.suffix().isEmpty() ? u"png"_s : info.suffix();
    return info.dir().filePath(u"%1-%2.%3"_s.arg(info.completeBaseName()).arg(number).arg(suffix));
}

QString versionName(VncHandshake::ProtocolVersion version)
{
    switch (version) {
    case VncHandshake::ProtocolVersion33:
        return u"3.3"_s;
    case VncHandshake::ProtocolVersion37:
        return u"3.7"_s;
    case VncHandshake::ProtocolVersion38:
        return u"3.8"_s;
    case VncHandshake::ProtocolVersionUnknown:
        break;
    }
    return u"unknown"_s;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Signal Slot Inc."));
    app.setOrganizationDomain("signal-slot.co.jp");
    app.setApplicationName("QtVnc Screenshot");
    app.setApplicationVersion("1.0.0");

    QSettings settings;
    settings.beginGroup("Connection");
    const QString lastHost = settings.value("server").toString();
    const int lastPort = settings.value("port", 5900).toInt();
    settings.endGroup();

    QCommandLineParser parser;
    parser.setApplicationDescription(u"Takes a screenshot of a VNC server."_s);
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(u"host"_s, u"VNC server to connect to (default: %1)."_s
                                         .arg(lastHost.isEmpty() ? u"none"_s : lastHost), u"[host]"_s);
    QCommandLineOption portOption({ u"p"_s, u"port"_s }, u"TCP port of the server."_s,
                                  u"port"_s, QString::number(lastPort));
    QCommandLineOption outputOption({ u"o"_s, u"output"_s }, u"Image file to write."_s,
                                    u"file"_s, u"screenshot.png"_s);
    QCommandLineOption screensOption(u"screens"_s, u"Also write each detected screen as <output>-<n>.png."_s);
    QCommandLineOption timeoutOption({ u"t"_s, u"timeout"_s }, u"Milliseconds to wait for the server."_s,
                                     u"msecs"_s, QString::number(QVncWireReader::DefaultTimeout));
    QCommandLineOption forceRgbaOption(u"force-rgba"_s, u"Ask the server for RGBA pixels in any case."_s);
    parser.addOptions({ portOption, outputOption, screensOption, timeoutOption, forceRgbaOption });
    parser.process(app);

    const QStringList arguments = parser.positionalArguments();
    const QString host = arguments.isEmpty() ? lastHost : arguments.first();
    if (host.isEmpty())
        parser.showHelp(1);

    bool ok = false;
    const int port = parser.value(portOption).toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        qCritical().noquote() << "Invalid port:" << parser.value(portOption);
        return 1;
    }
    const int timeout = parser.value(timeoutOption).toInt(&ok);
    if (!ok) {
        qCritical().noquote() << "Invalid timeout:" << parser.value(timeoutOption);
        return 1;
    }

    QTcpSocket socket;
    socket.connectToHost(host, quint16(port));
    if (!socket.waitForConnected(timeout)) {
        qCritical().noquote() << "Failed to connect to" << host << ':' << socket.errorString();
        return 1;
    }
    qCInfo(lcVncScreenshot) << "Connected to" << host << port;

    settings.beginGroup("Connection");
    settings.setValue("server", host);
    settings.setValue("port", port);
    settings.endGroup();

    VncHandshake handshake(&socket);
    handshake.setTimeout(timeout);
    if (!handshake.run()) {
        qCritical().noquote() << "Handshake failed:" << handshake.errorString();
        return 1;
    }
    qCInfo(lcVncScreenshot).noquote() << "RFB" << versionName(handshake.protocolVersion());

    QVncClient client;
    client.setReadTimeout(timeout);
    client.setForceCanonicalFormat(parser.isSet(forceRgbaOption));
    client.setDevice(&socket);
    if (!client.initialize()) {
        qCritical().noquote() << "Failed to initialize:" << client.errorString();
        return 1;
    }
    qCInfo(lcVncScreenshot) << "Desktop" << client.name() << client.framebufferWidth()
                            << 'x' << client.framebufferHeight();

    const QImage image = client.screenshot();
    if (image.isNull()) {
        qCritical().noquote() << "Screenshot failed:" << client.errorString();
        return 1;
    }

    const QString output = parser.value(outputOption);
    if (!image.save(output)) {
        qCritical().noquote() << "Failed to write" << output;
        return 1;
    }
    qCInfo(lcVncScreenshot) << "Wrote" << output;

    if (parser.isSet(screensOption)) {
        const QList<QVncScreen> screens = client.detectScreens();
        for (int i = 0; i < screens.size(); i++) {
            const QString fileName = screenFileName(output, i + 1);
            if (!screens.at(i).crop(image).save(fileName)) {
                qCritical().noquote() << "Failed to write" << fileName;
                return 1;
            }
            qCInfo(lcVncScreenshot) << "Wrote" << fileName << screens.at(i);
        }
    }

    socket.disconnectFromHost();
    return 0;
}
