// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "vnchandshake.h"

#include <QtCore/QList>
#include <QtCore/QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcVncScreenshot)

VncHandshake::VncHandshake(QIODevice *device)
    : device(device)
    , reader(device)
{
}

/*!
    Runs the handshake up to and including ClientInit with the shared flag set.
    Returns false with errorString() set if the server speaks an unsupported
    protocol version, offers no "None" security or rejects the connection.
*/
bool VncHandshake::run()
{
    if (!parseProtocolVersion())
        return false;

    switch (version) {
    case ProtocolVersion33:
        if (!parseSecurity33())
            return false;
        break;
    case ProtocolVersion37:
        if (!parseSecurity37())
            return false;
        break;
    case ProtocolVersion38:
        if (!parseSecurity37() || !parseSecurityResult())
            return false;
        break;
    default:
        return fail(u"Unsupported protocol version"_s);
    }

    // ClientInit: share the desktop with other viewers
    const quint8 sharedFlag = 1;
    device->write(reinterpret_cast<const char *>(&sharedFlag), 1);
    qCDebug(lcVncScreenshot) << "Handshake complete";
    return true;
}

// The server sends "RFB 003.00x\n" and the client answers with the version it speaks
bool VncHandshake::parseProtocolVersion()
{
    bool ok = false;
    const QByteArray value = reader.readBytes(12, &ok);
    if (!ok)
        return fail(reader.errorString());

    if (value == "RFB 003.003\n")
        version = ProtocolVersion33;
    else if (value == "RFB 003.007\n")
        version = ProtocolVersion37;
    else if (value == "RFB 003.008\n")
        version = ProtocolVersion38;
    else
        return fail(u"Unsupported protocol version %1"_s.arg(QString::fromLatin1(value.trimmed())));

    qCDebug(lcVncScreenshot) << "Protocol version:" << value.trimmed();
    device->write(value);
    return true;
}

// In RFB 3.3 the server decides the security type on its own
bool VncHandshake::parseSecurity33()
{
    bool ok = false;
    const quint32 securityType = reader.readInt(4, &ok);
    if (!ok)
        return fail(reader.errorString());
    if (securityType == SecurityTypeInvalid)
        return failWithReason(u"Connection refused"_s);
    if (securityType != SecurityTypeNone)
        return fail(u"Security type %1 not supported"_s.arg(securityType));
    return true;
}

// From RFB 3.7 on the server offers a list and the client picks one
bool VncHandshake::parseSecurity37()
{
    bool ok = false;
    const quint32 numberOfSecurityTypes = reader.readInt(1, &ok);
    if (!ok)
        return fail(reader.errorString());
    if (numberOfSecurityTypes == 0)
        return failWithReason(u"Connection refused"_s);

    const QByteArray securityTypes = reader.readBytes(numberOfSecurityTypes, &ok);
    if (!ok)
        return fail(reader.errorString());
    qCDebug(lcVncScreenshot) << "Security types:" << securityTypes.toHex(' ');
    if (!securityTypes.contains(char(SecurityTypeNone)))
        return fail(u"The server requires authentication"_s);

    const quint8 securityType = SecurityTypeNone;
    device->write(reinterpret_cast<const char *>(&securityType), 1);
    return true;
}

bool VncHandshake::parseSecurityResult()
{
    bool ok = false;
    const quint32 result = reader.readInt(4, &ok);
    if (!ok)
        return fail(reader.errorString());
    if (result != 0)
        return failWithReason(u"Security handshake failed"_s);
    return true;
}

bool VncHandshake::fail(const QString &message)
{
    error = message;
    qCWarning(lcVncScreenshot) << message;
    return false;
}

// Appends the reason string the server sends after a refusal
bool VncHandshake::failWithReason(const QString &message)
{
    bool ok = false;
    const QString reason = reader.readText(&ok);
    if (!ok || reason.isEmpty())
        return fail(message);
    return fail(u"%1: %2"_s.arg(message, reason));
}
