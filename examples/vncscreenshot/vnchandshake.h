// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef VNCHANDSHAKE_H
#define VNCHANDSHAKE_H

#include <QtCore/QByteArray>
#include <QtCore/QIODevice>
#include <QtCore/QString>

#include "qvncwirereader.h"

// Blocking RFB version handshake and "None" security negotiation. Leaves the
// device positioned at the ServerInit message.
class VncHandshake
{
public:
    enum ProtocolVersion {
        ProtocolVersionUnknown,
        ProtocolVersion33,
        ProtocolVersion37,
        ProtocolVersion38,
    };

    enum SecurityType : quint8 {
        SecurityTypeInvalid = 0,
        SecurityTypeNone = 1,
    };

    explicit VncHandshake(QIODevice *device);

    void setTimeout(int msecs) { reader.setTimeout(msecs); }

    bool run();

    ProtocolVersion protocolVersion() const { return version; }
    QString errorString() const { return error; }

private:
    bool parseProtocolVersion();
    bool parseSecurity33();
    bool parseSecurity37();
    bool parseSecurityResult();
    bool fail(const QString &message);
    bool failWithReason(const QString &message);

    QIODevice *device;
    QVncWireReader reader;
    ProtocolVersion version = ProtocolVersionUnknown;
    QString error;
};

#endif // VNCHANDSHAKE_H
