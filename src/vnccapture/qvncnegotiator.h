// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCNEGOTIATOR_H
#define QVNCNEGOTIATOR_H

#include "qtvnccaptureglobal.h"
#include "qvncpixelformat.h"
#include <QtCore/QList>
#include <QtCore/QSize>
#include <QtCore/QString>

#include <optional>

QT_BEGIN_NAMESPACE

class QVncMessageWriter;
class QVncWireReader;

struct QVncServerInit
{
    QSize size;
    QVncPixelFormat pixelFormat;    // as announced by the server
    QString name;
    QVnc::ChannelOrder channelOrder = QVnc::ChannelOrder::Rgba;
    bool reformatted = false;       // a SetPixelFormat was sent
};

class QVncPixelFormatNegotiator
{
public:
    QVncPixelFormatNegotiator(QVncWireReader &reader, QVncMessageWriter &writer);

    bool forceCanonicalFormat() const { return m_forceCanonicalFormat; }
    void setForceCanonicalFormat(bool force) { m_forceCanonicalFormat = force; }

    std::optional<QVncServerInit> negotiate();

    static QList<QVnc::Encoding> supportedEncodings();

private:
    QVncWireReader &m_reader;
    QVncMessageWriter &m_writer;
    bool m_forceCanonicalFormat = false;
};

QT_END_NAMESPACE

#endif // QVNCNEGOTIATOR_H
