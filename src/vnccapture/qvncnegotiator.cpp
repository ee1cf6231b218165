// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncnegotiator.h"
#include "qvncmessagewriter.h"
#include "qvncwirereader.h"

QT_BEGIN_NAMESPACE

QVncPixelFormatNegotiator::QVncPixelFormatNegotiator(QVncWireReader &reader, QVncMessageWriter &writer)
    : m_reader(reader)
    , m_writer(writer)
{
}

/*!
    Reads the ServerInit message and settles the pixel format.

    A format matching one of the four supported 32-bit layouts is used as is.
    Anything else, or any format when forceCanonicalFormat() is set, makes the
    server switch to canonical RGBA with a SetPixelFormat message. The
    supported encodings are announced last.

    Returns std::nullopt if the stream ended before ServerInit was complete.
*/
std::optional<QVncServerInit> QVncPixelFormatNegotiator::negotiate()
{
    bool ok = false;
    QVncServerInit init;

    const quint32 width = m_reader.readInt(2, &ok);
    if (!ok)
        return std::nullopt;
    const quint32 height = m_reader.readInt(2, &ok);
    if (!ok)
        return std::nullopt;
    init.size = QSize(int(width), int(height));
    qCDebug(lcVncCapture) << "Framebuffer size:" << init.size;

    const QByteArray record = m_reader.readBytes(QVncPixelFormat::RecordSize, &ok);
    if (!ok || !m_reader.skip(3)) // padding
        return std::nullopt;
    init.pixelFormat = QVncPixelFormat::fromRecord(record);
    qCDebug(lcVncCapture) << "Pixel format:" << init.pixelFormat;

    init.name = m_reader.readText(&ok);
    if (!ok)
        return std::nullopt;
    qCDebug(lcVncCapture) << "Server name:" << init.name;

    const auto order = init.pixelFormat.channelOrder();
    if (order && !m_forceCanonicalFormat) {
        init.channelOrder = *order;
    } else {
        if (!order)
            qCWarning(lcVncCapture) << "Unrecognized pixel format" << init.pixelFormat << "- requesting RGBA";
        init.channelOrder = QVnc::ChannelOrder::Rgba;
        init.reformatted = true;
        m_writer.setPixelFormat(QVncPixelFormat::canonical());
    }
    m_writer.setEncodings(supportedEncodings());

    qCInfo(lcVncCapture) << "Negotiated" << init.size << init.channelOrder
                         << (init.reformatted ? "(reformatted)" : "(server format)");
    return init;
}

/*!
    Returns the encodings this client decodes, in order of preference.
*/
QList<QVnc::Encoding> QVncPixelFormatNegotiator::supportedEncodings()
{
    return { QVnc::Encoding::Raw, QVnc::Encoding::ZLib };
}

QT_END_NAMESPACE
