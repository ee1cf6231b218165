// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncmessagewriter.h"

QT_BEGIN_NAMESPACE

QVncMessageWriter::QVncMessageWriter(QIODevice *device)
    : m_device(device)
{
}

/*!
    Sends a SetPixelFormat message asking the server to encode all further
    rectangles with \a pixelFormat.
*/
void QVncMessageWriter::setPixelFormat(const QVncPixelFormat &pixelFormat)
{
    qCDebug(lcVncCapture) << "SetPixelFormat" << pixelFormat;
    write(SetPixelFormat);
    write("\0\0\0", 3); // padding
    write(pixelFormat);
}

/*!
    Sends a SetEncodings message listing \a encodings in order of preference.
*/
void QVncMessageWriter::setEncodings(const QList<QVnc::Encoding> &encodings)
{
    qCDebug(lcVncCapture) << "SetEncodings" << encodings;
    write(SetEncodings);
    write(quint8(0)); // padding
    write(quint16_be(encodings.length()));
    for (const auto encoding : encodings)
        write(qint32_be(static_cast<qint32>(encoding)));
}

void QVncMessageWriter::framebufferUpdateRequest(bool incremental, const QRect &rect)
{
    qCDebug(lcVncCapture) << "FramebufferUpdateRequest" << incremental << rect;
    write(FramebufferUpdateRequest);
    write(quint8(incremental ? 1 : 0));
    Rectangle rectangle;
    rectangle.x = rect.x();
    rectangle.y = rect.y();
    rectangle.w = rect.width();
    rectangle.h = rect.height();
    write(rectangle);
}

QT_END_NAMESPACE
