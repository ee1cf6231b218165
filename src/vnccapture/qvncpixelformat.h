// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCPIXELFORMAT_H
#define QVNCPIXELFORMAT_H

#include "qtvnccaptureglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QtEndian>

#include <optional>

QT_BEGIN_NAMESPACE

/*
    Pixel format descriptor as it appears in ServerInit and SetPixelFormat.
    The first 13 bytes carry the format, the last three are padding.
*/
struct QVncPixelFormat
{
    static constexpr int RecordSize = 13;

    quint8 bitsPerPixel = 0;
    quint8 depth = 0;
    quint8 bigEndianFlag = 0;
    quint8 trueColourFlag = 0;
    quint16_be redMax{0};
    quint16_be greenMax{0};
    quint16_be blueMax{0};
    quint8 redShift = 0;
    quint8 greenShift = 0;
    quint8 blueShift = 0;
    quint8 padding1 = 0;
    quint8 padding2 = 0;
    quint8 padding3 = 0;

    static QVncPixelFormat fromRecord(const QByteArray &record);
    static QVncPixelFormat fromChannelOrder(QVnc::ChannelOrder order);
    static QVncPixelFormat canonical() { return fromChannelOrder(QVnc::ChannelOrder::Rgba); }

    QByteArray record() const;

    // Flags masked to their low bit
    QVncPixelFormat normalized() const;
    // Channel order of one of the four supported 32-bit formats, if this is one
    std::optional<QVnc::ChannelOrder> channelOrder() const;

    friend bool operator==(const QVncPixelFormat &lhs, const QVncPixelFormat &rhs)
    {
        return lhs.record() == rhs.record();
    }
    friend bool operator!=(const QVncPixelFormat &lhs, const QVncPixelFormat &rhs)
    {
        return !(lhs == rhs);
    }
};

static_assert(sizeof(QVncPixelFormat) == 16, "QVncPixelFormat must match the wire layout");

#ifndef QT_NO_DEBUG_STREAM
QDebug operator<<(QDebug debug, const QVncPixelFormat &format);
#endif

QT_END_NAMESPACE

#endif // QVNCPIXELFORMAT_H
