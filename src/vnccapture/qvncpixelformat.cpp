// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncpixelformat.h"

#include <cstring>

QT_BEGIN_NAMESPACE

namespace {

struct KnownFormat {
    QVnc::ChannelOrder order;
    quint8 bigEndianFlag;
    quint8 redShift;
    quint8 greenShift;
    quint8 blueShift;
};

// 32 bits per pixel, depth 24, true colour, 8 bits per channel
const KnownFormat knownFormats[] = {
    { QVnc::ChannelOrder::Bgra, 0, 16, 8, 0 },
    { QVnc::ChannelOrder::Rgba, 0, 0, 8, 16 },
    { QVnc::ChannelOrder::Argb, 1, 16, 8, 0 },
    { QVnc::ChannelOrder::Abgr, 1, 0, 8, 16 },
};

} // namespace

/*!
    Builds a pixel format from the first 13 bytes of \a record. Missing
    bytes are treated as zero.
*/
QVncPixelFormat QVncPixelFormat::fromRecord(const QByteArray &record)
{
    QVncPixelFormat format;
    std::memcpy(&format, record.constData(), qMin<qsizetype>(record.size(), RecordSize));
    return format;
}

QVncPixelFormat QVncPixelFormat::fromChannelOrder(QVnc::ChannelOrder order)
{
    QVncPixelFormat format;
    for (const auto &known : knownFormats) {
        if (known.order != order)
            continue;
        format.bitsPerPixel = 32;
        format.depth = 24;
        format.bigEndianFlag = known.bigEndianFlag;
        format.trueColourFlag = 1;
        format.redMax = 255;
        format.greenMax = 255;
        format.blueMax = 255;
        format.redShift = known.redShift;
        format.greenShift = known.greenShift;
        format.blueShift = known.blueShift;
    }
    return format;
}

QByteArray QVncPixelFormat::record() const
{
    return QByteArray(reinterpret_cast<const char *>(this), RecordSize);
}

QVncPixelFormat QVncPixelFormat::normalized() const
{
    QVncPixelFormat format = *this;
    format.bigEndianFlag &= 1;
    format.trueColourFlag &= 1;
    return format;
}

std::optional<QVnc::ChannelOrder> QVncPixelFormat::channelOrder() const
{
    const QByteArray normalizedRecord = normalized().record();
    for (const auto &known : knownFormats) {
        if (fromChannelOrder(known.order).record() == normalizedRecord)
            return known.order;
    }
    return std::nullopt;
}

#ifndef QT_NO_DEBUG_STREAM
QDebug operator<<(QDebug debug, const QVncPixelFormat &format)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "QVncPixelFormat(bpp=" << int(format.bitsPerPixel)
                    << ", depth=" << int(format.depth)
                    << ", bigEndian=" << int(format.bigEndianFlag)
                    << ", trueColour=" << int(format.trueColourFlag)
                    << ", max=" << quint16(format.redMax) << '/' << quint16(format.greenMax)
                    << '/' << quint16(format.blueMax)
                    << ", shift=" << int(format.redShift) << '/' << int(format.greenShift)
                    << '/' << int(format.blueShift)
                    << ')';
    return debug;
}
#endif

QT_END_NAMESPACE
