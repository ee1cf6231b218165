// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QTVNCCAPTUREGLOBAL_H
#define QTVNCCAPTUREGLOBAL_H

#include <QtCore/qstring.h>
#include <QtCore/qglobal.h>
#include <QtCore/qdebug.h>
#include <QtCore/qloggingcategory.h>
#include <QtCore/qobjectdefs.h>

QT_BEGIN_NAMESPACE

using namespace Qt::Literals::StringLiterals;

Q_DECLARE_LOGGING_CATEGORY(lcVncCapture)

namespace QVnc {
Q_NAMESPACE

enum class Error {
    NoError,
    IncompleteStreamError,
    UnsupportedEncodingError,
    InvalidUpdateTypeError,
    DecompressionError,
    RectangleOutOfBoundsError,
    NotInitializedError,
};
Q_ENUM_NS(Error)

// Server to client message types
enum class UpdateType : quint8 {
    Video = 0x00,
};
Q_ENUM_NS(UpdateType)

// Rectangle encodings announced with SetEncodings
enum class Encoding : qint32 {
    Raw = 0,
    ZLib = 6,
};
Q_ENUM_NS(Encoding)

// Byte order of the four channels of a 32-bit pixel on the wire
enum class ChannelOrder {
    Bgra,
    Rgba,
    Argb,
    Abgr,
};
Q_ENUM_NS(ChannelOrder)

// Position of a channel ('r', 'g', 'b' or 'a') inside a pixel of the given order
int channelIndex(ChannelOrder order, char channel);

} // namespace QVnc

QT_END_NAMESPACE

#endif // QTVNCCAPTUREGLOBAL_H
