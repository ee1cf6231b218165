// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCMESSAGEWRITER_H
#define QVNCMESSAGEWRITER_H

#include "qtvnccaptureglobal.h"
#include "qvncpixelformat.h"
#include <QtCore/QIODevice>
#include <QtCore/QList>
#include <QtCore/QRect>

QT_BEGIN_NAMESPACE

class QVncMessageWriter
{
public:
    enum ClientMessageType : quint8 {
        SetPixelFormat = 0x00,
        SetEncodings = 0x02,
        FramebufferUpdateRequest = 0x03,
    };

    explicit QVncMessageWriter(QIODevice *device = nullptr);

    QIODevice *device() const { return m_device; }
    void setDevice(QIODevice *device) { m_device = device; }

    void setPixelFormat(const QVncPixelFormat &pixelFormat);
    void setEncodings(const QList<QVnc::Encoding> &encodings);
    void framebufferUpdateRequest(bool incremental, const QRect &rect);

private:
    struct Rectangle {
        quint16_be x;
        quint16_be y;
        quint16_be w;
        quint16_be h;
    };

    bool isValid() const {
        return m_device && m_device->isWritable();
    }

    void write(const char *out, qint64 len) {
        if (isValid())
            m_device->write(out, len);
    }

    template<class T>
    void write(const T &out) {
        write(reinterpret_cast<const char *>(&out), sizeof(T));
    }

    QIODevice *m_device = nullptr;
};

QT_END_NAMESPACE

#endif // QVNCMESSAGEWRITER_H
