// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCFRAMEBUFFER_H
#define QVNCFRAMEBUFFER_H

#include "qtvnccaptureglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QRect>
#include <QtCore/QScopedPointer>
#include <QtCore/QSize>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

class QVncMessageWriter;
class QVncWireReader;

class QVncFramebuffer
{
public:
    static constexpr int BytesPerPixel = 4;

    QVncFramebuffer(const QSize &size, QVnc::ChannelOrder channelOrder);
    ~QVncFramebuffer();

    QSize size() const;
    QVnc::ChannelOrder channelOrder() const;

    // Raw pixel data in wire channel order, empty until the first rectangle
    QByteArray data() const;
    bool hasData() const;
    void reset();

    void refresh(QVncMessageWriter &writer, const QRect &rect = QRect());
    bool read(QVncWireReader &reader, QRect *updated = nullptr);

    QImage toRgba() const;
    QImage alphaMask() const;
    bool isComplete() const;

    QVnc::Error error() const;
    QString errorString() const;

private:
    Q_DISABLE_COPY(QVncFramebuffer)

    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QVNCFRAMEBUFFER_H
