// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QVNCCLIENT_H
#define QVNCCLIENT_H

#include "qtvnccaptureglobal.h"
#include "qvncscreendetector.h"
#include <QtCore/QIODevice>
#include <QtCore/QObject>
#include <QtCore/QRect>
#include <QtCore/QScopedPointer>
#include <QtGui/QImage>

#include <optional>

QT_BEGIN_NAMESPACE

class QVncFramebuffer;

class QVncClient : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QIODevice *device READ device WRITE setDevice NOTIFY deviceChanged)
    Q_PROPERTY(int readTimeout READ readTimeout WRITE setReadTimeout)
    Q_PROPERTY(bool forceCanonicalFormat READ forceCanonicalFormat WRITE setForceCanonicalFormat)
    Q_PROPERTY(QString name READ name)
    Q_PROPERTY(QVnc::Error error READ error)
public:
    explicit QVncClient(QObject *parent = nullptr);
    ~QVncClient() override;

    QIODevice *device() const;

    int readTimeout() const;
    void setReadTimeout(int msecs);

    bool forceCanonicalFormat() const;
    void setForceCanonicalFormat(bool force);

    // Valid after initialize()
    QString name() const;
    int framebufferWidth() const;
    int framebufferHeight() const;
    QVnc::ChannelOrder channelOrder() const;
    QVncFramebuffer *framebuffer() const;

    bool initialize();
    std::optional<QVnc::UpdateType> read();
    QImage screenshot(const QRect &rect = QRect());
    QList<QVncScreen> detectScreens() const;

    QVnc::Error error() const;
    QString errorString() const;

public slots:
    void setDevice(QIODevice *device);

signals:
    void deviceChanged(QIODevice *device);
    void framebufferSizeChanged(int width, int height);
    void imageChanged(const QRect &rect);
    void errorOccurred(QVnc::Error error);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QVNCCLIENT_H
