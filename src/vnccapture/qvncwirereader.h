// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCWIREREADER_H
#define QVNCWIREREADER_H

#include "qtvnccaptureglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QIODevice>

QT_BEGIN_NAMESPACE

class QVncWireReader
{
public:
    static constexpr int DefaultTimeout = 30000;

    explicit QVncWireReader(QIODevice *device = nullptr);

    QIODevice *device() const { return m_device; }
    void setDevice(QIODevice *device);

    // Milliseconds to wait for each chunk of data, -1 waits forever
    int timeout() const { return m_timeout; }
    void setTimeout(int msecs) { m_timeout = msecs; }

    QByteArray readBytes(qint64 length, bool *ok = nullptr);
    quint32 readInt(int length, bool *ok = nullptr);
    QString readText(bool *ok = nullptr);
    bool skip(qint64 length);

    QVnc::Error error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    bool waitForBytes();
    void setError(QVnc::Error error, const QString &errorString);

    QIODevice *m_device = nullptr;
    int m_timeout = DefaultTimeout;
    QVnc::Error m_error = QVnc::Error::NoError;
    QString m_errorString;
};

QT_END_NAMESPACE

#endif // QVNCWIREREADER_H
