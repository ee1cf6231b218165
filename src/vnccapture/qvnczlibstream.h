// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCZLIBSTREAM_H
#define QVNCZLIBSTREAM_H

#include "qtvnccaptureglobal.h"
#include <QtCore/QByteArray>

#include <zlib.h>

QT_BEGIN_NAMESPACE

/*
    Inflate context shared by every ZLib rectangle of one connection. The
    server keeps a single deflate dictionary for the whole session, so this
    object must live exactly as long as the connection.
*/
class QVncZlibStream
{
public:
    QVncZlibStream();
    ~QVncZlibStream();

    bool isValid() const { return m_active; }

    // Inflates all of input and returns exactly expectedBytes of output
    QByteArray inflate(const QByteArray &input, qsizetype expectedBytes, bool *ok = nullptr);

    QString errorString() const { return m_errorString; }

private:
    Q_DISABLE_COPY(QVncZlibStream)

    z_stream m_stream;
    bool m_active = false;
    QString m_errorString;
};

QT_END_NAMESPACE

#endif // QVNCZLIBSTREAM_H
