// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncwirereader.h"

QT_BEGIN_NAMESPACE

/*!
    \class QVncWireReader
    \inmodule QtVncCapture

    \brief The QVncWireReader class reads RFB primitives from a QIODevice.

    All integers on the wire are big-endian. Every read either returns the
    complete value or fails with QVnc::Error::IncompleteStreamError; a failed
    read leaves the stream at an unknown offset.
*/

QVncWireReader::QVncWireReader(QIODevice *device)
    : m_device(device)
{
}

void QVncWireReader::setDevice(QIODevice *device)
{
    m_device = device;
    m_error = QVnc::Error::NoError;
    m_errorString.clear();
}

/*!
    Reads exactly \a length bytes, waiting for the device to deliver more
    data when needed. Returns an empty array and sets \a ok to false if the
    stream ends first.
*/
QByteArray QVncWireReader::readBytes(qint64 length, bool *ok)
{
    if (ok)
        *ok = false;
    if (!m_device) {
        setError(QVnc::Error::IncompleteStreamError, u"No device to read from"_s);
        return QByteArray();
    }

    // length comes from the peer, so the buffer only grows by what has arrived
    QByteArray data;
    qint64 totalRead = 0;
    while (totalRead < length) {
        if (m_device->bytesAvailable() < 1 && !waitForBytes()) {
            setError(QVnc::Error::IncompleteStreamError,
                     u"Stream ended after %1 of %2 bytes"_s.arg(totalRead).arg(length));
            return QByteArray();
        }
        const qint64 chunk = qMin(length - totalRead, qMax<qint64>(m_device->bytesAvailable(), 1));
        data.resize(totalRead + chunk);
        const qint64 bytesRead = m_device->read(data.data() + totalRead, chunk);
        if (bytesRead < 0) {
            setError(QVnc::Error::IncompleteStreamError,
                     u"Read failed: %1"_s.arg(m_device->errorString()));
            return QByteArray();
        }
        totalRead += bytesRead;
        data.resize(totalRead);
    }

    if (ok)
        *ok = true;
    return data;
}

/*!
    Reads a big-endian unsigned integer of \a length bytes (1 to 4).
*/
quint32 QVncWireReader::readInt(int length, bool *ok)
{
    Q_ASSERT(length >= 1 && length <= 4);
    bool readOk = false;
    const QByteArray data = readBytes(length, &readOk);
    if (ok)
        *ok = readOk;
    if (!readOk)
        return 0;

    quint32 value = 0;
    for (const char byte : data)
        value = (value << 8) | static_cast<quint8>(byte);
    return value;
}

/*!
    Reads a 4-byte length followed by that many bytes of UTF-8 text.
*/
QString QVncWireReader::readText(bool *ok)
{
    bool readOk = false;
    const quint32 length = readInt(4, &readOk);
    QByteArray data;
    if (readOk)
        data = readBytes(length, &readOk);
    if (ok)
        *ok = readOk;
    return readOk ? QString::fromUtf8(data) : QString();
}

bool QVncWireReader::skip(qint64 length)
{
    bool ok = false;
    readBytes(length, &ok);
    return ok;
}

bool QVncWireReader::waitForBytes()
{
    // A random-access device at its end will never deliver more
    if (!m_device->isOpen() || (!m_device->isSequential() && m_device->atEnd()))
        return false;
    return m_device->waitForReadyRead(m_timeout) && m_device->bytesAvailable() > 0;
}

void QVncWireReader::setError(QVnc::Error error, const QString &errorString)
{
    m_error = error;
    m_errorString = errorString;
    qCWarning(lcVncCapture) << error << errorString;
}

QT_END_NAMESPACE
