// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvnczlibstream.h"

QT_BEGIN_NAMESPACE

QVncZlibStream::QVncZlibStream()
{
    m_stream.zalloc = Z_NULL;
    m_stream.zfree = Z_NULL;
    m_stream.opaque = Z_NULL;
    m_stream.next_in = Z_NULL;
    m_stream.avail_in = 0;
    const int result = inflateInit(&m_stream);
    if (result != Z_OK) {
        m_errorString = u"Failed to initialize zlib stream, error code %1"_s.arg(result);
        qCWarning(lcVncCapture) << m_errorString;
        return;
    }
    m_active = true;
}

QVncZlibStream::~QVncZlibStream()
{
    if (m_active)
        inflateEnd(&m_stream);
}

/*!
    Feeds all of \a input to the persistent inflate context and returns the
    first \a expectedBytes bytes it produces. Output beyond that is dropped,
    but the input behind it is still consumed so that the dictionary stays
    in step with the server's compressor.

    Sets \a ok to false, returns an empty array and sets errorString() if
    zlib reports an error or produces fewer than \a expectedBytes bytes.
*/
QByteArray QVncZlibStream::inflate(const QByteArray &input, qsizetype expectedBytes, bool *ok)
{
    if (ok)
        *ok = false;
    if (!m_active) {
        m_errorString = u"Zlib stream is not initialized"_s;
        return QByteArray();
    }

    QByteArray output(expectedBytes, Qt::Uninitialized);
    Bytef scratch[1024];
    qsizetype produced = 0;
    qsizetype surplus = 0;

    m_stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.constData()));
    m_stream.avail_in = static_cast<uInt>(input.size());

    while (true) {
        const bool intoOutput = produced < expectedBytes;
        if (intoOutput) {
            m_stream.next_out = reinterpret_cast<Bytef *>(output.data()) + produced;
            m_stream.avail_out = static_cast<uInt>(expectedBytes - produced);
        } else {
            if (m_stream.avail_in == 0)
                break;
            m_stream.next_out = scratch;
            m_stream.avail_out = sizeof(scratch);
        }

        const uInt availableBefore = m_stream.avail_out;
        const int result = ::inflate(&m_stream, Z_SYNC_FLUSH);
        const qsizetype written = availableBefore - m_stream.avail_out;
        if (intoOutput)
            produced += written;
        else
            surplus += written;

        // Z_BUF_ERROR only means no progress was possible with the input given
        if (result == Z_STREAM_END || result == Z_BUF_ERROR)
            break;
        if (result != Z_OK) {
            m_errorString = u"Zlib inflation failed with error code %1 (%2)"_s
                    .arg(result).arg(QString::fromLatin1(m_stream.msg ? m_stream.msg : "no message"));
            m_stream.next_in = Z_NULL;
            m_stream.next_out = Z_NULL;
            return QByteArray();
        }
    }

    m_stream.next_in = Z_NULL;
    m_stream.next_out = Z_NULL;

    if (surplus > 0)
        qCWarning(lcVncCapture) << "Discarding" << surplus << "bytes of surplus zlib output";

    if (produced < expectedBytes) {
        m_errorString = u"Zlib produced %1 of %2 expected bytes"_s.arg(produced).arg(expectedBytes);
        return QByteArray();
    }
    if (ok)
        *ok = true;
    return output;
}

QT_END_NAMESPACE
