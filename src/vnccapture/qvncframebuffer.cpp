// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncframebuffer.h"
#include "qvncmessagewriter.h"
#include "qvncwirereader.h"
#include "qvnczlibstream.h"

#include <QtCore/QtEndian>

#include <cstring>

QT_BEGIN_NAMESPACE

/*!
    \internal
    \class QVncFramebuffer::Private
    \brief Holds the pixel buffer and the connection's inflate context.
*/
class QVncFramebuffer::Private
{
public:
    /*!
        \internal
        \struct QVncFramebuffer::Private::RectangleHeader
        \brief Header preceding every rectangle of a FramebufferUpdate.
    */
    struct RectangleHeader {
        quint16_be x;        ///< X-coordinate of the top-left corner
        quint16_be y;        ///< Y-coordinate of the top-left corner
        quint16_be w;        ///< Width of the rectangle
        quint16_be h;        ///< Height of the rectangle
        qint32_be encoding;  ///< Encoding of the body that follows
    };
    static_assert(sizeof(RectangleHeader) == 12, "Rectangle header is 12 bytes on the wire");

    Private(const QSize &size, QVnc::ChannelOrder channelOrder);

    /*!
        \internal
        \brief Records \a error and returns false so callers can bail out in one line.
    */
    bool setError(QVnc::Error error, const QString &errorString);

    /*!
        \internal
        \brief Reads the body of a raw rectangle of \a length bytes.
    */
    QByteArray handleRawEncoding(QVncWireReader &reader, qsizetype length, bool *ok);

    /*!
        \internal
        \brief Reads a zlib rectangle body and inflates it to \a length bytes.

        The inflate context is shared with every earlier zlib rectangle of the
        connection and is never reset here.
    */
    QByteArray handleZlibEncoding(QVncWireReader &reader, qsizetype length, bool *ok);

    /*!
        \internal
        \brief Copies \a pixels into \a rect and marks the rectangle as written.
    */
    void blit(const QRect &rect, const QByteArray &pixels);

    uchar *pixel(int x, int y) {
        return reinterpret_cast<uchar *>(data.data()) + (qsizetype(y) * size.width() + x) * BytesPerPixel;
    }
    const uchar *pixel(int x, int y) const {
        return reinterpret_cast<const uchar *>(data.constData()) + (qsizetype(y) * size.width() + x) * BytesPerPixel;
    }

    QSize size;
    QVnc::ChannelOrder channelOrder;
    int alphaIndex;
    bool allocated = false;
    QByteArray data;
    QVncZlibStream zlibStream;
    QVnc::Error error = QVnc::Error::NoError;
    QString errorString;
};

QVncFramebuffer::Private::Private(const QSize &size, QVnc::ChannelOrder channelOrder)
    : size(size)
    , channelOrder(channelOrder)
    , alphaIndex(QVnc::channelIndex(channelOrder, 'a'))
{
}

bool QVncFramebuffer::Private::setError(QVnc::Error error, const QString &errorString)
{
    this->error = error;
    this->errorString = errorString;
    qCWarning(lcVncCapture) << error << errorString;
    return false;
}

QByteArray QVncFramebuffer::Private::handleRawEncoding(QVncWireReader &reader, qsizetype length, bool *ok)
{
    const QByteArray pixels = reader.readBytes(length, ok);
    if (!*ok)
        setError(reader.error(), reader.errorString());
    return pixels;
}

QByteArray QVncFramebuffer::Private::handleZlibEncoding(QVncWireReader &reader, qsizetype length, bool *ok)
{
    const quint32 compressedLength = reader.readInt(4, ok);
    if (!*ok) {
        setError(reader.error(), reader.errorString());
        return QByteArray();
    }
    const QByteArray compressedData = reader.readBytes(compressedLength, ok);
    if (!*ok) {
        setError(reader.error(), reader.errorString());
        return QByteArray();
    }

    const QByteArray pixels = zlibStream.inflate(compressedData, length, ok);
    if (!*ok)
        setError(QVnc::Error::DecompressionError, zlibStream.errorString());
    return pixels;
}

void QVncFramebuffer::Private::blit(const QRect &rect, const QByteArray &pixels)
{
    if (!allocated) {
        data = QByteArray(qsizetype(size.width()) * size.height() * BytesPerPixel, '\0');
        allocated = true;
    }
    if (rect.isEmpty())
        return;

    const qsizetype rowLength = qsizetype(rect.width()) * BytesPerPixel;
    const char *source = pixels.constData();
    for (int row = 0; row < rect.height(); row++) {
        uchar *target = pixel(rect.x(), rect.y() + row);
        std::memcpy(target, source + row * rowLength, rowLength);
        // The alpha channel marks pixels that have been written at least once
        for (int column = 0; column < rect.width(); column++)
            target[column * BytesPerPixel + alphaIndex] = 0xff;
    }
}

/*!
    \class QVncFramebuffer
    \inmodule QtVncCapture

    \brief The QVncFramebuffer class decodes rectangle updates into a local
    copy of the remote framebuffer.

    Pixels are stored in the channel order negotiated for the connection. The
    alpha channel doubles as a completeness marker: it is 255 for every pixel
    that has been covered by a decoded rectangle and 0 for all others,
    whatever the server sent in that byte.

    A framebuffer is created once per connection and owns the connection's
    zlib inflate context. reset() discards the pixels but keeps the context.
*/

/*!
    Constructs a framebuffer of \a size whose pixels arrive in \a channelOrder.
    No pixel memory is allocated until the first rectangle is decoded.
*/
QVncFramebuffer::QVncFramebuffer(const QSize &size, QVnc::ChannelOrder channelOrder)
    : d(new Private(size, channelOrder))
{
}

/*!
    Destroys the framebuffer and releases its zlib context.
*/
QVncFramebuffer::~QVncFramebuffer() = default;

QSize QVncFramebuffer::size() const
{
    return d->size;
}

QVnc::ChannelOrder QVncFramebuffer::channelOrder() const
{
    return d->channelOrder;
}

/*!
    Returns the raw pixel data, \c{height * width * 4} bytes in channelOrder(),
    or an empty array if no rectangle has been decoded since the last reset().
*/
QByteArray QVncFramebuffer::data() const
{
    return d->data;
}

/*!
    Returns true once the first rectangle has been decoded.

    \sa reset()
*/
bool QVncFramebuffer::hasData() const
{
    return d->allocated;
}

/*!
    Discards the pixel buffer. The next refresh() is a full update request and
    the next decoded rectangle allocates a fresh, entirely unwritten buffer.
*/
void QVncFramebuffer::reset()
{
    d->data.clear();
    d->allocated = false;
}

/*!
    Sends a FramebufferUpdateRequest for \a rect through \a writer.

    The request is incremental if a pixel buffer already exists. A rectangle
    without width or height falls back to the framebuffer's width or height.
    Nothing is read back here.
*/
void QVncFramebuffer::refresh(QVncMessageWriter &writer, const QRect &rect)
{
    const QRect request(rect.x(), rect.y(),
                        rect.width() > 0 ? rect.width() : d->size.width(),
                        rect.height() > 0 ? rect.height() : d->size.height());
    writer.framebufferUpdateRequest(d->allocated, request);
}

/*!
    Reads one rectangle (header and body) from \a reader and decodes it into
    the buffer. On success the decoded area is stored in \a updated.

    Returns false if the stream ended, the encoding is neither Raw nor ZLib,
    decompression failed or the rectangle lies outside the framebuffer. A
    rectangle outside the framebuffer is rejected before its body is read.
    The stream cannot be used after a failure.
*/
bool QVncFramebuffer::read(QVncWireReader &reader, QRect *updated)
{
    bool ok = false;
    const QByteArray headerData = reader.readBytes(sizeof(Private::RectangleHeader), &ok);
    if (!ok)
        return d->setError(reader.error(), reader.errorString());

    Private::RectangleHeader header;
    std::memcpy(&header, headerData.constData(), sizeof(header));
    const QRect rect(header.x, header.y, header.w, header.h);
    const qint32 encoding = header.encoding;
    qCDebug(lcVncCapture) << "Rectangle" << rect << "encoding" << encoding;

    // Checked before the body, whose size follows from the header
    if (!QRect(QPoint(0, 0), d->size).contains(rect) && !rect.isEmpty()) {
        return d->setError(QVnc::Error::RectangleOutOfBoundsError,
                           u"Rectangle %1,%2 %3x%4 exceeds the %5x%6 framebuffer"_s
                                   .arg(rect.x()).arg(rect.y()).arg(rect.width()).arg(rect.height())
                                   .arg(d->size.width()).arg(d->size.height()));
    }

    const qsizetype length = qsizetype(rect.width()) * rect.height() * BytesPerPixel;
    QByteArray pixels;
    switch (static_cast<QVnc::Encoding>(encoding)) {
    case QVnc::Encoding::Raw:
        pixels = d->handleRawEncoding(reader, length, &ok);
        break;
    case QVnc::Encoding::ZLib:
        pixels = d->handleZlibEncoding(reader, length, &ok);
        break;
    default:
        // The body length depends on the encoding, so nothing after this can be parsed
        return d->setError(QVnc::Error::UnsupportedEncodingError,
                           u"Unsupported encoding %1"_s.arg(encoding));
    }
    if (!ok)
        return false;

    d->blit(rect, pixels);
    if (updated)
        *updated = rect;
    return true;
}

/*!
    Returns the buffer as an image with canonical R, G, B, A byte order.

    If no rectangle has been decoded yet, an all-zero image of the negotiated
    size is returned.
*/
QImage QVncFramebuffer::toRgba() const
{
    QImage image(d->size, QImage::Format_RGBA8888);
    if (!d->allocated) {
        image.fill(0);
        return image;
    }

    const qsizetype rowLength = qsizetype(d->size.width()) * BytesPerPixel;
    if (d->channelOrder == QVnc::ChannelOrder::Rgba) {
        for (int y = 0; y < d->size.height(); y++)
            std::memcpy(image.scanLine(y), d->pixel(0, y), rowLength);
        return image;
    }

    // abgr is a full reversal; bgra and argb need a gather. Both are lookups by channel name
    const int r = QVnc::channelIndex(d->channelOrder, 'r');
    const int g = QVnc::channelIndex(d->channelOrder, 'g');
    const int b = QVnc::channelIndex(d->channelOrder, 'b');
    const int a = d->alphaIndex;
    for (int y = 0; y < d->size.height(); y++) {
        const uchar *source = d->pixel(0, y);
        uchar *target = image.scanLine(y);
        for (int x = 0; x < d->size.width(); x++) {
            target[0] = source[r];
            target[1] = source[g];
            target[2] = source[b];
            target[3] = source[a];
            source += BytesPerPixel;
            target += BytesPerPixel;
        }
    }
    return image;
}

/*!
    Returns the alpha channel as a Format_Alpha8 image: 255 where a pixel has
    been written, 0 elsewhere.

    \sa QVncScreenDetector::detectScreens()
*/
QImage QVncFramebuffer::alphaMask() const
{
    QImage mask(d->size, QImage::Format_Alpha8);
    mask.fill(0);
    if (!d->allocated)
        return mask;

    for (int y = 0; y < d->size.height(); y++) {
        const uchar *source = d->pixel(0, y) + d->alphaIndex;
        uchar *target = mask.scanLine(y);
        for (int x = 0; x < d->size.width(); x++)
            target[x] = source[x * BytesPerPixel];
    }
    return mask;
}

/*!
    Returns true if a buffer exists and every one of its pixels has been
    written by a decoded rectangle.
*/
bool QVncFramebuffer::isComplete() const
{
    if (!d->allocated)
        return false;

    const uchar *alpha = d->pixel(0, 0) + d->alphaIndex;
    const qsizetype pixelCount = qsizetype(d->size.width()) * d->size.height();
    for (qsizetype i = 0; i < pixelCount; i++) {
        if (alpha[i * BytesPerPixel] != 0xff)
            return false;
    }
    return true;
}

QVnc::Error QVncFramebuffer::error() const
{
    return d->error;
}

QString QVncFramebuffer::errorString() const
{
    return d->errorString;
}

QT_END_NAMESPACE
