// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// QVncClient API Documentation
// ===========================
//
// This file implements the QVncClient class, the screenshot session of the
// QtVncCapture module.
//
// Class Overview:
// - QVncClient reads from a QIODevice that has already completed the RFB
//   version handshake and security negotiation
// - Negotiates the pixel format and the encodings from ServerInit on
// - Decodes FramebufferUpdate messages into a QVncFramebuffer
// - Takes blocking screenshots and detects the physical screens in them
//
// Protocol Support:
// - 32-bit true colour pixel formats in any of the bgra, rgba, argb and abgr
//   byte orders; other formats are switched to rgba with SetPixelFormat
// - Raw and ZLib rectangle encodings
//
// Main Classes and Functions:
// - QVncClient: Main public API for client applications
//   - setDevice(): Sets the stream for VNC communication
//   - initialize(): Reads ServerInit and negotiates the pixel format
//   - screenshot(): Requests and waits for a complete framebuffer
//   - detectScreens(): Finds the physical screens in the last screenshot
// - QVncFramebuffer: Rectangle decoding and completeness tracking
// - QVncScreenDetector: Screen boundary detection on an alpha mask
//
#include "qvncclient.h"
#include "qvncframebuffer.h"
#include "qvncmessagewriter.h"
#include "qvncnegotiator.h"
#include "qvncwirereader.h"

#include <QtCore/QDebug>

/*!
    \internal
    \class QVncClient::Private
    \brief The Private class implements the message loop for QVncClient.

    It owns the reader and writer bound to the device and the framebuffer,
    which in turn owns the zlib context of the connection.
*/
class QVncClient::Private
{
public:
    /*!
        \internal
        \brief Constructs a private implementation object for QVncClient.
        \param parent The QVncClient instance that owns this Private implementation.

        Connects to the device's aboutToClose() and destroyed() signals so that
        the connection state is released when the stream goes away.
    */
    Private(QVncClient *parent);

    /*!
        \internal
        \brief Records \a error, emits errorOccurred() and returns false.

        Errors are sticky: the stream position is unknown after any failure,
        so every later operation fails until a new device is set.
    */
    bool setError(QVnc::Error error, const QString &errorString);

    /*!
        \internal
        \brief Checks that a device is set, initialize() succeeded and no error occurred.
    */
    bool isReady();

    /*!
        \internal
        \brief Processes the body of a FramebufferUpdate message.

        Reads the number of rectangles and hands each one to the framebuffer.
    */
    bool framebufferUpdate();

    /*!
        \internal
        \brief Drops the framebuffer, its zlib context and the server name.
    */
    void releaseConnection();

private:
    QVncClient *q;                              ///< Pointer to the public class
    QIODevice *prev = nullptr;                  ///< Previous device for cleanup
public:
    QIODevice *device = nullptr;                ///< Stream for VNC communication
    QVncWireReader reader;                      ///< Reads server messages from device
    QVncMessageWriter writer;                   ///< Writes client messages to device
    QScopedPointer<QVncFramebuffer> framebuffer; ///< Created by initialize()
    QString name;                               ///< Desktop name from ServerInit
    bool forceCanonicalFormat = false;          ///< Always request rgba
    QVnc::Error error = QVnc::Error::NoError;   ///< First fatal error
    QString errorString;                        ///< Description of error
};

QVncClient::Private::Private(QVncClient *parent)
    : q(parent)
{
    connect(q, &QVncClient::deviceChanged, q, [this](QIODevice *device) {
        if (prev) {
            disconnect(prev, nullptr, q, nullptr);
        }

        if (device) {
            // Queued, a socket may close itself while a read is waiting for data
            connect(device, &QIODevice::aboutToClose, q, [this, device]() {
                qCInfo(lcVncCapture) << "Connection closed";
                if (this->device == device)
                    releaseConnection();
            }, Qt::QueuedConnection);
            connect(device, &QObject::destroyed, q, [this]() {
                this->device = nullptr;
                prev = nullptr;
                reader.setDevice(nullptr);
                writer.setDevice(nullptr);
                releaseConnection();
            });
        }
        prev = device;
    });
}

bool QVncClient::Private::setError(QVnc::Error error, const QString &errorString)
{
    if (this->error != QVnc::Error::NoError)
        return false;
    this->error = error;
    this->errorString = errorString;
    emit q->errorOccurred(error);
    return false;
}

bool QVncClient::Private::isReady()
{
    if (error != QVnc::Error::NoError)
        return false;
    if (!device || !framebuffer) {
        qCWarning(lcVncCapture) << "Session used before initialize()";
        return setError(QVnc::Error::NotInitializedError, u"Session is not initialized"_s);
    }
    return true;
}

bool QVncClient::Private::framebufferUpdate()
{
    if (!reader.skip(1)) // padding
        return setError(reader.error(), reader.errorString());
    bool ok = false;
    const quint32 numberOfRectangles = reader.readInt(2, &ok);
    if (!ok)
        return setError(reader.error(), reader.errorString());

    qCDebug(lcVncCapture) << "FramebufferUpdate with" << numberOfRectangles << "rectangles";
    for (quint32 i = 0; i < numberOfRectangles; i++) {
        QRect rect;
        if (!framebuffer->read(reader, &rect))
            return setError(framebuffer->error(), framebuffer->errorString());
        emit q->imageChanged(rect);
    }
    return true;
}

void QVncClient::Private::releaseConnection()
{
    framebuffer.reset();
    name.clear();
}

/*!
    \class QVncClient
    \inmodule QtVncCapture

    \brief The QVncClient class takes screenshots from a VNC server.

    QVncClient works on a QIODevice whose RFB version handshake and security
    negotiation have already been completed, typically a QTcpSocket. Reads
    block in QIODevice::waitForReadyRead(), so the device must support it.
    Only one read may be in progress at a time; QVncClient does no locking.

    \code
    QVncClient client;
    client.setDevice(socket);
    if (client.initialize()) {
        const QImage image = client.screenshot();
        for (const QVncScreen &screen : client.detectScreens())
            screen.crop(image).save(...);
    }
    \endcode

    \sa QVncFramebuffer, QVncScreenDetector
*/

/*!
    Constructs a VNC client with the given \a parent object.
*/
QVncClient::QVncClient(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

/*!
    Destroys the VNC client and frees its resources, including the zlib
    context of the connection.
*/
QVncClient::~QVncClient() = default;

/*!
    Returns the device used for the VNC connection.

    \sa setDevice()
*/
QIODevice *QVncClient::device() const
{
    return d->device;
}

/*!
    Sets the device used for VNC communication to \a device.

    \note The device must be positioned right after the security result, so
    that the next bytes it delivers are the ServerInit message. Call
    initialize() afterwards.

    Setting a device releases the framebuffer of the previous connection and
    clears any error.

    \sa device(), initialize()
*/
void QVncClient::setDevice(QIODevice *device)
{
    if (d->device == device) return;
    d->device = device;
    d->reader.setDevice(device);
    d->writer.setDevice(device);
    d->releaseConnection();
    d->error = QVnc::Error::NoError;
    d->errorString.clear();
    emit deviceChanged(device);
}

/*!
    Returns the number of milliseconds a read waits for more data before it
    fails with QVnc::Error::IncompleteStreamError.
*/
int QVncClient::readTimeout() const
{
    return d->reader.timeout();
}

/*!
    Sets the read timeout to \a msecs. -1 waits forever.
*/
void QVncClient::setReadTimeout(int msecs)
{
    d->reader.setTimeout(msecs);
}

/*!
    Returns whether initialize() asks the server for RGBA pixels even if it
    already uses one of the supported layouts.
*/
bool QVncClient::forceCanonicalFormat() const
{
    return d->forceCanonicalFormat;
}

void QVncClient::setForceCanonicalFormat(bool force)
{
    d->forceCanonicalFormat = force;
}

/*!
    Returns the desktop name announced by the server.
*/
QString QVncClient::name() const
{
    return d->name;
}

/*!
    Returns the width of the remote framebuffer in pixels.

    \sa framebufferHeight(), framebufferSizeChanged()
*/
int QVncClient::framebufferWidth() const
{
    return d->framebuffer ? d->framebuffer->size().width() : 0;
}

/*!
    Returns the height of the remote framebuffer in pixels.

    \sa framebufferWidth(), framebufferSizeChanged()
*/
int QVncClient::framebufferHeight() const
{
    return d->framebuffer ? d->framebuffer->size().height() : 0;
}

/*!
    Returns the byte order of the pixels sent by the server.
*/
QVnc::ChannelOrder QVncClient::channelOrder() const
{
    return d->framebuffer ? d->framebuffer->channelOrder() : QVnc::ChannelOrder::Rgba;
}

/*!
    Returns the framebuffer of the current connection, or \nullptr before
    initialize().
*/
QVncFramebuffer *QVncClient::framebuffer() const
{
    return d->framebuffer.data();
}

/*!
    Reads the ServerInit message, negotiates the pixel format and announces
    the supported encodings. Creates the framebuffer, and with it the zlib
    context used for the rest of the connection.

    Returns false if no device is set or the stream ended early.

    \sa framebufferSizeChanged()
*/
bool QVncClient::initialize()
{
    if (d->error != QVnc::Error::NoError)
        return false;
    if (!d->device)
        return d->setError(QVnc::Error::NotInitializedError, u"No device set"_s);
    if (d->framebuffer) {
        qCWarning(lcVncCapture) << "Session is already initialized";
        return true;
    }

    QVncPixelFormatNegotiator negotiator(d->reader, d->writer);
    negotiator.setForceCanonicalFormat(d->forceCanonicalFormat);
    const auto init = negotiator.negotiate();
    if (!init)
        return d->setError(d->reader.error(), d->reader.errorString());

    d->name = init->name;
    d->framebuffer.reset(new QVncFramebuffer(init->size, init->channelOrder));
    emit framebufferSizeChanged(init->size.width(), init->size.height());
    return true;
}

/*!
    Reads one message from the server and returns its type.

    For a video update every rectangle of the message is decoded and
    imageChanged() is emitted for each. Any other message type is an error,
    because its length is unknown and the stream cannot be skipped past it.

    Returns std::nullopt on failure; see error().
*/
std::optional<QVnc::UpdateType> QVncClient::read()
{
    if (!d->isReady())
        return std::nullopt;

    bool ok = false;
    const quint32 messageType = d->reader.readInt(1, &ok);
    if (!ok) {
        d->setError(d->reader.error(), d->reader.errorString());
        return std::nullopt;
    }

    if (static_cast<QVnc::UpdateType>(messageType) == QVnc::UpdateType::Video) {
        if (!d->framebufferUpdate())
            return std::nullopt;
        return QVnc::UpdateType::Video;
    }

    qCWarning(lcVncCapture) << "Unknown message type:" << messageType;
    d->setError(QVnc::Error::InvalidUpdateTypeError, u"Unknown message type %1"_s.arg(messageType));
    return std::nullopt;
}

/*!
    Takes a screenshot and returns it as a Format_RGBA8888 image.

    The current pixels are discarded and a full update of \a rect (the whole
    framebuffer if \a rect has no size) is requested. Messages are read until
    a video update leaves every pixel of the framebuffer written, however many
    rectangles and messages the server splits it into.

    Returns a null image on failure; see error().
*/
QImage QVncClient::screenshot(const QRect &rect)
{
    if (!d->isReady())
        return QImage();

    d->framebuffer->reset();
    d->framebuffer->refresh(d->writer, rect);
    while (true) {
        const auto updateType = read();
        if (!updateType)
            return QImage();
        if (*updateType == QVnc::UpdateType::Video && d->framebuffer->isComplete())
            break;
    }

    qCInfo(lcVncCapture) << "Screenshot complete:" << d->framebuffer->size();
    return d->framebuffer->toRgba();
}

/*!
    Returns the screens detected in the written area of the framebuffer, in
    order of detection. Empty before the first decoded rectangle.

    \sa QVncScreenDetector::detectScreens()
*/
QList<QVncScreen> QVncClient::detectScreens() const
{
    if (!d->framebuffer || !d->framebuffer->hasData())
        return QList<QVncScreen>();
    return QVncScreenDetector::detectScreens(d->framebuffer->alphaMask());
}

/*!
    Returns the first fatal error of the current connection.

    \sa errorString(), errorOccurred()
*/
QVnc::Error QVncClient::error() const
{
    return d->error;
}

QString QVncClient::errorString() const
{
    return d->errorString;
}
