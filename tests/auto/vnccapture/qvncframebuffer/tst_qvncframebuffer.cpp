// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtCore/QObject>

#include "qvncframebuffer.h"
#include "qvncmessagewriter.h"
#include "qvncwirereader.h"
#include "vnctestserver.h"

namespace {

QByteArray imageBytes(const QImage &image)
{
    return QByteArray(reinterpret_cast<const char *>(image.constBits()), image.sizeInBytes());
}

// Number of pixels of an Alpha8 mask with the given value
int countAlpha(const QImage &mask, uchar value)
{
    int count = 0;
    for (int y = 0; y < mask.height(); y++) {
        const uchar *line = mask.constScanLine(y);
        for (int x = 0; x < mask.width(); x++) {
            if (line[x] == value)
                count++;
        }
    }
    return count;
}

QByteArray withAlpha(QByteArray rgba, char alpha)
{
    for (qsizetype i = 3; i < rgba.size(); i += 4)
        rgba[i] = alpha;
    return rgba;
}

} // namespace

class tst_qvncframebuffer : public QObject
{
    Q_OBJECT

private slots:
    void rawRectangle();        // Test bytes land at the right offset
    void completeness();
    void toRgba_data();
    void toRgba();              // Test conversion back to RGBA for every channel order
    void withoutData();
    void zlibSharedStream();    // Test one inflate context across rectangles
    void zlibFreshStreamFails();
    void zlibShortOutput();
    void resetKeepsZlibStream();
    void unsupportedEncoding();
    void outOfBounds();
    void hugeRectangle();
    void hugeZlibLength();
    void truncatedBody();
    void refresh();             // Test FramebufferUpdateRequest flags and fallbacks
};

// Test that a raw rectangle is copied to its position with alpha forced to 255
void tst_qvncframebuffer::rawRectangle()
{
    const QByteArray pixels = testPattern(2, 2, 0x10);

    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(1, 1, 2, 2), pixels));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 3), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.hasData());
    QRect updated;
    QVERIFY(framebuffer.read(reader, &updated));
    QCOMPARE(updated, QRect(1, 1, 2, 2));
    QCOMPARE(framebuffer.error(), QVnc::Error::NoError);

    const QByteArray data = framebuffer.data();
    QCOMPARE(data.size(), qsizetype(4 * 3 * 4));
    for (int y = 0; y < 3; y++) {
        for (int x = 0; x < 4; x++) {
            const QByteArray actual = data.mid((y * 4 + x) * 4, 4);
            if (QRect(1, 1, 2, 2).contains(x, y)) {
                const QByteArray expected = pixels.mid(((y - 1) * 2 + (x - 1)) * 4, 3) + char(0xff);
                QCOMPARE(actual, expected);
            } else {
                QCOMPARE(actual, QByteArray(4, '\0'));
            }
        }
    }
}

// Test that the buffer is complete exactly when the last pixel is covered
void tst_qvncframebuffer::completeness()
{
    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(0, 0, 2, 1), testPattern(2, 1)));
    server.feed(VncMessage::rawRectangle(QRect(0, 1, 1, 1), testPattern(1, 1)));
    server.feed(VncMessage::rawRectangle(QRect(1, 1, 1, 1), testPattern(1, 1, 0x00)));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(2, 2), QVnc::ChannelOrder::Bgra);
    QVERIFY(!framebuffer.isComplete());

    QVERIFY(framebuffer.read(reader));
    QVERIFY(!framebuffer.isComplete());
    QCOMPARE(countAlpha(framebuffer.alphaMask(), 0xff), 2);

    QVERIFY(framebuffer.read(reader));
    QVERIFY(!framebuffer.isComplete());

    QVERIFY(framebuffer.read(reader));
    QVERIFY(framebuffer.isComplete());
    QCOMPARE(countAlpha(framebuffer.alphaMask(), 0xff), 4);

    framebuffer.reset();
    QVERIFY(!framebuffer.hasData());
    QVERIFY(!framebuffer.isComplete());
}

void tst_qvncframebuffer::toRgba_data()
{
    QTest::addColumn<QVnc::ChannelOrder>("order");
    QTest::addColumn<QByteArray>("labels");

    QTest::newRow("bgra") << QVnc::ChannelOrder::Bgra << QByteArray("bgra");
    QTest::newRow("rgba") << QVnc::ChannelOrder::Rgba << QByteArray("rgba");
    QTest::newRow("argb") << QVnc::ChannelOrder::Argb << QByteArray("argb");
    QTest::newRow("abgr") << QVnc::ChannelOrder::Abgr << QByteArray("abgr");
}

// Test that decoding wire pixels and converting them back to RGBA is the identity
void tst_qvncframebuffer::toRgba()
{
    QFETCH(QVnc::ChannelOrder, order);
    QFETCH(QByteArray, labels);

    const QByteArray rgba = testPattern(5, 3, 0x33);
    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(0, 0, 5, 3), toChannelOrder(rgba, labels.constData())));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(5, 3), order);
    QVERIFY(framebuffer.read(reader));

    const QImage image = framebuffer.toRgba();
    QCOMPARE(image.format(), QImage::Format_RGBA8888);
    QCOMPARE(image.size(), QSize(5, 3));
    QCOMPARE(imageBytes(image), withAlpha(rgba, char(0xff)));
    QCOMPARE(image.pixel(2, 1), qRgba(2 * 7 + 1, 3, 2 ^ 1, 0xff));

    QCOMPARE(QVnc::channelIndex(order, 'a'), labels.indexOf('a'));
    QCOMPARE(countAlpha(framebuffer.alphaMask(), 0xff), 15);
}

// Test the outputs before any rectangle has been decoded
void tst_qvncframebuffer::withoutData()
{
    QVncFramebuffer framebuffer(QSize(3, 2), QVnc::ChannelOrder::Argb);
    QVERIFY(framebuffer.data().isEmpty());

    const QImage image = framebuffer.toRgba();
    QCOMPARE(image.size(), QSize(3, 2));
    QCOMPARE(imageBytes(image), QByteArray(3 * 2 * 4, '\0'));

    const QImage mask = framebuffer.alphaMask();
    QCOMPARE(mask.format(), QImage::Format_Alpha8);
    QCOMPARE(countAlpha(mask, 0), 6);
}

// Test that zlib rectangles decoded one by one match the same pixels sent in one piece
void tst_qvncframebuffer::zlibSharedStream()
{
    const QByteArray top = testPattern(8, 2, 0xff, 1);
    const QByteArray bottom = top;

    VncTestDeflater deflater;
    VncTestServer server;
    server.feed(VncMessage::zlibRectangle(QRect(0, 0, 8, 2), deflater.compress(top)));
    server.feed(VncMessage::zlibRectangle(QRect(0, 2, 8, 2), deflater.compress(bottom)));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(8, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(framebuffer.read(reader));
    QVERIFY(framebuffer.read(reader));
    QVERIFY(framebuffer.isComplete());
    QCOMPARE(framebuffer.data(), top + bottom);

    VncTestDeflater continuousDeflater;
    VncTestServer continuousServer;
    continuousServer.feed(VncMessage::zlibRectangle(QRect(0, 0, 8, 4), continuousDeflater.compress(top + bottom)));
    QVncWireReader continuousReader(&continuousServer);

    QVncFramebuffer continuous(QSize(8, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(continuous.read(continuousReader));
    QCOMPARE(continuous.data(), framebuffer.data());
}

// Test that a later rectangle cannot be inflated without the earlier ones
void tst_qvncframebuffer::zlibFreshStreamFails()
{
    const QByteArray pixels = testPattern(8, 2, 0xff, 2);

    VncTestDeflater deflater;
    const QByteArray first = deflater.compress(pixels);
    const QByteArray later = deflater.compress(pixels);

    // An empty rectangle carrying only the two byte zlib header gets the fresh
    // stream past the header, so the later block fails on its back-reference
    VncTestServer server;
    server.feed(VncMessage::zlibRectangle(QRect(0, 0, 0, 0), first.left(2)));
    server.feed(VncMessage::zlibRectangle(QRect(0, 2, 8, 2), later));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(8, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(framebuffer.read(reader));
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::DecompressionError);
    QVERIFY2(framebuffer.errorString().contains(u"distance"_s), qPrintable(framebuffer.errorString()));

    // The same bytes decode once the stream has seen the first block
    VncTestServer sharedServer;
    sharedServer.feed(VncMessage::zlibRectangle(QRect(0, 0, 8, 2), first));
    sharedServer.feed(VncMessage::zlibRectangle(QRect(0, 2, 8, 2), later));
    QVncWireReader sharedReader(&sharedServer);

    QVncFramebuffer shared(QSize(8, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(shared.read(sharedReader));
    QVERIFY(shared.read(sharedReader));
    QCOMPARE(shared.data(), pixels + pixels);
}

void tst_qvncframebuffer::zlibShortOutput()
{
    VncTestDeflater deflater;
    VncTestServer server;
    server.feed(VncMessage::zlibRectangle(QRect(0, 0, 2, 2), deflater.compress(QByteArray(10, 'x'))));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(2, 2), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::DecompressionError);
}

// Test that reset() discards pixels but not the inflate dictionary
void tst_qvncframebuffer::resetKeepsZlibStream()
{
    const QByteArray pixels = testPattern(4, 4, 0xff, 3);

    VncTestDeflater deflater;
    VncTestServer server;
    server.feed(VncMessage::zlibRectangle(QRect(0, 0, 4, 4), deflater.compress(pixels)));
    server.feed(VncMessage::zlibRectangle(QRect(0, 0, 4, 4), deflater.compress(pixels)));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(framebuffer.read(reader));
    framebuffer.reset();
    QVERIFY(framebuffer.read(reader));
    QCOMPARE(framebuffer.data(), pixels);
}

// Test that an unknown encoding fails before its body is read
void tst_qvncframebuffer::unsupportedEncoding()
{
    const QByteArray body(64, '\x5a');

    VncTestServer server;
    server.feed(VncMessage::rectangleHeader(QRect(0, 0, 4, 4), 16) + body);
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::UnsupportedEncodingError);
    QCOMPARE(server.unreadBytes(), qint64(body.size()));
    QVERIFY(!framebuffer.hasData());
}

// Test that a rectangle outside the framebuffer fails before its body is read
void tst_qvncframebuffer::outOfBounds()
{
    const QByteArray body = testPattern(2, 2);

    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(3, 3, 2, 2), body));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::RectangleOutOfBoundsError);
    QCOMPARE(server.unreadBytes(), qint64(body.size()));
    QVERIFY(!framebuffer.hasData());
}

// Test that a header claiming a huge raw body is rejected without reading it
void tst_qvncframebuffer::hugeRectangle()
{
    const QByteArray body(64, '\x11');

    VncTestServer server;
    server.feed(VncMessage::rectangleHeader(QRect(0, 0, 65535, 65535), 0) + body);
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::RectangleOutOfBoundsError);
    QCOMPARE(server.unreadBytes(), qint64(body.size()));
    QCOMPARE(server.waitCount(), 0);
    QVERIFY(!framebuffer.hasData());
}

// Test that a zlib length far beyond the data sent fails as a short stream
void tst_qvncframebuffer::hugeZlibLength()
{
    QByteArray data = VncMessage::rectangleHeader(QRect(0, 0, 4, 4), 6);
    QDataStream stream(&data, QIODevice::WriteOnly | QIODevice::Append);
    stream << quint32(0xfffffff0) << quint32(0x78010000);

    VncTestServer server;
    server.feed(data);
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(4, 4), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::IncompleteStreamError);
    QVERIFY(!framebuffer.hasData());
}

void tst_qvncframebuffer::truncatedBody()
{
    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(0, 0, 2, 2), testPattern(2, 2)).chopped(1));
    QVncWireReader reader(&server);

    QVncFramebuffer framebuffer(QSize(2, 2), QVnc::ChannelOrder::Rgba);
    QVERIFY(!framebuffer.read(reader));
    QCOMPARE(framebuffer.error(), QVnc::Error::IncompleteStreamError);
}

// Test that requests are incremental only once a buffer exists
void tst_qvncframebuffer::refresh()
{
    VncTestServer server;
    server.feed(VncMessage::rawRectangle(QRect(0, 0, 1, 1), testPattern(1, 1)));
    QVncWireReader reader(&server);
    QVncMessageWriter writer(&server);

    QVncFramebuffer framebuffer(QSize(4, 2), QVnc::ChannelOrder::Rgba);
    framebuffer.refresh(writer);
    QCOMPARE(server.takeWritten(), QByteArray::fromHex("0300" "0000" "0000" "0004" "0002"));

    QVERIFY(framebuffer.read(reader));
    framebuffer.refresh(writer, QRect(1, 0, 2, 0));
    QCOMPARE(server.takeWritten(), QByteArray::fromHex("0301" "0001" "0000" "0002" "0002"));

    framebuffer.reset();
    framebuffer.refresh(writer, QRect(0, 1, 0, 1));
    QCOMPARE(server.takeWritten(), QByteArray::fromHex("0300" "0000" "0001" "0004" "0001"));
}

QTEST_GUILESS_MAIN(tst_qvncframebuffer)
#include "tst_qvncframebuffer.moc"
