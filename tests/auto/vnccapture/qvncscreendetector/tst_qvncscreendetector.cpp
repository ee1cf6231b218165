// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtCore/QObject>
#include <QtGui/QImage>

#include "qvncscreendetector.h"

#include <algorithm>

namespace {

QImage makeMask(const QSize &size, const QList<QRect> &filled)
{
    QImage mask(size, QImage::Format_Alpha8);
    mask.fill(0);
    for (const QRect &rect : filled) {
        for (int y = rect.top(); y <= rect.bottom(); y++)
            std::fill_n(mask.scanLine(y) + rect.left(), rect.width(), uchar(0xff));
    }
    return mask;
}

} // namespace

class tst_qvncscreendetector : public QObject
{
    Q_OBJECT

private slots:
    void score_data();
    void score();
    void singleScreen_data();
    void singleScreen();
    void separatedScreens();
    void adjacentScreens();     // Test screens sharing a boundary column
    void equalHeightAdjacentScreens();
    void emptyMask();
    void partiallyWrittenPixels();
    void argbMask();
    void maskNotModified();
    void crop();
};

void tst_qvncscreendetector::score_data()
{
    QTest::addColumn<QSize>("size");
    QTest::addColumn<double>("expected");

    QTest::newRow("16:9") << QSize(1920, 1080) << 2073600.0;
    QTest::newRow("16:10") << QSize(1680, 1050) << 1764000.0;
    QTest::newRow("4:3 portrait") << QSize(768, 1024) << 786432.0;
    QTest::newRow("32:9") << QSize(5120, 1440) << 7372800.0;
    QTest::newRow("64:27") << QSize(2560, 1080) << 2764800.0;
    // 683:384 is closest to 16:9 with a denominator of at most 64
    QTest::newRow("1366x768") << QSize(1366, 768) << 1049088.0;
    QTest::newRow("square") << QSize(100, 100) << 5000.0;
    QTest::newRow("5:4") << QSize(1280, 1024) << 524288.0;
    QTest::newRow("empty") << QSize(0, 1080) << 0.0;
}

// Test that common aspect ratios score their area and others are penalized
void tst_qvncscreendetector::score()
{
    QFETCH(QSize, size);
    QFETCH(double, expected);

    const QVncScreen screen(0, 0, size.width(), size.height());
    QCOMPARE(screen.score(), expected);
}

void tst_qvncscreendetector::singleScreen_data()
{
    QTest::addColumn<QSize>("size");
    QTest::addColumn<double>("expectedScore");

    QTest::newRow("100x100") << QSize(100, 100) << 5000.0;
    QTest::newRow("1920x1080") << QSize(1920, 1080) << 2073600.0;
}

// Test that a fully written framebuffer is one screen
void tst_qvncscreendetector::singleScreen()
{
    QFETCH(QSize, size);
    QFETCH(double, expectedScore);

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(makeMask(size, { QRect(QPoint(0, 0), size) }));
    QCOMPARE(screens.size(), 1);
    QCOMPARE(screens.first(), QVncScreen(0, 0, size.width(), size.height()));
    QCOMPARE(screens.first().score(), expectedScore);
}

void tst_qvncscreendetector::separatedScreens()
{
    const QImage mask = makeMask(QSize(1800, 600), { QRect(0, 0, 800, 600), QRect(1000, 0, 800, 600) });

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(mask);
    QCOMPARE(screens.size(), 2);
    QCOMPARE(screens.at(0), QVncScreen(0, 0, 800, 600));
    QCOMPARE(screens.at(1), QVncScreen(1000, 0, 800, 600));
}

// Test that two touching screens of different height are told apart
void tst_qvncscreendetector::adjacentScreens()
{
    const QRect primary(0, 0, 1920, 1080);
    const QRect secondary(1920, 0, 1280, 1024);
    const QImage mask = makeMask(QSize(3200, 1080), { primary, secondary });

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(mask);
    QCOMPARE(screens.size(), 2);
    QCOMPARE(screens.at(0).rect(), primary);
    QCOMPARE(screens.at(1).rect(), secondary);

    // Column 1920 belongs to the second screen only
    QVERIFY(!screens.at(0).rect().intersects(screens.at(1).rect()));
    QCOMPARE(screens.at(0).rect().right() + 1, screens.at(1).x());
    QCOMPARE(screens.at(0).width() * screens.at(0).height() + screens.at(1).width() * screens.at(1).height(),
             1920 * 1080 + 1280 * 1024);
}

// Test that side-by-side screens of equal height come back as one screen
void tst_qvncscreendetector::equalHeightAdjacentScreens()
{
    const QImage mask = makeMask(QSize(1600, 600), { QRect(0, 0, 800, 600), QRect(800, 0, 800, 600) });

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(mask);
    QCOMPARE(screens.size(), 1);
    QCOMPARE(screens.at(0).rect(), QRect(0, 0, 1600, 600));
}

void tst_qvncscreendetector::emptyMask()
{
    QVERIFY(QVncScreenDetector::detectScreens(makeMask(QSize(64, 48), {})).isEmpty());
    QVERIFY(QVncScreenDetector::detectScreens(QImage()).isEmpty());
}

// Test that pixels below full alpha do not count as written
void tst_qvncscreendetector::partiallyWrittenPixels()
{
    QImage mask = makeMask(QSize(160, 90), { QRect(0, 0, 160, 90) });
    mask.scanLine(45)[80] = 0xfe;

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(mask);
    for (const QVncScreen &screen : screens)
        QVERIFY(!screen.rect().contains(80, 45));
}

// Test that images in other formats are judged by their alpha channel
void tst_qvncscreendetector::argbMask()
{
    QImage image(160, 90, QImage::Format_ARGB32);
    image.fill(qRgba(12, 34, 56, 255));

    const QList<QVncScreen> screens = QVncScreenDetector::detectScreens(image);
    QCOMPARE(screens.size(), 1);
    QCOMPARE(screens.first(), QVncScreen(0, 0, 160, 90));
    QCOMPARE(screens.first().score(), 14400.0);
}

void tst_qvncscreendetector::maskNotModified()
{
    const QImage mask = makeMask(QSize(1800, 600), { QRect(0, 0, 800, 600), QRect(1000, 0, 800, 600) });
    const QImage copy = mask.copy();

    QCOMPARE(QVncScreenDetector::detectScreens(mask).size(), 2);
    QCOMPARE(mask, copy);
}

void tst_qvncscreendetector::crop()
{
    QImage image(40, 20, QImage::Format_RGBA8888);
    image.fill(Qt::red);
    image.setPixelColor(25, 5, Qt::blue);

    const QVncScreen screen(20, 0, 20, 20);
    const QImage cropped = screen.crop(image);
    QCOMPARE(cropped.size(), QSize(20, 20));
    QCOMPARE(cropped.pixelColor(5, 5), QColor(Qt::blue));
    QCOMPARE(cropped.pixelColor(0, 0), QColor(Qt::red));
}

QTEST_GUILESS_MAIN(tst_qvncscreendetector)
#include "tst_qvncscreendetector.moc"
