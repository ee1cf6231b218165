// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#ifndef QVNCSCREENDETECTOR_H
#define QVNCSCREENDETECTOR_H

#include "qtvnccaptureglobal.h"
#include <QtCore/QList>
#include <QtCore/QRect>
#include <QtGui/QImage>

QT_BEGIN_NAMESPACE

class QVncScreen
{
    Q_GADGET
    Q_PROPERTY(int x READ x CONSTANT)
    Q_PROPERTY(int y READ y CONSTANT)
    Q_PROPERTY(int width READ width CONSTANT)
    Q_PROPERTY(int height READ height CONSTANT)
    Q_PROPERTY(double score READ score CONSTANT)
public:
    constexpr QVncScreen() = default;
    constexpr QVncScreen(int x, int y, int width, int height)
        : m_x(x), m_y(y), m_width(width), m_height(height) {}

    constexpr int x() const { return m_x; }
    constexpr int y() const { return m_y; }
    constexpr int width() const { return m_width; }
    constexpr int height() const { return m_height; }

    QRect rect() const { return QRect(m_x, m_y, m_width, m_height); }

    // Confidence that this is a physical screen
    double score() const;

    // The part of image covered by this screen
    QImage crop(const QImage &image) const { return image.copy(rect()); }

    friend constexpr bool operator==(const QVncScreen &lhs, const QVncScreen &rhs)
    {
        return lhs.m_x == rhs.m_x && lhs.m_y == rhs.m_y
                && lhs.m_width == rhs.m_width && lhs.m_height == rhs.m_height;
    }
    friend constexpr bool operator!=(const QVncScreen &lhs, const QVncScreen &rhs)
    {
        return !(lhs == rhs);
    }

private:
    int m_x = 0;
    int m_y = 0;
    int m_width = 0;
    int m_height = 0;
};

Q_DECLARE_TYPEINFO(QVncScreen, Q_PRIMITIVE_TYPE);

#ifndef QT_NO_DEBUG_STREAM
QDebug operator<<(QDebug debug, const QVncScreen &screen);
#endif

class QVncScreenDetector
{
public:
    static QList<QVncScreen> detectScreens(const QImage &alphaMask);
};

QT_END_NAMESPACE

#endif // QVNCSCREENDETECTOR_H
