// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qvncscreendetector.h"

#include <QtCore/QHash>
#include <QtCore/QSet>

#include <algorithm>
#include <numeric>
#include <utility>

QT_BEGIN_NAMESPACE

namespace {

struct Fraction {
    qint64 numerator;
    qint64 denominator;

    double toDouble() const { return double(numerator) / double(denominator); }
    bool operator==(const Fraction &other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
};

Fraction reduced(qint64 numerator, qint64 denominator)
{
    const qint64 divisor = std::gcd(numerator, denominator);
    return { numerator / divisor, denominator / divisor };
}

// Closest fraction to numerator / denominator with a denominator of at most maxDenominator
Fraction limitDenominator(qint64 numerator, qint64 denominator, qint64 maxDenominator)
{
    const Fraction exact = reduced(numerator, denominator);
    if (exact.denominator <= maxDenominator)
        return exact;

    // Walk the continued fraction expansion until the next convergent is too fine
    qint64 p0 = 0, q0 = 1, p1 = 1, q1 = 0;
    qint64 n = exact.numerator, d = exact.denominator;
    while (true) {
        const qint64 a = n / d;
        const qint64 q2 = q0 + a * q1;
        if (q2 > maxDenominator)
            break;
        const qint64 p2 = p0 + a * p1;
        p0 = p1;
        q0 = q1;
        p1 = p2;
        q1 = q2;
        const qint64 remainder = n - a * d;
        n = d;
        d = remainder;
    }

    const qint64 k = (maxDenominator - q0) / q1;
    const Fraction semiconvergent = reduced(p0 + k * p1, q0 + k * q1);
    const Fraction convergent = reduced(p1, q1);

    const auto distance = [&exact](const Fraction &f) {
        return qAbs(f.numerator * exact.denominator - exact.numerator * f.denominator);
    };
    // Compare |f - exact| of both bounds without leaving integer arithmetic
    if (distance(convergent) * semiconvergent.denominator
            <= distance(semiconvergent) * convergent.denominator)
        return convergent;
    return semiconvergent;
}

// 3:2, 4:3, 16:10, 16:9, 32:9 and 64:27, reduced
const Fraction screenRatios[] = {
    { 3, 2 }, { 4, 3 }, { 8, 5 }, { 16, 9 }, { 32, 9 }, { 64, 27 },
};

bool isScreenRatio(const Fraction &ratio)
{
    return std::find(std::begin(screenRatios), std::end(screenRatios), ratio) != std::end(screenRatios);
}

struct Corner {
    int row;
    int column;
};

struct Edges {
    int x0;
    int y0;
    int x1;
    int y1;

    bool operator==(const Edges &other) const {
        return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 && y1 == other.y1;
    }
};

size_t qHash(const Edges &edges, size_t seed = 0)
{
    return qHashMulti(seed, edges.x0, edges.y0, edges.x1, edges.y1);
}

/*
    Binary occupancy mask: 1 where the alpha byte is 255, 0 elsewhere.
    Reads outside the mask return 0, which stands in for the zero padding.
*/
class Mask
{
public:
    explicit Mask(const QImage &image)
        : m_width(image.width())
        , m_height(image.height())
        , m_cells(qsizetype(m_width) * m_height, 0)
    {
        if (image.format() == QImage::Format_Alpha8) {
            for (int y = 0; y < m_height; y++) {
                const uchar *line = image.constScanLine(y);
                for (int x = 0; x < m_width; x++)
                    m_cells[index(y, x)] = line[x] / 255;
            }
        } else {
            const QImage argb = image.convertToFormat(QImage::Format_ARGB32);
            for (int y = 0; y < m_height; y++) {
                const QRgb *line = reinterpret_cast<const QRgb *>(argb.constScanLine(y));
                for (int x = 0; x < m_width; x++)
                    m_cells[index(y, x)] = qAlpha(line[x]) / 255;
            }
        }
    }

    int width() const { return m_width; }
    int height() const { return m_height; }

    int at(int row, int column) const
    {
        if (row < 0 || column < 0 || row >= m_height || column >= m_width)
            return 0;
        return m_cells[index(row, column)];
    }

    bool isFilled(const QRect &rect) const
    {
        for (int y = rect.top(); y <= rect.bottom(); y++) {
            for (int x = rect.left(); x <= rect.right(); x++) {
                if (!m_cells[index(y, x)])
                    return false;
            }
        }
        return true;
    }

    void clear(const QRect &rect)
    {
        for (int y = rect.top(); y <= rect.bottom(); y++)
            std::fill_n(m_cells.begin() + index(y, rect.left()), rect.width(), qint8(0));
    }

private:
    qsizetype index(int row, int column) const { return qsizetype(row) * m_width + column; }

    int m_width;
    int m_height;
    QList<qint8> m_cells;
};

/*
    Candidate rectangles from the corners of the filled regions of mask.

    Corners live on the lattice between cells. At lattice point (i, j) the
    2x2 neighbourhood is a = M[i][j], b = M[i][j-1], c = M[i-1][j] and
    d = M[i-1][j-1]; a corner is where both perpendicular differences step
    from 0 to 1 into the region.
*/
QList<QVncScreen> findCandidates(const Mask &mask)
{
    QList<Corner> topLeft, topRight, bottomLeft, bottomRight;
    for (int i = 0; i <= mask.height(); i++) {
        for (int j = 0; j <= mask.width(); j++) {
            const int a = mask.at(i, j);
            const int b = mask.at(i, j - 1);
            const int c = mask.at(i - 1, j);
            const int d = mask.at(i - 1, j - 1);
            if (b - a == -1 && c - a == -1)
                topLeft.append({ i, j });
            if (a - b == -1 && d - b == -1)
                topRight.append({ i, j });
            if (d - c == -1 && a - c == -1)
                bottomLeft.append({ i, j });
            if (c - d == -1 && b - d == -1)
                bottomRight.append({ i, j });
        }
    }

    // Any three aligned corners pin down a rectangle, so one missing corner is tolerated
    QSet<Edges> edges;
    for (const Corner &a : std::as_const(topLeft)) {
        for (const Corner &b : std::as_const(topRight)) {
            const bool top = a.row == b.row && a.column < b.column;
            for (const Corner &c : std::as_const(bottomLeft)) {
                const bool left = a.column == c.column && a.row < c.row;
                for (const Corner &d : std::as_const(bottomRight)) {
                    const bool bottom = c.row == d.row && c.column < d.column;
                    const bool right = b.column == d.column && b.row < d.row;
                    if (top && left)
                        edges.insert({ a.column, a.row, b.column, c.row });
                    if (top && right)
                        edges.insert({ a.column, a.row, d.column, d.row });
                    if (bottom && left)
                        edges.insert({ a.column, a.row, d.column, d.row });
                    if (bottom && right)
                        edges.insert({ c.column, b.row, d.column, d.row });
                }
            }
        }
    }

    QList<QVncScreen> candidates;
    candidates.reserve(edges.size());
    for (const Edges &e : std::as_const(edges))
        candidates.append(QVncScreen(e.x0, e.y0, e.x1 - e.x0, e.y1 - e.y0));
    return candidates;
}

} // namespace

/*!
    \class QVncScreen
    \inmodule QtVncCapture

    \brief The QVncScreen class describes a rectangle of the framebuffer that
    is believed to show one physical monitor.
*/

/*!
    Returns a measure of confidence that this rectangle is a real screen.

    For the common aspect ratios 3:2, 4:3, 16:10, 16:9, 32:9 and 64:27 the
    score is the pixel area. Otherwise the area is further multiplied by half
    the aspect ratio or its reciprocal, whichever is smaller. Both ratios are
    approximated by the nearest fraction with a denominator of at most 64.
*/
double QVncScreen::score() const
{
    if (m_width <= 0 || m_height <= 0)
        return 0.0;

    double value = double(m_width) * double(m_height);
    const Fraction wide = limitDenominator(m_width, m_height, 64);
    const Fraction tall = limitDenominator(m_height, m_width, 64);
    if (!isScreenRatio(wide) && !isScreenRatio(tall))
        value *= std::min(wide.toDouble(), tall.toDouble()) * 0.5;
    return value;
}

#ifndef QT_NO_DEBUG_STREAM
QDebug operator<<(QDebug debug, const QVncScreen &screen)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "QVncScreen(" << screen.x() << ',' << screen.y() << ' '
                    << screen.width() << 'x' << screen.height() << ", score=" << screen.score() << ')';
    return debug;
}
#endif

/*!
    \class QVncScreenDetector
    \inmodule QtVncCapture

    \brief The QVncScreenDetector class recovers screen rectangles from the
    written-pixel mask of a framebuffer.
*/

/*!
    Detects the screens in \a alphaMask, in which a pixel counts as filled
    when its alpha value is 255. Format_Alpha8 images are used directly, any
    other format is converted and its alpha channel used.

    Each round finds the corners of the filled regions of a working copy of
    the mask, builds every rectangle that three aligned corners define and
    accepts the best scored one that is entirely filled. The accepted area is
    cleared from the working copy before the next round, so nested or
    overlapping rectangles are not reported twice. Detection stops when no
    candidate is entirely filled.

    Returns the screens in the order they were accepted; a mask without any
    filled region gives an empty list. \a alphaMask itself is not modified.

    \sa QVncFramebuffer::alphaMask()
*/
QList<QVncScreen> QVncScreenDetector::detectScreens(const QImage &alphaMask)
{
    QList<QVncScreen> screens;
    if (alphaMask.isNull())
        return screens;

    Mask mask(alphaMask);
    while (true) {
        QList<QVncScreen> candidates = findCandidates(mask);
        std::sort(candidates.begin(), candidates.end(), [](const QVncScreen &lhs, const QVncScreen &rhs) {
            const double lhsScore = lhs.score();
            const double rhsScore = rhs.score();
            if (lhsScore != rhsScore)
                return lhsScore > rhsScore;
            if (lhs.y() != rhs.y())
                return lhs.y() < rhs.y();
            if (lhs.x() != rhs.x())
                return lhs.x() < rhs.x();
            if (lhs.width() != rhs.width())
                return lhs.width() < rhs.width();
            return lhs.height() < rhs.height();
        });

        const auto accepted = std::find_if(candidates.cbegin(), candidates.cend(), [&mask](const QVncScreen &screen) {
            return mask.isFilled(screen.rect());
        });
        if (accepted == candidates.cend())
            break;

        qCDebug(lcVncCapture) << "Detected" << *accepted << "among" << candidates.size() << "candidates";
        mask.clear(accepted->rect());
        screens.append(*accepted);
    }
    return screens;
}

QT_END_NAMESPACE
