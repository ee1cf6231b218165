// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qtvnccaptureglobal.h"

QT_BEGIN_NAMESPACE

// Define the logging category
Q_LOGGING_CATEGORY(lcVncCapture, "qt.vnccapture")

namespace QVnc {

int channelIndex(ChannelOrder order, char channel)
{
    static const char *const labels[] = { "bgra", "rgba", "argb", "abgr" };
    const char *label = labels[static_cast<int>(order)];
    for (int i = 0; i < 4; i++) {
        if (label[i] == channel)
            return i;
    }
    return -1;
}

} // namespace QVnc

QT_END_NAMESPACE
