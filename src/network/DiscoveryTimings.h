#pragma once

#include <QtGlobal>

// One time unit is one second in production. Tests shrink these.
struct DiscoveryTimings {
    int roomIntervalMs = 2000;
    int peerIntervalMs = 3000;
    int sweepIntervalMs = 1000;
    qint64 ttlMs = 6000;
};
