#include "negotiation/MediaEngine.h"

QString mediaConnectionStateName(MediaConnectionState state) {
    switch (state) {
        case MediaConnectionState::New:          return "new";
        case MediaConnectionState::Connecting:   return "connecting";
        case MediaConnectionState::Connected:    return "connected";
        case MediaConnectionState::Disconnected: return "disconnected";
        case MediaConnectionState::Failed:       return "failed";
        case MediaConnectionState::Closed:       return "closed";
    }
    return QString();
}

bool isTerminalMediaState(MediaConnectionState state) {
    return state == MediaConnectionState::Failed || state == MediaConnectionState::Closed;
}
