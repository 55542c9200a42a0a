#include "models/PeerLink.h"

QString negotiationStateName(NegotiationState state) {
    switch (state) {
        case NegotiationState::Idle:          return "Idle";
        case NegotiationState::OfferSent:     return "OfferSent";
        case NegotiationState::AnswerPending: return "AnswerPending";
        case NegotiationState::Connected:     return "Connected";
        case NegotiationState::Closed:        return "Closed";
    }
    return "Unknown";
}
