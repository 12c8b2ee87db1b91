#pragma once

namespace vault {

// Continuous input written by the host's event handlers and read once per
// tick. Held directions are current state (last write wins); look deltas
// accumulate until the tick consumes them.
struct InputState {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;

    float lookDeltaX = 0.0f;
    float lookDeltaY = 0.0f;

    bool anyDirection() const { return forward || backward || left || right; }

    void addLook(float dx, float dy) {
        lookDeltaX += dx;
        lookDeltaY += dy;
    }

    void clearLook() {
        lookDeltaX = 0.0f;
        lookDeltaY = 0.0f;
    }

    void releaseAll() {
        forward = backward = left = right = false;
        clearLook();
    }
};

} // namespace vault
