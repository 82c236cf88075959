#pragma once
#include <cstddef>

/* --------------------------------------------------------------------------
   Inbox between the host's input callbacks and the tick.
   Lane moves are edge-triggered: each press is applied by exactly one
   consume(). Boost is a level and stays as the host last set it.
---------------------------------------------------------------------------- */
class InputLatch {
public:
    void setMoveLeft()  { left_ = true; }
    void setMoveRight() { right_ = true; }
    void setBoost(bool active) { boost_ = active; }

    bool boost() const { return boost_; }
    bool leftPending()  const { return left_; }
    bool rightPending() const { return right_; }

    // Applies at most one pending move to `lane`, left first, clamped to
    // [0, laneCount-1]. Returns the new lane.
    std::size_t consume(std::size_t lane, std::size_t laneCount) {
        std::size_t last = laneCount ? laneCount - 1 : 0;
        if (lane > last) lane = last;
        if (left_) {
            if (lane > 0) --lane;
            left_ = false;
        } else if (right_) {
            if (lane < last) ++lane;
            right_ = false;
        }
        return lane;
    }

    void clearPending() { left_ = right_ = false; }

private:
    bool left_  = false;
    bool right_ = false;
    bool boost_ = false;
};
