/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_EDGE_DETECTOR_HPP
#define INPUT_EDGE_DETECTOR_HPP

#include "core/LookoutInput.hpp"

/**
 * InputEdgeDetector turns polled held-key state into discrete events by
 * comparing the current frame against the previous one.
 *
 * Call update() exactly once per frame with the held state for that frame.
 * A key held across many frames reports wasPressed() only on the first.
 */
class InputEdgeDetector {
public:
    void update(const HeldActions& held);

    bool isHeld(LookoutAction action) const;
    bool wasPressed(LookoutAction action) const;
    bool wasReleased(LookoutAction action) const;

    /**
     * Build the simulation input for the current frame
     * @return held movement/aim flags plus edge-triggered toggle/report
     */
    LookoutInput buildInput() const;

    // Forget all state (focus loss, state change)
    void reset();

private:
    HeldActions m_previous{};
    HeldActions m_current{};
};

#endif // INPUT_EDGE_DETECTOR_HPP
