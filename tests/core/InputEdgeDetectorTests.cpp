/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE InputEdgeDetectorTests
#include <boost/test/unit_test.hpp>

#include "core/InputEdgeDetector.hpp"
#include <initializer_list>

namespace {
HeldActions held(std::initializer_list<LookoutAction> actions) {
    HeldActions bits;
    for (LookoutAction action : actions) {
        bits.set(static_cast<size_t>(action));
    }
    return bits;
}
}

BOOST_AUTO_TEST_SUITE(EdgeDetectionTests)

BOOST_AUTO_TEST_CASE(TestPressReportedOnFirstFrameOnly) {
    InputEdgeDetector detector;

    detector.update(held({LookoutAction::Report}));
    BOOST_CHECK(detector.wasPressed(LookoutAction::Report));
    BOOST_CHECK(detector.isHeld(LookoutAction::Report));

    for (int frame = 0; frame < 10; ++frame) {
        detector.update(held({LookoutAction::Report}));
        BOOST_CHECK(!detector.wasPressed(LookoutAction::Report));
        BOOST_CHECK(detector.isHeld(LookoutAction::Report));
    }
}

BOOST_AUTO_TEST_CASE(TestRelease) {
    InputEdgeDetector detector;
    detector.update(held({LookoutAction::MoveLeft}));
    detector.update(held({}));

    BOOST_CHECK(detector.wasReleased(LookoutAction::MoveLeft));
    BOOST_CHECK(!detector.isHeld(LookoutAction::MoveLeft));

    detector.update(held({}));
    BOOST_CHECK(!detector.wasReleased(LookoutAction::MoveLeft));
}

BOOST_AUTO_TEST_CASE(TestRepressAfterRelease) {
    InputEdgeDetector detector;
    detector.update(held({LookoutAction::ToggleInstrument}));
    detector.update(held({}));
    detector.update(held({LookoutAction::ToggleInstrument}));
    BOOST_CHECK(detector.wasPressed(LookoutAction::ToggleInstrument));
}

BOOST_AUTO_TEST_CASE(TestResetForgetsHeldKeys) {
    InputEdgeDetector detector;
    detector.update(held({LookoutAction::Report}));
    detector.reset();
    BOOST_CHECK(!detector.isHeld(LookoutAction::Report));

    // Still down after a focus loss counts as a fresh press
    detector.update(held({LookoutAction::Report}));
    BOOST_CHECK(detector.wasPressed(LookoutAction::Report));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(BuildInputTests)

BOOST_AUTO_TEST_CASE(TestHeldFlagsAreLevelTriggered) {
    InputEdgeDetector detector;
    const HeldActions keys = held({LookoutAction::MoveRight, LookoutAction::AimUp,
                                   LookoutAction::AimLeft});
    detector.update(keys);
    detector.update(keys);

    LookoutInput input = detector.buildInput();
    BOOST_CHECK(input.moveRight);
    BOOST_CHECK(input.aimUp);
    BOOST_CHECK(input.aimLeft);
    BOOST_CHECK(!input.moveLeft);
    BOOST_CHECK(!input.aimRight);
    BOOST_CHECK(!input.aimDown);
}

BOOST_AUTO_TEST_CASE(TestActionFlagsAreEdgeTriggered) {
    InputEdgeDetector detector;
    const HeldActions keys = held({LookoutAction::ToggleInstrument, LookoutAction::Report,
                                   LookoutAction::CycleWeather});
    detector.update(keys);

    LookoutInput first = detector.buildInput();
    BOOST_CHECK(first.toggleInstrument);
    BOOST_CHECK(first.reportAction);
    BOOST_CHECK(first.cycleWeather);

    detector.update(keys);
    LookoutInput second = detector.buildInput();
    BOOST_CHECK(!second.toggleInstrument);
    BOOST_CHECK(!second.reportAction);
    BOOST_CHECK(!second.cycleWeather);
}

BOOST_AUTO_TEST_CASE(TestQuitNotForwarded) {
    InputEdgeDetector detector;
    detector.update(held({LookoutAction::Quit}));
    LookoutInput input = detector.buildInput();

    BOOST_CHECK(detector.wasPressed(LookoutAction::Quit));
    BOOST_CHECK(!input.reportAction);
    BOOST_CHECK(!input.toggleInstrument);
}

BOOST_AUTO_TEST_SUITE_END()
