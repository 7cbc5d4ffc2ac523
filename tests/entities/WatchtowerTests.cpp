/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WatchtowerTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "entities/Watchtower.hpp"

struct WatchtowerFixture {
    WatchtowerFixture() {
        LOOKOUT_ENABLE_BENCHMARK_MODE();
        view.fieldOfView = 150.0f;
        view.panSpeed = 60.0f;
        view.aimHeight = 45.0f;
        view.crosshairSpeed = 40.0f;
        view.startAzimuth = 0.0f;
        bounds.width = 360.0f;
        bounds.height = 90.0f;
        bounds.wrapHorizontal = true;
    }
    ~WatchtowerFixture() {
        LOOKOUT_DISABLE_BENCHMARK_MODE();
    }

    Lookout::ViewConfig view{};
    Lookout::WorldBounds bounds{};
};

// ============================================================================
// PANNING TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(PanningTests, WatchtowerFixture)

BOOST_AUTO_TEST_CASE(TestStartsAtConfiguredAzimuth) {
    view.startAzimuth = 90.0f;
    Watchtower tower(view, bounds);
    BOOST_CHECK_EQUAL(tower.getAzimuth(), 90.0f);
    BOOST_CHECK(!tower.isInstrumentActive());
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getY(), 45.0f);
}

BOOST_AUTO_TEST_CASE(TestPanRightAndLeft) {
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.moveRight = true;
    tower.applyInput(input, 0.5f);
    BOOST_CHECK_CLOSE(tower.getAzimuth(), 30.0f, 0.001f);

    input.moveRight = false;
    input.moveLeft = true;
    tower.applyInput(input, 0.25f);
    BOOST_CHECK_CLOSE(tower.getAzimuth(), 15.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestOpposingKeysCancel) {
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.moveLeft = true;
    input.moveRight = true;
    tower.applyInput(input, 1.0f);
    BOOST_CHECK_EQUAL(tower.getAzimuth(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestPanWrapsBothWays) {
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.moveLeft = true;
    tower.applyInput(input, 0.5f);
    BOOST_CHECK_CLOSE(tower.getAzimuth(), 330.0f, 0.001f);

    input.moveLeft = false;
    input.moveRight = true;
    tower.applyInput(input, 1.0f);
    BOOST_CHECK_CLOSE(tower.getAzimuth(), 30.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestAzimuthAlwaysInRange) {
    Watchtower tower(view, bounds);
    tower.setAzimuth(720.0f);
    BOOST_CHECK_EQUAL(tower.getAzimuth(), 0.0f);
    tower.setAzimuth(-0.0001f);
    BOOST_CHECK_GE(tower.getAzimuth(), 0.0f);
    BOOST_CHECK_LT(tower.getAzimuth(), 360.0f);
}

BOOST_AUTO_TEST_CASE(TestNonWrappingWorldClamps) {
    bounds.wrapHorizontal = false;
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.moveLeft = true;
    tower.applyInput(input, 1.0f);
    BOOST_CHECK_EQUAL(tower.getAzimuth(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// INSTRUMENT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(InstrumentTests, WatchtowerFixture)

BOOST_AUTO_TEST_CASE(TestToggleFlipsInstrument) {
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.toggleInstrument = true;

    tower.applyInput(input, 0.016f);
    BOOST_CHECK(tower.isInstrumentActive());
    BOOST_CHECK(tower.getAimState().instrumentActive);

    tower.applyInput(input, 0.016f);
    BOOST_CHECK(!tower.isInstrumentActive());
}

BOOST_AUTO_TEST_CASE(TestAimIgnoredWhileLowered) {
    Watchtower tower(view, bounds);
    LookoutInput input;
    input.aimRight = true;
    tower.applyInput(input, 1.0f);
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getX(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestAimMovesCrosshairWhileRaised) {
    Watchtower tower(view, bounds);
    tower.setInstrumentActive(true);

    LookoutInput input;
    input.aimRight = true;
    input.aimUp = true;
    tower.applyInput(input, 0.5f);

    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getX(), 20.0f, 0.001f);
    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getY(), 25.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPointerAimsWhileRaised) {
    Watchtower tower(view, bounds);
    tower.setAzimuth(100.0f);
    tower.setInstrumentActive(true);

    LookoutInput input;
    input.pointerMoved = true;
    input.pointerX = 0.75f;
    input.pointerY = 0.25f;
    tower.applyInput(input, 0.0f);

    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getX(), 37.5f, 0.001f);
    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getY(), 22.5f, 0.001f);
    BOOST_CHECK_CLOSE(tower.getCrosshairAzimuth(), 137.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestPointerIgnoredWhileLowered) {
    Watchtower tower(view, bounds);

    LookoutInput input;
    input.pointerMoved = true;
    input.pointerX = 0.0f;
    input.pointerY = 1.0f;
    tower.applyInput(input, 0.1f);

    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getX(), 0.0f);
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getY(), 45.0f);
}

BOOST_AUTO_TEST_CASE(TestPointerThenNudgeInSameStep) {
    Watchtower tower(view, bounds);
    tower.setInstrumentActive(true);

    LookoutInput input;
    input.pointerMoved = true;
    input.pointerX = 0.5f;
    input.pointerY = 0.5f;
    input.aimRight = true;
    tower.applyInput(input, 0.25f);

    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getX(), 10.0f, 0.001f);
    BOOST_CHECK_CLOSE(tower.getCrosshairOffset().getY(), 45.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestCrosshairClampedToFieldOfView) {
    Watchtower tower(view, bounds);
    tower.setCrosshairOffset(Vector2D(500.0f, 500.0f));
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getX(), 75.0f);
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getY(), 90.0f);

    tower.setCrosshairOffset(Vector2D(-500.0f, -5.0f));
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getX(), -75.0f);
    BOOST_CHECK_EQUAL(tower.getCrosshairOffset().getY(), 0.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// READOUT TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(ReadoutTests, WatchtowerFixture)

BOOST_AUTO_TEST_CASE(TestAimStateInWorldSpace) {
    Watchtower tower(view, bounds);
    tower.setAzimuth(350.0f);
    tower.setCrosshairOffset(Vector2D(20.0f, 30.0f));
    tower.setInstrumentActive(true);

    AimState aim = tower.getAimState();
    BOOST_CHECK_CLOSE(aim.crosshairPosition.getX(), 10.0f, 0.001f);
    BOOST_CHECK_EQUAL(aim.crosshairPosition.getY(), 30.0f);
    BOOST_CHECK(aim.instrumentActive);
}

BOOST_AUTO_TEST_CASE(TestDeclinationMeasuredFromHorizon) {
    Watchtower tower(view, bounds);
    tower.setCrosshairOffset(Vector2D(0.0f, 45.0f));
    BOOST_CHECK_EQUAL(tower.getCrosshairDeclination(), 0.0f);

    tower.setCrosshairOffset(Vector2D(0.0f, 15.0f));
    BOOST_CHECK_EQUAL(tower.getCrosshairDeclination(), 30.0f);

    tower.setCrosshairOffset(Vector2D(0.0f, 60.0f));
    BOOST_CHECK_EQUAL(tower.getCrosshairDeclination(), -15.0f);
}

BOOST_AUTO_TEST_SUITE_END()
