// =============================================================================
// parz - Test Entry Point
// =============================================================================
// Workers and the collector log through the global logger, so it is set up
// once before any test runs.
// =============================================================================

#include <gtest/gtest.h>

#include "parz/common/logger.h"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    parz::log::init({.level = parz::log::Level::kWarning});
    const int result = RUN_ALL_TESTS();
    parz::log::shutdown();
    return result;
}
