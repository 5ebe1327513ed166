#include <gtest/gtest.h>

#include <csignal>

#include "coedit/logging.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Suppress logs during tests unless explicitly needed
    coedit::Logger::getInstance()->set_level(coedit::LogLevel::ERROR);

    // Integration tests kill child processes whose pipes may still be written.
    std::signal(SIGPIPE, SIG_IGN);

    return RUN_ALL_TESTS();
}
