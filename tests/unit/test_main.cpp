#include <gtest/gtest.h>
#include <CircFit/CircFit.h>

#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "CircFit Unit Tests\n";
    std::cout << "Version: " << Circ::Fit::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
