#include "ConsoleUtils.hpp"
#include "kmslocal/security/SecureString.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include <string>

#if defined(__linux__)
#include <sys/mman.h>
#endif

namespace
{

// Swaps std::cin/std::cout for string streams for its lifetime.
struct StreamRedirector
{
    std::streambuf* oldCin;
    std::streambuf* oldCout;
    std::stringstream input;
    std::stringstream output;

    explicit StreamRedirector(const std::string& inputData) : oldCin(std::cin.rdbuf()), oldCout(std::cout.rdbuf())
    {
        input << inputData;
        std::cin.rdbuf(input.rdbuf());
        std::cout.rdbuf(output.rdbuf());
    }

    StreamRedirector(const StreamRedirector&) = delete;
    StreamRedirector& operator=(const StreamRedirector&) = delete;

    ~StreamRedirector()
    {
        std::cin.rdbuf(oldCin);
        std::cout.rdbuf(oldCout);
        std::cin.clear();
    }
};

} // namespace

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    kmslocal::ui::cli::lockProcessMemory();

#if defined(__linux__)
    munlockall();
#endif
}

TEST(ConsoleUtilsTest, ReadSecretConsumesOneLineAndPrintsPrompt)
{
    StreamRedirector redirect("00112233\nnext line\n");

    const std::string prompt = "Key (64 hex digits): ";
    auto result = kmslocal::ui::cli::readSecret(prompt);

    EXPECT_EQ(kmslocal::security::asStringView(result), "00112233");
    EXPECT_EQ(redirect.output.str(), prompt + "\n");

    std::string rest;
    std::getline(std::cin, rest);
    EXPECT_EQ(rest, "next line");
}

TEST(ConsoleUtilsTest, ReadSecretHandlesEmptyAndMissingInput)
{
    {
        StreamRedirector redirect("\n");
        EXPECT_TRUE(kmslocal::security::asStringView(kmslocal::ui::cli::readSecret("Key: ")).empty());
    }
    {
        StreamRedirector redirect("");
        EXPECT_TRUE(kmslocal::security::asStringView(kmslocal::ui::cli::readSecret("Key: ")).empty());
    }
}
