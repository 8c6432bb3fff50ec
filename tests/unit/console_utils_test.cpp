#include "ConsoleUtils.hpp"
#include "itemcrypt/security/SecureMemory.hpp"
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

#if defined(__linux__)
#include <sys/mman.h>
#endif

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

    ~StreamRedirector()
    {
        std::cin.rdbuf(oldCin);
        std::cout.rdbuf(oldCout);
    }
};

TEST(ConsoleUtilsTest, LockProcessMemoryIsSafeToCall)
{
    EXPECT_NO_THROW(itemcrypt::ui::cli::lockProcessMemory());

#if defined(__linux__)
    munlockall();
#endif
}

TEST(ConsoleUtilsTest, ReadPasswordConsumesInputAndPrintsPrompt)
{
    StreamRedirector redirect("secret123\n");

    std::string prompt = "Enter Password: ";

    auto result = itemcrypt::ui::cli::readPassword(prompt);

    EXPECT_EQ(itemcrypt::security::asStringView(result), "secret123");

    std::string expectedOutput = prompt + "\n";
    EXPECT_EQ(redirect.output.str(), expectedOutput);
}

TEST(ConsoleUtilsTest, ReadPasswordHandlesEmptyInput)
{
    StreamRedirector redirect("\n");

    auto result = itemcrypt::ui::cli::readPassword("Pass: ");

    EXPECT_TRUE(itemcrypt::security::asStringView(result).empty());
}

TEST(ConsoleUtilsTest, ReadPasswordStopsAtFirstLine)
{
    StreamRedirector redirect("first line\nsecond line\n");

    auto result = itemcrypt::ui::cli::readPassword("Pass: ");

    EXPECT_EQ(itemcrypt::security::asStringView(result), "first line");
}
