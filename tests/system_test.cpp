#include <pathwright/system.hpp>

#include <gtest/gtest.h>

#include <system_error>

using namespace pathwright;

TEST(system, current_platform_profile)
{
#ifdef _WIN32
    EXPECT_EQ(system::current_platform_profile(), platform_profile::windows);
#else
    EXPECT_EQ(system::current_platform_profile(), platform_profile::posix);
#endif
}

TEST(system, max_filename_length_of_working_directory)
{
    std::error_code error;
    const int n = system::max_filename_length(".", error);
    EXPECT_FALSE(error) << error.message();
    EXPECT_GT(n, 0);
    EXPECT_EQ(system::max_filename_length(), n);
}

#ifndef _WIN32
TEST(system, max_filename_length_of_missing_directory_sets_error)
{
    std::error_code error;
    const int n = system::max_filename_length("/this/path/does/not/exist", error);
    EXPECT_TRUE(error);
    EXPECT_EQ(error, std::errc::no_such_file_or_directory);
    EXPECT_EQ(n, system::default_max_filename_length);
}
#endif // _WIN32

TEST(system, separators)
{
    EXPECT_EQ(separator(platform_profile::posix), '/');
    EXPECT_EQ(separator(platform_profile::windows), '\\');
    EXPECT_TRUE(is_separator('/', platform_profile::windows));
    EXPECT_TRUE(is_separator('\\', platform_profile::windows));
    EXPECT_FALSE(is_separator('\\', platform_profile::posix));
}
