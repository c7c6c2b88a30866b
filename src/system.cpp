#include "system.hpp"

#include <cerrno>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif // WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif // NOMINMAX
#include <windows.h>
#else // _WIN32
#include <unistd.h>
#endif // _WIN32

namespace pathwright {
namespace system {

std::error_code last_error() noexcept
{
    std::error_code error;
#ifdef _WIN32
    error.assign(GetLastError(), std::system_category());
#else
    error.assign(errno, std::system_category());
#endif
    return error;
}

int max_filename_length(const path& dir, std::error_code& error)
{
    error.clear();
#ifdef _WIN32
    wchar_t volume[MAX_PATH + 1];
    if(GetVolumePathNameW(dir.wstring().c_str(), volume, MAX_PATH + 1) == 0) {
        error = last_error();
        return default_max_filename_length;
    }
    DWORD max_component_length = 0;
    if(GetVolumeInformationW(volume, nullptr, 0, nullptr, &max_component_length,
               nullptr, nullptr, 0)
            == 0) {
        error = last_error();
        return default_max_filename_length;
    }
    return static_cast<int>(max_component_length);
#else // _WIN32
    errno = 0;
    const auto n = ::pathconf(dir.c_str(), _PC_NAME_MAX);
    if(n == -1) {
        // pathconf returns -1 without touching errno if there is no limit, in
        // which case the conventional limit is as good as any.
        if(errno != 0) {
            error = last_error();
        }
        return default_max_filename_length;
    }
    return static_cast<int>(n);
#endif // _WIN32
}

int max_filename_length()
{
    std::error_code error;
    return max_filename_length(".", error);
}

platform_profile current_platform_profile() noexcept
{
#ifdef _WIN32
    return platform_profile::windows;
#else
    return platform_profile::posix;
#endif
}

} // namespace system
} // namespace pathwright
