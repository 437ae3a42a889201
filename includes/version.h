#pragma once

#include <string>
#include <string_view>

#ifndef RLS_VERSION_MAJOR
#define RLS_VERSION_MAJOR 0
#endif

#ifndef RLS_VERSION_MINOR
#define RLS_VERSION_MINOR 0
#endif

#ifndef RLS_VERSION_PATCH
#define RLS_VERSION_PATCH 0
#endif

#ifndef RLS_VERSION_STRING
#define RLS_VERSION_STRING "0.0.0"
#endif

namespace rls {

class Version {
public:
    static constexpr int Major() noexcept { return RLS_VERSION_MAJOR; }
    static constexpr int Minor() noexcept { return RLS_VERSION_MINOR; }
    static constexpr int Patch() noexcept { return RLS_VERSION_PATCH; }

    static constexpr std::string_view String() noexcept { return std::string_view{RLS_VERSION_STRING}; }

    static std::string FullString()
    {
        return std::string{"rls "} + std::string{String()};
    }
};

}  // namespace rls
