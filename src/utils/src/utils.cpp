#include "utils.hpp"

#include <chrono>
#include <format>

namespace wcc::utils
{
    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    bool equalsIgnoreCase(const std::string & a, const std::string & b)
    {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](char lhs, char rhs) {
                return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
            });
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}
