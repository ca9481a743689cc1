#pragma once

#include <string>
#include <algorithm>
#include <cctype>

namespace wcc::utils
{
    /**
     * @brief Helper for building exhaustive std::visit visitors out of lambdas.
     */
    template<class... Ts>
    struct Overloaded : Ts...
    {
        using Ts::operator()...;
    };

    std::string currentTimestamp();

    bool equalsIgnoreCase(const std::string & a, const std::string & b);

    std::string toLower(std::string value);
}
