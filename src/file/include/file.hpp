#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "parser.hpp"

namespace wcc::file
{
    std::optional<std::string> loadTextFile(const std::filesystem::path & path);

    /**
     * @brief Loads and parses a JSON document. A missing or unreadable file is INVALID_VALUE.
     */
    parse::Result<json> loadJsonFile(const std::filesystem::path & path);
}
