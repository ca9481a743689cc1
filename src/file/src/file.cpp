#include "file.hpp"

#include <format>
#include <fstream>
#include <iterator>

#include <spdlog/spdlog.h>

namespace wcc::file
{
    std::optional<std::string> loadTextFile(const std::filesystem::path & path)
    {
        if(std::filesystem::exists(path) == false)
        {
            spdlog::error("Cannot find file {}", path.string());
            return std::nullopt;
        }

        std::ifstream file(path, std::ios::in);
        if(file.good() == false)
        {
            spdlog::error("Failed to open file {}", path.string());
            return std::nullopt;
        }

        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }

    parse::Result<json> loadJsonFile(const std::filesystem::path & path)
    {
        const auto content = loadTextFile(path);
        if(!content)
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("cannot read {}", path.string())});
        }

        auto json_res = parse::parseJsonString(*content);
        if(!json_res)
        {
            spdlog::error("Malformed JSON in {}", path.string());
            return std::unexpected(parse::Error{json_res.error().kind, std::format("{}: {}", path.string(), json_res.error().message)});
        }
        return json_res;
    }
}
