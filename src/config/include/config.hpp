#pragma once

#include <cstddef>
#include <filesystem>

#include <boost/multiprecision/cpp_int.hpp>
#include <spdlog/spdlog.h>

#include "parser.hpp"

namespace wcc::config
{
    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;

        bool log_to_file = false;
        spdlog::level::level_enum console_log_level = spdlog::level::info;
        spdlog::level::level_enum file_log_level = spdlog::level::debug;

        boost::multiprecision::cpp_int gas_price = 20'000'000'000ULL;
        unsigned int default_decimals = 18;
        std::size_t mailbox_capacity = 100;
    };
}

namespace wcc::parse
{
    /**
     * @brief Reads a configuration object. Missing keys keep their defaults,
     * a missing "logs_path" is left empty.
     */
    template<>
    Result<config::Config> parseFromJson(json json, use_json_t);

    template<>
    Result<json> parseToJson(config::Config config, use_json_t);

    Result<spdlog::level::level_enum> parseLogLevel(const std::string & level);
}
