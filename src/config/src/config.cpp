#include "config.hpp"

#include <format>

#include "utils.hpp"

namespace wcc::parse
{
    Result<spdlog::level::level_enum> parseLogLevel(const std::string & level)
    {
        const spdlog::level::level_enum parsed = spdlog::level::from_str(utils::toLower(level));

        // from_str maps unknown names to off
        if(parsed == spdlog::level::off && utils::toLower(level) != "off")
        {
            return std::unexpected(Error{Error::Kind::INVALID_VALUE, std::format("unknown log level '{}'", level)});
        }
        return parsed;
    }

    template<>
    Result<config::Config> parseFromJson(json config_json, use_json_t)
    {
        if(!config_json.is_object())
        {
            return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "configuration must be a JSON object"});
        }

        config::Config cfg;

        if(config_json.contains("logs_path"))
        {
            const auto path_res = parseString(config_json.at("logs_path"), "logs_path");
            if(!path_res) return std::unexpected(path_res.error());
            cfg.logs_path = *path_res;
        }

        if(config_json.contains("log_to_file"))
        {
            if(!config_json.at("log_to_file").is_boolean())
            {
                return std::unexpected(Error{Error::Kind::TYPE_MISMATCH, "'log_to_file' must be a bool"});
            }
            cfg.log_to_file = config_json.at("log_to_file").get<bool>();
        }

        if(config_json.contains("console_log_level"))
        {
            const auto level_str = parseString(config_json.at("console_log_level"), "console_log_level");
            if(!level_str) return std::unexpected(level_str.error());
            const auto level_res = parseLogLevel(*level_str);
            if(!level_res) return std::unexpected(level_res.error());
            cfg.console_log_level = *level_res;
        }

        if(config_json.contains("file_log_level"))
        {
            const auto level_str = parseString(config_json.at("file_log_level"), "file_log_level");
            if(!level_str) return std::unexpected(level_str.error());
            const auto level_res = parseLogLevel(*level_str);
            if(!level_res) return std::unexpected(level_res.error());
            cfg.file_log_level = *level_res;
        }

        if(config_json.contains("gas_price"))
        {
            const json & gas_price = config_json.at("gas_price");
            if(gas_price.is_number_unsigned())
            {
                cfg.gas_price = gas_price.get<std::uint64_t>();
            }
            else
            {
                const auto gas_price_str = parseString(gas_price, "gas_price");
                if(!gas_price_str) return std::unexpected(gas_price_str.error());
                const auto gas_price_res = parseInteger(*gas_price_str);
                if(!gas_price_res) return std::unexpected(gas_price_res.error());
                if(*gas_price_res < 0)
                {
                    return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, "'gas_price' must not be negative"});
                }
                cfg.gas_price = *gas_price_res;
            }
        }

        if(config_json.contains("default_decimals"))
        {
            const json & decimals = config_json.at("default_decimals");
            if(!decimals.is_number_unsigned() || decimals.get<std::uint64_t>() > 77)
            {
                return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, "'default_decimals' must be an integer in [0, 77]"});
            }
            cfg.default_decimals = decimals.get<unsigned int>();
        }

        if(config_json.contains("mailbox_capacity"))
        {
            const json & capacity = config_json.at("mailbox_capacity");
            if(!capacity.is_number_unsigned() || capacity.get<std::uint64_t>() == 0)
            {
                return std::unexpected(Error{Error::Kind::OUT_OF_RANGE, "'mailbox_capacity' must be a positive integer"});
            }
            cfg.mailbox_capacity = capacity.get<std::size_t>();
        }

        return cfg;
    }

    template<>
    Result<json> parseToJson(config::Config config, use_json_t)
    {
        json json_obj = json::object();
        json_obj["logs_path"] = config.logs_path.string();
        json_obj["log_to_file"] = config.log_to_file;
        json_obj["console_log_level"] = std::string(spdlog::level::to_string_view(config.console_log_level).data(),
            spdlog::level::to_string_view(config.console_log_level).size());
        json_obj["file_log_level"] = std::string(spdlog::level::to_string_view(config.file_log_level).data(),
            spdlog::level::to_string_view(config.file_log_level).size());
        json_obj["gas_price"] = config.gas_price.str();
        json_obj["default_decimals"] = config.default_decimals;
        json_obj["mailbox_capacity"] = config.mailbox_capacity;
        return json_obj;
    }
}
