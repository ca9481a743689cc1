#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

namespace wcc::cmd
{
    struct CommandLineArgDef
    {
        enum class NArgs : std::uint8_t
        {
            Zero = 0,
            One,
            Many
        };

        enum class Type : std::uint8_t
        {
            Bool = 0,
            Int,
            String
        };

        std::string name;
        NArgs nargs = NArgs::Zero;
        Type type = Type::Bool;
        std::string description;
    };

    class ArgParser
    {
        public:
            ArgParser() = default;

            ArgParser(const ArgParser&) = delete;
            ArgParser& operator=(const ArgParser&) = delete;

            ~ArgParser() = default;

            void addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description);

            /**
             * @brief Parses argv[1..argc). Returns false on unknown options, missing values
             * or values of the wrong type. Problems are logged.
             */
            bool parse(int argc, char* argv[]);

            /**
             * @brief Supported T: bool, std::vector<int>, std::vector<std::string>.
             * Returns std::nullopt when the option was not given.
             */
            template<class T>
            std::optional<T> getArg(const std::string & name) const;

            std::string constructHelpMessage() const;

        private:
            std::vector<CommandLineArgDef> _defs;
            absl::flat_hash_map<std::string, std::vector<std::string>> _values;
    };

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const;

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const;

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const;
}
