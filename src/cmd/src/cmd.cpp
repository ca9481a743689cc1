#include "cmd.hpp"

#include <algorithm>
#include <charconv>
#include <format>

#include <spdlog/spdlog.h>

namespace wcc::cmd
{
    namespace
    {
        bool _isOption(const std::string & token)
        {
            // "-5" is a value, not an option
            if(token.size() < 2 || token[0] != '-')
            {
                return false;
            }
            return !(token[1] >= '0' && token[1] <= '9');
        }

        bool _isInt(const std::string & token)
        {
            int value = 0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            return ec == std::errc{} && ptr == token.data() + token.size();
        }
    }

    void ArgParser::addArg(std::string name, CommandLineArgDef::NArgs nargs, CommandLineArgDef::Type type, std::string description)
    {
        _defs.push_back(CommandLineArgDef{std::move(name), nargs, type, std::move(description)});
    }

    bool ArgParser::parse(int argc, char* argv[])
    {
        _values.clear();

        bool ok = true;
        for(int i = 1; i < argc; ++i)
        {
            const std::string token = argv[i];

            const auto def = std::ranges::find(_defs, token, &CommandLineArgDef::name);
            if(def == _defs.end())
            {
                spdlog::error("Unknown argument: {}", token);
                ok = false;
                continue;
            }

            std::vector<std::string> values;
            while(def->nargs != CommandLineArgDef::NArgs::Zero && i + 1 < argc && !_isOption(argv[i + 1]))
            {
                values.emplace_back(argv[++i]);
                if(def->nargs == CommandLineArgDef::NArgs::One)
                {
                    break;
                }
            }

            if(def->nargs != CommandLineArgDef::NArgs::Zero && values.empty())
            {
                spdlog::error("Argument {} expects a value", token);
                ok = false;
                continue;
            }

            if(def->type == CommandLineArgDef::Type::Int && !std::ranges::all_of(values, _isInt))
            {
                spdlog::error("Argument {} expects an integer value", token);
                ok = false;
                continue;
            }

            _values[token] = std::move(values);
        }

        return ok;
    }

    template<>
    std::optional<bool> ArgParser::getArg<bool>(const std::string & name) const
    {
        if(!_values.contains(name))
        {
            return std::nullopt;
        }
        return true;
    }

    template<>
    std::optional<std::vector<int>> ArgParser::getArg<std::vector<int>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }

        std::vector<int> out;
        out.reserve(it->second.size());
        for(const auto & value : it->second)
        {
            int parsed = 0;
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if(ec != std::errc{})
            {
                return std::nullopt;
            }
            out.push_back(parsed);
        }
        return out;
    }

    template<>
    std::optional<std::vector<std::string>> ArgParser::getArg<std::vector<std::string>>(const std::string & name) const
    {
        const auto it = _values.find(name);
        if(it == _values.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string ArgParser::constructHelpMessage() const
    {
        std::size_t width = 0;
        for(const auto & def : _defs)
        {
            width = std::max(width, def.name.size());
        }

        std::string message = "Options:\n";
        for(const auto & def : _defs)
        {
            std::string value_hint;
            switch(def.nargs)
            {
                case CommandLineArgDef::NArgs::Zero : break;
                case CommandLineArgDef::NArgs::One : value_hint = def.type == CommandLineArgDef::Type::Int ? "<int>" : "<value>"; break;
                case CommandLineArgDef::NArgs::Many : value_hint = "<values...>"; break;
            }

            message += std::format("  {:<{}} {:<12} {}\n", def.name, width, value_hint, def.description);
        }
        return message;
    }
}
