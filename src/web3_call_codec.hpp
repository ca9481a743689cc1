#pragma once

#include <cstdio>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "utils.hpp"
#include "hex.hpp"
#include "cmd.hpp"
#include "config.hpp"
#include "file.hpp"
#include "crypto.hpp"
#include "abi.hpp"
#include "address.hpp"
#include "transaction.hpp"
#include "units.hpp"
#include "parser.hpp"
#include "value_json.hpp"
#include "events.hpp"
#include "event_monitor.hpp"
#include "erc20.hpp"
#include "erc721.hpp"

namespace wcc
{
    inline constexpr int MAJOR_VERSION = 0;
    inline constexpr int MINOR_VERSION = 3;
    inline constexpr int PATCH_VERSION = 0;
}
