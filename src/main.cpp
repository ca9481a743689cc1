#include "web3_call_codec.hpp"

static void _configureLogger(const wcc::config::Config & cfg)
{
    std::vector<spdlog::sink_ptr> sinks;

    // console logs go to stderr, stdout carries command results
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(cfg.console_log_level);
    console_sink->set_pattern("[%T] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if(cfg.log_to_file)
    {
        std::filesystem::create_directories(cfg.logs_path);

        const std::string log_name = wcc::utils::currentTimestamp() + "-wcc.log";
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (cfg.logs_path / log_name).string(), true);
        file_sink->set_level(cfg.file_log_level);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
}

static void _print(const std::string & output)
{
    std::printf("%s\n", output.c_str());
    std::fflush(stdout);
}

static unsigned int _decimalsArg(const wcc::cmd::ArgParser & arg_parser, const wcc::config::Config & cfg)
{
    const int decimals = arg_parser.getArg<std::vector<int>>("--decimals")
        .value_or(std::vector<int>{static_cast<int>(cfg.default_decimals)}).at(0);
    return static_cast<unsigned int>(decimals);
}

static int _runSelector(const std::string & signature)
{
    const auto function_res = wcc::abi::parseSignature(signature);
    if(!function_res)
    {
        spdlog::error(std::format("{} : {}", function_res.error().kind, function_res.error().message));
        return 1;
    }

    spdlog::debug("Canonical signature: {}", function_res->signature());
    const auto selector = function_res->selector();
    _print(wcc::utils::toHex(selector.data(), selector.size(), true));
    return 0;
}

static int _runEncode(const std::string & signature, const std::string & args)
{
    const auto function_res = wcc::abi::parseSignature(signature);
    if(!function_res)
    {
        spdlog::error(std::format("{} : {}", function_res.error().kind, function_res.error().message));
        return 1;
    }

    const auto args_json = wcc::parse::parseJsonString(args);
    if(!args_json)
    {
        spdlog::error(std::format("{} : --args {}", args_json.error().kind, args_json.error().message));
        return 1;
    }

    const auto values_res = wcc::parse::parseValues(function_res->inputTypes(), *args_json);
    if(!values_res)
    {
        spdlog::error(std::format("{} : {}", values_res.error().kind, values_res.error().message));
        return 1;
    }

    const auto call_res = function_res->encode(*values_res);
    if(!call_res)
    {
        spdlog::error(std::format("{} : {}", call_res.error().kind, call_res.error().message));
        return 1;
    }

    spdlog::debug("Encoded {} : selector 0x{}, {} head words, {} tail bytes",
        function_res->signature(), call_res->selectorHex(), call_res->head.size(), call_res->tail.size());
    _print(call_res->hex());
    return 0;
}

static int _runDecode(const std::string & types, const std::string & data_hex)
{
    const auto types_res = wcc::abi::parseTypeList(types);
    if(!types_res)
    {
        spdlog::error(std::format("{} : {}", types_res.error().kind, types_res.error().message));
        return 1;
    }

    const auto data = wcc::utils::fromHex(data_hex);
    if(!data)
    {
        spdlog::error("Invalid hex in --data");
        return 1;
    }

    const auto values_res = wcc::abi::decodeResult(*types_res, *data);
    if(!values_res)
    {
        spdlog::error(std::format("{} : {}", values_res.error().kind, values_res.error().message));
        return 1;
    }

    json out = json::array();
    for(const auto & value : *values_res)
    {
        out.push_back(wcc::parse::valueToJson(value));
    }
    _print(out.dump());
    return 0;
}

static int _runDecodeCall(const std::string & signature, const std::string & data_hex)
{
    const auto function_res = wcc::abi::parseSignature(signature);
    if(!function_res)
    {
        spdlog::error(std::format("{} : {}", function_res.error().kind, function_res.error().message));
        return 1;
    }

    const auto calldata = wcc::utils::fromHex(data_hex);
    if(!calldata)
    {
        spdlog::error("Invalid hex in --data");
        return 1;
    }

    const auto values_res = wcc::abi::decodeCall(*function_res, *calldata);
    if(!values_res)
    {
        spdlog::error(std::format("{} : {}", values_res.error().kind, values_res.error().message));
        return 1;
    }

    json out = json::object();
    out["function"] = function_res->signature();
    out["args"] = json::array();
    for(const auto & value : *values_res)
    {
        out["args"].push_back(wcc::parse::valueToJson(value));
    }
    _print(out.dump());
    return 0;
}

static int _runParseUnits(const std::string & amount, unsigned int decimals)
{
    const auto value_res = wcc::units::parseUnits(amount, decimals);
    if(!value_res)
    {
        spdlog::error(std::format("{} : {}", value_res.error().kind, value_res.error().message));
        return 1;
    }

    _print(value_res->str());
    return 0;
}

static int _runFormatUnits(const std::string & amount, unsigned int decimals)
{
    const auto value_res = wcc::parse::parseInteger(amount);
    if(!value_res)
    {
        spdlog::error(std::format("{} : {}", value_res.error().kind, value_res.error().message));
        return 1;
    }

    _print(wcc::units::formatUnits(*value_res, decimals));
    return 0;
}

static int _runAddressOf(const std::string & private_key)
{
    const auto address_res = wcc::crypto::privateKeyToAddress(private_key);
    if(!address_res)
    {
        spdlog::error(std::format("{} : {}", address_res.error().kind, address_res.error().message));
        return 1;
    }

    _print(wcc::chain::addressToHex(*address_res));
    return 0;
}

static int _runGenerateKey()
{
    const auto key_res = wcc::crypto::generatePrivateKey();
    if(!key_res)
    {
        spdlog::error(std::format("{} : {}", key_res.error().kind, key_res.error().message));
        return 1;
    }

    const auto address_res = wcc::crypto::privateKeyToAddress(*key_res);
    if(!address_res)
    {
        spdlog::error(std::format("{} : {}", address_res.error().kind, address_res.error().message));
        return 1;
    }

    json out = json::object();
    out["private_key"] = wcc::utils::toHex(key_res->data(), key_res->size(), true);
    out["address"] = wcc::chain::addressToHex(*address_res);
    _print(out.dump(2));
    return 0;
}

static int _runEstimateGas(const wcc::cmd::ArgParser & arg_parser, const wcc::config::Config & cfg, const std::string & data_hex)
{
    wcc::chain::Wei value = 0;
    if(const auto value_arg = arg_parser.getArg<std::vector<std::string>>("--value"))
    {
        const auto value_res = wcc::parse::parseInteger(value_arg->at(0));
        if(!value_res)
        {
            spdlog::error(std::format("{} : --value {}", value_res.error().kind, value_res.error().message));
            return 1;
        }
        value = *value_res;
    }

    if(const auto to_arg = arg_parser.getArg<std::vector<std::string>>("--to"))
    {
        const auto data = wcc::utils::fromHex(data_hex);
        if(!data)
        {
            spdlog::error("Invalid hex call data");
            return 1;
        }

        auto transaction_res = wcc::chain::createTransaction(to_arg->at(0), value, *data);
        if(!transaction_res)
        {
            spdlog::error(std::format("{} : {}", transaction_res.error().kind, transaction_res.error().message));
            return 1;
        }
        transaction_res->gas_price = cfg.gas_price;

        const auto json_res = wcc::parse::parseToJson(*transaction_res, wcc::parse::use_json);
        if(!json_res)
        {
            spdlog::error(std::format("{} : {}", json_res.error().kind, json_res.error().message));
            return 1;
        }
        _print(json_res->dump(2));
        return 0;
    }

    const auto gas_res = wcc::chain::estimateGas(data_hex, value);
    if(!gas_res)
    {
        spdlog::error(std::format("{} : {}", gas_res.error().kind, gas_res.error().message));
        return 1;
    }

    const wcc::chain::Wei fee = wcc::chain::Wei(*gas_res) * cfg.gas_price;

    json out = json::object();
    out["gas"] = *gas_res;
    out["gas_price"] = cfg.gas_price.str();
    out["gas_price_gwei"] = wcc::units::formatUnits(cfg.gas_price, wcc::units::GWEI_DECIMALS);
    out["fee"] = fee.str();
    out["fee_ether"] = wcc::units::formatEther(fee, 6);
    _print(out.dump(2));
    return 0;
}

static wcc::parse::Result<std::vector<wcc::events::Event>> _loadLogs(const std::filesystem::path & path)
{
    const auto document = wcc::file::loadJsonFile(path);
    if(!document)
    {
        return std::unexpected(document.error());
    }

    if(document->is_object())
    {
        auto receipt_res = wcc::parse::parseFromJson<wcc::chain::TransactionReceipt>(*document, wcc::parse::use_json);
        if(!receipt_res)
        {
            return std::unexpected(receipt_res.error());
        }
        spdlog::debug("Loaded receipt {} with {} logs", wcc::utils::toHex(receipt_res->transaction_hash, true), receipt_res->logs.size());
        return std::move(receipt_res->logs);
    }

    if(!document->is_array())
    {
        return std::unexpected(wcc::parse::Error{wcc::parse::Error::Kind::TYPE_MISMATCH, "expected a receipt object or an array of logs"});
    }

    std::vector<wcc::events::Event> logs;
    for(const auto & log_json : *document)
    {
        auto log_res = wcc::parse::parseFromJson<wcc::chain::Log>(log_json, wcc::parse::use_json);
        if(!log_res)
        {
            return std::unexpected(log_res.error());
        }
        logs.push_back(std::move(*log_res));
    }
    return logs;
}

static int _runScanLogs(const wcc::cmd::ArgParser & arg_parser, const wcc::config::Config & cfg, const std::string & path)
{
    const auto logs_res = _loadLogs(path);
    if(!logs_res)
    {
        spdlog::error(std::format("{} : {}", logs_res.error().kind, logs_res.error().message));
        return 1;
    }

    wcc::events::EventFilter filter;
    for(const auto & address : arg_parser.getArg<std::vector<std::string>>("--filter-address").value_or(std::vector<std::string>{}))
    {
        filter.addAddress(address);
    }

    for(const auto & topic_hex : arg_parser.getArg<std::vector<std::string>>("--filter-topic").value_or(std::vector<std::string>{}))
    {
        const auto topic = wcc::parse::parseWord(json(topic_hex), "--filter-topic");
        if(!topic)
        {
            spdlog::error(std::format("{} : {}", topic.error().kind, topic.error().message));
            return 1;
        }
        filter.addTopic(*topic);
    }

    asio::io_context io_context;
    wcc::events::EventMonitor monitor(io_context, cfg.mailbox_capacity);

    monitor.addEventHandler(wcc::events::transferTopic(), [](const wcc::events::Event & event)
    {
        if(const auto transfer = wcc::events::parseTransferEvent(event))
        {
            spdlog::info("Transfer {} -> {} : {}", wcc::chain::addressToHex(transfer->from), wcc::chain::addressToHex(transfer->to), transfer->amount.str());
        }
        else
        {
            spdlog::warn("Undecodable Transfer log at {}: {}", wcc::chain::addressToHex(event.address), transfer.error().message);
        }
    });

    monitor.addEventHandler(wcc::events::approvalTopic(), [](const wcc::events::Event & event)
    {
        if(const auto approval = wcc::events::parseApprovalEvent(event))
        {
            spdlog::info("Approval {} -> {} : {}", wcc::chain::addressToHex(approval->owner), wcc::chain::addressToHex(approval->spender), approval->amount.str());
        }
        else
        {
            spdlog::warn("Undecodable Approval log at {}: {}", wcc::chain::addressToHex(event.address), approval.error().message);
        }
    });

    const auto subscription = monitor.subscribe(std::move(filter));
    for(const auto & log : *logs_res)
    {
        monitor.processEvent(log);
    }

    try
    {
        io_context.run();
    }
    catch(const std::exception & e)
    {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    json out = json::object();
    out["subscription"] = subscription->getId();
    out["matched"] = json::array();
    for(auto & event : subscription->drain())
    {
        auto log_json = wcc::parse::parseToJson(std::move(event), wcc::parse::use_json);
        if(!log_json)
        {
            spdlog::error(std::format("{} : {}", log_json.error().kind, log_json.error().message));
            return 1;
        }
        out["matched"].push_back(std::move(*log_json));
    }
    out["dropped"] = subscription->getDroppedCount();

    if(subscription->getDroppedCount() > 0)
    {
        spdlog::warn("{} events dropped, mailbox capacity is {}", subscription->getDroppedCount(), subscription->getCapacity());
    }

    monitor.unsubscribe(subscription->getId());
    _print(out.dump(2));
    return 0;
}

int main(int argc, char* argv[])
{
    wcc::config::Config cfg;
    cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    cfg.logs_path = cfg.bin_path.parent_path() / "logs";

    _configureLogger(cfg);

    spdlog::debug("wcc-cli started with {} arguments", argc);
    for(int i = 0; i < argc; ++i)
    {
        spdlog::debug("Argument at [{}] : {}", i, argv[i]);
    }

    wcc::cmd::ArgParser arg_parser;
    arg_parser.addArg("-h", wcc::cmd::CommandLineArgDef::NArgs::Zero, wcc::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--help", wcc::cmd::CommandLineArgDef::NArgs::Zero, wcc::cmd::CommandLineArgDef::Type::Bool, "Display help message and exit");
    arg_parser.addArg("--version", wcc::cmd::CommandLineArgDef::NArgs::Zero, wcc::cmd::CommandLineArgDef::Type::Bool, "Display version and exit");
    arg_parser.addArg("--config", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "JSON configuration file");
    arg_parser.addArg("--log-level", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Console log level (trace, debug, info, warn, error, off)");
    arg_parser.addArg("--selector", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Print the selector of a function signature");
    arg_parser.addArg("--encode", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Encode a call to the given function signature");
    arg_parser.addArg("--args", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "JSON array of arguments for --encode");
    arg_parser.addArg("--decode", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Decode --data against a comma separated type list");
    arg_parser.addArg("--decode-call", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Decode call data in --data against a function signature");
    arg_parser.addArg("--data", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Hex data for --decode and --decode-call");
    arg_parser.addArg("--parse-units", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Convert a decimal amount to base units");
    arg_parser.addArg("--format-units", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Convert base units to a decimal amount");
    arg_parser.addArg("--decimals", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::Int, "Decimals for unit conversion");
    arg_parser.addArg("--address-of", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Derive the address of a private key");
    arg_parser.addArg("--generate-key", wcc::cmd::CommandLineArgDef::NArgs::Zero, wcc::cmd::CommandLineArgDef::Type::Bool, "Generate a random private key");
    arg_parser.addArg("--estimate-gas", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Intrinsic gas and fee of hex call data");
    arg_parser.addArg("--to", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Recipient for --estimate-gas, prints the full transaction");
    arg_parser.addArg("--value", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Value in wei for --estimate-gas");
    arg_parser.addArg("--scan-logs", wcc::cmd::CommandLineArgDef::NArgs::One, wcc::cmd::CommandLineArgDef::Type::String, "Run logs from a JSON file (log array or receipt) through the event monitor");
    arg_parser.addArg("--filter-address", wcc::cmd::CommandLineArgDef::NArgs::Many, wcc::cmd::CommandLineArgDef::Type::String, "Contract addresses for --scan-logs");
    arg_parser.addArg("--filter-topic", wcc::cmd::CommandLineArgDef::NArgs::Many, wcc::cmd::CommandLineArgDef::Type::String, "Event signature topics for --scan-logs");

    if(!arg_parser.parse(argc, argv))
    {
        spdlog::error("Invalid arguments, see --help");
        return 1;
    }

    if(arg_parser.getArg<bool>("--version").value_or(false))
    {
        spdlog::info("Version: {}.{}.{}", wcc::MAJOR_VERSION, wcc::MINOR_VERSION, wcc::PATCH_VERSION);
        return 0;
    }

    if(arg_parser.getArg<bool>("--help").value_or(false) || arg_parser.getArg<bool>("-h").value_or(false))
    {
        _print(arg_parser.constructHelpMessage());
        return 0;
    }

    if(const auto config_arg = arg_parser.getArg<std::vector<std::string>>("--config"))
    {
        const auto config_json = wcc::file::loadJsonFile(config_arg->at(0));
        if(!config_json)
        {
            spdlog::error(std::format("{} : {}", config_json.error().kind, config_json.error().message));
            return 1;
        }

        auto file_cfg = wcc::parse::parseFromJson<wcc::config::Config>(*config_json, wcc::parse::use_json);
        if(!file_cfg)
        {
            spdlog::error(std::format("{} : {}", file_cfg.error().kind, file_cfg.error().message));
            return 1;
        }

        file_cfg->bin_path = cfg.bin_path;
        if(file_cfg->logs_path.empty())
        {
            file_cfg->logs_path = cfg.logs_path;
        }
        cfg = std::move(*file_cfg);
    }

    if(const auto level_arg = arg_parser.getArg<std::vector<std::string>>("--log-level"))
    {
        const auto level_res = wcc::parse::parseLogLevel(level_arg->at(0));
        if(!level_res)
        {
            spdlog::error(std::format("{} : {}", level_res.error().kind, level_res.error().message));
            return 1;
        }
        cfg.console_log_level = *level_res;
    }

    _configureLogger(cfg);

    if(arg_parser.getArg<std::vector<int>>("--decimals").value_or(std::vector<int>{0}).at(0) < 0)
    {
        spdlog::error("--decimals cannot be negative");
        return 1;
    }

    if(const auto signature = arg_parser.getArg<std::vector<std::string>>("--selector"))
    {
        return _runSelector(signature->at(0));
    }

    if(const auto signature = arg_parser.getArg<std::vector<std::string>>("--encode"))
    {
        const auto args = arg_parser.getArg<std::vector<std::string>>("--args").value_or(std::vector<std::string>{"[]"});
        return _runEncode(signature->at(0), args.at(0));
    }

    if(const auto types = arg_parser.getArg<std::vector<std::string>>("--decode"))
    {
        const auto data = arg_parser.getArg<std::vector<std::string>>("--data");
        if(!data)
        {
            spdlog::error("--decode requires --data");
            return 1;
        }
        return _runDecode(types->at(0), data->at(0));
    }

    if(const auto signature = arg_parser.getArg<std::vector<std::string>>("--decode-call"))
    {
        const auto data = arg_parser.getArg<std::vector<std::string>>("--data");
        if(!data)
        {
            spdlog::error("--decode-call requires --data");
            return 1;
        }
        return _runDecodeCall(signature->at(0), data->at(0));
    }

    if(const auto amount = arg_parser.getArg<std::vector<std::string>>("--parse-units"))
    {
        return _runParseUnits(amount->at(0), _decimalsArg(arg_parser, cfg));
    }

    if(const auto amount = arg_parser.getArg<std::vector<std::string>>("--format-units"))
    {
        return _runFormatUnits(amount->at(0), _decimalsArg(arg_parser, cfg));
    }

    if(const auto private_key = arg_parser.getArg<std::vector<std::string>>("--address-of"))
    {
        return _runAddressOf(private_key->at(0));
    }

    if(arg_parser.getArg<bool>("--generate-key").value_or(false))
    {
        return _runGenerateKey();
    }

    if(const auto data = arg_parser.getArg<std::vector<std::string>>("--estimate-gas"))
    {
        return _runEstimateGas(arg_parser, cfg, data->at(0));
    }

    if(const auto path = arg_parser.getArg<std::vector<std::string>>("--scan-logs"))
    {
        return _runScanLogs(arg_parser, cfg, path->at(0));
    }

    spdlog::error("No command given");
    _print(arg_parser.constructHelpMessage());
    return 1;
}
