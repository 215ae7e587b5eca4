/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Command-line front end (`nexuid`).
 *
 * @details
 * This file contains the `main` function which orchestrates a single invocation:
 * 1. Global option parsing (`--config`, `--log-level`, `--help`).
 * 2. Configuration loading and logger setup.
 * 3. Manager construction.
 * 4. Command dispatch.
 */

#include "nexuid/api/handler.hpp"
#include "nexuid/config/config.hpp"
#include "nexuid/core/errors.hpp"
#include "nexuid/detect/format_detector.hpp"
#include "nexuid/encoding/time.hpp"
#include "nexuid/engine/manager.hpp"
#include "nexuid/infra/logger.hpp"
#include "nexuid/infra/scheduler.hpp"
#include "nexuid/infra/string.hpp"
#include "nexuid/serial/json_codec.hpp"

#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using nexuid::infra::Logger;
using nexuid::infra::LogLevel;

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "Options:\n"
              << "  --config FILE       Load factory configuration from a JSON file\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error or fatal\n"
              << "  --help              Show this help message\n"
              << "Commands:\n"
              << "  generate [TYPE] [--count N] [--threads T] [--at ISO8601]\n"
              << "  parse INPUT [--as TYPE]\n"
              << "  validate INPUT [--as TYPE]\n"
              << "  convert INPUT TYPE\n"
              << "  detect INPUT\n"
              << "  serve               Answer JSON requests read line by line from stdin\n"
              << "Types: ulid, uuid_v1, uuid_v4, uuid_v6, uuid_v7\n";
}

/// @brief Cursor over the positional and flag arguments of one command.
class Args {
  public:
    Args(int argc, char* argv[], int start)
    {
        for (int i = start; i < argc; ++i) {
            items_.emplace_back(argv[i]);
        }
    }

    /// @brief Removes `--name VALUE` and returns VALUE.
    std::optional<std::string> take_flag(const std::string& name)
    {
        for (std::size_t i = 0; i < items_.size(); ++i) {
            if (items_[i] != name) {
                continue;
            }
            if (i + 1 >= items_.size()) {
                throw std::invalid_argument("option " + name + " requires a value");
            }
            std::string value = items_[i + 1];
            items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(i),
                         items_.begin() + static_cast<std::ptrdiff_t>(i + 2));
            return value;
        }
        return std::nullopt;
    }

    std::optional<std::string> next()
    {
        if (pos_ >= items_.size()) {
            return std::nullopt;
        }
        return items_[pos_++];
    }

    std::string require(const std::string& what)
    {
        auto value = next();
        if (!value) {
            throw std::invalid_argument("missing argument: " + what);
        }
        return *value;
    }

  private:
    std::vector<std::string> items_;
    std::size_t pos_ = 0;
};

nexuid::core::IdType to_type(const std::string& name)
{
    const auto type = nexuid::core::type_from_string(name);
    if (!type) {
        throw nexuid::core::ValidationError("type", name, "unknown identifier type");
    }
    return *type;
}

std::size_t to_count(const std::string& flag, const std::string& text)
{
    const auto value = nexuid::infra::String::parse_positive(text);
    if (!value) {
        throw std::invalid_argument(flag + " expects a positive integer, got '" + text + "'");
    }
    return *value;
}

/**
 * @brief `generate`: one identifier, or a bulk run spread over the worker pool.
 *
 * Bulk output keeps submission order.
 */
int run_generate(nexuid::engine::Manager& manager, Args& args)
{
    const auto count_flag = args.take_flag("--count");
    const auto threads_flag = args.take_flag("--threads");
    const auto at_flag = args.take_flag("--at");

    std::optional<nexuid::core::IdType> type;
    if (auto name = args.next()) {
        type = to_type(*name);
    }
    std::optional<nexuid::core::Timestamp> at;
    if (at_flag) {
        at = nexuid::encoding::parse_iso8601(*at_flag);
    }

    auto make_one = [&manager, type, at]() {
        return at ? manager.generate_at(type, *at) : manager.generate(type);
    };

    const std::size_t count = count_flag ? to_count("--count", *count_flag) : 1;
    if (count == 1) {
        std::cout << make_one().canonical() << "\n";
        return 0;
    }

    const std::size_t threads = threads_flag ? to_count("--threads", *threads_flag)
                                             : std::thread::hardware_concurrency();
    Logger::log(LogLevel::DEBUG, "Generate: " + std::to_string(count) + " identifiers on " +
                                     std::to_string(threads) + " workers");

    nexuid::infra::Scheduler pool(threads);
    std::vector<std::future<nexuid::core::Identifier>> results;
    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        results.push_back(pool.submit(make_one));
    }
    for (auto& result : results) {
        std::cout << result.get().canonical() << "\n";
    }
    return 0;
}

int run_parse(nexuid::engine::Manager& manager, Args& args)
{
    const auto as = args.take_flag("--as");
    const std::string input = args.require("INPUT");
    const auto value = as ? manager.parse_as(input, to_type(*as)) : manager.parse(input);
    std::cout << nexuid::serial::JsonCodec::encode(value) << "\n";
    return 0;
}

int run_validate(nexuid::engine::Manager& manager, Args& args)
{
    const auto as = args.take_flag("--as");
    const std::string input = args.require("INPUT");
    if (as) {
        manager.validate_as(input, to_type(*as));
        std::cout << "valid " << *as << "\n";
    } else {
        manager.validate(input);
        std::cout << "valid " << nexuid::core::to_string(manager.detect(input)) << "\n";
    }
    return 0;
}

int run_convert(nexuid::engine::Manager& manager, Args& args)
{
    const std::string input = args.require("INPUT");
    const nexuid::core::IdType target = to_type(args.require("TYPE"));
    const auto converted = manager.convert(manager.parse(input), target);
    std::cout << nexuid::serial::JsonCodec::encode(converted) << "\n";
    return 0;
}

int run_detect(Args& args)
{
    const auto detection = nexuid::detect::FormatDetector::inspect(args.require("INPUT"));
    std::cout << nexuid::core::to_string(detection.type) << (detection.exact ? "" : " (guessed)")
              << "\n";
    return 0;
}

/**
 * @brief `serve`: one JSON request per stdin line, one JSON response per stdout line.
 *
 * Ends at EOF or after an `exit` request.
 */
int run_serve(nexuid::engine::Manager& manager)
{
    Logger::log(LogLevel::DEBUG, "Serve: reading requests from stdin");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        const std::string response = nexuid::api::Handler::process(manager, line);
        std::cout << response << std::endl;
        if (response.find("\"status\":\"goodbye\"") != std::string::npos) {
            break;
        }
    }
    Logger::log(LogLevel::DEBUG, "Serve: session closed");
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 0. Argument Pre-check
    if (argc < 2 || std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    try {
        // 1. Global Options
        std::optional<std::string> config_path;
        std::optional<std::string> log_level;
        int i = 1;
        while (i < argc && std::string(argv[i]).rfind("--", 0) == 0) {
            const std::string opt = argv[i];
            if (opt == "--help") {
                print_help(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + opt + " requires a value");
            }
            if (opt == "--config") {
                config_path = argv[i + 1];
            } else if (opt == "--log-level") {
                log_level = argv[i + 1];
            } else {
                throw std::invalid_argument("unknown option " + opt);
            }
            i += 2;
        }
        if (i >= argc) {
            throw std::invalid_argument("missing command");
        }
        const std::string command = argv[i];
        Args args(argc, argv, i + 1);

        // 2. Configuration & Logging
        nexuid::config::FactoryConfig cfg =
            config_path ? nexuid::config::load_factory_config_file(*config_path)
                        : nexuid::config::default_factory_config();
        if (log_level) {
            const auto level = Logger::parse_level(*log_level);
            if (!level) {
                throw std::invalid_argument("unknown log level '" + *log_level + "'");
            }
            cfg.log_level = *level;
        }
        Logger::set_level(cfg.log_level);
        if (config_path) {
            Logger::log(LogLevel::DEBUG, "Config: loaded '" + *config_path + "'");
        }

        // 3. Engine Bootstrap
        nexuid::engine::Manager manager(cfg);

        // 4. Command Dispatch
        if (command == "generate")
            return run_generate(manager, args);
        if (command == "parse")
            return run_parse(manager, args);
        if (command == "validate")
            return run_validate(manager, args);
        if (command == "convert")
            return run_convert(manager, args);
        if (command == "detect")
            return run_detect(args);
        if (command == "serve")
            return run_serve(manager);

        throw std::invalid_argument("unknown command '" + command + "'");

    } catch (const nexuid::core::Error& e) {
        Logger::log(LogLevel::ERROR, e.kind() + ": " + e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        Logger::log(LogLevel::ERROR, std::string("Usage: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
}
