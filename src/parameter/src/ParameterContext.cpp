#include "ParameterContext.hpp"
#include "AnonymizerError.hpp"
#include "StringUtils.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

#ifndef TDANON_VERSION
#define TDANON_VERSION "1.0.0"
#endif
#ifndef TDANON_BUILD_GIT
#define TDANON_BUILD_GIT "unknown"
#endif
#ifndef TDANON_BUILD_DATE
#define TDANON_BUILD_DATE "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--column_name_pattern", '\0', "Regex identifying sensitive column names", true},
    {"--column_prefix", '\0', "Prefix for anonymized column names (default: column_)", true},
    {"--encoding", '\0', "Input/output encoding, or 'auto' to detect (default: utf-8)", true},
    {"--config_file", 'c', "Read option values from a YAML config file", true},
    {"--log_file", '\0', "Also write log output to this file", true},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: tdanon [OPTIONS]... <input_file> <output_file>\n\n"
              << "Anonymizes database table definitions by replacing sensitive column names\n"
              << "with generic ones.\n\n"
              << "Arguments:\n"
              << "  input_file    Table definition to anonymize\n"
              << "  output_file   Where to write the anonymized definition\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        if (opt.short_opt != '\0') {
            std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;
        } else {
            std::cout << "      " << opt.long_opt;
        }

        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset - current_len;
        std::cout << std::string(padding, ' ');

        std::cout << opt.description << "\n";
    }

    std::cout << "\nDefault column name pattern:\n"
              << "  " << AnonymizerConfig::DEFAULT_COLUMN_NAME_PATTERN << "\n"
              << "\nExamples:\n"
              << "  tdanon input.sql output.sql\n"
              << "  tdanon input.sql output.sql --column_name_pattern \"ssn|credit_card\"\n"
              << "  tdanon input.sql output.sql --column_prefix renamed_column_\n"
              << "  tdanon input.sql output.sql --encoding latin-1\n"
              << "  tdanon input.sql output.sql --encoding auto\n"
              << "  tdanon -c anonymizer.yaml\n\n";
}

void ParameterContext::show_version() {
    std::cout << "tdanon version: " << TDANON_VERSION << std::endl;
    std::cout << "git: " << TDANON_BUILD_GIT << std::endl;
    std::cout << "build: " << TDANON_BUILD_DATE << std::endl;
}

void ParameterContext::merge_yaml(const YAML::Node& config) {
    YAML::convert<AnonymizerConfig>::decode(config, config_);
}

void ParameterContext::merge_yaml(const std::string& file_path) {
    try {
        YAML::Node config = YAML::LoadFile(file_path);
        merge_yaml(config);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML file '" + file_path + "': " + e.what());
    } catch (const std::exception& e) {
        throw ConfigError("Error processing YAML file '" + file_path + "': " + e.what());
    }
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        // Positional argument
        if (options_done || arg.size() < 2 || arg[0] != '-') {
            positional_args.push_back(arg);
            continue;
        }

        // Everything after "--" is positional
        if (arg == "--") {
            options_done = true;
            continue;
        }

        // Handle long option format (--key=value)
        if (StringUtils::starts_with(arg, "--")) {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            // Validate long option
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw ConfigError("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw ConfigError("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else {
            if (arg.length() != 2) {
                throw ConfigError("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt != '\0' && opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw ConfigError("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw ConfigError("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_commandline(int argc, char* argv[]) {
    parse_commandline(argc, argv);
    merge_commandline();
}

void ParameterContext::merge_commandline() {
    if (positional_args.size() > 2) {
        std::string extra;
        for (size_t i = 2; i < positional_args.size(); ++i) {
            extra += (i > 2 ? " " : "") + positional_args[i];
        }
        throw ConfigError("Unrecognized arguments: " + extra);
    }

    // Map command line parameters to the anonymizer config
    if (positional_args.size() > 0)
        config_.input_file = positional_args[0];

    if (positional_args.size() > 1)
        config_.output_file = positional_args[1];

    if (cli_params.count("--column_name_pattern"))
        config_.column_name_pattern = cli_params["--column_name_pattern"];

    if (cli_params.count("--column_prefix"))
        config_.column_prefix = cli_params["--column_prefix"];

    if (cli_params.count("--encoding")) {
        std::string encoding = cli_params["--encoding"];
        StringUtils::trim(encoding);
        if (encoding.empty()) {
            throw ConfigError("Option --encoding must not be empty");
        }
        config_.encoding = encoding;
    }

    if (cli_params.count("--log_file"))
        config_.log_file = cli_params["--log_file"];

    if (cli_params.count("--verbose")) {
        config_.verbose = true;
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    if (cli_params.count("--config_file")) {
        merge_yaml(cli_params["--config_file"]);
    }
    merge_commandline();

    if (config_.input_file.empty() || config_.output_file.empty()) {
        throw ConfigError("Input and output file paths must be specified.");
    }
    return true;
}

const AnonymizerConfig& ParameterContext::get_config() const {
    return config_;
}
