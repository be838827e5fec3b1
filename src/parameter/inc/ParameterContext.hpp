#pragma once

#include "ConfigParser.hpp"
#include "AnonymizerConfig.hpp"

#include <unordered_map>
#include <vector>
#include <string>


class ParameterContext {
public:
    ParameterContext();

    // Returns false when help or version output was requested and the
    // program should stop without running.
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_commandline();
    void merge_commandline(int argc, char* argv[]);
    void merge_yaml(const YAML::Node& config);
    void merge_yaml(const std::string& file_path);

    const AnonymizerConfig& get_config() const;

private:
    AnonymizerConfig config_;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> positional_args;

    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--encoding")
        char short_opt;          // Short option (e.g. 'c'), '\0' if none
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
