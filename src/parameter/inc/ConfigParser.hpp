#pragma once

#include "AnonymizerConfig.hpp"

#include <set>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>


namespace YAML {

    inline void check_unknown_keys(const YAML::Node& node, const std::set<std::string>& valid_keys, const std::string& context) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (valid_keys.find(key) == valid_keys.end()) {
                throw std::runtime_error("Unknown configuration key in " + context + ": " + key);
            }
        }
    }

    // Decodes onto the existing value: keys absent from the node keep
    // whatever rhs already holds.
    template<>
    struct convert<AnonymizerConfig> {
        static bool decode(const Node& node, AnonymizerConfig& rhs) {
            if (!node.IsMap()) {
                throw std::runtime_error("Configuration root must be a mapping.");
            }

            // Detect unknown configuration keys
            static const std::set<std::string> valid_keys = {
                "input_file", "output_file", "column_name_pattern", "column_prefix",
                "encoding", "verbose", "log_file"
            };
            check_unknown_keys(node, valid_keys, "anonymizer config");

            if (node["input_file"]) {
                rhs.input_file = node["input_file"].as<std::string>();
            }
            if (node["output_file"]) {
                rhs.output_file = node["output_file"].as<std::string>();
            }
            if (node["column_name_pattern"]) {
                rhs.column_name_pattern = node["column_name_pattern"].as<std::string>();
            }
            if (node["column_prefix"]) {
                rhs.column_prefix = node["column_prefix"].as<std::string>();
            }
            if (node["encoding"]) {
                rhs.encoding = node["encoding"].as<std::string>();
                if (rhs.encoding.empty()) {
                    throw std::runtime_error("Configuration key 'encoding' must not be empty.");
                }
            }
            if (node["verbose"]) {
                rhs.verbose = node["verbose"].as<bool>();
            }
            if (node["log_file"]) {
                rhs.log_file = node["log_file"].as<std::string>();
            }
            return true;
        }
    };

}
