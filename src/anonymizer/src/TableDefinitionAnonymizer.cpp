#include "TableDefinitionAnonymizer.hpp"
#include "AnonymizerError.hpp"
#include "ColumnRenamer.hpp"
#include "EncodingConverter.hpp"
#include "EncodingDetector.hpp"
#include "EncodingName.hpp"
#include "LogUtils.hpp"
#include "TextFile.hpp"
#include <utility>

TableDefinitionAnonymizer::TableDefinitionAnonymizer(AnonymizerConfig config)
    : config_(std::move(config)) {}

void TableDefinitionAnonymizer::validate() const {
    if (config_.input_file.empty() || config_.output_file.empty()) {
        throw ConfigError("Input and output file paths must be specified.");
    }
}

std::string TableDefinitionAnonymizer::resolve_encoding(const std::string& raw_data) const {
    if (!is_auto_encoding(config_.encoding)) {
        return config_.encoding;
    }

    auto detected = EncodingDetector::detect(raw_data);
    if (!detected) {
        throw ConfigError("Unable to automatically detect file encoding.");
    }

    LogUtils::info("Detected encoding: {} (confidence {}%)", detected->name, detected->confidence);
    return detected->name;
}

size_t TableDefinitionAnonymizer::run() {
    validate();

    // 1. Read raw input and settle on an encoding
    const std::string raw_data = TextFile::read_bytes(config_.input_file);
    LogUtils::debug("Read {} bytes from {}", raw_data.size(), config_.input_file);

    const std::string encoding = resolve_encoding(raw_data);
    LogUtils::debug("Using encoding {} for {} and {}", encoding, config_.input_file, config_.output_file);

    // 2. Decode, replacing undecodable bytes
    const std::string table_definition = EncodingConverter::decode(raw_data, encoding);

    // 3. Rename columns
    ColumnRenamer renamer(config_.column_name_pattern, config_.column_prefix);
    RenameResult renamed = renamer.rename(table_definition);
    LogUtils::debug("Replaced {} column names matching {}", renamed.replacements, config_.column_name_pattern);

    // 4. Encode and write the output
    const std::string output_data = EncodingConverter::encode(renamed.text, encoding);
    TextFile::write_bytes(config_.output_file, output_data);
    LogUtils::debug("Wrote {} bytes to {}", output_data.size(), config_.output_file);

    LogUtils::info("Anonymized table definition written to {}", config_.output_file);
    return renamed.replacements;
}
