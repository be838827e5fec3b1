#pragma once

#include "AnonymizerConfig.hpp"
#include <cstddef>
#include <string>

// Runs one input file through encoding resolution, decoding, column
// renaming and encoding back to the output file. The output file is only
// opened once the whole input has been read and substituted.
class TableDefinitionAnonymizer {
public:
    explicit TableDefinitionAnonymizer(AnonymizerConfig config);

    // Returns the number of column names replaced. Throws the
    // AnonymizerError family, EncodingError or other std::exception.
    size_t run();

    // Concrete encoding for the given raw input: the configured name, or
    // the detected one when the selector is "auto".
    std::string resolve_encoding(const std::string& raw_data) const;

private:
    void validate() const;

    AnonymizerConfig config_;
};
