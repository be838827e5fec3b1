#pragma once

#include <string>

// Whole-file byte access. Streams are opened in binary mode so line endings
// and undecoded bytes reach the caller untouched.
class TextFile {
public:
    // Throws NotFoundError when the path does not exist, IoError otherwise
    static std::string read_bytes(const std::string& path);

    // Creates or truncates the file. Throws IoError on any failure.
    static void write_bytes(const std::string& path, const std::string& data);
};
