#include "TextFile.hpp"
#include "AnonymizerError.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace {

std::string last_error() {
    return errno != 0 ? std::strerror(errno) : "unknown error";
}

}

std::string TextFile::read_bytes(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw IoError(path, ec.message());
        }
        throw NotFoundError(path);
    }

    if (std::filesystem::is_directory(path, ec)) {
        throw IoError(path, "Is a directory");
    }

    errno = 0;
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) {
        throw IoError(path, last_error());
    }

    std::string data{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    if (ifs.bad()) {
        throw IoError(path, "read failed: " + last_error());
    }
    return data;
}

void TextFile::write_bytes(const std::string& path, const std::string& data) {
    errno = 0;
    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw IoError(path, last_error());
    }

    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
        throw IoError(path, "write failed: " + last_error());
    }

    ofs.close();
    if (!ofs) {
        throw IoError(path, "close failed: " + last_error());
    }
}
