#include "file_io.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out, std::string* error) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
        return false;
    }
    const std::streamoff size = in.tellg();
    if (size < 0) {
        if (error) *error = "cannot size " + path;
        return false;
    }
    in.seekg(0, std::ios::beg);

    out.resize(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(out.data()), size)) {
        if (error) *error = "read of " + path + " failed";
        return false;
    }
    return true;
}

bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data, std::string* error) {
    const std::string part = path + ".part";
    {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            if (error) *error = "cannot create " + part + ": " + std::strerror(errno);
            return false;
        }
        if (!data.empty()) {
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        if (!out.flush()) {
            if (error) *error = "write to " + part + " failed";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(part, path, ec);
    if (ec) {
        std::filesystem::remove(part, ec);
        if (error) *error = "cannot move " + part + " to " + path;
        return false;
    }
    return true;
}

std::string file_base_name(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}
