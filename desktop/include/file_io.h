#ifndef LITECDN_FILE_IO_H
#define LITECDN_FILE_IO_H

#include <cstdint>
#include <string>
#include <vector>

// Whole-file helpers for the command line front end.
bool read_file_bytes(const std::string& path, std::vector<uint8_t>& out, std::string* error);

// Writes to <path>.part first and renames over path, so a failed download never
// leaves a truncated file under the final name.
bool write_file_bytes(const std::string& path, const std::vector<uint8_t>& data, std::string* error);

// Last path component, used as the manifest's file_name.
std::string file_base_name(const std::string& path);

#endif // LITECDN_FILE_IO_H
