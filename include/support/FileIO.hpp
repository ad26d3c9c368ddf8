#pragma once
#include <string>

namespace aicw {

// Whole-file read in binary mode.
bool readFile(const std::string& path, std::string& out);

// Truncating write; parent directories are created as needed.
bool writeFile(const std::string& path, const std::string& data, std::string* error);

} // namespace aicw
