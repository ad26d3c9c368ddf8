#include "support/FileIO.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
namespace aicw {

bool readFile(const std::string& path, std::string& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream ss; ss << ifs.rdbuf();
  if (ifs.bad()) return false;
  out = ss.str();
  return true;
}

bool writeFile(const std::string& path, const std::string& data, std::string* error) {
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) {
      if (error) *error = "Failed to create " + parent.string() + ": " + ec.message();
      return false;
    }
  }
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    if (error) *error = "Failed to open " + path;
    return false;
  }
  ofs << data;
  if (!ofs) {
    if (error) *error = "Failed to write " + path;
    return false;
  }
  return true;
}

} // namespace aicw
