#include "gimba/core/file_sink.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace gimba::core {

bool LocalTextFileSink::Exists(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path(path), ec) && !ec;
}

FileWriteResult LocalTextFileSink::Write(const std::string& path, const std::string& content, bool overwrite) {
  FileWriteResult result;
  const std::filesystem::path file_path(path);
  const bool existed = Exists(path);
  if (existed && !overwrite) {
    result.outcome = FileWriteOutcome::kSkipped;
    return result;
  }

  std::error_code ec;
  if (file_path.has_parent_path() && !std::filesystem::exists(file_path.parent_path(), ec)) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      result.error = "cannot create directory \"" + file_path.parent_path().string() + "\": " + ec.message();
      return result;
    }
  }

  std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    result.error = "cannot open \"" + path + "\" for writing";
    return result;
  }
  ofs << content;
  ofs.flush();
  if (!ofs) {
    result.error = "write to \"" + path + "\" failed";
    return result;
  }

  result.outcome = existed ? FileWriteOutcome::kOverwritten : FileWriteOutcome::kCreated;
  return result;
}

}  // namespace gimba::core
