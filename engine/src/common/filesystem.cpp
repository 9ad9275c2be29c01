#include <algorithm>
#include <sstream>

#include <corona/common/filesystem.hpp>
#include <corona/common/logging.hpp>

namespace {
auto logger = corona::_get_logger(__FILE__);
};

namespace corona {
FileInfo FileInfo::root(const fs::path& root)
{
  const auto full_path = fs::absolute(root);
  return FileInfo {
    fs::path(),
    full_path,
    full_path,
    full_path
  };
}

std::optional<std::ifstream> FileInfo::open(bool binary) const
{
  fs::path full_path = file_path;

  logger->debug("Attempting to read {}", file_relative.string());

  if (!fs::exists(full_path)) {
    logger->error("{} does not exist", full_path.string());
    return {};
  }

  std::ifstream istrm(full_path.string(), binary ? std::ios::binary : std::ios::in);

  if (istrm.is_open()) {
    return istrm;
  }

  logger->error("{} could not be opened, though it exists.", full_path.string());
  return {};
}

std::optional<std::string> FileInfo::read(bool binary) const
{
  auto ifs = this->open(binary);
  if (!ifs) {
    return {};
  }

  std::stringstream ss;
  ss << ifs->rdbuf();
  return ss.str();
}

FileInfo FileInfo::from_root(const fs::path& relative_path) const
{
  return FileInfo {
    relative_path,
    game_root / relative_path,
    (game_root / relative_path).parent_path(),
    game_root
  };
}

FileInfo FileInfo::from_current_dir(const fs::path& relative_path) const
{
  const auto is_file = fs::is_regular_file(file_path);
  const auto new_file_path = is_file ? file_path.parent_path() : file_path;
  const auto new_file_relative = is_file ? file_relative.parent_path() : file_relative;
  return {
    new_file_relative / relative_path,
    fs::absolute(new_file_path / relative_path),
    (new_file_path / relative_path).parent_path(),
    game_root
  };
}

std::optional<std::vector<FileInfo>> FileInfo::list() const
{
  if (!fs::is_directory(file_path)) {
    logger->error("{} is not a directory", file_relative.string());
    return {};
  }

  std::vector<FileInfo> files;
  for (const auto& entry : fs::directory_iterator(file_path)) {
    if (!fs::is_regular_file(entry.path())) {
      continue;
    }
    files.push_back(*this / entry.path().filename());
  }

  std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
    return a.file_path.filename().string() < b.file_path.filename().string();
  });

  return files;
}

FileInfo FileInfo::operator/(const fs::path& path) const
{
  return {
    file_relative / path,
    file_path / path,
    (file_path / path).parent_path(),
    game_root
  };
}

bool FileInfo::exists() const
{
  return fs::exists(file_path);
}

} // namespace corona
