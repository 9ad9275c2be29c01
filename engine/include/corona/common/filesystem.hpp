#pragma once

#include <optional>
#include <fstream>
#include <string>
#include <vector>
#include <experimental/filesystem>

namespace corona
{
namespace fs = std::experimental::filesystem;

/*!
  A path into the game directory. Keeps the path relative to the game root
  around for log messages along with the absolute location on disk.
*/
class FileInfo
{
public:
  fs::path file_relative;
  fs::path file_path;
  fs::path file_dir;
  fs::path game_root;

  //! The same root with a path appended, for walking into a directory
  FileInfo operator/ (const fs::path& path) const;

public:
  /*!
    Create a FileInfo that points at the root of a game directory
    \param root - Relative or absolute path to the game directory
  */
  static FileInfo root(const fs::path& root);

  std::optional<std::ifstream> open(bool binary = true) const;
  std::optional<std::string> read(bool binary = true) const;
  FileInfo from_root(const fs::path& relative_path) const;
  FileInfo from_current_dir(const fs::path& relative_path) const;

  /*!
    Lists the regular files of this directory ordered by filename
    \return The files or nothing if this is not a directory
  */
  std::optional<std::vector<FileInfo>> list() const;

  bool exists() const;
};
} // namespace corona
