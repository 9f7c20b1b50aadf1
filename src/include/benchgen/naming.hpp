#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace benchgen {

  std::string
  to_snake_case(std::string_view name);

  // Generated artifact file name for a schema file: the snake_case stem of
  // the schema followed by artifact_extension ("JazzMusic.bop", ".hpp" ->
  // "jazz_music.hpp").
  std::string
  artifact_name_for(const std::filesystem::path& schema,
                    std::string_view artifact_extension);

  // True when path's extension equals ext, ignoring ASCII case. An empty
  // ext matches every path.
  bool
  has_extension(const std::filesystem::path& path, std::string_view ext);

} // namespace benchgen
