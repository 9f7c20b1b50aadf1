#include <benchgen/naming.hpp>

#include <cctype>

namespace benchgen {

  namespace {

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

  } // namespace

  std::string
  to_snake_case(std::string_view name) {
    if (name.empty()) return {};

    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i) {
      char c = name[i];

      // Word separators all collapse to a single underscore
      if (c == '-' || c == '.' || c == ' ' || c == '_') {
        if (!result.empty() && result.back() != '_') result += '_';
        continue;
      }

      if (is_upper(c)) {
        // Insert underscore before:
        // - an uppercase letter preceded by a lowercase letter or digit
        // - an uppercase letter that starts a new word after an abbreviation
        //   run (e.g. the 'P' in "HTMLParser")
        if (!result.empty() && result.back() != '_') {
          bool prev_lower = is_lower(name[i - 1]) || is_digit(name[i - 1]);
          bool prev_upper = is_upper(name[i - 1]);
          bool next_lower = (i + 1 < name.size()) && is_lower(name[i + 1]);

          if (prev_lower || (prev_upper && next_lower)) result += '_';
        }
        result += to_lower(c);
      } else {
        result += c;
      }
    }

    if (!result.empty() && result.back() == '_') result.pop_back();
    return result;
  }

  std::string
  artifact_name_for(const std::filesystem::path& schema,
                    std::string_view artifact_extension) {
    auto stem = to_snake_case(schema.stem().string());
    if (stem.empty()) stem = schema.filename().string();
    stem += artifact_extension;
    return stem;
  }

  bool
  has_extension(const std::filesystem::path& path, std::string_view ext) {
    if (ext.empty()) return true;
    auto actual = path.extension().string();
    if (actual.size() != ext.size()) return false;
    // Case-insensitive comparison
    for (std::size_t i = 0; i < ext.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(actual[i])) !=
          std::tolower(static_cast<unsigned char>(ext[i])))
        return false;
    }
    return true;
  }

} // namespace benchgen
