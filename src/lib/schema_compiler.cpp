#include <benchgen/schema_compiler.hpp>

#include <benchgen/error.hpp>
#include <benchgen/naming.hpp>

#include <algorithm>
#include <system_error>
#include <unordered_map>

namespace fs = std::filesystem;

namespace benchgen {

  namespace {

    bool
    is_hidden(const fs::path& path) {
      auto name = path.filename().string();
      return !name.empty() && name[0] == '.';
    }

    // Extensions are matched against path::extension(), which always starts
    // with a dot.
    void
    check_extension(const std::string& ext, const char* what) {
      if (!ext.empty() && ext.front() != '.') {
        throw generation_error(error_kind::configuration_error, what,
                               "'" + ext + "' must start with '.'");
      }
    }

    std::vector<fs::path>
    list_schemas(const schema_dir_options& opts) {
      const fs::path dir = opts.schema_dir;
      std::error_code ec;

      if (!fs::is_directory(dir, ec)) {
        throw generation_error(error_kind::io_error, dir.string(),
                               ec ? ec.message()
                                  : "schema directory does not exist");
      }

      std::vector<fs::path> schemas;
      fs::directory_iterator it(dir, ec);
      if (ec) throw generation_error(error_kind::io_error, dir.string(),
                                     ec.message());

      for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        if (is_hidden(it->path())) continue;
        if (!has_extension(it->path(), opts.schema_extension)) continue;
        schemas.push_back(it->path());
      }
      if (ec)
        throw generation_error(error_kind::io_error, dir.string(),
                               ec.message());

      std::sort(schemas.begin(), schemas.end());
      return schemas;
    }

    void
    ensure_output_dir(const fs::path& dir) {
      std::error_code ec;
      fs::create_directories(dir, ec);
      if (ec)
        throw generation_error(error_kind::io_error, dir.string(),
                               ec.message());
      if (!fs::is_directory(dir, ec))
        throw generation_error(error_kind::io_error, dir.string(),
                               "output path exists and is not a directory");
    }

    void
    check_tool(const fs::path& tool) {
      if (!find_executable(tool)) {
        throw generation_error(error_kind::tool_not_found, tool.string(),
                               "schema compiler is missing or not "
                               "executable");
      }
    }

    std::vector<fs::path>
    remove_stale(const fs::path& output_dir,
                 const std::vector<compiled_schema>& planned,
                 const std::string& artifact_extension) {
      std::vector<fs::path> removed;

      std::error_code ec;
      fs::directory_iterator it(output_dir, ec);
      if (ec)
        throw generation_error(error_kind::io_error, output_dir.string(),
                               ec.message());

      std::vector<fs::path> stale;
      for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        const auto path = it->path();
        if (!has_extension(path, artifact_extension)) continue;
        bool current = std::any_of(
            planned.begin(), planned.end(), [&](const compiled_schema& c) {
              return c.artifact.filename() == path.filename();
            });
        if (!current) stale.push_back(path);
      }
      if (ec)
        throw generation_error(error_kind::io_error, output_dir.string(),
                               ec.message());

      std::sort(stale.begin(), stale.end());
      for (auto& path : stale) {
        fs::remove(path, ec);
        if (ec)
          throw generation_error(error_kind::io_error, path.string(),
                                 ec.message());
        removed.push_back(std::move(path));
      }
      return removed;
    }

  } // namespace

  std::vector<compiled_schema>
  plan_schema_dir(const schema_dir_options& opts) {
    check_extension(opts.schema_extension, "schema extension");
    check_extension(opts.artifact_extension, "artifact extension");
    auto schemas = list_schemas(opts);

    std::vector<compiled_schema> planned;
    planned.reserve(schemas.size());

    std::unordered_map<std::string, fs::path> claimed;
    for (auto& schema : schemas) {
      auto name = artifact_name_for(schema, opts.artifact_extension);
      auto [it, inserted] = claimed.emplace(name, schema);
      if (!inserted) {
        throw generation_error(error_kind::configuration_error,
                               schema.string(),
                               "artifact name '" + name +
                                   "' is already produced by " +
                                   it->second.string());
      }

      compiled_schema c;
      c.artifact = fs::path(opts.output_dir) / name;
      c.schema = std::move(schema);
      planned.push_back(std::move(c));
    }

    return planned;
  }

  schema_dir_result
  compile_schema_dir(const fs::path& tool, const schema_dir_options& opts,
                     const process_runner& runner) {
    auto planned = plan_schema_dir(opts);
    ensure_output_dir(opts.output_dir);

    schema_dir_result result;
    if (opts.stale == stale_policy::clean_before_generate) {
      result.removed =
          remove_stale(opts.output_dir, planned, opts.artifact_extension);
    }

    if (planned.empty()) return result;

    check_tool(tool);

    for (auto& c : planned) {
      process_request request;
      request.program = tool.string();
      request.args = {"--quiet",           "--files",
                      c.schema.string(),   "--" + opts.language,
                      c.artifact.string()};
      request.timeout = opts.timeout;

      auto run = runner(request);

      if (!run.launched) {
        throw generation_error(error_kind::tool_not_found, tool.string(),
                               run.error);
      }

      if (!run.succeeded()) {
        std::string diagnostics = std::move(run.output);
        if (run.timed_out) {
          if (!diagnostics.empty() && diagnostics.back() != '\n')
            diagnostics += '\n';
          diagnostics += "timed out after " +
                         std::to_string(opts.timeout.count()) + " ms";
        } else if (diagnostics.empty()) {
          diagnostics = "exited with status " + std::to_string(run.exit_code);
        }
        throw generation_error(error_kind::compilation_failed,
                               c.schema.string(), std::move(diagnostics));
      }

      c.output = std::move(run.output);
      result.compiled.push_back(std::move(c));
    }

    return result;
  }

} // namespace benchgen
