#include <benchgen/error.hpp>
#include <benchgen/manifest.hpp>

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace benchgen;
using namespace benchgen_test;

static generation_report
sample_report() {
  generation_report report;
  report.platform = platform_target::unix_like;
  report.tool_path = "../../../bin/compiler/Linux-Debug/bebopc";
  report.compiled.compiled = {
      {"schemas/a.bop", "src/bebops/a.hpp", ""},
      {"schemas/b.bop", "src/bebops/b.hpp", ""},
  };
  report.compiled.removed = {"src/bebops/old.hpp"};
  report.generated.output_dir = "src/protos";
  report.generated.inputs = {"schemas/jazz.proto"};
  return report;
}

TEST_CASE("to_json: lists platform, tool and both steps", "[manifest]") {
  auto doc = to_json(sample_report(), default_build_plan());

  CHECK(doc["platform"] == "unix-like");
  CHECK(doc["tool"] == "../../../bin/compiler/Linux-Debug/bebopc");

  CHECK(doc["compiler"]["schema-dir"] == "schemas");
  CHECK(doc["compiler"]["output-dir"] == "src/bebops");
  REQUIRE(doc["compiler"]["artifacts"].size() == 2);
  CHECK(doc["compiler"]["artifacts"][0]["schema"] == "schemas/a.bop");
  CHECK(doc["compiler"]["artifacts"][0]["artifact"] == "src/bebops/a.hpp");
  CHECK(doc["compiler"]["removed"] ==
        nlohmann::json::array({"src/bebops/old.hpp"}));

  CHECK(doc["codegen"]["output-dir"] == "src/protos");
  CHECK(doc["codegen"]["inputs"] ==
        nlohmann::json::array({"schemas/jazz.proto"}));
}

TEST_CASE("to_json: empty run has empty arrays", "[manifest]") {
  auto doc = to_json(generation_report{}, default_build_plan());
  CHECK(doc["compiler"]["artifacts"].is_array());
  CHECK(doc["compiler"]["artifacts"].empty());
  CHECK(doc["compiler"]["removed"].empty());
  CHECK(doc["codegen"]["inputs"].empty());
}

TEST_CASE("write_manifest: writes parseable JSON with a timestamp",
          "[manifest]") {
  temp_dir dir("manifest_write");
  auto path = dir / "manifest.json";

  write_manifest(path, sample_report(), default_build_plan(),
                 "2026-10-17T09:30:00Z");

  auto doc = nlohmann::json::parse(read_file(path));
  CHECK(doc["generated"] == "2026-10-17T09:30:00Z");
  CHECK(doc["compiler"]["artifacts"].size() == 2);
}

TEST_CASE("write_manifest: unwritable path is an i/o error", "[manifest]") {
  temp_dir dir("manifest_unwritable");
  auto path = dir / "missing/dir/manifest.json";

  try {
    write_manifest(path, sample_report(), default_build_plan(), "now");
    FAIL("expected generation_error");
  } catch (const generation_error& e) {
    CHECK(e.kind() == error_kind::io_error);
    CHECK(e.subject() == path.string());
  }
}
