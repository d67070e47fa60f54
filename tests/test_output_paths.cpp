#include <catch2/catch_test_macros.hpp>
#include "core/output_paths.hpp"

using namespace vecture;

namespace fs = std::filesystem;

TEST_CASE("Redacted output gets a _redacted stem", "[paths]") {
    CHECK(redacted_path_for("docs/report.txt") == fs::path("docs/report_redacted.txt"));
    CHECK(redacted_path_for("notes") == fs::path("notes_redacted"));
}

TEST_CASE("Restored output swaps _redacted for _restored", "[paths]") {
    CHECK(restored_path_for("docs/report_redacted.txt") == fs::path("docs/report_restored.txt"));
    CHECK(restored_path_for("report_redacted_v2.txt") == fs::path("report_restored_v2.txt"));
    CHECK(restored_path_for("a_redacted_b_redacted.md") == fs::path("a_restored_b_restored.md"));
}

TEST_CASE("Restored output appends _restored when the stem has no tag", "[paths]") {
    CHECK(restored_path_for("docs/report.txt") == fs::path("docs/report_restored.txt"));
    CHECK(restored_path_for("_redacted.txt") == fs::path("_restored.txt"));
}

TEST_CASE("Key file sits beside the sanitized output", "[paths]") {
    CHECK(key_path_for("out/report_redacted.txt") == fs::path("out/report_redacted.txt.vecture"));
}
