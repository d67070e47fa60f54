#include "core/output_paths.hpp"
#include "codec/key_codec.hpp"

#include <string>
#include <string_view>

namespace vecture {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kRedactedTag = "_redacted";
constexpr std::string_view kRestoredTag = "_restored";

} // anonymous namespace

fs::path redacted_path_for(const fs::path& input) {
    return input.parent_path() /
        (input.stem().string() + std::string(kRedactedTag) + input.extension().string());
}

fs::path restored_path_for(const fs::path& redacted) {
    std::string stem = redacted.stem().string();

    size_t pos = stem.find(kRedactedTag);
    if (pos == std::string::npos) {
        stem += kRestoredTag;
    }
    while (pos != std::string::npos) {
        stem.replace(pos, kRedactedTag.size(), kRestoredTag);
        pos = stem.find(kRedactedTag, pos + kRestoredTag.size());
    }
    return redacted.parent_path() / (stem + redacted.extension().string());
}

fs::path key_path_for(const fs::path& output) {
    return fs::path(output.string() + std::string(kKeyFileExtension));
}

} // namespace vecture
