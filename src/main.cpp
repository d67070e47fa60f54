#include "codec/key_codec.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/output_paths.hpp"
#include "core/redactor.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace vecture;

namespace fs = std::filesystem;

namespace {

constexpr const char* kPassphraseEnv = "VECTURE_PASSPHRASE";

void print_usage() {
    std::cerr <<
        "Usage:\n"
        "  vecture redact <file> [--style CLASSIC|BLACKOUT|NOISE] [--words <file>]\n"
        "                 [--capitals] [--encrypt] [--obfuscate]\n"
        "                 [--output <path>] [--config <toml>]\n"
        "  vecture restore <redacted> <key> [--output <path>] [--config <toml>]\n"
        "\n"
        "Encrypted keys read the passphrase from $" << kPassphraseEnv
        << " or key.passphrase in the config.\n";
}

int fail(ErrorCode code, const std::string& message) {
    utils::log::error(std::format("{}: {}", error_code_to_string(code), message));
    return static_cast<int>(exit_code_for(code));
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT,
            std::format("Cannot open {}", path.string()));
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::error(ErrorCode::INVALID_INPUT,
            std::format("Failed reading {}", path.string()));
    }
    return Result<std::string>::ok(buf.str());
}

bool write_file(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return false;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    return !out.fail();
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> style;
    std::optional<std::string> words;
    std::optional<std::string> output;
    std::optional<std::string> config;
    bool capitals = false;
    bool encrypt = false;
    bool obfuscate = false;
};

Result<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        return Result<CliArgs>::error(ErrorCode::INVALID_INPUT, "Missing command");
    }

    CliArgs args;
    args.command = argv[1];

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];

        auto take_value = [&](std::optional<std::string>& slot) -> bool {
            if (i + 1 >= argc) return false;
            slot = argv[++i];
            return true;
        };

        bool ok = true;
        if (arg == "--style") {
            ok = take_value(args.style);
        } else if (arg == "--words") {
            ok = take_value(args.words);
        } else if (arg == "--output" || arg == "-o") {
            ok = take_value(args.output);
        } else if (arg == "--config") {
            ok = take_value(args.config);
        } else if (arg == "--capitals") {
            args.capitals = true;
        } else if (arg == "--encrypt") {
            args.encrypt = true;
        } else if (arg == "--obfuscate") {
            args.obfuscate = true;
        } else if (arg.starts_with("--")) {
            return Result<CliArgs>::error(ErrorCode::INVALID_INPUT,
                std::format("Unknown option {}", arg));
        } else {
            args.positional.push_back(arg);
        }

        if (!ok) {
            return Result<CliArgs>::error(ErrorCode::INVALID_INPUT,
                std::format("Option {} requires a value", arg));
        }
    }
    return Result<CliArgs>::ok(std::move(args));
}

// Config file (if any) with command-line overrides applied, then validated
ConfigLoader::LoadResult load_config(const CliArgs& args) {
    VectureConfig config;
    if (args.config) {
        auto loaded = ConfigLoader::load_from_file(*args.config);
        if (!loaded.success) return loaded;
        config = std::move(loaded.config);
    }

    if (args.style) config.redaction.style = *args.style;
    if (args.words) config.redaction.terms_file = *args.words;
    if (args.capitals) config.redaction.capitals = true;
    if (args.encrypt) config.key.encrypt = true;
    if (args.obfuscate) config.key.obfuscate = true;

    if (const char* env = std::getenv(kPassphraseEnv); env && *env) {
        config.key.passphrase = env;
    }

    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Invalid options:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

int run_redact(const CliArgs& args, const VectureConfig& config) {
    if (args.positional.size() != 1) {
        print_usage();
        return fail(ErrorCode::INVALID_INPUT, "redact takes exactly one input file");
    }

    const fs::path input = args.positional[0];
    const fs::path output = args.output ? fs::path(*args.output) : redacted_path_for(input);
    const fs::path key_path = key_path_for(output);

    auto options = ConfigLoader::to_redactor_options(config);
    if (options.is_error()) return fail(options.error_code(), options.error_message());

    if (options.value().key.encoding == KeyEncoding::ENCRYPTED &&
        options.value().key.passphrase.empty()) {
        return fail(ErrorCode::INVALID_INPUT,
            std::format("--encrypt needs a passphrase (set {})", kPassphraseEnv));
    }

    auto text = read_file(input);
    if (text.is_error()) return fail(text.error_code(), text.error_message());

    const Redactor redactor(std::move(options.value()));
    auto severed = redactor.sever(text.value());
    if (severed.is_error()) return fail(severed.error_code(), severed.error_message());

    if (!write_file(output, severed.value().sanitized)) {
        return fail(ErrorCode::INVALID_INPUT, std::format("Cannot write {}", output.string()));
    }
    if (!write_file(key_path, severed.value().key_file)) {
        std::error_code ec;
        fs::remove(output, ec);
        if (ec) {
            utils::log::warn(std::format("Could not remove {}: {}", output.string(), ec.message()));
        }
        return fail(ErrorCode::INVALID_INPUT, std::format("Cannot write key {}", key_path.string()));
    }

    utils::log::info(std::format("Redacted {} -> {} ({} records, key {})",
        input.string(), output.string(),
        severed.value().payload.records.size(), key_path.string()));
    return static_cast<int>(ExitCode::SUCCESS);
}

int run_restore(const CliArgs& args, const VectureConfig& config) {
    if (args.positional.size() != 2) {
        print_usage();
        return fail(ErrorCode::INVALID_INPUT, "restore takes a redacted file and a key file");
    }

    const fs::path redacted = args.positional[0];
    const fs::path key_path = args.positional[1];
    const fs::path output = args.output ? fs::path(*args.output) : restored_path_for(redacted);

    auto sanitized = read_file(redacted);
    if (sanitized.is_error()) return fail(sanitized.error_code(), sanitized.error_message());

    auto key_bytes = read_file(key_path);
    if (key_bytes.is_error()) return fail(key_bytes.error_code(), key_bytes.error_message());

    std::optional<std::string> passphrase;
    if (!config.key.passphrase.empty()) passphrase = config.key.passphrase;

    auto restored = Redactor::restore(sanitized.value(), key_bytes.value(), passphrase);
    if (restored.is_error()) return fail(restored.error_code(), restored.error_message());

    if (!write_file(output, restored.value())) {
        return fail(ErrorCode::INVALID_INPUT, std::format("Cannot write {}", output.string()));
    }

    utils::log::info(std::format("Restored {} -> {}", redacted.string(), output.string()));
    return static_cast<int>(ExitCode::SUCCESS);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        auto args = parse_args(argc, argv);
        if (args.is_error()) {
            print_usage();
            return fail(args.error_code(), args.error_message());
        }

        const auto loaded = load_config(args.value());
        if (!loaded.success) {
            return fail(ErrorCode::INVALID_INPUT, loaded.error_message);
        }
        if (const auto level = ConfigLoader::parse_log_level(loaded.config.logging.level)) {
            utils::log::set_level(*level);
        }

        const auto& command = args.value().command;
        if (command == "redact") return run_redact(args.value(), loaded.config);
        if (command == "restore") return run_restore(args.value(), loaded.config);

        print_usage();
        return fail(ErrorCode::INVALID_INPUT, std::format("Unknown command '{}'", command));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return static_cast<int>(ExitCode::INVALID_INPUT);
    }
}
