#include "core/redactor.hpp"
#include "core/displacement_renderer.hpp"
#include "core/reintegration_engine.hpp"
#include "core/span_resolver.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace vecture {

Redactor::Redactor(Options options)
    : options_(std::move(options)) {}

EntityLocator::Config Redactor::locator_config() const {
    EntityLocator::Config config;
    config.enabled_classes = options_.enabled_classes;
    config.custom_terms = options_.custom_terms;
    config.pattern_overrides = options_.pattern_overrides;

    const bool has_custom = std::find(config.enabled_classes.begin(),
        config.enabled_classes.end(), Category::CUSTOM_TERM) != config.enabled_classes.end();
    if (!config.custom_terms.empty() && !has_custom) {
        config.enabled_classes.push_back(Category::CUSTOM_TERM);
    }
    return config;
}

Result<Redactor::SeverResult> Redactor::sever(std::string_view text) const {
    utils::Timer timer;

    auto locator = EntityLocator::create(locator_config());
    if (locator.is_error()) {
        return Result<SeverResult>::forward_error(locator);
    }

    const auto candidates = locator.value().locate(text);
    const auto spans = SpanResolver::resolve(candidates);

    auto rendered = DisplacementRenderer::render(text, spans, options_.style, options_.noise_seed);
    if (rendered.is_error()) {
        return Result<SeverResult>::forward_error(rendered);
    }

    auto& output = rendered.value();
    SeverResult result;
    result.payload = KeyCodec::encode(std::move(output.records), output.sanitized, options_.style);

    auto key_file = KeyCodec::serialize(result.payload, options_.key);
    if (key_file.is_error()) {
        return Result<SeverResult>::forward_error(key_file);
    }
    result.key_file = std::move(key_file.value());
    result.sanitized = std::move(output.sanitized);

    utils::log::info(std::format("Severed {} bytes: {} candidates, {} spans, style {} ({}ms)",
        text.size(), candidates.size(), spans.size(),
        style_to_string(options_.style), timer.elapsed_ms().count()));

    return Result<SeverResult>::ok(std::move(result));
}

Result<std::string> Redactor::restore(
    std::string_view sanitized,
    std::string_view key_bytes,
    const std::optional<std::string>& passphrase) {

    auto payload = KeyCodec::decode(key_bytes, passphrase);
    if (payload.is_error()) {
        return Result<std::string>::forward_error(payload);
    }

    auto restored = ReintegrationEngine::restore(sanitized, payload.value());
    if (restored.is_ok()) {
        utils::log::info(std::format("Restored {} records ({} bytes)",
            payload.value().records.size(), restored.value().size()));
    }
    return restored;
}

} // namespace vecture
