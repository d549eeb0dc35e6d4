#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <tinyxml2.h>
#pragma GCC diagnostic pop

#include "config.h"
#include "errors_t.h"
#include "utilities.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <iostream>

// ============================================================================
// Finder configuration
// ============================================================================

[[nodiscard]] size_t FinderConfig::viewport_rows(const size_t terminal_rows) const
{
	if (terminal_rows == 0) {
		return 0;
	}

	switch (height_mode) {
	case HeightMode::Fixed: return std::clamp(height, size_t(1), terminal_rows);
	case HeightMode::Percentage:
		return std::clamp(terminal_rows * height_percentage / 100, size_t(1), terminal_rows);
	case HeightMode::Fullscreen: break;
	}
	return terminal_rows;
}

[[nodiscard]] bool FinderConfig::fullscreen() const
{
	return height_mode == HeightMode::Fullscreen;
}

// ============================================================================
// XML config file
// ============================================================================

[[nodiscard]] bool ConfigLoader::parse_bool(const std::string_view text)
{
	const auto value = Util::to_lower(Util::trim(text));
	if (value == "true" || value == "yes" || value == "1") {
		return true;
	}
	if (value == "false" || value == "no" || value == "0") {
		return false;
	}
	throw ConfigError("expected a boolean, got '" + std::string(text) + "'");
}

[[nodiscard]] size_t ConfigLoader::parse_size(const std::string_view text)
{
	const auto value = Util::trim(text);
	size_t result    = 0;

	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
	if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
		throw ConfigError("expected a number, got '" + std::string(text) + "'");
	}
	return result;
}

void ConfigLoader::apply(const tinyxml2::XMLElement* root, FinderConfig& config)
{
	if (const auto* height = get_text(root, "height")) {
		config.height = parse_size(height);
		if (config.height == 0) {
			throw ConfigError("height must be at least 1");
		}
		config.height_mode = HeightMode::Fixed;
	}

	if (const auto* percentage = get_text(root, "heightPercentage")) {
		config.height_percentage = parse_size(percentage);
		if (config.height_percentage == 0 || config.height_percentage > 100) {
			throw ConfigError("heightPercentage must be between 1 and 100");
		}
		config.height_mode = HeightMode::Percentage;
	}

	if (const auto* fullscreen = get_text(root, "fullscreen")) {
		if (parse_bool(fullscreen)) {
			config.height_mode = HeightMode::Fullscreen;
		}
	}

	// An empty element clears the prompt rather than leaving the default.
	if (const auto* prompt = root->FirstChildElement("prompt")) {
		config.prompt = prompt->GetText() ? prompt->GetText() : "";
	}

	if (const auto* multi = get_text(root, "multiSelect")) {
		config.multi_select = parse_bool(multi);
	}
	if (const auto* help = get_text(root, "showHelp")) {
		config.show_help = parse_bool(help);
	}
	if (const auto* status = get_text(root, "showStatus")) {
		config.show_status = parse_bool(status);
	}
	if (const auto* loading = get_text(root, "loadingMessage")) {
		config.loading_message = loading;
	}
	if (const auto* ready = get_text(root, "readyMessage")) {
		config.ready_message = ready;
	}
	if (const auto* capacity = get_text(root, "cacheCapacity")) {
		config.cache_capacity = std::max(size_t(1), parse_size(capacity));
	}
}

[[nodiscard]] std::optional<std::filesystem::path> ConfigLoader::default_path()
{
	if (const char* path = std::getenv("FF_CONFIG"); path && *path) {
		return std::filesystem::path(path);
	}
	if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
		return std::filesystem::path(xdg) / "ff" / "config.xml";
	}
	if (const char* home = std::getenv("HOME"); home && *home) {
		return std::filesystem::path(home) / ".config" / "ff" / "config.xml";
	}
	return std::nullopt;
}

void ConfigLoader::load(const std::filesystem::path& path, FinderConfig& config)
{
	tinyxml2::XMLDocument doc = {};
	if (doc.LoadFile(path.string().c_str()) != tinyxml2::XML_SUCCESS) {
		throw ConfigError("cannot read " + path.string() + ": " +
		                  (doc.ErrorStr() ? doc.ErrorStr() : "unknown error"));
	}

	const auto* root = doc.FirstChildElement("ff");
	if (!root) {
		throw ConfigError("no <ff> root element in " + path.string());
	}

	// Apply to a copy so a bad value leaves the caller's config untouched.
	FinderConfig updated = config;
	apply(root, updated);
	config = std::move(updated);
}

[[nodiscard]] FinderConfig ConfigLoader::load_or_default(
        const std::optional<std::string>& explicit_path)
{
	using namespace std::string_view_literals;

	FinderConfig config = {};

	std::optional<std::filesystem::path> path = {};
	if (explicit_path) {
		path = *explicit_path;
	} else if (const auto fallback = default_path()) {
		std::error_code ec = {};
		if (std::filesystem::exists(*fallback, ec)) {
			path = *fallback;
		}
	}

	if (!path) {
		return config;
	}

	try {
		load(*path, config);
	} catch (const ConfigError& e) {
		std::cerr << "Config warning: "sv << e.what() << '\n';
	}
	return config;
}
