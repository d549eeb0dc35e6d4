#ifndef CONFIG_H
#define CONFIG_H

#include "command_t.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// Finder configuration
// ============================================================================

enum class HeightMode {
	Fullscreen,
	Fixed,
	Percentage,
};

struct FinderConfig {
	HeightMode height_mode   = HeightMode::Fullscreen;
	size_t height            = 10;
	size_t height_percentage = 50;
	std::string prompt       = "> ";
	std::string query        = {};
	bool multi_select        = false;
	bool show_help           = true;
	bool show_status         = true;
	size_t cache_capacity    = Display::DefaultCacheCapacity;

	std::optional<std::string> loading_message = {};
	std::optional<std::string> ready_message   = {};

	// Rows the finder occupies on a terminal with the given height.
	[[nodiscard]] size_t viewport_rows(const size_t terminal_rows) const;

	[[nodiscard]] bool fullscreen() const;
};

// ============================================================================
// XML config file
// ============================================================================

namespace tinyxml2 { class XMLElement; }

class ConfigLoader {
	static constexpr auto get_text = [](const auto* parent, const char* tag) {
		const auto* elem = parent->FirstChildElement(tag);
		return elem ? elem->GetText() : nullptr;
	};

	static void apply(const tinyxml2::XMLElement* root, FinderConfig& config);

public:
	// $FF_CONFIG, then $XDG_CONFIG_HOME/ff/config.xml, then
	// ~/.config/ff/config.xml. nullopt when no location can be formed.
	[[nodiscard]] static std::optional<std::filesystem::path> default_path();

	// Overlays the file's settings onto config. Throws ConfigError when the
	// file cannot be read or holds an invalid value.
	static void load(const std::filesystem::path& path, FinderConfig& config);

	// Defaults overlaid with the explicit file, or the default file when it
	// exists. Problems are reported on stderr and leave the defaults in place.
	[[nodiscard]] static FinderConfig load_or_default(
	        const std::optional<std::string>& explicit_path);

	[[nodiscard]] static bool parse_bool(const std::string_view text);

	[[nodiscard]] static size_t parse_size(const std::string_view text);
};

#endif
