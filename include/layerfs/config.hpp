#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "layerfs/layer.hpp"
#include "layerfs/publication.hpp"

namespace layerfs {

using Environment = std::unordered_map<std::string, std::string>;

struct Config {
	// Names `share/<app>` and `etc/<app>` unless the suffixes are given.
	std::string app = "jupyter";

	// Names the directory under the user data directory that holds overlays.
	std::string storage_id = "juv";

	// Overrides `user_data_dir(storage_id)`.
	std::optional<std::filesystem::path> storage_dir;

	std::filesystem::path              prefix;
	std::vector<std::filesystem::path> search_paths;

	std::string                          marker    = "site-packages";
	int                                  levels_up = 3;
	std::optional<std::filesystem::path> data_suffix;
	std::optional<std::filesystem::path> config_suffix;

	EnvironmentKeys keys;

	std::string log_level = "info";

	[[nodiscard]] LayerOptions layer_options() const;

	// Directory in which overlays are allocated.
	[[nodiscard]] std::filesystem::path overlay_parent() const;

	/**
	 * @brief Overrides fields present in a YAML mapping. Search paths are appended.
	 *
	 * @exception \ref layerfs::ConfigError if \p node is not a mapping or a value has the wrong type.
	 */
	void merge(YAML::Node const& node);

	/**
	 * @brief Loads a YAML file and merges it.
	 *
	 * @exception \ref layerfs::ConfigError if the file cannot be read or parsed.
	 */
	void merge_file(std::filesystem::path const& path);

	/**
	 * @brief Applies `LAYERFS_PREFIX`, `LAYERFS_SEARCH_PATH`, and `LAYERFS_LOG_LEVEL`.
	 */
	void merge_environment(Environment const& env);

	/**
	 * @exception \ref layerfs::ConfigError if a required field is missing or out of range.
	 */
	void validate() const;
};

Environment current_environment();

}  // namespace layerfs
