#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace layerfs {

#if defined(_WIN32)
constexpr char PathListSeparator = ';';
#else
constexpr char PathListSeparator = ':';
#endif

struct EnvironmentKeys {
	std::string data_dir    = "JUPYTER_DATA_DIR";
	std::string config_path = "JUPYTER_CONFIG_PATH";

	bool operator==(EnvironmentKeys const& rhs) const = default;
};

/**
 * @brief Result of the merge handed to the consumer: where the overlay is and where the config directories are.
 */
struct Publication {
	std::filesystem::path              overlay_path;
	std::vector<std::filesystem::path> config_paths;

	/**
	 * @brief Renders the publication as key/value pairs, the data directory first.
	 */
	[[nodiscard]] std::vector<std::pair<std::string, std::string>> environment(EnvironmentKeys const& keys) const;

	/**
	 * @brief Sets the rendered key/value pairs in the environment of the current process.
	 *
	 * @exception \ref std::system_error if a variable cannot be set.
	 */
	void apply(EnvironmentKeys const& keys) const;
};

std::string join_path_list(std::vector<std::filesystem::path> const& paths);

// Empty elements are dropped.
std::vector<std::filesystem::path> split_path_list(std::string_view s);

}  // namespace layerfs
