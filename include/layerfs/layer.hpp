#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "layerfs/fs.hpp"

namespace layerfs {

struct LayerOptions {
	// Last element of a search path that belongs to an isolated environment.
	std::string marker = "site-packages";

	// Number of elements between the environment root and the marker directory, the marker included.
	int levels_up = 3;

	std::filesystem::path data_suffix   = "share/jupyter";
	std::filesystem::path config_suffix = "etc/jupyter";

	bool operator==(LayerOptions const& rhs) const = default;
};

struct Layer {
	std::filesystem::path root;
	std::filesystem::path data_path;
	std::filesystem::path config_path;

	bool operator==(Layer const& rhs) const = default;
};

struct ResolvedLayers {
	// The canonical data path first, then discovered environments in encounter order.
	std::vector<std::filesystem::path> data_paths;

	// One entry per discovered environment, in encounter order.
	std::vector<std::filesystem::path> config_paths;

	/**
	 * @brief Retrieves the data paths ordered from the highest to the lowest precedence.
	 *   The first discovered environment comes first and the canonical data path comes last.
	 */
	[[nodiscard]] std::vector<std::filesystem::path> walk_order() const;

	bool operator==(ResolvedLayers const& rhs) const = default;
};

/**
 * @brief Derives the layer an entry of a library search path belongs to.
 *
 * @param search_path Entry of the library search path, e.g. `/venv/lib/python3.12/site-packages`.
 * @param opts        Marker and suffixes used for the derivation.
 * @return The layer, or `std::nullopt` if \p search_path does not end with the marker
 *   or has too few elements to ascend to an environment root.
 */
std::optional<Layer> layer_of(std::filesystem::path const& search_path, LayerOptions const& opts = {});

/**
 * @brief Produces the ordered data layers and the config path list for a set of search paths.
 *   Entries that are not environment paths or whose data path does not exist are skipped.
 *
 * @param fs           Filesystem used for existence checks.
 * @param search_paths Library search path entries in lookup order.
 * @param prefix       Installation root of the invoking process; its data path is always the first layer.
 * @param opts         Marker and suffixes used for the derivation.
 */
ResolvedLayers resolve_layers(
    Fs const&                                 fs,
    std::vector<std::filesystem::path> const& search_paths,
    std::filesystem::path const&              prefix,
    LayerOptions const&                       opts = {});

}  // namespace layerfs
