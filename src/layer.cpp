#include "layerfs/layer.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <optional>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "layerfs/fs.hpp"
#include "layerfs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace layerfs {

std::vector<fs::path> ResolvedLayers::walk_order() const {
	if(this->data_paths.empty()) {
		return {};
	}

	std::vector<fs::path> rst(std::next(this->data_paths.begin()), this->data_paths.end());
	rst.push_back(this->data_paths.front());
	return rst;
}

std::optional<Layer> layer_of(fs::path const& search_path, LayerOptions const& opts) {
	auto const p = impl::strip_trailing_separator(search_path.lexically_normal());
	if(p.filename() != opts.marker) {
		return std::nullopt;
	}

	auto root = p;
	for(int i = 0; i < opts.levels_up; ++i) {
		if(!root.has_relative_path()) {
			return std::nullopt;
		}
		root = root.parent_path();
	}
	if(root.empty()) {
		return std::nullopt;
	}

	return Layer{
	    .root        = root,
	    .data_path   = root / opts.data_suffix,
	    .config_path = root / opts.config_suffix,
	};
}

ResolvedLayers resolve_layers(
    Fs const&                    fs,
    std::vector<fs::path> const& search_paths,
    fs::path const&              prefix,
    LayerOptions const&          opts) {
	auto const normal = [&](fs::path const& p) {
		return fs.absolute(p).lexically_normal();
	};

	ResolvedLayers rst;
	rst.data_paths.push_back(prefix / opts.data_suffix);

	std::vector<fs::path> seen{normal(rst.data_paths.front())};
	for(auto const& search_path: search_paths) {
		auto const layer = layer_of(search_path, opts);
		if(!layer) {
			continue;
		}

		rst.config_paths.push_back(layer->config_path);

		std::error_code ec;
		if(!fs.exists(layer->data_path, ec)) {
			spdlog::debug("no data directory at {}", layer->data_path.string());
			continue;
		}

		auto const n = normal(layer->data_path);
		if(std::find(seen.begin(), seen.end(), n) != seen.end()) {
			spdlog::debug("data directory {} is already a layer", layer->data_path.string());
			continue;
		}

		seen.push_back(n);
		rst.data_paths.push_back(layer->data_path);
	}

	return rst;
}

}  // namespace layerfs
