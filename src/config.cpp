#include "layerfs/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "layerfs/error.hpp"
#include "layerfs/layer.hpp"
#include "layerfs/lifecycle.hpp"
#include "layerfs/publication.hpp"

extern char** environ;

namespace fs = std::filesystem;

namespace layerfs {

namespace {

template<typename T>
void assign_(YAML::Node const& node, char const* key, T& dst) {
	auto const v = node[key];
	if(!v) {
		return;
	}

	try {
		dst = v.as<T>();
	} catch(YAML::Exception const& e) {
		throw ConfigError(std::string("invalid value for \"") + key + "\": " + e.what());
	}
}

void assign_path_(YAML::Node const& node, char const* key, std::optional<fs::path>& dst) {
	std::string v;
	assign_(node, key, v);
	if(!v.empty()) {
		dst = v;
	}
}

}  // namespace

LayerOptions Config::layer_options() const {
	return LayerOptions{
	    .marker        = this->marker,
	    .levels_up     = this->levels_up,
	    .data_suffix   = this->data_suffix.value_or(fs::path("share") / this->app),
	    .config_suffix = this->config_suffix.value_or(fs::path("etc") / this->app),
	};
}

fs::path Config::overlay_parent() const {
	if(this->storage_dir) {
		return *this->storage_dir;
	}

	return user_data_dir(this->storage_id);
}

void Config::merge(YAML::Node const& node) {
	if(!node || node.IsNull()) {
		return;
	}
	if(!node.IsMap()) {
		throw ConfigError("configuration must be a mapping");
	}

	assign_(node, "app", this->app);
	assign_(node, "storage_id", this->storage_id);
	assign_path_(node, "storage_dir", this->storage_dir);
	assign_(node, "marker", this->marker);
	assign_(node, "levels_up", this->levels_up);
	assign_path_(node, "data_suffix", this->data_suffix);
	assign_path_(node, "config_suffix", this->config_suffix);
	assign_(node, "log_level", this->log_level);

	std::string prefix;
	assign_(node, "prefix", prefix);
	if(!prefix.empty()) {
		this->prefix = prefix;
	}

	if(auto const v = node["search_paths"]; v) {
		if(!v.IsSequence()) {
			throw ConfigError("\"search_paths\" must be a sequence");
		}

		std::vector<std::string> paths;
		assign_(node, "search_paths", paths);
		this->search_paths.insert(this->search_paths.end(), paths.begin(), paths.end());
	}

	if(auto const v = node["keys"]; v) {
		if(!v.IsMap()) {
			throw ConfigError("\"keys\" must be a mapping");
		}

		assign_(v, "data_dir", this->keys.data_dir);
		assign_(v, "config_path", this->keys.config_path);
	}
}

void Config::merge_file(fs::path const& path) {
	YAML::Node node;
	try {
		node = YAML::LoadFile(path.string());
	} catch(YAML::Exception const& e) {
		throw ConfigError("cannot load " + path.string() + ": " + e.what());
	}

	this->merge(node);
}

void Config::merge_environment(Environment const& env) {
	if(auto const it = env.find("LAYERFS_PREFIX"); it != env.end() && !it->second.empty()) {
		this->prefix = it->second;
	}
	if(auto const it = env.find("LAYERFS_SEARCH_PATH"); it != env.end()) {
		auto const paths = split_path_list(it->second);
		this->search_paths.insert(this->search_paths.end(), paths.begin(), paths.end());
	}
	if(auto const it = env.find("LAYERFS_LOG_LEVEL"); it != env.end() && !it->second.empty()) {
		this->log_level = it->second;
	}
}

void Config::validate() const {
	if(this->prefix.empty()) {
		throw ConfigError("installation prefix is not set; use --prefix or LAYERFS_PREFIX");
	}
	if(this->app.empty()) {
		throw ConfigError("application id must not be empty");
	}
	if(this->marker.empty()) {
		throw ConfigError("search path marker must not be empty");
	}
	if(this->levels_up < 1) {
		throw ConfigError("\"levels_up\" must be positive");
	}
	if(!this->storage_dir && this->storage_id.empty()) {
		throw ConfigError("either \"storage_dir\" or \"storage_id\" must be given");
	}
}

Environment current_environment() {
	Environment env;
	for(char** it = environ; it != nullptr && *it != nullptr; ++it) {
		std::string_view const entry(*it);

		auto const pos = entry.find('=');
		if(pos == std::string_view::npos) {
			continue;
		}

		env.emplace(entry.substr(0, pos), entry.substr(pos + 1));
	}

	return env;
}

}  // namespace layerfs
