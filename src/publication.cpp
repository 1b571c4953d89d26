#include "layerfs/publication.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace layerfs {

std::vector<std::pair<std::string, std::string>> Publication::environment(EnvironmentKeys const& keys) const {
	return {
	    {keys.data_dir, this->overlay_path.string()},
	    {keys.config_path, join_path_list(this->config_paths)},
	};
}

void Publication::apply(EnvironmentKeys const& keys) const {
	for(auto const& [key, value]: this->environment(keys)) {
		if(::setenv(key.c_str(), value.c_str(), 1) != 0) {
			throw std::system_error(errno, std::generic_category(), "cannot set " + key);
		}
	}
}

std::string join_path_list(std::vector<fs::path> const& paths) {
	std::string rst;
	for(auto it = paths.begin(); it != paths.end(); ++it) {
		if(it != paths.begin()) {
			rst += PathListSeparator;
		}
		rst += it->string();
	}

	return rst;
}

std::vector<fs::path> split_path_list(std::string_view s) {
	std::vector<fs::path> rst;
	while(!s.empty()) {
		auto const pos  = s.find(PathListSeparator);
		auto const elem = s.substr(0, pos);
		if(!elem.empty()) {
			rst.emplace_back(elem);
		}
		if(pos == std::string_view::npos) {
			break;
		}
		s.remove_prefix(pos + 1);
	}

	return rst;
}

}  // namespace layerfs
