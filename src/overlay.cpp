#include "layerfs/overlay.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include "layerfs/directory_iterator.hpp"
#include "layerfs/error.hpp"
#include "layerfs/fs.hpp"
#include "layerfs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace layerfs {

ProjectResult project_file(Fs& fs, fs::path const& src, fs::path const& dst) {
	fs.create_directories(dst.parent_path());

	std::error_code ec;
	fs.create_hard_link(src, dst, ec);
	if(!ec) {
		return ProjectResult::linked;
	}
	if(ec == std::errc::file_exists) {
		return ProjectResult::skipped;
	}

	throw fs::filesystem_error("cannot link file into overlay", src, dst, ec);
}

BuildReport build_overlay(Fs& fs, std::vector<fs::path> const& layers, fs::path const& dst, BuildOptions const& opts) {
	BuildReport report;

	auto const check_interrupted = [&] {
		if(!opts.interrupted) {
			return;
		}
		if(auto const sig = opts.interrupted(); sig != 0) {
			throw Interrupted(sig);
		}
	};

	// A signal may arrive before any regular file is reached.
	check_interrupted();

	for(auto const& layer: layers) {
		std::error_code ec;
		auto const      s = fs.status(layer, ec);
		if(s.type() == fs::file_type::not_found) {
			spdlog::debug("layer {} does not exist", layer.string());
			continue;
		}
		if(!fs.status_known(s)) {
			throw fs::filesystem_error("cannot inspect layer", layer, ec);
		}
		if(!fs.is_directory(s)) {
			spdlog::debug("layer {} is not a directory", layer.string());
			continue;
		}

		report.layers.push_back(layer);
		spdlog::debug("merging layer {}", layer.string());

		for(auto const& entry: recursive_directory_iterator(fs, layer)) {
			if(entry.is_directory()) {
				continue;
			}
			if(!entry.is_regular_file()) {
				spdlog::debug("ignore {} ({})", entry.path().string(), impl::to_string(entry.symlink_status().type()));
				++report.ignored;
				continue;
			}

			check_interrupted();

			auto const target = dst / entry.path().lexically_relative(layer);
			switch(project_file(fs, entry.path(), target)) {
			case ProjectResult::linked: {
				++report.linked;
				break;
			}
			case ProjectResult::skipped: {
				spdlog::debug("skip {}: provided by a preceding layer", target.string());
				++report.skipped;
				break;
			}
			}
		}
	}

	return report;
}

}  // namespace layerfs
