#include "layerfs/session.hpp"

#include <filesystem>
#include <utility>

#include <spdlog/spdlog.h>

#include "layerfs/layer.hpp"
#include "layerfs/overlay.hpp"
#include "layerfs/publication.hpp"

namespace fs = std::filesystem;

namespace layerfs {

Session::Session(Fs& fs, ResolvedLayers layers, fs::path const& parent)
    : fs_(fs)
    , layers_(std::move(layers))
    , overlay_(fs, parent) { }

BuildReport Session::build(BuildOptions const& opts) {
	auto report = build_overlay(this->fs_, this->layers_.walk_order(), this->overlay_.path(), opts);
	this->overlay_.mark_populated();

	spdlog::debug(
	    "populated {} from {} layers: {} linked, {} shadowed, {} ignored",
	    this->overlay_.path().string(),
	    report.layers.size(),
	    report.linked,
	    report.skipped,
	    report.ignored);
	return report;
}

Publication Session::publish() {
	this->overlay_.mark_active();

	return Publication{
	    .overlay_path = this->overlay_.path(),
	    .config_paths = this->layers_.config_paths,
	};
}

}  // namespace layerfs
