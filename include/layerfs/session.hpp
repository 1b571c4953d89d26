#pragma once

#include <filesystem>

#include "layerfs/fs.hpp"
#include "layerfs/layer.hpp"
#include "layerfs/lifecycle.hpp"
#include "layerfs/overlay.hpp"
#include "layerfs/publication.hpp"

namespace layerfs {

/**
 * @brief Drives one overlay from allocation to removal.
 *   The overlay is allocated on construction, populated by `build`, handed out by `publish`,
 *   and removed by `close` or on destruction, whichever comes first.
 */
class Session {
   public:
	/**
	 * @param fs     Filesystem holding the layers and the overlay.
	 * @param layers Resolved layers to merge.
	 * @param parent Directory in which the overlay is allocated; created if absent.
	 */
	Session(Fs& fs, ResolvedLayers layers, std::filesystem::path const& parent);

	[[nodiscard]] ResolvedLayers const& layers() const noexcept {
		return this->layers_;
	}

	[[nodiscard]] ScopedOverlayDir const& overlay() const noexcept {
		return this->overlay_;
	}

	/**
	 * @brief Populates the overlay with the layers, the first discovered environment taking precedence.
	 *
	 * @exception \ref std::filesystem::filesystem_error if a file cannot be projected.
	 * @exception \ref layerfs::Interrupted if `opts.interrupted` reported a termination request.
	 */
	BuildReport build(BuildOptions const& opts = {});

	/**
	 * @brief Marks the overlay as in use and returns what the consumer needs to find it.
	 */
	Publication publish();

	bool close() noexcept {
		return this->overlay_.cleanup();
	}

   private:
	Fs&              fs_;
	ResolvedLayers   layers_;
	ScopedOverlayDir overlay_;
};

}  // namespace layerfs
