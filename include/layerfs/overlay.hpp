#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

#include "layerfs/fs.hpp"

namespace layerfs {

enum class ProjectResult {
	linked,

	// The destination already existed and was left untouched.
	skipped,
};

struct BuildOptions {
	// Polled before each file is projected; returning a signal number other than 0
	// aborts the build with `layerfs::Interrupted`.
	std::function<int()> interrupted;
};

struct BuildReport {
	// Layers that existed as directories, in the order they were walked.
	std::vector<std::filesystem::path> layers;

	std::size_t linked  = 0;
	std::size_t skipped = 0;

	// Symbolic links and special files, which are never projected.
	std::size_t ignored = 0;
};

/**
 * @brief Projects a regular file into the overlay with a hard link, creating missing parent directories.
 *
 * @param fs  Filesystem holding both \p src and \p dst.
 * @param src Path to the regular file to project.
 * @param dst Path of the link to create.
 * @return `ProjectResult::skipped` if \p dst already exists, `ProjectResult::linked` otherwise.
 *
 * @exception \ref std::filesystem::filesystem_error on any other failure, e.g. permission denied or cross-device link.
 */
ProjectResult project_file(Fs& fs, std::filesystem::path const& src, std::filesystem::path const& dst);

/**
 * @brief Populates a directory with the file-level union of the given layers.
 *   Layers are walked in the given order and the first layer providing a relative path wins,
 *   so \p layers must be ordered from the highest to the lowest precedence.
 *   Only regular files are linked; directories are created as parents of linked files.
 *   A layer that does not exist or is not a directory contributes nothing.
 *
 * @param fs     Filesystem holding the layers and \p dst.
 * @param layers Layer roots ordered from the highest to the lowest precedence.
 * @param dst    Existing directory to populate.
 * @param opts   Build options.
 *
 * @exception \ref std::filesystem::filesystem_error if a file cannot be projected for a reason other than an existing destination.
 * @exception \ref layerfs::Interrupted if `opts.interrupted` reported a termination request.
 */
BuildReport build_overlay(
    Fs&                                       fs,
    std::vector<std::filesystem::path> const& layers,
    std::filesystem::path const&              dst,
    BuildOptions const&                       opts = {});

}  // namespace layerfs
