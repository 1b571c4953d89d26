#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

#include "layerfs/directory_entry.hpp"

namespace layerfs {

class recursive_directory_iterator;

class Fs {
   public:
	class RecursiveCursor {
	   public:
		virtual ~RecursiveCursor() = default;

		[[nodiscard]] virtual directory_entry const& value() const = 0;

		[[nodiscard]] virtual bool at_end() const = 0;

		virtual void increment() = 0;
	};

	virtual ~Fs() = default;

	/**
	 * @brief Opens a file for reading.
	 *
	 * @param filename Name of the file to be opened.
	 * @param mode     Open mode for the file.
	 * @return Input stream of the opened file.
	 */
	virtual std::shared_ptr<std::istream> open_read(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::in) const = 0;

	/**
	 * @brief Opens a file for writing.
	 *
	 * @param filename Name of the file to be opened.
	 * @param mode     Open mode for the file.
	 * @return Output stream of the opened file.
	 */
	virtual std::shared_ptr<std::ostream> open_write(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::out) = 0;

	/**
	 * @brief Converts a given path to its absolute form, which is a fully qualified path that includes the root directory.
	 *
	 * @param[in] p Path to be converted to its absolute form.
	 * @return Absolute (although not necessarily canonical) form of \p p.
	 */
	std::filesystem::path absolute(std::filesystem::path const& p) const {
		return p.is_absolute() ? p : this->current_path() / p;
	}

	/**
	 * @brief Converts a given path to its canonical form, which is an absolute path with symbolic links resolved and redundant elements like ".", ".." removed.
	 *
	 * @param[in] p Path to be converted to its canonical form.
	 * @return Canonical form of \p p.
	 *
	 * @exception \ref std::filesystem::filesystem_error if \p p does not existing or insufficient permission.
	 */
	virtual std::filesystem::path canonical(std::filesystem::path const& p) const = 0;

	/**
	 * @brief Converts a given path to its canonical form, which is an absolute path with symbolic links resolved and redundant elements like ".", ".." removed.
	 *
	 * @param[in]  p  Path to be converted to its canonical form.
	 * @param[out] ec Error code to store error status to.
	 * @return Canonical form of \p p.
	 */
	virtual std::filesystem::path canonical(std::filesystem::path const& p, std::error_code& ec) const = 0;

	/**
	 * @brief Creates a directory.
	 *
	 * @param[in] p Path to the directory to be created.
	 * @return `true` if the directory was successfully created, `false` if it already exists.
	 */
	virtual bool create_directory(std::filesystem::path const& p) = 0;

	/**
	 * @brief Creates a directory.
	 *
	 * @param[in]  p  Path to the directory to be created.
	 * @param[out] ec Error code to store error status to.
	 * @return `true` if the directory was successfully created, `false` otherwise.
	 */
	virtual bool create_directory(std::filesystem::path const& p, std::error_code& ec) noexcept = 0;

	/**
	 * @brief Creates directories and any missing parent directories.
	 *
	 * @param[in] p  Path to the directory to be created.
	 * @return `true` if a directory was created, `false` otherwise.
	 */
	virtual bool create_directories(std::filesystem::path const& p) = 0;

	/**
	 * @brief Creates directories and any missing parent directories.
	 *
	 * @param[in]  p  Path to the directory to be created.
	 * @param[out] ec Error code to store error status to.
	 * @return `true` if a directory was created, `false` otherwise.
	 */
	virtual bool create_directories(std::filesystem::path const& p, std::error_code& ec) = 0;

	/**
	 * @brief Creates a hard link.
	 *
	 * @param[in] target Path to the file to link to.
	 * @param[in] link   Path to the hard link to be created.
	 *
	 * @exception \ref std::filesystem::filesystem_error with `std::errc::file_exists` if \p link already exists.
	 */
	virtual void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link) = 0;

	/**
	 * @brief Creates a hard link.
	 *
	 * @param[in]  target Path to the file to link to.
	 * @param[in]  link   Path to the hard link to be created.
	 * @param[out] ec     Error code to store error status to.
	 */
	virtual void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link, std::error_code& ec) noexcept = 0;

	/**
	 * @brief Creates a symbolic link.
	 *
	 * @param[in] target Path to the file or directory to link to.
	 * @param[in] link   Path to the symbolic link to be created.
	 */
	virtual void create_symlink(std::filesystem::path const& target, std::filesystem::path const& link) = 0;

	/**
	 * @brief Retrieves path of the current working directory.
	 *
	 * @return Path of the current working directory.
	 */
	virtual std::filesystem::path current_path() const = 0;

	bool exists(std::filesystem::file_status s) const noexcept {
		return this->status_known(s) && s.type() != std::filesystem::file_type::not_found;
	}

	bool exists(std::filesystem::path const& p) const {
		return this->exists(this->status(p));
	}

	bool exists(std::filesystem::path const& p, std::error_code& ec) const noexcept {
		auto const s = this->status(p, ec);
		if(this->status_known(s)) {
			ec.clear();
		}
		return this->exists(s);
	}

	/**
	 * @brief Checks whether two paths refer to the same file.
	 *
	 * @param[in] p1 Path to the first file.
	 * @param[in] p2 Path to the second file.
	 * @return `true` if \p p1 and \p p2 resolve to the same file, `false` otherwise.
	 *
	 * @exception \ref std::filesystem::filesystem_error if neither \p p1 nor \p p2 exists.
	 */
	virtual bool equivalent(std::filesystem::path const& p1, std::filesystem::path const& p2) const = 0;

	/**
	 * @brief Retrieves the number of hard links referring to a file.
	 *
	 * @param[in] p Path to the file to examine.
	 * @return The number of hard links to \p p.
	 */
	virtual std::uintmax_t hard_link_count(std::filesystem::path const& p) const = 0;

	/**
	 * @brief Changes permissions of a file.
	 *
	 * @param[in] p    Path to the file to change permissions of.
	 * @param[in] prms Permissions to set, add, or remove.
	 * @param[in] opts Options controlling how \p prms applied.
	 */
	virtual void permissions(std::filesystem::path const& p, std::filesystem::perms prms, std::filesystem::perm_options opts = std::filesystem::perm_options::replace) = 0;

	/**
	 * @brief Removes a file or a directory with all its contents, recursively.
	 *   Symbolic links are removed, not followed.
	 *
	 * @param[in] p Path to the file or directory to remove.
	 * @return The number of files and directories removed.
	 */
	virtual std::uintmax_t remove_all(std::filesystem::path const& p) = 0;

	/**
	 * @brief Removes a file or a directory with all its contents, recursively.
	 *
	 * @param[in]  p  Path to the file or directory to remove.
	 * @param[out] ec Error code to store error status to.
	 * @return The number of files and directories removed, or `static_cast<std::uintmax_t>(-1)` on error.
	 */
	virtual std::uintmax_t remove_all(std::filesystem::path const& p, std::error_code& ec) = 0;

	/**
	 * @brief Determines the type and attributes of the file, following symbolic links.
	 *
	 * @param[in] p Path to examine.
	 * @return The file status.
	 */
	virtual std::filesystem::file_status status(std::filesystem::path const& p) const = 0;

	/**
	 * @brief Determines the type and attributes of the file, following symbolic links.
	 *
	 * @param[in]  p  Path to examine.
	 * @param[out] ec Error code to store error status to.
	 * @return The file status.
	 */
	virtual std::filesystem::file_status status(std::filesystem::path const& p, std::error_code& ec) const noexcept = 0;

	/**
	 * @brief Determines the type and attributes of the file without following a symbolic link at the last element.
	 *
	 * @param[in] p Path to examine.
	 * @return The file status.
	 */
	virtual std::filesystem::file_status symlink_status(std::filesystem::path const& p) const = 0;

	/**
	 * @brief Determines the type and attributes of the file without following a symbolic link at the last element.
	 *
	 * @param[in]  p  Path to examine.
	 * @param[out] ec Error code to store error status to.
	 * @return The file status.
	 */
	virtual std::filesystem::file_status symlink_status(std::filesystem::path const& p, std::error_code& ec) const noexcept = 0;

	/**
	 * @brief Retrieves the directory location suitable for temporary files.
	 *
	 * @return Path to the temporary directory.
	 */
	virtual std::filesystem::path temp_directory_path() const = 0;

	bool is_directory(std::filesystem::file_status s) const noexcept {
		return s.type() == std::filesystem::file_type::directory;
	}

	bool is_directory(std::filesystem::path const& p) const {
		return this->is_directory(this->status(p));
	}

	bool is_directory(std::filesystem::path const& p, std::error_code& ec) const noexcept {
		return this->is_directory(this->status(p, ec));
	}

	bool is_regular_file(std::filesystem::file_status s) const noexcept {
		return s.type() == std::filesystem::file_type::regular;
	}

	bool is_regular_file(std::filesystem::path const& p) const {
		return this->is_regular_file(this->status(p));
	}

	bool is_regular_file(std::filesystem::path const& p, std::error_code& ec) const noexcept {
		return this->is_regular_file(this->status(p, ec));
	}

	bool is_symlink(std::filesystem::file_status s) const noexcept {
		return s.type() == std::filesystem::file_type::symlink;
	}

	bool is_symlink(std::filesystem::path const& p) const {
		return this->is_symlink(this->symlink_status(p));
	}

	bool status_known(std::filesystem::file_status s) const noexcept {
		return s.type() != std::filesystem::file_type::none;
	}

   protected:
	// Directory symlinks are never followed.
	virtual std::shared_ptr<RecursiveCursor> recursive_cursor_(std::filesystem::path const& p) const = 0;

	friend class recursive_directory_iterator;
};

/**
 * @brief Creates a filesystem backed by the host operating system.
 *   Relative paths are resolved against the working directory of the process at the time of the call.
 */
std::shared_ptr<Fs> make_os_fs();

/**
 * @brief Creates an empty in-memory filesystem.
 *   Hard links share the same file, so `equivalent` and `hard_link_count` behave as on POSIX.
 *
 * @param temp_dir Path reported by `Fs::temp_directory_path`; it is created with the filesystem.
 */
std::shared_ptr<Fs> make_mem_fs(std::filesystem::path const& temp_dir = "/tmp");

}  // namespace layerfs
