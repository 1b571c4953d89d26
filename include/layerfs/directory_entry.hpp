#pragma once

#include <filesystem>
#include <utility>

namespace layerfs {

class directory_entry {
   public:
	directory_entry() noexcept = default;

	directory_entry(std::filesystem::path p, std::filesystem::file_status s)
	    : path_(std::move(p))
	    , symlink_status_(s) { }

	directory_entry(directory_entry const& other)     = default;
	directory_entry(directory_entry&& other) noexcept = default;

	directory_entry& operator=(directory_entry const& other)     = default;
	directory_entry& operator=(directory_entry&& other) noexcept = default;

	[[nodiscard]] std::filesystem::path const& path() const noexcept {
		return this->path_;
	}

	operator std::filesystem::path const&() const noexcept {
		return this->path_;
	}

	/**
	 * @brief Retrieves the status of the entry itself; a symbolic link is reported as a symbolic link.
	 */
	[[nodiscard]] std::filesystem::file_status symlink_status() const noexcept {
		return this->symlink_status_;
	}

	[[nodiscard]] bool is_directory() const noexcept {
		return this->symlink_status_.type() == std::filesystem::file_type::directory;
	}

	[[nodiscard]] bool is_regular_file() const noexcept {
		return this->symlink_status_.type() == std::filesystem::file_type::regular;
	}

	[[nodiscard]] bool is_symlink() const noexcept {
		return this->symlink_status_.type() == std::filesystem::file_type::symlink;
	}

	bool operator==(directory_entry const& rhs) const noexcept {
		return this->path_ == rhs.path_;
	}

   private:
	std::filesystem::path        path_;
	std::filesystem::file_status symlink_status_;
};

}  // namespace layerfs
