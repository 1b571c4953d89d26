#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include "layerfs/impl/mem_file.hpp"
#include "layerfs/impl/utils.hpp"

#include "layerfs/fs.hpp"

namespace layerfs {
namespace impl {

class MemFs: public Fs {
   public:
	MemFs(std::filesystem::path temp_dir);

	std::shared_ptr<std::istream> open_read(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::in) const override;

	std::shared_ptr<std::ostream> open_write(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::out) override;

	std::filesystem::path canonical(std::filesystem::path const& p) const override;

	std::filesystem::path canonical(std::filesystem::path const& p, std::error_code& ec) const override {
		return handle_error([&] { return this->canonical(p); }, ec);
	}

	bool create_directory(std::filesystem::path const& p) override;

	bool create_directory(std::filesystem::path const& p, std::error_code& ec) noexcept override {
		return handle_error([&] { return this->create_directory(p); }, ec);
	}

	bool create_directories(std::filesystem::path const& p) override;

	bool create_directories(std::filesystem::path const& p, std::error_code& ec) override {
		return handle_error([&] { return this->create_directories(p); }, ec);
	}

	void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link) override;

	void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link, std::error_code& ec) noexcept override {
		handle_error([&] { this->create_hard_link(target, link); return 0; }, ec);
	}

	void create_symlink(std::filesystem::path const& target, std::filesystem::path const& link) override;

	std::filesystem::path current_path() const override {
		return "/";
	}

	bool equivalent(std::filesystem::path const& p1, std::filesystem::path const& p2) const override;

	std::uintmax_t hard_link_count(std::filesystem::path const& p) const override;

	void permissions(std::filesystem::path const& p, std::filesystem::perms prms, std::filesystem::perm_options opts) override;

	std::uintmax_t remove_all(std::filesystem::path const& p) override;

	std::uintmax_t remove_all(std::filesystem::path const& p, std::error_code& ec) override {
		return handle_error([&] { return this->remove_all(p); }, ec, static_cast<std::uintmax_t>(-1));
	}

	std::filesystem::file_status status(std::filesystem::path const& p) const override;

	std::filesystem::file_status status(std::filesystem::path const& p, std::error_code& ec) const noexcept override;

	std::filesystem::file_status symlink_status(std::filesystem::path const& p) const override;

	std::filesystem::file_status symlink_status(std::filesystem::path const& p, std::error_code& ec) const noexcept override;

	std::filesystem::path temp_directory_path() const override {
		return this->temp_;
	}

   protected:
	std::shared_ptr<RecursiveCursor> recursive_cursor_(std::filesystem::path const& p) const override;

   private:
	class RecursiveCursor_;

	struct Resolved_ {
		std::shared_ptr<File> file;

		// Canonical path of `file`.
		std::filesystem::path path;
	};

	struct Slot_ {
		std::shared_ptr<Directory> parent;
		std::string                name;
	};

	// Sets `ec` and returns an empty result if `p` cannot be resolved.
	Resolved_ navigate_(std::filesystem::path const& p, bool follow_last, std::error_code& ec) const;

	Resolved_ navigate_(std::filesystem::path const& p, bool follow_last) const;

	// Resolves the directory that would hold the last element of `p`.
	Slot_ slot_of_(std::filesystem::path const& p) const;

	std::filesystem::file_status status_(std::filesystem::path const& p, bool follow_last, std::error_code& ec) const noexcept;

	std::shared_ptr<Directory> root_;
	std::filesystem::path      temp_;
};

}  // namespace impl
}  // namespace layerfs
