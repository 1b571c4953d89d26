#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <system_error>
#include <utility>

#include "layerfs/impl/utils.hpp"

#include "layerfs/fs.hpp"

namespace layerfs {
namespace impl {

class StdFs: public Fs {
   public:
	StdFs(std::filesystem::path cwd)
	    : cwd_(std::move(cwd)) { }

	std::shared_ptr<std::istream> open_read(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::in) const override {
		return std::make_shared<std::ifstream>(this->normal_(filename), mode);
	}

	std::shared_ptr<std::ostream> open_write(std::filesystem::path const& filename, std::ios_base::openmode mode = std::ios_base::out) override {
		return std::make_shared<std::ofstream>(this->normal_(filename), mode);
	}

	std::filesystem::path canonical(std::filesystem::path const& p) const override {
		return std::filesystem::canonical(this->normal_(p));
	}

	std::filesystem::path canonical(std::filesystem::path const& p, std::error_code& ec) const override {
		return handle_error([&] { return this->canonical(p); }, ec);
	}

	bool create_directory(std::filesystem::path const& p) override {
		return std::filesystem::create_directory(this->normal_(p));
	}

	bool create_directory(std::filesystem::path const& p, std::error_code& ec) noexcept override {
		return std::filesystem::create_directory(this->normal_(p), ec);
	}

	bool create_directories(std::filesystem::path const& p) override {
		return std::filesystem::create_directories(this->normal_(p));
	}

	bool create_directories(std::filesystem::path const& p, std::error_code& ec) override {
		return std::filesystem::create_directories(this->normal_(p), ec);
	}

	void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link) override {
		std::filesystem::create_hard_link(this->normal_(target), this->normal_(link));
	}

	void create_hard_link(std::filesystem::path const& target, std::filesystem::path const& link, std::error_code& ec) noexcept override {
		std::filesystem::create_hard_link(this->normal_(target), this->normal_(link), ec);
	}

	void create_symlink(std::filesystem::path const& target, std::filesystem::path const& link) override {
		std::filesystem::create_symlink(target, this->normal_(link));
	}

	std::filesystem::path current_path() const override {
		return this->cwd_;
	}

	bool equivalent(std::filesystem::path const& p1, std::filesystem::path const& p2) const override {
		return std::filesystem::equivalent(this->normal_(p1), this->normal_(p2));
	}

	std::uintmax_t hard_link_count(std::filesystem::path const& p) const override {
		return std::filesystem::hard_link_count(this->normal_(p));
	}

	void permissions(std::filesystem::path const& p, std::filesystem::perms prms, std::filesystem::perm_options opts) override {
		std::filesystem::permissions(this->normal_(p), prms, opts);
	}

	std::uintmax_t remove_all(std::filesystem::path const& p) override {
		return std::filesystem::remove_all(this->normal_(p));
	}

	std::uintmax_t remove_all(std::filesystem::path const& p, std::error_code& ec) override {
		return std::filesystem::remove_all(this->normal_(p), ec);
	}

	std::filesystem::file_status status(std::filesystem::path const& p) const override {
		return std::filesystem::status(this->normal_(p));
	}

	std::filesystem::file_status status(std::filesystem::path const& p, std::error_code& ec) const noexcept override {
		return std::filesystem::status(this->normal_(p), ec);
	}

	std::filesystem::file_status symlink_status(std::filesystem::path const& p) const override {
		return std::filesystem::symlink_status(this->normal_(p));
	}

	std::filesystem::file_status symlink_status(std::filesystem::path const& p, std::error_code& ec) const noexcept override {
		return std::filesystem::symlink_status(this->normal_(p), ec);
	}

	std::filesystem::path temp_directory_path() const override {
		return std::filesystem::temp_directory_path();
	}

   protected:
	std::shared_ptr<RecursiveCursor> recursive_cursor_(std::filesystem::path const& p) const override;

   private:
	class RecursiveCursor_;

	std::filesystem::path normal_(std::filesystem::path const& p) const {
		return p.is_absolute() ? p : this->cwd_ / p;
	}

	std::filesystem::path cwd_;
};

}  // namespace impl
}  // namespace layerfs
