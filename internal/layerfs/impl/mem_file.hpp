#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace layerfs {
namespace impl {

class Directory;

class File {
   public:
	File(std::filesystem::perms perms)
	    : perms_(perms) { }

	virtual ~File() = default;

	[[nodiscard]] virtual std::filesystem::file_type type() const = 0;

	[[nodiscard]] std::filesystem::perms perms() const {
		return this->perms_;
	}

	void perms(std::filesystem::perms prms, std::filesystem::perm_options opts);

	// Number of directory entries referring to this file.
	[[nodiscard]] std::uintmax_t links() const {
		return this->links_;
	}

   private:
	friend class Directory;

	std::filesystem::perms perms_;
	std::uintmax_t         links_ = 0;
};

class RegularFile
    : public File
    , public std::enable_shared_from_this<RegularFile> {
   public:
	static constexpr auto Type = std::filesystem::file_type::regular;

	static constexpr auto DefaultPerms = std::filesystem::perms::owner_write
	    | std::filesystem::perms::owner_read
	    | std::filesystem::perms::group_read
	    | std::filesystem::perms::others_read;

	RegularFile()
	    : File(DefaultPerms)
	    , data_(std::make_shared<std::string>()) { }

	[[nodiscard]] std::filesystem::file_type type() const final {
		return Type;
	}

	[[nodiscard]] std::uintmax_t size() const {
		return this->data_->size();
	}

	[[nodiscard]] std::shared_ptr<std::istream> open_read(std::ios_base::openmode mode) const;

	std::shared_ptr<std::ostream> open_write(std::ios_base::openmode mode);

   private:
	std::shared_ptr<std::string> data_;
};

class Symlink: public File {
   public:
	static constexpr auto Type = std::filesystem::file_type::symlink;

	Symlink(std::filesystem::path target)
	    : File(std::filesystem::perms::all)
	    , target_(std::move(target)) { }

	[[nodiscard]] std::filesystem::file_type type() const final {
		return Type;
	}

	[[nodiscard]] std::filesystem::path const& target() const {
		return this->target_;
	}

   private:
	std::filesystem::path target_;
};

class Directory: public File {
   public:
	static constexpr auto Type = std::filesystem::file_type::directory;

	static constexpr auto DefaultPerms = std::filesystem::perms::all
	    & ~std::filesystem::perms::group_write
	    & ~std::filesystem::perms::others_write;

	using Entries = std::map<std::string, std::shared_ptr<File>>;

	Directory()
	    : File(DefaultPerms) { }

	[[nodiscard]] std::filesystem::file_type type() const final {
		return Type;
	}

	[[nodiscard]] bool writable() const {
		return (this->perms() & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
	}

	// returns nullptr if not exists.
	[[nodiscard]] std::shared_ptr<File> next(std::string const& name) const;

	// returns `false` if an entry with the same name exists.
	bool insert(std::string const& name, std::shared_ptr<File> file);

	// Removes the entry and, for a directory, everything below it.
	// Returns the number of entries removed.
	std::uintmax_t erase(std::string const& name);

	[[nodiscard]] Entries const& entries() const {
		return this->files_;
	}

	[[nodiscard]] std::uintmax_t subdirectory_count() const;

   private:
	Entries files_;
};

}  // namespace impl
}  // namespace layerfs
