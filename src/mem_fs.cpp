#include "layerfs/impl/mem_fs.hpp"
#include "layerfs/fs.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "layerfs/directory_entry.hpp"
#include "layerfs/impl/mem_file.hpp"
#include "layerfs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace layerfs {

namespace impl {

namespace {

constexpr int MaxSymlinkHops = 40;

fs::filesystem_error err_(fs::path const& p, std::errc e) {
	return fs::filesystem_error("", p, std::make_error_code(e));
}

fs::filesystem_error err_(fs::path const& p1, fs::path const& p2, std::errc e) {
	return fs::filesystem_error("", p1, p2, std::make_error_code(e));
}

}  // namespace

class MemFs::RecursiveCursor_: public Fs::RecursiveCursor {
   public:
	RecursiveCursor_(Directory const& d, fs::path const& p) {
		this->collect_(d, p);
	}

	[[nodiscard]] directory_entry const& value() const override {
		return this->entries_.at(this->pos_);
	}

	[[nodiscard]] bool at_end() const override {
		return this->pos_ >= this->entries_.size();
	}

	void increment() override {
		if(this->at_end()) {
			return;
		}

		++this->pos_;
	}

   private:
	void collect_(Directory const& d, fs::path const& p) {
		for(auto const& [name, f]: d.entries()) {
			auto const next = p / name;
			this->entries_.emplace_back(next, fs::file_status(f->type(), f->perms()));

			if(auto const sub = std::dynamic_pointer_cast<Directory const>(f); sub) {
				this->collect_(*sub, next);
			}
		}
	}

	std::vector<directory_entry> entries_;
	std::size_t                  pos_ = 0;
};

MemFs::MemFs(fs::path temp_dir)
    : root_(std::make_shared<Directory>())
    , temp_((fs::path("/") / temp_dir).lexically_normal()) {
	this->create_directories(this->temp_);
}

MemFs::Resolved_ MemFs::navigate_(fs::path const& p, bool follow_last, std::error_code& ec) const {
	std::vector<std::pair<std::string, std::shared_ptr<File>>> stack;
	stack.emplace_back("", this->root_);

	std::deque<fs::path> pending;
	for(auto const& e: this->absolute(p).relative_path()) {
		pending.push_back(e);
	}

	int hops = 0;
	while(!pending.empty()) {
		auto const name = pending.front().string();
		pending.pop_front();

		if(name.empty() || name == ".") {
			continue;
		}
		if(name == "..") {
			if(stack.size() > 1) {
				stack.pop_back();
			}
			continue;
		}

		auto const d = std::dynamic_pointer_cast<Directory>(stack.back().second);
		if(!d) {
			ec = std::make_error_code(std::errc::not_a_directory);
			return {};
		}

		auto next = d->next(name);
		if(!next) {
			ec = std::make_error_code(std::errc::no_such_file_or_directory);
			return {};
		}

		auto const s = std::dynamic_pointer_cast<Symlink>(next);
		if(s && (follow_last || !pending.empty())) {
			if(++hops > MaxSymlinkHops) {
				ec = std::make_error_code(std::errc::too_many_symbolic_link_levels);
				return {};
			}

			auto const& target = s->target();
			if(target.is_absolute()) {
				stack.resize(1);
			}

			auto const rel = target.relative_path();
			for(auto it = rel.end(); it != rel.begin();) {
				--it;
				pending.push_front(*it);
			}
			continue;
		}

		stack.emplace_back(name, std::move(next));
	}

	fs::path resolved = "/";
	for(std::size_t i = 1; i < stack.size(); ++i) {
		resolved /= stack[i].first;
	}

	ec.clear();
	return {stack.back().second, std::move(resolved)};
}

MemFs::Resolved_ MemFs::navigate_(fs::path const& p, bool follow_last) const {
	std::error_code ec;
	auto r = this->navigate_(p, follow_last, ec);
	if(ec) {
		throw fs::filesystem_error("", p, ec);
	}

	return r;
}

MemFs::Slot_ MemFs::slot_of_(fs::path const& p) const {
	auto const a    = strip_trailing_separator(this->absolute(p).lexically_normal());
	auto const name = a.filename().string();
	if(name.empty() || name == "." || name == "..") {
		throw err_(p, std::errc::invalid_argument);
	}

	auto d = std::dynamic_pointer_cast<Directory>(this->navigate_(a.parent_path(), true).file);
	if(!d) {
		throw err_(p, std::errc::not_a_directory);
	}

	return {std::move(d), name};
}

fs::file_status MemFs::status_(fs::path const& p, bool follow_last, std::error_code& ec) const noexcept {
	auto const r = this->navigate_(p, follow_last, ec);
	if(ec) {
		if(ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
			return fs::file_status(fs::file_type::not_found);
		}
		return fs::file_status(fs::file_type::none);
	}

	return fs::file_status(r.file->type(), r.file->perms());
}

std::shared_ptr<std::istream> MemFs::open_read(fs::path const& filename, std::ios_base::openmode mode) const {
	std::error_code ec;

	auto const r = this->navigate_(filename, true, ec);
	auto const f = std::dynamic_pointer_cast<RegularFile>(r.file);
	if(ec || !f) {
		auto s = std::make_shared<std::istringstream>();
		s->setstate(std::ios_base::failbit);
		return s;
	}

	return f->open_read(mode | std::ios_base::in);
}

std::shared_ptr<std::ostream> MemFs::open_write(fs::path const& filename, std::ios_base::openmode mode) {
	constexpr auto fail = [] {
		auto s = std::make_shared<std::ostringstream>();
		s->setstate(std::ios_base::failbit);
		return s;
	};

	mode |= std::ios_base::out;

	std::error_code ec;
	if(auto const r = this->navigate_(filename, true, ec); !ec) {
		auto const f = std::dynamic_pointer_cast<RegularFile>(r.file);
		if(!f) {
			// File exists but not a regular file.
			return fail();
		}

		return f->open_write(mode);
	}

	Slot_ slot;
	try {
		slot = this->slot_of_(filename);
	} catch(fs::filesystem_error const&) {
		return fail();
	}
	if(!slot.parent->writable()) {
		return fail();
	}

	auto f = std::make_shared<RegularFile>();
	if(!slot.parent->insert(slot.name, f)) {
		// Dangling symlink.
		return fail();
	}

	return f->open_write(mode);
}

fs::path MemFs::canonical(fs::path const& p) const {
	return this->navigate_(p, true).path;
}

bool MemFs::create_directory(fs::path const& p) {
	std::error_code ec;
	if(this->is_directory(p, ec)) {
		return false;
	}

	auto const [d, name] = this->slot_of_(p);
	if(d->next(name)) {
		throw err_(p, std::errc::file_exists);
	}
	if(!d->writable()) {
		throw err_(p, std::errc::permission_denied);
	}

	d->insert(name, std::make_shared<Directory>());
	return true;
}

bool MemFs::create_directories(fs::path const& p) {
	auto const a = strip_trailing_separator(this->absolute(p).lexically_normal());

	bool     created = false;
	fs::path cur;
	for(auto const& e: a) {
		cur /= e;
		if(!cur.has_relative_path()) {
			continue;
		}

		std::error_code ec;
		auto const      s = this->status(cur, ec);
		if(this->is_directory(s)) {
			continue;
		}
		if(this->exists(s)) {
			throw err_(cur, std::errc::not_a_directory);
		}

		created = this->create_directory(cur) || created;
	}

	return created;
}

void MemFs::create_hard_link(fs::path const& target, fs::path const& link) {
	auto const r = this->navigate_(target, false);
	if(r.file->type() == fs::file_type::directory) {
		throw err_(target, link, std::errc::operation_not_permitted);
	}

	auto const [d, name] = this->slot_of_(link);
	if(d->next(name)) {
		throw err_(target, link, std::errc::file_exists);
	}
	if(!d->writable()) {
		throw err_(target, link, std::errc::permission_denied);
	}

	d->insert(name, r.file);
}

void MemFs::create_symlink(fs::path const& target, fs::path const& link) {
	auto const [d, name] = this->slot_of_(link);
	if(d->next(name)) {
		throw err_(target, link, std::errc::file_exists);
	}
	if(!d->writable()) {
		throw err_(target, link, std::errc::permission_denied);
	}

	d->insert(name, std::make_shared<Symlink>(target));
}

bool MemFs::equivalent(fs::path const& p1, fs::path const& p2) const {
	std::error_code ec1;
	std::error_code ec2;

	auto const r1 = this->navigate_(p1, true, ec1);
	auto const r2 = this->navigate_(p2, true, ec2);
	if(ec1 && ec2) {
		throw fs::filesystem_error("", p1, p2, ec1);
	}
	if(ec1 || ec2) {
		return false;
	}

	return r1.file == r2.file;
}

std::uintmax_t MemFs::hard_link_count(fs::path const& p) const {
	auto const f = this->navigate_(p, true).file;
	if(auto const d = std::dynamic_pointer_cast<Directory>(f); d) {
		return 2 + d->subdirectory_count();
	}

	return f->links();
}

void MemFs::permissions(fs::path const& p, fs::perms prms, fs::perm_options opts) {
	auto const follow = (opts & fs::perm_options::nofollow) == fs::perm_options{};
	this->navigate_(p, follow).file->perms(prms, opts);
}

std::uintmax_t MemFs::remove_all(fs::path const& p) {
	std::error_code ec;
	auto const      s = this->symlink_status(p, ec);
	if(s.type() == fs::file_type::not_found) {
		return 0;
	}
	if(!this->status_known(s)) {
		throw fs::filesystem_error("", p, ec);
	}

	auto const [d, name] = this->slot_of_(p);
	if(!d->writable()) {
		throw err_(p, std::errc::permission_denied);
	}

	return d->erase(name);
}

fs::file_status MemFs::status(fs::path const& p) const {
	std::error_code ec;
	auto const      s = this->status_(p, true, ec);
	if(!this->status_known(s)) {
		throw fs::filesystem_error("", p, ec);
	}

	return s;
}

fs::file_status MemFs::status(fs::path const& p, std::error_code& ec) const noexcept {
	return this->status_(p, true, ec);
}

fs::file_status MemFs::symlink_status(fs::path const& p) const {
	std::error_code ec;
	auto const      s = this->status_(p, false, ec);
	if(!this->status_known(s)) {
		throw fs::filesystem_error("", p, ec);
	}

	return s;
}

fs::file_status MemFs::symlink_status(fs::path const& p, std::error_code& ec) const noexcept {
	return this->status_(p, false, ec);
}

std::shared_ptr<Fs::RecursiveCursor> MemFs::recursive_cursor_(fs::path const& p) const {
	auto const d = std::dynamic_pointer_cast<Directory const>(this->navigate_(p, true).file);
	if(!d) {
		throw err_(p, std::errc::not_a_directory);
	}

	return std::make_shared<MemFs::RecursiveCursor_>(*d, p);
}

}  // namespace impl

std::shared_ptr<Fs> make_mem_fs(fs::path const& temp_dir) {
	return std::make_shared<impl::MemFs>(temp_dir);
}

}  // namespace layerfs
