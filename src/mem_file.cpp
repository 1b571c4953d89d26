#include "layerfs/impl/mem_file.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace layerfs {
namespace impl {

void File::perms(fs::perms prms, fs::perm_options opts) {
	switch(opts & ~fs::perm_options::nofollow) {
	case fs::perm_options::replace: {
		this->perms_ = prms & fs::perms::mask;
		break;
	}
	case fs::perm_options::add: {
		this->perms_ |= (prms & fs::perms::mask);
		break;
	}
	case fs::perm_options::remove: {
		this->perms_ &= ~(prms & fs::perms::mask);
		break;
	}

	default: {
		throw std::invalid_argument("exactly one of replace, add, or remove must be given");
	}
	}
}

std::shared_ptr<std::istream> RegularFile::open_read(std::ios_base::openmode mode) const {
	return std::make_shared<std::istringstream>(*this->data_, mode);
}

std::shared_ptr<std::ostream> RegularFile::open_write(std::ios_base::openmode mode) {
	using ios = std::ios_base;

	mode &= ios::out | ios::trunc | ios::app;
	switch(int(mode)) {
	case int(ios::out):
	case int(ios::trunc):
	case int(ios::app):
	case int(ios::out | ios::trunc):
	case int(ios::out | ios::app): {
		break;
	}

	default: {
		auto s = std::make_shared<std::stringstream>();
		s->setstate(ios::failbit);
		return s;
	}
	}

	// Content is committed when the stream is released so every hard link observes the whole write.
	return std::shared_ptr<std::ostringstream>(new std::ostringstream(), [mode, self = std::weak_ptr(this->shared_from_this())](std::ostringstream* p) {
		auto data = std::move(*p).str();
		delete p;

		auto f = self.lock();
		if(!f) {
			return;
		}

		if((mode & ios::app) == ios::app) {
			f->data_->append(data);
		} else {
			*f->data_ = std::move(data);
		}
	});
}

std::shared_ptr<File> Directory::next(std::string const& name) const {
	auto const it = this->files_.find(name);
	if(it == this->files_.end()) {
		return nullptr;
	}

	return it->second;
}

bool Directory::insert(std::string const& name, std::shared_ptr<File> file) {
	auto const [it, ok] = this->files_.emplace(name, std::move(file));
	if(ok) {
		++it->second->links_;
	}

	return ok;
}

std::uintmax_t Directory::erase(std::string const& name) {
	auto const it = this->files_.find(name);
	if(it == this->files_.end()) {
		return 0;
	}

	std::uintmax_t n = 1;
	if(auto d = std::dynamic_pointer_cast<Directory>(it->second); d) {
		while(!d->files_.empty()) {
			n += d->erase(d->files_.begin()->first);
		}
	}

	--it->second->links_;
	this->files_.erase(it);
	return n;
}

std::uintmax_t Directory::subdirectory_count() const {
	std::uintmax_t n = 0;
	for(auto const& [_, f]: this->files_) {
		if(f->type() == fs::file_type::directory) {
			++n;
		}
	}

	return n;
}

}  // namespace impl
}  // namespace layerfs
