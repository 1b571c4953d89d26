#include "layerfs/impl/os_fs.hpp"
#include "layerfs/fs.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

#include "layerfs/directory_entry.hpp"

namespace fs = std::filesystem;

namespace layerfs {

namespace impl {

class StdFs::RecursiveCursor_: public Fs::RecursiveCursor {
   public:
	RecursiveCursor_(fs::path const& p, fs::path const& os_path)
	    : path_(p)
	    , os_path_(os_path)
	    , it_(this->os_path_) {
		this->refresh_();
	}

	[[nodiscard]] directory_entry const& value() const override {
		return this->entry_;
	}

	[[nodiscard]] bool at_end() const override {
		return this->it_ == fs::end(this->it_);
	}

	void increment() override {
		if(this->at_end()) {
			return;
		}

		++this->it_;
		this->refresh_();
	}

   private:
	void refresh_() {
		if(this->at_end()) {
			this->entry_ = directory_entry();
			return;
		}

		auto const r = this->it_->path().lexically_relative(this->os_path_);
		this->entry_ = directory_entry(this->path_ / r, this->it_->symlink_status());
	}

	fs::path path_;
	fs::path os_path_;

	fs::recursive_directory_iterator it_;

	directory_entry entry_;
};

std::shared_ptr<Fs::RecursiveCursor> StdFs::recursive_cursor_(fs::path const& p) const {
	return std::make_shared<StdFs::RecursiveCursor_>(p, this->normal_(p));
}

}  // namespace impl

std::shared_ptr<Fs> make_os_fs() {
	return std::make_shared<impl::StdFs>(fs::current_path());
}

}  // namespace layerfs
