#pragma once

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>

#include "layerfs/directory_entry.hpp"
#include "layerfs/fs.hpp"

namespace layerfs {

/**
 * @brief Iterates over the entries of a directory and, recursively, of its subdirectories.
 *   Symbolic links to directories are reported but not descended into.
 */
class recursive_directory_iterator {
   public:
	using value_type        = layerfs::directory_entry;
	using difference_type   = std::ptrdiff_t;
	using pointer           = layerfs::directory_entry const*;
	using reference         = layerfs::directory_entry const&;
	using iterator_category = std::input_iterator_tag;

	recursive_directory_iterator() noexcept = default;

	/**
	 * @brief Constructs an iterator that refers to the first entry under \p p.
	 *
	 * @exception \ref std::filesystem::filesystem_error if \p p is not a directory.
	 */
	recursive_directory_iterator(Fs const& fs, std::filesystem::path const& p)
	    : cursor_(fs.recursive_cursor_(p)) {
		if(this->cursor_->at_end()) {
			this->cursor_.reset();
		}
	}

	recursive_directory_iterator(recursive_directory_iterator const& rhs)     = default;
	recursive_directory_iterator(recursive_directory_iterator&& rhs) noexcept = default;

	recursive_directory_iterator& operator=(recursive_directory_iterator const& other)     = default;
	recursive_directory_iterator& operator=(recursive_directory_iterator&& other) noexcept = default;

	directory_entry const& operator*() const {
		return this->cursor_->value();
	}

	directory_entry const* operator->() const {
		return &this->cursor_->value();
	}

	recursive_directory_iterator& operator++() {
		this->cursor_->increment();
		if(this->cursor_->at_end()) {
			this->cursor_.reset();
		}
		return *this;
	}

	bool operator==(recursive_directory_iterator const& rhs) const noexcept = default;

   private:
	std::shared_ptr<Fs::RecursiveCursor> cursor_;
};

inline recursive_directory_iterator begin(recursive_directory_iterator iter) noexcept {
	return iter;
}

inline recursive_directory_iterator end(recursive_directory_iterator /*unused*/) noexcept {
	return {};
}

}  // namespace layerfs
