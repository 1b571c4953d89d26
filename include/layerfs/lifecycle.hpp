#pragma once

#include <filesystem>
#include <functional>
#include <string_view>

#include <signal.h>

#include "layerfs/fs.hpp"

namespace layerfs {

/**
 * @brief Retrieves the per-user data directory of an application.
 *   `$XDG_DATA_HOME/<app>` or `$HOME/.local/share/<app>`; `$HOME/Library/Application Support/<app>` on macOS.
 *
 * @exception \ref layerfs::ConfigError if neither `XDG_DATA_HOME` nor `HOME` is set.
 */
std::filesystem::path user_data_dir(std::string_view app);

/**
 * @brief Owns a uniquely named directory that is removed when the owner goes out of scope.
 *   The directory may be removed earlier by `cleanup`; removal happens at most once.
 */
class ScopedOverlayDir {
   public:
	enum class State {
		allocated,
		populated,
		active,
		cleaned_up,
	};

	/**
	 * @brief Creates \p parent if absent and allocates a new directory in it.
	 *
	 * @exception \ref std::filesystem::filesystem_error if a directory cannot be created.
	 */
	ScopedOverlayDir(Fs& fs, std::filesystem::path const& parent);

	ScopedOverlayDir(ScopedOverlayDir const& other) = delete;
	ScopedOverlayDir(ScopedOverlayDir&& other)      = delete;

	~ScopedOverlayDir();

	ScopedOverlayDir& operator=(ScopedOverlayDir const& other) = delete;
	ScopedOverlayDir& operator=(ScopedOverlayDir&& other)      = delete;

	[[nodiscard]] std::filesystem::path const& path() const noexcept {
		return this->path_;
	}

	[[nodiscard]] State state() const noexcept {
		return this->state_;
	}

	void mark_populated();

	void mark_active();

	/**
	 * @brief Removes the directory with whatever it contains.
	 *
	 * @return `true` if this call performed the removal, `false` if it was already cleaned up.
	 */
	bool cleanup() noexcept;

   private:
	Fs&                   fs_;
	std::filesystem::path path_;
	State                 state_ = State::allocated;
};

/**
 * @brief Catches `SIGINT` and `SIGTERM` while in scope and restores the previous handlers on destruction.
 *   The handler only records the signal; owners poll `signal_number` or block in `wait`.
 *   At most one guard can exist at a time.
 */
class SignalGuard {
   public:
	SignalGuard();

	SignalGuard(SignalGuard const& other) = delete;
	SignalGuard(SignalGuard&& other)      = delete;

	~SignalGuard();

	SignalGuard& operator=(SignalGuard const& other) = delete;
	SignalGuard& operator=(SignalGuard&& other)      = delete;

	// 0 until a termination signal was received.
	[[nodiscard]] int signal_number() const noexcept;

	[[nodiscard]] bool triggered() const noexcept {
		return this->signal_number() != 0;
	}

	/**
	 * @brief Blocks until a termination signal is received or \p done returns `true`.
	 *   \p done is evaluated on entry and after each delivered signal, including `SIGCHLD`.
	 */
	void wait(std::function<bool()> const& done = nullptr) const;

   private:
	struct sigaction prev_int_  = {};
	struct sigaction prev_term_ = {};
	struct sigaction prev_chld_ = {};
};

}  // namespace layerfs
