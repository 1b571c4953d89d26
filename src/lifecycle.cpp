#include "layerfs/lifecycle.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <signal.h>

#include <spdlog/spdlog.h>

#include "layerfs/error.hpp"
#include "layerfs/fs.hpp"
#include "layerfs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace layerfs {

namespace {

constexpr int MaxAllocationAttempts = 100;

volatile std::sig_atomic_t received_ = 0;

bool guarded_ = false;

void on_termination_(int sig) {
	received_ = sig;
}

void on_child_(int /*sig*/) {
	// Only interrupts `sigsuspend` in `SignalGuard::wait`.
}

void install_(int sig, void (*handler)(int), int flags, struct sigaction* prev) {
	struct sigaction sa = {};
	sa.sa_handler       = handler;
	sa.sa_flags         = flags;
	sigemptyset(&sa.sa_mask);

	if(sigaction(sig, &sa, prev) != 0) {
		throw std::system_error(errno, std::generic_category(), "cannot install handler for signal " + std::to_string(sig));
	}
}

class MaskRestore_ {
   public:
	MaskRestore_(sigset_t mask)
	    : mask_(mask) { }

	~MaskRestore_() {
		sigprocmask(SIG_SETMASK, &this->mask_, nullptr);
	}

   private:
	sigset_t mask_;
};

}  // namespace

fs::path user_data_dir(std::string_view app) {
	char const* const home = std::getenv("HOME");

#if defined(__APPLE__)
	if(home == nullptr || *home == '\0') {
		throw ConfigError("HOME is not set");
	}
	return fs::path(home) / "Library" / "Application Support" / app;
#else
	if(char const* const xdg = std::getenv("XDG_DATA_HOME"); xdg != nullptr && *xdg != '\0') {
		return fs::path(xdg) / app;
	}
	if(home == nullptr || *home == '\0') {
		throw ConfigError("neither XDG_DATA_HOME nor HOME is set");
	}
	return fs::path(home) / ".local" / "share" / app;
#endif
}

ScopedOverlayDir::ScopedOverlayDir(Fs& fs, fs::path const& parent)
    : fs_(fs) {
	this->fs_.create_directories(parent);

	for(int i = 0; i < MaxAllocationAttempts; ++i) {
		auto p = parent / ("tmp" + impl::random_string(8, impl::Alphanumeric));
		if(!this->fs_.create_directory(p)) {
			continue;
		}

		try {
			this->fs_.permissions(p, fs::perms::owner_all);
		} catch(fs::filesystem_error const&) {
			std::error_code ec;
			this->fs_.remove_all(p, ec);
			throw;
		}

		this->path_ = std::move(p);
		spdlog::debug("allocated overlay {}", this->path_.string());
		return;
	}

	throw fs::filesystem_error("cannot allocate an overlay directory", parent, std::make_error_code(std::errc::file_exists));
}

ScopedOverlayDir::~ScopedOverlayDir() {
	this->cleanup();
}

void ScopedOverlayDir::mark_populated() {
	if(this->state_ != State::allocated) {
		throw std::logic_error("overlay can be populated only once");
	}

	this->state_ = State::populated;
}

void ScopedOverlayDir::mark_active() {
	if(this->state_ != State::populated) {
		throw std::logic_error("overlay must be populated before it is published");
	}

	this->state_ = State::active;
}

bool ScopedOverlayDir::cleanup() noexcept {
	if(this->state_ == State::cleaned_up) {
		return false;
	}

	this->state_ = State::cleaned_up;

	std::error_code ec;
	auto const      n = this->fs_.remove_all(this->path_, ec);
	if(ec) {
		spdlog::warn("cannot remove overlay {}: {}", this->path_.string(), ec.message());
	} else {
		spdlog::debug("removed overlay {} ({} entries)", this->path_.string(), n);
	}

	return true;
}

SignalGuard::SignalGuard() {
	if(guarded_) {
		throw std::logic_error("another SignalGuard is active");
	}

	received_ = 0;

	// Without SA_RESTART so blocking calls return with EINTR.
	install_(SIGINT, on_termination_, 0, &this->prev_int_);
	install_(SIGTERM, on_termination_, 0, &this->prev_term_);
	install_(SIGCHLD, on_child_, SA_NOCLDSTOP, &this->prev_chld_);

	guarded_ = true;
}

SignalGuard::~SignalGuard() {
	sigaction(SIGINT, &this->prev_int_, nullptr);
	sigaction(SIGTERM, &this->prev_term_, nullptr);
	sigaction(SIGCHLD, &this->prev_chld_, nullptr);

	guarded_ = false;
}

int SignalGuard::signal_number() const noexcept {
	return received_;
}

void SignalGuard::wait(std::function<bool()> const& done) const {
	sigset_t blocked;
	sigemptyset(&blocked);
	sigaddset(&blocked, SIGINT);
	sigaddset(&blocked, SIGTERM);
	sigaddset(&blocked, SIGCHLD);

	sigset_t prev;
	if(sigprocmask(SIG_BLOCK, &blocked, &prev) != 0) {
		throw std::system_error(errno, std::generic_category(), "cannot block signals");
	}

	MaskRestore_ const restore(prev);

	sigset_t unblocked = prev;
	sigdelset(&unblocked, SIGINT);
	sigdelset(&unblocked, SIGTERM);
	sigdelset(&unblocked, SIGCHLD);

	while(!this->triggered() && !(done && done())) {
		sigsuspend(&unblocked);
	}
}

}  // namespace layerfs
