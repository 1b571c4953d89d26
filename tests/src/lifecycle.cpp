#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include <signal.h>

#include <catch2/catch_test_macros.hpp>

#include <layerfs/error.hpp>
#include <layerfs/fs.hpp>
#include <layerfs/lifecycle.hpp>

#include "testing.hpp"

namespace fs = std::filesystem;

namespace {

class ScopedEnv {
   public:
	ScopedEnv(char const* name, char const* value)
	    : name_(name) {
		if(char const* const prev = std::getenv(name); prev != nullptr) {
			this->prev_ = prev;
		}

		if(value == nullptr) {
			::unsetenv(name);
		} else {
			::setenv(name, value, 1);
		}
	}

	~ScopedEnv() {
		if(this->prev_) {
			::setenv(this->name_.c_str(), this->prev_->c_str(), 1);
		} else {
			::unsetenv(this->name_.c_str());
		}
	}

   private:
	std::string                name_;
	std::optional<std::string> prev_;
};

}  // namespace

TEST_CASE("user_data_dir") {
	SECTION("XDG_DATA_HOME takes precedence") {
		ScopedEnv const xdg("XDG_DATA_HOME", "/xdg");
		ScopedEnv const home("HOME", "/home/alice");
#if defined(__APPLE__)
		CHECK("/home/alice/Library/Application Support/juv" == layerfs::user_data_dir("juv"));
#else
		CHECK("/xdg/juv" == layerfs::user_data_dir("juv"));
#endif
	}

	SECTION("falls back to HOME") {
		ScopedEnv const xdg("XDG_DATA_HOME", nullptr);
		ScopedEnv const home("HOME", "/home/alice");
#if !defined(__APPLE__)
		CHECK("/home/alice/.local/share/juv" == layerfs::user_data_dir("juv"));
#endif
	}

	SECTION("neither is set") {
		ScopedEnv const xdg("XDG_DATA_HOME", nullptr);
		ScopedEnv const home("HOME", nullptr);
		CHECK_THROWS_AS(layerfs::user_data_dir("juv"), layerfs::ConfigError);
	}
}

TEST_CASE("ScopedOverlayDir") {
	auto const mem    = layerfs::make_mem_fs();
	auto const parent = fs::path("/home/alice/.local/share/juv");

	SECTION("allocates a private directory in a new parent") {
		layerfs::ScopedOverlayDir const dir(*mem, parent);
		CHECK(parent == dir.path().parent_path());
		CHECK(0 == dir.path().filename().string().rfind("tmp", 0));
		CHECK(mem->is_directory(dir.path()));
		CHECK(fs::perms::owner_all == (mem->status(dir.path()).permissions() & fs::perms::all));
		CHECK(layerfs::ScopedOverlayDir::State::allocated == dir.state());
	}

	SECTION("names are unique") {
		layerfs::ScopedOverlayDir const a(*mem, parent);
		layerfs::ScopedOverlayDir const b(*mem, parent);
		CHECK(a.path() != b.path());
	}

	SECTION("is removed with its contents when it goes out of scope") {
		fs::path p;
		{
			layerfs::ScopedOverlayDir const dir(*mem, parent);
			p = dir.path();
			testing::write_file(*mem, p / "kernels/python3/kernel.json", testing::QuoteA);
		}

		CHECK(not mem->exists(p));
		CHECK(mem->is_directory(parent));
	}

	SECTION("sources of hard links survive removal") {
		testing::write_file(*mem, "/src/a.txt", testing::QuoteA);
		{
			layerfs::ScopedOverlayDir const dir(*mem, parent);
			mem->create_hard_link("/src/a.txt", dir.path() / "a.txt");
			REQUIRE(2 == mem->hard_link_count("/src/a.txt"));
		}

		CHECK(1 == mem->hard_link_count("/src/a.txt"));
		CHECK(testing::QuoteA == testing::read_all(*mem->open_read("/src/a.txt")));
	}

	SECTION("cleanup runs once") {
		layerfs::ScopedOverlayDir dir(*mem, parent);
		CHECK(dir.cleanup());
		CHECK(not mem->exists(dir.path()));
		CHECK(layerfs::ScopedOverlayDir::State::cleaned_up == dir.state());

		// A directory allocated later under the same name is not touched.
		mem->create_directory(dir.path());
		CHECK(not dir.cleanup());
		CHECK(mem->is_directory(dir.path()));
	}

	SECTION("state transitions") {
		layerfs::ScopedOverlayDir dir(*mem, parent);

		CHECK_THROWS_AS(dir.mark_active(), std::logic_error);

		dir.mark_populated();
		CHECK(layerfs::ScopedOverlayDir::State::populated == dir.state());
		CHECK_THROWS_AS(dir.mark_populated(), std::logic_error);

		dir.mark_active();
		CHECK(layerfs::ScopedOverlayDir::State::active == dir.state());

		dir.cleanup();
		CHECK_THROWS_AS(dir.mark_populated(), std::logic_error);
		CHECK_THROWS_AS(dir.mark_active(), std::logic_error);
	}

	SECTION("parent that cannot be created") {
		testing::write_file(*mem, "/home/alice/.local/share", testing::QuoteA);
		CHECK_THROWS_AS(layerfs::ScopedOverlayDir(*mem, parent), fs::filesystem_error);
	}

	SECTION("on the host filesystem") {
		auto const os      = layerfs::make_os_fs();
		auto const sandbox = testing::make_sandbox(*os);

		fs::path p;
		{
			layerfs::ScopedOverlayDir const dir(*os, sandbox / "juv");
			p = dir.path();
			REQUIRE(fs::is_directory(p));
			testing::write_file(*os, p / "a/b.txt", testing::QuoteB);
		}

		CHECK(not fs::exists(p));
		os->remove_all(sandbox);
	}
}

TEST_CASE("SignalGuard") {
	SECTION("records a termination signal") {
		layerfs::SignalGuard const guard;
		REQUIRE(not guard.triggered());

		std::raise(SIGTERM);
		CHECK(guard.triggered());
		CHECK(SIGTERM == guard.signal_number());
	}

	SECTION("wait returns once a signal was received") {
		layerfs::SignalGuard const guard;
		std::raise(SIGINT);

		guard.wait();
		CHECK(SIGINT == guard.signal_number());
	}

	SECTION("wait returns once the condition holds") {
		layerfs::SignalGuard const guard;

		int calls = 0;
		guard.wait([&] { return ++calls > 0; });
		CHECK(1 == calls);
		CHECK(not guard.triggered());
	}

	SECTION("only one guard at a time") {
		layerfs::SignalGuard const guard;
		CHECK_THROWS_AS(layerfs::SignalGuard(), std::logic_error);
	}

	SECTION("a new guard starts clean") {
		{
			layerfs::SignalGuard const guard;
			std::raise(SIGTERM);
		}

		layerfs::SignalGuard const guard;
		CHECK(not guard.triggered());

		struct sigaction current = {};
		sigaction(SIGTERM, nullptr, &current);
		CHECK(current.sa_handler != SIG_DFL);
	}

	SECTION("handlers are restored") {
		struct sigaction before = {};
		sigaction(SIGINT, nullptr, &before);
		{
			layerfs::SignalGuard const guard;
		}

		struct sigaction after = {};
		sigaction(SIGINT, nullptr, &after);
		CHECK(before.sa_handler == after.sa_handler);
	}
}
