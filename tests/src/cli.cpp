#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <catch2/catch_test_macros.hpp>

#include <layerfs/cli.hpp>
#include <layerfs/config.hpp>
#include <layerfs/error.hpp>
#include <layerfs/fs.hpp>

#include "testing.hpp"

namespace fs = std::filesystem;

namespace {

class Args {
   public:
	Args(std::initializer_list<std::string> args)
	    : storage_(args) {
		for(auto& arg: this->storage_) {
			this->ptrs_.push_back(arg.data());
		}
		this->ptrs_.push_back(nullptr);
	}

	Args(Args const& other) = delete;
	Args(Args&& other)      = delete;

	Args& operator=(Args const& other) = delete;
	Args& operator=(Args&& other)      = delete;

	int argc() const {
		return static_cast<int>(this->storage_.size());
	}

	char** argv() {
		return this->ptrs_.data();
	}

   private:
	std::vector<std::string> storage_;
	std::vector<char*>       ptrs_;
};

layerfs::cli::Options parse(Args&& args) {
	return layerfs::cli::parse_args(args.argc(), args.argv());
}

}  // namespace

TEST_CASE("cli::parse_args") {
	SECTION("options precede the command") {
		auto const opts = parse({"layerfs", "-v", "-s", "/a", "--search-path", "/b", "-p", "/usr", "-a", "voila", "-d", "/tmp/o", "plan"});
		CHECK(opts.verbose);
		CHECK(std::vector<fs::path>{"/a", "/b"} == opts.search_paths);
		CHECK(fs::path("/usr") == opts.prefix);
		CHECK("voila" == opts.app);
		CHECK(fs::path("/tmp/o") == opts.storage_dir);
		CHECK("plan" == opts.command);
		CHECK(opts.args.empty());
	}

	SECTION("arguments after the command belong to it") {
		auto const opts = parse({"layerfs", "-p", "/usr", "run", "--", "jupyter", "lab", "-v"});
		CHECK("run" == opts.command);
		CHECK(std::vector<std::string>{"jupyter", "lab", "-v"} == opts.args);
		CHECK(not opts.verbose);
	}

	SECTION("help stops parsing") {
		CHECK(parse({"layerfs", "--help"}).help);
	}

	SECTION("missing command") {
		CHECK_THROWS_AS(parse({"layerfs", "-v"}), layerfs::ConfigError);
	}

	SECTION("unknown option") {
		CHECK_THROWS_AS(parse({"layerfs", "--nope", "plan"}), layerfs::ConfigError);
	}
}

TEST_CASE("cli::load_config") {
	auto const os      = layerfs::make_os_fs();
	auto const sandbox = testing::make_sandbox(*os);

	auto const file = sandbox / "layerfs.yaml";
	std::ofstream(file) << "prefix: /file\n"
	                       "app: voila\n"
	                       "search_paths:\n"
	                       "  - /from-file\n";

	layerfs::cli::Options opts;
	opts.config_file = file;

	layerfs::Environment const env{
	    {"LAYERFS_PREFIX", "/env"},
	    {"LAYERFS_SEARCH_PATH", "/from-env"},
	};

	SECTION("environment overrides the file") {
		auto const config = layerfs::cli::load_config(opts, env);
		CHECK("/env" == config.prefix);
		CHECK("voila" == config.app);
		CHECK(std::vector<fs::path>{"/from-file", "/from-env"} == config.search_paths);
	}

	SECTION("options override the environment") {
		opts.prefix = "/flag";
		opts.app    = "lab";
		opts.search_paths.emplace_back("/from-flag");
		opts.storage_dir = sandbox / "overlays";

		auto const config = layerfs::cli::load_config(opts, env);
		CHECK("/flag" == config.prefix);
		CHECK("lab" == config.app);
		CHECK(std::vector<fs::path>{"/from-file", "/from-env", "/from-flag"} == config.search_paths);
		CHECK(sandbox / "overlays" == config.overlay_parent());
	}

	SECTION("unreadable file") {
		opts.config_file = sandbox / "none.yaml";
		CHECK_THROWS_AS(layerfs::cli::load_config(opts, env), layerfs::ConfigError);
	}

	os->remove_all(sandbox);
}

TEST_CASE("cli::plan and cli::run") {
	auto const os      = layerfs::make_os_fs();
	auto const sandbox = testing::make_sandbox(*os);

	auto const usr    = sandbox / "usr";
	auto const env    = sandbox / "env";
	auto const parent = sandbox / "overlays";
	testing::write_file(*os, usr / "share/jupyter/kernels/python3/kernel.json", testing::QuoteA);
	testing::write_file(*os, env / "share/jupyter/a.txt", testing::QuoteB);

	layerfs::Config config;
	config.prefix       = usr;
	config.search_paths = {env / "lib/python3.12/site-packages"};
	config.storage_dir  = parent;
	REQUIRE_NOTHROW(config.validate());

	auto const overlays = [&] {
		std::vector<fs::path> paths;
		for(auto const& entry: fs::directory_iterator(parent)) {
			paths.push_back(entry.path());
		}
		return paths;
	};

	SECTION("plan prints the layers in walk order without touching anything") {
		std::ostringstream out;
		CHECK(0 == layerfs::cli::plan(*os, config, out));
		CHECK(
		    "layers (highest precedence first):\n"
		    "  " + (env / "share/jupyter").string() + "\n"
		    "  " + (usr / "share/jupyter").string() + "\n"
		    "config paths:\n"
		    "  " + (env / "etc/jupyter").string() + "\n"
		    "overlay parent: " + parent.string() + "\n"
		    == out.str());
		CHECK(not os->exists(parent));
	}

	SECTION("run returns the exit status of the command") {
		std::ostringstream out;
		auto const status = layerfs::cli::run(*os, config, {"sh", "-c", "test -f \"$JUPYTER_DATA_DIR/a.txt\" && exit 3"}, out);
		::unsetenv("JUPYTER_DATA_DIR");
		::unsetenv("JUPYTER_CONFIG_PATH");

		CHECK(3 == status);
		CHECK(overlays().empty());
	}

	SECTION("run ends with status 0 when the command signals termination") {
		std::ostringstream out;
		auto const status = layerfs::cli::run(*os, config, {"sh", "-c", "kill -TERM $PPID; exec sleep 30"}, out);
		::unsetenv("JUPYTER_DATA_DIR");
		::unsetenv("JUPYTER_CONFIG_PATH");

		CHECK(0 == status);
		CHECK(overlays().empty());
	}

	SECTION("run without a command publishes and waits for an interrupt") {
		pid_t const helper = ::fork();
		REQUIRE(0 <= helper);
		if(helper == 0) {
			// Interrupts the parent once the prefix layer, walked last, is merged.
			for(int i = 0; i < 500; ++i) {
				std::error_code ec;
				for(auto const& entry: fs::directory_iterator(parent, ec)) {
					if(fs::exists(entry.path() / "kernels/python3/kernel.json", ec)) {
						::usleep(50'000);
						::kill(::getppid(), SIGINT);
						::_exit(0);
					}
				}
				::usleep(10'000);
			}
			::_exit(1);
		}

		std::ostringstream out;
		auto const status = layerfs::cli::run(*os, config, {}, out);

		int helper_status = 0;
		REQUIRE(helper == ::waitpid(helper, &helper_status, 0));
		CHECK(WIFEXITED(helper_status));
		CHECK(0 == WEXITSTATUS(helper_status));

		CHECK(0 == status);
		CHECK(overlays().empty());

		auto const printed = out.str();
		INFO(printed);
		CHECK(printed.starts_with("JUPYTER_DATA_DIR=" + parent.string() + "/"));
		CHECK(printed.find("JUPYTER_CONFIG_PATH=" + (env / "etc/jupyter").string() + "\n") != std::string::npos);
	}

	os->remove_all(sandbox);
}

TEST_CASE("cli::main") {
	SECTION("help") {
		Args args{"layerfs", "--help"};
		CHECK(0 == layerfs::cli::main(args.argc(), args.argv()));
	}

	SECTION("invalid command line") {
		Args args{"layerfs", "--nope"};
		CHECK(2 == layerfs::cli::main(args.argc(), args.argv()));
	}

	SECTION("unknown command") {
		Args args{"layerfs", "-p", "/usr", "bogus"};
		CHECK(2 == layerfs::cli::main(args.argc(), args.argv()));
	}
}
