#include <filesystem>
#include <fstream>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <layerfs/config.hpp>
#include <layerfs/error.hpp>
#include <layerfs/fs.hpp>
#include <layerfs/log.hpp>

#include "testing.hpp"

namespace fs = std::filesystem;

TEST_CASE("Config defaults") {
	layerfs::Config const config;

	auto const opts = config.layer_options();
	CHECK("site-packages" == opts.marker);
	CHECK(3 == opts.levels_up);
	CHECK("share/jupyter" == opts.data_suffix);
	CHECK("etc/jupyter" == opts.config_suffix);

	CHECK("JUPYTER_DATA_DIR" == config.keys.data_dir);
	CHECK("JUPYTER_CONFIG_PATH" == config.keys.config_path);

	// No prefix.
	CHECK_THROWS_AS(config.validate(), layerfs::ConfigError);
}

TEST_CASE("Config::merge") {
	layerfs::Config config;

	SECTION("overrides present fields") {
		config.merge(YAML::Load(R"(
app: voila
storage_dir: /var/lib/overlays
prefix: /opt/conda
search_paths:
  - /envs/a/lib/python3.12/site-packages
levels_up: 4
keys:
  data_dir: VOILA_DATA_DIR
log_level: debug
)"));

		CHECK("voila" == config.app);
		CHECK("juv" == config.storage_id);
		CHECK(fs::path("/var/lib/overlays") == config.overlay_parent());
		CHECK("/opt/conda" == config.prefix);
		CHECK(std::vector<fs::path>{"/envs/a/lib/python3.12/site-packages"} == config.search_paths);
		CHECK("VOILA_DATA_DIR" == config.keys.data_dir);
		CHECK("JUPYTER_CONFIG_PATH" == config.keys.config_path);
		CHECK("debug" == config.log_level);

		auto const opts = config.layer_options();
		CHECK(4 == opts.levels_up);
		CHECK("share/voila" == opts.data_suffix);
		CHECK("etc/voila" == opts.config_suffix);

		CHECK_NOTHROW(config.validate());
	}

	SECTION("explicit suffixes win over the application id") {
		config.merge(YAML::Load("{app: voila, data_suffix: share/jupyter, config_suffix: etc/jupyter}"));

		auto const opts = config.layer_options();
		CHECK("share/jupyter" == opts.data_suffix);
		CHECK("etc/jupyter" == opts.config_suffix);
	}

	SECTION("search paths accumulate") {
		config.merge(YAML::Load("search_paths: [/a]"));
		config.merge(YAML::Load("search_paths: [/b]"));
		CHECK(std::vector<fs::path>{"/a", "/b"} == config.search_paths);
	}

	SECTION("empty document") {
		config.merge(YAML::Load(""));
		CHECK("jupyter" == config.app);
	}

	SECTION("not a mapping") {
		CHECK_THROWS_AS(config.merge(YAML::Load("[a, b]")), layerfs::ConfigError);
	}

	SECTION("wrong value type") {
		CHECK_THROWS_AS(config.merge(YAML::Load("levels_up: three")), layerfs::ConfigError);
		CHECK_THROWS_AS(config.merge(YAML::Load("search_paths: /a")), layerfs::ConfigError);
		CHECK_THROWS_AS(config.merge(YAML::Load("keys: JUPYTER")), layerfs::ConfigError);
	}
}

TEST_CASE("Config::merge_file") {
	auto const os      = layerfs::make_os_fs();
	auto const sandbox = testing::make_sandbox(*os);

	SECTION("existing file") {
		std::ofstream(sandbox / "layerfs.yaml") << "prefix: /usr\nstorage_id: overlays\n";

		layerfs::Config config;
		config.merge_file(sandbox / "layerfs.yaml");
		CHECK("/usr" == config.prefix);
		CHECK("overlays" == config.storage_id);
	}

	SECTION("missing file") {
		layerfs::Config config;
		CHECK_THROWS_AS(config.merge_file(sandbox / "none.yaml"), layerfs::ConfigError);
	}

	SECTION("malformed file") {
		std::ofstream(sandbox / "layerfs.yaml") << "prefix: [/usr\n";

		layerfs::Config config;
		CHECK_THROWS_AS(config.merge_file(sandbox / "layerfs.yaml"), layerfs::ConfigError);
	}

	os->remove_all(sandbox);
}

TEST_CASE("Config::merge_environment") {
	layerfs::Config config;
	config.prefix       = "/usr";
	config.search_paths = {"/from/file"};

	config.merge_environment({
	    {"LAYERFS_PREFIX", "/opt/conda"},
	    {"LAYERFS_SEARCH_PATH", "/a::/b"},
	    {"LAYERFS_LOG_LEVEL", "warn"},
	    {"PATH", "/usr/bin"},
	});

	CHECK("/opt/conda" == config.prefix);
	CHECK(std::vector<fs::path>{"/from/file", "/a", "/b"} == config.search_paths);
	CHECK("warn" == config.log_level);

	SECTION("empty values are ignored") {
		config.merge_environment({
		    {"LAYERFS_PREFIX", ""},
		    {"LAYERFS_LOG_LEVEL", ""},
		});
		CHECK("/opt/conda" == config.prefix);
		CHECK("warn" == config.log_level);
	}
}

TEST_CASE("Config::validate") {
	layerfs::Config config;
	config.prefix = "/usr";
	REQUIRE_NOTHROW(config.validate());

	SECTION("levels_up") {
		config.levels_up = 0;
		CHECK_THROWS_AS(config.validate(), layerfs::ConfigError);
	}

	SECTION("marker") {
		config.marker.clear();
		CHECK_THROWS_AS(config.validate(), layerfs::ConfigError);
	}

	SECTION("storage") {
		config.storage_id.clear();
		CHECK_THROWS_AS(config.validate(), layerfs::ConfigError);

		config.storage_dir = "/var/lib/overlays";
		CHECK_NOTHROW(config.validate());
	}
}

TEST_CASE("current_environment") {
	::setenv("LAYERFS_TEST_VALUE", "a=b", 1);

	auto const env = layerfs::current_environment();
	REQUIRE(env.contains("LAYERFS_TEST_VALUE"));
	CHECK("a=b" == env.at("LAYERFS_TEST_VALUE"));

	::unsetenv("LAYERFS_TEST_VALUE");
}

TEST_CASE("log::parse_level") {
	CHECK(spdlog::level::debug == layerfs::log::parse_level("debug"));
	CHECK(spdlog::level::warn == layerfs::log::parse_level("warn"));
	CHECK(spdlog::level::off == layerfs::log::parse_level("off"));
	CHECK_THROWS_AS(layerfs::log::parse_level("loud"), layerfs::ConfigError);
}

TEST_CASE("log::init") {
	layerfs::log::init(spdlog::level::warn);
	REQUIRE(spdlog::get("layerfs") != nullptr);
	CHECK(spdlog::default_logger() == spdlog::get("layerfs"));
	CHECK(spdlog::level::warn == spdlog::default_logger()->level());

	layerfs::log::init(spdlog::level::info);
	CHECK(spdlog::level::info == spdlog::default_logger()->level());
}
