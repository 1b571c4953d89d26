#include "layerfs/cli.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include <getopt.h>

#include <spdlog/spdlog.h>

#include "layerfs/config.hpp"
#include "layerfs/error.hpp"
#include "layerfs/fs.hpp"
#include "layerfs/layer.hpp"
#include "layerfs/lifecycle.hpp"
#include "layerfs/log.hpp"
#include "layerfs/process.hpp"
#include "layerfs/session.hpp"

namespace layerfs {
namespace cli {

void print_usage(std::ostream& o, char const* prog) {
	o << "Usage: " << prog << " [options] <command> [args...]\n"
	  << "\n"
	  << "Commands:\n"
	  << "  plan                  Print the layers and config paths that would be merged\n"
	  << "  run [--] [cmd args]   Merge the layers and run cmd with the overlay published;\n"
	  << "                        without cmd, print the published variables and wait for a signal\n"
	  << "\n"
	  << "Options:\n"
	  << "  -c, --config FILE       YAML configuration file\n"
	  << "  -s, --search-path DIR   Append a library search path entry (repeatable)\n"
	  << "  -p, --prefix DIR        Installation prefix of the invoking environment\n"
	  << "  -a, --app NAME          Application id naming share/<app> and etc/<app>\n"
	  << "  -d, --storage-dir DIR   Directory in which overlays are allocated\n"
	  << "  -v, --verbose           Log debug messages\n"
	  << "  -h, --help              Show this help\n"
	  << "\n"
	  << "Environment:\n"
	  << "  LAYERFS_SEARCH_PATH, LAYERFS_PREFIX, LAYERFS_LOG_LEVEL\n";
}

Options parse_args(int argc, char* argv[]) {
	Options opts;

	static struct option const long_options[] = {
	    {"config", required_argument, nullptr, 'c'},
	    {"search-path", required_argument, nullptr, 's'},
	    {"prefix", required_argument, nullptr, 'p'},
	    {"app", required_argument, nullptr, 'a'},
	    {"storage-dir", required_argument, nullptr, 'd'},
	    {"verbose", no_argument, nullptr, 'v'},
	    {"help", no_argument, nullptr, 'h'},
	    {nullptr, 0, nullptr, 0},
	};

	// 0 rather than 1 makes getopt reinitialize, so the arguments can be parsed more than once.
	optind = 0;

	// "+" stops at the first operand so the arguments of the command are left alone.
	int opt = 0;
	while((opt = getopt_long(argc, argv, "+c:s:p:a:d:vh", long_options, nullptr)) != -1) {
		switch(opt) {
		case 'c':
			opts.config_file = optarg;
			break;
		case 's':
			opts.search_paths.emplace_back(optarg);
			break;
		case 'p':
			opts.prefix = optarg;
			break;
		case 'a':
			opts.app = optarg;
			break;
		case 'd':
			opts.storage_dir = optarg;
			break;
		case 'v':
			opts.verbose = true;
			break;
		case 'h':
			opts.help = true;
			return opts;
		default:
			throw ConfigError("invalid command line; see --help");
		}
	}

	if(optind >= argc) {
		throw ConfigError("missing command; see --help");
	}

	opts.command = argv[optind++];
	if(optind < argc && std::string(argv[optind]) == "--") {
		++optind;
	}
	for(; optind < argc; ++optind) {
		opts.args.emplace_back(argv[optind]);
	}

	return opts;
}

Config load_config(Options const& opts, Environment const& env) {
	Config config;
	if(opts.config_file) {
		config.merge_file(*opts.config_file);
	}

	config.merge_environment(env);

	config.search_paths.insert(config.search_paths.end(), opts.search_paths.begin(), opts.search_paths.end());
	if(opts.prefix) {
		config.prefix = *opts.prefix;
	}
	if(opts.app) {
		config.app = *opts.app;
	}
	if(opts.storage_dir) {
		config.storage_dir = *opts.storage_dir;
	}

	return config;
}

int plan(Fs const& fs, Config const& config, std::ostream& out) {
	auto const layers = resolve_layers(fs, config.search_paths, config.prefix, config.layer_options());

	out << "layers (highest precedence first):\n";
	for(auto const& p: layers.walk_order()) {
		out << "  " << p.string() << '\n';
	}

	out << "config paths:\n";
	for(auto const& p: layers.config_paths) {
		out << "  " << p.string() << '\n';
	}

	out << "overlay parent: " << config.overlay_parent().string() << '\n';
	return 0;
}

int run(Fs& fs, Config const& config, std::vector<std::string> const& command, std::ostream& out) {
	SignalGuard const guard;

	auto const layers = resolve_layers(fs, config.search_paths, config.prefix, config.layer_options());

	Session session(fs, layers, config.overlay_parent());
	try {
		auto const report = session.build({.interrupted = [&] { return guard.signal_number(); }});
		spdlog::info(
		    "merged {} layers into {} ({} linked, {} shadowed)",
		    report.layers.size(),
		    session.overlay().path().string(),
		    report.linked,
		    report.skipped);
	} catch(Interrupted const& e) {
		session.close();
		spdlog::info("{}; overlay removed", e.what());
		return 0;
	}

	auto const publication = session.publish();

	if(command.empty()) {
		for(auto const& [key, value]: publication.environment(config.keys)) {
			out << key << '=' << value << '\n';
		}
		out.flush();

		guard.wait();
		session.close();
		spdlog::info("received signal {}; overlay removed", guard.signal_number());
		return 0;
	}

	// A signal caught after the build must not start the command.
	if(guard.triggered()) {
		session.close();
		spdlog::info("received signal {}; overlay removed", guard.signal_number());
		return 0;
	}

	publication.apply(config.keys);

	auto const status = run_command(command, guard);
	session.close();
	if(!status) {
		spdlog::info("received signal {}; overlay removed", guard.signal_number());
		return 0;
	}

	return *status;
}

int main(int argc, char* argv[]) {
	log::init(spdlog::level::info);

	try {
		auto const opts = parse_args(argc, argv);
		if(opts.help) {
			print_usage(std::cout, argv[0]);
			return 0;
		}

		auto const config = load_config(opts, current_environment());
		log::init(opts.verbose ? spdlog::level::debug : log::parse_level(config.log_level));
		config.validate();

		auto const fs = make_os_fs();
		if(opts.command == "plan") {
			return plan(*fs, config, std::cout);
		}
		if(opts.command == "run") {
			return run(*fs, config, opts.args, std::cout);
		}

		throw ConfigError("unknown command: " + opts.command);
	} catch(ConfigError const& e) {
		spdlog::error("{}", e.what());
		return 2;
	} catch(std::exception const& e) {
		spdlog::error("{}", e.what());
		return 1;
	}
}

}  // namespace cli
}  // namespace layerfs
