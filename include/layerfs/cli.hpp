#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "layerfs/config.hpp"
#include "layerfs/fs.hpp"

namespace layerfs {
namespace cli {

struct Options {
	std::optional<std::filesystem::path> config_file;
	std::vector<std::filesystem::path>   search_paths;
	std::optional<std::filesystem::path> prefix;
	std::optional<std::string>           app;
	std::optional<std::filesystem::path> storage_dir;
	bool                                 verbose = false;
	bool                                 help    = false;

	std::string              command;
	std::vector<std::string> args;
};

void print_usage(std::ostream& o, char const* prog);

/**
 * @brief Parses options up to the first operand, which names the command.
 *   Everything after the command, except a leading `--`, is passed through as its arguments.
 *
 * @exception \ref layerfs::ConfigError on an unknown option or a missing command.
 */
Options parse_args(int argc, char* argv[]);

/**
 * @brief Layers the configuration file, \p env, and the command line options, later ones overriding earlier ones.
 *   Search paths accumulate in that order instead.
 */
Config load_config(Options const& opts, Environment const& env);

/**
 * @brief Prints the layers in walk order, the config paths, and the overlay parent without touching anything.
 */
int plan(Fs const& fs, Config const& config, std::ostream& out);

/**
 * @brief Builds and publishes an overlay, then runs \p command with it or, if \p command is empty,
 *   prints the published variables to \p out and waits for `SIGINT` or `SIGTERM`.
 *   The overlay is removed before returning.
 *
 * @return Exit status of \p command, or 0 if a termination signal ended the run.
 */
int run(Fs& fs, Config const& config, std::vector<std::string> const& command, std::ostream& out);

int main(int argc, char* argv[]);

}  // namespace cli
}  // namespace layerfs
