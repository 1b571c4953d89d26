#include "layerfs/cli.hpp"

int main(int argc, char* argv[]) {
	return layerfs::cli::main(argc, argv);
}
