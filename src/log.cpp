#include "layerfs/log.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "layerfs/error.hpp"

namespace layerfs {
namespace log {

spdlog::level::level_enum parse_level(std::string_view name) {
	auto const level = spdlog::level::from_str(std::string(name));
	if(level == spdlog::level::off && name != "off") {
		throw ConfigError("unknown log level: " + std::string(name));
	}

	return level;
}

void init(spdlog::level::level_enum level) {
	auto logger = spdlog::get("layerfs");
	if(!logger) {
		logger = spdlog::stderr_color_mt("layerfs");
	}

	logger->set_pattern("layerfs: %^%l%$: %v");
	logger->set_level(level);
	spdlog::set_default_logger(std::move(logger));
}

}  // namespace log
}  // namespace layerfs
