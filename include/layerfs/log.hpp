#pragma once

#include <string_view>

#include <spdlog/spdlog.h>

namespace layerfs {
namespace log {

/**
 * @brief Parses a level name such as "debug" or "warn".
 *
 * @exception \ref layerfs::ConfigError if \p name is not a level name.
 */
spdlog::level::level_enum parse_level(std::string_view name);

/**
 * @brief Makes a colored stderr logger named "layerfs" the default logger.
 *   Standard output is left to command results.
 */
void init(spdlog::level::level_enum level);

}  // namespace log
}  // namespace layerfs
