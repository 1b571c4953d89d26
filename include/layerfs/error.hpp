#pragma once

#include <stdexcept>
#include <string>

namespace layerfs {

/**
 * @brief Thrown by long-running operations that observed a termination request.
 */
class Interrupted: public std::runtime_error {
   public:
	Interrupted(int signal_number)
	    : std::runtime_error("interrupted by signal " + std::to_string(signal_number))
	    , signal_number_(signal_number) { }

	[[nodiscard]] int signal_number() const noexcept {
		return this->signal_number_;
	}

   private:
	int signal_number_;
};

/**
 * @brief Thrown for malformed configuration files, environment variables, or command line arguments.
 */
class ConfigError: public std::runtime_error {
   public:
	using std::runtime_error::runtime_error;
};

}  // namespace layerfs
