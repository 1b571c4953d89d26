#include "layerfs/process.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "layerfs/lifecycle.hpp"

namespace layerfs {

namespace {

// Returns `true` once the child is reaped.
bool try_reap(pid_t pid, int& status, std::string const& name) {
	auto const r = ::waitpid(pid, &status, WNOHANG);
	if(r < 0 && errno != EINTR) {
		throw std::system_error(errno, std::generic_category(), "cannot wait for " + name);
	}

	return r == pid;
}

void terminate_child(pid_t pid, int sig, std::chrono::milliseconds grace, std::string const& name) {
	spdlog::debug("forwarding signal {} to pid {}", sig, pid);
	::kill(pid, sig);

	int        status   = 0;
	auto const deadline = std::chrono::steady_clock::now() + grace;
	while(!try_reap(pid, status, name)) {
		if(std::chrono::steady_clock::now() >= deadline) {
			spdlog::warn("{} (pid {}) did not exit within {} ms; killing it", name, pid, grace.count());
			::kill(pid, SIGKILL);
			while(::waitpid(pid, &status, 0) < 0) {
				if(errno != EINTR) {
					throw std::system_error(errno, std::generic_category(), "cannot wait for " + name);
				}
			}
			return;
		}

		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}
}

}  // namespace

std::optional<int> run_command(std::vector<std::string> const& argv, SignalGuard const& guard, std::chrono::milliseconds grace) {
	if(argv.empty()) {
		throw std::invalid_argument("command must not be empty");
	}

	std::vector<char*> args;
	args.reserve(argv.size() + 1);
	for(auto const& arg: argv) {
		args.push_back(const_cast<char*>(arg.c_str()));
	}
	args.push_back(nullptr);

	pid_t const pid = ::fork();
	if(pid < 0) {
		throw std::system_error(errno, std::generic_category(), "cannot fork");
	}
	if(pid == 0) {
		::execvp(args[0], args.data());
		std::fprintf(stderr, "layerfs: cannot execute %s: %s\n", args[0], std::strerror(errno));
		::_exit(127);
	}

	spdlog::debug("started {} as pid {}", argv.front(), pid);

	int  status = 0;
	bool exited = false;
	guard.wait([&] {
		exited = try_reap(pid, status, argv.front());
		return exited;
	});

	if(!exited) {
		terminate_child(pid, guard.signal_number(), grace, argv.front());
		return std::nullopt;
	}

	if(WIFEXITED(status)) {
		return WEXITSTATUS(status);
	}
	if(WIFSIGNALED(status)) {
		return 128 + WTERMSIG(status);
	}

	return 1;
}

}  // namespace layerfs
