#pragma once

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <bootsvc/debug.hpp>

#include "testsuite.hpp"

namespace halt_detail {

inline int outputFd = -1;

inline void writeToPipe(char c) {
	while (write(outputFd, &c, 1) == -1) {
		if (errno != EINTR)
			_exit(2);
	}
}

} // namespace halt_detail

// Runs f in a child process and checks that it halts instead of returning.
// A halted child spins until the alarm kills it. Returns everything the child logged.
template<typename F>
std::string runHalting(F &&f) {
	int fds[2];
	int ret = pipe(fds);
	assert_errno("pipe", ret != -1);

	pid_t pid = fork();
	assert_errno("fork", pid >= 0);

	if (!pid) {
		close(fds[0]);
		halt_detail::outputFd = fds[1];
		bootsvc::setDebugOutput(halt_detail::writeToPipe);
		alarm(1);
		f();
		_exit(0);
	}

	close(fds[1]);
	std::string text;
	char buffer[256];
	while (true) {
		auto n = read(fds[0], buffer, sizeof(buffer));
		if (n == -1 && errno == EINTR)
			continue;
		assert_errno("read", n != -1);
		if (!n)
			break;
		text.append(buffer, n);
	}
	close(fds[0]);

	int status = 0;
	while (waitpid(pid, &status, 0) == -1) {
		if (errno == EINTR)
			continue;
		assert_errno("waitpid", false);
	}

	if (!WIFSIGNALED(status) || WTERMSIG(status) != SIGALRM) {
		fprintf(stderr, "Subprocess did not halt (status 0x%x), output:\n%s\n", status,
				text.c_str());
		abort();
	}
	return text;
}

// Same as above; also checks that message was logged.
template<typename F>
void expectHalt(F &&f, const char *message) {
	auto text = runHalting(std::forward<F>(f));
	if (text.find(message) == std::string::npos) {
		fprintf(stderr, "Subprocess halted without logging '%s', output:\n%s\n", message,
				text.c_str());
		abort();
	}
}
