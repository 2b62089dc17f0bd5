#include "launcher.h"

#include <cstdlib>
#include <iostream>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

// ============================================================================
// Launcher
// ============================================================================

namespace Launcher {

bool spawn(const std::string& command)
{
#ifdef _WIN32
	return std::system(("start \"\" " + command).c_str()) == 0;
#else
	const pid_t pid = fork();
	if (pid < 0) {
		std::cerr << "Launch error: fork failed\n";
		return false;
	}

	if (pid == 0) {
		// The grandchild is reparented to init, so nobody has to wait on it
		setsid();
		if (fork() != 0) {
			_exit(0);
		}
		const int null_fd = open("/dev/null", O_RDWR);
		if (null_fd >= 0) {
			dup2(null_fd, STDIN_FILENO);
			dup2(null_fd, STDOUT_FILENO);
			dup2(null_fd, STDERR_FILENO);
		}
		execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
		_exit(127);
	}

	int status = 0;
	if (waitpid(pid, &status, 0) < 0) {
		std::cerr << "Launch error: lost track of launcher process\n";
		return false;
	}
	return WIFEXITED(status) && WEXITSTATUS(status) == 0;
#endif
}

} // namespace Launcher
