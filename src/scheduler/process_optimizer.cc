#include "scheduler/process_optimizer.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <glog/logging.h>

#include "common/config.h"
#include "common/scoped_fd.h"

namespace Wipflow {

namespace {

// A child that exits without reading stdin must not take us down with SIGPIPE.
void IgnoreSigpipeOnce() {
	static std::once_flag flag;
	std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void KillAndReap(pid_t pid) {
	::kill(pid, SIGKILL);
	int status = 0;
	while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
	}
}

int RemainingMs(absl::Time deadline) {
	int64_t ms = absl::ToInt64Milliseconds(deadline - absl::Now());
	if (ms < 0) return 0;
	return ms > 1000 ? 1000 : static_cast<int>(ms);
}

} // namespace

ProcessOptimizer::ProcessOptimizer(std::string command, std::string label)
	: command_(std::move(command)), label_(std::move(label)) {}

std::string ProcessOptimizer::Name() const {
	return label_.empty() ? command_ : label_;
}

absl::StatusOr<std::string> ProcessOptimizer::Run(const std::string& input, absl::Duration timeout) const {
	IgnoreSigpipeOnce();

	ScopedPipe in_pipe, out_pipe, err_pipe;
	if (!in_pipe.Open() || !out_pipe.Open() || !err_pipe.Open()) {
		return absl::InternalError(std::string("pipe failed: ") + std::strerror(errno));
	}

	const absl::Time deadline = absl::Now() + timeout;
	pid_t pid = ::fork();
	if (pid < 0) {
		return absl::InternalError(std::string("fork failed: ") + std::strerror(errno));
	}
	if (pid == 0) {
		// Child: O_CLOEXEC closes every other pipe end on exec
		::dup2(in_pipe.read_end.get(), STDIN_FILENO);
		::dup2(out_pipe.write_end.get(), STDOUT_FILENO);
		::dup2(err_pipe.write_end.get(), STDERR_FILENO);
		::execl("/bin/sh", "sh", "-c", command_.c_str(), static_cast<char*>(nullptr));
		_exit(127);
	}

	in_pipe.read_end.reset();
	out_pipe.write_end.reset();
	err_pipe.write_end.reset();
	ScopedFd to_child = std::move(in_pipe.write_end);
	ScopedFd from_child = std::move(out_pipe.read_end);
	ScopedFd errors_from_child = std::move(err_pipe.read_end);
	to_child.SetNonBlocking();
	from_child.SetNonBlocking();
	errors_from_child.SetNonBlocking();

	std::string output;
	std::string errors;
	size_t written = 0;
	if (input.empty()) to_child.reset();

	char buf[16384];
	while (from_child.valid() || errors_from_child.valid()) {
		if (absl::Now() >= deadline) {
			KillAndReap(pid);
			return absl::DeadlineExceededError("optimizer '" + Name() + "' timed out after " +
					absl::FormatDuration(timeout));
		}

		struct pollfd fds[3];
		nfds_t nfds = 0;
		int in_idx = -1, out_idx = -1, err_idx = -1;
		if (to_child.valid()) { in_idx = nfds; fds[nfds++] = {to_child.get(), POLLOUT, 0}; }
		if (from_child.valid()) { out_idx = nfds; fds[nfds++] = {from_child.get(), POLLIN, 0}; }
		if (errors_from_child.valid()) { err_idx = nfds; fds[nfds++] = {errors_from_child.get(), POLLIN, 0}; }

		int ready = ::poll(fds, nfds, RemainingMs(deadline));
		if (ready < 0) {
			if (errno == EINTR) continue;
			KillAndReap(pid);
			return absl::InternalError(std::string("poll failed: ") + std::strerror(errno));
		}
		if (ready == 0) continue;

		if (in_idx >= 0 && fds[in_idx].revents != 0) {
			ssize_t n = ::write(to_child.get(), input.data() + written, input.size() - written);
			if (n > 0) {
				written += static_cast<size_t>(n);
				if (written == input.size()) to_child.reset();
			} else if (n < 0 && errno != EAGAIN && errno != EINTR) {
				// EPIPE: the child stopped reading; its exit status decides the outcome
				to_child.reset();
			}
		}
		if (out_idx >= 0 && fds[out_idx].revents != 0) {
			ssize_t n = ::read(from_child.get(), buf, sizeof(buf));
			if (n > 0) {
				output.append(buf, static_cast<size_t>(n));
				if (output.size() > kMaxOptimizerOutputBytes) {
					KillAndReap(pid);
					return absl::ResourceExhaustedError("optimizer '" + Name() + "' output exceeds " +
							std::to_string(kMaxOptimizerOutputBytes) + " bytes");
				}
			} else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
				from_child.reset();
			}
		}
		if (err_idx >= 0 && fds[err_idx].revents != 0) {
			ssize_t n = ::read(errors_from_child.get(), buf, sizeof(buf));
			if (n > 0) {
				if (errors.size() < 4096) errors.append(buf, static_cast<size_t>(n));
			} else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
				errors_from_child.reset();
			}
		}
	}
	to_child.reset();

	// Output is closed; the child may still be running
	int status = 0;
	while (true) {
		pid_t done = ::waitpid(pid, &status, WNOHANG);
		if (done == pid) break;
		if (done < 0 && errno != EINTR) {
			return absl::InternalError(std::string("waitpid failed: ") + std::strerror(errno));
		}
		if (absl::Now() >= deadline) {
			KillAndReap(pid);
			return absl::DeadlineExceededError("optimizer '" + Name() + "' timed out after " +
					absl::FormatDuration(timeout));
		}
		::usleep(1000);
	}

	if (!errors.empty()) {
		VLOG(2) << "\t[ProcessOptimizer] " << Name() << " stderr: " << errors;
	}
	if (WIFSIGNALED(status)) {
		return absl::InternalError("optimizer '" + Name() + "' killed by signal " +
				std::to_string(WTERMSIG(status)));
	}
	if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
		return absl::InternalError("optimizer '" + Name() + "' exited with code " +
				std::to_string(WEXITSTATUS(status)) + (errors.empty() ? "" : ": " + errors));
	}
	return output;
}

absl::StatusOr<wipflow::OptimizerResponse> ProcessOptimizer::Optimize(const wipflow::OptimizerRequest& request,
		absl::Duration timeout) {
	absl::StatusOr<std::string> input = OptimizerRequestToJson(request);
	if (!input.ok()) return input.status();

	absl::StatusOr<std::string> output = Run(*input, timeout);
	if (!output.ok()) return output.status();
	if (output->empty()) {
		return absl::DataLossError("optimizer '" + Name() + "' produced no output");
	}
	return OptimizerResponseFromJson(*output);
}

} // namespace Wipflow
