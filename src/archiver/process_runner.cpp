#include <ytarchive/archiver/download.h>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace ytarchive::archiver {

namespace {

class PosixProcessRunner final : public IProcessRunner {
public:
    explicit PosixProcessRunner(bool quiet) : quiet_(quiet) {}

    Result<int> run(const std::vector<std::string>& args) override {
        if (args.empty()) {
            return Error{ErrorCode::InvalidArgument, "empty argument list"};
        }

        // Build argv before forking; the child only calls async-signal-safe functions.
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        // Close-on-exec pipe: the child writes errno only when exec fails.
        int errPipe[2];
        if (pipe2(errPipe, O_CLOEXEC) < 0) {
            return Error{ErrorCode::SpawnFailed,
                         "pipe2() failed: " + std::string(std::strerror(errno))};
        }

        pid_t pid = fork();
        if (pid < 0) {
            const int err = errno;
            close(errPipe[0]);
            close(errPipe[1]);
            return Error{ErrorCode::SpawnFailed, "fork() failed: " + std::string(std::strerror(err))};
        }

        if (pid == 0) {
            close(errPipe[0]);
            if (quiet_) {
                int devnull = open("/dev/null", O_WRONLY);
                if (devnull >= 0) {
                    dup2(devnull, STDOUT_FILENO);
                    close(devnull);
                }
            }
            execvp(argv[0], argv.data());
            int err = errno;
            ssize_t ignored = write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        close(errPipe[1]);
        int execErr = 0;
        ssize_t n;
        do {
            n = read(errPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        close(errPipe[0]);

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return Error{ErrorCode::InternalError,
                             "waitpid() failed: " + std::string(std::strerror(errno))};
            }
        }

        if (n == static_cast<ssize_t>(sizeof(execErr))) {
            return Error{ErrorCode::SpawnFailed,
                         "start process " + args.front() + ": " + std::strerror(execErr)};
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            spdlog::debug("Process {} (pid {}) killed by signal {}", args.front(), pid,
                          WTERMSIG(status));
            return 128 + WTERMSIG(status);
        }
        return Error{ErrorCode::InternalError, "abnormal termination of pid " + std::to_string(pid)};
    }

private:
    bool quiet_;
};

} // namespace

std::shared_ptr<IProcessRunner> makePosixProcessRunner(bool quiet) {
    return std::make_shared<PosixProcessRunner>(quiet);
}

} // namespace ytarchive::archiver
