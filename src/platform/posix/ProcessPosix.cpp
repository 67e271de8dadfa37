#if !defined(_WIN32)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <cstring>

namespace twcli::process::detail {

    namespace {

        //---Повторы exec при ETXTBSY: параллельный fork в другом потоке может
        //   ненадолго удерживать дескриптор записи только что созданного файла
        constexpr int kExecBusyRetries = 50;
        constexpr long kExecBusyDelayNs = 10L * 1000L * 1000L;

        //---Дескриптор, закрывается в деструкторе
        struct UniqueFd final {
            int fd = -1;

            UniqueFd() = default;
            explicit UniqueFd(int f) : fd(f) {}
            ~UniqueFd() { reset(); }

            UniqueFd(const UniqueFd&) = delete;
            UniqueFd& operator=(const UniqueFd&) = delete;

            void reset()
            {
                if (fd >= 0) ::close(fd);
                fd = -1;
            }
        };

        struct Pipe final {
            UniqueFd readEnd;
            UniqueFd writeEnd;
        };

        //---Канал с флагом close-on-exec на обоих концах
        static bool makePipe(Pipe& p)
        {
            int fds[2] = { -1, -1 };
#if defined(__linux__)
            if (::pipe2(fds, O_CLOEXEC) != 0) return false;
#else
            if (::pipe(fds) != 0) return false;
            ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
            p.readEnd.fd = fds[0];
            p.writeEnd.fd = fds[1];
            return true;
        }

        static std::string errnoText(int err)
        {
            return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
        }

        //---Только в дочернем процессе: передать errno родителю и выйти
        [[noreturn]] static void childFail(int statusFd, int err)
        {
            ssize_t written = ::write(statusFd, &err, sizeof(err));
            (void)written;
            _exit(127);
        }

        //---Только в дочернем процессе: fd → target без флага close-on-exec
        static bool redirect(int fd, int target)
        {
            if (fd == target)
                return ::fcntl(fd, F_SETFD, 0) == 0;
            return ::dup2(fd, target) >= 0;
        }

        //---Ожидание завершения дочернего процесса с повтором при EINTR
        static pid_t waitChild(pid_t pid, int& status)
        {
            pid_t r;
            do
            {
                r = ::waitpid(pid, &status, 0);
            } while (r < 0 && errno == EINTR);
            return r;
        }

        //---Чтение stdout и stderr одновременно до EOF на обоих каналах
        static bool drainPipes(int outFd, int errFd, std::string& outBuf, std::string& errBuf, int& err)
        {
            char buf[64 * 1024];
            pollfd fds[2] = { { outFd, POLLIN, 0 }, { errFd, POLLIN, 0 } };
            std::string* sinks[2] = { &outBuf, &errBuf };
            int open = 2;

            while (open > 0)
            {
                if (::poll(fds, 2, -1) < 0)
                {
                    if (errno == EINTR) continue;
                    err = errno;
                    return false;
                }
                for (int i = 0; i < 2; ++i)
                {
                    if (fds[i].fd < 0 || fds[i].revents == 0) continue;

                    const ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
                    if (got > 0)
                    {
                        sinks[i]->append(buf, (size_t)got);
                        continue;
                    }
                    if (got < 0)
                    {
                        if (errno == EINTR || errno == EAGAIN) continue;
                        err = errno;
                        return false;
                    }
                    //---EOF: poll пропускает отрицательные дескрипторы
                    fds[i].fd = -1;
                    --open;
                }
            }
            return true;
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для POSIX
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---Всё, что нужно дочернему процессу, готовим до fork (после fork память не выделяем)
        const std::string exePath = exe.string();
        const std::string cwd = opt.workingDir.string();

        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exePath);
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        UniqueFd devNull(::open("/dev/null", O_RDONLY | O_CLOEXEC));
        if (devNull.fd < 0)
        {
            const int err = errno;
            out.sysError = (std::uint32_t)err;
            out.exitCode = err;
            out.error = "open(/dev/null) failed: " + errnoText(err);
            return false;
        }

        Pipe stdoutPipe, stderrPipe, statusPipe;
        if (!makePipe(stdoutPipe) || !makePipe(stderrPipe) || !makePipe(statusPipe))
        {
            const int err = errno;
            out.sysError = (std::uint32_t)err;
            out.exitCode = err;
            out.error = "pipe() failed: " + errnoText(err);
            return false;
        }

        pid_t pid = fork();
        if (pid < 0)
        {
            const int err = errno;
            out.started = false;
            out.sysError = (std::uint32_t)err;
            out.exitCode = err;
            out.error = "fork() failed: " + errnoText(err);
            return false;
        }

        if (pid == 0)
        {
            const int statusFd = statusPipe.writeEnd.fd;

            if (!redirect(devNull.fd, STDIN_FILENO)) childFail(statusFd, errno);
            if (!redirect(stdoutPipe.writeEnd.fd, STDOUT_FILENO)) childFail(statusFd, errno);
            if (!redirect(stderrPipe.writeEnd.fd, STDERR_FILENO)) childFail(statusFd, errno);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) childFail(statusFd, errno);

            for (int attempt = 0;; ++attempt)
            {
                execv(exePath.c_str(), argv.data());
                if (errno != ETXTBSY || attempt >= kExecBusyRetries) break;

                timespec delay{ 0, kExecBusyDelayNs };
                ::nanosleep(&delay, nullptr);
            }
            childFail(statusFd, errno); // exec failed
        }

        //---Родитель: закрываем концы, принадлежащие дочернему процессу
        stdoutPipe.writeEnd.reset();
        stderrPipe.writeEnd.reset();
        statusPipe.writeEnd.reset();
        devNull.reset();

        //---Канал статуса закрывается при успешном exec (EOF) или содержит errno
        int execErr = 0;
        ssize_t n;
        do
        {
            n = ::read(statusPipe.readEnd.fd, &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);

        if (n == (ssize_t)sizeof(execErr))
        {
            int ignored = 0;
            waitChild(pid, ignored);

            out.started = false;
            out.sysError = (std::uint32_t)execErr;
            out.exitCode = execErr;
            out.error = "exec failed: " + errnoText(execErr);
            return false;
        }

        out.started = true;

        int drainErr = 0;
        const bool drained = drainPipes(stdoutPipe.readEnd.fd, stderrPipe.readEnd.fd,
            out.stdoutBytes, out.stderrBytes, drainErr);

        //---Закрываем каналы до ожидания: если чтение прервано, процесс получит EPIPE
        stdoutPipe.readEnd.reset();
        stderrPipe.readEnd.reset();

        int status = 0;
        if (waitChild(pid, status) < 0)
        {
            const int err = errno;
            out.sysError = (std::uint32_t)err;
            out.exitCode = err;
            out.error = "waitpid() failed: " + errnoText(err);
            return false;
        }

        if (!drained)
        {
            out.sysError = (std::uint32_t)drainErr;
            out.error = "reading child output failed: " + errnoText(drainErr);
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
        {
            out.signaled = true;
            out.termSignal = WTERMSIG(status);
            out.exitCode = 128 + out.termSignal;
        }
        else
            out.exitCode = 1;

        return true;
    }

} // namespace twcli::process::detail
#endif
