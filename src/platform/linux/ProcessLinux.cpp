#if defined(__linux__)

#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace unisvc::process::detail {

    namespace {

        //---Закрытие дескриптора, если он открыт
        void closeFd(int& fd)
        {
            if (fd >= 0)
            {
                ::close(fd);
                fd = -1;
            }
        }

        //---Дочерний процесс: перенаправление, exec. При ошибке errno уходит в errFd
        [[noreturn]] void execChild(const fs::path& exe, const std::vector<std::string>& args,
            const RunOptions& opt, int outFd, int errFd, int statusFd)
        {
            //---Маска сигналов наследуется (run() блокирует SIGTERM/SIGINT) - сбрасываем
            sigset_t all;
            sigemptyset(&all);
            sigprocmask(SIG_SETMASK, &all, nullptr);

            const int devNull = ::open("/dev/null", O_RDWR);
            if (devNull >= 0)
            {
                ::dup2(devNull, STDIN_FILENO);
                if (outFd < 0) ::dup2(devNull, STDOUT_FILENO);
            }
            if (outFd >= 0) ::dup2(outFd, STDOUT_FILENO);
            ::dup2(errFd, STDERR_FILENO);

            if (!opt.workingDir.empty() && ::chdir(opt.workingDir.c_str()) != 0)
            {
                const int e = errno;
                (void)!::write(statusFd, &e, sizeof(e));
                _exit(127);
            }

            std::vector<std::string> argvStorage;
            argvStorage.reserve(args.size() + 1);
            argvStorage.push_back(exe.string());
            argvStorage.insert(argvStorage.end(), args.begin(), args.end());

            std::vector<char*> argv;
            argv.reserve(argvStorage.size() + 1);
            for (auto& s : argvStorage) argv.push_back(s.data());
            argv.push_back(nullptr);

            ::execvp(exe.c_str(), argv.data());

            const int e = errno;
            (void)!::write(statusFd, &e, sizeof(e));
            _exit(127); // exec failed
        }

        //---Чтение stdout/stderr до закрытия обоих каналов
        void drain(int& outFd, int& errFd, RunResult& out)
        {
            char buf[4096];
            while (outFd >= 0 || errFd >= 0)
            {
                pollfd fds[2];
                nfds_t n = 0;
                if (outFd >= 0) fds[n++] = pollfd{ outFd, POLLIN, 0 };
                if (errFd >= 0) fds[n++] = pollfd{ errFd, POLLIN, 0 };

                if (::poll(fds, n, -1) < 0)
                {
                    if (errno == EINTR) continue;
                    break;
                }

                for (nfds_t i = 0; i < n; i++)
                {
                    if (fds[i].revents == 0) continue;

                    const bool isOut = (fds[i].fd == outFd);
                    const ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
                    if (r > 0)
                    {
                        (isOut ? out.out : out.err).append(buf, (size_t)r);
                    }
                    else if (r == 0 || errno != EINTR)
                    {
                        closeFd(isOut ? outFd : errFd);
                    }
                }
            }
            closeFd(outFd);
            closeFd(errFd);
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для Linux
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        //---Каналы: stdout (опционально), stderr и статус exec (CLOEXEC)
        int outPipe[2] = { -1, -1 };
        int errPipe[2] = { -1, -1 };
        int statusPipe[2] = { -1, -1 };

        auto closeAll = [&]() {
            for (int* p : { outPipe, errPipe, statusPipe })
            {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };

        if ((opt.captureStdout && ::pipe2(outPipe, O_CLOEXEC) < 0) ||
            ::pipe2(errPipe, O_CLOEXEC) < 0 ||
            ::pipe2(statusPipe, O_CLOEXEC) < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            closeAll();
            return false;
        }

        pid_t pid = fork();
        if (pid < 0)
        {
            out.started = false;
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            closeAll();
            return false;
        }

        if (pid == 0)
        {
            execChild(exe, args, opt, outPipe[1], errPipe[1], statusPipe[1]);
        }

        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(statusPipe[1]);

        //---Если exec прошёл, канал статуса закрывается без данных
        int childErrno = 0;
        ssize_t r;
        do
        {
            r = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
        } while (r < 0 && errno == EINTR);
        closeFd(statusPipe[0]);

        out.started = (r == 0);

        drain(outPipe[0], errPipe[0], out);

        int status = 0;
        pid_t w;
        do
        {
            w = waitpid(pid, &status, 0);
        } while (w < 0 && errno == EINTR);

        if (w < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (!out.started)
        {
            out.sysError = (std::uint32_t)(r > 0 ? childErrno : EIO);
            out.exitCode = 127;
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
        {
            out.signaled = true;
            out.termSignal = WTERMSIG(status);
            out.exitCode = 128 + WTERMSIG(status);
        }
        else
            out.exitCode = 1;

        return true;
    }

} // namespace unisvc::process::detail
#endif
