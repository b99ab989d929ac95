#if defined(__linux__)

#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/Paths.hpp"

#include <fcntl.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include <fstream>
#include <regex>
#include <sstream>
#include <thread>
#include <glog/logging.h>

namespace unisvc::backend {

    namespace {

        //---Очищает описание от символов новой строки
        static std::string sanitizeDescription(const std::string& s)
        {
            // В unit-файле и комментариях скрипта переводы строк недопустимы
            std::string out;
            out.reserve(s.size());
            for (char c : s)
            {
                if (c == '\r' || c == '\n') continue;
                out.push_back(c);
            }
            return out;
        }

        //---Программа вернула false, не заполнив ошибку
        static bool programFailed(Error* error, const char* what)
        {
            if (error && error->ok())
                return fail(error, ErrorKind::Program, std::string("program ") + what + " failed");
            return false;
        }

        //---Запись всего буфера в дескриптор (с повтором после EINTR)
        static bool writeAll(int fd, const std::string& text)
        {
            size_t done = 0;
            while (done < text.size())
            {
                const ssize_t n = ::write(fd, text.data() + done, text.size() - done);
                if (n < 0)
                {
                    if (errno == EINTR) continue;
                    return false;
                }
                done += (size_t)n;
            }
            return true;
        }

        static bool startsWith(const std::string& s, const char* p)
        {
            return s.rfind(p, 0) == 0;
        }

    } // namespace

    fs::path rooted(const fs::path& root, const fs::path& abs)
    {
        return root / abs.relative_path();
    }

    bool pathExists(const fs::path& p)
    {
        std::error_code ec;
        return fs::exists(p, ec) && !ec;
    }

    bool inittabMatches(const fs::path& root, const std::string& pattern)
    {
        std::ifstream f(rooted(root, "/etc/inittab"));
        if (!f) return false;

        std::ostringstream ss;
        ss << f.rdbuf();

        try
        {
            return std::regex_search(ss.str(), std::regex(pattern));
        }
        catch (const std::regex_error& e)
        {
            LOG(WARNING) << "inittab match '" << pattern << "': " << e.what();
            return false;
        }
    }

    fs::path findTool(const fs::path& root, const std::string& name)
    {
        if (root == "/") return lookPath(name);

        for (const char* dir : { "/sbin", "/usr/sbin", "/bin", "/usr/bin" })
        {
            const fs::path p = rooted(root, fs::path(dir) / name);
            if (pathExists(p)) return p;
        }
        return {};
    }

    Status parseScriptStatus(const std::string& out, Error* error)
    {
        if (startsWith(out, "Running")) return Status::Running;
        if (startsWith(out, "Stopped")) return Status::Stopped;

        fail(error, ErrorKind::NotInstalled, "");
        return Status::Unknown;
    }

    //------------------------------------------------------------
    //  BackendBase
    //------------------------------------------------------------
    BackendBase::BackendBase(IProgram& program, std::string platform, Config config, fs::path root)
        : program_(program), platform_(std::move(platform)), config_(std::move(config)), root_(std::move(root))
    {
    }

    std::string BackendBase::string() const
    {
        return config_.displayName.empty() ? config_.name : config_.displayName;
    }

    std::unique_ptr<ILogger> BackendBase::logger(ErrorSink errors)
    {
        return std::make_unique<GlogLogger>(string(), std::move(errors));
    }

    std::unique_ptr<ILogger> BackendBase::systemLogger(ErrorSink errors)
    {
        return std::make_unique<GlogLogger>(config_.name, std::move(errors));
    }

    //---start программы, ожидание SIGTERM/SIGINT, stop программы
    bool BackendBase::run(Error* error)
    {
        const KeyValue::Func wait = config_.option.getFunc(option::kRunWait, nullptr);

        //---Сигналы блокируются до start: ранний SIGTERM останется в очереди
        //   и будет получен sigwait. Потоки программы наследуют маску
        sigset_t set;
        sigset_t old;
        sigemptyset(&set);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGINT);
        if (!wait) pthread_sigmask(SIG_BLOCK, &set, &old);

        if (!program_.start(*this, error))
        {
            if (!wait) pthread_sigmask(SIG_SETMASK, &old, nullptr);
            return programFailed(error, "start");
        }

        if (wait)
        {
            wait();
        }
        else
        {
            int sig = 0;
            while (sigwait(&set, &sig) != 0) {}
            pthread_sigmask(SIG_SETMASK, &old, nullptr);
            LOG(INFO) << string() << ": received signal " << sig << ", stopping";
        }

        if (!program_.stop(*this, error))
            return programFailed(error, "stop");
        return true;
    }

    //---Политика по умолчанию: stop, пауза, start. start не вызывается, если stop не удался
    bool BackendBase::restart(Error* error)
    {
        if (!stop(error)) return false;
        std::this_thread::sleep_for(restartDelay_);
        return start(error);
    }

    bool BackendBase::templateData(tmpl::Data& data, Error* error) const
    {
        const fs::path exe = config_.execPath();
        if (exe.empty())
            return fail(error, ErrorKind::Io, "cannot determine service executable path");

        data.set("Name", config_.name);
        data.set("DisplayName", string());
        data.set("Description", sanitizeDescription(config_.description.empty() ? string() : config_.description));
        data.set("UserName", config_.userName);
        data.set("Path", exe.string());
        data.setList("Arguments", config_.arguments);
        data.setList("Dependencies", config_.dependencies);
        data.set("WorkingDirectory", config_.workingDirectory.string());
        data.set("ChRoot", config_.chRoot.string());
        data.set("LogDirectory", config_.option.getString(option::kLogDirectory, kDefaultLogDirectory));
        data.set("PIDFile", config_.option.getString(option::kPIDFile, ""));
        data.setFlag("LogOutput", config_.option.getBool(option::kLogOutput, false));
        return true;
    }

    std::string BackendBase::scriptTemplate(const char* optionName, const std::string& builtin) const
    {
        const std::string custom = config_.option.getString(optionName, "");
        return custom.empty() ? builtin : custom;
    }

    bool BackendBase::writeDescriptor(const fs::path& path, const std::string& templateText,
        const tmpl::Data& data, fs::perms perms, Error* error) const
    {
        //---O_EXCL: создание и проверка существования одной операцией
        //   (висячая символьная ссылка тоже считается существующим файлом)
        const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0)
        {
            const int err = errno;
            if (err == EEXIST)
                return fail(error, ErrorKind::AlreadyInstalled, "Init already exists: " + path.string());
            return fail(error, ErrorKind::Io, "Failed to create " + path.string() + ": " + std::strerror(err));
        }

        //---Ошибка шаблона: файл остаётся на месте для диагностики
        std::string text;
        if (!tmpl::render(templateText, data, text, error))
        {
            ::close(fd);
            LOG(ERROR) << "render " << path.string() << ": " << (error ? error->message : "template error");
            return false;
        }

        bool ok = writeAll(fd, text);
        int err = ok ? 0 : errno;
        if (::close(fd) != 0 && ok)
        {
            ok = false;
            err = errno;
        }
        if (!ok)
            return fail(error, ErrorKind::Io, "Failed to write " + path.string() + ": " + std::strerror(err));

        std::error_code ec;
        fs::permissions(path, perms, fs::perm_options::replace, ec);
        if (ec)
            return fail(error, ErrorKind::Io, "chmod " + path.string() + ": " + ec.message());

        LOG(INFO) << "installed " << path.string();
        return true;
    }

    bool BackendBase::removeFile(const fs::path& path, Error* error)
    {
        std::error_code ec;
        if (!fs::remove(path, ec))
        {
            if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return fail(error, ErrorKind::Io, "remove " + path.string() + ": " + ec.message());
        }
        return true;
    }

} // namespace unisvc::backend
#endif
