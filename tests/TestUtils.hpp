#pragma once
#include <filesystem>
#include <fstream>
#include <random>
#include <cstdlib>
#include <sstream>
#include <string>
#include <system_error>
#include <unistd.h>

namespace unisvc::test {

    namespace fs = std::filesystem;

    //---Временный каталог, удаляется в деструкторе
    class TempDir final {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = fs::temp_directory_path() /
                ("uni_service_test_" + std::to_string(::getpid()) + "_" + std::to_string(rd()));
            fs::create_directories(path_);
        }
        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const fs::path& path() const { return path_; }
        fs::path operator/(const fs::path& p) const { return path_ / p; }

    private:
        fs::path path_;
    };

    inline void writeFile(const fs::path& p, const std::string& text)
    {
        fs::create_directories(p.parent_path());
        std::ofstream f(p, std::ios::binary | std::ios::trunc);
        f << text;
    }

    inline std::string readFile(const fs::path& p)
    {
        std::ifstream f(p, std::ios::binary);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    inline void makeExecutable(const fs::path& p)
    {
        fs::permissions(p, fs::perms::owner_all, fs::perm_options::replace);
    }

    //---Каталог в начале PATH на время теста
    class ScopedPath final {
    public:
        explicit ScopedPath(const fs::path& dir)
        {
            const char* old = std::getenv("PATH");
            old_ = old ? old : "";
            ::setenv("PATH", (dir.string() + ":" + old_).c_str(), 1);
        }
        ~ScopedPath() { ::setenv("PATH", old_.c_str(), 1); }

        ScopedPath(const ScopedPath&) = delete;
        ScopedPath& operator=(const ScopedPath&) = delete;

    private:
        std::string old_;
    };

    //---Исполняемый shell-скрипт
    inline void writeScript(const fs::path& p, const std::string& body)
    {
        writeFile(p, "#!/bin/sh\n" + body);
        makeExecutable(p);
    }

} // namespace unisvc::test
