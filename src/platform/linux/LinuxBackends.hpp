#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "uni_service/Config.hpp"
#include "uni_service/IServiceBackend.hpp"
#include "uni_service/Template.hpp"

namespace unisvc::backend {

    namespace fs = std::filesystem;

    //---Абсолютный системный путь внутри корня (root = "/" в рабочем режиме)
    fs::path rooted(const fs::path& root, const fs::path& abs);

    //---Помощники детекторов: ошибки файловой системы = "не найдено"
    bool pathExists(const fs::path& p);
    bool inittabMatches(const fs::path& root, const std::string& pattern);
    fs::path findTool(const fs::path& root, const std::string& name);

    //---Разбор вывода "status" сгенерированных скриптов:
    //   "Running..." -> Running, "Stopped..." -> Stopped, иначе Unknown + NotInstalled
    Status parseScriptStatus(const std::string& out, Error* error);

    //---Общая часть всех бэкендов: run, restart по умолчанию, логгер, шаблоны
    class BackendBase : public IServiceBackend {
    public:
        BackendBase(IProgram& program, std::string platform, Config config, fs::path root);

        bool run(Error* error) override;
        bool restart(Error* error) override;

        std::unique_ptr<ILogger> logger(ErrorSink errors) override;
        std::unique_ptr<ILogger> systemLogger(ErrorSink errors) override;

        std::string string() const override;
        std::string platform() const override { return platform_; }

    protected:
        const Config& config() const { return config_; }
        const fs::path& root() const { return root_; }
        fs::path rooted(const fs::path& abs) const { return backend::rooted(root_, abs); }

        //---Поля, общие для всех шаблонов (Name, Path, Arguments, ...)
        bool templateData(tmpl::Data& data, Error* error) const;

        //---Текст шаблона: пользовательский из option или встроенный
        std::string scriptTemplate(const char* optionName, const std::string& builtin) const;

        //---Создание дескриптора: проверка существования, создание файла,
        //   отрисовка шаблона, права доступа. Частично записанный файл не удаляется
        bool writeDescriptor(const fs::path& path, const std::string& templateText,
            const tmpl::Data& data, fs::perms perms, Error* error) const;

        //---Удаление файла; ошибка возвращается как есть (ErrorKind::Io)
        static bool removeFile(const fs::path& path, Error* error);

        //---Пауза между stop и start в restart()
        std::chrono::milliseconds restartDelay_{ 50 };

    private:
        IProgram& program_;
        std::string platform_;
        Config config_;
        fs::path root_;
    };

    //------------------------------------------------------------
    //  systemd
    //------------------------------------------------------------
    bool isSystemd(const fs::path& root = "/");
    std::unique_ptr<IServiceBackend> newSystemdService(IProgram& program, const std::string& platform,
        const Config& config, Error* error, const fs::path& root = "/");

    //---Разбор "systemctl is-active" (ветка inactive уточняется через list-unit-files)
    enum class ActiveState { Active, Activating, Inactive, Failed, Other };
    ActiveState parseIsActive(const std::string& out);

    //---Есть ли строка unit-файла в выводе "systemctl list-unit-files"
    bool listsUnit(const std::string& out, const std::string& unit);

    //------------------------------------------------------------
    //  upstart
    //------------------------------------------------------------
    bool isUpstart(const fs::path& root = "/");
    std::unique_ptr<IServiceBackend> newUpstartService(IProgram& program, const std::string& platform,
        const Config& config, Error* error, const fs::path& root = "/");

    //---Разбор "initctl status <name>"
    Status parseUpstartStatus(const std::string& name, const std::string& out, Error* error);

    //------------------------------------------------------------
    //  OpenRC
    //------------------------------------------------------------
    bool isOpenRC(const fs::path& root = "/");
    std::unique_ptr<IServiceBackend> newOpenRCService(IProgram& program, const std::string& platform,
        const Config& config, Error* error, const fs::path& root = "/");

    //---Код завершения "rc-service <name> status" -> Status
    Status decodeOpenRCStatus(int exitCode, const Error& cmdError, Error* error);

    //------------------------------------------------------------
    //  Init-скрипты: SysV, rcS, boxrc
    //------------------------------------------------------------

    //---Раскладка файлов init-скрипта
    struct ScriptLayout final {
        fs::path descriptorDir;                             //  Каталог скрипта ("/etc/init.d")
        std::string prefix;                                 //  Числовой префикс имени ("65")
        std::vector<std::pair<fs::path, std::string>> links;//  (каталог, префикс) символьных ссылок
        bool linksBestEffort = false;                       //  Ошибки ссылок не фатальны (SysV)
        bool viaServiceTool = false;                        //  Управление через "service <name> <verb>"
        std::string defaultScript;                          //  Встроенный шаблон
    };

    ScriptLayout sysvLayout();
    ScriptLayout rcsLayout();
    ScriptLayout boxrcLayout();

    bool isSysV(const fs::path& root = "/");
    bool isRCS(const fs::path& root = "/");
    bool isBoxRC(const fs::path& root = "/");

    std::unique_ptr<IServiceBackend> newInitScriptService(IProgram& program, const std::string& platform,
        const Config& config, ScriptLayout layout, Error* error, const fs::path& root = "/");

} // namespace unisvc::backend
