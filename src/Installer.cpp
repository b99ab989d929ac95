#include "uni_service/Installer.hpp"
#include "uni_service/Config.hpp"
#include "uni_service/IServiceBackend.hpp"
#include "uni_service/Paths.hpp"
#include "uni_service/Platform.hpp"

#include <cctype>
#include <iostream>
#include <glog/logging.h>

namespace unisvc {

	namespace {
		//------------------------------------------------------------
		//	Программа для режима --run: только логирует start / stop
		//------------------------------------------------------------
		class HostedProgram final : public IProgram {
		public:
			bool start(IServiceBackend& service, Error* /*error*/) override
			{
				logger_ = service.logger(nullptr);
				logger_->info("started under " + service.platform());
				return true;
			}
			bool stop(IServiceBackend& /*service*/, Error* /*error*/) override
			{
				if (logger_) logger_->info("stopping");
				return true;
			}
		private:
			std::unique_ptr<ILogger> logger_;
		};

		//------------------------------------------------------------
		//	Проверка, что строка пустая или содержит только пробельные символы
		//------------------------------------------------------------
		static bool isEmptyOrWhitespace(const std::string& s) {
			for (char c : s)
			{
				if (!std::isspace(static_cast<unsigned char>(c))) return false;
			}
			return true;
		}
		//------------------------------------------------------------
		//	Формирование конфигурации службы из опций
		//------------------------------------------------------------
		static Config makeConfig(const CliOptions& opt) {
			Config c;
			c.name = opt.name;
			c.displayName = opt.displayName;
			c.description = opt.description;

			//---Если описание службы пустое → использование имени службы
			if (isEmptyOrWhitespace(c.description)) c.description = opt.displayName.empty() ? opt.name : opt.displayName;

			c.executable = resolveServiceExePath(opt.exe);
			c.arguments = opt.args;
			c.workingDirectory = opt.workDir;

			c.option.set(option::kUserService, opt.userService);
			c.option.set(option::kLogOutput, opt.logOutput);
			if (!opt.logDir.empty()) c.option.set(option::kLogDirectory, opt.logDir);
			return c;
		}
	} // namespace

	//------------------------------------------------------------
	//	Логирование ошибки и возврат кода ошибки
	//------------------------------------------------------------
	static int fail(const std::string& what, const Error& err) {
		LOG(ERROR) << what << ": " << (err.message.empty() ? toString(err.kind) : err.message);
		return 1;
	}
	static int fail(const std::string& msg) {
		LOG(ERROR) << msg;
		return 1;
	}
	//------------------------------------------------------------
	//	Оркестратор: выполнение команды CLI
	//------------------------------------------------------------
	int runInstaller(const CliOptions& opt) {

		Registry registry = makeRegistry();

		//---Вывод выбранной init-системы
		if (opt.cmd == Command::Platform)
		{
			const std::string p = registry.platform();
			if (p.empty()) return fail(toString(ErrorKind::NoServiceSystemDetected));
			std::cout << p << "\n";
			return 0;
		}

		//---Валидация опций
		if (opt.name.empty()) return fail("Missing required option: --name=<service_name>");

		//---Изменение системных служб требует root
		const bool mutating = opt.cmd == Command::Install || opt.cmd == Command::Uninstall ||
			opt.cmd == Command::Start || opt.cmd == Command::Stop || opt.cmd == Command::Restart;
		if (mutating && !opt.userService && !requireAdminRoot()) return fail("root privileges required.");

		//---Создание службы для обнаруженной init-системы
		const Config config = makeConfig(opt);
		HostedProgram program;
		Error err;
		auto service = registry.newService(program, config, &err);
		if (!service) return fail("select backend", err);

		LOG(INFO) << "service " << service->string() << " on " << service->platform();

		switch (opt.cmd)
		{
		case Command::Install:
			if (!service->install(&err)) return fail("install", err);
			return 0;
		case Command::Uninstall:
			if (!service->uninstall(&err)) return fail("uninstall", err);
			return 0;
		case Command::Start:
			if (!service->start(&err)) return fail("start", err);
			return 0;
		case Command::Stop:
			if (!service->stop(&err)) return fail("stop", err);
			return 0;
		case Command::Restart:
			if (!service->restart(&err)) return fail("restart", err);
			return 0;
		case Command::Status:
		{
			const Status st = service->status(&err);
			if (!err.ok() && !err.is(ErrorKind::NotInstalled)) return fail("status", err);
			std::cout << toString(st) << (err.is(ErrorKind::NotInstalled) ? " (not installed)" : "") << "\n";
			return err.is(ErrorKind::NotInstalled) ? 3 : 0;
		}
		case Command::Run:
			if (!service->run(&err)) return fail("run", err);
			return 0;
		default:
			return 2;
		}
	}
}; //---namespace unisvc
