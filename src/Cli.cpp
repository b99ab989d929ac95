#include "uni_service/Cli.hpp"
#include <iomanip>
#include <string_view>

namespace unisvc {
	//------------------------------------------------------------
	//	Проверка, что строка начинается с префикса
	//------------------------------------------------------------
	static bool startsWith(std::string_view s, std::string_view p) {
		return s.size() >= p.size() && s.substr(0, p.size()) == p;
	}
	//------------------------------------------------------------
	//	Удаление кавычек в начале и конце строки
	//------------------------------------------------------------
	static std::string trimQuotes(std::string v) {

		//---Если строка слишком короткая → возврат без изменений
		if (v.size() < 2) return v;

		//---Проверка на двойные или одинарные кавычки
		const bool dbl = (v.front() == '"' && v.back() == '"');
		const bool sgl = (v.front() == '\'' && v.back() == '\'');

		//---Если есть кавычки → удаление
		if (dbl || sgl) v = v.substr(1, v.size() - 2);

		return v;
	}
	//------------------------------------------------------------
	//	Все значения ключа (--arg=a --arg=b → {a, b})
	//------------------------------------------------------------
	static std::vector<std::string> getAllKv(int argc, char** argv, const std::string& key) {

		const std::string prefix = key + "=";

		std::vector<std::string> out;
		for (int i = 1; i < argc; i++)
		{
			std::string_view a = argv[i];
			if (startsWith(a, prefix))
			{
				out.push_back(trimQuotes(std::string(a.substr(prefix.size()))));
			}
		}
		return out;
	}
	//------------------------------------------------------------
	//	Получение значения ключа из аргументов командной строки
	//------------------------------------------------------------
	static std::string getKv(int argc, char** argv, const std::string& key) {
		auto all = getAllKv(argc, argv, key);
		return all.empty() ? std::string{} : all.front();
	}
	//------------------------------------------------------------
	//	Проверка наличия флага в аргументах командной строки
	//------------------------------------------------------------
	static bool hasFlag(int argc, char** argv, std::string_view flag) {
		for (int i = 1; i < argc; i++)
		{
			if (argv[i] == flag) return true;
		}
		return false;
	}
	//------------------------------------------------------------
	//---Парсинг опций командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		//---Результирующие опции
		CliOptions o;

		//---Команды
		static const std::pair<const char*, Command> commands[] = {
			{ "--install", Command::Install },
			{ "--uninstall", Command::Uninstall },
			{ "--start", Command::Start },
			{ "--stop", Command::Stop },
			{ "--restart", Command::Restart },
			{ "--status", Command::Status },
			{ "--platform", Command::Platform },
			{ "--run", Command::Run },
		};

		//---Параметры службы
		o.name = getKv(argc, argv, "--name");
		o.displayName = getKv(argc, argv, "--display");
		o.description = getKv(argc, argv, "--desc");
		o.exe = getKv(argc, argv, "--exe");
		o.args = getAllKv(argc, argv, "--arg");
		o.workDir = getKv(argc, argv, "--workdir");
		o.logDir = getKv(argc, argv, "--log-dir");

		//---Флаги
		o.userService = hasFlag(argc, argv, "--user");
		o.logOutput = hasFlag(argc, argv, "--log-output");

		//---Определение команды
		int cmdCount = 0;
		for (const auto& [flag, cmd] : commands)
		{
			if (hasFlag(argc, argv, flag))
			{
				o.cmd = cmd;
				cmdCount++;
			}
		}

		//---Если не указана ни одна команда → Help
		if (cmdCount == 0)
		{
			o.cmd = Command::Help;
			return o;
		}
		//---Если некорректно указана команда → Invalid
		if (cmdCount > 1)
		{
			o.cmd = Command::Invalid;
		}
		return o;
	}
	//------------------------------------------------------------
	//	Вывод опции с описанием
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc, int w = 24)
	{
		os << "  " << std::left << std::setw(w) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Вывод справки по использованию
	//------------------------------------------------------------
	void printHelp(std::ostream& os)
	{
		os <<
			"uni-service\n\n"
			"Usage:\n"
			"  uni-service <command> [options]\n\n"
			"Commands (choose exactly one):\n"
			"  --install        Install service for the detected init system\n"
			"  --uninstall      Uninstall service\n"
			"  --start          Start service\n"
			"  --stop           Stop service\n"
			"  --restart        Restart service\n"
			"  --status         Print service status (Running|Stopped|Unknown)\n"
			"  --platform       Print detected init system\n"
			"  --run            Run as the service process (blocks until SIGTERM/SIGINT)\n\n"
			"Common options:\n";

		printOpt(os, "--name=<name>", "Service name (required for any command except --platform)");
		printOpt(os, "--user", "Per-user service (systemd only)");
		printOpt(os, "--log-dir=<path>", "Log directory for generated scripts and uni-service logs");

		os << "\nInstall options:\n";
		printOpt(os, "--exe=<path>", "Service executable (default: uni-service itself)");
		printOpt(os, "", "If relative: resolved relative to uni-service location (selfDir).");
		printOpt(os, "--arg=<value>", "Service argument, repeat for each argument");
		printOpt(os, "--display=\"...\"", "Display name");
		printOpt(os, "--desc=\"...\"", "Description");
		printOpt(os, "--workdir=<path>", "Working directory");
		printOpt(os, "--log-output", "systemd/upstart: write stdout/stderr to /var/log/<name>.out/.err");

		os <<
			"\nExamples:\n"
			"  uni-service --platform\n"
			"  uni-service --install --name=echo --exe=/usr/local/bin/echo-server --arg=--port --arg=8080\n"
			"  uni-service --install --name=self --arg=--run --arg=--name=self\n"
			"  uni-service --status --name=echo\n"
			"  uni-service --restart --name=echo\n"
			"  uni-service --uninstall --name=echo\n";
	}
};//---namespace unisvc
