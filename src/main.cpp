#include <iostream>
#include "uni_service/Cli.hpp"
#include "uni_service/ExecContext.hpp"
#include "uni_service/Installer.hpp"
#include "uni_service/Logger.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const unisvc::CliOptions opt = unisvc::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == unisvc::Command::Help || opt.cmd == unisvc::Command::Invalid)
	{
		unisvc::printHelp(std::cout);
		return (opt.cmd == unisvc::Command::Invalid) ? 2 : 0;
	}

	//---Инициализация логгера
	unisvc::initLogging(argv[0], opt.logDir, unisvc::isInteractive());

	//---Выполнение команды
	return unisvc::runInstaller(opt);
}
