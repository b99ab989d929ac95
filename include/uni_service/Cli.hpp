#pragma once
#include <iostream>
#include <string>
#include <vector>

namespace unisvc {

	//---Команды CLI
	enum class Command {
	Help,
	Install,
	Uninstall,
	Start,
	Stop,
	Restart,
	Status,
	Platform,
	Run,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {
	
		//---Команда
		Command cmd = Command::Help;

		//---Параметры службы
		std::string name;						//	Имя службы
		std::string displayName;				//	Отображаемое имя
		std::string description;				//	Описание службы
		std::string exe;						//	Путь к исполняемому файлу
		std::vector<std::string> args;			//	Аргументы (по одному на --arg=)
		std::string workDir;					//	Рабочий каталог
		std::string logDir;						//	Каталог логов скриптов и glog

		//---Флаги
		bool userService = false;				//	Пользовательская служба (systemd --user)
		bool logOutput = false;					//	stdout/stderr службы в /var/log
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

};//---namespace unisvc
