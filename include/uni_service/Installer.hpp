#pragma once
#include "Cli.hpp"

namespace unisvc {

	//---Оркестратор: выполнение команды CLI, возвращает код выхода процесса
	int runInstaller(const CliOptions& opt);

};//---namespace unisvc
