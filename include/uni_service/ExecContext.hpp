#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <sys/types.h>

namespace unisvc {

	namespace fs = std::filesystem;

	//---Входные данные для определения контекста запуска
	struct ContextProbe final {
		fs::path cgroupFile = "/proc/1/cgroup";	//	Членство процесса 1 в cgroup
		fs::path procRoot = "/proc";			//	Откуда читать <pid>/stat
		pid_t parentPid = 0;					//	0 - взять getppid()
	};

	//---Запущен ли процесс интерактивно (консоль), а не init-системой
	//   Любая ошибка чтения = "условие не выполнено", исключений нет
	bool isInteractive();
	bool isInteractive(const ContextProbe& probe);

	//---Признаки docker / lxc в первых строках cgroup-файла
	bool isInContainer(const fs::path& cgroupFile, std::error_code& ec);

	//---Имя бинарника процесса из <procRoot>/<pid>/stat
	bool binaryName(pid_t pid, const fs::path& procRoot, std::string& out);

	//---Разбор строки stat: подстрока между первой '(' и следующей за ней ')'
	bool parseStatBinaryName(const std::string& stat, std::string& out);

};//---namespace unisvc
