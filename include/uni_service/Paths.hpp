#pragma once
#include <filesystem>
#include <string>

namespace unisvc {

	namespace fs = std::filesystem;

	//---Директория, в которой находится исполняемый файл uni-service
	fs::path selfDir();
	
	//--Определение пути к исполняемому файлу службы:
	//	Если exeArg пустой → возвращается пустой путь (Config::execPath() возьмёт текущий бинарник)
	//	Если exeArg относительный путь → selfDir() / exeArg
	//	Если exeArg абсолютный путь → остаётся без изменений
	fs::path resolveServiceExePath(const std::string& exeArg);

	//---Поиск программы в PATH (пустой путь, если не найдена)
	fs::path lookPath(const std::string& name);

	//---Домашний каталог текущего пользователя ($HOME или passwd)
	fs::path homeDir();

};//---namespace unisvc
