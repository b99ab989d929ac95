#include "uni_service/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace unisvc {

	//---Директория, в которой находится исполняемый файл uni-service
	fs::path selfDir() {
		
		//---Получение пути к собственному исполняемому файлу
		const fs::path exe = platform::selfExePath();

		//---Возврат родительской директории или текущей директории, если путь не определён
		if (!exe.empty())
		{
			return exe.parent_path();
		}
		std::error_code ec;
		return fs::current_path(ec);
	}
	//---Определение пути к исполняемому файлу службы:
	fs::path resolveServiceExePath(const std::string& exeArg) {
		
		if (exeArg.empty())
		{
			return {};
		}
		
		//---Формирование пути
		fs::path p(exeArg);
		
		//---Если путь относительный → формирование абсолютного пути относительно selfDir
		if (p.is_relative())
		{ 
			p = (selfDir() / p).lexically_normal();
		}
		return p;
	}
	//---Поиск программы в PATH
	fs::path lookPath(const std::string& name) {

		if (name.empty()) return {};

		//---Путь со слэшем проверяется как есть
		if (name.find('/') != std::string::npos)
		{
			return ::access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path{};
		}

		const char* env = std::getenv("PATH");
		const std::string path = env ? env : "";

		size_t b = 0;
		while (b <= path.size())
		{
			size_t e = path.find(':', b);
			if (e == std::string::npos) e = path.size();

			//---Пустой элемент PATH = текущий каталог
			const std::string dir = (e == b) ? "." : path.substr(b, e - b);
			const fs::path candidate = fs::path(dir) / name;

			std::error_code ec;
			if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0)
				return candidate;

			b = e + 1;
		}
		return {};
	}
	//---Домашний каталог текущего пользователя
	fs::path homeDir() {

		if (const char* home = std::getenv("HOME"); home && *home)
			return fs::path(home);

		if (const passwd* pw = ::getpwuid(::getuid()); pw && pw->pw_dir)
			return fs::path(pw->pw_dir);

		return {};
	}
} // namespace unisvc
