#pragma once
#include <filesystem>
#include <vector>
#include "uni_service/Registry.hpp"

namespace unisvc {

	//---Платформенно-зависимые реализации
	namespace platform {
		namespace fs = std::filesystem;

		//---Получение пути к собственному исполняемому файлу
		fs::path selfExePath();
		//---Проверка, что процесс запущен с правами root
		bool isElevated();
		//---Кандидаты в бэкенды в порядке приоритета
		std::vector<BackendDescriptor> backendCandidates();
	}

} // namespace unisvc
