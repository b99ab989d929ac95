#pragma once
#include "Registry.hpp"

namespace unisvc {

	//---Запуск с правами root
	bool requireAdminRoot();

	//---Список бэкендов для текущей платформы в порядке приоритета
	Registry makeRegistry();

};//---namespace unisvc
