#include "uni_service/Platform.hpp"
#include "platform/PlatformImpl.hpp"

namespace unisvc {
	//------------------------------------------------------------
	//	Проверка прав root
	//------------------------------------------------------------
	bool requireAdminRoot() {
		return platform::isElevated();
	}
	//------------------------------------------------------------
	//	Список бэкендов для текущей платформы
	//------------------------------------------------------------
	Registry makeRegistry() {
		return Registry(platform::backendCandidates());
	}
}; //---namespace unisvc
