#if defined(__linux__)
#include "platform/PlatformImpl.hpp"
#include "platform/linux/LinuxBackends.hpp"
#include "uni_service/ExecContext.hpp"
#include <unistd.h>
#include <vector>

namespace unisvc::platform {

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
	}
	//---Проверка, что процесс запущен с правами root
	bool isElevated()
	{
		return ::geteuid() == 0;
	}
	//---Кандидаты в порядке приоритета: первый сработавший детектор побеждает
	std::vector<BackendDescriptor> backendCandidates()
	{
		using namespace unisvc::backend;

		auto script = [](ScriptLayout (*layout)()) {
			return [layout](IProgram& p, const std::string& platform, const Config& c, Error* e) {
				return newInitScriptService(p, platform, c, layout(), e);
			};
		};

		return {
			{ "linux-systemd", [] { return isSystemd(); }, [] { return isInteractive(); },
				[](IProgram& p, const std::string& platform, const Config& c, Error* e) { return newSystemdService(p, platform, c, e); } },
			{ "linux-upstart", [] { return isUpstart(); }, [] { return isInteractive(); },
				[](IProgram& p, const std::string& platform, const Config& c, Error* e) { return newUpstartService(p, platform, c, e); } },
			{ "linux-openrc", [] { return isOpenRC(); }, [] { return isInteractive(); },
				[](IProgram& p, const std::string& platform, const Config& c, Error* e) { return newOpenRCService(p, platform, c, e); } },
			{ "linux-rcs", [] { return isRCS(); }, [] { return isInteractive(); }, script(&rcsLayout) },
			{ "linux-boxrc", [] { return isBoxRC(); }, [] { return isInteractive(); }, script(&boxrcLayout) },
			{ "linux-systemv", [] { return isSysV(); }, [] { return isInteractive(); }, script(&sysvLayout) },
		};
	}

} // namespace unisvc::platform
#endif
