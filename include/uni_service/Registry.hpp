#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Config.hpp"
#include "Errors.hpp"
#include "IServiceBackend.hpp"

namespace unisvc {

	//---Кандидат в бэкенды: имя, детектор и конструктор
	struct BackendDescriptor final {
		using Factory = std::function<std::unique_ptr<IServiceBackend>(
			IProgram& program, const std::string& platform, const Config& config, Error* error)>;

		std::string name;
		std::function<bool()> detect;		//	Дешёвый, без побочных эффектов, без исключений
		std::function<bool()> interactive;
		Factory create;
	};

	//---Упорядоченный список бэкендов: первый сработавший детектор побеждает
	//   Выбор выполняется один раз и больше не пересматривается
	class Registry final {
	public:
		explicit Registry(std::vector<BackendDescriptor> candidates);

		//---Выбранный бэкенд (nullptr, если ни один не подошёл)
		const BackendDescriptor* select();

		//---Создание службы выбранного бэкенда
		std::unique_ptr<IServiceBackend> newService(IProgram& program, const Config& config, Error* error);

		//---Имя выбранного бэкенда ("" если не найден)
		std::string platform();
		//---Интерактивный запуск (по правилам выбранного бэкенда)
		bool interactive();

		const std::vector<BackendDescriptor>& candidates() const { return candidates_; }

	private:
		std::vector<BackendDescriptor> candidates_;
		bool probed_ = false;
		std::optional<std::size_t> chosen_;
	};

};//---namespace unisvc
