#pragma once
#include <memory>
#include <string>
#include "Errors.hpp"
#include "Logger.hpp"
#include "Status.hpp"

namespace unisvc {

	class IServiceBackend;

	//---Интерфейс прикладной программы, которую обслуживает служба
	//   start/stop должны возвращаться быстро; долгую работу программа
	//   запускает в собственных потоках
	class IProgram {
	public:
		virtual ~IProgram() = default;

		virtual bool start(IServiceBackend& service, Error* error) = 0;
		virtual bool stop(IServiceBackend& service, Error* error) = 0;
	};

	//---Интерфейс бэкэнда управления службой (одна реализация на init-систему)
	class IServiceBackend {
	public:
		virtual ~IServiceBackend() = default;

		//---Установка / удаление дескриптора службы
		virtual bool install(Error* error) = 0;
		virtual bool uninstall(Error* error) = 0;

		//---Запуск программы в текущем процессе: start, ожидание SIGTERM/SIGINT, stop
		//   SIGTERM/SIGINT блокируются только в вызывающем потоке и в потоках,
		//   созданных после вызова run(). Потоки, запущенные раньше, должны сами
		//   заблокировать эти сигналы, иначе сигнал может завершить процесс
		//   без вызова IProgram::stop
		virtual bool run(Error* error) = 0;

		//---Управление установленной службой через init-систему
		virtual bool start(Error* error) = 0;
		virtual bool stop(Error* error) = 0;
		virtual bool restart(Error* error) = 0;

		//---Текущее состояние. Если служба не установлена: Unknown + ErrorKind::NotInstalled
		virtual Status status(Error* error) = 0;

		//---Логгер для программы
		virtual std::unique_ptr<ILogger> logger(ErrorSink errors) = 0;
		virtual std::unique_ptr<ILogger> systemLogger(ErrorSink errors) = 0;

		//---Отображаемое имя службы
		virtual std::string string() const = 0;
		//---Имя выбранного бэкенда ("linux-systemd", ...)
		virtual std::string platform() const = 0;
	};
};//---namespace unisvc
