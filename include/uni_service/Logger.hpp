#pragma once
#include <functional>
#include <string>

namespace unisvc {

	//---Получатель ошибок логгера (может быть пустым)
	using ErrorSink = std::function<void(const std::string&)>;

	//---Логгер, доступный программе через службу
	class ILogger {
	public:
		virtual ~ILogger() = default;

		virtual void error(const std::string& msg) = 0;
		virtual void warning(const std::string& msg) = 0;
		virtual void info(const std::string& msg) = 0;
	};

	//---Логгер поверх glog. Сообщения уровня error дополнительно уходят в sink
	class GlogLogger final : public ILogger {
	public:
		GlogLogger(std::string name, ErrorSink errors);

		void error(const std::string& msg) override;
		void warning(const std::string& msg) override;
		void info(const std::string& msg) override;

	private:
		std::string name_;
		ErrorSink errors_;
	};

	//---Инициализация glog
	//   logDir - каталог для файлов логов (пустой - только stderr)
	//   interactive - дублировать вывод в консоль
	void initLogging(const char* programName, const std::string& logDir, bool interactive);

};//---namespace unisvc
