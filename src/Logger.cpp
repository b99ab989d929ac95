#include "uni_service/Logger.hpp"

#include <filesystem>
#include <system_error>
#include <glog/logging.h>

namespace unisvc {

	namespace fs = std::filesystem;

	GlogLogger::GlogLogger(std::string name, ErrorSink errors)
		: name_(std::move(name)), errors_(std::move(errors))
	{
	}

	void GlogLogger::error(const std::string& msg)
	{
		LOG(ERROR) << name_ << ": " << msg;
		if (errors_) errors_(msg);
	}

	void GlogLogger::warning(const std::string& msg)
	{
		LOG(WARNING) << name_ << ": " << msg;
	}

	void GlogLogger::info(const std::string& msg)
	{
		LOG(INFO) << name_ << ": " << msg;
	}

	//---Инициализация логгера
	void initLogging(const char* programName, const std::string& logDir, bool interactive)
	{
		if (!logDir.empty())
		{
			//---Создание директории для логов (ошибка не фатальна - glog сам пишет в stderr)
			std::error_code ec;
			fs::create_directories(logDir, ec);

			const fs::path dir(logDir);
			google::SetLogDestination(google::GLOG_INFO, (dir / "uni-service.info.").string().c_str());
			google::SetLogDestination(google::GLOG_WARNING, (dir / "uni-service.warning.").string().c_str());
			google::SetLogDestination(google::GLOG_ERROR, (dir / "uni-service.error.").string().c_str());
			google::SetLogDestination(google::GLOG_FATAL, (dir / "uni-service.fatal.").string().c_str());
		}
		else
		{
			FLAGS_logtostderr = true;
		}
		google::InitGoogleLogging(programName); // Инициализация

		//---Настройка вывода в консоль
		FLAGS_alsologtostderr = interactive;
		FLAGS_colorlogtostderr = interactive;
	}

}; //---namespace unisvc
