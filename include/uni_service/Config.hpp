#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace unisvc {

	namespace fs = std::filesystem;

	//---Имена известных опций (Config::option)
	namespace option {
		inline constexpr const char* kUserService = "UserService";			// bool: пользовательская служба (только systemd)
		inline constexpr const char* kRunWait = "RunWait";					// func: замена ожидания сигнала в run()
		inline constexpr const char* kLogDirectory = "LogDirectory";		// string: каталог логов для скриптов
		inline constexpr const char* kLogOutput = "LogOutput";				// bool: stdout/stderr в /var/log (systemd, upstart)
		inline constexpr const char* kRestart = "Restart";					// string: Restart= для systemd
		inline constexpr const char* kSuccessExitStatus = "SuccessExitStatus";
		inline constexpr const char* kLimitNOFILE = "LimitNOFILE";			// int: -1 - не задавать
		inline constexpr const char* kReloadSignal = "ReloadSignal";
		inline constexpr const char* kPIDFile = "PIDFile";
		inline constexpr const char* kSystemdScript = "SystemdScript";		// string: свой шаблон unit-файла
		inline constexpr const char* kUpstartScript = "UpstartScript";
		inline constexpr const char* kOpenRCScript = "OpenRCScript";
		inline constexpr const char* kSysvScript = "SysvScript";
		inline constexpr const char* kRCSScript = "RCSScript";				// rcS и boxrc
	}

	inline constexpr const char* kDefaultLogDirectory = "/var/log";

	//---Набор именованных типизированных опций
	class KeyValue final {
	public:
		using Func = std::function<void()>;
		using Value = std::variant<bool, int, std::string, Func>;

		void set(const std::string& name, Value v) { values_[name] = std::move(v); }
		//---Строковый литерал иначе превратился бы в bool
		void set(const std::string& name, const char* v) { values_[name] = std::string(v); }
		bool has(const std::string& name) const { return values_.count(name) != 0; }

		//---Значение опции или def, если опции нет или у неё другой тип
		bool getBool(const std::string& name, bool def) const;
		int getInt(const std::string& name, int def) const;
		std::string getString(const std::string& name, const std::string& def) const;
		Func getFunc(const std::string& name, Func def) const;

	private:
		std::map<std::string, Value> values_;
	};

	//---Описание управляемой службы
	struct Config final {

		//---Параметры службы
		std::string name;						//	Обязательное поле: имя файла дескриптора и процесса
		std::string displayName;				//	Если пустое - используется name
		std::string description;
		std::string userName;					//	От чьего имени запускать (systemd, upstart)

		fs::path executable;					//	Если пустой - путь к текущему исполняемому файлу
		std::vector<std::string> arguments;		//	Аргументы для executable (по одному на элемент)
		std::vector<std::string> dependencies;	//	Доп. строки [Unit] (systemd) / depend() (OpenRC)

		fs::path workingDirectory;
		fs::path chRoot;

		KeyValue option;

		//---Путь к исполняемому файлу службы (executable или текущий бинарник)
		fs::path execPath() const;
	};

};//---namespace unisvc
