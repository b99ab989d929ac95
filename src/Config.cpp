#include "uni_service/Config.hpp"
#include "platform/PlatformImpl.hpp"

namespace unisvc {

	bool KeyValue::getBool(const std::string& name, bool def) const
	{
		auto it = values_.find(name);
		if (it == values_.end()) return def;
		if (const bool* v = std::get_if<bool>(&it->second)) return *v;
		return def;
	}

	int KeyValue::getInt(const std::string& name, int def) const
	{
		auto it = values_.find(name);
		if (it == values_.end()) return def;
		if (const int* v = std::get_if<int>(&it->second)) return *v;
		return def;
	}

	std::string KeyValue::getString(const std::string& name, const std::string& def) const
	{
		auto it = values_.find(name);
		if (it == values_.end()) return def;
		if (const std::string* v = std::get_if<std::string>(&it->second)) return *v;
		return def;
	}

	KeyValue::Func KeyValue::getFunc(const std::string& name, Func def) const
	{
		auto it = values_.find(name);
		if (it == values_.end()) return def;
		if (const Func* v = std::get_if<Func>(&it->second))
		{
			if (*v) return *v;
		}
		return def;
	}

	//---Путь к исполняемому файлу службы
	fs::path Config::execPath() const
	{
		if (!executable.empty()) return executable;
		return platform::selfExePath();
	}

}; //---namespace unisvc
