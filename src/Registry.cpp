#include "uni_service/Registry.hpp"
#include "uni_service/ExecContext.hpp"

#include <glog/logging.h>

namespace unisvc {

	Registry::Registry(std::vector<BackendDescriptor> candidates)
		: candidates_(std::move(candidates))
	{
	}

	//------------------------------------------------------------
	//	Выбор бэкенда: первый сработавший детектор, только один раз
	//------------------------------------------------------------
	const BackendDescriptor* Registry::select()
	{
		if (!probed_)
		{
			probed_ = true;
			for (std::size_t i = 0; i < candidates_.size(); i++)
			{
				const auto& c = candidates_[i];
				if (c.detect && c.detect())
				{
					chosen_ = i;
					VLOG(1) << "service system detected: " << c.name;
					break;
				}
			}
			if (!chosen_) LOG(WARNING) << "no service system detected";
		}
		return chosen_ ? &candidates_[*chosen_] : nullptr;
	}

	std::unique_ptr<IServiceBackend> Registry::newService(IProgram& program, const Config& config, Error* error)
	{
		const BackendDescriptor* d = select();
		if (!d || !d->create)
		{
			fail(error, ErrorKind::NoServiceSystemDetected, "");
			return nullptr;
		}
		return d->create(program, d->name, config, error);
	}

	std::string Registry::platform()
	{
		const BackendDescriptor* d = select();
		return d ? d->name : std::string{};
	}

	bool Registry::interactive()
	{
		const BackendDescriptor* d = select();
		if (d && d->interactive) return d->interactive();
		return isInteractive();
	}

}; //---namespace unisvc
