#pragma once

namespace unisvc {

	//---Состояние службы (вычисляется заново при каждом запросе)
	enum class Status {
		Unknown,
		Running,
		Stopped
	};

	inline const char* toString(Status s)
	{
		switch (s)
		{
		case Status::Running: return "Running";
		case Status::Stopped: return "Stopped";
		default: return "Unknown";
		}
	}

};//---namespace unisvc
