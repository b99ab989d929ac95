#include "uni_service/Errors.hpp"

namespace unisvc {

	const char* toString(ErrorKind kind)
	{
		switch (kind)
		{
		case ErrorKind::None: return "ok";
		case ErrorKind::NoServiceSystemDetected: return "no service system detected";
		case ErrorKind::UserServiceUnsupported: return "user service not supported";
		case ErrorKind::AlreadyInstalled: return "already installed";
		case ErrorKind::NotInstalled: return "the service is not installed";
		case ErrorKind::Io: return "io error";
		case ErrorKind::Command: return "command failed";
		case ErrorKind::Template: return "template error";
		case ErrorKind::Program: return "program error";
		}
		return "unknown error";
	}

	bool fail(Error* error, ErrorKind kind, std::string message)
	{
		if (error)
		{
			error->kind = kind;
			error->message = message.empty() ? toString(kind) : std::move(message);
		}
		return false;
	}

}; //---namespace unisvc
