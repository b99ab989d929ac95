#pragma once
#include <string>

namespace unisvc {

	//---Категории ошибок библиотеки
	enum class ErrorKind {
		None,
		NoServiceSystemDetected,	// Ни один бэкенд не подошёл к текущей системе
		UserServiceUnsupported,		// Бэкенд не поддерживает пользовательские службы
		AlreadyInstalled,			// Дескриптор службы уже существует
		NotInstalled,				// Служба не установлена (сентинел для status)
		Io,							// Ошибка файловой системы
		Command,					// Внешняя команда не запустилась или вернула ошибку
		Template,					// Ошибка разбора / отрисовки шаблона
		Program						// Ошибка в callback'ах программы (IProgram)
	};

	//---Ошибка: категория + сообщение для диагностики
	struct Error final {
		ErrorKind kind = ErrorKind::None;
		std::string message;

		bool ok() const { return kind == ErrorKind::None; }
		bool is(ErrorKind k) const { return kind == k; }
	};

	//---Имя категории (для логов и сообщений)
	const char* toString(ErrorKind kind);

	//---Заполняет ошибку, если указатель не пустой. Всегда возвращает false,
	//   чтобы можно было писать: return fail(error, ErrorKind::Io, "...");
	bool fail(Error* error, ErrorKind kind, std::string message);

};//---namespace unisvc
