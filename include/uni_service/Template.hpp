#pragma once
#include <map>
#include <string>
#include <vector>
#include "Errors.hpp"

namespace unisvc::tmpl {

	//---Данные, доступные шаблону: скаляры ({{.Name}}) и списки ({{range .Arguments}})
	//   Истинность для {{if}}: непустая строка / непустой список
	class Data final {
	public:
		void set(const std::string& name, std::string value) { scalars_[name] = std::move(value); }
		void setFlag(const std::string& name, bool value) { scalars_[name] = value ? "true" : ""; }
		void setList(const std::string& name, std::vector<std::string> values) { lists_[name] = std::move(values); }

		const std::string* scalar(const std::string& name) const;
		const std::vector<std::string>* list(const std::string& name) const;

	private:
		std::map<std::string, std::string> scalars_;
		std::map<std::string, std::vector<std::string>> lists_;
	};

	//---Преобразования, доступные в шаблоне
	//   cmd:       "value" для shell: экранируются '"', '\', '$' и '`'
	//   shEscape:  то же экранирование без внешних кавычек
	//   cmdEscape: пробелы -> \x20
	//   unitQuote: "value" для командной строки systemd ('$' -> '$$', '%' -> '%%')
	std::string cmd(const std::string& s);
	std::string shEscape(const std::string& s);
	std::string cmdEscape(const std::string& s);
	std::string unitQuote(const std::string& s);

	namespace detail {

		//---{{.Field|f|g}} / {{.|f}}
		struct Pipeline final {
			bool dot = false;					//	Текущий элемент range
			std::string field;
			std::vector<std::string> funcs;
		};

		struct Node final {
			enum class Type { Text, Action, If, Range };

			Type type = Type::Text;
			std::string text;
			Pipeline pipe;
			std::vector<Node> body;
			std::vector<Node> elseBody;
		};
	}

	//---Шаблон в стиле text/template с фиксированным набором функций
	//   Поддерживается: текст, {{.X}}, {{.}}, {{.X|cmd}}, {{if}}/{{else}}/{{end}},
	//   {{range .List}}...{{end}}, {{- и -}} для обрезки пробелов
	class Template final {
	public:
		//---Разбор текста шаблона. Ошибки синтаксиса -> ErrorKind::Template
		bool parse(const std::string& text, Error* error);
		//---Подстановка данных. Неизвестное поле -> ErrorKind::Template
		bool render(const Data& data, std::string& out, Error* error) const;

	private:
		std::vector<detail::Node> nodes_;
	};

	//---parse + render
	bool render(const std::string& text, const Data& data, std::string& out, Error* error);

} // namespace unisvc::tmpl
