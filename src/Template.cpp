#include "uni_service/Template.hpp"

#include <cctype>
#include <sstream>

namespace unisvc::tmpl {

	using detail::Node;
	using detail::Pipeline;

	//------------------------------------------------------------
	//	Преобразования, доступные в шаблоне
	//------------------------------------------------------------
	std::string shEscape(const std::string& s)
	{
		std::string out;
		out.reserve(s.size());
		for (char c : s)
		{
			//---Символы, которые shell раскрывает внутри двойных кавычек
			if (c == '"' || c == '\\' || c == '$' || c == '`') out.push_back('\\');
			out.push_back(c);
		}
		return out;
	}

	std::string cmd(const std::string& s)
	{
		return "\"" + shEscape(s) + "\"";
	}

	std::string unitQuote(const std::string& s)
	{
		std::string out;
		out.reserve(s.size() + 2);
		out.push_back('"');
		for (char c : s)
		{
			if (c == '"' || c == '\\') out.push_back('\\');
			//---systemd раскрывает $VAR и спецификаторы %x
			else if (c == '$' || c == '%') out.push_back(c);
			out.push_back(c);
		}
		out.push_back('"');
		return out;
	}

	std::string cmdEscape(const std::string& s)
	{
		std::string out;
		out.reserve(s.size());
		for (char c : s)
		{
			if (c == ' ') out += "\\x20";
			else out.push_back(c);
		}
		return out;
	}

	const std::string* Data::scalar(const std::string& name) const
	{
		auto it = scalars_.find(name);
		return it == scalars_.end() ? nullptr : &it->second;
	}

	const std::vector<std::string>* Data::list(const std::string& name) const
	{
		auto it = lists_.find(name);
		return it == lists_.end() ? nullptr : &it->second;
	}

	namespace {

		//---Фрагмент исходного текста: текст или содержимое {{ }}
		struct Item final {
			bool action = false;
			std::string text;
			size_t line = 1;
		};

		static bool isSpace(char c)
		{
			return std::isspace(static_cast<unsigned char>(c)) != 0;
		}

		static std::string trim(const std::string& s)
		{
			size_t b = 0, e = s.size();
			while (b < e && isSpace(s[b])) b++;
			while (e > b && isSpace(s[e - 1])) e--;
			return s.substr(b, e - b);
		}

		static bool startsWith(const std::string& s, const std::string& p)
		{
			return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
		}

		static bool templateError(Error* error, size_t line, const std::string& msg)
		{
			std::ostringstream os;
			os << "template: line " << line << ": " << msg;
			return fail(error, ErrorKind::Template, os.str());
		}

		//---Разбиение на текст и действия с учётом {{- и -}}
		static bool lex(const std::string& text, std::vector<Item>& items, Error* error)
		{
			size_t pos = 0;
			size_t line = 1;
			bool trimNext = false;

			while (pos < text.size())
			{
				const size_t open = text.find("{{", pos);
				std::string chunk = text.substr(pos, open == std::string::npos ? std::string::npos : open - pos);

				if (trimNext)
				{
					size_t b = 0;
					while (b < chunk.size() && isSpace(chunk[b])) b++;
					chunk.erase(0, b);
					trimNext = false;
				}

				const size_t chunkLine = line;
				for (size_t i = pos; i < (open == std::string::npos ? text.size() : open); i++)
				{
					if (text[i] == '\n') line++;
				}

				if (open == std::string::npos)
				{
					if (!chunk.empty()) items.push_back(Item{ false, chunk, chunkLine });
					break;
				}

				size_t start = open + 2;
				if (start + 1 < text.size() && text[start] == '-' && isSpace(text[start + 1]))
				{
					while (!chunk.empty() && isSpace(chunk.back())) chunk.pop_back();
					start += 1;
				}
				if (!chunk.empty()) items.push_back(Item{ false, chunk, chunkLine });

				const size_t close = text.find("}}", start);
				if (close == std::string::npos)
					return templateError(error, line, "unclosed action");

				size_t end = close;
				if (end >= start + 2 && text[end - 1] == '-' && isSpace(text[end - 2]))
				{
					end -= 1;
					trimNext = true;
				}

				items.push_back(Item{ true, trim(text.substr(start, end - start)), line });
				for (size_t i = start; i < close; i++)
				{
					if (text[i] == '\n') line++;
				}
				pos = close + 2;
			}
			return true;
		}

		static bool isIdent(const std::string& s)
		{
			if (s.empty()) return false;
			for (char c : s)
			{
				if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
			}
			return true;
		}

		static bool isKnownFunc(const std::string& name)
		{
			return name == "cmd" || name == "cmdEscape" || name == "shEscape" || name == "unitQuote";
		}

		//---Разбор конвейера ".Field|f|g"
		static bool parsePipeline(const std::string& src, size_t line, Pipeline& out, Error* error)
		{
			std::vector<std::string> parts;
			size_t b = 0;
			while (true)
			{
				const size_t bar = src.find('|', b);
				parts.push_back(trim(src.substr(b, bar == std::string::npos ? std::string::npos : bar - b)));
				if (bar == std::string::npos) break;
				b = bar + 1;
			}

			const std::string& head = parts.front();
			if (head == ".")
			{
				out.dot = true;
			}
			else if (head.size() > 1 && head[0] == '.' && isIdent(head.substr(1)))
			{
				out.field = head.substr(1);
			}
			else
			{
				return templateError(error, line, "unexpected \"" + head + "\" in command");
			}

			for (size_t i = 1; i < parts.size(); i++)
			{
				if (parts[i].empty())
					return templateError(error, line, "missing command after '|'");
				if (!isKnownFunc(parts[i]))
					return templateError(error, line, "function \"" + parts[i] + "\" not defined");
				out.funcs.push_back(parts[i]);
			}
			return true;
		}

		//---Рекурсивный разбор до {{end}} / {{else}} / конца текста
		//   stop - встреченный терминатор ("end", "else" или "")
		static bool parseList(const std::vector<Item>& items, size_t& pos, std::vector<Node>& nodes,
			std::string& stop, Error* error)
		{
			stop.clear();
			while (pos < items.size())
			{
				const Item& it = items[pos++];
				if (!it.action)
				{
					Node n;
					n.type = Node::Type::Text;
					n.text = it.text;
					nodes.push_back(std::move(n));
					continue;
				}

				const std::string& a = it.text;
				if (a.empty())
					return templateError(error, it.line, "missing value for command");

				if (a == "end" || a == "else")
				{
					stop = a;
					return true;
				}

				//---Комментарий {{/* ... */}}
				if (startsWith(a, "/*"))
				{
					if (a.size() < 4 || a.compare(a.size() - 2, 2, "*/") != 0)
						return templateError(error, it.line, "unclosed comment");
					continue;
				}

				const bool isIf = startsWith(a, "if") && a.size() > 2 && isSpace(a[2]);
				const bool isRange = startsWith(a, "range") && a.size() > 5 && isSpace(a[5]);

				if (isIf || isRange)
				{
					Node n;
					n.type = isIf ? Node::Type::If : Node::Type::Range;
					if (!parsePipeline(trim(a.substr(isIf ? 2 : 5)), it.line, n.pipe, error))
						return false;
					if (isRange && !n.pipe.funcs.empty())
						return templateError(error, it.line, "range over a function result is not supported");

					std::string inner;
					if (!parseList(items, pos, n.body, inner, error)) return false;
					if (inner == "else")
					{
						if (!parseList(items, pos, n.elseBody, inner, error)) return false;
						if (inner == "else")
							return templateError(error, it.line, "expected end; found else");
					}
					if (inner != "end")
						return templateError(error, it.line, std::string("unexpected EOF in ") + (isIf ? "if" : "range"));

					nodes.push_back(std::move(n));
					continue;
				}

				Node n;
				n.type = Node::Type::Action;
				if (!parsePipeline(a, it.line, n.pipe, error)) return false;
				nodes.push_back(std::move(n));
			}
			return true;
		}

		//---Значение конвейера: строка или список
		struct Value final {
			std::string str;
			const std::vector<std::string>* list = nullptr;
		};

		static std::string applyFunc(const std::string& name, const std::string& v)
		{
			if (name == "cmd") return cmd(v);
			if (name == "shEscape") return shEscape(v);
			if (name == "unitQuote") return unitQuote(v);
			return cmdEscape(v);
		}

		static bool evaluate(const Pipeline& p, const Data& data, const std::string* dot, Value& out, Error* error)
		{
			if (p.dot)
			{
				if (!dot)
					return fail(error, ErrorKind::Template, "template: {{.}} used outside of range");
				out.str = *dot;
			}
			else if (const std::string* s = data.scalar(p.field))
			{
				out.str = *s;
			}
			else if (const std::vector<std::string>* l = data.list(p.field))
			{
				if (!p.funcs.empty())
					return fail(error, ErrorKind::Template, "template: can't apply function to list field " + p.field);
				out.list = l;
				return true;
			}
			else
			{
				return fail(error, ErrorKind::Template, "template: can't evaluate field " + p.field);
			}

			for (const auto& f : p.funcs) out.str = applyFunc(f, out.str);
			return true;
		}

		static bool execute(const std::vector<Node>& nodes, const Data& data, const std::string* dot,
			std::string& out, Error* error)
		{
			for (const Node& n : nodes)
			{
				switch (n.type)
				{
				case Node::Type::Text:
					out += n.text;
					break;

				case Node::Type::Action:
				{
					Value v;
					if (!evaluate(n.pipe, data, dot, v, error)) return false;
					if (v.list)
						return fail(error, ErrorKind::Template, "template: can't print list field " + n.pipe.field);
					out += v.str;
					break;
				}

				case Node::Type::If:
				{
					Value v;
					if (!evaluate(n.pipe, data, dot, v, error)) return false;
					const bool truth = v.list ? !v.list->empty() : !v.str.empty();
					if (!execute(truth ? n.body : n.elseBody, data, dot, out, error)) return false;
					break;
				}

				case Node::Type::Range:
				{
					Value v;
					if (!evaluate(n.pipe, data, dot, v, error)) return false;
					if (!v.list)
						return fail(error, ErrorKind::Template, "template: range can't iterate over " + n.pipe.field);
					if (v.list->empty())
					{
						if (!execute(n.elseBody, data, dot, out, error)) return false;
						break;
					}
					for (const std::string& elem : *v.list)
					{
						if (!execute(n.body, data, &elem, out, error)) return false;
					}
					break;
				}
				}
			}
			return true;
		}

	} // namespace

	//------------------------------------------------------------
	//	Разбор шаблона
	//------------------------------------------------------------
	bool Template::parse(const std::string& text, Error* error)
	{
		nodes_.clear();

		std::vector<Item> items;
		if (!lex(text, items, error)) return false;

		size_t pos = 0;
		std::string stop;
		std::vector<Node> nodes;
		if (!parseList(items, pos, nodes, stop, error)) return false;
		if (!stop.empty())
			return templateError(error, items[pos - 1].line, "unexpected {{" + stop + "}}");

		nodes_ = std::move(nodes);
		return true;
	}

	//------------------------------------------------------------
	//	Подстановка данных
	//------------------------------------------------------------
	bool Template::render(const Data& data, std::string& out, Error* error) const
	{
		std::string result;
		if (!execute(nodes_, data, nullptr, result, error)) return false;
		out = std::move(result);
		return true;
	}

	bool render(const std::string& text, const Data& data, std::string& out, Error* error)
	{
		Template t;
		if (!t.parse(text, error)) return false;
		return t.render(data, out, error);
	}

} // namespace unisvc::tmpl
