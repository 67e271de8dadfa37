#include "tailwind_cli/Output.hpp"

namespace twcli {

	namespace {

		const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD в UTF-8

		//---Длина последовательности по ведущему байту (1-4) или 0, если байт не может быть ведущим
		static std::size_t leadLength(unsigned char b) {
			if (b < 0x80u) return 1;
			if (b >= 0xC2u && b <= 0xDFu) return 2;
			if (b >= 0xE0u && b <= 0xEFu) return 3;
			if (b >= 0xF0u && b <= 0xF4u) return 4;
			return 0;
		}

		//---Допустимый диапазон второго байта (исключает overlong, суррогаты и > U+10FFFF)
		static bool validSecond(unsigned char lead, unsigned char b) {
			if (lead == 0xE0u) return b >= 0xA0u && b <= 0xBFu;
			if (lead == 0xEDu) return b >= 0x80u && b <= 0x9Fu;
			if (lead == 0xF0u) return b >= 0x90u && b <= 0xBFu;
			if (lead == 0xF4u) return b >= 0x80u && b <= 0x8Fu;
			return (b & 0xC0u) == 0x80u;
		}

		static bool isContinuation(unsigned char b) {
			return (b & 0xC0u) == 0x80u;
		}

		static bool isAsciiSpace(char c) {
			return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
		}
	} // namespace

	//------------------------------------------------------------
	//	Декодирование UTF-8 с заменой некорректных последовательностей
	//------------------------------------------------------------
	std::string decodeLossy(std::string_view bytes) {
		std::string out;
		out.reserve(bytes.size());

		const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
		const auto* end = p + bytes.size();

		while (p < end)
		{
			const std::size_t len = leadLength(*p);
			if (len == 1)
			{
				out.push_back(static_cast<char>(*p++));
				continue;
			}

			//---Сколько байтов составляют корректный префикс последовательности
			std::size_t valid = 0;
			if (len != 0)
			{
				valid = 1;
				if (p + 1 < end && validSecond(p[0], p[1]))
				{
					valid = 2;
					while (valid < len && p + valid < end && isContinuation(p[valid])) ++valid;
				}
			}

			if (len != 0 && valid == len)
			{
				out.append(reinterpret_cast<const char*>(p), len);
				p += len;
				continue;
			}

			//---Некорректный префикс заменяется одним U+FFFD
			out.append(kReplacement, sizeof(kReplacement) - 1);
			p += (valid == 0 ? 1 : valid);
		}
		return out;
	}
	//------------------------------------------------------------
	//	Обрезка пробельных символов по краям
	//------------------------------------------------------------
	std::string trimWhitespace(std::string_view text) {
		std::size_t b = 0;
		std::size_t e = text.size();
		while (b < e && isAsciiSpace(text[b])) ++b;
		while (e > b && isAsciiSpace(text[e - 1])) --e;
		return std::string(text.substr(b, e - b));
	}
	//------------------------------------------------------------
	//	Классификация результата процесса
	//------------------------------------------------------------
	ToolOutput classify(const process::RunResult& raw) {
		ToolOutput o;
		o.exitCode = raw.exitCode;
		o.success = raw.exitCode == 0 && !raw.signaled;
		o.stdoutText = trimWhitespace(decodeLossy(raw.stdoutBytes));
		o.stderrText = trimWhitespace(decodeLossy(raw.stderrBytes));
		return o;
	}

}; //---namespace twcli
