#pragma once
#include <string>
#include <string_view>

#include "Process.hpp"

namespace twcli {

	//---Разобранный вывод инструмента
	struct ToolOutput final {
		bool success = false;		//	Код завершения 0 и процесс не убит сигналом
		int exitCode = 0;
		std::string stdoutText;		//	UTF-8, без пробельных символов по краям
		std::string stderrText;
	};

	//---Декодирование байтов как UTF-8: некорректные последовательности заменяются на U+FFFD
	std::string decodeLossy(std::string_view bytes);

	//---Удаление ASCII-пробельных символов (' ', \t, \n, \v, \f, \r) в начале и конце
	std::string trimWhitespace(std::string_view text);

	//---Классификация результата процесса: декодирование, обрезка, успех/ошибка
	ToolOutput classify(const process::RunResult& raw);

};//---namespace twcli
