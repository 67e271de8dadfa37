#pragma once
#include <cstddef>
#include "Platform.hpp"

namespace twcli {

	//---Неизменяемые байты встроенного исполняемого файла (время жизни = время жизни программы)
	struct EmbeddedBinary final {
		const unsigned char* data = nullptr;
		std::size_t size = 0;
	};

	//---Бинарник для платформы. Таблица полная: каждая платформа имеет запись,
	//	это проверяется при сборке (switch без default + -Werror=switch, ссылки на
	//	сгенерированные символы)
	EmbeddedBinary bytesFor(PlatformId platform) noexcept;

};//---namespace twcli
