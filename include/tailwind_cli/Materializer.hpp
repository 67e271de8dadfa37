#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "EmbeddedBinary.hpp"
#include "Platform.hpp"

namespace twcli {

	namespace fs = std::filesystem;

	//---Префикс имени временного файла
	inline constexpr const char* kTempFilePrefix = "tailwindcss";

	//---Временный исполняемый файл, которым владеет создавший его вызов.
	//	Файл удаляется ровно один раз: явно через remove() или деструктором
	class MaterializedExecutable final {
	public:
		MaterializedExecutable() = default;
		explicit MaterializedExecutable(fs::path path);
		~MaterializedExecutable();

		MaterializedExecutable(const MaterializedExecutable&) = delete;
		MaterializedExecutable& operator=(const MaterializedExecutable&) = delete;

		MaterializedExecutable(MaterializedExecutable&& other) noexcept;
		MaterializedExecutable& operator=(MaterializedExecutable&& other) noexcept;

		const fs::path& path() const { return path_; }

		//---Владеет ли объект файлом на диске
		bool owns() const { return owned_; }

		//---Удаление файла. Повторный вызов ничего не делает и возвращает true.
		//	После вызова объект не владеет файлом, даже если удаление не удалось
		bool remove(std::string* error);

	private:
		fs::path path_;
		bool owned_ = false;
	};

	//---Случайный 128-битный идентификатор в виде UUID (8-4-4-4-12, нижний регистр)
	std::string makeUniqueToken();

	//---Имя файла: <prefix>-<platform>-v<version>-<token>[.exe]
	std::string makeTempFileName(PlatformId platform, std::string_view version, std::string_view token);

	//--Запись встроенного бинарника во временный исполняемый файл:
	//	version попадает в имя файла (обычно TWCLI_VERSION)
	//	dir пустой → системный временный каталог; несуществующий каталог создаётся
	//	При ошибке файл не остаётся на диске, out не меняется
	// Возвращает:
	//   true - файл записан, сброшен на диск и помечен исполняемым
	//   false - ошибка ввода-вывода (описание в error, код ОС в sysError)
	bool materialize(const EmbeddedBinary& binary, PlatformId platform, std::string_view version, const fs::path& dir,
		MaterializedExecutable& out, std::string* error, std::uint32_t* sysError = nullptr);

};//---namespace twcli
