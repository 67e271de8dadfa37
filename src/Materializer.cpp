#include "tailwind_cli/Materializer.hpp"
#include "platform/PlatformImpl.hpp"

#include <random>
#include <system_error>
#include <utility>
#include <glog/logging.h>

namespace twcli {

	//------------------------------------------------------------
	//	Владение временным файлом
	//------------------------------------------------------------
	MaterializedExecutable::MaterializedExecutable(fs::path path)
		: path_(std::move(path)), owned_(!path_.empty()) {
	}

	MaterializedExecutable::~MaterializedExecutable() {
		if (!owned_) return;

		std::string err;
		if (!remove(&err))
		{
			LOG(WARNING) << "Temporary executable left on disk: " << err;
		}
	}

	MaterializedExecutable::MaterializedExecutable(MaterializedExecutable&& other) noexcept
		: path_(std::move(other.path_)), owned_(other.owned_) {
		other.owned_ = false;
		other.path_.clear();
	}

	MaterializedExecutable& MaterializedExecutable::operator=(MaterializedExecutable&& other) noexcept {
		if (this != &other)
		{
			//---Текущий файл удаляется до перехода владения
			if (owned_)
			{
				std::string err;
				if (!remove(&err)) LOG(WARNING) << "Temporary executable left on disk: " << err;
			}
			path_ = std::move(other.path_);
			owned_ = other.owned_;
			other.owned_ = false;
			other.path_.clear();
		}
		return *this;
	}

	bool MaterializedExecutable::remove(std::string* error) {
		if (!owned_) return true;

		//---Повторная попытка удаления не делается ни при каком исходе
		owned_ = false;
		if (!platform::removeFile(path_, error)) return false;

		VLOG(1) << "Deleted temporary file " << path_.u8string();
		return true;
	}
	//------------------------------------------------------------
	//	128-битный случайный идентификатор в формате UUID
	//------------------------------------------------------------
	std::string makeUniqueToken() {
		static const char kHex[] = "0123456789abcdef";

		std::random_device rd;
		unsigned char bytes[16];
		std::size_t produced = 0;
		while (produced < sizeof(bytes))
		{
			const std::random_device::result_type r = rd();
			for (std::size_t k = 0; k < sizeof(r) && produced < sizeof(bytes); ++k)
			{
				bytes[produced++] = static_cast<unsigned char>((r >> (8 * k)) & 0xFFu);
			}
		}

		//---Версия 4, вариант RFC 4122
		bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
		bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

		std::string out;
		out.reserve(36);
		for (std::size_t i = 0; i < sizeof(bytes); ++i)
		{
			if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
			out.push_back(kHex[(bytes[i] >> 4) & 0x0F]);
			out.push_back(kHex[bytes[i] & 0x0F]);
		}
		return out;
	}
	//------------------------------------------------------------
	//	Имя временного файла
	//------------------------------------------------------------
	std::string makeTempFileName(PlatformId platform, std::string_view version, std::string_view token) {
		std::string name = kTempFilePrefix;
		name += "-";
		name += platformName(platform);
		name += "-v";
		name += version;
		name += "-";
		name += token;
		if (isWindowsPlatform(platform)) name += ".exe";
		return name;
	}
	//------------------------------------------------------------
	//	Запись бинарника во временный исполняемый файл
	//------------------------------------------------------------
	bool materialize(const EmbeddedBinary& binary, PlatformId platform, std::string_view version, const fs::path& dir,
		MaterializedExecutable& out, std::string* error, std::uint32_t* sysError) {

		//---Каталог: заданный или системный временный
		std::error_code ec;
		fs::path target = dir;
		if (target.empty())
		{
			target = fs::temp_directory_path(ec);
			if (ec)
			{
				if (error) *error = "Failed to get system temporary directory: " + ec.message();
				if (sysError) *sysError = (std::uint32_t)ec.value();
				return false;
			}
		}
		else if (!fs::exists(target, ec))
		{
			ec.clear();
			fs::create_directories(target, ec);
			if (ec)
			{
				if (error) *error = "Failed to create directory " + target.u8string() + ": " + ec.message();
				if (sysError) *sysError = (std::uint32_t)ec.value();
				return false;
			}
		}

		const fs::path path = target / makeTempFileName(platform, version, makeUniqueToken());

		if (!platform::writeExecutable(path, binary, error, sysError)) return false;

		VLOG(1) << "Wrote " << binary.size << " bytes to temporary executable " << path.u8string();
		out = MaterializedExecutable(path);
		return true;
	}

}; //---namespace twcli
