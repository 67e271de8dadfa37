//---Генератор единицы трансляции со встроенным бинарником:
//	twcli_embed <input> <identifier> <output.cpp>
//	Определяет twcli_embedded_<identifier>[] и twcli_embedded_<identifier>_size
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

	std::vector<std::uint8_t> readAll(const std::string& path) {
		std::ifstream in(path, std::ios::binary);
		if (!in) throw std::runtime_error("Failed to open " + path);
		return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	bool isIdentifier(const std::string& s) {
		if (s.empty()) return false;
		for (char c : s)
		{
			const bool ok =
				(c >= 'a' && c <= 'z') ||
				(c >= 'A' && c <= 'Z') ||
				(c >= '0' && c <= '9') ||
				c == '_';
			if (!ok) return false;
		}
		return !(s[0] >= '0' && s[0] <= '9');
	}

	void writeSource(const std::string& outPath, const std::string& ident, const std::string& inputPath,
		const std::vector<std::uint8_t>& data) {
		static const char kHex[] = "0123456789abcdef";

		std::ofstream out(outPath, std::ios::binary);
		if (!out) throw std::runtime_error("Failed to write " + outPath);

		const std::string sym = "twcli_embedded_" + ident;
		out << "// Generated by twcli_embed from " << inputPath << ". Do not edit.\n";
		out << "#include <cstddef>\n\n";
		out << "extern const unsigned char " << sym << "[] = {";
		for (std::size_t i = 0; i < data.size(); ++i)
		{
			if (i % 16 == 0) out << "\n    ";
			out << "0x" << kHex[(data[i] >> 4) & 0x0F] << kHex[data[i] & 0x0F] << ",";
		}
		out << "\n};\n";
		out << "extern const std::size_t " << sym << "_size = " << data.size() << ";\n";

		out.flush();
		if (!out) throw std::runtime_error("Failed to write " + outPath);
	}

} // namespace

int main(int argc, char** argv) {
	try
	{
		if (argc != 4)
		{
			std::cerr << "Usage: twcli_embed <input> <identifier> <output.cpp>\n";
			return 1;
		}
		const std::string input = argv[1];
		const std::string ident = argv[2];
		const std::string output = argv[3];

		if (!isIdentifier(ident)) throw std::runtime_error("Invalid identifier: " + ident);

		const auto data = readAll(input);
		//---Пустой бинарник - ошибка сборки, а не пустая запись в таблице
		if (data.empty()) throw std::runtime_error("Input is empty: " + input);

		writeSource(output, ident, input, data);
		return 0;
	}
	catch (const std::exception& ex)
	{
		std::cerr << "twcli_embed: " << ex.what() << "\n";
		return 1;
	}
}
