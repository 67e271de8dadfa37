#include <gtest/gtest.h>

#include "TestUtil.hpp"
#include "tailwind_cli/Materializer.hpp"
#include "tailwind_cli/Version.hpp"

#include <set>
#include <string>
#include <thread>
#include <vector>

using twcli::EmbeddedBinary;
using twcli::MaterializedExecutable;
using twcli::PlatformId;
using twcli::test::ScopedTempDir;
namespace fs = std::filesystem;

namespace {

const std::string kScript = "#!/bin/sh\necho materialized\n";

EmbeddedBinary scriptBinary()
{
	return EmbeddedBinary{ reinterpret_cast<const unsigned char*>(kScript.data()), kScript.size() };
}

} // namespace

TEST(MaterializerTest, TokenIsUuidShaped)
{
	const std::string token = twcli::makeUniqueToken();
	ASSERT_EQ(token.size(), 36u);
	EXPECT_EQ(token[8], '-');
	EXPECT_EQ(token[13], '-');
	EXPECT_EQ(token[18], '-');
	EXPECT_EQ(token[23], '-');
	EXPECT_EQ(token[14], '4');
	for (char c : token)
	{
		EXPECT_TRUE(c == '-' || (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << token;
	}
}

TEST(MaterializerTest, TokensDoNotRepeat)
{
	std::set<std::string> tokens;
	for (int i = 0; i < 1000; i++) tokens.insert(twcli::makeUniqueToken());
	EXPECT_EQ(tokens.size(), 1000u);
}

TEST(MaterializerTest, FileNameCarriesPlatformAndVersion)
{
	EXPECT_EQ(twcli::makeTempFileName(PlatformId::LinuxX64, "3.4.1-0", "abc"),
		"tailwindcss-linux-x64-v3.4.1-0-abc");
	EXPECT_EQ(twcli::makeTempFileName(PlatformId::WindowsArm64, "3.4.1-0", "abc"),
		"tailwindcss-windows-arm64-v3.4.1-0-abc.exe");
}

TEST(MaterializerTest, WritesBytesToNamedFile)
{
	ScopedTempDir dir;
	MaterializedExecutable exe;
	std::string err;

	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), exe, &err)) << err;
	ASSERT_TRUE(exe.owns());
	EXPECT_EQ(exe.path().parent_path(), dir.path());
	EXPECT_EQ(exe.path().filename().string().rfind(std::string("tailwindcss-linux-x64-v") + TWCLI_VERSION + "-", 0), 0u);
	EXPECT_EQ(twcli::test::readFile(exe.path()), kScript);
}

#if !defined(_WIN32)
TEST(MaterializerTest, FileIsExecutable)
{
	ScopedTempDir dir;
	MaterializedExecutable exe;
	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), exe, nullptr));

	const fs::perms perms = fs::status(exe.path()).permissions();
	const fs::perms expected =
		fs::perms::owner_all |
		fs::perms::group_read | fs::perms::group_exec |
		fs::perms::others_read | fs::perms::others_exec;
	EXPECT_EQ(perms & fs::perms::mask, expected);
}
#endif

TEST(MaterializerTest, RemoveIsIdempotent)
{
	ScopedTempDir dir;
	MaterializedExecutable exe;
	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), exe, nullptr));
	const fs::path path = exe.path();

	std::string err;
	EXPECT_TRUE(exe.remove(&err)) << err;
	EXPECT_FALSE(fs::exists(path));
	EXPECT_FALSE(exe.owns());

	EXPECT_TRUE(exe.remove(&err));
	EXPECT_EQ(twcli::test::countTempExecutables(dir.path()), 0);
}

TEST(MaterializerTest, DestructorRemovesFile)
{
	ScopedTempDir dir;
	fs::path path;
	{
		MaterializedExecutable exe;
		ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), exe, nullptr));
		path = exe.path();
		EXPECT_TRUE(fs::exists(path));
	}
	EXPECT_FALSE(fs::exists(path));
}

TEST(MaterializerTest, MoveTransfersOwnership)
{
	ScopedTempDir dir;
	MaterializedExecutable a;
	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), a, nullptr));
	const fs::path path = a.path();

	MaterializedExecutable b(std::move(a));
	EXPECT_FALSE(a.owns());
	EXPECT_TRUE(b.owns());
	EXPECT_EQ(b.path(), path);

	//---Перемещённый объект ничего не удаляет
	EXPECT_TRUE(a.remove(nullptr));
	EXPECT_TRUE(fs::exists(path));

	EXPECT_TRUE(b.remove(nullptr));
	EXPECT_FALSE(fs::exists(path));
}

TEST(MaterializerTest, CreatesMissingDirectory)
{
	ScopedTempDir dir;
	const fs::path nested = dir.path() / "target" / "tmp";

	MaterializedExecutable exe;
	std::string err;
	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, nested, exe, &err)) << err;
	EXPECT_EQ(exe.path().parent_path(), nested);
}

TEST(MaterializerTest, DefaultsToSystemTempDirectory)
{
	MaterializedExecutable exe;
	ASSERT_TRUE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, fs::path(), exe, nullptr));
	EXPECT_EQ(exe.path().parent_path(), fs::temp_directory_path());
}

TEST(MaterializerTest, ReportsIoErrorAndLeavesNothing)
{
	ScopedTempDir dir;
	//---Обычный файл на месте каталога
	const fs::path blocker = dir.path() / "not-a-dir";
	twcli::test::writeFile(blocker, "x");

	MaterializedExecutable exe;
	std::string err;
	std::uint32_t sysError = 0;
	EXPECT_FALSE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, blocker / "sub", exe, &err, &sysError));
	EXPECT_FALSE(err.empty());
	EXPECT_NE(sysError, 0u);
	EXPECT_FALSE(exe.owns());
	EXPECT_EQ(twcli::test::countTempExecutables(dir.path()), 0);
}

TEST(MaterializerTest, ConcurrentMaterializationsDoNotCollide)
{
	ScopedTempDir dir;
	constexpr int kThreads = 8;

	std::vector<MaterializedExecutable> exes(kThreads);
	std::vector<char> ok(kThreads, 0);
	std::vector<std::thread> threads;
	for (int i = 0; i < kThreads; i++)
	{
		threads.emplace_back([&, i]() {
			ok[i] = twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, dir.path(), exes[i], nullptr);
		});
	}
	for (auto& t : threads) t.join();

	std::set<fs::path> paths;
	for (int i = 0; i < kThreads; i++)
	{
		EXPECT_TRUE(ok[i]);
		paths.insert(exes[i].path());
	}
	EXPECT_EQ(paths.size(), (std::size_t)kThreads);
	EXPECT_EQ(twcli::test::countTempExecutables(dir.path()), kThreads);

	exes.clear();
	EXPECT_EQ(twcli::test::countTempExecutables(dir.path()), 0);
}

TEST(MaterializerTest, ErrorTextKeepsNonAsciiPathAsUtf8)
{
	ScopedTempDir dir;
	//---Каталог с кириллицей в имени (как профиль пользователя на Windows)
	const fs::path blocker = dir.path() / fs::u8path("\xD0\xBF\xD0\xBE\xD0\xBB\xD1\x8C\xD0\xB7\xD0\xBE\xD0\xB2\xD0\xB0\xD1\x82\xD0\xB5\xD0\xBB\xD1\x8C");
	twcli::test::writeFile(blocker, "x");

	MaterializedExecutable exe;
	std::string err;
	EXPECT_FALSE(twcli::materialize(scriptBinary(), PlatformId::LinuxX64, TWCLI_VERSION, blocker / "sub", exe, &err));
	EXPECT_NE(err.find("\xD0\xBF\xD0\xBE\xD0\xBB\xD1\x8C"), std::string::npos) << err;
}
