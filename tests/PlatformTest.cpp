#include <gtest/gtest.h>

#include "tailwind_cli/Platform.hpp"

#include <set>
#include <string>

using twcli::PlatformId;

namespace {

struct Case {
	const char* os;
	const char* arch;
	PlatformId expected;
};

} // namespace

TEST(PlatformTest, ResolvesKnownPairsAndAliases)
{
	const Case cases[] = {
		{ "macos", "aarch64", PlatformId::MacOsArm64 },
		{ "Darwin", "arm64", PlatformId::MacOsArm64 },
		{ "osx", "x86_64", PlatformId::MacOsX64 },
		{ "linux", "aarch64", PlatformId::LinuxArm64 },
		{ "Linux", "armv7l", PlatformId::LinuxArmv7 },
		{ "linux", "armv7", PlatformId::LinuxArmv7 },
		{ "linux", "amd64", PlatformId::LinuxX64 },
		{ "windows", "ARM64", PlatformId::WindowsArm64 },
		{ "WIN32", "x64", PlatformId::WindowsX64 },
	};

	for (const auto& c : cases)
	{
		PlatformId p{};
		std::string err;
		ASSERT_TRUE(twcli::resolvePlatform(c.os, c.arch, p, &err)) << c.os << "/" << c.arch << ": " << err;
		EXPECT_EQ(p, c.expected) << c.os << "/" << c.arch;
		EXPECT_TRUE(err.empty());
	}
}

TEST(PlatformTest, RejectsUnknownOs)
{
	PlatformId p{};
	std::string err;
	EXPECT_FALSE(twcli::resolvePlatform("freebsd", "x86_64", p, &err));
	EXPECT_NE(err.find("freebsd"), std::string::npos);
}

TEST(PlatformTest, RejectsUnknownArchitecture)
{
	PlatformId p{};
	std::string err;
	EXPECT_FALSE(twcli::resolvePlatform("linux", "riscv64", p, &err));
	EXPECT_NE(err.find("riscv64"), std::string::npos);

	//---armv7 поддерживается только на Linux
	EXPECT_FALSE(twcli::resolvePlatform("macos", "armv7", p, nullptr));
	EXPECT_FALSE(twcli::resolvePlatform("windows", "armv7l", p, nullptr));
	EXPECT_FALSE(twcli::resolvePlatform("", "", p, nullptr));
}

TEST(PlatformTest, NamesAreDistinct)
{
	std::set<std::string> names;
	for (PlatformId p : twcli::allPlatforms()) names.insert(twcli::platformName(p));

	EXPECT_EQ(names.size(), twcli::kPlatformCount);
	EXPECT_STREQ(twcli::platformName(PlatformId::LinuxX64), "linux-x64");
	EXPECT_STREQ(twcli::platformName(PlatformId::MacOsArm64), "macos-arm64");
	EXPECT_STREQ(twcli::platformName(PlatformId::WindowsX64), "windows-x64");
}

TEST(PlatformTest, OnlyWindowsPlatformsNeedExeSuffix)
{
	EXPECT_TRUE(twcli::isWindowsPlatform(PlatformId::WindowsArm64));
	EXPECT_TRUE(twcli::isWindowsPlatform(PlatformId::WindowsX64));
	EXPECT_FALSE(twcli::isWindowsPlatform(PlatformId::LinuxX64));
	EXPECT_FALSE(twcli::isWindowsPlatform(PlatformId::MacOsX64));
}

TEST(PlatformTest, DetectsHostPlatform)
{
	EXPECT_FALSE(twcli::hostOsName().empty());
	EXPECT_FALSE(twcli::hostArchName().empty());

	PlatformId p{};
	std::string err;
	ASSERT_TRUE(twcli::detectPlatform(p, &err)) << err;

#if defined(__linux__) && defined(__x86_64__)
	EXPECT_EQ(p, PlatformId::LinuxX64);
#elif defined(__linux__) && defined(__aarch64__)
	EXPECT_EQ(p, PlatformId::LinuxArm64);
#elif defined(__APPLE__) && defined(__aarch64__)
	EXPECT_EQ(p, PlatformId::MacOsArm64);
#elif defined(_WIN32) && defined(_M_X64)
	EXPECT_EQ(p, PlatformId::WindowsX64);
#endif
}
