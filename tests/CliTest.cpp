#include <gtest/gtest.h>

#include "tailwind_cli/Cli.hpp"

#include <sstream>
#include <string>
#include <vector>

using twcli::Command;

namespace {

	//---argv из списка строк (argv[0] - имя программы)
	twcli::CliOptions parse(std::vector<std::string> args) {
		args.insert(args.begin(), "tailwind-cli");
		std::vector<char*> argv;
		for (auto& a : args) argv.push_back(a.data());
		argv.push_back(nullptr);
		return twcli::parseCli((int)args.size(), argv.data());
	}

} // namespace

TEST(CliTest, PassesToolArgumentsThrough)
{
	const auto o = parse({ "--input", "src/main.css", "-o", "target/built.css", "--minify" });
	EXPECT_EQ(o.cmd, Command::Run);
	EXPECT_EQ(o.toolArgs, (std::vector<std::string>{ "--input", "src/main.css", "-o", "target/built.css", "--minify" }));
	EXPECT_TRUE(o.tempDir.empty());
	EXPECT_FALSE(o.verbose);
}

TEST(CliTest, ConsumesWrapperOptions)
{
	const auto o = parse({ "--twcli-temp-dir=target", "--help", "--twcli-work-dir=\"my site\"",
		"--twcli-log-dir='logs'", "--twcli-verbose" });
	EXPECT_EQ(o.cmd, Command::Run);
	EXPECT_EQ(o.tempDir, "target");
	EXPECT_EQ(o.workDir, "my site");
	EXPECT_EQ(o.logDir, "logs");
	EXPECT_TRUE(o.verbose);
	EXPECT_EQ(o.toolArgs, (std::vector<std::string>{ "--help" }));
}

TEST(CliTest, DoubleDashStopsOptionParsing)
{
	const auto o = parse({ "--twcli-verbose", "--", "--twcli-help", "--", "-i", "in.css" });
	EXPECT_EQ(o.cmd, Command::Run);
	EXPECT_TRUE(o.verbose);
	EXPECT_EQ(o.toolArgs, (std::vector<std::string>{ "--twcli-help", "--", "-i", "in.css" }));
}

TEST(CliTest, HelpAndVersion)
{
	EXPECT_EQ(parse({ "--twcli-help" }).cmd, Command::Help);
	EXPECT_EQ(parse({ "--twcli-version" }).cmd, Command::Version);
	//-----help без префикса относится к tailwindcss
	EXPECT_EQ(parse({ "--help" }).cmd, Command::Run);
}

TEST(CliTest, UnknownWrapperOptionIsInvalid)
{
	const auto o = parse({ "--twcli-tmp=target" });
	EXPECT_EQ(o.cmd, Command::Invalid);
	EXPECT_NE(o.error.find("--twcli-tmp=target"), std::string::npos);
}

TEST(CliTest, EmptyPathIsInvalid)
{
	EXPECT_EQ(parse({ "--twcli-temp-dir=" }).cmd, Command::Invalid);
	EXPECT_EQ(parse({ "--twcli-work-dir=\"\"" }).cmd, Command::Invalid);
	//---Без '=' значение не задано
	EXPECT_EQ(parse({ "--twcli-log-dir" }).cmd, Command::Invalid);
}

TEST(CliTest, HelpListsWrapperOptions)
{
	std::ostringstream os;
	twcli::printHelp(os);
	const std::string text = os.str();
	EXPECT_NE(text.find("--twcli-temp-dir"), std::string::npos);
	EXPECT_NE(text.find("--twcli-work-dir"), std::string::npos);
	EXPECT_NE(text.find("--twcli-verbose"), std::string::npos);
}

TEST(CliTest, ExitCodesFollowSysexits)
{
	struct Row {
		twcli::ErrorKind kind;
		int toolExit;
		int expected;
	};
	const Row rows[] = {
		{ twcli::ErrorKind::None, 0, 0 },
		{ twcli::ErrorKind::ToolFailed, 3, 3 },
		{ twcli::ErrorKind::ToolFailed, 143, 143 },
		{ twcli::ErrorKind::ToolFailed, 0, 1 },
		{ twcli::ErrorKind::UnsupportedPlatform, 0, 69 },
		{ twcli::ErrorKind::SpawnFailed, 0, 71 },
		{ twcli::ErrorKind::TempFileIo, 0, 73 },
		{ twcli::ErrorKind::CleanupFailed, 0, 74 },
	};

	for (const auto& row : rows)
	{
		twcli::InvocationResult r;
		r.kind = row.kind;
		r.exitCode = row.toolExit;
		EXPECT_EQ(twcli::exitCodeFor(r), row.expected) << twcli::toString(row.kind) << " / " << row.toolExit;
	}
}
