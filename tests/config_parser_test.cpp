#include "config_parser.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

TEST(ConfigParser, EmptyRootGivesDefaults)
{
	const auto config = ConfigParser::parse_text("<QuickLaunch/>");

	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->name, Defaults::Name);
	EXPECT_EQ(config->rows, Defaults::Rows);
	EXPECT_EQ(config->terminal, Defaults::Terminal);
	EXPECT_FALSE(config->disable_apps);
	EXPECT_FALSE(config->disable_cache);
	EXPECT_EQ(config->app_dirs.size(), 2u);
	EXPECT_EQ(config->cache_file.filename(), "launcher");
	EXPECT_TRUE(config->doc_dirs.empty());
	EXPECT_FALSE(config->exit_key.has_value());
}

TEST(ConfigParser, ReadsEverySetting)
{
	const auto config = ConfigParser::parse_text(R"(
		<QuickLaunch name="docs &amp; bins">
			<Rows>6</Rows>
			<Terminal>alacritty</Terminal>
			<DisableApps>true</DisableApps>
			<DisableCache>no</DisableCache>
			<CacheFile>/tmp/ql/cache</CacheFile>
			<DocDir>/srv/docs</DocDir>
			<DocDir>-/srv/docs/old</DocDir>
			<DocExt>pdf</DocExt>
			<DocExt>odt</DocExt>
			<BinDir>/usr/local/bin</BinDir>
			<BinExt>sh</BinExt>
			<ExitKey>Q</ExitKey>
			<Colors fg="250" bg="235" fg_focus="16" bg_focus="214"/>
		</QuickLaunch>)");

	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->name, "docs & bins");
	EXPECT_EQ(config->rows, 6u);
	EXPECT_EQ(config->terminal, "alacritty");
	EXPECT_TRUE(config->disable_apps);
	EXPECT_FALSE(config->disable_cache);
	EXPECT_EQ(config->cache_file, "/tmp/ql/cache");
	EXPECT_EQ(config->doc_dirs, (std::vector<std::string>{"/srv/docs", "-/srv/docs/old"}));
	EXPECT_EQ(config->doc_ext, (std::vector<std::string>{"pdf", "odt"}));
	EXPECT_EQ(config->bin_dirs, (std::vector<std::string>{"/usr/local/bin"}));
	EXPECT_EQ(config->bin_ext, (std::vector<std::string>{"sh"}));
	EXPECT_EQ(config->exit_key, 'q');
	EXPECT_EQ(config->normal.fg, 250);
	EXPECT_EQ(config->normal.bg, 235);
	EXPECT_EQ(config->focus.fg, 16);
	EXPECT_EQ(config->focus.bg, 214);
}

TEST(ConfigParser, DefaultCacheFileIsNamedAfterLauncher)
{
	const auto config = ConfigParser::parse_text(R"(<QuickLaunch name="my apps 2"/>)");

	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->cache_file.filename(), "myxappsxx");
	EXPECT_EQ(config->cache_file.parent_path().filename(), "quicklaunch");
}

TEST(ConfigParser, ExpandsHomeInDirectories)
{
	const auto config = ConfigParser::parse_text(
	        "<QuickLaunch><DocDir>~/Documents</DocDir><DocDir>-~/Documents/tmp</DocDir>"
	        "</QuickLaunch>");

	ASSERT_TRUE(config.has_value());
	ASSERT_EQ(config->doc_dirs.size(), 2u);
	EXPECT_NE(config->doc_dirs[0].front(), '~');
	EXPECT_TRUE(config->doc_dirs[0].ends_with("Documents"));
	EXPECT_EQ(config->doc_dirs[1].front(), '-');
	EXPECT_NE(config->doc_dirs[1][1], '~');
}

TEST(ConfigParser, RejectsInvalidValues)
{
	EXPECT_FALSE(ConfigParser::parse_text("<QuickLaunch><Rows>0</Rows></QuickLaunch>"));
	EXPECT_FALSE(ConfigParser::parse_text("<QuickLaunch><Rows>ten</Rows></QuickLaunch>"));
	EXPECT_FALSE(ConfigParser::parse_text(
	        "<QuickLaunch><DisableApps>maybe</DisableApps></QuickLaunch>"));
	EXPECT_FALSE(ConfigParser::parse_text(
	        "<QuickLaunch><ExitKey>F4</ExitKey></QuickLaunch>"));
	EXPECT_FALSE(ConfigParser::parse_text(
	        "<QuickLaunch><Colors fg=\"300\"/></QuickLaunch>"));
}

TEST(ConfigParser, RejectsExitKeysThatShadowEditingKeys)
{
	for (const char* key : {"h", "i", "J", "m"}) {
		const std::string xml =
		        std::string("<QuickLaunch><ExitKey>") + key + "</ExitKey></QuickLaunch>";
		EXPECT_FALSE(ConfigParser::parse_text(xml)) << key;
	}
	EXPECT_TRUE(ConfigParser::parse_text("<QuickLaunch><ExitKey>x</ExitKey></QuickLaunch>"));
}

TEST(ConfigParser, RejectsMalformedDocuments)
{
	EXPECT_FALSE(ConfigParser::parse_text("<QuickLaunch><Rows>3</QuickLaunch>"));
	EXPECT_FALSE(ConfigParser::parse_text("<Launcher/>"));
}

TEST(ConfigParser, ReadsFromFile)
{
	const TempDir dir;
	const auto file = dir.write("launcher.xml", "<QuickLaunch><Rows>4</Rows></QuickLaunch>");

	const auto config = ConfigParser::parse(file.string());
	ASSERT_TRUE(config.has_value());
	EXPECT_EQ(config->rows, 4u);

	EXPECT_FALSE(ConfigParser::parse((dir.path() / "missing.xml").string()));
}
