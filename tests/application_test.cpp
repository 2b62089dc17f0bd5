#include "application.h"

#include <gtest/gtest.h>

TEST(Application, TypingAlwaysShowsFilter)
{
	const QueryHistory history = {};
	EXPECT_TRUE(Application::shows_filter(CharKey{'f'}, history));
}

TEST(Application, BackspaceShowsFilterOnlyWithHistory)
{
	QueryHistory history = {};
	EXPECT_FALSE(Application::shows_filter(Backspace{}, history));

	history.accept("f");
	EXPECT_TRUE(Application::shows_filter(Backspace{}, history));

	static_cast<void>(history.undo());
	EXPECT_FALSE(Application::shows_filter(Backspace{}, history));
}

TEST(Application, NavigationDoesNotShowFilter)
{
	QueryHistory history = {};
	history.accept("f");
	EXPECT_FALSE(Application::shows_filter(MoveDown{}, history));
	EXPECT_FALSE(Application::shows_filter(Confirm{}, history));
	EXPECT_FALSE(Application::shows_filter(Refresh{}, history));
}
