#include <gtest/gtest.h>
#include <context.hpp>
#include <testutil.hpp>


TEST(Context, StringsAndListsOfStrings) {
    Context context;
    ASSERT_EQ(context.parse("{\"name\": \"Michael\", \"items\": [\"a\", \"b\", \"c\"], \"none\": []}"), RENDER_EXIT_OK);
    EXPECT_EQ(context.size(), 3u);
    const ContextValue* name = context.lookup("name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name -> type, ContextValue::SCALAR);
    EXPECT_EQ(name -> scalar, "Michael");
    const ContextValue* items = context.lookup("items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(items -> type, ContextValue::LIST);
    EXPECT_EQ(items -> list, std::vector<std::string>({ "a", "b", "c" }));
    const ContextValue* none = context.lookup("none");
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(none -> type, ContextValue::LIST);
    EXPECT_TRUE(none -> list.empty());
    EXPECT_EQ(context.lookup("missing"), nullptr);
}

TEST(Context, NumbersAndBooleansBecomeTheirJsonText) {
    Context context;
    ASSERT_EQ(context.parse("{\"count\": 3, \"draft\": false, \"mixed\": [1, true, \"x\"]}"), RENDER_EXIT_OK);
    EXPECT_EQ(context.lookup("count") -> scalar, "3");
    EXPECT_EQ(context.lookup("draft") -> scalar, "false");
    EXPECT_EQ(context.lookup("mixed") -> list, std::vector<std::string>({ "1", "true", "x" }));
}

TEST(Context, NullIsTheSameAsMissing) {
    Context context;
    ASSERT_EQ(context.parse("{\"gone\": null, \"here\": \"yes\"}"), RENDER_EXIT_OK);
    EXPECT_EQ(context.lookup("gone"), nullptr);
    EXPECT_EQ(context.size(), 1u);
}

TEST(Context, RejectsWhatItCantHold) {
    Context context;
    EXPECT_EQ(context.parse("{\"nested\": {\"a\": \"b\"}}"), RENDER_EXIT_PARSE);
    EXPECT_EQ(context.parse("{\"grid\": [[\"a\"]]}"), RENDER_EXIT_PARSE);
    EXPECT_EQ(context.parse("{\"holes\": [\"a\", null]}"), RENDER_EXIT_PARSE);
    EXPECT_EQ(context.parse("[\"not\", \"an\", \"object\"]"), RENDER_EXIT_PARSE);
    EXPECT_EQ(context.parse("{\"broken\": "), RENDER_EXIT_PARSE);
    EXPECT_EQ(context.parse(""), RENDER_EXIT_PARSE);
}

TEST(Context, SetAndSetListReplaceEntries) {
    Context context;
    context.set("title", "Draft");
    context.setList("title", { "now", "a", "list" });
    const ContextValue* title = context.lookup("title");
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title -> type, ContextValue::LIST);
    EXPECT_EQ(title -> list.size(), 3u);
    context.set("title", "Final");
    EXPECT_EQ(context.lookup("title") -> type, ContextValue::SCALAR);
    EXPECT_EQ(context.lookup("title") -> scalar, "Final");
}

TEST(Context, LoadsFromAFile) {
    TempDir dir;
    std::string path = dir.write("context.json", "{\"site\": \"example.com\"}");
    Context context;
    ASSERT_EQ(context.load(path), RENDER_EXIT_OK);
    EXPECT_EQ(context.lookup("site") -> scalar, "example.com");
}

TEST(Context, MissingFileIsAnIOError) {
    TempDir dir;
    Context context;
    EXPECT_EQ(context.load(dir.path + "/nope.json"), RENDER_EXIT_IO);
}
