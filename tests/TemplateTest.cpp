#include <gtest/gtest.h>

#include <gmshim/Template.hpp>

using namespace gmshim;

TEST(ShellQuoteTest, WrapsInDoubleQuotes) {
    EXPECT_EQ(shellQuote("a.jpg"), R"("a.jpg")");
    EXPECT_EQ(shellQuote("my file.jpg"), R"("my file.jpg")");
    EXPECT_EQ(shellQuote(""), R"("")");
}

TEST(ShellQuoteTest, EscapesShellMetacharacters) {
    EXPECT_EQ(shellQuote(R"(say "hi")"), R"("say \"hi\"")");
    EXPECT_EQ(shellQuote("$HOME"), R"("\$HOME")");
    EXPECT_EQ(shellQuote("`id`"), R"("\`id\`")");
    EXPECT_EQ(shellQuote(R"(a\b)"), R"("a\\b")");
}

TEST(BindDataTest, EscapedMode) {
    EXPECT_EQ(bindData("identify :file", {{"file", std::string("a.jpg")}},
                       BindMode::kEscaped),
              R"(identify "a.jpg")");
}

TEST(BindDataTest, RawMode) {
    EXPECT_EQ(bindData(":widthx:height", {{"width", 50L}, {"height", 60L}},
                       BindMode::kRaw),
              "50x60");
}

TEST(BindDataTest, LongestKeyWins) {
    const Bindings bindings = {{"file", std::string("short")},
                               {"file_name", std::string("long")}};
    EXPECT_EQ(bindData(":file_name :file", bindings, BindMode::kRaw),
              "long short");
}

TEST(BindDataTest, SubstitutedValuesAreNotRescanned) {
    const Bindings bindings = {{"input", std::string(":output")},
                               {"output", std::string("b.png")}};
    EXPECT_EQ(bindData(":input :output", bindings, BindMode::kRaw),
              ":output b.png");
}

TEST(BindDataTest, UnboundPlaceholderStays) {
    EXPECT_EQ(bindData("convert :input_file :output_file",
                       {{"input_file", std::string("a.jpg")}},
                       BindMode::kEscaped),
              R"(convert "a.jpg" :output_file)");
}

TEST(BindDataTest, UnusedKeyIsIgnored) {
    EXPECT_EQ(bindData("convert :input_file",
                       {{"input_file", std::string("a")},
                        {"unused", std::string("x")}},
                       BindMode::kRaw),
              "convert a");
}

TEST(BindDataTest, NoBindings) {
    EXPECT_EQ(bindData("version", {}, BindMode::kEscaped), "version");
}

TEST(TemplateTest, ParsesSegments) {
    const Template tmpl("convert {{options}} :input_file");
    using Kind = Template::Segment::Kind;
    const std::vector<Template::Segment> expected = {
        {Kind::kLiteral, "convert "},
        {Kind::kInsertion, "options"},
        {Kind::kLiteral, " :input_file"},
    };
    EXPECT_EQ(tmpl.segments(), expected);
}

TEST(TemplateTest, UnclosedMarkerIsLiteral) {
    const Template tmpl("a {{b");
    ASSERT_EQ(tmpl.segments().size(), 1U);
    EXPECT_EQ(tmpl.segments()[0].text, "a {{b");
}

TEST(TemplateTest, RendersFragmentsAndBindings) {
    const Template tmpl("mogrify {{options}} :file");
    const auto rendered =
        tmpl.render({{"options", R"(-resize "50%")"}},
                    {{"file", std::string("a.jpg")}}, BindMode::kEscaped);
    ASSERT_TRUE(rendered.ok()) << rendered.status();
    EXPECT_EQ(*rendered, R"(mogrify -resize "50%" "a.jpg")");
}

TEST(TemplateTest, FragmentsAreNotBound) {
    const Template tmpl("{{options}} :file");
    const auto rendered =
        tmpl.render({{"options", "-draw \"text 0,0 ':file'\""}},
                    {{"file", std::string("a.jpg")}}, BindMode::kEscaped);
    ASSERT_TRUE(rendered.ok()) << rendered.status();
    EXPECT_EQ(*rendered, R"(-draw "text 0,0 ':file'" "a.jpg")");
}

TEST(TemplateTest, StrictRejectsUnboundPlaceholder) {
    const Template tmpl("convert :input_file :output_file");
    const auto rendered = tmpl.render(
        {}, {{"input_file", std::string("a.jpg")}}, BindMode::kEscaped);
    ASSERT_FALSE(rendered.ok());
    EXPECT_EQ(rendered.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(rendered.status().message().find(":output_file"),
              absl::string_view::npos);
}

TEST(TemplateTest, StrictRejectsMissingFragment) {
    const Template tmpl("identify {{options}} :file");
    const auto rendered =
        tmpl.render({}, {{"file", std::string("a.jpg")}}, BindMode::kEscaped);
    ASSERT_FALSE(rendered.ok());
    EXPECT_NE(rendered.status().message().find("{{options}}"),
              absl::string_view::npos);
}

TEST(TemplateTest, LegacyKeepsUnbound) {
    const Template tmpl("identify {{options}} :file :other");
    const auto rendered =
        tmpl.render({}, {{"file", std::string("a.jpg")}}, BindMode::kEscaped,
                    TemplateMode::kLegacy);
    ASSERT_TRUE(rendered.ok()) << rendered.status();
    EXPECT_EQ(*rendered, R"(identify {{options}} "a.jpg" :other)");
}

TEST(TemplateTest, ColonWithoutIdentifierIsText) {
    const Template tmpl("at 10:30 :file");
    const auto rendered = tmpl.render({}, {{"file", std::string("x")}},
                                      BindMode::kRaw);
    ASSERT_TRUE(rendered.ok()) << rendered.status();
    EXPECT_EQ(*rendered, "at 10:30 x");
}

TEST(TemplateTest, StrictAcceptsUnusedBinding) {
    const Template tmpl("convert :input_file");
    const auto rendered = tmpl.render(
        {{"options", "-strip"}},
        {{"input_file", std::string("a")}, {"unused", std::string("x")}},
        BindMode::kRaw);
    ASSERT_TRUE(rendered.ok()) << rendered.status();
    EXPECT_EQ(*rendered, "convert a");
}
