#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <gmshim/GraphicsMagick.hpp>
#include <gmshim/OptionCatalog.hpp>
#include <memory>

#include "mocks/CommandRunner.hpp"

using namespace gmshim;
using testing::_;
using testing::Return;

class GraphicsMagickTest : public ::testing::Test {
   protected:
    void SetUp() override { runner = std::make_shared<CommandRunnerMock>(); }

    // Expects exactly one command and replies with output.
    void willRun(const std::string& command, std::string output = {},
                 int exitCode = 0) {
        EXPECT_CALL(*runner, run(command))
            .WillOnce(Return(Result<ExecResult>(
                ExecResult{std::move(output), exitCode, false})));
    }

    [[nodiscard]] GraphicsMagick gm(GraphicsMagickSettings settings = {}) const {
        return GraphicsMagick(runner, std::move(settings));
    }

    std::shared_ptr<CommandRunnerMock> runner;
};

TEST_F(GraphicsMagickTest, IdentifyExplicit) {
    willRun(R"(gm identify -format "filename: %f--SEP--width: %w--SEP--height: %h" "a.jpg")",
            "filename: a.jpg--SEP--width: 640--SEP--height: 480\n");
    const auto record = gm().identifyExplicit(
        "a.jpg",
        {FormatField::kFilename, FormatField::kWidth, FormatField::kHeight});
    ASSERT_TRUE(record) << record.error();
    EXPECT_EQ(record->getText("filename"), "a.jpg");
    EXPECT_EQ(record->width(), 640);
    EXPECT_EQ(record->height(), 480);
}

TEST_F(GraphicsMagickTest, IdentifyExplicitWithType) {
    willRun(R"(gm identify -format "filename: %f--SEP--width: %w--SEP--height: %h--SEP--type: %m" "a.jpg")",
            "filename: a.jpg--SEP--width: 100--SEP--height: 50--SEP--type: "
            "JPEG\n");
    const auto record = gm().identifyExplicit(
        "a.jpg", {FormatField::kFilename, FormatField::kWidth,
                  FormatField::kHeight, FormatField::kType});
    ASSERT_TRUE(record) << record.error();
    EXPECT_EQ(record->size(), 4U);
    EXPECT_EQ(record->getText("filename"), "a.jpg");
    EXPECT_EQ(record->getInt("width"), 100);
    EXPECT_EQ(record->getInt("height"), 50);
    EXPECT_EQ(record->getText("type"), "JPEG");
}

TEST_F(GraphicsMagickTest, IdentifyExplicitMissingFile) {
    willRun(R"(gm identify -format "width: %w" "missing.jpg")",
            "gm identify: Unable to open file (missing.jpg) "
            "[No such file or directory].\n",
            1);
    const auto record =
        gm().identifyExplicit("missing.jpg", {FormatField::kWidth});
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error(), ErrorKind::kFileNotFound);
}

TEST_F(GraphicsMagickTest, IdentifyExplicitEmptyOutput) {
    willRun(R"(gm identify -format "width: %w" "a.jpg")");
    const auto record = gm().identifyExplicit("a.jpg", {FormatField::kWidth});
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error(), ErrorKind::kMalformedMetadata);
}

TEST_F(GraphicsMagickTest, IdentifyReturnsRawOutput) {
    willRun(R"(gm identify -verbose "a.jpg")", "Image: a.jpg\n  Format: JPEG\n");
    const auto output = gm().identify("a.jpg", {opt::verbose()});
    ASSERT_TRUE(output) << output.error();
    EXPECT_EQ(*output, "Image: a.jpg\n  Format: JPEG\n");
}

TEST_F(GraphicsMagickTest, IdentifyWithoutOptions) {
    willRun(R"(gm identify  "a.jpg")", "a.jpg JPEG 640x480\n");
    const auto output = gm().identify("a.jpg", {});
    ASSERT_TRUE(output) << output.error();
}

TEST_F(GraphicsMagickTest, IdentifyClassifiesErrors) {
    willRun(R"(gm identify  "x.png")", "gm identify: unable to open image\n");
    const auto output = gm().identify("x.png", {});
    ASSERT_FALSE(output);
    EXPECT_EQ(output.error(), ErrorKind::kUnableToOpen);
}

TEST_F(GraphicsMagickTest, Convert) {
    willRun(R"(gm convert -resize "50%" "in.jpg" -quality "80" "out.png")");
    EXPECT_TRUE(gm().convert("in.jpg", "out.png", {opt::resizePercent(50)},
                             {opt::quality(80)}));
}

TEST_F(GraphicsMagickTest, ConvertWithoutOptions) {
    willRun(R"(gm convert  "in.jpg"  "out.png")");
    EXPECT_TRUE(gm().convert("in.jpg", "out.png"));
}

TEST_F(GraphicsMagickTest, ConvertQuotesFileNames) {
    willRun(R"(gm convert -strip "my \$photo.jpg"  "out file.png")");
    EXPECT_TRUE(gm().convert("my $photo.jpg", "out file.png", {opt::strip()}));
}

TEST_F(GraphicsMagickTest, ConvertUnexpectedOutput) {
    willRun(R"(gm convert  "in.jpg"  "out.png")", "gm convert: warning\n");
    const auto result = gm().convert("in.jpg", "out.png");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ErrorKind::kUnclassified);
    EXPECT_EQ(result.error().detail, "gm convert: warning\n");
}

TEST_F(GraphicsMagickTest, ExitCodeDoesNotDecide) {
    willRun(R"(gm mogrify -flip "a.jpg")", "", 1);
    EXPECT_TRUE(gm().mogrify("a.jpg", {opt::flip()}));
}

TEST_F(GraphicsMagickTest, Mogrify) {
    willRun(R"(gm mogrify -resize "640x480" -strip "a.jpg")");
    EXPECT_TRUE(gm().mogrify("a.jpg", {opt::resize(640, 480), opt::strip()}));
}

TEST_F(GraphicsMagickTest, Composite) {
    willRun(R"(gm composite -gravity "center" "logo.png" "base.png" "out.png")");
    EXPECT_TRUE(gm().composite("logo.png", "base.png", "out.png",
                               {opt::gravity("center")}));
}

TEST_F(GraphicsMagickTest, Montage) {
    willRun(R"(gm montage -tile "2x1" "a.png" "b.png" "out.png")");
    EXPECT_TRUE(gm().montage({"a.png", "b.png"}, "out.png", {opt::tile(2, 1)}));
}

TEST_F(GraphicsMagickTest, MontageCommandNotFound) {
    willRun(R"(gm montage  "a.png" "out.png")", "sh: gm: command not found\n",
            127);
    const auto result = gm().montage({"a.png"}, "out.png", {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ErrorKind::kCommandNotFound);
}

TEST_F(GraphicsMagickTest, Version) {
    willRun("gm version", "GraphicsMagick 1.3.38\n");
    const auto output = gm().version();
    ASSERT_TRUE(output) << output.error();
    EXPECT_EQ(*output, "GraphicsMagick 1.3.38\n");
}

TEST_F(GraphicsMagickTest, CustomBinary) {
    willRun("/opt/gm/bin/gm version", "GraphicsMagick\n");
    GraphicsMagickSettings settings;
    settings.binary = "/opt/gm/bin/gm";
    EXPECT_TRUE(gm(settings).version());
}

TEST_F(GraphicsMagickTest, SpawnFailurePropagates) {
    EXPECT_CALL(*runner, run(_))
        .WillOnce(Return(Result<ExecResult>(
            std::unexpected(Error{ErrorKind::kSpawnFailed, "popen"}))));
    const auto result = gm().mogrify("a.jpg", {});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ErrorKind::kSpawnFailed);
}

TEST_F(GraphicsMagickTest, UnboundOptionNeverRuns) {
    EXPECT_CALL(*runner, run(_)).Times(0);
    const auto result = gm().mogrify(
        "a.jpg", {Option::valued("-resize", ":widthx:height", {{"width", 5L}})});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), ErrorKind::kUnboundPlaceholder);
}

TEST_F(GraphicsMagickTest, LegacyModeRunsUnboundOption) {
    willRun(R"(gm mogrify -resize "5x:height" "a.jpg")");
    GraphicsMagickSettings settings;
    settings.templateMode = TemplateMode::kLegacy;
    EXPECT_TRUE(gm(settings).mogrify(
        "a.jpg",
        {Option::valued("-resize", ":widthx:height", {{"width", 5L}})}));
}

TEST_F(GraphicsMagickTest, BuildCommandStrictRejectsUnbound) {
    const auto command =
        gm().buildCommand("convert :input_file :output_file", {},
                          {{"input_file", std::string("a.jpg")}});
    ASSERT_FALSE(command);
    EXPECT_EQ(command.error(), ErrorKind::kUnboundPlaceholder);
}

TEST_F(GraphicsMagickTest, FileNameWithPlaceholderIsNotRebound) {
    willRun(R"(gm composite  ":base_file" "base.png" "out.png")");
    EXPECT_TRUE(gm().composite(":base_file", "base.png", "out.png", {}));
}
