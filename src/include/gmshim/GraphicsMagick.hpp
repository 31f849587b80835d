#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "CommandRunner.hpp"
#include "Error.hpp"
#include "FormatField.hpp"
#include "MetadataParser.hpp"
#include "Option.hpp"
#include "Template.hpp"

namespace gmshim {

struct GraphicsMagickSettings {
    static constexpr std::string_view kDefaultBinary = "gm";

    // Prefix of every command line, looked up in PATH by the shell.
    std::string binary{kDefaultBinary};
    TemplateMode templateMode = TemplateMode::kStrict;
};

/**
 * @brief The gm subcommands, each run as one blocking subprocess.
 *
 * Instances hold no mutable state, so one object can serve several threads
 * as long as the CommandRunner can.
 */
class GraphicsMagick {
   public:
    // Command templates, one per subcommand.
    static constexpr std::string_view kIdentifyExplicitTemplate =
        "identify -format :format_string :file";
    static constexpr std::string_view kIdentifyTemplate =
        "identify {{options}} :file";
    static constexpr std::string_view kCompositeTemplate =
        "composite {{options}} :input_file :base_file :output_file";
    static constexpr std::string_view kConvertTemplate =
        "convert {{options}} :input_file {{output_options}} :output_file";
    static constexpr std::string_view kMogrifyTemplate =
        "mogrify {{options}} :file";
    static constexpr std::string_view kMontageTemplate =
        "montage {{options}} {{input_files}} :output_file";
    static constexpr std::string_view kVersionTemplate = "version";

    explicit GraphicsMagick(std::shared_ptr<CommandRunner> runner,
                            GraphicsMagickSettings settings = {});

    /**
     * @brief Reads the given properties of an image.
     *
     * Runs identify with a -format string made of "name: escape" pairs
     * joined by "--SEP--" and parses the reply.
     *
     * @param file The image.
     * @param fields Properties to read, e.g. {kFilename, kWidth, kHeight}.
     * @return The properties with width and height as integers, a
     * classified gm error, or kMalformedMetadata.
     */
    [[nodiscard]] Result<MetadataRecord> identifyExplicit(
        const std::filesystem::path& file,
        const std::vector<FormatField>& fields) const;

    /**
     * @brief Runs identify and returns its text.
     *
     * @return The raw output, unless it contains a known gm error message.
     */
    [[nodiscard]] Result<std::string> identify(
        const std::filesystem::path& file, const Options& options) const;

    // Composites file over baseFile into output.
    [[nodiscard]] CommandResult composite(const std::filesystem::path& file,
                                          const std::filesystem::path& baseFile,
                                          const std::filesystem::path& output,
                                          const Options& options) const;

    /**
     * @brief Converts file into output.
     *
     * @param options Switches placed before the input file.
     * @param outputOptions Switches placed between input and output file.
     */
    [[nodiscard]] CommandResult convert(
        const std::filesystem::path& file, const std::filesystem::path& output,
        const Options& options = {}, const Options& outputOptions = {}) const;

    // Modifies file in place.
    [[nodiscard]] CommandResult mogrify(const std::filesystem::path& file,
                                        const Options& options) const;

    // Combines files, in this order, into output.
    [[nodiscard]] CommandResult montage(
        const std::vector<std::filesystem::path>& files,
        const std::filesystem::path& output, const Options& options) const;

    // Raw output of `gm version`.
    [[nodiscard]] Result<std::string> version() const;

    /**
     * @brief Builds the full command line for a template, binary included.
     *
     * Fragments are spliced as they are, bindings are shell-quoted.
     */
    [[nodiscard]] Result<std::string> buildCommand(
        std::string_view tmpl, const Template::Fragments& fragments,
        const Bindings& bindings) const;

    [[nodiscard]] const GraphicsMagickSettings& settings() const {
        return _settings;
    }

   private:
    // Builds the command for tmpl with its {{options}}-style fragments
    // rendered from the given option lists.
    [[nodiscard]] Result<std::string> buildWithOptions(
        std::string_view tmpl, const Options& options,
        const Options& outputOptions, Template::Fragments fragments,
        const Bindings& bindings) const;
    [[nodiscard]] Result<std::string> execute(const std::string& command) const;
    [[nodiscard]] CommandResult executeAndClassify(
        const Result<std::string>& command) const;

    std::shared_ptr<CommandRunner> _runner;
    GraphicsMagickSettings _settings;
};

}  // namespace gmshim
