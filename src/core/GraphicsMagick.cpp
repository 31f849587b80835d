#include <fmt/format.h>

#include <LogCompat.hpp>
#include <gmshim/GraphicsMagick.hpp>
#include <gmshim/OutputClassifier.hpp>
#include <string>
#include <utility>

namespace gmshim {

namespace {

Error toError(const absl::Status& status) {
    return {ErrorKind::kUnboundPlaceholder, std::string(status.message())};
}

// Each file becomes its own quoted argument, in order.
std::string quotedFileList(const std::vector<std::filesystem::path>& files) {
    std::string list;
    for (const auto& file : files) {
        if (!list.empty()) {
            list += ' ';
        }
        list += shellQuote(file.string());
    }
    return list;
}

}  // namespace

GraphicsMagick::GraphicsMagick(std::shared_ptr<CommandRunner> runner,
                               GraphicsMagickSettings settings)
    : _runner(std::move(runner)), _settings(std::move(settings)) {}

Result<std::string> GraphicsMagick::buildCommand(
    const std::string_view tmpl, const Template::Fragments& fragments,
    const Bindings& bindings) const {
    const auto rendered = Template(tmpl).render(
        fragments, bindings, BindMode::kEscaped, _settings.templateMode);
    if (!rendered.ok()) {
        LOG(ERROR) << "Cannot build command: " << rendered.status().message();
        return std::unexpected(toError(rendered.status()));
    }
    return fmt::format("{} {}", _settings.binary, *rendered);
}

Result<std::string> GraphicsMagick::buildWithOptions(
    const std::string_view tmpl, const Options& options,
    const Options& outputOptions, Template::Fragments fragments,
    const Bindings& bindings) const {
    const auto optString = renderOptions(options, _settings.templateMode);
    if (!optString.ok()) {
        return std::unexpected(toError(optString.status()));
    }
    const auto outOptString =
        renderOptions(outputOptions, _settings.templateMode);
    if (!outOptString.ok()) {
        return std::unexpected(toError(outOptString.status()));
    }
    fragments.insert_or_assign("options", *optString);
    fragments.insert_or_assign("output_options", *outOptString);
    return buildCommand(tmpl, fragments, bindings);
}

Result<std::string> GraphicsMagick::execute(const std::string& command) const {
    DLOG(INFO) << "Running: " << command;
    auto result = _runner->run(command);
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    if (result->exitCode != 0) {
        // Only the output text decides the result.
        DLOG(INFO) << "Command exited with " << result->exitCode
                   << (result->signaled ? " (signal)" : "");
    }
    return std::move(result->output);
}

CommandResult GraphicsMagick::executeAndClassify(
    const Result<std::string>& command) const {
    if (!command) {
        return std::unexpected(command.error());
    }
    const auto output = execute(*command);
    if (!output) {
        return std::unexpected(output.error());
    }
    return classifyOutput(*output);
}

Result<MetadataRecord> GraphicsMagick::identifyExplicit(
    const std::filesystem::path& file,
    const std::vector<FormatField>& fields) const {
    const auto command = buildCommand(
        kIdentifyExplicitTemplate, {},
        {{"file", file.string()},
         {"format_string", identifyFormatString(fields)}});
    if (!command) {
        return std::unexpected(command.error());
    }
    const auto output = execute(*command);
    if (!output) {
        return std::unexpected(output.error());
    }
    if (const auto kind = findKnownError(*output)) {
        LOG(WARNING) << "identify " << file << " failed: " << *kind;
        return std::unexpected(Error{*kind, *output});
    }
    return parseIdentifyExplicit(*output);
}

Result<std::string> GraphicsMagick::identify(const std::filesystem::path& file,
                                             const Options& options) const {
    const auto command = buildWithOptions(kIdentifyTemplate, options, {}, {},
                                          {{"file", file.string()}});
    if (!command) {
        return std::unexpected(command.error());
    }
    auto output = execute(*command);
    if (!output) {
        return output;
    }
    if (const auto kind = findKnownError(*output)) {
        LOG(WARNING) << "identify " << file << " failed: " << *kind;
        return std::unexpected(Error{*kind, std::move(*output)});
    }
    return output;
}

CommandResult GraphicsMagick::composite(const std::filesystem::path& file,
                                        const std::filesystem::path& baseFile,
                                        const std::filesystem::path& output,
                                        const Options& options) const {
    return executeAndClassify(buildWithOptions(
        kCompositeTemplate, options, {}, {},
        {{"input_file", file.string()},
         {"base_file", baseFile.string()},
         {"output_file", output.string()}}));
}

CommandResult GraphicsMagick::convert(const std::filesystem::path& file,
                                      const std::filesystem::path& output,
                                      const Options& options,
                                      const Options& outputOptions) const {
    return executeAndClassify(buildWithOptions(
        kConvertTemplate, options, outputOptions, {},
        {{"input_file", file.string()}, {"output_file", output.string()}}));
}

CommandResult GraphicsMagick::mogrify(const std::filesystem::path& file,
                                      const Options& options) const {
    return executeAndClassify(buildWithOptions(kMogrifyTemplate, options, {},
                                               {}, {{"file", file.string()}}));
}

CommandResult GraphicsMagick::montage(
    const std::vector<std::filesystem::path>& files,
    const std::filesystem::path& output, const Options& options) const {
    return executeAndClassify(
        buildWithOptions(kMontageTemplate, options, {},
                         {{"input_files", quotedFileList(files)}},
                         {{"output_file", output.string()}}));
}

Result<std::string> GraphicsMagick::version() const {
    const auto command = buildCommand(kVersionTemplate, {}, {});
    if (!command) {
        return std::unexpected(command.error());
    }
    return execute(*command);
}

}  // namespace gmshim
