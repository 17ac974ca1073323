#include "parameters.hpp"
#include "file_resolver.hpp"
#include "verbose.hpp"

namespace incfile {

FilePathConverter::FilePathConverter(ParseContext ctx, bool is_text, std::optional<std::string> encoding)
    : ctx_(std::move(ctx)), is_text_(is_text), encoding_(std::move(encoding)) {}

ConversionResult FilePathConverter::convert(const std::string& raw) const {
    std::string path = expand_home(raw);
    Reachability reach = IncludedFile::check_reachable(path);
    if (!reach.ok) {
        return ConversionResult::failure(reach.reason);
    }
    return ConversionResult::success(
        std::make_shared<IncludedFile>(ctx_.logger, is_text_, encoding_, path, ctx_.options));
}

FileGlobConverter::FileGlobConverter(ParseContext ctx, std::string name, bool is_text,
                                     std::optional<std::string> encoding, bool recursive,
                                     SuffixGenerator suffixes)
    : ctx_(std::move(ctx)),
      name_(std::move(name)),
      is_text_(is_text),
      encoding_(std::move(encoding)),
      recursive_(recursive),
      suffixes_(std::move(suffixes)) {}

ConversionResult FileGlobConverter::convert(const std::string& raw) const {
    auto collection = std::make_shared<FileCollection>(
        name_, ctx_.logger, is_text_, encoding_, ctx_.options, suffixes_);

    std::string pattern = expand_home(raw);
    for (const auto& path : expand_glob(pattern, recursive_)) {
        collection->add_match(path);
    }

    verbose_log("GLOB", pattern + " -> " + std::to_string(collection->size()) + " file(s)");
    return ConversionResult::success(collection);
}

// ========== CLI11 Registration ==========

CLI::Option* add_include_file(CLI::App& app, const ParseContext& ctx, const IncludeSpec& spec,
                              std::shared_ptr<IncludedFile>& target) {
    auto converter = std::make_shared<FilePathConverter>(ctx, spec.is_text, spec.encoding);
    std::string option_name = "--" + spec.name;

    CLI::Option* option = app.add_option_function<std::string>(
        option_name,
        [converter, option_name, &target](const std::string& raw) {
            ConversionResult result = converter->convert(raw);
            if (!result.ok()) {
                throw CLI::ValidationError(option_name, result.error);
            }
            target = std::get<std::shared_ptr<IncludedFile>>(*result.value);
        },
        spec.help);

    option->type_name(converter->type_name());
    if (spec.required) {
        option->required();
    }
    return option;
}

CLI::Option* add_include_multiple_files(CLI::App& app, const ParseContext& ctx, const IncludeSpec& spec,
                                        std::shared_ptr<FileCollection>& target) {
    auto converter = std::make_shared<FileGlobConverter>(
        ctx, spec.name, spec.is_text, spec.encoding, spec.recursive);
    std::string option_name = "--" + spec.name;

    CLI::Option* option = app.add_option_function<std::string>(
        option_name,
        [converter, option_name, &target](const std::string& raw) {
            ConversionResult result = converter->convert(raw);
            if (!result.ok()) {
                throw CLI::ValidationError(option_name, result.error);
            }
            target = std::get<std::shared_ptr<FileCollection>>(*result.value);
        },
        spec.help);

    option->type_name(converter->type_name());
    if (spec.required) {
        option->required();
    }
    return option;
}

} // namespace incfile
