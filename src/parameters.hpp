#pragma once

/**
 * Command-line parameter types for file inclusion.
 *
 * A ParameterConverter turns the raw string given on the command line into
 * an unresolved IncludedFile or FileCollection. The add_include_* helpers
 * register converters as CLI11 options so that bad paths fail argument
 * parsing with a readable message.
 */

#include "file_collection.hpp"
#include "included_file.hpp"
#include <CLI/CLI.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace incfile {

// Value produced by a successful conversion.
using ResolvedValue = std::variant<std::shared_ptr<IncludedFile>, std::shared_ptr<FileCollection>>;

/**
 * Either a value or the reason the raw argument was rejected.
 */
struct ConversionResult {
    std::optional<ResolvedValue> value;
    std::string error;

    bool ok() const { return value.has_value(); }

    static ConversionResult success(ResolvedValue v) { return {std::move(v), ""}; }
    static ConversionResult failure(std::string reason) { return {std::nullopt, std::move(reason)}; }
};

/**
 * State available to converters while arguments are parsed.
 */
struct ParseContext {
    Logger logger;           // Receives resolution progress messages.
    ResolveOptions options;  // Temp directory and storage access.
};

class ParameterConverter {
public:
    virtual ~ParameterConverter() = default;

    // Name shown in help output ("FilePath", "FileGlob").
    virtual std::string type_name() const = 0;

    virtual ConversionResult convert(const std::string& raw) const = 0;
};

/**
 * Single file, local or s3://. Fails when a local path cannot be opened.
 */
class FilePathConverter : public ParameterConverter {
public:
    FilePathConverter(ParseContext ctx, bool is_text, std::optional<std::string> encoding);

    std::string type_name() const override { return "FilePath"; }
    ConversionResult convert(const std::string& raw) const override;

private:
    ParseContext ctx_;
    bool is_text_;
    std::optional<std::string> encoding_;
};

/**
 * Local glob pattern. Never fails: no matches gives an empty collection.
 */
class FileGlobConverter : public ParameterConverter {
public:
    FileGlobConverter(ParseContext ctx, std::string name, bool is_text,
                      std::optional<std::string> encoding, bool recursive,
                      SuffixGenerator suffixes = random_suffix_generator());

    std::string type_name() const override { return "FileGlob"; }
    ConversionResult convert(const std::string& raw) const override;

private:
    ParseContext ctx_;
    std::string name_;
    bool is_text_;
    std::optional<std::string> encoding_;
    bool recursive_;
    SuffixGenerator suffixes_;
};

// ========== CLI11 Registration ==========

/**
 * Declaration of an include parameter.
 */
struct IncludeSpec {
    std::string name;                     // Option name without dashes; base for generated names.
    std::string help;
    bool required = false;
    bool is_text = true;
    std::optional<std::string> encoding;
    bool recursive = false;               // Globs only.
};

// Registers --<name> as a FilePath option storing its result in target.
CLI::Option* add_include_file(CLI::App& app, const ParseContext& ctx, const IncludeSpec& spec,
                              std::shared_ptr<IncludedFile>& target);

// Registers --<name> as a FileGlob option storing its result in target.
CLI::Option* add_include_multiple_files(CLI::App& app, const ParseContext& ctx, const IncludeSpec& spec,
                                        std::shared_ptr<FileCollection>& target);

} // namespace incfile
