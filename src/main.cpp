#include "config.hpp"
#include "console.hpp"
#include "curl_storage_client.hpp"
#include "parameters.hpp"
#include "settings.hpp"
#include "size_format.hpp"
#include "temp_file.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>

using namespace incfile;
using json = nlohmann::json;

// ========== Command Line ==========

// Options that shape how include parameters are converted.
struct GlobalOptions {
    std::string config_path = SETTINGS_FILE;
    std::string encoding;
    bool recursive = false;
    bool verbose = false;
};

// Declares the options shared by the pre-parse and the real parse.
void declare_global_options(CLI::App& app, GlobalOptions& options) {
    app.add_option("--config", options.config_path, "Settings file (default: .incfile.json)");
    app.add_option("--encoding", options.encoding, "Text encoding of included files (default: UTF-8)");
    app.add_flag("-r,--recursive", options.recursive, "Let ** in glob patterns match any depth");
    app.add_flag("-v,--verbose", options.verbose, "Enable verbose output");
}

// ========== Output ==========

// Prints one resolved file: its summary line, and its text when requested.
void report(const std::string& name, const FileContent& content, std::uint64_t size,
            bool print_content, Console& console) {
    console.print_colored(name, ansi::GREEN);
    console.println("  " + describe_size(size));

    if (!print_content) {
        return;
    }
    if (const auto* text = std::get_if<std::string>(&content)) {
        console.print_raw(*text);
        if (!text->empty() && text->back() != '\n') {
            console.println();
        }
    } else {
        console.print_warning("(binary content of " + name + " not printed)");
    }
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    // Conversion happens while CLI11 parses, so the options that affect it
    // are read in a first, lenient pass.
    GlobalOptions options;
    {
        CLI::App pre;
        pre.set_help_flag();
        pre.allow_extras();
        declare_global_options(pre, options);
        try {
            pre.parse(argc, argv);
        } catch (const CLI::ParseError&) {
            // Reported by the full parse below.
        }
    }

    Settings settings = load_settings(options.config_path).value_or(Settings{});
    if (!options.encoding.empty()) {
        settings.encoding = options.encoding;
    }
    settings.recursive = settings.recursive || options.recursive;
    settings.verbose = settings.verbose || options.verbose;
    set_verbose(settings.verbose);

    Console console;

    std::string temp_dir = settings.temp_dir.empty() ? default_temp_dir() : settings.temp_dir;
    CurlStorageOptions storage{effective_s3_endpoint(settings), temp_dir, settings.timeout_seconds};

    ParseContext ctx{
        [&console](const std::string& message) { console.print_info(message); },
        ResolveOptions{temp_dir, curl_storage_factory(storage)}
    };

    CLI::App app{"Resolve files and glob patterns, local or s3://, into named content"};
    app.footer("\nExamples:\n"
               "  incfile --file notes.txt --print           Print a text file\n"
               "  incfile --binary-file s3://bucket/model.bin Fetch and measure an object\n"
               "  incfile -r --glob 'data/**/*.csv' --list    Show generated names only\n");

    declare_global_options(app, options);

    std::shared_ptr<IncludedFile> text_file;
    std::shared_ptr<IncludedFile> binary_file;
    std::shared_ptr<FileCollection> text_glob;
    std::shared_ptr<FileCollection> binary_glob;

    IncludeSpec spec;
    spec.encoding = settings.encoding;
    spec.recursive = settings.recursive;

    spec.name = "file";
    spec.help = "Text file to include (local path or s3:// URI)";
    spec.is_text = true;
    add_include_file(app, ctx, spec, text_file);

    spec.name = "binary-file";
    spec.help = "Binary file to include (local path or s3:// URI)";
    spec.is_text = false;
    add_include_file(app, ctx, spec, binary_file);

    spec.name = "glob";
    spec.help = "Glob pattern of text files to include";
    spec.is_text = true;
    add_include_multiple_files(app, ctx, spec, text_glob);

    spec.name = "binary-glob";
    spec.help = "Glob pattern of binary files to include";
    spec.is_text = false;
    add_include_multiple_files(app, ctx, spec, binary_glob);

    bool list_only = false;
    app.add_flag("--list", list_only, "Print the generated names as JSON without reading files");

    bool print_content = false;
    app.add_flag("--print", print_content, "Write resolved text to stdout");

    bool save_config = false;
    app.add_flag("--save-config", save_config, "Write the effective settings to the settings file");

    CLI11_PARSE(app, argc, argv);

    if (save_config) {
        try {
            save_settings(settings, options.config_path);
        } catch (const std::exception& e) {
            console.print_error("Error: " + std::string(e.what()));
            return 1;
        }
        console.print_info("Saved settings to " + options.config_path);
    }

    if (!text_file && !binary_file && !text_glob && !binary_glob) {
        if (save_config) {
            return 0;
        }
        console.print_error("Error: No files specified");
        console.println();
        console.println(app.help());
        return 1;
    }

    if (list_only) {
        json j = json::object();
        if (text_file) j["file"] = text_file->name();
        if (binary_file) j["binary_file"] = binary_file->name();
        if (text_glob) j["glob"] = text_glob->reference_map();
        if (binary_glob) j["binary_glob"] = binary_glob->reference_map();
        console.println(j.dump(2));
        return 0;
    }

    try {
        for (const auto& single : {text_file, binary_file}) {
            if (!single) continue;
            FileContent content = single->resolve();
            report(single->name(), content, single->size(), print_content, console);
        }

        for (const auto& collection : {text_glob, binary_glob}) {
            if (!collection) continue;
            if (collection->empty()) {
                console.print_warning("No readable files matched for --" + collection->base_name());
                continue;
            }
            console.print_header(collection->base_name() + ":");
            auto producer = collection->produce_all();
            while (auto entry = producer.next()) {
                report(entry->name, entry->content, entry->size, print_content, console);
            }
        }
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
