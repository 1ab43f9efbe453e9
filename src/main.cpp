#include "anon/orchestrator.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "detector/languages.hpp"
#include "detector/pattern_detector.hpp"
#include "ocr/tesseract_ocr_extractor.hpp"
#include "pipeline/file_processor.hpp"
#include "pipeline/run_report.hpp"
#include "registry/open_registry.hpp"
#include "security/env_key_manager.hpp"

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace docanon;

namespace {

struct CliOptions {
    std::optional<std::string> input_path;
    std::optional<std::string> config_path;
    std::optional<std::string> language;
    std::optional<std::string> allow_list;
    std::optional<std::string> preserve_entities;
    std::optional<int64_t> slug_length;
    std::optional<int64_t> batch_size;
    std::optional<std::string> output_dir;
    std::optional<std::string> log_level;
    bool list_entities = false;
    bool list_languages = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "usage: docanon [options] <file_or_directory>\n"
           "\n"
           "Anonymize sensitive information in various file formats.\n"
           "\n"
           "options:\n"
           "  --list-entities              list all supported entity types and exit\n"
           "  --list-languages             list all supported languages and exit\n"
           "  --lang CODE                  language of the document (default: en)\n"
           "  --allow-list TERMS           comma-separated terms never anonymized\n"
           "  --preserve-entities TYPES    comma-separated entity types left as-is\n"
           "  --slug-length N              length of the display hash (1-64)\n"
           "  --batch-size N               texts per detector call (default: 32)\n"
           "  --output-dir DIR             where anonymized files go (default: output)\n"
           "  --config FILE                TOML configuration file\n"
           "  --log-level LEVEL            debug, info, warn or error\n"
           "  -h, --help                   show this help and exit\n";
}

int64_t parse_int_flag(const std::string& flag, const std::string& value) {
    const auto parsed = utils::try_parse_int<int64_t>(value);
    if (!parsed) {
        throw std::invalid_argument(std::format("argument {}: invalid int value: '{}'", flag, value));
    }
    return *parsed;
}

/**
 * @throws std::invalid_argument on unknown flags or bad values
 */
CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // --flag=value and --flag value
        std::string flag = arg;
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            if (const auto eq = arg.find('='); eq != std::string::npos) {
                flag = arg.substr(0, eq);
                inline_value = arg.substr(eq + 1);
            }
        }
        const auto value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::format("argument {}: expected one argument", flag));
            }
            return argv[++i];
        };

        if (flag == "-h" || flag == "--help") {
            opts.help = true;
        } else if (flag == "--list-entities") {
            opts.list_entities = true;
        } else if (flag == "--list-languages") {
            opts.list_languages = true;
        } else if (flag == "--lang") {
            opts.language = value();
        } else if (flag == "--allow-list") {
            opts.allow_list = value();
        } else if (flag == "--preserve-entities") {
            opts.preserve_entities = value();
        } else if (flag == "--slug-length") {
            opts.slug_length = parse_int_flag(flag, value());
        } else if (flag == "--batch-size") {
            opts.batch_size = parse_int_flag(flag, value());
        } else if (flag == "--output-dir") {
            opts.output_dir = value();
        } else if (flag == "--config") {
            opts.config_path = value();
        } else if (flag == "--log-level") {
            opts.log_level = value();
        } else if (arg.starts_with("-") && arg != "-") {
            throw std::invalid_argument(std::format("unrecognized arguments: {}", arg));
        } else if (!opts.input_path) {
            opts.input_path = arg;
        } else {
            throw std::invalid_argument(std::format("unrecognized arguments: {}", arg));
        }
    }

    if (opts.slug_length && !utils::in_range<1, 64>(*opts.slug_length)) {
        throw std::invalid_argument("--slug-length must be between 1 and 64.");
    }
    if (!opts.input_path && !opts.list_entities && !opts.list_languages && !opts.help) {
        throw std::invalid_argument(
            "A file path must be provided when not using --list-entities or --list-languages.");
    }
    return opts;
}

void apply_overrides(const CliOptions& opts, AnonymizerConfig& config) {
    auto& anon = config.anonymization;
    if (opts.language) anon.language = *opts.language;
    if (opts.allow_list) anon.allow_list = utils::split_list(*opts.allow_list);
    if (opts.preserve_entities) anon.preserve_entities = utils::split_list(*opts.preserve_entities);
    if (opts.slug_length) anon.slug_length = *opts.slug_length;
    if (opts.batch_size) anon.batch_size = *opts.batch_size;
    if (opts.output_dir) config.output.directory = *opts.output_dir;
    if (opts.log_level) config.logging.level = *opts.log_level;
}

void configure_logging(const LoggingConfig& logging) {
    if (const auto level = utils::log::parse_level(logging.level)) {
        utils::log::set_level(*level);
    }
    if (!logging.file.empty()) {
        const auto parent = std::filesystem::path(logging.file).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        if (!utils::log::set_file(logging.file)) {
            utils::log::warn(std::format("Cannot open log file {}", logging.file));
        }
    }
}

std::unique_ptr<IOcrExtractor> make_ocr(const OcrConfig& ocr) {
    if (!ocr.enabled) {
        utils::log::info("OCR disabled; embedded images yield no text");
        return std::make_unique<NullOcrExtractor>();
    }
    return std::make_unique<TesseractOcrExtractor>(ocr.language, ocr.tessdata_path);
}

int run_directory(FileProcessor& processor, const std::filesystem::path& dir) {
    std::cout << std::format("[+] Processing directory: {}...\n", dir.string());
    const auto summary = processor.process_directory(dir);
    for (const auto& output : summary.outputs) {
        std::cout << std::format("[*] Anonymized file saved at: {}\n", output.string());
    }
    if (summary.processed == 0) {
        std::cerr << "[!] No files were processed in the directory.\n";
    }
    return 0;
}

int run_file(FileProcessor& processor, const Orchestrator& orchestrator,
             const std::filesystem::path& input, const AnonymizerConfig& config,
             const utils::Timer& timer) {
    std::cout << std::format("[+] Processing file: {}...\n", input.string());
    const auto output = processor.process_file(input);
    std::cout << std::format("[*] Anonymized file saved at: {}\n", output.string());

    const auto report = RunReport::from_counters(input, output, timer.elapsed_seconds(),
                                                 orchestrator.counters());
    std::cout << report.stats_text() << "\n";

    const auto report_path = report.write(config.output.report_directory);
    std::cout << std::format("Report saved at: {}\n", report_path.string());
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        print_usage(std::cerr);
        std::cerr << std::format("docanon: error: {}\n", e.what());
        return 2;
    }
    if (opts.help) {
        print_usage(std::cout);
        return 0;
    }

    AnonymizerConfig config;
    if (opts.config_path) {
        auto loaded = ConfigLoader::load_from_file(*opts.config_path);
        if (!loaded.success) {
            std::cerr << std::format("[!] Error: {}\n", loaded.error_message);
            return 1;
        }
        config = std::move(loaded.config);
    }
    apply_overrides(opts, config);

    if (const auto errors = ConfigLoader::validate_config(config); !errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << std::format("[!] Error: {}\n", err);
        }
        return 1;
    }

    try {
        configure_logging(config.logging);
        PatternDetector detector(config.recognizers);

        if (opts.list_entities) {
            std::cout << "[*] Supported entity types:\n";
            for (const auto& entity : detector.supported_entities(config.anonymization.language)) {
                std::cout << std::format(" - {}\n", entity);
            }
            return 0;
        }
        if (opts.list_languages) {
            std::cout << "[*] Supported languages:\n";
            for (const auto& [code, name] : supported_languages()) {
                std::cout << std::format(" - {}: {}\n", code, name);
            }
            return 0;
        }

        const EnvKeyManager keys(config.secret.env_var);
        const auto key = keys.get_active_key();
        if (!key) {
            std::cerr << std::format("[!] Error: {} environment variable not set.\n", keys.env_var_name());
            return 1;
        }

        const utils::Timer timer;
        auto registry = open_registry(config.registry);
        auto ocr = make_ocr(config.ocr);

        std::cout << std::format("[+] Initializing anonymization engine for language '{}'...\n",
            config.anonymization.language);
        Orchestrator orchestrator(config.to_anonymization_config(), detector, *key, registry.get());
        FileProcessor processor(orchestrator, *ocr, config.output.directory,
                                static_cast<size_t>(config.anonymization.batch_size));

        const std::filesystem::path input(*opts.input_path);
        if (std::filesystem::is_directory(input)) {
            return run_directory(processor, input);
        }
        return run_file(processor, orchestrator, input, config, timer);

    } catch (const std::exception& e) {
        std::cerr << std::format("[!] An error occurred during processing: {}\n", e.what());
        return 1;
    }
}
