#include "hircgen/generator.hpp"
#include "hircgen/registry.hpp"
#include "hircgen/renderer.hpp"
#include "hircgen/report.hpp"
#include "bank_parser.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <bank.txt>...\n";
    std::cerr << "  -u              Also generate objects not reached from any root\n";
    std::cerr << "  -b              Keep bank declaration order for roots\n";
    std::cerr << "  -f FILTER       Only generate roots matching id, name or type (repeatable)\n";
    std::cerr << "  -r              With -f, generate the remaining roots afterwards\n";
    std::cerr << "  -sn             Render normal roots without writing them\n";
    std::cerr << "  -su             Render unused objects without writing them\n";
    std::cerr << "  -s GROUP=VALUE  Fix a switch selector (repeatable)\n";
    std::cerr << "  -p ID=VALUE     Fix a parameter value (repeatable)\n";
    std::cerr << "  -o DIR          Write one .txtp file per artifact into DIR\n";
    std::cerr << "  -v              Verbose mode\n";
}

// "KEY=VALUE" を分割
std::pair<std::string, std::string> split_assignment(const std::string& arg) {
    auto pos = arg.find('=');
    if (pos == std::string::npos || pos == 0 || pos + 1 == arg.size()) {
        throw std::invalid_argument("expected KEY=VALUE: " + arg);
    }
    return {arg.substr(0, pos), arg.substr(pos + 1)};
}

uint32_t parse_id(const std::string& text) {
    size_t used = 0;
    unsigned long long value = std::stoull(text, &used, 0);
    if (used != text.size() || value > 0xFFFFFFFFull) {
        throw std::invalid_argument("invalid id: " + text);
    }
    return static_cast<uint32_t>(value);
}

hircgen::StateItem parse_selector(const std::string& arg) {
    auto kv = split_assignment(arg);
    hircgen::StateItem item;
    item.group = parse_id(kv.first);
    item.value = parse_id(kv.second);
    return item;
}

hircgen::ParamItem parse_param(const std::string& arg) {
    auto kv = split_assignment(arg);
    hircgen::ParamItem item;
    item.id = parse_id(kv.first);
    size_t used = 0;
    item.value = std::stod(kv.second, &used);
    if (used != kv.second.size()) {
        throw std::invalid_argument("invalid value: " + kv.second);
    }
    return item;
}

int main(int argc, char* argv[]) {
    hircgen::GeneratorOptions options;
    std::vector<std::string> filters;
    std::vector<std::string> files;
    std::vector<std::string> selector_args;
    std::vector<std::string> param_args;
    std::string outdir;
    bool generate_rest = false;
    bool skip_normal = false;
    bool skip_unused = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-u") == 0) {
            options.generate_unused = true;
        } else if (std::strcmp(argv[i], "-b") == 0) {
            options.bank_order = true;
        } else if (std::strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            filters.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "-r") == 0) {
            generate_rest = true;
        } else if (std::strcmp(argv[i], "-sn") == 0) {
            skip_normal = true;
        } else if (std::strcmp(argv[i], "-su") == 0) {
            skip_unused = true;
        } else if (std::strcmp(argv[i], "-s") == 0 && i + 1 < argc) {
            selector_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            param_args.push_back(argv[++i]);
        } else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            outdir = argv[++i];
        } else if (std::strcmp(argv[i], "-v") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            files.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        for (const auto& arg : selector_args) {
            options.selector_presets.push_back(parse_selector(arg));
        }
        for (const auto& arg : param_args) {
            options.param_presets.push_back(parse_param(arg));
        }

        // Banks keep command line order
        std::vector<hircgen::Bank> banks;
        for (const auto& file : files) {
            auto parsed = hircgen::bank::parse_file(file);
            for (auto& bank : parsed) {
                banks.push_back(std::move(bank));
            }
        }

        hircgen::Registry registry;
        registry.set_verbose(options.verbose);
        hircgen::TreeRenderer renderer(registry);

        std::unique_ptr<hircgen::TextSink> sink;
        if (outdir.empty()) {
            sink = std::make_unique<hircgen::TextSink>(std::cout);
        } else {
            sink = std::make_unique<hircgen::TextSink>(outdir);
        }

        hircgen::Generator generator(std::move(banks), registry, renderer, *sink, options);
        for (const auto& entry : filters) {
            generator.filter().add(entry);
        }
        generator.filter().generate_rest = generate_rest;
        generator.filter().skip_normal = skip_normal;
        generator.filter().skip_unused = skip_unused;

        generator.generate();

        hircgen::write_report(std::cerr, registry, generator.stats(), sink->stats());
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
