// diff_demo.cpp
// Command-line driver: diff two JSON files and print the changes
#include "tree_diff/differ.h"
#include "tree_diff/errors.h"
#include "tree_diff/serialization.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace tree_diff;

namespace {

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " [options] <old.json> <new.json>\n"
              << "\n"
              << "Options:\n"
              << "  --best              try several similarity thresholds, keep the smallest diff\n"
              << "  --linear            align sequences position by position\n"
              << "  --loose             compare int and float numbers by value\n"
              << "  --strip             ignore surrounding whitespace in strings\n"
              << "  --tokens            report paths as token lists\n"
              << "  --json              print the change list as JSON\n"
              << "  --tolerance <t>     numeric tolerance\n"
              << "  --similarity <s>    similarity threshold in (0, 1]\n"
              << "  --delimiter <d>     key separator in paths\n";
}

bool read_document(const std::string& file, Value& out)
{
    std::ifstream in(file);
    if (!in) {
        std::cerr << "[diff_demo] cannot open " << file << "\n";
        return false;
    }
    std::ostringstream text;
    text << in.rdbuf();

    std::string error;
    out = from_json(text.str(), &error);
    if (!error.empty()) {
        std::cerr << "[diff_demo] " << file << ": " << error << "\n";
        return false;
    }
    return true;
}

// Whole argument must be a finite number
bool parse_number(const char* text, double& out)
{
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    DiffOptions options;
    bool best = false;
    bool as_json = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--best") {
            best = true;
        } else if (arg == "--linear") {
            options.use_lcs = false;
        } else if (arg == "--loose") {
            options.strict = false;
        } else if (arg == "--strip") {
            options.strip = true;
        } else if (arg == "--tokens") {
            options.array_path = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if ((arg == "--tolerance" || arg == "--similarity") && has_value) {
            double& target = arg == "--tolerance" ? options.numeric_tolerance : options.similarity;
            if (!parse_number(argv[++i], target)) {
                std::cerr << "[diff_demo] invalid number for " << arg << ": " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--delimiter" && has_value) {
            options.delimiter = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "[diff_demo] unknown option " << arg << "\n";
            print_usage(argv[0]);
            return EXIT_FAILURE;
        } else {
            files.emplace_back(arg);
        }
    }

    if (files.size() != 2) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    Value old_doc;
    Value new_doc;
    if (!read_document(files[0], old_doc) || !read_document(files[1], new_doc)) {
        return EXIT_FAILURE;
    }

    try {
        const ChangeList changes = best ? best_diff(old_doc, new_doc, options)
                                        : diff(old_doc, new_doc, options);
        if (as_json) {
            std::cout << to_json(changes) << "\n";
        } else {
            print_changes(changes);
        }
        return changes.empty() ? EXIT_SUCCESS : 1;
    } catch (const invalid_options_error& e) {
        std::cerr << "[diff_demo] invalid options: " << e.what() << "\n";
    } catch (const depth_limit_error& e) {
        std::cerr << "[diff_demo] " << e.what() << "\n";
    }
    return 2;
}
