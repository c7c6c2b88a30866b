#include <pathwright/log.hpp>
#include <pathwright/path_legalizer.hpp>
#include <pathwright/settings.hpp>

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

void print_usage(const char* program)
{
    std::cerr << "usage: " << program << " [options] < paths\n"
              << "Reads one path per line and prints its legalized form.\n\n"
              << "  --posix | --windows        filesystem rules to follow\n"
              << "  --max-length N             bytes allowed per segment\n"
              << "  --library-root DIR         probe DIR for the length limit\n"
              << "  --replace PATTERN=REPL     add a candidate rule set (up to two\n"
              << "                             are tried)\n"
              << "  --default PATTERN=REPL     rule applied before truncating\n"
              << "  --truncate-only            only truncate, don't sanitize\n"
              << "  --show-truncated           mark truncated paths on stderr\n";
}

pathwright::replacement_rule parse_rule(std::string_view arg)
{
    const auto eq = arg.rfind('=');
    if(eq == std::string_view::npos) {
        throw std::invalid_argument(
                "rule must be PATTERN=REPLACEMENT (" + std::string(arg) + ")");
    }
    return pathwright::replacement_rule(
            std::string(arg.substr(0, eq)), std::string(arg.substr(eq + 1)));
}

} // namespace

int main(int argc, char** argv)
{
    pathwright::legalizer_settings settings;
    bool truncate_only = false;
    bool show_truncated = false;

    try {
        for(int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            const bool has_value = i + 1 < argc;
            if(arg == "--posix") {
                settings.profile = pathwright::platform_profile::posix;
            } else if(arg == "--windows") {
                settings.profile = pathwright::platform_profile::windows;
            } else if(arg == "--max-length" && has_value) {
                settings.max_filename_length = std::stoi(argv[++i]);
                if(settings.max_filename_length <= 0) {
                    throw std::invalid_argument("--max-length must be positive");
                }
            } else if(arg == "--library-root" && has_value) {
                settings.library_root = argv[++i];
            } else if(arg == "--replace" && has_value) {
                settings.replacements.push_back({parse_rule(argv[++i])});
            } else if(arg == "--default" && has_value) {
                settings.default_rule = parse_rule(argv[++i]);
            } else if(arg == "--truncate-only") {
                truncate_only = true;
            } else if(arg == "--show-truncated") {
                show_truncated = true;
            } else if(arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            } else {
                std::cerr << "unknown or incomplete option: " << arg << '\n';
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch(const std::exception& e) {
        // std::stoi reports bad numbers with invalid_argument or out_of_range.
        std::cerr << "error: " << e.what() << '\n';
        return 2;
    }

    const pathwright::path_legalizer legalizer(std::move(settings));
    std::string line;
    while(std::getline(std::cin, line)) {
        if(truncate_only) {
            std::cout << legalizer.truncate(line) << '\n';
            continue;
        }
        const auto result = legalizer.legalize(line);
        if(show_truncated && result.truncated) {
            std::cerr << "truncated: " << line << '\n';
        }
        std::cout << result.path << '\n';
    }
    pathwright::log::flush();
    return EXIT_SUCCESS;
}
