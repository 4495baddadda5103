#include "tabula/config.hpp"
#include "tabula/cli/table_script.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{

constexpr std::string_view kToolId = "tabula-draw";

void print_usage(const char *binaryName)
{
    std::printf("Usage: %s [--config FILE] [--fill TEXT] [--rows] [--json] [--verbose] FILE...\n", binaryName);
}

} // namespace

int main(int argc, char **argv)
{
    const char *binaryName = (argc > 0 && argv[0]) ? argv[0] : "tabula-draw";

    std::optional<std::filesystem::path> configPath;
    tabula::cli::DocumentOptions options;
    std::vector<std::filesystem::path> files;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--config" || arg == "--fill")
        {
            if (i + 1 >= argc)
            {
                std::cerr << kToolId << ": " << arg << " requires a value\n";
                return EXIT_FAILURE;
            }
            if (arg == "--config")
                configPath = std::filesystem::path(argv[++i]);
            else
                options.fill_text = std::string(argv[++i]);
        }
        else if (arg == "--rows")
        {
            options.list_rows = true;
        }
        else if (arg == "--json")
        {
            options.print_json = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage(binaryName);
            return 0;
        }
        else if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << kToolId << ": unknown option " << arg << '\n';
            print_usage(binaryName);
            return EXIT_FAILURE;
        }
        else
        {
            files.emplace_back(argv[i]);
        }
    }

    if (files.empty())
    {
        print_usage(binaryName);
        return EXIT_FAILURE;
    }

    try
    {
        using tabula::config::ConfigLoader;
        options.config = configPath ? ConfigLoader::load_from_file(*configPath) : ConfigLoader::load_or_default();
    }
    catch (const std::exception &error)
    {
        std::cerr << kToolId << ": " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    bool failed = false;
    for (std::size_t i = 0; i < files.size(); ++i)
    {
        if (files.size() > 1)
            std::cout << (i > 0 ? "\n" : "") << "== " << files[i].string() << " ==\n";
        if (!tabula::cli::process_file(files[i], options, &std::cout, &std::cerr))
            failed = true;
    }
    return failed ? EXIT_FAILURE : 0;
}
