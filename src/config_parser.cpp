#include "config_parser.h"
#include "utils.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

static constexpr int kMinBufferCount = 2;

// Helper function: strict integer parse (whole string must be a number)
static bool parse_int_arg(const char *text, int *out)
{
    try
    {
        size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != std::string(text).size())
            return false;
        *out = parsed;
        return true;
    }
    catch (const std::logic_error &)
    {
        return false;
    }
}

// Helper function: get environment variable as integer with default
static int get_env_int(const char *name, int default_value, int min_value)
{
    const char *value = std::getenv(name);
    if (!value)
        return default_value;
    int parsed = 0;
    if (parse_int_arg(value, &parsed) && parsed >= min_value)
        return parsed;
    fprintf(stderr, "Warning: Invalid integer value for %s: %s (using default: %d)\n", name, value, default_value);
    return default_value;
}

// Helper function: get environment variable as boolean (1/true/yes = true, 0/false/no = false)
static bool get_env_bool(const char *name, bool default_value)
{
    const char *value = std::getenv(name);
    if (!value)
        return default_value;
    std::string lower = lowercase_copy(value);
    if (lower == "1" || lower == "true" || lower == "yes")
        return true;
    if (lower == "0" || lower == "false" || lower == "no")
        return false;
    fprintf(stderr, "Warning: Invalid boolean value for %s: %s (using default: %s)\n",
            name, value, default_value ? "true" : "false");
    return default_value;
}

std::string default_output_path(const std::string &inputPath)
{
    const std::filesystem::path input(inputPath);
    return (input.parent_path() / (input.stem().string() + "-SpatialVideo.mov")).string();
}

void print_help(const char *argv0)
{
    fprintf(stderr, "sbs2spatial build %s\n", BUILD_VERSION);
    fprintf(stderr, "Usage: %s input [output.mov] [options]\n", argv0);
    fprintf(stderr, "\nConverts a side-by-side stereoscopic video into a spatial (MV-HEVC) video.\n");
    fprintf(stderr, "Without an output path the result is written next to the input as <name>-SpatialVideo.mov.\n");
    fprintf(stderr, "\nOptions:\n");
    fprintf(stderr, "  -v, --verbose      Enable verbose logging (env: SPATIAL_VERBOSE=1)\n");
    fprintf(stderr, "  -d, --debug        Enable debug logging (env: SPATIAL_DEBUG=1)\n");
    fprintf(stderr, "  --encoder <name>   HEVC encoder, default libx265 (env: SPATIAL_ENCODER)\n");
    fprintf(stderr, "  --buffers <n>      Output frame buffers, default 4, minimum 2 (env: SPATIAL_BUFFER_COUNT)\n");
    fprintf(stderr, "  --no-progress      Do not draw the progress bar (env: SPATIAL_NO_PROGRESS=1)\n");
    fprintf(stderr, "  -h, --help         Show this help\n");
    fprintf(stderr, "\nEnvironment variables can be used to set defaults. Command-line flags override environment variables.\n");
}

bool parse_arguments(int argc, char **argv, ConverterConfig *cfg)
{
    // Environment defaults first, flags override them
    cfg->verbose = get_env_bool("SPATIAL_VERBOSE", false);
    cfg->debug = get_env_bool("SPATIAL_DEBUG", false);
    cfg->showProgress = !get_env_bool("SPATIAL_NO_PROGRESS", false);
    cfg->retainedBufferCount = get_env_int("SPATIAL_BUFFER_COUNT", 4, kMinBufferCount);
    const char *env_encoder = std::getenv("SPATIAL_ENCODER");
    cfg->encoder = (env_encoder && *env_encoder) ? env_encoder : "libx265";

    int positional = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            cfg->showHelp = true;
            return true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            cfg->verbose = true;
        }
        else if (arg == "-d" || arg == "--debug")
        {
            cfg->debug = true;
        }
        else if (arg == "--no-progress")
        {
            cfg->showProgress = false;
        }
        else if (arg == "--encoder")
        {
            if (i + 1 >= argc)
            {
                fprintf(stderr, "--encoder requires a name\n");
                print_help(argv[0]);
                return false;
            }
            cfg->encoder = argv[++i];
        }
        else if (arg == "--buffers")
        {
            if (i + 1 >= argc)
            {
                fprintf(stderr, "--buffers requires a count\n");
                print_help(argv[0]);
                return false;
            }
            int count = 0;
            const char *value = argv[++i];
            if (!parse_int_arg(value, &count) || count < kMinBufferCount)
            {
                fprintf(stderr, "Invalid value for --buffers: %s (minimum %d)\n", value, kMinBufferCount);
                print_help(argv[0]);
                return false;
            }
            cfg->retainedBufferCount = count;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_help(argv[0]);
            return false;
        }
        else if (positional == 0)
        {
            cfg->inputPath = arg;
            ++positional;
        }
        else if (positional == 1)
        {
            cfg->outputPath = arg;
            ++positional;
        }
        else
        {
            fprintf(stderr, "Unexpected argument: %s\n", arg.c_str());
            print_help(argv[0]);
            return false;
        }
    }

    if (positional < 1)
    {
        fprintf(stderr, "An input path is required\n");
        print_help(argv[0]);
        return false;
    }
    if (positional < 2)
        cfg->outputPath = default_output_path(cfg->inputPath);
    return true;
}
