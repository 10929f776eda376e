#pragma once

#include <string>

// Settings for one sbs2spatial run
struct ConverterConfig
{
    bool verbose = false;
    bool debug = false;
    bool showProgress = true;
    bool showHelp = false;

    std::string inputPath;
    std::string outputPath;

    std::string encoder = "libx265"; // HEVC encoder name (--encoder)
    int retainedBufferCount = 4;     // output frame pool size (--buffers), at least 2
};

// <input dir>/<input stem>-SpatialVideo.mov
std::string default_output_path(const std::string &inputPath);

// Print usage/help information
void print_help(const char *argv0);

// Parse command-line arguments on top of environment defaults.
// Returns false (after printing usage) when the arguments are invalid.
bool parse_arguments(int argc, char **argv, ConverterConfig *cfg);
