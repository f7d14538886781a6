#include "separator.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

struct CliOptions
{
    std::string input_path;
    std::string output_dir = "./separated";
    std::string model_path = "htdemucs.pt";
    double overlap = 0.25;
    bool as_float = false;
    bool help = false;
};

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program << " <input.wav> [options]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Arguments:" << std::endl;
    std::cerr << "  <input.wav>           Path to the input audio file" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  -h, --help            Print this message and exit" << std::endl;
    std::cerr << "  -o, --output <dir>    Output directory (default: ./separated)" << std::endl;
    std::cerr << "  --overlap <float>     Overlap ratio for chunking (default: 0.25)" << std::endl;
    std::cerr << "  --model <path>        TorchScript model (default: htdemucs.pt)" << std::endl;
    std::cerr << "  --float               Write 32-bit float WAV instead of 16-bit PCM" << std::endl;
}

/**
 * @brief Parses argv into CliOptions.
 *
 * @return false if the arguments are malformed.
 */
bool parse_arguments(int argc, char *argv[], CliOptions &options)
{
    int positionals = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next_value = [&](std::string &target)
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a value" << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            options.help = true;
        }
        else if (arg == "-o" || arg == "--output")
        {
            if (!next_value(options.output_dir))
                return false;
        }
        else if (arg == "--model")
        {
            if (!next_value(options.model_path))
                return false;
        }
        else if (arg == "--overlap")
        {
            std::string value;
            if (!next_value(value))
                return false;
            try
            {
                options.overlap = std::stod(value);
            }
            catch (const std::exception &)
            {
                std::cerr << "Error: invalid overlap '" << value << "'" << std::endl;
                return false;
            }
        }
        else if (arg == "--float")
        {
            options.as_float = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return false;
        }
        else
        {
            options.input_path = arg;
            positionals++;
        }
    }
    return options.help || positionals == 1;
}

/**
 * @brief Prints "step/total", rewriting one line when stdout is a terminal.
 */
void print_progress(long step, long total)
{
    static const bool interactive = isatty(STDOUT_FILENO);
    if (interactive)
    {
        std::cout << "\r  - Processed chunk " << step << "/" << total << std::flush;
        if (step == total)
            std::cout << std::endl;
    }
    else
    {
        std::cout << step << "/" << total << std::endl;
    }
}

void print_summary(const SeparationMetrics &metrics)
{
    std::cout << std::string(50, '=') << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Processing time: " << metrics.processing_time_ms << " ms" << std::endl;
    if (metrics.chunks_processed > 0)
    {
        std::cout << "Average time per chunk: " << metrics.processing_time_ms / metrics.chunks_processed
                  << " ms (" << metrics.chunks_processed << " chunks)" << std::endl;
    }
    std::cout << "Separated " << metrics.frames << " samples x " << metrics.channels << " channels into "
              << metrics.sources << " sources" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

int main(int argc, char *argv[])
{
    CliOptions cli;
    if (!parse_arguments(argc, argv, cli) || cli.help)
    {
        print_usage(argv[0]);
        return cli.help ? 0 : 1;
    }

    if (!fs::exists(cli.input_path))
    {
        std::cerr << "Error: Input file not found: " << cli.input_path << std::endl;
        return 1;
    }

    std::cout << "Stem Separator" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    std::cout << "Input file: " << cli.input_path << std::endl;
    std::cout << "Output directory: " << cli.output_dir << std::endl;
    std::cout << "Overlap: " << cli.overlap << std::endl;
    std::cout << "Model: " << cli.model_path << std::endl;
    std::cout << std::string(50, '=') << std::endl;

    ModelConfig model_config;
    model_config.model_path = cli.model_path;

    std::cout << "Loading model..." << std::endl;
    StemSeparator separator(model_config);
    if (!separator.is_initialized())
    {
        std::cerr << "Exiting due to model initialization failure." << std::endl;
        return 1;
    }

    try
    {
        std::cout << "Reading and processing audio..." << std::endl;
        RawAudio audio = load_audio(cli.input_path);
        check_channels(separator.model(), audio);

        SeparationOptions options;
        options.overlap = cli.overlap;
        options.progress = print_progress;

        auto tracks = separator.separate(audio, options);
        print_summary(separator.get_last_metrics());

        std::cout << "Writing output files..." << std::endl;
        fs::path track_dir = fs::path(cli.output_dir) / fs::path(cli.input_path).stem();
        fs::create_directories(track_dir);

        for (const auto &[name, track] : tracks)
        {
            fs::path output_path = track_dir / (name + ".wav");
            save_audio(output_path.string(), track, cli.as_float);
            std::cout << "  Wrote: " << output_path.string() << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Done!" << std::endl;
    return 0;
}
