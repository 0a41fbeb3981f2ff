#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <getopt.h>

#include <ncpp/NotCurses.hh>
#include <ncpp/Plane.hh>
#include <notcurses/notcurses.h>

#include "converter/ConverterConfig.hpp"
#include "converter/Errors.hpp"
#include "converter/LibavEngine.hpp"
#include "converter/OutputNaming.hpp"
#include "converter/SelfTest.hpp"
#include "converter/SizeEstimator.hpp"
#include "converter/SvxConverter.hpp"
#include "tui/ConvertScreen.hpp"
#include "tui/Signal.hpp"
#include "tui/StateMachine.hpp"
#include "tui/WelcomeScreen.hpp"

namespace {
struct CommandLine {
    std::filesystem::path config_path = std::filesystem::path("config") / "converter.yml";
    bool self_test = false;
    bool preview = false;
    bool batch = false;
    std::vector<std::string> inputs;
};

void PrintUsage(std::ostream& out) {
    out << "Usage: svxconv [options] input_file [output_file]\n"
           "       svxconv -b [options] input_files...   (implied by 3+ files)\n"
           "       svxconv            (interactive converter)\n"
           "\n"
           "Options override config/converter.yml:\n"
           "  -r RATE     Target sample rate in Hz (8363, 16726, 22050, 27928...)\n"
           "  -n          Normalize to 0 dBFS before conversion\n"
           "  -g GAIN     Gain in dB before conversion (ignored with -n)\n"
           "  -f FREQ     Low-pass cutoff in Hz\n"
           "  -l          A500-style low-pass at 3.3 kHz\n"
           "  -t          Trim silence below -48 dB at both ends\n"
           "  -d / -D     TPDF dither on / off (truncate)\n"
           "  -p          Print the conversion plan, do not convert\n"
           "  -b          Batch mode: every argument is an input file\n"
           "  -o DIR      Output folder for batch mode\n"
           "  -c FILE     Config file (default: config/converter.yml)\n"
           "  --self-test Run the pipeline smoke tests; exit status = failures\n"
           "  -h          Show this help\n";
}

std::vector<std::string> WelcomeSummary(const ConversionOptions& options, const ConverterConfig& config) {
    std::vector<std::string> lines;
    lines.push_back("Target: " + std::to_string(options.target_rate) + " Hz, 8-bit signed mono");
    lines.push_back(std::string("Dither: ") + (options.dither ? "TPDF" : "off") +
                    ", Normalize: " + (options.normalize ? "on" : "off"));
    lines.push_back("Output folder: " + config.GetString(config_keys::kOutputFolder, kDefaultOutputFolder));
    if (std::optional<std::string> advisory = SampleRateAdvisory(options.target_rate)) {
        lines.push_back("Warning: " + *advisory);
    }
    return lines;
}

int RunSelfTest() {
    std::error_code ec;
    std::filesystem::path scratch = std::filesystem::temp_directory_path(ec);
    if (ec) {
        scratch = std::filesystem::current_path();
    }
    scratch /= "svxconv_selftest";

    LibavEngine engine;
    SelfTestOracle oracle(engine, scratch, std::cout);
    const int failed = oracle.Run();
    std::filesystem::remove_all(scratch, ec);
    return std::min(failed, 255);
}

void PrintLine(const std::string& line) {
    if (line.rfind("Warning:", 0) == 0) {
        std::cerr << line << "\n";
    } else {
        std::cout << line << "\n";
    }
}

int RunPreview(SvxConverter& converter, const CommandLine& cli) {
    if (!cli.batch) {
        std::cout << FormatPreview(converter.Preview(cli.inputs[0]), converter.Options()) << "\n";
        return 0;
    }
    const std::vector<std::filesystem::path> inputs(cli.inputs.begin(), cli.inputs.end());
    for (const ConversionPreview& preview : converter.PreviewBatch(inputs, PrintLine)) {
        std::cout << FormatPreview(preview, converter.Options()) << "\n";
    }
    return 0;
}

int RunSingle(SvxConverter& converter, const CommandLine& cli) {
    const std::filesystem::path input = cli.inputs[0];
    const std::filesystem::path output =
        cli.inputs.size() > 1 ? std::filesystem::path(cli.inputs[1]) : std::filesystem::path(SanitizeBaseName(input) + ".iff");

    std::cout << "Converting: " << input.filename().string() << "\n";
    const ConversionResult result = converter.ConvertFile(input, output);
    std::cout << "Done: " << FormatResult(result) << "\n";
    return 0;
}

int RunBatch(SvxConverter& converter, const CommandLine& cli, const std::filesystem::path& out_dir) {
    std::vector<std::filesystem::path> inputs(cli.inputs.begin(), cli.inputs.end());
    std::cout << "Batch converting " << inputs.size() << " files -> " << out_dir.string() << "/\n";
    const std::vector<ConversionResult> results = converter.ConvertBatch(inputs, out_dir, PrintLine);
    std::cout << "Converted " << results.size() << " file(s) to " << out_dir.string() << "/\n";
    return 0;
}

int RunInteractive(ConverterConfig& config, const ConversionOptions& options, const std::filesystem::path& config_path) {
    // Configure NotCurses and suppress the startup banner.
    notcurses_options nc_options = ncpp::NotCurses::default_notcurses_options;
    nc_options.flags |= NCOPTION_SUPPRESS_BANNERS;
    ncpp::NotCurses nc(nc_options);

    // Grab the root plane; it tracks the terminal size automatically.
    std::unique_ptr<ncpp::Plane> stdplane{nc.get_stdplane()};

    bool config_changed = false;

    StateMachine machine(nc, *stdplane);
    std::shared_ptr<WelcomeScreen> welcome_state = std::make_shared<WelcomeScreen>(WelcomeSummary(options, config));
    std::shared_ptr<ConvertScreen> convert_state = std::make_shared<ConvertScreen>(config, config_changed);
    machine.AddState("welcome", welcome_state);
    machine.AddState("convert", convert_state);
    machine.TransitionTo("welcome");

    // Enter the main loop: draw, poll, and dispatch to the active state.
    machine.Run();

    // If configuration changed, prompt to save.
    if (config_changed && !InterruptRequested()) {
        unsigned rows = 0;
        unsigned cols = 0;
        stdplane->get_dim(rows, cols);
        bool save = true;

        while (true) {
            stdplane->erase();
            stdplane->perimeter_rounded(0, 0, 0);
            const int choice_row = static_cast<int>(rows) - 1;
            const std::string prompt = "Save configuration changes to " + config_path.string() + "?";
            stdplane->putstr(choice_row, 2, prompt.c_str());
            const int yes_col = 2 + static_cast<int>(prompt.size()) + 4;
            const int no_col = yes_col + 8;
            if (save) {
                stdplane->set_bg_rgb8(255, 255, 255);
                stdplane->set_fg_rgb8(0, 0, 0);
                stdplane->putstr(choice_row, yes_col, "Yes");
                stdplane->set_bg_default();
                stdplane->set_fg_default();
                stdplane->putstr(choice_row, no_col, "No");
            } else {
                stdplane->putstr(choice_row, yes_col, "Yes");
                stdplane->set_bg_rgb8(255, 255, 255);
                stdplane->set_fg_rgb8(0, 0, 0);
                stdplane->putstr(choice_row, no_col, "No");
                stdplane->set_bg_default();
                stdplane->set_fg_default();
            }
            nc.render();

            ncinput ni{};
            timespec ts{0, 500'000'000};
            uint32_t ch = notcurses_get(nc, &ts, &ni);
            if (ch == 0) {
                continue;
            }
            if (ch == 'q' || ch == 'Q' || static_cast<int32_t>(ch) == -1) {
                break;
            }
            if (ch == NCKEY_LEFT || ch == NCKEY_RIGHT) {
                save = !save;
            } else if (ch == NCKEY_ENTER || ch == '\n' || ch == '\r') {
                if (save) {
                    std::error_code ec;
                    std::filesystem::create_directories(config_path.parent_path(), ec);
                    if (!config.SaveToFile(config_path)) {
                        std::cerr << "Warning: failed to save config to " << config_path << "\n";
                    }
                }
                break;
            }
        }
    }
    return 0;
}
}

int main(int argc, char* argv[]) {
    // Ctrl-C or SIGTERM leave the loop so the terminal is restored.
    InstallInterruptHandlers();

    CommandLine cli;
    ConverterConfig overrides;
    std::string out_dir_override;

    static const struct option long_options[] = {
        {"self-test", no_argument, nullptr, 'S'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "r:ng:f:ltdDpbo:c:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'r': overrides.SetString(config_keys::kSampleRate, optarg); break;
            case 'n': overrides.SetBool(config_keys::kNormalize, true); break;
            case 'g': overrides.SetString(config_keys::kGainDb, optarg); break;
            case 'f': overrides.SetString(config_keys::kLpfCutoffHz, optarg); break;
            case 'l': overrides.SetBool(config_keys::kAmigaLpf, true); break;
            case 't': overrides.SetBool(config_keys::kTrimSilence, true); break;
            case 'd': overrides.SetBool(config_keys::kDither, true); break;
            case 'D': overrides.SetBool(config_keys::kDither, false); break;
            case 'p': cli.preview = true; break;
            case 'b': cli.batch = true; break;
            case 'o': out_dir_override = optarg; break;
            case 'c': cli.config_path = optarg; break;
            case 'S': cli.self_test = true; break;
            case 'h':
                PrintUsage(std::cout);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }
    for (int i = optind; i < argc; ++i) {
        cli.inputs.push_back(argv[i]);
    }

    if (cli.self_test) {
        try {
            return RunSelfTest();
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 255;
        }
    }

    // Load converter configuration if present.
    ConverterConfig config;
    if (!config.LoadFromFile(cli.config_path)) {
        std::cerr << "Warning: could not load config from " << cli.config_path << "; using defaults.\n";
    }
    for (const char* key : {config_keys::kSampleRate, config_keys::kNormalize, config_keys::kGainDb,
                            config_keys::kLpfCutoffHz, config_keys::kAmigaLpf, config_keys::kTrimSilence,
                            config_keys::kDither}) {
        if (overrides.Has(key)) {
            config.SetString(key, overrides.GetString(key, ""));
        }
    }

    try {
        const ConversionOptions options = OptionsFromConfig(config);

        if (cli.inputs.empty()) {
            if (cli.preview || cli.batch) {
                std::cerr << "Error: No input file(s) specified. Use -h for help.\n";
                return 1;
            }
            return RunInteractive(config, options, cli.config_path);
        }
        cli.batch = IsBatchInvocation(cli.batch, cli.inputs.size());

        if (std::optional<std::string> advisory = SampleRateAdvisory(options.target_rate)) {
            std::cerr << "Warning: " << *advisory << "\n";
        }

        LibavEngine engine;
        SvxConverter converter(engine, options);
        if (cli.preview) {
            return RunPreview(converter, cli);
        }
        if (cli.batch) {
            std::string out_dir = out_dir_override.empty()
                ? config.GetString(config_keys::kOutputFolder, kDefaultOutputFolder)
                : out_dir_override;
            if (out_dir.empty()) {
                out_dir = kDefaultOutputFolder;
            }
            return RunBatch(converter, cli, out_dir);
        }
        return RunSingle(converter, cli);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
