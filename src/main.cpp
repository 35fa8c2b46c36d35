// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 OpenFixture Contributors
 *
 * This file is part of OpenFixture, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "ansi_colors.h"
#include "board_json_reader.h"
#include "fixture_config.h"
#include "fixture_coordinate_transform.h"
#include "fixture_generator.h"
#include "kicad_board_reader.h"
#include "logging_init.h"
#include "openscad_runner.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace openfixture;

namespace {

struct CliOptions {
    std::string board_path;
    std::string output_dir; ///< Empty: fixture-<revision>
    std::string config_path;
    std::string params_json_path;
    std::vector<std::pair<std::string, std::string>> settings; ///< Applied after the config file
    bool run_openscad = false;
    bool testcut = false;
    bool dry_run = false;
    bool use_colors = true;
    int verbosity = 0;
    logging::LogTarget log_target = logging::LogTarget::Console;
    std::string log_file;
};

// Flags that take a value and map straight onto a FixtureConfig key
struct ValueFlag {
    const char* flag;
    const char* key;
};

const ValueFlag VALUE_FLAGS[] = {
    {"--mat_th", "mat_th"},
    {"--pcb_th", "pcb_th"},
    {"--screw_len", "screw_len"},
    {"--screw_d", "screw_d"},
    {"--washer_th", "washer_th"},
    {"--nut_f2f", "nut_f2f"},
    {"--nut_c2c", "nut_c2c"},
    {"--nut_th", "nut_th"},
    {"--pivot_d", "pivot_d"},
    {"--border", "border"},
    {"--pogo-uncompressed-length", "pogo_uncompressed_length"},
    {"--rev", "rev"},
    {"--layer", "layer"},
    {"--flayer", "flayer"},
    {"--ilayer", "ilayer"},
    {"--logo", "logo"},
    {"--logo-scale", "logo_scale"},
    {"--scad", "scad"},
};

void print_usage(const char* program) {
    printf("Usage: %s --board <file.kicad_pcb|file.json> --mat_th <mm> [options]\n", program);
    printf("\nInput/output:\n");
    printf("  --board <file>          KiCad board or JSON board snapshot\n");
    printf("  --out <dir>             Output directory (default: fixture-<rev>)\n");
    printf("  --config <file>         JSON config file, overridden by flags\n");
    printf("  --params-json <file>    Write the parameter set as JSON\n");
    printf("\nBoard and material:\n");
    printf("  --mat_th <mm>           Laser-cut material thickness (required)\n");
    printf("  --pcb_th <mm>           PCB thickness (default: %.1f)\n", DEFAULT_PCB_TH);
    printf("  --rev <text>            Revision label (default: rev.<title block rev>)\n");
    printf("\nTest point selection:\n");
    printf("  --layer <L>             F.Cu, B.Cu or both (default: F.Cu)\n");
    printf("  --flayer <L>            Force layer (default: Eco2.User)\n");
    printf("  --ilayer <L>            Ignore layer (default: Eco1.User)\n");
    printf("  --smd / --no-smd        Include SMD pads (default: on)\n");
    printf("  --th / --no-th          Include through-hole pads (default: off)\n");
    printf("\nHardware:\n");
    printf("  --screw_len <mm>        Screw thread length (default: %.0f)\n", DEFAULT_SCREW_LEN);
    printf("  --screw_d <mm>          Screw diameter (default: %.1f)\n", DEFAULT_SCREW_D);
    printf("  --washer_th <mm>        Washer thickness\n");
    printf("  --nut_f2f <mm>          Nut width across flats\n");
    printf("  --nut_c2c <mm>          Nut width across corners\n");
    printf("  --nut_th <mm>           Nut thickness\n");
    printf("  --pivot_d <mm>          Pivot hole diameter\n");
    printf("  --border <mm>           PCB support ledge width\n");
    printf("  --pogo-uncompressed-length <mm>\n");
    printf("                          Pogo pin length before compression\n");
    printf("  --logo <file>           Logo drawing engraved into the head\n");
    printf("  --logo-scale <f>        Logo scale factor\n");
    printf("\nGeometry tool:\n");
    printf("  --scad <file>           Fixture model (default: %s)\n", DEFAULT_SCAD_FILE);
    printf("  --run-openscad          Render the 3D preview and laser-cut layout\n");
    printf("  --testcut               Also render the material test piece\n");
    printf("  --dry-run               Print the OpenSCAD commands instead of running them\n");
    printf("\nLogging:\n");
    printf("  -v, -vv, -vvv           More log output (info, debug, trace)\n");
    printf("  --log-target <t>        auto, syslog, file or console (default: console)\n");
    printf("  --log-file <file>       Log file for the file target\n");
    printf("  --no-color              Disable colored output\n");
    printf("  -h, --help              Show this help\n");
}

/**
 * @brief Parse argv into options
 * @return 0 to continue, otherwise the process exit code (help or error)
 */
int parse_args(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        auto next_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: %s requires a value\n", arg);
                return false;
            }
            out = argv[++i];
            return true;
        };

        bool matched = false;
        for (const auto& vf : VALUE_FLAGS) {
            if (strcmp(arg, vf.flag) == 0) {
                std::string value;
                if (!next_value(value)) {
                    return 1;
                }
                opts.settings.emplace_back(vf.key, value);
                matched = true;
                break;
            }
        }
        if (matched) {
            continue;
        }

        if (strcmp(arg, "--board") == 0) {
            if (!next_value(opts.board_path)) {
                return 1;
            }
        } else if (strcmp(arg, "--out") == 0) {
            if (!next_value(opts.output_dir)) {
                return 1;
            }
        } else if (strcmp(arg, "--config") == 0) {
            if (!next_value(opts.config_path)) {
                return 1;
            }
        } else if (strcmp(arg, "--params-json") == 0) {
            if (!next_value(opts.params_json_path)) {
                return 1;
            }
        } else if (strcmp(arg, "--log-target") == 0) {
            std::string target;
            if (!next_value(target)) {
                return 1;
            }
            opts.log_target = logging::parse_log_target(target);
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!next_value(opts.log_file)) {
                return 1;
            }
        } else if (strcmp(arg, "--smd") == 0) {
            opts.settings.emplace_back("smd", "true");
        } else if (strcmp(arg, "--no-smd") == 0) {
            opts.settings.emplace_back("smd", "false");
        } else if (strcmp(arg, "--th") == 0) {
            opts.settings.emplace_back("th", "true");
        } else if (strcmp(arg, "--no-th") == 0) {
            opts.settings.emplace_back("th", "false");
        } else if (strcmp(arg, "--run-openscad") == 0) {
            opts.run_openscad = true;
        } else if (strcmp(arg, "--testcut") == 0) {
            opts.testcut = true;
        } else if (strcmp(arg, "--dry-run") == 0) {
            opts.dry_run = true;
        } else if (strcmp(arg, "--no-color") == 0 || strcmp(arg, "--no-colour") == 0) {
            opts.use_colors = false;
        } else if (strcmp(arg, "-v") == 0) {
            opts.verbosity += 1;
        } else if (strcmp(arg, "-vv") == 0) {
            opts.verbosity += 2;
        } else if (strcmp(arg, "-vvv") == 0) {
            opts.verbosity += 3;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return -1;
        } else {
            fprintf(stderr, "Error: unknown option '%s'\n", arg);
            fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
            return 1;
        }
    }

    if (opts.board_path.empty()) {
        fprintf(stderr, "Error: --board is required\n");
        return 1;
    }
    return 0;
}

std::unique_ptr<IBoardSnapshot> load_board(const std::string& path, std::string& error) {
    if (std::filesystem::path(path).extension() == ".json") {
        return BoardJsonReader::load(path, error);
    }
    return KicadBoardSnapshot::load(path, error);
}

void print_section(const ansi::Painter& paint, const std::string& title) {
    printf("\n%s\n", paint.section("┌─ " + title).c_str());
}

void print_kv(const ansi::Painter& paint, const std::string& key, const std::string& value) {
    char padded[64];
    snprintf(padded, sizeof(padded), "%-22s", key.c_str());
    printf("  %s: %s\n", paint.key(padded).c_str(), paint.value(value).c_str());
}

std::string format_point(const glm::dvec2& p) {
    return "(" + transform::format_fixed2(p.x) + ", " + transform::format_fixed2(p.y) + ")";
}

void print_summary(const ansi::Painter& paint, const IBoardSnapshot& board,
                   const GenerationResult& result, const std::string& output_dir) {
    const FixtureGeometry& geometry = result.geometry;

    print_section(paint, "Board");
    print_kv(paint, "Name", board.name());
    print_kv(paint, "Revision", result.revision);
    print_kv(paint, "Origin", format_point(geometry.origin));
    print_kv(paint, "Dimensions", transform::format_fixed2(geometry.dimensions.x) + " x " +
                                      transform::format_fixed2(geometry.dimensions.y) + " mm");

    print_section(paint, "Test points");
    print_kv(paint, "Count", std::to_string(geometry.test_points.size()));
    if (geometry.dual_sided) {
        print_kv(paint, "Top", std::to_string(geometry.test_points_top.size()));
        print_kv(paint, "Bottom", std::to_string(geometry.test_points_bottom.size()));
    }
    print_kv(paint, "Minimum Y", transform::format_fixed2(geometry.min_y));

    if (!result.diagnostics.empty()) {
        print_section(paint, "Diagnostics");
        for (const auto& d : result.diagnostics) {
            std::string tag = std::string("[") + diagnostic_kind_name(d.kind) + "]";
            std::string line = d.severity == DiagnosticSeverity::Error ? paint.error(tag)
                                                                       : paint.warning(tag);
            printf("  %s %s\n", line.c_str(), d.message.c_str());
        }
    }

    print_section(paint, "Output");
    print_kv(paint, "Directory", output_dir);
    print_kv(paint, "Outline drawing", result.paths.outline);
    if (geometry.dual_sided) {
        print_kv(paint, "Top track drawing", result.paths.track_top);
        print_kv(paint, "Bottom track drawing", result.paths.track_bottom);
    } else {
        print_kv(paint, "Track drawing", result.paths.track);
    }
    print_kv(paint, "Parameters", std::to_string(result.parameters.size()));
}

bool write_params_json(const std::string& path, const GenerationResult& result) {
    std::ofstream out(path);
    if (!out.is_open()) {
        spdlog::error("[main] Cannot write {}", path);
        return false;
    }
    out << result.parameters.to_json().dump(2) << "\n";
    spdlog::info("[main] Wrote parameters to {}", path);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    opts.use_colors = ansi::is_tty();

    int parse_status = parse_args(argc, argv, opts);
    if (parse_status != 0) {
        return parse_status < 0 ? 0 : 1;
    }

    logging::LogConfig log_config;
    log_config.level = logging::level_for_verbosity(opts.verbosity);
    log_config.color = opts.use_colors;
    log_config.target = opts.log_target;
    log_config.file_path = opts.log_file;
    logging::init(log_config);

    ansi::Painter paint(opts.use_colors);

    // Configuration: defaults, then config file, then flags
    FixtureConfig config;
    if (!opts.config_path.empty()) {
        std::string error;
        if (!config.load_file(opts.config_path, error)) {
            fprintf(stderr, "%s %s\n", paint.error("Invalid configuration:").c_str(),
                    error.c_str());
            return 1;
        }
    }
    for (const auto& [key, value] : opts.settings) {
        try {
            config.set(key, value);
        } catch (const ConfigError& e) {
            fprintf(stderr, "%s %s\n", paint.error("Invalid configuration:").c_str(), e.what());
            return 1;
        }
    }

    std::string error;
    std::unique_ptr<IBoardSnapshot> board = load_board(opts.board_path, error);
    if (!board) {
        fprintf(stderr, "%s %s\n", paint.error("Cannot load board:").c_str(), error.c_str());
        return 1;
    }

    std::string output_dir = opts.output_dir;
    if (output_dir.empty()) {
        output_dir = "fixture-" +
                     ParameterAssembler::resolve_revision(config, board->title_revision());
    }

    FixtureGenerator generator(*board, config);
    GenerationResult result = generator.generate(output_dir);

    if (!result.succeeded()) {
        if (result.failure == FailureKind::NoTestPointsFound) {
            fprintf(stderr, "%s\n", paint.warning("WARNING, ABORTING: No test points found!").c_str());
            fprintf(stderr, "%s\n", result.failure_reason.c_str());
            fprintf(stderr, "Verify that the board has test points specified or use the "
                            "--flayer option to force test points\n");
        } else {
            fprintf(stderr, "%s %s\n",
                    paint.error(std::string(failure_kind_name(result.failure)) + ":").c_str(),
                    result.failure_reason.c_str());
        }
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec) {
        fprintf(stderr, "%s %s: %s\n", paint.error("Cannot create output directory").c_str(),
                output_dir.c_str(), ec.message().c_str());
        return 1;
    }

    print_summary(paint, *board, result, output_dir);

    if (!opts.params_json_path.empty() && !write_params_json(opts.params_json_path, result)) {
        return 1;
    }

    if (opts.run_openscad || opts.dry_run) {
        std::vector<RenderMode> modes;
        if (opts.testcut) {
            modes.push_back(RenderMode::TestCut);
        }
        modes.push_back(RenderMode::Model3d);
        modes.push_back(RenderMode::LaserCut);

        OpenScadRunner runner;
        runner.set_dry_run(opts.dry_run);
        if (opts.dry_run) {
            print_section(paint, "OpenSCAD commands");
        } else {
            printf("\nGenerating fixture...\n");
        }
        if (!runner.render(result.parameters, modes, config.scad_file, output_dir,
                           board->name())) {
            fprintf(stderr, "%s\n", paint.error("OpenSCAD failed").c_str());
            return 1;
        }
        if (!opts.dry_run) {
            printf("%s %s\n", paint.success("Fixture generated in").c_str(), output_dir.c_str());
        }
    }

    return 0;
}
