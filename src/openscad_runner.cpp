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

#include "openscad_runner.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace openfixture {

const char* render_mode_name(RenderMode mode) {
    switch (mode) {
    case RenderMode::Model3d:
        return "3dmodel";
    case RenderMode::LaserCut:
        return "lasercut";
    case RenderMode::TestCut:
        return "testcut";
    }
    return "unknown";
}

OpenScadRunner::OpenScadRunner(std::string executable) : executable_(std::move(executable)) {}

std::string OpenScadRunner::output_file(RenderMode mode, const std::string& output_dir,
                                        const std::string& board_name) {
    const char* suffix = "-fixture.dxf";
    if (mode == RenderMode::Model3d) {
        suffix = "-fixture.png";
    } else if (mode == RenderMode::TestCut) {
        suffix = "-test.dxf";
    }
    return (std::filesystem::path(output_dir) / (board_name + suffix)).string();
}

std::vector<std::string> OpenScadRunner::build_command(const FixtureParameters& params,
                                                       RenderMode mode,
                                                       const std::string& scad_file,
                                                       const std::string& output_file) const {
    std::vector<std::string> argv{executable_};
    for (auto& arg : params.to_openscad_args()) {
        argv.push_back(std::move(arg));
    }
    argv.emplace_back("-D");
    argv.push_back(std::string("mode=") + quote_string(render_mode_name(mode)));
    if (mode == RenderMode::Model3d) {
        argv.emplace_back("--render");
    }
    argv.emplace_back("-o");
    argv.push_back(output_file);
    argv.push_back(scad_file);
    return argv;
}

std::string OpenScadRunner::format_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.find_first_of(" \t\"'[]$\\") == std::string::npos) {
            line += arg;
            continue;
        }
        line += '\'';
        for (char c : arg) {
            if (c == '\'') {
                line += "'\\''";
            } else {
                line += c;
            }
        }
        line += '\'';
    }
    return line;
}

int OpenScadRunner::run(const std::vector<std::string>& argv) const {
    if (argv.empty()) {
        return -1;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("[OpenScadRunner] Fork failed: {}", strerror(errno));
        return -1;
    }

    if (pid == 0) {
        execvp(c_argv[0], c_argv.data());
        // Only reached if exec failed
        std::fprintf(stderr, "execvp %s failed: %s\n", c_argv[0], strerror(errno));
        _exit(127);
    }

    spdlog::debug("[OpenScadRunner] Started {} (PID {})", argv[0], pid);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[OpenScadRunner] waitpid failed: {}", strerror(errno));
            return -1;
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    spdlog::error("[OpenScadRunner] {} terminated by signal {}", argv[0],
                  WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    return -1;
}

bool OpenScadRunner::render(const FixtureParameters& params, const std::vector<RenderMode>& modes,
                            const std::string& scad_file, const std::string& output_dir,
                            const std::string& board_name) const {
    for (RenderMode mode : modes) {
        std::string output = output_file(mode, output_dir, board_name);
        std::vector<std::string> argv = build_command(params, mode, scad_file, output);

        if (dry_run_) {
            std::printf("%s\n", format_command(argv).c_str());
            continue;
        }

        spdlog::info("[OpenScadRunner] Rendering {} -> {}", render_mode_name(mode), output);
        spdlog::debug("[OpenScadRunner] {}", format_command(argv));

        int status = run(argv);
        if (status != 0) {
            spdlog::error("[OpenScadRunner] {} render failed (exit status {})",
                          render_mode_name(mode), status);
            return false;
        }
    }
    return true;
}

} // namespace openfixture
