// Copyright (c) 2025 -  SwarmPlotter contributors
// Use of this source code is governed by a GPLv3 license that can be found in the LICENSE file.

// swarmplot: optimizes a toolpath and plays it on dry-run actuators.

#include "Config.h"
#include "CoordinatedExecutor.h"
#include "EmergencyTrap.h"
#include "Error.h"
#include "JobController.h"
#include "Logging.h"
#include "MotionScheduler.h"
#include "ToolpathReader.h"
#include "Machine/DryRunActuator.h"
#include "Machine/PlotterConfig.h"
#include "Optimizer/Optimizer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> interrupted { false };

static void onInterrupt(int) {
    interrupted = true;
}

static void usage() {
    std::cerr << "usage: swarmplot [-c config.json] [-v level] [-t time_scale] [-n] [-w config.json] toolpath.gcode\n"
                 "  -c  load configuration record\n"
                 "  -v  log level 0 (none) .. 5 (verbose)\n"
                 "  -t  sleep for hardware move times scaled by this factor\n"
                 "  -n  do not optimize the toolpath\n"
                 "  -w  write the effective configuration and exit\n";
}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string writePath;
    std::string toolpathPath;
    int         logLevel  = -1;
    float       timeScale = 0.0f;
    bool        optimize  = true;

    for (int i = 1; i < argc; ++i) {
        bool hasValue = i + 1 < argc;
        if (!strcmp(argv[i], "-c") && hasValue) {
            configPath = argv[++i];
        } else if (!strcmp(argv[i], "-v") && hasValue) {
            logLevel = atoi(argv[++i]);
        } else if (!strcmp(argv[i], "-t") && hasValue) {
            timeScale = float(atof(argv[++i]));
        } else if (!strcmp(argv[i], "-w") && hasValue) {
            writePath = argv[++i];
        } else if (!strcmp(argv[i], "-n")) {
            optimize = false;
        } else if (argv[i][0] != '-' && toolpathPath.empty()) {
            toolpathPath = argv[i];
        } else {
            usage();
            return 2;
        }
    }

    Machine::PlotterConfig config;
    try {
        if (!configPath.empty()) {
            config.load_file(configPath);
        }
        if (!writePath.empty()) {
            config.save_file(writePath);
            return 0;
        }
    } catch (const Error& err) {
        log_error("Configuration: " << errorString(err));
        return 1;
    }
    setMsgLevel(MsgLevel(logLevel >= MsgLevelNone && logLevel <= MsgLevelVerbose ? logLevel : config._logLevel));

    if (toolpathPath.empty()) {
        usage();
        return 2;
    }

    std::vector<Toolpath::Command> commands;
    try {
        commands = Toolpath::Reader().readFile(toolpathPath);
    } catch (const Error& err) {
        log_error("Toolpath: " << errorString(err));
        return 1;
    }
    if (optimize) {
        commands = Optimizer::optimize(commands);
    }
    log_info("Travel distance " << Optimizer::travelDistance(commands) << "mm");

    Machine::DryRunActuator xAxis("x", timeScale);
    Machine::DryRunActuator yAxis("y", timeScale);

    std::vector<std::unique_ptr<Machine::DryRunActuator>> toolActuators;
    std::vector<Machine::Actuator*>                       tools;
    for (int32_t id = 0; id < config._toolCount; ++id) {
        toolActuators.push_back(std::make_unique<Machine::DryRunActuator>("tool" + std::to_string(id), timeScale));
        tools.push_back(toolActuators.back().get());
    }

    Machine::DryRunSwitch stopSwitch("emergency_stop");
    Machine::DryRunLink   link;
    EmergencyTrap         trap(stopSwitch, link, config._stopSwitchNormallyOpen);

    MotionScheduler     scheduler(xAxis, yAxis, tools, config);
    CoordinatedExecutor executor(scheduler, trap, config);
    JobController       controller(scheduler, executor, trap, config);

    // Ctrl-C presses the emergency stop.
    std::signal(SIGINT, onInterrupt);
    std::atomic<bool> done { false };
    std::thread       watcher([&] {
        while (!done) {
            if (interrupted.exchange(false)) {
                stopSwitch.set(config._stopSwitchNormallyOpen);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });

    Error result = controller.submitJob(commands);

    done = true;
    watcher.join();

    if (result != Error::Ok) {
        log_error("Job ended: " << errorString(result) << ", controller " << stateName(controller.state()));
        return 1;
    }
    log_info("Plot complete, carriage at x " << xAxis.position() << " y " << yAxis.position() << " steps");
    return 0;
}
