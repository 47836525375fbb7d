// =============================================================================
// PrinterHub Simulator - Main Entry Point
// =============================================================================
// Runs the engine against three simulated printers in real time:
//   - a legacy Adventurer 3 (single channel, concurrency 1)
//   - an Adventurer 5M Pro (dual protocol, built-in camera)
//   - an AD5X (dual protocol + material station)
// and cycles the active context so the polling cadence visibly follows it.
//
// Usage: printerhub_sim [--config path] [--duration-ms N] [--switch-ms N] [--log-level L]
// =============================================================================

#include "config_loader.hpp"
#include "printer_hub.hpp"
#include "printerhub_log.hpp"
#include "scheduler.hpp"
#include "sim_printer.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

using namespace printerhub;

namespace {

struct SimOptions {
    std::string config_path = "printerhub.json";
    int duration_ms = 20000;
    int switch_ms = 6000;
    std::string log_level;      // overrides config when set
};

void usage(const char* argv0) {
    std::fprintf(stderr,
                 "usage: %s [--config path] [--duration-ms N] [--switch-ms N] [--log-level L]\n",
                 argv0);
}

bool parseArgs(int argc, char* argv[], SimOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "--config") == 0 && has_value) {
            opts.config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--duration-ms") == 0 && has_value) {
            opts.duration_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--switch-ms") == 0 && has_value) {
            opts.switch_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log-level") == 0 && has_value) {
            opts.log_level = argv[++i];
        } else {
            return false;
        }
    }
    return opts.duration_ms > 0 && opts.switch_ms > 0;
}

DeviceDetails makeDevice(const char* name, const char* ip, const char* serial, const char* model,
                         bool camera) {
    DeviceDetails d;
    d.name = name;
    d.ip_address = ip;
    d.serial_number = serial;
    d.model = model;
    d.client_type = std::strstr(model, "5M") || std::strstr(model, "AD5X") ? "new" : "legacy";
    d.has_camera = camera;
    return d;
}

void describeCompletion(const std::string& what, const Result<void>& r) {
    if (r.is_ok()) PHLOG_INFO("sim", "%s: ok", what.c_str());
    else PHLOG_WARN("sim", "%s: %s", what.c_str(), r.error().describe().c_str());
}

} // namespace

int main(int argc, char* argv[]) {
    SimOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        usage(argv[0]);
        return 2;
    }

    auto loaded = config::loadConfig(opts.config_path);
    if (loaded.is_err()) {
        std::fprintf(stderr, "config: %s\n", loaded.error().describe().c_str());
        return 1;
    }
    config::EngineConfig cfg = loaded.value();
    if (!opts.log_level.empty()) cfg.log.level = opts.log_level;

    log::setLogLevel(log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        PHLOG_WARN("sim", "Cannot open log file %s", cfg.log.log_path.c_str());
    }
    PHLOG_INFO("sim", "PrinterHub simulator starting (%d ms)", opts.duration_ms);

    Scheduler scheduler(Scheduler::Mode::RealTime);

    sim::SimulatedClientFactory factory(scheduler);
    const std::vector<DeviceDetails> devices = {
        makeDevice("Workshop A3", "192.168.1.40", "", "FlashForge Adventurer 3", false),
        makeDevice("Office 5M Pro", "192.168.1.50", "SNMOMC9900101", "Adventurer 5M Pro", true),
        makeDevice("Lab AD5X", "192.168.1.60", "SNAD5X0000042", "AD5X", false),
    };
    factory.addPrinter(devices[0]);
    factory.addPrinter(devices[1]);
    factory.addPrinter(devices[2], true);

    PrinterHub& engine = hub();
    auto init = engine.initialize(cfg, scheduler, factory);
    if (init.is_err()) {
        PHLOG_FATAL("sim", "%s", init.error().describe().c_str());
        return 1;
    }

    auto data_sub = engine.events().subscribe<PollingDataEvent>([](const PollingDataEvent& e) {
        const auto& s = e.status;
        PHLOG_INFO("sim", "%s%s %s bed %.0f/%.0f nozzle %.0f/%.0f%s", e.context_id.c_str(),
                   e.cached ? " (cached)" : "", machineStateName(s.state),
                   s.bed.current, s.bed.target, s.extruder.current, s.extruder.target,
                   s.job ? (" " + s.job->file_name + " " + std::to_string((int)s.job->percentage) + "%").c_str() : "");
    });
    auto error_sub = engine.events().subscribe<PollingErrorEvent>([](const PollingErrorEvent& e) {
        PHLOG_WARN("sim", "%s polling error after %d attempt(s): %s",
                   e.context_id.c_str(), e.attempts, e.error.c_str());
    });
    auto switch_sub = engine.events().subscribe<ContextSwitchedEvent>([](const ContextSwitchedEvent& e) {
        PHLOG_INFO("sim", "Active context is now %s", e.context_id.c_str());
    });

    std::vector<std::string> ids;
    for (const auto& device : devices) {
        auto created = engine.createContext(device);
        if (created.is_err()) {
            PHLOG_ERROR("sim", "%s: %s", device.name.c_str(), created.error().describe().c_str());
            continue;
        }
        ids.push_back(created.value());
    }
    if (ids.empty()) {
        engine.shutdown();
        return 1;
    }

    for (const auto& info : engine.listContexts()) {
        nlohmann::json j = info;
        PHLOG_INFO("sim", "%s", j.dump().c_str());
    }

    // Start a job on every printer; the AD5X one uses the material station
    for (const auto& id : ids) {
        JobStartParams job;
        job.file_name = "benchy.gcode";
        auto caps = engine.getCapabilities(id);
        if (caps.is_ok() && caps.value().features.material_station) {
            job.file_name = "benchy_4color.3mf";
            job.material_mappings = {{0, 1}, {1, 2}};
        }
        engine.startJob(job, [id](Result<void> r) { describeCompletion("start " + id, r); }, id);
        engine.getJobThumbnail(job.file_name, [id](Result<std::string> r) {
            if (r.is_ok()) PHLOG_INFO("sim", "%s thumbnail %zu bytes", id.c_str(), r.value().size());
            else PHLOG_WARN("sim", "%s thumbnail: %s", id.c_str(), r.error().describe().c_str());
        }, 0, id);
    }

    // Rotate the active context
    size_t next = 1;
    std::function<void()> rotate = [&] {
        if (!engine.initialized() || ids.empty()) return;
        const std::string& target = ids[next % ids.size()];
        next++;
        auto r = engine.switchContext(target);
        if (r.is_err()) PHLOG_WARN("sim", "switch: %s", r.error().describe().c_str());
        scheduler.schedule(Scheduler::Duration(opts.switch_ms), rotate);
    };
    scheduler.schedule(Scheduler::Duration(opts.switch_ms), rotate);
    scheduler.schedule(Scheduler::Duration(opts.duration_ms), [&] { scheduler.stop(); });

    scheduler.run();

    for (const auto& id : engine.polling().activePollingContexts()) {
        auto stats = engine.polling().getPollingStatsForContext(id);
        if (!stats) continue;
        PHLOG_INFO("sim", "%s: %llu ticks, %llu ok, %llu failed, %llu retries", id.c_str(),
                   (unsigned long long)stats->ticks, (unsigned long long)stats->successes,
                   (unsigned long long)stats->failures, (unsigned long long)stats->retries);
    }
    const auto& qs = engine.requests().stats();
    PHLOG_INFO("sim", "queue: %llu enqueued, %llu joined, %llu ok, %llu failed",
               (unsigned long long)qs.enqueued, (unsigned long long)qs.deduplicated,
               (unsigned long long)qs.succeeded, (unsigned long long)qs.failed);

    data_sub.reset();
    error_sub.reset();
    switch_sub.reset();
    engine.shutdown();
    log::closeLogFile();
    return 0;
}
