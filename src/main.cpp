/*
 * Tilt Bridge - Main Entry Point
 * Validates configuration, opens transports, runs bias calibration,
 * then streams 10Hz command frames until SIGINT/SIGTERM
 *
 * Usage: tilt_bridge [serial-device|-] < notification-dump
 */

#include "config.h"
#include "types.h"

#include "drivers/hex_notify_source.hpp"
#include "drivers/serial_transport.hpp"
#include "logic/bridge_config.hpp"
#include "logic/bridge_core.hpp"
#include "logic/frame_codec.hpp"
#include "logic/frame_emitter.hpp"
#include "logic/tick_scheduler.hpp"
#include "utils/mono_clock.hpp"
#include "utils/stdio_reporter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>

#include <unistd.h>

static constexpr int EXIT_CALIBRATION_FAILED = 1;
static constexpr int EXIT_CONFIG_INVALID = 2;
static constexpr int EXIT_TRANSPORT_FAILED = 3;

static std::atomic_bool shutdown_requested{false};

static void on_shutdown_signal(int) {
    shutdown_requested.store(true);
}

static void install_signal_handlers() {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_shutdown_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    /* A closed pipe must surface as a failed write, not kill the process */
    signal(SIGPIPE, SIG_IGN);
}

/* Sleep in short steps so a shutdown request is seen promptly */
static void sleep_interruptible(uint32_t ms) {
    uint32_t start = mono_now_ms();
    while (!shutdown_requested.load() && (mono_now_ms() - start) < ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

static void print_heartbeat(const Bridge_Core &core, const Frame_Emitter &emitter,
                            const Tick_Scheduler &scheduler,
                            const Hex_Notify_Source &source) {
    CommandPair cmd = core.latest_command();
    IngestStats rx = core.stats();
    EmitterStats tx = emitter.get_stats();
    TickStats ticks = scheduler.get_stats();
    SourceStats src = source.get_stats();

    fprintf(stderr,
            "[heartbeat] uptime=%lu ms  cmd=(%.2f, %.2f)  phase=%s  "
            "tx=%lu fail=%lu  rx=%lu applied=%lu nonfinite=%lu bad_lines=%lu  "
            "ticks=%lu missed=%lu  jitter=%lu/%lu/%lu us\n",
            static_cast<unsigned long>(mono_now_ms()),
            static_cast<double>(cmd.throttle),
            static_cast<double>(cmd.steer),
            conditioner_phase_name(core.phase()),
            static_cast<unsigned long>(tx.frames_sent),
            static_cast<unsigned long>(tx.write_failures),
            static_cast<unsigned long>(rx.received),
            static_cast<unsigned long>(rx.applied),
            static_cast<unsigned long>(rx.non_finite),
            static_cast<unsigned long>(src.malformed),
            static_cast<unsigned long>(ticks.ticks),
            static_cast<unsigned long>(ticks.missed),
            static_cast<unsigned long>(ticks.jitter.min_us == UINT32_MAX ? 0U : ticks.jitter.min_us),
            static_cast<unsigned long>(ticks.jitter.last_us),
            static_cast<unsigned long>(ticks.jitter.max_us));
    fflush(stderr);
}

int main(int argc, char **argv) {
    const char *device = (argc > 1) ? argv[1] : "-";

    install_signal_handlers();
    (void)mono_now_ms();   /* Pin the process epoch */

    fprintf(stderr, "\n========================================\n");
    fprintf(stderr, "Tilt Bridge\n");
    fprintf(stderr, "Build: %s %s\n", __DATE__, __TIME__);
    fprintf(stderr, "Output: %s  Tick: %u ms\n", device, BRIDGE_TICK_PERIOD_MS);
    fprintf(stderr, "========================================\n\n");

    Stdio_Reporter reporter;

    /* Configuration - fatal before anything is opened */
    BridgeConfig cfg = bridge_config_defaults();
    char reason[96];
    if (bridge_config_validate(cfg, reason, sizeof(reason)) != BridgeError::None) {
        reporter.show_error("Config", reason, StatusSeverity::Fatal);
        return EXIT_CONFIG_INVALID;
    }
    {
        char summary[128];
        snprintf(summary, sizeof(summary),
                 "x_scale=%.1f z_scale=%.1f deadzone=%.2f expo=%.2f invert_x=%d invert_z=%d",
                 static_cast<double>(cfg.x_scale), static_cast<double>(cfg.z_scale),
                 static_cast<double>(cfg.deadzone), static_cast<double>(cfg.expo),
                 cfg.invert_x ? 1 : 0, cfg.invert_z ? 1 : 0);
        reporter.show_status("Config", summary);
    }

    /* The actuator must read our neutral frame as (0, 0) */
    {
        char line[FRAME_MAX_LEN];
        size_t len = frame_encode(NEUTRAL_COMMAND, line, sizeof(line));
        CommandPair back = {1.0f, 1.0f};
        if (len == 0 || !frame_decode(line, len, &back) ||
            back.throttle != 0.0f || back.steer != 0.0f) {
            reporter.show_error("Frame", "Neutral frame self-check failed", StatusSeverity::Fatal);
            return EXIT_CONFIG_INVALID;
        }
    }

    /* Transports */
    static Serial_Transport transport;
    if (!transport.init(device)) {
        reporter.show_error("TX", "Transport open FAILED", StatusSeverity::Fatal);
        return EXIT_TRANSPORT_FAILED;
    }
    reporter.show_status("TX", "Transport open");

    static Bridge_Core core(cfg);
    static Hex_Notify_Source source(STDIN_FILENO);
    bool src_ok = source.start([](const RawSample &s) {
        core.on_sample(s, mono_now_ms());
    });
    if (!src_ok) {
        reporter.show_error("RX", "Notification source start FAILED", StatusSeverity::Fatal);
        return EXIT_TRANSPORT_FAILED;
    }
    reporter.show_status("RX", "Listening for IMU notifications on stdin");

    /* Boot calibration - bounded by the window, never by sample count */
    sleep_interruptible(CALIB_SETTLE_MS);
    reporter.show_status("Cal", "Hold the sensor still...");
    core.begin_calibration(mono_now_ms());
    if (shutdown_requested.load() ||
        bridge_wait_calibration(core, shutdown_requested) == CalibrationWait::Interrupted) {
        /* A partial window is not a bias; leave without sending anything */
        reporter.show_status("Cal", "Interrupted before the window closed");
        source.stop();
        transport.deinit();
        return 0;
    }

    CalibrationResult cal = core.finish_calibration();
    if (!cal.ok()) {
        reporter.show_error("Cal", cal.error_msg, StatusSeverity::Fatal);
        source.stop();
        transport.deinit();
        return EXIT_CALIBRATION_FAILED;
    }
    {
        char buf[96];
        snprintf(buf, sizeof(buf), "Bias: roll=%.1f pitch=%.1f (%lu samples)",
                 static_cast<double>(cal.bias.roll_bias),
                 static_cast<double>(cal.bias.pitch_bias),
                 static_cast<unsigned long>(cal.sample_count));
        reporter.show_status("Cal", buf);
    }

    /* Emission */
    static Frame_Emitter emitter(transport, reporter);
    static Tick_Scheduler scheduler(BRIDGE_TICK_PERIOD_MS);
    bool tick_ok = scheduler.start([](uint32_t, uint32_t now_ms) {
        (void)emitter.emit(core.latest_command(), now_ms);
    });
    if (!tick_ok) {
        reporter.show_error("Sys", "Tick scheduler start FAILED", StatusSeverity::Fatal);
        source.stop();
        transport.deinit();
        return EXIT_TRANSPORT_FAILED;
    }
    reporter.show_status("Sys", "Streaming commands at 10Hz. Ctrl+C to quit.");

    uint32_t last_heartbeat = mono_now_ms();
    bool eof_reported = false;

    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(BRIDGE_MAIN_LOOP_SLEEP_MS));

        if (!eof_reported && source.get_stats().eof) {
            reporter.show_error("RX", "Notification input closed - holding last command",
                                StatusSeverity::Warning);
            eof_reported = true;
        }

        uint32_t now = mono_now_ms();
        if ((now - last_heartbeat) >= BRIDGE_HEARTBEAT_INTERVAL_MS) {
            print_heartbeat(core, emitter, scheduler, source);
            last_heartbeat = now;
        }
    }

    /* Whole pipeline comes down together */
    reporter.show_status("Sys", "Shutting down");
    scheduler.stop();
    source.stop();
    print_heartbeat(core, emitter, scheduler, source);
    transport.deinit();
    return 0;
}
