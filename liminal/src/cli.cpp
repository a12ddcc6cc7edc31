// liminal: drive the conversational-quality pipeline over scripted turns
//
// Usage: liminal [command] [options]
//
// Commands:
//   run        Run the pipeline over the turns (default)
//   config     Print the effective configuration as JSON
//   keys       List every setting with its environment variable
//   help       Show this help

#include <liminal/alerts.hpp>
#include <liminal/config.hpp>
#include <liminal/dialog.hpp>
#include <liminal/guard.hpp>
#include <liminal/log.hpp>
#include <liminal/pipeline.hpp>
#include <liminal/session.hpp>
#include <liminal/version.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace liminal;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Settings that take no value on the command line
static const std::set<std::string>& switch_keys() {
    static const std::set<std::string> keys = {
        "verbose", "status", "log", "alarm", "strict", "guard",
        "stabilizer", "sync", "awareness", "compassion", "silence"
    };
    return keys;
}

// "--stab-alpha" -> "stab_alpha"
static std::string flag_to_key(const char* flag) {
    std::string key(flag);
    for (auto& c : key) {
        if (c == '-') c = '_';
    }
    return key;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "liminal " << LIMINAL_VERSION << " - Conversational-quality controller\n\n"
              << "Usage: " << name << " [command] [options]\n\n"
              << "Commands:\n"
              << "  run                Run the pipeline over the turns (default)\n"
              << "  config             Print the effective configuration as JSON\n"
              << "  keys               List settings and their environment variables\n"
              << "  help               Show this help\n\n"
              << "Turns:\n"
              << "  --inputs FILE      JSONL turns (string or object per line)\n"
              << "  --script \"a;b\"     Semicolon separated utterances\n"
              << "  --cycles N         Minimum number of turns (default: 5)\n\n"
              << "Layers (all on by default):\n"
              << "  --no-stabilizer    --no-sync    --no-awareness\n"
              << "  --no-compassion    --no-silence --no-guard    --no-alarm\n\n"
              << "Options:\n"
              << "  --config PATH      JSON config file (or LIMINAL_CONFIG)\n"
              << "  --log              Write a JSONL session log\n"
              << "  --log-dir DIR      Session log directory (default: logs)\n"
              << "  --strict           Exit 2 if any turn breaches the baselines\n"
              << "  --no-status        Hide per-layer status lines\n"
              << "  --<setting> VALUE  Any setting listed by 'keys'\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

int cmd_keys() {
    for (const auto& key : config_keys()) {
        std::cout << "  " << key;
        for (size_t i = key.size(); i < 16; ++i) std::cout << ' ';
        std::cout << env_name(key) << "\n";
    }
    return 0;
}

int cmd_config(const Config& cfg) {
    std::cout << config_to_json(cfg).dump(2) << "\n";
    return 0;
}

int cmd_run(const Config& cfg) {
    std::vector<Signal> turns = load_turns(cfg);
    log_debug("cli", "%zu turns", turns.size());

    Pipeline pipeline = Pipeline::from_config(cfg);

    GuardConfig guard_cfg;
    guard_cfg.drift_limit = cfg.guard_drift;
    guard_cfg.res_limit = cfg.guard_res;

    SessionLog session;
    if (cfg.enable_logging && !session.open(cfg.log_dir)) {
        log_warn("cli", "continuing without a session log");
    }

    AlertStats stats;
    std::vector<float> drift_history;
    std::vector<float> resonance_history;
    drift_history.reserve(turns.size());
    resonance_history.reserve(turns.size());

    for (size_t idx = 0; idx < turns.size(); ++idx) {
        Signal signal = turns[idx].sanitized();
        Adjustments adj = pipeline.run_turn(signal);

        if (cfg.show_status) {
            for (const auto& line : pipeline.status_lines()) {
                std::cout << line << "\n";
            }
        }

        GuardAction guard;
        if (cfg.guard) {
            guard = check_guard(signal.text, adj.drift, adj.resonance, guard_cfg);
            if (guard.kind == GuardAction::Kind::Warn) {
                std::cout << guard.text << "\n";
            } else if (guard.rephrased()) {
                std::cout << "[voice-core] " << guard.text << "\n";
            }
            pipeline.note_rephrased(guard.rephrased());
        }

        char buf[160];
        snprintf(buf, sizeof(buf), "[turn %zu] pace=%.2f pause=%lldms drift=%.2f res=%.2f",
                 idx, adj.pace, static_cast<long long>(adj.pause_ms), adj.drift, adj.resonance);
        std::cout << buf << "\n";

        drift_history.push_back(adj.drift);
        resonance_history.push_back(adj.resonance);
        stats.update(adj.drift, adj.resonance, cfg.baseline_drift, cfg.baseline_res);

        if (session.is_open() && !session.write(turn_record(idx, signal, adj, guard, pipeline))) {
            log_warn("cli", "session log stopped at turn %zu", idx);
            session.close();
        }
    }

    pipeline.finish();
    session.close();

    std::cout << "[viz] resonance  " << sparkline(resonance_history) << "\n";
    std::cout << "[viz] drift      " << sparkline(drift_history) << "\n";

    if (const auto* silence = pipeline.silence()) {
        std::cout << "[silence] episodes=" << silence->silence_count
                  << " total=" << silence->total_silence_time << "s"
                  << " max=" << silence->max_silence_duration << "s"
                  << " avg_quality=" << silence->avg_silence_quality << "\n";
    }

    if (const auto* sync = pipeline.sync()) {
        auto [drift_bias, res_bias] = sync->slow_increments();
        char line[96];
        snprintf(line, sizeof(line), "[sync] slow increments: drift=%.3f res=%.3f",
                 drift_bias, res_bias);
        std::cout << line << "\n";
    }

    if (cfg.alarm) {
        for (const auto& line : stats.summary_lines(cfg.baseline_drift, cfg.baseline_res)) {
            std::cout << line << "\n";
        }
    }

    if (session.records() > 0) {
        std::cout << "[log] " << session.records() << " turns -> " << session.path() << "\n";
    }

    if (cfg.strict && !stats.ok()) {
        log_error("cli", "strict mode: %zu drift and %zu resonance breaches",
                  stats.drift_breaches, stats.res_breaches);
        return 2;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::string command;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--verbose") == 0) {
            set_verbose(true);
            overrides.emplace_back("verbose", "true");
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "liminal " << LIMINAL_VERSION << "\n";
            return 0;
        } else if (strncmp(argv[i], "--no-", 5) == 0
                   && switch_keys().count(flag_to_key(argv[i] + 5))) {
            overrides.emplace_back(flag_to_key(argv[i] + 5), "false");
        } else if (strncmp(argv[i], "--", 2) == 0 && is_config_key(flag_to_key(argv[i] + 2))) {
            std::string key = flag_to_key(argv[i] + 2);
            if (switch_keys().count(key)) {
                overrides.emplace_back(key, "true");
            } else if (i + 1 < argc) {
                overrides.emplace_back(key, argv[++i]);
            } else {
                std::cerr << "Missing value for " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else {
                std::cerr << "Unexpected argument: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) command = "run";
    if (command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "keys") {
        return cmd_keys();
    }

    // defaults -> environment -> config file -> flags
    Config cfg;
    apply_env(cfg);
    if (config_path.empty()) {
        if (const char* env_path = std::getenv("LIMINAL_CONFIG")) config_path = env_path;
    }
    if (!config_path.empty()) {
        load_config_file(cfg, config_path);
    }
    for (const auto& [key, value] : overrides) {
        set_option(cfg, key, value, "cli");
    }
    set_verbose(cfg.verbose);

    if (command == "config") {
        return cmd_config(cfg);
    }
    if (command == "run") {
        return cmd_run(cfg);
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
