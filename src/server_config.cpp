#include "server_config.h"
#include <fstream>
#include <sstream>
#include <vector>
#include "errors.h"
#include "logger.h"

using json = nlohmann::json;

namespace {

template<typename T>
void read_key(const json& j, const char* key, T& value) {
    if (j.contains(key) && !j[key].is_null()) {
        value = j[key].get<T>();
    }
}

int parse_int(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw ConfigError(flag + " expects an integer, got '" + text + "'");
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(flag + " expects an integer, got '" + text + "'");
    }
}

} // namespace

void ServerConfig::validate() const {
    LogLevel level;
    if (!parse_log_level(log_level, level)) {
        throw ConfigError("unknown log level '" + log_level + "'");
    }
    if (port == 0) {
        throw ConfigError("port must be non-zero");
    }
    const SchedulerConfig& s = session.scheduler;
    if (s.trigger_interval_ms <= 0) {
        throw ConfigError("session.trigger_interval_ms must be positive");
    }
    if (s.max_window_ms <= 0) {
        throw ConfigError("session.max_window_ms must be positive");
    }
    if (s.min_silence_ms <= 0) {
        throw ConfigError("session.min_silence_ms must be positive");
    }
    if (s.min_recognition_ms < 0) {
        throw ConfigError("session.min_recognition_ms must not be negative");
    }
    if (session.buffer_capacity_ms < s.max_window_ms) {
        throw ConfigError("session.buffer_capacity_ms must be at least session.max_window_ms");
    }
    if (session.idle_flush_ms < 0) {
        throw ConfigError("session.idle_flush_ms must not be negative");
    }
    if (session.language.empty()) {
        throw ConfigError("session.language must not be empty");
    }
    if (vad.backend != "energy" && vad.backend != "silero") {
        throw ConfigError("vad.backend must be 'energy' or 'silero'");
    }
    if (vad.energy_threshold <= 0.0f || vad.energy_threshold >= 1.0f) {
        throw ConfigError("vad.energy_threshold must be in (0, 1)");
    }
    if (vad.silero_threshold <= 0.0f || vad.silero_threshold >= 1.0f) {
        throw ConfigError("vad.silero_threshold must be in (0, 1)");
    }
    if (recognizer.threads <= 0 || recognizer.max_concurrent <= 0) {
        throw ConfigError("recognizer.threads and recognizer.max_concurrent must be positive");
    }
    if (recognizer.t2s && recognizer.opencc_config.empty()) {
        throw ConfigError("recognizer.opencc_config must be set when recognizer.t2s is on");
    }
}

void apply_config_json(const json& j, ServerConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }
    try {
        read_key(j, "host", config.host);
        read_key(j, "port", config.port);
        read_key(j, "log_level", config.log_level);

        if (j.contains("mode")) {
            std::string mode = j["mode"].get<std::string>();
            if (!parse_server_mode(mode, config.session.mode)) {
                throw ConfigError("unknown mode '" + mode + "'");
            }
        }

        if (j.contains("session")) {
            const json& s = j["session"];
            read_key(s, "language", config.session.language);
            if (s.contains("format")) {
                std::string format = s["format"].get<std::string>();
                if (!parse_audio_encoding(format, config.session.encoding)) {
                    throw ConfigError("unknown audio format '" + format + "'");
                }
            }
            read_key(s, "trigger_interval_ms", config.session.scheduler.trigger_interval_ms);
            read_key(s, "max_window_ms", config.session.scheduler.max_window_ms);
            read_key(s, "min_silence_ms", config.session.scheduler.min_silence_ms);
            read_key(s, "min_recognition_ms", config.session.scheduler.min_recognition_ms);
            read_key(s, "buffer_capacity_ms", config.session.buffer_capacity_ms);
            read_key(s, "idle_flush_ms", config.session.idle_flush_ms);
        }

        if (j.contains("vad")) {
            const json& v = j["vad"];
            read_key(v, "backend", config.vad.backend);
            read_key(v, "energy_threshold", config.vad.energy_threshold);
            read_key(v, "max_zero_crossing_rate", config.vad.max_zero_crossing_rate);
            read_key(v, "silero_model", config.vad.silero_model);
            read_key(v, "silero_threshold", config.vad.silero_threshold);
        }

        if (j.contains("recognizer")) {
            const json& r = j["recognizer"];
            read_key(r, "model", config.recognizer.model);
            read_key(r, "threads", config.recognizer.threads);
            read_key(r, "max_concurrent", config.recognizer.max_concurrent);
            read_key(r, "t2s", config.recognizer.t2s);
            read_key(r, "opencc_config", config.recognizer.opencc_config);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
}

ServerConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file " + path);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }

    ServerConfig config;
    apply_config_json(j, config);
    LOG_INFO("Loaded config from " << path);
    return config;
}

bool apply_command_line(int argc, char** argv, ServerConfig& config) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // --config 先读, 其余参数覆盖文件中的值
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw ConfigError("--config requires a value");
            }
            config = load_config_file(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        }
        if (i + 1 >= args.size()) {
            throw ConfigError("unknown or incomplete argument '" + arg + "'");
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            continue;
        } else if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            int port = parse_int(arg, value);
            if (port <= 0 || port > 65535) {
                throw ConfigError("--port out of range: " + value);
            }
            config.port = static_cast<uint16_t>(port);
        } else if (arg == "--model") {
            config.recognizer.model = value;
        } else if (arg == "--threads") {
            config.recognizer.threads = parse_int(arg, value);
        } else if (arg == "--mode") {
            if (!parse_server_mode(value, config.session.mode)) {
                throw ConfigError("unknown mode '" + value + "'");
            }
        } else if (arg == "--language") {
            config.session.language = value;
        } else if (arg == "--vad") {
            config.vad.backend = value;
        } else if (arg == "--vad-model") {
            config.vad.silero_model = value;
        } else if (arg == "--log-level") {
            config.log_level = value;
        } else {
            throw ConfigError("unknown argument '" + arg + "'");
        }
    }
    return true;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --config <file>      JSON configuration file\n"
        << "  --host <addr>        listen address (default 0.0.0.0)\n"
        << "  --port <port>        listen port (default 8765)\n"
        << "  --model <file>       whisper.cpp ggml model\n"
        << "  --threads <n>        recognizer threads per call\n"
        << "  --mode <mode>        streaming | single_shot\n"
        << "  --language <code>    default language hint (default zh)\n"
        << "  --vad <backend>      energy | silero\n"
        << "  --vad-model <file>   silero VAD onnx model\n"
        << "  --log-level <level>  debug | info | warn | error\n"
        << "  -h, --help           show this help\n";
    return out.str();
}
