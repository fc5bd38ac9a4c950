#include "coordinator-context.h"
#include "websocket-server.h"
#include "stream-service-clients.h"
#include "call-history.h"

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <memory>
#include <thread>
#include <chrono>
#include <stdexcept>

static std::atomic<bool> g_shutdown(false);

struct RelayArgs {
    int port                = 8080;
    std::string path        = "/ws";
    std::string db_path     = "";    // empty disables call history
    int batch               = 20;
    int timeout_ms          = 15000;
    int audio_retention_s   = 60;
    int session_retention_s = 600;
    int evict_after_s       = 1800;
    std::string stt_host    = "127.0.0.1";
    int stt_port            = 0;     // 0 disables transcription
    std::string llm_host    = "127.0.0.1";
    int llm_port            = 0;     // 0 disables responses and summaries
    std::string chat_host   = "";
    int chat_port           = 0;     // 0 logs channel messages only
    int workers             = 4;
    bool verbose            = false;
};

static void print_usage(const char* prog) {
    std::cout << "\n📡 Relay Call Coordinator\n\n";
    std::cout << "Usage: " << prog << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --port N               WebSocket port [8080]\n";
    std::cout << "  --path PATH                WebSocket path [/ws]\n";
    std::cout << "  -d, --database PATH        Call history database (optional)\n";
    std::cout << "  --batch N                  Audio fragments per transcription, 0 = end of call [20]\n";
    std::cout << "  --timeout-ms N             Timeout for external services [15000]\n";
    std::cout << "  --audio-retention-s N      Keep call audio after end [60]\n";
    std::cout << "  --session-retention-s N    Keep call metadata after end [600]\n";
    std::cout << "  --evict-after-s N          Drop idle connections after [1800]\n";
    std::cout << "  --stt-host HOST            Transcription service host [127.0.0.1]\n";
    std::cout << "  --stt-port PORT            Transcription service port (optional)\n";
    std::cout << "  --llm-host HOST            LLM service host [127.0.0.1]\n";
    std::cout << "  --llm-port PORT            LLM service port (optional)\n";
    std::cout << "  --chat-host HOST           Chat bridge host (optional)\n";
    std::cout << "  --chat-port PORT           Chat bridge port (optional)\n";
    std::cout << "  --workers N                Threads per worker pool [4]\n";
    std::cout << "  -v, --verbose              Log every fragment and delivery\n";
    std::cout << "  -h, --help                 Show this help\n";
}

static bool parse_args(int argc, char** argv, RelayArgs& a) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "-h" || arg == "--help") { print_usage(argv[0]); return false; }
            else if (arg == "-v" || arg == "--verbose") { a.verbose = true; }
            else if (!has_value) { std::cout << "Missing value for " << arg << "\n"; print_usage(argv[0]); return false; }
            else if (arg == "-p" || arg == "--port") { a.port = std::stoi(argv[++i]); }
            else if (arg == "--path") { a.path = argv[++i]; }
            else if (arg == "-d" || arg == "--database") { a.db_path = argv[++i]; }
            else if (arg == "--batch") { a.batch = std::stoi(argv[++i]); }
            else if (arg == "--timeout-ms") { a.timeout_ms = std::stoi(argv[++i]); }
            else if (arg == "--audio-retention-s") { a.audio_retention_s = std::stoi(argv[++i]); }
            else if (arg == "--session-retention-s") { a.session_retention_s = std::stoi(argv[++i]); }
            else if (arg == "--evict-after-s") { a.evict_after_s = std::stoi(argv[++i]); }
            else if (arg == "--stt-host") { a.stt_host = argv[++i]; }
            else if (arg == "--stt-port") { a.stt_port = std::stoi(argv[++i]); }
            else if (arg == "--llm-host") { a.llm_host = argv[++i]; }
            else if (arg == "--llm-port") { a.llm_port = std::stoi(argv[++i]); }
            else if (arg == "--chat-host") { a.chat_host = argv[++i]; }
            else if (arg == "--chat-port") { a.chat_port = std::stoi(argv[++i]); }
            else if (arg == "--workers") { a.workers = std::stoi(argv[++i]); }
            else { std::cout << "Unknown arg: " << arg << "\n"; print_usage(argv[0]); return false; }
        }
    } catch (const std::exception& e) {
        std::cout << "Invalid numeric argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return false;
    }

    if (a.batch < 0 || a.timeout_ms <= 0 || a.workers <= 0 || a.audio_retention_s < 0 ||
        a.session_retention_s < a.audio_retention_s || a.evict_after_s <= 0) {
        std::cout << "Invalid option values\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

static void on_signal(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

int main(int argc, char** argv) {
    RelayArgs a;
    if (!parse_args(argc, argv, a)) return 1;

    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    CoordinatorConfig cfg;
    cfg.batch_threshold = static_cast<size_t>(a.batch);
    cfg.capability_timeout = std::chrono::milliseconds(a.timeout_ms);
    cfg.audio_retention = std::chrono::seconds(a.audio_retention_s);
    cfg.session_retention = std::chrono::seconds(a.session_retention_s);
    cfg.evict_after = std::chrono::seconds(a.evict_after_s);
    cfg.ingest_workers = static_cast<size_t>(a.workers);
    cfg.capability_workers = static_cast<size_t>(a.workers);
    cfg.ws_path = a.path;
    cfg.verbose = a.verbose;

    // External services; a zero port leaves the capability unset
    CoordinatorCapabilities caps;
    if (a.stt_port > 0) {
        caps.transcriber = std::make_shared<WhisperTranscriptionClient>(a.stt_host, a.stt_port);
    } else {
        std::cout << "⚠️ No transcription service configured, audio is buffered only" << std::endl;
    }
    if (a.llm_port > 0) {
        auto llama = std::make_shared<LlamaResponseClient>(a.llm_host, a.llm_port);
        // One client serves both responses and summaries
        caps.responder = llama;
        caps.summarizer = llama;
    } else {
        std::cout << "⚠️ No LLM service configured, responses and summaries disabled" << std::endl;
    }
    caps.notifier = std::make_shared<ChatBridgeNotifier>(a.chat_host, a.chat_port);

    CoordinatorContext context(cfg, caps);

    if (!a.db_path.empty()) {
        auto history = std::make_shared<CallHistory>();
        if (!history->init(a.db_path)) {
            return 1;
        }
        context.attach_history(history);
    }

    if (!context.start()) {
        return 1;
    }

    WebSocketServer server(context.registry(), context.router(), cfg.ws_path, cfg.max_frame_bytes);
    server.set_verbose(a.verbose);
    if (!server.start(a.port)) {
        context.stop();
        return 1;
    }

    std::cout << "\n📡 Relay coordinator listening on ws://0.0.0.0:" << server.bound_port() << cfg.ws_path << std::endl;
    if (a.stt_port > 0) std::cout << "Transcription: " << a.stt_host << ":" << a.stt_port << std::endl;
    if (a.llm_port > 0) std::cout << "LLM: " << a.llm_host << ":" << a.llm_port << std::endl;
    if (!a.db_path.empty()) std::cout << "DB: " << a.db_path << std::endl;
    std::cout << "Press Ctrl+C to stop." << std::endl;

    // Stop the listener before draining the worker pools
    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\n🛑 Shutting down" << std::endl;
    server.stop();
    context.stop();
    std::cout << "✅ Relay coordinator stopped" << std::endl;
    return 0;
}
