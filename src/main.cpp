#include "config.hpp"
#include "log.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "stream_converter.hpp"
#include "chunk_logger.hpp"
#include "turn_streamer.hpp"
#include <iostream>
#include <fstream>
#include <string>
#include <cstring>

static void print_usage() {
    std::cout << "Usage: streamgate-convert [options] [FILE]\n"
              << "\n"
              << "Reads runtime events as JSON lines from FILE (or stdin) and writes\n"
              << "the SSE chunk protocol to stdout.\n"
              << "\n"
              << "Options:\n"
              << "  --message-id ID      Message id for the first turn (default: random)\n"
              << "  --model NAME         Fallback model version for finish metadata\n"
              << "  --no-hold            Finish turns even while approvals are pending\n"
              << "  --log-level LEVEL    debug, info, warn or error\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Event lines:\n"
              << "  {\"kind\":\"text-delta\",\"text\":\"Hi\"}\n"
              << "  {\"kind\":\"function-call\",\"id\":\"c1\",\"name\":\"get_weather\",\"args\":{}}\n"
              << "  {\"kind\":\"function-response\",\"id\":\"c1\",\"name\":\"get_weather\",\"response\":{}}\n"
              << "  {\"kind\":\"turn-complete\",\"finishReason\":\"STOP\"}\n"
              << "\n"
              << "Environment variables:\n"
              << "  STREAMGATE_LOG_LEVEL     Log verbosity (overrides config)\n"
              << "  CHUNK_LOGGER_ENABLED     Record chunks as JSONL (true/false)\n"
              << "  CHUNK_LOGGER_OUTPUT_DIR  Chunk log directory (default: ./chunk_logs)\n"
              << "  CHUNK_LOGGER_SESSION_ID  Chunk log session id\n";
}

int main(int argc, char* argv[]) try {
    std::string message_id;
    std::string model_name;
    std::string log_level_name;
    std::string input_path;
    bool no_hold = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--message-id") == 0 && i + 1 < argc) {
            message_id = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_name = argv[++i];
        } else if (std::strcmp(argv[i], "--no-hold") == 0) {
            no_hold = true;
        } else if (argv[i][0] != '-' && input_path.empty()) {
            input_path = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = streamgate::Config::load();

    // Override config with CLI args
    if (!log_level_name.empty()) {
        auto level = streamgate::log_level_from_string(log_level_name);
        if (!level) {
            std::cerr << "Unknown log level: " << log_level_name << "\n";
            return 1;
        }
        config.log_level = *level;
    }
    if (!model_name.empty()) {
        config.converter.agent_model = model_name;
    }
    if (no_hold) {
        config.converter.hold_turn_while_awaiting_approval = false;
    }
    streamgate::set_log_level(config.log_level);

    std::ifstream file;
    if (!input_path.empty()) {
        file.open(input_path);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open " << input_path << "\n";
            return 1;
        }
    }
    std::istream& in = input_path.empty() ? std::cin : file;

    streamgate::EventBus bus;
    streamgate::subscribe<streamgate::TurnFinishedEvent>(bus,
        [](const streamgate::TurnFinishedEvent& ev) {
            streamgate::log_debug("convert", "Turn " + ev.message_id +
                                             (ev.errored ? " failed" : " finished") + " after " +
                                             std::to_string(ev.chunk_count) + " chunks");
        });

    auto options = streamgate::ConverterOptions::from_config(config);
    options.message_id = message_id;
    streamgate::StreamConverter converter(options, &bus);

    streamgate::ChunkLogger chunk_log(config.chunk_log);
    streamgate::TurnStreamer streamer(converter, chunk_log.enabled() ? &chunk_log : nullptr);

    streamgate::JsonLinesEventSource source(in);
    streamgate::SseStreamWriter writer(std::cout);
    auto stats = streamer.run(source, writer);

    streamgate::log_info("convert", std::to_string(stats.events) + " events -> " +
                                    std::to_string(stats.chunks) + " chunks in " +
                                    std::to_string(stats.turns) + " turn(s)");
    return stats.source_failed || stats.client_closed ? 1 : 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
