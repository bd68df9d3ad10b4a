#include "batch-scheduler.h"
#include "credential-cache.h"
#include "edge-auth.h"
#include "proxy-common.h"
#include "response-assembler.h"
#include "speech-request.h"
#include "synthesis-client.h"
#include "text-chunker.h"
#include "text-cleaner.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace edge_tts;

struct cli_params {
    std::string text;
    std::string text_file;
    std::string output = "output.mp3";

    std::string voice = "shimmer";
    double speed = 1.0;
    double pitch = 1.0;
    std::string style = "general";

    int32_t concurrency = k_default_concurrency;
    int32_t chunk_size = (int32_t) k_default_chunk_size;
    std::string output_format = k_default_output_format;

    std::string token_endpoint = k_default_token_endpoint;
    int32_t backend_timeout_sec = 30;

    bool stream = false;
    bool no_clean = false;
    bool dry_run = false;
    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s (-t TEXT | -f FILE) [options]\n\n"
        "Input:\n"
        "  -t, --text TEXT                 text to synthesize\n"
        "  -f, --file FNAME                read text from file\n"
        "  -o, --output FNAME              output audio file (default: output.mp3)\n\n"
        "Voice:\n"
        "  -v, --voice STR                 alias (shimmer, alloy, ...) or backend voice name (default: shimmer)\n"
        "  --speed F                       speech rate multiplier (default: 1.0)\n"
        "  --pitch F                       pitch multiplier (default: 1.0)\n"
        "  --style STR                     speaking style (default: general)\n\n"
        "Pipeline:\n"
        "  --concurrency N                 max concurrent backend calls per batch (default: 10)\n"
        "  --chunk-size N                  max code points per unit (default: 300)\n"
        "  --stream                        write audio batch by batch as it arrives\n"
        "  --no-clean                      skip text cleaning\n"
        "  --dry-run                       print the units and exit without synthesizing\n\n"
        "Backend:\n"
        "  --output-format STR             backend output format (default: %s)\n"
        "  --token-endpoint URL            token issuance endpoint\n"
        "  --backend-timeout N             timeout seconds per call (default: 30)\n",
        argv0, k_default_output_format);
}

static bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = (int32_t) v;
    return true;
}

static bool parse_f64(const char * s, double & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    const double v = std::strtod(s, &end);
    if (end == nullptr || end == s || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-t" || arg == "--text") {
            if (!needs_value(i, argc)) return false;
            p.text = argv[++i];
        } else if (arg == "-f" || arg == "--file") {
            if (!needs_value(i, argc)) return false;
            p.text_file = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "-v" || arg == "--voice") {
            if (!needs_value(i, argc)) return false;
            p.voice = argv[++i];
        } else if (arg == "--speed") {
            if (!needs_value(i, argc) || !parse_f64(argv[++i], p.speed)) return false;
        } else if (arg == "--pitch") {
            if (!needs_value(i, argc) || !parse_f64(argv[++i], p.pitch)) return false;
        } else if (arg == "--style") {
            if (!needs_value(i, argc)) return false;
            p.style = argv[++i];
        } else if (arg == "--concurrency") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.concurrency)) return false;
        } else if (arg == "--chunk-size") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.chunk_size)) return false;
        } else if (arg == "--output-format") {
            if (!needs_value(i, argc)) return false;
            p.output_format = argv[++i];
        } else if (arg == "--token-endpoint") {
            if (!needs_value(i, argc)) return false;
            p.token_endpoint = argv[++i];
        } else if (arg == "--backend-timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.backend_timeout_sec)) return false;
        } else if (arg == "--stream") {
            p.stream = true;
        } else if (arg == "--no-clean") {
            p.no_clean = true;
        } else if (arg == "--dry-run") {
            p.dry_run = true;
        } else if (arg == "-h" || arg == "--help") {
            p.show_help = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (p.show_help) {
        return true;
    }
    if (p.text.empty() == p.text_file.empty()) {
        std::fprintf(stderr, "exactly one of --text or --file is required\n");
        return false;
    }
    if (p.backend_timeout_sec < 1) {
        return false;
    }
    return true;
}

static bool read_text_file(const std::string & path, std::string & out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    speech_request req;
    req.voice = p.voice;
    req.speed = p.speed;
    req.pitch = p.pitch;
    req.style = p.style;
    req.stream = p.stream;
    req.concurrency = p.concurrency;
    req.chunk_size = p.chunk_size;
    if (!p.text_file.empty()) {
        if (!read_text_file(p.text_file, req.input)) {
            std::fprintf(stderr, "failed to read text file: %s\n", p.text_file.c_str());
            return 1;
        }
    } else {
        req.input = p.text;
    }
    if (p.no_clean) {
        req.cleaning = cleaning_options::none();
    }

    proxy_error err;
    voice_params vp;
    if (!resolve_voice_params(req, p.output_format, vp, err)) {
        std::fprintf(stderr, "error: %s\n", err.message.c_str());
        return 1;
    }

    const std::vector<text_unit> units = chunk_text(clean_text(req.input, req.cleaning), (size_t) req.chunk_size);
    const int32_t eff = effective_concurrency(req.concurrency, units.size());
    std::fprintf(stderr, "info: voice=%s units=%zu effective_concurrency=%d\n", vp.voice.c_str(), units.size(), eff);

    if (p.dry_run) {
        for (const auto & u : units) {
            std::printf("[%d] (%zu) %s\n", u.index, utf8_length(u.content), u.content.c_str());
        }
        return 0;
    }

    edge_auth_config auth_cfg;
    auth_cfg.token_endpoint = p.token_endpoint;
    auth_cfg.timeout_sec = p.backend_timeout_sec;

    edge_token_issuer issuer(auth_cfg);
    credential_cache creds(issuer);
    edge_synthesis_client synth(p.backend_timeout_sec);
    batch_scheduler scheduler(creds, synth);

    // the output file is created only once there is audio to put in it
    std::ofstream out;
    auto open_output = [&]() {
        out.open(p.output, std::ios::binary);
        if (!out) {
            std::fprintf(stderr, "failed to open output: %s\n", p.output.c_str());
            return false;
        }
        return true;
    };

    const auto t0 = std::chrono::steady_clock::now();
    size_t n_bytes = 0;

    if (!p.stream) {
        std::string audio;
        if (!assemble_buffered(scheduler, units, req.concurrency, vp, audio, err)) {
            std::fprintf(stderr, "error: %s (%s)\n", err.message.c_str(), error_kind_to_cstr(err.kind));
            return 1;
        }
        if (!open_output()) {
            return 1;
        }
        out.write(audio.data(), (std::streamsize) audio.size());
        n_bytes = audio.size();
    } else {
        stream_session session(scheduler, units, req.concurrency, vp);
        session.start();
        for (;;) {
            std::string chunk;
            const auto st = session.channel().read(chunk, err);
            if (st == byte_channel::READ_EOF) {
                break;
            }
            if (st == byte_channel::READ_ABORTED) {
                std::fprintf(stderr, "error: stream aborted after %zu bytes: %s (%s)\n",
                        n_bytes, err.message.c_str(), error_kind_to_cstr(err.kind));
                return 1;
            }
            if (!out.is_open() && !open_output()) {
                return 1;
            }
            out.write(chunk.data(), (std::streamsize) chunk.size());
            out.flush();
            n_bytes += chunk.size();
            const double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
            std::fprintf(stderr, "info: chunk bytes=%zu total=%zu elapsed_ms=%.1f\n", chunk.size(), n_bytes, ms);
        }
    }

    if (!out.is_open() && !open_output()) {
        return 1;
    }
    if (!out) {
        std::fprintf(stderr, "failed to write output: %s\n", p.output.c_str());
        return 1;
    }

    const double total_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    std::fprintf(stderr, "info: wrote %s (%zu bytes, %.1f ms, token_refreshes=%llu)\n",
            p.output.c_str(), n_bytes, total_ms, (unsigned long long) creds.refresh_count());
    return 0;
}
