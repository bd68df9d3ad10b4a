#include "batch-scheduler.h"
#include "credential-cache.h"
#include "edge-auth.h"
#include "proxy-common.h"
#include "response-assembler.h"
#include "speech-request.h"
#include "synthesis-client.h"
#include "text-chunker.h"
#include "text-cleaner.h"

#include <cpp-httplib/httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using json = nlohmann::ordered_json;

using namespace edge_tts;

struct server_config {
    std::string host = "127.0.0.1";
    int32_t port = 18090;
    int32_t n_threads = 8;

    std::string api_key;

    int32_t concurrency = k_default_concurrency;
    int32_t chunk_size = (int32_t) k_default_chunk_size;
    std::string output_format = k_default_output_format;

    std::string token_endpoint = k_default_token_endpoint;
    int32_t backend_timeout_sec = 30;
    int32_t token_refresh_skew_sec = (int32_t) k_default_refresh_skew_sec;
    int32_t stream_buffer_chunks = 8;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [options]\n\n"
        "Server:\n"
        "  --host STR                      bind host (default: 127.0.0.1, env EDGE_TTS_HOST)\n"
        "  --port N                        bind port (default: 18090, env EDGE_TTS_PORT)\n"
        "  --threads N                     HTTP worker threads (default: 8)\n"
        "  --api-key STR                   shared secret for Bearer/?key= auth\n"
        "                                  (env EDGE_TTS_API_KEY or API_KEY; empty disables auth)\n\n"
        "Synthesis:\n"
        "  --concurrency N                 default per-request concurrency (default: 10)\n"
        "  --chunk-size N                  default max code points per unit (default: 300)\n"
        "  --output-format STR             backend output format (default: %s)\n"
        "  --stream-buffer N               queued chunks per streaming response (default: 8)\n\n"
        "Backend:\n"
        "  --token-endpoint URL            token issuance endpoint\n"
        "  --backend-timeout N             connect/read timeout seconds per call (default: 30)\n"
        "  --token-refresh-skew N          refresh this many seconds before expiry (default: 300)\n",
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

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static const char * getenv_nonempty(const char * name) {
    const char * v = std::getenv(name);
    return (v != nullptr && v[0] != '\0') ? v : nullptr;
}

static bool parse_args(int argc, char ** argv, server_config & cfg) {
    bool host_set = false;
    bool port_set = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--host") {
            if (!needs_value(i, argc)) return false;
            cfg.host = argv[++i];
            host_set = true;
        } else if (arg == "--port") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.port)) return false;
            port_set = true;
        } else if (arg == "--threads") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.n_threads)) return false;
        } else if (arg == "--api-key") {
            if (!needs_value(i, argc)) return false;
            cfg.api_key = argv[++i];
        } else if (arg == "--concurrency") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.concurrency)) return false;
        } else if (arg == "--chunk-size") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.chunk_size)) return false;
        } else if (arg == "--output-format") {
            if (!needs_value(i, argc)) return false;
            cfg.output_format = argv[++i];
        } else if (arg == "--stream-buffer") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.stream_buffer_chunks)) return false;
        } else if (arg == "--token-endpoint") {
            if (!needs_value(i, argc)) return false;
            cfg.token_endpoint = argv[++i];
        } else if (arg == "--backend-timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.backend_timeout_sec)) return false;
        } else if (arg == "--token-refresh-skew") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], cfg.token_refresh_skew_sec)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (!host_set) {
        if (const char * v = getenv_nonempty("EDGE_TTS_HOST")) {
            cfg.host = v;
        }
    }
    if (!port_set) {
        if (const char * v = getenv_nonempty("EDGE_TTS_PORT")) {
            if (!parse_i32(v, cfg.port)) {
                std::fprintf(stderr, "EDGE_TTS_PORT is not a number: %s\n", v);
                return false;
            }
        }
    }
    if (cfg.api_key.empty()) {
        if (const char * v = getenv_nonempty("EDGE_TTS_API_KEY")) {
            cfg.api_key = v;
        } else if (const char * v2 = getenv_nonempty("API_KEY")) {
            cfg.api_key = v2;
        }
    }

    if (cfg.port < 1 || cfg.port > 65535) {
        return false;
    }
    if (cfg.n_threads < 1 || cfg.concurrency < 1 || cfg.chunk_size < 1 || cfg.stream_buffer_chunks < 1) {
        return false;
    }
    if (cfg.backend_timeout_sec < 1 || cfg.token_refresh_skew_sec < 0) {
        return false;
    }
    return true;
}

static double ms_since(
        const std::chrono::steady_clock::time_point & t0,
        const std::chrono::steady_clock::time_point & t1) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(t1 - t0).count();
}

static json make_error_json(const std::string & message, const char * type, const char * code) {
    return json {
        {"error", {
            {"message", message},
            {"type", type},
            {"code", code},
            {"param", nullptr},
        }},
    };
}

static void send_error(httplib::Response & res, const proxy_error & err) {
    int status = 500;
    const char * type = "api_error";
    const char * code = "internal_server_error";
    switch (err.kind) {
        case ERROR_KIND_INPUT:
            status = 400;
            type = "invalid_request_error";
            code = "invalid_request_error";
            break;
        case ERROR_KIND_AUTH:
            status = 401;
            code = "invalid_api_key";
            break;
        case ERROR_KIND_CREDENTIAL:
        case ERROR_KIND_SYNTHESIS:
        case ERROR_KIND_STREAM_ABORT:
            status = 500;
            code = "tts_generation_error";
            break;
        default:
            break;
    }
    res.status = status;
    res.set_content(make_error_json(err.message, type, code).dump(), "application/json; charset=utf-8");
}

static void send_error(httplib::Response & res, int status, const std::string & message, const char * code) {
    res.status = status;
    res.set_content(make_error_json(message, "api_error", code).dump(), "application/json; charset=utf-8");
}

static bool check_api_key(const httplib::Request & req, const std::string & api_key) {
    if (api_key.empty()) {
        return true;
    }
    std::string provided;
    const std::string auth = req.get_header_value("Authorization");
    if (auth.compare(0, 7, "Bearer ") == 0) {
        provided = auth.substr(7);
    } else if (req.has_param("key")) {
        provided = req.get_param_value("key");
    } else if (req.has_param("api_key")) {
        provided = req.get_param_value("api_key");
    }
    return !provided.empty() && provided == api_key;
}

static bool is_api_path(const std::string & path) {
    return path.compare(0, 4, "/v1/") == 0 || path.compare(0, 8, "/api/v1/") == 0;
}

static json make_models_json() {
    const int64_t created = now_sec();
    json data = json::array();
    data.push_back({{"id", "tts-1"}, {"object", "model"}, {"created", created}, {"owned_by", "openai"}});
    data.push_back({{"id", "tts-1-hd"}, {"object", "model"}, {"created", created}, {"owned_by", "openai"}});
    for (const auto & kv : openai_voice_map()) {
        data.push_back({{"id", "tts-1-" + kv.first}, {"object", "model"}, {"created", created}, {"owned_by", "openai"}});
    }
    return json {{"object", "list"}, {"data", data}};
}

int main(int argc, char ** argv) {
    server_config cfg;
    if (!parse_args(argc, argv, cfg)) {
        print_usage(argv[0]);
        return 1;
    }

    edge_auth_config auth_cfg;
    auth_cfg.token_endpoint = cfg.token_endpoint;
    auth_cfg.timeout_sec = cfg.backend_timeout_sec;

    edge_token_issuer issuer(auth_cfg);
    credential_cache creds(issuer, cfg.token_refresh_skew_sec);
    edge_synthesis_client synth(cfg.backend_timeout_sec);
    batch_scheduler scheduler(creds, synth);

    request_defaults defaults;
    defaults.concurrency = cfg.concurrency;
    defaults.chunk_size = cfg.chunk_size;
    defaults.output_format = cfg.output_format;

    std::atomic<int32_t> inflight {0};

    httplib::Server server;
    server.new_task_queue = [&cfg] { return new httplib::ThreadPool((size_t) cfg.n_threads); };
    server.set_default_headers({{"Server", "edge-tts-proxy"}});

    server.set_pre_routing_handler([&cfg](const httplib::Request & req, httplib::Response & res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Max-Age", "86400");
        if (req.method == "OPTIONS") {
            const std::string requested = req.get_header_value("Access-Control-Request-Headers");
            res.set_header("Access-Control-Allow-Headers", requested.empty() ? "Content-Type, Authorization" : requested);
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
        if (is_api_path(req.path) && !check_api_key(req, cfg.api_key)) {
            proxy_error err;
            set_error(err, ERROR_KIND_AUTH, 401, "invalid API key");
            send_error(res, err);
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server.Get("/health", [&](const httplib::Request &, httplib::Response & res) {
        json j = {
            {"status", "ok"},
            {"inflight", inflight.load()},
            {"credential_valid", creds.has_valid()},
            {"credential_refreshing", creds.is_refreshing()},
            {"token_refreshes", creds.refresh_count()},
            {"default_concurrency", cfg.concurrency},
            {"default_chunk_size", cfg.chunk_size},
        };
        res.set_content(j.dump(), "application/json; charset=utf-8");
    });

    auto models_handler = [](const httplib::Request &, httplib::Response & res) {
        res.set_content(make_models_json().dump(), "application/json; charset=utf-8");
    };

    server.Get("/reader.json", [&cfg](const httplib::Request & req, httplib::Response & res) {
        const std::string base_url = "http://" + req.get_header_value("Host");
        const std::string voice = req.has_param("voice") ? req.get_param_value("voice") : "zh-CN-XiaoxiaoNeural";
        const std::string name = req.has_param("n") ? req.get_param_value("n") : "Edge TTS";
        json j = {
            {"name", name},
            {"url", base_url + "/api/v1/audio/speech?t={{java.encodeURI(speakText)}}&v=" + voice +
                    "&r={{(speakSpeed - 10) / 10 + 1}}&p=1.0&key=" + cfg.api_key},
            {"header", {{"Authorization", "Bearer " + cfg.api_key}}},
            {"id", now_ms()},
        };
        res.set_content(j.dump(2), "application/json; charset=utf-8");
    });

    auto speech_handler = [&](const httplib::Request & req, httplib::Response & res) {
        const auto t_req_begin = std::chrono::steady_clock::now();

        speech_request sr;
        proxy_error err;
        if (req.method == "GET") {
            if (!parse_speech_request_query(req.params, defaults, sr, err)) {
                send_error(res, err);
                return;
            }
        } else {
            json body;
            try {
                body = json::parse(req.body.empty() ? "{}" : req.body);
            } catch (const std::exception & e) {
                set_error(err, ERROR_KIND_INPUT, 400, std::string("invalid JSON: ") + e.what());
                send_error(res, err);
                return;
            }
            if (!parse_speech_request_json(body, defaults, sr, err)) {
                send_error(res, err);
                return;
            }
        }

        voice_params vp;
        if (!resolve_voice_params(sr, cfg.output_format, vp, err)) {
            send_error(res, err);
            return;
        }

        std::vector<text_unit> units = chunk_text(clean_text(sr.input, sr.cleaning), (size_t) sr.chunk_size);
        const size_t n_units = units.size();
        const int32_t eff = effective_concurrency(sr.concurrency, n_units);

        if (!sr.stream) {
            inflight.fetch_add(1);
            std::string audio;
            const bool ok = assemble_buffered(scheduler, units, sr.concurrency, vp, audio, err);
            inflight.fetch_sub(1);

            const double total_ms = ms_since(t_req_begin, std::chrono::steady_clock::now());
            std::fprintf(stderr,
                    "speech: path=%s mode=buffered ok=%s voice=%s units=%zu effective=%d bytes=%zu total_ms=%.2f%s%s\n",
                    req.path.c_str(), ok ? "true" : "false", vp.voice.c_str(), n_units, eff, audio.size(), total_ms,
                    ok ? "" : " err=", ok ? "" : err.message.c_str());
            if (!ok) {
                send_error(res, err);
                return;
            }
            res.status = 200;
            res.set_content(std::move(audio), "audio/mpeg");
            return;
        }

        // Streaming: hold the response until the first batch lands so an
        // early failure can still be reported as a JSON error.
        auto session = std::make_shared<stream_session>(
                scheduler, std::move(units), sr.concurrency, vp, (size_t) cfg.stream_buffer_chunks);
        inflight.fetch_add(1);
        session->start();

        proxy_error early_err;
        if (session->channel().wait_ready(early_err) == byte_channel::READ_ABORTED) {
            inflight.fetch_sub(1);
            const double total_ms = ms_since(t_req_begin, std::chrono::steady_clock::now());
            std::fprintf(stderr,
                    "speech: path=%s mode=stream ok=false voice=%s units=%zu effective=%d bytes=0 total_ms=%.2f err=%s\n",
                    req.path.c_str(), vp.voice.c_str(), n_units, eff, total_ms, early_err.message.c_str());
            send_error(res, early_err);
            return;
        }

        res.status = 200;
        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");

        auto * p_inflight = &inflight;
        res.set_chunked_content_provider(
                "audio/mpeg",
                [session, req_path = req.path, voice = vp.voice, n_units, eff, t_req_begin,
                 n_sent = size_t(0)]
                (size_t, httplib::DataSink & sink) mutable -> bool {
                    std::string data;
                    proxy_error stream_err;
                    switch (session->channel().read(data, stream_err)) {
                        case byte_channel::READ_DATA:
                            n_sent += data.size();
                            return sink.write(data.data(), data.size());
                        case byte_channel::READ_EOF: {
                            const double total_ms = ms_since(t_req_begin, std::chrono::steady_clock::now());
                            std::fprintf(stderr,
                                    "speech: path=%s mode=stream ok=true voice=%s units=%zu effective=%d bytes=%zu total_ms=%.2f\n",
                                    req_path.c_str(), voice.c_str(), n_units, eff, n_sent, total_ms);
                            sink.done();
                            return true;
                        }
                        case byte_channel::READ_ABORTED:
                        default: {
                            const double total_ms = ms_since(t_req_begin, std::chrono::steady_clock::now());
                            std::fprintf(stderr,
                                    "speech: path=%s mode=stream ok=false voice=%s units=%zu effective=%d bytes=%zu total_ms=%.2f err=%s\n",
                                    req_path.c_str(), voice.c_str(), n_units, eff, n_sent, total_ms, stream_err.message.c_str());
                            // returning false drops the connection without the terminating chunk
                            return false;
                        }
                    }
                },
                [session, p_inflight](bool success) {
                    p_inflight->fetch_sub(1);
                    if (!success) {
                        session->channel().cancel();
                    }
                });
    };

    server.Post("/v1/audio/speech", speech_handler);
    server.Get("/v1/audio/speech", speech_handler);
    server.Post("/api/v1/audio/speech", speech_handler);
    server.Get("/api/v1/audio/speech", speech_handler);
    server.Get("/v1/models", models_handler);
    server.Get("/api/v1/models", models_handler);

    auto method_not_allowed = [](const httplib::Request & req, httplib::Response & res) {
        send_error(res, 405, "method " + req.method + " not allowed", "method_not_allowed");
        res.set_header("Allow", "GET, POST, OPTIONS");
    };
    for (const char * path : {"/v1/audio/speech", "/api/v1/audio/speech"}) {
        server.Put(path, method_not_allowed);
        server.Patch(path, method_not_allowed);
        server.Delete(path, method_not_allowed);
    }
    for (const char * path : {"/v1/models", "/api/v1/models"}) {
        server.Post(path, method_not_allowed);
    }

    std::fprintf(stderr, "edge-tts-proxy listening on http://%s:%d (threads=%d, auth=%s)\n",
            cfg.host.c_str(), cfg.port, cfg.n_threads, cfg.api_key.empty() ? "off" : "on");
    if (!server.listen(cfg.host, cfg.port)) {
        std::fprintf(stderr, "failed to listen on %s:%d\n", cfg.host.c_str(), cfg.port);
        return 1;
    }

    return 0;
}
