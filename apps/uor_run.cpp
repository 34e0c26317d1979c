/**
 * @file uor_run.cpp
 * @brief Chart runner CLI — load a chart file, run it, print node states
 *
 *   uor_run <chart.json> [--threads N] [--timeout-ms T] [--no-cache]
 *           [--node ID] [--profile] [--trace PATH] [--log-level L]
 *
 * Configuration starts from the UOR_* environment; flags override it.
 * Exit codes: 0 success, 1 usage / load / build error, 2 execution failure.
 */

#include "uor/engine.hpp"
#include "uor/metrics.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

static void usage(const char* prog) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s <chart.json> [--threads N] [--timeout-ms T] [--no-cache]\n"
        "     [--node ID] [--profile] [--trace PATH] [--log-level L]\n", prog);
}

static bool read_file(const char* path, std::string* out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    *out = ss.str();
    return true;
}

static bool parse_u32(const char* s, uint32_t* out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(s, &end, 10);
    if (!*s || *end != '\0' || v > UINT32_MAX) return false;
    *out = static_cast<uint32_t>(v);
    return true;
}

static void print_node(const uor::ManifoldNode& n) {
    std::printf("%-16s %-10s %-9s", n.id.c_str(), n.type.c_str(),
                uor_node_status_str(n.status));
    if (n.status == UOR_NODE_COMPUTED)
        std::printf(" %s", n.payload->to_string().c_str());
    else if (n.status == UOR_NODE_FAILED)
        std::printf(" %s: %s", uor_status_str(n.cause), n.message.c_str());
    std::printf("\n");
}

int main(int argc, char** argv) {
    uor::EngineConfig cfg = uor::EngineConfig::from_env();
    const char* chart_path = nullptr;
    const char* only_node  = nullptr;
    const char* trace_path = nullptr;
    bool        profile    = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        bool has_val = i + 1 < argc;
        if (std::strcmp(a, "--threads") == 0 && has_val) {
            if (!parse_u32(argv[++i], &cfg.threads)) { usage(argv[0]); return 1; }
        } else if (std::strcmp(a, "--timeout-ms") == 0 && has_val) {
            if (!parse_u32(argv[++i], &cfg.timeout_ms)) { usage(argv[0]); return 1; }
        } else if (std::strcmp(a, "--no-cache") == 0) {
            cfg.cache = false;
        } else if (std::strcmp(a, "--node") == 0 && has_val) {
            only_node = argv[++i];
        } else if (std::strcmp(a, "--profile") == 0) {
            profile = true;
        } else if (std::strcmp(a, "--trace") == 0 && has_val) {
            trace_path = argv[++i];
        } else if (std::strcmp(a, "--log-level") == 0 && has_val) {
            if (!uor_log_level_parse(argv[++i], &cfg.log_level)) {
                std::fprintf(stderr, "unknown log level: %s\n", argv[i]);
                return 1;
            }
        } else if (a[0] == '-' || chart_path) {
            std::fprintf(stderr, "unexpected argument: %s\n", a);
            usage(argv[0]);
            return 1;
        } else {
            chart_path = a;
        }
    }
    if (!chart_path) { usage(argv[0]); return 1; }

    std::string text;
    if (!read_file(chart_path, &text)) {
        std::fprintf(stderr, "cannot read %s\n", chart_path);
        return 1;
    }

    uor::Engine engine(cfg);

    uor::Manifold manifold;
    uor::Diagnostic diag;
    if (engine.load(text, &manifold, &diag) != UOR_OK) {
        std::fprintf(stderr, "%s: %s\n", chart_path, diag.to_string().c_str());
        return 1;
    }
    if (only_node && !manifold.find(only_node)) {
        std::fprintf(stderr, "no node '%s' in %s\n", only_node, chart_path);
        return 1;
    }

    uor::Manifold result;
    uor::ExecutionError err;
    uor_status st = engine.run(manifold, &result, &err);

    if (only_node) {
        print_node(*result.find(only_node));
    } else {
        for (auto& id : result.topological_order()) print_node(*result.find(id));
    }

    const uor::GraphProfile& prof = engine.scheduler().last_profile();
    if (profile) {
        std::printf("%s\n", prof.dump_json().c_str());
        char buf[1024];
        if (uor_metrics_to_json(buf, sizeof(buf)) > 0) std::printf("%s\n", buf);
    }
    if (trace_path && !prof.export_chrome_trace(trace_path))
        std::fprintf(stderr, "cannot write trace to %s\n", trace_path);

    if (st != UOR_OK) {
        std::fprintf(stderr, "%s\n", err.to_string().c_str());
        return 2;
    }
    return 0;
}
