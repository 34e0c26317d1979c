/**
 * @file c_api_test.cpp
 * @brief C API: handle lifecycle, run, queries, thread-local last error
 */

#include "uor/uor_c_api.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#define CHECK(expr) do { \
    if (!(expr)) { \
        std::fprintf(stderr, "CHECK FAILED: %s (%s:%d)\n", #expr, __FILE__, __LINE__); \
        std::abort(); \
    } \
} while(0)

static const char* kChart = R"({
  "nodes": [
    {"id": "a", "type": "const", "params": {"value": 5}},
    {"id": "b", "type": "const", "params": {"value": 7}},
    {"id": "c", "type": "add", "deps": ["a", "b"]},
    {"id": "label", "type": "const", "params": {"value": "hello world"}},
    {"id": "v", "type": "concat", "deps": ["a", "b"]},
    {"id": "bad", "type": "fail", "deps": ["c"]},
    {"id": "after", "type": "neg", "deps": ["bad"]}
  ]
})";

static void test_lifecycle_and_run() {
    uor_engine_t e = uor_create_engine(2, 0, 1);
    CHECK(e != nullptr);

    uor_manifold_t m = uor_build_manifold_json(e, kChart);
    CHECK(m != nullptr);
    CHECK(std::strcmp(uor_last_error(), "") == 0);

    uor_node_status ns;
    CHECK(uor_get_node_status(m, "c", &ns) == UOR_OK && ns == UOR_NODE_PENDING);

    CHECK(uor_run(e, m) == UOR_ERROR_EXECUTION);
    CHECK(std::strstr(uor_last_error(), "bad") != nullptr);

    CHECK(uor_get_node_status(m, "c", &ns) == UOR_OK && ns == UOR_NODE_COMPUTED);
    CHECK(uor_get_node_status(m, "bad", &ns) == UOR_OK && ns == UOR_NODE_FAILED);
    CHECK(uor_get_node_status(m, "after", &ns) == UOR_OK && ns == UOR_NODE_SKIPPED);

    double x = 0.0;
    CHECK(uor_read_real(m, "c", &x) == UOR_OK && x == 12.0);
    CHECK(uor_read_real(m, "label", &x) == UOR_ERROR_SHAPE_MISMATCH);
    CHECK(uor_read_real(m, "after", &x) == UOR_ERROR_INVALID_ARG);
    CHECK(std::strstr(uor_last_error(), "skipped") != nullptr);
    CHECK(uor_read_real(m, "ghost", &x) == UOR_ERROR_NOT_FOUND);

    uor_destroy_manifold(m);
    uor_destroy_engine(e);
    std::printf("  PASS: lifecycle and run\n");
}

static void test_read_text() {
    uor_engine_t e = uor_create_engine(1, 0, 0);
    uor_manifold_t m = uor_build_manifold_json(e, kChart);
    CHECK(m != nullptr);
    CHECK(uor_run(e, m) == UOR_ERROR_EXECUTION);

    char buf[64];
    size_t needed = 0;
    CHECK(uor_read_text(m, "label", buf, sizeof(buf), &needed) == UOR_OK);
    CHECK(std::strcmp(buf, "hello world") == 0 && needed == 11);

    CHECK(uor_read_text(m, "v", buf, sizeof(buf), &needed) == UOR_OK);
    CHECK(std::strcmp(buf, "[5, 7]") == 0);

    /* Truncation keeps the NUL and still reports the full length. */
    char tiny[6];
    CHECK(uor_read_text(m, "label", tiny, sizeof(tiny), &needed) == UOR_OK);
    CHECK(std::strcmp(tiny, "hello") == 0 && needed == 11);

    /* Size query only. */
    CHECK(uor_read_text(m, "c", nullptr, 0, &needed) == UOR_OK && needed == 2);

    CHECK(uor_read_text(m, "bad", buf, sizeof(buf), &needed) == UOR_ERROR_INVALID_ARG);

    uor_destroy_manifold(m);
    uor_destroy_engine(e);
    std::printf("  PASS: read text\n");
}

static void test_build_errors() {
    uor_engine_t e = uor_create_engine(1, 0, 1);

    CHECK(uor_build_manifold_json(e, "{not json") == nullptr);
    CHECK(std::strstr(uor_last_error(), "schema") != nullptr);

    CHECK(uor_build_manifold_json(e, R"({"nodes": [{"id": "c", "type": "neg",
                                          "deps": ["missing_x"]}]})") == nullptr);
    CHECK(std::strstr(uor_last_error(), "missing_x") != nullptr);

    CHECK(uor_build_manifold_json(e, R"({"nodes": [{"id": "a", "type": "neg", "deps": ["b"]},
                                                   {"id": "b", "type": "neg", "deps": ["a"]}]})")
          == nullptr);
    CHECK(std::strstr(uor_last_error(), "cycle") != nullptr);

    CHECK(uor_build_manifold_json(nullptr, kChart) == nullptr);
    CHECK(uor_build_manifold_json(e, nullptr) == nullptr);
    CHECK(uor_run(nullptr, nullptr) == UOR_ERROR_INVALID_ARG);

    uor_node_status ns;
    CHECK(uor_get_node_status(nullptr, "a", &ns) == UOR_ERROR_INVALID_ARG);

    /* Destroying null handles is a no-op. */
    uor_destroy_manifold(nullptr);
    uor_destroy_engine(e);
    uor_destroy_engine(nullptr);
    std::printf("  PASS: build errors\n");
}

static void test_last_error_is_thread_local() {
    uor_engine_t e = uor_create_engine(1, 0, 1);
    CHECK(uor_build_manifold_json(e, "[]") == nullptr);
    std::string mine = uor_last_error();
    CHECK(!mine.empty());

    std::string theirs = "unset";
    std::thread t([&] { theirs = uor_last_error(); });
    t.join();
    CHECK(theirs.empty());
    CHECK(mine == uor_last_error());

    uor_destroy_engine(e);
    std::printf("  PASS: last error is thread local\n");
}

int main() {
    std::printf("c_api_test: FFI gateway\n");
    test_lifecycle_and_run();
    test_read_text();
    test_build_errors();
    test_last_error_is_thread_local();
    std::printf("OK: all C API tests passed\n");
    return 0;
}
