// tests/atomic/test_atomic_file.cpp
//
// create-if-absent / replace / read / remove primitives.
//
// The concurrency case races several threads on one target: link(2) must let
// exactly one of them win and every loser must see "exists".

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <sodium.h>

#include "atomic_file.h"
#include "plshare_util.h"

namespace fs = std::filesystem;
using namespace plshare;

static int failures = 0;

static void check(bool cond, const char* name, const std::string& detail = "") {
    if (cond) {
        std::printf("[%s] OK\n", name);
    } else {
        std::fprintf(stderr, "[%s] FAIL %s\n", name, detail.c_str());
        failures++;
    }
}

static size_t count_temp_files(const fs::path& dir) {
    size_t n = 0;
    std::error_code ec;
    for (auto& e : fs::directory_iterator(dir, ec)) {
        if (is_temp_path(e.path())) n++;
    }
    return n;
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 1;
    }

    const fs::path dir = fs::temp_directory_path() / ("plshare_atomic_" + random_b64url(6));
    fs::create_directories(dir);

    std::string err;

    // --- create_unique_file ---
    {
        const fs::path p = dir / "a.json";
        CreateStatus s1 = create_unique_file(p, "first", &err);
        check(s1 == CreateStatus::created, "create_first", err);

        CreateStatus s2 = create_unique_file(p, "second", &err);
        check(s2 == CreateStatus::exists, "create_second_exists");

        std::string got;
        check(read_file_bytes(p, &got, &err) == ReadStatus::ok && got == "first", "create_never_overwrites", got);
    }

    // --- replace_file_atomic ---
    {
        const fs::path p = dir / "a.json";
        check(replace_file_atomic(p, "replaced", &err), "replace_ok", err);
        std::string got;
        check(read_file_bytes(p, &got, &err) == ReadStatus::ok && got == "replaced", "replace_content", got);

        const fs::path fresh = dir / "fresh.json";
        check(replace_file_atomic(fresh, "new", &err) && fs::exists(fresh), "replace_creates_missing", err);
    }

    // --- read_file_bytes ---
    {
        std::string got = "untouched";
        check(read_file_bytes(dir / "nope.json", &got, &err) == ReadStatus::missing, "read_missing");

        const fs::path empty = dir / "empty.json";
        check(create_unique_file(empty, "", &err) == CreateStatus::created, "create_empty", err);
        check(read_file_bytes(empty, &got, &err) == ReadStatus::ok && got.empty(), "read_empty");
    }

    // --- remove_file_if_present ---
    {
        const fs::path p = dir / "fresh.json";
        bool removed = false;
        check(remove_file_if_present(p, &removed, &err) && removed, "remove_present", err);
        check(remove_file_if_present(p, &removed, &err) && !removed, "remove_absent_ok", err);
    }

    // --- temp naming ---
    {
        const fs::path t = temp_path_for(dir / "x.json");
        check(t.parent_path() == dir, "temp_same_dir");
        check(is_temp_path(t), "temp_recognized", t.string());
        check(!is_temp_path(dir / "x.json"), "non_temp_not_recognized");
        check(temp_path_for(dir / "x.json") != t, "temp_names_unique");
    }

    // --- racing creators ---
    {
        const fs::path p = dir / "race.json";
        const int kThreads = 8;
        std::atomic<int> created{0};
        std::atomic<int> exists{0};
        std::atomic<int> failed{0};
        std::vector<std::thread> ts;
        for (int i = 0; i < kThreads; i++) {
            ts.emplace_back([&, i] {
                std::string e;
                switch (create_unique_file(p, "writer-" + std::to_string(i), &e)) {
                    case CreateStatus::created: created++; break;
                    case CreateStatus::exists:  exists++;  break;
                    case CreateStatus::failed:  failed++;  break;
                }
            });
        }
        for (auto& t : ts) t.join();

        check(created == 1, "race_single_winner", std::to_string(created.load()));
        check(exists == kThreads - 1, "race_losers_see_exists");
        check(failed == 0, "race_no_failures");

        std::string got;
        check(read_file_bytes(p, &got, &err) == ReadStatus::ok && got.rfind("writer-", 0) == 0,
              "race_content_whole", got);
    }

    check(count_temp_files(dir) == 0, "no_temp_leftovers");

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failures) {
        std::fprintf(stderr, "[atomic_file] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[atomic_file] ALL OK\n");
    return 0;
}
