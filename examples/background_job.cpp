#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include "relay.hpp"

using namespace relay;
using namespace std::chrono_literals;

// --- 1. Visualization Utilities ---
struct Visualizer {
    static void print_header(const std::string& title) {
        std::cout << "\n\033[1;34m" << std::string(50, '=') << "\n"
                  << " JOB: " << title << "\n"
                  << std::string(50, '=') << "\033[0m" << std::endl;
    }

    static void draw_progress(const std::string& label, float progress) {
        int width = 20;
        int pos = static_cast<int>(width * progress);
        std::cout << "\033[1;32m[PROG]\033[0m " << std::left << std::setw(12) << label
                  << " [\033[1;33m" << std::string(pos, '#') << std::string(width - pos, ' ')
                  << "\033[0m] " << static_cast<int>(progress * 100) << "%" << std::endl;
    }
};

// --- 2. Background Import ---
// Loads and indexes a batch of records on the pool while the owner thread
// keeps draining its dispatch queue.
static int import_batch(cancellation_token& cancel, progress_reporter& load, progress_reporter& index, int records) {
    for (int i = 1; i <= records; ++i) {
        if (cancel.is_cancelled()) {
            return i - 1;
        }
        std::this_thread::sleep_for(20ms);
        load.update(static_cast<float>(i) / records, "record " + std::to_string(i));
    }
    for (int i = 1; i <= 4; ++i) {
        std::this_thread::sleep_for(30ms);
        index.set_progress(i / 4.0f);
    }
    return records;
}

int main() {
    set_owner_thread();
    thread_pool pool{thread_pool_config::with_threads(4)};

    // --- 3. Subscribers ---
    aggregate_progress overall;
    auto load  = overall.add_task("load", 3.0f);
    auto index = overall.add_task("index", 1.0f);

    // Emitted on a pool thread, delivered on this one.
    auto overall_conn = overall.on_progress_changed().connect_scoped([](float value) {
        Visualizer::draw_progress("overall", value);
    }, connection_type::queued, std::nullopt);

    auto message_conn = load.on_message_changed().connect_scoped([](const std::string& text) {
        std::cout << "\033[1;90m[LOAD] " << text << "\033[0m" << std::endl;
    }, connection_type::queued, std::nullopt);

    // --- 4. Execution ---
    Visualizer::print_header("NOMINAL IMPORT");
    auto handle = pool.spawn_cancellable([&](cancellation_token& cancel) {
        return import_batch(cancel, load, index, 10);
    }).first;

    std::optional<int> imported;
    while (!(imported = handle.try_get())) {
        wait_deferred(10ms);
    }
    process_deferred();
    std::cout << "\033[1;32mImported " << *imported << " record(s).\033[0m" << std::endl;

    // --- 5. Cancellation ---
    Visualizer::print_header("CANCELLED IMPORT");
    overall.reset();
    process_deferred();

    auto [second, second_token] = pool.spawn_cancellable([&](cancellation_token& cancel) {
        return import_batch(cancel, load, index, 50);
    });

    std::this_thread::sleep_for(100ms);
    second_token.cancel();
    auto partial = second.wait();
    process_deferred();
    std::cout << "\033[1;31mImport cancelled after " << partial.value_or(0)
              << " record(s). \033[1;32m [Meet expectations]\033[0m" << std::endl;

    // --- 6. Worker results ---
    Visualizer::print_header("CHECKSUM WORKER");
    worker<std::string> checksum{worker_config::with_name("checksum")};
    bool done = false;
    checksum.on_result().connect([&](const std::string& digest) {
        std::cout << "[WORKER] digest " << digest << std::endl;
        done = true;
    });
    checksum.send([] { return std::string("9f2c4a"); });
    while (!done) {
        wait_deferred(10ms);
    }

    return 0;
}
