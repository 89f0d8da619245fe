#include "logger.h"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static std::size_t count_lines(const std::string& s, const std::string& needle) {
    std::istringstream in(s);
    std::string line;
    std::size_t n = 0;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

int main() {
    std::ostringstream sink;
    Logger log("logger_test", sink);
    log.set_level(LogLevel::DEBUG);

    const int threads = 4;
    const int msgs = 200;

    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([t, msgs, &log](){
            for (int i = 0; i < msgs; ++i) {
                log.debug_fmt("threads=", t, " msg=", i);
            }
        });
    }
    for (auto &x : th) x.join();

    // every line intact, none interleaved
    assert(count_lines(sink.str(), "[DEBUG] logger_test: threads=") ==
           static_cast<std::size_t>(threads * msgs));

    // filtering
    std::ostringstream quiet;
    Logger q("quiet", quiet);
    q.set_level(LogLevel::WARN);
    q.debug("hidden");
    q.info("hidden");
    q.warn("shown");
    q.error("shown");
    assert(count_lines(quiet.str(), "hidden") == 0);
    assert(count_lines(quiet.str(), "shown") == 2);

    q.set_level(LogLevel::OFF);
    q.error("muted");
    assert(count_lines(quiet.str(), "muted") == 0);

    // OFF is a threshold, never a message level
    std::ostringstream off_sink;
    Logger o("off", off_sink);
    o.set_level(LogLevel::TRACE);
    o.log(LogLevel::OFF, "never");
    assert(off_sink.str().empty());

    // level changes while other threads log
    std::ostringstream race_sink;
    Logger r("race", race_sink);
    std::thread writer([&r]() {
        for (int i = 0; i < 500; ++i) r.info("tick");
    });
    for (int i = 0; i < 500; ++i) {
        r.set_level(i % 2 ? LogLevel::INFO : LogLevel::ERROR);
        assert(r.level() == LogLevel::INFO || r.level() == LogLevel::ERROR);
    }
    writer.join();
    assert(count_lines(race_sink.str(), "[INFO] race: tick") <= 500);

    assert(parse_log_level("Debug") == LogLevel::DEBUG);
    assert(parse_log_level("warning") == LogLevel::WARN);
    bool threw = false;
    try { parse_log_level("loud"); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    // moved-to logger keeps writing to the same sink
    Logger moved(std::move(q));
    moved.set_level(LogLevel::INFO);
    moved.info("after move");
    assert(count_lines(quiet.str(), "[INFO] quiet: after move") == 1);

    std::cout << "logger test finished\n";
    return 0;
}
