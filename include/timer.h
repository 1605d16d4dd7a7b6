#ifndef TIMER_H
#define TIMER_H

#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <iostream>
#include <iomanip>
#include <cstdint>

class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using ns = std::chrono::nanoseconds;

    struct Record {
        std::string name;
        int64_t duration_ns;
        uint32_t calls;
    };

    // Starts a phase on construction and stops it on scope exit
    class Phase {
    public:
        explicit Phase(const std::string& name): _timer(Timer::instance()) { _timer.start(name); }
        ~Phase() { _timer.stop(); }

        Phase(const Phase&) = delete;
        Phase& operator=(const Phase&) = delete;

    private:
        Timer& _timer;
    };

    static Timer& instance() {
        static Timer timer_instance;
        return timer_instance;
    }

    void start(const std::string& name) {
        if (running) {
            throw std::logic_error("Timer is already running: " + *current_name);
        }
        running = true;
        current_name = name;
        start_time = Clock::now();
    }

    int64_t stop() {
        if (!running) {
            throw std::logic_error("Timer is not running");
        }
        auto end_time = Clock::now();
        auto duration = std::chrono::duration_cast<ns>(end_time - *start_time).count();
        auto it = index.find(*current_name);
        if (it != index.end()) {
            records[it->second].duration_ns += duration;
            records[it->second].calls++;
        } else {
            index[*current_name] = records.size();
            records.push_back({ *current_name, static_cast<int64_t>(duration), 1 });
        }
        running = false;
        current_name.reset();
        start_time.reset();
        return static_cast<int64_t>(duration);
    }

    bool is_running() const {
        return running;
    }

    const std::vector<Record>& get_records() const {
        return records;
    }

    void reset() {
        records.clear();
        index.clear();
    }

    // Phases in the order they first ran
    void print_records(std::ostream& out = std::cout) const {
        std::ios::fmtflags flags = out.flags();
        std::streamsize precision = out.precision();
        int64_t total_ns = 0;
        for (const auto& record : records) {
            out << std::setw(40) << std::left << record.name
                << ": " << std::setw(8) << std::right << record.calls << " x"
                << std::setw(14) << std::right << std::fixed << std::setprecision(3)
                << record.duration_ns / 1e6 << " ms" << std::endl;
            total_ns += record.duration_ns;
        }

        out << std::setw(40) << std::left << "Total"
            << ": " << std::setw(25) << std::right << std::fixed << std::setprecision(3)
            << total_ns / 1e6 << " ms" << std::endl;
        out.flags(flags);
        out.precision(precision);
    }

private:
    Timer() = default;
    ~Timer() = default;
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    bool running{false};
    std::optional<std::string> current_name;
    std::optional<Clock::time_point> start_time;
    std::vector<Record> records;
    std::unordered_map<std::string, size_t> index;
};

#endif // TIMER_H
