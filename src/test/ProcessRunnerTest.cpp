#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "infrastructure/ProcessRunner.hpp"

using docxpdf::infrastructure::ProcessRunner;
using namespace std::chrono_literals;

int main() {
    std::cout << "[Test] Starting ProcessRunner Test..." << std::endl;

    auto ok = ProcessRunner::Run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 0"}, 5000ms);
    assert(ok.launched);
    assert(!ok.timedOut);
    assert(ok.exitCode == 0);
    assert(ok.stdOut == "out\n");
    assert(ok.stdErr == "err\n");
    std::cout << "[PASS] Captures stdout and stderr separately." << std::endl;

    auto failed = ProcessRunner::Run({"/bin/sh", "-c", "echo broken 1>&2; exit 3"}, 5000ms);
    assert(failed.launched);
    assert(!failed.timedOut);
    assert(failed.exitCode == 3);
    assert(failed.stdErr == "broken\n");
    std::cout << "[PASS] Non-zero exit code reported." << std::endl;

    // Arguments are passed verbatim, no shell splitting
    auto args = ProcessRunner::Run({"/bin/sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "c;d"}, 5000ms);
    assert(args.exitCode == 0);
    assert(args.stdOut == "a b|c;d|");
    std::cout << "[PASS] Arguments are not re-split." << std::endl;

    auto start = std::chrono::steady_clock::now();
    auto slow = ProcessRunner::Run({"/bin/sh", "-c", "sleep 20"}, 300ms);
    auto took = std::chrono::steady_clock::now() - start;
    assert(slow.launched);
    assert(slow.timedOut);
    assert(slow.exitCode == -1);
    assert(took < 5s);
    std::cout << "[PASS] Deadline enforced (" << slow.elapsed.count() << " ms)." << std::endl;

    // The child keeps the pipes open through a grandchild; the deadline still holds.
    start = std::chrono::steady_clock::now();
    auto grandchild = ProcessRunner::Run({"/bin/sh", "-c", "sleep 20 & wait"}, 300ms);
    assert(grandchild.timedOut);
    assert(std::chrono::steady_clock::now() - start < 5s);
    std::cout << "[PASS] Whole process group killed on timeout." << std::endl;

    auto missing = ProcessRunner::Run({"docxpdf-no-such-program-xyz"}, 5000ms);
    assert(!missing.launched);
    assert(!missing.timedOut);
    assert(missing.stdErr.find("docxpdf-no-such-program-xyz") != std::string::npos);
    std::cout << "[PASS] Launch failure reported distinctly." << std::endl;

    auto empty = ProcessRunner::Run({}, 1000ms);
    assert(!empty.launched);

    // Effectively unbounded timeouts still wait for the child instead of expiring at once
    for (auto huge : {std::chrono::milliseconds(3000000000LL), std::chrono::milliseconds::max()}) {
        auto patient = ProcessRunner::Run({"/bin/sh", "-c", "sleep 0.2; echo done"}, huge);
        assert(patient.launched);
        assert(!patient.timedOut);
        assert(patient.exitCode == 0);
        assert(patient.stdOut == "done\n");
    }
    std::cout << "[PASS] Very large timeouts are clamped, not overflowed." << std::endl;

    // Concurrent spawns must not leak pipe ends into each other's children:
    // a quick run finishing only when a slow sibling exits means it inherited a descriptor.
    {
        std::vector<std::thread> slow;
        for (int i = 0; i < 4; ++i) {
            slow.emplace_back([]() { ProcessRunner::Run({"/bin/sh", "-c", "sleep 3"}, 10000ms); });
        }
        std::atomic<int> delayed{0};
        std::vector<std::thread> quick;
        for (int i = 0; i < 8; ++i) {
            quick.emplace_back([&delayed]() {
                for (int n = 0; n < 20; ++n) {
                    auto t0 = std::chrono::steady_clock::now();
                    auto r = ProcessRunner::Run({"/bin/sh", "-c", "echo hi"}, 10000ms);
                    if (r.exitCode != 0 || std::chrono::steady_clock::now() - t0 > 2s) ++delayed;
                }
            });
        }
        for (auto& t : quick) t.join();
        for (auto& t : slow) t.join();
        assert(delayed == 0);
    }
    std::cout << "[PASS] Concurrent runs keep their pipes to themselves." << std::endl;

    std::cout << "[PASS] ProcessRunner Test." << std::endl;
    return 0;
}
