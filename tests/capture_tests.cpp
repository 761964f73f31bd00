#include "cmdprove.h"
#include "utils.h"

#include <cassert>
#include <cstdio>
#include <functional>
#include <string>

void addTest(std::string name, std::function<void()> func);

using namespace cmdprove;

namespace {

void allocates_sequential_names() {
    const std::filesystem::path dir = createTempDir("/tmp/cmdprove-tests.XXXXXX");
    CaptureStore store(dir);
    assert(store.directory() == dir);

    const CapturePaths first = store.allocate();
    assert(first.out == dir / "test00.out");
    assert(first.err == dir / "test00.err");
    assert(first.ret == dir / "test00.ret");
    assert(std::filesystem::exists(first.out));
    assert(std::filesystem::exists(first.err));
    assert(std::filesystem::exists(first.ret));

    const CapturePaths second = store.allocate();
    assert(second.out == dir / "test01.out");
    assert(second.of(Channel::Ret) == dir / "test01.ret");
    std::filesystem::remove_all(dir);
}

void skips_partially_taken_candidates() {
    const std::filesystem::path dir = createTempDir("/tmp/cmdprove-tests.XXXXXX");
    writeFile(dir / "run00.err", "left over");

    CaptureStore store(dir);
    const CapturePaths paths = store.allocate("run");
    assert(paths.out == dir / "run01.out");
    assert(!std::filesystem::exists(dir / "run00.out"));
    std::filesystem::remove_all(dir);
}

void gives_up_after_all_candidates() {
    const std::filesystem::path dir = createTempDir("/tmp/cmdprove-tests.XXXXXX");
    for (int i = 0; i < CaptureStore::kMaxCandidates; ++i) {
        char name[32];
        std::snprintf(name, sizeof(name), "full%02d.ret", i);
        writeFile(dir / name, "0\n");
    }

    CaptureStore store(dir);
    bool threw = false;
    try {
        store.allocate("full");
    } catch (const TestError&) {
        threw = true;
    }
    assert(threw);

    const CapturePaths other = store.allocate("other");
    assert(other.out == dir / "other00.out");
    std::filesystem::remove_all(dir);
}

} // namespace

void register_capture_tests() {
    addTest("capture sequential", allocates_sequential_names);
    addTest("capture skip taken", skips_partially_taken_candidates);
    addTest("capture exhaustion", gives_up_after_all_candidates);
}
