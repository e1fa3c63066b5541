/**
 * sysfs GPIO Backend Tests
 *
 * Runs the real backend against a scratch directory laid out like
 * /sys/class/gpio. Regular files never report POLLPRI, so watchers only
 * ever time out here; edge delivery itself needs a board.
 */

#include <cstdio>
#include <cstdlib>
#include <string>
#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../src/gpio/gpio_backend.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

/**
 * Scratch gpio class directory with export/unexport and optional
 * pre-exported lines.
 */
class FakeSysfs {
public:
    FakeSysfs() {
        char tmpl[] = "/tmp/superkit_sysfs_XXXXXX";
        if (mkdtemp(tmpl) != nullptr) {
            m_root = tmpl;
            writeFile("export", "");
            writeFile("unexport", "");
        }
    }

    ~FakeSysfs() {
        if (!m_root.empty()) {
            nftw(m_root.c_str(), removeEntry, 8, FTW_DEPTH | FTW_PHYS);
        }
    }

    bool ok() const { return !m_root.empty(); }
    const std::string &root() const { return m_root; }

    void addLine(int line) {
        std::string dir = "gpio" + std::to_string(line);
        mkdir((m_root + "/" + dir).c_str(), 0755);
        writeFile(dir + "/direction", "in\n");
        writeFile(dir + "/value", "0\n");
        writeFile(dir + "/edge", "none\n");
    }

    void writeFile(const std::string &name, const std::string &content) {
        std::ofstream file(m_root + "/" + name, std::ios::trunc);
        file << content;
    }

    std::string readFile(const std::string &name) const {
        std::ifstream file(m_root + "/" + name);
        std::stringstream buffer;
        buffer << file.rdbuf();
        std::string text = buffer.str();
        while (!text.empty() && (text.back() == '\n' || text.back() == '\0')) {
            text.pop_back();
        }
        return text;
    }

private:
    static int removeEntry(const char *path, const struct stat *, int, struct FTW *) {
        return remove(path);
    }

    std::string m_root;
};

void test_init_needs_export() {
    TEST("init() fails without a writable export file");

    FakeSysfs sysfs;
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root() + "/missing"));

    bool ok = sysfs.ok() && !gpio->init();
    ok = ok && !gpio->configurePin(17, GpioBackend::Direction::OUTPUT);

    if (ok) {
        PASS();
    } else {
        FAIL("init() succeeded without sysfs");
    }
}

void test_output_direction_low() {
    TEST("Output pin gets direction 'low'");

    FakeSysfs sysfs;
    sysfs.addLine(17);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root()));

    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(17, GpioBackend::Direction::OUTPUT);
    ok = ok && (sysfs.readFile("gpio17/direction") == "low");

    if (ok) {
        PASS();
    } else {
        FAIL("direction not set to low");
    }
}

void test_second_configure_refused() {
    TEST("Second configurePin on an owned pin fails");

    FakeSysfs sysfs;
    sysfs.addLine(27);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root()));

    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(27, GpioBackend::Direction::INPUT);
    ok = ok && !gpio->configurePin(27, GpioBackend::Direction::OUTPUT);
    ok = ok && (sysfs.readFile("gpio27/direction") == "in");

    gpio->releasePin(27);
    ok = ok && gpio->configurePin(27, GpioBackend::Direction::OUTPUT);

    if (ok) {
        PASS();
    } else {
        FAIL("Pin shared or not reusable after release");
    }
}

void test_gpio_base_offset() {
    TEST("gpio_base offsets every line path");

    FakeSysfs sysfs;
    sysfs.addLine(529);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(512, sysfs.root()));

    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(17, GpioBackend::Direction::OUTPUT);
    ok = ok && (sysfs.readFile("gpio529/direction") == "low");
    ok = ok && gpio->write(17, 1);
    ok = ok && (sysfs.readFile("gpio529/value") == "1");

    sysfs.writeFile("gpio529/value", "0\n");
    ok = ok && (gpio->read(17) == 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Line number offset not applied");
    }
}

void test_fresh_export_uses_offset() {
    TEST("Export and rollback write the offset line number");

    FakeSysfs sysfs;
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(512, sysfs.root()));

    // No gpio530 directory appears, so direction fails and export is undone
    bool ok = sysfs.ok() && gpio->init();
    ok = ok && !gpio->configurePin(18, GpioBackend::Direction::OUTPUT);
    ok = ok && (sysfs.readFile("export") == "530");
    ok = ok && (sysfs.readFile("unexport") == "530");

    if (ok) {
        PASS();
    } else {
        FAIL("export/unexport content incorrect");
    }
}

void test_adopted_line_left_exported() {
    TEST("Line exported by someone else is not unexported");

    FakeSysfs sysfs;
    sysfs.addLine(22);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root()));

    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(22, GpioBackend::Direction::INPUT);
    gpio->releasePin(22);
    ok = ok && sysfs.readFile("unexport").empty();
    ok = ok && sysfs.readFile("export").empty();

    if (ok) {
        PASS();
    } else {
        FAIL("Foreign line was torn down");
    }
}

void test_release_joins_watcher() {
    TEST("releasePin stops the watcher and disarms the edge");

    FakeSysfs sysfs;
    sysfs.addLine(27);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root()));

    std::atomic<int> calls{0};
    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(27, GpioBackend::Direction::INPUT, GpioBackend::Pull::UP);
    ok = ok && gpio->onFallingEdge(27, [&calls]() { calls++; });
    ok = ok && (sysfs.readFile("gpio27/edge") == "falling");

    usleep(150000);

    auto start = std::chrono::steady_clock::now();
    gpio->releasePin(27);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ok = ok && (sysfs.readFile("gpio27/edge") == "none");
    ok = ok && (elapsed < 1000);

    sysfs.writeFile("gpio27/value", "0\n");
    usleep(150000);
    ok = ok && (calls.load() == 0);

    // Released pin can no longer be armed
    ok = ok && !gpio->onFallingEdge(27, [&calls]() { calls++; });

    if (ok) {
        PASS();
    } else {
        char buf[64];
        snprintf(buf, sizeof(buf), "release took %lld ms, calls %d",
                 static_cast<long long>(elapsed), calls.load());
        FAIL(buf);
    }
}

void test_rearm_replaces_watcher() {
    TEST("Re-arming a pin replaces its watcher");

    FakeSysfs sysfs;
    sysfs.addLine(27);
    std::unique_ptr<GpioBackend> gpio(createGpioBackend(0, sysfs.root()));

    bool ok = sysfs.ok() && gpio->init();
    ok = ok && gpio->configurePin(27, GpioBackend::Direction::INPUT);
    ok = ok && gpio->onFallingEdge(27, []() {});
    ok = ok && gpio->onFallingEdge(27, []() {});
    ok = ok && (sysfs.readFile("gpio27/edge") == "falling");

    gpio->cleanup();
    ok = ok && (sysfs.readFile("gpio27/edge") == "none");

    if (ok) {
        PASS();
    } else {
        FAIL("Watcher state incorrect");
    }
}

int main() {
    printf("=== sysfs GPIO Backend Tests ===\n");

    test_init_needs_export();
    test_output_direction_low();
    test_second_configure_refused();
    test_gpio_base_offset();
    test_fresh_export_uses_offset();
    test_adopted_line_left_exported();
    test_release_joins_watcher();
    test_rearm_replaces_watcher();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
