#include "gpio_backend.hpp"
#include "../logger.h"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#define EXPORT_SETTLE_US       50000   // udev needs time to fix permissions
#define EDGE_POLL_TIMEOUT_MS   100     // bounds releasePin() latency

static const char *TAG = "GPIO";

class GpioSysfs : public GpioBackend {
public:
    GpioSysfs(int gpio_base, const std::string &root) : base_(gpio_base), root_(root) {}
    ~GpioSysfs() override { cleanup(); }

    bool init() override {
        std::string path = root_ + "/export";
        if (access(path.c_str(), W_OK) != 0) {
            LOG_ERROR(TAG, "%s not writable: %s", path.c_str(), strerror(errno));
            return false;
        }
        initialized_ = true;
        LOG_DEBUG(TAG, "sysfs backend ready at %s (base %d)", root_.c_str(), base_);
        return true;
    }

    bool configurePin(int pin, Direction dir, Pull pull) override {
        if (!initialized_) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        if (ownedPins_.count(pin) != 0) {
            LOG_ERROR(TAG, "GPIO%d already in use", pin);
            return false;
        }

        bool exported = false;
        if (!exportPin(pin, exported)) {
            return false;
        }

        if (!setDirection(pin, dir)) {
            if (exported && !unexportPin(pin)) {
                LOG_WARN(TAG, "GPIO%d left exported", pin);
            }
            return false;
        }

        if (pull != Pull::NONE) {
            // sysfs has no bias control; pulls come from the firmware config
            LOG_DEBUG(TAG, "GPIO%d pull-%s must be set in config.txt", pin,
                      pull == Pull::UP ? "up" : "down");
        }

        ownedPins_[pin] = exported;
        return true;
    }

    bool write(int pin, int value) override {
        std::string path = pinPath(pin, "value");

        int fd = open(path.c_str(), O_WRONLY);
        if (fd < 0) {
            LOG_ERROR(TAG, "open %s: %s", path.c_str(), strerror(errno));
            return false;
        }

        const char *val = (value != 0) ? "1" : "0";
        ssize_t written = ::write(fd, val, 1);
        close(fd);

        return written == 1;
    }

    int read(int pin) override {
        std::string path = pinPath(pin, "value");

        int fd = open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            return -1;
        }

        char buf[4] = {0};
        ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
        close(fd);

        if (n <= 0) {
            return -1;
        }

        return (buf[0] == '1') ? 1 : 0;
    }

    bool onFallingEdge(int pin, EdgeCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ownedPins_.count(pin) == 0) {
            LOG_ERROR(TAG, "GPIO%d not configured, cannot watch edges", pin);
            return false;
        }

        stopWatcher(pin);

        if (!writeAttr(pin, "edge", "falling")) {
            LOG_ERROR(TAG, "GPIO%d does not support edge interrupts", pin);
            return false;
        }

        std::string path = pinPath(pin, "value");
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) {
            LOG_ERROR(TAG, "open %s: %s", path.c_str(), strerror(errno));
            return false;
        }

        std::unique_ptr<EdgeWatcher> watcher(new EdgeWatcher());
        watcher->fd = fd;
        watcher->pin = pin;
        watcher->callback = callback;
        watcher->thread = std::thread(&GpioSysfs::watchLoop, watcher.get());
        watchers_[pin] = std::move(watcher);
        return true;
    }

    void releasePin(int pin) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ownedPins_.find(pin);
        if (it == ownedPins_.end()) {
            return;
        }
        bool exported = it->second;
        ownedPins_.erase(it);

        stopWatcher(pin);

        // A line someone else exported is handed back as found
        if (exported && !unexportPin(pin)) {
            LOG_WARN(TAG, "GPIO%d unexport failed", pin);
        }
    }

    void cleanup() override {
        std::map<int, bool> pins;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pins = ownedPins_;
        }
        for (const auto &entry : pins) {
            releasePin(entry.first);
        }
        initialized_ = false;
    }

private:
    struct EdgeWatcher {
        int fd = -1;
        int pin = -1;
        std::atomic<bool> stop{false};
        EdgeCallback callback;
        std::thread thread;
    };

    int base_;
    std::string root_;
    bool initialized_ = false;
    std::map<int, bool> ownedPins_;   // pin -> exported by us
    std::map<int, std::unique_ptr<EdgeWatcher>> watchers_;
    std::mutex mutex_;

    static void watchLoop(EdgeWatcher *w) {
        char buf[4];

        // Consume the current value so the first poll only reports new edges
        if (lseek(w->fd, 0, SEEK_SET) < 0 || ::read(w->fd, buf, sizeof(buf) - 1) < 0) {
            LOG_WARN(TAG, "GPIO%d initial value read failed: %s", w->pin, strerror(errno));
        }

        while (!w->stop.load()) {
            struct pollfd pfd;
            pfd.fd = w->fd;
            pfd.events = POLLPRI | POLLERR;
            pfd.revents = 0;

            int rc = poll(&pfd, 1, EDGE_POLL_TIMEOUT_MS);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR(TAG, "GPIO%d poll: %s", w->pin, strerror(errno));
                break;
            }
            if (rc == 0) continue;

            if (lseek(w->fd, 0, SEEK_SET) < 0) {
                LOG_ERROR(TAG, "GPIO%d lseek: %s", w->pin, strerror(errno));
                break;
            }
            ssize_t n = ::read(w->fd, buf, sizeof(buf) - 1);
            // Contact bounce can raise the line again before we read it
            if (n > 0 && buf[0] == '0' && !w->stop.load()) {
                w->callback();
            }
        }
    }

    // Caller holds mutex_
    void stopWatcher(int pin) {
        auto it = watchers_.find(pin);
        if (it == watchers_.end()) return;

        EdgeWatcher *w = it->second.get();
        w->stop.store(true);
        if (w->thread.joinable()) {
            w->thread.join();
        }
        close(w->fd);
        if (!writeAttr(pin, "edge", "none")) {
            LOG_WARN(TAG, "GPIO%d edge detection still armed", pin);
        }
        watchers_.erase(it);
    }

    std::string lineDir(int pin) const {
        return root_ + "/gpio" + std::to_string(pin + base_);
    }

    std::string pinPath(int pin, const char *attr) const {
        return lineDir(pin) + "/" + attr;
    }

    bool writeFile(const std::string &path, const std::string &value) {
        int fd = open(path.c_str(), O_WRONLY | O_TRUNC);
        if (fd < 0) {
            return false;
        }

        ssize_t written = ::write(fd, value.c_str(), value.size());
        close(fd);

        return written == static_cast<ssize_t>(value.size());
    }

    bool writeAttr(int pin, const char *attr, const char *value) {
        return writeFile(pinPath(pin, attr), value);
    }

    bool exportPin(int pin, bool &exported) {
        exported = false;
        if (access(lineDir(pin).c_str(), F_OK) == 0) {
            // Left over from a crashed run or held by another program
            LOG_WARN(TAG, "GPIO%d (line %d) already exported, taking it over", pin, pin + base_);
            return true;
        }

        if (!writeFile(root_ + "/export", std::to_string(pin + base_))) {
            LOG_ERROR(TAG, "export GPIO%d (line %d) refused: %s", pin, pin + base_, strerror(errno));
            return false;
        }

        exported = true;
        usleep(EXPORT_SETTLE_US);
        return true;
    }

    bool unexportPin(int pin) {
        return writeFile(root_ + "/unexport", std::to_string(pin + base_));
    }

    bool setDirection(int pin, Direction dir) {
        // "low" sets output direction with the line already driven low
        const char *dirStr = (dir == Direction::OUTPUT) ? "low" : "in";
        if (!writeAttr(pin, "direction", dirStr)) {
            LOG_ERROR(TAG, "GPIO%d set direction %s failed", pin, dirStr);
            return false;
        }
        return true;
    }
};

GpioBackend *createGpioBackend(int gpio_base, const std::string &sysfs_root) {
    return new GpioSysfs(gpio_base, sysfs_root);
}
