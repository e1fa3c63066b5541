#ifndef GPIO_BACKEND_HPP
#define GPIO_BACKEND_HPP

#include <cstdint>
#include <functional>
#include <string>

#define GPIO_SYSFS_ROOT "/sys/class/gpio"

/**
 * GPIO Backend Interface
 *
 * Abstract interface for raw digital line access.
 * Implementations: sysfs (target), MockGpioBackend (tests).
 *
 * A pin configured through one backend is owned by the caller until
 * releasePin(); a second configurePin() on the same pin fails.
 */
class GpioBackend {
public:
    virtual ~GpioBackend() = default;

    enum class Direction {
        INPUT,
        OUTPUT
    };

    enum class Pull {
        NONE,
        UP,
        DOWN
    };

    // Invoked on an unspecified thread, never concurrently for one pin
    using EdgeCallback = std::function<void()>;

    /**
     * Initialize GPIO subsystem.
     */
    virtual bool init() = 0;

    /**
     * Export and configure a GPIO pin. Fails if the pin is already owned.
     */
    virtual bool configurePin(int pin, Direction dir, Pull pull = Pull::NONE) = 0;

    /**
     * Write to output pin (0 or 1).
     */
    virtual bool write(int pin, int value) = 0;

    /**
     * Read pin level. Returns 0, 1 or -1 on error.
     */
    virtual int read(int pin) = 0;

    /**
     * Register a falling-edge notification on an input pin.
     * Replaces any callback already registered for the pin.
     */
    virtual bool onFallingEdge(int pin, EdgeCallback callback) = 0;

    /**
     * Stop notifications and return the pin to the unconfigured state.
     * No callback for the pin runs after this returns. Idempotent.
     */
    virtual void releasePin(int pin) = 0;

    /**
     * Release every pin and shut the subsystem down.
     */
    virtual void cleanup() = 0;
};

/**
 * Create platform GPIO backend (sysfs). gpio_base is added to every
 * header pin number to form the kernel line number. sysfs_root points
 * at the gpio class directory.
 */
GpioBackend *createGpioBackend(int gpio_base = 0, const std::string &sysfs_root = GPIO_SYSFS_ROOT);

#endif // GPIO_BACKEND_HPP
