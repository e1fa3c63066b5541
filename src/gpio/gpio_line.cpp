#include "gpio_line.hpp"
#include "../logger.h"

#include <utility>

const char *gpioStatusToString(GpioStatus status) {
    switch (status) {
        case GpioStatus::OK:                        return "ok";
        case GpioStatus::RESOURCE_UNAVAILABLE:      return "resource unavailable";
        case GpioStatus::NOTIFICATION_SETUP_FAILED: return "notification setup failed";
        case GpioStatus::IO_ERROR:                  return "I/O error";
    }
    return "unknown";
}

GpioLine::~GpioLine() {
    release();
}

GpioLine::GpioLine(GpioLine&& other) noexcept
    : m_backend(other.m_backend)
    , m_pin(other.m_pin)
    , m_mode(other.m_mode)
{
    other.m_backend = nullptr;
    other.m_pin = -1;
}

GpioLine& GpioLine::operator=(GpioLine&& other) noexcept {
    if (this != &other) {
        release();
        m_backend = other.m_backend;
        m_pin = other.m_pin;
        m_mode = other.m_mode;
        other.m_backend = nullptr;
        other.m_pin = -1;
    }
    return *this;
}

GpioStatus GpioLine::acquire(GpioBackend &backend, int pin, Mode mode) {
    release();

    if (pin < 0) {
        LOG_ERROR("GPIO", "Invalid pin %d", pin);
        return GpioStatus::RESOURCE_UNAVAILABLE;
    }

    GpioBackend::Direction dir = GpioBackend::Direction::INPUT;
    GpioBackend::Pull pull = GpioBackend::Pull::NONE;
    switch (mode) {
        case Mode::INPUT:
            break;
        case Mode::INPUT_PULLUP:
            pull = GpioBackend::Pull::UP;
            break;
        case Mode::OUTPUT:
            dir = GpioBackend::Direction::OUTPUT;
            break;
    }

    if (!backend.configurePin(pin, dir, pull)) {
        return GpioStatus::RESOURCE_UNAVAILABLE;
    }

    m_backend = &backend;
    m_pin = pin;
    m_mode = mode;

    if (mode == Mode::OUTPUT && !m_backend->write(m_pin, 0)) {
        LOG_ERROR("GPIO", "GPIO%d could not be driven low", m_pin);
        release();
        return GpioStatus::RESOURCE_UNAVAILABLE;
    }

    return GpioStatus::OK;
}

bool GpioLine::set(int level) {
    if (!m_backend || m_mode != Mode::OUTPUT) return false;
    return m_backend->write(m_pin, level != 0 ? 1 : 0);
}

int GpioLine::read() {
    if (!m_backend) return -1;
    return m_backend->read(m_pin);
}

GpioStatus GpioLine::onFallingEdge(GpioBackend::EdgeCallback callback) {
    if (!m_backend || m_mode == Mode::OUTPUT) {
        return GpioStatus::NOTIFICATION_SETUP_FAILED;
    }
    if (!m_backend->onFallingEdge(m_pin, callback)) {
        return GpioStatus::NOTIFICATION_SETUP_FAILED;
    }
    return GpioStatus::OK;
}

void GpioLine::release() {
    if (!m_backend) return;
    m_backend->releasePin(m_pin);
    m_backend = nullptr;
    m_pin = -1;
}
