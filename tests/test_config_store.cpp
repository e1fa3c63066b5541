/**
 * ConfigStore Unit Tests
 */

#include <cstdio>
#include <cstdint>
#include <string>
#include <unistd.h>
#include "../src/config_store.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

void test_defaults() {
    TEST("Defaults match the kit wiring");

    ConfigStore config;

    bool ok = true;
    ok = ok && (config.shift_register_pins.data == 17);
    ok = ok && (config.shift_register_pins.latch_clock == 18);
    ok = ok && (config.shift_register_pins.shift_clock == 27);
    ok = ok && (config.bit_order == ShiftRegisterDriver::BitOrder::MSB_FIRST);
    ok = ok && (config.pulse_us == 1);
    ok = ok && (config.chain_length == 1);
    ok = ok && (config.encoder_pins.channel_a == 18);
    ok = ok && (config.encoder_pins.channel_b == 17);
    ok = ok && (config.encoder_pins.reset == 27);
    ok = ok && (config.poll_interval_ms == 10);
    ok = ok && (config.dice_button_pin == 22);
    ok = ok && (config.gpio_base == 0);

    if (ok) {
        PASS();
    } else {
        FAIL("Default mismatch");
    }
}

void test_parse_full_document() {
    TEST("Parse full document");

    ConfigStore config;
    std::string json = R"({
        "log_level": "debug",
        "gpio_base": 512,
        "shift_register": {
            "data_pin": 5, "latch_pin": 6, "shift_clock_pin": 13,
            "bit_order": "lsb_first", "pulse_us": 2, "chain_length": 2
        },
        "rotary_encoder": {"clk_pin": 23, "dt_pin": 24, "sw_pin": 25, "poll_interval_ms": 5},
        "dice": {"button_pin": 26}
    })";

    if (config.parseJson(json) != ConfigStore::Status::OK) {
        FAIL(config.lastError().c_str());
        return;
    }

    bool ok = true;
    ok = ok && (config.log_level == "debug");
    ok = ok && (config.gpio_base == 512);
    ok = ok && (config.shift_register_pins.data == 5);
    ok = ok && (config.shift_register_pins.latch_clock == 6);
    ok = ok && (config.shift_register_pins.shift_clock == 13);
    ok = ok && (config.bit_order == ShiftRegisterDriver::BitOrder::LSB_FIRST);
    ok = ok && (config.pulse_us == 2);
    ok = ok && (config.chain_length == 2);
    ok = ok && (config.encoder_pins.channel_a == 23);
    ok = ok && (config.encoder_pins.channel_b == 24);
    ok = ok && (config.encoder_pins.reset == 25);
    ok = ok && (config.poll_interval_ms == 5);
    ok = ok && (config.dice_button_pin == 26);

    if (ok) {
        PASS();
    } else {
        FAIL("Values incorrect");
    }
}

void test_partial_document_keeps_defaults() {
    TEST("Missing keys keep defaults");

    ConfigStore config;
    if (config.parseJson(R"({"shift_register": {"chain_length": 2}})") != ConfigStore::Status::OK) {
        FAIL("Parse failed");
        return;
    }

    bool ok = (config.chain_length == 2);
    ok = ok && (config.shift_register_pins.data == 17);
    ok = ok && (config.bit_order == ShiftRegisterDriver::BitOrder::MSB_FIRST);
    ok = ok && (config.poll_interval_ms == 10);

    if (ok) {
        PASS();
    } else {
        FAIL("Defaults lost");
    }
}

void test_reject_unknown_bit_order() {
    TEST("Reject unknown bit order, keep previous settings");

    ConfigStore config;
    ConfigStore::Status status = config.parseJson(R"({
        "shift_register": {"data_pin": 4, "bit_order": "middle_out"}
    })");

    bool ok = (status == ConfigStore::Status::INVALID);
    ok = ok && (config.shift_register_pins.data == 17);
    ok = ok && !config.lastError().empty();

    if (ok) {
        PASS();
    } else {
        FAIL("Should have rejected bit order");
    }
}

void test_reject_malformed_json() {
    TEST("Reject malformed JSON");

    ConfigStore config;
    bool ok = (config.parseJson("{\"log_level\": ") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson("[1, 2, 3]") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"gpio_base": "zero"})") == ConfigStore::Status::INVALID);

    if (ok) {
        PASS();
    } else {
        FAIL("Accepted malformed input");
    }
}

void test_reject_out_of_range() {
    TEST("Reject out-of-range values");

    ConfigStore config;
    bool ok = true;
    ok = ok && (config.parseJson(R"({"shift_register": {"chain_length": 0}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"shift_register": {"chain_length": 9}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"shift_register": {"pulse_us": -1}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"shift_register": {"pulse_us": 0}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"rotary_encoder": {"poll_interval_ms": 0}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"rotary_encoder": {"sw_pin": -3}})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"log_level": "chatty"})") == ConfigStore::Status::INVALID);
    ok = ok && (config.parseJson(R"({"gpio_base": -512})") == ConfigStore::Status::INVALID);
    ok = ok && (config.chain_length == 1) && (config.poll_interval_ms == 10);
    ok = ok && (config.pulse_us == 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Accepted bad value");
    }
}

void test_load_missing_file() {
    TEST("Missing file reports NOT_FOUND");

    ConfigStore config;
    ConfigStore::Status status = config.load("/nonexistent/superkit/config.json");

    if (status == ConfigStore::Status::NOT_FOUND && config.chain_length == 1) {
        PASS();
    } else {
        FAIL("Wrong status");
    }
}

void test_save_and_reload() {
    TEST("Saved file loads back the same settings");

    char path[] = "/tmp/superkit_config_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) {
        FAIL("mkstemp failed");
        return;
    }
    close(fd);

    ConfigStore config;
    config.bit_order = ShiftRegisterDriver::BitOrder::LSB_FIRST;
    config.chain_length = 2;
    config.encoder_pins.reset = 4;
    config.gpio_base = 512;

    ConfigStore loaded;
    bool ok = config.save(path);
    ok = ok && (loaded.load(path) == ConfigStore::Status::OK);
    ok = ok && (loaded.bit_order == ShiftRegisterDriver::BitOrder::LSB_FIRST);
    ok = ok && (loaded.chain_length == 2);
    ok = ok && (loaded.encoder_pins.reset == 4);
    ok = ok && (loaded.gpio_base == 512);
    unlink(path);

    if (ok) {
        PASS();
    } else {
        FAIL("Settings changed across save/load");
    }
}

void test_dump_names_keys() {
    TEST("Dump uses file key names");

    ConfigStore config;
    std::string out = config.dump();

    bool ok = true;
    ok = ok && (out.find("\"bit_order\": \"msb_first\"") != std::string::npos);
    ok = ok && (out.find("\"shift_clock_pin\": 27") != std::string::npos);
    ok = ok && (out.find("\"poll_interval_ms\": 10") != std::string::npos);

    if (ok) {
        PASS();
    } else {
        FAIL("Dump format incorrect");
    }
}

int main() {
    printf("=== Config Store Tests ===\n");

    test_defaults();
    test_parse_full_document();
    test_partial_document_keeps_defaults();
    test_reject_unknown_bit_order();
    test_reject_malformed_json();
    test_reject_out_of_range();
    test_load_missing_file();
    test_save_and_reload();
    test_dump_names_keys();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
