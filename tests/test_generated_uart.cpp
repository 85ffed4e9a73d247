#include <catch2/catch_test_macros.hpp>
#include <acme_uart_mmap.hpp>

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

// Exercises the header svd-mmap generates from tests/fixtures/acme_uart.svd,
// with ordinary memory standing in for the peripherals.

using namespace acme_uart;

namespace {

template<typename T>
concept Readable = requires(const T& reg) { reg.get(); };

template<typename T>
concept Updatable = requires(T& reg) { reg.update(); reg.ignoring_state(); };

} // anonymous namespace

TEST_CASE("Generated layout", "[generated][layout]") {
    STATIC_REQUIRE(sizeof(uart::Uart) == 0x14);
    STATIC_REQUIRE(offsetof(uart::Uart, ctrl) == 0x00);
    STATIC_REQUIRE(offsetof(uart::Uart, status) == 0x04);
    STATIC_REQUIRE(offsetof(uart::Uart, data) == 0x0C);
    STATIC_REQUIRE(offsetof(uart::Uart, baud) == 0x10);
    STATIC_REQUIRE(sizeof(timer0::Timer0) == 0xC);
    STATIC_REQUIRE(std::is_same_v<decltype(timer0::Timer0::timer0), timer0::Timer0Reg>);
    STATIC_REQUIRE(std::is_same_v<decltype(timer0::Timer0::prescale), timer0::Prescale>);
}

TEST_CASE("Generated link declarations", "[generated][link]") {
    // UART1 is derived from UART0 and shares its layout
    STATIC_REQUIRE(std::is_same_v<decltype(uart::UART0), uart::Uart>);
    STATIC_REQUIRE(std::is_same_v<decltype(uart::UART1), uart::Uart>);
    STATIC_REQUIRE(std::is_same_v<decltype(timer0::TIMER0), timer0::Timer0>);
}

TEST_CASE("Generated access surfaces follow register access", "[generated]") {
    STATIC_REQUIRE(Readable<uart::Ctrl>);
    STATIC_REQUIRE(Updatable<uart::Ctrl>);

    STATIC_REQUIRE(Readable<uart::Status>);
    STATIC_REQUIRE_FALSE(Updatable<uart::Status>);

    STATIC_REQUIRE_FALSE(Readable<uart::Data>);
    STATIC_REQUIRE(Updatable<uart::Data>);

    STATIC_REQUIRE(std::is_same_v<decltype(std::declval<uart::CtrlGet>().enable()), bool>);
    STATIC_REQUIRE(std::is_same_v<decltype(std::declval<uart::CtrlGet>().low()), std::uint8_t>);
    STATIC_REQUIRE(std::is_same_v<decltype(std::declval<uart::StatusGet>().level()), std::uint16_t>);
    STATIC_REQUIRE(std::is_same_v<decltype(std::declval<uart::CtrlGet>().parity()), uart::Parity>);
}

TEST_CASE("Generated staged update", "[generated][update]") {
    uart::Uart block;
    block.ctrl.store(0xA5);

    SECTION("Preserves untouched fields") {
        block.ctrl.update().set_low(3);
        REQUIRE(block.ctrl.load() == 0xA3);
    }

    SECTION("Ignoring state") {
        block.ctrl.ignoring_state().set_low(3);
        REQUIRE(block.ctrl.load() == 0x03);
    }

    SECTION("Chained setters") {
        block.ctrl.update().set_low(1).set_high(2).set_enable(true);
        REQUIRE(block.ctrl.load() == 0x80000021);
    }

    SECTION("Convenience setter") {
        block.ctrl.set_parity(uart::Parity::Odd);
        REQUIRE(block.ctrl.load() == 0x3A5);
    }

    SECTION("Values wider than the field are masked") {
        block.ctrl.update().set_high(0x1F);
        REQUIRE(block.ctrl.load() == 0xF5);
    }

    SECTION("Reserved bits are written as zero") {
        block.ctrl.store(0xFFFFFFFF);
        block.ctrl.update().set_low(0);
        REQUIRE(block.ctrl.load() == 0x800003F0);
    }

    SECTION("Whole-word write") {
        block.baud.update().set_bits(0x1A0);
        REQUIRE(block.baud.load() == 0x1A0);
        REQUIRE(block.baud.get().bits() == 0x1A0);
    }

    SECTION("Staged state is visible before commit") {
        auto update = block.ctrl.update();
        update.set_low(7);
        REQUIRE(update.staged_mask() == 0xF);
        REQUIRE(block.ctrl.load() == 0xA5);
    }
}

TEST_CASE("Generated write-only register zero-fills", "[generated][update]") {
    uart::Uart block;
    block.data.store(0xFFFFFFFF);

    block.data.set_data(0x12);
    REQUIRE(block.data.load() == 0x12);

    block.data.update().set_bits(0xABCD);
    REQUIRE(block.data.load() == 0xABCD);
}

TEST_CASE("Generated snapshot reader", "[generated][snapshot]") {
    uart::Uart block;
    block.status.store(0x1FF03);

    auto status = block.status.get();
    block.status.store(0);

    REQUIRE(status.rxne());
    REQUIRE(status.txe());
    REQUIRE(status.level() == 0x1FF);
    REQUIRE_FALSE(block.status.rxne());

    SECTION("Single-field getters") {
        block.ctrl.store(0x8000005A);
        REQUIRE(block.ctrl.low() == 0xA);
        REQUIRE(block.ctrl.high() == 0x5);
        REQUIRE(block.ctrl.enable());
    }
}

TEST_CASE("Generated enumerated fields", "[generated][enum]") {
    uart::Uart block;

    block.ctrl.store(0x000);
    REQUIRE(block.ctrl.parity() == uart::Parity::None);

    block.ctrl.store(0x200);
    REQUIRE(block.ctrl.parity() == uart::Parity::Even);

    block.ctrl.store(0x300);
    REQUIRE(block.ctrl.get().parity() == uart::Parity::Odd);

    block.ctrl.store(0x100);
    REQUIRE_THROWS_AS(block.ctrl.parity(), svdmmap::UnmappedEnumValue);
}

TEST_CASE("Generated full-width field", "[generated]") {
    timer0::Timer0 timer;
    timer.count.set_value(0xDEADBEEF);
    REQUIRE(timer.count.load() == 0xDEADBEEF);
    REQUIRE(timer.count.value() == 0xDEADBEEF);
}

TEST_CASE("Generated enumerated types sharing a name", "[generated][enum]") {
    timer0::Timer0 timer;

    timer.timer0.set_mode(timer0::Mode::Periodic);
    REQUIRE(timer.timer0.load() == 0x1);
    REQUIRE(timer.timer0.mode() == timer0::Mode::Periodic);

    timer.prescale.set_mode(timer0::PrescaleMode::Div8);
    REQUIRE(timer.prescale.load() == 0x3);
    REQUIRE(timer.prescale.mode() == timer0::PrescaleMode::Div8);

    timer.prescale.store(0x1);
    REQUIRE_THROWS_AS(timer.prescale.mode(), svdmmap::UnmappedEnumValue);
}
