#include <catch2/catch_test_macros.hpp>
#include <svdmmap/runtime/Register.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

using namespace svdmmap;

namespace {

// Plain memory standing in for a hardware register, counting accesses
class FakeRegister {
public:
    using word_type = uint32_t;

    explicit FakeRegister(uint32_t initial = 0) : value(initial) {}

    uint32_t load() const {
        ++reads;
        return value;
    }

    void store(uint32_t new_value) {
        ++writes;
        value = new_value;
    }

    uint32_t value;
    mutable int reads = 0;
    int writes = 0;
};

// Field A in bits 0-3, field B in bits 4-7
template<uint32_t Reserved = 0>
class FakeUpdate : public RegisterUpdate<FakeRegister, Reserved> {
public:
    using RegisterUpdate<FakeRegister, Reserved>::RegisterUpdate;

    FakeUpdate& set_a(uint32_t v) {
        this->stage(0xF, v & 0xF);
        return *this;
    }

    FakeUpdate& set_b(uint32_t v) {
        this->stage(0xF0, (v & 0xF) << 4);
        return *this;
    }
};

class FakeSnapshot : public RegisterSnapshot<FakeRegister> {
public:
    using RegisterSnapshot::RegisterSnapshot;

    uint32_t a() const { return bits() & 0xF; }
    uint32_t b() const { return (bits() >> 4) & 0xF; }
};

} // anonymous namespace

TEST_CASE("HardwareRegister concept", "[runtime][concepts]") {
    STATIC_REQUIRE(HardwareRegister<FakeRegister>);
    STATIC_REQUIRE(HardwareRegister<Register<uint32_t>>);
    STATIC_REQUIRE(HardwareRegister<Register<uint8_t>>);
    STATIC_REQUIRE(sizeof(Register<uint32_t>) == sizeof(uint32_t));
}

TEST_CASE("Register storage", "[runtime]") {
    Register<uint32_t> reg;
    REQUIRE(reg.load() == 0);

    reg.store(0xDEADBEEF);
    REQUIRE(reg.load() == 0xDEADBEEF);
}

TEST_CASE("Snapshot reads once", "[runtime][snapshot]") {
    FakeRegister reg(0xA5);
    FakeSnapshot snapshot(reg);
    REQUIRE(reg.reads == 1);

    reg.value = 0;  // Hardware changes after the snapshot
    REQUIRE(snapshot.a() == 0x5);
    REQUIRE(snapshot.b() == 0xA);
    REQUIRE(snapshot.bits() == 0xA5);
    REQUIRE(reg.reads == 1);
}

TEST_CASE("Staged update", "[runtime][update]") {
    FakeRegister reg(0xA5);

    SECTION("Preserves untouched fields") {
        {
            FakeUpdate<> update(reg, WritePolicy::PreserveState);
            update.set_a(3);
            REQUIRE(reg.writes == 0);
        }
        REQUIRE(reg.value == 0xA3);
        REQUIRE(reg.writes == 1);
        REQUIRE(reg.reads == 1);
    }

    SECTION("Ignoring state zeroes untouched fields") {
        {
            FakeUpdate<> update(reg, WritePolicy::IgnoreState);
            update.set_a(3);
        }
        REQUIRE(reg.value == 0x03);
        REQUIRE(reg.writes == 1);
        REQUIRE(reg.reads == 0);
    }

    SECTION("No setter, no access") {
        {
            FakeUpdate<> update(reg, WritePolicy::PreserveState);
        }
        REQUIRE(reg.writes == 0);
        REQUIRE(reg.reads == 0);
        REQUIRE(reg.value == 0xA5);
    }

    SECTION("Chained setters commit once") {
        FakeUpdate<>(reg, WritePolicy::PreserveState).set_a(1).set_b(2).set_a(4);
        REQUIRE(reg.value == 0x24);
        REQUIRE(reg.writes == 1);
    }

    SECTION("Later setter of the same field wins") {
        {
            FakeUpdate<> update(reg, WritePolicy::PreserveState);
            update.set_b(1);
            update.set_b(7);
            REQUIRE(update.staged_value() == 0x70);
            REQUIRE(update.staged_mask() == 0xF0);
        }
        REQUIRE(reg.value == 0x75);
    }

    SECTION("Reserved bits are written as zero") {
        reg.value = 0xFFFF;
        {
            FakeUpdate<0xFF00> update(reg, WritePolicy::PreserveState);
            update.set_a(3);
        }
        REQUIRE(reg.value == 0x00F3);
        REQUIRE(FakeUpdate<0xFF00>::reserved_mask == 0xFF00);
    }

    SECTION("Commits when the scope unwinds") {
        try {
            FakeUpdate<> update(reg, WritePolicy::PreserveState);
            update.set_a(0);
            throw std::runtime_error("unwind");
        } catch (const std::runtime_error&) {
        }
        REQUIRE(reg.value == 0xA0);
        REQUIRE(reg.writes == 1);
    }
}

TEST_CASE("Moving a staged update", "[runtime][update]") {
    FakeRegister reg(0xA5);

    SECTION("The moved-from writer is disarmed") {
        {
            FakeUpdate<> first(reg, WritePolicy::PreserveState);
            first.set_a(3);
            FakeUpdate<> second(std::move(first));
            REQUIRE(first.staged_mask() == 0);
            REQUIRE(second.staged_mask() == 0xF);
            REQUIRE(second.staged_value() == 0x3);
        }
        REQUIRE(reg.writes == 1);
        REQUIRE(reg.value == 0xA3);
    }

    SECTION("Returned from a function") {
        auto make = [&reg] {
            FakeUpdate<> update(reg, WritePolicy::IgnoreState);
            update.set_b(9);
            return update;
        };
        {
            auto update = make();
            REQUIRE(update.ignores_state());
            REQUIRE(reg.writes == 0);
        }
        REQUIRE(reg.writes == 1);
        REQUIRE(reg.value == 0x90);
    }
}

TEST_CASE("Unmapped enumerated values", "[runtime][enum]") {
    try {
        unmapped_enum_value("Parity", 1);
        FAIL("Expected UnmappedEnumValue");
    } catch (const UnmappedEnumValue& e) {
        REQUIRE(std::string(e.type_name()) == "Parity");
        REQUIRE(e.raw() == 1);
        REQUIRE(std::string(e.what()) == "Unmapped value 1 for enumerated type Parity");
    }
}
