#include <catch2/catch_test_macros.hpp>
#include <svdmmap/LayoutPlan.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using namespace svdmmap;

namespace {

std::vector<Register> registers_at(std::initializer_list<std::pair<const char*, uint32_t>> specs) {
    std::vector<Register> registers;
    for (const auto& [name, offset] : specs) {
        Register reg;
        reg.name = name;
        reg.address_offset = offset;
        registers.push_back(reg);
    }
    return registers;
}

} // anonymous namespace

TEST_CASE("Contiguous registers", "[layout]") {
    auto registers = registers_at({{"CR1", 0x0}, {"CR2", 0x4}, {"SR", 0x8}});
    auto plan = plan_layout(registers);

    REQUIRE(plan.slots.size() == 3);
    REQUIRE(plan.register_count() == 3);
    REQUIRE(plan.dropped.empty());
    REQUIRE(plan.size == 0xC);

    REQUIRE(plan.slots[0].name == "cr1");
    REQUIRE(plan.slots[0].type_name == "Cr1");
    REQUIRE(plan.slots[2].offset == 0x8);
    REQUIRE(plan.slots[2].source == &registers[2]);
}

TEST_CASE("Gaps become padding", "[layout]") {
    auto registers = registers_at({{"A", 0x00}, {"B", 0x08}});
    auto plan = plan_layout(registers);

    REQUIRE(plan.slots.size() == 3);
    REQUIRE_FALSE(plan.slots[0].is_padding());
    REQUIRE(plan.slots[1].is_padding());
    REQUIRE(plan.slots[1].name == "_pad0");
    REQUIRE(plan.slots[1].offset == 0x4);
    REQUIRE(plan.slots[1].size == 4);
    REQUIRE(plan.slots[2].name == "b");
    REQUIRE(plan.size == 0xC);

    SECTION("Padding is numbered per peripheral") {
        auto more = registers_at({{"A", 0x04}, {"B", 0x10}});
        auto second = plan_layout(more);
        REQUIRE(second.slots[0].name == "_pad0");
        REQUIRE(second.slots[0].size == 4);
        REQUIRE(second.slots[2].name == "_pad1");
        REQUIRE(second.slots[2].size == 8);
        REQUIRE(second.size == 0x14);
    }
}

TEST_CASE("Registers are laid out in address order", "[layout]") {
    auto registers = registers_at({{"C", 0x8}, {"A", 0x0}, {"B", 0x4}});
    auto plan = plan_layout(registers);

    REQUIRE(plan.slots.size() == 3);
    REQUIRE(plan.slots[0].name == "a");
    REQUIRE(plan.slots[1].name == "b");
    REQUIRE(plan.slots[2].name == "c");
}

TEST_CASE("Overlapping registers are dropped", "[layout]") {
    SECTION("Same offset: the first declared wins") {
        auto registers = registers_at({{"DATA", 0x0}, {"ALT", 0x0}});
        auto plan = plan_layout(registers);

        REQUIRE(plan.slots.size() == 1);
        REQUIRE(plan.slots[0].name == "data");
        REQUIRE(plan.dropped.size() == 1);
        REQUIRE(plan.dropped[0].name == "ALT");
        REQUIRE(plan.dropped[0].cursor == 0x4);
        REQUIRE(plan.size == 0x4);
    }

    SECTION("Misaligned offset inside the previous register") {
        auto registers = registers_at({{"A", 0x0}, {"B", 0x2}, {"C", 0x4}});
        auto plan = plan_layout(registers);

        REQUIRE(plan.register_count() == 2);
        REQUIRE(plan.dropped.size() == 1);
        REQUIRE(plan.dropped[0].address_offset == 0x2);
    }
}

TEST_CASE("Empty register list", "[layout]") {
    auto plan = plan_layout({});
    REQUIRE(plan.slots.empty());
    REQUIRE(plan.size == 0);
}
