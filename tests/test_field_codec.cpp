#include <catch2/catch_test_macros.hpp>
#include <svdmmap/Errors.hpp>
#include <svdmmap/FieldCodec.hpp>

#include <cstdint>

using namespace svdmmap;

namespace {

Field make_field(const char* name, uint32_t offset, uint32_t width) {
    Field field;
    field.name = name;
    field.bit_offset = offset;
    field.bit_width = width;
    return field;
}

} // anonymous namespace

TEST_CASE("Storage type selection", "[field_codec]") {
    REQUIRE(select_storage_type("F", 1) == StorageType::Bool);
    REQUIRE(select_storage_type("F", 2) == StorageType::U8);
    REQUIRE(select_storage_type("F", 8) == StorageType::U8);
    REQUIRE(select_storage_type("F", 9) == StorageType::U16);
    REQUIRE(select_storage_type("F", 16) == StorageType::U16);
    REQUIRE(select_storage_type("F", 17) == StorageType::U32);
    REQUIRE(select_storage_type("F", 32) == StorageType::U32);
    REQUIRE(select_storage_type("F", 33) == StorageType::U64);
    REQUIRE(select_storage_type("F", 64) == StorageType::U64);

    REQUIRE(storage_type_name(StorageType::Bool) == "bool");
    REQUIRE(storage_type_name(StorageType::U16) == "std::uint16_t");
}

TEST_CASE("Unsupported bit widths", "[field_codec][errors]") {
    SECTION("Width zero") {
        REQUIRE_THROWS_AS(select_storage_type("EMPTY", 0), UnsupportedBitWidth);
    }

    SECTION("Width 65") {
        try {
            select_storage_type("HUGE", 65);
            FAIL("Expected UnsupportedBitWidth");
        } catch (const UnsupportedBitWidth& e) {
            REQUIRE(e.field_name() == "HUGE");
            REQUIRE(e.bit_width() == 65);
        }
    }

    SECTION("Codec construction") {
        REQUIRE_THROWS_AS(FieldCodec(make_field("BAD", 0, 0), std::nullopt), GenerationError);
    }
}

TEST_CASE("Field masks", "[field_codec]") {
    REQUIRE(field_mask(1) == 0x1);
    REQUIRE(field_mask(4) == 0xF);
    REQUIRE(field_mask(32) == 0xFFFFFFFFull);
    REQUIRE(field_mask(64) == ~uint64_t{0});

    FieldCodec codec(make_field("MODE", 8, 2), std::nullopt);
    REQUIRE(codec.mask() == 0x3);
    REQUIRE(codec.shifted_mask() == 0x300);
    REQUIRE(codec.word_mask() == 0x300u);
}

TEST_CASE("Codec round trip", "[field_codec]") {
    const uint32_t widths[] = {1, 2, 4, 7, 8, 9, 16, 17, 31, 32};
    for (uint32_t width : widths) {
        for (uint32_t offset = 0; offset + width <= 32; offset += 3) {
            FieldCodec codec(make_field("F", offset, width), std::nullopt);
            const uint64_t max = field_mask(width);
            for (uint64_t value : {uint64_t{0}, uint64_t{1} & max, max / 2, max}) {
                auto encoded = codec.encode(value);
                REQUIRE((encoded.bits & ~encoded.mask) == 0);
                REQUIRE(codec.decode(encoded.bits) == value);
            }
        }
    }
}

TEST_CASE("Encoding leaves other bits alone", "[field_codec]") {
    FieldCodec codec(make_field("A", 0, 4), std::nullopt);
    auto encoded = codec.encode(0x13);  // Wider than the field
    REQUIRE(encoded.bits == 0x3);
    REQUIRE(encoded.mask == 0xF);

    const uint64_t hardware = 0xA5;
    REQUIRE(((hardware & ~encoded.mask) | encoded.bits) == 0xA3);
}

TEST_CASE("Readability and writability", "[field_codec]") {
    auto field = make_field("F", 0, 1);

    SECTION("Register access applies") {
        REQUIRE_FALSE(FieldCodec(field, Access::WriteOnly).readable());
        REQUIRE(FieldCodec(field, Access::WriteOnly).writable());
        REQUIRE(FieldCodec(field, Access::ReadOnly).readable());
        REQUIRE_FALSE(FieldCodec(field, Access::ReadOnly).writable());
    }

    SECTION("Field access narrows it") {
        field.access = Access::ReadOnly;
        FieldCodec codec(field, Access::ReadWrite);
        REQUIRE(codec.readable());
        REQUIRE_FALSE(codec.writable());
    }

    SECTION("No access given") {
        FieldCodec codec(field, std::nullopt);
        REQUIRE(codec.readable());
        REQUIRE(codec.writable());
    }
}

TEST_CASE("Accessor names", "[field_codec]") {
    REQUIRE(FieldCodec(make_field("TXEIE", 0, 1), std::nullopt).accessor_name() == "txeie");
    REQUIRE(FieldCodec(make_field("TXEIE", 0, 1), std::nullopt).setter_name() == "set_txeie");

    SECTION("Names used by the runtime classes are suffixed") {
        REQUIRE(FieldCodec(make_field("UPDATE", 0, 1), std::nullopt).accessor_name() == "update_");
        REQUIRE(FieldCodec(make_field("BITS", 0, 4), std::nullopt).accessor_name() == "bits_");
    }
}

TEST_CASE("Emitted expressions", "[field_codec]") {
    SECTION("Offset zero") {
        FieldCodec codec(make_field("LOW", 0, 4), std::nullopt);
        REQUIRE(codec.raw_expression("w") == "w & 0xfu");
        REQUIRE(codec.decode_expression("w") == "static_cast<std::uint8_t>(w & 0xfu)");
        REQUIRE(codec.encode_expression("v") ==
                "static_cast<std::uint32_t>(static_cast<std::uint32_t>(v) & 0xfu)");
        REQUIRE(codec.value_type() == "std::uint8_t");
    }

    SECTION("Single bit") {
        FieldCodec codec(make_field("EN", 11, 1), std::nullopt);
        REQUIRE(codec.decode_expression("w") == "((w >> 11) & 0x1u) != 0");
        REQUIRE(codec.encode_expression("v") ==
                "static_cast<std::uint32_t>((static_cast<std::uint32_t>(v) & 0x1u) << 11)");
        REQUIRE(codec.value_type() == "bool");
    }

    SECTION("Beyond the register word") {
        FieldCodec codec(make_field("WIDE", 16, 33), std::nullopt);
        REQUIRE(codec.raw_expression("w") ==
                "(static_cast<std::uint64_t>(w) >> 16) & 0x1ffffffffull");
    }
}

TEST_CASE("Enumerated types", "[field_codec][enum]") {
    auto field = make_field("PARITY", 8, 2);
    field.enumerated_values = EnumeratedValues{
        std::nullopt,
        {{"NONE", 0, std::nullopt}, {"EVEN", 2, std::nullopt}, {"ODD", 3, std::nullopt},
         {"EVEN", 1, std::nullopt}}};

    auto def = make_enum_type(field);
    REQUIRE(def.has_value());
    REQUIRE(def->type_name == "Parity");
    REQUIRE(def->underlying_type == "std::uint32_t");

    SECTION("First of a duplicated name wins") {
        REQUIRE(def->variants.size() == 3);
        REQUIRE(def->variants[1].name == "Even");
        REQUIRE(def->variants[1].value == 2);
    }

    SECTION("Raw values map to variants") {
        FieldCodec codec(field, std::nullopt);
        REQUIRE(codec.value_type() == "Parity");

        auto even = def->find_variant(codec.decode(0x200));
        REQUIRE(even != nullptr);
        REQUIRE(even->name == "Even");
        REQUIRE(def->find_variant(codec.decode(0x100)) == nullptr);
    }

    SECTION("Named enumerations") {
        field.enumerated_values->name = "PARITY_MODE";
        REQUIRE(make_enum_type(field)->type_name == "ParityMode");
    }

    SECTION("Plain fields have none") {
        REQUIRE_FALSE(make_enum_type(make_field("LOW", 0, 4)).has_value());
    }
}

TEST_CASE("Hexadecimal literals", "[field_codec]") {
    REQUIRE(hex_literal(0) == "0x0u");
    REQUIRE(hex_literal(0x7ffffc00) == "0x7ffffc00u");
    REQUIRE(hex_literal(0xffffffff) == "0xffffffffu");
    REQUIRE(hex_literal(0x100000000ull) == "0x100000000ull");
}
