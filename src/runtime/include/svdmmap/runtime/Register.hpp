// Copyright © 2025 Robert Smallshire <robert@smallshire.org.uk>
//
// This file is part of SvdMmap.
//
// SvdMmap is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. SvdMmap is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with SvdMmap.
// If not, see <https://www.gnu.org/licenses/>.

#ifndef SVDMMAP_RUNTIME_REGISTER_HPP
#define SVDMMAP_RUNTIME_REGISTER_HPP

#include "svdmmap/runtime/VolatileCell.hpp"

#include <concepts>
#include <cstdint>

#if defined(__cpp_exceptions)
#include <stdexcept>
#include <string>
#endif

namespace svdmmap {

// Concept for anything the access protocol can read and write a whole word of.
// Generated register classes satisfy it through Register<Word>; tests satisfy
// it with plain memory.
template<typename T>
concept HardwareRegister = requires(T& reg, const T& creg, typename T::word_type value) {
    requires std::unsigned_integral<typename T::word_type>;
    { creg.load() } -> std::same_as<typename T::word_type>;
    { reg.store(value) } -> std::same_as<void>;
};

// Storage for one memory-mapped register. Generated register classes derive
// from this and add no data members, so sizeof(Derived) == sizeof(Word).
template<std::unsigned_integral Word>
class Register {
public:
    using word_type = Word;

    // Raw single-access read and write of the whole word
    Word load() const noexcept { return cell_.get(); }
    void store(Word value) noexcept { cell_.set(value); }

private:
    VolatileCell<Word> cell_;
};

// Immutable copy of a register taken with exactly one hardware read.
// Every field getter of a derived snapshot decodes the cached word.
template<HardwareRegister Reg>
class RegisterSnapshot {
public:
    using word_type = typename Reg::word_type;

    explicit RegisterSnapshot(const Reg& reg) noexcept
        : value_(reg.load()) {}

    word_type bits() const noexcept { return value_; }

private:
    word_type value_;
};

// What a staged update writes into bits no setter touched
enum class WritePolicy : uint8_t {
    PreserveState,  // Read the register at commit and keep those bits
    IgnoreState     // Write those bits as zero
};

// Staged write to one register.
//
// Setters in the derived class call stage() to accumulate field bits and the
// mask of touched fields; nothing reaches hardware until the destructor, which
// performs at most one store:
//
//   base      = ignores_state() ? 0 : reg.load()
//   preserved = base & ~ReservedMask & ~mask
//   reg.store(value | preserved)
//
// A writer whose mask is still zero at destruction does not touch the register.
// Writers are move-only; the moved-from writer is disarmed.
template<HardwareRegister Reg, typename Reg::word_type ReservedMask = 0>
class RegisterUpdate {
public:
    using word_type = typename Reg::word_type;

    static constexpr word_type reserved_mask = ReservedMask;

    RegisterUpdate(Reg& reg, WritePolicy policy) noexcept
        : reg_(&reg)
        , ignore_state_(policy == WritePolicy::IgnoreState) {}

    ~RegisterUpdate() { commit(); }

    RegisterUpdate(const RegisterUpdate&) = delete;
    RegisterUpdate& operator=(const RegisterUpdate&) = delete;

    RegisterUpdate(RegisterUpdate&& other) noexcept
        : reg_(other.reg_)
        , value_(other.value_)
        , mask_(other.mask_)
        , ignore_state_(other.ignore_state_) {
        other.mask_ = 0;
    }

    RegisterUpdate& operator=(RegisterUpdate&&) = delete;

    word_type staged_value() const noexcept { return value_; }
    word_type staged_mask() const noexcept { return mask_; }
    bool ignores_state() const noexcept { return ignore_state_; }

protected:
    // Replace the bits under mask with bits, and mark them as touched
    void stage(word_type mask, word_type bits) noexcept {
        value_ = static_cast<word_type>((value_ & ~mask) | (bits & mask));
        mask_ = static_cast<word_type>(mask_ | mask);
    }

private:
    void commit() noexcept {
        if (mask_ == 0) {
            return;
        }
        const word_type base = ignore_state_ ? word_type{0} : reg_->load();
        const word_type preserved = static_cast<word_type>(base & ~ReservedMask & ~mask_);
        reg_->store(static_cast<word_type>(value_ | preserved));
    }

    Reg* reg_;
    word_type value_ = 0;
    word_type mask_ = 0;
    bool ignore_state_;
};

#if defined(__cpp_exceptions)

// Raised by generated getters when hardware holds a value that is not one of
// the enumerated variants of the field.
class UnmappedEnumValue : public std::runtime_error {
public:
    UnmappedEnumValue(const char* type_name, uint64_t raw)
        : std::runtime_error("Unmapped value " + std::to_string(raw) +
                             " for enumerated type " + type_name)
        , type_name_(type_name)
        , raw_(raw) {}

    const char* type_name() const noexcept { return type_name_; }
    uint64_t raw() const noexcept { return raw_; }

private:
    const char* type_name_;
    uint64_t raw_;
};

#endif

// Signal a raw field value with no enumerated variant. Throws UnmappedEnumValue
// where exceptions are available and traps otherwise; never returns.
[[noreturn]] inline void unmapped_enum_value(const char* type_name, uint64_t raw) {
#if defined(__cpp_exceptions)
    throw UnmappedEnumValue(type_name, raw);
#else
    (void)type_name; (void)raw;
    __builtin_trap();
#endif
}

} // namespace svdmmap

#endif // SVDMMAP_RUNTIME_REGISTER_HPP
