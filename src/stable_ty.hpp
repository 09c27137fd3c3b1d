#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "opaque.hpp"

// Stable counterparts of crates, items and types. Values here own their data;
// only `Ty` refers back into the session that minted it.
namespace smir::stable {

using CrateNum = std::size_t;
// Index into the session's definition table.
using DefId = std::size_t;

struct Ty {
    std::size_t id = 0;

    bool operator==(const Ty& o) const { return id == o.id; }
    bool operator!=(const Ty& o) const { return id != o.id; }
};

struct Crate {
    CrateNum id = 0;
    std::string name{};
    bool is_local = false;

    bool operator==(const Crate& o) const {
        return id == o.id && name == o.name && is_local == o.is_local;
    }
};

struct CrateItem {
    DefId def = 0;

    bool operator==(const CrateItem& o) const { return def == o.def; }
};

using CrateItems = std::vector<CrateItem>;

struct AdtDef {
    DefId def = 0;
    bool operator==(const AdtDef& o) const { return def == o.def; }
};
struct FnDef {
    DefId def = 0;
    bool operator==(const FnDef& o) const { return def == o.def; }
};
struct ClosureDef {
    DefId def = 0;
    bool operator==(const ClosureDef& o) const { return def == o.def; }
};
struct GeneratorDef {
    DefId def = 0;
    bool operator==(const GeneratorDef& o) const { return def == o.def; }
};
struct ForeignDef {
    DefId def = 0;
    bool operator==(const ForeignDef& o) const { return def == o.def; }
};
struct ParamDef {
    DefId def = 0;
    bool operator==(const ParamDef& o) const { return def == o.def; }
};
struct BrNamedDef {
    DefId def = 0;
    bool operator==(const BrNamedDef& o) const { return def == o.def; }
};

enum class Mutability : std::uint8_t { Not, Mut };
enum class IntTy : std::uint8_t { Isize, I8, I16, I32, I64, I128 };
enum class UintTy : std::uint8_t { Usize, U8, U16, U32, U64, U128 };
enum class FloatTy : std::uint8_t { F32, F64 };
enum class Movability : std::uint8_t { Static, Movable };
enum class Safety : std::uint8_t { Unsafe, Normal };

struct GenericArgKind {
    struct Lifetime {
        Opaque region{};
    };
    struct Type {
        Ty ty{};
    };
    struct Const {
        Opaque value{};
    };

    std::variant<Lifetime, Type, Const> data{};
};

struct GenericArgs {
    std::vector<GenericArgKind> args{};
};

enum class AbiTag : std::uint8_t {
    Rust,
    C,
    Cdecl,
    Stdcall,
    Fastcall,
    Vectorcall,
    Thiscall,
    Aapcs,
    Win64,
    SysV64,
    PtxKernel,
    Msp430Interrupt,
    X86Interrupt,
    AmdGpuKernel,
    EfiApi,
    AvrInterrupt,
    AvrNonBlockingInterrupt,
    CCmseNonSecureCall,
    Wasm,
    System,
    RustIntrinsic,
    RustCall,
    PlatformIntrinsic,
    Unadjusted,
    RustCold,
};

struct Abi {
    AbiTag tag = AbiTag::Rust;
    bool unwind = false;
};

struct FnSig {
    std::vector<Ty> inputs_and_output{};
    bool c_variadic = false;
    Safety safety = Safety::Normal;
    Abi abi{};

    Ty output() const { return inputs_and_output.back(); }
};

struct BoundTyKind {
    struct Anon {};
    struct Param {
        ParamDef def{};
        std::string name{};
    };

    std::variant<Anon, Param> data{};
};

struct BoundRegionKind {
    struct BrAnon {
        std::optional<Opaque> span{};
    };
    struct BrNamed {
        BrNamedDef def{};
        std::string name{};
    };
    struct BrEnv {};

    std::variant<BrAnon, BrNamed, BrEnv> data{};
};

struct BoundVariableKind {
    struct Const {};

    std::variant<BoundTyKind, BoundRegionKind, Const> data{};
};

template <typename T>
struct Binder {
    T value{};
    std::vector<BoundVariableKind> bound_vars{};
};

using PolyFnSig = Binder<FnSig>;

struct RigidTy {
    struct Bool {};
    struct Char {};
    struct Int {
        IntTy ty{};
    };
    struct Uint {
        UintTy ty{};
    };
    struct Float {
        FloatTy ty{};
    };
    struct Adt {
        AdtDef def{};
        GenericArgs args{};
    };
    struct Foreign {
        ForeignDef def{};
    };
    struct Str {};
    struct Array {
        Ty elem{};
        Opaque len{};
    };
    struct Slice {
        Ty elem{};
    };
    struct RawPtr {
        Ty pointee{};
        Mutability mutbl{};
    };
    struct Ref {
        Opaque region{};
        Ty pointee{};
        Mutability mutbl{};
    };
    struct FnDef {
        stable::FnDef def{};
        GenericArgs args{};
    };
    struct FnPtr {
        PolyFnSig sig{};
    };
    struct Closure {
        ClosureDef def{};
        GenericArgs args{};
    };
    struct Generator {
        GeneratorDef def{};
        GenericArgs args{};
        Movability movability{};
    };
    struct Never {};
    struct Tuple {
        std::vector<Ty> elems{};
    };

    std::variant<Bool, Char, Int, Uint, Float, Adt, Foreign, Str, Array, Slice,
                 RawPtr, Ref, FnDef, FnPtr, Closure, Generator, Never, Tuple>
        data{Never{}};
};

// Only rigid types have a stable form so far.
struct TyKind {
    RigidTy rigid{};

    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&rigid.data);
    }
};

const char* abi_tag_name(AbiTag tag);

}  // namespace smir::stable
