#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/Hashing.h>
#include <llvm/ADT/STLFunctionalExtras.h>

#include "span.hpp"

namespace smir {

// Lets an `if constexpr` chain over variant alternatives end in a
// `static_assert` so that a new alternative fails to compile.
template <typename>
inline constexpr bool dependent_false_v = false;

using Ty = std::uint32_t;
using CrateNum = std::uint32_t;
using DefIndex = std::uint32_t;

inline constexpr CrateNum LOCAL_CRATE = 0;

struct DefId {
    CrateNum krate = LOCAL_CRATE;
    DefIndex index = 0;

    bool is_local() const { return krate == LOCAL_CRATE; }

    bool operator==(const DefId& o) const {
        return krate == o.krate && index == o.index;
    }
    bool operator!=(const DefId& o) const { return !(*this == o); }
};

enum class Mutability : std::uint8_t { Not, Mut };

enum class IntTy : std::uint8_t { Isize, I8, I16, I32, I64, I128 };
enum class UintTy : std::uint8_t { Usize, U8, U16, U32, U64, U128 };
enum class FloatTy : std::uint8_t { F32, F64 };

enum class Unsafety : std::uint8_t { Normal, Unsafe };
enum class Movability : std::uint8_t { Static, Movable };

enum class AbiKind : std::uint8_t {
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
    AbiKind kind = AbiKind::Rust;
    // Only carried by C, Cdecl, Stdcall, Fastcall, Vectorcall, Thiscall,
    // Aapcs, Win64, SysV64 and System.
    bool unwind = false;

    bool operator==(const Abi& o) const {
        return kind == o.kind && unwind == o.unwind;
    }
};

bool abi_has_unwind(AbiKind kind);

struct Region {
    struct EarlyBound {
        std::uint32_t index = 0;
        std::string name{};
    };
    struct LateBound {
        std::uint32_t debruijn = 0;
        std::uint32_t var = 0;
    };
    struct Static {};
    struct Erased {};

    std::variant<EarlyBound, LateBound, Static, Erased> data{Erased{}};

    static Region erased() { return Region{Erased{}}; }
    static Region static_() { return Region{Static{}}; }
    static Region early_bound(std::uint32_t index, std::string name) {
        return Region{EarlyBound{index, std::move(name)}};
    }
};

bool operator==(const Region& a, const Region& b);
std::string to_string(const Region& r);

struct TyConst {
    struct Value {
        llvm::APInt bits{};
    };
    struct ZeroSized {};
    struct Param {
        std::uint32_t index = 0;
        std::string name{};
    };
    struct Unevaluated {
        DefId def{};
    };

    Ty ty = 0;
    std::variant<Value, ZeroSized, Param, Unevaluated> kind{ZeroSized{}};
};

struct GenericArg {
    std::variant<Region, Ty, TyConst> data{};

    static GenericArg lifetime(Region r) { return GenericArg{std::move(r)}; }
    static GenericArg type(Ty t) { return GenericArg{t}; }
    static GenericArg constant(TyConst c) { return GenericArg{std::move(c)}; }
};

using GenericArgs = std::vector<GenericArg>;

struct BoundTyKind {
    struct Anon {};
    struct Param {
        DefId def{};
        std::string name{};
    };

    std::variant<Anon, Param> data{};
};

struct BoundRegionKind {
    struct BrAnon {
        std::optional<Span> span{};
    };
    struct BrNamed {
        DefId def{};
        std::string name{};
    };
    struct BrEnv {};

    std::variant<BrAnon, BrNamed, BrEnv> data{};
};

struct BoundVariableKind {
    struct Const {};

    std::variant<BoundTyKind, BoundRegionKind, Const> data{};
};

struct FnSig {
    // Parameter types followed by the return type.
    std::vector<Ty> inputs_and_output{};
    bool c_variadic = false;
    Unsafety unsafety = Unsafety::Normal;
    Abi abi{};
};

struct PolyFnSig {
    FnSig sig{};
    std::vector<BoundVariableKind> bound_vars{};
};

enum class AliasKind : std::uint8_t { Projection, Inherent, Opaque, Weak };

struct TypeData {
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
        DefId def{};
        GenericArgs args{};
    };
    struct Foreign {
        DefId def{};
    };
    struct Str {};
    struct Array {
        Ty elem = 0;
        TyConst len{};
    };
    struct Slice {
        Ty elem = 0;
    };
    struct RawPtr {
        Ty pointee = 0;
        Mutability mutbl{};
    };
    struct Ref {
        Region region{};
        Ty pointee = 0;
        Mutability mutbl{};
    };
    struct FnDef {
        DefId def{};
        GenericArgs args{};
    };
    struct FnPtr {
        PolyFnSig sig{};
    };
    struct Dynamic {
        std::vector<DefId> traits{};
        Region region{};
    };
    struct Closure {
        DefId def{};
        GenericArgs args{};
    };
    struct Generator {
        DefId def{};
        GenericArgs args{};
        Movability movability{};
    };
    struct GeneratorWitness {
        DefId def{};
        GenericArgs args{};
    };
    struct Never {};
    struct Tuple {
        std::vector<Ty> elems{};
    };
    struct Alias {
        AliasKind kind{};
        DefId def{};
        GenericArgs args{};
    };
    struct Param {
        std::uint32_t index = 0;
        std::string name{};
    };
    struct Bound {
        std::uint32_t debruijn = 0;
        std::uint32_t var = 0;
    };
    struct Placeholder {
        std::uint32_t universe = 0;
        std::uint32_t var = 0;
    };
    struct Infer {
        std::uint32_t vid = 0;
    };
    struct Error {};

    std::variant<Bool, Char, Int, Uint, Float, Adt, Foreign, Str, Array, Slice,
                 RawPtr, Ref, FnDef, FnPtr, Dynamic, Closure, Generator,
                 GeneratorWitness, Never, Tuple, Alias, Param, Bound,
                 Placeholder, Infer, Error>
        data{Error{}};
};

// Renders a definition path for display, e.g. `std::vec::Vec`.
using DefPathFn = llvm::function_ref<std::string(DefId)>;

// Arena of internal types. Leaf types are cached; composite types are
// appended on every request, so two distinct `Ty` values may denote the same
// type. Use `equal`/`hash` for structural identity.
class TypeStore {
   public:
    TypeStore() = default;

    Ty bool_() const;
    Ty char_() const;
    Ty str() const;
    Ty never() const;
    Ty unit() const;
    Ty error() const;
    Ty int_(IntTy k) const;
    Ty uint_(UintTy k) const;
    Ty float_(FloatTy k) const;

    Ty adt(DefId def, GenericArgs args) const;
    Ty foreign(DefId def) const;
    Ty array(Ty elem, TyConst len) const;
    Ty slice(Ty elem) const;
    Ty raw_ptr(Ty pointee, Mutability mutbl) const;
    Ty ref(Region region, Ty pointee, Mutability mutbl) const;
    Ty fn_def(DefId def, GenericArgs args) const;
    Ty fn_ptr(PolyFnSig sig) const;
    Ty dynamic(std::vector<DefId> traits, Region region) const;
    Ty closure(DefId def, GenericArgs args) const;
    Ty generator(DefId def, GenericArgs args, Movability movability) const;
    Ty generator_witness(DefId def, GenericArgs args) const;
    Ty tuple(std::vector<Ty> elems) const;
    Ty alias(AliasKind kind, DefId def, GenericArgs args) const;
    Ty param(std::uint32_t index, std::string name) const;
    Ty bound(std::uint32_t debruijn, std::uint32_t var) const;
    Ty placeholder(std::uint32_t universe, std::uint32_t var) const;
    Ty infer(std::uint32_t vid) const;

    // Scalar constant of type `ty`; `bits` is truncated or zero-extended to
    // 128 bits.
    TyConst scalar(Ty ty, std::uint64_t value) const;

    const TypeData& get(Ty id) const {
        return types_.at(static_cast<size_t>(id));
    }
    std::size_t size() const { return types_.size(); }

    bool equal(Ty a, Ty b) const;
    bool equal(const GenericArgs& a, const GenericArgs& b) const;
    bool equal(const TyConst& a, const TyConst& b) const;
    bool equal(const PolyFnSig& a, const PolyFnSig& b) const;

    llvm::hash_code hash(Ty t) const;
    llvm::hash_code hash(const GenericArgs& args) const;
    llvm::hash_code hash(const TyConst& c) const;

    std::string to_string(Ty t, DefPathFn def_path) const;
    std::string to_string(const TyConst& c, DefPathFn def_path) const;
    std::string to_string(const GenericArgs& args, DefPathFn def_path) const;

   private:
    mutable std::vector<TypeData> types_{};

    mutable std::optional<Ty> cached_bool_{};
    mutable std::optional<Ty> cached_char_{};
    mutable std::optional<Ty> cached_str_{};
    mutable std::optional<Ty> cached_never_{};
    mutable std::optional<Ty> cached_unit_{};
    mutable std::optional<Ty> cached_error_{};

    mutable std::unordered_map<IntTy, Ty> cached_ints_{};
    mutable std::unordered_map<UintTy, Ty> cached_uints_{};
    mutable std::unordered_map<FloatTy, Ty> cached_floats_{};

    Ty make(TypeData d) const;
};

const char* int_ty_name(IntTy t);
const char* uint_ty_name(UintTy t);
const char* float_ty_name(FloatTy t);
const char* abi_name(AbiKind kind);

}  // namespace smir

template <>
struct std::hash<smir::DefId> {
    std::size_t operator()(const smir::DefId& d) const noexcept {
        return static_cast<std::size_t>(llvm::hash_combine(d.krate, d.index));
    }
};
