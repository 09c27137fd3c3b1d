#include "types.hpp"

#include <sstream>

#include <llvm/ADT/StringExtras.h>

namespace smir {

bool abi_has_unwind(AbiKind kind) {
    switch (kind) {
        case AbiKind::C:
        case AbiKind::Cdecl:
        case AbiKind::Stdcall:
        case AbiKind::Fastcall:
        case AbiKind::Vectorcall:
        case AbiKind::Thiscall:
        case AbiKind::Aapcs:
        case AbiKind::Win64:
        case AbiKind::SysV64:
        case AbiKind::System:
            return true;
        case AbiKind::Rust:
        case AbiKind::PtxKernel:
        case AbiKind::Msp430Interrupt:
        case AbiKind::X86Interrupt:
        case AbiKind::AmdGpuKernel:
        case AbiKind::EfiApi:
        case AbiKind::AvrInterrupt:
        case AbiKind::AvrNonBlockingInterrupt:
        case AbiKind::CCmseNonSecureCall:
        case AbiKind::Wasm:
        case AbiKind::RustIntrinsic:
        case AbiKind::RustCall:
        case AbiKind::PlatformIntrinsic:
        case AbiKind::Unadjusted:
        case AbiKind::RustCold:
            return false;
    }
    return false;
}

const char* int_ty_name(IntTy t) {
    switch (t) {
        case IntTy::Isize:
            return "isize";
        case IntTy::I8:
            return "i8";
        case IntTy::I16:
            return "i16";
        case IntTy::I32:
            return "i32";
        case IntTy::I64:
            return "i64";
        case IntTy::I128:
            return "i128";
    }
    return "?";
}

const char* uint_ty_name(UintTy t) {
    switch (t) {
        case UintTy::Usize:
            return "usize";
        case UintTy::U8:
            return "u8";
        case UintTy::U16:
            return "u16";
        case UintTy::U32:
            return "u32";
        case UintTy::U64:
            return "u64";
        case UintTy::U128:
            return "u128";
    }
    return "?";
}

const char* float_ty_name(FloatTy t) {
    switch (t) {
        case FloatTy::F32:
            return "f32";
        case FloatTy::F64:
            return "f64";
    }
    return "?";
}

const char* abi_name(AbiKind kind) {
    switch (kind) {
        case AbiKind::Rust:
            return "Rust";
        case AbiKind::C:
            return "C";
        case AbiKind::Cdecl:
            return "cdecl";
        case AbiKind::Stdcall:
            return "stdcall";
        case AbiKind::Fastcall:
            return "fastcall";
        case AbiKind::Vectorcall:
            return "vectorcall";
        case AbiKind::Thiscall:
            return "thiscall";
        case AbiKind::Aapcs:
            return "aapcs";
        case AbiKind::Win64:
            return "win64";
        case AbiKind::SysV64:
            return "sysv64";
        case AbiKind::PtxKernel:
            return "ptx-kernel";
        case AbiKind::Msp430Interrupt:
            return "msp430-interrupt";
        case AbiKind::X86Interrupt:
            return "x86-interrupt";
        case AbiKind::AmdGpuKernel:
            return "amdgpu-kernel";
        case AbiKind::EfiApi:
            return "efiapi";
        case AbiKind::AvrInterrupt:
            return "avr-interrupt";
        case AbiKind::AvrNonBlockingInterrupt:
            return "avr-non-blocking-interrupt";
        case AbiKind::CCmseNonSecureCall:
            return "C-cmse-nonsecure-call";
        case AbiKind::Wasm:
            return "wasm";
        case AbiKind::System:
            return "system";
        case AbiKind::RustIntrinsic:
            return "rust-intrinsic";
        case AbiKind::RustCall:
            return "rust-call";
        case AbiKind::PlatformIntrinsic:
            return "platform-intrinsic";
        case AbiKind::Unadjusted:
            return "unadjusted";
        case AbiKind::RustCold:
            return "rust-cold";
    }
    return "?";
}

bool operator==(const Region& a, const Region& b) {
    if (a.data.index() != b.data.index()) return false;
    return std::visit(
        [&](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            const T& y = std::get<T>(b.data);
            if constexpr (std::is_same_v<T, Region::EarlyBound>) {
                return x.index == y.index && x.name == y.name;
            } else if constexpr (std::is_same_v<T, Region::LateBound>) {
                return x.debruijn == y.debruijn && x.var == y.var;
            } else if constexpr (std::is_same_v<T, Region::Static> ||
                                 std::is_same_v<T, Region::Erased>) {
                return true;
            } else {
                static_assert(dependent_false_v<T>, "unhandled region");
            }
        },
        a.data);
}

std::string to_string(const Region& r) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Region::EarlyBound>) {
                return v.name;
            } else if constexpr (std::is_same_v<T, Region::LateBound>) {
                return "'^" + std::to_string(v.debruijn) + "_" +
                       std::to_string(v.var);
            } else if constexpr (std::is_same_v<T, Region::Static>) {
                return "'static";
            } else if constexpr (std::is_same_v<T, Region::Erased>) {
                return "'{erased}";
            } else {
                static_assert(dependent_false_v<T>, "unhandled region");
            }
        },
        r.data);
}

Ty TypeStore::make(TypeData d) const {
    Ty id = static_cast<Ty>(types_.size());
    types_.push_back(std::move(d));
    return id;
}

Ty TypeStore::bool_() const {
    if (cached_bool_) return *cached_bool_;
    cached_bool_ = make(TypeData{TypeData::Bool{}});
    return *cached_bool_;
}

Ty TypeStore::char_() const {
    if (cached_char_) return *cached_char_;
    cached_char_ = make(TypeData{TypeData::Char{}});
    return *cached_char_;
}

Ty TypeStore::str() const {
    if (cached_str_) return *cached_str_;
    cached_str_ = make(TypeData{TypeData::Str{}});
    return *cached_str_;
}

Ty TypeStore::never() const {
    if (cached_never_) return *cached_never_;
    cached_never_ = make(TypeData{TypeData::Never{}});
    return *cached_never_;
}

Ty TypeStore::unit() const {
    if (cached_unit_) return *cached_unit_;
    cached_unit_ = make(TypeData{TypeData::Tuple{}});
    return *cached_unit_;
}

Ty TypeStore::error() const {
    if (cached_error_) return *cached_error_;
    cached_error_ = make(TypeData{TypeData::Error{}});
    return *cached_error_;
}

Ty TypeStore::int_(IntTy k) const {
    if (auto it = cached_ints_.find(k); it != cached_ints_.end())
        return it->second;
    Ty id = make(TypeData{TypeData::Int{k}});
    cached_ints_.insert({k, id});
    return id;
}

Ty TypeStore::uint_(UintTy k) const {
    if (auto it = cached_uints_.find(k); it != cached_uints_.end())
        return it->second;
    Ty id = make(TypeData{TypeData::Uint{k}});
    cached_uints_.insert({k, id});
    return id;
}

Ty TypeStore::float_(FloatTy k) const {
    if (auto it = cached_floats_.find(k); it != cached_floats_.end())
        return it->second;
    Ty id = make(TypeData{TypeData::Float{k}});
    cached_floats_.insert({k, id});
    return id;
}

Ty TypeStore::adt(DefId def, GenericArgs args) const {
    return make(TypeData{TypeData::Adt{def, std::move(args)}});
}

Ty TypeStore::foreign(DefId def) const {
    return make(TypeData{TypeData::Foreign{def}});
}

Ty TypeStore::array(Ty elem, TyConst len) const {
    return make(TypeData{TypeData::Array{elem, std::move(len)}});
}

Ty TypeStore::slice(Ty elem) const {
    return make(TypeData{TypeData::Slice{elem}});
}

Ty TypeStore::raw_ptr(Ty pointee, Mutability mutbl) const {
    return make(TypeData{TypeData::RawPtr{pointee, mutbl}});
}

Ty TypeStore::ref(Region region, Ty pointee, Mutability mutbl) const {
    return make(TypeData{TypeData::Ref{std::move(region), pointee, mutbl}});
}

Ty TypeStore::fn_def(DefId def, GenericArgs args) const {
    return make(TypeData{TypeData::FnDef{def, std::move(args)}});
}

Ty TypeStore::fn_ptr(PolyFnSig sig) const {
    return make(TypeData{TypeData::FnPtr{std::move(sig)}});
}

Ty TypeStore::dynamic(std::vector<DefId> traits, Region region) const {
    return make(
        TypeData{TypeData::Dynamic{std::move(traits), std::move(region)}});
}

Ty TypeStore::closure(DefId def, GenericArgs args) const {
    return make(TypeData{TypeData::Closure{def, std::move(args)}});
}

Ty TypeStore::generator(DefId def, GenericArgs args,
                        Movability movability) const {
    return make(
        TypeData{TypeData::Generator{def, std::move(args), movability}});
}

Ty TypeStore::generator_witness(DefId def, GenericArgs args) const {
    return make(TypeData{TypeData::GeneratorWitness{def, std::move(args)}});
}

Ty TypeStore::tuple(std::vector<Ty> elems) const {
    if (elems.empty()) return unit();
    return make(TypeData{TypeData::Tuple{std::move(elems)}});
}

Ty TypeStore::alias(AliasKind kind, DefId def, GenericArgs args) const {
    return make(TypeData{TypeData::Alias{kind, def, std::move(args)}});
}

Ty TypeStore::param(std::uint32_t index, std::string name) const {
    return make(TypeData{TypeData::Param{index, std::move(name)}});
}

Ty TypeStore::bound(std::uint32_t debruijn, std::uint32_t var) const {
    return make(TypeData{TypeData::Bound{debruijn, var}});
}

Ty TypeStore::placeholder(std::uint32_t universe, std::uint32_t var) const {
    return make(TypeData{TypeData::Placeholder{universe, var}});
}

Ty TypeStore::infer(std::uint32_t vid) const {
    return make(TypeData{TypeData::Infer{vid}});
}

TyConst TypeStore::scalar(Ty ty, std::uint64_t value) const {
    return TyConst{.ty = ty, .kind = TyConst::Value{llvm::APInt(128, value)}};
}

// ---- structural equality ----

static bool apint_equal(const llvm::APInt& a, const llvm::APInt& b) {
    return a.getBitWidth() == b.getBitWidth() && a == b;
}

static bool ty_vec_equal(const TypeStore& ts, const std::vector<Ty>& a,
                         const std::vector<Ty>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (!ts.equal(a[i], b[i])) return false;
    }
    return true;
}

static bool bound_var_equal(const BoundVariableKind& a,
                            const BoundVariableKind& b) {
    if (a.data.index() != b.data.index()) return false;
    if (const auto* ta = std::get_if<BoundTyKind>(&a.data)) {
        const auto& tb = std::get<BoundTyKind>(b.data);
        if (ta->data.index() != tb.data.index()) return false;
        if (const auto* pa = std::get_if<BoundTyKind::Param>(&ta->data)) {
            const auto& pb = std::get<BoundTyKind::Param>(tb.data);
            return pa->def == pb.def && pa->name == pb.name;
        }
        return true;
    }
    if (const auto* ra = std::get_if<BoundRegionKind>(&a.data)) {
        const auto& rb = std::get<BoundRegionKind>(b.data);
        if (ra->data.index() != rb.data.index()) return false;
        if (const auto* na = std::get_if<BoundRegionKind::BrNamed>(&ra->data)) {
            const auto& nb = std::get<BoundRegionKind::BrNamed>(rb.data);
            return na->def == nb.def && na->name == nb.name;
        }
        if (const auto* aa = std::get_if<BoundRegionKind::BrAnon>(&ra->data)) {
            const auto& ab = std::get<BoundRegionKind::BrAnon>(rb.data);
            if (aa->span.has_value() != ab.span.has_value()) return false;
            return !aa->span || *aa->span == *ab.span;
        }
        return true;
    }
    return true;
}

bool TypeStore::equal(const TyConst& a, const TyConst& b) const {
    if (!equal(a.ty, b.ty)) return false;
    if (a.kind.index() != b.kind.index()) return false;
    return std::visit(
        [&](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            const T& y = std::get<T>(b.kind);
            if constexpr (std::is_same_v<T, TyConst::Value>) {
                return apint_equal(x.bits, y.bits);
            } else if constexpr (std::is_same_v<T, TyConst::ZeroSized>) {
                return true;
            } else if constexpr (std::is_same_v<T, TyConst::Param>) {
                return x.index == y.index && x.name == y.name;
            } else if constexpr (std::is_same_v<T, TyConst::Unevaluated>) {
                return x.def == y.def;
            } else {
                static_assert(dependent_false_v<T>, "unhandled const kind");
            }
        },
        a.kind);
}

bool TypeStore::equal(const GenericArgs& a, const GenericArgs& b) const {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].data.index() != b[i].data.index()) return false;
        bool same = std::visit(
            [&](const auto& x) -> bool {
                using T = std::decay_t<decltype(x)>;
                const T& y = std::get<T>(b[i].data);
                if constexpr (std::is_same_v<T, Region>) {
                    return x == y;
                } else if constexpr (std::is_same_v<T, Ty>) {
                    return equal(x, y);
                } else if constexpr (std::is_same_v<T, TyConst>) {
                    return equal(x, y);
                } else {
                    static_assert(dependent_false_v<T>, "unhandled arg");
                }
            },
            a[i].data);
        if (!same) return false;
    }
    return true;
}

bool TypeStore::equal(const PolyFnSig& a, const PolyFnSig& b) const {
    if (a.sig.c_variadic != b.sig.c_variadic) return false;
    if (a.sig.unsafety != b.sig.unsafety) return false;
    if (!(a.sig.abi == b.sig.abi)) return false;
    if (!ty_vec_equal(*this, a.sig.inputs_and_output, b.sig.inputs_and_output))
        return false;
    if (a.bound_vars.size() != b.bound_vars.size()) return false;
    for (size_t i = 0; i < a.bound_vars.size(); i++) {
        if (!bound_var_equal(a.bound_vars[i], b.bound_vars[i])) return false;
    }
    return true;
}

bool TypeStore::equal(Ty a, Ty b) const {
    if (a == b) return true;
    const TypeData& ta = get(a);
    const TypeData& tb = get(b);
    if (ta.data.index() != tb.data.index()) return false;

    return std::visit(
        [&](const auto& x) -> bool {
            using T = std::decay_t<decltype(x)>;
            const T& y = std::get<T>(tb.data);
            if constexpr (std::is_same_v<T, TypeData::Bool> ||
                          std::is_same_v<T, TypeData::Char> ||
                          std::is_same_v<T, TypeData::Str> ||
                          std::is_same_v<T, TypeData::Never> ||
                          std::is_same_v<T, TypeData::Error>) {
                return true;
            } else if constexpr (std::is_same_v<T, TypeData::Int> ||
                                 std::is_same_v<T, TypeData::Uint> ||
                                 std::is_same_v<T, TypeData::Float>) {
                return x.ty == y.ty;
            } else if constexpr (std::is_same_v<T, TypeData::Adt> ||
                                 std::is_same_v<T, TypeData::FnDef> ||
                                 std::is_same_v<T, TypeData::Closure> ||
                                 std::is_same_v<T,
                                                TypeData::GeneratorWitness>) {
                return x.def == y.def && equal(x.args, y.args);
            } else if constexpr (std::is_same_v<T, TypeData::Foreign>) {
                return x.def == y.def;
            } else if constexpr (std::is_same_v<T, TypeData::Array>) {
                return equal(x.elem, y.elem) && equal(x.len, y.len);
            } else if constexpr (std::is_same_v<T, TypeData::Slice>) {
                return equal(x.elem, y.elem);
            } else if constexpr (std::is_same_v<T, TypeData::RawPtr>) {
                return x.mutbl == y.mutbl && equal(x.pointee, y.pointee);
            } else if constexpr (std::is_same_v<T, TypeData::Ref>) {
                return x.mutbl == y.mutbl && x.region == y.region &&
                       equal(x.pointee, y.pointee);
            } else if constexpr (std::is_same_v<T, TypeData::FnPtr>) {
                return equal(x.sig, y.sig);
            } else if constexpr (std::is_same_v<T, TypeData::Dynamic>) {
                return x.traits == y.traits && x.region == y.region;
            } else if constexpr (std::is_same_v<T, TypeData::Generator>) {
                return x.def == y.def && x.movability == y.movability &&
                       equal(x.args, y.args);
            } else if constexpr (std::is_same_v<T, TypeData::Tuple>) {
                return ty_vec_equal(*this, x.elems, y.elems);
            } else if constexpr (std::is_same_v<T, TypeData::Alias>) {
                return x.kind == y.kind && x.def == y.def &&
                       equal(x.args, y.args);
            } else if constexpr (std::is_same_v<T, TypeData::Param>) {
                return x.index == y.index && x.name == y.name;
            } else if constexpr (std::is_same_v<T, TypeData::Bound>) {
                return x.debruijn == y.debruijn && x.var == y.var;
            } else if constexpr (std::is_same_v<T, TypeData::Placeholder>) {
                return x.universe == y.universe && x.var == y.var;
            } else if constexpr (std::is_same_v<T, TypeData::Infer>) {
                return x.vid == y.vid;
            } else {
                static_assert(dependent_false_v<T>, "unhandled type kind");
            }
        },
        ta.data);
}

// ---- structural hashing ----
//
// Must agree with `equal`: structurally equal types hash equally.

static llvm::hash_code hash_def(DefId d) {
    return llvm::hash_combine(d.krate, d.index);
}

static llvm::hash_code hash_region(const Region& r) {
    llvm::hash_code h = llvm::hash_value(r.data.index());
    if (const auto* e = std::get_if<Region::EarlyBound>(&r.data))
        return llvm::hash_combine(h, e->index, e->name);
    if (const auto* l = std::get_if<Region::LateBound>(&r.data))
        return llvm::hash_combine(h, l->debruijn, l->var);
    return h;
}

llvm::hash_code TypeStore::hash(const TyConst& c) const {
    llvm::hash_code h = llvm::hash_combine(hash(c.ty), c.kind.index());
    if (const auto* v = std::get_if<TyConst::Value>(&c.kind))
        return llvm::hash_combine(h, llvm::hash_value(v->bits));
    if (const auto* p = std::get_if<TyConst::Param>(&c.kind))
        return llvm::hash_combine(h, p->index, p->name);
    if (const auto* u = std::get_if<TyConst::Unevaluated>(&c.kind))
        return llvm::hash_combine(h, hash_def(u->def));
    return h;
}

llvm::hash_code TypeStore::hash(const GenericArgs& args) const {
    llvm::hash_code h = llvm::hash_value(args.size());
    for (const GenericArg& arg : args) {
        llvm::hash_code ah = std::visit(
            [&](const auto& v) -> llvm::hash_code {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Region>) {
                    return hash_region(v);
                } else if constexpr (std::is_same_v<T, Ty>) {
                    return hash(v);
                } else if constexpr (std::is_same_v<T, TyConst>) {
                    return hash(v);
                } else {
                    static_assert(dependent_false_v<T>, "unhandled arg");
                }
            },
            arg.data);
        h = llvm::hash_combine(h, arg.data.index(), ah);
    }
    return h;
}

llvm::hash_code TypeStore::hash(Ty t) const {
    const TypeData& td = get(t);
    llvm::hash_code kind = llvm::hash_value(td.data.index());
    return std::visit(
        [&](const auto& x) -> llvm::hash_code {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, TypeData::Bool> ||
                          std::is_same_v<T, TypeData::Char> ||
                          std::is_same_v<T, TypeData::Str> ||
                          std::is_same_v<T, TypeData::Never> ||
                          std::is_same_v<T, TypeData::Error>) {
                return kind;
            } else if constexpr (std::is_same_v<T, TypeData::Int> ||
                                 std::is_same_v<T, TypeData::Uint> ||
                                 std::is_same_v<T, TypeData::Float>) {
                return llvm::hash_combine(kind, x.ty);
            } else if constexpr (std::is_same_v<T, TypeData::Adt> ||
                                 std::is_same_v<T, TypeData::FnDef> ||
                                 std::is_same_v<T, TypeData::Closure> ||
                                 std::is_same_v<T,
                                                TypeData::GeneratorWitness>) {
                return llvm::hash_combine(kind, hash_def(x.def), hash(x.args));
            } else if constexpr (std::is_same_v<T, TypeData::Foreign>) {
                return llvm::hash_combine(kind, hash_def(x.def));
            } else if constexpr (std::is_same_v<T, TypeData::Array>) {
                return llvm::hash_combine(kind, hash(x.elem), hash(x.len));
            } else if constexpr (std::is_same_v<T, TypeData::Slice>) {
                return llvm::hash_combine(kind, hash(x.elem));
            } else if constexpr (std::is_same_v<T, TypeData::RawPtr>) {
                return llvm::hash_combine(kind, x.mutbl, hash(x.pointee));
            } else if constexpr (std::is_same_v<T, TypeData::Ref>) {
                return llvm::hash_combine(kind, x.mutbl, hash_region(x.region),
                                          hash(x.pointee));
            } else if constexpr (std::is_same_v<T, TypeData::FnPtr>) {
                llvm::hash_code h = llvm::hash_combine(
                    kind, x.sig.sig.c_variadic, x.sig.sig.unsafety,
                    x.sig.sig.abi.kind, x.sig.sig.abi.unwind,
                    x.sig.bound_vars.size());
                for (Ty io : x.sig.sig.inputs_and_output)
                    h = llvm::hash_combine(h, hash(io));
                return h;
            } else if constexpr (std::is_same_v<T, TypeData::Dynamic>) {
                llvm::hash_code h =
                    llvm::hash_combine(kind, hash_region(x.region));
                for (DefId d : x.traits) h = llvm::hash_combine(h, hash_def(d));
                return h;
            } else if constexpr (std::is_same_v<T, TypeData::Generator>) {
                return llvm::hash_combine(kind, hash_def(x.def), hash(x.args),
                                          x.movability);
            } else if constexpr (std::is_same_v<T, TypeData::Tuple>) {
                llvm::hash_code h = llvm::hash_combine(kind, x.elems.size());
                for (Ty e : x.elems) h = llvm::hash_combine(h, hash(e));
                return h;
            } else if constexpr (std::is_same_v<T, TypeData::Alias>) {
                return llvm::hash_combine(kind, x.kind, hash_def(x.def),
                                          hash(x.args));
            } else if constexpr (std::is_same_v<T, TypeData::Param>) {
                return llvm::hash_combine(kind, x.index, x.name);
            } else if constexpr (std::is_same_v<T, TypeData::Bound>) {
                return llvm::hash_combine(kind, x.debruijn, x.var);
            } else if constexpr (std::is_same_v<T, TypeData::Placeholder>) {
                return llvm::hash_combine(kind, x.universe, x.var);
            } else if constexpr (std::is_same_v<T, TypeData::Infer>) {
                return llvm::hash_combine(kind, x.vid);
            } else {
                static_assert(dependent_false_v<T>, "unhandled type kind");
            }
        },
        td.data);
}

// ---- display ----

static const char* mut_prefix(Mutability m) {
    return m == Mutability::Mut ? "mut " : "";
}

std::string TypeStore::to_string(const GenericArgs& args,
                                 DefPathFn def_path) const {
    if (args.empty()) return {};
    std::string out = "<";
    for (size_t i = 0; i < args.size(); i++) {
        if (i) out += ", ";
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Region>) {
                    out += smir::to_string(v);
                } else if constexpr (std::is_same_v<T, Ty>) {
                    out += to_string(v, def_path);
                } else if constexpr (std::is_same_v<T, TyConst>) {
                    out += to_string(v, def_path);
                }
            },
            args[i].data);
    }
    out += ">";
    return out;
}

std::string TypeStore::to_string(const TyConst& c, DefPathFn def_path) const {
    return std::visit(
        [&](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, TyConst::Value>) {
                const TypeData& td = get(c.ty);
                if (std::holds_alternative<TypeData::Bool>(td.data))
                    return v.bits.isZero() ? "false" : "true";
                if (const auto* i = std::get_if<TypeData::Int>(&td.data))
                    return llvm::toString(v.bits, 10, /*Signed=*/true) + "_" +
                           int_ty_name(i->ty);
                if (const auto* u = std::get_if<TypeData::Uint>(&td.data))
                    return llvm::toString(v.bits, 10, /*Signed=*/false) + "_" +
                           uint_ty_name(u->ty);
                return "0x" + llvm::toString(v.bits, 16, /*Signed=*/false) +
                       ": " + to_string(c.ty, def_path);
            } else if constexpr (std::is_same_v<T, TyConst::ZeroSized>) {
                return "ZeroSized: " + to_string(c.ty, def_path);
            } else if constexpr (std::is_same_v<T, TyConst::Param>) {
                return v.name;
            } else if constexpr (std::is_same_v<T, TyConst::Unevaluated>) {
                return "{unevaluated " + def_path(v.def) + "}";
            }
        },
        c.kind);
}

std::string TypeStore::to_string(Ty t, DefPathFn def_path) const {
    const TypeData& td = get(t);
    return std::visit(
        [&](const auto& x) -> std::string {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, TypeData::Bool>) {
                return "bool";
            } else if constexpr (std::is_same_v<T, TypeData::Char>) {
                return "char";
            } else if constexpr (std::is_same_v<T, TypeData::Int>) {
                return int_ty_name(x.ty);
            } else if constexpr (std::is_same_v<T, TypeData::Uint>) {
                return uint_ty_name(x.ty);
            } else if constexpr (std::is_same_v<T, TypeData::Float>) {
                return float_ty_name(x.ty);
            } else if constexpr (std::is_same_v<T, TypeData::Adt>) {
                return def_path(x.def) + to_string(x.args, def_path);
            } else if constexpr (std::is_same_v<T, TypeData::Foreign>) {
                return def_path(x.def);
            } else if constexpr (std::is_same_v<T, TypeData::Str>) {
                return "str";
            } else if constexpr (std::is_same_v<T, TypeData::Array>) {
                return "[" + to_string(x.elem, def_path) + "; " +
                       to_string(x.len, def_path) + "]";
            } else if constexpr (std::is_same_v<T, TypeData::Slice>) {
                return "[" + to_string(x.elem, def_path) + "]";
            } else if constexpr (std::is_same_v<T, TypeData::RawPtr>) {
                return std::string(x.mutbl == Mutability::Mut ? "*mut "
                                                              : "*const ") +
                       to_string(x.pointee, def_path);
            } else if constexpr (std::is_same_v<T, TypeData::Ref>) {
                std::string r = smir::to_string(x.region);
                std::string out = "&";
                if (!std::holds_alternative<Region::Erased>(x.region.data))
                    out += r + " ";
                return out + mut_prefix(x.mutbl) +
                       to_string(x.pointee, def_path);
            } else if constexpr (std::is_same_v<T, TypeData::FnDef>) {
                return "fn " + def_path(x.def) + to_string(x.args, def_path);
            } else if constexpr (std::is_same_v<T, TypeData::FnPtr>) {
                const FnSig& sig = x.sig.sig;
                std::string out{};
                if (sig.unsafety == Unsafety::Unsafe) out += "unsafe ";
                if (sig.abi.kind != AbiKind::Rust)
                    out += std::string("extern \"") + abi_name(sig.abi.kind) +
                           (sig.abi.unwind ? "-unwind" : "") + "\" ";
                out += "fn(";
                size_t n = sig.inputs_and_output.empty()
                               ? 0
                               : sig.inputs_and_output.size() - 1;
                for (size_t i = 0; i < n; i++) {
                    if (i) out += ", ";
                    out += to_string(sig.inputs_and_output[i], def_path);
                }
                if (sig.c_variadic) out += n ? ", ..." : "...";
                out += ")";
                if (!sig.inputs_and_output.empty()) {
                    Ty ret = sig.inputs_and_output.back();
                    if (!equal(ret, unit()))
                        out += " -> " + to_string(ret, def_path);
                }
                return out;
            } else if constexpr (std::is_same_v<T, TypeData::Dynamic>) {
                std::string out = "dyn ";
                for (size_t i = 0; i < x.traits.size(); i++) {
                    if (i) out += " + ";
                    out += def_path(x.traits[i]);
                }
                return out;
            } else if constexpr (std::is_same_v<T, TypeData::Closure>) {
                return "[closure@" + def_path(x.def) + "]";
            } else if constexpr (std::is_same_v<T, TypeData::Generator>) {
                return std::string("[") +
                       (x.movability == Movability::Static ? "static " : "") +
                       "generator@" + def_path(x.def) + "]";
            } else if constexpr (std::is_same_v<T,
                                                TypeData::GeneratorWitness>) {
                return "[generator witness@" + def_path(x.def) + "]";
            } else if constexpr (std::is_same_v<T, TypeData::Never>) {
                return "!";
            } else if constexpr (std::is_same_v<T, TypeData::Tuple>) {
                std::string out = "(";
                for (size_t i = 0; i < x.elems.size(); i++) {
                    if (i) out += ", ";
                    out += to_string(x.elems[i], def_path);
                }
                if (x.elems.size() == 1) out += ",";
                return out + ")";
            } else if constexpr (std::is_same_v<T, TypeData::Alias>) {
                return "<alias " + def_path(x.def) +
                       to_string(x.args, def_path) + ">";
            } else if constexpr (std::is_same_v<T, TypeData::Param>) {
                return x.name;
            } else if constexpr (std::is_same_v<T, TypeData::Bound>) {
                return "^" + std::to_string(x.debruijn) + "_" +
                       std::to_string(x.var);
            } else if constexpr (std::is_same_v<T, TypeData::Placeholder>) {
                return "!" + std::to_string(x.universe) + "_" +
                       std::to_string(x.var);
            } else if constexpr (std::is_same_v<T, TypeData::Infer>) {
                return "?" + std::to_string(x.vid) + "t";
            } else if constexpr (std::is_same_v<T, TypeData::Error>) {
                return "{type error}";
            }
        },
        td.data);
}

}  // namespace smir
