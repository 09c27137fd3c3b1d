#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mir.hpp"
#include "types.hpp"

namespace smir {

enum class DefKind : std::uint8_t {
    Mod,
    Fn,
    AssocFn,
    Closure,
    Generator,
    Const,
    Static,
    Struct,
    Enum,
    Union,
    ForeignTy,
    Trait,
    TyParam,
    LifetimeParam,
};

const char* def_kind_name(DefKind kind);

struct DefData {
    DefId id{};
    DefKind kind = DefKind::Fn;
    std::string path{};  // relative to the crate root, e.g. `vec::Vec`
};

struct CrateData {
    CrateNum num = LOCAL_CRATE;
    std::string name{};
    std::vector<DefData> defs{};
};

// The compiler-side view consumed by the stable layer: crates, definitions,
// the type arena and the optimized MIR of every body-bearing local item.
class TyCtxt {
   public:
    explicit TyCtxt(std::string local_crate_name);

    TypeStore types{};

    CrateNum add_crate(std::string name);
    DefId add_def(CrateNum krate, DefKind kind, std::string path);

    // Installs `body` as the optimized MIR of `body.owner`.
    void set_optimized_mir(MirBody body);
    void set_entry_fn(DefId def) { entry_fn_ = def; }

    const std::string& crate_name(CrateNum krate) const;
    // External crates, in the order they were added.
    std::vector<CrateNum> crates() const;
    // Local definitions that have a MIR body, in definition order.
    std::vector<DefId> mir_keys() const;
    std::optional<DefId> entry_fn() const { return entry_fn_; }
    const MirBody* optimized_mir(DefId def) const;

    const DefData& def(DefId def) const;
    DefKind def_kind(DefId def) const { return this->def(def).kind; }

    std::string def_path_str(DefId def) const;
    std::string ty_to_string(Ty ty) const;
    std::string const_to_string(const TyConst& c) const;
    std::string args_to_string(const GenericArgs& args) const;

   private:
    std::vector<CrateData> crates_{};
    std::unordered_map<DefId, MirBody> bodies_{};
    std::optional<DefId> entry_fn_{};
};

}  // namespace smir
