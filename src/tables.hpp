#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>

#include "context.hpp"
#include "interner.hpp"
#include "session.hpp"
#include "tcx.hpp"

namespace smir {

// Per-session state behind the query surface: the type interner and the
// definition table. Only code that links against the internal model should
// touch this directly; tooling gets a `Context&`.
class Tables final : public Context {
   public:
    Tables(Session& session, const TyCtxt& tcx);

    Session& session;
    const TyCtxt& tcx;

    TypeInterner types;
    std::vector<DefId> def_ids{};

    stable::Ty intern_ty(Ty ty) { return types.intern(ty); }
    Ty resolve_ty(stable::Ty ty) const { return types.resolve(ty); }

    stable::DefId create_def_id(DefId def);
    // Throws std::out_of_range for an id this session never handed out.
    DefId def_id(stable::DefId id) const { return def_ids.at(id); }

    // Record a conversion failure. The running query yields no value.
    void not_yet_implemented(std::string what);
    void invariant_violated(std::string what);
    std::size_t failure_count() const { return failures_; }

    // Scoped access to the raw tables for extensions that also speak the
    // internal model.
    void with_internal_tables(llvm::function_ref<void(Tables&)> fn) {
        fn(*this);
    }

    stable::Crate local_crate() const override;
    std::vector<stable::Crate> external_crates() const override;
    std::optional<stable::Crate> find_crate(
        std::string_view name) const override;
    stable::CrateItems all_local_items() override;
    std::optional<stable::CrateItem> entry_fn() override;
    std::optional<stable::Body> mir_body(
        const stable::CrateItem& item) override;
    std::optional<stable::TyKind> ty_kind(stable::Ty ty) override;

   private:
    std::unordered_map<DefId, std::size_t> def_index_{};
    std::size_t failures_ = 0;

    void push_failure(DiagCode code, std::string message);
};

}  // namespace smir
