#include "tables.hpp"

#include <utility>

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include "convert.hpp"
#include "identity.hpp"

#define DEBUG_TYPE "smir"

namespace smir {

Tables::Tables(Session& session, const TyCtxt& tcx)
    : session(session),
      tcx(tcx),
      types(tcx.types, session.options.intern_strategy) {}

stable::DefId Tables::create_def_id(DefId def) {
    if (auto it = def_index_.find(def); it != def_index_.end())
        return it->second;
    std::size_t id = def_ids.size();
    def_ids.push_back(def);
    def_index_.insert({def, id});
    return id;
}

void Tables::push_failure(DiagCode code, std::string message) {
    failures_++;
    LLVM_DEBUG(llvm::dbgs() << "conversion failure: " << message << "\n");
    session.diags.push_back(Diagnostic{
        .severity = Severity::Error,
        .span = Span{.file = kNoFile},
        .message = std::move(message),
        .code = code,
    });
}

void Tables::not_yet_implemented(std::string what) {
    push_failure(DiagCode::NotYetImplemented,
                 "not yet implemented: " + std::move(what));
}

void Tables::invariant_violated(std::string what) {
    push_failure(DiagCode::InvariantViolated,
                 "invariant violated: " + std::move(what));
}

stable::Crate Tables::local_crate() const {
    return smir_crate(tcx, LOCAL_CRATE);
}

std::vector<stable::Crate> Tables::external_crates() const {
    std::vector<stable::Crate> out{};
    for (CrateNum krate : tcx.crates()) out.push_back(smir_crate(tcx, krate));
    return out;
}

std::optional<stable::Crate> Tables::find_crate(std::string_view name) const {
    if (tcx.crate_name(LOCAL_CRATE) == name)
        return smir_crate(tcx, LOCAL_CRATE);
    for (CrateNum krate : tcx.crates()) {
        if (tcx.crate_name(krate) == name) return smir_crate(tcx, krate);
    }
    return std::nullopt;
}

stable::CrateItems Tables::all_local_items() {
    stable::CrateItems out{};
    for (DefId def : tcx.mir_keys()) out.push_back(crate_item(*this, def));
    return out;
}

std::optional<stable::CrateItem> Tables::entry_fn() {
    std::optional<DefId> def = tcx.entry_fn();
    if (!def) return std::nullopt;
    return crate_item(*this, *def);
}

std::optional<stable::Body> Tables::mir_body(const stable::CrateItem& item) {
    DefId def = item_def_id(*this, item);
    const MirBody* mir = tcx.optimized_mir(def);
    if (!mir) {
        invariant_violated("`" + tcx.def_path_str(def) +
                           "` has no optimized MIR");
        return std::nullopt;
    }

    LLVM_DEBUG(llvm::dbgs() << "mir_body: " << tcx.def_path_str(def) << " ("
                            << mir->basic_blocks.size() << " blocks)\n");
    std::size_t before = failures_;
    stable::Body body = body_to_stable(*this, *mir);
    if (failures_ != before) return std::nullopt;
    return body;
}

std::optional<stable::TyKind> Tables::ty_kind(stable::Ty ty) {
    Ty internal = resolve_ty(ty);
    std::size_t before = failures_;
    stable::TyKind kind = ty_kind_of(*this, internal);
    if (failures_ != before) return std::nullopt;
    return kind;
}

void run_query_session(Session& session, const TyCtxt& tcx,
                       llvm::function_ref<void(Context&)> fn) {
    Tables tables{session, tcx};
    fn(tables);
    LLVM_DEBUG(llvm::dbgs() << "query session done: " << tables.types.size()
                            << " types, " << tables.def_ids.size()
                            << " definitions\n");
}

}  // namespace smir
