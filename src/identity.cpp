#include "identity.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include "tables.hpp"

#define DEBUG_TYPE "smir"

namespace smir {

stable::CrateItem crate_item(Tables& tables, DefId def) {
    return stable::CrateItem{tables.create_def_id(def)};
}

stable::AdtDef adt_def(Tables& tables, DefId def) {
    return stable::AdtDef{tables.create_def_id(def)};
}

stable::FnDef fn_def(Tables& tables, DefId def) {
    return stable::FnDef{tables.create_def_id(def)};
}

stable::ClosureDef closure_def(Tables& tables, DefId def) {
    return stable::ClosureDef{tables.create_def_id(def)};
}

stable::GeneratorDef generator_def(Tables& tables, DefId def) {
    return stable::GeneratorDef{tables.create_def_id(def)};
}

stable::ForeignDef foreign_def(Tables& tables, DefId def) {
    return stable::ForeignDef{tables.create_def_id(def)};
}

stable::ParamDef param_def(Tables& tables, DefId def) {
    return stable::ParamDef{tables.create_def_id(def)};
}

stable::BrNamedDef br_named_def(Tables& tables, DefId def) {
    return stable::BrNamedDef{tables.create_def_id(def)};
}

DefId item_def_id(const Tables& tables, const stable::CrateItem& item) {
    return tables.def_id(item.def);
}

stable::CrateNum stable_crate_num(CrateNum krate) {
    return static_cast<stable::CrateNum>(krate);
}

stable::Crate smir_crate(const TyCtxt& tcx, CrateNum krate) {
    const std::string& name = tcx.crate_name(krate);
    LLVM_DEBUG(llvm::dbgs() << "smir_crate: " << name << " (crate#" << krate
                            << ")\n");
    return stable::Crate{.id = stable_crate_num(krate),
                         .name = name,
                         .is_local = krate == LOCAL_CRATE};
}

}  // namespace smir
