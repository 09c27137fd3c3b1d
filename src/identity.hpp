#pragma once

#include "stable_ty.hpp"
#include "types.hpp"

namespace smir {

class Tables;
class TyCtxt;

// Stable identities for internal definitions. All of them share the
// session's definition table, so the same `DefId` always maps to the same
// stable id whichever wrapper asked first.
stable::CrateItem crate_item(Tables& tables, DefId def);
stable::AdtDef adt_def(Tables& tables, DefId def);
stable::FnDef fn_def(Tables& tables, DefId def);
stable::ClosureDef closure_def(Tables& tables, DefId def);
stable::GeneratorDef generator_def(Tables& tables, DefId def);
stable::ForeignDef foreign_def(Tables& tables, DefId def);
stable::ParamDef param_def(Tables& tables, DefId def);
stable::BrNamedDef br_named_def(Tables& tables, DefId def);

DefId item_def_id(const Tables& tables, const stable::CrateItem& item);

stable::CrateNum stable_crate_num(CrateNum krate);
stable::Crate smir_crate(const TyCtxt& tcx, CrateNum krate);

}  // namespace smir
