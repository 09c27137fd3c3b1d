#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>

#include "stable_mir.hpp"
#include "stable_ty.hpp"

namespace smir {

struct Session;
class TyCtxt;

// Query surface handed to tooling. Calls may grow the session's tables, so
// most of them are non-const even though they look like reads.
class Context {
   public:
    virtual ~Context() = default;

    virtual stable::Crate local_crate() const = 0;
    virtual std::vector<stable::Crate> external_crates() const = 0;
    // First crate named `name`, the local crate searched first.
    virtual std::optional<stable::Crate> find_crate(
        std::string_view name) const = 0;

    virtual stable::CrateItems all_local_items() = 0;
    virtual std::optional<stable::CrateItem> entry_fn() = 0;

    // Empty if the body, or anything reachable from it, has no stable form.
    // The reason is reported to the session diagnostics.
    virtual std::optional<stable::Body> mir_body(
        const stable::CrateItem& item) = 0;
    virtual std::optional<stable::TyKind> ty_kind(stable::Ty ty) = 0;
};

// Runs `fn` against a fresh set of tables bound to `tcx`. Handles minted
// during the call are only valid inside it.
void run_query_session(Session& session, const TyCtxt& tcx,
                       llvm::function_ref<void(Context&)> fn);

}  // namespace smir
