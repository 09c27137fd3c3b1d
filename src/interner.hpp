#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <llvm/ADT/SmallVector.h>

#include "session.hpp"
#include "stable_ty.hpp"
#include "types.hpp"

namespace smir {

// Maps internal types to stable handles. Structurally equal types share a
// handle; the n-th distinct type gets handle n-1. Never shrinks.
class TypeInterner {
   public:
    TypeInterner(const TypeStore& store, InternStrategy strategy)
        : store_(store), strategy_(strategy) {}

    stable::Ty intern(Ty ty);
    // Throws std::out_of_range for a handle this interner never minted.
    Ty resolve(stable::Ty handle) const { return types_.at(handle.id); }

    std::size_t size() const { return types_.size(); }
    InternStrategy strategy() const { return strategy_; }

   private:
    const TypeStore& store_;
    InternStrategy strategy_;
    std::vector<Ty> types_{};
    // Structural hash -> positions in `types_`. Used by HashCons only.
    std::unordered_map<std::size_t, llvm::SmallVector<std::size_t, 1>>
        buckets_{};

    std::size_t push(Ty ty);
};

}  // namespace smir
