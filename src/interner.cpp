#include "interner.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "smir"

namespace smir {

std::size_t TypeInterner::push(Ty ty) {
    std::size_t id = types_.size();
    types_.push_back(ty);
    LLVM_DEBUG(llvm::dbgs() << "interned ty#" << id << " (internal " << ty
                            << ")\n");
    return id;
}

stable::Ty TypeInterner::intern(Ty ty) {
    switch (strategy_) {
        case InternStrategy::LinearScan: {
            for (std::size_t i = 0; i < types_.size(); i++) {
                if (store_.equal(types_[i], ty)) return stable::Ty{i};
            }
            return stable::Ty{push(ty)};
        }
        case InternStrategy::HashCons: {
            std::size_t h = static_cast<std::size_t>(store_.hash(ty));
            llvm::SmallVector<std::size_t, 1>& bucket = buckets_[h];
            for (std::size_t i : bucket) {
                if (store_.equal(types_[i], ty)) return stable::Ty{i};
            }
            std::size_t id = push(ty);
            bucket.push_back(id);
            return stable::Ty{id};
        }
    }
    return stable::Ty{push(ty)};
}

}  // namespace smir
