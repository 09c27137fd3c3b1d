#include "tcx.hpp"

#include <utility>

namespace smir {

const char* def_kind_name(DefKind kind) {
    switch (kind) {
        case DefKind::Mod:
            return "mod";
        case DefKind::Fn:
            return "fn";
        case DefKind::AssocFn:
            return "associated fn";
        case DefKind::Closure:
            return "closure";
        case DefKind::Generator:
            return "generator";
        case DefKind::Const:
            return "const";
        case DefKind::Static:
            return "static";
        case DefKind::Struct:
            return "struct";
        case DefKind::Enum:
            return "enum";
        case DefKind::Union:
            return "union";
        case DefKind::ForeignTy:
            return "foreign type";
        case DefKind::Trait:
            return "trait";
        case DefKind::TyParam:
            return "type parameter";
        case DefKind::LifetimeParam:
            return "lifetime parameter";
    }
    return "?";
}

TyCtxt::TyCtxt(std::string local_crate_name) {
    crates_.push_back(
        CrateData{.num = LOCAL_CRATE, .name = std::move(local_crate_name)});
}

CrateNum TyCtxt::add_crate(std::string name) {
    CrateNum num = static_cast<CrateNum>(crates_.size());
    crates_.push_back(CrateData{.num = num, .name = std::move(name)});
    return num;
}

DefId TyCtxt::add_def(CrateNum krate, DefKind kind, std::string path) {
    CrateData& c = crates_.at(krate);
    DefId id{.krate = krate, .index = static_cast<DefIndex>(c.defs.size())};
    c.defs.push_back(DefData{.id = id, .kind = kind, .path = std::move(path)});
    return id;
}

void TyCtxt::set_optimized_mir(MirBody body) {
    DefId owner = body.owner;
    bodies_.insert_or_assign(owner, std::move(body));
}

const std::string& TyCtxt::crate_name(CrateNum krate) const {
    return crates_.at(krate).name;
}

std::vector<CrateNum> TyCtxt::crates() const {
    std::vector<CrateNum> out{};
    for (const CrateData& c : crates_) {
        if (c.num != LOCAL_CRATE) out.push_back(c.num);
    }
    return out;
}

std::vector<DefId> TyCtxt::mir_keys() const {
    std::vector<DefId> out{};
    for (const DefData& d : crates_.at(LOCAL_CRATE).defs) {
        if (bodies_.count(d.id)) out.push_back(d.id);
    }
    return out;
}

const MirBody* TyCtxt::optimized_mir(DefId def) const {
    auto it = bodies_.find(def);
    if (it == bodies_.end()) return nullptr;
    return &it->second;
}

const DefData& TyCtxt::def(DefId def) const {
    return crates_.at(def.krate).defs.at(def.index);
}

std::string TyCtxt::def_path_str(DefId def) const {
    const DefData& d = this->def(def);
    if (def.is_local()) return d.path;
    return crate_name(def.krate) + "::" + d.path;
}

std::string TyCtxt::ty_to_string(Ty ty) const {
    return types.to_string(ty, [this](DefId d) { return def_path_str(d); });
}

std::string TyCtxt::const_to_string(const TyConst& c) const {
    return types.to_string(c, [this](DefId d) { return def_path_str(d); });
}

std::string TyCtxt::args_to_string(const GenericArgs& args) const {
    return types.to_string(args, [this](DefId d) { return def_path_str(d); });
}

}  // namespace smir
