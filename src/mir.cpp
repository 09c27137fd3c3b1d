#include "mir.hpp"

#include <ostream>
#include <string>

#include "tcx.hpp"

namespace smir {

SwitchTargets SwitchTargets::make(
    std::vector<std::pair<std::uint64_t, BasicBlock>> cases,
    BasicBlock otherwise) {
    SwitchTargets out{};
    for (const auto& [value, target] : cases) {
        out.values.push_back(llvm::APInt(128, value));
        out.targets.push_back(target);
    }
    out.targets.push_back(otherwise);
    return out;
}

SwitchTargets SwitchTargets::if_(std::uint64_t value, BasicBlock then,
                                 BasicBlock else_) {
    return make({{value, then}}, else_);
}

namespace {

static void print_bool(std::ostream& os, bool b) {
    os << (b ? "true" : "false");
}

static void print_projection_elem(std::ostream& os, const TyCtxt& tcx,
                                  const ProjectionElem& elem) {
    std::visit(
        [&](const auto& pe) {
            using T = std::decay_t<decltype(pe)>;
            if constexpr (std::is_same_v<T, ProjectionElem::Deref>) {
                os << "Deref";
            } else if constexpr (std::is_same_v<T, ProjectionElem::Field>) {
                os << "Field(" << pe.field << ", " << tcx.ty_to_string(pe.ty)
                   << ")";
            } else if constexpr (std::is_same_v<T, ProjectionElem::Index>) {
                os << "Index(_" << pe.local << ")";
            } else if constexpr (std::is_same_v<T,
                                                ProjectionElem::ConstantIndex>) {
                os << "ConstantIndex { offset: " << pe.offset
                   << ", min_length: " << pe.min_length << ", from_end: ";
                print_bool(os, pe.from_end);
                os << " }";
            } else if constexpr (std::is_same_v<T, ProjectionElem::Subslice>) {
                os << "Subslice { from: " << pe.from << ", to: " << pe.to
                   << ", from_end: ";
                print_bool(os, pe.from_end);
                os << " }";
            } else if constexpr (std::is_same_v<T, ProjectionElem::Downcast>) {
                os << "Downcast(";
                if (pe.name)
                    os << "Some(\"" << *pe.name << "\")";
                else
                    os << "None";
                os << ", " << pe.variant << ")";
            } else if constexpr (std::is_same_v<T,
                                                ProjectionElem::OpaqueCast>) {
                os << "OpaqueCast(" << tcx.ty_to_string(pe.ty) << ")";
            } else {
                static_assert(dependent_false_v<T>, "unhandled projection");
            }
        },
        elem.data);
}

}  // namespace

void print_place_projection(std::ostream& os, const TyCtxt& tcx,
                            const std::vector<ProjectionElem>& projection) {
    os << "[";
    for (size_t i = 0; i < projection.size(); i++) {
        if (i) os << ", ";
        print_projection_elem(os, tcx, projection[i]);
    }
    os << "]";
}

void print_place(std::ostream& os, const TyCtxt& tcx, const MirPlace& place) {
    std::string out = "_" + std::to_string(place.local);
    for (const ProjectionElem& elem : place.projection) {
        std::visit(
            [&](const auto& pe) {
                using T = std::decay_t<decltype(pe)>;
                if constexpr (std::is_same_v<T, ProjectionElem::Deref>) {
                    out = "(*" + out + ")";
                } else if constexpr (std::is_same_v<T, ProjectionElem::Field>) {
                    out = "(" + out + "." + std::to_string(pe.field) + ": " +
                          tcx.ty_to_string(pe.ty) + ")";
                } else if constexpr (std::is_same_v<T, ProjectionElem::Index>) {
                    out += "[_" + std::to_string(pe.local) + "]";
                } else if constexpr (std::is_same_v<
                                         T, ProjectionElem::ConstantIndex>) {
                    out += "[" + std::string(pe.from_end ? "-" : "") +
                           std::to_string(pe.offset) + " of " +
                           std::to_string(pe.min_length) + "]";
                } else if constexpr (std::is_same_v<T,
                                                    ProjectionElem::Subslice>) {
                    out += "[" + std::to_string(pe.from) + ":" +
                           std::string(pe.from_end ? "-" : "") +
                           std::to_string(pe.to) + "]";
                } else if constexpr (std::is_same_v<T,
                                                    ProjectionElem::Downcast>) {
                    out = "(" + out + " as " +
                          (pe.name ? *pe.name : std::to_string(pe.variant)) +
                          ")";
                } else if constexpr (std::is_same_v<
                                         T, ProjectionElem::OpaqueCast>) {
                    out = "(" + out + " as " + tcx.ty_to_string(pe.ty) + ")";
                } else {
                    static_assert(dependent_false_v<T>, "unhandled projection");
                }
            },
            elem.data);
    }
    os << out;
}

void print_constant(std::ostream& os, const TyCtxt& tcx, const MirConstant& c) {
    os << "const " << tcx.const_to_string(c.literal);
}

void print_operand(std::ostream& os, const TyCtxt& tcx, const MirOperand& op) {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, MirOperand::Copy>) {
                os << "copy ";
                print_place(os, tcx, v.place);
            } else if constexpr (std::is_same_v<T, MirOperand::Move>) {
                os << "move ";
                print_place(os, tcx, v.place);
            } else if constexpr (std::is_same_v<T, MirOperand::Constant>) {
                print_constant(os, tcx, v.value);
            }
        },
        op.data);
}

void print_span(std::ostream& os, const Span& span) {
    os << "file#" << span.file << ":" << span.begin.line << ":"
       << span.begin.column << ": " << span.end.line << ":" << span.end.column;
}

void print_inline_asm_template(std::ostream& os,
                               const std::vector<InlineAsmTemplatePiece>& t) {
    os << "[";
    for (size_t i = 0; i < t.size(); i++) {
        if (i) os << ", ";
        std::visit(
            [&](const auto& piece) {
                using T = std::decay_t<decltype(piece)>;
                if constexpr (std::is_same_v<T, InlineAsmTemplatePiece::String>) {
                    os << "String(\"" << piece.text << "\")";
                } else if constexpr (std::is_same_v<
                                         T,
                                         InlineAsmTemplatePiece::Placeholder>) {
                    os << "Placeholder { operand_idx: " << piece.operand_idx
                       << ", modifier: ";
                    if (piece.modifier)
                        os << "Some('" << *piece.modifier << "')";
                    else
                        os << "None";
                    os << ", span: ";
                    print_span(os, piece.span);
                    os << " }";
                }
            },
            t[i].data);
    }
    os << "]";
}

void print_inline_asm_options(std::ostream& os, std::uint16_t options) {
    namespace opt = inline_asm_options;
    static const std::pair<std::uint16_t, const char*> kNames[] = {
        {opt::PURE, "PURE"},
        {opt::NOMEM, "NOMEM"},
        {opt::READONLY, "READONLY"},
        {opt::PRESERVES_FLAGS, "PRESERVES_FLAGS"},
        {opt::NORETURN, "NORETURN"},
        {opt::NOSTACK, "NOSTACK"},
        {opt::ATT_SYNTAX, "ATT_SYNTAX"},
        {opt::RAW, "RAW"},
        {opt::MAY_UNWIND, "MAY_UNWIND"},
    };
    os << "InlineAsmOptions(";
    bool first = true;
    for (const auto& [bit, name] : kNames) {
        if (!(options & bit)) continue;
        if (!first) os << " | ";
        os << name;
        first = false;
    }
    if (first) os << "0x0";
    os << ")";
}

void print_line_spans(std::ostream& os, const std::vector<Span>& spans) {
    os << "[";
    for (size_t i = 0; i < spans.size(); i++) {
        if (i) os << ", ";
        print_span(os, spans[i]);
    }
    os << "]";
}

void print_inline_asm_operand(std::ostream& os, const TyCtxt& tcx,
                              const InlineAsmOperand& op) {
    auto print_out_place = [&](const std::optional<MirPlace>& place) {
        if (place) {
            os << "Some(";
            print_place(os, tcx, *place);
            os << ")";
        } else {
            os << "None";
        }
    };
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, InlineAsmOperand::In>) {
                os << "In { reg: " << v.reg << ", value: ";
                print_operand(os, tcx, v.value);
                os << " }";
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::Out>) {
                os << "Out { reg: " << v.reg << ", late: ";
                print_bool(os, v.late);
                os << ", place: ";
                print_out_place(v.place);
                os << " }";
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::InOut>) {
                os << "InOut { reg: " << v.reg << ", late: ";
                print_bool(os, v.late);
                os << ", in_value: ";
                print_operand(os, tcx, v.in_value);
                os << ", out_place: ";
                print_out_place(v.out_place);
                os << " }";
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::Const>) {
                os << "Const { value: ";
                print_constant(os, tcx, v.value);
                os << " }";
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::SymFn>) {
                os << "SymFn { value: ";
                print_constant(os, tcx, v.value);
                os << " }";
            } else if constexpr (std::is_same_v<T,
                                                InlineAsmOperand::SymStatic>) {
                os << "SymStatic { def_id: " << tcx.def_path_str(v.def) << " }";
            }
        },
        op.data);
}

}  // namespace smir
