#include "parse.hpp"

#include <cctype>
#include <ostream>
#include <string>
#include <string_view>

#include "parser.hpp"

int yyparse(void);
int yylex(void);

extern YYSTYPE yylval;
extern YYLTYPE yylloc;

namespace smir {

ParseState parse_file(FileId file_id, const std::string& text) {
    ParseState state{};
    state.file = file_id;
    {
        ParseScope scope(state, text);
        if (yyparse() != 0 && state.diags.empty()) {
            push_error(Span{.file = file_id}, "parse failed");
        }
    }
    return state;
}

static const char* token_name(int tok) {
    switch (tok) {
        case 0:
            return "EOF";
        case IDENT:
            return "IDENT";
        case STRING:
            return "STRING";
        case INT:
            return "INT";

        case KW_FN:
            return "fn";
        case KW_LET:
            return "let";
        case KW_MUT:
            return "mut";
        case KW_IF:
            return "if";
        case KW_ELSE:
            return "else";
        case KW_TRUE:
            return "true";
        case KW_FALSE:
            return "false";

        case TOK_COLONCOLON:
            return "::";
        case TOK_ARROW:
            return "->";
        case TOK_EQEQ:
            return "==";
        case TOK_NEQ:
            return "!=";
        case TOK_LE:
            return "<=";
        case TOK_GE:
            return ">=";
        case TOK_ANDAND:
            return "&&";
        case TOK_OROR:
            return "||";
    }
    return nullptr;
}

static void dump_string_lit(std::ostream& os, std::string_view s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            default:
                if (c >= 32 && c < 127) {
                    os << static_cast<char>(c);
                } else {
                    static constexpr char kHex[] = "0123456789abcdef";
                    os << "\\x" << kHex[(c >> 4) & 0xf] << kHex[c & 0xf];
                }
                break;
        }
    }
    os << '"';
}

void dump_tokens(FileId file_id, const std::string& text, std::ostream& os) {
    ParseState state{};
    state.file = file_id;
    ParseScope scope(state, text);

    while (true) {
        int tok = yylex();
        if (tok == 0) break;

        os << yylloc.first_line << ":" << yylloc.first_column << " ";
        if (const char* name = token_name(tok)) {
            os << name;
        } else if (tok >= 0 && tok < 128 && std::isprint(tok)) {
            os << "'" << static_cast<char>(tok) << "'";
        } else {
            os << "<tok " << tok << ">";
        }

        switch (tok) {
            case IDENT:
                os << " ";
                dump_string_lit(os, take_str(yylval.cstr));
                break;
            case STRING:
                os << " ";
                dump_string_lit(os, take_string(yylval.str_lit));
                break;
            case INT:
                os << " " << yylval.int_val;
                break;
            default:
                break;
        }
        os << "\n";
    }

    for (const auto& d : state.diags) os << d.span.begin.line << ":" << d.span.begin.column << " error: " << d.message << "\n";
}

}  // namespace smir
